#include "core/testDoubles.hpp"
#include "server/requestRouter.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <format>
#include <future>
#include <memory>
#include <string>

namespace wordgame::server::gtest {

using namespace std::chrono_literals;

using wordgame::gtest::ALICE_RACK;
using wordgame::gtest::BlockingEngine;
using wordgame::gtest::BOB_RACK;
using wordgame::gtest::scriptedSettings;

class RequestRouterTest : public ::testing::Test {
protected:
	RequestRouterTest() : m_registry(scriptedSettings()), m_router(m_registry, m_timers.get_executor()) {
	}

	//! Send a request through the text interface and wait for the reply message.
	network::Message send(const std::string& message) {
		std::promise<network::Message> reply;
		auto future = reply.get_future();
		m_router.handle(message, [&reply](network::Message m) { reply.set_value(std::move(m)); });
		EXPECT_EQ(future.wait_for(5s), std::future_status::ready) << message;
		return future.get();
	}

	//! Send a request and decode the reply.
	ServerReply call(const std::string& message) {
		const auto reply = fromServerMessage(send(message));
		EXPECT_TRUE(reply.has_value()) << message;
		return reply.value_or(ErrorReply{"Undecodable"});
	}

	std::string errorOf(const std::string& message) {
		const auto reply = call(message);
		const auto* error = std::get_if<ErrorReply>(&reply);
		return error ? error->reason : std::string{};
	}

	GameId createGame() {
		return std::get<GameCreatedReply>(call("CREATE")).gameId;
	}

	PlayerId join(const GameId& gameId, const std::string& name) {
		return std::get<JoinedReply>(call(std::format("JOIN:{},{}", gameId.toString(), name))).playerId;
	}

	asio::thread_pool m_timers{1};
	GameRegistry m_registry;
	RequestRouter m_router;
};

TEST_F(RequestRouterTest, MalformedRequestIsBadRequest) {
	EXPECT_EQ(send("HELLO"), "ERROR:BadRequest");
	EXPECT_EQ(send("JOIN:xyz,alice"), "ERROR:BadRequest");
	EXPECT_EQ(m_registry.size(), 0u);
}

TEST_F(RequestRouterTest, UnknownGameIsNotFound) {
	const auto unknown = GameId::generate().toString();
	const auto player  = PlayerId::generate().toString();

	EXPECT_EQ(errorOf(std::format("JOIN:{},alice", unknown)), "NotFound");
	EXPECT_EQ(errorOf(std::format("START:{}", unknown)), "NotFound");
	EXPECT_EQ(errorOf(std::format("STATE:{},{}", unknown, player)), "NotFound");
	EXPECT_EQ(errorOf(std::format("SWAP:{},{},A", unknown, player)), "NotFound");
}

TEST_F(RequestRouterTest, LobbyFlow) {
	const auto gameId = createGame();
	EXPECT_NE(m_registry.lookup(gameId), nullptr);

	const auto alice = join(gameId, "alice");
	EXPECT_EQ(errorOf(std::format("START:{}", gameId.toString())), "NotEnoughPlayers");
	EXPECT_EQ(errorOf(std::format("STATE:{},{}", gameId.toString(), alice.toString())), "NotStarted");

	join(gameId, "bob");
	join(gameId, "carol");
	join(gameId, "dave");
	EXPECT_EQ(errorOf(std::format("JOIN:{},eve", gameId.toString())), "GameFull");

	const auto started = call(std::format("START:{}", gameId.toString()));
	ASSERT_TRUE(std::holds_alternative<StartedReply>(started));
	EXPECT_EQ(std::get<StartedReply>(started).gameId, gameId);

	EXPECT_EQ(errorOf(std::format("START:{}", gameId.toString())), "AlreadyStarted");
}

TEST_F(RequestRouterTest, TurnFlow) {
	const auto gameId = createGame();
	const auto alice  = join(gameId, "alice");
	const auto bob    = join(gameId, "bob");
	ASSERT_TRUE(std::holds_alternative<StartedReply>(call(std::format("START:{}", gameId.toString()))));

	const auto g = gameId.toString();
	EXPECT_EQ(errorOf(std::format("JOIN:{},carol", g)), "AlreadyStarted");

	const auto initial = call(std::format("STATE:{},{}", g, alice.toString()));
	ASSERT_TRUE(std::holds_alternative<StateReply>(initial));
	EXPECT_EQ(std::get<StateReply>(initial).state.turn, 0u);
	EXPECT_EQ(std::get<StateReply>(initial).state.playerTiles, ALICE_RACK);

	EXPECT_EQ(errorOf(std::format("PLAY:{},{},7|7,9|7,BED", g, bob.toString())), "NotYourTurn");
	EXPECT_EQ(errorOf(std::format("PLAY:{},{},0|0,2|0,CAT", g, alice.toString())), "IllegalMove");
	EXPECT_EQ(errorOf(std::format("SWAP:{},{},QQ", g, alice.toString())), "InvalidTiles");
	EXPECT_EQ(errorOf(std::format("STATE:{},{}", g, PlayerId::generate().toString())), "NotFound");

	const auto played = call(std::format("PLAY:{},{},7|7,9|7,CAT", g, alice.toString()));
	ASSERT_TRUE(std::holds_alternative<StateReply>(played));
	const auto& state = std::get<StateReply>(played).state;
	EXPECT_EQ(state.turn, 1u);
	EXPECT_EQ(state.playerTiles.size(), RACK_SIZE);
	EXPECT_EQ(state.players[0].score, 10u);
	EXPECT_EQ(state.board.row(7), ".......CAT.....");

	const auto bobView = call(std::format("STATE:{},{}", g, bob.toString()));
	ASSERT_TRUE(std::holds_alternative<StateReply>(bobView));
	EXPECT_EQ(std::get<StateReply>(bobView).state.playerTiles, BOB_RACK);
}

TEST(RequestRouter, StalledGameAnswersTimeoutWithoutBlockingTheCaller) {
	auto engine = std::make_shared<BlockingEngine>();
	asio::thread_pool timers{1};
	GameRegistry registry(scriptedSettings(engine, 300ms));
	RequestRouter router(registry, timers.get_executor());

	const auto game = registry.create();
	PlayerId alice, bob;
	ASSERT_EQ(game->addPlayer("alice", alice), GameError::None);
	ASSERT_EQ(game->addPlayer("bob", bob), GameError::None);
	ASSERT_EQ(game->start(), GameError::None);

	std::promise<network::Message> reply;
	auto future = reply.get_future();
	router.handle(std::format("PLAY:{},{},7|7,9|7,CAT", game->id().toString(), alice.toString()),
	              [&reply](network::Message m) { reply.set_value(std::move(m)); });

	// handle() returned while the engine still holds the move.
	engine->waitUntilEntered();
	EXPECT_EQ(future.wait_for(0s), std::future_status::timeout);

	ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
	EXPECT_EQ(future.get(), "ERROR:Timeout");

	// The player may ask again right away; the stalled move still holds the controller.
	std::promise<network::Message> again;
	auto againFuture = again.get_future();
	router.handle(std::format("STATE:{},{}", game->id().toString(), bob.toString()), [&again](network::Message m) { again.set_value(std::move(m)); });
	engine->release();
	ASSERT_EQ(againFuture.wait_for(5s), std::future_status::ready);
	EXPECT_EQ(againFuture.get().substr(0, 6), "STATE:");
}

} // namespace wordgame::server::gtest
