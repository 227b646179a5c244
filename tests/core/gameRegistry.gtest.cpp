#include "core/gameRegistry.hpp"
#include "core/testDoubles.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

namespace wordgame::gtest {

using namespace std::chrono_literals;

TEST(GameRegistry, CreateThenLookup) {
	GameRegistry registry(scriptedSettings());

	const auto game = registry.create();
	ASSERT_TRUE(game);
	EXPECT_FALSE(game->isActive());
	EXPECT_EQ(game->playerCount(), 0u);
	EXPECT_EQ(registry.lookup(game->id()), game);

	const auto other = registry.create();
	EXPECT_NE(other->id(), game->id());
	EXPECT_EQ(registry.size(), 2u);
}

TEST(GameRegistry, UnknownGameIsNotFound) {
	GameRegistry registry(scriptedSettings());
	registry.create();

	EXPECT_EQ(registry.lookup(GameId::generate()), nullptr);
	EXPECT_EQ(registry.lookup(GameId{}), nullptr);
}

TEST(GameRegistry, ConcurrentCreates) {
	GameRegistry registry(scriptedSettings());

	std::vector<std::thread> threads;
	for (int t = 0; t < 8; ++t) {
		threads.emplace_back([&] {
			for (int i = 0; i < 25; ++i) {
				const auto game = registry.create();
				EXPECT_EQ(registry.lookup(game->id()), game);
			}
		});
	}
	for (auto& t: threads) {
		t.join();
	}
	EXPECT_EQ(registry.size(), 200u);
}

TEST(GameRegistry, EvictsOnlyIdleGames) {
	GameRegistry registry(scriptedSettings());
	const auto idle = registry.create();
	const auto busy = registry.create();

	std::this_thread::sleep_for(50ms);
	PlayerId player;
	ASSERT_EQ(busy->addPlayer("alice", player), GameError::None);

	EXPECT_EQ(registry.evictIdle(25ms), 1u);
	EXPECT_EQ(registry.lookup(idle->id()), nullptr);
	EXPECT_EQ(registry.lookup(busy->id()), busy);
	EXPECT_EQ(registry.size(), 1u);
}

TEST(GameRegistry, EvictedGameStaysUsableForHolders) {
	GameRegistry registry(scriptedSettings());
	const auto game = registry.create();
	PlayerId alice, bob;
	ASSERT_EQ(game->addPlayer("alice", alice), GameError::None);
	ASSERT_EQ(game->addPlayer("bob", bob), GameError::None);
	ASSERT_EQ(game->start(), GameError::None);

	std::this_thread::sleep_for(20ms);
	EXPECT_EQ(registry.evictIdle(1ms), 1u);

	EXPECT_EQ(game->request(QueryRequest{alice}).error, GameError::None);
}

TEST(GameRegistry, KeepsGamesStuckInATurn) {
	auto engine = std::make_shared<BlockingEngine>();
	GameRegistry registry(scriptedSettings(engine, 20ms));
	const auto game = registry.create();
	PlayerId alice, bob;
	ASSERT_EQ(game->addPlayer("alice", alice), GameError::None);
	ASSERT_EQ(game->addPlayer("bob", bob), GameError::None);
	ASSERT_EQ(game->start(), GameError::None);

	EXPECT_EQ(game->request(PlayRequest{alice, CENTER, {9u, 7u}, "CAT"}).error, GameError::Timeout);
	std::this_thread::sleep_for(20ms);

	// Evicting would join the stuck controller thread.
	EXPECT_EQ(registry.evictIdle(1ms), 0u);
	EXPECT_EQ(registry.lookup(game->id()), game);

	engine->release();
	for (int attempt = 0; attempt < 100 && game->isBusy(); ++attempt) {
		std::this_thread::sleep_for(5ms);
	}
	EXPECT_EQ(registry.evictIdle(1ms), 1u);
}

} // namespace wordgame::gtest
