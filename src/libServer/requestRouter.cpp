#include "server/requestRouter.hpp"

#include "Logging.hpp"

#include <chrono>
#include <format>
#include <memory>

namespace wordgame::server {

namespace {

ServerReply errorReply(GameError error) {
	return ErrorReply{.reason = std::string{toString(error)}};
}

//! Deadline of one forwarded turn request. Strand only.
struct Deadline {
	explicit Deadline(const asio::strand<asio::any_io_executor>& strand) : timer{strand} {
	}

	asio::steady_timer timer;
	bool answered{false};
};

} // namespace

RequestRouter::RequestRouter(GameRegistry& registry, asio::any_io_executor executor) : m_registry{registry}, m_deadlines{asio::make_strand(executor)} {
}

void RequestRouter::handle(const network::Message& message, ReplyHandler reply) {
	const auto request = fromClientMessage(message);
	if (!request) {
		auto logger = Logger();
		logger.Log(Logging::LogLevel::Warning, std::format("[RequestRouter] Could not parse request: '{}'.", message));
		reply(std::format("ERROR:{}", REASON_BAD_REQUEST));
		return;
	}

	dispatch(*request, [message, reply = std::move(reply)](ServerReply serverReply) {
		const auto encoded = toMessage(serverReply);
		if (!encoded) {
			auto logger = Logger();
			logger.Log(Logging::LogLevel::Error, std::format("[RequestRouter] Could not encode reply to '{}'.", message));
			reply(std::format("ERROR:{}", REASON_INTERNAL));
			return;
		}
		reply(*encoded);
	});
}

void RequestRouter::dispatch(const ClientRequest& request, Completion done) {
	std::visit([&](const auto& r) { route(r, done); }, request);
}

void RequestRouter::route(const CreateGameRequest&, const Completion& done) {
	const auto game = m_registry.create();
	done(GameCreatedReply{.gameId = game->id()});
}

void RequestRouter::route(const JoinGameRequest& request, const Completion& done) {
	const auto game = m_registry.lookup(request.gameId);
	if (!game) {
		done(errorReply(GameError::NotFound));
		return;
	}

	PlayerId playerId;
	if (const auto error = game->addPlayer(request.playerName, playerId); error != GameError::None) {
		done(errorReply(error));
		return;
	}
	done(JoinedReply{.gameId = request.gameId, .playerId = playerId});
}

void RequestRouter::route(const StartGameRequest& request, const Completion& done) {
	const auto game = m_registry.lookup(request.gameId);
	if (!game) {
		done(errorReply(GameError::NotFound));
		return;
	}

	if (const auto error = game->start(); error != GameError::None) {
		done(errorReply(error));
		return;
	}
	done(StartedReply{.gameId = request.gameId});
}

void RequestRouter::route(const StateRequest& request, const Completion& done) {
	forward(request.gameId, QueryRequest{.playerId = request.playerId}, done);
}

void RequestRouter::route(const PlayTilesRequest& request, const Completion& done) {
	forward(request.gameId, PlayRequest{.playerId = request.playerId, .start = request.start, .end = request.end, .tiles = request.tiles}, done);
}

void RequestRouter::route(const SwapTilesRequest& request, const Completion& done) {
	forward(request.gameId, SwapRequest{.playerId = request.playerId, .tiles = request.tiles}, done);
}

void RequestRouter::forward(const GameId& gameId, TurnRequest request, const Completion& done) {
	const auto game = m_registry.lookup(gameId);
	if (!game) {
		done(errorReply(GameError::NotFound));
		return;
	}

	const auto playerId = requester(request);
	auto deadline       = std::make_shared<Deadline>(m_deadlines);

	// Runs on the controller thread, or wherever expire() is called. Must not keep the game alive.
	auto onReply = [strand = m_deadlines, deadline, done](GameStateResponse response) {
		asio::post(strand, [deadline] {
			deadline->answered = true;
			deadline->timer.cancel();
		});

		if (response.error != GameError::None) {
			done(errorReply(response.error));
			return;
		}
		done(StateReply{.state = std::move(response)});
	};

	const auto ticket = game->requestAsync(std::move(request), std::move(onReply));
	if (!ticket) {
		return;
	}

	asio::post(m_deadlines, [deadline, weakGame = std::weak_ptr<Game>(game), playerId, ticket = *ticket, timeout = game->replyTimeout()] {
		if (deadline->answered) {
			return;
		}
		deadline->timer.expires_after(timeout);
		deadline->timer.async_wait([weakGame, playerId, ticket](const asio::error_code& ec) {
			if (ec) {
				return;
			}
			if (const auto game = weakGame.lock()) {
				game->expire(playerId, ticket);
			}
		});
	});
}

} // namespace wordgame::server
