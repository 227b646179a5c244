#pragma once

#include "core/gameRegistry.hpp"
#include "network/protocol.hpp"
#include "server/messages.hpp"

#include <asio.hpp>

#include <functional>

namespace wordgame::server {

//! Thin glue between decoded client requests and the game registry.
//! Thread safe and never blocks: turn requests are answered later from the game's controller thread,
//! or with Timeout once the game's reply timeout passed.
class RequestRouter {
public:
	using ReplyHandler = std::function<void(network::Message)>;
	using Completion   = std::function<void(ServerReply)>;

	//! Reply deadlines run on a strand of executor.
	RequestRouter(GameRegistry& registry, asio::any_io_executor executor);

	//! Decode, dispatch and encode. reply is called exactly once, possibly on another thread.
	void handle(const network::Message& message, ReplyHandler reply);

private:
	void dispatch(const ClientRequest& request, Completion done);
	void route(const CreateGameRequest& request, const Completion& done);
	void route(const JoinGameRequest& request, const Completion& done);
	void route(const StartGameRequest& request, const Completion& done);
	void route(const StateRequest& request, const Completion& done);
	void route(const PlayTilesRequest& request, const Completion& done);
	void route(const SwapTilesRequest& request, const Completion& done);

	//! Forward a turn request to the game's controller and arm its deadline.
	void forward(const GameId& gameId, TurnRequest request, const Completion& done);

private:
	GameRegistry& m_registry;
	asio::strand<asio::any_io_executor> m_deadlines;
};

} // namespace wordgame::server
