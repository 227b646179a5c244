#pragma once

#include "core/gameState.hpp"
#include "core/identifier.hpp"
#include "core/types.hpp"
#include "network/protocol.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace wordgame::server {

inline constexpr std::size_t MAX_NAME_LENGTH = 32;

// Reasons of error replies that do not stem from the game itself.
inline constexpr std::string_view REASON_BAD_REQUEST = "BadRequest";
inline constexpr std::string_view REASON_INTERNAL    = "Internal";

// Client requests (client -> server)
struct CreateGameRequest {};
struct JoinGameRequest {
	GameId gameId;
	std::string playerName;
};
struct StartGameRequest {
	GameId gameId;
};
struct StateRequest {
	GameId gameId;
	PlayerId playerId;
};
struct PlayTilesRequest {
	GameId gameId;
	PlayerId playerId;
	Coord start;
	Coord end;
	Tiles tiles;
};
struct SwapTilesRequest {
	GameId gameId;
	PlayerId playerId;
	Tiles tiles;
};

// Server replies (server -> client)
struct GameCreatedReply {
	GameId gameId;
};
struct JoinedReply {
	GameId gameId;
	PlayerId playerId;
};
struct StartedReply {
	GameId gameId;
};
struct StateReply {
	GameStateResponse state; //!< state.error is not transmitted; failed requests get an ErrorReply.
};
struct ErrorReply {
	std::string reason; //!< GameError name, REASON_BAD_REQUEST or REASON_INTERNAL.
};

using ClientRequest = std::variant<CreateGameRequest, JoinGameRequest, StartGameRequest, StateRequest, PlayTilesRequest, SwapTilesRequest>;
using ServerReply   = std::variant<GameCreatedReply, JoinedReply, StartedReply, StateReply, ErrorReply>;

//! Names are 1..MAX_NAME_LENGTH printable characters without protocol separators.
bool isValidPlayerName(std::string_view name);

// Serialize typed messages. Empty if the message cannot be represented or exceeds MAX_PAYLOAD_BYTES.
std::optional<network::Message> toMessage(const ClientRequest& request);
std::optional<network::Message> toMessage(const ServerReply& reply);

// Parse messages into typed events. Returns empty on invalid input.
std::optional<ClientRequest> fromClientMessage(std::string_view message);
std::optional<ServerReply> fromServerMessage(std::string_view message);

} // namespace wordgame::server
