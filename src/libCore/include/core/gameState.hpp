#pragma once

#include "core/board.hpp"
#include "core/identifier.hpp"
#include "core/types.hpp"

#include <string>
#include <variant>
#include <vector>

namespace wordgame {

//! Player record as stored by the game.
struct Player {
	PlayerId id;
	std::string name;
	unsigned number{0}; //!< Zero based join order. Turn rotation position.
	Tiles tiles{};      //!< Private rack.
	unsigned score{0};
};

//! What every participant may see of a player. Never carries the rack.
struct PlayerView {
	std::string name;
	unsigned number{0};
	unsigned score{0};
	std::size_t rackSize{0};

	bool operator==(const PlayerView&) const = default;
};

//! Per player reply of the turn controller.
struct GameStateResponse {
	GameError error{GameError::None};
	GameId gameId{};
	std::vector<PlayerView> players{}; //!< In join order.
	Board board{};
	unsigned turn{0};   //!< Number of the player to move.
	Tiles playerTiles{}; //!< Rack of the requesting player only.
};

// Turn requests accepted once the game is active.
struct QueryRequest {
	PlayerId playerId;
};
struct PlayRequest {
	PlayerId playerId;
	Coord start;
	Coord end;
	Tiles tiles;
};
struct SwapRequest {
	PlayerId playerId;
	Tiles tiles;
};

using TurnRequest = std::variant<QueryRequest, PlayRequest, SwapRequest>;

//! Player a turn request is submitted for.
inline const PlayerId& requester(const TurnRequest& request) {
	return std::visit([](const auto& r) -> const PlayerId& { return r.playerId; }, request);
}

} // namespace wordgame
