#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wordgame {

using Tile  = char;        //!< Single upper-case letter.
using Tiles = std::string; //!< Ordered sequence of tiles (rack, play, swap).

//! Coordinate pair for the board. x is the column, y the row.
struct Coord {
	unsigned x, y;

	bool operator==(const Coord&) const = default;
};

inline constexpr std::size_t MAX_PLAYERS = 4;
inline constexpr std::size_t MIN_PLAYERS = 2;
inline constexpr std::size_t RACK_SIZE   = 7;
inline constexpr std::size_t BOARD_SIZE  = 15;
inline constexpr unsigned BINGO_BONUS    = 50; //!< Bonus for playing a full rack.

//! Per request outcome. Every value except None rejects exactly one request.
enum class GameError : std::uint8_t {
	None,
	NotFound,         //!< Unknown game or player.
	GameFull,         //!< MAX_PLAYERS already joined.
	AlreadyStarted,   //!< Lobby operation on an active game.
	NotEnoughPlayers, //!< Start with fewer than MIN_PLAYERS.
	NotStarted,       //!< Turn request on a game still in the lobby.
	NotYourTurn,
	IllegalMove,      //!< Rejected by the board engine.
	InvalidTiles,     //!< Tiles not held by the player.
	NotEnoughTiles,   //!< Draw pool too small for the exchange.
	RequestInFlight,  //!< Player already waits for a reply.
	Timeout,
	ShuttingDown
};

std::string_view toString(GameError error);
std::optional<GameError> gameErrorFromString(std::string_view value);

//! True for the letters the tile bag hands out.
inline constexpr bool isTile(char c) {
	return c >= 'A' && c <= 'Z';
}

} // namespace wordgame
