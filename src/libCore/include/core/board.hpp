#pragma once

#include "core/types.hpp"

#include <array>
#include <string>

namespace wordgame {

//! Square grid of letter tiles. Origin is the top left square.
//! \note Value type. Only the turn controller mutates the live board; responses get copies.
class Board {
public:
	static constexpr Tile EMPTY = '\0';

public:
	Board() = default;

	std::size_t size() const;

	bool inside(Coord c) const;      //!< True if (x,y) \in [0, size-1].
	Tile at(Coord c) const;          //!< Tile at coordinate or EMPTY.
	void set(Coord c, Tile tile);    //!< Place a tile on a free square.
	bool isEmpty(Coord c) const;     //!< Square holds no tile.
	bool empty() const;              //!< No tile on the whole board.
	std::size_t placedCount() const; //!< Number of tiles on the board.

	std::string row(std::size_t y) const; //!< Row as letters; empty squares as '.'.

	bool operator==(const Board&) const = default;

private:
	std::array<Tile, BOARD_SIZE * BOARD_SIZE> m_squares{}; //!< Row major.
};

//! The start square every first move has to cover.
inline constexpr Coord CENTER{BOARD_SIZE / 2, BOARD_SIZE / 2};

} // namespace wordgame
