#include "core/board.hpp"

#include <algorithm>
#include <cassert>

namespace wordgame {

std::size_t Board::size() const {
	return BOARD_SIZE;
}

bool Board::inside(const Coord c) const {
	return c.x < BOARD_SIZE && c.y < BOARD_SIZE;
}

Tile Board::at(const Coord c) const {
	assert(inside(c));
	return m_squares[c.y * BOARD_SIZE + c.x];
}

void Board::set(const Coord c, Tile tile) {
	assert(inside(c) && isEmpty(c)); // Engine checks placement before setting.
	m_squares[c.y * BOARD_SIZE + c.x] = tile;
}

bool Board::isEmpty(const Coord c) const {
	return at(c) == EMPTY;
}

bool Board::empty() const {
	return placedCount() == 0;
}

std::size_t Board::placedCount() const {
	return static_cast<std::size_t>(std::count_if(m_squares.begin(), m_squares.end(), [](Tile t) { return t != EMPTY; }));
}

std::string Board::row(std::size_t y) const {
	assert(y < BOARD_SIZE);

	std::string out(BOARD_SIZE, '.');
	for (std::size_t x = 0; x < BOARD_SIZE; ++x) {
		const auto tile = m_squares[y * BOARD_SIZE + x];
		if (tile != EMPTY) {
			out[x] = tile;
		}
	}
	return out;
}

} // namespace wordgame
