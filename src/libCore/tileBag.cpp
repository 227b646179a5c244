#include "core/tileBag.hpp"

#include <algorithm>
#include <array>

namespace wordgame {

struct LetterInfo {
	unsigned count;
	unsigned score;
};

// A..Z
static constexpr std::array<LetterInfo, 26> LETTERS{{
	{9, 1}, {2, 3}, {2, 3}, {4, 2}, {12, 1}, {2, 4}, {3, 2}, {2, 4}, {9, 1}, {1, 8}, {1, 5}, {4, 1}, {2, 3},
	{6, 1}, {8, 1}, {2, 3}, {1, 10}, {6, 1}, {4, 1}, {6, 1}, {4, 1}, {2, 4}, {2, 4}, {1, 8}, {2, 4}, {1, 10},
}};

unsigned tileCount(Tile tile) {
	return isTile(tile) ? LETTERS[static_cast<std::size_t>(tile - 'A')].count : 0u;
}

unsigned tileScore(Tile tile) {
	return isTile(tile) ? LETTERS[static_cast<std::size_t>(tile - 'A')].score : 0u;
}

TileBag::TileBag(std::optional<std::uint32_t> seed) : m_random{seed ? *seed : std::random_device{}()} {
	for (char letter = 'A'; letter <= 'Z'; ++letter) {
		m_tiles.append(tileCount(letter), letter);
	}
	shuffle();
}

Tiles TileBag::draw(std::size_t count) {
	count = std::min(count, m_tiles.size());

	Tiles drawn = m_tiles.substr(m_tiles.size() - count);
	m_tiles.resize(m_tiles.size() - count);
	return drawn;
}

GameError TileBag::exchange(const Tiles& tiles, Tiles& replacement) {
	if (tiles.empty() || m_tiles.size() < tiles.size()) {
		return GameError::NotEnoughTiles;
	}

	replacement = draw(tiles.size());
	m_tiles += tiles;
	shuffle();
	return GameError::None;
}

std::size_t TileBag::remaining() const {
	return m_tiles.size();
}

void TileBag::shuffle() {
	std::shuffle(m_tiles.begin(), m_tiles.end(), m_random);
}

} // namespace wordgame
