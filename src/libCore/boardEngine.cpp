#include "core/boardEngine.hpp"

#include "core/tileBag.hpp"

#include <algorithm>
#include <array>
#include <cassert>
#include <string_view>

namespace wordgame {

// T = triple word, D = double word, t = triple letter, d = double letter.
static constexpr std::array<std::string_view, 8> PREMIUM_ROWS{
	"T..d...T...d..T", ".D...t...t...D.", "..D...d.d...D..", "d..D...d...D..d",
	"....D.....D....", ".t...t...t...t.", "..d...d.d...d..", "T..d...D...d..T",
};

struct Direction {
	int dx, dy;
};

static constexpr Direction HORIZONTAL{1, 0};
static constexpr Direction VERTICAL{0, 1};

//! Word on the board with the squares it covers.
struct FormedWord {
	std::string letters;
	std::vector<Coord> squares;
};

Premium premiumAt(const Coord c) {
	assert(c.x < BOARD_SIZE && c.y < BOARD_SIZE);

	// Layout is symmetric; rows below the centre mirror the ones above.
	const auto row = c.y < PREMIUM_ROWS.size() ? c.y : BOARD_SIZE - 1 - c.y;
	switch (PREMIUM_ROWS[row][c.x]) {
	case 'T':
		return Premium::TripleWord;
	case 'D':
		return Premium::DoubleWord;
	case 't':
		return Premium::TripleLetter;
	case 'd':
		return Premium::DoubleLetter;
	default:
		return Premium::None;
	}
}

static bool step(const Board& board, Coord& c, Direction dir, int sign) {
	const auto nx = static_cast<long>(c.x) + sign * dir.dx;
	const auto ny = static_cast<long>(c.y) + sign * dir.dy;
	if (nx < 0 || ny < 0) {
		return false;
	}
	const Coord next{static_cast<unsigned>(nx), static_cast<unsigned>(ny)};
	if (!board.inside(next)) {
		return false;
	}
	c = next;
	return true;
}

//! Collect the maximal run of tiles through c along dir.
static FormedWord wordThrough(const Board& board, Coord c, Direction dir) {
	auto first = c;
	for (auto probe = c; step(board, probe, dir, -1) && !board.isEmpty(probe);) {
		first = probe;
	}

	FormedWord word;
	for (auto cur = first;;) {
		word.letters.push_back(board.at(cur));
		word.squares.push_back(cur);
		if (!step(board, cur, dir, 1) || board.isEmpty(cur)) {
			break;
		}
	}
	return word;
}

static bool touchesExisting(const Board& board, Coord c) {
	for (const auto dir: {HORIZONTAL, VERTICAL}) {
		for (const int sign: {-1, 1}) {
			auto neighbour = c;
			if (step(board, neighbour, dir, sign) && !board.isEmpty(neighbour)) {
				return true;
			}
		}
	}
	return false;
}

static unsigned scoreWord(const Board& board, const FormedWord& word, const std::vector<Coord>& placed) {
	unsigned sum        = 0;
	unsigned multiplier = 1;
	for (std::size_t i = 0; i < word.squares.size(); ++i) {
		const auto square = word.squares[i];
		auto letter       = tileScore(board.at(square));

		if (std::find(placed.begin(), placed.end(), square) != placed.end()) {
			switch (premiumAt(square)) {
			case Premium::DoubleLetter:
				letter *= 2;
				break;
			case Premium::TripleLetter:
				letter *= 3;
				break;
			case Premium::DoubleWord:
				multiplier *= 2;
				break;
			case Premium::TripleWord:
				multiplier *= 3;
				break;
			case Premium::None:
				break;
			}
		}
		sum += letter;
	}
	return sum * multiplier;
}

BoardEngine::BoardEngine(std::shared_ptr<const WordList> words) : m_words{std::move(words)} {
	assert(m_words);
}

PlaceResult BoardEngine::tryPlace(const Board& board, const Coord start, const Coord end, const Tiles& tiles) const {
	PlaceResult result;

	if (tiles.empty() || tiles.size() > RACK_SIZE || !std::all_of(tiles.begin(), tiles.end(), isTile)) {
		return result;
	}
	if (!board.inside(start) || !board.inside(end)) {
		return result;
	}

	const bool horizontal = start.y == end.y && start.x <= end.x;
	const bool vertical   = start.x == end.x && start.y <= end.y;
	if (!horizontal && !vertical) {
		return result;
	}
	const auto mainDir  = horizontal ? HORIZONTAL : VERTICAL;
	const auto crossDir = horizontal ? VERTICAL : HORIZONTAL;

	// Lay the tiles on the free squares of the segment.
	Board next = board;
	std::vector<Coord> placed;
	bool connected   = false;
	std::size_t used = 0;
	for (auto cur = start;;) {
		if (next.isEmpty(cur)) {
			if (used == tiles.size()) {
				return result; // Gap in the segment.
			}
			next.set(cur, tiles[used++]);
			placed.push_back(cur);
			connected = connected || touchesExisting(board, cur);
		} else {
			connected = true; // Segment runs through existing tiles.
		}

		if (cur == end) {
			break;
		}
		step(board, cur, mainDir, 1);
	}
	if (used != tiles.size()) {
		return result;
	}

	if (board.empty()) {
		if (std::find(placed.begin(), placed.end(), CENTER) == placed.end()) {
			return result;
		}
	} else if (!connected) {
		return result;
	}

	std::vector<FormedWord> words;
	if (auto mainWord = wordThrough(next, start, mainDir); mainWord.letters.size() >= 2) {
		words.push_back(std::move(mainWord));
	}
	for (const auto square: placed) {
		if (auto cross = wordThrough(next, square, crossDir); cross.letters.size() >= 2) {
			words.push_back(std::move(cross));
		}
	}
	if (words.empty()) {
		return result; // Single letter on its own.
	}

	unsigned score = 0;
	for (const auto& word: words) {
		if (!m_words->accepts(word.letters)) {
			return result;
		}
		score += scoreWord(next, word, placed);
		result.words.push_back(word.letters);
	}
	if (placed.size() == RACK_SIZE) {
		score += BINGO_BONUS;
	}

	result.error = GameError::None;
	result.board = std::move(next);
	result.score = score;
	return result;
}

} // namespace wordgame
