#pragma once

#include "core/board.hpp"
#include "core/types.hpp"
#include "core/wordList.hpp"

#include <memory>
#include <string>
#include <vector>

namespace wordgame {

//! Outcome of a placement attempt. board and score are only meaningful when error is None.
struct PlaceResult {
	GameError error{GameError::IllegalMove};
	Board board{};
	unsigned score{0};
	std::vector<std::string> words{}; //!< Every word formed by the placement.
};

//! Placement legality and scoring. Implementations must be callable from any game thread.
class IBoardEngine {
public:
	virtual ~IBoardEngine() = default;

	//! Fill the free squares between start and end (inclusive) with tiles, in order.
	//! \note Never modifies the input board.
	virtual PlaceResult tryPlace(const Board& board, Coord start, Coord end, const Tiles& tiles) const = 0;
};

//! Standard rules: straight line, connected to existing tiles (or covering the centre on the first move),
//! every formed word in the word list, premium squares and full rack bonus.
class BoardEngine : public IBoardEngine {
public:
	explicit BoardEngine(std::shared_ptr<const WordList> words = std::make_shared<WordList>());

	PlaceResult tryPlace(const Board& board, Coord start, Coord end, const Tiles& tiles) const override;

private:
	std::shared_ptr<const WordList> m_words;
};

enum class Premium { None, DoubleLetter, TripleLetter, DoubleWord, TripleWord };

//! Premium of a square on the standard layout.
Premium premiumAt(Coord c);

} // namespace wordgame
