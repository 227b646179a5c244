#include "core/boardEngine.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace wordgame::gtest {

static Board boardWithCat() {
	BoardEngine engine;
	auto result = engine.tryPlace(Board{}, CENTER, {9u, 7u}, "CAT");
	EXPECT_EQ(result.error, GameError::None);
	return result.board;
}

TEST(BoardEngine, PremiumLayout) {
	EXPECT_EQ(premiumAt({0u, 0u}), Premium::TripleWord);
	EXPECT_EQ(premiumAt({14u, 14u}), Premium::TripleWord);
	EXPECT_EQ(premiumAt(CENTER), Premium::DoubleWord);
	EXPECT_EQ(premiumAt({3u, 0u}), Premium::DoubleLetter);
	EXPECT_EQ(premiumAt({5u, 1u}), Premium::TripleLetter);
	EXPECT_EQ(premiumAt({5u, 13u}), Premium::TripleLetter);
	EXPECT_EQ(premiumAt({1u, 0u}), Premium::None);
}

TEST(BoardEngine, FirstMoveCoversCentre) {
	BoardEngine engine;

	EXPECT_EQ(engine.tryPlace(Board{}, {0u, 0u}, {2u, 0u}, "CAT").error, GameError::IllegalMove);

	const auto result = engine.tryPlace(Board{}, CENTER, {9u, 7u}, "CAT");
	ASSERT_EQ(result.error, GameError::None);
	EXPECT_EQ(result.score, 10u); // (3 + 1 + 1) on a double word square
	ASSERT_EQ(result.words.size(), 1u);
	EXPECT_EQ(result.words[0], "CAT");
	EXPECT_EQ(result.board.row(7), ".......CAT.....");
	EXPECT_EQ(result.board.placedCount(), 3u);
}

TEST(BoardEngine, InputBoardIsNotModified) {
	BoardEngine engine;
	const Board board;

	const auto result = engine.tryPlace(board, CENTER, {9u, 7u}, "CAT");
	ASSERT_EQ(result.error, GameError::None);
	EXPECT_TRUE(board.empty());
}

TEST(BoardEngine, RejectsMalformedSegments) {
	BoardEngine engine;
	const Board board;

	EXPECT_EQ(engine.tryPlace(board, {6u, 6u}, {8u, 8u}, "CAT").error, GameError::IllegalMove);  // Diagonal
	EXPECT_EQ(engine.tryPlace(board, {9u, 7u}, CENTER, "CAT").error, GameError::IllegalMove);    // Reversed
	EXPECT_EQ(engine.tryPlace(board, CENTER, {10u, 7u}, "CAT").error, GameError::IllegalMove);   // Gap at the end
	EXPECT_EQ(engine.tryPlace(board, CENTER, {8u, 7u}, "CAT").error, GameError::IllegalMove);    // Too many tiles
	EXPECT_EQ(engine.tryPlace(board, CENTER, {20u, 7u}, "CAT").error, GameError::IllegalMove);   // Outside
	EXPECT_EQ(engine.tryPlace(board, CENTER, {9u, 7u}, "cat").error, GameError::IllegalMove);    // Not tiles
	EXPECT_EQ(engine.tryPlace(board, CENTER, {9u, 7u}, "").error, GameError::IllegalMove);
	EXPECT_EQ(engine.tryPlace(board, CENTER, CENTER, "A").error, GameError::IllegalMove);        // Single letter
}

TEST(BoardEngine, LaterMovesConnect) {
	BoardEngine engine;
	const auto board = boardWithCat();

	EXPECT_EQ(engine.tryPlace(board, {0u, 0u}, {2u, 0u}, "DOG").error, GameError::IllegalMove);

	const auto extended = engine.tryPlace(board, {10u, 7u}, {10u, 7u}, "S");
	ASSERT_EQ(extended.error, GameError::None);
	ASSERT_EQ(extended.words.size(), 1u);
	EXPECT_EQ(extended.words[0], "CATS");
	EXPECT_EQ(extended.score, 6u); // Premiums only count for new tiles
}

TEST(BoardEngine, SegmentRunsThroughExistingTiles) {
	BoardEngine engine;
	const auto board = boardWithCat();

	// B above and T below the existing A.
	const auto result = engine.tryPlace(board, {8u, 6u}, {8u, 8u}, "BT");
	ASSERT_EQ(result.error, GameError::None);
	ASSERT_EQ(result.words.size(), 1u);
	EXPECT_EQ(result.words[0], "BAT");
	EXPECT_EQ(result.score, 9u); // 2*3 + 1 + 2*1
	EXPECT_EQ(result.board.at({8u, 6u}), 'B');
	EXPECT_EQ(result.board.at({8u, 8u}), 'T');
}

TEST(BoardEngine, FormsCrossWords) {
	BoardEngine engine;
	const auto board = boardWithCat();

	// "AT" on row 8, directly below "AT" of CAT: main word AT plus cross words AA and TT.
	const auto result = engine.tryPlace(board, {8u, 8u}, {9u, 8u}, "AT");
	ASSERT_EQ(result.error, GameError::None);
	EXPECT_EQ(result.words, (std::vector<std::string>{"AT", "AA", "TT"}));
}

TEST(BoardEngine, FullRackEarnsBonus) {
	BoardEngine engine;

	const auto result = engine.tryPlace(Board{}, CENTER, {13u, 7u}, "ABCDEFG");
	ASSERT_EQ(result.error, GameError::None);
	EXPECT_EQ(result.score, 2u * 17u + BINGO_BONUS);
}

TEST(BoardEngine, ChecksEveryWordAgainstTheWordList) {
	auto words = std::make_shared<WordList>(std::initializer_list<std::string_view>{"cat", "cats"});
	BoardEngine engine(words);

	EXPECT_EQ(engine.tryPlace(Board{}, CENTER, {9u, 7u}, "DOG").error, GameError::IllegalMove);

	const auto first = engine.tryPlace(Board{}, CENTER, {9u, 7u}, "CAT");
	ASSERT_EQ(first.error, GameError::None);
	EXPECT_EQ(engine.tryPlace(first.board, {10u, 7u}, {10u, 7u}, "S").error, GameError::None);

	// Cross words are checked too: AA and TT are not listed.
	EXPECT_EQ(engine.tryPlace(first.board, {8u, 8u}, {9u, 8u}, "AT").error, GameError::IllegalMove);
}

} // namespace wordgame::gtest
