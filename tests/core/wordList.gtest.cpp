#include "core/wordList.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace wordgame::gtest {

TEST(WordList, EmptyListAcceptsEverything) {
	WordList words;
	EXPECT_EQ(words.size(), 0u);
	EXPECT_TRUE(words.accepts("QXZ"));
}

TEST(WordList, CaseInsensitive) {
	WordList words{"Cat", "dog"};
	EXPECT_EQ(words.size(), 2u);
	EXPECT_TRUE(words.accepts("CAT"));
	EXPECT_TRUE(words.accepts("cat"));
	EXPECT_TRUE(words.accepts("DOG"));
	EXPECT_FALSE(words.accepts("COW"));
}

TEST(WordList, LoadSkipsCommentsAndBlankLines) {
	const auto path = std::filesystem::temp_directory_path() / "wordgame_words.txt";
	{
		std::ofstream file(path);
		file << "# comment\n"
		     << "apple\n"
		     << "\n"
		     << "Pear\r\n"
		     << "ZOO\n";
	}

	WordList words;
	ASSERT_TRUE(words.load(path));
	EXPECT_EQ(words.size(), 3u);
	EXPECT_TRUE(words.accepts("APPLE"));
	EXPECT_TRUE(words.accepts("PEAR"));
	EXPECT_FALSE(words.accepts("COMMENT"));

	std::filesystem::remove(path);
}

TEST(WordList, LoadMissingFileFails) {
	WordList words;
	EXPECT_FALSE(words.load(std::filesystem::temp_directory_path() / "wordgame_missing" / "words.txt"));
	EXPECT_EQ(words.size(), 0u);
}

} // namespace wordgame::gtest
