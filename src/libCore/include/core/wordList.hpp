#pragma once

#include <cstddef>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>
#include <unordered_set>

namespace wordgame {

//! Dictionary used by the board engine to check formed words.
//! An empty list accepts every word.
class WordList {
public:
	WordList() = default;
	WordList(std::initializer_list<std::string_view> words);

	//! Load newline separated words. Lines starting with '#' are skipped.
	//! \returns False if the file could not be read. Words read so far are kept.
	bool load(const std::filesystem::path& path);

	void add(std::string_view word);
	bool accepts(std::string_view word) const; //!< Case insensitive.
	std::size_t size() const;

private:
	std::unordered_set<std::string> m_words; //!< Upper case.
};

} // namespace wordgame
