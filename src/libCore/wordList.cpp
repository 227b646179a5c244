#include "core/wordList.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>

namespace wordgame {

static std::string normalize(std::string_view word) {
	std::string out;
	out.reserve(word.size());
	for (const auto c: word) {
		if (std::isspace(static_cast<unsigned char>(c))) {
			continue;
		}
		out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
	}
	return out;
}

WordList::WordList(std::initializer_list<std::string_view> words) {
	for (const auto word: words) {
		add(word);
	}
}

bool WordList::load(const std::filesystem::path& path) {
	std::ifstream file(path);
	if (!file.is_open()) {
		auto logger = Logger();
		logger.Log(Logging::LogLevel::Error, std::format("[WordList] Could not open word list '{}'.", path.string()));
		return false;
	}

	std::string line;
	while (std::getline(file, line)) {
		if (line.empty() || line.front() == '#') {
			continue;
		}
		add(line);
	}

	auto logger = Logger();
	logger.Log(Logging::LogLevel::Info, std::format("[WordList] Loaded {} words from '{}'.", m_words.size(), path.string()));
	return true;
}

void WordList::add(std::string_view word) {
	auto normalized = normalize(word);
	if (!normalized.empty()) {
		m_words.insert(std::move(normalized));
	}
}

bool WordList::accepts(std::string_view word) const {
	if (m_words.empty()) {
		return true;
	}
	return m_words.contains(normalize(word));
}

std::size_t WordList::size() const {
	return m_words.size();
}

} // namespace wordgame
