#include "core/gameRegistry.hpp"

#include "Logging.hpp"

#include <format>
#include <vector>

namespace wordgame {

GameRegistry::GameRegistry(GameSettings settings) : m_settings{std::move(settings)} {
}

std::shared_ptr<Game> GameRegistry::create() {
	auto game = std::make_shared<Game>(GameId::generate(), m_settings);
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_games.emplace(game->id(), game);
	}

	auto logger = Logger();
	logger.Log(Logging::LogLevel::Info, std::format("[GameRegistry] Created game {}.", game->id().toString()));
	return game;
}

std::shared_ptr<Game> GameRegistry::lookup(const GameId& gameId) const {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_games.find(gameId);
	if (it == m_games.end()) {
		return nullptr;
	}
	return it->second;
}

std::size_t GameRegistry::evictIdle(std::chrono::steady_clock::duration maxIdle) {
	const auto deadline = std::chrono::steady_clock::now() - maxIdle;

	std::vector<std::shared_ptr<Game>> evicted;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		for (auto it = m_games.begin(); it != m_games.end();) {
			// A busy game may be stuck in its engine; tearing it down would join that thread here.
			if (it->second->lastActivity() < deadline && !it->second->isBusy()) {
				evicted.push_back(std::move(it->second));
				it = m_games.erase(it);
			} else {
				++it;
			}
		}
	}

	// Games die outside the lock; destroying an active game joins its controller thread.
	for (const auto& game: evicted) {
		auto logger = Logger();
		logger.Log(Logging::LogLevel::Info, std::format("[GameRegistry] Evicted idle game {}.", game->id().toString()));
	}
	return evicted.size();
}

std::size_t GameRegistry::size() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_games.size();
}

} // namespace wordgame
