#pragma once

#include "core/game.hpp"
#include "core/identifier.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace wordgame {

//! Process wide mapping from game id to game.
//! The registry lock only covers map access; callers work on the returned game without holding it.
class GameRegistry {
public:
	explicit GameRegistry(GameSettings settings = {});

	std::shared_ptr<Game> create();                             //!< New empty game in lobby phase.
	std::shared_ptr<Game> lookup(const GameId& gameId) const;   //!< nullptr if the game does not exist.

	//! Drop games without activity for longer than maxIdle. Games still working on a turn request stay.
	//! Callers still holding an evicted game keep it alive until they release it.
	//! \returns Number of evicted games.
	std::size_t evictIdle(std::chrono::steady_clock::duration maxIdle);

	std::size_t size() const;

private:
	const GameSettings m_settings;

	mutable std::mutex m_mutex;
	std::unordered_map<GameId, std::shared_ptr<Game>> m_games;
};

} // namespace wordgame
