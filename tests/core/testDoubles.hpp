#pragma once

#include "core/boardEngine.hpp"
#include "core/game.hpp"
#include "core/tileBag.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace wordgame::gtest {

//! Draw pool handing out a fixed sequence from the front. Swapped tiles go to the back.
class ScriptedPool : public IDrawPool {
public:
	explicit ScriptedPool(Tiles script) : m_tiles{std::move(script)} {
	}

	Tiles draw(std::size_t count) override {
		const auto n = std::min(count, m_tiles.size());
		auto drawn   = m_tiles.substr(0, n);
		m_tiles.erase(0, n);
		return drawn;
	}

	GameError exchange(const Tiles& tiles, Tiles& replacement) override {
		if (tiles.empty() || m_tiles.size() < tiles.size()) {
			return GameError::NotEnoughTiles;
		}
		replacement = draw(tiles.size());
		m_tiles += tiles;
		return GameError::None;
	}

	std::size_t remaining() const override {
		return m_tiles.size();
	}

private:
	Tiles m_tiles;
};

//! Real board rules, but the first call waits until the test releases it.
class BlockingEngine : public IBoardEngine {
public:
	PlaceResult tryPlace(const Board& board, Coord start, Coord end, const Tiles& tiles) const override {
		std::unique_lock<std::mutex> lock(m_mutex);
		m_entered = true;
		m_condition.notify_all();
		m_condition.wait(lock, [this] { return m_released; });
		lock.unlock();

		return m_rules.tryPlace(board, start, end, tiles);
	}

	void waitUntilEntered() {
		std::unique_lock<std::mutex> lock(m_mutex);
		m_condition.wait(lock, [this] { return m_entered; });
	}

	void release() {
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			m_released = true;
		}
		m_condition.notify_all();
	}

private:
	BoardEngine m_rules;

	mutable std::mutex m_mutex;
	mutable std::condition_variable m_condition;
	mutable bool m_entered{false};
	bool m_released{false};
};

//! Engine that fails with an exception.
class ThrowingEngine : public IBoardEngine {
public:
	PlaceResult tryPlace(const Board&, Coord, Coord, const Tiles&) const override {
		throw std::runtime_error("dictionary unavailable");
	}
};

// Alice draws "CATSDOG", Bob "BEDRUNE", then the pool continues with the rest.
inline constexpr char ALICE_RACK[] = "CATSDOG";
inline constexpr char BOB_RACK[]   = "BEDRUNE";
inline constexpr char POOL_REST[]  = "XYZQKLMNOPIIIIIAAAAAEEEEE";

inline GameSettings scriptedSettings(std::shared_ptr<const IBoardEngine> engine = std::make_shared<BoardEngine>(),
                                     std::chrono::milliseconds timeout   = DEFAULT_REPLY_TIMEOUT) {
	GameSettings settings;
	settings.replyTimeout = timeout;
	settings.engine       = std::move(engine);
	settings.makeDrawPool = [] { return std::make_unique<ScriptedPool>(Tiles{ALICE_RACK} + BOB_RACK + POOL_REST); };
	return settings;
}

} // namespace wordgame::gtest
