#pragma once

#include "core/boardEngine.hpp"
#include "core/gameState.hpp"
#include "core/tileBag.hpp"
#include "core/turnController.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wordgame {

inline constexpr std::chrono::milliseconds DEFAULT_REPLY_TIMEOUT{5000};

//! Collaborators and limits shared by every game of a registry.
struct GameSettings {
	std::chrono::milliseconds replyTimeout{DEFAULT_REPLY_TIMEOUT}; //!< Upper bound a caller waits for its turn reply.
	std::function<std::unique_ptr<IDrawPool>()> makeDrawPool{[] { return std::make_unique<TileBag>(); }};
	std::shared_ptr<const IBoardEngine> engine{std::make_shared<BoardEngine>()};
};

//! One playthrough.
//! Lobby phase: many callers join concurrently under the lobby lock.
//! Active phase: the turn controller owns the game state; the lobby lock guards nothing mutable anymore.
class Game {
public:
	Game(GameId id, GameSettings settings);
	~Game();

	Game(const Game&)            = delete;
	Game& operator=(const Game&) = delete;

	const GameId& id() const;

	//! Join the lobby. Assigns the next join number.
	//! \returns GameFull, AlreadyStarted or None (playerId set).
	GameError addPlayer(std::string name, PlayerId& playerId);

	//! Deal racks and hand the game over to a new turn controller.
	//! \returns AlreadyStarted, NotEnoughPlayers or None.
	GameError start();

	//! Forward a turn request to the turn controller and wait for its reply.
	//! Blocks for at most the configured reply timeout.
	GameStateResponse request(TurnRequest request);

	//! Forward a turn request without waiting. handler gets exactly one reply.
	//! The caller owns the deadline: once replyTimeout() passed, it calls expire() with the returned ticket.
	//! \returns Empty if handler was already called with a rejection.
	std::optional<ReplySlot::Ticket> requestAsync(TurnRequest request, ReplySlot::Handler handler);

	//! Resolve a pending request with Timeout. No-op if its reply went out already.
	void expire(const PlayerId& playerId, ReplySlot::Ticket ticket);

	std::chrono::milliseconds replyTimeout() const;

	bool isActive() const;
	bool isBusy() const; //!< A turn request is queued or being handled.
	std::size_t playerCount() const;
	std::chrono::steady_clock::time_point lastActivity() const;

private:
	void touch();

private:
	const GameId m_id;
	const GameSettings m_settings;

	mutable std::mutex m_lobbyMutex;
	std::vector<Player> m_lobby; //!< Join order. Moved into the controller on start.
	std::size_t m_playerCount{0};

	std::unique_ptr<TurnController> m_controller; //!< Set once, under the lobby lock, before m_active is published.
	std::atomic<bool> m_active{false};

	std::atomic<std::chrono::steady_clock::rep> m_lastActivity;
};

} // namespace wordgame
