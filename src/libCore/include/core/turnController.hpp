#pragma once

#include "core/SafeQueue.hpp"
#include "core/boardEngine.hpp"
#include "core/gameState.hpp"
#include "core/replySlot.hpp"
#include "core/tileBag.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace wordgame {

//! Exclusive owner of an active game.
//! A dedicated thread pops the mailbox one request at a time and is the only code touching
//! racks, scores, board and turn index. Replies go through the requesting player's reply slot.
class TurnController {
public:
	TurnController(GameId gameId, std::vector<Player> players, std::unique_ptr<IDrawPool> pool, std::shared_ptr<const IBoardEngine> engine);
	~TurnController();

	TurnController(const TurnController&)            = delete;
	TurnController& operator=(const TurnController&) = delete;

	//! Enqueue the request and wait for the reply addressed to its player.
	//! Unknown players are rejected directly; no request is queued for them.
	GameStateResponse submit(TurnRequest request, std::chrono::milliseconds timeout);

	//! Enqueue the request and return at once.
	//! handler gets exactly one reply: from the controller thread, from expire(), or right here for a rejected request.
	//! \returns The ticket to expire the request with; empty if handler already got its rejection.
	std::optional<ReplySlot::Ticket> submitAsync(TurnRequest request, ReplySlot::Handler handler);

	//! Answer the request of ticket with Timeout unless the controller already replied.
	//! A request still in the mailbox is then dropped unprocessed.
	void expire(const PlayerId& playerId, ReplySlot::Ticket ticket);

	//! True while a request is queued or being handled.
	bool isBusy() const;

	//! Stop accepting requests, answer the queued ones and join the controller thread.
	void shutdown();

private:
	struct Envelope {
		TurnRequest request;
		ReplySlot::Ticket ticket;
	};

	void run(); //!< Controller thread: drain mailbox and act.
	void process(const Envelope& envelope);

	GameStateResponse handle(const QueryRequest& request);
	GameStateResponse handle(const PlayRequest& request);
	GameStateResponse handle(const SwapRequest& request);

	Player* findPlayer(const PlayerId& playerId);
	GameStateResponse stateFor(const Player& player) const; //!< Current state as seen by player.
	GameStateResponse reject(const Player& player, GameError error) const;
	void advanceTurn();

private:
	const GameId m_gameId;

	// Controller thread only.
	std::vector<Player> m_players; //!< Join order.
	Board m_board{};
	unsigned m_turnIndex{0};
	std::unique_ptr<IDrawPool> m_pool;
	std::shared_ptr<const IBoardEngine> m_engine;

	//! One reply slot per player. The map itself never changes after construction.
	std::unordered_map<PlayerId, std::unique_ptr<ReplySlot>> m_replySlots;

	SafeQueue<Envelope> m_mailbox;
	std::atomic<bool> m_accepting{true};
	std::atomic<bool> m_handling{false};
	std::thread m_thread; //!< Started last in the constructor.
};

//! True if rack holds every tile of tiles (counting duplicates).
bool rackHolds(const Tiles& rack, const Tiles& tiles);

//! Remove one occurrence of each tile. Caller checks rackHolds first.
void removeFromRack(Tiles& rack, const Tiles& tiles);

} // namespace wordgame
