#pragma once

#include "core/gameState.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

namespace wordgame {

//! Single slot rendezvous between the turn controller and the one caller waiting for a player's reply.
//! Each armed request gets a ticket. Whoever resolves the ticket first, the controller through fill()
//! or the caller's deadline through expire(), frees the slot; the other one finds it disarmed.
class ReplySlot {
public:
	using Ticket  = std::uint64_t;
	using Handler = std::function<void(GameStateResponse)>;

	//! Reserve the slot for a new request whose reply goes to handler.
	//! \returns Empty if a request of this player is still waiting for its reply.
	std::optional<Ticket> arm(const Handler& handler);

	//! True while ticket still holds the slot.
	bool isArmed(Ticket ticket) const;

	//! Free the slot and pass the reply to the handler of ticket. Ignored for any other ticket.
	void fill(Ticket ticket, GameStateResponse response);

	//! Free the slot without a reply.
	//! \returns The handler of ticket, or an empty one if ticket does not hold the slot anymore.
	Handler expire(Ticket ticket);

	bool pending() const;

private:
	mutable std::mutex m_mutex;

	Ticket m_nextTicket{1};
	Ticket m_armed{0}; //!< 0 = free.
	Handler m_handler;
};

} // namespace wordgame
