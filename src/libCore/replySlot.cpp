#include "core/replySlot.hpp"

#include <utility>

namespace wordgame {

std::optional<ReplySlot::Ticket> ReplySlot::arm(const Handler& handler) {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (m_armed != 0) {
		return std::nullopt;
	}

	m_armed   = m_nextTicket++;
	m_handler = handler;
	return m_armed;
}

bool ReplySlot::isArmed(Ticket ticket) const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return ticket != 0 && m_armed == ticket;
}

void ReplySlot::fill(Ticket ticket, GameStateResponse response) {
	auto handler = expire(ticket);
	if (handler) {
		handler(std::move(response)); // Outside the lock: the handler may arm the slot again.
	}
}

ReplySlot::Handler ReplySlot::expire(Ticket ticket) {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (ticket == 0 || ticket != m_armed) {
		return {};
	}

	m_armed = 0;
	return std::exchange(m_handler, {});
}

bool ReplySlot::pending() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_armed != 0;
}

} // namespace wordgame
