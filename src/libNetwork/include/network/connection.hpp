#pragma once

#include "network/protocol.hpp"

#include <asio.hpp>

#include <atomic>
#include <deque>
#include <functional>
#include <memory>

namespace wordgame::network {

//! Transportation primitive. Reads and writes length prefixed frames of a single client.
//! All socket work runs on the connection strand; any io thread may drive it.
class Connection : public std::enable_shared_from_this<Connection> {
public:
	struct Callbacks {
		std::function<void(Connection&, const Message&)> onMessage;
		std::function<void(Connection&)> onDisconnect; //!< Called once, from the strand.
	};

	Connection(asio::ip::tcp::socket socket, ConnectionId connectionId, Callbacks callbacks);

	void start();                  //!< Prime the read loop.
	void stop();                   //!< Close the socket. No disconnect callback.
	void send(const Message& msg); //!< Queue a frame. Thread safe.

	ConnectionId connectionId() const;

private:
	void startRead();    //!< Prime async read and dispatch messages.
	void startWrite();   //!< Write the front of the queue.
	void doDisconnect(); //!< Internal cleanup after a read or write error.

private:
	asio::ip::tcp::socket m_socket;
	asio::strand<asio::any_io_executor> m_strand;
	std::atomic<bool> m_running{false};

	const ConnectionId m_connectionId;
	Callbacks m_callbacks;

	std::deque<Message> m_writeQueue; //!< Strand only.
};

} // namespace wordgame::network
