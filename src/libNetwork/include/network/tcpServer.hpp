#pragma once

#include "network/connection.hpp"
#include "network/protocol.hpp"

#include <asio.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace wordgame::network {

//! Connection manager running an async accept loop on a pool of IO threads.
//! Callbacks run on IO threads and must not block.
class TcpServer {
public:
	struct Callbacks {
		std::function<void(ConnectionId)> onConnect;
		std::function<void(ConnectionId, const Message&)> onMessage;
		std::function<void(ConnectionId)> onDisconnect;
	};

	//! Bind the listener. Port 0 picks a free port, see port().
	explicit TcpServer(std::uint16_t port = DEFAULT_PORT, std::size_t ioThreads = 1);
	~TcpServer();

	void connect(Callbacks callbacks); //!< Connect callback functions to get event signalling. Call before start.
	void start();                      //!< Start accepting clients.
	void stop();                       //!< Disconnect clients and stop the server.

	bool send(ConnectionId connectionId, const Message& msg); //!< Send message to the client with given connectionId.

	std::uint16_t port() const; //!< Port the listener is bound to.
	std::size_t connectionCount() const;

private:
	void doAccept(); //!< Start async accept loop.
	void removeConnection(ConnectionId connectionId);

private:
	asio::io_context m_ioContext;
	asio::ip::tcp::acceptor m_acceptor;
	std::optional<asio::executor_work_guard<asio::io_context::executor_type>> m_workGuard;

	const std::size_t m_ioThreadCount;
	std::vector<std::thread> m_ioThreads;
	std::atomic<bool> m_running{false};

	Callbacks m_callbacks; //!< Callback functions to signal events.

	ConnectionId m_nextConnectionId{1};                                          //!< Accept handler only.
	std::unordered_map<ConnectionId, std::shared_ptr<Connection>> m_connections; //!< Active connections.
	mutable std::mutex m_connectionsMutex;
};

} // namespace wordgame::network
