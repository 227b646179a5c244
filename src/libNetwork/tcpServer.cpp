#include "network/tcpServer.hpp"

#include "Logging.hpp"

#include <asio/ip/tcp.hpp>

#include <algorithm>
#include <format>
#include <utility>

namespace wordgame::network {

TcpServer::TcpServer(std::uint16_t port, std::size_t ioThreads)
    : m_ioContext(), m_acceptor(m_ioContext, asio::ip::tcp::endpoint(asio::ip::tcp::v4(), port)), m_ioThreadCount(std::max<std::size_t>(1u, ioThreads)) {
}

TcpServer::~TcpServer() {
	stop();
}

void TcpServer::connect(Callbacks callbacks) {
	m_callbacks = std::move(callbacks);
}

void TcpServer::start() {
	if (m_running.exchange(true)) {
		return;
	}

	m_ioContext.restart();
	m_workGuard.emplace(asio::make_work_guard(m_ioContext));
	doAccept();
	for (std::size_t i = 0; i < m_ioThreadCount; ++i) {
		m_ioThreads.emplace_back([this] { m_ioContext.run(); });
	}

	auto logger = Logger();
	logger.Log(Logging::LogLevel::Info, std::format("[TcpServer] Listening on port {} with {} io threads.", port(), m_ioThreadCount));
}

void TcpServer::stop() {
	if (!m_running.exchange(false)) {
		return;
	}

	asio::error_code ec;
	m_acceptor.cancel(ec);
	m_acceptor.close(ec);

	std::unordered_map<ConnectionId, std::shared_ptr<Connection>> connections;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		connections.swap(m_connections);
	}
	for (auto& [id, conn]: connections) {
		conn->stop();
	}

	if (m_workGuard) {
		m_workGuard->reset();
		m_workGuard.reset();
	}
	m_ioContext.stop();

	for (auto& thread: m_ioThreads) {
		if (thread.joinable()) {
			thread.join();
		}
	}
	m_ioThreads.clear();

	auto logger = Logger();
	logger.Log(Logging::LogLevel::Info, "[TcpServer] Stopped.");
}

bool TcpServer::send(ConnectionId connectionId, const Message& msg) {
	std::lock_guard<std::mutex> lock(m_connectionsMutex);

	const auto it = m_connections.find(connectionId);
	if (it == m_connections.end()) {
		return false;
	}
	it->second->send(msg);
	return true;
}

std::uint16_t TcpServer::port() const {
	asio::error_code ec;
	const auto endpoint = m_acceptor.local_endpoint(ec);
	return ec ? std::uint16_t{0} : endpoint.port();
}

std::size_t TcpServer::connectionCount() const {
	std::lock_guard<std::mutex> lock(m_connectionsMutex);
	return m_connections.size();
}

void TcpServer::doAccept() {
	m_acceptor.async_accept([this](asio::error_code ec, asio::ip::tcp::socket socket) {
		if (!m_running) {
			return;
		}

		if (ec) {
			auto logger = Logger();
			logger.Log(Logging::LogLevel::Warning, std::format("[TcpServer] Accept failed: {}", ec.message()));
		} else {
			const auto connectionId = m_nextConnectionId++;

			Connection::Callbacks callbacks;
			callbacks.onMessage = [this](Connection& connection, const Message& message) {
				if (m_callbacks.onMessage) {
					m_callbacks.onMessage(connection.connectionId(), message);
				}
			};
			callbacks.onDisconnect = [this](Connection& connection) {
				const auto id = connection.connectionId();
				removeConnection(id);
				if (m_callbacks.onDisconnect) {
					m_callbacks.onDisconnect(id);
				}
			};

			auto connection = std::make_shared<Connection>(std::move(socket), connectionId, std::move(callbacks));
			{
				std::lock_guard<std::mutex> lock(m_connectionsMutex);
				m_connections.emplace(connectionId, connection);
			}

			if (m_callbacks.onConnect) {
				m_callbacks.onConnect(connectionId);
			}
			connection->start();
		}

		doAccept();
	});
}

void TcpServer::removeConnection(ConnectionId connectionId) {
	std::lock_guard<std::mutex> lock(m_connectionsMutex);
	m_connections.erase(connectionId);
}

} // namespace wordgame::network
