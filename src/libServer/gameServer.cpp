#include "server/gameServer.hpp"

#include "Logging.hpp"

#include <format>

namespace wordgame::server {

GameSettings makeGameSettings(const ServerConfig& config, std::shared_ptr<const WordList> words) {
	GameSettings settings;
	settings.replyTimeout = config.replyTimeout;
	settings.engine       = std::make_shared<BoardEngine>(std::move(words));

	if (config.seed) {
		// Every game gets its own, still reproducible, bag.
		auto nextSeed         = std::make_shared<std::atomic<std::uint32_t>>(*config.seed);
		settings.makeDrawPool = [nextSeed] { return std::make_unique<TileBag>(nextSeed->fetch_add(1)); };
	}
	return settings;
}

GameServer::GameServer(ServerConfig config, GameSettings settings)
    : m_config{std::move(config)}, m_workers{m_config.workerThreads}, m_sweepStrand{asio::make_strand(m_workers)}, m_sweepTimer{m_sweepStrand},
      m_registry{std::move(settings)}, m_router{m_registry, m_workers.get_executor()}, m_network{m_config.port, m_config.ioThreads} {
	// Wire up network callbacks but keep them thin: they only post work.
	network::TcpServer::Callbacks callbacks;
	callbacks.onConnect    = [this](network::ConnectionId connectionId) { onClientConnected(connectionId); };
	callbacks.onMessage    = [this](network::ConnectionId connectionId, const network::Message& payload) { onClientMessage(connectionId, payload); };
	callbacks.onDisconnect = [this](network::ConnectionId connectionId) { onClientDisconnected(connectionId); };
	m_network.connect(callbacks);
}

GameServer::~GameServer() {
	stop();
}

void GameServer::start() {
	if (m_isRunning.exchange(true)) {
		return;
	}

	m_network.start();
	if (m_config.idleTimeout.count() > 0) {
		scheduleSweep();
	}

	auto logger = Logger();
	logger.Log(Logging::LogLevel::Info, std::format("[GameServer] Started on port {} with {} workers.", m_network.port(), m_config.workerThreads));
}

void GameServer::stop() {
	if (!m_isRunning.exchange(false)) {
		return;
	}

	m_network.stop();
	asio::post(m_sweepStrand, [this] { m_sweepTimer.cancel(); }); // Serialized with a running sweep.
	m_workers.join(); // Pending reply deadlines fire within the reply timeout.

	{
		std::lock_guard<std::mutex> lock(m_sessionsMutex);
		m_sessions.clear();
	}

	auto logger = Logger();
	logger.Log(Logging::LogLevel::Info, "[GameServer] Stopped.");
}

std::uint16_t GameServer::port() const {
	return m_network.port();
}

GameRegistry& GameServer::registry() {
	return m_registry;
}

void GameServer::onClientConnected(network::ConnectionId connectionId) {
	sessionFor(connectionId);

	auto logger = Logger();
	logger.Log(Logging::LogLevel::Info, std::format("[GameServer] Client '{}' connected.", connectionId));
}

void GameServer::onClientMessage(network::ConnectionId connectionId, const network::Message& payload) {
	auto session = sessionFor(connectionId);
	asio::post(session->strand, [this, connectionId, session, payload] {
		session->inbox.push_back(payload);
		if (!session->busy) {
			processNext(connectionId, session);
		}
	});
}

void GameServer::onClientDisconnected(network::ConnectionId connectionId) {
	{
		std::lock_guard<std::mutex> lock(m_sessionsMutex);
		m_sessions.erase(connectionId);
	}

	auto logger = Logger();
	logger.Log(Logging::LogLevel::Info, std::format("[GameServer] Client '{}' disconnected.", connectionId));
}

std::shared_ptr<GameServer::Session> GameServer::sessionFor(network::ConnectionId connectionId) {
	std::lock_guard<std::mutex> lock(m_sessionsMutex);

	auto it = m_sessions.find(connectionId);
	if (it == m_sessions.end()) {
		it = m_sessions.emplace(connectionId, std::make_shared<Session>(asio::make_strand(m_workers))).first;
	}
	return it->second;
}

void GameServer::processNext(network::ConnectionId connectionId, const std::shared_ptr<Session>& session) {
	if (session->inbox.empty()) {
		session->busy = false;
		return;
	}

	session->busy = true;
	const auto payload = std::move(session->inbox.front());
	session->inbox.pop_front();

	{
		static constexpr char LOG_MSG[] = "[GameServer] Message from client '{}': '{}'.";
		auto logger                     = Logger();
		logger.Log(Logging::LogLevel::Debug, std::format(LOG_MSG, connectionId, payload));
	}

	// The reply may come from a game's controller thread. Hop back onto the session strand to send it.
	m_router.handle(payload, [this, connectionId, session](network::Message reply) {
		asio::post(session->strand, [this, connectionId, session, reply = std::move(reply)] {
			if (!m_network.send(connectionId, reply)) {
				auto logger = Logger();
				logger.Log(Logging::LogLevel::Debug, std::format("[GameServer] Client '{}' left before its reply was sent.", connectionId));
			}
			processNext(connectionId, session);
		});
	});
}

void GameServer::scheduleSweep() {
	m_sweepTimer.expires_after(m_config.sweepInterval);
	m_sweepTimer.async_wait([this](const asio::error_code& ec) {
		if (ec || !m_isRunning) {
			return;
		}

		const auto evicted = m_registry.evictIdle(m_config.idleTimeout);
		if (evicted > 0) {
			auto logger = Logger();
			logger.Log(Logging::LogLevel::Info, std::format("[GameServer] Evicted {} idle games, {} remain.", evicted, m_registry.size()));
		}
		scheduleSweep();
	});
}

} // namespace wordgame::server
