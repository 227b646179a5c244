#pragma once

#include "core/gameRegistry.hpp"
#include "core/wordList.hpp"
#include "network/tcpServer.hpp"
#include "server/config.hpp"
#include "server/requestRouter.hpp"

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace wordgame::server {

//! Build the per game collaborators from the server configuration.
GameSettings makeGameSettings(const ServerConfig& config, std::shared_ptr<const WordList> words);

//! Game server on two layers.
//! - Network layer    : TcpServer threads receive frames and only post work.
//! - Application layer: Worker threads run the router and never wait on a game. Each connection has its own
//!                      strand and handles one request at a time, so replies keep request order.
class GameServer {
public:
	GameServer(ServerConfig config, GameSettings settings);
	~GameServer();

	GameServer(const GameServer&)            = delete;
	GameServer& operator=(const GameServer&) = delete;

	void start(); //!< Boot the network listener and the idle game sweep.
	void stop();  //!< Stop the listener, finish running requests. Final.

	std::uint16_t port() const;
	GameRegistry& registry();

private:
	using Strand = asio::strand<asio::thread_pool::executor_type>;

	//! Per connection request queue.
	struct Session {
		explicit Session(Strand s) : strand{std::move(s)} {
		}

		Strand strand;
		std::deque<network::Message> inbox; //!< Strand only.
		bool busy{false};                   //!< Strand only. A request of this connection awaits its reply.
	};

	// Network callbacks (run on libNetwork threads) just post work.
	void onClientConnected(network::ConnectionId connectionId);
	void onClientMessage(network::ConnectionId connectionId, const network::Message& payload);
	void onClientDisconnected(network::ConnectionId connectionId);

	std::shared_ptr<Session> sessionFor(network::ConnectionId connectionId);
	void processNext(network::ConnectionId connectionId, const std::shared_ptr<Session>& session); //!< Session strand only.
	void scheduleSweep(); //!< Re-arm the idle game timer.

private:
	const ServerConfig m_config;
	std::atomic<bool> m_isRunning{false};

	asio::thread_pool m_workers; //!< Outlives the registry: controllers post their replies here until they are joined.
	Strand m_sweepStrand;
	asio::basic_waitable_timer<std::chrono::steady_clock, asio::wait_traits<std::chrono::steady_clock>, Strand> m_sweepTimer; //!< Sweep strand only.

	GameRegistry m_registry;
	RequestRouter m_router;

	std::unordered_map<network::ConnectionId, std::shared_ptr<Session>> m_sessions;
	std::mutex m_sessionsMutex;

	network::TcpServer m_network; //!< Communication with clients. Declared last: stops first.
};

} // namespace wordgame::server
