#pragma once

#include "core/game.hpp"
#include "network/protocol.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wordgame::server {

inline constexpr std::size_t DEFAULT_IO_THREADS     = 2;
inline constexpr std::size_t DEFAULT_WORKER_THREADS = 8;
inline constexpr std::chrono::seconds DEFAULT_SWEEP_INTERVAL{60};

struct ServerConfig {
	std::uint16_t port{network::DEFAULT_PORT};
	std::size_t ioThreads{DEFAULT_IO_THREADS};         //!< Threads driving sockets.
	std::size_t workerThreads{DEFAULT_WORKER_THREADS}; //!< Threads executing requests. Bounds concurrently waiting callers.
	std::chrono::milliseconds replyTimeout{DEFAULT_REPLY_TIMEOUT};
	std::chrono::milliseconds idleTimeout{0}; //!< Evict games idle for longer. 0 keeps games for the process lifetime.
	std::chrono::milliseconds sweepInterval{DEFAULT_SWEEP_INTERVAL};
	std::string wordListPath{};           //!< Empty accepts every word.
	std::optional<std::uint32_t> seed{};  //!< Fixed tile bag seed for reproducible games.
	bool showHelp{false};
};

//! Parse command line arguments (without the program name).
//! \returns Empty and sets error on unknown flags, missing values or malformed numbers.
std::optional<ServerConfig> parseArguments(const std::vector<std::string>& args, std::string& error);

//! Usage text printed for --help.
std::string usage(const std::string& program);

} // namespace wordgame::server
