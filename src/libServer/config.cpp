#include "server/config.hpp"

#include <charconv>
#include <format>

namespace wordgame::server {

template <class Number>
static bool parseNumber(const std::string& value, Number& out) {
	if (value.empty()) {
		return false;
	}
	const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
	return ec == std::errc{} && ptr == value.data() + value.size();
}

std::optional<ServerConfig> parseArguments(const std::vector<std::string>& args, std::string& error) {
	ServerConfig config;

	for (std::size_t i = 0; i < args.size(); ++i) {
		const auto& flag = args[i];
		if (flag == "--help" || flag == "-h") {
			config.showHelp = true;
			continue;
		}

		if (i + 1 >= args.size()) {
			error = std::format("Missing value for '{}'.", flag);
			return std::nullopt;
		}
		const auto& value = args[++i];

		bool ok = true;
		if (flag == "--port") {
			ok = parseNumber(value, config.port);
		} else if (flag == "--io-threads") {
			ok = parseNumber(value, config.ioThreads) && config.ioThreads > 0;
		} else if (flag == "--workers") {
			ok = parseNumber(value, config.workerThreads) && config.workerThreads > 0;
		} else if (flag == "--reply-timeout-ms") {
			std::chrono::milliseconds::rep ms{};
			ok                  = parseNumber(value, ms) && ms > 0;
			config.replyTimeout = std::chrono::milliseconds{ms};
		} else if (flag == "--idle-timeout-s") {
			std::chrono::seconds::rep s{};
			ok                 = parseNumber(value, s) && s >= 0;
			config.idleTimeout = std::chrono::seconds{s};
		} else if (flag == "--words") {
			config.wordListPath = value;
		} else if (flag == "--seed") {
			std::uint32_t seed{};
			ok          = parseNumber(value, seed);
			config.seed = seed;
		} else {
			error = std::format("Unknown option '{}'.", flag);
			return std::nullopt;
		}

		if (!ok) {
			error = std::format("Invalid value '{}' for '{}'.", value, flag);
			return std::nullopt;
		}
	}

	return config;
}

std::string usage(const std::string& program) {
	return std::format("Usage: {} [options]\n"
	                   "  --port N              TCP port (default {})\n"
	                   "  --io-threads N        Socket threads (default {})\n"
	                   "  --workers N           Request threads (default {})\n"
	                   "  --reply-timeout-ms N  Max wait for a turn reply (default {})\n"
	                   "  --idle-timeout-s N    Evict games idle this long, 0 = never (default 0)\n"
	                   "  --words PATH          Word list, one word per line\n"
	                   "  --seed N              Fixed tile bag seed\n",
	                   program, network::DEFAULT_PORT, DEFAULT_IO_THREADS, DEFAULT_WORKER_THREADS, DEFAULT_REPLY_TIMEOUT.count());
}

} // namespace wordgame::server
