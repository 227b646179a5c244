#pragma once

#include "network/protocol.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace wordgame::network {

//! Minimal synchronous TCP client. One request frame out, one reply frame in.
class TcpClient {
public:
	TcpClient();
	~TcpClient();

	bool connect(const std::string& host, std::uint16_t port = DEFAULT_PORT);
	void disconnect();
	bool isConnected() const;

	bool send(const Message& message);
	std::optional<Message> read(); //!< Empty on connection loss or oversized frame.

	//! Send a message and read the reply.
	std::optional<Message> request(const Message& message);

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl;
};

} // namespace wordgame::network
