#include "network/tcpClient.hpp"
#include "network/tcpServer.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <format>
#include <string>
#include <thread>

namespace wordgame::gtest {

using namespace std::chrono_literals;

//! Echo server that answers every frame with "ECHO:<payload>".
class EchoServer {
public:
	EchoServer() : m_network(0, 2) {
		network::TcpServer::Callbacks callbacks;
		callbacks.onConnect    = [this](network::ConnectionId) { ++m_connected; };
		callbacks.onMessage    = [this](network::ConnectionId connectionId, const network::Message& msg) { m_network.send(connectionId, "ECHO:" + msg); };
		callbacks.onDisconnect = [this](network::ConnectionId) { ++m_disconnected; };
		m_network.connect(callbacks);
		m_network.start();
	}
	~EchoServer() {
		m_network.stop();
	}

	std::uint16_t port() const {
		return m_network.port();
	}
	network::TcpServer& network() {
		return m_network;
	}

	std::atomic<int> m_connected{0};
	std::atomic<int> m_disconnected{0};

private:
	network::TcpServer m_network;
};

static bool waitFor(const std::atomic<int>& counter, int expected) {
	for (int i = 0; i < 200 && counter.load() < expected; ++i) {
		std::this_thread::sleep_for(5ms);
	}
	return counter.load() >= expected;
}

TEST(TcpServer, BindsFreePort) {
	EchoServer server;
	EXPECT_NE(server.port(), 0u);
}

TEST(TcpServer, RequestReply) {
	EchoServer server;

	network::TcpClient client;
	ASSERT_TRUE(client.connect("127.0.0.1", server.port()));
	EXPECT_TRUE(client.isConnected());

	for (int i = 0; i < 10; ++i) {
		const auto reply = client.request(std::format("msg{}", i));
		ASSERT_TRUE(reply.has_value());
		EXPECT_EQ(*reply, std::format("ECHO:msg{}", i));
	}
	EXPECT_TRUE(waitFor(server.m_connected, 1));
	EXPECT_EQ(server.network().connectionCount(), 1u);
}

TEST(TcpServer, SeveralClients) {
	EchoServer server;

	network::TcpClient first, second;
	ASSERT_TRUE(first.connect("127.0.0.1", server.port()));
	ASSERT_TRUE(second.connect("127.0.0.1", server.port()));

	EXPECT_EQ(first.request("a"), "ECHO:a");
	EXPECT_EQ(second.request("b"), "ECHO:b");
	EXPECT_TRUE(waitFor(server.m_connected, 2));
}

TEST(TcpServer, DisconnectIsSignalled) {
	EchoServer server;

	network::TcpClient client;
	ASSERT_TRUE(client.connect("127.0.0.1", server.port()));
	ASSERT_TRUE(client.request("hello").has_value());

	client.disconnect();
	EXPECT_FALSE(client.isConnected());
	EXPECT_TRUE(waitFor(server.m_disconnected, 1));
	EXPECT_EQ(server.network().connectionCount(), 0u);
}

TEST(TcpServer, SendToUnknownConnectionFails) {
	EchoServer server;
	EXPECT_FALSE(server.network().send(4711, "nobody"));
}

TEST(TcpClient, OversizedFrameIsNotSent) {
	EchoServer server;

	network::TcpClient client;
	ASSERT_TRUE(client.connect("127.0.0.1", server.port()));
	EXPECT_FALSE(client.send(std::string(network::MAX_PAYLOAD_BYTES + 1, 'x')));

	// Connection is still usable.
	EXPECT_EQ(client.request("ok"), "ECHO:ok");
}

TEST(TcpClient, ConnectFailsWithoutServer) {
	std::uint16_t port = 0;
	{
		EchoServer server;
		port = server.port();
	}

	network::TcpClient client;
	EXPECT_FALSE(client.connect("127.0.0.1", port));
	EXPECT_FALSE(client.send("x"));
}

} // namespace wordgame::gtest
