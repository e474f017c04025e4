#include <gtest/gtest.h>
#include "socket.h"
#include "network_utils.h"
#include <thread>
#include <chrono>
#include <string>
#include <vector>

using namespace rtcdrop;

class SocketTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(init_socket_library());
    }

    void TearDown() override {
        cleanup_socket_library();
    }
};

// Test Peer structure
TEST_F(SocketTest, PeerTest) {
    Peer peer1("127.0.0.1", 8080);
    EXPECT_EQ(peer1.ip, "127.0.0.1");
    EXPECT_EQ(peer1.port, 8080);

    Peer peer2("127.0.0.1", 8080);
    EXPECT_EQ(peer1, peer2);

    Peer peer3("127.0.0.1", 8081);
    EXPECT_NE(peer1, peer3);
}

TEST_F(SocketTest, ParseHostPortTest) {
    Peer peer;
    ASSERT_TRUE(parse_host_port("192.168.1.20:4000", peer));
    EXPECT_EQ(peer.ip, "192.168.1.20");
    EXPECT_EQ(peer.port, 4000);

    ASSERT_TRUE(parse_host_port("localhost:65535", peer));
    EXPECT_EQ(peer.ip, "localhost");

    ASSERT_TRUE(parse_host_port("[::1]:9000", peer));
    EXPECT_EQ(peer.ip, "::1");
    EXPECT_EQ(peer.port, 9000);

    EXPECT_FALSE(parse_host_port("", peer));
    EXPECT_FALSE(parse_host_port("10.0.0.1", peer));
    EXPECT_FALSE(parse_host_port(":4000", peer));
    EXPECT_FALSE(parse_host_port("10.0.0.1:", peer));
    EXPECT_FALSE(parse_host_port("10.0.0.1:0", peer));
    EXPECT_FALSE(parse_host_port("10.0.0.1:65536", peer));
    EXPECT_FALSE(parse_host_port("10.0.0.1:80a", peer));
    EXPECT_FALSE(parse_host_port("[::1]9000", peer));
}

// Test socket validity check
TEST_F(SocketTest, SocketValidityTest) {
    socket_t valid_socket = create_tcp_server_v4(0);  // Use port 0 for automatic port assignment
    EXPECT_TRUE(is_valid_socket(valid_socket));
    EXPECT_GT(get_ephemeral_port(valid_socket), 0);

    close_socket(valid_socket);

    socket_t invalid_socket = INVALID_SOCKET_VALUE;
    EXPECT_FALSE(is_valid_socket(invalid_socket));
}

TEST_F(SocketTest, ClientServerExchangeTest) {
    socket_t server = create_tcp_server_v4(0);
    ASSERT_TRUE(is_valid_socket(server));
    int port = get_ephemeral_port(server);

    socket_t client = create_tcp_client_v4("127.0.0.1", port, 2000);
    ASSERT_TRUE(is_valid_socket(client));

    ASSERT_EQ(wait_for_readable(server, 2000), 1);
    socket_t accepted = accept_client(server);
    ASSERT_TRUE(is_valid_socket(accepted));
    EXPECT_EQ(get_peer_address(accepted).compare(0, 10, "127.0.0.1:"), 0);

    // Nothing sent yet
    EXPECT_EQ(wait_for_readable(accepted, 50), 0);

    std::vector<uint8_t> payload(100000);
    for (size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<uint8_t>(i % 251);
    }

    std::thread sender([&]() {
        EXPECT_TRUE(send_all(client, payload.data(), payload.size()));
        EXPECT_EQ(send_tcp_string(client, "done"), 4);
    });

    std::vector<uint8_t> received;
    ASSERT_TRUE(receive_exact_bytes(accepted, payload.size(), received));
    EXPECT_EQ(received, payload);

    char tail[4];
    size_t got = 0;
    while (got < sizeof(tail)) {
        int n = receive_tcp_some(accepted, tail + got, sizeof(tail) - got);
        ASSERT_GT(n, 0);
        got += static_cast<size_t>(n);
    }
    EXPECT_EQ(std::string(tail, sizeof(tail)), "done");
    sender.join();

    // Orderly close reads as zero bytes
    shutdown_socket(client);
    close_socket(client);
    char byte;
    EXPECT_EQ(receive_tcp_some(accepted, &byte, 1), 0);
    EXPECT_FALSE(receive_exact_bytes(accepted, 1, received));

    close_socket(accepted);
    close_socket(server);
}

TEST_F(SocketTest, ConnectionRefusedTest) {
    socket_t server = create_tcp_server_v4(0);
    ASSERT_TRUE(is_valid_socket(server));
    int port = get_ephemeral_port(server);
    close_socket(server);

    socket_t client = create_tcp_client_v4("127.0.0.1", port, 500);
    EXPECT_FALSE(is_valid_socket(client));
}

TEST_F(SocketTest, NetworkUtilsTest) {
    EXPECT_TRUE(network_utils::is_valid_ipv4("10.0.0.1"));
    EXPECT_FALSE(network_utils::is_valid_ipv4("10.0.0.256"));
    EXPECT_FALSE(network_utils::is_valid_ipv4("::1"));
    EXPECT_TRUE(network_utils::is_loopback_ipv4("127.0.0.1"));
    EXPECT_TRUE(network_utils::is_loopback_ipv4("127.1.2.3"));
    EXPECT_FALSE(network_utils::is_loopback_ipv4("192.168.0.1"));

    EXPECT_EQ(network_utils::resolve_hostname("127.0.0.1"), "127.0.0.1");

    for (const auto& address : network_utils::get_local_interface_addresses_v4()) {
        EXPECT_TRUE(network_utils::is_valid_ipv4(address));
        EXPECT_FALSE(network_utils::is_loopback_ipv4(address));
    }
}
