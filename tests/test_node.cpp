#include <gtest/gtest.h>
#include "node.h"
#include "errors.h"
#include "fs.h"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace rtcdrop;

class NodeTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(init_socket_library());
        cleanup();
        ASSERT_TRUE(create_directories("node_share"));
        ASSERT_TRUE(create_directories("node_downloads"));

        connection_config_.gather_interface_addresses = false;
        connection_config_.include_loopback = true;
        connection_config_.connect_attempt_timeout_ms = 1000;
        connection_config_.binding_timeout_ms = 2000;
    }

    void TearDown() override {
        if (node_a_) node_a_->stop();
        if (node_b_) node_b_->stop();
        node_a_.reset();
        node_b_.reset();
        cleanup();
        cleanup_socket_library();
    }

    void cleanup() {
        delete_file("node_share/shared.bin");
        delete_file("node_downloads/downloaded_shared.bin");
        delete_directory("node_share");
        delete_directory("node_downloads");
    }

    // Node A downloads into node_downloads, node B serves node_share
    void start_nodes() {
        NodeConfig config_a;
        config_a.peer_id = "node-a";
        config_a.connection_timeout_seconds = 10;
        config_a.download_directory = "node_downloads";

        NodeConfig config_b;
        config_b.peer_id = "node-b";
        config_b.connection_timeout_seconds = 10;
        config_b.share_directory = "node_share";

        node_a_.reset(new RtcdropNode(config_a, connection_config_));
        node_b_.reset(new RtcdropNode(config_b, connection_config_));
        ASSERT_TRUE(node_a_->start());
        ASSERT_TRUE(node_b_->start());

        node_a_->add_peer("node-b", "127.0.0.1:" + std::to_string(node_b_->get_listen_port()));
        node_b_->add_peer("node-a", "127.0.0.1:" + std::to_string(node_a_->get_listen_port()));
    }

    void connect_nodes() {
        ASSERT_TRUE(node_a_->offer("node-b"));
        ASSERT_EQ(node_a_->await_connected("node-b", std::chrono::seconds(10)), NegotiationState::CONNECTED);
        ASSERT_EQ(node_b_->await_connected("node-a", std::chrono::seconds(10)), NegotiationState::CONNECTED);
    }

    TcpPeerConnectionConfig connection_config_;
    std::unique_ptr<RtcdropNode> node_a_;
    std::unique_ptr<RtcdropNode> node_b_;
};

TEST_F(NodeTest, StartTest) {
    start_nodes();
    EXPECT_TRUE(node_a_->is_running());
    EXPECT_GT(node_a_->get_listen_port(), 0);
    EXPECT_EQ(node_a_->get_peer_id(), "node-a");
    EXPECT_EQ(node_a_->get_session_state("node-b"), NegotiationState::IDLE);
    EXPECT_EQ(node_a_->get_connected_peer(), "");

    node_a_->stop();
    EXPECT_FALSE(node_a_->is_running());
}

TEST_F(NodeTest, GeneratesPeerIdTest) {
    RtcdropNode node{NodeConfig()};
    EXPECT_EQ(node.get_peer_id().size(), 32u);
}

TEST_F(NodeTest, AddressBookTest) {
    start_nodes();
    EXPECT_THROW(node_a_->add_peer("node-c", "no-port-here"), ProtocolError);
    EXPECT_EQ(node_a_->get_known_peers().count("node-c"), 0u);

    node_a_->add_peer("node-c", "10.0.0.3:4000");
    EXPECT_EQ(node_a_->get_known_peers().at("node-c"), "10.0.0.3:4000");
    EXPECT_TRUE(node_a_->remove_peer("node-c"));
    EXPECT_FALSE(node_a_->remove_peer("node-c"));
}

TEST_F(NodeTest, OfferToSelfRefusedTest) {
    start_nodes();
    EXPECT_FALSE(node_a_->offer("node-a"));
}

TEST_F(NodeTest, OfferToUnknownPeerFailsTest) {
    start_nodes();
    EXPECT_FALSE(node_a_->offer("node-unknown"));
    EXPECT_EQ(node_a_->get_session_state("node-unknown"), NegotiationState::FAILED);
}

TEST_F(NodeTest, ConnectTest) {
    start_nodes();

    std::mutex mutex;
    std::vector<NegotiationState> states;
    node_a_->set_session_status_callback(
        [&](const std::string& peer_id, NegotiationState state, const std::string&) {
            std::lock_guard<std::mutex> lock(mutex);
            if (peer_id == "node-b") {
                states.push_back(state);
            }
        });

    connect_nodes();

    EXPECT_EQ(node_a_->get_connected_peer(), "node-b");
    EXPECT_EQ(node_b_->get_connected_peer(), "node-a");
    EXPECT_NE(node_a_->get_transfer_channel("node-b"), nullptr);

    std::vector<PeerSession> sessions = node_b_->get_sessions();
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].role, SessionRole::RESPONDER);

    // The status callback fires after the state change becomes visible
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!states.empty() && states.back() == NegotiationState::CONNECTED) {
                break;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_FALSE(states.empty());
    EXPECT_EQ(states.front(), NegotiationState::OFFER_PENDING);
    EXPECT_EQ(states.back(), NegotiationState::CONNECTED);
}

TEST_F(NodeTest, DownloadWithoutConnectionTest) {
    start_nodes();
    try {
        node_a_->download("shared.bin");
        FAIL() << "download without a session should throw";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(std::string(e.what()), "Not connected to any peer");
    }
}

TEST_F(NodeTest, DownloadFileTest) {
    std::vector<uint8_t> content(40000);
    for (size_t i = 0; i < content.size(); ++i) {
        content[i] = static_cast<uint8_t>((i * 7) & 0xFF);
    }
    ASSERT_TRUE(create_file_binary("node_share/shared.bin", content.data(), content.size()));

    start_nodes();

    std::mutex mutex;
    std::condition_variable cv;
    bool received = false;
    FileReceiveResult result;
    node_a_->set_receive_complete_callback([&](const FileReceiveResult& r) {
        std::lock_guard<std::mutex> lock(mutex);
        result = r;
        received = true;
        cv.notify_all();
    });

    connect_nodes();
    node_a_->download("shared.bin");

    {
        std::unique_lock<std::mutex> lock(mutex);
        ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(10), [&]() { return received; }));
    }

    EXPECT_EQ(result.filename, "shared.bin");
    EXPECT_EQ(result.bytes_received, 40000u);
    EXPECT_TRUE(result.size_matches());
    EXPECT_FALSE(result.write_failed);

    size_t size = 0;
    char* data = read_file_text("node_downloads/downloaded_shared.bin", &size);
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(std::vector<uint8_t>(data, data + size), content);
    free_file_buffer(data);
}

TEST_F(NodeTest, DisconnectTest) {
    start_nodes();
    connect_nodes();

    EXPECT_TRUE(node_a_->disconnect("node-b"));
    EXPECT_EQ(node_a_->get_session_state("node-b"), NegotiationState::IDLE);
    EXPECT_EQ(node_a_->get_transfer_channel("node-b"), nullptr);
    EXPECT_FALSE(node_a_->disconnect("node-b"));

    EXPECT_THROW(node_a_->download("shared.bin", "node-b"), ProtocolError);
}
