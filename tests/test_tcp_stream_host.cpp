#include <gtest/gtest.h>
#include "tcp_stream_host.h"
#include "socket.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace rtcdrop;

namespace {

const char* ECHO_PROTOCOL = "/rtcdrop/echo/1";

} // anonymous namespace

class TcpStreamHostTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(init_socket_library());

        host_a_.reset(new TcpStreamHost("peer-a"));
        host_b_.reset(new TcpStreamHost("peer-b"));
        ASSERT_TRUE(host_a_->start());
        ASSERT_TRUE(host_b_->start());

        host_a_->add_peer_address("peer-b", "127.0.0.1:" + std::to_string(host_b_->get_listen_port()));
        host_b_->add_peer_address("peer-a", "127.0.0.1:" + std::to_string(host_a_->get_listen_port()));
        host_a_->set_connect_timeout_ms(2000);
    }

    void TearDown() override {
        host_a_->stop();
        host_b_->stop();
        host_a_.reset();
        host_b_.reset();
        cleanup_socket_library();
    }

    // Echo every line back until the stream ends, recording the outcome
    void install_echo_handler(TcpStreamHost& host) {
        host.set_stream_handler(ECHO_PROTOCOL, [this](std::unique_ptr<SignalingStream> stream) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                inbound_peer_id_ = stream->remote_peer_id();
            }

            std::string line, error;
            StreamReadStatus status;
            while ((status = stream->read_line(line, &error)) == StreamReadStatus::OK) {
                if (!stream->write(line + "\n") || !stream->flush()) {
                    break;
                }
            }

            std::lock_guard<std::mutex> lock(mutex_);
            final_status_ = status;
            handler_done_ = true;
            cv_.notify_all();
        });
    }

    bool wait_for_handler() {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::seconds(5), [this]() { return handler_done_; });
    }

    std::unique_ptr<TcpStreamHost> host_a_;
    std::unique_ptr<TcpStreamHost> host_b_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::string inbound_peer_id_;
    StreamReadStatus final_status_ = StreamReadStatus::OK;
    bool handler_done_ = false;
};

TEST_F(TcpStreamHostTest, ListensOnEphemeralPortTest) {
    EXPECT_TRUE(host_a_->is_running());
    EXPECT_GT(host_a_->get_listen_port(), 0);
    EXPECT_NE(host_a_->get_listen_port(), host_b_->get_listen_port());
    EXPECT_EQ(host_a_->local_peer_id(), "peer-a");
}

TEST_F(TcpStreamHostTest, AddressBookTest) {
    EXPECT_EQ(host_a_->lookup_peer_address("peer-b"),
              "127.0.0.1:" + std::to_string(host_b_->get_listen_port()));
    EXPECT_EQ(host_a_->lookup_peer_address("peer-z"), "");

    host_a_->add_peer_address("peer-z", "10.0.0.9:4000");
    EXPECT_EQ(host_a_->get_known_peers().size(), 2u);
    EXPECT_TRUE(host_a_->remove_peer_address("peer-z"));
    EXPECT_FALSE(host_a_->remove_peer_address("peer-z"));
}

TEST_F(TcpStreamHostTest, OpenStreamEchoesLinesTest) {
    install_echo_handler(*host_b_);

    std::unique_ptr<SignalingStream> stream = host_a_->open_stream("peer-b", ECHO_PROTOCOL);
    ASSERT_NE(stream, nullptr);
    EXPECT_EQ(stream->remote_peer_id(), "peer-b");

    ASSERT_TRUE(stream->write("OFFER:dj0w\n"));
    ASSERT_TRUE(stream->write("second\n"));
    ASSERT_TRUE(stream->flush());

    std::string line;
    ASSERT_EQ(stream->read_line(line), StreamReadStatus::OK);
    EXPECT_EQ(line, "OFFER:dj0w");
    ASSERT_EQ(stream->read_line(line), StreamReadStatus::OK);
    EXPECT_EQ(line, "second");

    stream->close();
    ASSERT_TRUE(wait_for_handler());

    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_EQ(inbound_peer_id_, "peer-a");
    EXPECT_EQ(final_status_, StreamReadStatus::END_OF_STREAM);
}

TEST_F(TcpStreamHostTest, ReadTimeoutTest) {
    install_echo_handler(*host_b_);

    std::unique_ptr<SignalingStream> stream = host_a_->open_stream("peer-b", ECHO_PROTOCOL);
    ASSERT_NE(stream, nullptr);
    stream->set_read_timeout(100);

    std::string line, error;
    auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(stream->read_line(line, &error), StreamReadStatus::TIMED_OUT);
    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(90));
    EXPECT_FALSE(error.empty());

    // A timeout leaves the stream usable
    stream->set_read_timeout(2000);
    ASSERT_TRUE(stream->write("late\n"));
    ASSERT_TRUE(stream->flush());
    ASSERT_EQ(stream->read_line(line), StreamReadStatus::OK);
    EXPECT_EQ(line, "late");

    stream->close();
    ASSERT_TRUE(wait_for_handler());
}

TEST_F(TcpStreamHostTest, UnknownProtocolRefusedTest) {
    install_echo_handler(*host_b_);
    EXPECT_EQ(host_a_->open_stream("peer-b", "/rtcdrop/unknown/1"), nullptr);
}

TEST_F(TcpStreamHostTest, UnknownPeerTest) {
    install_echo_handler(*host_b_);
    EXPECT_EQ(host_a_->open_stream("peer-z", ECHO_PROTOCOL), nullptr);
}

TEST_F(TcpStreamHostTest, UnreachablePeerTest) {
    host_a_->set_connect_timeout_ms(500);
    int port = host_b_->get_listen_port();
    host_b_->stop();

    host_a_->add_peer_address("peer-gone", "127.0.0.1:" + std::to_string(port));
    EXPECT_EQ(host_a_->open_stream("peer-gone", ECHO_PROTOCOL), nullptr);
}

TEST_F(TcpStreamHostTest, PartialLineAtEndIsErrorTest) {
    install_echo_handler(*host_b_);

    socket_t raw = create_tcp_client_v4("127.0.0.1", host_b_->get_listen_port(), 2000);
    ASSERT_TRUE(is_valid_socket(raw));

    std::string preamble = std::string(ECHO_PROTOCOL) + " peer-raw\n";
    ASSERT_EQ(send_tcp_string(raw, preamble), static_cast<int>(preamble.size()));

    std::string expected = std::string(ECHO_PROTOCOL) + "\n";
    std::vector<uint8_t> confirmation;
    ASSERT_TRUE(receive_exact_bytes(raw, expected.size(), confirmation));
    EXPECT_EQ(std::string(confirmation.begin(), confirmation.end()), expected);

    ASSERT_GT(send_tcp_string(raw, "no terminator"), 0);
    shutdown_socket(raw);
    close_socket(raw);

    ASSERT_TRUE(wait_for_handler());
    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_EQ(inbound_peer_id_, "peer-raw");
    EXPECT_EQ(final_status_, StreamReadStatus::ERROR);
}

TEST_F(TcpStreamHostTest, StopInterruptsOpenStreamsTest) {
    std::atomic<bool> handler_entered(false);
    host_b_->set_stream_handler(ECHO_PROTOCOL, [&](std::unique_ptr<SignalingStream> stream) {
        handler_entered = true;
        std::string line;
        StreamReadStatus status = stream->read_line(line);

        std::lock_guard<std::mutex> lock(mutex_);
        final_status_ = status;
        handler_done_ = true;
        cv_.notify_all();
    });

    std::unique_ptr<SignalingStream> stream = host_a_->open_stream("peer-b", ECHO_PROTOCOL);
    ASSERT_NE(stream, nullptr);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!handler_entered && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(handler_entered);

    auto start = std::chrono::steady_clock::now();
    host_b_->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(3));
    EXPECT_FALSE(host_b_->is_running());

    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_TRUE(handler_done_);
    EXPECT_NE(final_status_, StreamReadStatus::OK);
}
