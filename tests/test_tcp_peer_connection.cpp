#include <gtest/gtest.h>
#include "tcp_peer_connection.h"
#include "session_description.h"
#include "errors.h"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace rtcdrop;

namespace {

struct ReceivedMessage {
    std::vector<uint8_t> data;
    bool is_text;
};

} // anonymous namespace

class TcpPeerConnectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(init_socket_library());

        config_.gather_interface_addresses = false;
        config_.include_loopback = true;
        config_.connect_attempt_timeout_ms = 1000;
        config_.binding_timeout_ms = 2000;

        offerer_.reset(new TcpPeerConnection(config_));
        answerer_.reset(new TcpPeerConnection(config_));
    }

    void TearDown() override {
        offerer_->close();
        answerer_->close();
        offerer_.reset();
        answerer_.reset();
        cleanup_socket_library();
    }

    void connect_pair() {
        std::string offer = offerer_->create_offer();
        std::string answer = answerer_->create_answer(offer);
        offerer_->set_answer(answer);

        ASSERT_EQ(offerer_->wait_for_connection(std::chrono::seconds(5)), ConnectionWaitResult::CONNECTED);
        ASSERT_EQ(answerer_->wait_for_connection(std::chrono::seconds(5)), ConnectionWaitResult::CONNECTED);
    }

    void collect_messages(TcpPeerConnection& connection) {
        connection.set_message_callback([this](const std::vector<uint8_t>& data, bool is_text) {
            std::lock_guard<std::mutex> lock(mutex_);
            received_.push_back(ReceivedMessage{data, is_text});
            cv_.notify_all();
        });
    }

    bool wait_for_messages(size_t count) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::seconds(5), [this, count]() { return received_.size() >= count; });
    }

    TcpPeerConnectionConfig config_;
    std::unique_ptr<TcpPeerConnection> offerer_;
    std::unique_ptr<TcpPeerConnection> answerer_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<ReceivedMessage> received_;
};

TEST_F(TcpPeerConnectionTest, OfferAdvertisesLoopbackCandidateTest) {
    std::string offer = offerer_->create_offer();
    SessionDescription desc = SessionDescription::parse(offer);

    EXPECT_EQ(desc.setup, SetupRole::PASSIVE);
    EXPECT_FALSE(desc.ice_ufrag.empty());
    EXPECT_FALSE(desc.ice_pwd.empty());
    ASSERT_EQ(desc.candidates.size(), 1u);
    EXPECT_EQ(desc.candidates[0].ip, "127.0.0.1");
    EXPECT_EQ(desc.candidates[0].port, offerer_->get_listen_port());
    EXPECT_GT(offerer_->get_listen_port(), 0);
}

TEST_F(TcpPeerConnectionTest, AdvertisedAddressesComeFirstTest) {
    TcpPeerConnectionConfig config = config_;
    config.advertised_addresses.push_back("203.0.113.5");
    TcpPeerConnection connection(config);

    SessionDescription desc = SessionDescription::parse(connection.create_offer());
    ASSERT_EQ(desc.candidates.size(), 2u);
    EXPECT_EQ(desc.candidates[0].ip, "203.0.113.5");
    EXPECT_GT(desc.candidates[0].priority, desc.candidates[1].priority);
    connection.close();
}

TEST_F(TcpPeerConnectionTest, ConnectOverLoopbackTest) {
    connect_pair();
    EXPECT_TRUE(offerer_->is_connected());
    EXPECT_TRUE(answerer_->is_connected());
}

TEST_F(TcpPeerConnectionTest, TextAndBinaryMessagesTest) {
    collect_messages(*offerer_);
    connect_pair();

    ASSERT_TRUE(answerer_->send_text("REQUEST_FILE:YS50eHQ="));
    std::vector<uint8_t> chunk(16384);
    for (size_t i = 0; i < chunk.size(); ++i) {
        chunk[i] = static_cast<uint8_t>(i & 0xFF);
    }
    ASSERT_TRUE(answerer_->send_binary(chunk.data(), chunk.size()));
    ASSERT_TRUE(answerer_->send_binary(nullptr, 0));

    ASSERT_TRUE(wait_for_messages(3));
    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_TRUE(received_[0].is_text);
    EXPECT_EQ(std::string(received_[0].data.begin(), received_[0].data.end()), "REQUEST_FILE:YS50eHQ=");
    EXPECT_FALSE(received_[1].is_text);
    EXPECT_EQ(received_[1].data, chunk);
    EXPECT_FALSE(received_[2].is_text);
    EXPECT_TRUE(received_[2].data.empty());
}

TEST_F(TcpPeerConnectionTest, SendBeforeConnectedFailsTest) {
    EXPECT_FALSE(offerer_->send_text("hello"));
    uint8_t byte = 1;
    EXPECT_FALSE(offerer_->send_binary(&byte, 1));
}

TEST_F(TcpPeerConnectionTest, WaitTimesOutWithoutAnswerTest) {
    offerer_->create_offer();
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(offerer_->wait_for_connection(std::chrono::milliseconds(200)), ConnectionWaitResult::TIMED_OUT);
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(200));
}

TEST_F(TcpPeerConnectionTest, CloseWakesWaitersTest) {
    offerer_->create_offer();
    offerer_->close();
    EXPECT_EQ(offerer_->wait_for_connection(std::chrono::seconds(5)), ConnectionWaitResult::FAILED);
    EXPECT_FALSE(offerer_->is_connected());
}

TEST_F(TcpPeerConnectionTest, RemoteCloseIsDetectedTest) {
    connect_pair();
    answerer_->close();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (offerer_->is_connected() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_FALSE(offerer_->is_connected());
}

TEST_F(TcpPeerConnectionTest, RejectsInvalidDescriptionsTest) {
    EXPECT_THROW(answerer_->create_answer("not an sdp"), NegotiationError);

    // An offer must come from the passive side
    std::string offer = offerer_->create_offer();
    std::string answer = answerer_->create_answer(offer);
    EXPECT_THROW(answerer_->create_answer(answer), NegotiationError);

    // Answers only apply to the offering side, and only once
    EXPECT_THROW(answerer_->set_answer(answer), NegotiationError);
    EXPECT_THROW(offerer_->set_answer(offer), NegotiationError);
    offerer_->set_answer(answer);
    EXPECT_THROW(offerer_->set_answer(answer), NegotiationError);
}

TEST_F(TcpPeerConnectionTest, SecondOfferRejectedTest) {
    offerer_->create_offer();
    EXPECT_THROW(offerer_->create_offer(), NegotiationError);
}

TEST_F(TcpPeerConnectionTest, WrongCredentialsNeverConnectTest) {
    std::string offer = offerer_->create_offer();
    std::string answer = answerer_->create_answer(offer);

    // Answer from an unrelated negotiation: ufrag/pwd do not match the binding request
    TcpPeerConnection other(config_);
    TcpPeerConnection other_offerer(config_);
    std::string foreign_answer = other.create_answer(other_offerer.create_offer());
    offerer_->set_answer(foreign_answer);

    EXPECT_NE(offerer_->wait_for_connection(std::chrono::milliseconds(1500)), ConnectionWaitResult::CONNECTED);
    other.close();
    other_offerer.close();
}
