#pragma once

#include "peer_connection.h"
#include "session_description.h"
#include "socket.h"
#include "threadmanager.h"
#include <string>
#include <vector>
#include <mutex>
#include <condition_variable>
#include <atomic>

namespace rtcdrop {

/**
 * Candidate gathering and connectivity check settings
 */
struct TcpPeerConnectionConfig {
    std::vector<std::string> advertised_addresses;  // Extra host candidates (e.g. a port-forwarded public IP)
    bool gather_interface_addresses;                 // Advertise addresses of local interfaces that are up
    bool include_loopback;                           // Advertise 127.0.0.1 with the lowest priority
    int connect_attempt_timeout_ms;                  // TCP connect timeout per candidate
    int binding_timeout_ms;                          // Wait for the binding response after connecting
    int retry_interval_ms;                           // Pause between full rounds over the candidate list
    uint32_t max_frame_size;                         // Largest accepted frame payload

    TcpPeerConnectionConfig()
        : gather_interface_addresses(true),
          include_loopback(true),
          connect_attempt_timeout_ms(2000),
          binding_timeout_ms(10000),
          retry_interval_ms(250),
          max_frame_size(1024 * 1024) {}
};

/**
 * PeerConnection carried over a single TCP connection.
 *
 * The offerer listens on an ephemeral port and advertises its host candidates.
 * The answerer dials the candidates in priority order and proves knowledge of
 * both sets of ICE credentials with a binding request; the offerer answers with
 * a binding response once the remote answer has been applied. After that the
 * socket carries framed data channel messages:
 *   [kind:1][length:4 big-endian][payload]
 */
class TcpPeerConnection : public PeerConnection, public ThreadManager {
public:
    explicit TcpPeerConnection(const TcpPeerConnectionConfig& config = TcpPeerConnectionConfig());
    ~TcpPeerConnection() override;

    std::string create_offer() override;
    std::string create_answer(const std::string& offer) override;
    void set_answer(const std::string& answer) override;
    ConnectionWaitResult wait_for_connection(std::chrono::milliseconds timeout) override;

    bool send_text(const std::string& text) override;
    bool send_binary(const uint8_t* data, size_t size) override;

    bool is_connected() const override;
    void set_message_callback(DataChannelMessageCallback callback) override;
    void close() override;

    // Port the offerer listens on (0 before create_offer)
    int get_listen_port() const;

private:
    enum class Role {
        NONE,
        OFFERER,
        ANSWERER
    };

    enum class LinkState {
        NEW,
        CHECKING,
        CONNECTED,
        CLOSED
    };

    enum class FrameKind : uint8_t {
        TEXT = 1,
        BINARY = 2,
        BINDING_REQUEST = 3,
        BINDING_RESPONSE = 4
    };

    TcpPeerConnectionConfig config_;

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    Role role_;
    LinkState link_state_;
    SessionDescription local_description_;
    SessionDescription remote_description_;
    bool has_remote_description_;
    socket_t listen_socket_;
    socket_t data_socket_;
    socket_t handshake_socket_;   // Socket of a connectivity check in progress
    int listen_port_;
    std::atomic<bool> closed_;

    std::mutex send_mutex_;

    std::mutex callback_mutex_;
    DataChannelMessageCallback message_callback_;

    std::vector<HostCandidate> gather_host_candidates(int port) const;

    // Offerer side
    void accept_loop();
    bool handle_binding_request(socket_t client);

    // Answerer side
    void connect_loop();
    bool try_candidate(const HostCandidate& candidate);

    void receive_loop();
    bool mark_connected(socket_t socket);
    void mark_closed();

    bool send_frame(socket_t socket, FrameKind kind, const uint8_t* data, size_t size);
    bool read_frame(socket_t socket, FrameKind& kind, std::vector<uint8_t>& payload);
    void set_handshake_socket(socket_t socket);
    bool sleep_interruptible(int milliseconds);
};

} // namespace rtcdrop
