#pragma once

#include "stream_host.h"
#include "socket.h"
#include "threadmanager.h"
#include <string>
#include <memory>
#include <mutex>
#include <atomic>
#include <vector>
#include <unordered_map>

namespace rtcdrop {

/**
 * Socket handle shared between a stream and the host that produced it,
 * so the host can interrupt blocked reads on shutdown.
 */
class StreamSocket {
public:
    explicit StreamSocket(socket_t socket);
    ~StreamSocket();

    socket_t get() const { return socket_; }

    // Wake up blocked readers without releasing the handle
    void interrupt();
    void close();
    bool is_closed() const;

private:
    mutable std::mutex mutex_;
    socket_t socket_;
    bool closed_;
};

/**
 * Line-oriented signaling stream over a TCP connection
 */
class TcpSignalingStream : public SignalingStream {
public:
    TcpSignalingStream(std::shared_ptr<StreamSocket> socket, const std::string& remote_peer_id);
    ~TcpSignalingStream() override;

    StreamReadStatus read_line(std::string& line, std::string* error = nullptr) override;
    void set_read_timeout(int timeout_ms) override { read_timeout_ms_ = timeout_ms; }
    bool write(const std::string& data) override;
    bool flush() override;
    void close() override;
    std::string remote_peer_id() const override;

    void set_remote_peer_id(const std::string& peer_id) { remote_peer_id_ = peer_id; }

    // Longest accepted line, terminator excluded
    static constexpr size_t MAX_LINE_LENGTH = 1024 * 1024;

private:
    std::shared_ptr<StreamSocket> socket_;
    std::string remote_peer_id_;
    std::string read_buffer_;
    std::string write_buffer_;
    int read_timeout_ms_;
};

/**
 * StreamHost over plain TCP.
 *
 * Peers are reached through an address book (peer id -> host:port). Every
 * stream starts with a preamble line "<protocol_id> <peer_id>"; the accepting
 * side echoes the protocol id when a handler is registered for it, or "na".
 */
class TcpStreamHost : public StreamHost, public ThreadManager {
public:
    TcpStreamHost(const std::string& local_peer_id, int listen_port = 0);
    ~TcpStreamHost() override;

    /**
     * Bind the listening socket and start accepting streams
     * @return true if the host is listening
     */
    bool start();

    /**
     * Stop accepting, interrupt every open stream and join handler threads
     */
    void stop();

    bool is_running() const { return running_.load(); }

    // Actual listening port (resolved after start() when 0 was requested)
    int get_listen_port() const;

    // Address book
    void add_peer_address(const std::string& peer_id, const std::string& address);
    bool remove_peer_address(const std::string& peer_id);
    std::string lookup_peer_address(const std::string& peer_id) const;
    std::unordered_map<std::string, std::string> get_known_peers() const;

    void set_connect_timeout_ms(int timeout_ms) { connect_timeout_ms_ = timeout_ms; }

    // StreamHost
    std::string local_peer_id() const override;
    void set_stream_handler(const std::string& protocol_id, StreamHandler handler) override;
    std::unique_ptr<SignalingStream> open_stream(const std::string& peer_id,
                                                 const std::string& protocol_id) override;

    static constexpr const char* PROTOCOL_NOT_AVAILABLE = "na";

private:
    std::string local_peer_id_;
    int requested_port_;
    int listen_port_;
    socket_t listen_socket_;
    std::atomic<bool> running_;
    std::atomic<int> connect_timeout_ms_;
    mutable std::mutex listen_mutex_;

    mutable std::mutex peers_mutex_;
    std::unordered_map<std::string, std::string> peer_addresses_;

    mutable std::mutex handlers_mutex_;
    std::unordered_map<std::string, StreamHandler> handlers_;

    std::mutex streams_mutex_;
    std::vector<std::weak_ptr<StreamSocket>> open_streams_;

    void accept_loop();
    void handle_inbound_connection(std::shared_ptr<StreamSocket> socket, const std::string& address);
    void track_stream(const std::shared_ptr<StreamSocket>& socket);
};

} // namespace rtcdrop
