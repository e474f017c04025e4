#pragma once

#include "config.h"
#include "tcp_stream_host.h"
#include "tcp_peer_connection.h"
#include "peer_session.h"
#include "signaling.h"
#include "file_transfer.h"
#include "threadmanager.h"
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <chrono>
#include <unordered_map>

namespace rtcdrop {

/**
 * One rtcdrop peer: signaling host, session state machine and a file
 * transfer channel per established connection.
 */
class RtcdropNode : public ThreadManager {
public:
    explicit RtcdropNode(const NodeConfig& config);
    RtcdropNode(const NodeConfig& config, const TcpPeerConnectionConfig& connection_config);
    ~RtcdropNode() override;

    /**
     * Start listening for signaling streams
     * @return false if the host could not bind its port
     */
    bool start();

    /**
     * Stop the host, close every session and transfer channel
     */
    void stop();

    bool is_running() const;

    std::string get_peer_id() const { return config_.peer_id; }
    int get_listen_port() const;
    const NodeConfig& get_config() const { return config_; }

    // Address book
    void add_peer(const std::string& peer_id, const std::string& address);
    bool remove_peer(const std::string& peer_id);
    std::unordered_map<std::string, std::string> get_known_peers() const;

    /**
     * Negotiate a connection with a known peer (initiator role)
     * @return true if the peer's answer was applied; the connection is then
     *         awaited in the background
     */
    bool offer(const std::string& peer_id);

    /**
     * Block until the session with the peer is connected or failed
     */
    NegotiationState await_connected(const std::string& peer_id, std::chrono::milliseconds timeout);

    /**
     * Ask a connected peer for a file. Without a peer id the first connected
     * peer is used.
     * @throws ProtocolError if no matching session is connected
     * @throws IOError if the request cannot be sent
     */
    void download(const std::string& filename, const std::string& peer_id = "");

    /**
     * Close the session with the peer and drop its transfer channel
     * @return false if there was no session
     */
    bool disconnect(const std::string& peer_id);

    NegotiationState get_session_state(const std::string& peer_id) const;
    std::vector<PeerSession> get_sessions() const;
    std::string get_connected_peer() const;
    std::shared_ptr<FileTransferChannel> get_transfer_channel(const std::string& peer_id) const;

    void set_session_status_callback(SessionStatusCallback callback);
    void set_receive_started_callback(FileReceiveStartedCallback callback);
    void set_receive_complete_callback(FileReceiveCompleteCallback callback);
    void set_send_complete_callback(FileSendCompleteCallback callback);

private:
    NodeConfig config_;
    TcpPeerConnectionConfig connection_config_;

    std::unique_ptr<TcpStreamHost> host_;
    std::unique_ptr<SessionManager> sessions_;
    std::unique_ptr<SignalingHandler> signaling_;

    mutable std::mutex config_mutex_;

    mutable std::mutex channels_mutex_;
    std::unordered_map<std::string, std::shared_ptr<FileTransferChannel>> channels_;

    std::mutex callbacks_mutex_;
    FileReceiveStartedCallback receive_started_callback_;
    FileReceiveCompleteCallback receive_complete_callback_;
    FileSendCompleteCallback send_complete_callback_;

    void initialize();
    std::shared_ptr<PeerConnection> create_peer_connection(const std::string& peer_id);
    // Close a displaced channel on a managed thread; runs inline once stopping
    void retire_channel(std::shared_ptr<FileTransferChannel> channel);
};

} // namespace rtcdrop
