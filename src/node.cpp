#include "node.h"
#include "errors.h"
#include "logger.h"

// Node module logging macros
#define LOG_NODE_DEBUG(message) LOG_DEBUG("node", message)
#define LOG_NODE_INFO(message)  LOG_INFO("node", message)
#define LOG_NODE_WARN(message)  LOG_WARN("node", message)
#define LOG_NODE_ERROR(message) LOG_ERROR("node", message)

namespace rtcdrop {

RtcdropNode::RtcdropNode(const NodeConfig& config) : config_(config) {
    connection_config_.advertised_addresses = config.advertised_addresses;
    initialize();
}

RtcdropNode::RtcdropNode(const NodeConfig& config, const TcpPeerConnectionConfig& connection_config)
    : config_(config), connection_config_(connection_config) {
    initialize();
}

RtcdropNode::~RtcdropNode() {
    stop();
}

void RtcdropNode::initialize() {
    if (config_.peer_id.empty()) {
        config_.peer_id = generate_peer_id();
    }

    host_ = std::make_unique<TcpStreamHost>(config_.peer_id, config_.listen_port);
    sessions_ = std::make_unique<SessionManager>(
        [this](const std::string& peer_id) { return create_peer_connection(peer_id); },
        std::chrono::seconds(config_.connection_timeout_seconds));
    signaling_ = std::make_unique<SignalingHandler>(*host_, *sessions_);
    signaling_->attach();

    for (const auto& peer : config_.peers) {
        host_->add_peer_address(peer.first, peer.second);
    }
}

bool RtcdropNode::start() {
    if (!host_->start()) {
        LOG_NODE_ERROR("Failed to start signaling host on port " << config_.listen_port);
        return false;
    }
    LOG_NODE_INFO("Node " << config_.peer_id << " listening on port " << host_->get_listen_port());
    return true;
}

void RtcdropNode::stop() {
    host_->stop();
    sessions_->shutdown();

    std::unordered_map<std::string, std::shared_ptr<FileTransferChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        channels.swap(channels_);
    }
    for (auto& entry : channels) {
        entry.second->close();
    }

    shutdown_all_threads();
    join_all_active_threads();
}

bool RtcdropNode::is_running() const {
    return host_->is_running();
}

int RtcdropNode::get_listen_port() const {
    return host_->get_listen_port();
}

//=============================================================================
// Address book
//=============================================================================

void RtcdropNode::add_peer(const std::string& peer_id, const std::string& address) {
    Peer endpoint;
    if (!parse_host_port(address, endpoint)) {
        throw ProtocolError("Invalid peer address '" + address + "', expected host:port");
    }

    host_->add_peer_address(peer_id, address);
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_.peers[peer_id] = address;
}

bool RtcdropNode::remove_peer(const std::string& peer_id) {
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_.peers.erase(peer_id);
    }
    return host_->remove_peer_address(peer_id);
}

std::unordered_map<std::string, std::string> RtcdropNode::get_known_peers() const {
    return host_->get_known_peers();
}

//=============================================================================
// Sessions
//=============================================================================

bool RtcdropNode::offer(const std::string& peer_id) {
    if (peer_id == config_.peer_id) {
        LOG_NODE_WARN("Refusing to offer a connection to ourselves");
        return false;
    }
    return signaling_->send_offer(peer_id);
}

NegotiationState RtcdropNode::await_connected(const std::string& peer_id, std::chrono::milliseconds timeout) {
    return sessions_->await_connected(peer_id, timeout);
}

void RtcdropNode::download(const std::string& filename, const std::string& peer_id) {
    std::string target = peer_id.empty() ? sessions_->get_connected_peer() : peer_id;
    if (target.empty()) {
        throw ProtocolError("Not connected to any peer");
    }

    std::shared_ptr<PeerConnection> connection = sessions_->get_connection(target);
    if (sessions_->get_state(target) != NegotiationState::CONNECTED || !connection || !connection->is_connected()) {
        throw ProtocolError("Not connected to peer " + target);
    }

    std::shared_ptr<FileTransferChannel> channel = get_transfer_channel(target);
    if (!channel) {
        throw ProtocolError("No transfer channel for peer " + target);
    }
    channel->request_file(filename);
}

bool RtcdropNode::disconnect(const std::string& peer_id) {
    bool had_session = sessions_->reset(peer_id);

    std::shared_ptr<FileTransferChannel> channel;
    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        auto it = channels_.find(peer_id);
        if (it != channels_.end()) {
            channel = it->second;
            channels_.erase(it);
        }
    }
    if (channel) {
        channel->close();
    }

    if (had_session) {
        LOG_NODE_INFO("Disconnected from peer " << peer_id);
    }
    return had_session;
}

NegotiationState RtcdropNode::get_session_state(const std::string& peer_id) const {
    return sessions_->get_state(peer_id);
}

std::vector<PeerSession> RtcdropNode::get_sessions() const {
    return sessions_->get_sessions();
}

std::string RtcdropNode::get_connected_peer() const {
    return sessions_->get_connected_peer();
}

std::shared_ptr<FileTransferChannel> RtcdropNode::get_transfer_channel(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(channels_mutex_);
    auto it = channels_.find(peer_id);
    return it != channels_.end() ? it->second : nullptr;
}

//=============================================================================
// Callbacks
//=============================================================================

void RtcdropNode::set_session_status_callback(SessionStatusCallback callback) {
    sessions_->set_status_callback(std::move(callback));
}

void RtcdropNode::set_receive_started_callback(FileReceiveStartedCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    receive_started_callback_ = std::move(callback);
}

void RtcdropNode::set_receive_complete_callback(FileReceiveCompleteCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    receive_complete_callback_ = std::move(callback);
}

void RtcdropNode::set_send_complete_callback(FileSendCompleteCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    send_complete_callback_ = std::move(callback);
}

//=============================================================================
// Peer connection factory
//=============================================================================

std::shared_ptr<PeerConnection> RtcdropNode::create_peer_connection(const std::string& peer_id) {
    auto connection = std::make_shared<TcpPeerConnection>(connection_config_);
    auto channel = FileTransferChannel::create(connection, config_.to_file_transfer_config());

    channel->set_receive_started_callback([this](const std::string& filename, uint64_t declared_size) {
        FileReceiveStartedCallback callback;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            callback = receive_started_callback_;
        }
        if (callback) {
            callback(filename, declared_size);
        }
    });
    channel->set_receive_complete_callback([this](const FileReceiveResult& result) {
        FileReceiveCompleteCallback callback;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            callback = receive_complete_callback_;
        }
        if (callback) {
            callback(result);
        }
    });
    channel->set_send_complete_callback([this](const FileSendResult& result) {
        FileSendCompleteCallback callback;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            callback = send_complete_callback_;
        }
        if (callback) {
            callback(result);
        }
    });

    std::shared_ptr<FileTransferChannel> replaced;
    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        auto it = channels_.find(peer_id);
        if (it != channels_.end()) {
            replaced = it->second;
        }
        channels_[peer_id] = channel;
    }
    if (replaced) {
        LOG_NODE_DEBUG("Replacing transfer channel for peer " << peer_id);
        retire_channel(replaced);
    }

    return connection;
}

void RtcdropNode::retire_channel(std::shared_ptr<FileTransferChannel> channel) {
    cleanup_finished_threads();
    bool started = start_managed_thread("retire-channel", [channel]() {
        channel->close();
    });
    if (!started) {
        channel->close();
    }
}

} // namespace rtcdrop
