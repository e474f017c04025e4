#include "tcp_peer_connection.h"
#include "network_utils.h"
#include "errors.h"
#include "logger.h"
#include <algorithm>
#include <cstring>

// Peer connection module logging macros
#define LOG_PC_DEBUG(message) LOG_DEBUG("peer_conn", message)
#define LOG_PC_INFO(message)  LOG_INFO("peer_conn", message)
#define LOG_PC_WARN(message)  LOG_WARN("peer_conn", message)
#define LOG_PC_ERROR(message) LOG_ERROR("peer_conn", message)

namespace rtcdrop {

namespace {

const size_t ICE_UFRAG_LENGTH = 8;
const size_t ICE_PWD_LENGTH = 24;
const size_t FRAME_HEADER_SIZE = 5;
const char* const LOOPBACK_ADDRESS = "127.0.0.1";

// "<ufrag_a>:<ufrag_b> <pwd>"
std::string format_binding(const std::string& first_ufrag, const std::string& second_ufrag,
                           const std::string& pwd) {
    return first_ufrag + ":" + second_ufrag + " " + pwd;
}

bool parse_binding(const std::string& payload, std::string& first_ufrag,
                   std::string& second_ufrag, std::string& pwd) {
    size_t colon = payload.find(':');
    if (colon == std::string::npos) {
        return false;
    }
    size_t space = payload.find(' ', colon + 1);
    if (space == std::string::npos) {
        return false;
    }
    first_ufrag = payload.substr(0, colon);
    second_ufrag = payload.substr(colon + 1, space - colon - 1);
    pwd = payload.substr(space + 1);
    return !first_ufrag.empty() && !second_ufrag.empty() && !pwd.empty();
}

} // anonymous namespace

TcpPeerConnection::TcpPeerConnection(const TcpPeerConnectionConfig& config)
    : config_(config),
      role_(Role::NONE),
      link_state_(LinkState::NEW),
      has_remote_description_(false),
      listen_socket_(INVALID_SOCKET_VALUE),
      data_socket_(INVALID_SOCKET_VALUE),
      handshake_socket_(INVALID_SOCKET_VALUE),
      listen_port_(0),
      closed_(false) {
}

TcpPeerConnection::~TcpPeerConnection() {
    close();
}

//=============================================================================
// Offer / answer
//=============================================================================

std::string TcpPeerConnection::create_offer() {
    std::string sdp;
    size_t candidate_count = 0;
    int port = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (closed_.load()) {
            throw NegotiationError("Peer connection is closed");
        }
        if (role_ != Role::NONE) {
            throw NegotiationError("Peer connection already has a local description");
        }

        socket_t server = create_tcp_server_v4(0);
        if (!is_valid_socket(server)) {
            throw NegotiationError("Failed to open a listening socket for host candidates");
        }
        port = get_ephemeral_port(server);
        if (port == 0) {
            close_socket(server);
            throw NegotiationError("Failed to determine the candidate port");
        }

        local_description_.session_id = generate_session_id();
        local_description_.ice_ufrag = generate_ice_credential(ICE_UFRAG_LENGTH);
        local_description_.ice_pwd = generate_ice_credential(ICE_PWD_LENGTH);
        local_description_.setup = SetupRole::PASSIVE;
        local_description_.candidates = gather_host_candidates(port);
        if (local_description_.candidates.empty()) {
            close_socket(server);
            throw NegotiationError("No host candidates available");
        }

        listen_socket_ = server;
        listen_port_ = port;
        role_ = Role::OFFERER;
        link_state_ = LinkState::CHECKING;
        candidate_count = local_description_.candidates.size();
        sdp = local_description_.to_sdp();
    }

    if (!start_managed_thread("offer-accept", [this]() { accept_loop(); })) {
        throw NegotiationError("Peer connection is shutting down");
    }

    LOG_PC_INFO("Created offer with " << candidate_count << " host candidates on port " << port);
    return sdp;
}

std::string TcpPeerConnection::create_answer(const std::string& offer) {
    SessionDescription remote = SessionDescription::parse(offer);
    if (remote.setup != SetupRole::PASSIVE) {
        throw NegotiationError("Offer must use setup:passive");
    }
    if (remote.candidates.empty()) {
        throw NegotiationError("Offer carries no usable candidates");
    }

    std::string sdp;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (closed_.load()) {
            throw NegotiationError("Peer connection is closed");
        }
        if (role_ != Role::NONE) {
            throw NegotiationError("Peer connection already has a local description");
        }

        local_description_.session_id = generate_session_id();
        local_description_.ice_ufrag = generate_ice_credential(ICE_UFRAG_LENGTH);
        local_description_.ice_pwd = generate_ice_credential(ICE_PWD_LENGTH);
        local_description_.setup = SetupRole::ACTIVE;
        local_description_.candidates.clear();

        remote_description_ = remote;
        has_remote_description_ = true;
        role_ = Role::ANSWERER;
        link_state_ = LinkState::CHECKING;
        sdp = local_description_.to_sdp();
    }

    if (!start_managed_thread("answer-connect", [this]() { connect_loop(); })) {
        throw NegotiationError("Peer connection is shutting down");
    }

    LOG_PC_INFO("Created answer for offer with " << remote.candidates.size() << " candidates");
    return sdp;
}

void TcpPeerConnection::set_answer(const std::string& answer) {
    SessionDescription remote = SessionDescription::parse(answer);
    if (remote.setup != SetupRole::ACTIVE) {
        throw NegotiationError("Answer must use setup:active");
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (closed_.load()) {
        throw NegotiationError("Peer connection is closed");
    }
    if (role_ != Role::OFFERER) {
        throw NegotiationError("No local offer to apply an answer to");
    }
    if (has_remote_description_) {
        throw NegotiationError("Remote answer already applied");
    }

    remote_description_ = remote;
    has_remote_description_ = true;
    state_cv_.notify_all();
    LOG_PC_DEBUG("Applied remote answer (ufrag " << remote.ice_ufrag << ")");
}

ConnectionWaitResult TcpPeerConnection::wait_for_connection(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    bool settled = state_cv_.wait_for(lock, timeout, [this]() {
        return link_state_ == LinkState::CONNECTED || link_state_ == LinkState::CLOSED;
    });
    if (!settled) {
        return ConnectionWaitResult::TIMED_OUT;
    }
    return link_state_ == LinkState::CONNECTED ? ConnectionWaitResult::CONNECTED
                                               : ConnectionWaitResult::FAILED;
}

//=============================================================================
// Data channel
//=============================================================================

bool TcpPeerConnection::send_text(const std::string& text) {
    std::lock_guard<std::mutex> send_lock(send_mutex_);
    socket_t socket;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (link_state_ != LinkState::CONNECTED) {
            return false;
        }
        socket = data_socket_;
    }
    return send_frame(socket, FrameKind::TEXT,
                      reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

bool TcpPeerConnection::send_binary(const uint8_t* data, size_t size) {
    std::lock_guard<std::mutex> send_lock(send_mutex_);
    socket_t socket;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (link_state_ != LinkState::CONNECTED) {
            return false;
        }
        socket = data_socket_;
    }
    return send_frame(socket, FrameKind::BINARY, data, size);
}

bool TcpPeerConnection::is_connected() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return link_state_ == LinkState::CONNECTED;
}

void TcpPeerConnection::set_message_callback(DataChannelMessageCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    message_callback_ = std::move(callback);
}

int TcpPeerConnection::get_listen_port() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return listen_port_;
}

void TcpPeerConnection::close() {
    bool was_closed = closed_.exchange(true);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!was_closed && role_ != Role::NONE) {
            LOG_PC_DEBUG("Closing peer connection");
        }
        link_state_ = LinkState::CLOSED;
        shutdown_socket(listen_socket_);
        shutdown_socket(data_socket_);
        shutdown_socket(handshake_socket_);
        state_cv_.notify_all();
    }

    shutdown_all_threads();
    join_all_active_threads();

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (is_valid_socket(listen_socket_)) {
            close_socket(listen_socket_);
            listen_socket_ = INVALID_SOCKET_VALUE;
        }
        if (is_valid_socket(data_socket_)) {
            close_socket(data_socket_);
            data_socket_ = INVALID_SOCKET_VALUE;
        }
    }
}

//=============================================================================
// Candidate gathering
//=============================================================================

std::vector<HostCandidate> TcpPeerConnection::gather_host_candidates(int port) const {
    std::vector<std::string> addresses;
    auto add_address = [&addresses](const std::string& ip) {
        if (!ip.empty() && std::find(addresses.begin(), addresses.end(), ip) == addresses.end()) {
            addresses.push_back(ip);
        }
    };

    if (config_.gather_interface_addresses) {
        for (const auto& ip : network_utils::get_local_interface_addresses_v4()) {
            add_address(ip);
        }
    }
    for (const auto& ip : config_.advertised_addresses) {
        add_address(ip);
    }

    std::vector<HostCandidate> candidates;
    uint16_t local_pref = 65535;
    for (const auto& ip : addresses) {
        if (ip == LOOPBACK_ADDRESS) {
            continue;
        }
        HostCandidate candidate;
        candidate.foundation = generate_candidate_foundation(ip);
        candidate.priority = calculate_host_priority(local_pref--);
        candidate.ip = ip;
        candidate.port = static_cast<uint16_t>(port);
        candidates.push_back(candidate);
    }

    if (config_.include_loopback || std::find(addresses.begin(), addresses.end(), LOOPBACK_ADDRESS) != addresses.end()) {
        HostCandidate candidate;
        candidate.foundation = generate_candidate_foundation(LOOPBACK_ADDRESS);
        candidate.priority = calculate_host_priority(0);
        candidate.ip = LOOPBACK_ADDRESS;
        candidate.port = static_cast<uint16_t>(port);
        candidates.push_back(candidate);
    }

    return candidates;
}

//=============================================================================
// Offerer: accept connectivity checks
//=============================================================================

void TcpPeerConnection::accept_loop() {
    socket_t server;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        server = listen_socket_;
    }

    while (!closed_.load() && !is_shutdown_requested()) {
        int ready = wait_for_readable(server, 100);
        if (ready < 0) {
            if (!closed_.load()) {
                LOG_PC_ERROR("Listening socket failed while waiting for connectivity checks");
                mark_closed();
            }
            return;
        }
        if (ready == 0) {
            continue;
        }

        socket_t client = accept_client(server);
        if (!is_valid_socket(client)) {
            continue;
        }

        LOG_PC_DEBUG("Connectivity check from " << get_peer_address(client));
        set_handshake_socket(client);
        bool accepted = handle_binding_request(client);
        set_handshake_socket(INVALID_SOCKET_VALUE);

        if (accepted) {
            if (mark_connected(client)) {
                receive_loop();
            }
            return;
        }
        close_socket(client);
    }
}

bool TcpPeerConnection::handle_binding_request(socket_t client) {
    if (wait_for_readable(client, config_.binding_timeout_ms) != 1) {
        LOG_PC_WARN("No binding request received on candidate connection");
        return false;
    }

    FrameKind kind;
    std::vector<uint8_t> payload;
    if (!read_frame(client, kind, payload) || kind != FrameKind::BINDING_REQUEST) {
        LOG_PC_WARN("Candidate connection did not start with a binding request");
        return false;
    }

    std::string offer_ufrag, answer_ufrag, pwd;
    if (!parse_binding(std::string(payload.begin(), payload.end()), offer_ufrag, answer_ufrag, pwd)) {
        LOG_PC_WARN("Malformed binding request");
        return false;
    }

    std::string response;
    {
        std::unique_lock<std::mutex> lock(state_mutex_);
        if (offer_ufrag != local_description_.ice_ufrag || pwd != local_description_.ice_pwd) {
            LOG_PC_WARN("Binding request carries wrong credentials");
            return false;
        }

        // The answer may still be in flight on the signaling stream
        state_cv_.wait(lock, [this]() { return has_remote_description_ || closed_.load(); });
        if (closed_.load()) {
            return false;
        }
        if (answer_ufrag != remote_description_.ice_ufrag) {
            LOG_PC_WARN("Binding request does not match the applied answer");
            return false;
        }
        response = format_binding(remote_description_.ice_ufrag, local_description_.ice_ufrag,
                                  remote_description_.ice_pwd);
    }

    return send_frame(client, FrameKind::BINDING_RESPONSE,
                      reinterpret_cast<const uint8_t*>(response.data()), response.size());
}

//=============================================================================
// Answerer: dial the offer's candidates
//=============================================================================

void TcpPeerConnection::connect_loop() {
    std::vector<HostCandidate> candidates;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        candidates = remote_description_.candidates;
    }
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const HostCandidate& a, const HostCandidate& b) {
                         return a.priority > b.priority;
                     });

    while (!closed_.load()) {
        for (const auto& candidate : candidates) {
            if (closed_.load()) {
                return;
            }
            if (try_candidate(candidate)) {
                receive_loop();
                return;
            }
        }
        if (!sleep_interruptible(config_.retry_interval_ms)) {
            return;
        }
    }
}

bool TcpPeerConnection::try_candidate(const HostCandidate& candidate) {
    socket_t socket = create_tcp_client_v4(candidate.ip, candidate.port, config_.connect_attempt_timeout_ms);
    if (!is_valid_socket(socket)) {
        return false;
    }
    set_handshake_socket(socket);

    std::string request, expected;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        request = format_binding(remote_description_.ice_ufrag, local_description_.ice_ufrag,
                                 remote_description_.ice_pwd);
        expected = format_binding(local_description_.ice_ufrag, remote_description_.ice_ufrag,
                                  local_description_.ice_pwd);
    }

    bool ok = send_frame(socket, FrameKind::BINDING_REQUEST,
                         reinterpret_cast<const uint8_t*>(request.data()), request.size());
    if (ok && wait_for_readable(socket, config_.binding_timeout_ms) != 1) {
        LOG_PC_DEBUG("No binding response from " << candidate.ip << ":" << candidate.port);
        ok = false;
    }

    FrameKind kind;
    std::vector<uint8_t> payload;
    if (ok && (!read_frame(socket, kind, payload) || kind != FrameKind::BINDING_RESPONSE ||
               std::string(payload.begin(), payload.end()) != expected)) {
        LOG_PC_WARN("Invalid binding response from " << candidate.ip << ":" << candidate.port);
        ok = false;
    }

    set_handshake_socket(INVALID_SOCKET_VALUE);
    if (!ok) {
        close_socket(socket);
        return false;
    }

    LOG_PC_INFO("Connectivity check succeeded via " << candidate.ip << ":" << candidate.port);
    return mark_connected(socket);
}

//=============================================================================
// Connected state
//=============================================================================

void TcpPeerConnection::receive_loop() {
    socket_t socket;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        socket = data_socket_;
    }

    while (!closed_.load()) {
        FrameKind kind;
        std::vector<uint8_t> payload;
        if (!read_frame(socket, kind, payload)) {
            break;
        }

        if (kind == FrameKind::TEXT || kind == FrameKind::BINARY) {
            DataChannelMessageCallback callback;
            {
                std::lock_guard<std::mutex> lock(callback_mutex_);
                callback = message_callback_;
            }
            if (callback) {
                callback(payload, kind == FrameKind::TEXT);
            } else {
                LOG_PC_DEBUG("Dropping data channel message, no callback registered");
            }
        } else {
            LOG_PC_WARN("Unexpected frame kind " << static_cast<int>(kind) << " on data channel");
        }
    }

    mark_closed();
}

bool TcpPeerConnection::mark_connected(socket_t socket) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (closed_.load()) {
        close_socket(socket);
        return false;
    }

    data_socket_ = socket;
    if (is_valid_socket(listen_socket_)) {
        close_socket(listen_socket_);
        listen_socket_ = INVALID_SOCKET_VALUE;
    }
    link_state_ = LinkState::CONNECTED;
    state_cv_.notify_all();

    LOG_PC_INFO("Data channel open");
    return true;
}

void TcpPeerConnection::mark_closed() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (link_state_ != LinkState::CLOSED) {
        link_state_ = LinkState::CLOSED;
        LOG_PC_INFO("Data channel closed");
    }
    state_cv_.notify_all();
}

void TcpPeerConnection::set_handshake_socket(socket_t socket) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    handshake_socket_ = socket;
    if (closed_.load()) {
        shutdown_socket(socket);
    }
}

//=============================================================================
// Framing
//=============================================================================

bool TcpPeerConnection::send_frame(socket_t socket, FrameKind kind, const uint8_t* data, size_t size) {
    if (size > config_.max_frame_size) {
        LOG_PC_ERROR("Frame of " << size << " bytes exceeds the limit of " << config_.max_frame_size);
        return false;
    }

    std::vector<uint8_t> frame(FRAME_HEADER_SIZE + size);
    uint32_t length = static_cast<uint32_t>(size);
    frame[0] = static_cast<uint8_t>(kind);
    frame[1] = static_cast<uint8_t>((length >> 24) & 0xFF);
    frame[2] = static_cast<uint8_t>((length >> 16) & 0xFF);
    frame[3] = static_cast<uint8_t>((length >> 8) & 0xFF);
    frame[4] = static_cast<uint8_t>(length & 0xFF);
    if (size > 0) {
        memcpy(frame.data() + FRAME_HEADER_SIZE, data, size);
    }

    return send_all(socket, frame.data(), frame.size());
}

bool TcpPeerConnection::read_frame(socket_t socket, FrameKind& kind, std::vector<uint8_t>& payload) {
    std::vector<uint8_t> header;
    if (!receive_exact_bytes(socket, FRAME_HEADER_SIZE, header)) {
        return false;
    }

    kind = static_cast<FrameKind>(header[0]);
    uint32_t length = (static_cast<uint32_t>(header[1]) << 24) |
                      (static_cast<uint32_t>(header[2]) << 16) |
                      (static_cast<uint32_t>(header[3]) << 8) |
                      static_cast<uint32_t>(header[4]);
    if (length > config_.max_frame_size) {
        LOG_PC_ERROR("Incoming frame of " << length << " bytes exceeds the limit of " << config_.max_frame_size);
        return false;
    }

    if (length == 0) {
        payload.clear();
        return true;
    }
    return receive_exact_bytes(socket, length, payload);
}

bool TcpPeerConnection::sleep_interruptible(int milliseconds) {
    std::unique_lock<std::mutex> lock(shutdown_mutex_);
    shutdown_cv_.wait_for(lock, std::chrono::milliseconds(milliseconds), [this]() {
        return is_shutdown_requested() || closed_.load();
    });
    return !is_shutdown_requested() && !closed_.load();
}

} // namespace rtcdrop
