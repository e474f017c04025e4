#include "tcp_stream_host.h"
#include "logger.h"
#include <algorithm>
#include <chrono>

// Stream host module logging macros
#define LOG_HOST_DEBUG(message) LOG_DEBUG("stream_host", message)
#define LOG_HOST_INFO(message)  LOG_INFO("stream_host", message)
#define LOG_HOST_WARN(message)  LOG_WARN("stream_host", message)
#define LOG_HOST_ERROR(message) LOG_ERROR("stream_host", message)

namespace rtcdrop {

namespace {

const int PREAMBLE_TIMEOUT_MS = 10000;
const int DEFAULT_CONNECT_TIMEOUT_MS = 5000;

std::string strip_carriage_return(const std::string& line) {
    if (!line.empty() && line[line.size() - 1] == '\r') {
        return line.substr(0, line.size() - 1);
    }
    return line;
}

} // anonymous namespace

//=============================================================================
// StreamSocket
//=============================================================================

StreamSocket::StreamSocket(socket_t socket) : socket_(socket), closed_(false) {}

StreamSocket::~StreamSocket() {
    close();
}

void StreamSocket::interrupt() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_) {
        shutdown_socket(socket_);
    }
}

void StreamSocket::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_) {
        shutdown_socket(socket_);
        close_socket(socket_);
        closed_ = true;
    }
}

bool StreamSocket::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

//=============================================================================
// TcpSignalingStream
//=============================================================================

TcpSignalingStream::TcpSignalingStream(std::shared_ptr<StreamSocket> socket, const std::string& remote_peer_id)
    : socket_(std::move(socket)), remote_peer_id_(remote_peer_id), read_timeout_ms_(0) {
}

TcpSignalingStream::~TcpSignalingStream() {
    close();
}

StreamReadStatus TcpSignalingStream::read_line(std::string& line, std::string* error) {
    char buffer[4096];
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(read_timeout_ms_);

    while (true) {
        size_t newline = read_buffer_.find('\n');
        if (newline != std::string::npos) {
            line = read_buffer_.substr(0, newline);
            read_buffer_.erase(0, newline + 1);
            return StreamReadStatus::OK;
        }

        if (read_buffer_.size() > MAX_LINE_LENGTH) {
            if (error) *error = "line exceeds " + std::to_string(MAX_LINE_LENGTH) + " bytes";
            return StreamReadStatus::ERROR;
        }
        if (socket_->is_closed()) {
            if (error) *error = "stream is closed";
            return StreamReadStatus::ERROR;
        }

        if (read_timeout_ms_ > 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            int ready = remaining > 0 ? wait_for_readable(socket_->get(), static_cast<int>(remaining)) : 0;
            if (ready == 0) {
                if (error) *error = "no line within " + std::to_string(read_timeout_ms_) + "ms";
                return StreamReadStatus::TIMED_OUT;
            }
            if (ready < 0) {
                if (error) *error = "failed to wait for stream data";
                return StreamReadStatus::ERROR;
            }
        }

        int received = receive_tcp_some(socket_->get(), buffer, sizeof(buffer));
        if (received == 0) {
            if (!read_buffer_.empty()) {
                if (error) *error = "stream ended in the middle of a line";
                return StreamReadStatus::ERROR;
            }
            return StreamReadStatus::END_OF_STREAM;
        }
        if (received < 0) {
            if (error) *error = "failed to read from stream";
            return StreamReadStatus::ERROR;
        }
        read_buffer_.append(buffer, static_cast<size_t>(received));
    }
}

bool TcpSignalingStream::write(const std::string& data) {
    if (socket_->is_closed()) {
        return false;
    }
    write_buffer_ += data;
    return true;
}

bool TcpSignalingStream::flush() {
    if (write_buffer_.empty()) {
        return true;
    }
    if (socket_->is_closed()) {
        return false;
    }
    bool ok = send_all(socket_->get(), write_buffer_.data(), write_buffer_.size());
    write_buffer_.clear();
    return ok;
}

void TcpSignalingStream::close() {
    socket_->close();
}

std::string TcpSignalingStream::remote_peer_id() const {
    return remote_peer_id_;
}

//=============================================================================
// TcpStreamHost
//=============================================================================

TcpStreamHost::TcpStreamHost(const std::string& local_peer_id, int listen_port)
    : local_peer_id_(local_peer_id),
      requested_port_(listen_port),
      listen_port_(0),
      listen_socket_(INVALID_SOCKET_VALUE),
      running_(false),
      connect_timeout_ms_(DEFAULT_CONNECT_TIMEOUT_MS) {
}

TcpStreamHost::~TcpStreamHost() {
    stop();
}

bool TcpStreamHost::start() {
    if (running_.load()) {
        LOG_HOST_WARN("Stream host is already running");
        return true;
    }

    if (!init_socket_library()) {
        LOG_HOST_ERROR("Failed to initialize socket library");
        return false;
    }

    socket_t server = create_tcp_server_v4(requested_port_);
    if (!is_valid_socket(server)) {
        LOG_HOST_ERROR("Failed to listen on port " << requested_port_);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(listen_mutex_);
        listen_socket_ = server;
        listen_port_ = get_ephemeral_port(server);
    }

    reset_shutdown_flag();
    running_.store(true);
    if (!start_managed_thread("stream-accept", [this]() { accept_loop(); })) {
        running_.store(false);
        std::lock_guard<std::mutex> lock(listen_mutex_);
        close_socket(listen_socket_);
        listen_socket_ = INVALID_SOCKET_VALUE;
        return false;
    }

    LOG_HOST_INFO("Listening for peers on port " << get_listen_port() << " as " << local_peer_id_);
    return true;
}

void TcpStreamHost::stop() {
    bool was_running = running_.exchange(false);

    {
        std::lock_guard<std::mutex> lock(listen_mutex_);
        shutdown_socket(listen_socket_);
    }

    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        for (auto& weak : open_streams_) {
            if (auto socket = weak.lock()) {
                socket->interrupt();
            }
        }
        open_streams_.clear();
    }

    shutdown_all_threads();
    join_all_active_threads();

    {
        std::lock_guard<std::mutex> lock(listen_mutex_);
        if (is_valid_socket(listen_socket_)) {
            close_socket(listen_socket_);
            listen_socket_ = INVALID_SOCKET_VALUE;
        }
    }

    if (was_running) {
        LOG_HOST_INFO("Stream host stopped");
    }
}

int TcpStreamHost::get_listen_port() const {
    std::lock_guard<std::mutex> lock(listen_mutex_);
    return listen_port_;
}

void TcpStreamHost::add_peer_address(const std::string& peer_id, const std::string& address) {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    peer_addresses_[peer_id] = address;
    LOG_HOST_DEBUG("Peer " << peer_id << " reachable at " << address);
}

bool TcpStreamHost::remove_peer_address(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    return peer_addresses_.erase(peer_id) > 0;
}

std::string TcpStreamHost::lookup_peer_address(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    auto it = peer_addresses_.find(peer_id);
    return it != peer_addresses_.end() ? it->second : "";
}

std::unordered_map<std::string, std::string> TcpStreamHost::get_known_peers() const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    return peer_addresses_;
}

std::string TcpStreamHost::local_peer_id() const {
    return local_peer_id_;
}

void TcpStreamHost::set_stream_handler(const std::string& protocol_id, StreamHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_[protocol_id] = std::move(handler);
}

std::unique_ptr<SignalingStream> TcpStreamHost::open_stream(const std::string& peer_id,
                                                            const std::string& protocol_id) {
    std::string address = lookup_peer_address(peer_id);
    if (address.empty()) {
        LOG_HOST_WARN("No known address for peer " << peer_id);
        return nullptr;
    }

    Peer endpoint;
    if (!parse_host_port(address, endpoint)) {
        LOG_HOST_ERROR("Invalid address for peer " << peer_id << ": " << address);
        return nullptr;
    }

    int timeout_ms = connect_timeout_ms_.load();
    socket_t socket = create_tcp_client_v4(endpoint.ip, endpoint.port, timeout_ms);
    if (!is_valid_socket(socket)) {
        LOG_HOST_WARN("Failed to connect to peer " << peer_id << " at " << address);
        return nullptr;
    }

    auto handle = std::make_shared<StreamSocket>(socket);
    track_stream(handle);
    auto stream = std::make_unique<TcpSignalingStream>(handle, peer_id);

    if (!stream->write(protocol_id + " " + local_peer_id_ + "\n") || !stream->flush()) {
        LOG_HOST_WARN("Failed to send stream preamble to peer " << peer_id);
        return nullptr;
    }

    if (wait_for_readable(socket, timeout_ms) != 1) {
        LOG_HOST_WARN("Peer " << peer_id << " did not answer the stream preamble");
        return nullptr;
    }

    std::string line, error;
    if (stream->read_line(line, &error) != StreamReadStatus::OK) {
        LOG_HOST_WARN("Failed to read protocol confirmation from peer " << peer_id
                      << (error.empty() ? "" : ": " + error));
        return nullptr;
    }

    line = strip_carriage_return(line);
    if (line == PROTOCOL_NOT_AVAILABLE) {
        LOG_HOST_WARN("Peer " << peer_id << " does not support protocol " << protocol_id);
        return nullptr;
    }
    if (line != protocol_id) {
        LOG_HOST_WARN("Peer " << peer_id << " confirmed unexpected protocol '" << line << "'");
        return nullptr;
    }

    LOG_HOST_DEBUG("Opened " << protocol_id << " stream to peer " << peer_id);
    return stream;
}

void TcpStreamHost::accept_loop() {
    LOG_HOST_DEBUG("Accept loop started");

    while (running_.load() && !is_shutdown_requested()) {
        socket_t server;
        {
            std::lock_guard<std::mutex> lock(listen_mutex_);
            server = listen_socket_;
        }

        int ready = wait_for_readable(server, 100);
        if (ready < 0) {
            if (running_.load()) {
                LOG_HOST_ERROR("Listening socket failed");
            }
            break;
        }
        if (ready == 0) {
            continue;
        }

        socket_t client = accept_client(server);
        if (!is_valid_socket(client)) {
            continue;
        }

        std::string address = get_peer_address(client);
        auto handle = std::make_shared<StreamSocket>(client);
        track_stream(handle);

        if (!start_managed_thread("stream-" + address, [this, handle, address]() {
                handle_inbound_connection(handle, address);
            })) {
            handle->close();
        }
    }

    LOG_HOST_DEBUG("Accept loop stopped");
}

void TcpStreamHost::handle_inbound_connection(std::shared_ptr<StreamSocket> socket, const std::string& address) {
    if (wait_for_readable(socket->get(), PREAMBLE_TIMEOUT_MS) != 1) {
        LOG_HOST_WARN("No stream preamble from " << address);
        socket->close();
        return;
    }

    auto stream = std::make_unique<TcpSignalingStream>(socket, "");
    std::string line, error;
    if (stream->read_line(line, &error) != StreamReadStatus::OK) {
        LOG_HOST_WARN("Failed to read stream preamble from " << address
                      << (error.empty() ? "" : ": " + error));
        return;
    }

    line = strip_carriage_return(line);
    size_t space = line.find(' ');
    std::string protocol_id = line.substr(0, space);
    std::string peer_id = space == std::string::npos ? "" : line.substr(space + 1);

    StreamHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        auto it = handlers_.find(protocol_id);
        if (it != handlers_.end()) {
            handler = it->second;
        }
    }

    if (!handler || peer_id.empty()) {
        LOG_HOST_WARN("Rejecting stream from " << address << " for protocol '" << protocol_id << "'");
        if (!stream->write(std::string(PROTOCOL_NOT_AVAILABLE) + "\n") || !stream->flush()) {
            LOG_HOST_DEBUG("Failed to send protocol rejection to " << address);
        }
        return;
    }

    stream->set_remote_peer_id(peer_id);
    if (!stream->write(protocol_id + "\n") || !stream->flush()) {
        LOG_HOST_WARN("Failed to confirm protocol to " << address);
        return;
    }

    LOG_HOST_INFO("Accepted " << protocol_id << " stream from peer " << peer_id << " (" << address << ")");
    handler(std::move(stream));
}

void TcpStreamHost::track_stream(const std::shared_ptr<StreamSocket>& socket) {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    open_streams_.erase(std::remove_if(open_streams_.begin(), open_streams_.end(),
                                       [](const std::weak_ptr<StreamSocket>& weak) { return weak.expired(); }),
                        open_streams_.end());
    open_streams_.push_back(socket);
}

} // namespace rtcdrop
