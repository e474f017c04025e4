#include "socket.h"
#include "network_utils.h"
#include "logger.h"
#include <cstring>
#include <cstdlib>
#ifndef _WIN32
    #include <fcntl.h>      // for O_NONBLOCK
    #include <errno.h>      // for errno
    #include <sys/select.h>
#endif

// Socket module logging macros
#define LOG_SOCKET_DEBUG(message) LOG_DEBUG("socket", message)
#define LOG_SOCKET_INFO(message)  LOG_INFO("socket", message)
#define LOG_SOCKET_WARN(message)  LOG_WARN("socket", message)
#define LOG_SOCKET_ERROR(message) LOG_ERROR("socket", message)

#if defined(_WIN32) || !defined(MSG_NOSIGNAL)
    #define RTCDROP_SEND_FLAGS 0
#else
    #define RTCDROP_SEND_FLAGS MSG_NOSIGNAL
#endif

namespace rtcdrop {

namespace {

bool connect_in_progress() {
#ifdef _WIN32
    return WSAGetLastError() == WSAEWOULDBLOCK;
#else
    return errno == EINPROGRESS;
#endif
}

bool interrupted() {
#ifdef _WIN32
    return false;
#else
    return errno == EINTR;
#endif
}

} // namespace

bool parse_host_port(const std::string& address, Peer& out) {
    std::string host;
    std::string port_str;

    if (!address.empty() && address[0] == '[') {
        size_t close = address.find(']');
        if (close == std::string::npos || close + 1 >= address.size() || address[close + 1] != ':') {
            return false;
        }
        host = address.substr(1, close - 1);
        port_str = address.substr(close + 2);
    } else {
        size_t colon = address.rfind(':');
        if (colon == std::string::npos) {
            return false;
        }
        host = address.substr(0, colon);
        port_str = address.substr(colon + 1);
    }

    if (host.empty() || port_str.empty() || port_str.size() > 5) {
        return false;
    }
    for (char c : port_str) {
        if (c < '0' || c > '9') {
            return false;
        }
    }

    int port = std::atoi(port_str.c_str());
    if (port <= 0 || port > 65535) {
        return false;
    }

    out.ip = host;
    out.port = static_cast<uint16_t>(port);
    return true;
}

// Socket Library Initialization
bool init_socket_library() {
#ifdef _WIN32
    WSADATA wsaData;
    int result = WSAStartup(MAKEWORD(2, 2), &wsaData);
    if (result != 0) {
        LOG_SOCKET_ERROR("WSAStartup failed: " << result);
        return false;
    }
    LOG_SOCKET_DEBUG("Windows Socket API initialized");
#endif
    LOG_SOCKET_DEBUG("Socket library initialized");
    return true;
}

void cleanup_socket_library() {
#ifdef _WIN32
    WSACleanup();
    LOG_SOCKET_DEBUG("Windows Socket API cleaned up");
#endif
    LOG_SOCKET_DEBUG("Socket library cleaned up");
}

// TCP Socket Functions
socket_t create_tcp_client_v4(const std::string& host, int port, int timeout_ms) {
    LOG_SOCKET_DEBUG("Creating TCP client socket for " << host << ":" << port);

    // Validate port number
    if (port <= 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port << " (must be 1-65535)");
        return INVALID_SOCKET_VALUE;
    }

    // Resolve hostname to IP address
    std::string resolved_ip = network_utils::resolve_hostname(host);
    if (resolved_ip.empty()) {
        LOG_SOCKET_ERROR("Failed to resolve hostname: " << host);
        return INVALID_SOCKET_VALUE;
    }

    sockaddr_in server_addr;
    memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_port = htons(static_cast<uint16_t>(port));

    // Convert IP address from string to binary form
    if (inet_pton(AF_INET, resolved_ip.c_str(), &server_addr.sin_addr) <= 0) {
        LOG_SOCKET_ERROR("Invalid address: " << resolved_ip);
        return INVALID_SOCKET_VALUE;
    }

    socket_t client_socket = socket(AF_INET, SOCK_STREAM, 0);
    if (client_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Failed to create client socket");
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_DEBUG("Connecting to " << resolved_ip << ":" << port);

    if (timeout_ms <= 0) {
        if (connect(client_socket, (struct sockaddr*)&server_addr, sizeof(server_addr)) == SOCKET_ERROR_VALUE) {
            LOG_SOCKET_DEBUG("Connection to " << resolved_ip << ":" << port << " failed");
            close_socket(client_socket);
            return INVALID_SOCKET_VALUE;
        }
    } else {
        if (!set_socket_nonblocking(client_socket, true)) {
            close_socket(client_socket);
            return INVALID_SOCKET_VALUE;
        }

        int result = connect(client_socket, (struct sockaddr*)&server_addr, sizeof(server_addr));
        if (result == SOCKET_ERROR_VALUE) {
            if (!connect_in_progress()) {
                LOG_SOCKET_DEBUG("Connection to " << resolved_ip << ":" << port << " failed immediately");
                close_socket(client_socket);
                return INVALID_SOCKET_VALUE;
            }

            fd_set write_set;
            FD_ZERO(&write_set);
            FD_SET(client_socket, &write_set);
            timeval tv;
            tv.tv_sec = timeout_ms / 1000;
            tv.tv_usec = (timeout_ms % 1000) * 1000;

            result = select(static_cast<int>(client_socket) + 1, nullptr, &write_set, nullptr, &tv);
            if (result <= 0) {
                LOG_SOCKET_DEBUG("Connection to " << resolved_ip << ":" << port << " timed out after " << timeout_ms << "ms");
                close_socket(client_socket);
                return INVALID_SOCKET_VALUE;
            }

            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (getsockopt(client_socket, SOL_SOCKET, SO_ERROR, (char*)&so_error, &len) == SOCKET_ERROR_VALUE ||
                so_error != 0) {
                LOG_SOCKET_DEBUG("Connection to " << resolved_ip << ":" << port << " refused (error " << so_error << ")");
                close_socket(client_socket);
                return INVALID_SOCKET_VALUE;
            }
        }

        if (!set_socket_nonblocking(client_socket, false)) {
            close_socket(client_socket);
            return INVALID_SOCKET_VALUE;
        }
    }

    LOG_SOCKET_DEBUG("Successfully connected to " << resolved_ip << ":" << port);
    return client_socket;
}

socket_t create_tcp_server_v4(int port, int backlog) {
    LOG_SOCKET_DEBUG("Creating TCP server socket on port " << port);

    // Validate port number
    if (port < 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port << " (must be 0-65535)");
        return INVALID_SOCKET_VALUE;
    }

    socket_t server_socket = socket(AF_INET, SOCK_STREAM, 0);
    if (server_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Failed to create server socket");
        return INVALID_SOCKET_VALUE;
    }

    // Set socket option to reuse address
    int opt = 1;
    if (setsockopt(server_socket, SOL_SOCKET, SO_REUSEADDR,
                   (char*)&opt, sizeof(opt)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to set socket options");
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    sockaddr_in server_addr;
    memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_addr.s_addr = INADDR_ANY;
    server_addr.sin_port = htons(static_cast<uint16_t>(port));

    // Bind socket to address
    if (bind(server_socket, (struct sockaddr*)&server_addr, sizeof(server_addr)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to bind server socket to port " << port);
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    // Listen for connections
    if (listen(server_socket, backlog) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to listen on server socket");
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_DEBUG("Server listening on port " << get_ephemeral_port(server_socket) << " (backlog: " << backlog << ")");
    return server_socket;
}

socket_t accept_client(socket_t server_socket) {
    sockaddr_storage client_addr;
    socklen_t client_addr_len = sizeof(client_addr);

    socket_t client_socket = accept(server_socket, (struct sockaddr*)&client_addr, &client_addr_len);
    if (client_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_DEBUG("Failed to accept client connection");
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_DEBUG("Client connected from " << get_peer_address(client_socket));
    return client_socket;
}

std::string get_peer_address(socket_t socket) {
    sockaddr_storage peer_addr;
    socklen_t peer_addr_len = sizeof(peer_addr);

    if (getpeername(socket, (struct sockaddr*)&peer_addr, &peer_addr_len) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_DEBUG("Failed to get peer address for socket " << socket);
        return "";
    }

    std::string peer_ip;
    uint16_t peer_port = 0;

    if (peer_addr.ss_family == AF_INET) {
        char ip_str[INET_ADDRSTRLEN];
        struct sockaddr_in* addr_in = (struct sockaddr_in*)&peer_addr;
        inet_ntop(AF_INET, &addr_in->sin_addr, ip_str, INET_ADDRSTRLEN);
        peer_ip = ip_str;
        peer_port = ntohs(addr_in->sin_port);
    } else if (peer_addr.ss_family == AF_INET6) {
        char ip_str[INET6_ADDRSTRLEN];
        struct sockaddr_in6* addr_in6 = (struct sockaddr_in6*)&peer_addr;
        inet_ntop(AF_INET6, &addr_in6->sin6_addr, ip_str, INET6_ADDRSTRLEN);
        peer_ip = ip_str;
        peer_port = ntohs(addr_in6->sin6_port);
    } else {
        LOG_SOCKET_ERROR("Unknown address family for socket " << socket);
        return "";
    }

    return peer_ip + ":" + std::to_string(peer_port);
}

bool send_all(socket_t socket, const void* data, size_t size) {
    const char* cursor = static_cast<const char*>(data);
    size_t remaining = size;

    while (remaining > 0) {
        int sent = send(socket, cursor, static_cast<int>(remaining), RTCDROP_SEND_FLAGS);
        if (sent == SOCKET_ERROR_VALUE) {
            if (interrupted()) {
                continue;
            }
            LOG_SOCKET_DEBUG("Failed to send " << remaining << " bytes to socket " << socket);
            return false;
        }
        cursor += sent;
        remaining -= static_cast<size_t>(sent);
    }

    return true;
}

int send_tcp_string(socket_t socket, const std::string& data) {
    if (!send_all(socket, data.data(), data.size())) {
        return -1;
    }
    return static_cast<int>(data.size());
}

int receive_tcp_some(socket_t socket, void* buffer, size_t buffer_size) {
    while (true) {
        int bytes_received = recv(socket, static_cast<char*>(buffer), static_cast<int>(buffer_size), 0);
        if (bytes_received == SOCKET_ERROR_VALUE) {
            if (interrupted()) {
                continue;
            }
            return -1;
        }
        return bytes_received;
    }
}

bool receive_exact_bytes(socket_t socket, size_t num_bytes, std::vector<uint8_t>& out) {
    out.resize(num_bytes);
    size_t received = 0;

    while (received < num_bytes) {
        int n = receive_tcp_some(socket, out.data() + received, num_bytes - received);
        if (n <= 0) {
            out.resize(received);
            return false;
        }
        received += static_cast<size_t>(n);
    }

    return true;
}

int wait_for_readable(socket_t socket, int timeout_ms) {
    if (!is_valid_socket(socket)) {
        return -1;
    }

    fd_set read_set;
    FD_ZERO(&read_set);
    FD_SET(socket, &read_set);
    timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;

    int result = select(static_cast<int>(socket) + 1, &read_set, nullptr, nullptr, &tv);
    if (result < 0) {
        return interrupted() ? 0 : -1;
    }
    return result > 0 ? 1 : 0;
}

// Common Socket Functions
void close_socket(socket_t socket) {
    if (is_valid_socket(socket)) {
        LOG_SOCKET_DEBUG("Closing socket " << socket);
        closesocket(socket);
    }
}

void shutdown_socket(socket_t socket) {
    if (!is_valid_socket(socket)) {
        return;
    }
#ifdef _WIN32
    shutdown(socket, SD_BOTH);
#else
    shutdown(socket, SHUT_RDWR);
#endif
}

bool is_valid_socket(socket_t socket) {
    return socket != INVALID_SOCKET_VALUE;
}

bool set_socket_nonblocking(socket_t socket, bool nonblocking) {
#ifdef _WIN32
    unsigned long mode = nonblocking ? 1 : 0;
    if (ioctlsocket(socket, FIONBIO, &mode) != 0) {
        LOG_SOCKET_ERROR("Failed to change socket blocking mode");
        return false;
    }
#else
    int flags = fcntl(socket, F_GETFL, 0);
    if (flags == -1) {
        LOG_SOCKET_ERROR("Failed to get socket flags");
        return false;
    }

    flags = nonblocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (fcntl(socket, F_SETFL, flags) == -1) {
        LOG_SOCKET_ERROR("Failed to change socket blocking mode");
        return false;
    }
#endif

    return true;
}

int get_ephemeral_port(socket_t socket) {
    sockaddr_storage addr;
    socklen_t addr_len = sizeof(addr);

    if (getsockname(socket, (struct sockaddr*)&addr, &addr_len) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to get socket name for socket " << socket);
        return 0;
    }

    if (addr.ss_family == AF_INET) {
        return ntohs(((sockaddr_in*)&addr)->sin_port);
    } else if (addr.ss_family == AF_INET6) {
        return ntohs(((sockaddr_in6*)&addr)->sin6_port);
    }
    return 0;
}

} // namespace rtcdrop
