#pragma once

#include <string>
#include <vector>
#include <cstdint>

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")
    typedef SOCKET socket_t;
    #define INVALID_SOCKET_VALUE INVALID_SOCKET
    #define SOCKET_ERROR_VALUE SOCKET_ERROR
#else
    #include <sys/socket.h>
    #include <arpa/inet.h>
    #include <netinet/in.h>
    #include <unistd.h>
    typedef int socket_t;
    #define INVALID_SOCKET_VALUE -1
    #define SOCKET_ERROR_VALUE -1
    #define closesocket close
#endif

namespace rtcdrop {

/**
 * Remote endpoint information
 */
struct Peer {
    std::string ip;
    uint16_t port;

    Peer() : port(0) {}
    Peer(const std::string& ip, uint16_t port) : ip(ip), port(port) {}

    bool operator==(const Peer& other) const {
        return ip == other.ip && port == other.port;
    }

    bool operator!=(const Peer& other) const {
        return !(*this == other);
    }
};

/**
 * Parse "host:port" (or "[v6]:port") into a Peer
 * @return true if the string had a host part and a valid port
 */
bool parse_host_port(const std::string& address, Peer& out);

// Socket Library Initialization
/**
 * Initialize the socket library
 * @return true if successful, false otherwise
 */
bool init_socket_library();

/**
 * Cleanup the socket library
 */
void cleanup_socket_library();

// TCP Socket Functions
/**
 * Create a TCP client socket and connect to a server using IPv4
 * @param host The hostname or IP address to connect to
 * @param port The port number to connect to
 * @param timeout_ms Connection timeout in milliseconds (0 for blocking)
 * @return Socket handle, or INVALID_SOCKET_VALUE on error
 */
socket_t create_tcp_client_v4(const std::string& host, int port, int timeout_ms = 0);

/**
 * Create a TCP server socket and bind to a port using IPv4 only
 * @param port The port number to bind to (0 for an ephemeral port)
 * @param backlog The maximum number of pending connections
 * @return Socket handle, or INVALID_SOCKET_VALUE on error
 */
socket_t create_tcp_server_v4(int port, int backlog = 5);

/**
 * Accept a client connection on a server socket
 * @param server_socket The server socket handle
 * @return Client socket handle, or INVALID_SOCKET_VALUE on error
 */
socket_t accept_client(socket_t server_socket);

/**
 * Get the peer address (IP:port) from a connected socket
 * @param socket The connected socket handle
 * @return Peer address string in format "IP:port", or empty string on error
 */
std::string get_peer_address(socket_t socket);

/**
 * Send the whole buffer through a TCP socket, retrying short writes
 * @return true if every byte was written
 */
bool send_all(socket_t socket, const void* data, size_t size);

/**
 * Send string data through a TCP socket
 * @param socket The socket handle
 * @param data The string data to send
 * @return Number of bytes sent, or -1 on error
 */
int send_tcp_string(socket_t socket, const std::string& data);

/**
 * Receive whatever is available (blocking until at least one byte)
 * @param socket The socket handle
 * @param buffer Destination
 * @param buffer_size Maximum number of bytes to receive
 * @return Bytes received, 0 when the peer closed the connection, -1 on error
 */
int receive_tcp_some(socket_t socket, void* buffer, size_t buffer_size);

/**
 * Receive exact number of bytes from a TCP socket (blocking until complete)
 * @param socket The socket handle
 * @param num_bytes Number of bytes to receive
 * @param out Received binary data
 * @return true when num_bytes were read; false on error or connection close
 */
bool receive_exact_bytes(socket_t socket, size_t num_bytes, std::vector<uint8_t>& out);

/**
 * Wait until the socket is readable (or has a pending connection)
 * @param timeout_ms Maximum wait in milliseconds
 * @return 1 when readable, 0 on timeout, -1 on error
 */
int wait_for_readable(socket_t socket, int timeout_ms);

// Common Socket Functions
/**
 * Close a socket
 * @param socket The socket handle to close
 */
void close_socket(socket_t socket);

/**
 * Shut down both directions of a socket without closing the handle.
 * Wakes up threads blocked in recv/accept on it.
 */
void shutdown_socket(socket_t socket);

/**
 * Check if a socket is valid
 * @param socket The socket handle to check
 * @return true if valid, false otherwise
 */
bool is_valid_socket(socket_t socket);

/**
 * Set socket to non-blocking or blocking mode
 * @param socket The socket handle
 * @return true if successful, false otherwise
 */
bool set_socket_nonblocking(socket_t socket, bool nonblocking = true);

/**
 * Get the port that a socket is bound to
 * @param socket The socket handle
 * @return The bound port, or 0 on error
 */
int get_ephemeral_port(socket_t socket);

} // namespace rtcdrop
