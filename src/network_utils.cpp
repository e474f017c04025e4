#ifdef _WIN32
    // Include winsock2.h first to avoid conflicts with windows.h
    #ifndef WIN32_LEAN_AND_MEAN
    #define WIN32_LEAN_AND_MEAN
    #endif
    #include <winsock2.h>
    #include <ws2tcpip.h>
#else
    #include <netdb.h>
    #include <arpa/inet.h>
    #include <netinet/in.h>
    #include <ifaddrs.h>
    #include <net/if.h>
    #include <unistd.h>
#endif

#include "network_utils.h"
#include "logger.h"
#include <cstring>
#include <cerrno>
#include <algorithm>

// Network utilities module logging macros
#define LOG_NETUTILS_DEBUG(message) LOG_DEBUG("network_utils", message)
#define LOG_NETUTILS_INFO(message)  LOG_INFO("network_utils", message)
#define LOG_NETUTILS_WARN(message)  LOG_WARN("network_utils", message)
#define LOG_NETUTILS_ERROR(message) LOG_ERROR("network_utils", message)

namespace rtcdrop {
namespace network_utils {

std::string resolve_hostname(const std::string& hostname) {
    // Handle empty string
    if (hostname.empty()) {
        LOG_NETUTILS_DEBUG("Empty hostname provided");
        return "";
    }

    // Check if it's already an IP address
    if (is_valid_ipv4(hostname)) {
        return hostname;
    }

    // Resolve hostname using getaddrinfo
    struct addrinfo hints, *result;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;  // IPv4
    hints.ai_socktype = SOCK_STREAM;

    int status = getaddrinfo(hostname.c_str(), nullptr, &hints, &result);
    if (status != 0) {
#ifdef _WIN32
        LOG_NETUTILS_ERROR("Failed to resolve hostname " << hostname << ": " << WSAGetLastError());
#else
        LOG_NETUTILS_ERROR("Failed to resolve hostname " << hostname << ": " << gai_strerror(status));
#endif
        return "";
    }

    char ip_str[INET_ADDRSTRLEN];
    struct sockaddr_in* addr_in = (struct sockaddr_in*)result->ai_addr;
    inet_ntop(AF_INET, &addr_in->sin_addr, ip_str, INET_ADDRSTRLEN);

    freeaddrinfo(result);

    LOG_NETUTILS_DEBUG("Resolved " << hostname << " to " << ip_str);
    return std::string(ip_str);
}

bool is_valid_ipv4(const std::string& ip_str) {
    struct sockaddr_in sa;
    return inet_pton(AF_INET, ip_str.c_str(), &sa.sin_addr) == 1;
}

bool is_loopback_ipv4(const std::string& ip_str) {
    struct sockaddr_in sa;
    if (inet_pton(AF_INET, ip_str.c_str(), &sa.sin_addr) != 1) {
        return false;
    }
    return (ntohl(sa.sin_addr.s_addr) >> 24) == 127;
}

std::vector<std::string> get_local_interface_addresses_v4() {
    std::vector<std::string> addresses;

#ifdef _WIN32
    char host_name[256];
    if (gethostname(host_name, sizeof(host_name)) != 0) {
        LOG_NETUTILS_ERROR("gethostname failed: " << WSAGetLastError());
        return addresses;
    }

    struct addrinfo hints, *result;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    if (getaddrinfo(host_name, nullptr, &hints, &result) != 0) {
        LOG_NETUTILS_ERROR("Failed to enumerate local addresses: " << WSAGetLastError());
        return addresses;
    }

    for (struct addrinfo* it = result; it != nullptr; it = it->ai_next) {
        char ip_str[INET_ADDRSTRLEN];
        struct sockaddr_in* addr_in = (struct sockaddr_in*)it->ai_addr;
        inet_ntop(AF_INET, &addr_in->sin_addr, ip_str, INET_ADDRSTRLEN);
        std::string ip(ip_str);
        if (!is_loopback_ipv4(ip) && std::find(addresses.begin(), addresses.end(), ip) == addresses.end()) {
            addresses.push_back(ip);
        }
    }
    freeaddrinfo(result);
#else
    struct ifaddrs* interfaces = nullptr;
    if (getifaddrs(&interfaces) != 0) {
        LOG_NETUTILS_ERROR("getifaddrs failed: " << strerror(errno));
        return addresses;
    }

    for (struct ifaddrs* it = interfaces; it != nullptr; it = it->ifa_next) {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if (!(it->ifa_flags & IFF_UP) || (it->ifa_flags & IFF_LOOPBACK)) {
            continue;
        }

        char ip_str[INET_ADDRSTRLEN];
        struct sockaddr_in* addr_in = (struct sockaddr_in*)it->ifa_addr;
        inet_ntop(AF_INET, &addr_in->sin_addr, ip_str, INET_ADDRSTRLEN);
        std::string ip(ip_str);
        if (std::find(addresses.begin(), addresses.end(), ip) == addresses.end()) {
            addresses.push_back(ip);
        }
    }

    freeifaddrs(interfaces);
#endif

    LOG_NETUTILS_DEBUG("Found " << addresses.size() << " local IPv4 interface addresses");
    return addresses;
}

} // namespace network_utils
} // namespace rtcdrop
