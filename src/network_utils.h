#pragma once

#include <string>
#include <vector>

namespace rtcdrop {
namespace network_utils {

/**
 * Resolve hostname to IPv4 address
 * @param hostname The hostname to resolve (can be hostname or IP address)
 * @return IP address string, or empty string on error
 *
 * Example usage:
 *   std::string ip = network_utils::resolve_hostname("localhost");
 *   std::string ip2 = network_utils::resolve_hostname("192.168.1.1"); // returns same IP
 */
std::string resolve_hostname(const std::string& hostname);

/**
 * Check if a string is a valid IPv4 address
 * @param ip_str The string to validate
 * @return true if valid IPv4 address, false otherwise
 */
bool is_valid_ipv4(const std::string& ip_str);

/**
 * Check if an IPv4 address is in 127.0.0.0/8
 */
bool is_loopback_ipv4(const std::string& ip_str);

/**
 * Get all local IPv4 network interface addresses (loopback excluded)
 * @return Vector of local IPv4 addresses from interfaces that are up
 *
 * Example usage:
 *   auto local_ipv4s = network_utils::get_local_interface_addresses_v4();
 *   for (const auto& ip : local_ipv4s) {
 *       std::cout << "Local IPv4: " << ip << std::endl;
 *   }
 */
std::vector<std::string> get_local_interface_addresses_v4();

} // namespace network_utils
} // namespace rtcdrop
