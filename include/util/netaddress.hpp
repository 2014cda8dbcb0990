#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate and normalize IP address strings
 - Turn "ip:port" command-line arguments into UDP endpoints

 Key functions:
 - ValidateAndNormalizeIP: Validates address format and normalizes (IPv4-mapped -> IPv4)
 - IsValidIPAddress: Quick check if address string is valid
 - ParseIPPort: Split "ip:port" / "[ipv6]:port"
 - ParseEndpoint: "ip:port" -> boost::asio::ip::udp::endpoint
*/

#include <boost/asio/ip/udp.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace bacnet {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * Wraps boost::asio::ip::make_address() and normalizes IPv4-mapped IPv6
 * addresses to IPv4 (::ffff:1.2.3.4 -> 1.2.3.4), so that I-Am senders
 * received on a dual-stack socket print the same way as configured peers.
 * Hostnames are rejected; only numeric addresses are accepted.
 *
 * Examples:
 *   "192.168.1.1" -> "192.168.1.1"
 *   "::ffff:192.168.1.1" -> "192.168.1.1"
 *   "2001:db8::1" -> "2001:db8::1"
 *   "invalid" -> std::nullopt
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

/**
 * Check if a string is a valid IP address
 */
bool IsValidIPAddress(const std::string& address);

/**
 * Parse "IP:port" string into separate IP and port components
 *
 * Supports both IPv4 and IPv6 formats:
 * - IPv4: "192.168.1.255:47808"
 * - IPv6: "[2001:db8::1]:47808"
 *
 * @return true if successfully parsed, false otherwise
 */
bool ParseIPPort(const std::string& address_port, std::string& out_ip, uint16_t& out_port);

/**
 * Parse "IP:port" into a UDP endpoint
 */
std::optional<boost::asio::ip::udp::endpoint> ParseEndpoint(const std::string& address_port);

/**
 * Format endpoint as "ip:port" ("[ip]:port" for IPv6), normalizing
 * IPv4-mapped addresses.
 */
std::string FormatEndpoint(const boost::asio::ip::udp::endpoint& endpoint);

} // namespace util
} // namespace bacnet
