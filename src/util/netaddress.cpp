#include "util/netaddress.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <boost/asio/ip/address.hpp>

namespace bacnet {
namespace util {

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  try {
    boost::system::error_code ec;
    auto ip = boost::asio::ip::make_address(address, ec);
    if (ec) {
      return std::nullopt;
    }

    // Example: ::ffff:192.168.1.1 -> 192.168.1.1
    if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
      auto v4 = boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, ip.to_v6());
      return v4.to_string();
    }

    return ip.to_string();

  } catch (const std::exception& e) {
    LOG_TRACE("ValidateAndNormalizeIP: exception parsing address '{}': {}", address, e.what());
    return std::nullopt;
  }
}

bool IsValidIPAddress(const std::string& address) {
  return ValidateAndNormalizeIP(address).has_value();
}

bool ParseIPPort(const std::string& address_port, std::string& out_ip, uint16_t& out_port) {
  if (address_port.empty()) {
    return false;
  }

  std::string ip;
  std::string port_str;

  // IPv6 format: "[IPv6]:port"
  if (address_port[0] == '[') {
    size_t bracket_end = address_port.find(']');
    if (bracket_end == std::string::npos || bracket_end < 2) {
      return false;
    }
    if (bracket_end + 1 >= address_port.length() || address_port[bracket_end + 1] != ':') {
      return false; // Missing :port
    }
    ip = address_port.substr(1, bracket_end - 1);
    port_str = address_port.substr(bracket_end + 2);
  } else {
    size_t first_colon = address_port.find(':');
    if (first_colon == std::string::npos) {
      return false; // Missing port
    }
    // Multiple colons: IPv6 without brackets, which is ambiguous
    if (address_port.find(':', first_colon + 1) != std::string::npos) {
      return false;
    }
    ip = address_port.substr(0, first_colon);
    port_str = address_port.substr(first_colon + 1);
  }

  auto port = SafeParsePort(port_str);
  if (!port) {
    return false;
  }
  auto normalized = ValidateAndNormalizeIP(ip);
  if (!normalized) {
    return false;
  }

  out_ip = *normalized;
  out_port = *port;
  return true;
}

std::optional<boost::asio::ip::udp::endpoint> ParseEndpoint(const std::string& address_port) {
  std::string ip;
  uint16_t port = 0;
  if (!ParseIPPort(address_port, ip, port)) {
    return std::nullopt;
  }
  boost::system::error_code ec;
  auto address = boost::asio::ip::make_address(ip, ec);
  if (ec) {
    return std::nullopt;
  }
  return boost::asio::ip::udp::endpoint(address, port);
}

std::string FormatEndpoint(const boost::asio::ip::udp::endpoint& endpoint) {
  auto address = endpoint.address();
  if (address.is_v6() && address.to_v6().is_v4_mapped()) {
    address = boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, address.to_v6());
  }
  if (address.is_v6()) {
    return "[" + address.to_string() + "]:" + std::to_string(endpoint.port());
  }
  return address.to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace util
} // namespace bacnet
