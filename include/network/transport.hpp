#pragma once

#include <boost/asio/ip/udp.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace bacnet {
namespace network {

// Abstract datagram transport
// Allows dependency injection of different implementations:
// - UdpTransport: UDP sockets via boost::asio
// - FakeTransport: scripted in-memory datagrams for testing (in test/)

using Endpoint = boost::asio::ip::udp::endpoint;

// One received datagram: its length in the caller's buffer and its origin
struct Datagram {
  size_t size = 0;
  Endpoint sender;
};

// Transport - one socket bound towards one peer (unicast or broadcast)
//
// Every operation is bounded by timeout(). Failures are reported by throwing
// network::Error: ErrorKind::Timeout when nothing happened in time,
// ErrorKind::Io for socket failures. A transport is never reconnected; build
// a new one from the factory instead.
class Transport {
public:
  virtual ~Transport() = default;

  // Wait for one datagram and copy it into `buf` (truncated to `len`).
  // `buf` is not touched after read() returns or throws.
  virtual Datagram read(uint8_t *buf, size_t len) = 0;

  // Send one datagram to peer(); returns the number of bytes sent
  virtual size_t write(const uint8_t *data, size_t len) = 0;

  // Applies to subsequent read()/write() calls only
  virtual void set_timeout(std::chrono::milliseconds timeout) = 0;
  virtual std::chrono::milliseconds timeout() const = 0;

  virtual const Endpoint &peer() const = 0;
  virtual Endpoint local_endpoint() const = 0;
};

// TransportFactory - creates transports
class TransportFactory {
public:
  virtual ~TransportFactory() = default;

  // Bind an ephemeral local port for request/response traffic with `peer`
  virtual std::unique_ptr<Transport> connect(const Endpoint &peer) = 0;

  // Bind the broadcast port so that replies sent to it are received too
  virtual std::unique_ptr<Transport> connect_broadcast(const Endpoint &peer) = 0;
};

} // namespace network
} // namespace bacnet
