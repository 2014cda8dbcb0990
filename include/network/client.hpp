// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/message.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

namespace bacnet {
namespace network {

/**
 * Client - request/response transactions against one BACnet/IP device
 *
 * Each operation encodes one request, sends it, waits for exactly one reply
 * datagram (bounded by the transport timeout) and decodes it. There are no
 * retries; every failure is thrown as network::Error:
 *   - Timeout:  no reply in time
 *   - Io:       socket failure
 *   - Codec:    undecodable reply, or a reply that does not answer the request
 *   - Rejected: the device answered with an Error, Reject or Abort PDU
 *
 * Operations must not run concurrently on one client; the decode buffer is
 * reused for every reply. Decoded values are owned copies, so results stay
 * valid across subsequent calls.
 *
 * A reply that arrives after its request timed out stays queued on the
 * socket and is read by the next operation, which then fails with a Codec
 * error. The client keeps reading one reply behind until a read times out
 * with nothing queued; construct a new Client to resynchronize immediately.
 */
class Client {
public:
  struct Config {
    std::chrono::milliseconds timeout = protocol::DEFAULT_TIMEOUT;
  };

  using Buffer = std::array<uint8_t, protocol::BUFFER_SIZE>;

  // Binds a unicast transport to `peer`; propagates transport errors
  Client(TransportFactory &factory, const Endpoint &peer);
  Client(TransportFactory &factory, const Endpoint &peer, const Config &config);

  Client(const Client &) = delete;
  Client &operator=(const Client &) = delete;

  message::ReadPropertyAck read_property(const message::ReadProperty &request);

  message::ReadPropertyMultipleAck
  read_property_multiple(const message::ReadPropertyMultiple &request);

  // Returns only on SimpleAck
  void write_property(const message::WriteProperty &request);

  // Unicast Who-Is. nullopt if the reply is not an I-Am.
  std::optional<message::IAm> who_is();

  const Endpoint &peer() const { return transport_->peer(); }

  // Escape hatches for callers that speak other services directly
  Transport &transport() { return *transport_; }
  Buffer &buffer() { return buffer_; }

private:
  // Send a confirmed request and return the matching SimpleAck/ComplexAck
  message::Apdu confirmed(message::ConfirmedServiceRequest request);

  // One request datagram out, one reply datagram in
  message::DataLink exchange(const message::DataLink &request);

  uint8_t next_invoke_id() { return invoke_id_++; }

  std::unique_ptr<Transport> transport_;
  Buffer buffer_{};
  uint8_t invoke_id_ = 0;
};

} // namespace network
} // namespace bacnet
