// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace bacnet {
namespace network {

// What went wrong, independent of where
enum class ErrorKind {
  Timeout,  // no datagram sent/received within the transport timeout
  Io,       // socket-level failure (bind, send, receive, options)
  Codec,    // malformed, truncated, unsupported or unexpected bytes
  Rejected, // well-formed Error/Reject/Abort reply from the peer
};

const char *ToString(ErrorKind kind);

// Which BACnet PDU carried a rejection
enum class RejectionSource {
  ErrorPdu,
  RejectPdu,
  AbortPdu,
};

/**
 * BACnet-level detail of a peer rejection
 *
 * For ErrorPdu: error_class/error_code are set.
 * For RejectPdu/AbortPdu: reason is set.
 */
struct Rejection {
  RejectionSource source = RejectionSource::ErrorPdu;
  uint8_t service_choice = 0;
  uint32_t error_class = 0;
  uint32_t error_code = 0;
  uint8_t reason = 0;

  std::string describe() const;
};

/**
 * Error - the single exception type thrown by transports, the codec, the
 * client and the discovery engine
 *
 * Copyable so that discovery can forward it on its result channel.
 */
class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &message);
  explicit Error(const Rejection &rejection);

  ErrorKind kind() const { return kind_; }
  bool is_timeout() const { return kind_ == ErrorKind::Timeout; }

  // Set only for ErrorKind::Rejected
  const std::optional<Rejection> &rejection() const { return rejection_; }

private:
  ErrorKind kind_;
  std::optional<Rejection> rejection_;
};

} // namespace network
} // namespace bacnet
