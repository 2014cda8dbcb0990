// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/error.hpp"
#include "network/protocol.hpp"
#include <sstream>

namespace bacnet {
namespace network {

const char *ToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Timeout:
    return "timeout";
  case ErrorKind::Io:
    return "io";
  case ErrorKind::Codec:
    return "codec";
  case ErrorKind::Rejected:
    return "rejected";
  }
  return "unknown";
}

std::string Rejection::describe() const {
  std::ostringstream oss;
  switch (source) {
  case RejectionSource::ErrorPdu:
    oss << "error (class: " << protocol::ErrorClassName(error_class)
        << ", code: " << error_code << ")";
    break;
  case RejectionSource::RejectPdu:
    oss << "reject (reason: " << protocol::RejectReasonName(reason) << ")";
    break;
  case RejectionSource::AbortPdu:
    oss << "abort (reason: " << protocol::AbortReasonName(reason) << ")";
    break;
  }
  return oss.str();
}

Error::Error(ErrorKind kind, const std::string &message)
    : std::runtime_error(message), kind_(kind) {}

Error::Error(const Rejection &rejection)
    : std::runtime_error("request rejected by peer: " + rejection.describe()),
      kind_(ErrorKind::Rejected), rejection_(rejection) {}

} // namespace network
} // namespace bacnet
