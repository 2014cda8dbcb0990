// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/client.hpp"
#include "network/error.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include <type_traits>

namespace bacnet {
namespace network {

namespace {

[[noreturn]] void Unexpected(const std::string &what) {
  throw Error(ErrorKind::Codec, "unexpected response: " + what);
}

} // namespace

Client::Client(TransportFactory &factory, const Endpoint &peer)
    : Client(factory, peer, Config{}) {}

Client::Client(TransportFactory &factory, const Endpoint &peer, const Config &config)
    : transport_(factory.connect(peer)) {
  transport_->set_timeout(config.timeout);
}

message::DataLink Client::exchange(const message::DataLink &request) {
  std::vector<uint8_t> bytes = message::Encode(request);
  transport_->write(bytes.data(), bytes.size());

  // Stale bytes of an earlier reply must never be decoded
  buffer_.fill(0);
  Datagram datagram = transport_->read(buffer_.data(), buffer_.size());
  LOG_NET_TRACE("reply of {} bytes from {}", datagram.size,
                util::FormatEndpoint(datagram.sender));
  return message::Decode(buffer_.data(), datagram.size);
}

message::Apdu Client::confirmed(message::ConfirmedServiceRequest request) {
  const uint8_t invoke_id = next_invoke_id();
  message::DataLink frame = message::MakeConfirmedRequest(invoke_id, std::move(request));
  const uint8_t service =
      std::get<message::ConfirmedRequest>(*message::GetApdu(frame)).service_choice();

  message::DataLink reply = exchange(frame);
  if (!reply.npdu || !reply.npdu->apdu) {
    Unexpected("no APDU");
  }
  message::Apdu apdu = std::move(*reply.npdu->apdu);

  std::visit(
      [&](const auto &pdu) {
        using T = std::decay_t<decltype(pdu)>;
        if constexpr (std::is_same_v<T, message::ConfirmedRequest> ||
                      std::is_same_v<T, message::UnconfirmedRequest>) {
          Unexpected("request PDU instead of a reply");
        } else {
          if (pdu.invoke_id != invoke_id) {
            Unexpected("invoke id " + std::to_string(pdu.invoke_id) + ", expected " +
                       std::to_string(invoke_id));
          }
          Rejection rejection;
          rejection.service_choice = service;
          if constexpr (std::is_same_v<T, message::ErrorPdu>) {
            rejection.source = RejectionSource::ErrorPdu;
            rejection.error_class = pdu.error_class;
            rejection.error_code = pdu.error_code;
            throw Error(rejection);
          } else if constexpr (std::is_same_v<T, message::RejectPdu>) {
            rejection.source = RejectionSource::RejectPdu;
            rejection.reason = pdu.reason;
            throw Error(rejection);
          } else if constexpr (std::is_same_v<T, message::AbortPdu>) {
            rejection.source = RejectionSource::AbortPdu;
            rejection.reason = pdu.reason;
            throw Error(rejection);
          } else if constexpr (std::is_same_v<T, message::SimpleAck>) {
            if (pdu.service_choice != service) {
              Unexpected("acknowledgement of service " + std::to_string(pdu.service_choice));
            }
          } else {
            if (pdu.service_choice() != service) {
              Unexpected("acknowledgement of service " + std::to_string(pdu.service_choice()));
            }
          }
        }
      },
      apdu);

  return apdu;
}

message::ReadPropertyAck Client::read_property(const message::ReadProperty &request) {
  LOG_NET_DEBUG("read-property {} {} from {}", request.object_id.to_string(),
                protocol::PropertyName(request.property_id), util::FormatEndpoint(peer()));
  message::Apdu apdu = confirmed(request);
  auto *ack = std::get_if<message::ComplexAck>(&apdu);
  if (!ack) {
    Unexpected("simple acknowledgement to read-property");
  }
  auto *result = std::get_if<message::ReadPropertyAck>(&ack->service);
  if (!result) {
    Unexpected("undecodable read-property acknowledgement");
  }
  return std::move(*result);
}

message::ReadPropertyMultipleAck
Client::read_property_multiple(const message::ReadPropertyMultiple &request) {
  LOG_NET_DEBUG("read-property-multiple ({} objects) from {}", request.specifications.size(),
                util::FormatEndpoint(peer()));
  message::Apdu apdu = confirmed(request);
  auto *ack = std::get_if<message::ComplexAck>(&apdu);
  if (!ack) {
    Unexpected("simple acknowledgement to read-property-multiple");
  }
  auto *result = std::get_if<message::ReadPropertyMultipleAck>(&ack->service);
  if (!result) {
    Unexpected("undecodable read-property-multiple acknowledgement");
  }
  return std::move(*result);
}

void Client::write_property(const message::WriteProperty &request) {
  LOG_NET_DEBUG("write-property {} {} to {}", request.object_id.to_string(),
                protocol::PropertyName(request.property_id), util::FormatEndpoint(peer()));
  message::Apdu apdu = confirmed(request);
  if (!std::holds_alternative<message::SimpleAck>(apdu)) {
    Unexpected("complex acknowledgement to write-property");
  }
}

std::optional<message::IAm> Client::who_is() {
  LOG_NET_DEBUG("who-is to {}", util::FormatEndpoint(peer()));
  message::DataLink reply =
      exchange(message::MakeUnconfirmedRequest(message::WhoIs{}, false));

  const message::Apdu *apdu = message::GetApdu(reply);
  if (!apdu) {
    return std::nullopt;
  }
  auto *request = std::get_if<message::UnconfirmedRequest>(apdu);
  if (!request) {
    return std::nullopt;
  }
  if (auto *i_am = std::get_if<message::IAm>(&request->service)) {
    return *i_am;
  }
  return std::nullopt;
}

} // namespace network
} // namespace bacnet
