#pragma once

#include "network/protocol.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace bacnet {
namespace message {

// ============================================================================
// Primitive data
// ============================================================================

struct ObjectId {
  uint16_t type = 0;
  uint32_t instance = 0;

  ObjectId() = default;
  ObjectId(uint16_t t, uint32_t i) : type(t), instance(i) {}
  ObjectId(protocol::ObjectType t, uint32_t i) : type(static_cast<uint16_t>(t)), instance(i) {}

  // 10-bit type, 22-bit instance
  uint32_t raw() const { return (static_cast<uint32_t>(type) << 22) | (instance & protocol::MAX_OBJECT_INSTANCE); }
  static ObjectId from_raw(uint32_t raw) {
    return ObjectId(static_cast<uint16_t>(raw >> 22), raw & protocol::MAX_OBJECT_INSTANCE);
  }

  std::string to_string() const;

  bool operator==(const ObjectId &) const = default;
};

struct Null {
  bool operator==(const Null &) const = default;
};

struct Enumerated {
  uint32_t value = 0;
  bool operator==(const Enumerated &) const = default;
};

// 0xFF in any field means "unspecified"
struct Date {
  uint8_t year_since_1900 = 0xFF;
  uint8_t month = 0xFF;
  uint8_t day = 0xFF;
  uint8_t weekday = 0xFF; // 1 = Monday
  bool operator==(const Date &) const = default;
};

struct Time {
  uint8_t hour = 0xFF;
  uint8_t minute = 0xFF;
  uint8_t second = 0xFF;
  uint8_t hundredths = 0xFF;
  bool operator==(const Time &) const = default;
};

struct BitString {
  uint8_t unused_bits = 0;
  std::vector<uint8_t> bytes;

  size_t size() const { return bytes.size() * 8 - (bytes.empty() ? 0 : unused_bits); }
  // Bit 0 is the most significant bit of the first octet
  bool test(size_t bit) const { return (bytes.at(bit / 8) >> (7 - bit % 8)) & 1; }

  bool operator==(const BitString &) const = default;
};

using OctetString = std::vector<uint8_t>;

// Application-tagged value. Alternative order follows the tag numbers.
using ApplicationDataValue =
    std::variant<Null, bool, uint32_t, int32_t, float, double, OctetString,
                 std::string, BitString, Enumerated, Date, Time, ObjectId>;

std::string FormatValue(const ApplicationDataValue &value);

// ============================================================================
// Service requests
// ============================================================================

struct ReadProperty {
  ObjectId object_id;
  uint32_t property_id = static_cast<uint32_t>(protocol::PropertyId::PresentValue);
  std::optional<uint32_t> array_index;

  bool operator==(const ReadProperty &) const = default;
};

struct PropertyReference {
  uint32_t property_id = 0;
  std::optional<uint32_t> array_index;

  bool operator==(const PropertyReference &) const = default;
};

struct ReadAccessSpecification {
  ObjectId object_id;
  std::vector<PropertyReference> properties;

  bool operator==(const ReadAccessSpecification &) const = default;
};

struct ReadPropertyMultiple {
  std::vector<ReadAccessSpecification> specifications;

  bool operator==(const ReadPropertyMultiple &) const = default;
};

struct WriteProperty {
  ObjectId object_id;
  uint32_t property_id = static_cast<uint32_t>(protocol::PropertyId::PresentValue);
  std::optional<uint32_t> array_index;
  // A single value for scalar properties; Null relinquishes a priority slot
  std::vector<ApplicationDataValue> values;
  std::optional<uint8_t> priority; // 1..16

  bool operator==(const WriteProperty &) const = default;
};

struct WhoIs {
  // Either both limits or neither
  std::optional<uint32_t> low_limit;
  std::optional<uint32_t> high_limit;

  bool operator==(const WhoIs &) const = default;
};

struct IAm {
  ObjectId device_id;
  uint32_t max_apdu_length = 0;
  protocol::Segmentation segmentation = protocol::Segmentation::None;
  uint16_t vendor_id = 0;

  bool operator==(const IAm &) const = default;
};

// Service the codec does not interpret; the raw service data is kept
struct UnknownService {
  uint8_t service_choice = 0;
  std::vector<uint8_t> data;

  bool operator==(const UnknownService &) const = default;
};

// ============================================================================
// Service acknowledgements
// ============================================================================

struct ReadPropertyAck {
  ObjectId object_id;
  uint32_t property_id = 0;
  std::optional<uint32_t> array_index;
  std::vector<ApplicationDataValue> values;

  bool operator==(const ReadPropertyAck &) const = default;
};

struct PropertyAccessError {
  uint32_t error_class = 0;
  uint32_t error_code = 0;

  bool operator==(const PropertyAccessError &) const = default;
};

struct PropertyResult {
  uint32_t property_id = 0;
  std::optional<uint32_t> array_index;
  std::vector<ApplicationDataValue> values; // empty when `error` is set
  std::optional<PropertyAccessError> error;

  bool operator==(const PropertyResult &) const = default;
};

struct ReadAccessResult {
  ObjectId object_id;
  std::vector<PropertyResult> results;

  bool operator==(const ReadAccessResult &) const = default;
};

struct ReadPropertyMultipleAck {
  std::vector<ReadAccessResult> results;

  bool operator==(const ReadPropertyMultipleAck &) const = default;
};

// ============================================================================
// APDU
// ============================================================================

using ConfirmedServiceRequest =
    std::variant<ReadProperty, ReadPropertyMultiple, WriteProperty, UnknownService>;
using UnconfirmedServiceRequest = std::variant<IAm, WhoIs, UnknownService>;
using ComplexAckService =
    std::variant<ReadPropertyAck, ReadPropertyMultipleAck, UnknownService>;

struct ConfirmedRequest {
  uint8_t invoke_id = 0;
  uint8_t max_apdu_code = protocol::apdu::MAX_APDU_CODE_1476;
  ConfirmedServiceRequest service;

  uint8_t service_choice() const;
};

struct UnconfirmedRequest {
  UnconfirmedServiceRequest service;

  uint8_t service_choice() const;
};

struct SimpleAck {
  uint8_t invoke_id = 0;
  uint8_t service_choice = 0;
};

struct ComplexAck {
  uint8_t invoke_id = 0;
  ComplexAckService service;

  uint8_t service_choice() const;
};

struct ErrorPdu {
  uint8_t invoke_id = 0;
  uint8_t service_choice = 0;
  uint32_t error_class = 0;
  uint32_t error_code = 0;
};

struct RejectPdu {
  uint8_t invoke_id = 0;
  uint8_t reason = 0;
};

struct AbortPdu {
  uint8_t invoke_id = 0;
  uint8_t reason = 0;
  bool from_server = false;
};

using Apdu = std::variant<ConfirmedRequest, UnconfirmedRequest, SimpleAck,
                          ComplexAck, ErrorPdu, RejectPdu, AbortPdu>;

// ============================================================================
// NPDU / BVLC
// ============================================================================

struct NetworkAddress {
  uint16_t network = 0;
  std::vector<uint8_t> mac; // empty = broadcast on `network`

  bool operator==(const NetworkAddress &) const = default;
};

struct NetworkPdu {
  protocol::npdu::MessagePriority priority = protocol::npdu::MessagePriority::Normal;
  bool expecting_reply = false;
  std::optional<NetworkAddress> destination;
  std::optional<NetworkAddress> source;
  uint8_t hop_count = protocol::npdu::DEFAULT_HOP_COUNT;
  // Network layer messages carry no APDU
  std::optional<uint8_t> network_message_type;
  std::optional<Apdu> apdu;
};

struct DataLink {
  protocol::bvlc::Function function = protocol::bvlc::Function::OriginalUnicastNpdu;
  std::optional<NetworkPdu> npdu;
};

// ============================================================================
// Codec entry points
// ============================================================================

/**
 * Encode a complete B/IP frame
 * @throws network::Error (Codec) for values that cannot be encoded, e.g. a
 * priority outside 1..16 or an APDU longer than MAX_APDU_LENGTH
 */
std::vector<uint8_t> Encode(const DataLink &frame);

/**
 * Decode one datagram
 *
 * Every returned value owns its data; nothing refers back into `data`.
 * @throws network::Error (Codec) on malformed, truncated or segmented input
 */
DataLink Decode(const uint8_t *data, size_t size);

// Frame builders for the requests this library issues
DataLink MakeConfirmedRequest(uint8_t invoke_id, ConfirmedServiceRequest request);
DataLink MakeUnconfirmedRequest(UnconfirmedServiceRequest request, bool broadcast);
// Builders for replies, used by simulated devices
DataLink MakeReply(Apdu apdu);

// Shortcut to the APDU of a decoded frame (nullptr if there is none)
const Apdu *GetApdu(const DataLink &frame);

} // namespace message
} // namespace bacnet
