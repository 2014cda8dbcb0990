#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace bacnet {
namespace protocol {

// BACnet/IP well-known UDP port (0xBAC0)
constexpr uint16_t BACNET_IP_PORT = 47808;

// Decode buffer size: one Ethernet MTU worth of payload
constexpr size_t BUFFER_SIZE = 1500;

// Largest APDU that fits a B/IP frame (ASHRAE 135 Annex J)
constexpr size_t MAX_APDU_LENGTH = 1476;

// ============================================================================
// Timing and capacity defaults
// ============================================================================

constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{std::chrono::seconds(5)};
constexpr std::chrono::milliseconds DISCOVERY_SEND_TIMEOUT{std::chrono::seconds(5)};
// Sliding inactivity window: discovery ends once no datagram arrived for this long
constexpr std::chrono::milliseconds DISCOVERY_WINDOW{std::chrono::seconds(120)};
constexpr size_t DISCOVERY_CHANNEL_CAPACITY = 1000;

// ============================================================================
// BVLC (Annex J)
// ============================================================================
namespace bvlc {
constexpr uint8_t TYPE_BACNET_IP = 0x81;
constexpr size_t HEADER_SIZE = 4;
// Forwarded-NPDU carries the originating B/IP address (4 octets IP + 2 port)
constexpr size_t FORWARDED_ADDRESS_SIZE = 6;

enum class Function : uint8_t {
  Result = 0x00,
  WriteBroadcastDistributionTable = 0x01,
  ReadBroadcastDistributionTable = 0x02,
  ReadBroadcastDistributionTableAck = 0x03,
  ForwardedNpdu = 0x04,
  RegisterForeignDevice = 0x05,
  ReadForeignDeviceTable = 0x06,
  ReadForeignDeviceTableAck = 0x07,
  DeleteForeignDeviceTableEntry = 0x08,
  DistributeBroadcastToNetwork = 0x09,
  OriginalUnicastNpdu = 0x0A,
  OriginalBroadcastNpdu = 0x0B,
};
} // namespace bvlc

// ============================================================================
// NPDU (clause 6)
// ============================================================================
namespace npdu {
constexpr uint8_t VERSION = 0x01;

// Control octet bits
constexpr uint8_t NETWORK_LAYER_MESSAGE = 0x80;
constexpr uint8_t DESTINATION_SPECIFIED = 0x20;
constexpr uint8_t SOURCE_SPECIFIED = 0x08;
constexpr uint8_t EXPECTING_REPLY = 0x04;
constexpr uint8_t PRIORITY_MASK = 0x03;

constexpr uint16_t GLOBAL_BROADCAST_NETWORK = 0xFFFF;
constexpr uint8_t DEFAULT_HOP_COUNT = 255;

enum class MessagePriority : uint8_t {
  Normal = 0,
  Urgent = 1,
  CriticalEquipment = 2,
  LifeSafety = 3,
};
} // namespace npdu

// ============================================================================
// APDU (clause 20)
// ============================================================================
namespace apdu {
enum class PduType : uint8_t {
  ConfirmedRequest = 0,
  UnconfirmedRequest = 1,
  SimpleAck = 2,
  ComplexAck = 3,
  SegmentAck = 4,
  Error = 5,
  Reject = 6,
  Abort = 7,
};

// PDU flag bits in the first octet
constexpr uint8_t SEGMENTED_MESSAGE = 0x08;
constexpr uint8_t MORE_FOLLOWS = 0x04;
constexpr uint8_t SEGMENTED_RESPONSE_ACCEPTED = 0x02;
constexpr uint8_t ABORT_FROM_SERVER = 0x01;

// Max-APDU-length-accepted code 5 = 1476 octets, max segments code 0 = unspecified
constexpr uint8_t MAX_APDU_CODE_1476 = 0x05;
} // namespace apdu

enum class ConfirmedService : uint8_t {
  ReadProperty = 12,
  ReadPropertyMultiple = 14,
  WriteProperty = 15,
};

enum class UnconfirmedService : uint8_t {
  IAm = 0,
  IHave = 1,
  UnconfirmedCovNotification = 2,
  UnconfirmedEventNotification = 3,
  UnconfirmedPrivateTransfer = 4,
  UnconfirmedTextMessage = 5,
  TimeSynchronization = 6,
  WhoHas = 7,
  WhoIs = 8,
  UtcTimeSynchronization = 9,
};

// Application tag numbers (clause 20.2.1.4)
enum class ApplicationTag : uint8_t {
  Null = 0,
  Boolean = 1,
  UnsignedInt = 2,
  SignedInt = 3,
  Real = 4,
  Double = 5,
  OctetString = 6,
  CharacterString = 7,
  BitString = 8,
  Enumerated = 9,
  Date = 10,
  Time = 11,
  ObjectIdentifier = 12,
};

enum class Segmentation : uint8_t {
  Both = 0,
  Transmit = 1,
  Receive = 2,
  None = 3,
};

// ============================================================================
// Object types and properties (clause 21)
// ============================================================================

constexpr uint32_t MAX_OBJECT_INSTANCE = 0x3FFFFF;
constexpr uint16_t MAX_OBJECT_TYPE = 0x3FF;
constexpr uint16_t FIRST_PROPRIETARY_OBJECT_TYPE = 128;

enum class ObjectType : uint16_t {
  AnalogInput = 0,
  AnalogOutput = 1,
  AnalogValue = 2,
  BinaryInput = 3,
  BinaryOutput = 4,
  BinaryValue = 5,
  Calendar = 6,
  Command = 7,
  Device = 8,
  EventEnrollment = 9,
  File = 10,
  Group = 11,
  Loop = 12,
  MultiStateInput = 13,
  MultiStateOutput = 14,
  NotificationClass = 15,
  Program = 16,
  Schedule = 17,
  Averaging = 18,
  MultiStateValue = 19,
  TrendLog = 20,
  LifeSafetyPoint = 21,
  LifeSafetyZone = 22,
  Accumulator = 23,
  PulseConverter = 24,
  EventLog = 25,
  GlobalGroup = 26,
  TrendLogMultiple = 27,
  LoadControl = 28,
  StructuredView = 29,
  AccessDoor = 30,
  Timer = 31,
  AccessCredential = 32,
  AccessPoint = 33,
  AccessRights = 34,
  AccessUser = 35,
  AccessZone = 36,
  CredentialDataInput = 37,
  NetworkSecurity = 38,
  BitstringValue = 39,
  CharacterstringValue = 40,
  DatePatternValue = 41,
  DateValue = 42,
  DatetimePatternValue = 43,
  DatetimeValue = 44,
  IntegerValue = 45,
  LargeAnalogValue = 46,
  OctetstringValue = 47,
  PositiveIntegerValue = 48,
  TimePatternValue = 49,
  TimeValue = 50,
  NotificationForwarder = 51,
  AlertEnrollment = 52,
  Channel = 53,
  LightingOutput = 54,
  BinaryLightingOutput = 55,
  NetworkPort = 56,
};

// Property identifiers are open-ended (proprietary values above 511), so any
// uint32_t may be cast to PropertyId
enum class PropertyId : uint32_t {
  All = 8,
  Description = 28,
  ObjectIdentifier = 75,
  ObjectList = 76,
  ObjectName = 77,
  ObjectType = 79,
  OutOfService = 81,
  PresentValue = 85,
  PriorityArray = 87,
  RelinquishDefault = 104,
  StatusFlags = 111,
  Units = 117,
  VendorIdentifier = 120,
  VendorName = 121,
  ModelName = 70,
};

constexpr uint8_t MIN_PRIORITY = 1;
constexpr uint8_t MAX_PRIORITY = 16;
constexpr size_t PRIORITY_ARRAY_SIZE = 16;

// kebab-case name ("analog-input"), "proprietary-<n>" or "reserved-<n>"
std::string ObjectTypeName(uint16_t object_type);

// Accepts names as printed by ObjectTypeName or a number in [0, 1023]
std::optional<uint16_t> ParseObjectType(const std::string &str);

std::string PropertyName(uint32_t property_id);

std::string ErrorClassName(uint32_t error_class);
std::string RejectReasonName(uint8_t reason);
std::string AbortReasonName(uint8_t reason);

} // namespace protocol
} // namespace bacnet
