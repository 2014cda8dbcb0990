#include "network/protocol.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace bacnet {
namespace protocol {

namespace {

// Indexed by ObjectType value (0..56)
constexpr std::array<const char *, 57> OBJECT_TYPE_NAMES = {
    "analog-input",
    "analog-output",
    "analog-value",
    "binary-input",
    "binary-output",
    "binary-value",
    "calendar",
    "command",
    "device",
    "event-enrollment",
    "file",
    "group",
    "loop",
    "multi-state-input",
    "multi-state-output",
    "notification-class",
    "program",
    "schedule",
    "averaging",
    "multi-state-value",
    "trend-log",
    "life-safety-point",
    "life-safety-zone",
    "accumulator",
    "pulse-converter",
    "event-log",
    "global-group",
    "trend-log-multiple",
    "load-control",
    "structured-view",
    "access-door",
    "timer",
    "access-credential",
    "access-point",
    "access-rights",
    "access-user",
    "access-zone",
    "credential-data-input",
    "network-security",
    "bitstring-value",
    "characterstring-value",
    "date-pattern-value",
    "date-value",
    "datetime-pattern-value",
    "datetime-value",
    "integer-value",
    "large-analog-value",
    "octetstring-value",
    "positive-integer-value",
    "time-pattern-value",
    "time-value",
    "notification-forwarder",
    "alert-enrollment",
    "channel",
    "lighting-output",
    "binary-lighting-output",
    "network-port",
};

constexpr std::array<const char *, 8> ERROR_CLASS_NAMES = {
    "device", "object", "property", "resources",
    "security", "services", "vt", "communication",
};

constexpr std::array<const char *, 10> REJECT_REASON_NAMES = {
    "other",
    "buffer-overflow",
    "inconsistent-parameters",
    "invalid-parameter-data-type",
    "invalid-tag",
    "missing-required-parameter",
    "parameter-out-of-range",
    "too-many-arguments",
    "undefined-enumeration",
    "unrecognized-service",
};

constexpr std::array<const char *, 12> ABORT_REASON_NAMES = {
    "other",
    "buffer-overflow",
    "invalid-apdu-in-this-state",
    "preempted-by-higher-priority-task",
    "segmentation-not-supported",
    "security-error",
    "insufficient-security",
    "window-size-out-of-range",
    "application-exceeded-reply-time",
    "out-of-resources",
    "tsm-timeout",
    "apdu-too-long",
};

template <size_t N>
std::string NameOrNumber(const std::array<const char *, N> &names, uint32_t value) {
  if (value < names.size()) {
    return names[value];
  }
  return std::to_string(value);
}

} // namespace

std::string ObjectTypeName(uint16_t object_type) {
  if (object_type < OBJECT_TYPE_NAMES.size()) {
    return OBJECT_TYPE_NAMES[object_type];
  }
  if (object_type >= FIRST_PROPRIETARY_OBJECT_TYPE) {
    return "proprietary-" + std::to_string(object_type);
  }
  return "reserved-" + std::to_string(object_type);
}

std::optional<uint16_t> ParseObjectType(const std::string &str) {
  std::string lower(str.size(), '\0');
  std::transform(str.begin(), str.end(), lower.begin(), [](unsigned char c) {
    return c == '_' ? '-' : static_cast<char>(std::tolower(c));
  });

  auto it = std::find_if(OBJECT_TYPE_NAMES.begin(), OBJECT_TYPE_NAMES.end(),
                         [&](const char *name) { return lower == name; });
  if (it != OBJECT_TYPE_NAMES.end()) {
    return static_cast<uint16_t>(it - OBJECT_TYPE_NAMES.begin());
  }

  auto number = util::SafeParseInt(str, 0, MAX_OBJECT_TYPE);
  if (number) {
    return static_cast<uint16_t>(*number);
  }
  return std::nullopt;
}

std::string PropertyName(uint32_t property_id) {
  switch (static_cast<PropertyId>(property_id)) {
  case PropertyId::All:
    return "all";
  case PropertyId::Description:
    return "description";
  case PropertyId::ModelName:
    return "model-name";
  case PropertyId::ObjectIdentifier:
    return "object-identifier";
  case PropertyId::ObjectList:
    return "object-list";
  case PropertyId::ObjectName:
    return "object-name";
  case PropertyId::ObjectType:
    return "object-type";
  case PropertyId::OutOfService:
    return "out-of-service";
  case PropertyId::PresentValue:
    return "present-value";
  case PropertyId::PriorityArray:
    return "priority-array";
  case PropertyId::RelinquishDefault:
    return "relinquish-default";
  case PropertyId::StatusFlags:
    return "status-flags";
  case PropertyId::Units:
    return "units";
  case PropertyId::VendorIdentifier:
    return "vendor-identifier";
  case PropertyId::VendorName:
    return "vendor-name";
  }
  return "property-" + std::to_string(property_id);
}

std::string ErrorClassName(uint32_t error_class) {
  return NameOrNumber(ERROR_CLASS_NAMES, error_class);
}

std::string RejectReasonName(uint8_t reason) {
  return NameOrNumber(REJECT_REASON_NAMES, reason);
}

std::string AbortReasonName(uint8_t reason) {
  return NameOrNumber(ABORT_REASON_NAMES, reason);
}

} // namespace protocol
} // namespace bacnet
