#include "application.hpp"
#include "network/client.hpp"
#include "network/error.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include "util/threadpool.hpp"
#include <cmath>
#include <iomanip>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>

namespace bacnet {
namespace app {

namespace {

// Property identifiers are 22-bit
constexpr int64_t MAX_PROPERTY_ID = 0x3FFFFF;
constexpr int64_t MAX_TIMEOUT_MS = 3600 * 1000;
constexpr int64_t MAX_DURATION_S = 24 * 3600;

const char *SegmentationName(protocol::Segmentation segmentation) {
  switch (segmentation) {
  case protocol::Segmentation::Both:
    return "both";
  case protocol::Segmentation::Transmit:
    return "transmit";
  case protocol::Segmentation::Receive:
    return "receive";
  case protocol::Segmentation::None:
    return "none";
  }
  return "unknown";
}

// Matches "--name=value" and stores the value
bool OptionValue(const std::string &arg, const std::string &name, std::string &value) {
  const std::string prefix = "--" + name + "=";
  if (arg.compare(0, prefix.size(), prefix) != 0) {
    return false;
  }
  value = arg.substr(prefix.size());
  return true;
}

uint8_t ParsePriority(const std::string &option, const std::string &value) {
  auto priority = util::SafeParseInt(value, protocol::MIN_PRIORITY, protocol::MAX_PRIORITY);
  if (!priority) {
    throw UsageError("invalid " + option + ": " + value + " (must be between 1 and 16)");
  }
  return static_cast<uint8_t>(*priority);
}

network::Endpoint ParseTarget(const std::string &value) {
  auto endpoint = util::ParseEndpoint(value);
  if (!endpoint) {
    throw UsageError("invalid address: " + value + " (expected ip:port)");
  }
  return *endpoint;
}

void Validate(const AppConfig &config) {
  const bool property_options = config.property_set || config.write_value ||
                                config.write_type || config.priority ||
                                config.priority_array || config.clear_priority;

  if (config.command != Command::Property && property_options) {
    throw UsageError("property options only apply to property commands");
  }
  if (config.command != Command::Discover && (config.duration || config.json)) {
    throw UsageError("--duration and --json only apply to discover");
  }
  if (config.write_value.has_value() != config.write_type.has_value()) {
    throw UsageError("--write-value and --write-type must be given together");
  }
  if (config.priority && !config.write_value) {
    throw UsageError("--priority requires --write-value");
  }
  if (config.priority_array &&
      (config.write_value || config.property_set || config.clear_priority)) {
    throw UsageError("--priority-array cannot be combined with --write-value, --property or "
                     "--clear-priority");
  }
  if (config.clear_priority && (config.write_value || config.property_set)) {
    throw UsageError("--clear-priority cannot be combined with --write-value or --property");
  }
  if (config.write_value) {
    // Reject type/value mismatches before any network traffic
    MakeWriteValue(*config.write_type, *config.write_value);
  }
}

} // namespace

std::optional<WriteType> ParseWriteType(const std::string &str) {
  if (str == "boolean")
    return WriteType::Boolean;
  if (str == "real")
    return WriteType::Real;
  if (str == "enumerated")
    return WriteType::Enumerated;
  if (str == "enumerated-binary")
    return WriteType::EnumeratedBinary;
  return std::nullopt;
}

ParseResult ParseArguments(const std::vector<std::string> &args) {
  ParseResult result;
  AppConfig &config = result.config;
  std::vector<std::string> positional;
  std::string v;

  for (const auto &arg : args) {
    if (arg == "--help" || arg == "-h") {
      result.action = ParseResult::Action::Help;
      return result;
    } else if (arg == "--version" || arg == "-v") {
      result.action = ParseResult::Action::Version;
      return result;
    } else if (OptionValue(arg, "property", v)) {
      auto property = util::SafeParseInt64(v, 0, MAX_PROPERTY_ID);
      if (!property) {
        throw UsageError("invalid --property: " + v);
      }
      config.property_id = static_cast<uint32_t>(*property);
      config.property_set = true;
    } else if (OptionValue(arg, "write-value", v)) {
      config.write_value = v;
    } else if (OptionValue(arg, "write-type", v)) {
      config.write_type = ParseWriteType(v);
      if (!config.write_type) {
        throw UsageError("invalid --write-type: " + v +
                         " (boolean, real, enumerated, enumerated-binary)");
      }
    } else if (OptionValue(arg, "priority", v)) {
      config.priority = ParsePriority("--priority", v);
    } else if (arg == "--priority-array") {
      config.priority_array = true;
    } else if (OptionValue(arg, "clear-priority", v)) {
      config.clear_priority = ParsePriority("--clear-priority", v);
    } else if (OptionValue(arg, "timeout", v)) {
      auto ms = util::SafeParseInt64(v, 1, MAX_TIMEOUT_MS);
      if (!ms) {
        throw UsageError("invalid --timeout: " + v + " (milliseconds)");
      }
      config.timeout = std::chrono::milliseconds(*ms);
    } else if (OptionValue(arg, "duration", v)) {
      auto seconds = util::SafeParseInt64(v, 1, MAX_DURATION_S);
      if (!seconds) {
        throw UsageError("invalid --duration: " + v + " (seconds)");
      }
      config.duration = std::chrono::seconds(*seconds);
    } else if (arg == "--json") {
      config.json = true;
    } else if (OptionValue(arg, "loglevel", v)) {
      config.log_level = v;
    } else if (OptionValue(arg, "debug", v)) {
      for (auto &component : util::SplitCommaList(v)) {
        config.debug_components.push_back(component);
      }
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw UsageError("unknown option: " + arg);
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.empty()) {
    throw UsageError("no target given");
  }

  if (positional[0] == "discover" || positional[0] == "whois") {
    config.command = positional[0] == "discover" ? Command::Discover : Command::WhoIs;
    if (positional.size() != 2) {
      throw UsageError(positional[0] + " expects exactly one <ip:port>");
    }
    config.endpoint = ParseTarget(positional[1]);
  } else {
    config.command = Command::Property;
    if (positional.size() != 3) {
      throw UsageError("expected <ip:port> <object-type> <instance>");
    }
    config.endpoint = ParseTarget(positional[0]);

    auto object_type = protocol::ParseObjectType(positional[1]);
    if (!object_type) {
      throw UsageError("invalid object type: " + positional[1]);
    }
    config.object_type = *object_type;

    auto instance = util::SafeParseInt64(positional[2], 0, protocol::MAX_OBJECT_INSTANCE);
    if (!instance) {
      throw UsageError("invalid instance: " + positional[2] + " (0.." +
                       std::to_string(protocol::MAX_OBJECT_INSTANCE) + ")");
    }
    config.instance = static_cast<uint32_t>(*instance);
  }

  Validate(config);
  return result;
}

message::ApplicationDataValue MakeWriteValue(WriteType type, const std::string &json_text) {
  nlohmann::json value;
  try {
    value = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::parse_error &e) {
    throw UsageError("invalid JSON write value '" + json_text + "': " + e.what());
  }

  switch (type) {
  case WriteType::Boolean:
    if (value.is_boolean()) {
      return value.get<bool>();
    }
    break;
  case WriteType::EnumeratedBinary:
    if (value.is_boolean()) {
      return message::Enumerated{value.get<bool>() ? 1u : 0u};
    }
    break;
  case WriteType::Real:
    if (value.is_number()) {
      const double real = value.get<double>();
      if (std::abs(real) > std::numeric_limits<float>::max()) {
        throw UsageError("write value " + json_text + " is out of range for a real");
      }
      return static_cast<float>(real);
    }
    break;
  case WriteType::Enumerated:
    if (value.is_number_unsigned() && value.get<uint64_t>() <= 0xFFFFFFFFull) {
      return message::Enumerated{static_cast<uint32_t>(value.get<uint64_t>())};
    }
    break;
  }
  throw UsageError("write value " + json_text + " does not match the write type");
}

std::string FormatDevice(const network::Device &device, bool json) {
  if (json) {
    nlohmann::json j = {
        {"device_id", device.device_id},
        {"vendor_id", device.vendor_id},
        {"address", util::FormatEndpoint(device.address)},
        {"max_apdu_length", device.max_apdu_length},
        {"segmentation", SegmentationName(device.segmentation)},
    };
    return j.dump();
  }

  std::ostringstream oss;
  oss << "device " << device.device_id << " at " << util::FormatEndpoint(device.address)
      << " (vendor " << device.vendor_id << ", max apdu " << device.max_apdu_length
      << ", segmentation " << SegmentationName(device.segmentation) << ")";
  return oss.str();
}

// ============================================================================
// Application
// ============================================================================

Application::Application(const AppConfig &config, network::TransportFactory &factory,
                         std::ostream &out)
    : config_(config), factory_(factory), out_(out) {}

void Application::run() {
  switch (config_.command) {
  case Command::Property:
    run_property();
    break;
  case Command::Discover:
    run_discover();
    break;
  case Command::WhoIs:
    run_who_is();
    break;
  }
}

message::ObjectId Application::object_id() const {
  return message::ObjectId(config_.object_type, config_.instance);
}

void Application::run_property() {
  network::Client::Config client_config;
  client_config.timeout = config_.timeout;
  network::Client client(factory_, config_.endpoint, client_config);

  if (config_.clear_priority) {
    message::WriteProperty request;
    request.object_id = object_id();
    request.property_id = static_cast<uint32_t>(protocol::PropertyId::PresentValue);
    request.values.push_back(message::Null{});
    request.priority = *config_.clear_priority;
    client.write_property(request);
    out_ << "priority " << static_cast<int>(*config_.clear_priority) << " cleared" << std::endl;
  } else if (config_.priority_array) {
    message::ReadProperty request;
    request.object_id = object_id();
    request.property_id = static_cast<uint32_t>(protocol::PropertyId::PriorityArray);
    auto ack = client.read_property(request);
    for (size_t i = 0; i < ack.values.size(); ++i) {
      out_ << "  priority " << std::setw(2) << (i + 1) << ": "
           << message::FormatValue(ack.values[i]) << std::endl;
    }
  } else if (config_.write_value) {
    message::WriteProperty request;
    request.object_id = object_id();
    request.property_id = config_.property_id;
    request.values.push_back(MakeWriteValue(*config_.write_type, *config_.write_value));
    request.priority = config_.priority;
    client.write_property(request);
    out_ << "write done" << std::endl;
  } else {
    message::ReadProperty request;
    request.object_id = object_id();
    request.property_id = config_.property_id;
    auto ack = client.read_property(request);
    for (const auto &value : ack.values) {
      out_ << message::FormatValue(value) << std::endl;
    }
  }
}

void Application::run_discover() {
  util::ThreadPool pool(1);
  network::Discovery discovery(factory_, pool);

  auto results = discovery.discover(config_.endpoint, config_.duration);
  size_t devices = 0;
  while (auto item = results.Recv()) {
    if (const auto *device = std::get_if<network::Device>(&*item)) {
      out_ << FormatDevice(*device, config_.json) << std::endl;
      ++devices;
    } else {
      LOG_WARN("discovery: {}", std::get<network::Error>(*item).what());
    }
  }
  LOG_APP_DEBUG("discovery finished, {} devices", devices);
}

void Application::run_who_is() {
  network::Client::Config client_config;
  client_config.timeout = config_.timeout;
  network::Client client(factory_, config_.endpoint, client_config);

  auto i_am = client.who_is();
  if (!i_am) {
    throw network::Error(network::ErrorKind::Codec,
                         "unexpected response: reply to who-is was not an I-Am");
  }

  network::Device device;
  device.device_id = i_am->device_id.instance;
  device.vendor_id = i_am->vendor_id;
  device.address = config_.endpoint;
  device.max_apdu_length = i_am->max_apdu_length;
  device.segmentation = i_am->segmentation;
  out_ << FormatDevice(device, false) << std::endl;
}

} // namespace app
} // namespace bacnet
