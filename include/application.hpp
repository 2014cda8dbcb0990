#pragma once

#include "network/discovery.hpp"
#include "network/message.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace bacnet {
namespace app {

enum class Command {
  Property, // read, write, priority array or clear priority of one object
  Discover,
  WhoIs,
};

// How a --write-value JSON literal is turned into a BACnet value
enum class WriteType {
  Boolean,          // true/false -> Boolean
  Real,             // number -> Real
  Enumerated,       // non-negative integer -> Enumerated
  EnumeratedBinary, // true/false -> Enumerated active(1)/inactive(0)
};

std::optional<WriteType> ParseWriteType(const std::string &str);

// Command line configuration of bacnet-cli
struct AppConfig {
  Command command = Command::Property;
  network::Endpoint endpoint;

  // Property command
  uint16_t object_type = 0;
  uint32_t instance = 0;
  uint32_t property_id = static_cast<uint32_t>(protocol::PropertyId::PresentValue);
  bool property_set = false;
  std::optional<std::string> write_value;
  std::optional<WriteType> write_type;
  std::optional<uint8_t> priority;
  bool priority_array = false;
  std::optional<uint8_t> clear_priority;

  std::chrono::milliseconds timeout = protocol::DEFAULT_TIMEOUT;

  // Discover command
  std::optional<std::chrono::milliseconds> duration;
  bool json = false;

  // Logging
  std::string log_level = "warn";
  std::vector<std::string> debug_components;
};

// Thrown for malformed or conflicting arguments
class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct ParseResult {
  enum class Action { Run, Help, Version };
  Action action = Action::Run;
  AppConfig config;
};

/**
 * Parse bacnet-cli arguments (without the program name)
 * @throws UsageError
 */
ParseResult ParseArguments(const std::vector<std::string> &args);

/**
 * Convert a JSON literal into the value to write
 * @throws UsageError if the literal does not fit `type`
 */
message::ApplicationDataValue MakeWriteValue(WriteType type, const std::string &json_text);

// One discovery result line, plain text or a JSON object
std::string FormatDevice(const network::Device &device, bool json);

// Application - executes one parsed command against the network
class Application {
public:
  Application(const AppConfig &config, network::TransportFactory &factory, std::ostream &out);

  // Throws network::Error (or UsageError for invalid write values) on failure
  void run();

private:
  void run_property();
  void run_discover();
  void run_who_is();

  message::ObjectId object_id() const;

  AppConfig config_;
  network::TransportFactory &factory_;
  std::ostream &out_;
};

} // namespace app
} // namespace bacnet
