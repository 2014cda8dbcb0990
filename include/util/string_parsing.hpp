#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of command-line strings to numeric types with validation
 - Consistent error handling for the CLI before any network traffic

 Key functions:
 - SafeParseInt: Parse integer with bounds checking
 - SafeParseInt64: Parse 64-bit integer with bounds checking
 - SafeParsePort: Parse port number (1-65535)
 - SplitCommaList: Split "a,b,c" into its non-empty items

 All numeric functions validate that the entire input is consumed and return
 std::nullopt on any parsing error (no exceptions thrown).
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bacnet {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * @param str String to parse
 * @param min Minimum allowed value (inclusive)
 * @param max Maximum allowed value (inclusive)
 * @return Parsed integer or std::nullopt if invalid
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 *   SafeParseInt("", 0, 100) -> std::nullopt (empty string)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse int64_t string with bounds checking
 *
 * Used for values wider than int, such as object instance numbers
 * (22 bits) and property identifiers (up to 2^22 - 1) together with
 * millisecond timeouts.
 */
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);

/**
 * Parse port number string (1-65535)
 *
 * Examples:
 *   SafeParsePort("47808") -> 47808
 *   SafeParsePort("0") -> std::nullopt (port 0 invalid)
 *   SafeParsePort("99999") -> std::nullopt (out of range)
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

/**
 * Split a comma-separated list, dropping empty items
 *
 * Example:
 *   SplitCommaList("network,,codec") -> {"network", "codec"}
 */
std::vector<std::string> SplitCommaList(const std::string& str);

} // namespace util
} // namespace bacnet
