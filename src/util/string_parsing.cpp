#include "util/string_parsing.hpp"
#include <cctype>

namespace bacnet {
namespace util {

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  auto value = SafeParseInt64(str, min, max);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max) {
  try {
    // Reject empty or whitespace-leading strings
    if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
      return std::nullopt;
    }

    size_t pos = 0;
    long long value = std::stoll(str, &pos);

    // Check entire string was consumed
    if (pos != str.size()) {
      return std::nullopt;
    }

    if (value < min || value > max) {
      return std::nullopt;
    }

    return static_cast<int64_t>(value);
  } catch (const std::exception&) {
    // std::invalid_argument / std::out_of_range from stoll
    return std::nullopt;
  }
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto value = SafeParseInt64(str, 1, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::vector<std::string> SplitCommaList(const std::string& str) {
  std::vector<std::string> items;
  size_t pos = 0;
  while (pos <= str.length()) {
    size_t comma = str.find(',', pos);
    if (comma == std::string::npos) {
      comma = str.length();
    }
    if (comma > pos) {
      items.push_back(str.substr(pos, comma - pos));
    }
    pos = comma + 1;
  }
  return items;
}

} // namespace util
} // namespace bacnet
