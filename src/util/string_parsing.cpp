#include "util/string_parsing.hpp"
#include <cctype>
#include <limits>
#include <stdexcept>

namespace ftpctl {
namespace util {

namespace {

// Full-consumption parse; std::nullopt on malformed, overflowing or
// out-of-range input
std::optional<long long> ParseBounded(const std::string &str, long long min,
                                      long long max) {
  if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }

  size_t pos = 0;
  long long value = 0;
  try {
    value = std::stoll(str, &pos);
  } catch (const std::invalid_argument &) {
    return std::nullopt;
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }

  if (pos != str.size() || value < min || value > max) {
    return std::nullopt;
  }
  return value;
}

} // namespace

std::optional<int> SafeParseInt(const std::string &str, int min, int max) {
  auto value = ParseBounded(str, min, max);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<uint16_t> SafeParsePort(const std::string &str) {
  auto value = ParseBounded(str, 1, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::optional<size_t> SafeParseSize(const std::string &str) {
  if (str.empty()) {
    return std::nullopt;
  }

  std::string digits = str;
  long long multiplier = 1;
  char suffix = static_cast<char>(std::tolower(static_cast<unsigned char>(str.back())));
  if (suffix == 'k') {
    multiplier = 1024;
    digits.pop_back();
  } else if (suffix == 'm') {
    multiplier = 1024 * 1024;
    digits.pop_back();
  }

  // Digits only: stoll would accept a sign
  if (digits.empty() || !std::isdigit(static_cast<unsigned char>(digits[0]))) {
    return std::nullopt;
  }

  auto value = ParseBounded(digits, 0, std::numeric_limits<long long>::max() / multiplier);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<size_t>(*value * multiplier);
}

std::vector<std::string> SplitList(const std::string &str) {
  std::vector<std::string> items;
  size_t pos = 0;
  while (pos <= str.size()) {
    size_t comma = str.find(',', pos);
    if (comma == std::string::npos) {
      comma = str.size();
    }
    if (comma > pos) {
      items.push_back(str.substr(pos, comma - pos));
    }
    pos = comma + 1;
  }
  return items;
}

bool IsValidLogLevel(const std::string &level) {
  return level == "trace" || level == "debug" || level == "info" || level == "warn" ||
         level == "error" || level == "critical" || level == "off";
}

} // namespace util
} // namespace ftpctl
