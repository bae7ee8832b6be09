#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of command-line and config values with validation
 - Returns std::nullopt on any parsing error (no exceptions thrown)

 Key functions:
 - SafeParseInt: integer with bounds checking
 - SafeParsePort: port number (1-65535)
 - SafeParseSize: non-negative byte count, optional k/m suffix
 - SplitList: comma-separated option values
 - IsValidLogLevel: spdlog level names accepted by LogManager

 All numeric parsers require the entire input to be consumed (no leading
 whitespace, no trailing garbage).
*/

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ftpctl {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string &str, int min, int max);

/**
 * Parse port number string (1-65535)
 *
 * Examples:
 *   SafeParsePort("2121") -> 2121
 *   SafeParsePort("0") -> std::nullopt (port 0 invalid)
 */
std::optional<uint16_t> SafeParsePort(const std::string &str);

/**
 * Parse a byte count: digits with an optional 'k' (KiB) or 'm' (MiB) suffix,
 * case-insensitive.
 *
 * Examples:
 *   SafeParseSize("4096") -> 4096
 *   SafeParseSize("64k") -> 65536
 *   SafeParseSize("-1") -> std::nullopt
 */
std::optional<size_t> SafeParseSize(const std::string &str);

// Split on commas, dropping empty items: "net,,tls" -> {"net", "tls"}
std::vector<std::string> SplitList(const std::string &str);

// trace, debug, info, warn, error, critical, off
bool IsValidLogLevel(const std::string &level);

} // namespace util
} // namespace ftpctl
