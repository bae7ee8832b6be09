#pragma once

#include <cstdint>
#include <filesystem>
#include <ios>
#include <string>
#include <vector>

namespace ftpctl {
namespace util {

/**
 * Read entire file into vector
 * Returns empty vector on failure (missing file, unreadable, or larger than
 * MAX_READ_FILE_SIZE)
 */
std::vector<uint8_t> read_file(const std::filesystem::path &path);

/**
 * Read entire file into string
 * Returns empty string on failure
 */
std::string read_file_string(const std::filesystem::path &path);

// Refuse to load anything bigger; certificates and config files are small
constexpr std::streamsize MAX_READ_FILE_SIZE = 4 * 1024 * 1024;

} // namespace util
} // namespace ftpctl
