#include "util/files.hpp"
#include <fstream>

namespace ftpctl {
namespace util {

std::vector<uint8_t> read_file(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) {
    return {};
  }

  std::streampos pos = file.tellg();
  if (pos == std::streampos(-1)) {
    return {};
  }

  std::streamsize size = static_cast<std::streamsize>(pos);
  if (size < 0 || size > MAX_READ_FILE_SIZE) {
    return {};
  }

  std::vector<uint8_t> data(static_cast<size_t>(size));
  file.seekg(0);
  file.read(reinterpret_cast<char *>(data.data()), size);

  if (!file) {
    return {};
  }

  return data;
}

std::string read_file_string(const std::filesystem::path &path) {
  auto data = read_file(path);
  return std::string(data.begin(), data.end());
}

} // namespace util
} // namespace ftpctl
