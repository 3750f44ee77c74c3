#include "fs_util.h"

#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <unistd.h>

namespace confq::util {

namespace fs = std::filesystem;

fs::path unique_temp_path(const fs::path& dest) {
  std::random_device rd;
  std::uniform_int_distribution<int> dist(0, 15);
  const char* hex = "0123456789abcdef";
  std::string suffix;
  for (int i = 0; i < 12; ++i) {
    suffix.push_back(hex[dist(rd)]);
  }
  return dest.parent_path() / ("." + dest.filename().string() + ".tmp." + suffix);
}

void write_file_atomic(const fs::path& path, const std::string& content) {
  fs::path temp = unique_temp_path(path);
  {
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("Failed to create temp file: " + temp.string());
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
      std::error_code ignored;
      fs::remove(temp, ignored);
      throw std::runtime_error("Failed to write temp file: " + temp.string());
    }
  }
  std::error_code ec;
  fs::rename(temp, path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(temp, ignored);
    throw std::runtime_error("Failed to install " + path.string() + ": " + ec.message());
  }
}

bool read_file(const fs::path& path, std::string& out) {
  std::ifstream file(path, std::ios::binary);
  if (!file) return false;
  std::ostringstream buffer;
  buffer << file.rdbuf();
  out = buffer.str();
  return true;
}

bool is_executable_file(const fs::path& path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec) || ec) return false;
  return access(path.c_str(), X_OK) == 0;
}

}  // namespace confq::util
