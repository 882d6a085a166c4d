#include "util/files.hpp"
#include <cstdio>
#include <fstream>
#include <random>
#include <sstream>

#if defined(__APPLE__) || defined(__linux__)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace forksim {
namespace util {

namespace {

// Generate random suffix for temp file
std::string random_suffix() {
  static thread_local std::mt19937 gen(std::random_device{}());
  static thread_local std::uniform_int_distribution<> dis(0, 0xFFFF);
  char buf[8];
  snprintf(buf, sizeof(buf), "%04x", dis(gen));
  return std::string(buf);
}

} // anonymous namespace

bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    return false;
  }

  auto temp_path = path;
  temp_path += ".tmp." + random_suffix();

#if defined(__APPLE__) || defined(__linux__)
  int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (fd < 0) {
    return false;
  }

  // Handle partial writes
  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = write(fd, data.data() + total, data.size() - total);
    if (n <= 0) {
      close(fd);
      std::filesystem::remove(temp_path);
      return false;
    }
    total += static_cast<size_t>(n);
  }

  if (fsync(fd) != 0) {
    close(fd);
    std::filesystem::remove(temp_path);
    return false;
  }

  close(fd);
#else
  // Fallback: std::ofstream without sync
  {
    std::ofstream temp_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!temp_file) {
      return false;
    }
    temp_file.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!temp_file) {
      temp_file.close();
      std::filesystem::remove(temp_path);
      return false;
    }
  }
#endif

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::filesystem::remove(temp_path, ec);
    return false;
  }

  return true;
}

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::exists(dir);
}

} // namespace util
} // namespace forksim
