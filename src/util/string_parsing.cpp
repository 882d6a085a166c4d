#include "util/string_parsing.hpp"
#include <cctype>
#include <sstream>

namespace forksim {
namespace util {

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  try {
    // Reject empty or whitespace-only strings
    if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
      return std::nullopt;
    }

    size_t pos = 0;
    long value = std::stol(str, &pos);

    // Check entire string was consumed
    if (pos != str.size()) {
      return std::nullopt;
    }

    if (value < min || value > max) {
      return std::nullopt;
    }

    return static_cast<int>(value);
  } catch (const std::exception&) {
    // std::invalid_argument / std::out_of_range
    return std::nullopt;
  }
}

std::optional<uint64_t> SafeParseUInt64(const std::string& str) {
  try {
    if (str.empty() || !std::isdigit(static_cast<unsigned char>(str[0]))) {
      return std::nullopt;
    }

    size_t pos = 0;
    unsigned long long value = std::stoull(str, &pos);

    if (pos != str.size()) {
      return std::nullopt;
    }

    return static_cast<uint64_t>(value);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::vector<std::string> SplitString(const std::string& str, char delimiter) {
  std::vector<std::string> out;
  size_t pos = 0;
  while (pos <= str.length()) {
    size_t next = str.find(delimiter, pos);
    if (next == std::string::npos) {
      next = str.length();
    }
    if (next > pos) {
      out.push_back(str.substr(pos, next - pos));
    }
    pos = next + 1;
  }
  return out;
}

std::string EscapeDotString(const std::string& str) {
  std::ostringstream oss;
  for (char c : str) {
    switch (c) {
      case '"':  oss << "\\\""; break;
      case '\\': oss << "\\\\"; break;
      case '\n': oss << "\\n"; break;
      case '\r': break;
      default:   oss << c;
    }
  }
  return oss.str();
}

} // namespace util
} // namespace forksim
