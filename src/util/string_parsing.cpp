// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"

#include <cerrno>
#include <cstdlib>

namespace walletsync {
namespace util {

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  if (str.empty()) {
    return std::nullopt;
  }
  // strtol skips leading whitespace; reject it explicitly
  if (str.front() == ' ' || str.front() == '\t') {
    return std::nullopt;
  }

  errno = 0;
  char* end = nullptr;
  long value = std::strtol(str.c_str(), &end, 10);

  if (errno == ERANGE || end != str.c_str() + str.size()) {
    return std::nullopt;
  }
  if (value < static_cast<long>(min) || value > static_cast<long>(max)) {
    return std::nullopt;
  }
  return static_cast<int>(value);
}

std::optional<uint256> SafeParseHash(const std::string& str) {
  uint256 hash;
  if (!hash.SetHex(str)) {
    return std::nullopt;
  }
  return hash;
}

std::vector<std::string> SplitCommaList(const std::string& str) {
  std::vector<std::string> out;
  size_t pos = 0;
  while (pos <= str.size()) {
    size_t comma = str.find(',', pos);
    if (comma == std::string::npos) {
      comma = str.size();
    }
    if (comma > pos) {
      out.push_back(str.substr(pos, comma - pos));
    }
    pos = comma + 1;
  }
  return out;
}

} // namespace util
} // namespace walletsync
