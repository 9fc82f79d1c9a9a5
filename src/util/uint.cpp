// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/uint.hpp"

namespace {

int HexDigit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

constexpr char kHexChars[] = "0123456789abcdef";

} // namespace

std::string uint256::GetHex() const {
  std::string out;
  out.reserve(WIDTH * 2);
  // Reverse byte order for display
  for (size_t i = WIDTH; i-- > 0;) {
    out.push_back(kHexChars[m_data[i] >> 4]);
    out.push_back(kHexChars[m_data[i] & 0x0f]);
  }
  return out;
}

std::string uint256::ShortHex() const { return GetHex().substr(0, 8); }

bool uint256::SetHex(std::string_view str) {
  SetNull();

  if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
    str.remove_prefix(2);
  }
  if (str.size() != WIDTH * 2) {
    return false;
  }

  std::array<uint8_t, WIDTH> parsed{};
  for (size_t i = 0; i < WIDTH; ++i) {
    // Most significant byte comes first in the string
    int hi = HexDigit(str[2 * i]);
    int lo = HexDigit(str[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    parsed[WIDTH - 1 - i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  m_data = parsed;
  return true;
}

const uint256 uint256::ZERO(0);
const uint256 uint256::ONE(1);
