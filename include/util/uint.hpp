// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>
#include <string_view>

/**
 * 256-bit opaque blob used for header hashes and transaction ids.
 *
 * The hex representation (GetHex/SetHex) shows bytes in reverse order, the
 * same convention block explorers use for block hashes.
 */
class uint256 {
public:
  static constexpr size_t WIDTH = 32;

  constexpr uint256() : m_data() {}

  // Constant with the lowest byte set (0 and 1 are the usual uses)
  constexpr explicit uint256(uint8_t v) : m_data{v} {}

  bool IsNull() const {
    for (uint8_t b : m_data) {
      if (b != 0) return false;
    }
    return true;
  }

  void SetNull() { m_data.fill(0); }

  int Compare(const uint256 &other) const {
    return std::memcmp(m_data.data(), other.m_data.data(), WIDTH);
  }

  friend bool operator==(const uint256 &a, const uint256 &b) {
    return a.Compare(b) == 0;
  }
  friend bool operator!=(const uint256 &a, const uint256 &b) {
    return a.Compare(b) != 0;
  }
  friend bool operator<(const uint256 &a, const uint256 &b) {
    return a.Compare(b) < 0;
  }

  std::string GetHex() const;
  std::string ToString() const { return GetHex(); }

  // First 8 hex characters, for log lines
  std::string ShortHex() const;

  /** Set from hex string. Supports optional "0x" prefix. Returns false (and
   *  leaves the value null) if the string is not exactly 64 hex digits. */
  bool SetHex(std::string_view str);

  const unsigned char *data() const { return m_data.data(); }
  unsigned char *data() { return m_data.data(); }

  unsigned char *begin() { return m_data.data(); }
  unsigned char *end() { return m_data.data() + WIDTH; }
  const unsigned char *begin() const { return m_data.data(); }
  const unsigned char *end() const { return m_data.data() + WIDTH; }

  static constexpr size_t size() { return WIDTH; }

  static const uint256 ZERO;
  static const uint256 ONE;

private:
  std::array<uint8_t, WIDTH> m_data;
};

/* uint256 from a hex string. Malformed input yields the null hash; use
 * util::SafeParseHash where malformed input must be detected. */
inline uint256 uint256S(std::string_view str) {
  uint256 rv;
  rv.SetHex(str);
  return rv;
}

namespace std {
template <> struct hash<uint256> {
  size_t operator()(const uint256 &h) const noexcept {
    size_t out = 0;
    std::memcpy(&out, h.data(), sizeof(out));
    return out;
  }
};
} // namespace std
