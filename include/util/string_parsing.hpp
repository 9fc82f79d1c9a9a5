// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Safe parsing of command-line and scenario values. Every function validates
 that the whole input is consumed and returns std::nullopt on any error
 instead of throwing.
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "util/uint.hpp"

namespace walletsync {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 *   SafeParseInt("", 0, 100) -> std::nullopt (empty string)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse a 64-character hex hash (optional 0x prefix)
 */
std::optional<uint256> SafeParseHash(const std::string& str);

/**
 * Split a comma-separated list, dropping empty items ("a,,b" -> {"a", "b"})
 */
std::vector<std::string> SplitCommaList(const std::string& str);

} // namespace util
} // namespace walletsync
