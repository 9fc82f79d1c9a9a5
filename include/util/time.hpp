// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>

namespace walletsync {
namespace util {

/**
 * Mockable wall clock
 *
 * Production code calls GetTime()/GetTimeMicros() instead of reading the
 * system clock directly, so tests can pin the current time (and with it the
 * current slotting epoch) with SetMockTime().
 *
 * Mock time is expressed in seconds; 0 disables mocking.
 */

// Current time as Unix timestamp (seconds since epoch)
int64_t GetTime();

// Current time in microseconds since epoch (mocked value * 1'000'000 when set)
int64_t GetTimeMicros();

void SetMockTime(int64_t time);

// Returns 0 if mock time is disabled
int64_t GetMockTime();

/**
 * RAII helper to set mock time and restore it when scope exits
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }

  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;
  MockTimeScope(MockTimeScope&&) = delete;
  MockTimeScope& operator=(MockTimeScope&&) = delete;

private:
  const int64_t previous_time_;
};

} // namespace util
} // namespace walletsync
