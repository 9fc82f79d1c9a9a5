// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/chrono.hpp"
#include <string>

namespace walletsync {
namespace chain {

/**
 * Validation state - tracks why a block window was refused
 */
class ValidationState {
public:
  enum class Result {
    VALID,
    INVALID, // Window does not fit the chain
    ERROR    // System error
  };

  ValidationState() : result_(Result::VALID) {}

  bool IsValid() const { return result_ == Result::VALID; }
  bool IsInvalid() const { return result_ == Result::INVALID; }
  bool IsError() const { return result_ == Result::ERROR; }

  bool Invalid(const std::string &reject_reason,
               const std::string &debug_message = "") {
    result_ = Result::INVALID;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  bool Error(const std::string &reject_reason,
             const std::string &debug_message = "") {
    result_ = Result::ERROR;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  const std::string& GetRejectReason() const { return reject_reason_; }
  const std::string& GetDebugMessage() const { return debug_message_; }

private:
  Result result_;
  std::string reject_reason_;
  std::string debug_message_;
};

// Validates blunds form a continuous chain, oldest to newest:
// window[i].prev_hash == window[i-1].hash. Does NOT verify the oldest block
// links to an existing chain (checked by the caller against its tip).
bool CheckWindowIsContinuous(const OldestFirst<Blund> &window);

// Same check on a rollback window, walked in place newest to oldest:
// window[i-1].prev_hash == window[i].hash
bool CheckWindowIsContinuous(const NewestFirst<Blund> &window);

} // namespace chain
} // namespace walletsync
