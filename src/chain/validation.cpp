// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/validation.hpp"

namespace walletsync {
namespace chain {

bool CheckWindowIsContinuous(const OldestFirst<Blund> &window) {
  const auto &blunds = window.Get();
  for (size_t i = 1; i < blunds.size(); ++i) {
    if (BlundPrevHash(blunds[i]) != BlundHash(blunds[i - 1])) {
      return false;
    }
  }
  return true;
}

bool CheckWindowIsContinuous(const NewestFirst<Blund> &window) {
  const auto &blunds = window.Get();
  for (size_t i = 1; i < blunds.size(); ++i) {
    if (BlundPrevHash(blunds[i - 1]) != BlundHash(blunds[i])) {
      return false;
    }
  }
  return true;
}

} // namespace chain
} // namespace walletsync
