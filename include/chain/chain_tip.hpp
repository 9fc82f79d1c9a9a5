// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"

namespace walletsync {
namespace chain {

// Read access to the hash of the chain's current head block.
// Implementations: BlockPipeline (in-memory chain), test doubles.
class ChainTip {
public:
  virtual ~ChainTip() = default;
  virtual HeaderHash GetTip() const = 0;
};

} // namespace chain
} // namespace walletsync
