// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/chain_tip.hpp"
#include "chain/chrono.hpp"
#include "chain/notifications.hpp"
#include "chain/validation.hpp"
#include <cstddef>
#include <mutex>
#include <vector>

namespace walletsync {
namespace chain {

// BlockPipeline - In-memory block processing pipeline
//
// Owns the active chain (a list of blunds on top of a base tip) and drives
// block listeners. Each ApplyBlocks/RollbackBlocks event runs entirely under
// the block lock, so listeners observe a frozen tip for the duration of
// their callback: the pre-window tip during apply, the newest block of the
// window during rollback. The tip moves only after all listeners returned.
class BlockPipeline : public ChainTip {
public:
  // `base_tip` is the hash the first applied block must link to
  explicit BlockPipeline(const HeaderHash &base_tip);

  HeaderHash GetTip() const override;

  // Number of blunds applied on top of the base tip
  size_t GetHeight() const;

  BlockNotifications &Notifications() { return notifications_; }

  // Apply an oldest-first window on top of the current tip.
  // Rejects with "non-continuous-window" or "bad-prevblk".
  bool ApplyBlocks(const OldestFirst<Blund> &blunds, ValidationState &state);

  // Roll back the newest `count` blocks. Rejects with "empty-window" or
  // "rollback-too-deep".
  bool RollbackBlocks(size_t count, ValidationState &state);

  // Batch ops returned by listeners for the last event
  const db::SomeBatchOp &LastBatch() const;

private:
  mutable std::recursive_mutex block_lock_;

  HeaderHash base_tip_;
  std::vector<Blund> active_;  // oldest first
  BlockNotifications notifications_;
  db::SomeBatchOp last_batch_;
};

} // namespace chain
} // namespace walletsync
