// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/block_pipeline.hpp"
#include "util/logging.hpp"
#include <spdlog/fmt/fmt.h>

namespace walletsync {
namespace chain {

BlockPipeline::BlockPipeline(const HeaderHash &base_tip) : base_tip_(base_tip) {}

HeaderHash BlockPipeline::GetTip() const {
  std::lock_guard<std::recursive_mutex> lock(block_lock_);
  return active_.empty() ? base_tip_ : BlundHash(active_.back());
}

size_t BlockPipeline::GetHeight() const {
  std::lock_guard<std::recursive_mutex> lock(block_lock_);
  return active_.size();
}

bool BlockPipeline::ApplyBlocks(const OldestFirst<Blund> &blunds,
                                ValidationState &state) {
  std::lock_guard<std::recursive_mutex> lock(block_lock_);

  if (!CheckWindowIsContinuous(blunds)) {
    return state.Invalid("non-continuous-window",
                         "blocks in the window are not chain-linked");
  }

  const HeaderHash tip = GetTip();
  if (BlundPrevHash(blunds.Oldest()) != tip) {
    return state.Invalid(
        "bad-prevblk",
        fmt::format("window starts at {} but tip is {}",
                    BlundPrevHash(blunds.Oldest()).ShortHex(), tip.ShortHex()));
  }

  // Listeners see the pre-window tip
  last_batch_ = notifications_.NotifyApplyBlocks(blunds);

  for (const auto &blund : blunds.Get()) {
    active_.push_back(blund);
  }

  LOG_CHAIN_DEBUG("Applied {} block(s), new tip {} (height {}, {} batch op(s))",
                  blunds.size(), GetTip().ShortHex(), active_.size(),
                  last_batch_.Size());
  return true;
}

bool BlockPipeline::RollbackBlocks(size_t count, ValidationState &state) {
  std::lock_guard<std::recursive_mutex> lock(block_lock_);

  if (count == 0) {
    return state.Invalid("empty-window", "nothing to roll back");
  }
  if (count > active_.size()) {
    return state.Invalid(
        "rollback-too-deep",
        fmt::format("requested {} block(s), only {} applied", count, active_.size()));
  }

  std::vector<Blund> newest_first(
      active_.rbegin(), active_.rbegin() + static_cast<std::ptrdiff_t>(count));
  NewestFirst<Blund> window(std::move(newest_first));

  // Listeners see the tip that is about to be removed
  last_batch_ = notifications_.NotifyRollbackBlocks(window);

  active_.erase(active_.end() - static_cast<std::ptrdiff_t>(count), active_.end());

  LOG_CHAIN_DEBUG("Rolled back {} block(s), new tip {} (height {})", count,
                  GetTip().ShortHex(), active_.size());
  return true;
}

const db::SomeBatchOp &BlockPipeline::LastBatch() const {
  std::lock_guard<std::recursive_mutex> lock(block_lock_);
  return last_batch_;
}

} // namespace chain
} // namespace walletsync
