// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/chrono.hpp"
#include "db/batch_op.hpp"
#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>

namespace walletsync {
namespace chain {

/**
 * Notification system for block application events
 *
 * - Simple observer pattern with std::function
 * - Synchronous callbacks, invoked in subscription order
 * - RAII-based subscription management
 *
 * Callbacks run while the block pipeline holds its block lock:
 *
 *   - On ApplyBlocks: the chain tip is still the tip BEFORE the window,
 *     i.e. the oldest block's prev_hash
 *   - On RollbackBlocks: the chain tip is still the newest block of the
 *     window, i.e. the block about to be removed first
 *
 * Every callback returns a SomeBatchOp; the notifier merges them in order.
 */
class BlockNotifications {
public:
  /**
   * Subscription handle - RAII wrapper
   * Automatically unsubscribes when destroyed
   */
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    // Movable but not copyable
    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;
    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    void Unsubscribe();

  private:
    friend class BlockNotifications;
    Subscription(BlockNotifications *owner, size_t id);

    BlockNotifications *owner_{nullptr};
    size_t id_{0};
    bool active_{false};
  };

  using ApplyBlocksCallback =
      std::function<db::SomeBatchOp(const OldestFirst<Blund> &blunds)>;
  using RollbackBlocksCallback =
      std::function<db::SomeBatchOp(const NewestFirst<Blund> &blunds)>;

  BlockNotifications() = default;
  BlockNotifications(const BlockNotifications &) = delete;
  BlockNotifications &operator=(const BlockNotifications &) = delete;

  [[nodiscard]] Subscription SubscribeApplyBlocks(ApplyBlocksCallback callback);
  [[nodiscard]] Subscription SubscribeRollbackBlocks(RollbackBlocksCallback callback);

  db::SomeBatchOp NotifyApplyBlocks(const OldestFirst<Blund> &blunds);
  db::SomeBatchOp NotifyRollbackBlocks(const NewestFirst<Blund> &blunds);

  size_t SubscriberCount() const;

private:
  void Unsubscribe(size_t id);

  struct CallbackEntry {
    size_t id;
    ApplyBlocksCallback apply_blocks;
    RollbackBlocksCallback rollback_blocks;
  };

  // Snapshot of entries so callbacks may (un)subscribe without deadlocking
  std::vector<CallbackEntry> SnapshotCallbacks() const;

  mutable std::mutex mutex_;
  std::vector<CallbackEntry> callbacks_;
  size_t next_id_{1}; // 0 reserved for invalid
};

} // namespace chain
} // namespace walletsync
