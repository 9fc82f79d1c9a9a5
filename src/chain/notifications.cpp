// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/notifications.hpp"
#include <algorithm>

namespace walletsync {
namespace chain {

// ============================================================================
// BlockNotifications::Subscription
// ============================================================================

BlockNotifications::Subscription::Subscription(BlockNotifications *owner,
                                               size_t id)
    : owner_(owner), id_(id), active_(true) {}

BlockNotifications::Subscription::~Subscription() { Unsubscribe(); }

BlockNotifications::Subscription::Subscription(Subscription &&other) noexcept
    : owner_(other.owner_), id_(other.id_), active_(other.active_) {
  other.owner_ = nullptr;
  other.active_ = false;
}

BlockNotifications::Subscription &
BlockNotifications::Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = other.owner_;
    id_ = other.id_;
    active_ = other.active_;
    other.owner_ = nullptr;
    other.active_ = false;
  }
  return *this;
}

void BlockNotifications::Subscription::Unsubscribe() {
  if (active_ && owner_) {
    owner_->Unsubscribe(id_);
    active_ = false;
  }
}

// ============================================================================
// BlockNotifications
// ============================================================================

BlockNotifications::Subscription
BlockNotifications::SubscribeApplyBlocks(ApplyBlocksCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t id = next_id_++;

  CallbackEntry entry;
  entry.id = id;
  entry.apply_blocks = std::move(callback);
  callbacks_.push_back(std::move(entry));

  return Subscription(this, id);
}

BlockNotifications::Subscription
BlockNotifications::SubscribeRollbackBlocks(RollbackBlocksCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t id = next_id_++;

  CallbackEntry entry;
  entry.id = id;
  entry.rollback_blocks = std::move(callback);
  callbacks_.push_back(std::move(entry));

  return Subscription(this, id);
}

db::SomeBatchOp
BlockNotifications::NotifyApplyBlocks(const OldestFirst<Blund> &blunds) {
  db::SomeBatchOp merged;
  for (const auto &entry : SnapshotCallbacks()) {
    if (entry.apply_blocks) {
      merged.Merge(entry.apply_blocks(blunds));
    }
  }
  return merged;
}

db::SomeBatchOp
BlockNotifications::NotifyRollbackBlocks(const NewestFirst<Blund> &blunds) {
  db::SomeBatchOp merged;
  for (const auto &entry : SnapshotCallbacks()) {
    if (entry.rollback_blocks) {
      merged.Merge(entry.rollback_blocks(blunds));
    }
  }
  return merged;
}

size_t BlockNotifications::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return callbacks_.size();
}

std::vector<BlockNotifications::CallbackEntry>
BlockNotifications::SnapshotCallbacks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return callbacks_;
}

void BlockNotifications::Unsubscribe(size_t id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it =
      std::find_if(callbacks_.begin(), callbacks_.end(),
                   [id](const CallbackEntry &entry) { return entry.id == id; });

  if (it != callbacks_.end()) {
    callbacks_.erase(it);
  }
}

} // namespace chain
} // namespace walletsync
