// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace walletsync {
namespace chain {

/**
 * Chronologically tagged, non-empty sequences
 *
 * Block windows travel as OldestFirst (apply) or NewestFirst (rollback). The
 * tag is part of the type so a rollback window can never be handed to the
 * apply path by accident, and emptiness is rejected at construction.
 */
template <typename T> class NewestFirst;

template <typename T> class OldestFirst {
public:
  // @throws std::invalid_argument if items is empty
  explicit OldestFirst(std::vector<T> items) : items_(std::move(items)) {
    if (items_.empty()) {
      throw std::invalid_argument("OldestFirst sequence must not be empty");
    }
  }

  const std::vector<T> &Get() const { return items_; }
  size_t size() const { return items_.size(); }

  const T &Oldest() const { return items_.front(); }
  const T &Newest() const { return items_.back(); }

  NewestFirst<T> ToNewestFirst() const {
    return NewestFirst<T>(std::vector<T>(items_.rbegin(), items_.rend()));
  }

private:
  std::vector<T> items_;
};

template <typename T> class NewestFirst {
public:
  // @throws std::invalid_argument if items is empty
  explicit NewestFirst(std::vector<T> items) : items_(std::move(items)) {
    if (items_.empty()) {
      throw std::invalid_argument("NewestFirst sequence must not be empty");
    }
  }

  const std::vector<T> &Get() const { return items_; }
  size_t size() const { return items_.size(); }

  const T &Newest() const { return items_.front(); }
  const T &Oldest() const { return items_.back(); }

  OldestFirst<T> ToOldestFirst() const {
    return OldestFirst<T>(std::vector<T>(items_.rbegin(), items_.rend()));
  }

private:
  std::vector<T> items_;
};

} // namespace chain
} // namespace walletsync
