// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "db/batch_op.hpp"
#include <utility>

namespace walletsync {
namespace db {

void SomeBatchOp::Append(std::shared_ptr<const BatchOp> op) {
  if (op) {
    ops_.push_back(std::move(op));
  }
}

void SomeBatchOp::Merge(const SomeBatchOp &other) {
  ops_.insert(ops_.end(), other.ops_.begin(), other.ops_.end());
}

} // namespace db
} // namespace walletsync
