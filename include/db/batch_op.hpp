// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace walletsync {
namespace db {

// Single write to be committed atomically with the block that produced it
class BatchOp {
public:
  virtual ~BatchOp() = default;
  virtual std::string ToString() const = 0;
};

/**
 * Ordered collection of batch operations returned by block listeners.
 * The pipeline merges the collections of all listeners and commits them
 * together with the block data.
 */
class SomeBatchOp {
public:
  SomeBatchOp() = default;

  void Append(std::shared_ptr<const BatchOp> op);
  void Merge(const SomeBatchOp &other);

  bool IsEmpty() const { return ops_.empty(); }
  size_t Size() const { return ops_.size(); }
  const std::vector<std::shared_ptr<const BatchOp>> &Ops() const { return ops_; }

private:
  std::vector<std::shared_ptr<const BatchOp>> ops_;
};

} // namespace db
} // namespace walletsync
