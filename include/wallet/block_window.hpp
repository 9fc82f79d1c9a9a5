// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/chrono.hpp"
#include "util/log_safe.hpp"
#include <vector>

namespace walletsync {
namespace wallet {

/**
 * One transaction of a block window together with its undo entry and the
 * header of the block that contains it.
 *
 * LIFETIME: `tx` and `undo` point into the Blund they were extracted from;
 * a TxWithUndo must not outlive the window.
 */
struct TxWithUndo {
  const chain::Tx *tx{nullptr};
  const chain::TxUndo *undo{nullptr};
  chain::BlockHeader header;
};

// Genesis block: empty. Main block: txs zipped with undo entries in block
// order; if the lengths differ only the common prefix is returned (and a
// warning is logged to `logger`).
std::vector<TxWithUndo> ExtractTxsWithUndo(const chain::Blund &blund,
                                           const util::SafeLogger &logger);

// Oldest block first, block order preserved
std::vector<TxWithUndo> FlattenForApply(const chain::OldestFirst<chain::Blund> &window,
                                        const util::SafeLogger &logger);

// Newest block first, each block's transactions reversed
std::vector<TxWithUndo> FlattenForRollback(const chain::NewestFirst<chain::Blund> &window,
                                           const util::SafeLogger &logger);

// Tip a wallet moves to after the window: hash of the newest block
chain::HeaderHash ApplyWindowNewTip(const chain::OldestFirst<chain::Blund> &window);

// Tip a wallet retreats to: prev hash of the oldest block in the window
chain::HeaderHash RollbackWindowNewTip(const chain::NewestFirst<chain::Blund> &window);

} // namespace wallet
} // namespace walletsync
