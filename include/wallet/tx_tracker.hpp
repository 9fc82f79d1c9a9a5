// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "slotting/slotting.hpp"
#include "wallet/block_window.hpp"
#include "wallet/modifier.hpp"
#include "wallet/types.hpp"
#include <functional>
#include <optional>
#include <vector>

namespace walletsync {
namespace wallet {

using DifficultyFn =
    std::function<std::optional<chain::ChainDifficulty>(const chain::BlockHeader &)>;
using TimestampFn = slotting::HeaderTimestampFn;
// Confirmation info for pending transactions: none for genesis headers
using BlockInfoFn =
    std::function<std::optional<chain::ChainDifficulty>(const chain::BlockHeader &)>;

// Computes the wallet delta for a transaction stream
class TxTracker {
public:
  virtual ~TxTracker() = default;

  virtual WalletModifier TrackingApplyTxs(const WalletKey &key, const CustomAddresses &used,
                                          const DifficultyFn &difficulty_of,
                                          const TimestampFn &timestamp_of,
                                          const BlockInfoFn &block_info_of,
                                          const std::vector<TxWithUndo> &txs) const = 0;

  // `txs` is a rollback stream (newest first, reversed per block)
  virtual WalletModifier TrackingRollbackTxs(const WalletKey &key, const CustomAddresses &used,
                                             const DifficultyFn &difficulty_of,
                                             const TimestampFn &timestamp_of,
                                             const std::vector<TxWithUndo> &txs) const = 0;
};

/**
 * AddressTxTracker - ownership by address
 *
 * An output belongs to the wallet when it pays to one of key.addresses; an
 * input belongs to the wallet when its undo entry (the spent output) does.
 * For the same window, TrackingApplyTxs over the apply stream and
 * TrackingRollbackTxs over the rollback stream (with the used set as left by
 * the apply) return equal modifiers.
 */
class AddressTxTracker : public TxTracker {
public:
  WalletModifier TrackingApplyTxs(const WalletKey &key, const CustomAddresses &used,
                                  const DifficultyFn &difficulty_of,
                                  const TimestampFn &timestamp_of,
                                  const BlockInfoFn &block_info_of,
                                  const std::vector<TxWithUndo> &txs) const override;

  WalletModifier TrackingRollbackTxs(const WalletKey &key, const CustomAddresses &used,
                                     const DifficultyFn &difficulty_of,
                                     const TimestampFn &timestamp_of,
                                     const std::vector<TxWithUndo> &txs) const override;
};

} // namespace wallet
} // namespace walletsync
