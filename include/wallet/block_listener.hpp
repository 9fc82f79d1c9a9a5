// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/chain_tip.hpp"
#include "chain/chrono.hpp"
#include "chain/notifications.hpp"
#include "db/batch_op.hpp"
#include "reporting/error_reporter.hpp"
#include "slotting/slotting.hpp"
#include "util/log_safe.hpp"
#include "wallet/block_window.hpp"
#include "wallet/key_store.hpp"
#include "wallet/sync_isolation.hpp"
#include "wallet/tip_guard.hpp"
#include "wallet/tx_tracker.hpp"
#include "wallet/wallet_store.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace walletsync {
namespace wallet {

// Outcome of one apply or rollback event across all tracked wallets
struct SyncReport {
  std::string phase;  // "apply" or "rollback"
  size_t block_count{0};
  size_t tx_count{0};
  std::optional<HeaderHash> current_tip;  // unset if the chain tip could not be read
  HeaderHash new_tip;
  std::vector<WalletSyncResult> results;  // wallet-store order

  size_t SyncedCount() const;
  size_t FailedCount() const;
  size_t SkippedCount() const;
};

/**
 * WalletBlockListener - keeps wallet views in step with the chain
 *
 * Called by the block pipeline under its block lock, once per apply or
 * rollback event. For every wallet in the store, the window's transaction
 * stream is turned into a WalletModifier by the TxTracker and written to the
 * store, provided the wallet's sync tip equals the current chain tip
 * (TipGuard). Each wallet runs inside a SyncIsolator, so one wallet's failure
 * neither stops the others nor reaches the caller. The whole event is
 * watched by a LongActionWatcher with a threshold of half the current slot
 * duration.
 *
 * The returned batch is always empty: wallet state is written directly
 * through WalletStore rather than committed with the block data.
 */
class WalletBlockListener {
public:
  struct Subscriptions {
    chain::BlockNotifications::Subscription apply;
    chain::BlockNotifications::Subscription rollback;
  };

  // LIFETIME: all collaborators must outlive the listener
  WalletBlockListener(const chain::ChainTip &chain_tip, const slotting::Slotting &slotting,
                      WalletStore &store, const KeyStore &keys, const TxTracker &tracker,
                      reporting::ErrorReporter &reporter,
                      util::SafeLogger logger = util::SafeLogger::ForComponent("wallet"));

  // Pipeline callbacks. Never throw.
  db::SomeBatchOp OnApplyBlocks(const chain::OldestFirst<chain::Blund> &blunds);
  db::SomeBatchOp OnRollbackBlocks(const chain::NewestFirst<chain::Blund> &blunds);

  // Same as the callbacks, returning the per-wallet outcome. Never throw.
  SyncReport ApplyBlocks(const chain::OldestFirst<chain::Blund> &blunds);
  SyncReport RollbackBlocks(const chain::NewestFirst<chain::Blund> &blunds);

  // Register OnApplyBlocks/OnRollbackBlocks with `notifications`
  [[nodiscard]] Subscriptions Subscribe(chain::BlockNotifications &notifications);

private:
  void SyncApply(const chain::OldestFirst<chain::Blund> &blunds, SyncReport &report);
  void SyncRollback(const chain::NewestFirst<chain::Blund> &blunds, SyncReport &report);

  void SyncWalletApply(const WalletId &wallet, const HeaderHash &new_tip,
                       const std::vector<TxWithUndo> &txs, size_t block_count);
  void SyncWalletRollback(const WalletId &wallet, const HeaderHash &new_tip,
                          const std::vector<TxWithUndo> &txs, size_t block_count);

  // Header -> slot start time, resolved from the current slotting data
  slotting::HeaderTimestampFn HeaderTimestampGetter() const;

  // Run `action` under the overrun watcher for `phase`
  void ReportTimeouts(const std::string &phase, const std::function<void()> &action) const;

  void ReportTopLevelFailure(const std::string &phase, const std::string &what) const;

  const chain::ChainTip &chain_tip_;
  const slotting::Slotting &slotting_;
  WalletStore &store_;
  const KeyStore &keys_;
  const TxTracker &tracker_;
  reporting::ErrorReporter &reporter_;
  util::SafeLogger logger_;
  TipGuard guard_;
  SyncIsolator isolator_;
};

} // namespace wallet
} // namespace walletsync
