// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/log_safe.hpp"
#include "wallet/types.hpp"
#include "wallet/wallet_store.hpp"
#include <functional>

namespace walletsync {
namespace wallet {

/**
 * TipGuard - per-wallet eligibility check for a block window
 *
 * A window may only be applied to (or rolled back from) a wallet whose
 * recorded sync tip equals the chain tip before the window:
 *
 *   Unknown                  -> warning, action skipped
 *   NotSynced                -> info, action skipped
 *   SyncedWith(t), t != tip  -> warning naming t and tip, action skipped
 *   SyncedWith(tip)          -> action runs
 *
 * Exceptions from the store lookup or from the action propagate.
 */
class TipGuard {
public:
  // LIFETIME: `store` must outlive the guard
  TipGuard(const WalletStore &store, util::SafeLogger logger);

  SyncOutcome Guard(const HeaderHash &current_tip, const WalletId &wallet,
                    const std::function<void()> &action) const;

private:
  const WalletStore &store_;
  util::SafeLogger logger_;
};

} // namespace wallet
} // namespace walletsync
