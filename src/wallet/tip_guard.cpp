// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "wallet/tip_guard.hpp"
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace walletsync {
namespace wallet {

using util::SecretOnly;
using util::SecurityLevel;

TipGuard::TipGuard(const WalletStore &store, util::SafeLogger logger)
    : store_(store), logger_(std::move(logger)) {}

SyncOutcome TipGuard::Guard(const HeaderHash &current_tip, const WalletId &wallet,
                            const std::function<void()> &action) const {
  const std::optional<WalletSyncState> state = store_.GetWalletSyncTip(wallet);

  if (!state) {
    logger_.Warn([&](SecurityLevel sl) {
      return fmt::format("There is no syncTip corresponding to wallet #{}",
                         SecretOnly(sl, wallet));
    });
    return SyncOutcome::SkippedUnknownWallet;
  }

  if (std::holds_alternative<NotSynced>(*state)) {
    logger_.Info([&](SecurityLevel sl) {
      return fmt::format("Wallet #{} hasn't been synced yet", SecretOnly(sl, wallet));
    });
    return SyncOutcome::SkippedNotSynced;
  }

  const HeaderHash &wallet_tip = std::get<SyncedWith>(*state).tip;
  if (wallet_tip != current_tip) {
    logger_.Warn([&](SecurityLevel sl) {
      return fmt::format("Skip wallet #{}, because of wallet's tip {} mismatched "
                         "with current tip {}",
                         SecretOnly(sl, wallet), wallet_tip.GetHex(), current_tip.GetHex());
    });
    return SyncOutcome::SkippedTipMismatch;
  }

  action();
  return SyncOutcome::Synced;
}

} // namespace wallet
} // namespace walletsync
