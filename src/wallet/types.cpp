// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "wallet/types.hpp"
#include <type_traits>

namespace walletsync {
namespace wallet {

std::string SyncStateToString(const std::optional<WalletSyncState> &state) {
  if (!state) {
    return "unknown";
  }
  return std::visit(
      [](const auto &s) -> std::string {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, NotSynced>) {
          return "not_synced";
        } else {
          return "synced_with:" + s.tip.GetHex();
        }
      },
      *state);
}

const char *SyncOutcomeToString(SyncOutcome outcome) {
  switch (outcome) {
  case SyncOutcome::Synced:
    return "synced";
  case SyncOutcome::SkippedUnknownWallet:
    return "skipped-unknown-wallet";
  case SyncOutcome::SkippedNotSynced:
    return "skipped-not-synced";
  case SyncOutcome::SkippedTipMismatch:
    return "skipped-tip-mismatch";
  case SyncOutcome::Failed:
    return "failed";
  }
  return "invalid";
}

} // namespace wallet
} // namespace walletsync
