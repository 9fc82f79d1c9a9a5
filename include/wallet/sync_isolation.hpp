// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "reporting/error_reporter.hpp"
#include "util/log_safe.hpp"
#include "wallet/types.hpp"
#include <functional>
#include <string>

namespace walletsync {
namespace wallet {

// Result of synchronizing one wallet with one window
struct WalletSyncResult {
  WalletId wallet_id;
  SyncOutcome outcome{SyncOutcome::Failed};
  std::string error;  // empty unless outcome == Failed

  bool Ok() const { return outcome != SyncOutcome::Failed; }
};

/**
 * SyncIsolator - runs one wallet's sync action and contains its failures
 *
 * Any exception escaping the action is turned into a Failed result: the
 * redacted failure text goes to the ErrorReporter (errors from the reporter
 * itself are only logged) and a warning naming the wallet, the phase and the
 * failure is logged. Run() does not throw.
 */
class SyncIsolator {
public:
  // LIFETIME: `reporter` must outlive the isolator
  SyncIsolator(reporting::ErrorReporter &reporter, util::SafeLogger logger);

  WalletSyncResult Run(const WalletId &wallet, const std::string &phase,
                       const std::function<SyncOutcome()> &action) const;

private:
  WalletSyncResult Fail(const WalletId &wallet, const std::string &phase,
                        const std::string &what) const;

  reporting::ErrorReporter &reporter_;
  util::SafeLogger logger_;
};

} // namespace wallet
} // namespace walletsync
