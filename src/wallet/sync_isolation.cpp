// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "wallet/sync_isolation.hpp"
#include <exception>
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace walletsync {
namespace wallet {

using util::SecretOnly;
using util::SecurityLevel;

SyncIsolator::SyncIsolator(reporting::ErrorReporter &reporter, util::SafeLogger logger)
    : reporter_(reporter), logger_(std::move(logger)) {}

WalletSyncResult SyncIsolator::Run(const WalletId &wallet, const std::string &phase,
                                   const std::function<SyncOutcome()> &action) const {
  try {
    return WalletSyncResult{wallet, action(), {}};
  } catch (const std::exception &e) {
    return Fail(wallet, phase, e.what());
  } catch (...) {
    return Fail(wallet, phase, "unknown exception");
  }
}

WalletSyncResult SyncIsolator::Fail(const WalletId &wallet, const std::string &phase,
                                    const std::string &what) const {
  auto prefix = [&](SecurityLevel sl) {
    return fmt::format("Failed to sync wallet {} in BListener ({}): ",
                       SecretOnly(sl, wallet), phase);
  };

  try {
    reporter_.TryReport(prefix(SecurityLevel::Public) + what);
  } catch (const std::exception &e) {
    logger_.Public().warn("Error reporter failed: {}", e.what());
  } catch (...) {
    logger_.Public().warn("Error reporter failed: unknown exception");
  }

  logger_.Warn([&](SecurityLevel sl) { return prefix(sl) + what; });
  return WalletSyncResult{wallet, SyncOutcome::Failed, what};
}

} // namespace wallet
} // namespace walletsync
