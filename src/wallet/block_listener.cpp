// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "wallet/block_listener.hpp"
#include "chain/validation.hpp"
#include "util/time_limit.hpp"
#include <chrono>
#include <exception>
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace walletsync {
namespace wallet {

using util::SecretOnly;
using util::SecurityLevel;

namespace {

const std::string kApplyPhase = "apply";
const std::string kRollbackPhase = "rollback";

std::optional<chain::ChainDifficulty> DifficultyOfHeader(const chain::BlockHeader &header) {
  return chain::DifficultyOf(header);
}

std::optional<chain::ChainDifficulty> BlockInfoOfHeader(const chain::BlockHeader &header) {
  if (chain::IsGenesis(header)) {
    return std::nullopt;
  }
  return chain::DifficultyOf(header);
}

SyncReport NewReport(const std::string &phase, size_t block_count,
                     const HeaderHash &new_tip) {
  SyncReport report;
  report.phase = phase;
  report.block_count = block_count;
  report.new_tip = new_tip;
  return report;
}

} // anonymous namespace

size_t SyncReport::SyncedCount() const {
  size_t n = 0;
  for (const auto &r : results) {
    if (r.outcome == SyncOutcome::Synced) ++n;
  }
  return n;
}

size_t SyncReport::FailedCount() const {
  size_t n = 0;
  for (const auto &r : results) {
    if (r.outcome == SyncOutcome::Failed) ++n;
  }
  return n;
}

size_t SyncReport::SkippedCount() const {
  return results.size() - SyncedCount() - FailedCount();
}

WalletBlockListener::WalletBlockListener(const chain::ChainTip &chain_tip,
                                         const slotting::Slotting &slotting,
                                         WalletStore &store, const KeyStore &keys,
                                         const TxTracker &tracker,
                                         reporting::ErrorReporter &reporter,
                                         util::SafeLogger logger)
    : chain_tip_(chain_tip), slotting_(slotting), store_(store), keys_(keys),
      tracker_(tracker), reporter_(reporter), logger_(std::move(logger)),
      guard_(store_, logger_), isolator_(reporter_, logger_) {}

db::SomeBatchOp WalletBlockListener::OnApplyBlocks(const chain::OldestFirst<chain::Blund> &blunds) {
  ApplyBlocks(blunds);
  // Wallet state is already written through the store
  return db::SomeBatchOp{};
}

db::SomeBatchOp
WalletBlockListener::OnRollbackBlocks(const chain::NewestFirst<chain::Blund> &blunds) {
  RollbackBlocks(blunds);
  return db::SomeBatchOp{};
}

SyncReport WalletBlockListener::ApplyBlocks(const chain::OldestFirst<chain::Blund> &blunds) {
  SyncReport report = NewReport(kApplyPhase, blunds.size(), ApplyWindowNewTip(blunds));
  try {
    ReportTimeouts(kApplyPhase, [&] { SyncApply(blunds, report); });
  } catch (const std::exception &e) {
    ReportTopLevelFailure(kApplyPhase, e.what());
  } catch (...) {
    ReportTopLevelFailure(kApplyPhase, "unknown exception");
  }
  return report;
}

SyncReport WalletBlockListener::RollbackBlocks(const chain::NewestFirst<chain::Blund> &blunds) {
  SyncReport report = NewReport(kRollbackPhase, blunds.size(), RollbackWindowNewTip(blunds));
  try {
    ReportTimeouts(kRollbackPhase, [&] { SyncRollback(blunds, report); });
  } catch (const std::exception &e) {
    ReportTopLevelFailure(kRollbackPhase, e.what());
  } catch (...) {
    ReportTopLevelFailure(kRollbackPhase, "unknown exception");
  }
  return report;
}

WalletBlockListener::Subscriptions
WalletBlockListener::Subscribe(chain::BlockNotifications &notifications) {
  Subscriptions subs;
  subs.apply = notifications.SubscribeApplyBlocks(
      [this](const chain::OldestFirst<chain::Blund> &blunds) { return OnApplyBlocks(blunds); });
  subs.rollback = notifications.SubscribeRollbackBlocks(
      [this](const chain::NewestFirst<chain::Blund> &blunds) { return OnRollbackBlocks(blunds); });
  return subs;
}

void WalletBlockListener::SyncApply(const chain::OldestFirst<chain::Blund> &blunds,
                                    SyncReport &report) {
  if (!chain::CheckWindowIsContinuous(blunds)) {
    logger_.Public().warn("Apply window of {} block(s) ending at {} is not continuous",
                          blunds.size(), report.new_tip.ShortHex());
  }

  const std::vector<TxWithUndo> txs = FlattenForApply(blunds, logger_);
  report.tx_count = txs.size();

  const HeaderHash current_tip = chain_tip_.GetTip();
  report.current_tip = current_tip;

  for (const WalletId &wallet : store_.GetWalletAddresses()) {
    report.results.push_back(isolator_.Run(wallet, kApplyPhase, [&] {
      return guard_.Guard(current_tip, wallet, [&] {
        SyncWalletApply(wallet, report.new_tip, txs, blunds.size());
      });
    }));
  }

  logger_.Public().debug("Wallet sync ({}): {} synced, {} skipped, {} failed", kApplyPhase,
                         report.SyncedCount(), report.SkippedCount(), report.FailedCount());
}

void WalletBlockListener::SyncRollback(const chain::NewestFirst<chain::Blund> &blunds,
                                       SyncReport &report) {
  if (!chain::CheckWindowIsContinuous(blunds)) {
    logger_.Public().warn("Rollback window of {} block(s) down to {} is not continuous",
                          blunds.size(), report.new_tip.ShortHex());
  }

  const std::vector<TxWithUndo> txs = FlattenForRollback(blunds, logger_);
  report.tx_count = txs.size();

  const HeaderHash current_tip = chain_tip_.GetTip();
  report.current_tip = current_tip;

  for (const WalletId &wallet : store_.GetWalletAddresses()) {
    report.results.push_back(isolator_.Run(wallet, kRollbackPhase, [&] {
      return guard_.Guard(current_tip, wallet, [&] {
        SyncWalletRollback(wallet, report.new_tip, txs, blunds.size());
      });
    }));
  }

  logger_.Public().debug("Wallet sync ({}): {} synced, {} skipped, {} failed", kRollbackPhase,
                         report.SyncedCount(), report.SkippedCount(), report.FailedCount());
}

void WalletBlockListener::SyncWalletApply(const WalletId &wallet, const HeaderHash &new_tip,
                                          const std::vector<TxWithUndo> &txs,
                                          size_t block_count) {
  const slotting::HeaderTimestampFn timestamp_of = HeaderTimestampGetter();
  const CustomAddresses used = store_.GetCustomAddresses(CustomAddressType::UsedAddr);
  const WalletKey key = keys_.GetSecretKeyById(wallet);

  const WalletModifier modifier = tracker_.TrackingApplyTxs(
      key, used, DifficultyOfHeader, timestamp_of, BlockInfoOfHeader, txs);
  store_.ApplyModifierToWallet(wallet, new_tip, modifier);

  logger_.Info([&](SecurityLevel sl) {
    return fmt::format("Applied {} block(s) to wallet {}, {}", block_count,
                       SecretOnly(sl, wallet), modifier.ToString(sl));
  });
}

void WalletBlockListener::SyncWalletRollback(const WalletId &wallet, const HeaderHash &new_tip,
                                             const std::vector<TxWithUndo> &txs,
                                             size_t block_count) {
  const WalletKey key = keys_.GetSecretKeyById(wallet);
  const slotting::HeaderTimestampFn timestamp_of = HeaderTimestampGetter();
  const CustomAddresses used = store_.GetCustomAddresses(CustomAddressType::UsedAddr);

  const WalletModifier modifier =
      tracker_.TrackingRollbackTxs(key, used, DifficultyOfHeader, timestamp_of, txs);
  store_.RollbackModifierFromWallet(wallet, new_tip, modifier);

  logger_.Info([&](SecurityLevel sl) {
    return fmt::format("Rolled back {} block(s) from wallet {}, {}", block_count,
                       SecretOnly(sl, wallet), modifier.ToString(sl));
  });
}

slotting::HeaderTimestampFn WalletBlockListener::HeaderTimestampGetter() const {
  return slotting::MakeHeaderTimestampFn(slotting_.GetSystemStart(),
                                         slotting_.GetSlottingData());
}

void WalletBlockListener::ReportTimeouts(const std::string &phase,
                                         const std::function<void()> &action) const {
  std::chrono::milliseconds first_warning{0};
  try {
    first_warning = slotting_.GetCurrentEpochSlotDuration() / 2;
  } catch (const std::exception &e) {
    logger_.Public().warn("Cannot read slot duration, {} runs unwatched: {}", phase, e.what());
  }

  util::LogWarningWaitInf(first_warning, "Wallet blistener " + phase, logger_.PublicPtr(),
                          action);
}

void WalletBlockListener::ReportTopLevelFailure(const std::string &phase,
                                                const std::string &what) const {
  const std::string message = fmt::format("Failed to sync wallets in BListener ({}): {}",
                                          phase, what);
  try {
    reporter_.TryReport(message);
  } catch (const std::exception &e) {
    logger_.Public().warn("Error reporter failed: {}", e.what());
  } catch (...) {
    logger_.Public().warn("Error reporter failed: unknown exception");
  }
  logger_.Public().error("{}", message);
}

} // namespace wallet
} // namespace walletsync
