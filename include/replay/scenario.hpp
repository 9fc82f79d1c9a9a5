// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/chrono.hpp"
#include "reporting/error_reporter.hpp"
#include "slotting/slotting.hpp"
#include "wallet/memory_wallet_store.hpp"
#include "wallet/types.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace walletsync {
namespace replay {

// Command-line configuration of walletsync-replay
struct ReplayConfig {
  std::filesystem::path scenario_path;
  size_t window{1};    // blocks per apply window
  size_t rollback{0};  // blocks rolled back after all windows are applied
  std::filesystem::path report_file;  // empty: reports go to the log
  std::filesystem::path secure_log;   // empty: secure log discarded
  std::string log_level{"info"};
  std::vector<std::string> debug_components;
  bool verbose{false};
};

class ScenarioError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct WalletSetup {
  wallet::WalletId id;
  std::set<chain::Address> addresses;
  // std::nullopt: key only, no store record (Unknown wallet)
  std::optional<wallet::WalletSyncState> sync_state;
  std::vector<chain::TxId> pending;
};

/**
 * Replay scenario, loaded from JSON:
 *
 *   {
 *     "version": 1,
 *     "slotting": {"system_start_us": 0, "slot_duration_ms": 20000,
 *                  "slots_per_epoch": 10},
 *     "base_tip": "<64 hex>",
 *     "blocks": [
 *       {"type": "genesis", "hash": "..", "prev": "..", "epoch": 0,
 *        "difficulty": 0},
 *       {"type": "main", "hash": "..", "prev": "..", "epoch": 0, "slot": 1,
 *        "difficulty": 1,
 *        "txs": [{"id": "..", "inputs": [{"prev_id": "..", "index": 0}],
 *                 "outputs": [{"address": "a", "value": 5}],
 *                 "undo": [{"address": "b", "value": 7}]}]}
 *     ],
 *     "wallets": [
 *       {"id": "w1", "addresses": ["a"], "sync": "base", "pending": [".."]}
 *     ]
 *   }
 *
 * Wallet "sync" is "base" (default: synced with base_tip), "not_synced",
 * "unknown", or a 64-hex tip. Blocks are listed oldest first.
 */
struct Scenario {
  slotting::Timestamp system_start{0};
  std::chrono::milliseconds slot_duration{20000};
  uint32_t slots_per_epoch{10};
  chain::HeaderHash base_tip;
  std::vector<chain::Blund> blocks;
  std::vector<WalletSetup> wallets;
};

// @throws ScenarioError on a malformed document
Scenario ParseScenario(const nlohmann::json &root);

// @throws ScenarioError if the file cannot be read or parsed
Scenario LoadScenario(const std::filesystem::path &path);

// Consecutive oldest-first windows of at most `window` blocks
// @throws ScenarioError if window is 0
std::vector<chain::OldestFirst<chain::Blund>> ChunkWindows(const std::vector<chain::Blund> &blocks,
                                                           size_t window);

// Wallet view as JSON: sync state, balance, utxo count, history, pending
nlohmann::json WalletStateToJson(const wallet::MemoryWalletStore &store,
                                 const wallet::WalletId &wallet);

/**
 * Replay `scenario` through a BlockPipeline with a WalletBlockListener
 * attached: apply all blocks in windows of config.window, then roll back
 * config.rollback blocks. The wall clock is pinned to the epoch after the
 * newest block for the duration of the run.
 *
 * Returns {"tip", "height", "windows": [...], "wallets": {...}}.
 * @throws ScenarioError if the pipeline rejects a window
 */
nlohmann::json RunScenario(const Scenario &scenario, const ReplayConfig &config,
                           reporting::ErrorReporter &reporter);

} // namespace replay
} // namespace walletsync
