// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "replay/scenario.hpp"
#include "chain/block_pipeline.hpp"
#include "chain/validation.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include "wallet/block_listener.hpp"
#include "wallet/key_store.hpp"
#include "wallet/tx_tracker.hpp"
#include <algorithm>
#include <fstream>
#include <spdlog/fmt/fmt.h>

using json = nlohmann::json;

namespace walletsync {
namespace replay {

namespace {

const json &RequireField(const json &obj, const char *key, const std::string &where) {
  if (!obj.is_object() || !obj.contains(key)) {
    throw ScenarioError(fmt::format("{}: missing field '{}'", where, key));
  }
  return obj[key];
}

chain::HeaderHash RequireHash(const json &obj, const char *key, const std::string &where) {
  const json &value = RequireField(obj, key, where);
  if (!value.is_string()) {
    throw ScenarioError(fmt::format("{}.{}: expected hex string", where, key));
  }
  auto hash = util::SafeParseHash(value.get<std::string>());
  if (!hash) {
    throw ScenarioError(fmt::format("{}.{}: invalid hash", where, key));
  }
  return *hash;
}

uint64_t RequireUnsigned(const json &obj, const char *key, const std::string &where) {
  const json &value = RequireField(obj, key, where);
  if (!value.is_number_unsigned()) {
    throw ScenarioError(fmt::format("{}.{}: expected non-negative integer", where, key));
  }
  return value.get<uint64_t>();
}

uint64_t OptionalUnsigned(const json &obj, const char *key, uint64_t fallback,
                          const std::string &where) {
  if (!obj.contains(key)) {
    return fallback;
  }
  return RequireUnsigned(obj, key, where);
}

chain::TxOut ParseTxOut(const json &j, const std::string &where) {
  chain::TxOut out;
  const json &address = RequireField(j, "address", where);
  if (!address.is_string()) {
    throw ScenarioError(where + ".address: expected string");
  }
  out.address = address.get<std::string>();
  out.value = RequireUnsigned(j, "value", where);
  return out;
}

// Returns the tx and its undo entry
std::pair<chain::Tx, chain::TxUndo> ParseTx(const json &j, const std::string &where) {
  chain::Tx tx;
  chain::TxUndo undo;
  tx.id = RequireHash(j, "id", where);

  const json empty = json::array();
  const json &inputs = j.contains("inputs") ? j["inputs"] : empty;
  const json &outputs = j.contains("outputs") ? j["outputs"] : empty;
  const json &undo_json = j.contains("undo") ? j["undo"] : empty;
  if (!inputs.is_array() || !outputs.is_array() || !undo_json.is_array()) {
    throw ScenarioError(where + ": inputs, outputs and undo must be arrays");
  }

  for (size_t i = 0; i < inputs.size(); ++i) {
    const std::string in_where = fmt::format("{}.inputs[{}]", where, i);
    chain::TxIn in;
    in.prev_id = RequireHash(inputs[i], "prev_id", in_where);
    in.index = static_cast<uint32_t>(RequireUnsigned(inputs[i], "index", in_where));
    tx.inputs.push_back(in);
  }
  for (size_t i = 0; i < outputs.size(); ++i) {
    tx.outputs.push_back(ParseTxOut(outputs[i], fmt::format("{}.outputs[{}]", where, i)));
  }
  for (size_t i = 0; i < undo_json.size(); ++i) {
    undo.push_back(ParseTxOut(undo_json[i], fmt::format("{}.undo[{}]", where, i)));
  }
  return {std::move(tx), std::move(undo)};
}

chain::Blund ParseBlock(const json &j, const std::string &where) {
  const std::string type = j.value("type", std::string("main"));
  const chain::HeaderHash hash = RequireHash(j, "hash", where);
  const chain::HeaderHash prev = RequireHash(j, "prev", where);
  const uint64_t epoch = RequireUnsigned(j, "epoch", where);
  const uint64_t difficulty = OptionalUnsigned(j, "difficulty", 0, where);

  if (type == "genesis") {
    chain::GenesisBlock block{chain::GenesisBlockHeader{hash, prev, epoch, difficulty}};
    return chain::Blund{block, chain::Undo{}};
  }
  if (type != "main") {
    throw ScenarioError(fmt::format("{}.type: unknown block type '{}'", where, type));
  }

  chain::MainBlock block;
  block.header.hash = hash;
  block.header.prev_hash = prev;
  block.header.slot.epoch = epoch;
  block.header.slot.slot = static_cast<uint32_t>(RequireUnsigned(j, "slot", where));
  block.header.difficulty = difficulty;

  chain::Undo undo;
  if (j.contains("txs")) {
    const json &txs = j["txs"];
    if (!txs.is_array()) {
      throw ScenarioError(where + ".txs: expected array");
    }
    for (size_t i = 0; i < txs.size(); ++i) {
      auto [tx, tx_undo] = ParseTx(txs[i], fmt::format("{}.txs[{}]", where, i));
      block.txs.push_back(std::move(tx));
      undo.tx_undo.push_back(std::move(tx_undo));
    }
  }
  return chain::Blund{block, undo};
}

WalletSetup ParseWallet(const json &j, const chain::HeaderHash &base_tip,
                       const std::string &where) {
  WalletSetup setup;
  const json &id = RequireField(j, "id", where);
  if (!id.is_string() || id.get<std::string>().empty()) {
    throw ScenarioError(where + ".id: expected non-empty string");
  }
  setup.id = wallet::WalletId(id.get<std::string>());

  if (j.contains("addresses")) {
    for (const auto &addr : j["addresses"]) {
      if (!addr.is_string()) {
        throw ScenarioError(where + ".addresses: expected strings");
      }
      setup.addresses.insert(addr.get<std::string>());
    }
  }

  const std::string sync = j.value("sync", std::string("base"));
  if (sync == "base") {
    setup.sync_state = wallet::SyncedWith{base_tip};
  } else if (sync == "not_synced") {
    setup.sync_state = wallet::NotSynced{};
  } else if (sync == "unknown") {
    setup.sync_state = std::nullopt;
  } else {
    auto tip = util::SafeParseHash(sync);
    if (!tip) {
      throw ScenarioError(fmt::format("{}.sync: invalid value '{}'", where, sync));
    }
    setup.sync_state = wallet::SyncedWith{*tip};
  }

  if (j.contains("pending")) {
    for (const auto &p : j["pending"]) {
      std::optional<uint256> tx_id;
      if (p.is_string()) {
        tx_id = util::SafeParseHash(p.get<std::string>());
      }
      if (!tx_id) {
        throw ScenarioError(where + ".pending: invalid tx id");
      }
      setup.pending.push_back(*tx_id);
    }
  }
  return setup;
}

uint64_t BlockEpoch(const chain::Blund &blund) {
  const chain::BlockHeader header = chain::GetBlockHeader(blund.block);
  if (const auto *genesis = std::get_if<chain::GenesisBlockHeader>(&header)) {
    return genesis->epoch;
  }
  return std::get<chain::MainBlockHeader>(header).slot.epoch;
}

// Mock clock value (seconds) at the start of the epoch after the newest block
int64_t ReplayClockSeconds(const Scenario &scenario) {
  uint64_t max_epoch = 0;
  for (const auto &blund : scenario.blocks) {
    max_epoch = std::max(max_epoch, BlockEpoch(blund));
  }
  const auto epoch_length = std::chrono::duration_cast<slotting::Timestamp>(
      scenario.slot_duration * scenario.slots_per_epoch);
  const slotting::Timestamp at =
      scenario.system_start + epoch_length * static_cast<int64_t>(max_epoch + 1);
  return std::max<int64_t>(1, std::chrono::ceil<std::chrono::seconds>(at).count());
}

} // anonymous namespace

Scenario ParseScenario(const json &root) {
  try {
    if (!root.is_object()) {
      throw ScenarioError("scenario: expected JSON object");
    }
    const int version = root.value("version", 1);
    if (version != 1) {
      throw ScenarioError(fmt::format("scenario: unsupported version {}", version));
    }

    Scenario scenario;
    if (root.contains("slotting")) {
      const json &s = root["slotting"];
      scenario.system_start = slotting::Timestamp(static_cast<int64_t>(
          OptionalUnsigned(s, "system_start_us", 0, "slotting")));
      scenario.slot_duration = std::chrono::milliseconds(static_cast<int64_t>(
          OptionalUnsigned(s, "slot_duration_ms", 20000, "slotting")));
      scenario.slots_per_epoch = static_cast<uint32_t>(
          OptionalUnsigned(s, "slots_per_epoch", 10, "slotting"));
    }
    if (scenario.slot_duration.count() <= 0 || scenario.slots_per_epoch == 0) {
      throw ScenarioError("slotting: slot_duration_ms and slots_per_epoch must be positive");
    }

    scenario.base_tip = RequireHash(root, "base_tip", "scenario");

    if (root.contains("blocks")) {
      const json &blocks = root["blocks"];
      for (size_t i = 0; i < blocks.size(); ++i) {
        scenario.blocks.push_back(ParseBlock(blocks[i], fmt::format("blocks[{}]", i)));
      }
    }
    if (root.contains("wallets")) {
      const json &wallets = root["wallets"];
      for (size_t i = 0; i < wallets.size(); ++i) {
        scenario.wallets.push_back(
            ParseWallet(wallets[i], scenario.base_tip, fmt::format("wallets[{}]", i)));
      }
    }
    return scenario;
  } catch (const json::exception &e) {
    throw ScenarioError(std::string("scenario: ") + e.what());
  }
}

Scenario LoadScenario(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ScenarioError("cannot open scenario file " + path.string());
  }

  json root;
  try {
    file >> root;
  } catch (const json::exception &e) {
    throw ScenarioError(fmt::format("failed to parse {}: {}", path.string(), e.what()));
  }

  Scenario scenario = ParseScenario(root);
  LOG_APP_INFO("Loaded scenario {}: {} block(s), {} wallet(s)", path.string(),
               scenario.blocks.size(), scenario.wallets.size());
  return scenario;
}

std::vector<chain::OldestFirst<chain::Blund>> ChunkWindows(const std::vector<chain::Blund> &blocks,
                                                           size_t window) {
  if (window == 0) {
    throw ScenarioError("window size must be positive");
  }
  std::vector<chain::OldestFirst<chain::Blund>> windows;
  for (size_t start = 0; start < blocks.size(); start += window) {
    const size_t end = std::min(blocks.size(), start + window);
    windows.emplace_back(std::vector<chain::Blund>(
        blocks.begin() + static_cast<std::ptrdiff_t>(start),
        blocks.begin() + static_cast<std::ptrdiff_t>(end)));
  }
  return windows;
}

json WalletStateToJson(const wallet::MemoryWalletStore &store, const wallet::WalletId &wallet) {
  const wallet::WalletSnapshot snap = store.Snapshot(wallet);

  chain::Coin balance = 0;
  for (const auto &[op, out] : snap.utxo) {
    balance += out.value;
  }

  json history = json::array();
  for (const auto &[id, entry] : snap.history) {
    json h;
    h["tx"] = id.GetHex();
    h["received"] = entry.received;
    h["spent"] = entry.spent;
    h["difficulty"] = entry.difficulty ? json(*entry.difficulty) : json(nullptr);
    h["timestamp_us"] = entry.timestamp ? json(entry.timestamp->count()) : json(nullptr);
    history.push_back(h);
  }

  json pending = json::object();
  for (const auto &[id, state] : snap.pending) {
    if (const auto *in_block = std::get_if<wallet::PtxInBlock>(&state)) {
      pending[id.GetHex()] = fmt::format("in_block:{}", in_block->difficulty);
    } else {
      pending[id.GetHex()] = "pending";
    }
  }

  json out;
  out["sync"] = wallet::SyncStateToString(snap.sync_state);
  out["balance"] = balance;
  out["utxo_count"] = snap.utxo.size();
  out["history"] = history;
  out["pending"] = pending;
  return out;
}

json RunScenario(const Scenario &scenario, const ReplayConfig &config,
                 reporting::ErrorReporter &reporter) {
  const auto windows = ChunkWindows(scenario.blocks, config.window);

  util::MockTimeScope clock(ReplayClockSeconds(scenario));
  slotting::FixedSlotting slotting(scenario.system_start, scenario.slot_duration,
                                   scenario.slots_per_epoch);

  chain::BlockPipeline pipeline(scenario.base_tip);
  wallet::MemoryWalletStore store;
  wallet::MemoryKeyStore keys;
  wallet::AddressTxTracker tracker;

  for (const auto &w : scenario.wallets) {
    keys.AddKey(wallet::WalletKey{w.id, {}, w.addresses});
    if (!w.sync_state) {
      continue;
    }
    store.SetWalletSyncTip(w.id, *w.sync_state);
    for (const auto &tx_id : w.pending) {
      store.AddPendingTx(w.id, tx_id);
    }
  }

  wallet::WalletBlockListener listener(pipeline, slotting, store, keys, tracker, reporter);
  auto subscriptions = listener.Subscribe(pipeline.Notifications());

  json steps = json::array();
  for (size_t i = 0; i < windows.size(); ++i) {
    chain::ValidationState state;
    if (!pipeline.ApplyBlocks(windows[i], state)) {
      throw ScenarioError(fmt::format("window {} rejected: {} ({})", i,
                                      state.GetRejectReason(), state.GetDebugMessage()));
    }
    steps.push_back({{"phase", "apply"},
                     {"blocks", windows[i].size()},
                     {"tip", pipeline.GetTip().GetHex()}});
  }

  if (config.rollback > 0) {
    chain::ValidationState state;
    if (!pipeline.RollbackBlocks(config.rollback, state)) {
      throw ScenarioError(fmt::format("rollback rejected: {} ({})", state.GetRejectReason(),
                                      state.GetDebugMessage()));
    }
    steps.push_back({{"phase", "rollback"},
                     {"blocks", config.rollback},
                     {"tip", pipeline.GetTip().GetHex()}});
  }

  json wallets = json::object();
  for (const auto &w : scenario.wallets) {
    wallets[w.id.ToString()] = WalletStateToJson(store, w.id);
  }

  LOG_APP_INFO("Replay finished at tip {} (height {})", pipeline.GetTip().ShortHex(),
               pipeline.GetHeight());

  json result;
  result["tip"] = pipeline.GetTip().GetHex();
  result["height"] = pipeline.GetHeight();
  result["windows"] = steps;
  result["wallets"] = wallets;
  return result;
}

} // namespace replay
} // namespace walletsync
