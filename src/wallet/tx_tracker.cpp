// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "wallet/tx_tracker.hpp"
#include <algorithm>
#include <set>

namespace walletsync {
namespace wallet {

namespace {

// Sum of owned outputs and owned spent inputs of one transaction
struct OwnedAmounts {
  chain::Coin received{0};
  chain::Coin spent{0};
  bool relevant{false};
};

OwnedAmounts ScanTx(const WalletKey &key, const TxWithUndo &t) {
  OwnedAmounts amounts;
  const size_t n_inputs = std::min(t.tx->inputs.size(), t.undo->size());
  for (size_t i = 0; i < n_inputs; ++i) {
    const chain::TxOut &prev = (*t.undo)[i];
    if (key.Owns(prev.address)) {
      amounts.spent += prev.value;
      amounts.relevant = true;
    }
  }
  for (const auto &out : t.tx->outputs) {
    if (key.Owns(out.address)) {
      amounts.received += out.value;
      amounts.relevant = true;
    }
  }
  return amounts;
}

// Owned addresses touched by a transaction, inputs first
std::vector<chain::Address> OwnedAddresses(const WalletKey &key, const TxWithUndo &t) {
  std::vector<chain::Address> addrs;
  const size_t n_inputs = std::min(t.tx->inputs.size(), t.undo->size());
  for (size_t i = 0; i < n_inputs; ++i) {
    if (key.Owns((*t.undo)[i].address)) {
      addrs.push_back((*t.undo)[i].address);
    }
  }
  for (const auto &out : t.tx->outputs) {
    if (key.Owns(out.address)) {
      addrs.push_back(out.address);
    }
  }
  return addrs;
}

void RecordHistory(WalletModifier &mod, const TxWithUndo &t, const OwnedAmounts &amounts,
                   const DifficultyFn &difficulty_of, const TimestampFn &timestamp_of) {
  TxHistoryEntry entry;
  entry.tx_id = t.tx->id;
  entry.difficulty = difficulty_of(t.header);
  entry.timestamp = timestamp_of(t.header);
  entry.received = amounts.received;
  entry.spent = amounts.spent;
  mod.history[entry.tx_id] = entry;
}

void SortLists(WalletModifier &mod) {
  std::sort(mod.used_addresses.begin(), mod.used_addresses.end());
  std::sort(mod.ptx_confirmed.begin(), mod.ptx_confirmed.end());
}

} // anonymous namespace

WalletModifier AddressTxTracker::TrackingApplyTxs(const WalletKey &key,
                                                  const CustomAddresses &used,
                                                  const DifficultyFn &difficulty_of,
                                                  const TimestampFn &timestamp_of,
                                                  const BlockInfoFn &block_info_of,
                                                  const std::vector<TxWithUndo> &txs) const {
  WalletModifier mod;
  std::set<chain::Address> first_seen;

  for (const auto &t : txs) {
    const chain::Tx &tx = *t.tx;
    const chain::HeaderHash block_hash = chain::HeaderHashOf(t.header);

    const size_t n_inputs = std::min(tx.inputs.size(), t.undo->size());
    for (size_t i = 0; i < n_inputs; ++i) {
      const chain::TxOut &prev = (*t.undo)[i];
      if (!key.Owns(prev.address)) continue;
      OutPoint op{tx.inputs[i].prev_id, tx.inputs[i].index};
      // Created earlier in this stream: the two cancel out
      if (mod.utxo_added.erase(op) == 0) {
        mod.utxo_spent[op] = prev;
      }
    }

    for (size_t j = 0; j < tx.outputs.size(); ++j) {
      if (key.Owns(tx.outputs[j].address)) {
        mod.utxo_added[OutPoint{tx.id, static_cast<uint32_t>(j)}] = tx.outputs[j];
      }
    }

    for (const auto &addr : OwnedAddresses(key, t)) {
      if (used.count(addr) == 0 && first_seen.insert(addr).second) {
        mod.used_addresses.emplace_back(addr, block_hash);
      }
    }

    const OwnedAmounts amounts = ScanTx(key, t);
    if (!amounts.relevant) continue;

    RecordHistory(mod, t, amounts, difficulty_of, timestamp_of);
    if (auto info = block_info_of(t.header)) {
      mod.ptx_confirmed.emplace_back(tx.id, *info);
    }
  }

  SortLists(mod);
  return mod;
}

WalletModifier AddressTxTracker::TrackingRollbackTxs(const WalletKey &key,
                                                     const CustomAddresses &used,
                                                     const DifficultyFn &difficulty_of,
                                                     const TimestampFn &timestamp_of,
                                                     const std::vector<TxWithUndo> &txs) const {
  WalletModifier mod;
  std::set<chain::Address> listed;

  for (const auto &t : txs) {
    const chain::Tx &tx = *t.tx;
    const chain::HeaderHash block_hash = chain::HeaderHashOf(t.header);

    for (size_t j = 0; j < tx.outputs.size(); ++j) {
      if (!key.Owns(tx.outputs[j].address)) continue;
      OutPoint op{tx.id, static_cast<uint32_t>(j)};
      // Spent later in the window (already seen, stream is reversed)
      if (mod.utxo_spent.erase(op) == 0) {
        mod.utxo_added[op] = tx.outputs[j];
      }
    }

    const size_t n_inputs = std::min(tx.inputs.size(), t.undo->size());
    for (size_t i = 0; i < n_inputs; ++i) {
      const chain::TxOut &prev = (*t.undo)[i];
      if (key.Owns(prev.address)) {
        mod.utxo_spent[OutPoint{tx.inputs[i].prev_id, tx.inputs[i].index}] = prev;
      }
    }

    for (const auto &addr : OwnedAddresses(key, t)) {
      auto it = used.find(addr);
      if (it != used.end() && it->second == block_hash && listed.insert(addr).second) {
        mod.used_addresses.emplace_back(addr, block_hash);
      }
    }

    const OwnedAmounts amounts = ScanTx(key, t);
    if (!amounts.relevant) continue;

    RecordHistory(mod, t, amounts, difficulty_of, timestamp_of);
    if (!chain::IsGenesis(t.header)) {
      if (auto difficulty = difficulty_of(t.header)) {
        mod.ptx_confirmed.emplace_back(tx.id, *difficulty);
      }
    }
  }

  SortLists(mod);
  return mod;
}

} // namespace wallet
} // namespace walletsync
