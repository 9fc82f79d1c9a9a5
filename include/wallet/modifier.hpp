// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "slotting/slotting.hpp"
#include "util/log_safe.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace walletsync {
namespace wallet {

struct OutPoint {
  chain::TxId tx_id;
  uint32_t index{0};

  friend bool operator==(const OutPoint &a, const OutPoint &b) {
    return a.tx_id == b.tx_id && a.index == b.index;
  }
  friend bool operator<(const OutPoint &a, const OutPoint &b) {
    if (a.tx_id != b.tx_id) return a.tx_id < b.tx_id;
    return a.index < b.index;
  }
};

struct TxHistoryEntry {
  chain::TxId tx_id;
  std::optional<chain::ChainDifficulty> difficulty;
  std::optional<slotting::Timestamp> timestamp;
  chain::Coin received{0};  // paid to wallet addresses
  chain::Coin spent{0};     // taken from wallet addresses

  friend bool operator==(const TxHistoryEntry &a, const TxHistoryEntry &b) {
    return a.tx_id == b.tx_id && a.difficulty == b.difficulty &&
           a.timestamp == b.timestamp && a.received == b.received &&
           a.spent == b.spent;
  }
};

/**
 * Wallet-specific state delta computed from a transaction stream.
 *
 * The same structure serves both directions. From an apply stream it lists
 * what to add to the wallet view; from the rollback stream of the same
 * blocks it lists exactly the same entries, which the store then removes
 * (WalletStore::RollbackModifierFromWallet). The orchestrator passes it
 * through without inspecting it.
 */
struct WalletModifier {
  std::map<OutPoint, chain::TxOut> utxo_added;
  std::map<OutPoint, chain::TxOut> utxo_spent;
  std::map<chain::TxId, TxHistoryEntry> history;
  // First use of an address, sorted by address
  std::vector<std::pair<chain::Address, chain::HeaderHash>> used_addresses;
  // Wallet transactions seen in main blocks with the block difficulty,
  // sorted by tx id
  std::vector<std::pair<chain::TxId, chain::ChainDifficulty>> ptx_confirmed;

  bool IsEmpty() const;

  // Public rendering shows counts only; secure rendering lists entries
  std::string ToString(util::SecurityLevel sl) const;

  friend bool operator==(const WalletModifier &a, const WalletModifier &b) {
    return a.utxo_added == b.utxo_added && a.utxo_spent == b.utxo_spent &&
           a.history == b.history && a.used_addresses == b.used_addresses &&
           a.ptx_confirmed == b.ptx_confirmed;
  }
};

} // namespace wallet
} // namespace walletsync
