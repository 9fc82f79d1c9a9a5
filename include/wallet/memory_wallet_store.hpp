// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "wallet/wallet_store.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <variant>
#include <vector>

namespace walletsync {
namespace wallet {

// Pending (submitted, not yet in a block) transaction state
struct PtxPending {
  friend bool operator==(const PtxPending &, const PtxPending &) { return true; }
};
struct PtxInBlock {
  chain::ChainDifficulty difficulty{0};
  friend bool operator==(const PtxInBlock &a, const PtxInBlock &b) {
    return a.difficulty == b.difficulty;
  }
};
using PendingTxState = std::variant<PtxPending, PtxInBlock>;

// Comparable copy of everything the store keeps for one wallet
struct WalletSnapshot {
  std::optional<WalletSyncState> sync_state;
  std::map<OutPoint, chain::TxOut> utxo;
  std::map<chain::TxId, TxHistoryEntry> history;
  std::map<chain::TxId, PendingTxState> pending;

  friend bool operator==(const WalletSnapshot &a, const WalletSnapshot &b) {
    return a.sync_state == b.sync_state && a.utxo == b.utxo &&
           a.history == b.history && a.pending == b.pending;
  }
};

/**
 * MemoryWalletStore - in-process WalletStore
 *
 * Thread-safe: every method takes the store mutex. Custom (used/change)
 * addresses are global to the store, as they are shared by all wallets.
 */
class MemoryWalletStore : public WalletStore {
public:
  MemoryWalletStore() = default;

  // WalletStore
  std::optional<WalletSyncState> GetWalletSyncTip(const WalletId &wallet) const override;
  std::vector<WalletId> GetWalletAddresses() const override;
  CustomAddresses GetCustomAddresses(CustomAddressType type) const override;
  void ApplyModifierToWallet(const WalletId &wallet, const HeaderHash &new_tip,
                             const WalletModifier &modifier) override;
  void RollbackModifierFromWallet(const WalletId &wallet, const HeaderHash &new_tip,
                                  const WalletModifier &modifier) override;

  // Register a wallet in NotSynced state. Returns false if it already exists.
  bool CreateWallet(const WalletId &wallet);

  // Overwrite the recorded sync state (registers the wallet if needed)
  void SetWalletSyncTip(const WalletId &wallet, const WalletSyncState &state);

  // Read accessors throw WalletNotFoundError for unknown wallets
  std::map<OutPoint, chain::TxOut> GetUtxo(const WalletId &wallet) const;
  chain::Coin GetBalance(const WalletId &wallet) const;
  std::map<chain::TxId, TxHistoryEntry> GetTxHistory(const WalletId &wallet) const;

  // Track a transaction submitted by the wallet
  void AddPendingTx(const WalletId &wallet, const chain::TxId &tx_id);
  std::optional<PendingTxState> GetPendingTxState(const WalletId &wallet,
                                                  const chain::TxId &tx_id) const;

  WalletSnapshot Snapshot(const WalletId &wallet) const;

private:
  struct WalletRecord {
    WalletSyncState sync_state{NotSynced{}};
    std::map<OutPoint, chain::TxOut> utxo;
    std::map<chain::TxId, TxHistoryEntry> history;
    std::map<chain::TxId, PendingTxState> pending;
  };

  // Caller must hold mutex_
  WalletRecord &RequireWallet(const WalletId &wallet);
  const WalletRecord &RequireWallet(const WalletId &wallet) const;

  mutable std::mutex mutex_;
  std::map<WalletId, WalletRecord> wallets_;
  std::map<CustomAddressType, CustomAddresses> custom_addresses_;
};

} // namespace wallet
} // namespace walletsync
