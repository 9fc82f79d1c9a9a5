// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "wallet/memory_wallet_store.hpp"
#include "util/logging.hpp"

namespace walletsync {
namespace wallet {

MemoryWalletStore::WalletRecord &MemoryWalletStore::RequireWallet(const WalletId &wallet) {
  auto it = wallets_.find(wallet);
  if (it == wallets_.end()) {
    throw WalletNotFoundError("wallet is not tracked by the store");
  }
  return it->second;
}

const MemoryWalletStore::WalletRecord &
MemoryWalletStore::RequireWallet(const WalletId &wallet) const {
  auto it = wallets_.find(wallet);
  if (it == wallets_.end()) {
    throw WalletNotFoundError("wallet is not tracked by the store");
  }
  return it->second;
}

std::optional<WalletSyncState>
MemoryWalletStore::GetWalletSyncTip(const WalletId &wallet) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = wallets_.find(wallet);
  if (it == wallets_.end()) {
    return std::nullopt;
  }
  return it->second.sync_state;
}

std::vector<WalletId> MemoryWalletStore::GetWalletAddresses() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<WalletId> ids;
  ids.reserve(wallets_.size());
  for (const auto &[id, record] : wallets_) {
    ids.push_back(id);
  }
  return ids;
}

CustomAddresses MemoryWalletStore::GetCustomAddresses(CustomAddressType type) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = custom_addresses_.find(type);
  if (it == custom_addresses_.end()) {
    return {};
  }
  return it->second;
}

void MemoryWalletStore::ApplyModifierToWallet(const WalletId &wallet,
                                              const HeaderHash &new_tip,
                                              const WalletModifier &modifier) {
  std::lock_guard<std::mutex> lock(mutex_);
  WalletRecord &record = RequireWallet(wallet);

  for (const auto &[op, out] : modifier.utxo_added) {
    record.utxo[op] = out;
  }
  for (const auto &[op, out] : modifier.utxo_spent) {
    record.utxo.erase(op);
  }
  for (const auto &[id, entry] : modifier.history) {
    record.history[id] = entry;
  }

  CustomAddresses &used = custom_addresses_[CustomAddressType::UsedAddr];
  for (const auto &[address, hash] : modifier.used_addresses) {
    used.emplace(address, hash);
  }

  for (const auto &[id, difficulty] : modifier.ptx_confirmed) {
    auto it = record.pending.find(id);
    if (it != record.pending.end()) {
      it->second = PtxInBlock{difficulty};
    }
  }

  record.sync_state = SyncedWith{new_tip};
  LOG_WALLET_TRACE("store: applied modifier, tip -> {}", new_tip.ShortHex());
}

void MemoryWalletStore::RollbackModifierFromWallet(const WalletId &wallet,
                                                   const HeaderHash &new_tip,
                                                   const WalletModifier &modifier) {
  std::lock_guard<std::mutex> lock(mutex_);
  WalletRecord &record = RequireWallet(wallet);

  for (const auto &[op, out] : modifier.utxo_added) {
    record.utxo.erase(op);
  }
  for (const auto &[op, out] : modifier.utxo_spent) {
    record.utxo[op] = out;
  }
  for (const auto &[id, entry] : modifier.history) {
    record.history.erase(id);
  }

  // Only forget an address if it was first used by the block being removed
  CustomAddresses &used = custom_addresses_[CustomAddressType::UsedAddr];
  for (const auto &[address, hash] : modifier.used_addresses) {
    auto it = used.find(address);
    if (it != used.end() && it->second == hash) {
      used.erase(it);
    }
  }

  for (const auto &[id, difficulty] : modifier.ptx_confirmed) {
    auto it = record.pending.find(id);
    if (it != record.pending.end() && std::holds_alternative<PtxInBlock>(it->second)) {
      it->second = PtxPending{};
    }
  }

  record.sync_state = SyncedWith{new_tip};
  LOG_WALLET_TRACE("store: rolled back modifier, tip -> {}", new_tip.ShortHex());
}

bool MemoryWalletStore::CreateWallet(const WalletId &wallet) {
  std::lock_guard<std::mutex> lock(mutex_);
  return wallets_.emplace(wallet, WalletRecord{}).second;
}

void MemoryWalletStore::SetWalletSyncTip(const WalletId &wallet,
                                         const WalletSyncState &state) {
  std::lock_guard<std::mutex> lock(mutex_);
  wallets_[wallet].sync_state = state;
}

std::map<OutPoint, chain::TxOut> MemoryWalletStore::GetUtxo(const WalletId &wallet) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return RequireWallet(wallet).utxo;
}

chain::Coin MemoryWalletStore::GetBalance(const WalletId &wallet) const {
  std::lock_guard<std::mutex> lock(mutex_);
  chain::Coin total = 0;
  for (const auto &[op, out] : RequireWallet(wallet).utxo) {
    total += out.value;
  }
  return total;
}

std::map<chain::TxId, TxHistoryEntry>
MemoryWalletStore::GetTxHistory(const WalletId &wallet) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return RequireWallet(wallet).history;
}

void MemoryWalletStore::AddPendingTx(const WalletId &wallet, const chain::TxId &tx_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  RequireWallet(wallet).pending[tx_id] = PtxPending{};
}

std::optional<PendingTxState>
MemoryWalletStore::GetPendingTxState(const WalletId &wallet, const chain::TxId &tx_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const WalletRecord &record = RequireWallet(wallet);
  auto it = record.pending.find(tx_id);
  if (it == record.pending.end()) {
    return std::nullopt;
  }
  return it->second;
}

WalletSnapshot MemoryWalletStore::Snapshot(const WalletId &wallet) const {
  std::lock_guard<std::mutex> lock(mutex_);
  WalletSnapshot snap;
  auto it = wallets_.find(wallet);
  if (it == wallets_.end()) {
    return snap;
  }
  snap.sync_state = it->second.sync_state;
  snap.utxo = it->second.utxo;
  snap.history = it->second.history;
  snap.pending = it->second.pending;
  return snap;
}

} // namespace wallet
} // namespace walletsync
