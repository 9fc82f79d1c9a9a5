// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "wallet/key_store.hpp"
#include <utility>

namespace walletsync {
namespace wallet {

WalletKey MemoryKeyStore::GetSecretKeyById(const WalletId &wallet) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = keys_.find(wallet);
  if (it == keys_.end()) {
    // No wallet id in the message: it can reach the error reporter
    throw KeyNotFoundError("secret key not found");
  }
  return it->second;
}

void MemoryKeyStore::AddKey(WalletKey key) {
  std::lock_guard<std::mutex> lock(mutex_);
  WalletId id = key.wallet_id;
  keys_[id] = std::move(key);
}

bool MemoryKeyStore::RemoveKey(const WalletId &wallet) {
  std::lock_guard<std::mutex> lock(mutex_);
  return keys_.erase(wallet) > 0;
}

size_t MemoryKeyStore::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return keys_.size();
}

} // namespace wallet
} // namespace walletsync
