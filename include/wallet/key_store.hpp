// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "wallet/types.hpp"
#include <map>
#include <mutex>

namespace walletsync {
namespace wallet {

// Lookup of wallet secret keys
class KeyStore {
public:
  virtual ~KeyStore() = default;

  // @throws KeyNotFoundError if the store holds no key for `wallet`
  virtual WalletKey GetSecretKeyById(const WalletId &wallet) const = 0;
};

// In-process KeyStore, thread-safe
class MemoryKeyStore : public KeyStore {
public:
  WalletKey GetSecretKeyById(const WalletId &wallet) const override;

  // Insert or replace the key for key.wallet_id
  void AddKey(WalletKey key);
  bool RemoveKey(const WalletId &wallet);
  size_t Size() const;

private:
  mutable std::mutex mutex_;
  std::map<WalletId, WalletKey> keys_;
};

} // namespace wallet
} // namespace walletsync
