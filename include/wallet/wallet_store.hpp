// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "wallet/modifier.hpp"
#include "wallet/types.hpp"
#include <optional>
#include <vector>

namespace walletsync {
namespace wallet {

// WalletStore - storage of wallet views and their sync tips
//
// Implementations: MemoryWalletStore (in-process), test doubles.
// Write operations throw WalletError (or a subclass) on failure.
class WalletStore {
public:
  virtual ~WalletStore() = default;

  // std::nullopt: no record for this wallet (Unknown)
  virtual std::optional<WalletSyncState> GetWalletSyncTip(const WalletId &wallet) const = 0;

  // All tracked wallets, in a stable order
  virtual std::vector<WalletId> GetWalletAddresses() const = 0;

  virtual CustomAddresses GetCustomAddresses(CustomAddressType type) const = 0;

  // Apply `modifier` to the wallet view and set its tip to SyncedWith(new_tip)
  virtual void ApplyModifierToWallet(const WalletId &wallet, const HeaderHash &new_tip,
                                     const WalletModifier &modifier) = 0;

  // Remove what `modifier` describes from the wallet view and set its tip to
  // SyncedWith(new_tip)
  virtual void RollbackModifierFromWallet(const WalletId &wallet, const HeaderHash &new_tip,
                                          const WalletModifier &modifier) = 0;
};

} // namespace wallet
} // namespace walletsync
