// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace walletsync {
namespace wallet {

using chain::Address;
using chain::HeaderHash;

// Opaque identifier of a tracked wallet. Treated as secret in logs.
class WalletId {
public:
  WalletId() = default;
  explicit WalletId(std::string id) : id_(std::move(id)) {}

  const std::string &ToString() const { return id_; }
  bool empty() const { return id_.empty(); }

  friend bool operator==(const WalletId &a, const WalletId &b) { return a.id_ == b.id_; }
  friend bool operator!=(const WalletId &a, const WalletId &b) { return a.id_ != b.id_; }
  friend bool operator<(const WalletId &a, const WalletId &b) { return a.id_ < b.id_; }

private:
  std::string id_;
};

// Registered but never synchronized
struct NotSynced {
  friend bool operator==(const NotSynced &, const NotSynced &) { return true; }
};

// Wallet view reflects the chain up to and including `tip`
struct SyncedWith {
  HeaderHash tip;
  friend bool operator==(const SyncedWith &a, const SyncedWith &b) { return a.tip == b.tip; }
};

// A wallet with no record at all (Unknown) is std::nullopt at the store API
using WalletSyncState = std::variant<NotSynced, SyncedWith>;

std::string SyncStateToString(const std::optional<WalletSyncState> &state);

enum class CustomAddressType { UsedAddr };

// Address -> hash of the block that first used it
using CustomAddresses = std::map<Address, HeaderHash>;

/**
 * Wallet secret key material as kept by the key store.
 * `addresses` are the account addresses derived from the key; the tracker
 * uses them to decide which outputs belong to the wallet.
 * Never logged.
 */
struct WalletKey {
  WalletId wallet_id;
  std::vector<uint8_t> encrypted_secret;
  std::set<Address> addresses;

  bool Owns(const Address &address) const { return addresses.count(address) > 0; }
};

// ============================================================================
// Errors raised by wallet collaborators
// ============================================================================

class WalletError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class KeyNotFoundError : public WalletError {
public:
  explicit KeyNotFoundError(const std::string &what) : WalletError(what) {}
};

class WalletNotFoundError : public WalletError {
public:
  explicit WalletNotFoundError(const std::string &what) : WalletError(what) {}
};

// ============================================================================
// Per-wallet sync outcome
// ============================================================================

enum class SyncOutcome {
  Synced,
  SkippedUnknownWallet,
  SkippedNotSynced,
  SkippedTipMismatch,
  Failed
};

const char *SyncOutcomeToString(SyncOutcome outcome);

} // namespace wallet
} // namespace walletsync
