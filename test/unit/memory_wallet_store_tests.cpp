// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch.hpp>
#include "wallet/key_store.hpp"
#include "wallet/memory_wallet_store.hpp"
#include "wallet_test_fixtures.hpp"

using namespace walletsync;
using namespace walletsync::wallet;
using walletsync::test::MakeHash;

namespace {

WalletModifier SampleModifier() {
  WalletModifier mod;
  mod.utxo_added[OutPoint{MakeHash(11), 0}] = chain::TxOut{"alice-1", 50};
  mod.utxo_added[OutPoint{MakeHash(12), 1}] = chain::TxOut{"alice-2", 7};
  mod.utxo_spent[OutPoint{MakeHash(1), 0}] = chain::TxOut{"alice-1", 20};

  TxHistoryEntry entry;
  entry.tx_id = MakeHash(11);
  entry.difficulty = 3;
  entry.received = 50;
  entry.spent = 20;
  mod.history[entry.tx_id] = entry;

  mod.used_addresses.emplace_back("alice-2", MakeHash(3));
  mod.ptx_confirmed.emplace_back(MakeHash(11), 3);
  return mod;
}

} // namespace

TEST_CASE("MemoryWalletStore - registration and sync state", "[wallet][store]") {
  MemoryWalletStore store;
  const WalletId alice("alice");

  REQUIRE_FALSE(store.GetWalletSyncTip(alice).has_value());
  REQUIRE(store.GetWalletAddresses().empty());

  REQUIRE(store.CreateWallet(alice));
  REQUIRE_FALSE(store.CreateWallet(alice));
  REQUIRE(store.GetWalletSyncTip(alice) == WalletSyncState{NotSynced{}});
  REQUIRE(SyncStateToString(store.GetWalletSyncTip(alice)) == "not_synced");

  store.SetWalletSyncTip(alice, SyncedWith{MakeHash(5)});
  REQUIRE(store.GetWalletSyncTip(alice) == WalletSyncState{SyncedWith{MakeHash(5)}});

  store.SetWalletSyncTip(WalletId("bob"), NotSynced{});
  REQUIRE(store.GetWalletAddresses() == std::vector<WalletId>{alice, WalletId("bob")});

  REQUIRE(SyncStateToString(store.GetWalletSyncTip(WalletId("carol"))) == "unknown");
}

TEST_CASE("MemoryWalletStore - apply then rollback restores the view", "[wallet][store]") {
  MemoryWalletStore store;
  const WalletId alice("alice");
  store.SetWalletSyncTip(alice, SyncedWith{MakeHash(0)});
  store.AddPendingTx(alice, MakeHash(11));

  // Pre-existing output that the modifier spends
  WalletModifier seed;
  seed.utxo_added[OutPoint{MakeHash(1), 0}] = chain::TxOut{"alice-1", 20};
  store.ApplyModifierToWallet(alice, MakeHash(0), seed);
  const WalletSnapshot before = store.Snapshot(alice);

  const WalletModifier mod = SampleModifier();
  store.ApplyModifierToWallet(alice, MakeHash(3), mod);

  REQUIRE(store.GetWalletSyncTip(alice) == WalletSyncState{SyncedWith{MakeHash(3)}});
  REQUIRE(store.GetBalance(alice) == 57);
  REQUIRE(store.GetUtxo(alice).count(OutPoint{MakeHash(1), 0}) == 0);
  REQUIRE(store.GetTxHistory(alice).at(MakeHash(11)).received == 50);
  REQUIRE(store.GetPendingTxState(alice, MakeHash(11)) == PendingTxState{PtxInBlock{3}});
  REQUIRE(store.GetCustomAddresses(CustomAddressType::UsedAddr).at("alice-2") == MakeHash(3));

  store.RollbackModifierFromWallet(alice, MakeHash(0), mod);

  REQUIRE(store.Snapshot(alice) == before);
  REQUIRE(store.GetPendingTxState(alice, MakeHash(11)) == PendingTxState{PtxPending{}});
  REQUIRE(store.GetCustomAddresses(CustomAddressType::UsedAddr).empty());
}

TEST_CASE("MemoryWalletStore - used addresses", "[wallet][store]") {
  MemoryWalletStore store;
  const WalletId alice("alice");
  store.CreateWallet(alice);

  WalletModifier first;
  first.used_addresses.emplace_back("addr", MakeHash(1));
  store.ApplyModifierToWallet(alice, MakeHash(1), first);

  SECTION("Later use does not overwrite the first block") {
    WalletModifier again;
    again.used_addresses.emplace_back("addr", MakeHash(2));
    store.ApplyModifierToWallet(alice, MakeHash(2), again);
    REQUIRE(store.GetCustomAddresses(CustomAddressType::UsedAddr).at("addr") == MakeHash(1));
  }

  SECTION("Rollback of a different block keeps the address") {
    WalletModifier other;
    other.used_addresses.emplace_back("addr", MakeHash(2));
    store.RollbackModifierFromWallet(alice, MakeHash(1), other);
    REQUIRE(store.GetCustomAddresses(CustomAddressType::UsedAddr).count("addr") == 1);
  }

  SECTION("Rollback of the first-use block forgets it") {
    store.RollbackModifierFromWallet(alice, MakeHash(0), first);
    REQUIRE(store.GetCustomAddresses(CustomAddressType::UsedAddr).count("addr") == 0);
  }
}

TEST_CASE("MemoryWalletStore - unknown wallet", "[wallet][store]") {
  MemoryWalletStore store;
  const WalletId ghost("ghost");

  REQUIRE_THROWS_AS(store.ApplyModifierToWallet(ghost, MakeHash(1), WalletModifier{}),
                    WalletNotFoundError);
  REQUIRE_THROWS_AS(store.RollbackModifierFromWallet(ghost, MakeHash(1), WalletModifier{}),
                    WalletNotFoundError);
  REQUIRE_THROWS_AS(store.GetBalance(ghost), WalletNotFoundError);
  REQUIRE_THROWS_AS(store.AddPendingTx(ghost, MakeHash(1)), WalletNotFoundError);

  // Failed writes never create a record
  REQUIRE_FALSE(store.GetWalletSyncTip(ghost).has_value());
  REQUIRE(store.Snapshot(ghost) == WalletSnapshot{});
}

TEST_CASE("MemoryKeyStore", "[wallet][keys]") {
  MemoryKeyStore keys;
  const WalletId alice("alice");
  REQUIRE(keys.Size() == 0);

  SECTION("Missing key") {
    REQUIRE_THROWS_AS(keys.GetSecretKeyById(alice), KeyNotFoundError);
    try {
      keys.GetSecretKeyById(alice);
    } catch (const KeyNotFoundError &e) {
      REQUIRE_FALSE(test::Contains(e.what(), "alice"));
    }
  }

  SECTION("Add, replace and remove") {
    keys.AddKey(WalletKey{alice, {1, 2, 3}, {"alice-1"}});
    REQUIRE(keys.GetSecretKeyById(alice).Owns("alice-1"));

    keys.AddKey(WalletKey{alice, {}, {"alice-2"}});
    REQUIRE(keys.Size() == 1);
    const WalletKey key = keys.GetSecretKeyById(alice);
    REQUIRE(key.Owns("alice-2"));
    REQUIRE_FALSE(key.Owns("alice-1"));

    REQUIRE(keys.RemoveKey(alice));
    REQUIRE_FALSE(keys.RemoveKey(alice));
    REQUIRE_THROWS_AS(keys.GetSecretKeyById(alice), KeyNotFoundError);
  }
}
