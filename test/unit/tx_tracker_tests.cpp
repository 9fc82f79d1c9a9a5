// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch.hpp>
#include "wallet/block_window.hpp"
#include "wallet/tx_tracker.hpp"
#include "wallet_test_fixtures.hpp"

using namespace walletsync;
using namespace walletsync::chain;
using namespace walletsync::test;
using walletsync::wallet::CustomAddresses;
using walletsync::wallet::OutPoint;
using walletsync::wallet::WalletKey;
using walletsync::wallet::WalletModifier;

namespace {

std::optional<ChainDifficulty> Difficulty(const BlockHeader &h) { return DifficultyOf(h); }

std::optional<ChainDifficulty> BlockInfo(const BlockHeader &h) {
    if (IsGenesis(h)) return std::nullopt;
    return DifficultyOf(h);
}

std::optional<slotting::Timestamp> NoTimestamp(const BlockHeader &) { return std::nullopt; }

WalletKey AliceKey() {
    return WalletKey{wallet::WalletId("alice"), {}, {"alice-1", "alice-2"}};
}

// Block 1: bob pays alice-1 (tx 11) and an unrelated tx (tx 12)
// Block 2: alice spends tx 11 output to bob with change to alice-2 (tx 21)
std::vector<Blund> SpendingChain() {
    std::vector<Blund> blunds;
    blunds.push_back(MakeMainBlund(
        MakeHash(1), MakeHash(100), 0, 1, 5,
        {MakeTx(MakeHash(11), {In(MakeHash(900), 0)}, {Out("alice-1", 40), Out("bob", 60)},
                {Out("bob", 100)}),
         MakeTx(MakeHash(12), {In(MakeHash(901), 0)}, {Out("carol", 10)}, {Out("bob", 10)})}));
    blunds.push_back(MakeMainBlund(
        MakeHash(2), MakeHash(1), 0, 2, 6,
        {MakeTx(MakeHash(21), {In(MakeHash(11), 0)}, {Out("bob", 30), Out("alice-2", 10)},
                {Out("alice-1", 40)})}));
    return blunds;
}

} // namespace

TEST_CASE("AddressTxTracker - apply", "[wallet][tracker]") {
    LogCapture log;
    wallet::AddressTxTracker tracker;
    const WalletKey key = AliceKey();

    SECTION("Incoming payment") {
        std::vector<Blund> blunds{SpendingChain()[0]};
        OldestFirst<Blund> window(blunds);
        auto mod = tracker.TrackingApplyTxs(key, {}, Difficulty, NoTimestamp, BlockInfo,
                                            wallet::FlattenForApply(window, log.logger()));

        REQUIRE(mod.utxo_added.size() == 1);
        REQUIRE(mod.utxo_added.at(OutPoint{MakeHash(11), 0}) == Out("alice-1", 40));
        REQUIRE(mod.utxo_spent.empty());
        REQUIRE(mod.history.size() == 1);
        REQUIRE(mod.history.at(MakeHash(11)).received == 40);
        REQUIRE(mod.history.at(MakeHash(11)).difficulty == 5u);
        REQUIRE_FALSE(mod.history.at(MakeHash(11)).timestamp.has_value());
        REQUIRE(mod.used_addresses ==
                std::vector<std::pair<Address, HeaderHash>>{{"alice-1", MakeHash(1)}});
        REQUIRE(mod.ptx_confirmed ==
                std::vector<std::pair<TxId, ChainDifficulty>>{{MakeHash(11), 5}});
    }

    SECTION("Output created and spent inside the window cancels out") {
        auto blunds = SpendingChain();
        OldestFirst<Blund> window(blunds);
        auto mod = tracker.TrackingApplyTxs(key, {}, Difficulty, NoTimestamp, BlockInfo,
                                            wallet::FlattenForApply(window, log.logger()));

        REQUIRE(mod.utxo_added.size() == 1);
        REQUIRE(mod.utxo_added.count(OutPoint{MakeHash(21), 1}) == 1);
        REQUIRE(mod.utxo_spent.empty());
        REQUIRE(mod.history.size() == 2);
        REQUIRE(mod.history.at(MakeHash(21)).spent == 40);
        REQUIRE(mod.history.at(MakeHash(21)).received == 10);
        REQUIRE(mod.history.count(MakeHash(12)) == 0);
    }

    SECTION("Spend of an output from before the window") {
        std::vector<Blund> blunds{SpendingChain()[1]};
        OldestFirst<Blund> window(blunds);
        auto mod = tracker.TrackingApplyTxs(key, {}, Difficulty, NoTimestamp, BlockInfo,
                                            wallet::FlattenForApply(window, log.logger()));
        REQUIRE(mod.utxo_spent.at(OutPoint{MakeHash(11), 0}) == Out("alice-1", 40));
    }

    SECTION("Already used addresses are not listed again") {
        std::vector<Blund> blunds{SpendingChain()[0]};
        OldestFirst<Blund> window(blunds);
        CustomAddresses used{{"alice-1", MakeHash(50)}};
        auto mod = tracker.TrackingApplyTxs(key, used, Difficulty, NoTimestamp, BlockInfo,
                                            wallet::FlattenForApply(window, log.logger()));
        REQUIRE(mod.used_addresses.empty());
    }

    SECTION("Unrelated wallet gets an empty modifier") {
        auto blunds = SpendingChain();
        OldestFirst<Blund> window(blunds);
        WalletKey dave{wallet::WalletId("dave"), {}, {"dave-1"}};
        auto mod = tracker.TrackingApplyTxs(dave, {}, Difficulty, NoTimestamp, BlockInfo,
                                            wallet::FlattenForApply(window, log.logger()));
        REQUIRE(mod.IsEmpty());
    }

    SECTION("Block info decides pending confirmations") {
        std::vector<Blund> blunds{SpendingChain()[0]};
        OldestFirst<Blund> window(blunds);
        auto none = [](const BlockHeader &) -> std::optional<ChainDifficulty> {
            return std::nullopt;
        };
        auto mod = tracker.TrackingApplyTxs(key, {}, Difficulty, NoTimestamp, none,
                                            wallet::FlattenForApply(window, log.logger()));
        REQUIRE(mod.ptx_confirmed.empty());
        REQUIRE(mod.history.size() == 1);
    }
}

TEST_CASE("AddressTxTracker - history timestamps", "[wallet][tracker]") {
    LogCapture log;
    wallet::AddressTxTracker tracker;
    StubSlotting slotting;
    auto timestamp_of =
        slotting::MakeHeaderTimestampFn(slotting.GetSystemStart(), slotting.GetSlottingData());

    std::vector<Blund> blunds{SpendingChain()[0]};
    OldestFirst<Blund> window(blunds);
    auto mod = tracker.TrackingApplyTxs(AliceKey(), {}, Difficulty, timestamp_of, BlockInfo,
                                        wallet::FlattenForApply(window, log.logger()));

    // Slot (0, 1) of the stub slotting
    REQUIRE(mod.history.at(MakeHash(11)).timestamp == slotting::Timestamp(2'000'000));
}

TEST_CASE("AddressTxTracker - rollback mirrors apply", "[wallet][tracker]") {
    LogCapture log;
    wallet::AddressTxTracker tracker;
    const WalletKey key = AliceKey();

    auto blunds = SpendingChain();
    blunds.push_back(MakeGenesisBlund(MakeHash(3), MakeHash(2), 1, 6));
    blunds.push_back(MakeMainBlund(
        MakeHash(4), MakeHash(3), 1, 0, 7,
        {MakeTx(MakeHash(41), {In(MakeHash(21), 1)}, {Out("alice-1", 9)},
                {Out("alice-2", 10)})}));
    OldestFirst<Blund> window(blunds);

    const auto apply_mod = tracker.TrackingApplyTxs(key, {}, Difficulty, NoTimestamp, BlockInfo,
                                                    wallet::FlattenForApply(window, log.logger()));

    // Used set as the store holds it after the apply
    CustomAddresses used;
    for (const auto &[address, hash] : apply_mod.used_addresses) {
        used.emplace(address, hash);
    }

    const auto newest_first = window.ToNewestFirst();
    const auto rollback_mod = tracker.TrackingRollbackTxs(
        key, used, Difficulty, NoTimestamp, wallet::FlattenForRollback(newest_first, log.logger()));

    REQUIRE_FALSE(apply_mod.IsEmpty());
    REQUIRE(rollback_mod == apply_mod);
    REQUIRE(apply_mod.used_addresses ==
            std::vector<std::pair<Address, HeaderHash>>{{"alice-1", MakeHash(1)},
                                                        {"alice-2", MakeHash(2)}});
}

TEST_CASE("AddressTxTracker - rollback keeps addresses first used elsewhere",
          "[wallet][tracker]") {
    LogCapture log;
    wallet::AddressTxTracker tracker;
    std::vector<Blund> blunds{SpendingChain()[0]};
    OldestFirst<Blund> window(blunds);
    const auto newest_first = window.ToNewestFirst();

    CustomAddresses used{{"alice-1", MakeHash(77)}};
    auto mod = tracker.TrackingRollbackTxs(AliceKey(), used, Difficulty, NoTimestamp,
                                           wallet::FlattenForRollback(newest_first, log.logger()));
    REQUIRE(mod.used_addresses.empty());
    REQUIRE(mod.utxo_added.count(OutPoint{MakeHash(11), 0}) == 1);
}
