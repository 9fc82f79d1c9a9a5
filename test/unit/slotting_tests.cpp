// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch.hpp>
#include "slotting/slotting.hpp"
#include "util/time.hpp"
#include "wallet_test_fixtures.hpp"
#include <chrono>
#include <stdexcept>

using namespace walletsync;
using namespace walletsync::slotting;
using walletsync::test::MakeHash;
using std::chrono::milliseconds;
using std::chrono::microseconds;

TEST_CASE("SlottingData lookup", "[slotting]") {
    SlottingData sd;
    REQUIRE(sd.Empty());
    REQUIRE_FALSE(sd.LastKnownEpoch().has_value());
    REQUIRE_FALSE(sd.Find(0).has_value());

    sd.AddEpoch(0, EpochSlottingData{milliseconds(1000), microseconds(0)});
    sd.AddEpoch(1, EpochSlottingData{milliseconds(2000), microseconds(10'000'000)});

    REQUIRE(sd.LastKnownEpoch() == 1u);
    REQUIRE(sd.Find(1)->slot_duration == milliseconds(2000));
    REQUIRE_FALSE(sd.Find(2).has_value());
}

TEST_CASE("SlottingData uniform epochs", "[slotting]") {
    SlottingData sd;

    SECTION("Epoch data is computed from the run") {
        sd.AddUniformEpochs(3, 1'000'000, milliseconds(500), 4, microseconds(7'000'000));
        REQUIRE_FALSE(sd.Empty());
        REQUIRE(sd.LastKnownEpoch() == 1'000'000u);
        REQUIRE_FALSE(sd.Find(2).has_value());
        REQUIRE(sd.Find(3)->start_diff == microseconds(7'000'000));
        REQUIRE(sd.Find(5)->start_diff == microseconds(11'000'000));
        REQUIRE(sd.Find(1'000'000)->slot_duration == milliseconds(500));
        REQUIRE_FALSE(sd.Find(1'000'001).has_value());
    }

    SECTION("Explicit epochs take precedence over a run") {
        sd.AddUniformEpochs(0, 9, milliseconds(1000), 10, microseconds(0));
        sd.AddEpoch(4, EpochSlottingData{milliseconds(3000), microseconds(1)});
        sd.AddEpoch(20, EpochSlottingData{milliseconds(1000), microseconds(2)});

        REQUIRE(sd.Find(4)->slot_duration == milliseconds(3000));
        REQUIRE(sd.Find(5)->start_diff == microseconds(50'000'000));
        REQUIRE(sd.LastKnownEpoch() == 20u);
        REQUIRE(GetSlotStart(Timestamp(0), chain::SlotId{9, 1}, sd) == Timestamp(91'000'000));
    }

    SECTION("Invalid runs") {
        REQUIRE_THROWS_AS(sd.AddUniformEpochs(5, 4, milliseconds(1000), 10, microseconds(0)),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(sd.AddUniformEpochs(0, 4, milliseconds(0), 10, microseconds(0)),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(sd.AddUniformEpochs(0, 4, milliseconds(1000), 0, microseconds(0)),
                          std::invalid_argument);
        REQUIRE(sd.Empty());
    }
}

TEST_CASE("GetSlotStart", "[slotting]") {
    SlottingData sd;
    sd.AddEpoch(0, EpochSlottingData{milliseconds(1000), microseconds(0)});
    sd.AddEpoch(1, EpochSlottingData{milliseconds(2000), microseconds(10'000'000)});
    const Timestamp start(5'000'000);

    SECTION("First epoch") {
        REQUIRE(GetSlotStart(start, chain::SlotId{0, 0}, sd) == Timestamp(5'000'000));
        REQUIRE(GetSlotStart(start, chain::SlotId{0, 3}, sd) == Timestamp(8'000'000));
    }

    SECTION("Later epoch uses its own offset and duration") {
        REQUIRE(GetSlotStart(start, chain::SlotId{1, 2}, sd) == Timestamp(19'000'000));
    }

    SECTION("Unknown epoch has no start") {
        REQUIRE_FALSE(GetSlotStart(start, chain::SlotId{2, 0}, sd).has_value());
    }
}

TEST_CASE("FixedSlotting", "[slotting]") {
    // 10 slots of 1s per epoch, system start at t=100s
    const Timestamp start(100'000'000);

    SECTION("Current epoch follows the (mock) clock") {
        util::MockTimeScope clock(100 + 25);
        FixedSlotting slotting(start, milliseconds(1000), 10);
        REQUIRE(slotting.CurrentEpoch() == 2);
        REQUIRE(slotting.GetCurrentEpochSlotDuration() == milliseconds(1000));

        SlottingData sd = slotting.GetSlottingData();
        REQUIRE(sd.LastKnownEpoch() == 3u);  // current + one epoch of lookahead
        REQUIRE(sd.Find(2)->start_diff == microseconds(20'000'000));
    }

    SECTION("Clock before system start is epoch 0") {
        util::MockTimeScope clock(50);
        FixedSlotting slotting(start, milliseconds(1000), 10);
        REQUIRE(slotting.CurrentEpoch() == 0);
    }

    SECTION("Real clock, system start at the Unix epoch") {
        // Millions of epochs have elapsed since the system start
        FixedSlotting slotting(Timestamp(0), milliseconds(20'000), 10);
        const uint64_t current = slotting.CurrentEpoch();
        REQUIRE(current > 8'000'000u);

        uint64_t last_known = 0;
        const auto begin = std::chrono::steady_clock::now();
        for (int i = 0; i < 1000; ++i) {
            last_known = slotting.GetSlottingData().LastKnownEpoch().value_or(0);
        }
        REQUIRE(std::chrono::steady_clock::now() - begin < std::chrono::seconds(1));
        REQUIRE(last_known >= current + 1);

        SlottingData sd = slotting.GetSlottingData();
        REQUIRE(sd.Find(0)->start_diff == microseconds(0));
        REQUIRE(GetSlotStart(Timestamp(0), chain::SlotId{current, 3}, sd) ==
                Timestamp(static_cast<int64_t>(current) * 200'000'000 + 60'000'000));
    }

    SECTION("Invalid parameters") {
        REQUIRE_THROWS_AS(FixedSlotting(start, milliseconds(0), 10), std::invalid_argument);
        REQUIRE_THROWS_AS(FixedSlotting(start, milliseconds(1000), 0), std::invalid_argument);
    }
}

TEST_CASE("Header timestamps", "[slotting]") {
    SlottingData sd;
    sd.AddEpoch(0, EpochSlottingData{milliseconds(1000), microseconds(0)});
    auto timestamp_of = MakeHeaderTimestampFn(Timestamp(1'000'000), sd);

    SECTION("Main header maps to its slot start") {
        chain::BlockHeader header =
            chain::MainBlockHeader{MakeHash(1), MakeHash(0), chain::SlotId{0, 4}, 1};
        REQUIRE(timestamp_of(header) == Timestamp(5'000'000));
    }

    SECTION("Genesis header never has a timestamp") {
        chain::BlockHeader header = chain::GenesisBlockHeader{MakeHash(1), MakeHash(0), 0, 0};
        REQUIRE_FALSE(timestamp_of(header).has_value());
    }

    SECTION("Main header in an unknown epoch has no timestamp") {
        chain::BlockHeader header =
            chain::MainBlockHeader{MakeHash(1), MakeHash(0), chain::SlotId{5, 0}, 1};
        REQUIRE_FALSE(timestamp_of(header).has_value());
    }
}
