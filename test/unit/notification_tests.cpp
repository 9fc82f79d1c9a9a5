// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for block notification system

#include <catch2/catch.hpp>
#include "chain/notifications.hpp"
#include "db/batch_op.hpp"
#include "wallet_test_fixtures.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace walletsync;
using namespace walletsync::chain;
using walletsync::test::MakeChain;
using walletsync::test::MakeHash;

namespace {

class NamedOp : public db::BatchOp {
public:
    explicit NamedOp(std::string name) : name_(std::move(name)) {}
    std::string ToString() const override { return name_; }

private:
    std::string name_;
};

db::SomeBatchOp BatchOf(const std::string &name) {
    db::SomeBatchOp batch;
    batch.Append(std::make_shared<NamedOp>(name));
    return batch;
}

} // namespace

TEST_CASE("SomeBatchOp", "[notifications][batch]") {
    db::SomeBatchOp batch;
    REQUIRE(batch.IsEmpty());

    batch.Append(nullptr);
    REQUIRE(batch.IsEmpty());

    batch.Append(std::make_shared<NamedOp>("a"));
    batch.Merge(BatchOf("b"));
    batch.Merge(db::SomeBatchOp{});
    REQUIRE(batch.Size() == 2);
    REQUIRE(batch.Ops()[0]->ToString() == "a");
    REQUIRE(batch.Ops()[1]->ToString() == "b");
}

TEST_CASE("Notifications - apply subscribers run in order and batches merge", "[notifications]") {
    BlockNotifications notifications;
    std::vector<std::string> calls;

    auto sub1 = notifications.SubscribeApplyBlocks([&](const OldestFirst<Blund> &blunds) {
        calls.push_back("first:" + std::to_string(blunds.size()));
        return BatchOf("first");
    });
    auto sub2 = notifications.SubscribeApplyBlocks([&](const OldestFirst<Blund> &) {
        calls.push_back("second");
        return BatchOf("second");
    });

    auto batch = notifications.NotifyApplyBlocks(OldestFirst<Blund>(MakeChain(MakeHash(100), 1, 2)));

    REQUIRE(calls == std::vector<std::string>{"first:2", "second"});
    REQUIRE(batch.Size() == 2);
    REQUIRE(batch.Ops()[0]->ToString() == "first");
    REQUIRE(batch.Ops()[1]->ToString() == "second");
}

TEST_CASE("Notifications - apply and rollback callbacks are separate", "[notifications]") {
    BlockNotifications notifications;
    int apply_calls = 0;
    int rollback_calls = 0;

    auto apply_sub = notifications.SubscribeApplyBlocks([&](const OldestFirst<Blund> &) {
        ++apply_calls;
        return db::SomeBatchOp{};
    });
    auto rollback_sub = notifications.SubscribeRollbackBlocks([&](const NewestFirst<Blund> &blunds) {
        ++rollback_calls;
        REQUIRE(BlundHash(blunds.Newest()) == MakeHash(3));
        return db::SomeBatchOp{};
    });

    auto window = OldestFirst<Blund>(MakeChain(MakeHash(100), 1, 3));
    notifications.NotifyRollbackBlocks(window.ToNewestFirst());
    REQUIRE(apply_calls == 0);
    REQUIRE(rollback_calls == 1);

    notifications.NotifyApplyBlocks(window);
    REQUIRE(apply_calls == 1);
    REQUIRE(rollback_calls == 1);
}

TEST_CASE("Notifications - RAII subscription", "[notifications]") {
    BlockNotifications notifications;
    int calls = 0;
    auto window = OldestFirst<Blund>(MakeChain(MakeHash(100), 1, 1));

    SECTION("Destroying the handle unsubscribes") {
        {
            auto sub = notifications.SubscribeApplyBlocks([&](const OldestFirst<Blund> &) {
                ++calls;
                return db::SomeBatchOp{};
            });
            REQUIRE(notifications.SubscriberCount() == 1);
            notifications.NotifyApplyBlocks(window);
        }
        REQUIRE(notifications.SubscriberCount() == 0);
        notifications.NotifyApplyBlocks(window);
        REQUIRE(calls == 1);
    }

    SECTION("Explicit unsubscribe") {
        auto sub = notifications.SubscribeApplyBlocks([&](const OldestFirst<Blund> &) {
            ++calls;
            return db::SomeBatchOp{};
        });
        sub.Unsubscribe();
        sub.Unsubscribe();  // second call is a no-op
        notifications.NotifyApplyBlocks(window);
        REQUIRE(calls == 0);
    }

    SECTION("Moved-from handle does not unsubscribe") {
        BlockNotifications::Subscription kept;
        {
            auto sub = notifications.SubscribeApplyBlocks([&](const OldestFirst<Blund> &) {
                ++calls;
                return db::SomeBatchOp{};
            });
            kept = std::move(sub);
        }
        notifications.NotifyApplyBlocks(window);
        REQUIRE(calls == 1);
    }

    SECTION("Callback may unsubscribe itself during notification") {
        BlockNotifications::Subscription self;
        self = notifications.SubscribeApplyBlocks([&](const OldestFirst<Blund> &) {
            ++calls;
            self.Unsubscribe();
            return db::SomeBatchOp{};
        });
        notifications.NotifyApplyBlocks(window);
        notifications.NotifyApplyBlocks(window);
        REQUIRE(calls == 1);
        REQUIRE(notifications.SubscriberCount() == 0);
    }
}
