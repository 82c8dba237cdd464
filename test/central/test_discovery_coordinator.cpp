//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "central/discovery_coordinator.hpp"

#include "central/resource_registry.hpp"
#include "sdk/discovery_gtest_helpers.hpp"
#include "serial_queue.hpp"
#include "virtual_time_scheduler.hpp"

#include <blecentral/sdk/discovery.hpp>
#include <blecentral/sdk/errors.hpp>
#include <blecentral/sdk/transport.hpp>
#include <blecentral/sdk/uuid.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace
{

using namespace blecentral::central;  // NOLINT This our main concern here in the unit tests.
using namespace blecentral::sdk;      // NOLINT This our main concern here in the unit tests.

using testing::ElementsAre;
using testing::IsEmpty;
using testing::IsNull;
using testing::NotNull;

// https://github.com/llvm/llvm-project/issues/53444
// NOLINTBEGIN(misc-unused-using-decls, misc-include-cleaner)
using std::literals::chrono_literals::operator""s;
using std::literals::chrono_literals::operator""ms;
// NOLINTEND(misc-unused-using-decls, misc-include-cleaner)

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestDiscoveryCoordinator : public testing::Test
{
protected:
    struct RawItem
    {
        Uuid uuid;
    };
    struct Item
    {
        Uuid uuid;
        int  made_in_round;
    };
    using Coordinator = DiscoveryCoordinator<Item>;

    Discovery::Future discover(const std::chrono::microseconds timeout,
                               const ConnectionState           state = ConnectionState::Connected)
    {
        return coordinator_->discover(queue_, state, timeout, [this] { ++requests_; });
    }

    std::vector<std::shared_ptr<Item>> complete(const std::vector<RawItem>& raw_items,
                                                const cetl::optional<int>&  error = cetl::nullopt)
    {
        const int round = static_cast<int>(coordinator_->generation());
        return coordinator_->onDiscoveryComplete(raw_items, error, registry_, [this, round](const RawItem& raw) {
            ++made_items_;
            return std::make_shared<Item>(Item{raw.uuid, round});
        });
    }

    std::vector<Uuid> discoveredUuids() const
    {
        std::vector<Uuid> uuids;
        for (const auto& item : coordinator_->resources(registry_))
        {
            uuids.push_back(item->uuid);
        }
        return uuids;
    }

    // NOLINTBEGIN
    blecentral::VirtualTimeScheduler    scheduler_{};
    blecentral::common::SerialQueue     queue_{scheduler_};
    Coordinator::Registry               registry_;
    std::unique_ptr<Coordinator>        coordinator_{std::make_unique<Coordinator>("Owner<test>")};
    int                                 requests_{0};
    int                                 made_items_{0};
    const Uuid                          x_{0x2A37};
    const Uuid                          y_{0x2A38};
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestDiscoveryCoordinator, fails_fast_when_not_connected)
{
    const auto future = discover(InfiniteTimeout, ConnectionState::Disconnected);
    EXPECT_TRUE(isFailedWith<NotConnectedError>(future)) << describe(future);
    EXPECT_EQ(0, requests_);
    EXPECT_FALSE(coordinator_->isPending());
    EXPECT_EQ(0U, coordinator_->generation());

    const auto connecting = discover(InfiniteTimeout, ConnectionState::Connecting);
    EXPECT_TRUE(isFailedWith<NotConnectedError>(connecting)) << describe(connecting);
    EXPECT_EQ(0, requests_);
}

TEST_F(TestDiscoveryCoordinator, successful_round)
{
    const auto future = discover(InfiniteTimeout);
    EXPECT_FALSE(future.completed());
    EXPECT_TRUE(coordinator_->isPending());
    EXPECT_EQ(1, requests_);

    complete({{x_}, {y_}});
    EXPECT_TRUE(isSucceeded(future)) << describe(future);
    EXPECT_FALSE(coordinator_->isPending());
    EXPECT_THAT(discoveredUuids(), ElementsAre(x_, y_));
    EXPECT_EQ(2U, coordinator_->roundIds().size());
}

TEST_F(TestDiscoveryCoordinator, concurrent_requests_are_coalesced)
{
    const auto future1 = discover(1s);
    const auto future2 = discover(5s);
    EXPECT_TRUE(future1.isSameAs(future2));
    EXPECT_EQ(1, requests_);
    EXPECT_EQ(1U, coordinator_->generation());

    // Coalesced request doesn't arm its own timeout.
    scheduler_.spinFor(1s);
    EXPECT_TRUE(isFailedWith<DiscoveryTimeoutError>(future2)) << describe(future2);

    const auto future3 = discover(InfiniteTimeout);
    EXPECT_FALSE(future3.isSameAs(future1));
    EXPECT_EQ(2, requests_);
}

TEST_F(TestDiscoveryCoordinator, transport_error_discards_reported_items)
{
    // The first round registers X.
    discover(InfiniteTimeout);
    complete({{x_}});
    EXPECT_THAT(discoveredUuids(), ElementsAre(x_));

    const auto future = discover(InfiniteTimeout);
    complete({{y_}}, EIO);
    ASSERT_TRUE(isFailedWith<TransportError>(future)) << describe(future);
    EXPECT_EQ(EIO, cetl::get<TransportError>(cetl::get<Discovery::Failure>(*future.result())).code);

    EXPECT_EQ(1, made_items_);
    EXPECT_THAT(discoveredUuids(), IsEmpty());
    EXPECT_THAT(registry_.lookup(y_), IsNull());
    ASSERT_THAT(registry_.lookup(x_), NotNull());
    EXPECT_EQ(x_, registry_.lookup(x_)->uuid);
}

TEST_F(TestDiscoveryCoordinator, times_out_exactly_once_at_deadline)
{
    const auto future = discover(2s);

    int failures = 0;
    future.onFailure([&failures](const Discovery::Failure&) { ++failures; });

    scheduler_.spinFor(2s - 1ms);
    EXPECT_FALSE(future.completed());

    scheduler_.spinFor(1ms);
    EXPECT_TRUE(isFailedWith<DiscoveryTimeoutError>(future)) << describe(future);
    EXPECT_EQ(1, failures);

    // A late response doesn't change the outcome, but still refreshes the registry.
    complete({{x_}});
    EXPECT_TRUE(isFailedWith<DiscoveryTimeoutError>(future)) << describe(future);
    EXPECT_EQ(1, failures);
    EXPECT_THAT(registry_.lookup(x_), NotNull());

    scheduler_.spinFor(10s);
    EXPECT_EQ(1, failures);
}

TEST_F(TestDiscoveryCoordinator, infinite_timeout_never_fires)
{
    const auto future = discover(InfiniteTimeout);
    scheduler_.spinFor(std::chrono::hours{24});
    EXPECT_FALSE(future.completed());
    EXPECT_EQ(0U, queue_.pendingCount());
}

TEST_F(TestDiscoveryCoordinator, stale_timeout_does_not_affect_next_round)
{
    Discovery::Future round1 = discover(2s);
    Discovery::Future round2 = round1;

    scheduler_.scheduleAt(1s, [&](const auto&) {
        complete({{x_}});
        EXPECT_TRUE(isSucceeded(round1)) << describe(round1);
    });
    scheduler_.scheduleAt(1s + 500ms, [&](const auto&) {
        round2 = discover(10s);
        EXPECT_FALSE(round2.isSameAs(round1));
        EXPECT_EQ(2U, coordinator_->generation());
    });
    scheduler_.scheduleAt(2s + 1ms, [&](const auto&) {
        // Round 1 timeout has fired meanwhile.
        EXPECT_FALSE(round2.completed()) << describe(round2);
        EXPECT_TRUE(isSucceeded(round1)) << describe(round1);
    });
    scheduler_.scheduleAt(11s + 500ms, [&](const auto&) {
        EXPECT_TRUE(isFailedWith<DiscoveryTimeoutError>(round2)) << describe(round2);
    });
    scheduler_.spinFor(20s);
}

TEST_F(TestDiscoveryCoordinator, disconnect_fails_pending_round)
{
    const auto future = discover(2s);

    scheduler_.spinFor(1s);
    coordinator_->onDisconnect(ECONNRESET);
    EXPECT_TRUE(isFailedWith<DisconnectedError>(future)) << describe(future);

    // Neither the timeout nor a late response can change the outcome.
    scheduler_.spinFor(5s);
    complete({{x_}}, EIO);
    EXPECT_TRUE(isFailedWith<DisconnectedError>(future)) << describe(future);

    // While still disconnected - fail fast.
    const auto retry = discover(2s, ConnectionState::Disconnected);
    EXPECT_TRUE(isFailedWith<NotConnectedError>(retry)) << describe(retry);
    EXPECT_EQ(1U, coordinator_->generation());

    // Reconnected - a fresh round.
    const auto fresh = discover(2s);
    EXPECT_FALSE(fresh.completed());
    EXPECT_EQ(2U, coordinator_->generation());
    EXPECT_EQ(2, requests_);
}

TEST_F(TestDiscoveryCoordinator, disconnect_keeps_registry)
{
    discover(InfiniteTimeout);
    complete({{x_}, {y_}});

    discover(InfiniteTimeout);
    coordinator_->onDisconnect(cetl::nullopt);
    EXPECT_THAT(registry_.lookup(x_), NotNull());
    EXPECT_THAT(registry_.lookup(y_), NotNull());

    // Without a pending round the disconnection is a no-op.
    coordinator_->onDisconnect(cetl::nullopt);
}

TEST_F(TestDiscoveryCoordinator, first_outcome_wins_for_any_event_order)
{
    // Success, then disconnection & timeout.
    {
        const auto future = discover(1s);
        complete({{x_}});
        coordinator_->onDisconnect(ECONNRESET);
        scheduler_.spinFor(2s);
        EXPECT_TRUE(isSucceeded(future)) << describe(future);
    }
    // Transport failure, then success.
    {
        const auto future = discover(1s);
        complete({}, EPROTO);
        complete({{y_}});
        EXPECT_TRUE(isFailedWith<TransportError>(future)) << describe(future);
        EXPECT_THAT(discoveredUuids(), ElementsAre(y_));
        scheduler_.spinFor(2s);
    }
    // Timeout, then disconnection.
    {
        const auto future = discover(1s);
        scheduler_.spinFor(1s);
        coordinator_->onDisconnect(ECONNRESET);
        EXPECT_TRUE(isFailedWith<DiscoveryTimeoutError>(future)) << describe(future);
    }
}

TEST_F(TestDiscoveryCoordinator, observer_may_start_next_round)
{
    const auto           future1 = discover(InfiniteTimeout);
    Discovery::Future    future2 = future1;
    future1.onSuccess([&](const Discovery::Success&) { future2 = discover(InfiniteTimeout); });

    complete({{x_}});
    EXPECT_TRUE(isSucceeded(future1)) << describe(future1);
    EXPECT_FALSE(future2.isSameAs(future1));
    EXPECT_FALSE(future2.completed());
    EXPECT_EQ(2, requests_);

    complete({{y_}});
    EXPECT_TRUE(isSucceeded(future2)) << describe(future2);
}

TEST_F(TestDiscoveryCoordinator, completion_hands_over_replaced_items)
{
    discover(InfiniteTimeout);
    EXPECT_THAT(complete({{x_}}), IsEmpty());

    discover(InfiniteTimeout);
    const auto replaced = complete({{y_}, {x_}});
    ASSERT_EQ(1U, replaced.size());
    EXPECT_EQ(x_, replaced.front()->uuid);
    EXPECT_EQ(1, replaced.front()->made_in_round);
    EXPECT_EQ(2, registry_.lookup(x_)->made_in_round);

    // A failed round replaces nothing.
    discover(InfiniteTimeout);
    EXPECT_THAT(complete({{x_}}, EIO), IsEmpty());
}

TEST_F(TestDiscoveryCoordinator, abandon_fails_pending_round)
{
    const auto future = discover(2s);
    coordinator_->abandon();
    EXPECT_TRUE(isFailedWith<UnconfiguredError>(future)) << describe(future);

    // Neither the timeout nor a late response can change the outcome.
    scheduler_.spinFor(5s);
    complete({{x_}});
    EXPECT_TRUE(isFailedWith<UnconfiguredError>(future)) << describe(future);
    EXPECT_THAT(registry_.lookup(x_), NotNull());

    // Without a pending round abandoning is a no-op.
    coordinator_->abandon();
    EXPECT_FALSE(discover(InfiniteTimeout).completed());
}

TEST_F(TestDiscoveryCoordinator, destroyed_coordinator_fails_pending_round)
{
    const auto future = discover(1s);

    std::vector<std::string> outcomes;
    future.onComplete([&outcomes](const Discovery::Result&) { outcomes.push_back("settled"); });

    coordinator_.reset();
    EXPECT_TRUE(isFailedWith<UnconfiguredError>(future)) << describe(future);
    EXPECT_THAT(outcomes, ElementsAre("settled"));

    // Its timeout is still scheduled, but has nothing to settle anymore.
    scheduler_.spinFor(2s);
    EXPECT_THAT(outcomes, ElementsAre("settled"));
    EXPECT_EQ(0U, queue_.pendingCount());
}

TEST_F(TestDiscoveryCoordinator, destroyed_coordinator_leaves_settled_round_alone)
{
    const auto future = discover(1s);
    complete({{x_}});
    coordinator_.reset();
    EXPECT_TRUE(isSucceeded(future)) << describe(future);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
