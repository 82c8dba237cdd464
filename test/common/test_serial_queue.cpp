//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "serial_queue.hpp"

#include "virtual_time_scheduler.hpp"

#include <libcyphal/types.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <vector>

namespace
{

using namespace blecentral::common;  // NOLINT This our main concern here in the unit tests.

using testing::ElementsAre;
using testing::IsEmpty;

// https://github.com/llvm/llvm-project/issues/53444
// NOLINTBEGIN(misc-unused-using-decls, misc-include-cleaner)
using std::literals::chrono_literals::operator""s;
using std::literals::chrono_literals::operator""ms;
// NOLINTEND(misc-unused-using-decls, misc-include-cleaner)

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestSerialQueue : public testing::Test
{
protected:
    libcyphal::TimePoint now() const
    {
        return scheduler_.now();
    }

    // NOLINTBEGIN
    blecentral::VirtualTimeScheduler scheduler_{};
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestSerialQueue, delayed_actions_run_in_time_order)
{
    SerialQueue queue{scheduler_};

    std::vector<libcyphal::TimePoint> calls;
    queue.delay(2s, [&] { calls.push_back(now()); });
    queue.delay(1s, [&] { calls.push_back(now()); });
    queue.post([&] { calls.push_back(now()); });
    EXPECT_EQ(3U, queue.pendingCount());

    scheduler_.spinFor(10s);
    EXPECT_THAT(calls,
                ElementsAre(libcyphal::TimePoint{},
                            libcyphal::TimePoint{} + 1s,
                            libcyphal::TimePoint{} + 2s));
    EXPECT_EQ(0U, queue.pendingCount());
}

TEST_F(TestSerialQueue, action_runs_exactly_once)
{
    SerialQueue queue{scheduler_};

    int calls = 0;
    queue.delay(100ms, [&] { ++calls; });

    scheduler_.spinFor(50ms);
    EXPECT_EQ(0, calls);
    scheduler_.spinFor(50ms);
    EXPECT_EQ(1, calls);
    scheduler_.spinFor(10s);
    EXPECT_EQ(1, calls);
}

TEST_F(TestSerialQueue, action_may_schedule_more_actions)
{
    SerialQueue queue{scheduler_};

    std::vector<int> calls;
    queue.delay(1s, [&] {
        calls.push_back(1);
        queue.delay(1s, [&] { calls.push_back(2); });
        queue.post([&] { calls.push_back(3); });
    });

    scheduler_.spinFor(1s);
    EXPECT_THAT(calls, ElementsAre(1, 3));
    scheduler_.spinFor(1s);
    EXPECT_THAT(calls, ElementsAre(1, 3, 2));
    EXPECT_EQ(0U, queue.pendingCount());
}

TEST_F(TestSerialQueue, negative_delay_is_treated_as_zero)
{
    SerialQueue queue{scheduler_};
    scheduler_.setNow(libcyphal::TimePoint{} + 5s);

    int calls = 0;
    queue.delay(-3s, [&] { ++calls; });
    scheduler_.spinFor(0s);
    EXPECT_EQ(1, calls);
}

TEST_F(TestSerialQueue, destruction_drops_pending_actions)
{
    auto queue = std::make_unique<SerialQueue>(scheduler_);

    int calls = 0;
    queue->delay(1s, [&] { ++calls; });
    queue->delay(2s, [&] { ++calls; });
    scheduler_.spinFor(1s);
    EXPECT_EQ(1, calls);

    queue.reset();
    scheduler_.spinFor(10s);
    EXPECT_EQ(1, calls);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
