//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BLECENTRAL_COMMON_SERIAL_QUEUE_HPP_INCLUDED
#define BLECENTRAL_COMMON_SERIAL_QUEUE_HPP_INCLUDED

#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <vector>

namespace blecentral
{
namespace common
{

/// Serialization domain of a single connection.
///
/// All actions run one at a time on the thread which spins the underlying (single-threaded) executor.
/// Delayed actions are fire-and-forget - there is no way to cancel them, so each action has to
/// validate itself against the state it finds once it runs.
///
class SerialQueue final
{
public:
    using Action = std::function<void()>;

    explicit SerialQueue(libcyphal::IExecutor& executor);

    SerialQueue(SerialQueue&&)                 = delete;
    SerialQueue(const SerialQueue&)            = delete;
    SerialQueue& operator=(SerialQueue&&)      = delete;
    SerialQueue& operator=(const SerialQueue&) = delete;

    /// Drops all actions which didn't run yet.
    ~SerialQueue();

    libcyphal::TimePoint now() const noexcept
    {
        return executor_.now();
    }

    /// Runs the action as soon as possible (on the next executor spin).
    ///
    void post(Action action)
    {
        delay(libcyphal::Duration::zero(), std::move(action));
    }

    /// Runs the action once the given duration has elapsed. Negative durations are treated as zero.
    ///
    void delay(const libcyphal::Duration duration, Action action);

    /// Number of actions which are still waiting to run.
    ///
    std::size_t pendingCount() const noexcept;

private:
    using Id = std::uint64_t;

    struct Entry
    {
        libcyphal::IExecutor::Callback::Any callback;
        Action                              action;
    };

    void fire(const Id id);
    void reclaimSpentEntries();

    libcyphal::IExecutor&              executor_;
    LoggerPtr                          logger_;
    Id                                 next_id_{0};
    std::unordered_map<Id, Entry>      id_to_entry_;
    std::vector<Id>                    spent_ids_;
    cetl::optional<Id>                 firing_id_;

};  // SerialQueue

}  // namespace common
}  // namespace blecentral

#endif  // BLECENTRAL_COMMON_SERIAL_QUEUE_HPP_INCLUDED
