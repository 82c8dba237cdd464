//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "serial_queue.hpp"

#include "logging.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <algorithm>
#include <cstddef>
#include <utility>

namespace blecentral
{
namespace common
{

SerialQueue::SerialQueue(libcyphal::IExecutor& executor)
    : executor_{executor}
    , logger_{getLogger(LoggerNames::Queue)}
{
}

SerialQueue::~SerialQueue()
{
    if (!id_to_entry_.empty())
    {
        logger_->debug("SerialQueue: dropping {} entries.", id_to_entry_.size());
    }
}

void SerialQueue::delay(const libcyphal::Duration duration, Action action)
{
    CETL_DEBUG_ASSERT(action, "");

    reclaimSpentEntries();

    const auto id = next_id_++;

    auto callback = executor_.registerCallback([this, id](const auto&) {
        //
        fire(id);
    });
    if (!callback)
    {
        logger_->error("SerialQueue: failed to register executor callback (id={}).", id);
        return;
    }

    // Clamp the execution time, so that a huge delay doesn't overflow the time point.
    const auto now       = executor_.now();
    const auto max_delay = libcyphal::TimePoint::max() - now;
    const auto exec_time = now + std::max(libcyphal::Duration::zero(), std::min(duration, max_delay));
    if (!callback.schedule(libcyphal::IExecutor::Callback::Schedule::Once{exec_time}))
    {
        logger_->error("SerialQueue: failed to schedule executor callback (id={}).", id);
        return;
    }

    id_to_entry_.emplace(id, Entry{std::move(callback), std::move(action)});
}

std::size_t SerialQueue::pendingCount() const noexcept
{
    return id_to_entry_.size() - spent_ids_.size();
}

void SerialQueue::fire(const Id id)
{
    const auto it = id_to_entry_.find(id);
    if ((it == id_to_entry_.end()) || !it->second.action)
    {
        return;
    }

    // The executor callback itself can't be released while it's running,
    // so the entry is only marked as spent here, and reclaimed on a later `delay` call.
    auto action = std::move(it->second.action);
    it->second.action = nullptr;
    spent_ids_.push_back(id);
    firing_id_ = id;

    action();

    // Don't touch `this` anymore - the action might have released the queue owner.
}

void SerialQueue::reclaimSpentEntries()
{
    const auto new_end = std::remove_if(spent_ids_.begin(), spent_ids_.end(), [this](const Id spent_id) {
        //
        if (firing_id_ && (*firing_id_ == spent_id))
        {
            return false;
        }
        id_to_entry_.erase(spent_id);
        return true;
    });
    spent_ids_.erase(new_end, spent_ids_.end());
}

}  // namespace common
}  // namespace blecentral
