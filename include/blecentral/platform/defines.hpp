//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BLECENTRAL_PLATFORM_DEFINES_HPP_INCLUDED
#define BLECENTRAL_PLATFORM_DEFINES_HPP_INCLUDED

#include "posix_single_threaded_executor.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/types.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace blecentral
{
namespace platform
{

using SingleThreadedExecutor = posix::PosixSingleThreadedExecutor;

/// Waits for the predicate to be fulfilled by spinning the executor.
///
/// The executor must expose `spinOnce`, `now` and `pollAwaitableResourcesFor`.
///
template <typename Executor, typename Predicate>
void waitPollingUntil(Executor& executor, Predicate predicate)
{
    spdlog::trace("Waiting for predicate to be fulfilled...");

    libcyphal::Duration worst_lateness{0};
    while (!predicate())
    {
        const auto spin_result = executor.spinOnce();
        worst_lateness         = std::max(worst_lateness, spin_result.worst_lateness);

        // Above `spinOnce` might fulfill the predicate.
        if (predicate())
        {
            break;
        }

        // Sleep until the next scheduled callback, but awake at least once per second.
        libcyphal::Duration timeout{std::chrono::seconds{1}};
        if (spin_result.next_exec_time.has_value())
        {
            timeout = std::min(timeout, spin_result.next_exec_time.value() - executor.now());
        }

        if (const auto poll_failure = executor.pollAwaitableResourcesFor(cetl::make_optional(timeout)))
        {
            spdlog::warn("Failed to wait for the next callback (err={}).", *poll_failure);
        }
    }

    spdlog::trace("Predicate is fulfilled (worst_lateness={}us).",
                  std::chrono::duration_cast<std::chrono::microseconds>(worst_lateness).count());
}

}  // namespace platform
}  // namespace blecentral

#endif  // BLECENTRAL_PLATFORM_DEFINES_HPP_INCLUDED
