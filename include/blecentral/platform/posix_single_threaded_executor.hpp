//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BLECENTRAL_PLATFORM_POSIX_SINGLE_THREADED_EXECUTOR_HPP_INCLUDED
#define BLECENTRAL_PLATFORM_POSIX_SINGLE_THREADED_EXECUTOR_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/platform/single_threaded_executor.hpp>
#include <libcyphal/types.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <limits>
#include <poll.h>

namespace blecentral
{
namespace platform
{
namespace posix
{

/// Single-threaded executor driven by the host monotonic clock.
///
/// The executor owns no awaitable resources (BLE transports deliver their events as executor callbacks),
/// so the idle wait between scheduled callbacks is a plain `poll(2)` without descriptors.
/// A signal interrupts the wait early, which lets the caller re-check its termination flag.
///
class PosixSingleThreadedExecutor final : public libcyphal::platform::SingleThreadedExecutor
{
public:
    using PollFailure = int;  // `errno`-like error code.

    /// Waits for at most the given timeout (forever if not specified).
    ///
    /// @return `nullopt` on timeout or signal interruption; `errno` otherwise.
    ///
    CETL_NODISCARD cetl::optional<PollFailure> pollAwaitableResourcesFor(
        const cetl::optional<libcyphal::Duration> timeout) const
    {
        int timeout_ms = -1;
        if (timeout.has_value())
        {
            // Round up, so that we never wake up before the next callback is due.
            const auto timeout_us = std::max<std::int64_t>(0, timeout->count());
            const auto ms         = (timeout_us + 999) / 1000;  // NOLINT(*-magic-numbers)
            timeout_ms            = static_cast<int>(std::min<std::int64_t>(ms, std::numeric_limits<int>::max()));
        }

        if (::poll(nullptr, 0, timeout_ms) < 0)
        {
            const int error_num = errno;
            if (error_num != EINTR)
            {
                return error_num;
            }
        }
        return cetl::nullopt;
    }

    // MARK: - IExecutor

    CETL_NODISCARD libcyphal::TimePoint now() const noexcept override
    {
        const auto since_epoch = std::chrono::steady_clock::now().time_since_epoch();
        return libcyphal::TimePoint{std::chrono::duration_cast<libcyphal::Duration>(since_epoch)};
    }

};  // PosixSingleThreadedExecutor

}  // namespace posix
}  // namespace platform
}  // namespace blecentral

#endif  // BLECENTRAL_PLATFORM_POSIX_SINGLE_THREADED_EXECUTOR_HPP_INCLUDED
