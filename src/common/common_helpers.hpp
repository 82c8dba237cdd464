//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BLECENTRAL_COMMON_HELPERS_HPP_INCLUDED
#define BLECENTRAL_COMMON_HELPERS_HPP_INCLUDED

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace blecentral
{
namespace common
{

/// Performs the given action, and converts an exception of the given type into a `false` result.
///
/// Used at the seams with third-party code which may throw (f.e. spdlog registry, toml11 parser),
/// so that the rest of the library stays exception-free.
///
/// @param context Short description of the action, used for the log record.
/// @return `true` if the action was performed successfully, `false` if an exception was thrown.
///         Always `true` if exceptions are disabled.
///
template <typename Exception = std::exception, typename Action>
bool performWithoutThrowing(const char* const context, Action&& action) noexcept
{
#if defined(__cpp_exceptions)
    try
    {
#endif
        std::forward<Action>(action)();
        return true;

#if defined(__cpp_exceptions)
    } catch (const Exception& ex)
    {
        spdlog::critical("{}: unexpected C++ exception is caught: {}", context, ex.what());
        return false;
    }
#endif
}

}  // namespace common
}  // namespace blecentral

#endif  // BLECENTRAL_COMMON_HELPERS_HPP_INCLUDED
