//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BLECENTRAL_COMMON_LOGGING_HPP_INCLUDED
#define BLECENTRAL_COMMON_LOGGING_HPP_INCLUDED

#include "common_helpers.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <array>
#include <memory>
#include <string>

namespace blecentral
{
namespace common
{

using Logger    = spdlog::logger;
using LoggerPtr = std::shared_ptr<Logger>;

/// Names of the subsystem loggers.
///
struct LoggerNames final
{
    static constexpr const char* Central = "central";
    static constexpr const char* Queue   = "queue";
    static constexpr const char* Cli     = "cli";
    static constexpr const char* Sim     = "sim";

    static std::array<const char*, 4> all() noexcept
    {
        return {Central, Queue, Cli, Sim};
    }

};  // LoggerNames

/// Gets a named subsystem logger.
///
/// Loggers registered up front by the application are returned as is. Otherwise the default logger
/// is cloned under the given name (so the clone shares its sinks and level) and registered.
///
inline LoggerPtr getLogger(const std::string& name) noexcept
{
    if (auto logger = spdlog::get(name))
    {
        return logger;
    }

    auto default_logger = spdlog::default_logger();
    CETL_DEBUG_ASSERT(default_logger, "default");

    auto logger = default_logger->clone(name);
    CETL_DEBUG_ASSERT(logger, name.c_str());

    // A concurrent registration under the same name makes this fail, but the clone is still usable.
    performWithoutThrowing("register logger", [&logger] {
        //
        spdlog::register_logger(logger);
    });

    return logger;
}

}  // namespace common
}  // namespace blecentral

#if (__cplusplus < CETL_CPP_STANDARD_17)
template <>
struct fmt::formatter<cetl::string_view> : formatter<string_view>
{
    auto format(cetl::string_view sv, format_context& ctx) const
    {
        return formatter<string_view>::format(string_view{sv.data(), sv.size()}, ctx);
    }
};
#endif

#endif  // BLECENTRAL_COMMON_LOGGING_HPP_INCLUDED
