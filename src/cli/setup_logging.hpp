//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BLECENTRAL_CLI_SETUP_LOGGING_HPP_INCLUDED
#define BLECENTRAL_CLI_SETUP_LOGGING_HPP_INCLUDED

#include "config.hpp"
#include "logging.hpp"

#include <spdlog/cfg/argv.h>
#include <spdlog/cfg/helpers.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdlib>
#include <exception>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <string>

namespace detail
{

inline void loadFlushLevels(const std::string& flush_levels)
{
    constexpr std::size_t max_levels_len = 512;
    if (flush_levels.empty() || (flush_levels.size() > max_levels_len))
    {
        return;
    }

    auto key_vals = spdlog::cfg::helpers::extract_key_vals_(flush_levels);  // NOLINT
    for (auto& name_level : key_vals)
    {
        const auto& logger_name = name_level.first;
        auto&       level_name  = spdlog::cfg::helpers::to_lower_(name_level.second);  // NOLINT
        const auto  level       = spdlog::level::from_str(level_name);
        // Unrecognized level names are ignored.
        if (level == spdlog::level::off && level_name != "off")
        {
            continue;
        }

        if (logger_name.empty())
        {
            spdlog::default_logger()->flush_on(level);
        }
        else if (const auto logger = spdlog::get(logger_name))
        {
            logger->flush_on(level);
        }
    }

    // Loggers without explicit flush level inherit the default one.
    const auto default_flush_level = spdlog::default_logger()->flush_level();
    spdlog::apply_all([&key_vals, default_flush_level](const auto& logger) {
        //
        if (!logger->name().empty() && (key_vals.find(logger->name()) == key_vals.end()))
        {
            logger->flush_on(default_flush_level);
        }
    });
}

/// Searches for `SPDLOG_FLUSH_LEVEL=` in the args, and uses it to init the flush levels.
///
inline void loadArgvFlushLevels(const int argc, const char** const argv)
{
    static const std::string spdlog_level_prefix = "SPDLOG_FLUSH_LEVEL=";

    for (int i = 1; i < argc; i++)
    {
        const std::string arg_str = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (0 == arg_str.compare(0, spdlog_level_prefix.size(), spdlog_level_prefix))
        {
            loadFlushLevels(arg_str.substr(spdlog_level_prefix.size()));
        }
    }
}

}  // namespace detail

/// Sets up the logging system.
///
/// The file sink is shared by all loggers, while the colored console sink is used by the default logger only
/// (so that subsystem chatter goes to the file). Levels come from the configuration (if any),
/// and then from `SPDLOG_LEVEL=` & `SPDLOG_FLUSH_LEVEL=` arguments (like `SPDLOG_LEVEL=debug,central=trace`).
///
inline void setupLogging(const int argc, const char** const argv, const blecentral::cli::Config::Ptr& config)
{
    using blecentral::common::LoggerNames;
    using spdlog::sinks::rotating_file_sink_st;
    using spdlog::sinks::stdout_color_sink_st;

    try
    {
        constexpr std::size_t log_files_max     = 4;
        constexpr std::size_t log_file_max_size = 16UL * 1048576UL;  // 16 MB

        std::string log_file_path = "./blecentral-cli.log";
        if (config)
        {
            if (const auto logging_file = config->getLoggingFile())
            {
                log_file_path = logging_file.value();
            }
        }

        // Drop all existing loggers, including the default one, so that we can reconfigure them.
        spdlog::drop_all();

        const auto file_sink = std::make_shared<rotating_file_sink_st>(log_file_path, log_file_max_size, log_files_max);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%P] [%n] [%l] %v");

        const auto console_sink = std::make_shared<stdout_color_sink_st>();
        console_sink->set_pattern("[%^%l%$] %v");
        console_sink->set_level(spdlog::level::warn);

        const std::initializer_list<spdlog::sink_ptr> sinks{console_sink, file_sink};
        const auto default_logger = std::make_shared<spdlog::logger>("", sinks);
        spdlog::register_logger(default_logger);
        spdlog::set_default_logger(default_logger);

        // Subsystem loggers go to the file sink only.
        for (const auto* const name : LoggerNames::all())
        {
            spdlog::register_logger(std::make_shared<spdlog::logger>(name, file_sink));
        }

        if (config)
        {
            if (const auto logging_level = config->getLoggingLevel())
            {
                spdlog::cfg::helpers::load_levels(logging_level.value());
            }
            if (const auto logging_flush_level = config->getLoggingFlushLevel())
            {
                detail::loadFlushLevels(logging_flush_level.value());
            }
        }
        spdlog::cfg::load_argv_levels(argc, argv);
        detail::loadArgvFlushLevels(argc, argv);

        // Separates runs in the log file.
        if (spdlog::default_logger()->should_log(spdlog::level::info))
        {
            file_sink->log({"", spdlog::level::info, "--------------------------"});
        }

    } catch (const std::exception& ex)
    {
        std::cerr << "Failed to setup logging: " << ex.what() << '\n';
        std::exit(EXIT_FAILURE);
    }
}

#endif  // BLECENTRAL_CLI_SETUP_LOGGING_HPP_INCLUDED
