//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "config.hpp"
#include "setup_logging.hpp"
#include "simulated_transport.hpp"

#include <blecentral/platform/defines.hpp>
#include <blecentral/sdk/characteristic.hpp>
#include <blecentral/sdk/discovery.hpp>
#include <blecentral/sdk/execution.hpp>
#include <blecentral/sdk/peripheral.hpp>
#include <blecentral/sdk/service.hpp>
#include <blecentral/sdk/transport.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <signal.h>  // NOLINT
#include <string>
#include <utility>
#include <vector>

namespace
{

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile sig_atomic_t g_running = 1;

void signalHandler(const int sig)
{
    switch (sig)
    {
    case SIGINT:
    case SIGTERM:
        g_running = 0;
        break;
    default:
        break;
    }
}

void setupSignalHandlers()
{
    struct sigaction sigbreak
    {};
    sigbreak.sa_handler = &signalHandler;
    ::sigaction(SIGINT, &sigbreak, nullptr);
    ::sigaction(SIGTERM, &sigbreak, nullptr);
}

/// Resolves the config file path: `--config <file>` argument, then `BLECENTRAL_CONFIG` env var,
/// and finally `./blecentral.toml`.
///
std::string findConfigPath(const int argc, const char** const argv)
{
    for (int i = 1; i < argc; i++)
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if ((0 == std::strcmp(argv[i], "--config")) && ((i + 1) < argc))
        {
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    if (const auto* const env_config = std::getenv("BLECENTRAL_CONFIG"))
    {
        return env_config;
    }
    return "./blecentral.toml";
}

void printDiscovered(const blecentral::sdk::Peripheral& peripheral)
{
    using blecentral::sdk::CharacteristicProperties;

    std::cout << "Peripheral '" << peripheral.identifier() << "':\n";
    for (const auto& service : peripheral.services())
    {
        std::cout << fmt::format("  Service {}\n", service->uuid());
        for (const auto& characteristic : service->characteristics())
        {
            std::cout << fmt::format("    Characteristic {} (properties=0x{:02X}{}{})",
                                     characteristic->uuid(),
                                     characteristic->properties(),
                                     characteristic->hasProperty(CharacteristicProperties::Read) ? ", read" : "",
                                     characteristic->hasProperty(CharacteristicProperties::Notify) ? ", notify" : "");
            if (const auto& value = characteristic->value())
            {
                std::cout << fmt::format(" = {:02X}", fmt::join(*value, ""));
            }
            std::cout << "\n";
        }
    }
}

/// Reads all readable characteristics (concurrently), so that their values get printed too.
///
template <typename Executor>
void readAllValues(Executor& executor, const blecentral::sdk::Peripheral& peripheral, const std::chrono::microseconds timeout)
{
    using blecentral::sdk::CharacteristicProperties;
    using ReadOperation = blecentral::sdk::ReadOperation;

    std::vector<ReadOperation::Future> reads;
    for (const auto& service : peripheral.services())
    {
        for (const auto& characteristic : service->characteristics())
        {
            if (characteristic->hasProperty(CharacteristicProperties::Read))
            {
                auto future = characteristic->read(timeout);
                future.onFailure([uuid = characteristic->uuid()](const ReadOperation::Failure& failure) {
                    //
                    spdlog::warn("Failed to read characteristic '{}': {}.", uuid, failure);
                });
                reads.push_back(std::move(future));
            }
        }
    }

    blecentral::platform::waitPollingUntil(executor, [&reads] {
        //
        for (const auto& read : reads)
        {
            if (!read.completed())
            {
                return g_running == 0;
            }
        }
        return true;
    });
}

}  // namespace

int main(const int argc, const char** const argv)
{
    using Executor  = blecentral::platform::SingleThreadedExecutor;
    using Discovery = blecentral::sdk::Discovery;

    setupSignalHandlers();

    const auto config_path = findConfigPath(argc, argv);
    const auto config      = blecentral::cli::Config::make(config_path);
    setupLogging(argc, argv, config);
    if (!config)
    {
        std::cerr << "Failed to load config '" << config_path << "'.\n";
        return EXIT_FAILURE;
    }

    spdlog::info("BLE central CLI started (ver='{}.{}', config='{}').", VERSION_MAJOR, VERSION_MINOR, config_path);
    int result = EXIT_FAILURE;
    try
    {
        auto peripheral_setup = config->getPeripheral();
        if (!peripheral_setup)
        {
            std::cerr << "Invalid peripheral setup in '" << config_path << "'.\n";
            return EXIT_FAILURE;
        }

        std::chrono::microseconds timeout = blecentral::sdk::InfiniteTimeout;
        if (const auto config_timeout = config->getDiscoveryTimeout())
        {
            timeout = *config_timeout;
        }

        Executor   executor;
        const auto identifier = peripheral_setup->identifier;
        auto       transport  = std::make_unique<blecentral::cli::SimulatedTransport>(executor, std::move(*peripheral_setup));
        const auto peripheral = blecentral::sdk::Peripheral::make(executor, std::move(transport), identifier);
        if (!peripheral)
        {
            spdlog::critical("Failed to make peripheral.");
            return EXIT_FAILURE;
        }

        auto future = peripheral->discoverAllServicesAndCharacteristics(timeout);
        blecentral::platform::waitPollingUntil(executor, [&future] { return future.completed() || (g_running == 0); });

        if (g_running == 0)
        {
            spdlog::debug("Received termination signal.");
        }
        else if (const auto* const failure = cetl::get_if<Discovery::Failure>(future.result()))
        {
            spdlog::error("Discovery has failed: {}.", *failure);
            printDiscovered(*peripheral);
        }
        else
        {
            readAllValues(executor, *peripheral, timeout);
            printDiscovered(*peripheral);
            result = EXIT_SUCCESS;
        }

    } catch (const std::exception& ex)
    {
        spdlog::critical("Unhandled exception: {}", ex.what());
        result = EXIT_FAILURE;
    }
    spdlog::info("BLE central CLI terminated (result={}).", result);

    return result;
}
