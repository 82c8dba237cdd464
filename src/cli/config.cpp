//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "config.hpp"

#include "logging.hpp"

#include <blecentral/sdk/transport.hpp>
#include <blecentral/sdk/uuid.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/spdlog.h>
#include <toml.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace blecentral
{
namespace cli
{
namespace
{

class ConfigImpl final : public Config
{
public:
    using TomlConf  = toml::ordered_type_config;
    using TomlValue = toml::basic_value<TomlConf>;

    ConfigImpl(std::string origin, TomlValue&& root)
        : origin_{std::move(origin)}
        , root_{std::move(root)}
    {
    }

    // Config

    auto getLoggingFile() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>(root_, "logging", "file");
    }

    auto getLoggingLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>(root_, "logging", "level");
    }

    auto getLoggingFlushLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>(root_, "logging", "flush_level");
    }

    auto getDiscoveryTimeout() const -> cetl::optional<std::chrono::milliseconds> override
    {
        const auto timeout_ms = findImpl<std::int64_t>(root_, "discovery", "timeout_ms");
        if (!timeout_ms)
        {
            return cetl::nullopt;
        }

        // The timeout is applied in microseconds.
        constexpr auto max_timeout_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::microseconds::max()).count();
        if ((*timeout_ms < 0) || (*timeout_ms > max_timeout_ms))
        {
            logger()->warn("Config '{}': discovery timeout {}ms is out of range [0, {}] - ignored.",
                           origin_,
                           *timeout_ms,
                           max_timeout_ms);
            return cetl::nullopt;
        }
        return std::chrono::milliseconds{*timeout_ms};
    }

    auto getPeripheral() const -> cetl::optional<PeripheralSetup> override
    {
        try
        {
            if (!root_.contains("peripheral"))
            {
                logger()->error("Config '{}': missing [peripheral] table.", origin_);
                return cetl::nullopt;
            }
            const auto& toml_peripheral = root_.at("peripheral");

            PeripheralSetup setup;
            setup.identifier     = toml::find_or(toml_peripheral, "identifier", std::string{"simulated"});
            setup.latency        = std::chrono::milliseconds{toml::find_or(toml_peripheral, "latency_ms", std::int64_t{0})};
            setup.connected      = toml::find_or(toml_peripheral, "connected", true);
            setup.services_error = findImpl<int>(toml_peripheral, "services_error");
            if (const auto disconnect_after_ms = findImpl<std::int64_t>(toml_peripheral, "disconnect_after_ms"))
            {
                setup.disconnect_after = std::chrono::milliseconds{*disconnect_after_ms};
            }

            if (toml_peripheral.contains("services"))
            {
                for (const auto& toml_service : toml_peripheral.at("services").as_array())
                {
                    auto service = parseService(toml_service);
                    if (!service)
                    {
                        return cetl::nullopt;
                    }
                    setup.services.push_back(std::move(*service));
                }
            }
            return setup;

        } catch (const std::exception& ex)
        {
            logger()->error("Config '{}': malformed [peripheral] table: {}", origin_, ex.what());
            return cetl::nullopt;
        }
    }

private:
    template <typename T, typename... Keys>
    static cetl::optional<T> findImpl(const TomlValue& value, Keys&&... keys)
    {
        try
        {
            return cetl::make_optional(toml::find<T>(value, std::forward<Keys>(keys)...));

        } catch (const std::exception&)
        {
            // Missing key or value of an unexpected type.
            return cetl::nullopt;
        }
    }

    cetl::optional<sdk::Uuid> parseUuid(const TomlValue& value) const
    {
        const auto text = toml::find<std::string>(value, "uuid");
        auto       uuid = sdk::Uuid::parse(text);
        if (!uuid)
        {
            logger()->error("Config '{}': invalid UUID '{}'.", origin_, text);
        }
        return uuid;
    }

    cetl::optional<ServiceSetup> parseService(const TomlValue& toml_service) const
    {
        const auto uuid = parseUuid(toml_service);
        if (!uuid)
        {
            return cetl::nullopt;
        }

        ServiceSetup service;
        service.uuid  = *uuid;
        service.error = findImpl<int>(toml_service, "error");
        service.drop  = toml::find_or(toml_service, "drop", false);

        if (toml_service.contains("characteristics"))
        {
            for (const auto& toml_characteristic : toml_service.at("characteristics").as_array())
            {
                const auto chr_uuid = parseUuid(toml_characteristic);
                if (!chr_uuid)
                {
                    return cetl::nullopt;
                }

                CharacteristicSetup characteristic;
                characteristic.uuid  = *chr_uuid;
                characteristic.error = findImpl<int>(toml_characteristic, "error");

                const auto value_text = toml::find_or(toml_characteristic, "value", std::string{});
                auto       value      = parseHexValue(value_text);
                if (!value)
                {
                    logger()->error("Config '{}': invalid characteristic value '{}'.", origin_, value_text);
                    return cetl::nullopt;
                }
                characteristic.value = std::move(*value);

                const auto property_names =
                    toml::find_or(toml_characteristic, "properties", std::vector<std::string>{});
                for (const auto& property_name : property_names)
                {
                    const auto property = parseCharacteristicProperty(property_name);
                    if (!property)
                    {
                        logger()->error("Config '{}': unknown characteristic property '{}'.", origin_, property_name);
                        return cetl::nullopt;
                    }
                    characteristic.properties |= *property;
                }
                service.characteristics.push_back(characteristic);
            }
        }
        return service;
    }

    // Not cached - the config is loaded before the logging is set up.
    static common::LoggerPtr logger()
    {
        return common::getLogger(common::LoggerNames::Cli);
    }

    const std::string origin_;
    const TomlValue   root_;

};  // ConfigImpl

}  // namespace

Config::Ptr Config::make(std::string file_path)
{
    try
    {
        auto root = toml::parse<ConfigImpl::TomlConf>(file_path);
        return std::make_shared<ConfigImpl>(std::move(file_path), std::move(root));

    } catch (const std::exception& ex)
    {
        spdlog::error("Failed to load config '{}': {}", file_path, ex.what());
        return nullptr;
    }
}

Config::Ptr Config::makeFromString(const std::string& toml_text)
{
    try
    {
        auto root = toml::parse_str<ConfigImpl::TomlConf>(toml_text);
        return std::make_shared<ConfigImpl>("<string>", std::move(root));

    } catch (const std::exception& ex)
    {
        spdlog::error("Failed to parse config: {}", ex.what());
        return nullptr;
    }
}

cetl::optional<sdk::CharacteristicProperties::Bits> parseCharacteristicProperty(const std::string& name)
{
    using Props = sdk::CharacteristicProperties;

    struct NameAndBits
    {
        const char* name;
        Props::Bits bits;
    };
    static const NameAndBits known_properties[] = {  // NOLINT(*-avoid-c-arrays)
        {"broadcast", Props::Broadcast},
        {"read", Props::Read},
        {"write_without_response", Props::WriteWithoutResponse},
        {"write", Props::Write},
        {"notify", Props::Notify},
        {"indicate", Props::Indicate},
        {"authenticated_signed_writes", Props::AuthenticatedSignedWrites},
        {"extended_properties", Props::ExtendedProperties},
    };
    for (const auto& known : known_properties)
    {
        if (name == known.name)
        {
            return known.bits;
        }
    }
    return cetl::nullopt;
}

cetl::optional<sdk::CharacteristicValue> parseHexValue(const std::string& text)
{
    if ((text.size() % 2) != 0)
    {
        return cetl::nullopt;
    }

    const auto digit = [](const char ch) -> int {
        //
        if ((ch >= '0') && (ch <= '9'))
        {
            return ch - '0';
        }
        if ((ch >= 'a') && (ch <= 'f'))
        {
            return ch - 'a' + 10;  // NOLINT(*-magic-numbers)
        }
        if ((ch >= 'A') && (ch <= 'F'))
        {
            return ch - 'A' + 10;  // NOLINT(*-magic-numbers)
        }
        return -1;
    };

    sdk::CharacteristicValue value;
    value.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); i += 2)
    {
        const int high = digit(text[i]);
        const int low  = digit(text[i + 1]);
        if ((high < 0) || (low < 0))
        {
            return cetl::nullopt;
        }
        value.push_back(static_cast<std::uint8_t>((high << 4) | low));  // NOLINT(*-signed-bitwise)
    }
    return value;
}

}  // namespace cli
}  // namespace blecentral
