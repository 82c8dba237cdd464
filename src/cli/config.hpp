//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BLECENTRAL_CLI_CONFIG_HPP_INCLUDED
#define BLECENTRAL_CLI_CONFIG_HPP_INCLUDED

#include <blecentral/sdk/transport.hpp>
#include <blecentral/sdk/uuid.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace blecentral
{
namespace cli
{

class Config
{
public:
    using Ptr = std::shared_ptr<Config>;

    /// Behaviour of a simulated GATT characteristic.
    struct CharacteristicSetup
    {
        sdk::Uuid                           uuid;
        sdk::CharacteristicProperties::Bits properties{0};

        /// Initial value; reads answer with the most recently written one.
        sdk::CharacteristicValue value;

        /// Read, write and notification requests of this characteristic fail with this code.
        cetl::optional<int> error;
    };

    /// Behaviour of a simulated GATT service.
    struct ServiceSetup
    {
        sdk::Uuid                        uuid;
        std::vector<CharacteristicSetup> characteristics;

        /// Characteristic discovery of this service fails with this code.
        cetl::optional<int> error;

        /// Characteristic discovery of this service is never answered.
        bool drop{false};
    };

    /// Behaviour of the simulated peripheral.
    struct PeripheralSetup
    {
        std::string                     identifier{"simulated"};
        std::chrono::milliseconds       latency{0};
        bool                            connected{true};
        cetl::optional<int>             services_error;
        cetl::optional<std::chrono::milliseconds> disconnect_after;
        std::vector<ServiceSetup>       services;
    };

    /// Loads configuration from a TOML file.
    ///
    /// @return `nullptr` if the file can't be read or parsed (see logs for the reason of failure).
    ///
    CETL_NODISCARD static Ptr make(std::string file_path);

    /// Parses configuration from an in-memory TOML document.
    ///
    CETL_NODISCARD static Ptr makeFromString(const std::string& toml_text);

    Config(const Config&)                = delete;
    Config(Config&&) noexcept            = delete;
    Config& operator=(const Config&)     = delete;
    Config& operator=(Config&&) noexcept = delete;

    virtual ~Config() = default;

    CETL_NODISCARD virtual auto getLoggingFile() const -> cetl::optional<std::string>       = 0;
    CETL_NODISCARD virtual auto getLoggingLevel() const -> cetl::optional<std::string>      = 0;
    CETL_NODISCARD virtual auto getLoggingFlushLevel() const -> cetl::optional<std::string> = 0;

    /// Gets the per-round discovery timeout. `nullopt` means no timeout.
    ///
    /// Values which are negative, or too big to be represented in microseconds,
    /// are rejected (see logs), and so mean no timeout too.
    ///
    CETL_NODISCARD virtual auto getDiscoveryTimeout() const -> cetl::optional<std::chrono::milliseconds> = 0;

    /// Gets setup of the simulated peripheral.
    ///
    /// @return `nullopt` if the `[peripheral]` table is missing or malformed (see logs).
    ///
    CETL_NODISCARD virtual auto getPeripheral() const -> cetl::optional<PeripheralSetup> = 0;

protected:
    Config() = default;

};  // Config

/// Parses name of a characteristic property (f.e. "write_without_response").
///
/// @return `nullopt` if the name is unknown.
///
CETL_NODISCARD cetl::optional<sdk::CharacteristicProperties::Bits> parseCharacteristicProperty(const std::string& name);

/// Parses a characteristic value from its hex representation (f.e. "5A01"; an empty string is an empty value).
///
/// @return `nullopt` if there is an odd number of digits, or a non-hex character.
///
CETL_NODISCARD cetl::optional<sdk::CharacteristicValue> parseHexValue(const std::string& text);

}  // namespace cli
}  // namespace blecentral

#endif  // BLECENTRAL_CLI_CONFIG_HPP_INCLUDED
