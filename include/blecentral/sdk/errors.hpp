//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BLECENTRAL_SDK_ERRORS_HPP_INCLUDED
#define BLECENTRAL_SDK_ERRORS_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <cstdint>

namespace blecentral
{
namespace sdk
{

/// The connection was not in the connected state when the operation was requested.
///
/// No transport request has been issued.
///
struct NotConnectedError final
{};

/// The connection dropped while the operation was in flight.
///
struct DisconnectedError final
{};

/// The discovery timeout elapsed before the transport responded.
///
struct DiscoveryTimeoutError final
{};

/// The owner of the operation is detached from its connection
/// (the peripheral is gone, or it has replaced the service or characteristic).
///
struct UnconfiguredError final
{};

/// The characteristic operation timeout elapsed before the transport responded.
///
struct OperationTimeoutError final
{};

/// The characteristic lacks the property the operation requires.
///
struct NotSupportedError final
{
    std::uint8_t required;  // Property bits; any one of them would do.
};

/// A write with response is already in flight for the characteristic.
///
/// ATT allows only one outstanding request, so writes are not queued.
///
struct BusyError final
{};

/// The transport reported a failure.
///
struct TransportError final
{
    int code;  // `errno`-like error code as reported by the transport.
};

using DiscoveryFailure =
    cetl::variant<NotConnectedError, DisconnectedError, DiscoveryTimeoutError, TransportError, UnconfiguredError>;

using OperationFailure = cetl::variant<NotConnectedError,
                                       DisconnectedError,
                                       OperationTimeoutError,
                                       TransportError,
                                       UnconfiguredError,
                                       NotSupportedError,
                                       BusyError>;

}  // namespace sdk
}  // namespace blecentral

// MARK: - Formatting

// NOLINTBEGIN
template <>
struct fmt::formatter<blecentral::sdk::NotConnectedError> : formatter<string_view>
{
    auto format(blecentral::sdk::NotConnectedError, format_context& ctx) const
    {
        return formatter<string_view>::format("NotConnected", ctx);
    }
};

template <>
struct fmt::formatter<blecentral::sdk::DisconnectedError> : formatter<string_view>
{
    auto format(blecentral::sdk::DisconnectedError, format_context& ctx) const
    {
        return formatter<string_view>::format("Disconnected", ctx);
    }
};

template <>
struct fmt::formatter<blecentral::sdk::DiscoveryTimeoutError> : formatter<string_view>
{
    auto format(blecentral::sdk::DiscoveryTimeoutError, format_context& ctx) const
    {
        return formatter<string_view>::format("DiscoveryTimeout", ctx);
    }
};

template <>
struct fmt::formatter<blecentral::sdk::UnconfiguredError> : formatter<string_view>
{
    auto format(blecentral::sdk::UnconfiguredError, format_context& ctx) const
    {
        return formatter<string_view>::format("Unconfigured", ctx);
    }
};

template <>
struct fmt::formatter<blecentral::sdk::TransportError> : formatter<string_view>
{
    auto format(blecentral::sdk::TransportError error, format_context& ctx) const
    {
        return format_to(ctx.out(), "TransportError(code={})", error.code);
    }
};

template <>
struct fmt::formatter<blecentral::sdk::OperationTimeoutError> : formatter<string_view>
{
    auto format(blecentral::sdk::OperationTimeoutError, format_context& ctx) const
    {
        return formatter<string_view>::format("OperationTimeout", ctx);
    }
};

template <>
struct fmt::formatter<blecentral::sdk::NotSupportedError> : formatter<string_view>
{
    auto format(blecentral::sdk::NotSupportedError error, format_context& ctx) const
    {
        return format_to(ctx.out(), "NotSupported(required=0x{:02X})", error.required);
    }
};

template <>
struct fmt::formatter<blecentral::sdk::BusyError> : formatter<string_view>
{
    auto format(blecentral::sdk::BusyError, format_context& ctx) const
    {
        return formatter<string_view>::format("Busy", ctx);
    }
};

template <>
struct fmt::formatter<blecentral::sdk::DiscoveryFailure> : formatter<string_view>
{
    auto format(const blecentral::sdk::DiscoveryFailure& failure, format_context& ctx) const
    {
        return cetl::visit([&ctx](const auto& error) { return format_to(ctx.out(), "{}", error); }, failure);
    }
};

template <>
struct fmt::formatter<blecentral::sdk::OperationFailure> : formatter<string_view>
{
    auto format(const blecentral::sdk::OperationFailure& failure, format_context& ctx) const
    {
        return cetl::visit([&ctx](const auto& error) { return format_to(ctx.out(), "{}", error); }, failure);
    }
};
// NOLINTEND

#endif  // BLECENTRAL_SDK_ERRORS_HPP_INCLUDED
