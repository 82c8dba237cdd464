//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BLECENTRAL_SDK_TRANSPORT_HPP_INCLUDED
#define BLECENTRAL_SDK_TRANSPORT_HPP_INCLUDED

#include "uuid.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace blecentral
{
namespace sdk
{

enum class ConnectionState : std::uint8_t
{
    Disconnected,
    Connecting,
    Connected,
    Disconnecting,
};

/// GATT characteristic properties (bit values as defined by the Bluetooth Core specification).
///
struct CharacteristicProperties final
{
    using Bits = std::uint8_t;

    // NOLINTBEGIN(*-magic-numbers)
    static constexpr Bits Broadcast                 = 0x01;
    static constexpr Bits Read                      = 0x02;
    static constexpr Bits WriteWithoutResponse      = 0x04;
    static constexpr Bits Write                     = 0x08;
    static constexpr Bits Notify                    = 0x10;
    static constexpr Bits Indicate                  = 0x20;
    static constexpr Bits AuthenticatedSignedWrites = 0x40;
    static constexpr Bits ExtendedProperties        = 0x80;
    // NOLINTEND(*-magic-numbers)

};  // CharacteristicProperties

/// Value of a characteristic, as transferred over the air.
///
using CharacteristicValue = std::vector<std::uint8_t>;

enum class WriteType : std::uint8_t
{
    WithResponse,
    WithoutResponse,
};

/// Service as reported by the transport.
///
struct RawService final
{
    Uuid uuid;
};

/// Characteristic as reported by the transport.
///
struct RawCharacteristic final
{
    Uuid                           uuid;
    CharacteristicProperties::Bits properties;
};

/// Abstract interface of the link to a connected (or connectable) remote peripheral.
///
/// Requests are fire-and-forget: their completion is delivered later as an event to the subscribed
/// handler. Implementations must deliver all events on the thread of the executor the peripheral was made with.
///
class Transport
{
public:
    using Ptr = std::unique_ptr<Transport>;

    struct Event
    {
        /// Completion of a `discoverServices` request.
        /// On failure `error` is set, and `services` may still carry whatever was received before the failure.
        struct ServicesDiscovered
        {
            std::vector<RawService> services;
            cetl::optional<int>     error;
        };

        /// Completion of a `discoverCharacteristics` request.
        struct CharacteristicsDiscovered
        {
            Uuid                           service_uuid;
            std::vector<RawCharacteristic> characteristics;
            cetl::optional<int>            error;
        };

        /// The link has dropped (`error` is empty for a locally requested disconnection).
        struct Disconnected
        {
            cetl::optional<int> error;
        };

        /// Completion of a `readValue` request.
        struct ValueRead
        {
            Uuid                service_uuid;
            Uuid                characteristic_uuid;
            CharacteristicValue value;
            cetl::optional<int> error;
        };

        /// Completion of a `writeValue` request with response.
        /// Writes without response are never acknowledged.
        struct ValueWritten
        {
            Uuid                service_uuid;
            Uuid                characteristic_uuid;
            cetl::optional<int> error;
        };

        /// Completion of a `setNotifyValue` request.
        struct NotificationStateChanged
        {
            Uuid                service_uuid;
            Uuid                characteristic_uuid;
            bool                enabled;
            cetl::optional<int> error;
        };

        /// The peripheral has notified (or indicated) a new value of the characteristic.
        struct ValueNotified
        {
            Uuid                service_uuid;
            Uuid                characteristic_uuid;
            CharacteristicValue value;
        };

        using Var = cetl::variant<ServicesDiscovered,
                                  CharacteristicsDiscovered,
                                  Disconnected,
                                  ValueRead,
                                  ValueWritten,
                                  NotificationStateChanged,
                                  ValueNotified>;
    };
    using EventHandler = std::function<void(const Event::Var&)>;

    Transport(Transport&&)                 = delete;
    Transport(const Transport&)            = delete;
    Transport& operator=(Transport&&)      = delete;
    Transport& operator=(const Transport&) = delete;

    virtual ~Transport() = default;

    CETL_NODISCARD virtual ConnectionState connectionState() const = 0;

    /// Requests discovery of the peripheral's primary services.
    ///
    /// @param service_uuids Services of interest; `nullopt` means all of them.
    ///
    virtual void discoverServices(const cetl::optional<UuidSet>& service_uuids) = 0;

    /// Requests discovery of characteristics of the given service.
    ///
    /// @param characteristic_uuids Characteristics of interest; `nullopt` means all of them.
    ///
    virtual void discoverCharacteristics(const Uuid& service_uuid, const cetl::optional<UuidSet>& characteristic_uuids) = 0;

    virtual void readValue(const Uuid& service_uuid, const Uuid& characteristic_uuid) = 0;

    virtual void writeValue(const Uuid&                service_uuid,
                            const Uuid&                characteristic_uuid,
                            const CharacteristicValue& value,
                            const WriteType            type) = 0;

    /// Enables (or disables) notifications (or indications) of the characteristic value.
    ///
    virtual void setNotifyValue(const Uuid& service_uuid, const Uuid& characteristic_uuid, const bool enabled) = 0;

    /// Subscribes to the transport events (replaces previous subscription, `nullptr` unsubscribes).
    ///
    virtual void subscribe(EventHandler event_handler) = 0;

protected:
    Transport() = default;

};  // Transport

}  // namespace sdk
}  // namespace blecentral

// MARK: - Formatting

// NOLINTBEGIN
template <>
struct fmt::formatter<blecentral::sdk::ConnectionState> : formatter<string_view>
{
    auto format(const blecentral::sdk::ConnectionState state, format_context& ctx) const
    {
        using State = blecentral::sdk::ConnectionState;

        string_view name = "?";
        switch (state)
        {
        case State::Disconnected:
            name = "Disconnected";
            break;
        case State::Connecting:
            name = "Connecting";
            break;
        case State::Connected:
            name = "Connected";
            break;
        case State::Disconnecting:
            name = "Disconnecting";
            break;
        }
        return formatter<string_view>::format(name, ctx);
    }
};

template <>
struct fmt::formatter<blecentral::sdk::WriteType> : formatter<string_view>
{
    auto format(const blecentral::sdk::WriteType type, format_context& ctx) const
    {
        return formatter<string_view>::format((type == blecentral::sdk::WriteType::WithResponse) ? "WithResponse"
                                                                                                  : "WithoutResponse",
                                              ctx);
    }
};
// NOLINTEND

#endif  // BLECENTRAL_SDK_TRANSPORT_HPP_INCLUDED
