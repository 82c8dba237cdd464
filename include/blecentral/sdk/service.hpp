//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BLECENTRAL_SDK_SERVICE_HPP_INCLUDED
#define BLECENTRAL_SDK_SERVICE_HPP_INCLUDED

#include "characteristic.hpp"
#include "discovery.hpp"
#include "uuid.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <memory>
#include <vector>

namespace blecentral
{
namespace sdk
{

class Peripheral;

/// An abstract interface of a discovered GATT service.
///
/// Services are made by the peripheral (see `Peripheral::discoverServices`).
/// Re-discovery of services replaces previously made service objects.
///
class Service
{
public:
    using Ptr = std::shared_ptr<Service>;

    // No copy/move semantics.
    Service(Service&&)                 = delete;
    Service(const Service&)            = delete;
    Service& operator=(Service&&)      = delete;
    Service& operator=(const Service&) = delete;

    virtual ~Service() = default;

    virtual const Uuid& uuid() const noexcept = 0;

    /// Gets the peripheral of this service.
    ///
    /// @return `nullptr` if the peripheral doesn't exist anymore.
    ///
    CETL_NODISCARD virtual std::shared_ptr<Peripheral> peripheral() const = 0;

    /// Discovers characteristics of this service.
    ///
    /// Completes with one of the following failures:
    /// - `NotConnectedError` (immediately) if the peripheral is not connected;
    /// - `UnconfiguredError` (immediately) if the peripheral is gone, or it has replaced this service;
    /// - `DiscoveryTimeoutError` if the timeout has expired before the transport response;
    /// - `TransportError` if the transport has reported a failure;
    /// - `DisconnectedError` if the peripheral has disconnected before the transport response.
    ///
    /// A call made while another discovery is still in progress joins the latter (the same future is returned).
    ///
    /// @param characteristic_uuids Characteristics of interest; `nullopt` means all of them.
    /// @param timeout Discovery timeout; `InfiniteTimeout` disables it.
    ///
    CETL_NODISCARD virtual Discovery::Future discover(const cetl::optional<UuidSet>& characteristic_uuids,
                                                      const std::chrono::microseconds timeout) = 0;

    CETL_NODISCARD Discovery::Future discoverAllCharacteristics(
        const std::chrono::microseconds timeout = InfiniteTimeout)
    {
        return discover(cetl::nullopt, timeout);
    }

    CETL_NODISCARD Discovery::Future discoverCharacteristics(const UuidSet&                  characteristic_uuids,
                                                             const std::chrono::microseconds timeout = InfiniteTimeout)
    {
        return discover(cetl::make_optional(characteristic_uuids), timeout);
    }

    /// Looks up a characteristic (discovered by any service of the peripheral) by its UUID.
    ///
    /// @return `nullptr` if not found.
    ///
    CETL_NODISCARD virtual Characteristic::Ptr characteristic(const Uuid& uuid) const = 0;

    /// Gets characteristics discovered by the most recent successful discovery of this service.
    ///
    CETL_NODISCARD virtual std::vector<Characteristic::Ptr> characteristics() const = 0;

protected:
    Service() = default;

};  // Service

}  // namespace sdk
}  // namespace blecentral

#endif  // BLECENTRAL_SDK_SERVICE_HPP_INCLUDED
