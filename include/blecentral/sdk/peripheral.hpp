//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BLECENTRAL_SDK_PERIPHERAL_HPP_INCLUDED
#define BLECENTRAL_SDK_PERIPHERAL_HPP_INCLUDED

#include "discovery.hpp"
#include "service.hpp"
#include "transport.hpp"
#include "uuid.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace blecentral
{
namespace sdk
{

/// An abstract interface of a remote GATT peripheral (the server side of a connection).
///
class Peripheral
{
public:
    using Ptr = std::shared_ptr<Peripheral>;

    /// Makes a new peripheral on top of the given transport.
    ///
    /// @param executor The executor which serializes all activities of the peripheral (and its services).
    ///                 Instance of the executor must outlive the peripheral.
    ///                 The transport must deliver its events on the thread which spins this executor.
    /// @param transport The link to the remote peripheral. Ownership is transferred to the peripheral.
    /// @param identifier Human-readable identifier (f.e. the device address), used for logging.
    /// @return Shared pointer to the successfully created peripheral.
    ///         `nullptr` on failure (see logs for the reason of failure).
    ///
    CETL_NODISCARD static Ptr make(libcyphal::IExecutor& executor,
                                   Transport::Ptr        transport,
                                   std::string           identifier);

    // No copy/move semantics.
    Peripheral(Peripheral&&)                 = delete;
    Peripheral(const Peripheral&)            = delete;
    Peripheral& operator=(Peripheral&&)      = delete;
    Peripheral& operator=(const Peripheral&) = delete;

    virtual ~Peripheral() = default;

    virtual const std::string& identifier() const noexcept = 0;

    /// Gets the current connection state (as reported by the transport).
    ///
    CETL_NODISCARD virtual ConnectionState state() const = 0;

    /// Discovers services of the peripheral.
    ///
    /// Completes with one of the following failures:
    /// - `NotConnectedError` (immediately) if the peripheral is not connected;
    /// - `DiscoveryTimeoutError` if the timeout has expired before the transport response;
    /// - `TransportError` if the transport has reported a failure;
    /// - `DisconnectedError` if the peripheral has disconnected before the transport response.
    ///
    /// A call made while another discovery is still in progress joins the latter (the same future is returned).
    ///
    /// @param service_uuids Services of interest; `nullopt` means all of them.
    /// @param timeout Discovery timeout; `InfiniteTimeout` disables it.
    ///
    CETL_NODISCARD virtual Discovery::Future discover(const cetl::optional<UuidSet>& service_uuids,
                                                      const std::chrono::microseconds timeout) = 0;

    CETL_NODISCARD Discovery::Future discoverAllServices(const std::chrono::microseconds timeout = InfiniteTimeout)
    {
        return discover(cetl::nullopt, timeout);
    }

    CETL_NODISCARD Discovery::Future discoverServices(const UuidSet&                  service_uuids,
                                                      const std::chrono::microseconds timeout = InfiniteTimeout)
    {
        return discover(cetl::make_optional(service_uuids), timeout);
    }

    /// Discovers all services, and then all characteristics of every discovered service.
    ///
    /// Succeeds once all the rounds have succeeded; fails with the first failure otherwise.
    /// The timeout bounds each individual round (not the whole sequence).
    ///
    CETL_NODISCARD virtual Discovery::Future discoverAllServicesAndCharacteristics(
        const std::chrono::microseconds timeout = InfiniteTimeout) = 0;

    /// Looks up a discovered service by its UUID.
    ///
    /// @return `nullptr` if not found.
    ///
    CETL_NODISCARD virtual Service::Ptr service(const Uuid& uuid) const = 0;

    /// Gets services discovered by the most recent successful discovery.
    ///
    CETL_NODISCARD virtual std::vector<Service::Ptr> services() const = 0;

protected:
    Peripheral() = default;

};  // Peripheral

}  // namespace sdk
}  // namespace blecentral

#endif  // BLECENTRAL_SDK_PERIPHERAL_HPP_INCLUDED
