//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BLECENTRAL_SDK_CHARACTERISTIC_HPP_INCLUDED
#define BLECENTRAL_SDK_CHARACTERISTIC_HPP_INCLUDED

#include "discovery.hpp"
#include "errors.hpp"
#include "execution.hpp"
#include "transport.hpp"
#include "uuid.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <functional>
#include <memory>

namespace blecentral
{
namespace sdk
{

class Service;

/// Defines the result types of a characteristic operation.
///
template <typename Success_>
struct OperationOf final
{
    using Success = Success_;
    using Failure = OperationFailure;
    using Result  = cetl::variant<Success, Failure>;
    using Future  = sdk::Future<Success, Failure>;
    using Promise = sdk::Promise<Success, Failure>;

};  // OperationOf

/// Read succeeds with the value read.
using ReadOperation = OperationOf<CharacteristicValue>;

/// Write, and notification state change, succeed with no value.
using WriteOperation  = OperationOf<cetl::monostate>;
using NotifyOperation = OperationOf<cetl::monostate>;

/// An abstract interface of a discovered GATT characteristic.
///
/// Characteristics are made by services (see `Service::discoverCharacteristics`).
/// Re-discovery of characteristics replaces previously made characteristic objects.
///
/// Operations complete with one of the following failures:
/// - `NotConnectedError` (immediately) if the peripheral is not connected;
/// - `UnconfiguredError` if the peripheral is gone, or it has replaced this characteristic;
/// - `NotSupportedError` (immediately) if the characteristic lacks the required property;
/// - `OperationTimeoutError` if the timeout has expired before the transport response;
/// - `TransportError` if the transport has reported a failure;
/// - `DisconnectedError` if the peripheral has disconnected before the transport response.
///
class Characteristic
{
public:
    using Ptr           = std::shared_ptr<Characteristic>;
    using UpdateHandler = std::function<void(const CharacteristicValue& value)>;

    // No copy/move semantics.
    Characteristic(Characteristic&&)                 = delete;
    Characteristic(const Characteristic&)            = delete;
    Characteristic& operator=(Characteristic&&)      = delete;
    Characteristic& operator=(const Characteristic&) = delete;

    virtual ~Characteristic() = default;

    virtual const Uuid& uuid() const noexcept = 0;

    virtual CharacteristicProperties::Bits properties() const noexcept = 0;

    /// Checks whether all of the given property bits are set.
    ///
    bool hasProperty(const CharacteristicProperties::Bits property) const noexcept
    {
        return (properties() & property) == property;
    }

    /// Gets the service which has discovered this characteristic.
    ///
    /// @return `nullptr` if the service doesn't exist anymore.
    ///
    CETL_NODISCARD virtual std::shared_ptr<Service> service() const = 0;

    /// Gets the most recent value (either read or notified).
    ///
    CETL_NODISCARD virtual const cetl::optional<CharacteristicValue>& value() const noexcept = 0;

    virtual bool isNotifying() const noexcept = 0;

    /// Reads the characteristic value.
    ///
    /// A read requested while another read is still in progress joins the latter (the same future is returned).
    ///
    CETL_NODISCARD virtual ReadOperation::Future read(const std::chrono::microseconds timeout) = 0;

    /// Writes the characteristic value.
    ///
    /// A write without response succeeds as soon as it has been handed over to the transport
    /// (the timeout is not used then). A write with response fails with `BusyError` (immediately)
    /// while another write with response is still in progress.
    ///
    CETL_NODISCARD virtual WriteOperation::Future write(const CharacteristicValue&      value,
                                                       const WriteType                 type,
                                                       const std::chrono::microseconds timeout) = 0;

    CETL_NODISCARD WriteOperation::Future write(const CharacteristicValue&      value,
                                                const std::chrono::microseconds timeout = InfiniteTimeout)
    {
        return write(value, WriteType::WithResponse, timeout);
    }

    CETL_NODISCARD WriteOperation::Future writeWithoutResponse(const CharacteristicValue& value)
    {
        return write(value, WriteType::WithoutResponse, InfiniteTimeout);
    }

    /// Enables notifications (or indications) of the value.
    /// Notified values are delivered to the update handler.
    ///
    /// A request made while another one of the same kind is still in progress joins the latter.
    ///
    CETL_NODISCARD virtual NotifyOperation::Future startNotifying(const std::chrono::microseconds timeout) = 0;

    CETL_NODISCARD virtual NotifyOperation::Future stopNotifying(const std::chrono::microseconds timeout) = 0;

    /// Sets the handler of notified values (replaces previous one, `nullptr` resets it).
    ///
    virtual void setUpdateHandler(UpdateHandler update_handler) = 0;

protected:
    Characteristic() = default;

};  // Characteristic

}  // namespace sdk
}  // namespace blecentral

#endif  // BLECENTRAL_SDK_CHARACTERISTIC_HPP_INCLUDED
