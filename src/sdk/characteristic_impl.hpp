//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BLECENTRAL_SDK_CHARACTERISTIC_IMPL_HPP_INCLUDED
#define BLECENTRAL_SDK_CHARACTERISTIC_IMPL_HPP_INCLUDED

#include "central/disconnect_notifier.hpp"
#include "central/single_flight.hpp"
#include "logging.hpp"

#include <blecentral/sdk/characteristic.hpp>
#include <blecentral/sdk/errors.hpp>
#include <blecentral/sdk/transport.hpp>
#include <blecentral/sdk/uuid.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <memory>
#include <utility>

namespace blecentral
{
namespace sdk
{

class PeripheralImpl;

class CharacteristicImpl final : public Characteristic
{
public:
    CharacteristicImpl(const RawCharacteristic&      raw,
                       const Uuid&                   service_uuid,
                       std::weak_ptr<Service>        service,
                       std::weak_ptr<PeripheralImpl> peripheral,
                       central::DisconnectNotifier&  disconnect_notifier);

    ~CharacteristicImpl() override = default;

    // MARK: Characteristic

    using Characteristic::write;

    const Uuid& uuid() const noexcept override
    {
        return uuid_;
    }

    CharacteristicProperties::Bits properties() const noexcept override
    {
        return properties_;
    }

    std::shared_ptr<Service> service() const override
    {
        return service_.lock();
    }

    const cetl::optional<CharacteristicValue>& value() const noexcept override
    {
        return value_;
    }

    bool isNotifying() const noexcept override
    {
        return is_notifying_;
    }

    ReadOperation::Future read(const std::chrono::microseconds timeout) override;

    WriteOperation::Future write(const CharacteristicValue&      value,
                                 const WriteType                 type,
                                 const std::chrono::microseconds timeout) override;

    NotifyOperation::Future startNotifying(const std::chrono::microseconds timeout) override;

    NotifyOperation::Future stopNotifying(const std::chrono::microseconds timeout) override;

    void setUpdateHandler(UpdateHandler update_handler) override
    {
        update_handler_ = std::move(update_handler);
    }

    // MARK: Peripheral support

    const Uuid& serviceUuid() const noexcept
    {
        return service_uuid_;
    }

    /// Fails all pending operations with `UnconfiguredError`.
    ///
    void abandon();

    // MARK: Transport events

    void onValueRead(const Transport::Event::ValueRead& event);
    void onValueWritten(const Transport::Event::ValueWritten& event);
    void onNotificationStateChanged(const Transport::Event::NotificationStateChanged& event);
    void onValueNotified(const Transport::Event::ValueNotified& event);

private:
    using ReadFlight = central::SingleFlight<ReadOperation::Success, OperationFailure, OperationTimeoutError>;
    using AckFlight  = central::SingleFlight<WriteOperation::Success, OperationFailure, OperationTimeoutError>;

    /// Either the peripheral to operate through, or the reason why the operation can't start.
    using Operable = cetl::variant<std::shared_ptr<PeripheralImpl>, OperationFailure>;

    /// @param required Property bits; any one of them would do.
    ///
    Operable checkOperable(const CharacteristicProperties::Bits required, const char* const operation) const;

    void onDisconnect(const cetl::optional<int>& error);

    const Uuid                                uuid_;
    const CharacteristicProperties::Bits      properties_;
    const Uuid                                service_uuid_;
    const std::weak_ptr<Service>              service_;
    const std::weak_ptr<PeripheralImpl>       peripheral_;
    common::LoggerPtr                         logger_;
    cetl::optional<CharacteristicValue>       value_;
    bool                                      is_notifying_{false};
    UpdateHandler                             update_handler_;
    ReadFlight                                read_flight_;
    AckFlight                                 write_flight_;
    AckFlight                                 start_notifying_flight_;
    AckFlight                                 stop_notifying_flight_;
    central::DisconnectNotifier::Subscription disconnect_subscription_;

};  // CharacteristicImpl

}  // namespace sdk
}  // namespace blecentral

#endif  // BLECENTRAL_SDK_CHARACTERISTIC_IMPL_HPP_INCLUDED
