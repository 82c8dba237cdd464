//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "characteristic_impl.hpp"

#include "central/disconnect_notifier.hpp"
#include "logging.hpp"
#include "peripheral_impl.hpp"

#include <blecentral/sdk/characteristic.hpp>
#include <blecentral/sdk/errors.hpp>
#include <blecentral/sdk/execution.hpp>
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

// C++14 requires out-of-line definitions of odr-used static constexpr members.
constexpr CharacteristicProperties::Bits CharacteristicProperties::Broadcast;
constexpr CharacteristicProperties::Bits CharacteristicProperties::Read;
constexpr CharacteristicProperties::Bits CharacteristicProperties::WriteWithoutResponse;
constexpr CharacteristicProperties::Bits CharacteristicProperties::Write;
constexpr CharacteristicProperties::Bits CharacteristicProperties::Notify;
constexpr CharacteristicProperties::Bits CharacteristicProperties::Indicate;
constexpr CharacteristicProperties::Bits CharacteristicProperties::AuthenticatedSignedWrites;
constexpr CharacteristicProperties::Bits CharacteristicProperties::ExtendedProperties;

namespace
{

constexpr CharacteristicProperties::Bits NotifyOrIndicate =
    CharacteristicProperties::Notify | CharacteristicProperties::Indicate;

}  // namespace

CharacteristicImpl::CharacteristicImpl(const RawCharacteristic&      raw,
                                       const Uuid&                   service_uuid,
                                       std::weak_ptr<Service>        service,
                                       std::weak_ptr<PeripheralImpl> peripheral,
                                       central::DisconnectNotifier&  disconnect_notifier)
    : uuid_{raw.uuid}
    , properties_{raw.properties}
    , service_uuid_{service_uuid}
    , service_{std::move(service)}
    , peripheral_{std::move(peripheral)}
    , logger_{common::getLogger(common::LoggerNames::Central)}
    , read_flight_{fmt::format("Characteristic<{}>", raw.uuid), "read"}
    , write_flight_{fmt::format("Characteristic<{}>", raw.uuid), "write"}
    , start_notifying_flight_{fmt::format("Characteristic<{}>", raw.uuid), "notification start"}
    , stop_notifying_flight_{fmt::format("Characteristic<{}>", raw.uuid), "notification stop"}
    , disconnect_subscription_{disconnect_notifier.subscribe([this](const cetl::optional<int>& error) {
        //
        onDisconnect(error);
    })}
{
}

ReadOperation::Future CharacteristicImpl::read(const std::chrono::microseconds timeout)
{
    if (auto pending = read_flight_.pendingFuture())
    {
        return *pending;
    }

    const auto operable = checkOperable(CharacteristicProperties::Read, "read");
    if (const auto* const failure = cetl::get_if<OperationFailure>(&operable))
    {
        return makeFailedFuture<ReadOperation::Success, ReadOperation::Failure>(*failure);
    }
    const auto& peripheral = *cetl::get_if<std::shared_ptr<PeripheralImpl>>(&operable);

    return read_flight_.start(peripheral->queue(), peripheral->state(), timeout, [this, &peripheral] {
        //
        peripheral->transport().readValue(service_uuid_, uuid_);
    });
}

WriteOperation::Future CharacteristicImpl::write(const CharacteristicValue&      value,
                                                 const WriteType                 type,
                                                 const std::chrono::microseconds timeout)
{
    if (type == WriteType::WithoutResponse)
    {
        const auto operable = checkOperable(CharacteristicProperties::WriteWithoutResponse, "write");
        if (const auto* const failure = cetl::get_if<OperationFailure>(&operable))
        {
            return makeFailedFuture<WriteOperation::Success, WriteOperation::Failure>(*failure);
        }
        const auto& peripheral = *cetl::get_if<std::shared_ptr<PeripheralImpl>>(&operable);

        const auto state = peripheral->state();
        if (state != ConnectionState::Connected)
        {
            logger_->debug("Characteristic<{}>: can't write - not connected (state={}).", uuid_, state);
            return makeFailedFuture<WriteOperation::Success, WriteOperation::Failure>(NotConnectedError{});
        }

        logger_->trace("Characteristic<{}>: writing {} byte(s) without response.", uuid_, value.size());
        peripheral->transport().writeValue(service_uuid_, uuid_, value, WriteType::WithoutResponse);
        return makeSucceededFuture<WriteOperation::Success, WriteOperation::Failure>(WriteOperation::Success{});
    }

    if (write_flight_.isPending())
    {
        logger_->debug("Characteristic<{}>: can't write - another write is in progress (gen={}).",
                       uuid_,
                       write_flight_.generation());
        return makeFailedFuture<WriteOperation::Success, WriteOperation::Failure>(BusyError{});
    }

    const auto operable = checkOperable(CharacteristicProperties::Write, "write");
    if (const auto* const failure = cetl::get_if<OperationFailure>(&operable))
    {
        return makeFailedFuture<WriteOperation::Success, WriteOperation::Failure>(*failure);
    }
    const auto& peripheral = *cetl::get_if<std::shared_ptr<PeripheralImpl>>(&operable);

    return write_flight_.start(peripheral->queue(), peripheral->state(), timeout, [this, &peripheral, &value] {
        //
        peripheral->transport().writeValue(service_uuid_, uuid_, value, WriteType::WithResponse);
    });
}

NotifyOperation::Future CharacteristicImpl::startNotifying(const std::chrono::microseconds timeout)
{
    if (auto pending = start_notifying_flight_.pendingFuture())
    {
        return *pending;
    }

    const auto operable = checkOperable(NotifyOrIndicate, "start notifying");
    if (const auto* const failure = cetl::get_if<OperationFailure>(&operable))
    {
        return makeFailedFuture<NotifyOperation::Success, NotifyOperation::Failure>(*failure);
    }
    const auto& peripheral = *cetl::get_if<std::shared_ptr<PeripheralImpl>>(&operable);

    return start_notifying_flight_.start(peripheral->queue(), peripheral->state(), timeout, [this, &peripheral] {
        //
        peripheral->transport().setNotifyValue(service_uuid_, uuid_, true);
    });
}

NotifyOperation::Future CharacteristicImpl::stopNotifying(const std::chrono::microseconds timeout)
{
    if (auto pending = stop_notifying_flight_.pendingFuture())
    {
        return *pending;
    }

    const auto operable = checkOperable(NotifyOrIndicate, "stop notifying");
    if (const auto* const failure = cetl::get_if<OperationFailure>(&operable))
    {
        return makeFailedFuture<NotifyOperation::Success, NotifyOperation::Failure>(*failure);
    }
    const auto& peripheral = *cetl::get_if<std::shared_ptr<PeripheralImpl>>(&operable);

    return stop_notifying_flight_.start(peripheral->queue(), peripheral->state(), timeout, [this, &peripheral] {
        //
        peripheral->transport().setNotifyValue(service_uuid_, uuid_, false);
    });
}

void CharacteristicImpl::abandon()
{
    read_flight_.abandon();
    write_flight_.abandon();
    start_notifying_flight_.abandon();
    stop_notifying_flight_.abandon();
}

void CharacteristicImpl::onValueRead(const Transport::Event::ValueRead& event)
{
    if (!read_flight_.isPending())
    {
        logger_->debug("Characteristic<{}>: dropping unsolicited read response (err={}).",
                       uuid_,
                       event.error.value_or(0));
        return;
    }

    if (event.error)
    {
        logger_->warn("Characteristic<{}>: read failed (err={}).", uuid_, *event.error);
        read_flight_.fail(TransportError{*event.error});
        return;
    }

    logger_->trace("Characteristic<{}>: read {} byte(s).", uuid_, event.value.size());
    value_ = event.value;
    read_flight_.succeed(event.value);
}

void CharacteristicImpl::onValueWritten(const Transport::Event::ValueWritten& event)
{
    if (event.error)
    {
        logger_->warn("Characteristic<{}>: write failed (err={}).", uuid_, *event.error);
        write_flight_.fail(TransportError{*event.error});
        return;
    }
    if (!write_flight_.succeed(WriteOperation::Success{}))
    {
        logger_->debug("Characteristic<{}>: dropping unsolicited write response.", uuid_);
    }
}

void CharacteristicImpl::onNotificationStateChanged(const Transport::Event::NotificationStateChanged& event)
{
    auto& flight = event.enabled ? start_notifying_flight_ : stop_notifying_flight_;
    if (event.error)
    {
        logger_->warn("Characteristic<{}>: notification {} failed (err={}).",
                      uuid_,
                      event.enabled ? "start" : "stop",
                      *event.error);
        flight.fail(TransportError{*event.error});
        return;
    }

    logger_->debug("Characteristic<{}>: notifying={}.", uuid_, event.enabled);
    is_notifying_ = event.enabled;
    flight.succeed(NotifyOperation::Success{});
}

void CharacteristicImpl::onValueNotified(const Transport::Event::ValueNotified& event)
{
    logger_->trace("Characteristic<{}>: notified {} byte(s).", uuid_, event.value.size());
    value_ = event.value;

    // The handler may replace itself.
    if (const auto update_handler = update_handler_)
    {
        update_handler(*value_);
    }
}

CharacteristicImpl::Operable CharacteristicImpl::checkOperable(const CharacteristicProperties::Bits required,
                                                               const char* const                    operation) const
{
    auto peripheral = peripheral_.lock();
    if (!peripheral || !peripheral->isCurrentCharacteristic(*this))
    {
        logger_->warn("Characteristic<{}>: can't {} - the characteristic is not configured anymore.",
                      uuid_,
                      operation);
        return OperationFailure{UnconfiguredError{}};
    }
    if ((properties_ & required) == 0)
    {
        logger_->warn("Characteristic<{}>: can't {} - not supported (props=0x{:02X}).", uuid_, operation, properties_);
        return OperationFailure{NotSupportedError{required}};
    }
    return peripheral;
}

void CharacteristicImpl::onDisconnect(const cetl::optional<int>& error)
{
    is_notifying_ = false;

    read_flight_.onDisconnect(error);
    write_flight_.onDisconnect(error);
    start_notifying_flight_.onDisconnect(error);
    stop_notifying_flight_.onDisconnect(error);
}

}  // namespace sdk
}  // namespace blecentral
