//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "simulated_transport.hpp"

#include "config.hpp"
#include "logging.hpp"

#include <blecentral/sdk/transport.hpp>
#include <blecentral/sdk/uuid.hpp>

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <utility>
#include <vector>

namespace blecentral
{
namespace cli
{
namespace
{

bool isOfInterest(const sdk::Uuid& uuid, const cetl::optional<sdk::UuidSet>& uuids_of_interest)
{
    return !uuids_of_interest || (uuids_of_interest->find(uuid) != uuids_of_interest->end());
}

}  // namespace

SimulatedTransport::SimulatedTransport(libcyphal::IExecutor& executor, Config::PeripheralSetup setup)
    : setup_{std::move(setup)}
    , logger_{common::getLogger(common::LoggerNames::Sim)}
    , queue_{executor}
    , state_{setup_.connected ? sdk::ConnectionState::Connected : sdk::ConnectionState::Disconnected}
{
    if (setup_.connected && setup_.disconnect_after)
    {
        queue_.delay(std::chrono::duration_cast<libcyphal::Duration>(*setup_.disconnect_after), [this] {
            //
            logger_->info("Sim<{}>: dropping the link.", setup_.identifier);
            state_ = sdk::ConnectionState::Disconnected;
            notifying_.clear();
            notify(Event::Disconnected{ECONNRESET});
        });
    }
}

void SimulatedTransport::discoverServices(const cetl::optional<sdk::UuidSet>& service_uuids)
{
    logger_->debug("Sim<{}>: discover services (filtered={}).", setup_.identifier, service_uuids.has_value());

    Event::ServicesDiscovered event;
    event.error = setup_.services_error;
    for (const auto& service : setup_.services)
    {
        if (isOfInterest(service.uuid, service_uuids))
        {
            event.services.push_back(sdk::RawService{service.uuid});
        }
    }

    deliverLater(std::move(event));
}

void SimulatedTransport::discoverCharacteristics(const sdk::Uuid&                    service_uuid,
                                                 const cetl::optional<sdk::UuidSet>& characteristic_uuids)
{
    logger_->debug("Sim<{}>: discover characteristics of '{}' (filtered={}).",
                   setup_.identifier,
                   service_uuid,
                   characteristic_uuids.has_value());

    Event::CharacteristicsDiscovered event;
    event.service_uuid = service_uuid;

    const auto service = std::find_if(setup_.services.cbegin(),
                                      setup_.services.cend(),
                                      [&service_uuid](const Config::ServiceSetup& setup) {
                                          return setup.uuid == service_uuid;
                                      });
    if (service == setup_.services.cend())
    {
        event.error = EINVAL;
    }
    else
    {
        if (service->drop)
        {
            logger_->debug("Sim<{}>: request for '{}' is dropped.", setup_.identifier, service_uuid);
            return;
        }

        event.error = service->error;
        for (const auto& characteristic : service->characteristics)
        {
            if (isOfInterest(characteristic.uuid, characteristic_uuids))
            {
                event.characteristics.push_back(sdk::RawCharacteristic{characteristic.uuid, characteristic.properties});
            }
        }
    }

    deliverLater(std::move(event));
}

void SimulatedTransport::readValue(const sdk::Uuid& service_uuid, const sdk::Uuid& characteristic_uuid)
{
    logger_->debug("Sim<{}>: read '{}'.", setup_.identifier, characteristic_uuid);

    Event::ValueRead event{service_uuid, characteristic_uuid, {}, cetl::nullopt};
    if (const auto* const characteristic = findCharacteristic(service_uuid, characteristic_uuid))
    {
        event.error = characteristic->error;
        if (!event.error)
        {
            event.value = characteristic->value;
        }
    }
    else
    {
        event.error = EINVAL;
    }
    deliverLater(std::move(event));
}

void SimulatedTransport::writeValue(const sdk::Uuid&                service_uuid,
                                    const sdk::Uuid&                characteristic_uuid,
                                    const sdk::CharacteristicValue& value,
                                    const sdk::WriteType            type)
{
    logger_->debug("Sim<{}>: write {} byte(s) to '{}' ({}).", setup_.identifier, value.size(), characteristic_uuid, type);

    auto* const characteristic = findCharacteristic(service_uuid, characteristic_uuid);

    cetl::optional<int> error;
    if (characteristic == nullptr)
    {
        error = EINVAL;
    }
    else
    {
        error = characteristic->error;
    }
    if (!error)
    {
        characteristic->value = value;
    }

    if (type == sdk::WriteType::WithResponse)
    {
        deliverLater(Event::ValueWritten{service_uuid, characteristic_uuid, error});
    }
    if (!error && (notifying_.find(characteristic_uuid) != notifying_.end()))
    {
        deliverLater(Event::ValueNotified{service_uuid, characteristic_uuid, value});
    }
}

void SimulatedTransport::setNotifyValue(const sdk::Uuid& service_uuid,
                                        const sdk::Uuid& characteristic_uuid,
                                        const bool       enabled)
{
    logger_->debug("Sim<{}>: set notify of '{}' to {}.", setup_.identifier, characteristic_uuid, enabled);

    constexpr auto notify_or_indicate = sdk::CharacteristicProperties::Notify | sdk::CharacteristicProperties::Indicate;

    Event::NotificationStateChanged event{service_uuid, characteristic_uuid, enabled, cetl::nullopt};

    const auto* const characteristic = findCharacteristic(service_uuid, characteristic_uuid);
    if (characteristic == nullptr)
    {
        event.error = EINVAL;
    }
    else if ((characteristic->properties & notify_or_indicate) == 0)
    {
        event.error = ENOTSUP;
    }
    else
    {
        event.error = characteristic->error;
    }

    if (!event.error)
    {
        if (enabled)
        {
            notifying_.insert(characteristic_uuid);
        }
        else
        {
            notifying_.erase(characteristic_uuid);
        }
    }
    deliverLater(std::move(event));
}

Config::CharacteristicSetup* SimulatedTransport::findCharacteristic(const sdk::Uuid& service_uuid,
                                                                    const sdk::Uuid& characteristic_uuid)
{
    for (auto& service : setup_.services)
    {
        if (service.uuid != service_uuid)
        {
            continue;
        }
        for (auto& characteristic : service.characteristics)
        {
            if (characteristic.uuid == characteristic_uuid)
            {
                return &characteristic;
            }
        }
    }
    return nullptr;
}

void SimulatedTransport::deliverLater(Event::Var event)
{
    queue_.delay(std::chrono::duration_cast<libcyphal::Duration>(setup_.latency),
                 [this, event = std::move(event)] {
                     //
                     deliver(event);
                 });
}

void SimulatedTransport::deliver(const Event::Var& event)
{
    // Answers still in the air when the link has dropped are lost.
    if (state_ != sdk::ConnectionState::Connected)
    {
        logger_->debug("Sim<{}>: event is lost (state={}).", setup_.identifier, state_);
        return;
    }
    notify(event);
}

void SimulatedTransport::notify(const Event::Var& event)
{
    if (event_handler_)
    {
        // Copy, so that the handler may safely unsubscribe.
        const auto event_handler = event_handler_;
        event_handler(event);
    }
}

}  // namespace cli
}  // namespace blecentral
