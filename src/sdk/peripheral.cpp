//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "peripheral_impl.hpp"

#include "characteristic_impl.hpp"
#include "logging.hpp"
#include "service_impl.hpp"

#include <blecentral/sdk/discovery.hpp>
#include <blecentral/sdk/errors.hpp>
#include <blecentral/sdk/peripheral.hpp>
#include <blecentral/sdk/service.hpp>
#include <blecentral/sdk/transport.hpp>
#include <blecentral/sdk/uuid.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>
#include <libcyphal/executor.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace blecentral
{
namespace sdk
{

PeripheralImpl::PeripheralImpl(libcyphal::IExecutor& executor, Transport::Ptr transport, std::string identifier)
    : identifier_{std::move(identifier)}
    , transport_{std::move(transport)}
    , logger_{common::getLogger(common::LoggerNames::Central)}
    , queue_{executor}
    , coordinator_{fmt::format("Peripheral<{}>", identifier_)}
{
    CETL_DEBUG_ASSERT(transport_, "");
}

PeripheralImpl::~PeripheralImpl()
{
    // Pending rounds lose their timeouts together with the queue.
    coordinator_.abandon();
    for (const auto& service : services_.all())
    {
        service->abandon();
    }
    for (const auto& characteristic : characteristics_.all())
    {
        characteristic->abandon();
    }

    transport_->subscribe(nullptr);
    logger_->debug("Peripheral<{}>: destroyed.", identifier_);
}

void PeripheralImpl::start()
{
    // Events are delivered by the transport which this peripheral owns,
    // but handling of an event may release the last external reference to the peripheral.
    const std::weak_ptr<PeripheralImpl> weak_self = shared_from_this();
    transport_->subscribe([weak_self](const Transport::Event::Var& event) {
        //
        if (const auto self = weak_self.lock())
        {
            self->onTransportEvent(event);
        }
    });

    logger_->debug("Peripheral<{}>: started (state={}).", identifier_, transport_->connectionState());
}

Discovery::Future PeripheralImpl::discover(const cetl::optional<UuidSet>&  service_uuids,
                                           const std::chrono::microseconds timeout)
{
    return coordinator_.discover(queue_, state(), timeout, [this, &service_uuids] {
        //
        transport_->discoverServices(service_uuids);
    });
}

Discovery::Future PeripheralImpl::discoverAllServicesAndCharacteristics(const std::chrono::microseconds timeout)
{
    Discovery::Promise promise;
    auto               future = promise.future();

    const std::weak_ptr<PeripheralImpl> weak_self = shared_from_this();
    discoverAllServices(timeout).onComplete([promise, weak_self, timeout](const Discovery::Result& result) mutable {
        //
        if (const auto* const failure = cetl::get_if<Discovery::Failure>(&result))
        {
            promise.failure(*failure);
            return;
        }
        const auto self = weak_self.lock();
        if (!self)
        {
            promise.failure(UnconfiguredError{});
            return;
        }

        const auto services = self->services();
        if (services.empty())
        {
            promise.success(Discovery::Success{});
            return;
        }

        // First failure wins; the promise ignores the rest.
        auto remaining = std::make_shared<std::size_t>(services.size());
        for (const auto& service : services)
        {
            service->discoverAllCharacteristics(timeout).onComplete(
                [promise, remaining](const Discovery::Result& service_result) mutable {
                    //
                    if (const auto* const failure = cetl::get_if<Discovery::Failure>(&service_result))
                    {
                        promise.failure(*failure);
                        return;
                    }
                    if (--(*remaining) == 0)
                    {
                        promise.success(Discovery::Success{});
                    }
                });
        }
    });

    return future;
}

Service::Ptr PeripheralImpl::service(const Uuid& uuid) const
{
    return services_.lookup(uuid);
}

std::vector<Service::Ptr> PeripheralImpl::services() const
{
    const auto service_impls = coordinator_.resources(services_);
    return std::vector<Service::Ptr>(service_impls.begin(), service_impls.end());
}

bool PeripheralImpl::isCurrentService(const ServiceImpl& service) const
{
    return services_.lookup(service.uuid()).get() == &service;
}

bool PeripheralImpl::isCurrentCharacteristic(const CharacteristicImpl& characteristic) const
{
    return characteristics_.lookup(characteristic.uuid()).get() == &characteristic;
}

void PeripheralImpl::onTransportEvent(const Transport::Event::Var& event)
{
    cetl::visit(cetl::make_overloaded(
                    [this](const Transport::Event::ServicesDiscovered& services_discovered) {
                        //
                        onServicesDiscovered(services_discovered);
                    },
                    [this](const Transport::Event::CharacteristicsDiscovered& characteristics_discovered) {
                        //
                        onCharacteristicsDiscovered(characteristics_discovered);
                    },
                    [this](const Transport::Event::Disconnected& disconnected) {
                        //
                        onDisconnected(disconnected);
                    },
                    [this](const Transport::Event::ValueRead& value_read) {
                        //
                        if (const auto characteristic = findCharacteristic(value_read.service_uuid,
                                                                           value_read.characteristic_uuid,
                                                                           "read response"))
                        {
                            characteristic->onValueRead(value_read);
                        }
                    },
                    [this](const Transport::Event::ValueWritten& value_written) {
                        //
                        if (const auto characteristic = findCharacteristic(value_written.service_uuid,
                                                                           value_written.characteristic_uuid,
                                                                           "write response"))
                        {
                            characteristic->onValueWritten(value_written);
                        }
                    },
                    [this](const Transport::Event::NotificationStateChanged& state_changed) {
                        //
                        if (const auto characteristic = findCharacteristic(state_changed.service_uuid,
                                                                           state_changed.characteristic_uuid,
                                                                           "notification state"))
                        {
                            characteristic->onNotificationStateChanged(state_changed);
                        }
                    },
                    [this](const Transport::Event::ValueNotified& value_notified) {
                        //
                        if (const auto characteristic = findCharacteristic(value_notified.service_uuid,
                                                                           value_notified.characteristic_uuid,
                                                                           "notification"))
                        {
                            characteristic->onValueNotified(value_notified);
                        }
                    }),
                event);
}

void PeripheralImpl::onServicesDiscovered(const Transport::Event::ServicesDiscovered& event)
{
    const std::weak_ptr<PeripheralImpl> weak_self = shared_from_this();

    const auto replaced = coordinator_.onDiscoveryComplete(event.services,
                                                           event.error,
                                                           services_,
                                                           [this, &weak_self](const RawService& raw) {
                                                               //
                                                               return std::make_shared<ServiceImpl>(raw,
                                                                                                    weak_self,
                                                                                                    disconnect_notifier_);
                                                           });

    // The user may still hold a replaced service.
    for (const auto& service : replaced)
    {
        service->abandon();
    }
}

void PeripheralImpl::onCharacteristicsDiscovered(const Transport::Event::CharacteristicsDiscovered& event)
{
    const auto service = services_.lookup(event.service_uuid);
    if (!service)
    {
        logger_->warn("Peripheral<{}>: dropping characteristics of unknown service '{}' (cnt={}).",
                      identifier_,
                      event.service_uuid,
                      event.characteristics.size());
        return;
    }
    service->onCharacteristicsDiscovered(event);
}

std::shared_ptr<CharacteristicImpl> PeripheralImpl::findCharacteristic(const Uuid&       service_uuid,
                                                                      const Uuid&       characteristic_uuid,
                                                                      const char* const event_name) const
{
    auto characteristic = characteristics_.lookup(characteristic_uuid);
    if (!characteristic)
    {
        logger_->warn("Peripheral<{}>: dropping {} of unknown characteristic '{}'.",
                      identifier_,
                      event_name,
                      characteristic_uuid);
        return nullptr;
    }
    if (characteristic->serviceUuid() != service_uuid)
    {
        logger_->warn("Peripheral<{}>: dropping {} of characteristic '{}' - it belongs to service '{}', not '{}'.",
                      identifier_,
                      event_name,
                      characteristic_uuid,
                      characteristic->serviceUuid(),
                      service_uuid);
        return nullptr;
    }
    return characteristic;
}

void PeripheralImpl::onDisconnected(const Transport::Event::Disconnected& event)
{
    logger_->info("Peripheral<{}>: disconnected (err={}).", identifier_, event.error.value_or(0));

    coordinator_.onDisconnect(event.error);
    disconnect_notifier_.notify(event.error);
}

// MARK: - Peripheral

Peripheral::Ptr Peripheral::make(libcyphal::IExecutor& executor, Transport::Ptr transport, std::string identifier)
{
    if (!transport)
    {
        common::getLogger(common::LoggerNames::Central)->error("Can't make peripheral '{}' without transport.", identifier);
        return nullptr;
    }

    auto peripheral = std::make_shared<PeripheralImpl>(executor, std::move(transport), std::move(identifier));
    peripheral->start();
    return peripheral;
}

}  // namespace sdk
}  // namespace blecentral
