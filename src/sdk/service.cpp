//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "service_impl.hpp"

#include "central/disconnect_notifier.hpp"
#include "characteristic_impl.hpp"
#include "logging.hpp"
#include "peripheral_impl.hpp"

#include <blecentral/sdk/characteristic.hpp>
#include <blecentral/sdk/discovery.hpp>
#include <blecentral/sdk/errors.hpp>
#include <blecentral/sdk/transport.hpp>
#include <blecentral/sdk/uuid.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <memory>
#include <utility>
#include <vector>

namespace blecentral
{
namespace sdk
{

ServiceImpl::ServiceImpl(const RawService&             raw,
                         std::weak_ptr<PeripheralImpl> peripheral,
                         central::DisconnectNotifier&  disconnect_notifier)
    : uuid_{raw.uuid}
    , peripheral_{std::move(peripheral)}
    , logger_{common::getLogger(common::LoggerNames::Central)}
    , coordinator_{fmt::format("Service<{}>", raw.uuid)}
    , disconnect_subscription_{disconnect_notifier.subscribe([this](const cetl::optional<int>& error) {
        //
        coordinator_.onDisconnect(error);
    })}
{
}

std::shared_ptr<Peripheral> ServiceImpl::peripheral() const
{
    return peripheral_.lock();
}

Discovery::Future ServiceImpl::discover(const cetl::optional<UuidSet>&  characteristic_uuids,
                                        const std::chrono::microseconds timeout)
{
    if (auto pending = coordinator_.pendingFuture())
    {
        return *pending;
    }

    const auto peripheral = peripheral_.lock();
    if (!peripheral || !peripheral->isCurrentService(*this))
    {
        logger_->warn("Service<{}>: can't discover characteristics - the service is not configured anymore.", uuid_);
        return makeFailedFuture<Discovery::Success, Discovery::Failure>(UnconfiguredError{});
    }

    return coordinator_.discover(peripheral->queue(), peripheral->state(), timeout, [this, &peripheral, &characteristic_uuids] {
        //
        peripheral->transport().discoverCharacteristics(uuid_, characteristic_uuids);
    });
}

Characteristic::Ptr ServiceImpl::characteristic(const Uuid& uuid) const
{
    if (const auto peripheral = peripheral_.lock())
    {
        return peripheral->characteristicsRegistry().lookup(uuid);
    }
    return nullptr;
}

std::vector<Characteristic::Ptr> ServiceImpl::characteristics() const
{
    if (const auto peripheral = peripheral_.lock())
    {
        const auto characteristic_impls = coordinator_.resources(peripheral->characteristicsRegistry());
        return std::vector<Characteristic::Ptr>(characteristic_impls.begin(), characteristic_impls.end());
    }
    return {};
}

void ServiceImpl::onCharacteristicsDiscovered(const Transport::Event::CharacteristicsDiscovered& event)
{
    const auto peripheral = peripheral_.lock();
    if (!peripheral)
    {
        return;
    }

    const std::weak_ptr<Service>        weak_self       = shared_from_this();
    const std::weak_ptr<PeripheralImpl> weak_peripheral = peripheral;

    const auto replaced = coordinator_.onDiscoveryComplete(event.characteristics,
                                                           event.error,
                                                           peripheral->characteristicsRegistry(),
                                                           [this, &weak_self, &weak_peripheral, &peripheral](
                                                               const RawCharacteristic& raw) {
                                                               //
                                                               return std::make_shared<CharacteristicImpl>(
                                                                   raw,
                                                                   uuid_,
                                                                   weak_self,
                                                                   weak_peripheral,
                                                                   peripheral->disconnectNotifier());
                                                           });

    // The user may still hold a replaced characteristic.
    for (const auto& characteristic : replaced)
    {
        characteristic->abandon();
    }
}

}  // namespace sdk
}  // namespace blecentral
