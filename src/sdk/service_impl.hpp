//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BLECENTRAL_SDK_SERVICE_IMPL_HPP_INCLUDED
#define BLECENTRAL_SDK_SERVICE_IMPL_HPP_INCLUDED

#include "central/disconnect_notifier.hpp"
#include "central/discovery_coordinator.hpp"
#include "characteristic_impl.hpp"
#include "logging.hpp"

#include <blecentral/sdk/characteristic.hpp>
#include <blecentral/sdk/discovery.hpp>
#include <blecentral/sdk/service.hpp>
#include <blecentral/sdk/transport.hpp>
#include <blecentral/sdk/uuid.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <memory>
#include <vector>

namespace blecentral
{
namespace sdk
{

class PeripheralImpl;

class ServiceImpl final : public Service, public std::enable_shared_from_this<ServiceImpl>
{
public:
    ServiceImpl(const RawService&                 raw,
                std::weak_ptr<PeripheralImpl>     peripheral,
                central::DisconnectNotifier&      disconnect_notifier);

    ~ServiceImpl() override = default;

    // MARK: Service

    const Uuid& uuid() const noexcept override
    {
        return uuid_;
    }

    std::shared_ptr<Peripheral> peripheral() const override;

    Discovery::Future discover(const cetl::optional<UuidSet>&  characteristic_uuids,
                               const std::chrono::microseconds timeout) override;

    Characteristic::Ptr characteristic(const Uuid& uuid) const override;

    std::vector<Characteristic::Ptr> characteristics() const override;

    /// Fails the pending discovery (if any) with `UnconfiguredError`.
    ///
    void abandon()
    {
        coordinator_.abandon();
    }

    // MARK: Transport events

    void onCharacteristicsDiscovered(const Transport::Event::CharacteristicsDiscovered& event);

private:
    const Uuid                                        uuid_;
    const std::weak_ptr<PeripheralImpl>               peripheral_;
    common::LoggerPtr                                 logger_;
    central::DiscoveryCoordinator<CharacteristicImpl> coordinator_;
    central::DisconnectNotifier::Subscription         disconnect_subscription_;

};  // ServiceImpl

}  // namespace sdk
}  // namespace blecentral

#endif  // BLECENTRAL_SDK_SERVICE_IMPL_HPP_INCLUDED
