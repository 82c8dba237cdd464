//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BLECENTRAL_SDK_PERIPHERAL_IMPL_HPP_INCLUDED
#define BLECENTRAL_SDK_PERIPHERAL_IMPL_HPP_INCLUDED

#include "central/disconnect_notifier.hpp"
#include "central/discovery_coordinator.hpp"
#include "central/resource_registry.hpp"
#include "characteristic_impl.hpp"
#include "logging.hpp"
#include "serial_queue.hpp"
#include "service_impl.hpp"

#include <blecentral/sdk/characteristic.hpp>
#include <blecentral/sdk/discovery.hpp>
#include <blecentral/sdk/peripheral.hpp>
#include <blecentral/sdk/service.hpp>
#include <blecentral/sdk/transport.hpp>
#include <blecentral/sdk/uuid.hpp>

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

class PeripheralImpl final : public Peripheral, public std::enable_shared_from_this<PeripheralImpl>
{
public:
    PeripheralImpl(libcyphal::IExecutor& executor, Transport::Ptr transport, std::string identifier);

    ~PeripheralImpl() override;

    /// Subscribes to the transport events. Must be called once, right after construction.
    ///
    void start();

    // MARK: Peripheral

    const std::string& identifier() const noexcept override
    {
        return identifier_;
    }

    ConnectionState state() const override
    {
        return transport_->connectionState();
    }

    Discovery::Future discover(const cetl::optional<UuidSet>&  service_uuids,
                               const std::chrono::microseconds timeout) override;

    Discovery::Future discoverAllServicesAndCharacteristics(const std::chrono::microseconds timeout) override;

    Service::Ptr service(const Uuid& uuid) const override;

    std::vector<Service::Ptr> services() const override;

    // MARK: Services support

    common::SerialQueue& queue() noexcept
    {
        return queue_;
    }

    Transport& transport() noexcept
    {
        return *transport_;
    }

    /// Characteristics discovered by all services of this peripheral.
    ///
    central::ResourceRegistry<CharacteristicImpl>& characteristicsRegistry() noexcept
    {
        return characteristics_;
    }

    central::DisconnectNotifier& disconnectNotifier() noexcept
    {
        return disconnect_notifier_;
    }

    /// Checks that the given service is still the one known for its UUID.
    ///
    bool isCurrentService(const ServiceImpl& service) const;

    bool isCurrentCharacteristic(const CharacteristicImpl& characteristic) const;

private:
    void onTransportEvent(const Transport::Event::Var& event);
    void onServicesDiscovered(const Transport::Event::ServicesDiscovered& event);
    void onCharacteristicsDiscovered(const Transport::Event::CharacteristicsDiscovered& event);
    void onDisconnected(const Transport::Event::Disconnected& event);

    /// Finds the characteristic addressed by a value event.
    ///
    /// @return `nullptr` (and logs) if the characteristic is unknown, or belongs to another service.
    ///
    std::shared_ptr<CharacteristicImpl> findCharacteristic(const Uuid&       service_uuid,
                                                           const Uuid&       characteristic_uuid,
                                                           const char* const event_name) const;

    const std::string                             identifier_;
    Transport::Ptr                                transport_;
    common::LoggerPtr                             logger_;
    common::SerialQueue                           queue_;
    central::ResourceRegistry<ServiceImpl>        services_;
    central::ResourceRegistry<CharacteristicImpl> characteristics_;
    central::DisconnectNotifier                   disconnect_notifier_;
    central::DiscoveryCoordinator<ServiceImpl>    coordinator_;

};  // PeripheralImpl

}  // namespace sdk
}  // namespace blecentral

#endif  // BLECENTRAL_SDK_PERIPHERAL_IMPL_HPP_INCLUDED
