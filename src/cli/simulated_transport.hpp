//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BLECENTRAL_CLI_SIMULATED_TRANSPORT_HPP_INCLUDED
#define BLECENTRAL_CLI_SIMULATED_TRANSPORT_HPP_INCLUDED

#include "config.hpp"
#include "logging.hpp"
#include "serial_queue.hpp"

#include <blecentral/sdk/transport.hpp>
#include <blecentral/sdk/uuid.hpp>

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

#include <utility>

namespace blecentral
{
namespace cli
{

/// Transport of a fake peripheral, which answers requests from its configured GATT database.
///
/// Every answer is delivered after the configured latency on the executor, like a real radio link would do.
/// Failures, unanswered requests and link drops are injected as the setup says.
/// Written values are kept (and notified, if enabled) until the transport is destroyed.
///
class SimulatedTransport final : public sdk::Transport
{
public:
    SimulatedTransport(libcyphal::IExecutor& executor, Config::PeripheralSetup setup);

    ~SimulatedTransport() override = default;

    // MARK: Transport

    sdk::ConnectionState connectionState() const override
    {
        return state_;
    }

    void discoverServices(const cetl::optional<sdk::UuidSet>& service_uuids) override;

    void discoverCharacteristics(const sdk::Uuid&                    service_uuid,
                                 const cetl::optional<sdk::UuidSet>& characteristic_uuids) override;

    void readValue(const sdk::Uuid& service_uuid, const sdk::Uuid& characteristic_uuid) override;

    void writeValue(const sdk::Uuid&                service_uuid,
                    const sdk::Uuid&                characteristic_uuid,
                    const sdk::CharacteristicValue& value,
                    const sdk::WriteType            type) override;

    void setNotifyValue(const sdk::Uuid& service_uuid, const sdk::Uuid& characteristic_uuid, const bool enabled) override;

    void subscribe(EventHandler event_handler) override
    {
        event_handler_ = std::move(event_handler);
    }

private:
    /// @return `nullptr` if the service doesn't have such characteristic.
    ///
    Config::CharacteristicSetup* findCharacteristic(const sdk::Uuid& service_uuid, const sdk::Uuid& characteristic_uuid);

    void deliverLater(Event::Var event);
    void deliver(const Event::Var& event);
    void notify(const Event::Var& event);

    Config::PeripheralSetup setup_;
    common::LoggerPtr       logger_;
    common::SerialQueue     queue_;
    sdk::ConnectionState    state_;
    sdk::UuidSet            notifying_;
    EventHandler            event_handler_;

};  // SimulatedTransport

}  // namespace cli
}  // namespace blecentral

#endif  // BLECENTRAL_CLI_SIMULATED_TRANSPORT_HPP_INCLUDED
