//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <blecentral/sdk/peripheral.hpp>

#include "sdk/discovery_gtest_helpers.hpp"
#include "sdk/transport_mock.hpp"
#include "virtual_time_scheduler.hpp"

#include <blecentral/sdk/discovery.hpp>
#include <blecentral/sdk/errors.hpp>
#include <blecentral/sdk/service.hpp>
#include <blecentral/sdk/transport.hpp>
#include <blecentral/sdk/uuid.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <memory>
#include <vector>

namespace
{

using namespace blecentral::sdk;  // NOLINT This our main concern here in the unit tests.

using testing::_;
using testing::Eq;
using testing::Return;
using testing::IsNull;
using testing::NotNull;
using testing::IsEmpty;
using testing::SaveArg;
using testing::InSequence;
using testing::StrictMock;
using testing::ElementsAre;

// https://github.com/llvm/llvm-project/issues/53444
// NOLINTBEGIN(misc-unused-using-decls, misc-include-cleaner)
using std::literals::chrono_literals::operator""s;
using std::literals::chrono_literals::operator""ms;
// NOLINTEND(misc-unused-using-decls, misc-include-cleaner)

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestPeripheral : public testing::Test
{
protected:
    using ServicesDiscovered        = Transport::Event::ServicesDiscovered;
    using CharacteristicsDiscovered = Transport::Event::CharacteristicsDiscovered;
    using Disconnected              = Transport::Event::Disconnected;

    void SetUp() override
    {
        EXPECT_CALL(transport_mock_, connectionState()).WillRepeatedly([this] { return connection_state_; });
    }

    void TearDown() override
    {
        peripheral_.reset();
    }

    Peripheral::Ptr makePeripheral()
    {
        EXPECT_CALL(transport_mock_, subscribe(_)).Times(2);
        EXPECT_CALL(transport_mock_, deinit()).Times(1);

        auto transport = std::make_unique<TransportMock::Wrapper>(transport_mock_);
        peripheral_    = Peripheral::make(scheduler_, std::move(transport), "periph");
        return peripheral_;
    }

    /// Delivers a successful service round with the given services.
    ///
    void respondServices(const std::vector<Uuid>& uuids, const cetl::optional<int>& error = cetl::nullopt)
    {
        std::vector<RawService> raw_services;
        for (const auto& uuid : uuids)
        {
            raw_services.push_back(RawService{uuid});
        }
        transport_mock_.emit(ServicesDiscovered{raw_services, error});
    }

    static std::vector<Uuid> uuidsOf(const std::vector<Service::Ptr>& services)
    {
        std::vector<Uuid> uuids;
        for (const auto& service : services)
        {
            uuids.push_back(service->uuid());
        }
        return uuids;
    }

    // NOLINTBEGIN
    blecentral::VirtualTimeScheduler scheduler_{};
    StrictMock<TransportMock>        transport_mock_;
    ConnectionState                  connection_state_{ConnectionState::Connected};
    Peripheral::Ptr                  peripheral_;
    const Uuid                       heart_rate_{0x180D};
    const Uuid                       battery_{0x180F};
    const Uuid                       device_info_{0x180A};
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestPeripheral, make_without_transport)
{
    EXPECT_THAT(Peripheral::make(scheduler_, nullptr, "periph"), IsNull());
}

TEST_F(TestPeripheral, make_subscribes_and_destruction_unsubscribes)
{
    {
        const InSequence seq;
        EXPECT_CALL(transport_mock_, subscribe(_)).WillOnce([](const Transport::EventHandler& handler) {
            EXPECT_TRUE(handler);
        });
        EXPECT_CALL(transport_mock_, subscribe(_)).WillOnce([](const Transport::EventHandler& handler) {
            EXPECT_FALSE(handler);
        });
        EXPECT_CALL(transport_mock_, deinit());
    }

    auto peripheral = Peripheral::make(scheduler_, std::make_unique<TransportMock::Wrapper>(transport_mock_), "xyz");
    ASSERT_THAT(peripheral, NotNull());
    EXPECT_THAT(peripheral->identifier(), Eq("xyz"));
    EXPECT_THAT(peripheral->state(), ConnectionState::Connected);
    EXPECT_THAT(peripheral->services(), IsEmpty());
    EXPECT_THAT(peripheral->service(heart_rate_), IsNull());

    peripheral.reset();
}

TEST_F(TestPeripheral, discover_all_services)
{
    const auto peripheral = makePeripheral();

    cetl::optional<UuidSet> requested{UuidSet{}};
    EXPECT_CALL(transport_mock_, discoverServices(_)).WillOnce(SaveArg<0>(&requested));

    const auto future = peripheral->discoverAllServices();
    EXPECT_FALSE(future.completed());
    EXPECT_FALSE(requested.has_value());

    respondServices({heart_rate_, battery_});
    EXPECT_TRUE(isSucceeded(future)) << describe(future);
    EXPECT_THAT(uuidsOf(peripheral->services()), ElementsAre(heart_rate_, battery_));

    const auto service = peripheral->service(battery_);
    ASSERT_THAT(service, NotNull());
    EXPECT_THAT(service->uuid(), battery_);
    EXPECT_THAT(service->peripheral().get(), peripheral.get());
    EXPECT_THAT(peripheral->service(device_info_), IsNull());
}

TEST_F(TestPeripheral, discover_specific_services)
{
    const auto peripheral = makePeripheral();

    cetl::optional<UuidSet> requested;
    EXPECT_CALL(transport_mock_, discoverServices(_)).WillOnce(SaveArg<0>(&requested));

    const auto future = peripheral->discoverServices({battery_}, 1s);
    ASSERT_TRUE(requested.has_value());
    EXPECT_THAT(*requested, Eq(UuidSet{battery_}));

    respondServices({battery_});
    EXPECT_TRUE(isSucceeded(future)) << describe(future);
    EXPECT_THAT(uuidsOf(peripheral->services()), ElementsAre(battery_));
}

TEST_F(TestPeripheral, discover_while_not_connected)
{
    connection_state_     = ConnectionState::Disconnected;
    const auto peripheral = makePeripheral();

    // No `discoverServices` expectation - the strict mock would complain about any request.
    const auto future = peripheral->discoverAllServices();
    EXPECT_TRUE(isFailedWith<NotConnectedError>(future)) << describe(future);
}

TEST_F(TestPeripheral, discover_is_coalesced)
{
    const auto peripheral = makePeripheral();

    EXPECT_CALL(transport_mock_, discoverServices(_)).Times(1);

    const auto future1 = peripheral->discoverAllServices(2s);
    const auto future2 = peripheral->discoverServices({battery_});
    EXPECT_TRUE(future1.isSameAs(future2));

    respondServices({heart_rate_, battery_});
    EXPECT_TRUE(isSucceeded(future2)) << describe(future2);
}

TEST_F(TestPeripheral, discover_times_out)
{
    const auto peripheral = makePeripheral();

    EXPECT_CALL(transport_mock_, discoverServices(_)).Times(1);
    const auto future = peripheral->discoverAllServices(2s);

    scheduler_.spinFor(2s - 1ms);
    EXPECT_FALSE(future.completed());
    scheduler_.spinFor(1ms);
    EXPECT_TRUE(isFailedWith<DiscoveryTimeoutError>(future)) << describe(future);

    // A late response doesn't change the outcome, but still refreshes the registry.
    respondServices({heart_rate_});
    EXPECT_TRUE(isFailedWith<DiscoveryTimeoutError>(future)) << describe(future);
    EXPECT_THAT(peripheral->service(heart_rate_), NotNull());
}

TEST_F(TestPeripheral, discover_fails_with_transport_error)
{
    const auto peripheral = makePeripheral();

    EXPECT_CALL(transport_mock_, discoverServices(_)).Times(2);
    auto future = peripheral->discoverAllServices();
    respondServices({heart_rate_});
    ASSERT_TRUE(isSucceeded(future)) << describe(future);

    future = peripheral->discoverAllServices();
    respondServices({battery_}, EIO);
    EXPECT_TRUE(isFailedWith<TransportError>(future)) << describe(future);

    EXPECT_THAT(peripheral->services(), IsEmpty());
    EXPECT_THAT(peripheral->service(heart_rate_), NotNull());
    EXPECT_THAT(peripheral->service(battery_), IsNull());
}

TEST_F(TestPeripheral, disconnect_mid_round)
{
    const auto peripheral = makePeripheral();

    EXPECT_CALL(transport_mock_, discoverServices(_)).Times(1);
    const auto future = peripheral->discoverAllServices(2s);

    scheduler_.spinFor(1s);
    connection_state_ = ConnectionState::Disconnected;
    transport_mock_.emit(Disconnected{ECONNRESET});
    EXPECT_TRUE(isFailedWith<DisconnectedError>(future)) << describe(future);

    scheduler_.spinFor(5s);
    EXPECT_TRUE(isFailedWith<DisconnectedError>(future)) << describe(future);

    const auto retry = peripheral->discoverAllServices();
    EXPECT_TRUE(isFailedWith<NotConnectedError>(retry)) << describe(retry);

    connection_state_ = ConnectionState::Connected;
    EXPECT_CALL(transport_mock_, discoverServices(_)).Times(1);
    const auto fresh = peripheral->discoverAllServices(2s);
    EXPECT_FALSE(fresh.completed());
    respondServices({battery_});
    EXPECT_TRUE(isSucceeded(fresh)) << describe(fresh);
}

TEST_F(TestPeripheral, rediscovery_replaces_services)
{
    const auto peripheral = makePeripheral();

    EXPECT_CALL(transport_mock_, discoverServices(_)).Times(2);
    auto future = peripheral->discoverAllServices();
    respondServices({heart_rate_, battery_});
    ASSERT_TRUE(isSucceeded(future)) << describe(future);
    const auto old_battery = peripheral->service(battery_);

    future = peripheral->discoverAllServices();
    respondServices({battery_, heart_rate_});
    ASSERT_TRUE(isSucceeded(future)) << describe(future);
    EXPECT_THAT(uuidsOf(peripheral->services()), ElementsAre(battery_, heart_rate_));

    const auto new_battery = peripheral->service(battery_);
    ASSERT_THAT(new_battery, NotNull());
    EXPECT_NE(old_battery, new_battery);

    // The replaced service object can't discover anymore.
    const auto stale = old_battery->discoverAllCharacteristics();
    EXPECT_TRUE(isFailedWith<UnconfiguredError>(stale)) << describe(stale);
}

TEST_F(TestPeripheral, rediscovery_abandons_characteristics_round_of_replaced_service)
{
    const auto peripheral = makePeripheral();

    EXPECT_CALL(transport_mock_, discoverServices(_)).Times(2);
    auto future = peripheral->discoverAllServices();
    respondServices({battery_});
    ASSERT_TRUE(isSucceeded(future)) << describe(future);

    // The user keeps the service, and its round is in flight while services get re-discovered.
    EXPECT_CALL(transport_mock_, discoverCharacteristics(battery_, _)).Times(1);
    const auto old_battery = peripheral->service(battery_);
    const auto old_round   = old_battery->discoverAllCharacteristics(2s);
    EXPECT_FALSE(old_round.completed());

    future = peripheral->discoverAllServices();
    respondServices({battery_});
    ASSERT_TRUE(isSucceeded(future)) << describe(future);
    EXPECT_TRUE(isFailedWith<UnconfiguredError>(old_round)) << describe(old_round);

    // The answer goes to the new service object, and the old round timeout has nothing to settle.
    transport_mock_.emit(CharacteristicsDiscovered{battery_, {{Uuid{0x2A19}, CharacteristicProperties::Read}}, {}});
    scheduler_.spinFor(3s);
    EXPECT_TRUE(isFailedWith<UnconfiguredError>(old_round)) << describe(old_round);
    EXPECT_THAT(peripheral->service(battery_)->characteristics().size(), 1U);
    EXPECT_THAT(old_battery->characteristics(), IsEmpty());
}

TEST_F(TestPeripheral, rediscovery_settles_pending_discovery_of_everything)
{
    const auto peripheral = makePeripheral();

    EXPECT_CALL(transport_mock_, discoverServices(_)).Times(2);
    const auto everything = peripheral->discoverAllServicesAndCharacteristics();

    EXPECT_CALL(transport_mock_, discoverCharacteristics(_, _)).Times(2);
    respondServices({heart_rate_, battery_});
    EXPECT_FALSE(everything.completed());

    // Nobody but the registry holds the services, so re-discovery destroys them with their rounds.
    const auto services = peripheral->discoverAllServices();
    respondServices({heart_rate_, battery_});
    ASSERT_TRUE(isSucceeded(services)) << describe(services);
    EXPECT_TRUE(isFailedWith<UnconfiguredError>(everything)) << describe(everything);
}

TEST_F(TestPeripheral, destruction_fails_pending_rounds)
{
    auto peripheral = makePeripheral();

    EXPECT_CALL(transport_mock_, discoverServices(_)).Times(2);
    const auto everything = peripheral->discoverAllServicesAndCharacteristics();

    EXPECT_CALL(transport_mock_, discoverCharacteristics(_, _)).Times(1);
    respondServices({heart_rate_});
    const auto service       = peripheral->service(heart_rate_);
    const auto service_round = service->discoverAllCharacteristics();
    EXPECT_FALSE(service_round.completed());

    const auto services_round = peripheral->discoverAllServices(2s);
    EXPECT_FALSE(services_round.completed());

    peripheral.reset();
    peripheral_.reset();
    EXPECT_TRUE(isFailedWith<UnconfiguredError>(services_round)) << describe(services_round);
    EXPECT_TRUE(isFailedWith<UnconfiguredError>(service_round)) << describe(service_round);
    EXPECT_TRUE(isFailedWith<UnconfiguredError>(everything)) << describe(everything);

    scheduler_.spinFor(5s);
    EXPECT_TRUE(isFailedWith<UnconfiguredError>(services_round)) << describe(services_round);
}

TEST_F(TestPeripheral, services_outlive_peripheral)
{
    auto peripheral = makePeripheral();

    EXPECT_CALL(transport_mock_, discoverServices(_)).Times(1);
    const auto future = peripheral->discoverAllServices();
    respondServices({heart_rate_});
    ASSERT_TRUE(isSucceeded(future)) << describe(future);

    const auto service = peripheral->service(heart_rate_);
    peripheral.reset();
    peripheral_.reset();

    EXPECT_THAT(service->peripheral(), IsNull());
    EXPECT_THAT(service->characteristics(), IsEmpty());
    EXPECT_THAT(service->characteristic(Uuid{0x2A37}), IsNull());

    const auto orphan = service->discoverAllCharacteristics();
    EXPECT_TRUE(isFailedWith<UnconfiguredError>(orphan)) << describe(orphan);
}

TEST_F(TestPeripheral, discover_all_services_and_characteristics)
{
    const auto peripheral = makePeripheral();

    EXPECT_CALL(transport_mock_, discoverServices(_)).Times(1);
    const auto future = peripheral->discoverAllServicesAndCharacteristics(2s);

    EXPECT_CALL(transport_mock_, discoverCharacteristics(heart_rate_, _)).Times(1);
    EXPECT_CALL(transport_mock_, discoverCharacteristics(battery_, _)).Times(1);
    respondServices({heart_rate_, battery_});
    EXPECT_FALSE(future.completed());

    transport_mock_.emit(CharacteristicsDiscovered{battery_, {{Uuid{0x2A19}, CharacteristicProperties::Read}}, {}});
    EXPECT_FALSE(future.completed());

    scheduler_.spinFor(1s);
    transport_mock_.emit(CharacteristicsDiscovered{heart_rate_, {{Uuid{0x2A37}, CharacteristicProperties::Notify}}, {}});
    EXPECT_TRUE(isSucceeded(future)) << describe(future);

    EXPECT_THAT(peripheral->service(battery_)->characteristics().size(), 1U);
    EXPECT_THAT(peripheral->service(heart_rate_)->characteristic(Uuid{0x2A37}), NotNull());

    // Each round had its own timeout, and all of them are stale by now.
    scheduler_.spinFor(10s);
    EXPECT_TRUE(isSucceeded(future)) << describe(future);
}

TEST_F(TestPeripheral, discover_all_services_and_characteristics_without_services)
{
    const auto peripheral = makePeripheral();

    EXPECT_CALL(transport_mock_, discoverServices(_)).Times(1);
    const auto future = peripheral->discoverAllServicesAndCharacteristics(2s);

    respondServices({});
    EXPECT_TRUE(isSucceeded(future)) << describe(future);
}

TEST_F(TestPeripheral, discover_all_services_and_characteristics_first_failure_wins)
{
    const auto peripheral = makePeripheral();

    EXPECT_CALL(transport_mock_, discoverServices(_)).Times(1);
    const auto future = peripheral->discoverAllServicesAndCharacteristics(2s);

    EXPECT_CALL(transport_mock_, discoverCharacteristics(_, _)).Times(3);
    respondServices({heart_rate_, battery_, device_info_});

    transport_mock_.emit(CharacteristicsDiscovered{heart_rate_, {}, {}});
    transport_mock_.emit(CharacteristicsDiscovered{battery_, {}, EPROTO});
    ASSERT_TRUE(isFailedWith<TransportError>(future)) << describe(future);

    // The device info round times out later, but the outcome is already settled.
    scheduler_.spinFor(3s);
    EXPECT_TRUE(isFailedWith<TransportError>(future)) << describe(future);
    EXPECT_THAT(peripheral->service(heart_rate_)->characteristics(), IsEmpty());
}

TEST_F(TestPeripheral, discover_all_services_and_characteristics_service_round_fails)
{
    const auto peripheral = makePeripheral();

    EXPECT_CALL(transport_mock_, discoverServices(_)).Times(1);
    const auto future = peripheral->discoverAllServicesAndCharacteristics(2s);

    scheduler_.spinFor(2s);
    EXPECT_TRUE(isFailedWith<DiscoveryTimeoutError>(future)) << describe(future);
}

TEST_F(TestPeripheral, disconnect_fails_service_rounds_too)
{
    const auto peripheral = makePeripheral();

    EXPECT_CALL(transport_mock_, discoverServices(_)).Times(1);
    const auto future = peripheral->discoverAllServicesAndCharacteristics();

    EXPECT_CALL(transport_mock_, discoverCharacteristics(_, _)).Times(2);
    respondServices({heart_rate_, battery_});

    const auto service_future = peripheral->service(battery_)->discoverAllCharacteristics();
    EXPECT_FALSE(service_future.completed());

    connection_state_ = ConnectionState::Disconnected;
    transport_mock_.emit(Disconnected{cetl::nullopt});
    EXPECT_TRUE(isFailedWith<DisconnectedError>(future)) << describe(future);
    EXPECT_TRUE(isFailedWith<DisconnectedError>(service_future)) << describe(service_future);

    // Discovered services are kept.
    EXPECT_THAT(uuidsOf(peripheral->services()), ElementsAre(heart_rate_, battery_));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
