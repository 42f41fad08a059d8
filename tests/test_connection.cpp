// tests/test_connection.cpp
#include <gtest/gtest.h>
#include <string>

#include "ble/connection_manager.hpp"
#include "ble/device_registry.hpp"
#include "transport/loopback_driver.hpp"
#include "util/clock.hpp"
#include "util/config.hpp"

using ble::ConnState;
using txrelay::Errc;
using txrelay::Error;

namespace
{
// Central "C0" and an advertising merchant "P0" on one loopback air.
struct Rig
{
    transport::LoopbackRadio  air;
    transport::LoopbackDriver central{air, "C0"};
    transport::LoopbackDriver merchant{air, "P0", "Shop"};
    util::SteadyClock         clock;
    ble::DeviceRegistry       registry{clock};
    txrelay::RelayConfig      cfg;
    ble::ConnectionManager    mgr{central, registry, cfg};

    Rig()
    {
        cfg.connect_retries        = 3;
        cfg.connect_retry_delay_ms = 0;
        central.set_link_handler([this](const transport::DeviceId &id) { mgr.on_link_down(id); });
        Error                       err;
        transport::AdvertiseOptions o;
        o.service_uuid = std::string(constants::SVC_UUID);
        EXPECT_TRUE(merchant.start_advertising(o, err));
    }
};
}  // namespace

TEST(Connection, ConnectsAndVerifiesGatt)
{
    Rig   rig;
    Error err;
    ASSERT_TRUE(rig.mgr.connect_to_device("P0", 1000, err)) << err.message();
    EXPECT_TRUE(rig.mgr.is_connected("P0"));
    EXPECT_EQ(rig.mgr.state("P0"), ConnState::connected);
    EXPECT_EQ(rig.central.connect_attempts(), 1);

    // already connected: no new driver attempt
    ASSERT_TRUE(rig.mgr.connect_to_device("P0", 1000, err));
    EXPECT_EQ(rig.central.connect_attempts(), 1);

    const ble::ConnectionHealth h = rig.mgr.check_connection_health("P0");
    EXPECT_TRUE(h.is_connected);
    EXPECT_TRUE(h.has_required_service);
    EXPECT_TRUE(h.can_write);
}

TEST(Connection, RetriesTransientFailures)
{
    Rig rig;
    rig.central.fail_next_connects(2);
    Error err;
    ASSERT_TRUE(rig.mgr.connect_to_device("P0", 1000, err)) << err.message();
    EXPECT_EQ(rig.central.connect_attempts(), 3);
    EXPECT_EQ(rig.mgr.state("P0"), ConnState::connected);
}

TEST(Connection, GivesUpAfterAllAttempts)
{
    Rig rig;
    rig.central.fail_next_connects(100);
    Error err;
    EXPECT_FALSE(rig.mgr.connect_to_device("P0", 1000, err));
    EXPECT_EQ(err.code, Errc::connect_exhausted);
    EXPECT_EQ(err.kind(), txrelay::ErrorKind::Connection);
    EXPECT_EQ(err.attempts, 4);
    EXPECT_EQ(rig.central.connect_attempts(), 4);
    EXPECT_EQ(rig.mgr.state("P0"), ConnState::disconnected);
    EXPECT_NE(err.message().find("attempts=4"), std::string::npos);
}

TEST(Connection, MissingServiceIsAFailedAttempt)
{
    Rig rig;
    rig.merchant.set_gatt({});
    Error err;
    EXPECT_FALSE(rig.mgr.connect_to_device("P0", 1000, err));
    EXPECT_EQ(err.code, Errc::connect_exhausted);
    EXPECT_NE(err.detail.find("service_missing"), std::string::npos);
    EXPECT_FALSE(rig.central.is_connected("P0"));
}

TEST(Connection, ReadOnlyCharacteristicIsRejected)
{
    Rig                    rig;
    transport::ServiceInfo svc;
    svc.uuid = std::string(constants::SVC_UUID);
    svc.characteristics.push_back(
        transport::CharacteristicInfo{std::string(constants::CHR_UUID), transport::PROP_READ});
    rig.merchant.set_gatt({svc});
    rig.cfg.connect_retries = 0;

    Error err;
    EXPECT_FALSE(rig.mgr.connect_to_device("P0", 1000, err));
    EXPECT_EQ(err.code, Errc::connect_exhausted);
    EXPECT_EQ(err.attempts, 1);
}

TEST(Connection, DisconnectDuringConnectCancels)
{
    Rig rig;
    rig.central.set_connect_hook(
        [&](const transport::DeviceId &peer, int) { rig.mgr.disconnect_device(peer); });
    Error err;
    EXPECT_FALSE(rig.mgr.connect_to_device("P0", 1000, err));
    EXPECT_EQ(err.code, Errc::connect_cancelled);
    EXPECT_EQ(err.attempts, 1);
    EXPECT_FALSE(rig.central.is_connected("P0"));
    EXPECT_EQ(rig.mgr.state("P0"), ConnState::disconnected);
}

TEST(Connection, SecondConnectWhileInFlightIsRefused)
{
    Rig   rig;
    Error inner;
    bool  inner_ok = true;
    rig.central.set_connect_hook([&](const transport::DeviceId &peer, int) {
        inner_ok = rig.mgr.connect_to_device(peer, 1000, inner);
    });
    Error err;
    ASSERT_TRUE(rig.mgr.connect_to_device("P0", 1000, err)) << err.message();
    EXPECT_FALSE(inner_ok);
    EXPECT_EQ(inner.code, Errc::connect_in_progress);
}

TEST(Connection, RadioOffFailsWithoutRetrying)
{
    Rig rig;
    rig.central.set_powered(false);
    Error err;
    EXPECT_FALSE(rig.mgr.connect_to_device("P0", 1000, err));
    EXPECT_EQ(err.code, Errc::driver_unavailable);
    EXPECT_EQ(err.attempts, 1);
}

TEST(Connection, LinkLossAndDisconnect)
{
    Rig   rig;
    Error err;
    ASSERT_TRUE(rig.mgr.connect_to_device("P0", 1000, err));

    rig.merchant.set_powered(false);  // central hears the link drop
    EXPECT_FALSE(rig.mgr.is_connected("P0"));
    EXPECT_EQ(rig.mgr.state("P0"), ConnState::disconnected);
    EXPECT_FALSE(rig.mgr.check_connection_health("P0").is_connected);

    rig.merchant.set_powered(true);
    transport::AdvertiseOptions o;
    o.service_uuid = std::string(constants::SVC_UUID);
    ASSERT_TRUE(rig.merchant.start_advertising(o, err));
    ASSERT_TRUE(rig.mgr.connect_to_device("P0", 1000, err)) << err.message();

    rig.mgr.disconnect_device("P0");
    rig.mgr.disconnect_device("P0");
    EXPECT_TRUE(rig.mgr.connected_devices().empty());
    EXPECT_FALSE(rig.central.is_connected("P0"));
}
