#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "transport/loopback_driver.hpp"
#include "util/constants.hpp"

using namespace transport;
using txrelay::Errc;
using txrelay::Error;

static AdvertiseOptions relay_advert(const std::string &name)
{
    AdvertiseOptions o;
    o.local_name   = name;
    o.service_uuid = std::string(constants::SVC_UUID);
    return o;
}

TEST(Loopback, ScannerSeesExistingAndNewAdverts)
{
    LoopbackRadio  air;
    LoopbackDriver central(air, "AA:AA:AA:AA:AA:01");
    LoopbackDriver early(air, "AA:AA:AA:AA:AA:02");
    LoopbackDriver late(air, "AA:AA:AA:AA:AA:03");
    Error          err;

    ASSERT_TRUE(early.start_advertising(relay_advert("early"), err));

    std::vector<Advertisement> seen;
    ASSERT_TRUE(central.start_scan(std::string(constants::SVC_UUID),
                                   [&](const Advertisement &a) { seen.push_back(a); }, err));
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].device_id, "AA:AA:AA:AA:AA:02");
    EXPECT_EQ(seen[0].name, "early");
    ASSERT_EQ(seen[0].service_uuids.size(), 1u);

    ASSERT_TRUE(late.start_advertising(relay_advert("late"), err));
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[1].name, "late");

    central.stop_scan();
    air.inject_advertisement(Advertisement{"AA:AA:AA:AA:AA:09", "x", -70, {}});
    EXPECT_EQ(seen.size(), 2u);
}

TEST(Loopback, WriteDeliversBothWays)
{
    LoopbackRadio  air;
    LoopbackDriver central(air, "C0");
    LoopbackDriver periph(air, "P0");
    Error          err;

    Frame    at_periph, at_central;
    DeviceId periph_from, central_from;
    periph.set_value_handler([&](const DeviceId &from, const Frame &f) {
        periph_from = from;
        at_periph   = f;
    });
    central.set_value_handler([&](const DeviceId &from, const Frame &f) {
        central_from = from;
        at_central   = f;
    });

    EXPECT_FALSE(central.write("P0", {1}));  // no link yet

    ASSERT_TRUE(periph.start_advertising(relay_advert("p"), err));
    ASSERT_TRUE(central.connect("P0", ConnectOptions{}, err)) << err.message();
    EXPECT_TRUE(central.is_connected("P0"));
    EXPECT_TRUE(periph.is_connected("C0"));

    ASSERT_TRUE(central.write("P0", {1, 2, 3}));
    EXPECT_EQ(periph_from, "C0");
    EXPECT_EQ(at_periph, (Frame{1, 2, 3}));

    ASSERT_TRUE(periph.write("C0", {9}));
    EXPECT_EQ(central_from, "P0");
    EXPECT_EQ(at_central, Frame{9});

    // only the central side can read the GATT table
    EXPECT_TRUE(central.services("P0").has_value());
    EXPECT_FALSE(periph.services("C0").has_value());
}

TEST(Loopback, ConnectNeedsAnAdvertisingPeer)
{
    LoopbackRadio  air;
    LoopbackDriver central(air, "C0");
    LoopbackDriver periph(air, "P0");
    Error          err;

    EXPECT_FALSE(central.connect("P0", ConnectOptions{}, err));
    EXPECT_EQ(err.code, Errc::connect_timeout);

    err.clear();
    EXPECT_FALSE(central.connect("ZZ", ConnectOptions{}, err));
    EXPECT_EQ(err.code, Errc::connect_timeout);
    EXPECT_EQ(central.connect_attempts(), 2);
}

TEST(Loopback, DisconnectNotifiesOnlyThePeer)
{
    LoopbackRadio  air;
    LoopbackDriver central(air, "C0");
    LoopbackDriver periph(air, "P0");
    Error          err;

    std::vector<DeviceId> periph_down, central_down;
    periph.set_link_handler([&](const DeviceId &id) { periph_down.push_back(id); });
    central.set_link_handler([&](const DeviceId &id) { central_down.push_back(id); });

    ASSERT_TRUE(periph.start_advertising(relay_advert("p"), err));
    ASSERT_TRUE(central.connect("P0", ConnectOptions{}, err));
    central.disconnect("P0");

    EXPECT_FALSE(central.is_connected("P0"));
    ASSERT_EQ(periph_down.size(), 1u);
    EXPECT_EQ(periph_down[0], "C0");
    EXPECT_TRUE(central_down.empty());

    central.disconnect("P0");  // idempotent
    EXPECT_EQ(periph_down.size(), 1u);
}

TEST(Loopback, PowerOffDropsLinksAndRefusesWork)
{
    LoopbackRadio  air;
    LoopbackDriver central(air, "C0");
    LoopbackDriver periph(air, "P0");
    Error          err;

    std::vector<DeviceId> central_down;
    central.set_link_handler([&](const DeviceId &id) { central_down.push_back(id); });

    ASSERT_TRUE(periph.start_advertising(relay_advert("p"), err));
    ASSERT_TRUE(central.connect("P0", ConnectOptions{}, err));

    periph.set_powered(false);
    EXPECT_FALSE(periph.radio_state().powered);
    EXPECT_FALSE(periph.advertising());
    ASSERT_EQ(central_down.size(), 1u);
    EXPECT_EQ(central_down[0], "P0");

    err.clear();
    EXPECT_FALSE(periph.start_scan("", nullptr, err));
    EXPECT_EQ(err.code, Errc::driver_unavailable);
}

TEST(Loopback, FaultInjection)
{
    LoopbackRadio  air;
    LoopbackDriver central(air, "C0");
    LoopbackDriver periph(air, "P0");
    Error          err;

    int delivered = 0;
    periph.set_value_handler([&](const DeviceId &, const Frame &) { ++delivered; });
    ASSERT_TRUE(periph.start_advertising(relay_advert("p"), err));

    central.fail_next_connects(1);
    EXPECT_FALSE(central.connect("P0", ConnectOptions{}, err));
    ASSERT_TRUE(central.connect("P0", ConnectOptions{}, err));

    // lost in the air: the write itself still succeeds
    central.set_write_filter([](const DeviceId &, const Frame &f) { return f[0] != 0xEE; });
    EXPECT_TRUE(central.write("P0", {0xEE}));
    EXPECT_TRUE(central.write("P0", {0x01}));
    EXPECT_EQ(delivered, 1);

    central.fail_next_writes(1);
    EXPECT_FALSE(central.write("P0", {0x02}));
    EXPECT_EQ(delivered, 1);
    EXPECT_EQ(central.writes_attempted(), 3u);
}
