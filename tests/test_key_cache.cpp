// tests/test_key_cache.cpp
#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

#include "app/identity.hpp"
#include "app/key_cache.hpp"
#include "app/relay_service.hpp"
#include "crypto/transport_crypto.hpp"
#include "transport/loopback_driver.hpp"
#include "util/clock.hpp"

using namespace std::chrono_literals;
using txrelay::Errc;
using txrelay::Error;

namespace
{
crypto::SharedKey key_of(std::uint8_t b)
{
    crypto::SharedKey k{};
    k.fill(b);
    return k;
}

crypto::PublicKey pub_of(std::uint8_t b)
{
    crypto::PublicKey p{};
    p.fill(b);
    return p;
}

// Counts derivations so tests can tell a cache hit from a fresh exchange.
class CountingCrypto final : public crypto::SodiumTransportCrypto
{
  public:
    bool derive_shared_key(const crypto::KeyPair           &mine,
                           const std::vector<std::uint8_t> &peer_public_raw,
                           crypto::SharedKey               &out,
                           Error                           &err) override
    {
        ++derivations;
        return SodiumTransportCrypto::derive_shared_key(mine, peer_public_raw, out, err);
    }

    std::atomic<int> derivations{0};
};
}  // namespace

TEST(KeyCache, HitWithinTtlMissAfter)
{
    util::ManualClock     clock;
    app::KeyExchangeCache cache(clock, 1000ms);

    EXPECT_FALSE(cache.lookup("P0").has_value());
    cache.put("P0", key_of(1), pub_of(2));

    auto rec = cache.lookup("P0");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->peer_id, "P0");
    EXPECT_EQ(rec->shared_key, key_of(1));
    EXPECT_EQ(rec->ephemeral_public, pub_of(2));
    EXPECT_EQ(rec->expires_at, clock.now() + 1000ms);

    clock.advance(999ms);
    EXPECT_TRUE(cache.lookup("P0").has_value());
    clock.advance(1ms);
    EXPECT_FALSE(cache.lookup("P0").has_value());
    EXPECT_EQ(cache.size(), 0u);
}

TEST(KeyCache, PutReplacesAndRestartsTtl)
{
    util::ManualClock     clock;
    app::KeyExchangeCache cache(clock, 1000ms);

    cache.put("P0", key_of(1), pub_of(1));
    clock.advance(800ms);
    cache.put("P0", key_of(2), pub_of(2));
    clock.advance(800ms);

    auto rec = cache.lookup("P0");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->shared_key, key_of(2));
    EXPECT_EQ(cache.size(), 1u);
}

TEST(KeyCache, ForgetAndPurge)
{
    util::ManualClock     clock;
    app::KeyExchangeCache cache(clock, 1000ms);

    cache.put("A", key_of(1), pub_of(1));
    cache.put("B", key_of(2), pub_of(2));
    EXPECT_TRUE(cache.forget("A"));
    EXPECT_FALSE(cache.forget("A"));
    EXPECT_EQ(cache.size(), 1u);

    clock.advance(500ms);
    cache.put("C", key_of(3), pub_of(3));
    clock.advance(600ms);
    EXPECT_EQ(cache.purge_expired(), 1u);  // B
    EXPECT_TRUE(cache.lookup("C").has_value());
}

TEST(KeyCache, RelayReusesKeyUntilExpiry)
{
    transport::LoopbackRadio  air;
    transport::LoopbackDriver tx_drv(air, "C0");
    transport::LoopbackDriver rx_drv(air, "P0", "Shop");
    util::ManualClock         clock;

    CountingCrypto tx_tc, rx_tc;

    txrelay::RelayConfig cfg;
    cfg.key_ttl_ms             = 60000;
    cfg.ack_timeout_ms         = 200;
    cfg.frame_retry_delay_ms   = 0;
    cfg.connect_retry_delay_ms = 0;

    // receiver identity
    crypto::KeyPair receiver;
    Error           err;
    ASSERT_TRUE(rx_tc.generate_ephemeral_key_pair(receiver, err));
    txrelay::RelayConfig rx_cfg = cfg;
    rx_cfg.identity_secret_hex  = crypto::to_hex(receiver.secret.data(), receiver.secret.size());

    app::StaticIdentityResolver tx_ids, rx_ids;
    tx_ids.add("P0", std::vector<std::uint8_t>(receiver.public_raw.begin(),
                                               receiver.public_raw.end()));

    app::RelayService sender(tx_drv, tx_tc, tx_ids, cfg, clock);
    app::RelayService merchant(rx_drv, rx_tc, rx_ids, rx_cfg, clock);
    ASSERT_TRUE(sender.start(err)) << err.message();
    ASSERT_TRUE(merchant.start(err)) << err.message();
    ASSERT_TRUE(merchant.enter_receiving_mode(err)) << err.message();

    int received = 0;
    merchant.on_envelope_received(
        [&](const transport::DeviceId &, std::uint64_t, const app::TransactionEnvelope &) {
            ++received;
        });

    app::TransactionEnvelope env;
    env.payload = {1, 2, 3, 4};

    ASSERT_TRUE(sender.send_envelope("P0", env).success);
    ASSERT_TRUE(sender.send_envelope("P0", env).success);
    EXPECT_EQ(tx_tc.derivations.load(), 1);
    EXPECT_EQ(sender.key_cache().size(), 1u);
    EXPECT_EQ(received, 2);

    clock.advance(std::chrono::milliseconds(cfg.key_ttl_ms));
    ASSERT_TRUE(sender.send_envelope("P0", env).success);
    EXPECT_EQ(tx_tc.derivations.load(), 2);
    EXPECT_EQ(received, 3);
}

TEST(KeyCache, RelaySweepDropsExpiredKeys)
{
    transport::LoopbackRadio      air;
    transport::LoopbackDriver     drv(air, "C0");
    crypto::SodiumTransportCrypto tc;
    app::StaticIdentityResolver   ids;
    util::ManualClock             clock;

    txrelay::RelayConfig cfg;
    cfg.key_ttl_ms = 1000;
    app::RelayService relay(drv, tc, ids, cfg, clock);

    relay.key_cache().put("P0", key_of(1), pub_of(1));
    relay.key_cache().put("P1", key_of(2), pub_of(2));
    clock.advance(500ms);
    relay.key_cache().put("P1", key_of(3), pub_of(3));
    clock.advance(600ms);

    testing::internal::CaptureStderr();
    relay.sweep();
    const std::string log = testing::internal::GetCapturedStderr();
    EXPECT_NE(log.find("[KEX] purged 1 expired key(s)"), std::string::npos);
    EXPECT_EQ(relay.key_cache().purge_expired(), 0u);  // already gone
    EXPECT_TRUE(relay.key_cache().lookup("P1").has_value());
}

TEST(KeyCache, SweeperThreadPurgesPeriodically)
{
    transport::LoopbackRadio      air;
    transport::LoopbackDriver     drv(air, "C0");
    crypto::SodiumTransportCrypto tc;
    app::StaticIdentityResolver   ids;
    util::ManualClock             clock;

    txrelay::RelayConfig cfg;
    cfg.key_ttl_ms        = 1000;
    cfg.sweep_interval_ms = 10;
    app::RelayService relay(drv, tc, ids, cfg, clock);
    relay.key_cache().put("P0", key_of(1), pub_of(1));
    clock.advance(2000ms);

    Error err;
    testing::internal::CaptureStderr();
    ASSERT_TRUE(relay.start(err)) << err.message();
    std::this_thread::sleep_for(200ms);
    relay.stop();
    const std::string log = testing::internal::GetCapturedStderr();

    EXPECT_NE(log.find("[KEX] purged 1 expired key(s)"), std::string::npos);
    EXPECT_EQ(relay.key_cache().purge_expired(), 0u);
}
