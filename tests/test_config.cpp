// tests/test_config.cpp
#include <cstdlib>
#include <gtest/gtest.h>
#include <string>

#include "util/config.hpp"
#include "util/error.hpp"
#include "util/log.hpp"

using txrelay::Errc;
using txrelay::Error;

// ENV guard
struct EnvGuard
{
    std::string key, old_val;
    bool        had = false;
    explicit EnvGuard(const char *k) : key(k)
    {
        const char *v = std::getenv(k);
        if (v)
        {
            had     = true;
            old_val = v;
        }
    }
    void set(const std::string &v) const { ::setenv(key.c_str(), v.c_str(), 1); }
    void unset() const { ::unsetenv(key.c_str()); }
    ~EnvGuard()
    {
        if (had)
            ::setenv(key.c_str(), old_val.c_str(), 1);
        else
            ::unsetenv(key.c_str());
    }
};

TEST(Config, DefaultsAreValid)
{
    txrelay::RelayConfig cfg;
    Error                err;
    EXPECT_TRUE(txrelay::validate_config(cfg, err)) << err.message();
    EXPECT_EQ(cfg.connect_retries, 3u);
    EXPECT_EQ(cfg.frame_retries, 3u);
    EXPECT_EQ(cfg.session_stale_ms, 600000u);
    EXPECT_EQ(cfg.key_ttl_ms, 3600000u);
    EXPECT_TRUE(cfg.encrypt);
    EXPECT_EQ(txrelay::max_frame_chunk(512), 471u);
}

TEST(Config, EnvOverlaysDefaults)
{
    EnvGuard ack("TXRELAY_ACK_TIMEOUT_MS");
    EnvGuard mtu("TXRELAY_MTU");
    EnvGuard name("TXRELAY_LOCAL_NAME");
    EnvGuard enc("TXRELAY_ENCRYPT");
    ack.set("250");
    mtu.set("247");
    name.set("Till 4");
    enc.set("0");

    txrelay::RelayConfig cfg;
    EXPECT_TRUE(txrelay::load_config_from_env(cfg));
    EXPECT_EQ(cfg.ack_timeout_ms, 250u);
    EXPECT_EQ(cfg.mtu, 247u);
    EXPECT_EQ(cfg.local_name, "Till 4");
    EXPECT_FALSE(cfg.encrypt);
    EXPECT_EQ(cfg.connect_retries, 3u);  // untouched
}

TEST(Config, InvalidValueIsSkippedAndLogged)
{
    EnvGuard retries("TXRELAY_CONNECT_RETRIES");
    EnvGuard ack("TXRELAY_ACK_TIMEOUT_MS");
    retries.set("lots");
    ack.set("5");  // below range

    txrelay::RelayConfig cfg;
    testing::internal::CaptureStderr();
    EXPECT_FALSE(txrelay::load_config_from_env(cfg));
    const std::string log = testing::internal::GetCapturedStderr();

    EXPECT_EQ(cfg.connect_retries, 3u);
    EXPECT_EQ(cfg.ack_timeout_ms, 3000u);
    EXPECT_NE(log.find("[CFG] ignoring invalid TXRELAY_CONNECT_RETRIES='lots'"), std::string::npos);
    EXPECT_NE(log.find("TXRELAY_ACK_TIMEOUT_MS='5'"), std::string::npos);
}

TEST(Config, ValidationRejectsBadCombinations)
{
    Error err;

    txrelay::RelayConfig big_mtu;
    big_mtu.mtu = 600;
    EXPECT_FALSE(txrelay::validate_config(big_mtu, err));
    EXPECT_EQ(err.code, Errc::invalid_argument);
    EXPECT_EQ(err.kind(), txrelay::ErrorKind::Config);

    txrelay::RelayConfig chunk;
    chunk.mtu              = 185;
    chunk.frame_chunk_size = 256;  // does not fit one write at this mtu
    EXPECT_FALSE(txrelay::validate_config(chunk, err));
    chunk.frame_chunk_size = txrelay::max_frame_chunk(185);
    EXPECT_TRUE(txrelay::validate_config(chunk, err));

    txrelay::RelayConfig crypto;
    crypto.crypto = "rot13";
    EXPECT_FALSE(txrelay::validate_config(crypto, err));

    txrelay::RelayConfig qr;
    qr.qr_chunk_size = 0;
    EXPECT_FALSE(txrelay::validate_config(qr, err));
}

TEST(ErrorFormat, CarriesContext)
{
    Error err;
    EXPECT_FALSE(txrelay::fail(err, Errc::frame_delivery_failed, "no ACK"));
    err.session_id = 0xabc;
    err.index      = 3;
    err.attempts   = 4;
    EXPECT_EQ(err.message(), "TransferError.frame_delivery_failed: no ACK "
                             "(session=0000000000000abc, index=3, attempts=4)");

    Error plain;
    EXPECT_FALSE(static_cast<bool>(plain));
    txrelay::fail(plain, Errc::bad_peer_key);
    EXPECT_EQ(plain.message(), "CryptoError.bad_peer_key");
}

TEST(ErrorFormat, SessionIdText)
{
    std::uint64_t sid = 0;
    EXPECT_TRUE(txrelay::parse_session_id("00000000000000ff", sid));
    EXPECT_EQ(sid, 0xffu);
    EXPECT_TRUE(txrelay::parse_session_id("DEADbeef", sid));
    EXPECT_EQ(txrelay::format_session_id(sid), "00000000deadbeef");
    EXPECT_FALSE(txrelay::parse_session_id("", sid));
    EXPECT_FALSE(txrelay::parse_session_id("12345678901234567", sid));
    EXPECT_FALSE(txrelay::parse_session_id("xyz", sid));
}

TEST(LogLevel, FiltersByThreshold)
{
    using namespace txrelay;

    // ERROR-only: WARN should be suppressed, ERROR should appear
    set_log_level_by_name("ERROR");
    testing::internal::CaptureStderr();
    LOG_WARN("should_not_print_warn");
    std::string out1 = testing::internal::GetCapturedStderr();
    EXPECT_TRUE(out1.find("should_not_print_warn") == std::string::npos);

    testing::internal::CaptureStderr();
    LOG_ERROR("should_print_error");
    std::string out2 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out2.find("should_print_error"), std::string::npos);

    // DEBUG: DEBUG should appear
    set_log_level_by_name("DEBUG");
    testing::internal::CaptureStderr();
    LOG_DEBUG("debug_visible");
    std::string out3 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out3.find("debug_visible"), std::string::npos);

    set_log_level_by_name("INFO");
}

TEST(LogLevel, FromEnv)
{
    EnvGuard g("TXRELAY_LOG_LEVEL");
    g.set("WARN");
    txrelay::set_log_level_from_env();
    EXPECT_EQ(txrelay::global_level(), txrelay::Level::Warning);
    txrelay::set_log_level_by_name("INFO");
}
