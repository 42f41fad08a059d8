#include <cstdlib>
#include <cstring>
#include <string>

#include "crypto/transport_crypto.hpp"
#include "proto/frag.hpp"
#include "util/config.hpp"
#include "util/log.hpp"

namespace txrelay
{

namespace
{

// Reads an unsigned integer variable in [lo, hi]. Missing -> untouched, true.
template <typename T>
bool env_uint(const char *key, T lo, T hi, T &out)
{
    const char *e = std::getenv(key);
    if (!e || !*e)
        return true;
    char         *p = nullptr;
    unsigned long v = std::strtoul(e, &p, 10);
    if (p && *p == '\0' && v >= lo && v <= hi)
    {
        out = static_cast<T>(v);
        LOG_DEBUG("[CFG] %s=%lu", key, v);
        return true;
    }
    LOG_WARN("[CFG] ignoring invalid %s='%s' (expect %lu..%lu)", key, e, (unsigned long)lo,
             (unsigned long)hi);
    return false;
}

bool env_str(const char *key, std::string &out)
{
    if (const char *e = std::getenv(key); e && *e)
        out = e;
    return true;
}

}  // namespace

std::size_t max_frame_chunk(std::size_t mtu)
{
    const std::size_t overhead = constants::ATT_OVERHEAD + frag::HDR_SIZE + crypto::TAG_SIZE;
    return mtu > overhead ? mtu - overhead : 0;
}

bool load_config_from_env(RelayConfig &cfg)
{
    constexpr std::uint32_t DAY_MS = 24u * 60u * 60u * 1000u;
    bool                    ok     = true;

    ok &= env_uint<std::uint32_t>("TXRELAY_DISCOVERY_TIMEOUT_MS", 100, DAY_MS,
                                  cfg.discovery_timeout_ms);
    ok &= env_uint<std::uint32_t>("TXRELAY_CONNECT_TIMEOUT_MS", 100, DAY_MS,
                                  cfg.connect_timeout_ms);
    ok &= env_uint<std::uint32_t>("TXRELAY_CONNECT_RETRIES", 0, 20, cfg.connect_retries);
    ok &= env_uint<std::uint32_t>("TXRELAY_CONNECT_RETRY_DELAY_MS", 0, 60000,
                                  cfg.connect_retry_delay_ms);
    ok &= env_uint<std::uint32_t>("TXRELAY_ACK_TIMEOUT_MS", 10, 600000, cfg.ack_timeout_ms);
    ok &= env_uint<std::uint32_t>("TXRELAY_FRAME_RETRIES", 0, 20, cfg.frame_retries);
    ok &= env_uint<std::uint32_t>("TXRELAY_FRAME_RETRY_DELAY_MS", 0, 60000,
                                  cfg.frame_retry_delay_ms);
    ok &= env_uint<std::uint32_t>("TXRELAY_COMMIT_TIMEOUT_MS", 0, 600000, cfg.commit_timeout_ms);
    ok &= env_uint<std::uint32_t>("TXRELAY_SESSION_STALE_MS", 1000, DAY_MS, cfg.session_stale_ms);
    ok &= env_uint<std::uint32_t>("TXRELAY_SWEEP_INTERVAL_MS", 100, DAY_MS,
                                  cfg.sweep_interval_ms);
    ok &= env_uint<std::uint32_t>("TXRELAY_PROGRESS_INTERVAL_MS", 10, 60000,
                                  cfg.progress_interval_ms);
    ok &= env_uint<std::size_t>("TXRELAY_MTU", 23, constants::MTU_CAP, cfg.mtu);
    ok &= env_uint<std::size_t>("TXRELAY_FRAME_SIZE", 1, 4096, cfg.frame_chunk_size);
    ok &= env_uint<std::size_t>("TXRELAY_QR_CHUNK_SIZE", 1, 2048, cfg.qr_chunk_size);
    ok &= env_uint<std::uint32_t>("TXRELAY_KEY_TTL_MS", 1000, 7 * DAY_MS, cfg.key_ttl_ms);

    env_str("TXRELAY_CRYPTO", cfg.crypto);
    env_str("TXRELAY_IDENTITY_KEY", cfg.identity_secret_hex);
    env_str("TXRELAY_PEER_KEYS", cfg.peer_keys);
    env_str("TXRELAY_ADAPTER", cfg.adapter);
    env_str("TXRELAY_LOCAL_NAME", cfg.local_name);

    if (const char *e = std::getenv("TXRELAY_ENCRYPT"); e && *e)
        cfg.encrypt = std::strcmp(e, "0") != 0;

    return ok;
}

bool validate_config(const RelayConfig &cfg, Error &err)
{
    if (cfg.mtu > constants::MTU_CAP)
        return fail(err, Errc::invalid_argument,
                    "mtu " + std::to_string(cfg.mtu) + " exceeds cap " +
                        std::to_string(constants::MTU_CAP));

    const std::size_t limit = max_frame_chunk(cfg.mtu);
    if (cfg.frame_chunk_size == 0 || cfg.frame_chunk_size > limit)
        return fail(err, Errc::invalid_argument,
                    "frame size " + std::to_string(cfg.frame_chunk_size) + " must be 1.." +
                        std::to_string(limit) + " for mtu " + std::to_string(cfg.mtu));

    if (cfg.qr_chunk_size == 0)
        return fail(err, Errc::invalid_argument, "qr chunk size must be positive");

    if (cfg.crypto != "sodium" && cfg.crypto != "plaintext")
        return fail(err, Errc::invalid_argument, "unknown crypto '" + cfg.crypto + "'");

    if (cfg.sweep_interval_ms == 0 || cfg.session_stale_ms == 0)
        return fail(err, Errc::invalid_argument, "sweep interval and staleness must be positive");

    return true;
}

}  // namespace txrelay
