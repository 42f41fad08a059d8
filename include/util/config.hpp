#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "util/constants.hpp"
#include "util/error.hpp"

namespace txrelay
{

// Every tunable of the relay. Defaults match the field-tested values of the
// mobile relay; tests shrink the timeouts.
struct RelayConfig
{
    // discovery / connection
    std::uint32_t discovery_timeout_ms   = 30000;
    std::uint32_t connect_timeout_ms     = 15000;
    std::uint32_t connect_retries        = 3;  // attempts = 1 + retries
    std::uint32_t connect_retry_delay_ms = 1000;

    // frame transfer
    std::uint32_t ack_timeout_ms       = 3000;
    std::uint32_t frame_retries        = 3;  // per frame, attempts = 1 + retries
    std::uint32_t frame_retry_delay_ms = 500;
    std::uint32_t commit_timeout_ms    = 3000;
    std::uint32_t session_stale_ms     = 10 * 60 * 1000;
    std::uint32_t sweep_interval_ms    = 5 * 60 * 1000;
    std::uint32_t progress_interval_ms = 500;

    // sizes
    std::size_t mtu              = constants::MTU_CAP;
    std::size_t frame_chunk_size = 256;  // plaintext bytes per BLE frame
    std::size_t qr_chunk_size    = 256;  // plaintext bytes per QR page

    // keys
    std::uint32_t key_ttl_ms = 60 * 60 * 1000;
    std::string   crypto     = "sodium";  // "sodium" | "plaintext" (dev only)
    bool          encrypt    = true;
    std::string   identity_secret_hex;  // receiving side static X25519 secret
    std::string   peer_keys;            // "AA:BB:CC:DD:EE:FF=<hex>,..."

    // radio
    std::string adapter    = "hci0";
    std::string local_name = std::string(constants::DEFAULT_LOCAL_NAME);
};

// Largest plaintext chunk that still fits one ATT write at `mtu`.
std::size_t max_frame_chunk(std::size_t mtu);

// Overlays TXRELAY_* environment variables onto `cfg`. Invalid values are
// logged and skipped; returns false if any were skipped.
bool load_config_from_env(RelayConfig &cfg);

bool validate_config(const RelayConfig &cfg, Error &err);

}  // namespace txrelay
