#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "app/identity.hpp"
#include "app/key_cache.hpp"
#include "ble/connection_manager.hpp"
#include "ble/device_discovery.hpp"
#include "ble/device_registry.hpp"
#include "ble/frame_transfer.hpp"
#include "crypto/transport_crypto.hpp"
#include "transport/ble_driver.hpp"
#include "util/clock.hpp"
#include "util/config.hpp"
#include "util/error.hpp"

/*
send_envelope(peer, envelope)
  -> connect_to_peer(peer)                  // if not connected yet
  -> key_cache.lookup(peer)
       miss -> identity.resolve(peer) -> generate_ephemeral_key_pair
            -> derive_shared_key -> key_cache.put(peer, K, eph.pub)
  -> engine.send({sid, payload, K, eph.pub})   // progress sampler alongside
  -> SendResult{success, sid, confirmation}

driver value -> engine.on_value
  KEY_OFFER -> answer_key_offer (local identity secret)
  complete  -> on_envelope_received(from, envelope)
*/

namespace app
{

struct EnvelopeMetadata
{
    std::string amount;
    std::string recipient;
    std::string memo;
};

// The payload is opaque; metadata is for display and logs only and never
// leaves this device.
struct TransactionEnvelope
{
    std::vector<std::uint8_t> payload;
    EnvelopeMetadata          metadata;
};

struct SendResult
{
    bool                       success{false};
    std::uint64_t              session_id{0};
    std::optional<std::string> peer_confirmation;  // hex digest echoed by the receiver
    txrelay::Error             error;
};

struct RelayStatus
{
    bool                             scanning{false};
    bool                             advertising{false};
    bool                             receiving{false};
    std::vector<transport::DeviceId> connected_devices;
    std::size_t                      active_sessions{0};
    std::size_t                      cached_keys{0};
};

using OnProgress = std::function<void(std::uint64_t session_id, const ble::Progress &)>;
using OnEnvelope =
    std::function<void(const transport::DeviceId &from, std::uint64_t session_id,
                       const TransactionEnvelope &)>;

class RelayService
{
  public:
    RelayService(transport::IBleDriver      &driver,
                 crypto::TransportCrypto    &tc,
                 IdentityResolver           &identity,
                 const txrelay::RelayConfig &cfg,
                 const util::Clock          &clock);
    ~RelayService();

    RelayService(const RelayService &)            = delete;
    RelayService &operator=(const RelayService &) = delete;

    // Wires driver events, loads the local identity key, starts the sweeper.
    bool start(txrelay::Error &err);
    void stop();

    bool scan_for_peers(ble::OnFound on_found, std::uint32_t timeout_ms, txrelay::Error &err);
    void stop_scan();

    bool enter_receiving_mode(txrelay::Error &err);
    void exit_receiving_mode();

    bool connect_to_peer(const transport::DeviceId &id, txrelay::Error &err);
    void disconnect_peer(const transport::DeviceId &id);

    SendResult send_envelope(const transport::DeviceId &peer,
                             const TransactionEnvelope &envelope,
                             OnProgress                 on_progress = nullptr);

    void on_envelope_received(OnEnvelope cb);
    bool cancel_transfer(std::uint64_t session_id);

    // Drops stale transfer sessions and expired cached keys. The sweeper
    // thread does this every sweep_interval_ms.
    void sweep();

    RelayStatus status() const;

    // Public half of the local identity, when one is loaded.
    std::optional<crypto::PublicKey> identity_public() const;

    ble::DeviceRegistry       &registry() { return registry_; }
    ble::DeviceDiscovery      &discovery() { return discovery_; }
    ble::ConnectionManager    &connections() { return connections_; }
    ble::FrameTransferEngine  &engine() { return engine_; }
    KeyExchangeCache          &key_cache() { return key_cache_; }

  private:
    bool resolve_shared_key(const transport::DeviceId &peer,
                            crypto::SharedKey         &key,
                            crypto::PublicKey         &ephemeral_public,
                            txrelay::Error            &err);
    std::optional<crypto::SharedKey> answer_key_offer(const transport::DeviceId &from,
                                                      const crypto::PublicKey   &ephemeral_public);
    void deliver_payload(const transport::DeviceId       &from,
                         std::uint64_t                    session_id,
                         const std::vector<std::uint8_t> &payload);
    void on_link_down(const transport::DeviceId &id);
    void purge_keys();

    static std::uint64_t new_session_id();

    const txrelay::RelayConfig cfg_;
    transport::IBleDriver     &driver_;
    crypto::TransportCrypto   &tc_;
    IdentityResolver          &identity_;
    const util::Clock         &clock_;

    ble::DeviceRegistry      registry_;
    ble::DeviceDiscovery     discovery_;
    ble::ConnectionManager   connections_;
    ble::FrameTransferEngine engine_;
    KeyExchangeCache         key_cache_;

    mutable std::mutex             mu_;
    std::optional<crypto::KeyPair> local_identity_;
    OnEnvelope                     on_envelope_;
    bool                           receiving_{false};
    std::atomic<bool>              started_{false};
};

}  // namespace app
