#include <chrono>
#include <condition_variable>
#include <sodium.h>
#include <thread>

#include "app/relay_service.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace app
{

using txrelay::Errc;
using txrelay::Error;
using txrelay::fail;
using txrelay::format_session_id;

RelayService::RelayService(transport::IBleDriver      &driver,
                           crypto::TransportCrypto    &tc,
                           IdentityResolver           &identity,
                           const txrelay::RelayConfig &cfg,
                           const util::Clock          &clock)
    : cfg_(cfg),
      driver_(driver),
      tc_(tc),
      identity_(identity),
      clock_(clock),
      registry_(clock_),
      discovery_(driver_, registry_),
      connections_(driver_, registry_, cfg_),
      engine_(driver_, tc_, cfg_, clock_),
      key_cache_(clock_, std::chrono::milliseconds(cfg_.key_ttl_ms))
{
}

RelayService::~RelayService()
{
    stop();
}

bool RelayService::start(Error &err)
{
    if (started_)
        return true;

    if (!cfg_.identity_secret_hex.empty())
    {
        std::vector<std::uint8_t> secret;
        if (!crypto::from_hex(cfg_.identity_secret_hex, secret))
            return fail(err, Errc::invalid_argument, "identity key is not hex");
        crypto::KeyPair kp;
        const bool      ok = tc_.key_pair_from_secret(secret, kp, err);
        crypto::wipe(secret.data(), secret.size());
        if (!ok)
            return false;
        std::lock_guard<std::mutex> lk(mu_);
        local_identity_ = kp;
    }

    driver_.set_value_handler([this](const transport::DeviceId &from, const transport::Frame &f) {
        engine_.on_value(from, f);
    });
    driver_.set_link_handler([this](const transport::DeviceId &id) { on_link_down(id); });
    engine_.set_payload_handler([this](const transport::DeviceId &from, std::uint64_t sid,
                                       const std::vector<std::uint8_t> &payload) {
        deliver_payload(from, sid, payload);
    });
    engine_.set_key_resolver(
        [this](const transport::DeviceId &from, const crypto::PublicKey &eph) {
            return answer_key_offer(from, eph);
        });
    engine_.set_sweep_hook([this]() { purge_keys(); });
    engine_.start_sweeper();

    started_ = true;
    LOG_SYSTEM("[RELAY] started on %s driver (crypto=%s, encrypt=%d)", driver_.name().c_str(),
               tc_.name(), cfg_.encrypt ? 1 : 0);
    return true;
}

void RelayService::stop()
{
    if (!started_.exchange(false))
        return;

    stop_scan();
    exit_receiving_mode();
    for (const auto &id : connections_.connected_devices())
        connections_.disconnect_device(id);
    engine_.stop_sweeper();
    engine_.set_sweep_hook(nullptr);

    driver_.set_value_handler(nullptr);
    driver_.set_link_handler(nullptr);
    LOG_SYSTEM("[RELAY] stopped");
}

bool RelayService::scan_for_peers(ble::OnFound on_found, std::uint32_t timeout_ms, Error &err)
{
    return discovery_.start_scanning(std::move(on_found),
                                     timeout_ms ? timeout_ms : cfg_.discovery_timeout_ms, err);
}

void RelayService::stop_scan()
{
    discovery_.stop_scanning();
}

bool RelayService::enter_receiving_mode(Error &err)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (receiving_)
            return true;
        if (cfg_.encrypt && !local_identity_)
            LOG_WARN("[RELAY] no identity key loaded; encrypted transfers will be refused");
    }
    if (!discovery_.start_advertising(cfg_.local_name, err))
        return false;
    std::lock_guard<std::mutex> lk(mu_);
    receiving_ = true;
    LOG_SYSTEM("[RELAY] receiving mode on as '%s'", cfg_.local_name.c_str());
    return true;
}

void RelayService::exit_receiving_mode()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!receiving_)
            return;
        receiving_ = false;
    }
    discovery_.stop_advertising();
    LOG_SYSTEM("[RELAY] receiving mode off");
}

bool RelayService::connect_to_peer(const transport::DeviceId &id, Error &err)
{
    return connections_.connect_to_device(id, cfg_.connect_timeout_ms, err);
}

void RelayService::disconnect_peer(const transport::DeviceId &id)
{
    connections_.disconnect_device(id);
}

std::uint64_t RelayService::new_session_id()
{
    std::uint64_t sid = 0;
    while (sid == 0)
        randombytes_buf(&sid, sizeof sid);
    return sid;
}

bool RelayService::resolve_shared_key(const transport::DeviceId &peer,
                                      crypto::SharedKey         &key,
                                      crypto::PublicKey         &ephemeral_public,
                                      Error                     &err)
{
    if (auto rec = key_cache_.lookup(peer))
    {
        key              = rec->shared_key;
        ephemeral_public = rec->ephemeral_public;
        LOG_DEBUG("[KEX] cache hit for %s", peer.c_str());
        return true;
    }

    const auto peer_public = identity_.resolve(peer);
    if (!peer_public)
        return fail(err, Errc::peer_key_unknown, "no public key known for " + peer);

    crypto::KeyPair eph;
    if (!tc_.generate_ephemeral_key_pair(eph, err))
        return false;
    if (!tc_.derive_shared_key(eph, *peer_public, key, err))
    {
        LOG_ERROR("[KEX] derivation for %s failed: %s", peer.c_str(), err.message().c_str());
        return false;
    }
    ephemeral_public = eph.public_raw;
    key_cache_.put(peer, key, ephemeral_public);
    LOG_INFO("[KEX] new shared key for %s (valid %u ms)", peer.c_str(), cfg_.key_ttl_ms);
    return true;
}

std::optional<crypto::SharedKey> RelayService::answer_key_offer(
    const transport::DeviceId &from, const crypto::PublicKey &ephemeral_public)
{
    std::optional<crypto::KeyPair> mine;
    {
        std::lock_guard<std::mutex> lk(mu_);
        mine = local_identity_;
    }
    if (!mine)
    {
        LOG_WARN("[KEX] key offer from %s but no identity key is loaded", from.c_str());
        return std::nullopt;
    }

    crypto::SharedKey key{};
    Error             err;
    const std::vector<std::uint8_t> eph(ephemeral_public.begin(), ephemeral_public.end());
    if (!tc_.derive_shared_key(*mine, eph, key, err))
    {
        LOG_WARN("[KEX] key offer from %s rejected: %s", from.c_str(), err.message().c_str());
        return std::nullopt;
    }
    return key;
}

void RelayService::deliver_payload(const transport::DeviceId       &from,
                                   std::uint64_t                    session_id,
                                   const std::vector<std::uint8_t> &payload)
{
    OnEnvelope cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        cb = on_envelope_;
    }
    LOG_SYSTEM("[RELAY] envelope sid=%s from %s (%zu bytes)", format_session_id(session_id).c_str(),
               from.c_str(), payload.size());
    if (!cb)
    {
        LOG_WARN("[RELAY] no envelope handler registered, dropping sid=%s",
                 format_session_id(session_id).c_str());
        return;
    }
    TransactionEnvelope env;
    env.payload = payload;
    cb(from, session_id, env);
}

void RelayService::on_link_down(const transport::DeviceId &id)
{
    connections_.on_link_down(id);
    engine_.on_link_down(id);
}

SendResult RelayService::send_envelope(const transport::DeviceId &peer,
                                       const TransactionEnvelope &envelope,
                                       OnProgress                 on_progress)
{
    SendResult r;
    r.session_id       = new_session_id();
    r.error.session_id = r.session_id;

    LOG_INFO("[RELAY] sending sid=%s to %s: %zu bytes (amount='%s' recipient='%s' memo='%s')",
             format_session_id(r.session_id).c_str(), peer.c_str(), envelope.payload.size(),
             envelope.metadata.amount.c_str(), envelope.metadata.recipient.c_str(),
             envelope.metadata.memo.c_str());

    if (!connections_.is_connected(peer) && !connect_to_peer(peer, r.error))
        return r;

    ble::SendRequest req;
    req.device     = peer;
    req.session_id = r.session_id;
    req.payload    = envelope.payload;
    if (cfg_.encrypt)
    {
        crypto::SharedKey key{};
        crypto::PublicKey eph{};
        if (!resolve_shared_key(peer, key, eph, r.error))
        {
            r.error.session_id = r.session_id;
            return r;
        }
        req.key              = key;
        req.ephemeral_public = eph;
        crypto::wipe(key.data(), key.size());
    }

    // progress sampler: runs only while engine_.send() is active
    std::mutex              pmu;
    std::condition_variable pcv;
    bool                    done = false;
    std::optional<ble::Progress> last;
    std::thread             sampler;
    if (on_progress)
    {
        sampler = std::thread([&] {
            std::unique_lock<std::mutex> lk(pmu);
            while (!done)
            {
                if (pcv.wait_for(lk, std::chrono::milliseconds(cfg_.progress_interval_ms),
                                 [&] { return done; }))
                    break;
                lk.unlock();
                auto p = engine_.progress(r.session_id);
                if (p)
                    on_progress(r.session_id, *p);
                lk.lock();
                if (p)
                    last = p;
            }
        });
    }

    const auto outcome = engine_.send(req, r.error);

    {
        std::lock_guard<std::mutex> lk(pmu);
        done = true;
    }
    pcv.notify_all();
    if (sampler.joinable())
        sampler.join();

    if (req.key)
        crypto::wipe(req.key->data(), req.key->size());

    if (!outcome)
    {
        if (r.error.code == Errc::rejected_by_peer && req.ephemeral_public)
        {
            // the peer may have lost its state for our cached key
            key_cache_.forget(peer);
        }
        if (on_progress && last)
            on_progress(r.session_id, *last);
        r.error.session_id = r.session_id;
        return r;
    }

    if (on_progress)
    {
        ble::Progress p;
        p.completed  = outcome->frames;
        p.total      = outcome->frames;
        p.percentage = 100.0;
        p.complete   = true;
        on_progress(r.session_id, p);
    }

    r.success = true;
    r.error.clear();
    if (outcome->confirmation)
        r.peer_confirmation =
            crypto::to_hex(outcome->confirmation->data(), outcome->confirmation->size());
    return r;
}

void RelayService::purge_keys()
{
    if (const std::size_t n = key_cache_.purge_expired())
        LOG_INFO("[KEX] purged %zu expired key(s)", n);
}

void RelayService::sweep()
{
    engine_.sweep_stale();
    purge_keys();
}

void RelayService::on_envelope_received(OnEnvelope cb)
{
    std::lock_guard<std::mutex> lk(mu_);
    on_envelope_ = std::move(cb);
}

bool RelayService::cancel_transfer(std::uint64_t session_id)
{
    return engine_.cancel(session_id);
}

RelayStatus RelayService::status() const
{
    RelayStatus st;
    st.scanning          = discovery_.is_scanning();
    st.advertising       = discovery_.is_advertising();
    st.connected_devices = connections_.connected_devices();
    st.active_sessions   = engine_.active_sessions().size();
    st.cached_keys       = key_cache_.size();
    std::lock_guard<std::mutex> lk(mu_);
    st.receiving = receiving_;
    return st;
}

std::optional<crypto::PublicKey> RelayService::identity_public() const
{
    std::lock_guard<std::mutex> lk(mu_);
    if (!local_identity_)
        return std::nullopt;
    return local_identity_->public_raw;
}

}  // namespace app
