#pragma once
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "crypto/transport_crypto.hpp"
#include "proto/ctrl.hpp"
#include "proto/frag.hpp"
#include "transport/ble_driver.hpp"
#include "util/clock.hpp"
#include "util/config.hpp"
#include "util/error.hpp"

/*
Sender (send(), caller's thread)            Receiver (on_value(), driver thread)
--------------------------------            ------------------------------------
[KEY_OFFER] ── write ──────────────────────▶ resolve key -> ACK(KEY_INDEX)
for i in 0..total-1:
  arm waiter(i)
  DATA[i] ── write ───────────────────────▶ checksum ok? reassembler.feed
  wait ACK(i) | timeout  ◀── ACK(i, OK|RETRY|REJECT)
  RETRY/timeout -> resend (1 + frame_retries attempts)
                                             all present -> parse_chunks
                                             -> on_payload (once) -> COMMIT
wait COMMIT | commit_timeout ◀──────────────

The driver is never called with mu_ held: loopback delivery is synchronous, so
an ACK can arrive before write() returns.
*/

namespace ble
{

enum class Direction
{
    outbound,
    inbound,
};

enum class SessionStatus
{
    pending,
    sending,
    receiving,
    complete,
    failed,
    cancelled,
};

const char *session_status_name(SessionStatus s);

struct Progress
{
    std::size_t completed{0};
    std::size_t total{0};
    double      percentage{0.0};
    bool        complete{false};
};

struct SessionInfo
{
    std::uint64_t       session_id{0};
    transport::DeviceId peer;
    Direction           direction{Direction::outbound};
    SessionStatus       status{SessionStatus::pending};
    std::uint64_t       age_ms{0};
    std::uint64_t       idle_ms{0};
    Progress            progress;
};

struct SendRequest
{
    transport::DeviceId              device;
    std::uint64_t                    session_id{0};
    std::vector<std::uint8_t>        payload;
    std::optional<crypto::SharedKey> key;               // set => frames are encrypted
    std::optional<crypto::PublicKey> ephemeral_public;  // set => KEY_OFFER goes first
};

struct SendOutcome
{
    std::uint64_t                 session_id{0};
    std::size_t                   frames{0};
    std::size_t                   retransmissions{0};
    bool                          peer_confirmed{false};
    std::optional<crypto::Digest> confirmation;  // digest echoed in COMMIT
};

using OnPayload =
    std::function<void(const transport::DeviceId &from, std::uint64_t session_id,
                       const std::vector<std::uint8_t> &payload)>;

// Receiver side: shared key for a KEY_OFFER from `from`, or nullopt to refuse.
using KeyResolver = std::function<std::optional<crypto::SharedKey>(
    const transport::DeviceId &from, const crypto::PublicKey &ephemeral_public)>;

// Runs on the sweeper thread after each periodic sweep.
using OnSweep = std::function<void()>;

class FrameTransferEngine
{
  public:
    FrameTransferEngine(transport::IBleDriver      &driver,
                        crypto::TransportCrypto    &tc,
                        const txrelay::RelayConfig &cfg,
                        const util::Clock          &clock);
    ~FrameTransferEngine();

    FrameTransferEngine(const FrameTransferEngine &)            = delete;
    FrameTransferEngine &operator=(const FrameTransferEngine &) = delete;

    // --- sender ---
    std::optional<SendOutcome> send(const SendRequest &req, txrelay::Error &err);

    // --- receiver ---
    void set_payload_handler(OnPayload cb);
    void set_key_resolver(KeyResolver cb);

    // Every inbound frame (DATA, ACK, KEY_OFFER, COMMIT) enters here.
    void on_value(const transport::DeviceId &from, const transport::Frame &frame);
    void on_link_down(const transport::DeviceId &id);

    // --- session control ---
    bool                     cancel(std::uint64_t session_id);
    std::optional<Progress>  progress(std::uint64_t session_id) const;
    std::vector<SessionInfo> active_sessions() const;

    // Drops sessions idle longer than session_stale_ms; returns how many.
    std::size_t sweep_stale();
    void        set_sweep_hook(OnSweep cb);
    void        start_sweeper();
    void        stop_sweeper();

  private:
    struct OutSession
    {
        std::uint64_t       sid{0};
        transport::DeviceId peer;
        SessionStatus       status{SessionStatus::pending};
        util::TimePoint     created{};
        util::TimePoint     last_activity{};
        std::size_t         total{0};
        std::size_t         acked{0};

        // single in-flight waiter (frames go strictly in order)
        int             waiting_index{-1};
        bool            ack_arrived{false};
        frag::AckStatus ack_status{frag::AckStatus::ok};

        bool         commit_arrived{false};
        ctrl::Commit commit;

        txrelay::Errc abort{txrelay::Errc::ok};
        std::string   abort_detail;
    };

    struct InSession
    {
        std::uint64_t                    sid{0};
        transport::DeviceId              peer;
        util::TimePoint                  created{};
        util::TimePoint                  last_activity{};
        std::optional<crypto::SharedKey> key;
    };

    bool deliver_with_ack(const std::shared_ptr<OutSession> &s,
                          std::uint16_t                      index,
                          const transport::Frame            &frame,
                          std::size_t                       &retransmissions,
                          txrelay::Error                    &err);
    void abort_locked(OutSession &s, txrelay::Errc code, const std::string &detail);
    void erase_out(std::uint64_t sid);

    void handle_ack(const frag::Ack &ack);
    void handle_commit(const ctrl::Commit &c);
    void handle_key_offer(const transport::DeviceId &from, const ctrl::KeyOffer &k);
    void handle_data(const transport::DeviceId &from, const transport::Frame &frame);
    void send_ack(const transport::DeviceId &to, std::uint64_t sid, std::uint16_t index,
                  frag::AckStatus st);

    void sweeper_loop();

    transport::IBleDriver      &driver_;
    crypto::TransportCrypto    &tc_;
    const txrelay::RelayConfig &cfg_;
    const util::Clock          &clock_;

    mutable std::mutex                                      mu_;
    std::condition_variable                                 cv_;
    std::map<std::uint64_t, std::shared_ptr<OutSession>>    out_;
    std::map<std::uint64_t, InSession>                      in_;
    std::map<std::uint64_t, util::TimePoint>                completed_;  // inbound, by finish time
    frag::Reassembler                                       reasm_;
    OnPayload                                               on_payload_;
    KeyResolver                                             key_resolver_;
    OnSweep                                                 on_sweep_;

    std::mutex              sweep_mu_;
    std::condition_variable sweep_cv_;
    bool                    sweep_stop_{false};
    std::thread             sweeper_;
};

}  // namespace ble
