#include <chrono>

#include "ble/frame_transfer.hpp"
#include "util/log.hpp"

namespace ble
{

using txrelay::Errc;
using txrelay::Error;
using txrelay::fail;
using txrelay::format_session_id;

const char *session_status_name(SessionStatus s)
{
    switch (s)
    {
        case SessionStatus::pending:
            return "pending";
        case SessionStatus::sending:
            return "sending";
        case SessionStatus::receiving:
            return "receiving";
        case SessionStatus::complete:
            return "complete";
        case SessionStatus::failed:
            return "failed";
        case SessionStatus::cancelled:
            return "cancelled";
    }
    return "?";
}

static Progress make_progress(std::size_t completed, std::size_t total)
{
    Progress p;
    p.completed  = completed;
    p.total      = total;
    p.percentage = total ? (100.0 * static_cast<double>(completed)) / static_cast<double>(total)
                         : 0.0;
    p.complete   = total != 0 && completed == total;
    return p;
}

FrameTransferEngine::FrameTransferEngine(transport::IBleDriver      &driver,
                                         crypto::TransportCrypto    &tc,
                                         const txrelay::RelayConfig &cfg,
                                         const util::Clock          &clock)
    : driver_(driver), tc_(tc), cfg_(cfg), clock_(clock)
{
}

FrameTransferEngine::~FrameTransferEngine()
{
    stop_sweeper();
    std::lock_guard<std::mutex> lk(mu_);
    for (auto &kv : out_)
        abort_locked(*kv.second, Errc::cancelled, "engine shutting down");
    cv_.notify_all();
}

void FrameTransferEngine::set_payload_handler(OnPayload cb)
{
    std::lock_guard<std::mutex> lk(mu_);
    on_payload_ = std::move(cb);
}

void FrameTransferEngine::set_key_resolver(KeyResolver cb)
{
    std::lock_guard<std::mutex> lk(mu_);
    key_resolver_ = std::move(cb);
}

// ======================================================================
// Sender
// ======================================================================

std::optional<SendOutcome> FrameTransferEngine::send(const SendRequest &req, Error &err)
{
    const std::uint64_t sid = req.session_id;
    err.session_id          = sid;

    if (req.device.empty())
    {
        fail(err, Errc::invalid_argument, "no target device");
        return std::nullopt;
    }
    if (cfg_.frame_chunk_size > txrelay::max_frame_chunk(cfg_.mtu))
    {
        fail(err, Errc::invalid_argument,
             "frame size " + std::to_string(cfg_.frame_chunk_size) + " does not fit mtu " +
                 std::to_string(cfg_.mtu));
        return std::nullopt;
    }

    std::vector<frag::Chunk>  chunks;
    const crypto::SharedKey *key = req.key ? &*req.key : nullptr;
    if (!frag::build_chunks(sid, req.payload, key, key != nullptr, cfg_.frame_chunk_size, &tc_,
                            chunks, err))
        return std::nullopt;

    std::vector<transport::Frame> frames;
    frames.reserve(chunks.size());
    for (const auto &c : chunks)
    {
        frames.push_back(frag::serialize(c));
        if (frames.back().empty())
        {
            err.index = c.hdr.index;
            fail(err, Errc::malformed_frame, "chunk does not serialize");
            return std::nullopt;
        }
    }

    auto s     = std::make_shared<OutSession>();
    s->sid     = sid;
    s->peer    = req.device;
    s->total   = frames.size();
    s->created = s->last_activity = clock_.now();
    s->status  = SessionStatus::sending;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (out_.count(sid))
        {
            fail(err, Errc::invalid_argument, "session id already in use");
            return std::nullopt;
        }
        out_[sid] = s;
    }

    LOG_INFO("[XFER] sid=%s -> %s: %zu bytes in %zu frame(s)%s", format_session_id(sid).c_str(),
             req.device.c_str(), req.payload.size(), frames.size(),
             key ? " (encrypted)" : "");

    auto give_up = [&]() -> std::optional<SendOutcome> {
        {
            std::lock_guard<std::mutex> lk(mu_);
            s->status = (err.code == Errc::cancelled) ? SessionStatus::cancelled
                                                      : SessionStatus::failed;
        }
        erase_out(sid);
        err.session_id = sid;
        LOG_ERROR("[XFER] %s", err.message().c_str());
        return std::nullopt;
    };

    SendOutcome out;
    out.session_id = sid;
    out.frames     = frames.size();

    if (req.ephemeral_public)
    {
        ctrl::KeyOffer offer;
        offer.session_id       = sid;
        offer.ephemeral_public = *req.ephemeral_public;
        if (!deliver_with_ack(s, frag::KEY_INDEX, ctrl::encode_key_offer(offer),
                              out.retransmissions, err))
            return give_up();
    }

    for (std::size_t i = 0; i < frames.size(); i++)
    {
        if (!deliver_with_ack(s, static_cast<std::uint16_t>(i), frames[i], out.retransmissions,
                              err))
            return give_up();
    }

    // every frame acknowledged; the receiver now reassembles and commits
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, std::chrono::milliseconds(cfg_.commit_timeout_ms),
                 [&] { return s->commit_arrived || s->abort != Errc::ok; });

    if (s->abort != Errc::ok)
    {
        fail(err, s->abort, s->abort_detail);
        lk.unlock();
        return give_up();
    }

    if (s->commit_arrived)
    {
        const ctrl::Commit c = s->commit;
        lk.unlock();
        if (c.status != ctrl::COMMIT_OK)
        {
            fail(err, Errc::rejected_by_peer,
                 c.reason.empty() ? "receiver failed to reassemble" : c.reason);
            return give_up();
        }
        if (c.has_digest)
        {
            const crypto::Digest mine = crypto::digest16(req.payload.data(), req.payload.size());
            if (mine != c.digest)
            {
                fail(err, Errc::inconsistent, "receiver digest does not match payload");
                return give_up();
            }
            out.peer_confirmed = true;
            out.confirmation   = c.digest;
        }
    }
    else
    {
        lk.unlock();
        LOG_WARN("[XFER] sid=%s: no COMMIT within %u ms, delivered without confirmation",
                 format_session_id(sid).c_str(), cfg_.commit_timeout_ms);
    }

    {
        std::lock_guard<std::mutex> g(mu_);
        s->status = SessionStatus::complete;
    }
    erase_out(sid);
    LOG_INFO("[XFER] sid=%s delivered (%zu frame(s), %zu retransmission(s), confirmed=%d)",
             format_session_id(sid).c_str(), out.frames, out.retransmissions,
             out.peer_confirmed ? 1 : 0);
    return out;
}

bool FrameTransferEngine::deliver_with_ack(const std::shared_ptr<OutSession> &s,
                                           std::uint16_t                      index,
                                           const transport::Frame            &frame,
                                           std::size_t                       &retransmissions,
                                           Error                             &err)
{
    const int  max_attempts = 1 + static_cast<int>(cfg_.frame_retries);
    const bool is_key       = (index == frag::KEY_INDEX);
    err.index               = is_key ? -1 : index;

    for (int attempt = 1; attempt <= max_attempts; ++attempt)
    {
        err.attempts = attempt;
        {
            // arm before writing: the ACK may land inside write()
            std::lock_guard<std::mutex> lk(mu_);
            if (s->abort != Errc::ok)
                return fail(err, s->abort, s->abort_detail);
            s->waiting_index = index;
            s->ack_arrived   = false;
            s->last_activity = clock_.now();
        }

        if (attempt > 1)
            ++retransmissions;

        if (!driver_.write(s->peer, frame))
        {
            LOG_WARN("[XFER] sid=%s index=%d: write failed (attempt %d/%d)",
                     format_session_id(s->sid).c_str(), err.index, attempt, max_attempts);
        }
        else
        {
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait_for(lk, std::chrono::milliseconds(cfg_.ack_timeout_ms),
                         [&] { return s->ack_arrived || s->abort != Errc::ok; });
            if (s->abort != Errc::ok)
                return fail(err, s->abort, s->abort_detail);

            if (s->ack_arrived)
            {
                s->waiting_index = -1;
                switch (s->ack_status)
                {
                    case frag::AckStatus::ok:
                        if (!is_key)
                            s->acked++;
                        return true;
                    case frag::AckStatus::reject:
                        return fail(err, Errc::rejected_by_peer,
                                    is_key ? "key offer refused" : "frame rejected");
                    case frag::AckStatus::retry:
                        LOG_DEBUG("[XFER] sid=%s index=%d: receiver asked for a resend",
                                  format_session_id(s->sid).c_str(), err.index);
                        break;
                }
            }
            else
            {
                LOG_DEBUG("[XFER] sid=%s index=%d: ACK timeout (attempt %d/%d)",
                          format_session_id(s->sid).c_str(), err.index, attempt, max_attempts);
            }
        }

        if (attempt < max_attempts && cfg_.frame_retry_delay_ms)
        {
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait_for(lk, std::chrono::milliseconds(cfg_.frame_retry_delay_ms),
                         [&] { return s->abort != Errc::ok; });
        }
    }

    err.attempts = max_attempts;
    return fail(err, Errc::frame_delivery_failed,
                is_key ? "key offer not acknowledged" : "no ACK after retries");
}

void FrameTransferEngine::abort_locked(OutSession &s, Errc code, const std::string &detail)
{
    if (s.abort != Errc::ok)
        return;
    s.abort        = code;
    s.abort_detail = detail;
}

void FrameTransferEngine::erase_out(std::uint64_t sid)
{
    std::lock_guard<std::mutex> lk(mu_);
    out_.erase(sid);
}

// ======================================================================
// Inbound dispatch
// ======================================================================

void FrameTransferEngine::on_value(const transport::DeviceId &from, const transport::Frame &frame)
{
    switch (frag::frame_kind(frame))
    {
        case frag::KIND_DATA:
            handle_data(from, frame);
            return;
        case frag::KIND_ACK:
            if (auto ack = frag::decode_ack(frame))
                handle_ack(*ack);
            else
                LOG_WARN("[XFER] malformed ACK from %s (%zu bytes)", from.c_str(), frame.size());
            return;
        case ctrl::MSG_KEY_OFFER:
            if (auto k = ctrl::parse_key_offer(frame))
                handle_key_offer(from, *k);
            else
                LOG_WARN("[XFER] malformed KEY_OFFER from %s", from.c_str());
            return;
        case ctrl::MSG_COMMIT:
            if (auto c = ctrl::parse_commit(frame))
                handle_commit(*c);
            else
                LOG_WARN("[XFER] malformed COMMIT from %s", from.c_str());
            return;
        default:
            LOG_WARN("[XFER] unknown frame kind 0x%02x from %s (%zu bytes)",
                     frag::frame_kind(frame), from.c_str(), frame.size());
            return;
    }
}

void FrameTransferEngine::handle_ack(const frag::Ack &ack)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = out_.find(ack.session_id);
    if (it == out_.end())
    {
        LOG_DEBUG("[XFER] ACK for unknown sid=%s", format_session_id(ack.session_id).c_str());
        return;
    }
    OutSession &s = *it->second;
    if (s.waiting_index != static_cast<int>(ack.index) || s.ack_arrived)
    {
        LOG_DEBUG("[XFER] stale ACK sid=%s index=%u", format_session_id(ack.session_id).c_str(),
                  ack.index);
        return;
    }
    s.ack_arrived    = true;
    s.ack_status     = ack.status;
    s.last_activity  = clock_.now();
    cv_.notify_all();
}

void FrameTransferEngine::handle_commit(const ctrl::Commit &c)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = out_.find(c.session_id);
    if (it == out_.end())
    {
        LOG_DEBUG("[XFER] COMMIT for unknown sid=%s", format_session_id(c.session_id).c_str());
        return;
    }
    it->second->commit_arrived = true;
    it->second->commit         = c;
    it->second->last_activity  = clock_.now();
    cv_.notify_all();
}

void FrameTransferEngine::handle_key_offer(const transport::DeviceId &from,
                                           const ctrl::KeyOffer      &k)
{
    KeyResolver resolver;
    {
        std::lock_guard<std::mutex> lk(mu_);
        resolver = key_resolver_;
    }

    std::optional<crypto::SharedKey> key;
    if (resolver)
        key = resolver(from, k.ephemeral_public);

    if (!key)
    {
        LOG_WARN("[KEX] sid=%s: refusing key offer from %s", format_session_id(k.session_id).c_str(),
                 from.c_str());
        send_ack(from, k.session_id, frag::KEY_INDEX, frag::AckStatus::reject);
        return;
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        InSession &s = in_[k.session_id];
        if (s.sid == 0 && s.peer.empty())
        {
            s.sid     = k.session_id;
            s.peer    = from;
            s.created = clock_.now();
        }
        s.key           = *key;
        s.last_activity = clock_.now();
    }
    LOG_INFO("[KEX] sid=%s: session key established with %s",
             format_session_id(k.session_id).c_str(), from.c_str());
    send_ack(from, k.session_id, frag::KEY_INDEX, frag::AckStatus::ok);
}

void FrameTransferEngine::handle_data(const transport::DeviceId &from, const transport::Frame &frame)
{
    auto chunk = frag::parse(frame);
    if (!chunk)
    {
        // no trustworthy header to ACK against; the sender times out and resends
        LOG_WARN("[XFER] dropping malformed frame from %s (%zu bytes)", from.c_str(),
                 frame.size());
        return;
    }
    const std::uint64_t sid   = chunk->hdr.session_id;
    const std::uint16_t index = chunk->hdr.index;

    frag::AckStatus                          reply = frag::AckStatus::ok;
    bool                                     done  = false;
    std::optional<std::vector<std::uint8_t>> payload;
    Error                                    perr;
    OnPayload                                cb;

    std::unique_lock<std::mutex> lk(mu_);
    const util::TimePoint        now = clock_.now();

    if (completed_.count(sid))
    {
        // late retransmission of a finished session: ACK, never resurrect
        lk.unlock();
        LOG_DEBUG("[XFER] sid=%s index=%u: session already complete, re-ACK",
                  format_session_id(sid).c_str(), index);
        send_ack(from, sid, index, frag::AckStatus::ok);
        return;
    }

    if (frag::checksum32(chunk->payload) != chunk->hdr.checksum)
    {
        auto it = in_.find(sid);
        if (it != in_.end())
            it->second.last_activity = now;
        lk.unlock();
        LOG_WARN("[XFER] sid=%s index=%u: checksum mismatch, asking for resend",
                 format_session_id(sid).c_str(), index);
        send_ack(from, sid, index, frag::AckStatus::retry);
        return;
    }

    InSession &s = in_[sid];
    if (s.peer.empty())
    {
        s.sid     = sid;
        s.peer    = from;
        s.created = now;
        LOG_INFO("[XFER] sid=%s <- %s: receiving %u frame(s)", format_session_id(sid).c_str(),
                 from.c_str(), chunk->hdr.total);
    }
    s.last_activity = now;

    if (s.peer != from)
    {
        reply = frag::AckStatus::reject;
        LOG_WARN("[XFER] sid=%s: frame from %s but session belongs to %s",
                 format_session_id(sid).c_str(), from.c_str(), s.peer.c_str());
    }
    else if (((chunk->hdr.flags & frag::FLAG_ENCRYPTED) != 0) != cfg_.encrypt ||
             (cfg_.encrypt && !s.key))
    {
        // local policy decides the mode, never the header
        reply = frag::AckStatus::reject;
        reasm_.clear(sid);
        in_.erase(sid);
        LOG_WARN("[XFER] sid=%s: %s frame refused (encrypt=%d, key offer %s)",
                 format_session_id(sid).c_str(),
                 (chunk->hdr.flags & frag::FLAG_ENCRYPTED) ? "encrypted" : "plaintext",
                 cfg_.encrypt ? 1 : 0, s.key ? "seen" : "missing");
    }
    else
    {
        switch (reasm_.feed(*chunk))
        {
            case frag::Reassembler::Result::stored:
            case frag::Reassembler::Result::duplicate:
                break;
            case frag::Reassembler::Result::conflict:
                reply = frag::AckStatus::reject;
                reasm_.clear(sid);
                in_.erase(sid);
                LOG_WARN("[XFER] sid=%s index=%u: inconsistent frame, dropping session",
                         format_session_id(sid).c_str(), index);
                break;
            case frag::Reassembler::Result::complete:
            {
                const std::optional<crypto::SharedKey> key = s.key;
                const std::vector<frag::Chunk>         chunks = reasm_.take(sid);
                in_.erase(sid);
                completed_[sid] = now;
                done            = true;
                cb              = on_payload_;
                lk.unlock();
                // decryption runs outside the lock
                payload = frag::parse_chunks(chunks, key ? &*key : nullptr, cfg_.encrypt,
                                             &tc_, perr);
                lk.lock();
                break;
            }
        }
    }
    lk.unlock();

    send_ack(from, sid, index, reply);
    if (!done)
        return;

    ctrl::Commit commit;
    commit.session_id = sid;
    if (payload)
    {
        LOG_INFO("[XFER] sid=%s: reassembled %zu bytes from %s", format_session_id(sid).c_str(),
                 payload->size(), from.c_str());
        if (cb)
            cb(from, sid, *payload);
        commit.status     = ctrl::COMMIT_OK;
        commit.has_digest = true;
        commit.digest     = crypto::digest16(payload->data(), payload->size());
    }
    else
    {
        LOG_ERROR("[XFER] reassembly failed: %s", perr.message().c_str());
        commit.status = ctrl::COMMIT_FAILED;
        commit.reason = perr.message();
    }
    if (!driver_.write(from, ctrl::encode_commit(commit)))
        LOG_WARN("[XFER] sid=%s: COMMIT write to %s failed", format_session_id(sid).c_str(),
                 from.c_str());
}

void FrameTransferEngine::send_ack(const transport::DeviceId &to, std::uint64_t sid,
                                   std::uint16_t index, frag::AckStatus st)
{
    frag::Ack a;
    a.session_id = sid;
    a.index      = index;
    a.status     = st;
    if (!driver_.write(to, frag::encode_ack(a)))
        LOG_WARN("[XFER] sid=%s index=%u: ACK write to %s failed", format_session_id(sid).c_str(),
                 index, to.c_str());
}

void FrameTransferEngine::on_link_down(const transport::DeviceId &id)
{
    std::lock_guard<std::mutex> lk(mu_);
    for (auto &kv : out_)
        if (kv.second->peer == id)
            abort_locked(*kv.second, Errc::not_connected, "link to " + id + " lost");
    cv_.notify_all();
}

// ======================================================================
// Session control
// ======================================================================

bool FrameTransferEngine::cancel(std::uint64_t session_id)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = out_.find(session_id);
    if (it != out_.end())
    {
        abort_locked(*it->second, Errc::cancelled, "cancelled by caller");
        it->second->status = SessionStatus::cancelled;
        cv_.notify_all();
        LOG_INFO("[XFER] sid=%s cancelled", format_session_id(session_id).c_str());
        return true;
    }
    if (in_.erase(session_id) || reasm_.contains(session_id))
    {
        reasm_.clear(session_id);
        LOG_INFO("[XFER] inbound sid=%s cancelled", format_session_id(session_id).c_str());
        return true;
    }
    return false;
}

std::optional<Progress> FrameTransferEngine::progress(std::uint64_t session_id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    if (auto it = out_.find(session_id); it != out_.end())
        return make_progress(it->second->acked, it->second->total);
    if (in_.count(session_id))
        return make_progress(reasm_.received(session_id), reasm_.total(session_id));
    return std::nullopt;
}

std::vector<SessionInfo> FrameTransferEngine::active_sessions() const
{
    std::lock_guard<std::mutex> lk(mu_);
    const util::TimePoint       now = clock_.now();
    std::vector<SessionInfo>    out;
    for (const auto &kv : out_)
    {
        const OutSession &s = *kv.second;
        SessionInfo       info;
        info.session_id = s.sid;
        info.peer       = s.peer;
        info.direction  = Direction::outbound;
        info.status     = s.status;
        info.age_ms     = util::ms_between(s.created, now);
        info.idle_ms    = util::ms_between(s.last_activity, now);
        info.progress   = make_progress(s.acked, s.total);
        out.push_back(std::move(info));
    }
    for (const auto &kv : in_)
    {
        const InSession &s = kv.second;
        SessionInfo      info;
        info.session_id = s.sid;
        info.peer       = s.peer;
        info.direction  = Direction::inbound;
        info.status     = SessionStatus::receiving;
        info.age_ms     = util::ms_between(s.created, now);
        info.idle_ms    = util::ms_between(s.last_activity, now);
        info.progress   = make_progress(reasm_.received(s.sid), reasm_.total(s.sid));
        out.push_back(std::move(info));
    }
    return out;
}

std::size_t FrameTransferEngine::sweep_stale()
{
    std::size_t swept = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        const util::TimePoint       now   = clock_.now();
        const std::uint64_t         stale = cfg_.session_stale_ms;

        for (auto it = out_.begin(); it != out_.end();)
        {
            OutSession &s = *it->second;
            if (util::ms_between(s.last_activity, now) > stale)
            {
                abort_locked(s, Errc::session_expired,
                             "idle for " + std::to_string(util::ms_between(s.last_activity, now)) +
                                 " ms");
                s.status = SessionStatus::failed;
                LOG_WARN("[XFER] sweeping stale outbound sid=%s", format_session_id(s.sid).c_str());
                it = out_.erase(it);
                ++swept;
            }
            else
            {
                ++it;
            }
        }

        for (auto it = in_.begin(); it != in_.end();)
        {
            if (util::ms_between(it->second.last_activity, now) > stale)
            {
                LOG_WARN("[XFER] sweeping stale inbound sid=%s (%zu/%u frames)",
                         format_session_id(it->first).c_str(), reasm_.received(it->first),
                         reasm_.total(it->first));
                reasm_.clear(it->first);
                it = in_.erase(it);
                ++swept;
            }
            else
            {
                ++it;
            }
        }

        for (auto it = completed_.begin(); it != completed_.end();)
        {
            if (util::ms_between(it->second, now) > stale)
                it = completed_.erase(it);
            else
                ++it;
        }
    }
    cv_.notify_all();
    if (swept)
        LOG_INFO("[XFER] swept %zu stale session(s)", swept);
    return swept;
}

void FrameTransferEngine::set_sweep_hook(OnSweep cb)
{
    std::lock_guard<std::mutex> lk(mu_);
    on_sweep_ = std::move(cb);
}

void FrameTransferEngine::start_sweeper()
{
    std::lock_guard<std::mutex> lk(sweep_mu_);
    if (sweeper_.joinable())
        return;
    sweep_stop_ = false;
    sweeper_    = std::thread(&FrameTransferEngine::sweeper_loop, this);
}

void FrameTransferEngine::stop_sweeper()
{
    {
        std::lock_guard<std::mutex> lk(sweep_mu_);
        sweep_stop_ = true;
    }
    sweep_cv_.notify_all();
    if (sweeper_.joinable())
        sweeper_.join();
}

void FrameTransferEngine::sweeper_loop()
{
    std::unique_lock<std::mutex> lk(sweep_mu_);
    while (!sweep_stop_)
    {
        if (sweep_cv_.wait_for(lk, std::chrono::milliseconds(cfg_.sweep_interval_ms),
                               [&] { return sweep_stop_; }))
            break;
        lk.unlock();
        sweep_stale();
        OnSweep hook;
        {
            std::lock_guard<std::mutex> g(mu_);
            hook = on_sweep_;
        }
        if (hook)
            hook();
        lk.lock();
    }
}

}  // namespace ble
