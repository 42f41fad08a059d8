#include <algorithm>
#include <arpa/inet.h>  // htonl, htons, ntohl, ntohs
#include <cstdint>
#include <cstring>
#include <endian.h>  // htobe64, be64toh

#include "proto/frag.hpp"
#include "util/log.hpp"

namespace frag
{

using txrelay::Errc;
using txrelay::Error;
using txrelay::fail;

std::uint32_t checksum32(const std::vector<std::uint8_t> &payload)
{
    const crypto::Digest d = crypto::digest16(payload.data(), payload.size());
    return (std::uint32_t(d[0]) << 24) | (std::uint32_t(d[1]) << 16) | (std::uint32_t(d[2]) << 8) |
           std::uint32_t(d[3]);
}

std::size_t chunk_count(std::size_t payload_size, std::size_t chunk_size)
{
    if (chunk_size == 0)
        return 0;
    if (payload_size == 0)
        return 1;
    return (payload_size + chunk_size - 1) / chunk_size;
}

bool build_chunks(std::uint64_t                    session_id,
                  const std::vector<std::uint8_t> &payload,
                  const crypto::SharedKey         *key,
                  bool                             encrypt,
                  std::size_t                      chunk_size,
                  crypto::TransportCrypto         *tc,
                  std::vector<Chunk>              &out,
                  Error                           &err)
{
    out.clear();
    err.session_id = session_id;

    if (chunk_size == 0 || chunk_size + crypto::TAG_SIZE > UINT16_MAX)
        return fail(err, Errc::invalid_argument,
                    "chunk size " + std::to_string(chunk_size) + " out of range");
    if (encrypt && (!key || !tc))
        return fail(err, Errc::missing_session_key, "encryption requested without a key");

    const std::size_t n = chunk_count(payload.size(), chunk_size);
    if (n > MAX_CHUNKS)
    {
        LOG_ERROR("[CODEC] payload too large (%zu bytes, needs %zu chunks)", payload.size(), n);
        return fail(err, Errc::payload_too_large,
                    std::to_string(payload.size()) + " bytes needs " + std::to_string(n) +
                        " chunks");
    }

    out.reserve(n);
    for (std::size_t i = 0; i < n; i++)
    {
        const std::size_t start = i * chunk_size;
        const std::size_t take  = payload.empty() ? 0 : std::min(chunk_size, payload.size() - start);

        std::vector<std::uint8_t> piece(payload.begin() + start, payload.begin() + start + take);

        Chunk c;
        c.hdr.kind       = KIND_DATA;
        c.hdr.ver        = PROTO_VER;
        c.hdr.flags      = (i + 1 == n) ? FLAG_FINAL : 0;
        c.hdr.session_id = session_id;
        c.hdr.index      = static_cast<std::uint16_t>(i);
        c.hdr.total      = static_cast<std::uint16_t>(n);

        if (encrypt)
        {
            c.hdr.flags |= FLAG_ENCRYPTED;
            if (!tc->encrypt_chunk(*key, session_id, c.hdr.index, piece, c.payload, err))
            {
                out.clear();
                return false;
            }
        }
        else
        {
            c.payload = std::move(piece);
        }
        c.hdr.len      = static_cast<std::uint16_t>(c.payload.size());
        c.hdr.checksum = checksum32(c.payload);
        out.push_back(std::move(c));
    }

    LOG_DEBUG("[CODEC] sid=%s built %zu chunk(s) from %zu bytes (chunk=%zu, enc=%d)",
              txrelay::format_session_id(session_id).c_str(), n, payload.size(), chunk_size,
              encrypt ? 1 : 0);
    return true;
}

std::optional<std::vector<std::uint8_t>> parse_chunks(const std::vector<Chunk> &chunks,
                                                      const crypto::SharedKey  *key,
                                                      bool                      decrypt,
                                                      crypto::TransportCrypto  *tc,
                                                      Error                    &err)
{
    if (chunks.empty())
    {
        fail(err, Errc::incomplete, "no chunks");
        return std::nullopt;
    }

    const Header       &first     = chunks.front().hdr;
    const std::uint16_t total     = first.total;
    const std::uint64_t sid       = first.session_id;
    const bool          encrypted = (first.flags & FLAG_ENCRYPTED) != 0;
    err.session_id                = sid;

    if (total == 0)
    {
        fail(err, Errc::inconsistent, "declared total is zero");
        return std::nullopt;
    }

    // 1) consistency: one session, one total, one encryption mode, unique indices
    std::vector<const Chunk *> slot(total, nullptr);
    for (const Chunk &c : chunks)
    {
        const Header &h = c.hdr;
        if (h.total != total || h.session_id != sid ||
            ((h.flags & FLAG_ENCRYPTED) != 0) != encrypted || h.index >= total ||
            h.len != c.payload.size())
        {
            err.index = h.index;
            fail(err, Errc::inconsistent,
                 "chunk " + std::to_string(h.index) + " disagrees with total " +
                     std::to_string(total));
            return std::nullopt;
        }
        if (slot[h.index])
        {
            if (slot[h.index]->payload != c.payload)
            {
                err.index = h.index;
                fail(err, Errc::inconsistent, "index repeated with different content");
                return std::nullopt;
            }
            continue;
        }
        slot[h.index] = &c;
    }

    // 2) completeness
    for (std::uint16_t i = 0; i < total; i++)
    {
        if (!slot[i])
        {
            err.index = i;
            fail(err, Errc::incomplete,
                 "missing index " + std::to_string(i) + " of " + std::to_string(total));
            return std::nullopt;
        }
    }

    // 3) integrity
    for (std::uint16_t i = 0; i < total; i++)
    {
        if (checksum32(slot[i]->payload) != slot[i]->hdr.checksum)
        {
            err.index = i;
            fail(err, Errc::checksum_mismatch, "chunk " + std::to_string(i));
            return std::nullopt;
        }
    }

    // 4) decryption
    if (encrypted && !decrypt)
    {
        fail(err, Errc::invalid_argument, "chunks are encrypted but no decryption requested");
        return std::nullopt;
    }
    if (!encrypted && decrypt)
    {
        fail(err, Errc::auth_failed, "expected encrypted chunks, got plaintext");
        return std::nullopt;
    }
    if (decrypt && (!key || !tc))
    {
        fail(err, Errc::missing_session_key, "no key for session");
        return std::nullopt;
    }

    std::vector<std::uint8_t> out;
    std::vector<std::uint8_t> plain;
    for (std::uint16_t i = 0; i < total; i++)
    {
        const Chunk &c = *slot[i];
        if (!decrypt)
        {
            out.insert(out.end(), c.payload.begin(), c.payload.end());
            continue;
        }
        if (!tc->decrypt_chunk(*key, sid, i, c.payload, plain, err))
        {
            crypto::wipe(out.data(), out.size());
            return std::nullopt;
        }
        out.insert(out.end(), plain.begin(), plain.end());
    }
    return out;
}

std::vector<std::uint8_t> serialize(const Chunk &c)
{
    if (c.payload.size() != c.hdr.len)
    {
        LOG_ERROR("[CODEC] payload size mismatch (%zu != %u)", c.payload.size(),
                  static_cast<unsigned>(c.hdr.len));
        return {};
    }

    std::vector<std::uint8_t> out(HDR_SIZE + c.payload.size());

    if (!pack_header(c.hdr, out.data()))
    {
        LOG_ERROR("[CODEC] invalid header (sid=%s index=%u total=%u len=%u)",
                  txrelay::format_session_id(c.hdr.session_id).c_str(), c.hdr.index, c.hdr.total,
                  c.hdr.len);
        return {};
    }

    if (!c.payload.empty())
        std::memcpy(out.data() + HDR_SIZE, c.payload.data(), c.payload.size());
    return out;
}

std::optional<Chunk> parse(const std::vector<std::uint8_t> &frame)
{
    Header h{};
    Chunk  c;
    if (frame.size() < HDR_SIZE)
    {
        LOG_WARN("[CODEC] frame too short (%zu)", frame.size());
        return std::nullopt;
    }
    if (!unpack_header(frame.data(), h))
    {
        LOG_WARN("[CODEC] invalid header, failed to unpack");
        return std::nullopt;
    }

    const std::size_t expected = HDR_SIZE + static_cast<std::size_t>(h.len);
    if (frame.size() != expected)
    {
        LOG_WARN("[CODEC] size mismatch (got %zu, expect %zu)", frame.size(), expected);
        return std::nullopt;
    }
    c.hdr = h;
    if (h.len)
        c.payload.assign(frame.begin() + HDR_SIZE, frame.end());
    return c;
}

static bool header_valid(const Header &h)
{
    return h.kind == KIND_DATA && h.ver == PROTO_VER && h.total != 0 && h.index < h.total &&
           h.len <= MAX_FRAME_PAYLOAD;
}

bool pack_header(const Header &in, std::uint8_t out[HDR_SIZE])
{
    if (!header_valid(in))
        return false;

    out[0] = in.kind;
    out[1] = in.ver;
    out[2] = in.flags;
    out[3] = 0;

    std::uint64_t sid_be = htobe64(in.session_id);
    std::memcpy(out + 4, &sid_be, sizeof sid_be);

    std::uint16_t index_be = htons(in.index);
    std::memcpy(out + 12, &index_be, sizeof index_be);

    std::uint16_t total_be = htons(in.total);
    std::memcpy(out + 14, &total_be, sizeof total_be);

    std::uint16_t len_be = htons(in.len);
    std::memcpy(out + 16, &len_be, sizeof len_be);

    std::uint32_t sum_be = htonl(in.checksum);
    std::memcpy(out + 18, &sum_be, sizeof sum_be);

    return true;
}

bool unpack_header(const std::uint8_t in[HDR_SIZE], Header &out)
{
    out.kind  = in[0];
    out.ver   = in[1];
    out.flags = in[2];

    std::uint64_t sid_be;
    std::memcpy(&sid_be, in + 4, sizeof sid_be);
    out.session_id = be64toh(sid_be);

    std::uint16_t index_be;
    std::memcpy(&index_be, in + 12, sizeof index_be);
    out.index = ntohs(index_be);

    std::uint16_t total_be;
    std::memcpy(&total_be, in + 14, sizeof total_be);
    out.total = ntohs(total_be);

    std::uint16_t len_be;
    std::memcpy(&len_be, in + 16, sizeof len_be);
    out.len = ntohs(len_be);

    std::uint32_t sum_be;
    std::memcpy(&sum_be, in + 18, sizeof sum_be);
    out.checksum = ntohl(sum_be);

    return header_valid(out);
}

std::vector<std::uint8_t> encode_ack(const Ack &a)
{
    std::vector<std::uint8_t> out(ACK_SIZE);
    out[0] = KIND_ACK;
    out[1] = PROTO_VER;
    out[2] = static_cast<std::uint8_t>(a.status);
    out[3] = 0;
    std::uint64_t sid_be = htobe64(a.session_id);
    std::memcpy(out.data() + 4, &sid_be, sizeof sid_be);
    std::uint16_t index_be = htons(a.index);
    std::memcpy(out.data() + 12, &index_be, sizeof index_be);
    return out;
}

std::optional<Ack> decode_ack(const std::vector<std::uint8_t> &frame)
{
    if (frame.size() != ACK_SIZE || frame[0] != KIND_ACK || frame[1] != PROTO_VER)
        return std::nullopt;
    if (frame[2] > static_cast<std::uint8_t>(AckStatus::reject))
        return std::nullopt;

    Ack a;
    a.status = static_cast<AckStatus>(frame[2]);
    std::uint64_t sid_be;
    std::memcpy(&sid_be, frame.data() + 4, sizeof sid_be);
    a.session_id = be64toh(sid_be);
    std::uint16_t index_be;
    std::memcpy(&index_be, frame.data() + 12, sizeof index_be);
    a.index = ntohs(index_be);
    return a;
}

Reassembler::Result Reassembler::feed(const Chunk &c)
{
    if (c.hdr.total == 0 || c.hdr.index >= c.hdr.total || c.hdr.len != c.payload.size())
    {
        LOG_WARN("[CODEC] invalid chunk");
        return Result::conflict;
    }
    const std::uint64_t sid = c.hdr.session_id;
    auto                it  = map_.find(sid);
    if (it == map_.end())
    {
        State st;
        st.total = c.hdr.total;
        st.parts.resize(st.total);
        st.have.assign(st.total, false);
        it = map_.emplace(sid, std::move(st)).first;
    }
    State &st = it->second;

    if (st.total != c.hdr.total)
    {
        LOG_WARN("[CODEC] sid=%s total changed (%u -> %u)",
                 txrelay::format_session_id(sid).c_str(), st.total, c.hdr.total);
        return Result::conflict;
    }

    const std::uint16_t index = c.hdr.index;
    if (st.have[index])
    {
        if (st.parts[index].payload != c.payload)
            return Result::conflict;
        LOG_DEBUG("[CODEC] duplicate chunk (sid=%s, index=%u)",
                  txrelay::format_session_id(sid).c_str(), index);
        return Result::duplicate;
    }

    st.parts[index] = c;
    st.have[index]  = true;
    st.received++;

    return st.received == st.total ? Result::complete : Result::stored;
}

std::vector<Chunk> Reassembler::take(std::uint64_t session_id)
{
    auto it = map_.find(session_id);
    if (it == map_.end())
        return {};
    std::vector<Chunk> out;
    out.reserve(it->second.received);
    for (std::size_t i = 0; i < it->second.parts.size(); i++)
    {
        if (it->second.have[i])
            out.push_back(std::move(it->second.parts[i]));
    }
    map_.erase(it);
    return out;
}

std::size_t Reassembler::received(std::uint64_t session_id) const
{
    auto it = map_.find(session_id);
    return it == map_.end() ? 0 : it->second.received;
}

std::uint16_t Reassembler::total(std::uint64_t session_id) const
{
    auto it = map_.find(session_id);
    return it == map_.end() ? 0 : it->second.total;
}

}  // namespace frag
