#pragma once
#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "crypto/transport_crypto.hpp"

/*
Control frames share the characteristic with DATA/ACK frames and are told
apart by the first byte. Body is a TLV list: [T][L hi][L lo][V...]

  KEY_OFFER (sender -> receiver, before DATA frames of an encrypted session)
    [0x20][ver] T_SESSION(8) T_EPH_PUB(32)
    answered by an ACK with index frag::KEY_INDEX

  COMMIT (receiver -> sender, once, after reassembly)
    [0x21][ver] T_SESSION(8) T_STATUS(1) [T_DIGEST(16)] [T_REASON(1..120)]
*/

namespace ctrl
{
constexpr std::uint8_t MSG_KEY_OFFER = 0x20;
constexpr std::uint8_t MSG_COMMIT    = 0x21;
constexpr std::uint8_t CTRL_VER      = 0x01;

constexpr std::uint8_t T_SESSION = 0x01;
constexpr std::uint8_t T_EPH_PUB = 0x02;
constexpr std::uint8_t T_STATUS  = 0x03;
constexpr std::uint8_t T_DIGEST  = 0x04;
constexpr std::uint8_t T_REASON  = 0x05;

constexpr std::uint8_t COMMIT_OK     = 0x00;
constexpr std::uint8_t COMMIT_FAILED = 0x01;

constexpr std::size_t REASON_MAX = 120;

struct KeyOffer
{
    std::uint64_t     session_id{0};
    crypto::PublicKey ephemeral_public{};
};

struct Commit
{
    std::uint64_t  session_id{0};
    std::uint8_t   status{COMMIT_OK};
    bool           has_digest{false};
    crypto::Digest digest{};
    std::string    reason;
};

namespace detail
{
inline void put_tlv(std::vector<std::uint8_t> &out,
                    std::uint8_t               t,
                    const std::uint8_t        *v,
                    std::size_t                len)
{
    out.push_back(t);
    out.push_back(static_cast<std::uint8_t>((len >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(len & 0xFF));
    out.insert(out.end(), v, v + len);
}

inline void put_session(std::vector<std::uint8_t> &out, std::uint64_t sid)
{
    std::uint8_t be[8];
    for (int i = 7; i >= 0; --i)
    {
        be[i] = static_cast<std::uint8_t>(sid & 0xFF);
        sid >>= 8;
    }
    put_tlv(out, T_SESSION, be, sizeof be);
}

inline std::uint64_t get_session(const std::uint8_t *v)
{
    std::uint64_t sid = 0;
    for (int i = 0; i < 8; ++i)
        sid = (sid << 8) | v[i];
    return sid;
}

// Walks the TLV body; `visit(t, v, L)` returns false on a malformed value.
template <typename Visit>
bool walk_tlv(const std::uint8_t *buf, std::size_t len, std::size_t i, Visit visit)
{
    while (i + 3 <= len)
    {
        std::uint8_t  t = buf[i++];
        std::uint16_t L = static_cast<std::uint16_t>(buf[i++] << 8);
        L |= buf[i++];
        if (i + L > len)
            return false;  // malformed => return false
        if (!visit(t, buf + i, L))
            return false;
        i += L;
    }
    return i == len;
}
}  // namespace detail

inline std::vector<std::uint8_t> encode_key_offer(const KeyOffer &k)
{
    std::vector<std::uint8_t> out;
    out.reserve(2 + 3 + 8 + 3 + crypto::PUBLIC_KEY_SIZE);
    out.push_back(MSG_KEY_OFFER);
    out.push_back(CTRL_VER);
    detail::put_session(out, k.session_id);
    detail::put_tlv(out, T_EPH_PUB, k.ephemeral_public.data(), k.ephemeral_public.size());
    return out;
}

inline std::optional<KeyOffer> parse_key_offer(const std::vector<std::uint8_t> &frame)
{
    if (frame.size() < 2 || frame[0] != MSG_KEY_OFFER || frame[1] != CTRL_VER)
        return std::nullopt;
    KeyOffer k;
    bool     has_sid = false, has_pub = false;
    const bool ok = detail::walk_tlv(
        frame.data(), frame.size(), 2, [&](std::uint8_t t, const std::uint8_t *v, std::uint16_t L) {
            switch (t)
            {
                case T_SESSION:
                    if (L != 8)
                        return false;
                    k.session_id = detail::get_session(v);
                    has_sid      = true;
                    break;
                case T_EPH_PUB:
                    if (L != crypto::PUBLIC_KEY_SIZE)
                        return false;
                    std::copy(v, v + L, k.ephemeral_public.begin());
                    has_pub = true;
                    break;
                default:  // ignore TLV if unknown
                    break;
            }
            return true;
        });
    if (!ok || !has_sid || !has_pub)
        return std::nullopt;
    return k;
}

inline std::vector<std::uint8_t> encode_commit(const Commit &c)
{
    std::vector<std::uint8_t> out;
    out.push_back(MSG_COMMIT);
    out.push_back(CTRL_VER);
    detail::put_session(out, c.session_id);
    detail::put_tlv(out, T_STATUS, &c.status, 1);
    if (c.has_digest)
        detail::put_tlv(out, T_DIGEST, c.digest.data(), c.digest.size());
    if (!c.reason.empty())
    {
        const std::size_t n = std::min(c.reason.size(), REASON_MAX);
        detail::put_tlv(out, T_REASON, reinterpret_cast<const std::uint8_t *>(c.reason.data()), n);
    }
    return out;
}

inline std::optional<Commit> parse_commit(const std::vector<std::uint8_t> &frame)
{
    if (frame.size() < 2 || frame[0] != MSG_COMMIT || frame[1] != CTRL_VER)
        return std::nullopt;
    Commit c;
    bool   has_sid = false, has_status = false;
    const bool ok = detail::walk_tlv(
        frame.data(), frame.size(), 2, [&](std::uint8_t t, const std::uint8_t *v, std::uint16_t L) {
            switch (t)
            {
                case T_SESSION:
                    if (L != 8)
                        return false;
                    c.session_id = detail::get_session(v);
                    has_sid      = true;
                    break;
                case T_STATUS:
                    if (L != 1)
                        return false;
                    c.status   = v[0];
                    has_status = true;
                    break;
                case T_DIGEST:
                    if (L != crypto::DIGEST_SIZE)
                        return false;
                    std::copy(v, v + L, c.digest.begin());
                    c.has_digest = true;
                    break;
                case T_REASON:
                    // 1..120, else malformed
                    if (L == 0 || L > REASON_MAX)
                        return false;
                    c.reason.assign(reinterpret_cast<const char *>(v), L);
                    break;
                default:
                    break;
            }
            return true;
        });
    if (!ok || !has_sid || !has_status)
        return std::nullopt;
    return c;
}
}  // namespace ctrl
