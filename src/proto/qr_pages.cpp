#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <sodium.h>

#include "proto/qr_pages.hpp"
#include "util/log.hpp"

namespace qr
{

using txrelay::Errc;
using txrelay::Error;
using txrelay::fail;

namespace
{

constexpr int B64_VARIANT = sodium_base64_VARIANT_URLSAFE_NO_PADDING;

std::string to_base64url(const std::vector<std::uint8_t> &bin)
{
    std::string out(sodium_base64_encoded_len(bin.size(), B64_VARIANT), '\0');
    sodium_bin2base64(&out[0], out.size(), bin.data(), bin.size(), B64_VARIANT);
    out.resize(std::char_traits<char>::length(out.c_str()));
    return out;
}

bool from_base64url(const std::string &text, std::vector<std::uint8_t> &out)
{
    out.assign(text.size() * 3 / 4 + 3, 0);
    std::size_t bin_len = 0;
    const char *end     = nullptr;
    if (sodium_base642bin(out.data(), out.size(), text.c_str(), text.size(), nullptr, &bin_len,
                          &end, B64_VARIANT) != 0 ||
        (end && *end != '\0'))
    {
        out.clear();
        return false;
    }
    out.resize(bin_len);
    return true;
}

std::vector<std::string> split(const std::string &s, char sep)
{
    std::vector<std::string> parts;
    std::size_t              start = 0;
    for (;;)
    {
        const std::size_t pos = s.find(sep, start);
        if (pos == std::string::npos)
        {
            parts.push_back(s.substr(start));
            return parts;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

bool parse_uint(const std::string &s, int base, unsigned long max, unsigned long &out)
{
    if (s.empty())
        return false;
    char         *p = nullptr;
    unsigned long v = std::strtoul(s.c_str(), &p, base);
    if (!p || *p != '\0' || v > max)
        return false;
    out = v;
    return true;
}

bool page_error(Error &err, const std::string &detail)
{
    LOG_DEBUG("[QR] malformed page: %s", detail.c_str());
    return fail(err, Errc::malformed_page, detail);
}

}  // namespace

std::string encode_page(const frag::Chunk &c)
{
    char head[96];
    std::snprintf(head, sizeof head, "%.*s%u:%s:%u:%u:%u:%08" PRIx32 ":",
                  static_cast<int>(constants::QR_PREFIX.size()), constants::QR_PREFIX.data(),
                  PAGE_VER, txrelay::format_session_id(c.hdr.session_id).c_str(), c.hdr.index,
                  c.hdr.total, c.hdr.flags, c.hdr.checksum);
    return std::string(head) + to_base64url(c.payload);
}

std::optional<frag::Chunk> decode_page(const std::string &page, Error &err)
{
    const std::string prefix(constants::QR_PREFIX);
    if (page.compare(0, prefix.size(), prefix) != 0)
    {
        page_error(err, "missing " + prefix + " tag");
        return std::nullopt;
    }

    // ver:sid:index:total:flags:checksum:payload
    const std::vector<std::string> f = split(page.substr(prefix.size()), ':');
    if (f.size() != 7)
    {
        page_error(err, "expected 7 fields, got " + std::to_string(f.size()));
        return std::nullopt;
    }

    unsigned long ver = 0, index = 0, total = 0, flags = 0, sum = 0;
    frag::Chunk   c;
    if (!parse_uint(f[0], 10, 255, ver) || ver != PAGE_VER)
    {
        page_error(err, "unsupported version '" + f[0] + "'");
        return std::nullopt;
    }
    if (f[1].size() != 16 || !txrelay::parse_session_id(f[1], c.hdr.session_id))
    {
        page_error(err, "bad session id '" + f[1] + "'");
        return std::nullopt;
    }
    if (!parse_uint(f[2], 10, UINT16_MAX, index) || !parse_uint(f[3], 10, UINT16_MAX, total) ||
        total == 0 || index >= total)
    {
        page_error(err, "bad index/total '" + f[2] + "/" + f[3] + "'");
        return std::nullopt;
    }
    if (!parse_uint(f[4], 10, 255, flags))
    {
        page_error(err, "bad flags '" + f[4] + "'");
        return std::nullopt;
    }
    if (f[5].size() != 8 || !parse_uint(f[5], 16, UINT32_MAX, sum))
    {
        page_error(err, "bad checksum '" + f[5] + "'");
        return std::nullopt;
    }
    if (!from_base64url(f[6], c.payload) || c.payload.size() > UINT16_MAX)
    {
        page_error(err, "payload is not base64url");
        return std::nullopt;
    }

    c.hdr.kind     = frag::KIND_DATA;
    c.hdr.ver      = frag::PROTO_VER;
    c.hdr.flags    = static_cast<std::uint8_t>(flags);
    c.hdr.index    = static_cast<std::uint16_t>(index);
    c.hdr.total    = static_cast<std::uint16_t>(total);
    c.hdr.len      = static_cast<std::uint16_t>(c.payload.size());
    c.hdr.checksum = static_cast<std::uint32_t>(sum);
    return c;
}

bool build_qr_pages(std::uint64_t                    session_id,
                    const std::vector<std::uint8_t> &payload,
                    const crypto::SharedKey         *key,
                    bool                             encrypt,
                    std::size_t                      chunk_size,
                    crypto::TransportCrypto         *tc,
                    std::vector<std::string>        &out,
                    Error                           &err)
{
    out.clear();
    std::vector<frag::Chunk> chunks;
    if (!frag::build_chunks(session_id, payload, key, encrypt, chunk_size, tc, chunks, err))
        return false;

    out.reserve(chunks.size());
    for (const auto &c : chunks)
        out.push_back(encode_page(c));

    LOG_INFO("[QR] sid=%s %zu page(s) for %zu bytes",
             txrelay::format_session_id(session_id).c_str(), out.size(), payload.size());
    return true;
}

std::optional<std::vector<std::uint8_t>> parse_qr_pages(const std::vector<std::string> &pages,
                                                        const crypto::SharedKey        *key,
                                                        bool                            decrypt,
                                                        crypto::TransportCrypto        *tc,
                                                        Error                          &err)
{
    std::vector<frag::Chunk> chunks;
    chunks.reserve(pages.size());
    for (std::size_t i = 0; i < pages.size(); i++)
    {
        auto c = decode_page(pages[i], err);
        if (!c)
        {
            err.index = static_cast<int>(i);
            return std::nullopt;
        }
        chunks.push_back(std::move(*c));
    }
    return frag::parse_chunks(chunks, key, decrypt, tc, err);
}

PageCollector::Add PageCollector::add(const std::string &page, Error &err)
{
    auto c = decode_page(page, err);
    if (!c)
        return Add::rejected;

    if (total_ == 0)
    {
        session_id_ = c->hdr.session_id;
        total_      = c->hdr.total;
        LOG_DEBUG("[QR] collecting sid=%s total=%u", txrelay::format_session_id(session_id_).c_str(),
                  total_);
    }
    else if (c->hdr.session_id != session_id_ || c->hdr.total != total_)
    {
        err.session_id = c->hdr.session_id;
        err.index      = c->hdr.index;
        fail(err, Errc::inconsistent, "page belongs to another session or total");
        return Add::rejected;
    }

    auto it = chunks_.find(c->hdr.index);
    if (it != chunks_.end())
    {
        if (it->second.payload != c->payload || it->second.hdr.checksum != c->hdr.checksum)
        {
            err.session_id = session_id_;
            err.index      = c->hdr.index;
            fail(err, Errc::inconsistent, "index scanned twice with different content");
            return Add::rejected;
        }
        return Add::duplicate;
    }

    chunks_.emplace(c->hdr.index, std::move(*c));
    return Add::accepted;
}

std::optional<std::vector<std::uint8_t>> PageCollector::assemble(const crypto::SharedKey *key,
                                                                 bool                     decrypt,
                                                                 crypto::TransportCrypto *tc,
                                                                 Error &err) const
{
    if (!ready())
    {
        err.session_id = session_id_;
        fail(err, Errc::incomplete,
             "have " + std::to_string(have()) + " of " + std::to_string(total_) + " pages");
        return std::nullopt;
    }
    std::vector<frag::Chunk> chunks;
    chunks.reserve(chunks_.size());
    for (const auto &kv : chunks_)
        chunks.push_back(kv.second);
    return frag::parse_chunks(chunks, key, decrypt, tc, err);
}

void PageCollector::reset()
{
    session_id_ = 0;
    total_      = 0;
    chunks_.clear();
}

}  // namespace qr
