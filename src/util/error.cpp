#include <cinttypes>
#include <cstdio>
#include <cstdlib>

#include "util/error.hpp"

namespace txrelay
{

const char *errc_name(Errc c)
{
    switch (c)
    {
        case Errc::ok:
            return "ok";
        case Errc::driver_unavailable:
            return "driver_unavailable";
        case Errc::service_missing:
            return "service_missing";
        case Errc::connect_exhausted:
            return "exhausted";
        case Errc::connect_timeout:
            return "timeout";
        case Errc::connect_in_progress:
            return "in_progress";
        case Errc::connect_cancelled:
            return "cancelled";
        case Errc::not_connected:
            return "not_connected";
        case Errc::frame_delivery_failed:
            return "frame_delivery_failed";
        case Errc::incomplete:
            return "incomplete";
        case Errc::inconsistent:
            return "inconsistent";
        case Errc::checksum_mismatch:
            return "checksum_mismatch";
        case Errc::cancelled:
            return "cancelled";
        case Errc::malformed_frame:
            return "malformed_frame";
        case Errc::malformed_page:
            return "malformed_page";
        case Errc::payload_too_large:
            return "payload_too_large";
        case Errc::rejected_by_peer:
            return "rejected_by_peer";
        case Errc::unknown_session:
            return "unknown";
        case Errc::session_expired:
            return "expired";
        case Errc::bad_peer_key:
            return "bad_peer_key";
        case Errc::key_derivation_failed:
            return "key_derivation";
        case Errc::auth_failed:
            return "authentication";
        case Errc::peer_key_unknown:
            return "peer_key_unknown";
        case Errc::missing_session_key:
            return "missing_session_key";
        case Errc::invalid_argument:
            return "invalid_argument";
    }
    return "?";
}

ErrorKind errc_kind(Errc c)
{
    switch (c)
    {
        case Errc::ok:
            return ErrorKind::None;
        case Errc::driver_unavailable:
        case Errc::service_missing:
        case Errc::connect_exhausted:
        case Errc::connect_timeout:
        case Errc::connect_in_progress:
        case Errc::connect_cancelled:
        case Errc::not_connected:
            return ErrorKind::Connection;
        case Errc::frame_delivery_failed:
        case Errc::incomplete:
        case Errc::inconsistent:
        case Errc::checksum_mismatch:
        case Errc::cancelled:
        case Errc::malformed_frame:
        case Errc::malformed_page:
        case Errc::payload_too_large:
        case Errc::rejected_by_peer:
            return ErrorKind::Transfer;
        case Errc::unknown_session:
        case Errc::session_expired:
            return ErrorKind::Session;
        case Errc::bad_peer_key:
        case Errc::key_derivation_failed:
        case Errc::auth_failed:
        case Errc::peer_key_unknown:
        case Errc::missing_session_key:
            return ErrorKind::Crypto;
        case Errc::invalid_argument:
            return ErrorKind::Config;
    }
    return ErrorKind::None;
}

const char *kind_name(ErrorKind k)
{
    switch (k)
    {
        case ErrorKind::None:
            return "Ok";
        case ErrorKind::Connection:
            return "ConnectionError";
        case ErrorKind::Transfer:
            return "TransferError";
        case ErrorKind::Session:
            return "SessionError";
        case ErrorKind::Crypto:
            return "CryptoError";
        case ErrorKind::Config:
            return "ConfigError";
    }
    return "?";
}

std::string Error::message() const
{
    std::string out = std::string(kind_name(kind())) + "." + errc_name(code);
    if (!detail.empty())
        out += ": " + detail;

    std::string ctx;
    if (session_id != 0)
        ctx += "session=" + format_session_id(session_id);
    if (index >= 0)
        ctx += (ctx.empty() ? "" : ", ") + std::string("index=") + std::to_string(index);
    if (attempts > 0)
        ctx += (ctx.empty() ? "" : ", ") + std::string("attempts=") + std::to_string(attempts);
    if (!ctx.empty())
        out += " (" + ctx + ")";
    return out;
}

std::string format_session_id(std::uint64_t sid)
{
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016" PRIx64, sid);
    return std::string(buf);
}

bool parse_session_id(const std::string &text, std::uint64_t &out)
{
    if (text.empty() || text.size() > 16)
        return false;
    char              *end = nullptr;
    unsigned long long v   = std::strtoull(text.c_str(), &end, 16);
    if (!end || *end != '\0')
        return false;
    out = static_cast<std::uint64_t>(v);
    return true;
}

}  // namespace txrelay
