#pragma once
#include <cstdint>
#include <string>

namespace txrelay
{

// Error families surfaced to callers.
enum class ErrorKind
{
    None,
    Connection,
    Transfer,
    Session,
    Crypto,
    Config
};

enum class Errc
{
    ok = 0,

    // ConnectionError
    driver_unavailable,
    service_missing,
    connect_exhausted,
    connect_timeout,
    connect_in_progress,
    connect_cancelled,
    not_connected,

    // TransferError
    frame_delivery_failed,
    incomplete,
    inconsistent,
    checksum_mismatch,
    cancelled,
    malformed_frame,
    malformed_page,
    payload_too_large,
    rejected_by_peer,

    // SessionError
    unknown_session,
    session_expired,

    // CryptoError
    bad_peer_key,
    key_derivation_failed,
    auth_failed,
    peer_key_unknown,
    missing_session_key,

    // configuration / argument errors
    invalid_argument,
};

const char *errc_name(Errc c);
ErrorKind   errc_kind(Errc c);
const char *kind_name(ErrorKind k);

// Carried alongside bool/optional returns. `session_id`, `index` and `attempts`
// are filled in whenever the failing operation knows them.
struct Error
{
    Errc          code = Errc::ok;
    std::uint64_t session_id{0};
    int           index{-1};
    int           attempts{0};
    std::string   detail;

    explicit operator bool() const { return code != Errc::ok; }
    ErrorKind kind() const { return errc_kind(code); }

    // "TransferError.frame_delivery_failed: no ACK (session=..., index=3, attempts=4)"
    std::string message() const;

    void clear() { *this = Error{}; }
};

// Small helper so call sites read `return fail(err, Errc::x, "...")`.
inline bool fail(Error &err, Errc code, std::string detail = {})
{
    err.code   = code;
    err.detail = std::move(detail);
    return false;
}

std::string format_session_id(std::uint64_t sid);
bool        parse_session_id(const std::string &text, std::uint64_t &out);

}  // namespace txrelay
