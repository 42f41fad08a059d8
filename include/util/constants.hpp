#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <cctype>

namespace constants
{
// GATT identifiers shared by both peers. One characteristic carries data
// writes (central -> peripheral) and ACK/control notifications back.
inline constexpr std::string_view SVC_UUID = "5a1e0001-7c3d-4b8e-9f21-0d6a4c2b9e10";
inline constexpr std::string_view CHR_UUID = "5a1e0002-7c3d-4b8e-9f21-0d6a4c2b9e10";

// BlueZ object paths for the exported GATT application (receiving mode)
inline constexpr std::string_view APP_PATH = "/org/txrelay/app";
inline constexpr std::string_view SVC_PATH = "/org/txrelay/app/svc0";
inline constexpr std::string_view CHR_PATH = "/org/txrelay/app/svc0/char0";
inline constexpr std::string_view ADV_PATH = "/org/txrelay/adv0";

inline constexpr std::string_view DEFAULT_LOCAL_NAME = "TxRelay-Merchant";

// Link limits
inline constexpr std::size_t MTU_CAP      = 512;
inline constexpr std::size_t ATT_OVERHEAD = 3;  // opcode + handle on every ATT write

// QR page tag
inline constexpr std::string_view QR_PREFIX = "VQR:";

// UUIDs arrive in either case depending on the stack
inline bool uuid_eq(std::string_view a, std::string_view b)
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
        if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i]))
            return false;
    return true;
}

}  // namespace constants
