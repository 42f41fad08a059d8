#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include "crypto/transport_crypto.hpp"
#include "util/constants.hpp"
#include "util/error.hpp"

/*
TX:
relay.send_envelope(payload)
  -> build_chunks(sid, payload, key, encrypt, chunk_size)
       -> per piece: crypto.encrypt_chunk(key, sid, index) -> checksum32(wire payload)
     -> BLE: serialize(Chunk)   // [22B header][payload]  -> driver.write(frame)
     -> QR : qr::build_qr_pages  // "VQR:1:..." text pages

RX:
driver value(frame)
  -> parse(frame)              // validate header, extract Chunk
     -> reassembler.feed(Chunk) -> complete ? take(sid)
        -> parse_chunks(...)   // total/index/checksum checks, then decrypt -> payload

Frame header (big-endian):
  [0] kind  [1] ver  [2] flags  [3] rsv
  [4..11]  session_id u64
  [12..13] index u16  [14..15] total u16  [16..17] len u16
  [18..21] checksum u32

ACK frame (receiver -> sender):
  [0] kind=ACK  [1] ver  [2] status  [3] rsv  [4..11] session_id  [12..13] index
*/

namespace frag
{

// --- Protocol constants ---
inline constexpr std::uint8_t KIND_DATA = 0x10;
inline constexpr std::uint8_t KIND_ACK  = 0x11;

inline constexpr std::uint8_t PROTO_VER      = 1;
inline constexpr std::uint8_t FLAG_FINAL     = 1 << 0;
inline constexpr std::uint8_t FLAG_ENCRYPTED = 1 << 1;
inline constexpr std::size_t  HDR_SIZE       = 22;
inline constexpr std::size_t  ACK_SIZE       = 14;
inline constexpr std::size_t  MAX_CHUNKS     = UINT16_MAX;
// largest payload one ATT write can carry at the MTU cap
inline constexpr std::size_t MAX_FRAME_PAYLOAD =
    constants::MTU_CAP - constants::ATT_OVERHEAD - HDR_SIZE;

// ACK index used to acknowledge a KEY_OFFER control frame
inline constexpr std::uint16_t KEY_INDEX = 0xFFFF;

enum class AckStatus : std::uint8_t
{
    ok     = 0,
    retry  = 1,  // transient, resend the same frame
    reject = 2,  // fatal for the session
};

// On-wire chunk header
struct Header
{
    std::uint8_t  kind{KIND_DATA};  // 1B
    std::uint8_t  ver{PROTO_VER};   // 1B
    std::uint8_t  flags{0};         // 1B
    std::uint64_t session_id{0};    // 8B
    std::uint16_t index{0};         // 2B
    std::uint16_t total{0};         // 2B
    std::uint16_t len{0};           // 2B
    std::uint32_t checksum{0};      // 4B
};

struct Chunk
{
    Header                    hdr;
    std::vector<std::uint8_t> payload;  // ciphertext when FLAG_ENCRYPTED
};

struct Ack
{
    std::uint64_t session_id{0};
    std::uint16_t index{0};
    AckStatus     status{AckStatus::ok};
};

// First four bytes of BLAKE2b-128 over the wire payload.
std::uint32_t checksum32(const std::vector<std::uint8_t> &payload);

// --- Codec ---
// Splits `payload` into pieces of `chunk_size` plaintext bytes. With `encrypt`
// set, `key` and `tc` must be non-null. Same inputs, same output.
bool build_chunks(std::uint64_t                    session_id,
                  const std::vector<std::uint8_t> &payload,
                  const crypto::SharedKey         *key,
                  bool                             encrypt,
                  std::size_t                      chunk_size,
                  crypto::TransportCrypto         *tc,
                  std::vector<Chunk>              &out,
                  txrelay::Error                  &err);

// Validates the set (total, indices, checksums) and, with `decrypt`, opens
// every chunk. Never returns partial data.
std::optional<std::vector<std::uint8_t>> parse_chunks(const std::vector<Chunk>  &chunks,
                                                      const crypto::SharedKey   *key,
                                                      bool                       decrypt,
                                                      crypto::TransportCrypto   *tc,
                                                      txrelay::Error            &err);

// Number of chunks build_chunks would produce.
std::size_t chunk_count(std::size_t payload_size, std::size_t chunk_size);

// --- BLE frames ---
// TX
std::vector<std::uint8_t> serialize(const Chunk &c);
bool                      pack_header(const Header &in, std::uint8_t out[HDR_SIZE]);
// RX
std::optional<Chunk>      parse(const std::vector<std::uint8_t> &frame);
bool                      unpack_header(const std::uint8_t in[HDR_SIZE], Header &out);

std::vector<std::uint8_t> encode_ack(const Ack &a);
std::optional<Ack>        decode_ack(const std::vector<std::uint8_t> &frame);

// 0 for an empty frame
inline std::uint8_t frame_kind(const std::vector<std::uint8_t> &frame)
{
    return frame.empty() ? 0 : frame[0];
}

// Per-session chunk store with duplicate detection.
class Reassembler
{
  public:
    enum class Result
    {
        stored,     // new chunk, session still incomplete
        duplicate,  // same index and payload seen before
        conflict,   // disagrees with what the session already holds
        complete,   // every index in [0, total) now present
    };

    Result feed(const Chunk &c);

    // Removes the session and hands back its chunks in index order.
    std::vector<Chunk> take(std::uint64_t session_id);

    bool          contains(std::uint64_t session_id) const { return map_.count(session_id) != 0; }
    std::size_t   received(std::uint64_t session_id) const;
    std::uint16_t total(std::uint64_t session_id) const;
    void          clear(std::uint64_t session_id) { map_.erase(session_id); }
    std::size_t   size() const { return map_.size(); }

  private:
    struct State
    {
        std::uint16_t      total    = 0;
        std::size_t        received = 0;
        std::vector<Chunk> parts;  // size == total
        std::vector<bool>  have;   // size == total
    };
    std::unordered_map<std::uint64_t, State> map_;
};

}  // namespace frag
