#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "proto/frag.hpp"

/*
One QR symbol per chunk, rendered in sequence by the caller:

  VQR:1:<sid 16 hex>:<index>:<total>:<flags>:<checksum 8 hex>:<base64url payload>

The scanning side feeds whatever it reads into a PageCollector and attempts
reassembly once every index in [0, total) has been seen.
*/

namespace qr
{

inline constexpr unsigned PAGE_VER = 1;

// --- single page ---
std::string                encode_page(const frag::Chunk &c);
std::optional<frag::Chunk> decode_page(const std::string &page, txrelay::Error &err);

// --- whole payload ---
bool build_qr_pages(std::uint64_t                    session_id,
                    const std::vector<std::uint8_t> &payload,
                    const crypto::SharedKey         *key,
                    bool                             encrypt,
                    std::size_t                      chunk_size,
                    crypto::TransportCrypto         *tc,
                    std::vector<std::string>        &out,
                    txrelay::Error                  &err);

std::optional<std::vector<std::uint8_t>> parse_qr_pages(const std::vector<std::string> &pages,
                                                        const crypto::SharedKey        *key,
                                                        bool                            decrypt,
                                                        crypto::TransportCrypto        *tc,
                                                        txrelay::Error                 &err);

// Incremental scan state for one session.
class PageCollector
{
  public:
    enum class Add
    {
        accepted,
        duplicate,
        rejected,
    };

    Add add(const std::string &page, txrelay::Error &err);

    bool          ready() const { return total_ != 0 && chunks_.size() == total_; }
    std::size_t   have() const { return chunks_.size(); }
    std::uint16_t total() const { return total_; }
    std::uint64_t session_id() const { return session_id_; }

    // Only meaningful once ready(); otherwise fails with `incomplete`.
    std::optional<std::vector<std::uint8_t>> assemble(const crypto::SharedKey *key,
                                                      bool                     decrypt,
                                                      crypto::TransportCrypto *tc,
                                                      txrelay::Error          &err) const;

    void reset();

  private:
    std::uint64_t                          session_id_{0};
    std::uint16_t                          total_{0};
    std::map<std::uint16_t, frag::Chunk>   chunks_;
};

}  // namespace qr
