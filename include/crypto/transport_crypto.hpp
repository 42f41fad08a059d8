#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "util/error.hpp"

/*
Key agreement (per peer, cached by the orchestrator):

  sender                                          receiver
  ------                                          --------
  eph = generate_ephemeral_key_pair()
  K   = derive_shared_key(eph, peer_static_pub)
  KEY_OFFER{sid, eph.pub} ──────────────────────▶ K = derive_shared_key(static, eph.pub)

Per chunk:
  nonce = BLAKE2b-192(key=K, "txrelay-nonce" || sid || index)
  ct    = XChaCha20-Poly1305(K, nonce, aad = "TXR1" || sid || index, plaintext)
*/

namespace crypto
{

constexpr std::size_t KEY_SIZE        = 32;  // crypto_aead_xchacha20poly1305_ietf_KEYBYTES
constexpr std::size_t NONCE_SIZE      = 24;  // crypto_aead_xchacha20poly1305_ietf_NPUBBYTES
constexpr std::size_t TAG_SIZE        = 16;  // crypto_aead_xchacha20poly1305_ietf_ABYTES
constexpr std::size_t PUBLIC_KEY_SIZE = 32;  // crypto_scalarmult_BYTES
constexpr std::size_t SECRET_KEY_SIZE = 32;  // crypto_scalarmult_SCALARBYTES
constexpr std::size_t DIGEST_SIZE     = 16;

using SharedKey = std::array<std::uint8_t, KEY_SIZE>;
using PublicKey = std::array<std::uint8_t, PUBLIC_KEY_SIZE>;
using Digest    = std::array<std::uint8_t, DIGEST_SIZE>;

struct KeyPair
{
    std::array<std::uint8_t, SECRET_KEY_SIZE> secret{};
    PublicKey                                 public_raw{};

    KeyPair()                           = default;
    KeyPair(const KeyPair &)            = default;
    KeyPair &operator=(const KeyPair &) = default;
    ~KeyPair();  // wipes the secret
};

// Capability interface injected into the codec and the orchestrator.
class TransportCrypto
{
  public:
    virtual ~TransportCrypto() = default;

    virtual const char *name() const = 0;
    // false for the dev implementation, which never authenticates
    virtual bool authenticated() const = 0;

    virtual bool generate_ephemeral_key_pair(KeyPair &out, txrelay::Error &err) = 0;

    virtual bool key_pair_from_secret(const std::vector<std::uint8_t> &secret,
                                      KeyPair                         &out,
                                      txrelay::Error                  &err) = 0;

    virtual bool derive_shared_key(const KeyPair                   &mine,
                                   const std::vector<std::uint8_t> &peer_public_raw,
                                   SharedKey                       &out,
                                   txrelay::Error                  &err) = 0;

    virtual bool encrypt_chunk(const SharedKey                 &key,
                               std::uint64_t                    session_id,
                               std::uint16_t                    index,
                               const std::vector<std::uint8_t> &plaintext,
                               std::vector<std::uint8_t>       &out,
                               txrelay::Error                  &err) = 0;

    virtual bool decrypt_chunk(const SharedKey                 &key,
                               std::uint64_t                    session_id,
                               std::uint16_t                    index,
                               const std::vector<std::uint8_t> &ciphertext,
                               std::vector<std::uint8_t>       &out,
                               txrelay::Error                  &err) = 0;
};

// libsodium: X25519 + BLAKE2b + XChaCha20-Poly1305
class SodiumTransportCrypto : public TransportCrypto
{
  public:
    SodiumTransportCrypto();

    const char *name() const override { return "sodium"; }
    bool        authenticated() const override { return true; }

    bool generate_ephemeral_key_pair(KeyPair &out, txrelay::Error &err) override;
    bool key_pair_from_secret(const std::vector<std::uint8_t> &secret,
                              KeyPair                         &out,
                              txrelay::Error                  &err) override;
    bool derive_shared_key(const KeyPair                   &mine,
                           const std::vector<std::uint8_t> &peer_public_raw,
                           SharedKey                       &out,
                           txrelay::Error                  &err) override;
    bool encrypt_chunk(const SharedKey                 &key,
                       std::uint64_t                    session_id,
                       std::uint16_t                    index,
                       const std::vector<std::uint8_t> &plaintext,
                       std::vector<std::uint8_t>       &out,
                       txrelay::Error                  &err) override;
    bool decrypt_chunk(const SharedKey                 &key,
                       std::uint64_t                    session_id,
                       std::uint16_t                    index,
                       const std::vector<std::uint8_t> &ciphertext,
                       std::vector<std::uint8_t>       &out,
                       txrelay::Error                  &err) override;

  private:
    bool ready_{false};
};

// Development only. Same wire format (payload || 16 zero bytes), no secrecy,
// no authentication. Never wired in unless configured by name.
class PlaintextTransportCrypto : public TransportCrypto
{
  public:
    const char *name() const override { return "plaintext"; }
    bool        authenticated() const override { return false; }

    bool generate_ephemeral_key_pair(KeyPair &out, txrelay::Error &err) override;
    bool key_pair_from_secret(const std::vector<std::uint8_t> &secret,
                              KeyPair                         &out,
                              txrelay::Error                  &err) override;
    bool derive_shared_key(const KeyPair                   &mine,
                           const std::vector<std::uint8_t> &peer_public_raw,
                           SharedKey                       &out,
                           txrelay::Error                  &err) override;
    bool encrypt_chunk(const SharedKey                 &key,
                       std::uint64_t                    session_id,
                       std::uint16_t                    index,
                       const std::vector<std::uint8_t> &plaintext,
                       std::vector<std::uint8_t>       &out,
                       txrelay::Error                  &err) override;
    bool decrypt_chunk(const SharedKey                 &key,
                       std::uint64_t                    session_id,
                       std::uint16_t                    index,
                       const std::vector<std::uint8_t> &ciphertext,
                       std::vector<std::uint8_t>       &out,
                       txrelay::Error                  &err) override;
};

// "sodium" or "plaintext"; nullptr for anything else.
std::unique_ptr<TransportCrypto> make_transport_crypto(const std::string &name);

// BLAKE2b-128 of `data`; used for chunk checksums and commit digests.
Digest digest16(const std::uint8_t *data, std::size_t len);

bool        from_hex(const std::string &hex, std::vector<std::uint8_t> &out);
std::string to_hex(const std::uint8_t *data, std::size_t len);

void wipe(void *p, std::size_t len);

}  // namespace crypto
