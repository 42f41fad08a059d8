#include <algorithm>
#include <cstring>
#include <sodium.h>

#include "crypto/transport_crypto.hpp"
#include "util/log.hpp"

namespace crypto
{

using txrelay::Errc;
using txrelay::Error;
using txrelay::fail;

static_assert(KEY_SIZE == crypto_aead_xchacha20poly1305_ietf_KEYBYTES, "key size mismatch");
static_assert(NONCE_SIZE == crypto_aead_xchacha20poly1305_ietf_NPUBBYTES, "nonce size mismatch");
static_assert(TAG_SIZE == crypto_aead_xchacha20poly1305_ietf_ABYTES, "tag size mismatch");
static_assert(PUBLIC_KEY_SIZE == crypto_scalarmult_BYTES, "public key size mismatch");
static_assert(SECRET_KEY_SIZE == crypto_scalarmult_SCALARBYTES, "secret key size mismatch");

namespace
{

constexpr char          NONCE_CTX[] = "txrelay-nonce";
constexpr std::uint8_t  AAD_TAG[]   = {'T', 'X', 'R', '1'};
constexpr std::size_t   AAD_SIZE    = sizeof(AAD_TAG) + 8 + 2;

bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

void put_be64(std::uint8_t *out, std::uint64_t v)
{
    for (int i = 7; i >= 0; --i)
    {
        out[i] = static_cast<std::uint8_t>(v & 0xFF);
        v >>= 8;
    }
}

// "TXR1" || sid_be64 || index_be16
void build_aad(std::uint64_t sid, std::uint16_t index, std::uint8_t out[AAD_SIZE])
{
    std::memcpy(out, AAD_TAG, sizeof(AAD_TAG));
    put_be64(out + sizeof(AAD_TAG), sid);
    out[sizeof(AAD_TAG) + 8] = static_cast<std::uint8_t>(index >> 8);
    out[sizeof(AAD_TAG) + 9] = static_cast<std::uint8_t>(index & 0xFF);
}

bool derive_nonce(const SharedKey &key,
                  std::uint64_t    sid,
                  std::uint16_t    index,
                  std::uint8_t     nonce[NONCE_SIZE])
{
    std::uint8_t msg[sizeof(NONCE_CTX) - 1 + 8 + 2];
    std::memcpy(msg, NONCE_CTX, sizeof(NONCE_CTX) - 1);
    put_be64(msg + sizeof(NONCE_CTX) - 1, sid);
    msg[sizeof(msg) - 2] = static_cast<std::uint8_t>(index >> 8);
    msg[sizeof(msg) - 1] = static_cast<std::uint8_t>(index & 0xFF);
    return crypto_generichash(nonce, NONCE_SIZE, msg, sizeof(msg), key.data(), key.size()) == 0;
}

// BLAKE2b-256(q || lo || hi) where lo/hi are the two public keys in byte order,
// so both ends compute the same value regardless of who is "mine".
bool hash_shared(const std::uint8_t *q,
                 std::size_t         q_len,
                 const PublicKey    &a,
                 const PublicKey    &b,
                 SharedKey          &out)
{
    const PublicKey &lo = std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end())
                              ? a
                              : b;
    const PublicKey &hi = (&lo == &a) ? b : a;

    crypto_generichash_state st;
    if (crypto_generichash_init(&st, nullptr, 0, out.size()) != 0)
        return false;
    if (q_len)
        crypto_generichash_update(&st, q, q_len);
    crypto_generichash_update(&st, lo.data(), lo.size());
    crypto_generichash_update(&st, hi.data(), hi.size());
    return crypto_generichash_final(&st, out.data(), out.size()) == 0;
}

bool peer_key_from_raw(const std::vector<std::uint8_t> &raw, PublicKey &out, Error &err)
{
    if (raw.size() != PUBLIC_KEY_SIZE)
        return fail(err, Errc::bad_peer_key,
                    "peer public key must be 32 bytes, got " + std::to_string(raw.size()));
    std::copy(raw.begin(), raw.end(), out.begin());
    return true;
}

}  // namespace

KeyPair::~KeyPair()
{
    wipe(secret.data(), secret.size());
}

void wipe(void *p, std::size_t len)
{
    if (p && len)
        sodium_memzero(p, len);
}

Digest digest16(const std::uint8_t *data, std::size_t len)
{
    ensure_sodium_init();
    Digest d{};
    crypto_generichash(d.data(), d.size(), data, len, nullptr, 0);
    return d;
}

bool from_hex(const std::string &hex, std::vector<std::uint8_t> &out)
{
    ensure_sodium_init();
    out.assign(hex.size() / 2 + 1, 0);
    std::size_t bin_len = 0;
    const char *end     = nullptr;
    if (sodium_hex2bin(out.data(), out.size(), hex.c_str(), hex.size(), ": ", &bin_len, &end) !=
            0 ||
        (end && *end != '\0'))
    {
        out.clear();
        return false;
    }
    out.resize(bin_len);
    return true;
}

std::string to_hex(const std::uint8_t *data, std::size_t len)
{
    std::string s(len * 2 + 1, '\0');
    sodium_bin2hex(&s[0], s.size(), data, len);
    s.resize(len * 2);
    return s;
}

// ======================================================================
// SodiumTransportCrypto
// ======================================================================

SodiumTransportCrypto::SodiumTransportCrypto() : ready_(ensure_sodium_init())
{
    if (!ready_)
        LOG_ERROR("[CRYPTO] sodium_init failed; every operation will fail");
}

bool SodiumTransportCrypto::generate_ephemeral_key_pair(KeyPair &out, Error &err)
{
    if (!ready_)
        return fail(err, Errc::key_derivation_failed, "libsodium not initialised");
    randombytes_buf(out.secret.data(), out.secret.size());
    if (crypto_scalarmult_base(out.public_raw.data(), out.secret.data()) != 0)
        return fail(err, Errc::key_derivation_failed, "scalarmult_base failed");
    return true;
}

bool SodiumTransportCrypto::key_pair_from_secret(const std::vector<std::uint8_t> &secret,
                                                 KeyPair                         &out,
                                                 Error                           &err)
{
    if (!ready_)
        return fail(err, Errc::key_derivation_failed, "libsodium not initialised");
    if (secret.size() != SECRET_KEY_SIZE)
        return fail(err, Errc::key_derivation_failed, "identity secret must be 32 bytes");
    std::copy(secret.begin(), secret.end(), out.secret.begin());
    if (crypto_scalarmult_base(out.public_raw.data(), out.secret.data()) != 0)
        return fail(err, Errc::key_derivation_failed, "scalarmult_base failed");
    return true;
}

bool SodiumTransportCrypto::derive_shared_key(const KeyPair                   &mine,
                                              const std::vector<std::uint8_t> &peer_public_raw,
                                              SharedKey                       &out,
                                              Error                           &err)
{
    if (!ready_)
        return fail(err, Errc::key_derivation_failed, "libsodium not initialised");

    PublicKey peer{};
    if (!peer_key_from_raw(peer_public_raw, peer, err))
        return false;

    std::uint8_t q[crypto_scalarmult_BYTES];
    // rejects small-order points (all-zero output)
    if (crypto_scalarmult(q, mine.secret.data(), peer.data()) != 0)
    {
        sodium_memzero(q, sizeof(q));
        return fail(err, Errc::bad_peer_key, "peer public key is a low-order point");
    }
    const bool ok = hash_shared(q, sizeof(q), mine.public_raw, peer, out);
    sodium_memzero(q, sizeof(q));
    if (!ok)
        return fail(err, Errc::key_derivation_failed, "BLAKE2b failed");
    return true;
}

bool SodiumTransportCrypto::encrypt_chunk(const SharedKey                 &key,
                                          std::uint64_t                    session_id,
                                          std::uint16_t                    index,
                                          const std::vector<std::uint8_t> &plaintext,
                                          std::vector<std::uint8_t>       &out,
                                          Error                           &err)
{
    if (!ready_)
        return fail(err, Errc::key_derivation_failed, "libsodium not initialised");

    std::uint8_t nonce[NONCE_SIZE];
    std::uint8_t aad[AAD_SIZE];
    if (!derive_nonce(key, session_id, index, nonce))
        return fail(err, Errc::key_derivation_failed, "nonce derivation failed");
    build_aad(session_id, index, aad);

    out.resize(plaintext.size() + TAG_SIZE);
    unsigned long long clen = 0;
    const int rc = crypto_aead_xchacha20poly1305_ietf_encrypt(
        out.data(), &clen, plaintext.data(), plaintext.size(), aad, sizeof(aad),
        /*nsec=*/nullptr, nonce, key.data());
    if (rc != 0)
    {
        out.clear();
        return fail(err, Errc::key_derivation_failed, "AEAD encrypt failed");
    }
    out.resize(static_cast<std::size_t>(clen));
    return true;
}

bool SodiumTransportCrypto::decrypt_chunk(const SharedKey                 &key,
                                          std::uint64_t                    session_id,
                                          std::uint16_t                    index,
                                          const std::vector<std::uint8_t> &ciphertext,
                                          std::vector<std::uint8_t>       &out,
                                          Error                           &err)
{
    out.clear();
    if (!ready_)
        return fail(err, Errc::key_derivation_failed, "libsodium not initialised");
    if (ciphertext.size() < TAG_SIZE)
    {
        err.index = index;
        return fail(err, Errc::auth_failed, "ciphertext shorter than tag");
    }

    std::uint8_t nonce[NONCE_SIZE];
    std::uint8_t aad[AAD_SIZE];
    if (!derive_nonce(key, session_id, index, nonce))
        return fail(err, Errc::key_derivation_failed, "nonce derivation failed");
    build_aad(session_id, index, aad);

    std::vector<std::uint8_t> plain(ciphertext.size() - TAG_SIZE);
    unsigned long long        mlen = 0;
    const int rc = crypto_aead_xchacha20poly1305_ietf_decrypt(
        plain.data(), &mlen, /*nsec=*/nullptr, ciphertext.data(), ciphertext.size(), aad,
        sizeof(aad), nonce, key.data());
    if (rc != 0)
    {
        if (!plain.empty())
            sodium_memzero(plain.data(), plain.size());
        err.index = index;
        return fail(err, Errc::auth_failed, "chunk failed authentication");
    }
    plain.resize(static_cast<std::size_t>(mlen));
    out = std::move(plain);
    return true;
}

// ======================================================================
// PlaintextTransportCrypto
// ======================================================================

bool PlaintextTransportCrypto::generate_ephemeral_key_pair(KeyPair &out, Error &err)
{
    ensure_sodium_init();
    randombytes_buf(out.secret.data(), out.secret.size());
    std::vector<std::uint8_t> secret(out.secret.begin(), out.secret.end());
    return key_pair_from_secret(secret, out, err);
}

bool PlaintextTransportCrypto::key_pair_from_secret(const std::vector<std::uint8_t> &secret,
                                                    KeyPair                         &out,
                                                    Error                           &err)
{
    if (secret.size() != SECRET_KEY_SIZE)
        return fail(err, Errc::key_derivation_failed, "identity secret must be 32 bytes");
    std::copy(secret.begin(), secret.end(), out.secret.begin());
    ensure_sodium_init();
    crypto_generichash(out.public_raw.data(), out.public_raw.size(), secret.data(), secret.size(),
                       nullptr, 0);
    return true;
}

bool PlaintextTransportCrypto::derive_shared_key(const KeyPair                   &mine,
                                                 const std::vector<std::uint8_t> &peer_public_raw,
                                                 SharedKey                       &out,
                                                 Error                           &err)
{
    PublicKey peer{};
    if (!peer_key_from_raw(peer_public_raw, peer, err))
        return false;
    ensure_sodium_init();
    if (!hash_shared(nullptr, 0, mine.public_raw, peer, out))
        return fail(err, Errc::key_derivation_failed, "BLAKE2b failed");
    return true;
}

bool PlaintextTransportCrypto::encrypt_chunk(const SharedKey & /*key*/,
                                             std::uint64_t /*session_id*/,
                                             std::uint16_t /*index*/,
                                             const std::vector<std::uint8_t> &plaintext,
                                             std::vector<std::uint8_t>       &out,
                                             Error & /*err*/)
{
    // [PLAINTEXT][TAG (16 zero bytes)]
    out.assign(plaintext.begin(), plaintext.end());
    out.insert(out.end(), TAG_SIZE, 0);
    return true;
}

bool PlaintextTransportCrypto::decrypt_chunk(const SharedKey & /*key*/,
                                             std::uint64_t /*session_id*/,
                                             std::uint16_t                    index,
                                             const std::vector<std::uint8_t> &ciphertext,
                                             std::vector<std::uint8_t>       &out,
                                             Error                           &err)
{
    out.clear();
    if (ciphertext.size() < TAG_SIZE)
    {
        err.index = index;
        return fail(err, Errc::auth_failed, "ciphertext shorter than tag");
    }
    out.assign(ciphertext.begin(), ciphertext.end() - TAG_SIZE);
    return true;
}

std::unique_ptr<TransportCrypto> make_transport_crypto(const std::string &name)
{
    if (name == "sodium")
    {
        LOG_INFO("[CRYPTO] using SodiumTransportCrypto (X25519 + XChaCha20-Poly1305)");
        return std::make_unique<SodiumTransportCrypto>();
    }
    if (name == "plaintext")
    {
        LOG_WARN("[CRYPTO] using PlaintextTransportCrypto (encryption disabled, dev only)");
        return std::make_unique<PlaintextTransportCrypto>();
    }
    LOG_ERROR("[CRYPTO] unknown crypto implementation '%s'", name.c_str());
    return nullptr;
}

}  // namespace crypto
