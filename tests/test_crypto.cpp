// tests/test_crypto.cpp
#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "crypto/transport_crypto.hpp"

using namespace crypto;
using txrelay::Errc;
using txrelay::Error;

static std::vector<std::uint8_t> gen_bytes(std::size_t n)
{
    std::vector<std::uint8_t> v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = static_cast<std::uint8_t>((i * 7) & 0xFF);
    return v;
}

static std::vector<std::uint8_t> pub_bytes(const KeyPair &kp)
{
    return std::vector<std::uint8_t>(kp.public_raw.begin(), kp.public_raw.end());
}

TEST(Crypto, SharedKeyAgreesOnBothSides)
{
    SodiumTransportCrypto tc;
    KeyPair               sender, receiver;
    Error                 err;
    ASSERT_TRUE(tc.generate_ephemeral_key_pair(sender, err)) << err.message();
    ASSERT_TRUE(tc.generate_ephemeral_key_pair(receiver, err)) << err.message();

    SharedKey k1{}, k2{};
    ASSERT_TRUE(tc.derive_shared_key(sender, pub_bytes(receiver), k1, err)) << err.message();
    ASSERT_TRUE(tc.derive_shared_key(receiver, pub_bytes(sender), k2, err)) << err.message();
    EXPECT_EQ(k1, k2);

    KeyPair third;
    ASSERT_TRUE(tc.generate_ephemeral_key_pair(third, err));
    SharedKey k3{};
    ASSERT_TRUE(tc.derive_shared_key(third, pub_bytes(receiver), k3, err));
    EXPECT_NE(k1, k3);
}

TEST(Crypto, KeyPairFromSecretIsStable)
{
    SodiumTransportCrypto     tc;
    std::vector<std::uint8_t> secret(SECRET_KEY_SIZE, 0x11);
    KeyPair                   a, b;
    Error                     err;
    ASSERT_TRUE(tc.key_pair_from_secret(secret, a, err));
    ASSERT_TRUE(tc.key_pair_from_secret(secret, b, err));
    EXPECT_EQ(a.public_raw, b.public_raw);

    secret.pop_back();
    EXPECT_FALSE(tc.key_pair_from_secret(secret, a, err));
    EXPECT_EQ(err.code, Errc::key_derivation_failed);
}

TEST(Crypto, RejectsBadPeerKeys)
{
    SodiumTransportCrypto tc;
    KeyPair               mine;
    Error                 err;
    ASSERT_TRUE(tc.generate_ephemeral_key_pair(mine, err));

    SharedKey out{};
    EXPECT_FALSE(tc.derive_shared_key(mine, std::vector<std::uint8_t>(31, 1), out, err));
    EXPECT_EQ(err.code, Errc::bad_peer_key);

    // the identity point yields an all-zero secret
    err.clear();
    EXPECT_FALSE(tc.derive_shared_key(mine, std::vector<std::uint8_t>(32, 0), out, err));
    EXPECT_EQ(err.code, Errc::bad_peer_key);
}

TEST(Crypto, ChunkRoundTripAndBinding)
{
    SodiumTransportCrypto tc;
    SharedKey             key{};
    key.fill(7);
    const auto plain = gen_bytes(200);

    std::vector<std::uint8_t> ct, back;
    Error                     err;
    ASSERT_TRUE(tc.encrypt_chunk(key, 0x1234, 3, plain, ct, err));
    EXPECT_EQ(ct.size(), plain.size() + TAG_SIZE);
    EXPECT_NE(std::vector<std::uint8_t>(ct.begin(), ct.begin() + plain.size()), plain);

    ASSERT_TRUE(tc.decrypt_chunk(key, 0x1234, 3, ct, back, err)) << err.message();
    EXPECT_EQ(back, plain);

    // same key, same position: same bytes
    std::vector<std::uint8_t> ct2;
    ASSERT_TRUE(tc.encrypt_chunk(key, 0x1234, 3, plain, ct2, err));
    EXPECT_EQ(ct, ct2);

    // bound to index and session
    EXPECT_FALSE(tc.decrypt_chunk(key, 0x1234, 4, ct, back, err));
    EXPECT_EQ(err.code, Errc::auth_failed);
    EXPECT_EQ(err.index, 4);
    err.clear();
    EXPECT_FALSE(tc.decrypt_chunk(key, 0x1235, 3, ct, back, err));
    EXPECT_EQ(err.code, Errc::auth_failed);
    EXPECT_TRUE(back.empty());
}

TEST(Crypto, TamperedCiphertextFails)
{
    SodiumTransportCrypto tc;
    SharedKey             key{};
    key.fill(9);
    std::vector<std::uint8_t> ct, back;
    Error                     err;
    ASSERT_TRUE(tc.encrypt_chunk(key, 1, 0, gen_bytes(32), ct, err));
    ct[5] ^= 0x01;
    EXPECT_FALSE(tc.decrypt_chunk(key, 1, 0, ct, back, err));
    EXPECT_EQ(err.code, Errc::auth_failed);

    err.clear();
    EXPECT_FALSE(tc.decrypt_chunk(key, 1, 0, std::vector<std::uint8_t>(TAG_SIZE - 1), back, err));
    EXPECT_EQ(err.code, Errc::auth_failed);
}

TEST(Crypto, PlaintextKeepsWireShape)
{
    PlaintextTransportCrypto tc;
    EXPECT_FALSE(tc.authenticated());
    SharedKey                 key{};
    const auto                plain = gen_bytes(40);
    std::vector<std::uint8_t> ct, back;
    Error                     err;
    ASSERT_TRUE(tc.encrypt_chunk(key, 1, 0, plain, ct, err));
    ASSERT_EQ(ct.size(), plain.size() + TAG_SIZE);
    EXPECT_EQ(std::vector<std::uint8_t>(ct.begin(), ct.begin() + plain.size()), plain);
    ASSERT_TRUE(tc.decrypt_chunk(key, 1, 0, ct, back, err));
    EXPECT_EQ(back, plain);

    KeyPair a, b;
    ASSERT_TRUE(tc.generate_ephemeral_key_pair(a, err));
    ASSERT_TRUE(tc.generate_ephemeral_key_pair(b, err));
    SharedKey k1{}, k2{};
    ASSERT_TRUE(tc.derive_shared_key(a, pub_bytes(b), k1, err));
    ASSERT_TRUE(tc.derive_shared_key(b, pub_bytes(a), k2, err));
    EXPECT_EQ(k1, k2);
}

TEST(Crypto, FactoryByName)
{
    EXPECT_STREQ(make_transport_crypto("sodium")->name(), "sodium");
    EXPECT_STREQ(make_transport_crypto("plaintext")->name(), "plaintext");

    testing::internal::CaptureStderr();
    auto none = make_transport_crypto("rot13");
    std::string log = testing::internal::GetCapturedStderr();
    EXPECT_EQ(none, nullptr);
    EXPECT_NE(log.find("[CRYPTO]"), std::string::npos);
}

TEST(Crypto, HexHelpers)
{
    const std::uint8_t        raw[] = {0x00, 0xAB, 0xFF};
    std::vector<std::uint8_t> out;
    EXPECT_EQ(to_hex(raw, sizeof raw), "00abff");
    ASSERT_TRUE(from_hex("00abff", out));
    EXPECT_EQ(out, std::vector<std::uint8_t>(raw, raw + 3));
    ASSERT_TRUE(from_hex("00:AB:FF", out));
    EXPECT_EQ(out.size(), 3u);
    EXPECT_FALSE(from_hex("zz", out));
}

TEST(Crypto, Digest16IsStable)
{
    const auto data = gen_bytes(100);
    EXPECT_EQ(digest16(data.data(), data.size()), digest16(data.data(), data.size()));
    auto other = data;
    other[0] ^= 1;
    EXPECT_NE(digest16(data.data(), data.size()), digest16(other.data(), other.size()));
}
