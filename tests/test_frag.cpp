// tests/test_frag.cpp
#include <cstdint>
#include <gtest/gtest.h>
#include <vector>

#include "crypto/transport_crypto.hpp"
#include "proto/frag.hpp"

using namespace frag;
using txrelay::Errc;
using txrelay::Error;

static std::vector<std::uint8_t> gen_bytes(std::size_t n)
{
    std::vector<std::uint8_t> v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = static_cast<std::uint8_t>(i & 0xFF);
    return v;
}

static std::vector<Chunk> plain_chunks(std::uint64_t sid, const std::vector<std::uint8_t> &data,
                                       std::size_t chunk_size)
{
    std::vector<Chunk> out;
    Error              err;
    EXPECT_TRUE(build_chunks(sid, data, nullptr, false, chunk_size, nullptr, out, err))
        << err.message();
    return out;
}

TEST(Frag, HeaderPackUnpack)
{
    Header h{};
    h.flags      = FLAG_FINAL | FLAG_ENCRYPTED;
    h.session_id = 0x0102030405060708ULL;
    h.index      = 3;
    h.total      = 7;
    h.len        = 55;
    h.checksum   = 0xDEADBEEF;

    std::uint8_t buf[HDR_SIZE];
    ASSERT_TRUE(pack_header(h, buf));
    EXPECT_EQ(buf[0], KIND_DATA);
    EXPECT_EQ(buf[4], 0x01);  // session id is big-endian
    EXPECT_EQ(buf[11], 0x08);

    Header h2{};
    ASSERT_TRUE(unpack_header(buf, h2));

    EXPECT_EQ(h2.kind, KIND_DATA);
    EXPECT_EQ(h2.ver, PROTO_VER);
    EXPECT_EQ(h2.flags, FLAG_FINAL | FLAG_ENCRYPTED);
    EXPECT_EQ(h2.session_id, 0x0102030405060708ULL);
    EXPECT_EQ(h2.index, 3u);
    EXPECT_EQ(h2.total, 7u);
    EXPECT_EQ(h2.len, 55u);
    EXPECT_EQ(h2.checksum, 0xDEADBEEFu);
}

TEST(Frag, PackHeader_RejectsIndexOutOfRange)
{
    Header h{};
    h.index = 4;
    h.total = 4;
    std::uint8_t buf[HDR_SIZE];
    EXPECT_FALSE(pack_header(h, buf));

    h.index = 0;
    h.total = 0;
    EXPECT_FALSE(pack_header(h, buf));
}

TEST(Frag, SerializeParse_Frame)
{
    auto chunks = plain_chunks(99, {'h', 'e', 'l', 'l', 'o'}, 100);
    ASSERT_EQ(chunks.size(), 1u);

    auto frame = serialize(chunks[0]);
    ASSERT_EQ(frame.size(), HDR_SIZE + 5);

    auto parsed = parse(frame);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->hdr.session_id, 99u);
    EXPECT_EQ(parsed->hdr.flags, FLAG_FINAL);
    EXPECT_EQ(parsed->hdr.total, 1u);
    EXPECT_EQ(parsed->hdr.checksum, chunks[0].hdr.checksum);
    EXPECT_EQ(parsed->payload, chunks[0].payload);
}

TEST(Frag, Parse_RejectBadSize)
{
    auto chunks = plain_chunks(5, gen_bytes(16), 100);
    auto frame  = serialize(chunks[0]);
    ASSERT_FALSE(frame.empty());
    frame.pop_back();  // size no longer equals HDR_SIZE + len

    EXPECT_FALSE(parse(frame).has_value());
    EXPECT_FALSE(parse({KIND_DATA, PROTO_VER}).has_value());
}

TEST(Frag, BuildChunks_EmptyPayload)
{
    auto chunks = plain_chunks(123, {}, 100);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].hdr.index, 0u);
    EXPECT_EQ(chunks[0].hdr.total, 1u);
    EXPECT_EQ(chunks[0].hdr.len, 0u);
    EXPECT_TRUE(chunks[0].hdr.flags & FLAG_FINAL);

    Error err;
    auto  back = parse_chunks(chunks, nullptr, false, nullptr, err);
    ASSERT_TRUE(back.has_value()) << err.message();
    EXPECT_TRUE(back->empty());
}

TEST(Frag, BuildChunks_ExactAndNonMultiple)
{
    auto exact = plain_chunks(1, gen_bytes(300), 100);
    ASSERT_EQ(exact.size(), 3u);
    for (std::size_t i = 0; i < exact.size(); ++i)
    {
        EXPECT_EQ(exact[i].hdr.index, i);
        EXPECT_EQ(exact[i].hdr.total, 3u);
        EXPECT_EQ(exact[i].hdr.len, 100u);
        EXPECT_EQ(exact[i].hdr.flags & FLAG_FINAL, i == 2 ? FLAG_FINAL : 0);
    }

    auto ragged = plain_chunks(2, gen_bytes(230), 100);
    ASSERT_EQ(ragged.size(), 3u);
    EXPECT_EQ(ragged[2].hdr.len, 30u);
    EXPECT_EQ(chunk_count(230, 100), 3u);
    EXPECT_EQ(chunk_count(0, 100), 1u);
}

TEST(Frag, BuildChunks_Deterministic)
{
    auto a = plain_chunks(7, gen_bytes(500), 64);
    auto b = plain_chunks(7, gen_bytes(500), 64);
    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i)
        EXPECT_EQ(serialize(a[i]), serialize(b[i]));
}

TEST(Frag, BuildChunks_RejectsBadArguments)
{
    std::vector<Chunk> out;
    Error              err;
    EXPECT_FALSE(build_chunks(1, gen_bytes(10), nullptr, false, 0, nullptr, out, err));
    EXPECT_EQ(err.code, Errc::invalid_argument);

    err.clear();
    EXPECT_FALSE(build_chunks(1, gen_bytes(10), nullptr, true, 4, nullptr, out, err));
    EXPECT_EQ(err.code, Errc::missing_session_key);

    err.clear();
    EXPECT_FALSE(build_chunks(1, gen_bytes(MAX_CHUNKS + 1), nullptr, false, 1, nullptr, out, err));
    EXPECT_EQ(err.code, Errc::payload_too_large);
    EXPECT_TRUE(out.empty());
}

TEST(Frag, ParseChunks_OutOfOrderWithDuplicate)
{
    const auto bytes  = gen_bytes(230);
    auto       chunks = plain_chunks(77, bytes, 100);
    std::vector<Chunk> shuffled{chunks[2], chunks[0], chunks[0], chunks[1]};

    Error err;
    auto  back = parse_chunks(shuffled, nullptr, false, nullptr, err);
    ASSERT_TRUE(back.has_value()) << err.message();
    EXPECT_EQ(*back, bytes);
}

TEST(Frag, ParseChunks_MissingIndexIsIncomplete)
{
    auto chunks = plain_chunks(8, gen_bytes(230), 100);
    chunks.erase(chunks.begin() + 1);

    Error err;
    EXPECT_FALSE(parse_chunks(chunks, nullptr, false, nullptr, err).has_value());
    EXPECT_EQ(err.code, Errc::incomplete);
    EXPECT_EQ(err.index, 1);
    EXPECT_EQ(err.session_id, 8u);
}

TEST(Frag, ParseChunks_TotalMismatchIsInconsistent)
{
    auto a = plain_chunks(9, gen_bytes(200), 100);  // total 2
    auto b = plain_chunks(9, gen_bytes(300), 100);  // total 3
    std::vector<Chunk> mixed{a[0], b[1]};

    Error err;
    EXPECT_FALSE(parse_chunks(mixed, nullptr, false, nullptr, err).has_value());
    EXPECT_EQ(err.code, Errc::inconsistent);
}

TEST(Frag, ParseChunks_CorruptPayloadIsChecksumMismatch)
{
    auto chunks = plain_chunks(10, gen_bytes(230), 100);
    chunks[2].payload[0] ^= 0xFF;

    Error err;
    EXPECT_FALSE(parse_chunks(chunks, nullptr, false, nullptr, err).has_value());
    EXPECT_EQ(err.code, Errc::checksum_mismatch);
    EXPECT_EQ(err.index, 2);
}

TEST(Frag, EncryptedChunks_OpenWithSameKey)
{
    crypto::SodiumTransportCrypto tc;
    crypto::SharedKey             key{};
    key.fill(0x42);

    const auto         bytes = gen_bytes(700);
    std::vector<Chunk> chunks;
    Error              err;
    ASSERT_TRUE(build_chunks(11, bytes, &key, true, 256, &tc, chunks, err)) << err.message();
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_TRUE(chunks[0].hdr.flags & FLAG_ENCRYPTED);
    EXPECT_EQ(chunks[0].payload.size(), 256 + crypto::TAG_SIZE);

    auto back = parse_chunks(chunks, &key, true, &tc, err);
    ASSERT_TRUE(back.has_value()) << err.message();
    EXPECT_EQ(*back, bytes);

    crypto::SharedKey other{};
    other.fill(0x43);
    err.clear();
    EXPECT_FALSE(parse_chunks(chunks, &other, true, &tc, err).has_value());
    EXPECT_EQ(err.code, Errc::auth_failed);
}

TEST(Frag, AckEncodeDecode)
{
    Ack a;
    a.session_id = 0xABCDEF;
    a.index      = KEY_INDEX;
    a.status     = AckStatus::retry;

    auto frame = encode_ack(a);
    ASSERT_EQ(frame.size(), ACK_SIZE);
    EXPECT_EQ(frame_kind(frame), KIND_ACK);

    auto back = decode_ack(frame);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->session_id, 0xABCDEFu);
    EXPECT_EQ(back->index, KEY_INDEX);
    EXPECT_EQ(back->status, AckStatus::retry);

    frame[2] = 9;  // unknown status
    EXPECT_FALSE(decode_ack(frame).has_value());
    frame.pop_back();
    EXPECT_FALSE(decode_ack(frame).has_value());
}

TEST(Frag, Reassembler_FeedResults)
{
    auto chunks = plain_chunks(77, gen_bytes(230), 100);
    ASSERT_EQ(chunks.size(), 3u);

    Reassembler r;
    EXPECT_EQ(r.feed(chunks[0]), Reassembler::Result::stored);
    EXPECT_EQ(r.feed(chunks[0]), Reassembler::Result::duplicate);
    EXPECT_EQ(r.feed(chunks[2]), Reassembler::Result::stored);
    EXPECT_EQ(r.received(77), 2u);
    EXPECT_EQ(r.total(77), 3u);

    Chunk altered = chunks[2];
    altered.payload[0] ^= 1;
    EXPECT_EQ(r.feed(altered), Reassembler::Result::conflict);

    EXPECT_EQ(r.feed(chunks[1]), Reassembler::Result::complete);
    auto parts = r.take(77);
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[1].hdr.index, 1u);
    EXPECT_FALSE(r.contains(77));
}

TEST(Frag, Reassembler_TotalChangeIsConflict)
{
    auto a = plain_chunks(5, gen_bytes(200), 100);
    auto b = plain_chunks(5, gen_bytes(300), 100);

    Reassembler r;
    EXPECT_EQ(r.feed(a[0]), Reassembler::Result::stored);
    EXPECT_EQ(r.feed(b[1]), Reassembler::Result::conflict);
}
