// tests/test_qr_pages.cpp
#include <algorithm>
#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "crypto/transport_crypto.hpp"
#include "proto/qr_pages.hpp"

using txrelay::Errc;
using txrelay::Error;

static std::vector<std::uint8_t> gen_bytes(std::size_t n)
{
    std::vector<std::uint8_t> v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = static_cast<std::uint8_t>((i * 31 + 5) & 0xFF);
    return v;
}

static std::vector<std::string> make_pages(std::uint64_t sid, const std::vector<std::uint8_t> &data,
                                           std::size_t chunk)
{
    std::vector<std::string> pages;
    Error                    err;
    EXPECT_TRUE(qr::build_qr_pages(sid, data, nullptr, false, chunk, nullptr, pages, err))
        << err.message();
    return pages;
}

TEST(QrPages, PageLayout)
{
    auto pages = make_pages(0x00000000000000FFULL, {'a', 'b', 'c'}, 100);
    ASSERT_EQ(pages.size(), 1u);
    const std::string &p = pages[0];
    EXPECT_EQ(p.rfind("VQR:1:00000000000000ff:0:1:1:", 0), 0u) << p;
    EXPECT_EQ(p.substr(p.size() - 4), "YWJj");  // base64url("abc")
}

TEST(QrPages, ShuffledPagesReassemble)
{
    const auto data  = gen_bytes(1000);
    auto       pages = make_pages(42, data, 64);
    ASSERT_EQ(pages.size(), 16u);
    std::reverse(pages.begin(), pages.end());

    Error err;
    auto  back = qr::parse_qr_pages(pages, nullptr, false, nullptr, err);
    ASSERT_TRUE(back.has_value()) << err.message();
    EXPECT_EQ(*back, data);
}

TEST(QrPages, FiftyBytesInThirtyTwoBytePagesReversed)
{
    const auto data  = gen_bytes(50);
    auto       pages = make_pages(0x50, data, 32);
    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(pages[0].rfind("VQR:1:0000000000000050:0:2:", 0), 0u) << pages[0];
    EXPECT_EQ(pages[1].rfind("VQR:1:0000000000000050:1:2:", 0), 0u) << pages[1];
    std::reverse(pages.begin(), pages.end());

    Error err;
    auto  back = qr::parse_qr_pages(pages, nullptr, false, nullptr, err);
    ASSERT_TRUE(back.has_value()) << err.message();
    EXPECT_EQ(*back, data);

    qr::PageCollector collector;
    for (const auto &p : pages)
        EXPECT_NE(collector.add(p, err), qr::PageCollector::Add::rejected) << err.message();
    ASSERT_TRUE(collector.ready());
    auto assembled = collector.assemble(nullptr, false, nullptr, err);
    ASSERT_TRUE(assembled.has_value()) << err.message();
    EXPECT_EQ(*assembled, data);
}

TEST(QrPages, EncryptedPagesNeedTheKey)
{
    crypto::SodiumTransportCrypto tc;
    crypto::SharedKey             key{};
    key.fill(0x5A);
    const auto data = gen_bytes(300);

    std::vector<std::string> pages;
    Error                    err;
    ASSERT_TRUE(qr::build_qr_pages(7, data, &key, true, 128, &tc, pages, err));

    auto back = qr::parse_qr_pages(pages, &key, true, &tc, err);
    ASSERT_TRUE(back.has_value()) << err.message();
    EXPECT_EQ(*back, data);

    crypto::SharedKey wrong{};
    err.clear();
    EXPECT_FALSE(qr::parse_qr_pages(pages, &wrong, true, &tc, err).has_value());
    EXPECT_EQ(err.code, Errc::auth_failed);
}

TEST(QrPages, MalformedPagesAreRejected)
{
    const std::vector<std::string> bad = {
        "",
        "XQR:1:00000000000000ff:0:1:1:00000000:YWJj",
        "VQR:2:00000000000000ff:0:1:1:00000000:YWJj",
        "VQR:1:ff:0:1:1:00000000:YWJj",
        "VQR:1:00000000000000ff:1:1:1:00000000:YWJj",
        "VQR:1:00000000000000ff:0:0:1:00000000:YWJj",
        "VQR:1:00000000000000ff:0:1:1:0000:YWJj",
        "VQR:1:00000000000000ff:0:1:1:00000000:***",
        "VQR:1:00000000000000ff:0:1:1:00000000",
    };
    for (const auto &page : bad)
    {
        Error err;
        EXPECT_FALSE(qr::decode_page(page, err).has_value()) << page;
        EXPECT_EQ(err.code, Errc::malformed_page) << page;
    }
}

TEST(QrPages, TamperedPayloadFailsChecksum)
{
    auto pages = make_pages(3, gen_bytes(90), 30);
    ASSERT_EQ(pages.size(), 3u);
    std::string &p    = pages[1];
    char        &last = p.back();
    last              = (last == 'A') ? 'B' : 'A';

    Error err;
    EXPECT_FALSE(qr::parse_qr_pages(pages, nullptr, false, nullptr, err).has_value());
    EXPECT_EQ(err.code, Errc::checksum_mismatch);
    EXPECT_EQ(err.index, 1);
}

TEST(QrPages, CollectorTracksProgress)
{
    const auto data  = gen_bytes(250);
    auto       pages = make_pages(0xC0FFEE, data, 100);
    ASSERT_EQ(pages.size(), 3u);

    qr::PageCollector c;
    Error             err;
    EXPECT_EQ(c.add(pages[2], err), qr::PageCollector::Add::accepted);
    EXPECT_EQ(c.add(pages[2], err), qr::PageCollector::Add::duplicate);
    EXPECT_EQ(c.session_id(), 0xC0FFEEu);
    EXPECT_EQ(c.total(), 3u);
    EXPECT_FALSE(c.ready());

    EXPECT_FALSE(c.assemble(nullptr, false, nullptr, err).has_value());
    EXPECT_EQ(err.code, Errc::incomplete);

    err.clear();
    EXPECT_EQ(c.add(pages[0], err), qr::PageCollector::Add::accepted);
    EXPECT_EQ(c.add(pages[1], err), qr::PageCollector::Add::accepted);
    ASSERT_TRUE(c.ready());
    auto back = c.assemble(nullptr, false, nullptr, err);
    ASSERT_TRUE(back.has_value()) << err.message();
    EXPECT_EQ(*back, data);

    c.reset();
    EXPECT_EQ(c.have(), 0u);
    EXPECT_EQ(c.total(), 0u);
}

TEST(QrPages, CollectorRejectsForeignSession)
{
    auto a = make_pages(1, gen_bytes(200), 100);
    auto b = make_pages(2, gen_bytes(200), 100);

    qr::PageCollector c;
    Error             err;
    ASSERT_EQ(c.add(a[0], err), qr::PageCollector::Add::accepted);
    EXPECT_EQ(c.add(b[1], err), qr::PageCollector::Add::rejected);
    EXPECT_EQ(err.code, Errc::inconsistent);
    EXPECT_EQ(c.have(), 1u);
}
