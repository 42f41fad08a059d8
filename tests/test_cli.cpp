// tests/test_cli.cpp
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <sys/wait.h>
#include <unistd.h>

namespace test_cli
{
const std::string KEY(64, '7');

static std::filesystem::path temp_dir()
{
    const char *tmp  = std::getenv("TMPDIR");
    std::string base = (tmp && *tmp) ? tmp : "/tmp";
    auto        dir  = std::filesystem::path(base) / ("txrelay-cli-test-" + std::to_string(::getpid()));
    std::filesystem::create_directories(dir);
    return dir;
}

static int run_sh(const std::string &cmd)
{
    int rc = std::system(cmd.c_str());
    if (rc == -1)
        return -1;
    return WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
}

static int run_cli(const std::string &args)
{
    // ctest runs from the build directory; binaries live in ./bin
    return run_sh("./bin/txrelay " + args);
}

static std::string slurp(const std::filesystem::path &p)
{
    std::ifstream      in(p, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void spit(const std::filesystem::path &p, const std::string &data)
{
    std::ofstream out(p, std::ios::binary);
    out << data;
}
}  // namespace test_cli

TEST(CLI, UsageAndUnknownCommands)
{
    EXPECT_EQ(test_cli::run_cli("> /dev/null 2>&1"), 2);
    EXPECT_EQ(test_cli::run_cli("frobnicate > /dev/null 2>&1"), 2);
    EXPECT_EQ(test_cli::run_cli("-h > /dev/null 2>&1"), 0);
    EXPECT_EQ(test_cli::run_cli("keygen extra > /dev/null 2>&1"), 2);
    EXPECT_EQ(test_cli::run_cli("send not-a-mac < /dev/null > /dev/null 2>&1"), 2);
}

TEST(CLI, KeygenPrintsKeyPair)
{
    const auto dir = test_cli::temp_dir();
    const auto out = dir / "keys.txt";
    ASSERT_EQ(test_cli::run_cli("keygen > " + out.string() + " 2>/dev/null"), 0);

    const std::string text = test_cli::slurp(out);
    const auto        s    = text.find("secret ");
    const auto        p    = text.find("public ");
    ASSERT_NE(s, std::string::npos);
    ASSERT_NE(p, std::string::npos);
    EXPECT_EQ(text.find('\n', s) - (s + 7), 64u);
    EXPECT_EQ(text.find('\n', p) - (p + 7), 64u);
    std::filesystem::remove_all(dir);
}

TEST(CLI, QrPagesRoundTripThroughPipes)
{
    const auto        dir     = test_cli::temp_dir();
    const auto        in      = dir / "payload.bin";
    const auto        pages   = dir / "pages.txt";
    const auto        out     = dir / "decoded.bin";
    const std::string payload = "signed-tx:0011223344556677";
    test_cli::spit(in, payload);

    ASSERT_EQ(test_cli::run_cli("qr-encode --key " + test_cli::KEY + " --sid ab --chunk 4 < " +
                                in.string() + " > " + pages.string() + " 2>/dev/null"),
              0);
    const std::string text = test_cli::slurp(pages);
    EXPECT_EQ(text.rfind("VQR:1:00000000000000ab:0:", 0), 0u);

    // reverse the page order on the way in
    ASSERT_EQ(test_cli::run_sh("tac " + pages.string() + " | ./bin/txrelay qr-decode --key " +
                               test_cli::KEY + " > " + out.string() + " 2>/dev/null"),
              0);
    EXPECT_EQ(test_cli::slurp(out), payload);
    std::filesystem::remove_all(dir);
}

TEST(CLI, QrDecodeReportsMissingPages)
{
    const auto dir   = test_cli::temp_dir();
    const auto in    = dir / "payload.bin";
    const auto pages = dir / "pages.txt";
    const auto err   = dir / "err.txt";
    test_cli::spit(in, std::string(40, 'x'));

    ASSERT_EQ(test_cli::run_cli("qr-encode --chunk 8 < " + in.string() + " > " + pages.string() +
                                " 2>/dev/null"),
              0);
    EXPECT_EQ(test_cli::run_sh("head -n1 " + pages.string() + " | ./bin/txrelay qr-decode > " +
                               "/dev/null 2> " + err.string()),
              4);
    EXPECT_NE(test_cli::slurp(err).find("(1/5 pages)"), std::string::npos);

    EXPECT_EQ(test_cli::run_sh("echo 'VQR:2:garbage' | ./bin/txrelay qr-decode > /dev/null "
                               "2>/dev/null"),
              4);
    EXPECT_EQ(test_cli::run_cli("qr-decode --key 1234 < /dev/null > /dev/null 2>&1"), 2);
    std::filesystem::remove_all(dir);
}
