#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <memory>
#include <sodium.h>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "app/identity.hpp"
#include "app/relay_service.hpp"
#include "crypto/transport_crypto.hpp"
#include "proto/qr_pages.hpp"
#include "transport/bluez_driver.hpp"
#include "util/clock.hpp"
#include "util/config.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

using txrelay::Errc;
using txrelay::Error;

std::atomic<bool> g_stop{false};

void on_signal(int)
{
    g_stop.store(true);
}

bool is_valid_mac(const std::string &mac)
{
    if (mac.size() != 17)
        return false;
    for (size_t i = 0; i < mac.size(); ++i)
    {
        if ((i % 3) == 2)
        {
            if (mac[i] != ':')
                return false;
        }
        else if (!std::isxdigit(static_cast<unsigned char>(mac[i])))
        {
            return false;
        }
    }
    return true;
}

std::string to_upper(std::string s)
{
    for (auto &c : s)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
void print_usage()
{
    std::fprintf(stderr,
                 "Usage:\n"
                 "  txrelay [--adapter hciN] <command> [args]\n"
                 "\n"
                 "Commands:\n"
                 "  keygen                               print an identity key pair\n"
                 "  qr-encode [--key HEX] [--sid HEX] [--chunk N] < payload > pages\n"
                 "  qr-decode [--key HEX] < pages > payload\n"
                 "  scan [--timeout MS]                  list advertising relays\n"
                 "  receive [--count N]                  accept envelopes (stdout: hex)\n"
                 "  send AA:BB:CC:DD:EE:FF [--amount A] [--recipient R] [--memo M] < payload\n"
                 "\n"
                 "Configuration comes from TXRELAY_* environment variables.\n");
}

// Splits "--name value" pairs off args[first..]; positional leftovers go to `rest`.
bool parse_flags(const std::vector<std::string>            &args,
                 size_t                                      first,
                 std::unordered_map<std::string, std::string> &flags,
                 std::vector<std::string>                   &rest)
{
    for (size_t i = first; i < args.size(); ++i)
    {
        const std::string &a = args[i];
        if (a.rfind("--", 0) == 0)
        {
            if (i + 1 >= args.size())
            {
                std::fprintf(stderr, "error: %s needs a value\n", a.c_str());
                return false;
            }
            flags[a.substr(2)] = args[++i];
        }
        else
        {
            rest.push_back(a);
        }
    }
    return true;
}

bool parse_uint(const std::string &s, unsigned long max, unsigned long &out)
{
    if (s.empty())
        return false;
    char         *end = nullptr;
    unsigned long v   = std::strtoul(s.c_str(), &end, 10);
    if (!end || *end != '\0' || v > max)
        return false;
    out = v;
    return true;
}

bool read_all(std::FILE *f, std::vector<std::uint8_t> &out)
{
    std::uint8_t buf[4096];
    size_t       n;
    while ((n = std::fread(buf, 1, sizeof buf, f)) > 0)
        out.insert(out.end(), buf, buf + n);
    return !std::ferror(f);
}

bool parse_shared_key(const std::string &hex, crypto::SharedKey &key)
{
    std::vector<std::uint8_t> raw;
    if (!crypto::from_hex(hex, raw) || raw.size() != key.size())
        return false;
    std::copy(raw.begin(), raw.end(), key.begin());
    crypto::wipe(raw.data(), raw.size());
    return true;
}

int exit_for(const Error &err)
{
    switch (err.kind())
    {
    case txrelay::ErrorKind::None:
        return exitc::ok;
    case txrelay::ErrorKind::Config:
        return exitc::bad_args;
    case txrelay::ErrorKind::Connection:
        return err.code == Errc::driver_unavailable ? exitc::no_driver : exitc::transfer_err;
    default:
        return exitc::transfer_err;
    }
}

struct Env
{
    txrelay::RelayConfig cfg;
    std::string          adapter;
};

// --------------------------------------------------------------------
// offline commands
// --------------------------------------------------------------------
int cmd_keygen(const Env &env)
{
    auto tc = crypto::make_transport_crypto(env.cfg.crypto);
    if (!tc)
        return exitc::bad_args;
    crypto::KeyPair kp;
    Error           err;
    if (!tc->generate_ephemeral_key_pair(kp, err))
    {
        std::fprintf(stderr, "error: %s\n", err.message().c_str());
        return exitc::failure;
    }
    std::printf("secret %s\n", crypto::to_hex(kp.secret.data(), kp.secret.size()).c_str());
    std::printf("public %s\n", crypto::to_hex(kp.public_raw.data(), kp.public_raw.size()).c_str());
    return exitc::ok;
}

int cmd_qr_encode(const Env &env, const std::unordered_map<std::string, std::string> &flags)
{
    auto tc = crypto::make_transport_crypto(env.cfg.crypto);
    if (!tc)
        return exitc::bad_args;

    crypto::SharedKey key{};
    const bool        encrypt = flags.count("key") > 0;
    if (encrypt && !parse_shared_key(flags.at("key"), key))
    {
        std::fprintf(stderr, "error: --key expects 32 bytes of hex\n");
        return exitc::bad_args;
    }

    std::uint64_t sid = 0;
    if (flags.count("sid"))
    {
        if (!txrelay::parse_session_id(flags.at("sid"), sid) || sid == 0)
        {
            std::fprintf(stderr, "error: --sid expects up to 16 hex digits\n");
            return exitc::bad_args;
        }
    }
    while (sid == 0)
        randombytes_buf(&sid, sizeof sid);

    std::size_t chunk = env.cfg.qr_chunk_size;
    if (flags.count("chunk"))
    {
        unsigned long v = 0;
        if (!parse_uint(flags.at("chunk"), 65535 - crypto::TAG_SIZE, v) || v == 0)
        {
            std::fprintf(stderr, "error: --chunk expects 1..%zu\n", 65535 - crypto::TAG_SIZE);
            return exitc::bad_args;
        }
        chunk = v;
    }

    std::vector<std::uint8_t> payload;
    if (!read_all(stdin, payload))
    {
        std::fprintf(stderr, "error: reading stdin failed\n");
        return exitc::io_err;
    }

    std::vector<std::string> pages;
    Error                    err;
    const bool ok = qr::build_qr_pages(sid, payload, encrypt ? &key : nullptr, encrypt, chunk,
                                       tc.get(), pages, err);
    crypto::wipe(key.data(), key.size());
    if (!ok)
    {
        std::fprintf(stderr, "error: %s\n", err.message().c_str());
        return exit_for(err);
    }
    for (const auto &p : pages)
        std::printf("%s\n", p.c_str());
    LOG_INFO("[QR] sid=%s: %zu bytes in %zu pages", txrelay::format_session_id(sid).c_str(),
             payload.size(), pages.size());
    return exitc::ok;
}

int cmd_qr_decode(const Env &env, const std::unordered_map<std::string, std::string> &flags)
{
    auto tc = crypto::make_transport_crypto(env.cfg.crypto);
    if (!tc)
        return exitc::bad_args;

    crypto::SharedKey key{};
    const bool        decrypt = flags.count("key") > 0;
    if (decrypt && !parse_shared_key(flags.at("key"), key))
    {
        std::fprintf(stderr, "error: --key expects 32 bytes of hex\n");
        return exitc::bad_args;
    }

    qr::PageCollector collector;
    char              line[8192];
    Error             err;
    while (!collector.ready() && std::fgets(line, sizeof line, stdin))
    {
        std::string page(line);
        while (!page.empty() && std::isspace(static_cast<unsigned char>(page.back())))
            page.pop_back();
        if (page.empty())
            continue;
        if (collector.add(page, err) == qr::PageCollector::Add::rejected)
        {
            std::fprintf(stderr, "error: %s\n", err.message().c_str());
            crypto::wipe(key.data(), key.size());
            return exit_for(err);
        }
    }

    auto payload = collector.assemble(decrypt ? &key : nullptr, decrypt, tc.get(), err);
    crypto::wipe(key.data(), key.size());
    if (!payload)
    {
        std::fprintf(stderr, "error: %s (%zu/%u pages)\n", err.message().c_str(),
                     collector.have(), (unsigned)collector.total());
        return exit_for(err);
    }
    if (!payload->empty() && std::fwrite(payload->data(), 1, payload->size(), stdout) !=
                                 payload->size())
        return exitc::io_err;
    return exitc::ok;
}

// --------------------------------------------------------------------
// BLE commands
// --------------------------------------------------------------------
struct Stack
{
    std::unique_ptr<crypto::TransportCrypto> tc;
    app::StaticIdentityResolver              identity;
    util::SteadyClock                        clock;
    std::unique_ptr<transport::BluezDriver>  driver;
    std::unique_ptr<app::RelayService>       relay;
};

int bring_up(const Env &env, Stack &s)
{
    Error err;
    if (!txrelay::validate_config(env.cfg, err))
    {
        std::fprintf(stderr, "error: %s\n", err.message().c_str());
        return exitc::bad_args;
    }
    s.tc = crypto::make_transport_crypto(env.cfg.crypto);
    if (!s.tc)
        return exitc::bad_args;
    if (!env.cfg.peer_keys.empty() && !s.identity.parse(env.cfg.peer_keys, err))
    {
        std::fprintf(stderr, "error: TXRELAY_PEER_KEYS: %s\n", err.message().c_str());
        return exitc::bad_args;
    }

    transport::BluezConfig bcfg;
    bcfg.adapter = env.adapter;
    s.driver     = std::make_unique<transport::BluezDriver>(bcfg);
    s.relay = std::make_unique<app::RelayService>(*s.driver, *s.tc, s.identity, env.cfg, s.clock);
    if (!s.relay->start(err))
    {
        std::fprintf(stderr, "error: %s\n", err.message().c_str());
        return exit_for(err);
    }
    return exitc::ok;
}

int cmd_scan(const Env &env, const std::unordered_map<std::string, std::string> &flags)
{
    unsigned long timeout = env.cfg.discovery_timeout_ms;
    if (flags.count("timeout") && (!parse_uint(flags.at("timeout"), 86400000UL, timeout) ||
                                   timeout == 0))
    {
        std::fprintf(stderr, "error: --timeout expects milliseconds\n");
        return exitc::bad_args;
    }

    Stack s;
    int   rc = bring_up(env, s);
    if (rc != exitc::ok)
        return rc;

    Error err;
    bool  ok = s.relay->scan_for_peers(
        [](const ble::DeviceRecord &rec) {
            std::printf("%s rssi=%d %s\n", rec.device_id.c_str(), (int)rec.rssi,
                        rec.display_name.c_str());
            std::fflush(stdout);
        },
        static_cast<std::uint32_t>(timeout), err);
    if (!ok)
    {
        std::fprintf(stderr, "error: %s\n", err.message().c_str());
        return exit_for(err);
    }
    while (!g_stop.load() && s.relay->status().scanning)
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    s.relay->stop();
    return exitc::ok;
}

int cmd_receive(const Env &env, const std::unordered_map<std::string, std::string> &flags)
{
    unsigned long count = 0;  // 0 = until interrupted
    if (flags.count("count") && !parse_uint(flags.at("count"), 1000000UL, count))
    {
        std::fprintf(stderr, "error: --count expects a number\n");
        return exitc::bad_args;
    }

    Stack s;
    int   rc = bring_up(env, s);
    if (rc != exitc::ok)
        return rc;
    if (!s.relay->identity_public())
        LOG_WARN("[RELAY] TXRELAY_IDENTITY_KEY not set; only plaintext transfers work");

    std::atomic<unsigned long> got{0};
    s.relay->on_envelope_received([&](const transport::DeviceId &from, std::uint64_t sid,
                                      const app::TransactionEnvelope &envelope) {
        std::printf("%s %s %s\n", txrelay::format_session_id(sid).c_str(), from.c_str(),
                    crypto::to_hex(envelope.payload.data(), envelope.payload.size()).c_str());
        std::fflush(stdout);
        got.fetch_add(1);
    });

    Error err;
    if (!s.relay->enter_receiving_mode(err))
    {
        std::fprintf(stderr, "error: %s\n", err.message().c_str());
        return exit_for(err);
    }
    if (auto pub = s.relay->identity_public())
        LOG_SYSTEM("[RELAY] identity public key %s", crypto::to_hex(pub->data(), pub->size()).c_str());

    while (!g_stop.load() && (count == 0 || got.load() < count))
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    s.relay->stop();
    return exitc::ok;
}

int cmd_send(const Env                                          &env,
             const std::unordered_map<std::string, std::string> &flags,
             const std::vector<std::string>                     &rest)
{
    if (rest.size() != 1)
    {
        print_usage();
        return exitc::bad_args;
    }
    const std::string mac = to_upper(rest[0]);
    if (!is_valid_mac(mac))
    {
        std::fprintf(stderr, "error: invalid MAC address: %s\n", rest[0].c_str());
        return exitc::bad_args;
    }

    app::TransactionEnvelope envelope;
    if (!read_all(stdin, envelope.payload))
    {
        std::fprintf(stderr, "error: reading stdin failed\n");
        return exitc::io_err;
    }
    auto flag = [&](const char *k) { return flags.count(k) ? flags.at(k) : std::string{}; };
    envelope.metadata.amount    = flag("amount");
    envelope.metadata.recipient = flag("recipient");
    envelope.metadata.memo      = flag("memo");

    Stack s;
    int   rc = bring_up(env, s);
    if (rc != exitc::ok)
        return rc;

    auto result = s.relay->send_envelope(mac, envelope, [](std::uint64_t sid,
                                                           const ble::Progress &p) {
        LOG_INFO("[RELAY] sid=%s %zu/%zu frames (%.0f%%)", txrelay::format_session_id(sid).c_str(),
                 p.completed, p.total, p.percentage);
    });
    s.relay->stop();

    if (!result.success)
    {
        std::fprintf(stderr, "error: %s\n", result.error.message().c_str());
        return exit_for(result.error);
    }
    std::printf("%s %s\n", txrelay::format_session_id(result.session_id).c_str(),
                result.peer_confirmation ? result.peer_confirmation->c_str() : "-");
    return exitc::ok;
}

int run_cmd(const std::string &cmd, const std::vector<std::string> &args, const Env &env)
{
    std::unordered_map<std::string, std::string> flags;
    std::vector<std::string>                     rest;
    if (!parse_flags(args, 1, flags, rest))
    {
        print_usage();
        return exitc::bad_args;
    }
    auto no_positionals = [&]() {
        if (rest.empty())
            return true;
        std::fprintf(stderr, "error: unexpected argument '%s'\n", rest[0].c_str());
        print_usage();
        return false;
    };

    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"keygen", [&]() -> int { return no_positionals() ? cmd_keygen(env) : exitc::bad_args; }},
        {"qr-encode",
         [&]() -> int { return no_positionals() ? cmd_qr_encode(env, flags) : exitc::bad_args; }},
        {"qr-decode",
         [&]() -> int { return no_positionals() ? cmd_qr_decode(env, flags) : exitc::bad_args; }},
        {"scan", [&]() -> int { return no_positionals() ? cmd_scan(env, flags) : exitc::bad_args; }},
        {"receive",
         [&]() -> int { return no_positionals() ? cmd_receive(env, flags) : exitc::bad_args; }},
        {"send", [&]() -> int { return cmd_send(env, flags, rest); }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    txrelay::set_log_level_from_env();

    Env env;
    if (!txrelay::load_config_from_env(env.cfg))
        LOG_WARN("[CFG] some TXRELAY_* values were ignored");
    env.adapter = env.cfg.adapter;

    std::vector<std::string> args;
    args.reserve(argc > 1 ? argc - 1 : 0);
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (args.empty() && a == "--adapter" && i + 1 < argc)
            env.adapter = argv[++i];
        else
            args.push_back(std::move(a));
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    return run_cmd(args[0], args, env);
}
