#include <algorithm>
#include <cctype>

#include "app/identity.hpp"
#include "crypto/transport_crypto.hpp"
#include "util/log.hpp"

namespace app
{

using txrelay::Errc;
using txrelay::fail;

static std::string normalize_id(const std::string &id)
{
    std::string out;
    out.reserve(id.size());
    for (char c : id)
        if (!std::isspace(static_cast<unsigned char>(c)))
            out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    return out;
}

bool StaticIdentityResolver::parse(const std::string &text, txrelay::Error &err)
{
    std::size_t start = 0;
    while (start <= text.size())
    {
        std::size_t end = text.find(',', start);
        if (end == std::string::npos)
            end = text.size();
        const std::string entry = text.substr(start, end - start);
        start                   = end + 1;
        if (normalize_id(entry).empty())
            continue;

        // MAC ids contain ':', so split on '='
        const std::size_t eq = entry.find('=');
        if (eq == std::string::npos || eq == 0)
            return fail(err, Errc::invalid_argument, "peer key entry '" + entry + "' lacks id=");

        std::vector<std::uint8_t> pub;
        if (!crypto::from_hex(entry.substr(eq + 1), pub) || pub.size() != crypto::PUBLIC_KEY_SIZE)
            return fail(err, Errc::invalid_argument,
                        "peer key for '" + entry.substr(0, eq) + "' is not 32 hex bytes");
        add(entry.substr(0, eq), std::move(pub));
    }
    return true;
}

void StaticIdentityResolver::add(const transport::DeviceId &peer, std::vector<std::uint8_t> public_raw)
{
    std::lock_guard<std::mutex> lk(mu_);
    keys_[normalize_id(peer)] = std::move(public_raw);
}

std::optional<std::vector<std::uint8_t>> StaticIdentityResolver::resolve(
    const transport::DeviceId &peer)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = keys_.find(normalize_id(peer));
    if (it == keys_.end())
        return std::nullopt;
    return it->second;
}

std::size_t StaticIdentityResolver::size() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return keys_.size();
}

}  // namespace app
