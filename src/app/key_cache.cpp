#include "app/key_cache.hpp"
#include "util/log.hpp"

namespace app
{

std::optional<KeyExchangeRecord> KeyExchangeCache::lookup(const transport::DeviceId &peer) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = records_.find(peer);
    if (it == records_.end())
        return std::nullopt;
    if (clock_.now() >= it->second.expires_at)
        return std::nullopt;
    return it->second;
}

void KeyExchangeCache::put(const transport::DeviceId &peer,
                           const crypto::SharedKey   &key,
                           const crypto::PublicKey   &ephemeral_public)
{
    KeyExchangeRecord rec;
    rec.peer_id          = peer;
    rec.shared_key       = key;
    rec.ephemeral_public = ephemeral_public;
    rec.expires_at       = clock_.now() + ttl_;

    std::lock_guard<std::mutex> lk(mu_);
    records_[peer] = rec;
    LOG_DEBUG("[KEX] cached key for %s (ttl %lld ms)", peer.c_str(),
              static_cast<long long>(ttl_.count()));
}

bool KeyExchangeCache::forget(const transport::DeviceId &peer)
{
    std::lock_guard<std::mutex> lk(mu_);
    return records_.erase(peer) > 0;
}

std::size_t KeyExchangeCache::purge_expired()
{
    std::lock_guard<std::mutex> lk(mu_);
    const util::TimePoint       now = clock_.now();
    std::size_t                 n   = 0;
    for (auto it = records_.begin(); it != records_.end();)
    {
        if (now >= it->second.expires_at)
        {
            it = records_.erase(it);
            ++n;
        }
        else
        {
            ++it;
        }
    }
    return n;
}

std::size_t KeyExchangeCache::size() const
{
    std::lock_guard<std::mutex> lk(mu_);
    const util::TimePoint       now = clock_.now();
    std::size_t                 n   = 0;
    for (const auto &kv : records_)
        if (now < kv.second.expires_at)
            ++n;
    return n;
}

}  // namespace app
