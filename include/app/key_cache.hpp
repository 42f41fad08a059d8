#pragma once
#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>

#include "crypto/transport_crypto.hpp"
#include "transport/ble_driver.hpp"
#include "util/clock.hpp"

namespace app
{

struct KeyExchangeRecord
{
    transport::DeviceId peer_id;
    crypto::SharedKey   shared_key{};
    crypto::PublicKey   ephemeral_public{};  // re-offered so the peer can derive the same key
    util::TimePoint     expires_at{};

    KeyExchangeRecord()                                     = default;
    KeyExchangeRecord(const KeyExchangeRecord &)            = default;
    KeyExchangeRecord &operator=(const KeyExchangeRecord &) = default;
    ~KeyExchangeRecord() { crypto::wipe(shared_key.data(), shared_key.size()); }
};

// One record per peer. A re-exchange replaces the record; expired records
// are never returned.
class KeyExchangeCache
{
  public:
    KeyExchangeCache(const util::Clock &clock, std::chrono::milliseconds ttl)
        : clock_(clock), ttl_(ttl)
    {
    }

    std::optional<KeyExchangeRecord> lookup(const transport::DeviceId &peer) const;

    void put(const transport::DeviceId &peer,
             const crypto::SharedKey   &key,
             const crypto::PublicKey   &ephemeral_public);

    bool        forget(const transport::DeviceId &peer);
    std::size_t purge_expired();
    std::size_t size() const;  // unexpired records

  private:
    const util::Clock                                &clock_;
    const std::chrono::milliseconds                   ttl_;
    mutable std::mutex                                mu_;
    std::map<transport::DeviceId, KeyExchangeRecord>  records_;
};

}  // namespace app
