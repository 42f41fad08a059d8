#include "ble/device_registry.hpp"

namespace ble
{

const char *conn_state_name(ConnState s)
{
    switch (s)
    {
        case ConnState::discovered:
            return "discovered";
        case ConnState::connecting:
            return "connecting";
        case ConnState::connected:
            return "connected";
        case ConnState::disconnected:
            return "disconnected";
    }
    return "?";
}

bool DeviceRegistry::upsert_seen(const transport::Advertisement &adv)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it    = devices_.find(adv.device_id);
    const bool                  fresh = (it == devices_.end());
    if (fresh)
    {
        DeviceRecord rec;
        rec.device_id = adv.device_id;
        it            = devices_.emplace(adv.device_id, rec).first;
    }
    DeviceRecord &rec = it->second;
    if (!adv.name.empty())
        rec.display_name = adv.name;
    rec.rssi      = adv.rssi;
    rec.last_seen = clock_.now();
    return fresh;
}

std::optional<DeviceRecord> DeviceRegistry::get(const transport::DeviceId &id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = devices_.find(id);
    if (it == devices_.end())
        return std::nullopt;
    return it->second;
}

std::vector<DeviceRecord> DeviceRegistry::all() const
{
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<DeviceRecord>   out;
    out.reserve(devices_.size());
    for (const auto &kv : devices_)
        out.push_back(kv.second);
    return out;
}

std::vector<DeviceRecord> DeviceRegistry::in_state(ConnState s) const
{
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<DeviceRecord>   out;
    for (const auto &kv : devices_)
        if (kv.second.state == s)
            out.push_back(kv.second);
    return out;
}

std::size_t DeviceRegistry::size() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return devices_.size();
}

void DeviceRegistry::set_state(const transport::DeviceId &id, ConnState s)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = devices_.find(id);
    if (it == devices_.end())
    {
        // connecting to an id that was never scanned (known MAC)
        DeviceRecord rec;
        rec.device_id = id;
        rec.last_seen = clock_.now();
        it            = devices_.emplace(id, rec).first;
    }
    it->second.state = s;
}

}  // namespace ble
