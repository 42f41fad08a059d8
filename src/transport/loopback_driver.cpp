#include "transport/loopback_driver.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace transport
{

using txrelay::Errc;
using txrelay::fail;

// ======================================================================
// LoopbackRadio
// ======================================================================

void LoopbackRadio::attach(LoopbackDriver *d)
{
    std::lock_guard<std::mutex> lk(mu_);
    drivers_[d->id()] = d;
}

void LoopbackRadio::detach(LoopbackDriver *d)
{
    std::lock_guard<std::mutex> lk(mu_);
    drivers_.erase(d->id());
    for (auto it = links_.begin(); it != links_.end();)
    {
        if (it->first == d->id() || it->second == d->id())
            it = links_.erase(it);
        else
            ++it;
    }
}

LoopbackDriver *LoopbackRadio::find(const DeviceId &id)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = drivers_.find(id);
    return it == drivers_.end() ? nullptr : it->second;
}

void LoopbackRadio::announce(LoopbackDriver *advertiser)
{
    std::vector<LoopbackDriver *> scanners;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto &kv : drivers_)
            if (kv.second != advertiser && kv.second->scanning())
                scanners.push_back(kv.second);
    }
    const Advertisement adv = advertiser->own_advert();
    for (auto *s : scanners)
        s->deliver_advert(adv);
}

void LoopbackRadio::replay_adverts_to(LoopbackDriver *scanner)
{
    std::vector<Advertisement> adverts;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto &kv : drivers_)
            if (kv.second != scanner && kv.second->advertising())
                adverts.push_back(kv.second->own_advert());
    }
    for (const auto &adv : adverts)
        scanner->deliver_advert(adv);
}

void LoopbackRadio::inject_advertisement(const Advertisement &adv)
{
    std::vector<LoopbackDriver *> scanners;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto &kv : drivers_)
            if (kv.second->scanning())
                scanners.push_back(kv.second);
    }
    for (auto *s : scanners)
        s->deliver_advert(adv);
}

bool LoopbackRadio::link_up(const DeviceId &central, const DeviceId &peripheral)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (!drivers_.count(peripheral))
        return false;
    links_.emplace(central, peripheral);
    return true;
}

void LoopbackRadio::link_down(const DeviceId &a, const DeviceId &b)
{
    std::lock_guard<std::mutex> lk(mu_);
    links_.erase({a, b});
    links_.erase({b, a});
}

bool LoopbackRadio::linked(const DeviceId &a, const DeviceId &b)
{
    std::lock_guard<std::mutex> lk(mu_);
    return links_.count({a, b}) || links_.count({b, a});
}

bool LoopbackRadio::is_central_of(const DeviceId &central, const DeviceId &peripheral)
{
    std::lock_guard<std::mutex> lk(mu_);
    return links_.count({central, peripheral}) != 0;
}

std::set<DeviceId> LoopbackRadio::peers_of(const DeviceId &id)
{
    std::lock_guard<std::mutex> lk(mu_);
    std::set<DeviceId>          out;
    for (const auto &l : links_)
    {
        if (l.first == id)
            out.insert(l.second);
        else if (l.second == id)
            out.insert(l.first);
    }
    return out;
}

// ======================================================================
// LoopbackDriver
// ======================================================================

LoopbackDriver::LoopbackDriver(LoopbackRadio &radio, DeviceId id, std::string local_name)
    : radio_(radio), id_(std::move(id)), local_name_(std::move(local_name)), gatt_(default_gatt())
{
    radio_.attach(this);
}

LoopbackDriver::~LoopbackDriver()
{
    radio_.detach(this);
}

std::vector<ServiceInfo> LoopbackDriver::default_gatt()
{
    ServiceInfo svc;
    svc.uuid = std::string(constants::SVC_UUID);
    svc.characteristics.push_back(
        CharacteristicInfo{std::string(constants::CHR_UUID), PROP_WRITE | PROP_NOTIFY});
    return {svc};
}

RadioState LoopbackDriver::radio_state()
{
    RadioState st;
    st.powered       = powered_.load();
    st.can_advertise = st.powered;
    return st;
}

// Adverts are passed through unfiltered; DeviceDiscovery applies the service
// filter itself.
bool LoopbackDriver::start_scan(const std::string & /*svc_uuid*/, OnAdvertisement on_adv,
                                txrelay::Error &err)
{
    if (!powered_)
        return fail(err, Errc::driver_unavailable, "loopback radio is powered off");
    {
        std::lock_guard<std::mutex> lk(mu_);
        on_adv_ = std::move(on_adv);
    }
    scanning_ = true;
    radio_.replay_adverts_to(this);
    return true;
}

void LoopbackDriver::stop_scan()
{
    scanning_ = false;
    std::lock_guard<std::mutex> lk(mu_);
    on_adv_ = nullptr;
}

bool LoopbackDriver::start_advertising(const AdvertiseOptions &opts, txrelay::Error &err)
{
    if (!powered_)
        return fail(err, Errc::driver_unavailable, "loopback radio is powered off");
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!opts.local_name.empty())
            local_name_ = opts.local_name;
        adv_service_ = opts.service_uuid;
    }
    advertising_ = true;
    radio_.announce(this);
    return true;
}

void LoopbackDriver::stop_advertising()
{
    advertising_ = false;
}

bool LoopbackDriver::connect(const DeviceId &id, const ConnectOptions & /*opts*/,
                             txrelay::Error &err)
{
    const int attempt = ++connect_attempts_;
    if (!powered_)
        return fail(err, Errc::driver_unavailable, "loopback radio is powered off");

    ConnectHook hook;
    {
        std::lock_guard<std::mutex> lk(mu_);
        hook = connect_hook_;
    }
    if (hook)
        hook(id, attempt);

    if (fail_connects_ > 0)
    {
        --fail_connects_;
        return fail(err, Errc::connect_timeout, "injected connect failure");
    }

    LoopbackDriver *peer = radio_.find(id);
    if (!peer || !peer->advertising() || !peer->powered_)
        return fail(err, Errc::connect_timeout, "device " + id + " not reachable");
    if (!radio_.link_up(id_, id))
        return fail(err, Errc::connect_timeout, "device " + id + " went away");
    return true;
}

void LoopbackDriver::disconnect(const DeviceId &id)
{
    if (!radio_.linked(id_, id))
        return;
    radio_.link_down(id_, id);
    if (LoopbackDriver *peer = radio_.find(id))
        peer->deliver_link_down(id_);
}

bool LoopbackDriver::is_connected(const DeviceId &id)
{
    return radio_.linked(id_, id);
}

std::optional<std::vector<ServiceInfo>> LoopbackDriver::services(const DeviceId &id)
{
    if (!radio_.is_central_of(id_, id))
        return std::nullopt;
    LoopbackDriver *peer = radio_.find(id);
    if (!peer)
        return std::nullopt;
    std::lock_guard<std::mutex> lk(peer->mu_);
    return peer->gatt_;
}

bool LoopbackDriver::write(const DeviceId &id, const Frame &frame)
{
    ++writes_;
    if (!powered_)
        return false;
    if (fail_writes_ > 0)
    {
        --fail_writes_;
        return false;
    }
    if (!radio_.linked(id_, id))
        return false;

    WriteFilter filter;
    {
        std::lock_guard<std::mutex> lk(mu_);
        filter = write_filter_;
    }
    if (filter && !filter(id, frame))
    {
        LOG_DEBUG("[LOOP] %s -> %s: frame lost (%zu bytes)", id_.c_str(), id.c_str(),
                  frame.size());
        return true;
    }

    LoopbackDriver *peer = radio_.find(id);
    if (!peer)
        return false;
    peer->deliver(id_, frame);
    return true;
}

void LoopbackDriver::set_value_handler(OnValue on_value)
{
    std::lock_guard<std::mutex> lk(mu_);
    on_value_ = std::move(on_value);
}

void LoopbackDriver::set_link_handler(OnLinkDown on_link_down)
{
    std::lock_guard<std::mutex> lk(mu_);
    on_link_down_ = std::move(on_link_down);
}

void LoopbackDriver::set_powered(bool on)
{
    powered_ = on;
    if (on)
        return;
    scanning_    = false;
    advertising_ = false;
    for (const auto &peer_id : radio_.peers_of(id_))
    {
        radio_.link_down(id_, peer_id);
        if (LoopbackDriver *peer = radio_.find(peer_id))
            peer->deliver_link_down(id_);
        deliver_link_down(peer_id);
    }
}

void LoopbackDriver::set_gatt(std::vector<ServiceInfo> table)
{
    std::lock_guard<std::mutex> lk(mu_);
    gatt_ = std::move(table);
}

void LoopbackDriver::set_write_filter(WriteFilter f)
{
    std::lock_guard<std::mutex> lk(mu_);
    write_filter_ = std::move(f);
}

void LoopbackDriver::set_connect_hook(ConnectHook h)
{
    std::lock_guard<std::mutex> lk(mu_);
    connect_hook_ = std::move(h);
}

void LoopbackDriver::deliver(const DeviceId &from, const Frame &frame)
{
    OnValue cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        cb = on_value_;
    }
    if (cb)
        cb(from, frame);
}

void LoopbackDriver::deliver_advert(const Advertisement &adv)
{
    if (!scanning_)
        return;
    OnAdvertisement cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        cb = on_adv_;
    }
    if (cb)
        cb(adv);
}

void LoopbackDriver::deliver_link_down(const DeviceId &peer)
{
    OnLinkDown cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        cb = on_link_down_;
    }
    if (cb)
        cb(peer);
}

Advertisement LoopbackDriver::own_advert() const
{
    std::lock_guard<std::mutex> lk(mu_);
    Advertisement               adv;
    adv.device_id = id_;
    adv.name      = local_name_;
    adv.rssi      = rssi_.load();
    if (!adv_service_.empty())
        adv.service_uuids.push_back(adv_service_);
    return adv;
}

}  // namespace transport
