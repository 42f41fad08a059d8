#include <algorithm>
#include <chrono>

#include "ble/device_discovery.hpp"
#include "util/log.hpp"

namespace ble
{

using txrelay::Errc;
using txrelay::fail;

DeviceDiscovery::DeviceDiscovery(transport::IBleDriver &driver,
                                 DeviceRegistry        &registry,
                                 std::string            svc_uuid)
    : driver_(driver), registry_(registry), svc_uuid_(std::move(svc_uuid))
{
}

DeviceDiscovery::~DeviceDiscovery()
{
    stop_scanning();
    stop_advertising();
}

bool DeviceDiscovery::start_scanning(OnFound on_found, std::uint32_t timeout_ms,
                                     txrelay::Error &err)
{
    if (timeout_ms == 0)
        return fail(err, Errc::invalid_argument, "scan timeout must be positive");

    const RadioStatus rs = check_radio_status();
    if (!rs.enabled)
        return fail(err, Errc::driver_unavailable, "radio is powered off");

    stop_scanning();

    std::uint64_t gen = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        gen       = ++gen_;
        scanning_ = true;
        seen_.clear();
        on_found_ = std::move(on_found);
    }

    // the driver may replay cached adverts from inside start_scan
    if (!driver_.start_scan(
            svc_uuid_,
            [this, gen](const transport::Advertisement &adv) { on_advertisement(gen, adv); }, err))
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (gen_ == gen)
        {
            scanning_ = false;
            on_found_ = nullptr;
        }
        if (err.code == Errc::ok)
            fail(err, Errc::driver_unavailable, "start_scan failed");
        LOG_ERROR("[BLE] scan start failed: %s", err.message().c_str());
        return false;
    }

    timer_ = std::thread(&DeviceDiscovery::timer_loop, this, gen, timeout_ms);
    LOG_INFO("[BLE] scanning for %s (%u ms)", svc_uuid_.c_str(), timeout_ms);
    return true;
}

void DeviceDiscovery::timer_loop(std::uint64_t gen, std::uint32_t timeout_ms)
{
    std::unique_lock<std::mutex> lk(mu_);
    const bool stopped = cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms),
                                      [&] { return gen_ != gen; });
    if (stopped)
        return;

    // timed out while still the current scan
    ++gen_;
    scanning_           = false;
    const std::size_t n = seen_.size();
    on_found_           = nullptr;
    lk.unlock();

    driver_.stop_scan();
    LOG_INFO("[BLE] scan timed out, %zu device(s) found", n);
}

void DeviceDiscovery::join_timer()
{
    if (timer_.joinable() && timer_.get_id() != std::this_thread::get_id())
        timer_.join();
    else if (timer_.joinable())
        timer_.detach();
}

void DeviceDiscovery::stop_scanning()
{
    bool was_scanning = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        was_scanning = scanning_;
        ++gen_;
        scanning_ = false;
        on_found_ = nullptr;
    }
    cv_.notify_all();
    join_timer();
    if (was_scanning)
    {
        driver_.stop_scan();
        LOG_INFO("[BLE] scan stopped");
    }
}

void DeviceDiscovery::on_advertisement(std::uint64_t gen, const transport::Advertisement &adv)
{
    const bool lists_service =
        std::any_of(adv.service_uuids.begin(), adv.service_uuids.end(),
                    [&](const std::string &u) { return constants::uuid_eq(u, svc_uuid_); });
    if (!lists_service)
    {
        LOG_DEBUG("[BLE] ignoring %s (service not advertised)", adv.device_id.c_str());
        return;
    }

    OnFound cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (gen != gen_ || !scanning_)
            return;
        registry_.upsert_seen(adv);
        if (!seen_.insert(adv.device_id).second)
            return;  // once per device per scan
        cb = on_found_;
    }

    LOG_INFO("[BLE] found %s name='%s' rssi=%d", adv.device_id.c_str(), adv.name.c_str(),
             adv.rssi);
    if (cb)
    {
        if (auto rec = registry_.get(adv.device_id))
            cb(*rec);
    }
}

bool DeviceDiscovery::start_advertising(const std::string &local_name, txrelay::Error &err)
{
    const RadioStatus rs = check_radio_status();
    if (!rs.enabled || !rs.can_advertise)
        return fail(err, Errc::driver_unavailable, "radio cannot advertise");

    transport::AdvertiseOptions opts;
    opts.local_name   = local_name;
    opts.service_uuid = svc_uuid_;
    if (!driver_.start_advertising(opts, err))
    {
        if (err.code == Errc::ok)
            fail(err, Errc::driver_unavailable, "start_advertising failed");
        LOG_ERROR("[BLE] advertise failed: %s", err.message().c_str());
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(mu_);
        advertising_ = true;
    }
    LOG_SYSTEM("[BLE] advertising '%s' (%s)", local_name.c_str(), svc_uuid_.c_str());
    return true;
}

void DeviceDiscovery::stop_advertising()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!advertising_)
            return;
        advertising_ = false;
    }
    driver_.stop_advertising();
    LOG_SYSTEM("[BLE] advertising stopped");
}

bool DeviceDiscovery::is_scanning() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return scanning_;
}

bool DeviceDiscovery::is_advertising() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return advertising_;
}

std::vector<DeviceRecord> DeviceDiscovery::discovered() const
{
    std::set<transport::DeviceId> ids;
    {
        std::lock_guard<std::mutex> lk(mu_);
        ids = seen_;
    }
    std::vector<DeviceRecord> out;
    for (const auto &id : ids)
        if (auto rec = registry_.get(id))
            out.push_back(*rec);
    return out;
}

RadioStatus DeviceDiscovery::check_radio_status()
{
    const transport::RadioState st = driver_.radio_state();
    RadioStatus                 out;
    out.enabled       = st.powered;
    out.can_advertise = st.powered && st.can_advertise;
    return out;
}

}  // namespace ble
