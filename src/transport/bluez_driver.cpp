/* ======================================================================
 * BlueZ driver (core): bus ownership and event flow
 *
 *  App thread                      Bus loop thread                 BlueZ/DBus
 *  ----------                      ---------------                 ----------
 *  first call -> ensure_bus()
 *    └─ sd_bus_open_system
 *    └─ match PropertiesChanged / InterfacesRemoved ─────────────▶  org.bluez
 *    └─ spawn loop
 *                                  lock bus_mu
 *                                    └─ sd_bus_process (callbacks queue BusEvents)
 *                                  unlock, dispatch_pending()
 *                                    └─ Advert   -> scan callback
 *                                    └─ Value    -> on_value(from, frame)
 *                                    └─ LinkDown -> on_link_down(id)
 *                                  sd_bus_wait (100ms, unlocked)
 *
 *  Central calls (scan/connect/write) live in bluez_driver_central.cpp,
 *  receiving mode (GATT app + advertisement) in bluez_driver_peripheral.cpp.
 *  All sd-bus calls from the app thread are made under impl_->bus_mu and
 *  handlers are never called with it held.
 * ====================================================================== */

#include <cerrno>
#include <cstring>
#include <mutex>
#include <thread>
#include <utility>

// clang-format off
#include "transport/bluez_driver.hpp"
#include "transport/bluez_driver_impl.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "util/log.hpp"
// clang-format on

#include <systemd/sd-bus.h>

namespace
{

using transport::BusEvent;
using transport::Frame;

// ======================================================================
// Function: on_props_changed
// - In: PropertiesChanged from org.bluez (any object)
// - Out: queues LinkDown for Device1.Connected=false on a tracked peer,
//        Value for notifications on a connected peer's characteristic,
//        Advert for Device1.UUIDs updates while scanning
// ======================================================================
int on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *impl  = static_cast<transport::BluezDriver::Impl *>(userdata);
    const char *iface = nullptr;
    int         r     = sd_bus_message_read(m, "s", &iface);
    if (r < 0)
        return r;

    const bool is_dev = iface && std::strcmp(iface, "org.bluez.Device1") == 0;
    const bool is_chr = iface && std::strcmp(iface, "org.bluez.GattCharacteristic1") == 0;

    bool                     connected_hit = false;
    bool                     connected_val = false;
    bool                     rssi_hit      = false;
    int16_t                  rssi          = 0;
    std::vector<std::string> uuids;
    bool                     value_hit = false;
    Frame                    value;

    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;

        if (is_dev && key && std::strcmp(key, "Connected") == 0)
        {
            if ((r = transport::dbus::read_var_b(m, connected_val)) < 0)
                return r;
            connected_hit = true;
        }
        else if (is_dev && key && std::strcmp(key, "RSSI") == 0)
        {
            if ((r = transport::dbus::read_var_i16(m, rssi)) < 0)
                return r;
            rssi_hit = true;
        }
        else if (is_dev && key && std::strcmp(key, "UUIDs") == 0)
        {
            if ((r = transport::dbus::read_var_as(m, uuids)) < 0)
                return r;
        }
        else if (is_chr && key && std::strcmp(key, "Value") == 0)
        {
            if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "ay")) < 0)
                return r;
            const void *buf = nullptr;
            size_t      len = 0;
            if ((r = sd_bus_message_read_array(m, 'y', &buf, &len)) < 0)
                return r;
            if (buf && len)
                value.assign(static_cast<const uint8_t *>(buf),
                             static_cast<const uint8_t *>(buf) + len);
            value_hit = true;
            if ((r = sd_bus_message_exit_container(m)) < 0)
                return r;
        }
        else
        {
            if ((r = sd_bus_message_skip(m, "v")) < 0)
                return r;
        }
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    if ((r = sd_bus_message_exit_container(m)) < 0)
        return r;

    const char *p = sd_bus_message_get_path(m);
    if (!p)
        return 0;
    const std::string path(p);

    if (is_dev && connected_hit && !connected_val)
    {
        const std::string mac     = transport::dbus::path_to_mac(path);
        bool              tracked = impl->links.erase(mac) > 0;
        tracked |= impl->centrals.erase(mac) > 0;
        if (tracked)
        {
            LOG_SYSTEM("[BLUEZ] %s disconnected", mac.c_str());
            BusEvent ev;
            ev.kind = BusEvent::LinkDown;
            ev.id   = mac;
            impl->pending.push_back(std::move(ev));
        }
    }

    if (is_chr && value_hit && !value.empty())
    {
        for (const auto &kv : impl->links)
        {
            if (kv.second.chr_path != path)
                continue;
            LOG_DEBUG("[BLUEZ][central] notify from %s len=%zu", kv.first.c_str(), value.size());
            BusEvent ev;
            ev.kind  = BusEvent::Value;
            ev.id    = kv.first;
            ev.frame = std::move(value);
            impl->pending.push_back(std::move(ev));
            break;
        }
    }

    if (is_dev && impl->discovery_on && !uuids.empty() &&
        transport::dbus::is_device_path(impl->adapter_path, path))
    {
        BusEvent ev;
        ev.kind              = BusEvent::Advert;
        ev.id                = transport::dbus::path_to_mac(path);
        ev.adv.device_id     = ev.id;
        ev.adv.rssi          = rssi_hit ? rssi : 0;
        ev.adv.service_uuids = std::move(uuids);
        impl->pending.push_back(std::move(ev));
    }
    return 0;
}

// ======================================================================
// Function: on_iface_removed
// - In: InterfacesRemoved from org.bluez
// - Out: a vanished device object counts as a dropped link
// ======================================================================
int on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *impl = static_cast<transport::BluezDriver::Impl *>(userdata);
    const char *obj  = nullptr;
    int         r    = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;
    if ((r = sd_bus_message_skip(m, "as")) < 0)
        return r;

    const std::string path(obj);
    if (!transport::dbus::is_device_path(impl->adapter_path, path))
        return 0;
    const std::string mac = transport::dbus::path_to_mac(path);
    bool tracked = impl->links.erase(mac) > 0;
    tracked |= impl->centrals.erase(mac) > 0;
    if (tracked)
    {
        LOG_SYSTEM("[BLUEZ] InterfacesRemoved -> dropped %s", mac.c_str());
        BusEvent ev;
        ev.kind = BusEvent::LinkDown;
        ev.id   = mac;
        impl->pending.push_back(std::move(ev));
    }
    return 0;
}

}  // namespace

namespace transport
{

using txrelay::Errc;
using txrelay::fail;

BluezDriver::BluezDriver(BluezConfig cfg) : cfg_(std::move(cfg)), impl_(std::make_unique<Impl>())
{
    impl_->adapter_path = "/org/bluez/" + cfg_.adapter;
}

// ======================================================================
// Function: BluezDriver::~BluezDriver
// - Out: receiving mode and scan torn down, links dropped, loop joined
// - Note: the loop thread is joined outside bus_mu
// ======================================================================
BluezDriver::~BluezDriver()
{
    stop_scan();
    stop_advertising();
    std::vector<DeviceId> ids;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        for (const auto &kv : impl_->links)
            ids.push_back(kv.first);
    }
    for (const auto &id : ids)
        disconnect(id);

    impl_->running.store(false);
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        // wake the loop if it sits in sd_bus_wait
        if (impl_->bus)
            sd_bus_close(impl_->bus);
    }
    if (impl_->loop.joinable())
        impl_->loop.join();

    dbus::unref_slot(impl_->added_slot);
    dbus::unref_slot(impl_->removed_slot);
    dbus::unref_slot(impl_->props_slot);
    if (impl_->bus)
    {
        sd_bus_flush_close_unref(impl_->bus);
        impl_->bus = nullptr;
    }
}

// ======================================================================
// Function: BluezDriver::ensure_bus
// - In: any app thread
// - Out: system bus open, global matches installed, loop running
// - Note: driver_unavailable when the system bus is unreachable
// ======================================================================
bool BluezDriver::ensure_bus(txrelay::Error &err)
{
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        if (impl_->bus)
            return true;

        int r = sd_bus_open_system(&impl_->bus);
        if (r < 0 || !impl_->bus)
        {
            LOG_ERROR("[BLUEZ] failed to connect to system bus: %s", strerror(-r));
            impl_->bus = nullptr;
            return fail(err, Errc::driver_unavailable, "system bus unreachable");
        }
        const char *uniq = nullptr;
        if (sd_bus_get_unique_name(impl_->bus, &uniq) >= 0 && uniq)
            impl_->unique_name = uniq;

        r = sd_bus_match_signal(impl_->bus, &impl_->props_slot, "org.bluez", nullptr,
                                "org.freedesktop.DBus.Properties", "PropertiesChanged",
                                on_props_changed, impl_.get());
        if (r >= 0)
            r = sd_bus_match_signal(impl_->bus, &impl_->removed_slot, "org.bluez", "/",
                                    "org.freedesktop.DBus.ObjectManager", "InterfacesRemoved",
                                    on_iface_removed, impl_.get());
        if (r < 0)
        {
            LOG_ERROR("[BLUEZ] subscribing to org.bluez signals failed: %s", strerror(-r));
            dbus::unref_slot(impl_->props_slot);
            dbus::unref_slot(impl_->removed_slot);
            sd_bus_flush_close_unref(impl_->bus);
            impl_->bus = nullptr;
            return fail(err, Errc::driver_unavailable, "cannot subscribe to org.bluez");
        }
        LOG_INFO("[BLUEZ] bus open (%s), adapter %s", impl_->unique_name.c_str(),
                 impl_->adapter_path.c_str());
    }

    impl_->running.store(true);
    impl_->loop = std::thread([this] { run_loop(); });
    return true;
}

void BluezDriver::run_loop()
{
    while (impl_->running.load())
    {
        {
            std::lock_guard<std::mutex> lk(impl_->bus_mu);
            while (true)
            {
                int pr = sd_bus_process(impl_->bus, nullptr);
                if (pr <= 0)
                    break;
            }
        }
        dispatch_pending();
        // do not hold the lock while waiting, app-thread calls would stall
        const uint64_t WAIT_USEC = 100000;  // 100ms
        sd_bus_wait(impl_->bus, WAIT_USEC);
    }
}

void BluezDriver::dispatch_pending()
{
    std::vector<BusEvent> events;
    OnAdvertisement       on_adv;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        events.swap(impl_->pending);
        on_adv = impl_->on_adv;
    }
    if (events.empty())
        return;

    OnValue    on_value;
    OnLinkDown on_link_down;
    {
        std::lock_guard<std::mutex> lk(handler_mu_);
        on_value     = on_value_;
        on_link_down = on_link_down_;
    }
    for (const auto &ev : events)
    {
        switch (ev.kind)
        {
        case BusEvent::Advert:
            if (on_adv)
                on_adv(ev.adv);
            break;
        case BusEvent::Value:
            if (on_value)
                on_value(ev.id, ev.frame);
            break;
        case BusEvent::LinkDown:
            if (on_link_down)
                on_link_down(ev.id);
            break;
        }
    }
}

// ======================================================================
// Function: BluezDriver::radio_state
// - Out: Adapter1.Powered and whether LE advertising instances are left
// ======================================================================
RadioState BluezDriver::radio_state()
{
    RadioState st;
    txrelay::Error e;
    if (!ensure_bus(e))
        return st;

    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    sd_bus_error err{};
    int          powered = 0;
    int r = sd_bus_get_property_trivial(impl_->bus, "org.bluez", impl_->adapter_path.c_str(),
                                        "org.bluez.Adapter1", "Powered", &err, 'b', &powered);
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] reading %s Powered failed: %s", impl_->adapter_path.c_str(),
                 dbus::err_text(err, r));
        sd_bus_error_free(&err);
        return st;
    }
    sd_bus_error_free(&err);
    st.powered = (powered != 0);

    err           = SD_BUS_ERROR_NULL;
    uint8_t slots = 0;
    r = sd_bus_get_property_trivial(impl_->bus, "org.bluez", impl_->adapter_path.c_str(),
                                    "org.bluez.LEAdvertisingManager1", "SupportedInstances", &err,
                                    'y', &slots);
    st.can_advertise = st.powered && r >= 0 && (slots > 0 || impl_->advertising);
    sd_bus_error_free(&err);
    return st;
}

bool BluezDriver::is_connected(const DeviceId &id)
{
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    const std::string           mac = dbus::upper(id);
    return impl_->links.count(mac) > 0 || impl_->centrals.count(mac) > 0;
}

// ======================================================================
// Function: BluezDriver::write
// - In: a connected peer
// - Out: WriteValue when we are its central, a notification when it is ours
// ======================================================================
bool BluezDriver::write(const DeviceId &id, const Frame &frame)
{
    if (frame.empty())
        return false;
    const std::string mac = dbus::upper(id);
    bool              as_central;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        as_central = impl_->links.count(mac) > 0;
        if (!as_central && impl_->centrals.count(mac) == 0)
        {
            LOG_DEBUG("[BLUEZ] write to %s dropped: no link", mac.c_str());
            return false;
        }
    }
    return as_central ? central_write(mac, frame) : peripheral_notify(mac, frame);
}

void BluezDriver::set_value_handler(OnValue on_value)
{
    std::lock_guard<std::mutex> lk(handler_mu_);
    on_value_ = std::move(on_value);
}

void BluezDriver::set_link_handler(OnLinkDown on_link_down)
{
    std::lock_guard<std::mutex> lk(handler_mu_);
    on_link_down_ = std::move(on_link_down);
}

}  // namespace transport
