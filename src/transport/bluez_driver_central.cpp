/* ======================================================================
 * BlueZ driver: central role (sending side)
 *
 *  App thread                                               BlueZ/DBus
 *  ----------                                               ----------
 *  start_scan(svc)
 *    └─ match InterfacesAdded
 *    └─ SetDiscoveryFilter(le, UUIDs=[svc]) ──────────────▶  Adapter1
 *    └─ StartDiscovery ───────────────────────────────────▶  Adapter1
 *    └─ cold walk GetManagedObjects (devices already cached)
 *                          ◀── InterfacesAdded(Device1) / PropertiesChanged(UUIDs)
 *                              └─ Advert{mac, name, rssi, uuids}
 *  connect(mac, timeout)
 *    └─ StopDiscovery (avoid object churn while linking)
 *    └─ Device1.Connect (call timeout = opts.timeout_ms) ─▶  Device1
 *    └─ poll ServicesResolved until the deadline
 *    └─ GetManagedObjects: find the data characteristic
 *    └─ StartNotify ──────────────────────────────────────▶  GattCharacteristic1
 *  write(mac, frame)
 *    └─ WriteValue(type=request, offset=0) ───────────────▶  GattCharacteristic1
 *                          ◀── PropertiesChanged(Value) = notification (ACK/COMMIT)
 * ====================================================================== */

#include <cerrno>
#include <chrono>
#include <cstring>
#include <map>
#include <mutex>
#include <thread>

// clang-format off
#include "transport/bluez_driver.hpp"
#include "transport/bluez_driver_impl.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "util/log.hpp"
// clang-format on

#include <systemd/sd-bus.h>

namespace
{

using transport::Advertisement;
using transport::BusEvent;
namespace dbus = transport::dbus;

// ======================================================================
// Function: read_device_props
// - In: message positioned at the a{sv} of an org.bluez.Device1
// - Out: fills address, name, RSSI and advertised service UUIDs
// ======================================================================
int read_device_props(sd_bus_message *m, Advertisement &adv)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    std::string alias;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;

        if (key && std::strcmp(key, "Address") == 0)
            r = dbus::read_var_s(m, adv.device_id);
        else if (key && std::strcmp(key, "Name") == 0)
            r = dbus::read_var_s(m, adv.name);
        else if (key && std::strcmp(key, "Alias") == 0)
            r = dbus::read_var_s(m, alias);
        else if (key && std::strcmp(key, "RSSI") == 0)
            r = dbus::read_var_i16(m, adv.rssi);
        else if (key && std::strcmp(key, "UUIDs") == 0)
            r = dbus::read_var_as(m, adv.service_uuids);
        else
            r = sd_bus_message_skip(m, "v");
        if (r < 0)
            return r;

        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    if (adv.name.empty())
        adv.name = alias;
    adv.device_id = dbus::upper(adv.device_id);
    return sd_bus_message_exit_container(m);
}

// queues an advert seen while scanning; bus_mu held
void queue_advert(transport::BluezDriver::Impl *impl, Advertisement adv)
{
    if (adv.device_id.empty())
        return;
    // with the UUID filter in place BlueZ only reports matching devices even
    // before their UUID list has been resolved
    if (adv.service_uuids.empty() && impl->uuid_filter_ok)
        adv.service_uuids.push_back(impl->scan_uuid);

    LOG_DEBUG("[BLUEZ][central] advert %s '%s' rssi=%d uuids=%zu", adv.device_id.c_str(),
              adv.name.c_str(), (int)adv.rssi, adv.service_uuids.size());
    BusEvent ev;
    ev.kind = BusEvent::Advert;
    ev.id   = adv.device_id;
    ev.adv  = std::move(adv);
    impl->pending.push_back(std::move(ev));
}

// ======================================================================
// Function: on_iface_added
// - In: InterfacesAdded from org.bluez while scanning
// - Out: queues an Advert for new Device1 objects under our adapter
// ======================================================================
int on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *impl = static_cast<transport::BluezDriver::Impl *>(userdata);
    const char *obj  = nullptr;
    int         r    = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;
    if (!impl->discovery_on || !dbus::is_device_path(impl->adapter_path, obj))
        return 0;

    Advertisement adv;
    bool          dev_hit = false;
    if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sa{sv}}")) < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
    {
        const char *iface = nullptr;
        if ((r = sd_bus_message_read(m, "s", &iface)) < 0)
            return r;
        if (iface && std::strcmp(iface, "org.bluez.Device1") == 0)
        {
            if ((r = read_device_props(m, adv)) < 0)
                return r;
            dev_hit = true;
        }
        else if ((r = sd_bus_message_skip(m, "a{sv}")) < 0)
        {
            return r;
        }
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    if ((r = sd_bus_message_exit_container(m)) < 0)
        return r;

    if (dev_hit)
    {
        if (adv.device_id.empty())
            adv.device_id = dbus::path_to_mac(obj);
        queue_advert(impl, std::move(adv));
    }
    return 0;
}

// ======================================================================
// Function: set_discovery_filter_locked
// - In: bus_mu held
// - Out: Adapter1.SetDiscoveryFilter{Transport=le, DuplicateData=false, UUIDs=[svc]}
// ======================================================================
bool set_discovery_filter_locked(sd_bus *bus, const std::string &adapter_path,
                                 const std::string &svc_uuid)
{
    sd_bus_message *msg = nullptr, *rep = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_message_new_method_call(bus, &msg, "org.bluez", adapter_path.c_str(),
                                           "org.bluez.Adapter1", "SetDiscoveryFilter");
    if (r < 0)
        goto out;
    if ((r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "{sv}")) < 0)
        goto out;
    if ((r = dbus::append_dict_entry(msg, "Transport", "s", "le")) < 0)
        goto out;
    if ((r = dbus::append_dict_entry(msg, "DuplicateData", "b", 0)) < 0)
        goto out;
    // UUIDs=["<svc_uuid>"]
    if ((r = sd_bus_message_open_container(msg, SD_BUS_TYPE_DICT_ENTRY, "sv")) < 0)
        goto out;
    if ((r = sd_bus_message_append(msg, "s", "UUIDs")) < 0)
        goto out;
    if ((r = sd_bus_message_open_container(msg, SD_BUS_TYPE_VARIANT, "as")) < 0)
        goto out;
    if ((r = sd_bus_message_append(msg, "as", 1, svc_uuid.c_str())) < 0)
        goto out;
    if ((r = sd_bus_message_close_container(msg)) < 0)  // variant
        goto out;
    if ((r = sd_bus_message_close_container(msg)) < 0)  // dict
        goto out;
    if ((r = sd_bus_message_close_container(msg)) < 0)  // a{sv}
        goto out;

    r = sd_bus_call(bus, msg, 0, &err, &rep);
out:
    if (msg)
        sd_bus_message_unref(msg);
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        LOG_WARN("[BLUEZ][central] SetDiscoveryFilter failed: %s", dbus::err_text(err, r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    LOG_INFO("[BLUEZ][central] SetDiscoveryFilter OK (Transport=le, UUID=%s)", svc_uuid.c_str());
    return true;
}

// Adapter1.StartDiscovery / StopDiscovery; bus_mu held
int adapter_discovery_locked(sd_bus *bus, const std::string &adapter_path, bool on,
                             sd_bus_error &err)
{
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", adapter_path.c_str(), "org.bluez.Adapter1",
                               on ? "StartDiscovery" : "StopDiscovery", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    return r;
}

// ======================================================================
// Function: walk_managed_objects
// - In: bus_mu held; prefix selects the subtree ("" = everything)
// - Out: for each object, calls on_iface(path, iface, m) with m positioned
//        at the interface's a{sv}; the callee must consume it
// ======================================================================
template <typename F>
int walk_managed_objects(sd_bus *bus, const std::string &prefix, F on_iface)
{
    sd_bus_message *reply = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_call_method(bus, "org.bluez", "/", "org.freedesktop.DBus.ObjectManager",
                               "GetManagedObjects", &err, &reply, "");
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] GetManagedObjects failed: %s", dbus::err_text(err, r));
        sd_bus_error_free(&err);
        if (reply)
            sd_bus_message_unref(reply);
        return r;
    }
    sd_bus_error_free(&err);

    // ==========================
    // Hierarchy:
    // Object path (o)
    // |- Interfaces (a{sa{sv}})
    //     |- Properties ({sv})
    // ==========================
    r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
    while (r >= 0 &&
           (r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0)
    {
        const char *obj = nullptr;
        if ((r = sd_bus_message_read(reply, "o", &obj)) < 0)
            break;
        const std::string path(obj ? obj : "");
        if (path.rfind(prefix, 0) != 0)
        {
            if ((r = sd_bus_message_skip(reply, "a{sa{sv}}")) < 0)
                break;
        }
        else
        {
            if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sa{sv}}")) < 0)
                break;
            while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) >
                   0)
            {
                const char *iface = nullptr;
                if ((r = sd_bus_message_read(reply, "s", &iface)) < 0)
                    break;
                if ((r = on_iface(path, std::string(iface ? iface : ""), reply)) < 0)
                    break;
                if ((r = sd_bus_message_exit_container(reply)) < 0)
                    break;
            }
            if (r < 0)
                break;
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                break;
        }
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            break;
    }
    sd_bus_message_unref(reply);
    return r < 0 ? r : 0;
}

struct RemoteChar
{
    std::string   uuid;
    std::string   service_path;
    std::uint32_t props{0};
};

std::uint32_t flags_to_props(const std::vector<std::string> &flags)
{
    std::uint32_t p = 0;
    for (const auto &f : flags)
    {
        if (f == "read")
            p |= transport::PROP_READ;
        else if (f == "write")
            p |= transport::PROP_WRITE;
        else if (f == "write-without-response")
            p |= transport::PROP_WRITE_NO_RSP;
        else if (f == "notify" || f == "indicate")
            p |= transport::PROP_NOTIFY;
    }
    return p;
}

// ======================================================================
// Function: read_gatt_table_locked
// - In: bus_mu held, device object path
// - Out: the remote GATT table; chr_path receives the object path of
//        the characteristic whose UUID equals want_chr
// ======================================================================
bool read_gatt_table_locked(sd_bus                             *bus,
                            const std::string                  &dev_path,
                            const std::string                  &want_chr,
                            std::vector<transport::ServiceInfo> &out,
                            std::string                        &chr_path)
{
    std::map<std::string, std::string> services;  // path -> uuid
    std::map<std::string, RemoteChar>  chars;     // path -> char

    int r = walk_managed_objects(
        bus, dev_path + "/", [&](const std::string &path, const std::string &iface,
                                 sd_bus_message *m) -> int {
            const bool is_svc = iface == "org.bluez.GattService1";
            const bool is_chr = iface == "org.bluez.GattCharacteristic1";
            if (!is_svc && !is_chr)
                return sd_bus_message_skip(m, "a{sv}");

            std::string              uuid, svc;
            std::vector<std::string> flags;
            int rr = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
            if (rr < 0)
                return rr;
            while ((rr = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
            {
                const char *key = nullptr;
                if ((rr = sd_bus_message_read(m, "s", &key)) < 0)
                    return rr;
                if (key && std::strcmp(key, "UUID") == 0)
                    rr = dbus::read_var_s(m, uuid);
                else if (is_chr && key && std::strcmp(key, "Service") == 0)
                    rr = dbus::read_var_o(m, svc);
                else if (is_chr && key && std::strcmp(key, "Flags") == 0)
                    rr = dbus::read_var_as(m, flags);
                else
                    rr = sd_bus_message_skip(m, "v");
                if (rr < 0)
                    return rr;
                if ((rr = sd_bus_message_exit_container(m)) < 0)
                    return rr;
            }
            if (rr < 0)
                return rr;
            if (is_svc)
                services[path] = uuid;
            else
                chars[path] = RemoteChar{uuid, svc, flags_to_props(flags)};
            return sd_bus_message_exit_container(m);
        });
    if (r < 0)
        return false;

    out.clear();
    chr_path.clear();
    for (const auto &s : services)
    {
        transport::ServiceInfo info;
        info.uuid = s.second;
        for (const auto &c : chars)
        {
            if (c.second.service_path != s.first)
                continue;
            info.characteristics.push_back({c.second.uuid, c.second.props});
            if (chr_path.empty() && constants::uuid_eq(c.second.uuid, want_chr))
                chr_path = c.first;
        }
        out.push_back(std::move(info));
    }
    return true;
}

// ======================================================================
// Function: start_notify_locked
// - In: bus_mu held, remote characteristic path
// - Out: true once notifications are on; transient CCCD races are reported
//        so the caller can retry
// ======================================================================
bool start_notify_locked(sd_bus *bus, const std::string &chr_path, bool &transient)
{
    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", chr_path.c_str(), "org.bluez.GattCharacteristic1",
                               "StartNotify", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    transient = false;
    if (r < 0)
    {
        const char *ename = err.name ? err.name : "";
        const char *emsg  = err.message ? err.message : "";
        transient         = std::strstr(emsg, "ATT error: 0x0e") != nullptr ||
                    std::strcmp(ename, "org.freedesktop.DBus.Error.NoReply") == 0 ||
                    std::strcmp(ename, "org.bluez.Error.InProgress") == 0;
        LOG_WARN("[BLUEZ][central] StartNotify on %s failed%s: %s", chr_path.c_str(),
                 transient ? " (transient)" : "", dbus::err_text(err, r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    LOG_SYSTEM("[BLUEZ][central] notifications enabled on %s", chr_path.c_str());
    return true;
}

void device_disconnect_locked(sd_bus *bus, const std::string &dev_path)
{
    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", dev_path.c_str(), "org.bluez.Device1",
                               "Disconnect", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
        LOG_DEBUG("[BLUEZ][central] Disconnect %s: %s", dev_path.c_str(), dbus::err_text(err, r));
    sd_bus_error_free(&err);
}

}  // namespace

namespace transport
{

using txrelay::Errc;
using txrelay::fail;

// ======================================================================
// Function: BluezDriver::start_scan
// - In: service UUID to look for, advert callback
// - Out: discovery running; cached devices are reported right away
// ======================================================================
bool BluezDriver::start_scan(const std::string &svc_uuid, OnAdvertisement on_adv,
                             txrelay::Error &err)
{
    if (!ensure_bus(err))
        return false;

    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    impl_->scan_uuid = svc_uuid;
    impl_->on_adv    = std::move(on_adv);

    if (!impl_->added_slot)
    {
        int r = sd_bus_match_signal(impl_->bus, &impl_->added_slot, "org.bluez", "/",
                                    "org.freedesktop.DBus.ObjectManager", "InterfacesAdded",
                                    on_iface_added, impl_.get());
        if (r < 0)
        {
            LOG_ERROR("[BLUEZ][central] subscribe to InterfacesAdded failed: %s", strerror(-r));
            return fail(err, Errc::driver_unavailable, "cannot watch for devices");
        }
    }

    impl_->uuid_filter_ok = set_discovery_filter_locked(impl_->bus, impl_->adapter_path, svc_uuid);

    sd_bus_error e{};
    int          r = adapter_discovery_locked(impl_->bus, impl_->adapter_path, true, e);
    if (r < 0 && !(e.name && std::strcmp(e.name, "org.bluez.Error.InProgress") == 0))
    {
        LOG_ERROR("[BLUEZ][central] StartDiscovery failed: %s", dbus::err_text(e, r));
        std::string detail = std::string("StartDiscovery: ") + dbus::err_text(e, r);
        sd_bus_error_free(&e);
        dbus::unref_slot(impl_->added_slot);
        impl_->on_adv = nullptr;
        return fail(err, Errc::driver_unavailable, detail);
    }
    sd_bus_error_free(&e);
    impl_->discovery_on = true;
    LOG_SYSTEM("[BLUEZ][central] discovery on %s for %s", impl_->adapter_path.c_str(),
               svc_uuid.c_str());

    // devices BlueZ already knows about do not produce InterfacesAdded
    Impl *impl = impl_.get();
    (void)walk_managed_objects(impl_->bus, impl_->adapter_path + "/dev_",
                         [impl](const std::string &path, const std::string &iface,
                                sd_bus_message *m) -> int {
                             if (iface != "org.bluez.Device1" ||
                                 !dbus::is_device_path(impl->adapter_path, path))
                                 return sd_bus_message_skip(m, "a{sv}");
                             Advertisement adv;
                             int           rr = read_device_props(m, adv);
                             if (rr < 0)
                                 return rr;
                             bool hit = false;
                             for (const auto &u : adv.service_uuids)
                                 hit |= constants::uuid_eq(u, impl->scan_uuid);
                             if (hit)
                                 queue_advert(impl, std::move(adv));
                             return 0;
                         });
    return true;
}

void BluezDriver::stop_scan()
{
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus || !impl_->discovery_on)
        return;
    sd_bus_error e{};
    int          r = adapter_discovery_locked(impl_->bus, impl_->adapter_path, false, e);
    if (r < 0)
        LOG_WARN("[BLUEZ][central] StopDiscovery failed (treat as off): %s", dbus::err_text(e, r));
    else
        LOG_SYSTEM("[BLUEZ][central] discovery off");
    sd_bus_error_free(&e);
    impl_->discovery_on = false;
    impl_->on_adv       = nullptr;
    dbus::unref_slot(impl_->added_slot);
}

// ======================================================================
// Function: BluezDriver::connect
// - In: MAC of an advertising peer, timeout in opts
// - Out: link recorded once Connect returned and services resolved;
//        notifications are enabled on the data characteristic when present
// - Note: a missing characteristic is left for services() to report
// ======================================================================
bool BluezDriver::connect(const DeviceId &id, const ConnectOptions &opts, txrelay::Error &err)
{
    if (!ensure_bus(err))
        return false;

    using clock         = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(opts.timeout_ms);
    const DeviceId mac  = dbus::upper(id);
    const std::string dev_path = dbus::mac_to_dev_path(impl_->adapter_path, mac);

    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        if (impl_->links.count(mac))
            return true;

        // Stop active discovery before connecting to avoid object churn/aborts.
        if (impl_->discovery_on)
        {
            sd_bus_error e{};
            (void)adapter_discovery_locked(impl_->bus, impl_->adapter_path, false, e);
            sd_bus_error_free(&e);
            impl_->discovery_on = false;
            LOG_INFO("[BLUEZ][central] discovery paused for connect");
        }

        sd_bus_message *msg = nullptr;
        sd_bus_message *rep = nullptr;
        sd_bus_error    e{};
        int r = sd_bus_message_new_method_call(impl_->bus, &msg, "org.bluez", dev_path.c_str(),
                                               "org.bluez.Device1", "Connect");
        if (r >= 0)
            r = sd_bus_call(impl_->bus, msg, (uint64_t)opts.timeout_ms * 1000, &e, &rep);
        if (msg)
            sd_bus_message_unref(msg);
        if (rep)
            sd_bus_message_unref(rep);
        if (r < 0)
        {
            const std::string ename = e.name ? e.name : "";
            const std::string text  = dbus::err_text(e, r);
            sd_bus_error_free(&e);
            LOG_WARN("[BLUEZ][central] Device1.Connect %s failed: %s", mac.c_str(), text.c_str());
            if (r == -ETIMEDOUT || ename == "org.freedesktop.DBus.Error.NoReply")
                return fail(err, Errc::connect_timeout, "Connect timed out: " + text);
            if (ename == "org.bluez.Error.NotReady")
                return fail(err, Errc::driver_unavailable, text);
            return fail(err, Errc::not_connected, "Connect: " + text);
        }
        sd_bus_error_free(&e);
        LOG_SYSTEM("[BLUEZ][central] connected to %s (mtu wanted %zu)", mac.c_str(), opts.mtu);
    }

    // ServicesResolved flips after GATT discovery; poll without holding the bus
    bool resolved = false;
    while (!resolved)
    {
        {
            std::lock_guard<std::mutex> lk(impl_->bus_mu);
            sd_bus_error e{};
            int          b = 0;
            int r = sd_bus_get_property_trivial(impl_->bus, "org.bluez", dev_path.c_str(),
                                                "org.bluez.Device1", "ServicesResolved", &e, 'b',
                                                &b);
            sd_bus_error_free(&e);
            resolved = (r >= 0 && b);
        }
        if (resolved)
            break;
        if (clock::now() >= deadline)
        {
            std::lock_guard<std::mutex> lk(impl_->bus_mu);
            device_disconnect_locked(impl_->bus, dev_path);
            LOG_WARN("[BLUEZ][central] %s: services not resolved in %u ms", mac.c_str(),
                     opts.timeout_ms);
            return fail(err, Errc::connect_timeout, "services not resolved");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    Impl::CentralLink link;
    link.dev_path = dev_path;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        std::vector<ServiceInfo>    table;
        if (!read_gatt_table_locked(impl_->bus, dev_path, impl_->chr_uuid, table, link.chr_path))
            LOG_WARN("[BLUEZ][central] %s: reading GATT table failed", mac.c_str());
    }

    if (!link.chr_path.empty())
    {
        for (int attempt = 0; attempt < 3 && !link.notifying; ++attempt)
        {
            bool transient = false;
            {
                std::lock_guard<std::mutex> lk(impl_->bus_mu);
                link.notifying = start_notify_locked(impl_->bus, link.chr_path, transient);
            }
            if (!transient)
                break;
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        LOG_INFO("[BLUEZ][central] %s data characteristic at %s", mac.c_str(),
                 link.chr_path.c_str());
    }
    else
    {
        LOG_WARN("[BLUEZ][central] %s does not expose %s", mac.c_str(), impl_->chr_uuid.c_str());
    }

    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    impl_->links[mac] = link;
    return true;
}

void BluezDriver::disconnect(const DeviceId &id)
{
    const DeviceId              mac = dbus::upper(id);
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus)
        return;
    auto it = impl_->links.find(mac);
    if (it != impl_->links.end())
    {
        device_disconnect_locked(impl_->bus, it->second.dev_path);
        impl_->links.erase(it);
        LOG_SYSTEM("[BLUEZ][central] disconnected %s", mac.c_str());
        return;
    }
    if (impl_->centrals.erase(mac) > 0)
    {
        device_disconnect_locked(impl_->bus, dbus::mac_to_dev_path(impl_->adapter_path, mac));
        LOG_SYSTEM("[BLUEZ][peripheral] dropped central %s", mac.c_str());
    }
}

std::optional<std::vector<ServiceInfo>> BluezDriver::services(const DeviceId &id)
{
    const DeviceId              mac = dbus::upper(id);
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    auto                        it = impl_->links.find(mac);
    if (it == impl_->links.end() || !impl_->bus)
        return std::nullopt;
    std::vector<ServiceInfo> table;
    std::string              chr_path;
    if (!read_gatt_table_locked(impl_->bus, it->second.dev_path, impl_->chr_uuid, table, chr_path))
        return std::nullopt;
    if (!chr_path.empty())
        it->second.chr_path = chr_path;
    return table;
}

// ======================================================================
// Function: BluezDriver::central_write
// - In: linked peer whose data characteristic was found
// - Out: true if WriteValue (Write Request, expects ATT response) succeeds
// ======================================================================
bool BluezDriver::central_write(const DeviceId &id, const Frame &frame)
{
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    auto                        it = impl_->links.find(id);
    if (!impl_->bus || it == impl_->links.end() || it->second.chr_path.empty())
        return false;

    sd_bus_message *msg = nullptr;
    sd_bus_message *rep = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_message_new_method_call(impl_->bus, &msg, "org.bluez",
                                           it->second.chr_path.c_str(),
                                           "org.bluez.GattCharacteristic1", "WriteValue");
    if (r < 0)
    {
        LOG_WARN("[BLUEZ][central] WriteValue new_method_call failed: %s", strerror(-r));
        return false;
    }
    if ((r = sd_bus_message_append_array(msg, 'y', frame.data(), frame.size())) < 0)
        goto build_fail;
    // options a{sv}: type=request, offset=0
    if ((r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "{sv}")) < 0)
        goto build_fail;
    if ((r = dbus::append_dict_entry(msg, "type", "s", "request")) < 0)
        goto build_fail;
    if ((r = dbus::append_dict_entry(msg, "offset", "q", (uint16_t)0)) < 0)
        goto build_fail;
    if ((r = sd_bus_message_close_container(msg)) < 0)
        goto build_fail;

    r = sd_bus_call(impl_->bus, msg, 0, &err, &rep);
    sd_bus_message_unref(msg);
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        if (-r == EBADMSG)
        {
            // Some BlueZ builds can surface EBADMSG despite a successful ATT write.
            LOG_INFO("[BLUEZ][central] WriteValue returned EBADMSG; treating as soft error "
                     "(len=%zu)",
                     frame.size());
        }
        else
        {
            LOG_WARN("[BLUEZ][central] WriteValue to %s failed: %s", id.c_str(),
                     dbus::err_text(err, r));
            sd_bus_error_free(&err);
            return false;
        }
    }
    sd_bus_error_free(&err);
    LOG_DEBUG("[BLUEZ][central] WriteValue OK (len=%zu)", frame.size());
    return true;

build_fail:
    LOG_WARN("[BLUEZ][central] WriteValue build failed: %s", strerror(-r));
    sd_bus_message_unref(msg);
    return false;
}

}  // namespace transport
