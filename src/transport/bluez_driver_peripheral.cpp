/* ======================================================================
 * BlueZ driver: peripheral role (receiving mode)
 *
 *  App thread                       Bus thread                 BlueZ/DBus           Peer (Central)
 *  ----------                       ----------                 ----------           --------------
 *  start_advertising(opts)
 *    └─ export ObjectManager (APP_PATH) -> GattService1 -> GattCharacteristic1
 *    └─ RegisterApplication (async) ─────────────────────────▶  GattManager1
 *    └─ export LEAdvertisement1 (ADV_PATH)
 *    └─ RegisterAdvertisement (async) ───────────────────────▶  LEAdvertisingManager1
 *
 *                                   ◀────── StartNotify on the characteristic ─────  central subscribes
 *                                      └─ Notifying=true, PropertiesChanged
 *                                   ◀────── WriteValue(frame, {device}) ───────────  central writes
 *                                      └─ central id = MAC of options["device"]
 *                                      └─ queue Value(central, frame)
 *  write(central, frame)
 *    └─ PropertiesChanged(Value=ay) on the characteristic ───▶  notification
 *
 *  stop_advertising()
 *    └─ UnregisterAdvertisement / UnregisterApplication, drop slots
 * ====================================================================== */

#include <cerrno>
#include <cstring>
#include <mutex>

// clang-format off
#include "transport/bluez_driver.hpp"
#include "transport/bluez_driver_impl.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"
// clang-format on

#include <systemd/sd-bus.h>

namespace
{

using transport::BusEvent;
namespace dbus = transport::dbus;

const std::string APP_PATH(constants::APP_PATH);
const std::string SVC_PATH(constants::SVC_PATH);
const std::string CHR_PATH(constants::CHR_PATH);
const std::string ADV_PATH(constants::ADV_PATH);

inline transport::BluezDriver::Impl *as_impl(void *userdata)
{
    return static_cast<transport::BluezDriver::Impl *>(userdata);
}

// ======================================================================
// Function: emit_value_changed
// - In: bus valid, data/len are one frame
// - Out: PropertiesChanged with Value=ay on the local characteristic,
//        which BlueZ turns into a notification to subscribed centrals
// ======================================================================
bool emit_value_changed(sd_bus *bus, const uint8_t *data, size_t len)
{
    sd_bus_message *sig = nullptr;
    int r = sd_bus_message_new_signal(bus, &sig, CHR_PATH.c_str(),
                                      "org.freedesktop.DBus.Properties", "PropertiesChanged");
    // clang-format off
    if (r < 0) return false;
    r = sd_bus_message_append(sig, "s", "org.bluez.GattCharacteristic1");
    if (r < 0) goto fail;
    r = sd_bus_message_open_container(sig, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0) goto fail;
    r = sd_bus_message_open_container(sig, SD_BUS_TYPE_DICT_ENTRY, "sv");
    if (r < 0) goto fail;
    r = sd_bus_message_append(sig, "s", "Value");
    if (r < 0) goto fail;
    r = sd_bus_message_open_container(sig, SD_BUS_TYPE_VARIANT, "ay");
    if (r < 0) goto fail;
    r = sd_bus_message_append_array(sig, 'y', data, len);
    if (r < 0) goto fail;
    r = sd_bus_message_close_container(sig); /* variant */
    if (r < 0) goto fail;
    r = sd_bus_message_close_container(sig); /* dict entry */
    if (r < 0) goto fail;
    r = sd_bus_message_close_container(sig); /* a{sv} */
    if (r < 0) goto fail;
    // invalidated props: empty 'as'
    r = sd_bus_message_append(sig, "as", 0);
    if (r < 0) goto fail;
    // clang-format on
    r = sd_bus_send(bus, sig, nullptr);
    sd_bus_message_unref(sig);
    return r >= 0;
fail:
    sd_bus_message_unref(sig);
    return false;
}

// ---------------- GattService1 ----------------
int svc_prop_UUID(sd_bus *, const char *, const char *, const char *, sd_bus_message *reply,
                  void *userdata, sd_bus_error *)
{
    return sd_bus_message_append(reply, "s", as_impl(userdata)->svc_uuid.c_str());
}

int svc_prop_Primary(sd_bus *, const char *, const char *, const char *, sd_bus_message *reply,
                     void *, sd_bus_error *)
{
    return sd_bus_message_append(reply, "b", 1);
}

// ---------------- GattCharacteristic1 ----------------
int chr_prop_UUID(sd_bus *, const char *, const char *, const char *, sd_bus_message *reply,
                  void *userdata, sd_bus_error *)
{
    return sd_bus_message_append(reply, "s", as_impl(userdata)->chr_uuid.c_str());
}

int chr_prop_Service(sd_bus *, const char *, const char *, const char *, sd_bus_message *reply,
                     void *, sd_bus_error *)
{
    return sd_bus_message_append(reply, "o", SVC_PATH.c_str());
}

// data arrives as Write Requests (or Write Commands), ACK/COMMIT leave as notifications
int chr_prop_Flags(sd_bus *, const char *, const char *, const char *, sd_bus_message *reply,
                   void *, sd_bus_error *)
{
    return sd_bus_message_append(reply, "as", 3, "write", "write-without-response", "notify");
}

int chr_prop_Notifying(sd_bus *, const char *, const char *, const char *, sd_bus_message *reply,
                       void *userdata, sd_bus_error *)
{
    return sd_bus_message_append(reply, "b", as_impl(userdata)->notifying.load() ? 1 : 0);
}

int chr_StartNotify(sd_bus_message *m, void *userdata, sd_bus_error *)
{
    as_impl(userdata)->notifying.store(true);
    sd_bus_emit_properties_changed(sd_bus_message_get_bus(m), CHR_PATH.c_str(),
                                   "org.bluez.GattCharacteristic1", "Notifying", nullptr);
    LOG_DEBUG("[BLUEZ][peripheral] StartNotify");
    return sd_bus_reply_method_return(m, "");
}

int chr_StopNotify(sd_bus_message *m, void *userdata, sd_bus_error *)
{
    as_impl(userdata)->notifying.store(false);
    sd_bus_emit_properties_changed(sd_bus_message_get_bus(m), CHR_PATH.c_str(),
                                   "org.bluez.GattCharacteristic1", "Notifying", nullptr);
    LOG_DEBUG("[BLUEZ][peripheral] StopNotify");
    return sd_bus_reply_method_return(m, "");
}

// ======================================================================
// Function: chr_WriteValue
// - In: frame bytes and options {device, offset, ...}
// - Out: queues Value(central MAC, frame) and replies success
// - Note: rejects non-zero offset; the writer becomes a known central
// ======================================================================
int chr_WriteValue(sd_bus_message *m, void *userdata, sd_bus_error *)
{
    auto       *impl = as_impl(userdata);
    const void *buf  = nullptr;
    size_t      len  = 0;

    int r = sd_bus_message_read_array(m, 'y', &buf, &len);
    if (r < 0)
        return r;

    uint16_t    offset = 0;
    std::string device;
    if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}")) < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;

        if (key && std::strcmp(key, "offset") == 0)
        {
            if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "q")) < 0)
                return r;
            if ((r = sd_bus_message_read(m, "q", &offset)) < 0)
                return r;
            r = sd_bus_message_exit_container(m);
        }
        else if (key && std::strcmp(key, "device") == 0)
        {
            r = dbus::read_var_o(m, device);
        }
        else
        {
            r = sd_bus_message_skip(m, "v");
        }
        if (r < 0)
            return r;
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    if ((r = sd_bus_message_exit_container(m)) < 0)
        return r;

    if (offset != 0)
        return sd_bus_reply_method_errorf(m, "org.bluez.Error.InvalidOffset",
                                          "Offset %u not supported", offset);

    const std::string mac = dbus::path_to_mac(device);
    LOG_DEBUG("[BLUEZ][peripheral] WriteValue from %s len=%zu", mac.empty() ? "?" : mac.c_str(),
              len);
    if (!mac.empty() && buf && len != 0)
    {
        if (impl->centrals.insert(mac).second)
            LOG_SYSTEM("[BLUEZ][peripheral] central %s linked", mac.c_str());
        BusEvent ev;
        ev.kind = BusEvent::Value;
        ev.id   = mac;
        ev.frame.assign(static_cast<const uint8_t *>(buf), static_cast<const uint8_t *>(buf) + len);
        impl->pending.push_back(std::move(ev));
    }
    return sd_bus_reply_method_return(m, "");
}

// ---------------- LEAdvertisement1 ----------------
int adv_prop_Type(sd_bus *, const char *, const char *, const char *, sd_bus_message *reply,
                  void *, sd_bus_error *)
{
    return sd_bus_message_append(reply, "s", "peripheral");
}

int adv_prop_ServiceUUIDs(sd_bus *, const char *, const char *, const char *,
                          sd_bus_message *reply, void *userdata, sd_bus_error *)
{
    return sd_bus_message_append(reply, "as", 1, as_impl(userdata)->svc_uuid.c_str());
}

int adv_prop_LocalName(sd_bus *, const char *, const char *, const char *, sd_bus_message *reply,
                       void *userdata, sd_bus_error *)
{
    return sd_bus_message_append(reply, "s", as_impl(userdata)->local_name.c_str());
}

int adv_prop_IncludeTxPower(sd_bus *, const char *, const char *, const char *,
                            sd_bus_message *reply, void *, sd_bus_error *)
{
    return sd_bus_message_append(reply, "b", 0);
}

int adv_Release(sd_bus_message *m, void *userdata, sd_bus_error *)
{
    as_impl(userdata)->advertising = false;
    LOG_SYSTEM("[BLUEZ][peripheral] advertisement released by BlueZ");
    return sd_bus_reply_method_return(m, "");
}

int on_register_reply(sd_bus_message *m, void *userdata, sd_bus_error *)
{
    const char *what = static_cast<const char *>(userdata);
    if (sd_bus_message_is_method_error(m, nullptr))
    {
        const sd_bus_error *e = sd_bus_message_get_error(m);
        LOG_ERROR("[BLUEZ][peripheral] %s failed: %s: %s", what,
                  e && e->name ? e->name : "unknown", e && e->message ? e->message : "no message");
    }
    else
    {
        LOG_SYSTEM("[BLUEZ][peripheral] %s OK", what);
    }
    return 1;
}

const sd_bus_vtable gatt_service_vtable[] = {
    SD_BUS_VTABLE_START(0),
    SD_BUS_PROPERTY("UUID", "s", svc_prop_UUID, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("Primary", "b", svc_prop_Primary, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_VTABLE_END};

const sd_bus_vtable gatt_chr_vtable[] = {
    SD_BUS_VTABLE_START(0),
    SD_BUS_PROPERTY("UUID", "s", chr_prop_UUID, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("Service", "o", chr_prop_Service, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("Flags", "as", chr_prop_Flags, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    // Notifying is dynamic (no CONST flag)
    SD_BUS_PROPERTY("Notifying", "b", chr_prop_Notifying, 0, 0),
    SD_BUS_METHOD("WriteValue", "aya{sv}", "", chr_WriteValue, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_METHOD("StartNotify", "", "", chr_StartNotify, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_METHOD("StopNotify", "", "", chr_StopNotify, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_VTABLE_END};

const sd_bus_vtable adv_vtable[] = {
    SD_BUS_VTABLE_START(0),
    SD_BUS_PROPERTY("Type", "s", adv_prop_Type, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("ServiceUUIDs", "as", adv_prop_ServiceUUIDs, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("LocalName", "s", adv_prop_LocalName, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("IncludeTxPower", "b", adv_prop_IncludeTxPower, 0,
                    SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_METHOD("Release", "", "", adv_Release, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_VTABLE_END};

char REG_APP[] = "RegisterApplication";
char REG_ADV[] = "RegisterAdvertisement";

void unregister_locked(sd_bus *bus, const std::string &adapter_path, const char *iface,
                       const char *method, const std::string &path)
{
    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", adapter_path.c_str(), iface, method, &err, &rep,
                               "o", path.c_str());
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
        LOG_DEBUG("[BLUEZ][peripheral] %s: %s", method, dbus::err_text(err, r));
    sd_bus_error_free(&err);
}

}  // namespace

namespace transport
{

using txrelay::Errc;
using txrelay::fail;

// ======================================================================
// Function: BluezDriver::start_advertising
// - In: local name and service UUID to advertise
// - Out: GATT application and advertisement exported and submitted
// - Note: BlueZ answers the registrations asynchronously (it calls back
//         into our ObjectManager first), failures are logged from the reply
// ======================================================================
bool BluezDriver::start_advertising(const AdvertiseOptions &opts, txrelay::Error &err)
{
    if (!ensure_bus(err))
        return false;

    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (impl_->advertising)
        return true;

    impl_->local_name = opts.local_name.empty() ? std::string(constants::DEFAULT_LOCAL_NAME)
                                                : opts.local_name;
    if (!opts.service_uuid.empty())
        impl_->svc_uuid = opts.service_uuid;

    Impl *impl = impl_.get();
    int   r    = sd_bus_add_object_manager(impl->bus, &impl->app_slot, APP_PATH.c_str());
    if (r >= 0)
        r = sd_bus_add_object_vtable(impl->bus, &impl->svc_slot, SVC_PATH.c_str(),
                                     "org.bluez.GattService1", gatt_service_vtable, impl);
    if (r >= 0)
        r = sd_bus_add_object_vtable(impl->bus, &impl->chr_slot, CHR_PATH.c_str(),
                                     "org.bluez.GattCharacteristic1", gatt_chr_vtable, impl);
    if (r >= 0)
        r = sd_bus_add_object_vtable(impl->bus, &impl->adv_obj_slot, ADV_PATH.c_str(),
                                     "org.bluez.LEAdvertisement1", adv_vtable, impl);
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ][peripheral] exporting GATT objects failed: %s", strerror(-r));
        dbus::unref_slot(impl->adv_obj_slot);
        dbus::unref_slot(impl->chr_slot);
        dbus::unref_slot(impl->svc_slot);
        dbus::unref_slot(impl->app_slot);
        return fail(err, Errc::driver_unavailable, "cannot export GATT application");
    }
    LOG_DEBUG("[BLUEZ][peripheral] exported svc=%s chr=%s (bus=%s)", SVC_PATH.c_str(),
              CHR_PATH.c_str(), impl->unique_name.c_str());

    r = sd_bus_call_method_async(impl->bus, &impl->reg_app_slot, "org.bluez",
                                 impl->adapter_path.c_str(), "org.bluez.GattManager1",
                                 "RegisterApplication", on_register_reply, REG_APP, "oa{sv}",
                                 APP_PATH.c_str(), 0);
    if (r >= 0)
        r = sd_bus_call_method_async(impl->bus, &impl->reg_adv_slot, "org.bluez",
                                     impl->adapter_path.c_str(), "org.bluez.LEAdvertisingManager1",
                                     "RegisterAdvertisement", on_register_reply, REG_ADV,
                                     "oa{sv}", ADV_PATH.c_str(), 0);
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ][peripheral] registration submit failed: %s", strerror(-r));
        dbus::unref_slot(impl->reg_app_slot);
        dbus::unref_slot(impl->reg_adv_slot);
        dbus::unref_slot(impl->adv_obj_slot);
        dbus::unref_slot(impl->chr_slot);
        dbus::unref_slot(impl->svc_slot);
        dbus::unref_slot(impl->app_slot);
        return fail(err, Errc::driver_unavailable, "cannot register with BlueZ");
    }

    impl->advertising = true;
    LOG_SYSTEM("[BLUEZ][peripheral] advertising '%s' with %s", impl->local_name.c_str(),
               impl->svc_uuid.c_str());
    return true;
}

void BluezDriver::stop_advertising()
{
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus || !impl_->app_slot)
        return;
    unregister_locked(impl_->bus, impl_->adapter_path, "org.bluez.LEAdvertisingManager1",
                      "UnregisterAdvertisement", ADV_PATH);
    unregister_locked(impl_->bus, impl_->adapter_path, "org.bluez.GattManager1",
                      "UnregisterApplication", APP_PATH);

    dbus::unref_slot(impl_->reg_app_slot);
    dbus::unref_slot(impl_->reg_adv_slot);
    dbus::unref_slot(impl_->adv_obj_slot);
    dbus::unref_slot(impl_->chr_slot);
    dbus::unref_slot(impl_->svc_slot);
    dbus::unref_slot(impl_->app_slot);
    impl_->advertising = false;
    impl_->notifying.store(false);
    LOG_SYSTEM("[BLUEZ][peripheral] advertising stopped");
}

// ======================================================================
// Function: BluezDriver::peripheral_notify
// - In: a central that wrote to us and has notifications on
// - Out: true if the Value update was emitted
// ======================================================================
bool BluezDriver::peripheral_notify(const DeviceId &id, const Frame &frame)
{
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus || !impl_->chr_slot)
        return false;
    if (!impl_->notifying.load())
    {
        LOG_DEBUG("[BLUEZ][peripheral] drop notify to %s (Notifying=false)", id.c_str());
        return false;
    }
    const bool ok = emit_value_changed(impl_->bus, frame.data(), frame.size());
    if (!ok)
        LOG_WARN("[BLUEZ][peripheral] notify to %s failed", id.c_str());
    return ok;
}

}  // namespace transport
