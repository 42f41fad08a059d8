#pragma once
#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "transport/bluez_driver.hpp"
#include "util/constants.hpp"

struct sd_bus;
struct sd_bus_slot;

namespace transport
{

// Bus callbacks run under bus_mu inside sd_bus_process and only queue these;
// the loop thread hands them to the registered handlers after unlocking.
struct BusEvent
{
    enum Kind
    {
        Advert,
        Value,
        LinkDown
    };
    Kind          kind = Advert;
    DeviceId      id;
    Frame         frame;
    Advertisement adv;
};

struct BluezDriver::Impl
{
    sd_bus *bus = nullptr;

    // scanning (central)
    sd_bus_slot *added_slot   = nullptr;  // ObjectManager.InterfacesAdded
    sd_bus_slot *removed_slot = nullptr;  // ObjectManager.InterfacesRemoved
    sd_bus_slot *props_slot   = nullptr;  // Properties.PropertiesChanged (always on)

    // receiving mode (peripheral)
    sd_bus_slot *app_slot     = nullptr;  // ObjectManager at APP_PATH
    sd_bus_slot *svc_slot     = nullptr;  // GattService1
    sd_bus_slot *chr_slot     = nullptr;  // GattCharacteristic1
    sd_bus_slot *adv_obj_slot = nullptr;  // LEAdvertisement1
    sd_bus_slot *reg_app_slot = nullptr;  // RegisterApplication (async)
    sd_bus_slot *reg_adv_slot = nullptr;  // RegisterAdvertisement (async)

    // serialize all sd-bus access
    std::mutex       bus_mu;
    std::thread      loop;
    std::atomic_bool running{false};

    std::string adapter_path;  // "/org/bluez/hci0"
    std::string unique_name;

    // ---- scan state (bus_mu) ----
    bool            discovery_on{false};
    bool            uuid_filter_ok{false};  // SetDiscoveryFilter(UUIDs) accepted
    std::string     scan_uuid;
    OnAdvertisement on_adv;

    // ---- central links (bus_mu) ----
    struct CentralLink
    {
        std::string dev_path;
        std::string chr_path;  // remote data characteristic
        bool        notifying{false};
    };
    std::map<DeviceId, CentralLink> links;

    // ---- receiving mode (bus_mu) ----
    bool               advertising{false};
    std::string        local_name;
    std::string        svc_uuid = std::string(constants::SVC_UUID);
    std::string        chr_uuid = std::string(constants::CHR_UUID);
    std::atomic_bool   notifying{false};  // local characteristic Notifying
    std::set<DeviceId> centrals;          // devices that wrote to us while advertising

    std::vector<BusEvent> pending;  // bus_mu
};

}  // namespace transport
