#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "util/error.hpp"

/*
Boundary to the platform BLE stack. Everything above this line is
radio-agnostic; below it sit LoopbackDriver (in-process air for tests and
demos) and BluezDriver (BlueZ over sd-bus).

  central (sender)                          peripheral (receiver)
  ----------------                          ---------------------
  start_scan(SVC_UUID) ◀── advertisement ── start_advertising()
  connect(id) ─────────────────────────────▶ link up
  services(id)  // GATT table check
  write(id, frame) ── WriteValue ─────────▶ on_value(central_id, frame)
  on_value(peripheral_id, frame) ◀── notify ── write(central_id, frame)
  disconnect(id) ──────────────────────────▶ on_link_down(central_id)
*/

namespace transport
{

using Frame    = std::vector<std::uint8_t>;
using DeviceId = std::string;  // MAC address for BlueZ

enum CharProp : std::uint32_t
{
    PROP_READ         = 1u << 0,
    PROP_WRITE        = 1u << 1,
    PROP_WRITE_NO_RSP = 1u << 2,
    PROP_NOTIFY       = 1u << 3,
};

struct Advertisement
{
    DeviceId                 device_id;
    std::string              name;
    std::int16_t             rssi{0};
    std::vector<std::string> service_uuids;
};

struct CharacteristicInfo
{
    std::string   uuid;
    std::uint32_t props{0};  // CharProp bits
};

struct ServiceInfo
{
    std::string                     uuid;
    std::vector<CharacteristicInfo> characteristics;
};

struct RadioState
{
    bool powered{false};
    bool can_advertise{false};
};

struct AdvertiseOptions
{
    std::string local_name;
    std::string service_uuid;
};

struct ConnectOptions
{
    std::size_t   mtu{512};
    std::uint32_t timeout_ms{15000};
};

using OnAdvertisement = std::function<void(const Advertisement &)>;
using OnValue         = std::function<void(const DeviceId &from, const Frame &)>;
using OnLinkDown      = std::function<void(const DeviceId &)>;

struct IBleDriver
{
    virtual std::string name() const  = 0;
    virtual RadioState  radio_state() = 0;

    virtual bool start_scan(const std::string &svc_uuid,
                            OnAdvertisement    on_adv,
                            txrelay::Error    &err) = 0;
    virtual void stop_scan()                       = 0;

    virtual bool start_advertising(const AdvertiseOptions &opts, txrelay::Error &err) = 0;
    virtual void stop_advertising()                                                   = 0;

    // Blocks for at most opts.timeout_ms.
    virtual bool connect(const DeviceId &id, const ConnectOptions &opts, txrelay::Error &err) = 0;
    virtual void disconnect(const DeviceId &id)                                               = 0;
    virtual bool is_connected(const DeviceId &id)                                             = 0;

    // GATT table of a connected peer; nullopt when not connected.
    virtual std::optional<std::vector<ServiceInfo>> services(const DeviceId &id) = 0;

    // One frame == one characteristic write. Write-with-response when this side
    // is the central of the link, a notification when it is the peripheral.
    virtual bool write(const DeviceId &id, const Frame &frame) = 0;

    virtual void set_value_handler(OnValue on_value)      = 0;
    virtual void set_link_handler(OnLinkDown on_link_down) = 0;

    virtual ~IBleDriver() = default;
};

}  // namespace transport
