#pragma once
#include <memory>
#include <mutex>
#include <string>

#include "transport/ble_driver.hpp"

namespace transport
{

struct BluezConfig
{
    std::string adapter = "hci0";
};

// IBleDriver over BlueZ (org.bluez on the system bus) using sd-bus.
//
// Device ids are MAC addresses ("AA:BB:CC:DD:EE:FF").
class BluezDriver final : public IBleDriver
{
  public:
    explicit BluezDriver(BluezConfig cfg = {});
    ~BluezDriver() override;

    BluezDriver(const BluezDriver &)            = delete;
    BluezDriver &operator=(const BluezDriver &) = delete;

    std::string name() const override { return "bluez"; }
    RadioState  radio_state() override;

    bool start_scan(const std::string &svc_uuid, OnAdvertisement on_adv,
                    txrelay::Error &err) override;
    void stop_scan() override;

    bool start_advertising(const AdvertiseOptions &opts, txrelay::Error &err) override;
    void stop_advertising() override;

    bool connect(const DeviceId &id, const ConnectOptions &opts, txrelay::Error &err) override;
    void disconnect(const DeviceId &id) override;
    bool is_connected(const DeviceId &id) override;

    std::optional<std::vector<ServiceInfo>> services(const DeviceId &id) override;

    bool write(const DeviceId &id, const Frame &frame) override;

    void set_value_handler(OnValue on_value) override;
    void set_link_handler(OnLinkDown on_link_down) override;

    struct Impl;

  private:
    // opens the system bus and spawns the loop thread on first use
    bool ensure_bus(txrelay::Error &err);
    void run_loop();
    void dispatch_pending();

    bool central_write(const DeviceId &id, const Frame &frame);
    bool peripheral_notify(const DeviceId &id, const Frame &frame);

    BluezConfig           cfg_;
    std::unique_ptr<Impl> impl_;

    std::mutex handler_mu_;
    OnValue    on_value_;
    OnLinkDown on_link_down_;
};

}  // namespace transport
