#pragma once
#include <atomic>
#include <cstddef>
#include <map>
#include <mutex>
#include <set>
#include <utility>

#include "transport/ble_driver.hpp"

namespace transport
{

class LoopbackDriver;

// In-process "air" shared by LoopbackDrivers. Delivery is synchronous on the
// writer's thread; no lock is held while a handler runs.
class LoopbackRadio
{
  public:
    // Pushes an advertisement to every scanning driver (devices that are not
    // LoopbackDrivers, or adverts without the service).
    void inject_advertisement(const Advertisement &adv);

  private:
    friend class LoopbackDriver;

    void            attach(LoopbackDriver *d);
    void            detach(LoopbackDriver *d);
    LoopbackDriver *find(const DeviceId &id);

    void announce(LoopbackDriver *advertiser);
    void replay_adverts_to(LoopbackDriver *scanner);

    bool link_up(const DeviceId &central, const DeviceId &peripheral);
    void link_down(const DeviceId &a, const DeviceId &b);
    bool linked(const DeviceId &a, const DeviceId &b);
    bool is_central_of(const DeviceId &central, const DeviceId &peripheral);
    std::set<DeviceId> peers_of(const DeviceId &id);

    std::mutex                             mu_;
    std::map<DeviceId, LoopbackDriver *>   drivers_;
    std::set<std::pair<DeviceId, DeviceId>> links_;  // (central, peripheral)
};

class LoopbackDriver final : public IBleDriver
{
  public:
    using WriteFilter = std::function<bool(const DeviceId &to, const Frame &)>;
    using ConnectHook = std::function<void(const DeviceId &peer, int attempt)>;

    LoopbackDriver(LoopbackRadio &radio, DeviceId id, std::string local_name = {});
    ~LoopbackDriver() override;

    std::string name() const override { return "loopback"; }
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

    // --- fault injection / inspection ---
    const DeviceId &id() const { return id_; }
    void set_powered(bool on);
    void set_rssi(std::int16_t rssi) { rssi_ = rssi; }
    // GATT table this driver exposes when someone connects to it
    void set_gatt(std::vector<ServiceInfo> table);
    // false => frame silently lost in the air (write still reports success)
    void set_write_filter(WriteFilter f);
    void fail_next_connects(int n) { fail_connects_ = n; }
    void fail_next_writes(int n) { fail_writes_ = n; }
    // runs inside connect(), before the outcome is decided
    void set_connect_hook(ConnectHook h);

    std::size_t writes_attempted() const { return writes_.load(); }
    int         connect_attempts() const { return connect_attempts_.load(); }
    bool        scanning() const { return scanning_.load(); }
    bool        advertising() const { return advertising_.load(); }

    static std::vector<ServiceInfo> default_gatt();

  private:
    friend class LoopbackRadio;

    void deliver(const DeviceId &from, const Frame &frame);
    void deliver_advert(const Advertisement &adv);
    void deliver_link_down(const DeviceId &peer);
    Advertisement own_advert() const;

    LoopbackRadio &radio_;
    DeviceId       id_;

    mutable std::mutex       mu_;
    std::string              local_name_;
    std::string              adv_service_;
    std::vector<ServiceInfo> gatt_;
    OnAdvertisement          on_adv_;
    OnValue                  on_value_;
    OnLinkDown               on_link_down_;
    WriteFilter              write_filter_;
    ConnectHook              connect_hook_;

    std::atomic<bool>         powered_{true};
    std::atomic<bool>         scanning_{false};
    std::atomic<bool>         advertising_{false};
    std::atomic<std::int16_t> rssi_{-50};
    std::atomic<int>          fail_connects_{0};
    std::atomic<int>          fail_writes_{0};
    std::atomic<int>          connect_attempts_{0};
    std::atomic<std::size_t>  writes_{0};
};

}  // namespace transport
