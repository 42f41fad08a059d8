#pragma once
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "ble/device_registry.hpp"
#include "transport/ble_driver.hpp"
#include "util/constants.hpp"
#include "util/error.hpp"

/*
start_scanning(on_found, timeout)
  -> driver.start_scan(SVC_UUID)
  -> timer thread: wait(timeout | stop) -> driver.stop_scan()

driver advertisement
  -> lists SVC_UUID? no -> drop
  -> registry.upsert_seen(adv)
  -> first sighting in this scan? -> on_found(record)
*/

namespace ble
{

struct RadioStatus
{
    bool enabled{false};
    bool can_advertise{false};
};

using OnFound = std::function<void(const DeviceRecord &)>;

class DeviceDiscovery
{
  public:
    DeviceDiscovery(transport::IBleDriver &driver,
                    DeviceRegistry        &registry,
                    std::string            svc_uuid = std::string(constants::SVC_UUID));
    ~DeviceDiscovery();

    DeviceDiscovery(const DeviceDiscovery &)            = delete;
    DeviceDiscovery &operator=(const DeviceDiscovery &) = delete;

    // Restarts the scan if one is running. Auto-stops after `timeout_ms`.
    bool start_scanning(OnFound on_found, std::uint32_t timeout_ms, txrelay::Error &err);
    void stop_scanning();

    bool start_advertising(const std::string &local_name, txrelay::Error &err);
    void stop_advertising();

    bool is_scanning() const;
    bool is_advertising() const;

    // Devices seen by the current (or last) scan.
    std::vector<DeviceRecord> discovered() const;

    RadioStatus check_radio_status();

  private:
    void on_advertisement(std::uint64_t gen, const transport::Advertisement &adv);
    void timer_loop(std::uint64_t gen, std::uint32_t timeout_ms);
    void join_timer();

    transport::IBleDriver &driver_;
    DeviceRegistry        &registry_;
    const std::string      svc_uuid_;

    mutable std::mutex            mu_;
    std::condition_variable       cv_;
    bool                          scanning_{false};
    bool                          advertising_{false};
    std::uint64_t                 gen_{0};  // bumps on every start/stop
    std::set<transport::DeviceId> seen_;
    OnFound                       on_found_;
    std::thread                   timer_;
};

}  // namespace ble
