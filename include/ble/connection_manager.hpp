#pragma once
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <vector>

#include "ble/device_registry.hpp"
#include "transport/ble_driver.hpp"
#include "util/config.hpp"
#include "util/error.hpp"

/*
Per device id:

  discovered/disconnected ──connect_to_device──▶ connecting
  connecting ──driver ok + GATT ok──▶ connected
  connecting ──1+retries failures──▶ disconnected   (connect_exhausted)
  connecting ──disconnect_device──▶ disconnected    (connect_cancelled)
  connected  ──disconnect_device / link down──▶ disconnected
*/

namespace ble
{

struct ConnectionHealth
{
    bool is_connected{false};
    bool has_required_service{false};
    bool can_write{false};
};

class ConnectionManager
{
  public:
    ConnectionManager(transport::IBleDriver &driver, DeviceRegistry &registry,
                      const txrelay::RelayConfig &cfg);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager &)            = delete;
    ConnectionManager &operator=(const ConnectionManager &) = delete;

    // Blocks through every attempt. Already connected => true at once.
    bool connect_to_device(const transport::DeviceId &id,
                           std::uint32_t              timeout_ms,
                           txrelay::Error            &err);

    // Idempotent. Cancels an in-flight connect_to_device for the same id.
    void disconnect_device(const transport::DeviceId &id);

    // Diagnostics only; never changes state.
    ConnectionHealth check_connection_health(const transport::DeviceId &id);

    // Driver reported the link gone.
    void on_link_down(const transport::DeviceId &id);

    bool                             is_connected(const transport::DeviceId &id) const;
    std::vector<transport::DeviceId> connected_devices() const;
    ConnState                        state(const transport::DeviceId &id) const;

  private:
    struct Attempt
    {
        bool cancelled{false};
    };

    bool verify_gatt(const transport::DeviceId &id, txrelay::Error &err);
    bool cancelled(const std::shared_ptr<Attempt> &a) const;
    bool finish_cancelled(const transport::DeviceId &id, int attempts, txrelay::Error &err);

    transport::IBleDriver      &driver_;
    DeviceRegistry             &registry_;
    const txrelay::RelayConfig &cfg_;

    mutable std::mutex                                      mu_;
    std::condition_variable                                 cv_;
    std::map<transport::DeviceId, std::shared_ptr<Attempt>> in_flight_;
    std::set<transport::DeviceId>                           connected_;
};

}  // namespace ble
