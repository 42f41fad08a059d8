#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "transport/ble_driver.hpp"
#include "util/clock.hpp"

namespace ble
{

enum class ConnState
{
    discovered,
    connecting,
    connected,
    disconnected,
};

const char *conn_state_name(ConnState s);

struct DeviceRecord
{
    transport::DeviceId device_id;
    std::string         display_name;
    std::int16_t        rssi{0};
    util::TimePoint     last_seen{};
    ConnState           state{ConnState::discovered};
};

class ConnectionManager;

// One record per physical peer. Discovery refreshes identity and signal;
// only ConnectionManager moves `state`.
class DeviceRegistry
{
  public:
    explicit DeviceRegistry(const util::Clock &clock) : clock_(clock) {}

    // Returns true when the device was not known before.
    bool upsert_seen(const transport::Advertisement &adv);

    std::optional<DeviceRecord> get(const transport::DeviceId &id) const;
    std::vector<DeviceRecord>   all() const;
    std::vector<DeviceRecord>   in_state(ConnState s) const;
    std::size_t                 size() const;

  private:
    friend class ConnectionManager;
    void set_state(const transport::DeviceId &id, ConnState s);

    const util::Clock                               &clock_;
    mutable std::mutex                               mu_;
    std::map<transport::DeviceId, DeviceRecord>      devices_;
};

}  // namespace ble
