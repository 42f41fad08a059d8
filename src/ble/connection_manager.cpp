#include <algorithm>
#include <chrono>

#include "ble/connection_manager.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace ble
{

using txrelay::Errc;
using txrelay::Error;
using txrelay::fail;

namespace
{

const transport::CharacteristicInfo *find_relay_char(
    const std::vector<transport::ServiceInfo> &table)
{
    for (const auto &svc : table)
    {
        if (!constants::uuid_eq(svc.uuid, constants::SVC_UUID))
            continue;
        for (const auto &chr : svc.characteristics)
            if (constants::uuid_eq(chr.uuid, constants::CHR_UUID))
                return &chr;
    }
    return nullptr;
}

}  // namespace

ConnectionManager::ConnectionManager(transport::IBleDriver &driver, DeviceRegistry &registry,
                                     const txrelay::RelayConfig &cfg)
    : driver_(driver), registry_(registry), cfg_(cfg)
{
}

ConnectionManager::~ConnectionManager()
{
    std::vector<transport::DeviceId> ids;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto &kv : in_flight_)
            kv.second->cancelled = true;
        ids.assign(connected_.begin(), connected_.end());
    }
    cv_.notify_all();
    for (const auto &id : ids)
        disconnect_device(id);
}

bool ConnectionManager::cancelled(const std::shared_ptr<Attempt> &a) const
{
    std::lock_guard<std::mutex> lk(mu_);
    return a->cancelled;
}

bool ConnectionManager::finish_cancelled(const transport::DeviceId &id, int attempts, Error &err)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        in_flight_.erase(id);
    }
    registry_.set_state(id, ConnState::disconnected);
    err.attempts = attempts;
    LOG_INFO("[BLE] connect to %s cancelled after %d attempt(s)", id.c_str(), attempts);
    return fail(err, Errc::connect_cancelled, "disconnect requested during connect");
}

bool ConnectionManager::connect_to_device(const transport::DeviceId &id,
                                          std::uint32_t              timeout_ms,
                                          Error                     &err)
{
    auto attempt = std::make_shared<Attempt>();
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (in_flight_.count(id))
            return fail(err, Errc::connect_in_progress, "connect to " + id + " already running");
        if (connected_.count(id) && driver_.is_connected(id))
            return true;
        connected_.erase(id);
        in_flight_[id] = attempt;
    }
    registry_.set_state(id, ConnState::connecting);

    const int max_attempts = 1 + static_cast<int>(cfg_.connect_retries);
    Error     last;

    transport::ConnectOptions opts;
    opts.mtu        = cfg_.mtu;
    opts.timeout_ms = timeout_ms;

    for (int n = 1; n <= max_attempts; ++n)
    {
        LOG_INFO("[BLE] connecting to %s (attempt %d/%d)", id.c_str(), n, max_attempts);
        last.clear();
        const bool linked = driver_.connect(id, opts, last);

        // state may have changed while the driver call blocked
        if (cancelled(attempt))
        {
            if (linked)
                driver_.disconnect(id);
            return finish_cancelled(id, n, err);
        }

        if (linked)
        {
            if (verify_gatt(id, last))
            {
                {
                    std::lock_guard<std::mutex> lk(mu_);
                    in_flight_.erase(id);
                    connected_.insert(id);
                }
                registry_.set_state(id, ConnState::connected);
                LOG_SYSTEM("[BLE] connected to %s (attempt %d)", id.c_str(), n);
                return true;
            }
            // a link without the relay characteristic is a failed attempt
            driver_.disconnect(id);
        }
        else if (last.code == Errc::ok)
        {
            fail(last, Errc::connect_timeout, "driver refused connect");
        }

        LOG_WARN("[BLE] attempt %d/%d to %s failed: %s", n, max_attempts, id.c_str(),
                 last.message().c_str());

        if (last.code == Errc::driver_unavailable)
        {
            {
                std::lock_guard<std::mutex> lk(mu_);
                in_flight_.erase(id);
            }
            registry_.set_state(id, ConnState::disconnected);
            err          = last;
            err.attempts = n;
            return false;
        }

        if (n < max_attempts)
        {
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait_for(lk, std::chrono::milliseconds(cfg_.connect_retry_delay_ms),
                         [&] { return attempt->cancelled; });
            if (attempt->cancelled)
            {
                lk.unlock();
                return finish_cancelled(id, n, err);
            }
        }
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        in_flight_.erase(id);
    }
    registry_.set_state(id, ConnState::disconnected);
    err.attempts = max_attempts;
    LOG_ERROR("[BLE] giving up on %s after %d attempts", id.c_str(), max_attempts);
    return fail(err, Errc::connect_exhausted,
                "last failure: " + std::string(txrelay::errc_name(last.code)) +
                    (last.detail.empty() ? "" : " (" + last.detail + ")"));
}

bool ConnectionManager::verify_gatt(const transport::DeviceId &id, Error &err)
{
    const auto table = driver_.services(id);
    if (!table)
        return fail(err, Errc::not_connected, "no GATT table for " + id);

    const transport::CharacteristicInfo *chr = find_relay_char(*table);
    if (!chr)
        return fail(err, Errc::service_missing, "relay service/characteristic not found");
    if (!(chr->props & (transport::PROP_WRITE | transport::PROP_WRITE_NO_RSP)))
        return fail(err, Errc::service_missing, "relay characteristic is not writable");
    return true;
}

void ConnectionManager::disconnect_device(const transport::DeviceId &id)
{
    bool was_connected = false;
    bool was_pending   = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto                        it = in_flight_.find(id);
        if (it != in_flight_.end())
        {
            it->second->cancelled = true;
            was_pending           = true;
        }
        was_connected = connected_.erase(id) > 0;
    }
    cv_.notify_all();

    if (driver_.is_connected(id))
        driver_.disconnect(id);

    if (was_connected)
    {
        registry_.set_state(id, ConnState::disconnected);
        LOG_SYSTEM("[BLE] disconnected from %s", id.c_str());
    }
    else if (was_pending)
    {
        LOG_INFO("[BLE] cancelling pending connect to %s", id.c_str());
    }
}

ConnectionHealth ConnectionManager::check_connection_health(const transport::DeviceId &id)
{
    ConnectionHealth h;
    h.is_connected = driver_.is_connected(id);
    if (!h.is_connected)
        return h;
    const auto table = driver_.services(id);
    if (!table)
        return h;
    if (const auto *chr = find_relay_char(*table))
    {
        h.has_required_service = true;
        h.can_write = (chr->props & (transport::PROP_WRITE | transport::PROP_WRITE_NO_RSP)) != 0;
    }
    return h;
}

void ConnectionManager::on_link_down(const transport::DeviceId &id)
{
    bool was_connected = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        was_connected = connected_.erase(id) > 0;
    }
    if (!was_connected)
        return;
    registry_.set_state(id, ConnState::disconnected);
    LOG_SYSTEM("[BLE] link to %s lost", id.c_str());
}

bool ConnectionManager::is_connected(const transport::DeviceId &id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    return connected_.count(id) != 0;
}

std::vector<transport::DeviceId> ConnectionManager::connected_devices() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return std::vector<transport::DeviceId>(connected_.begin(), connected_.end());
}

ConnState ConnectionManager::state(const transport::DeviceId &id) const
{
    if (auto rec = registry_.get(id))
        return rec->state;
    return ConnState::disconnected;
}

}  // namespace ble
