#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>

namespace util
{

using TimePoint = std::chrono::steady_clock::time_point;

// Source of "now" for staleness and TTL decisions. Waiting (ACK timeouts,
// retry delays) still runs on real time.
class Clock
{
  public:
    virtual ~Clock()              = default;
    virtual TimePoint now() const = 0;
};

class SteadyClock final : public Clock
{
  public:
    TimePoint now() const override { return std::chrono::steady_clock::now(); }
};

// Test clock: only moves when told to.
class ManualClock final : public Clock
{
  public:
    ManualClock() : now_(std::chrono::steady_clock::now()) {}

    TimePoint now() const override
    {
        std::lock_guard<std::mutex> lk(mu_);
        return now_;
    }

    void advance(std::chrono::milliseconds d)
    {
        std::lock_guard<std::mutex> lk(mu_);
        now_ += d;
    }

  private:
    mutable std::mutex mu_;
    TimePoint          now_;
};

inline std::uint64_t ms_between(TimePoint from, TimePoint to)
{
    if (to <= from)
        return 0;
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count());
}

}  // namespace util
