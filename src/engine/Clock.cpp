#include "engine/Clock.hpp"

#include <chrono>

namespace rotor::engine
{

TimePoint SystemClock::now() const
{
    return std::chrono::time_point_cast<Duration>(std::chrono::system_clock::now());
}

ManualClock::ManualClock(TimePoint start)
    : now_ms_(start.time_since_epoch().count())
{
}

TimePoint ManualClock::now() const
{
    return TimePoint(Duration(now_ms_.load(std::memory_order_acquire)));
}

void ManualClock::advance(Duration delta) noexcept
{
    now_ms_.fetch_add(delta.count(), std::memory_order_acq_rel);
}

void ManualClock::set(TimePoint value) noexcept
{
    now_ms_.store(value.time_since_epoch().count(), std::memory_order_release);
}

} // namespace rotor::engine
