#pragma once

#include "engine/Core.hpp"

#include <atomic>

namespace rotor::engine
{

// Time source for the pool. Everything time-based in the scheduler reads
// through this so tests can drive the pool with a manual clock.
class Clock
{
  public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock final : public Clock
{
  public:
    TimePoint now() const override;
};

class ManualClock final : public Clock
{
  public:
    explicit ManualClock(TimePoint start = TimePoint{});

    TimePoint now() const override;
    void advance(Duration delta) noexcept;
    void set(TimePoint value) noexcept;

  private:
    std::atomic<std::int64_t> now_ms_;
};

} // namespace rotor::engine
