#pragma once

#include "engine/Core.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

namespace rotor::engine
{

// Bounded, append-only history of pool events plus the aggregate counters
// reported by stats(). Not thread-safe; the scheduler guards it.
class EventLog
{
  public:
    explicit EventLog(std::size_t capacity = 500);

    // Stamps the next sequence number and returns the stored copy.
    PoolEvent const &append(PoolEvent event);

    // Newest last; at most `count` records.
    std::vector<PoolEvent> recent(std::size_t count) const;
    std::size_t size() const noexcept { return events_.size(); }
    std::size_t capacity() const noexcept { return capacity_; }
    std::uint64_t last_sequence() const noexcept { return next_sequence_ - 1; }

    PoolCounters &counters() noexcept { return counters_; }
    PoolCounters const &counters() const noexcept { return counters_; }

  private:
    std::size_t capacity_;
    std::deque<PoolEvent> events_;
    std::uint64_t next_sequence_ = 1;
    PoolCounters counters_;
};

} // namespace rotor::engine
