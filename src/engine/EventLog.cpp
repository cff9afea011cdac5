#include "engine/EventLog.hpp"

#include <algorithm>

namespace rotor::engine
{

EventLog::EventLog(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1))
{
}

PoolEvent const &EventLog::append(PoolEvent event)
{
    event.sequence = next_sequence_++;
    events_.push_back(std::move(event));
    while (events_.size() > capacity_)
    {
        events_.pop_front();
    }
    return events_.back();
}

std::vector<PoolEvent> EventLog::recent(std::size_t count) const
{
    auto const take = std::min(count, events_.size());
    return std::vector<PoolEvent>(events_.end() - static_cast<std::ptrdiff_t>(take),
                                  events_.end());
}

} // namespace rotor::engine
