#include "engine/SchedulerService.hpp"

#include <algorithm>

namespace rotor::engine
{

auto SchedulerService::schedule(std::chrono::milliseconds interval,
                                Callback callback) -> TaskId
{
    return schedule(interval, std::move(callback), Clock::now() + interval);
}

auto SchedulerService::schedule(std::chrono::milliseconds interval,
                                Callback callback, Clock::time_point first_run)
    -> TaskId
{
    TaskId id = next_id_++;
    interval = std::max(interval, std::chrono::milliseconds(1));
    tasks_.push({id, interval, first_run, std::move(callback)});
    return id;
}

bool SchedulerService::cancel(TaskId id)
{
    if (id == 0 || id >= next_id_)
    {
        return false;
    }
    bool inserted = cancelled_.insert(id).second;
    drop_cancelled_top();
    return inserted;
}

void SchedulerService::drop_cancelled_top()
{
    while (!tasks_.empty())
    {
        auto it = cancelled_.find(tasks_.top().id);
        if (it == cancelled_.end())
        {
            break;
        }
        cancelled_.erase(it);
        tasks_.pop();
    }
}

std::size_t SchedulerService::tick(Clock::time_point now)
{
    std::size_t executed = 0;

    drop_cancelled_top();
    while (!tasks_.empty() && tasks_.top().next_run <= now)
    {
        Task task = tasks_.top();
        tasks_.pop();

        if (task.callback)
        {
            task.callback();
            ++executed;
        }

        // a callback may cancel its own timer
        if (cancelled_.erase(task.id) == 0)
        {
            task.next_run = now + task.interval;
            tasks_.push(std::move(task));
        }
        drop_cancelled_top();
    }
    return executed;
}

std::chrono::milliseconds
SchedulerService::time_until_next_task(Clock::time_point now) const
{
    if (tasks_.empty())
    {
        return std::chrono::hours(24);
    }
    auto next = tasks_.top().next_run;
    if (now >= next)
    {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(next - now);
}

} // namespace rotor::engine
