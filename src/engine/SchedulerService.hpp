#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <queue>
#include <unordered_set>
#include <vector>

namespace rotor::engine
{

// Fixed-interval timers for the Core loop. Not thread-safe; owned and driven
// by the thread that runs Core::run.
class SchedulerService
{
  public:
    using Clock = std::chrono::steady_clock;
    using TaskId = std::size_t;
    using Callback = std::function<void()>;

    TaskId schedule(std::chrono::milliseconds interval, Callback callback);
    TaskId schedule(std::chrono::milliseconds interval, Callback callback,
                    Clock::time_point first_run);
    bool cancel(TaskId id);

    // Run pending tasks. Returns how many were executed.
    std::size_t tick(Clock::time_point now);

    // How long the loop may sleep before work is due.
    std::chrono::milliseconds time_until_next_task(Clock::time_point now) const;

  private:
    struct Task
    {
        TaskId id;
        std::chrono::milliseconds interval;
        Clock::time_point next_run;
        Callback callback;

        bool operator>(Task const &other) const
        {
            return next_run > other.next_run;
        }
    };

    void drop_cancelled_top();

    std::priority_queue<Task, std::vector<Task>, std::greater<Task>> tasks_;
    std::unordered_set<TaskId> cancelled_;
    TaskId next_id_ = 1;
};

} // namespace rotor::engine
