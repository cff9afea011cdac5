#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace rotor::engine
{

// FIFO work queue drained by a fixed set of worker threads. With one worker,
// tasks run strictly in submission order.
class AsyncTaskService
{
  public:
    explicit AsyncTaskService(std::size_t workers = 1,
                              std::string name = "worker");
    AsyncTaskService(AsyncTaskService const &) = delete;
    AsyncTaskService &operator=(AsyncTaskService const &) = delete;
    ~AsyncTaskService();

    void start();
    // Runs what is already queued, then joins the workers.
    void stop();
    bool is_running() const noexcept;
    void submit(std::function<void()> task);
    std::size_t pending() const;

  private:
    void loop();

    std::size_t worker_count_;
    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> tasks_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
    std::atomic<bool> exit_requested_{false};
};

} // namespace rotor::engine
