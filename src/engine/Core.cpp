#include "engine/Core.hpp"

#include "engine/AsyncTaskService.hpp"
#include "engine/Clock.hpp"
#include "engine/ConfigurationService.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/PersistenceManager.hpp"
#include "engine/PoolScheduler.hpp"
#include "engine/SchedulerService.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <utility>

namespace rotor::engine
{

namespace
{
// upper bound on one wait so a signal-driven shutdown is noticed promptly
constexpr auto kMaxIdleWait = std::chrono::milliseconds(250);
} // namespace

struct Core::Impl
{
    // Infrastructure
    SystemClock clock;
    EventBus event_bus;
    // one thread so saves land in the order they were made
    AsyncTaskService storage_tasks{1, "storage"};
    std::unique_ptr<AsyncTaskService> provisioning_tasks;

    // Services
    std::unique_ptr<PersistenceManager> persistence;
    std::unique_ptr<ConfigurationService> config_service;
    std::unique_ptr<PoolScheduler> pool;
    SchedulerService scheduler_service;

    // State
    std::mutex wake_mutex;
    std::condition_variable wake_cv;
    std::atomic_bool running{false};
    std::atomic_bool stop_requested{false};
    std::atomic_bool reschedule_requested{false};
    EventBus::SubscriptionId settings_subscription = 0;
    SchedulerService::TaskId tick_task = 0;
    SchedulerService::TaskId flush_task = 0;

    Impl(CoreSettings settings, std::shared_ptr<Provisioner> provisioner)
    {
        if (settings.state_path.empty())
        {
            settings.state_path = rotor::utils::data_root() / "rotor.db";
        }

        storage_tasks.start();
        persistence = std::make_unique<PersistenceManager>(settings.state_path,
                                                           &storage_tasks);
        if (!persistence->is_valid())
        {
            ROTOR_LOG_ERROR("state database {} unavailable; running without "
                            "persistence",
                            settings.state_path.string());
        }

        config_service = std::make_unique<ConfigurationService>(
            persistence.get(), &event_bus, std::move(settings));
        auto const resolved = config_service->get();

        provisioning_tasks = std::make_unique<AsyncTaskService>(
            static_cast<std::size_t>(std::max(resolved.worker_threads, 1)),
            "provisioning");
        provisioning_tasks->start();

        PoolSchedulerOptions options;
        options.health_check_timeout = resolved.health_check_timeout;
        options.provisioning_timeout = resolved.provisioning_timeout;
        options.flush_interval = resolved.flush_interval;
        options.event_history_limit = resolved.event_history_limit;

        auto *workers = provisioning_tasks.get();
        pool = std::make_unique<PoolScheduler>(
            clock, std::move(provisioner),
            persistence->is_valid() ? persistence.get() : nullptr, event_bus,
            [workers](PoolScheduler::Task task)
            { workers->submit(std::move(task)); },
            options);
        pool->load();

        settings_subscription = event_bus.subscribe<SettingsChangedEvent>(
            [this](SettingsChangedEvent const &)
            {
                reschedule_requested.store(true, std::memory_order_release);
                wake_cv.notify_all();
            });

        ROTOR_LOG_INFO("core ready: state={} tick={}ms workers={}",
                       resolved.state_path.string(),
                       resolved.tick_interval.count(), resolved.worker_threads);
    }

    ~Impl()
    {
        event_bus.unsubscribe(settings_subscription);
        if (pool)
        {
            pool->flush();
        }
        if (config_service)
        {
            config_service->persist_if_dirty();
        }
        // workers hold no pointer into the pool, but the storage queue does
        // reference the persistence manager
        if (provisioning_tasks)
        {
            provisioning_tasks->stop();
        }
        storage_tasks.stop();
    }

    void schedule_timers()
    {
        scheduler_service.cancel(tick_task);
        scheduler_service.cancel(flush_task);
        auto const settings = config_service->get();
        auto const now = SchedulerService::Clock::now();
        // first tick right away
        tick_task = scheduler_service.schedule(
            settings.tick_interval, [this] { pool->tick(); }, now);
        flush_task = scheduler_service.schedule(
            settings.flush_interval,
            [this]
            {
                pool->flush();
                config_service->persist_if_dirty();
            });
    }

    void run()
    {
        if (running.exchange(true))
        {
            ROTOR_LOG_WARN("core loop already running");
            return;
        }
        stop_requested.store(false, std::memory_order_release);
        schedule_timers();
        ROTOR_LOG_INFO("core loop started");

        while (!stop_requested.load(std::memory_order_acquire) &&
               !rotor::runtime::should_shutdown())
        {
            auto now = SchedulerService::Clock::now();
            scheduler_service.tick(now);
            if (reschedule_requested.exchange(false))
            {
                ROTOR_LOG_DEBUG("runtime settings changed; rescheduling");
                schedule_timers();
            }

            auto wait = std::min<std::chrono::milliseconds>(
                scheduler_service.time_until_next_task(
                    SchedulerService::Clock::now()),
                kMaxIdleWait);
            std::unique_lock<std::mutex> lock(wake_mutex);
            wake_cv.wait_for(lock, wait,
                             [this]
                             {
                                 return stop_requested.load(
                                            std::memory_order_acquire) ||
                                        reschedule_requested.load(
                                            std::memory_order_acquire);
                             });
        }

        scheduler_service.cancel(tick_task);
        scheduler_service.cancel(flush_task);
        tick_task = 0;
        flush_task = 0;
        // accrued quota must survive a restart
        if (persistence->is_valid() && !pool->flush())
        {
            ROTOR_LOG_WARN("final flush of pool state failed");
        }
        config_service->persist_if_dirty();
        running.store(false, std::memory_order_release);
        ROTOR_LOG_INFO("core loop stopped");
    }
};

// --- Proxy Methods ---

Core::Core(CoreSettings settings, std::shared_ptr<Provisioner> provisioner)
    : impl_(std::make_unique<Impl>(std::move(settings), std::move(provisioner)))
{
}

Core::~Core() = default;

std::unique_ptr<Core> Core::create(CoreSettings settings,
                                   std::shared_ptr<Provisioner> provisioner)
{
    return std::make_unique<Core>(std::move(settings), std::move(provisioner));
}

void Core::run()
{
    impl_->run();
}

void Core::stop() noexcept
{
    impl_->stop_requested.store(true, std::memory_order_release);
    impl_->wake_cv.notify_all();
}

bool Core::is_running() const noexcept
{
    return impl_->running.load(std::memory_order_acquire);
}

PoolScheduler &Core::pool() noexcept
{
    return *impl_->pool;
}

PoolScheduler const &Core::pool() const noexcept
{
    return *impl_->pool;
}

EventBus &Core::events() noexcept
{
    return impl_->event_bus;
}

CoreSettings Core::settings() const
{
    return impl_->config_service->get();
}

bool Core::update_settings(CoreSettings const &settings)
{
    auto next = settings;
    // the database location is fixed for the life of the process
    next.state_path = impl_->config_service->get().state_path;
    return impl_->config_service->update(next);
}

} // namespace rotor::engine
