#pragma once

#include "engine/AccountRegistry.hpp"
#include "engine/Clock.hpp"
#include "engine/Core.hpp"
#include "engine/EventBus.hpp"
#include "engine/EventLog.hpp"
#include "engine/Provisioner.hpp"
#include "engine/QuotaTracker.hpp"
#include "engine/Selector.hpp"
#include "engine/SessionMonitor.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rotor::engine
{

class PoolStore;

struct PoolSchedulerOptions
{
    Duration health_check_timeout = std::chrono::seconds(5);
    Duration provisioning_timeout = std::chrono::seconds(120);
    Duration flush_interval = std::chrono::seconds(30);
    std::size_t event_history_limit = 500;
};

// Owns the state of one account pool. All reads and writes go through
// mutex_; provisioner calls and observer notifications are collected while
// it is held and run after it is released, in commit order.
class PoolScheduler
{
  public:
    using Task = std::function<void()>;
    using TaskSubmitter = std::function<void(Task)>;

    PoolScheduler(Clock const &clock, std::shared_ptr<Provisioner> provisioner,
                  PoolStore *store, EventBus &bus, TaskSubmitter submitter,
                  PoolSchedulerOptions options = {});
    ~PoolScheduler();

    PoolScheduler(PoolScheduler const &) = delete;
    PoolScheduler &operator=(PoolScheduler const &) = delete;

    // Reads the store once. Sessions that were running when the state was
    // saved are closed; their quota usage is kept.
    bool load();
    bool flush();

    AccountResult add_account(AccountSpec const &spec);
    OperationResult remove_account(std::string const &id);
    AccountResult update_account(AccountSpec const &spec);
    OperationResult update_settings(PoolSettings const &settings);

    OperationResult set_active(std::string const &id, bool force = false);
    OperationResult activate_next();
    OperationResult end_session();
    OperationResult pause_session();
    OperationResult resume_account(std::string const &id);
    OperationResult recover_account(std::string const &id);
    OperationResult reset_daily_quota(std::string const &id);
    OperationResult reset_all_daily_quotas();
    OperationResult prestart_next();

    OperationResult record_task_started(std::string const &id,
                                        std::string const &description);
    OperationResult record_task_completed(std::string const &id,
                                          std::string const &description);
    OperationResult record_task_failed(std::string const &id,
                                       std::string const &error);
    OperationResult update_telemetry(std::string const &id,
                                     ResourceTelemetry const &telemetry);

    void tick();
    void tick(TimePoint now);

    PoolStatus pool_status() const;
    std::vector<Account> all_accounts() const;
    std::optional<Account> account(std::string const &id) const;
    PoolStats stats() const;
    std::vector<PoolEvent> recent_events(std::size_t count) const;
    PoolSettings settings() const;
    std::optional<std::string> current_account_id() const;
    std::size_t pending_operations() const;

  private:
    enum class OpKind
    {
        StartSession,
        Prestart,
        HealthCheck,
        Recover,
        Retry,
    };

    struct PendingOp
    {
        std::uint64_t ticket = 0;
        OpKind kind = OpKind::StartSession;
        std::string account_id;
        TimePoint deadline{};
    };

    struct AbandonedStart
    {
        std::uint64_t ticket = 0;
        Account account;
    };

    struct Prestart
    {
        std::string account_id;
        std::uint64_t ticket = 0;
        bool ready = false;
    };

    struct Completion
    {
        std::uint64_t ticket = 0;
        ProvisionResult result;
    };

    // Shared with worker tasks so late completions never touch a destroyed
    // scheduler.
    struct CompletionInbox
    {
        std::mutex mutex;
        std::vector<Completion> completions;
    };

    struct Effects
    {
        std::vector<Task> publications;
        std::vector<Task> tasks;
        bool save = false;
    };

    static char const *describe(OpKind kind) noexcept;

    template <typename T> void queue_publish(T event)
    {
        effects_.publications.push_back(
            [this, event = std::move(event)] { bus_.publish(event); });
    }

    // Everything below runs with mutex_ held.
    void finish(std::unique_lock<std::mutex> &lock, bool force_save = false);
    PoolState snapshot() const;

    void record(PoolEvent event);
    void emit(Account const &account, EventKind kind, std::string message,
              Severity severity, TimePoint at);
    void announce_status(Account const &account, AccountStatus from,
                         TimePoint now, std::string const &note);
    bool change_status(Account &account, StatusChange const &change,
                       std::string const &note = {});
    void report_exhausted(TimePoint now);

    std::uint64_t dispatch(OpKind kind, Account const &account, TimePoint now);
    void dispatch_stop(Account const &account);
    void cancel_pending(std::string const &id,
                        std::optional<std::uint64_t> keep = std::nullopt);
    bool has_pending(std::string const &id) const;
    void abandon_start(PendingOp const &op);

    void apply_completions(TimePoint now);
    void expire_pending(TimePoint now);
    void apply_result(PendingOp const &op, ProvisionResult const &result,
                      TimePoint now);
    void handle_failure(Account &account, std::string const &error, bool fatal,
                        AccountStatus failure_status, TimePoint now,
                        bool counted = false);

    void accrue_current(TimePoint now);
    void run_resets(TimePoint now);
    void run_expiries(TimePoint now);
    void evaluate_session(TimePoint now);
    void handle_switch(SwitchReason reason, TimePoint now);
    void maintain_session(TimePoint now);

    std::optional<Selection> pick_next(std::string const &exclude) const;
    bool activate(std::string const &id, bool emergency, TimePoint now,
                  std::optional<std::string> previous = std::nullopt);
    void close_current(StatusChange change, TimePoint now);
    StatusChange deliberate_stop(Account const &account, TimePoint now) const;
    void fail_over(std::string const &failed_id, TimePoint now);

    OperationResult start_prestart(TimePoint now);
    void validate_prestart(TimePoint now);
    void cancel_prestart();

    Account *current_account();

    Clock const &clock_;
    std::shared_ptr<Provisioner> provisioner_;
    PoolStore *store_;
    EventBus &bus_;
    TaskSubmitter submit_;
    PoolSchedulerOptions options_;

    mutable std::mutex mutex_;
    std::recursive_mutex dispatch_mutex_;
    std::shared_ptr<CompletionInbox> inbox_;

    AccountRegistry registry_;
    PoolSettings settings_;
    std::string cursor_;
    QuotaTracker quota_;
    SessionMonitor monitor_{quota_};
    Selector selector_;
    EventLog log_;

    std::optional<Session> current_;
    std::optional<Prestart> prestart_;
    std::vector<PendingOp> pending_;
    // start tickets nobody waits for any more; a late success is stopped
    std::vector<AbandonedStart> abandoned_starts_;
    std::uint64_t next_ticket_ = 1;

    bool engaged_ = false;
    bool emergency_active_ = false;
    bool exhausted_reported_ = false;
    std::optional<TimePoint> last_accrual_;
    TimePoint last_health_check_{};
    TimePoint last_save_{};

    Effects effects_;
};

} // namespace rotor::engine
