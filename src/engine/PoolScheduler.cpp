#include "engine/PoolScheduler.hpp"

#include "engine/Events.hpp"
#include "engine/PoolStore.hpp"
#include "engine/PoolUtils.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <utility>

namespace rotor::engine
{

namespace
{

std::string minutes_text(Duration value)
{
    return std::format("{:.1f} min", to_minutes(value));
}

Severity severity_for(AccountStatus status) noexcept
{
    switch (status)
    {
    case AccountStatus::Suspended:
        return Severity::Critical;
    case AccountStatus::Error:
    case AccountStatus::Disconnected:
        return Severity::Warning;
    default:
        return Severity::Info;
    }
}

CooldownReason cooldown_reason_for(SwitchReason reason) noexcept
{
    switch (reason)
    {
    case SwitchReason::QuotaExhausted:
        return CooldownReason::QuotaExhausted;
    case SwitchReason::SessionLimit:
        return CooldownReason::SessionLimit;
    default:
        return CooldownReason::Rotation;
    }
}

} // namespace

PoolScheduler::PoolScheduler(Clock const &clock,
                             std::shared_ptr<Provisioner> provisioner,
                             PoolStore *store, EventBus &bus,
                             TaskSubmitter submitter,
                             PoolSchedulerOptions options)
    : clock_(clock), provisioner_(std::move(provisioner)), store_(store),
      bus_(bus), submit_(std::move(submitter)), options_(options),
      inbox_(std::make_shared<CompletionInbox>()),
      log_(options.event_history_limit)
{
    if (!provisioner_)
    {
        provisioner_ = std::make_shared<PassiveProvisioner>();
    }
    if (!submit_)
    {
        submit_ = [](Task task) { task(); };
    }
    last_save_ = clock_.now();
}

PoolScheduler::~PoolScheduler() = default;

char const *PoolScheduler::describe(OpKind kind) noexcept
{
    switch (kind)
    {
    case OpKind::StartSession:
        return "session start";
    case OpKind::Prestart:
        return "prestart";
    case OpKind::HealthCheck:
        return "health check";
    case OpKind::Recover:
        return "recovery check";
    case OpKind::Retry:
        return "retry check";
    }
    return "operation";
}

// ---------------------------------------------------------------------------
// persistence

bool PoolScheduler::load()
{
    if (store_ == nullptr)
    {
        return false;
    }
    auto state = store_->load_pool();
    std::unique_lock lock(mutex_);
    if (!state)
    {
        ROTOR_LOG_INFO("no saved pool state; starting empty");
        return false;
    }
    auto const now = clock_.now();
    registry_.replace_all(std::move(state->accounts));
    settings_ = state->settings;
    cursor_ = std::move(state->rotation_cursor);
    current_.reset();
    prestart_.reset();
    pending_.clear();
    engaged_ = false;

    for (auto &account : registry_.accounts())
    {
        if (account.status == AccountStatus::Running)
        {
            // the previous process is gone, and so is its session
            auto const change = deliberate_stop(account, now);
            if (!registry_.transition(account.id, change).applied)
            {
                ROTOR_LOG_WARN("account {}: could not close stale session",
                               account.id);
            }
            effects_.save = true;
        }
        if (account.status == AccountStatus::Cooldown && !account.cooldown_until)
        {
            StatusChange lifted;
            lifted.to = AccountStatus::Active;
            lifted.now = now;
            if (!registry_.transition(account.id, lifted).applied)
            {
                ROTOR_LOG_WARN("account {}: could not lift cooldown without expiry",
                               account.id);
            }
            effects_.save = true;
        }
        AccountStateMachine::normalize(account);
    }
    ROTOR_LOG_INFO("loaded {} accounts ({} strategy)", registry_.size(),
                   to_string(settings_.strategy));
    finish(lock);
    return true;
}

bool PoolScheduler::flush()
{
    std::unique_lock lock(mutex_);
    if (store_ == nullptr)
    {
        return false;
    }
    auto state = snapshot();
    last_save_ = clock_.now();
    std::lock_guard dispatch(dispatch_mutex_);
    lock.unlock();
    return store_->save_pool(state);
}

PoolState PoolScheduler::snapshot() const
{
    PoolState state;
    state.accounts = registry_.accounts();
    state.settings = settings_;
    state.rotation_cursor = cursor_;
    return state;
}

void PoolScheduler::finish(std::unique_lock<std::mutex> &lock, bool force_save)
{
    auto effects = std::exchange(effects_, Effects{});
    std::optional<PoolState> state;
    if (store_ != nullptr && (effects.save || force_save))
    {
        state = snapshot();
        last_save_ = clock_.now();
    }

    // taken before the state lock is released so observers see commits in
    // order even when two callers race
    std::lock_guard dispatch(dispatch_mutex_);
    lock.unlock();

    for (auto &publication : effects.publications)
    {
        publication();
    }
    for (auto &task : effects.tasks)
    {
        submit_(std::move(task));
    }
    if (state && !store_->save_pool(*state))
    {
        ROTOR_LOG_WARN("pool state could not be saved");
    }
}

// ---------------------------------------------------------------------------
// events

void PoolScheduler::record(PoolEvent event)
{
    auto const &stored = log_.append(std::move(event));
    queue_publish(PoolEventPublished{stored});
}

void PoolScheduler::emit(Account const &account, EventKind kind,
                         std::string message, Severity severity, TimePoint at)
{
    PoolEvent event;
    event.account_id = account.id;
    event.account_name = account.display_name;
    event.kind = kind;
    event.message = std::move(message);
    event.timestamp = at;
    event.severity = severity;
    record(std::move(event));
}

void PoolScheduler::announce_status(Account const &account, AccountStatus from,
                                    TimePoint now, std::string const &note)
{
    if (from == account.status)
    {
        return;
    }
    PoolEvent event;
    event.account_id = account.id;
    event.account_name = account.display_name;
    event.kind = EventKind::StatusChanged;
    event.message = note.empty()
                        ? std::format("{} -> {}", to_string(from),
                                      to_string(account.status))
                        : std::format("{} -> {}: {}", to_string(from),
                                      to_string(account.status), note);
    event.timestamp = now;
    event.severity = severity_for(account.status);
    event.old_status = from;
    event.new_status = account.status;
    record(std::move(event));
    queue_publish(NodeStatusChangedEvent{account.id, from, account.status, now});
    effects_.save = true;
}

bool PoolScheduler::change_status(Account &account, StatusChange const &change,
                                  std::string const &note)
{
    if (account.status == change.to)
    {
        return true;
    }
    auto const transition = registry_.transition(account.id, change);
    if (!transition.applied)
    {
        ROTOR_LOG_WARN("account {}: transition {} -> {} rejected", account.id,
                       to_string(transition.from), to_string(change.to));
        return false;
    }
    announce_status(account, transition.from, change.now, note);
    return true;
}

void PoolScheduler::report_exhausted(TimePoint now)
{
    if (exhausted_reported_)
    {
        return;
    }
    exhausted_reported_ = true;
    PoolEvent event;
    event.kind = EventKind::PoolExhausted;
    event.message = "no eligible or emergency account available";
    event.timestamp = now;
    event.severity = Severity::Critical;
    record(std::move(event));
    ROTOR_LOG_WARN("pool exhausted: no account can take the session");
}

// ---------------------------------------------------------------------------
// provisioning work

std::uint64_t PoolScheduler::dispatch(OpKind kind, Account const &account,
                                      TimePoint now)
{
    auto const ticket = next_ticket_++;
    bool const starts = kind == OpKind::StartSession || kind == OpKind::Prestart;
    auto const timeout =
        starts ? options_.provisioning_timeout : options_.health_check_timeout;
    pending_.push_back({ticket, kind, account.id, now + timeout});

    effects_.tasks.push_back(
        [provisioner = provisioner_, inbox = inbox_, ticket, starts, account]
        {
            ProvisionResult result;
            try
            {
                result = starts ? provisioner->start_session(account)
                                : provisioner->health_check(account);
            }
            catch (std::exception const &ex)
            {
                result = ProvisionResult::failure(ex.what());
            }
            std::lock_guard guard(inbox->mutex);
            inbox->completions.push_back({ticket, std::move(result)});
        });
    return ticket;
}

void PoolScheduler::dispatch_stop(Account const &account)
{
    effects_.tasks.push_back(
        [provisioner = provisioner_, account]
        {
            ProvisionResult result;
            try
            {
                result = provisioner->stop_session(account);
            }
            catch (std::exception const &ex)
            {
                result = ProvisionResult::failure(ex.what());
            }
            if (!result.ok)
            {
                ROTOR_LOG_WARN("stopping session on {} failed: {}", account.id,
                               result.error);
            }
        });
}

void PoolScheduler::cancel_pending(std::string const &id,
                                   std::optional<std::uint64_t> keep)
{
    std::erase_if(pending_,
                  [&](PendingOp const &op)
                  {
                      if (op.account_id != id || op.ticket == keep)
                      {
                          return false;
                      }
                      abandon_start(op);
                      return true;
                  });
}

void PoolScheduler::abandon_start(PendingOp const &op)
{
    if (op.kind != OpKind::StartSession && op.kind != OpKind::Prestart)
    {
        return;
    }
    // keep a copy: the account may be gone by the time the start lands
    if (auto const *account = registry_.find(op.account_id))
    {
        abandoned_starts_.push_back({op.ticket, *account});
    }
}

bool PoolScheduler::has_pending(std::string const &id) const
{
    return std::any_of(pending_.begin(), pending_.end(),
                       [&](PendingOp const &op) { return op.account_id == id; });
}

void PoolScheduler::apply_completions(TimePoint now)
{
    std::vector<Completion> completions;
    {
        std::lock_guard guard(inbox_->mutex);
        completions.swap(inbox_->completions);
    }
    for (auto &completion : completions)
    {
        auto it = std::find_if(pending_.begin(), pending_.end(),
                               [&](PendingOp const &op)
                               { return op.ticket == completion.ticket; });
        if (it == pending_.end())
        {
            auto orphan = std::find_if(
                abandoned_starts_.begin(), abandoned_starts_.end(),
                [&](AbandonedStart const &entry)
                { return entry.ticket == completion.ticket; });
            if (orphan != abandoned_starts_.end())
            {
                // a session came up after we stopped waiting for it
                if (completion.result.ok)
                {
                    ROTOR_LOG_INFO("stopping late session on {}",
                                   orphan->account.id);
                    dispatch_stop(orphan->account);
                }
                abandoned_starts_.erase(orphan);
            }
            ROTOR_LOG_DEBUG("discarding completion for ticket {}",
                            completion.ticket);
            continue;
        }
        auto const op = *it;
        pending_.erase(it);
        apply_result(op, completion.result, now);
    }
}

void PoolScheduler::expire_pending(TimePoint now)
{
    std::vector<PendingOp> expired;
    for (auto it = pending_.begin(); it != pending_.end();)
    {
        if (it->deadline <= now)
        {
            expired.push_back(std::move(*it));
            it = pending_.erase(it);
        }
        else
        {
            ++it;
        }
    }
    for (auto const &op : expired)
    {
        abandon_start(op);
        apply_result(op,
                     ProvisionResult::failure(
                         std::format("{} timed out", describe(op.kind))),
                     now);
    }
}

void PoolScheduler::apply_result(PendingOp const &op,
                                 ProvisionResult const &result, TimePoint now)
{
    auto *account = registry_.find(op.account_id);
    if (account == nullptr)
    {
        return;
    }
    bool const is_current = current_ && current_->account_id == account->id &&
                            account->status == AccountStatus::Running;

    switch (op.kind)
    {
    case OpKind::StartSession:
        if (!is_current)
        {
            return;
        }
        if (result.ok)
        {
            account->consecutive_failures = 0;
            emit(*account, EventKind::Connected, "session is up", Severity::Info,
                 now);
            return;
        }
        handle_failure(*account, result.error, result.fatal,
                       AccountStatus::Error, now);
        return;

    case OpKind::Prestart:
        if (!prestart_ || prestart_->ticket != op.ticket)
        {
            return;
        }
        if (result.ok)
        {
            prestart_->ready = true;
            account->consecutive_failures = 0;
            emit(*account, EventKind::Connected, "prestarted session is ready",
                 Severity::Info, now);
            return;
        }
        prestart_.reset();
        handle_failure(*account, result.error, result.fatal,
                       AccountStatus::Error, now);
        return;

    case OpKind::HealthCheck:
        if (!is_current)
        {
            return;
        }
        if (result.ok)
        {
            account->consecutive_failures = 0;
            return;
        }
        handle_failure(*account, result.error, result.fatal,
                       AccountStatus::Disconnected, now);
        return;

    case OpKind::Recover:
    case OpKind::Retry:
        if (!AccountStateMachine::is_failure_status(account->status))
        {
            return;
        }
        if (result.ok)
        {
            account->consecutive_failures = 0;
            StatusChange change;
            change.to = AccountStatus::Active;
            change.now = now;
            if (change_status(*account, change,
                              op.kind == OpKind::Recover ? "recovered"
                                                         : "retry succeeded"))
            {
                emit(*account, EventKind::AccountRecovered,
                     "health check passed, account back in rotation",
                     Severity::Info, now);
                ROTOR_LOG_INFO("account {} recovered", account->id);
            }
            return;
        }
        if (op.kind == OpKind::Recover)
        {
            account->last_error = result.error;
            emit(*account, EventKind::Error,
                 std::format("recovery refused: {}", result.error),
                 Severity::Warning, now);
            effects_.save = true;
            return;
        }
        handle_failure(*account, result.error, result.fatal, account->status,
                       now);
        return;
    }
}

void PoolScheduler::handle_failure(Account &account, std::string const &error,
                                   bool fatal, AccountStatus failure_status,
                                   TimePoint now, bool counted)
{
    if (!counted)
    {
        ++account.failure_count;
        ++account.consecutive_failures;
        ++log_.counters().provisioning_failures;
    }
    account.last_error = error;
    effects_.save = true;

    auto const budget =
        static_cast<std::uint32_t>(std::max(1, settings_.max_consecutive_failures));
    bool const suspend = fatal || account.consecutive_failures >= budget;
    auto const severity = suspend || account.consecutive_failures > 1
                              ? Severity::Critical
                              : Severity::Warning;
    emit(account, EventKind::Error,
         std::format("{} (failure {} of {}{})", error,
                     account.consecutive_failures, budget,
                     fatal ? ", fatal" : ""),
         severity, now);

    StatusChange change;
    change.now = now;
    change.error = error;
    if (suspend)
    {
        change.to = AccountStatus::Suspended;
        ROTOR_LOG_WARN("account {} suspended: {}", account.id, error);
    }
    else
    {
        change.to = failure_status;
        change.retry_after = now + settings_.error_retry_delay;
    }

    if (prestart_ && prestart_->account_id == account.id)
    {
        cancel_prestart();
    }

    bool const was_current = current_ && current_->account_id == account.id;
    if (was_current)
    {
        auto const id = account.id;
        close_current(change, now);
        fail_over(id, now);
        return;
    }
    if (account.status == change.to)
    {
        account.retry_after = change.retry_after;
        return;
    }
    change_status(account, change, error);
}

// ---------------------------------------------------------------------------
// tick

void PoolScheduler::tick()
{
    tick(clock_.now());
}

void PoolScheduler::tick(TimePoint now)
{
    std::unique_lock lock(mutex_);
    apply_completions(now);
    expire_pending(now);
    accrue_current(now);
    run_resets(now);
    run_expiries(now);
    validate_prestart(now);
    evaluate_session(now);
    maintain_session(now);
    bool const periodic = now - last_save_ >= options_.flush_interval;
    finish(lock, periodic);
}

void PoolScheduler::accrue_current(TimePoint now)
{
    auto *account = current_account();
    if (account == nullptr || !last_accrual_)
    {
        return;
    }
    auto const elapsed =
        now > *last_accrual_ ? now - *last_accrual_ : Duration{0};
    last_accrual_ = std::max(*last_accrual_, now);
    auto const accrual = quota_.accrue(*account, elapsed);
    if (accrual.reached_limit)
    {
        effects_.save = true;
    }
    if (accrual.reached_limit || accrual.overflow > Duration{0})
    {
        auto message =
            accrual.overflow > Duration{0}
                ? std::format("daily quota of {} used, {} past the limit",
                              minutes_text(account->daily_limit),
                              minutes_text(accrual.overflow))
                : std::format("daily quota of {} used",
                              minutes_text(account->daily_limit));
        emit(*account, EventKind::QuotaExceeded, std::move(message),
             Severity::Warning, now);
    }
}

void PoolScheduler::run_resets(TimePoint now)
{
    for (auto &account : registry_.accounts())
    {
        auto const before = account.status;
        if (!quota_.reset_if_due(account, now))
        {
            continue;
        }
        ++log_.counters().quota_resets;
        emit(account, EventKind::QuotaReset, "daily quota reset", Severity::Info,
             now);
        announce_status(account, before, now, "new quota day");
        effects_.save = true;
    }
}

void PoolScheduler::run_expiries(TimePoint now)
{
    for (auto &account : registry_.accounts())
    {
        switch (account.status)
        {
        case AccountStatus::Cooldown:
            if (account.cooldown_until && now >= *account.cooldown_until)
            {
                StatusChange change;
                change.now = now;
                change.to = account.remaining_quota() > Duration{0}
                                ? AccountStatus::Active
                                : AccountStatus::QuotaExhausted;
                change_status(account, change, "cooldown expired");
            }
            break;
        case AccountStatus::Active:
            if (account.remaining_quota() <= Duration{0})
            {
                change_status(account, {AccountStatus::QuotaExhausted, now},
                              "no quota left today");
            }
            break;
        case AccountStatus::Error:
        case AccountStatus::Disconnected:
            if (account.retry_after && now >= *account.retry_after &&
                !has_pending(account.id))
            {
                emit(account, EventKind::Rebooting,
                     "retrying after earlier failure", Severity::Info, now);
                dispatch(OpKind::Retry, account, now);
            }
            break;
        default:
            break;
        }
    }
}

void PoolScheduler::evaluate_session(TimePoint now)
{
    auto *account = current_account();
    if (account == nullptr)
    {
        return;
    }
    auto const report = monitor_.evaluate(*account, settings_, now);
    if (report.quota_warning)
    {
        emit(*account, EventKind::QuotaWarning,
             std::format("{:.0f}% of daily quota used",
                         quota_.percent_used(*account)),
             Severity::Warning, now);
    }
    if (report.condition)
    {
        handle_switch(*report.condition, now);
    }
}

void PoolScheduler::handle_switch(SwitchReason reason, TimePoint now)
{
    auto *account = current_account();
    if (account == nullptr)
    {
        return;
    }
    auto const current_id = account->id;
    auto const next = pick_next(current_id);

    ++log_.counters().switch_required;
    SwitchRequiredEvent notice;
    notice.current_account_id = current_id;
    if (next)
    {
        notice.next_account_id = next->account_id;
    }
    notice.reason = reason;
    notice.at = now;
    queue_publish(std::move(notice));
    ROTOR_LOG_INFO("switch required on {} ({}), next: {}", current_id,
                   to_string(reason), next ? next->account_id : "none");

    // a low-quota rotation only happens onto a regular account; otherwise
    // the session keeps going until a hard limit
    if (reason == SwitchReason::QuotaLow && (!next || next->emergency))
    {
        return;
    }

    StatusChange change;
    change.to = AccountStatus::Cooldown;
    change.now = now;
    change.cooldown_until = now + settings_.cooldown;
    change.cooldown_reason = cooldown_reason_for(reason);
    close_current(change, now);

    if (next)
    {
        activate(next->account_id, next->emergency, now, current_id);
    }
    else
    {
        report_exhausted(now);
    }
}

void PoolScheduler::maintain_session(TimePoint now)
{
    auto *account = current_account();
    if (account == nullptr)
    {
        if (!engaged_)
        {
            return;
        }
        if (auto next = pick_next({}))
        {
            activate(next->account_id, next->emergency, now);
        }
        else
        {
            report_exhausted(now);
        }
        return;
    }

    if (emergency_active_)
    {
        auto ids = selector_.ranked(registry_.accounts(), settings_, cursor_,
                                    account->id);
        if (!ids.empty())
        {
            // hand back to a regular account as soon as one is eligible
            auto const id = account->id;
            close_current(deliberate_stop(*account, now), now);
            activate(ids.front(), false, now, id);
            return;
        }
    }

    if (settings_.auto_prestart && !prestart_)
    {
        auto const left = monitor_.time_to_switch(*account, settings_, now);
        if (left <= settings_.prestart_lead_time &&
            !selector_.ranked(registry_.accounts(), settings_, cursor_, account->id)
                 .empty())
        {
            if (auto result = start_prestart(now); !result)
            {
                ROTOR_LOG_DEBUG("prestart skipped: {}", result.message);
            }
        }
    }

    if (now - last_health_check_ >= settings_.health_check_interval &&
        !has_pending(account->id))
    {
        last_health_check_ = now;
        dispatch(OpKind::HealthCheck, *account, now);
    }
}

// ---------------------------------------------------------------------------
// sessions

Account *PoolScheduler::current_account()
{
    if (!current_)
    {
        return nullptr;
    }
    return registry_.find(current_->account_id);
}

std::optional<Selection> PoolScheduler::pick_next(std::string const &exclude) const
{
    // a prestart that is still eligible wins over a fresh selection
    if (prestart_ && prestart_->account_id != exclude)
    {
        if (auto const *account = registry_.find(prestart_->account_id);
            account != nullptr && Selector::is_eligible(*account))
        {
            return Selection{account->id, false};
        }
    }
    return selector_.select(registry_.accounts(), settings_, cursor_, exclude);
}

StatusChange PoolScheduler::deliberate_stop(Account const &account,
                                            TimePoint now) const
{
    StatusChange change;
    change.now = now;
    change.to = account.remaining_quota() > Duration{0}
                    ? AccountStatus::Active
                    : AccountStatus::QuotaExhausted;
    return change;
}

bool PoolScheduler::activate(std::string const &id, bool emergency, TimePoint now,
                             std::optional<std::string> previous)
{
    auto *account = registry_.find(id);
    if (account == nullptr)
    {
        return false;
    }
    if (current_)
    {
        if (current_->account_id == id)
        {
            return true;
        }
        previous = current_->account_id;
        close_current(deliberate_stop(*current_account(), now), now);
    }

    bool const from_prestart = prestart_ && prestart_->account_id == id;
    bool const ready = from_prestart && prestart_->ready;
    std::optional<std::uint64_t> keep;
    if (from_prestart && !ready)
    {
        keep = prestart_->ticket;
    }
    cancel_pending(id, keep);

    StatusChange change;
    change.to = AccountStatus::Running;
    change.now = now;
    if (!change_status(*account, change,
                       emergency ? "emergency activation" : "session assigned"))
    {
        if (from_prestart)
        {
            cancel_prestart();
        }
        return false;
    }

    if (from_prestart)
    {
        // the in-flight prestart becomes the session start
        for (auto &op : pending_)
        {
            if (keep && op.ticket == *keep)
            {
                op.kind = OpKind::StartSession;
            }
        }
        prestart_.reset();
    }
    else
    {
        dispatch(OpKind::StartSession, *account, now);
    }

    current_ = Session{id, now};
    monitor_.reset();
    last_accrual_ = now;
    last_health_check_ = now;
    if (!emergency)
    {
        cursor_ = id;
    }
    emergency_active_ = emergency;
    exhausted_reported_ = false;

    auto &counters = log_.counters();
    ++counters.sessions_started;
    if (previous)
    {
        ++counters.rotations;
    }
    emit(*account, EventKind::SessionStarted,
         from_prestart ? "session started from prestart" : "session started",
         Severity::Info, now);
    queue_publish(AccountRotatedEvent{previous, id, emergency, from_prestart, now});
    if (emergency)
    {
        ++counters.emergency_activations;
        emit(*account, EventKind::EmergencyActivated,
             "no eligible account left, emergency account activated",
             Severity::Warning, now);
        queue_publish(EmergencyActivatedEvent{id, previous, now});
    }
    ROTOR_LOG_INFO("account {} is now active{}{}", id,
                   emergency ? " (emergency)" : "",
                   from_prestart ? " (prestarted)" : "");
    return true;
}

void PoolScheduler::close_current(StatusChange change, TimePoint now)
{
    auto *account = current_account();
    if (account == nullptr)
    {
        current_.reset();
        return;
    }
    auto const started = current_->started_at;
    cancel_pending(account->id);
    dispatch_stop(*account);
    current_.reset();
    monitor_.reset();
    last_accrual_.reset();
    emergency_active_ = false;

    change_status(*account, change);
    ++log_.counters().sessions_ended;
    emit(*account, EventKind::SessionEnded,
         std::format("session ended after {}", minutes_text(now - started)),
         Severity::Info, now);
}

void PoolScheduler::fail_over(std::string const &failed_id, TimePoint now)
{
    if (!engaged_)
    {
        return;
    }
    if (auto next = pick_next(failed_id))
    {
        activate(next->account_id, next->emergency, now, failed_id);
    }
    else
    {
        report_exhausted(now);
    }
}

// ---------------------------------------------------------------------------
// prestart

OperationResult PoolScheduler::start_prestart(TimePoint now)
{
    std::string const exclude = current_ ? current_->account_id : std::string{};
    auto ids = selector_.ranked(registry_.accounts(), settings_, cursor_, exclude);
    if (ids.empty())
    {
        return OperationResult::failure(ErrorCode::PoolExhausted,
                                        "no eligible account to prestart");
    }
    auto const &candidate = ids.front();
    if (prestart_ && prestart_->account_id == candidate)
    {
        return OperationResult::success();
    }
    cancel_prestart();

    auto *account = registry_.find(candidate);
    auto const ticket = dispatch(OpKind::Prestart, *account, now);
    prestart_ = Prestart{candidate, ticket, false};
    ++log_.counters().prestarts;
    emit(*account, EventKind::PrestartTriggered,
         current_ ? std::format("prestarting ahead of {}", current_->account_id)
                  : std::string("prestarting next candidate"),
         Severity::Info, now);
    return OperationResult::success();
}

void PoolScheduler::validate_prestart(TimePoint)
{
    if (!prestart_)
    {
        return;
    }
    auto const *account = registry_.find(prestart_->account_id);
    if (account == nullptr || !Selector::is_eligible(*account))
    {
        cancel_prestart();
    }
}

void PoolScheduler::cancel_prestart()
{
    if (!prestart_)
    {
        return;
    }
    auto const prestart = *prestart_;
    prestart_.reset();

    auto it = std::find_if(pending_.begin(), pending_.end(),
                           [&](PendingOp const &op)
                           { return op.ticket == prestart.ticket; });
    if (it != pending_.end())
    {
        auto const op = *it;
        pending_.erase(it);
        abandon_start(op);
    }
    else if (prestart.ready)
    {
        if (auto const *account = registry_.find(prestart.account_id))
        {
            dispatch_stop(*account);
        }
    }
    ROTOR_LOG_DEBUG("prestart of {} cancelled", prestart.account_id);
}

// ---------------------------------------------------------------------------
// commands

AccountResult PoolScheduler::add_account(AccountSpec const &spec)
{
    std::unique_lock lock(mutex_);
    AccountResult result;
    result.status = AccountRegistry::validate(spec);
    if (!result.status)
    {
        return result;
    }
    auto const now = clock_.now();
    auto account = make_account(spec, now);
    result.status = registry_.add(account);
    if (!result.status)
    {
        return result;
    }
    emit(account, EventKind::AccountAdded,
         std::format("account added ({}, priority {})",
                     to_string(account.provider), account.priority),
         Severity::Info, now);
    effects_.save = true;
    result.account = std::move(account);
    finish(lock);
    return result;
}

OperationResult PoolScheduler::remove_account(std::string const &id)
{
    std::unique_lock lock(mutex_);
    auto *account = registry_.find(id);
    if (account == nullptr)
    {
        return OperationResult::failure(ErrorCode::NotFoundError,
                                        std::format("account {} not found", id));
    }
    auto const now = clock_.now();
    if (current_ && current_->account_id == id)
    {
        accrue_current(now);
        close_current(deliberate_stop(*account, now), now);
        engaged_ = false;
        cancel_prestart();
    }
    if (prestart_ && prestart_->account_id == id)
    {
        cancel_prestart();
    }
    cancel_pending(id);

    if (cursor_ == id)
    {
        // keep the round-robin position: continue after the predecessor
        auto const &accounts = registry_.accounts();
        std::size_t index = 0;
        while (index < accounts.size() && accounts[index].id != id)
        {
            ++index;
        }
        cursor_ = accounts.size() > 1
                      ? accounts[(index + accounts.size() - 1) % accounts.size()].id
                      : std::string{};
    }

    emit(*account, EventKind::AccountRemoved, "account removed", Severity::Info,
         now);
    registry_.remove(id);
    effects_.save = true;
    ROTOR_LOG_INFO("account {} removed", id);
    finish(lock);
    return OperationResult::success();
}

AccountResult PoolScheduler::update_account(AccountSpec const &spec)
{
    std::unique_lock lock(mutex_);
    AccountResult result;
    result.status = registry_.update(spec);
    if (!result.status)
    {
        return result;
    }
    result.account = registry_.get(spec.id);
    effects_.save = true;
    ROTOR_LOG_INFO("account {} updated (priority {}, {})", spec.id, spec.priority,
                   spec.enabled ? "enabled" : "disabled");
    finish(lock);
    return result;
}

OperationResult PoolScheduler::update_settings(PoolSettings const &settings)
{
    if (settings.low_quota_threshold_percent < 0 ||
        settings.low_quota_threshold_percent > 100)
    {
        return OperationResult::failure(
            ErrorCode::ValidationError,
            "low quota threshold must be between 0 and 100 percent");
    }
    if (settings.cooldown <= Duration{0})
    {
        return OperationResult::failure(ErrorCode::ValidationError,
                                        "cooldown must be positive");
    }
    if (settings.error_retry_delay < Duration{0} ||
        settings.prestart_lead_time < Duration{0})
    {
        return OperationResult::failure(ErrorCode::ValidationError,
                                        "durations must not be negative");
    }
    if (settings.health_check_interval <= Duration{0})
    {
        return OperationResult::failure(
            ErrorCode::ValidationError, "health check interval must be positive");
    }
    if (settings.max_consecutive_failures < 1)
    {
        return OperationResult::failure(
            ErrorCode::ValidationError, "failure budget must be at least one");
    }

    std::unique_lock lock(mutex_);
    settings_ = settings;
    effects_.save = true;
    queue_publish(SettingsChangedEvent{});
    ROTOR_LOG_INFO("pool settings updated ({} strategy)",
                   to_string(settings.strategy));
    finish(lock);
    return OperationResult::success();
}

OperationResult PoolScheduler::set_active(std::string const &id, bool force)
{
    std::unique_lock lock(mutex_);
    auto *account = registry_.find(id);
    if (account == nullptr)
    {
        return OperationResult::failure(ErrorCode::NotFoundError,
                                        std::format("account {} not found", id));
    }
    if (current_ && current_->account_id == id)
    {
        engaged_ = true;
        return OperationResult::success();
    }
    if (!force && !Selector::is_eligible(*account))
    {
        return OperationResult::failure(
            ErrorCode::IneligibleError,
            std::format("account {} is {}{}", id, to_string(account->status),
                        account->enabled ? "" : " and disabled"));
    }

    auto const now = clock_.now();
    std::optional<std::string> previous;
    if (auto *current = current_account())
    {
        previous = current->id;
        accrue_current(now);
        close_current(deliberate_stop(*current, now), now);
    }
    if (!activate(id, false, now, previous))
    {
        finish(lock);
        return OperationResult::failure(
            ErrorCode::IneligibleError,
            std::format("account {} cannot start a session", id));
    }
    engaged_ = true;
    finish(lock);
    return OperationResult::success();
}

OperationResult PoolScheduler::activate_next()
{
    std::unique_lock lock(mutex_);
    std::string const exclude = current_ ? current_->account_id : std::string{};
    auto const next = pick_next(exclude);
    if (!next)
    {
        return OperationResult::failure(ErrorCode::PoolExhausted,
                                        "no eligible or emergency account");
    }
    auto const now = clock_.now();
    std::optional<std::string> previous;
    if (auto *current = current_account())
    {
        previous = current->id;
        accrue_current(now);
        close_current(deliberate_stop(*current, now), now);
    }
    if (!activate(next->account_id, next->emergency, now, previous))
    {
        finish(lock);
        return OperationResult::failure(
            ErrorCode::IneligibleError,
            std::format("account {} cannot start a session", next->account_id));
    }
    engaged_ = true;
    finish(lock);
    return OperationResult::success();
}

OperationResult PoolScheduler::end_session()
{
    std::unique_lock lock(mutex_);
    auto *account = current_account();
    if (account == nullptr)
    {
        return OperationResult::failure(ErrorCode::NotFoundError,
                                        "no session is active");
    }
    auto const now = clock_.now();
    accrue_current(now);
    close_current(deliberate_stop(*account, now), now);
    engaged_ = false;
    cancel_prestart();
    finish(lock);
    return OperationResult::success();
}

OperationResult PoolScheduler::pause_session()
{
    std::unique_lock lock(mutex_);
    if (current_account() == nullptr)
    {
        return OperationResult::failure(ErrorCode::NotFoundError,
                                        "no session is active");
    }
    auto const now = clock_.now();
    accrue_current(now);
    close_current({AccountStatus::Paused, now}, now);
    engaged_ = false;
    cancel_prestart();
    finish(lock);
    return OperationResult::success();
}

OperationResult PoolScheduler::resume_account(std::string const &id)
{
    std::unique_lock lock(mutex_);
    auto *account = registry_.find(id);
    if (account == nullptr)
    {
        return OperationResult::failure(ErrorCode::NotFoundError,
                                        std::format("account {} not found", id));
    }
    if (account->status != AccountStatus::Paused)
    {
        return OperationResult::failure(
            ErrorCode::IneligibleError,
            std::format("account {} is {}, not paused", id,
                        to_string(account->status)));
    }
    change_status(*account, {AccountStatus::Active, clock_.now()}, "resumed");
    finish(lock);
    return OperationResult::success();
}

OperationResult PoolScheduler::recover_account(std::string const &id)
{
    std::unique_lock lock(mutex_);
    auto *account = registry_.find(id);
    if (account == nullptr)
    {
        return OperationResult::failure(ErrorCode::NotFoundError,
                                        std::format("account {} not found", id));
    }
    if (!AccountStateMachine::is_failure_status(account->status))
    {
        return OperationResult::failure(
            ErrorCode::IneligibleError,
            std::format("account {} is {}; nothing to recover", id,
                        to_string(account->status)));
    }
    if (has_pending(id))
    {
        return OperationResult::success();
    }
    auto const now = clock_.now();
    emit(*account, EventKind::Rebooting, "recovery requested", Severity::Info,
         now);
    dispatch(OpKind::Recover, *account, now);
    finish(lock);
    return OperationResult::success();
}

OperationResult PoolScheduler::reset_daily_quota(std::string const &id)
{
    std::unique_lock lock(mutex_);
    auto *account = registry_.find(id);
    if (account == nullptr)
    {
        return OperationResult::failure(ErrorCode::NotFoundError,
                                        std::format("account {} not found", id));
    }
    auto const now = clock_.now();
    auto const before = account->status;
    quota_.reset(*account, now);
    ++log_.counters().quota_resets;
    emit(*account, EventKind::QuotaReset, "daily quota reset by operator",
         Severity::Info, now);
    announce_status(*account, before, now, "quota reset");
    effects_.save = true;
    finish(lock);
    return OperationResult::success();
}

OperationResult PoolScheduler::reset_all_daily_quotas()
{
    std::unique_lock lock(mutex_);
    auto const now = clock_.now();
    for (auto &account : registry_.accounts())
    {
        auto const before = account.status;
        quota_.reset(account, now);
        ++log_.counters().quota_resets;
        emit(account, EventKind::QuotaReset, "daily quota reset by operator",
             Severity::Info, now);
        announce_status(account, before, now, "quota reset");
    }
    effects_.save = true;
    finish(lock);
    return OperationResult::success();
}

OperationResult PoolScheduler::prestart_next()
{
    std::unique_lock lock(mutex_);
    auto result = start_prestart(clock_.now());
    finish(lock);
    return result;
}

OperationResult PoolScheduler::record_task_started(std::string const &id,
                                                   std::string const &description)
{
    std::unique_lock lock(mutex_);
    auto *account = registry_.find(id);
    if (account == nullptr)
    {
        return OperationResult::failure(ErrorCode::NotFoundError,
                                        std::format("account {} not found", id));
    }
    if (account->status != AccountStatus::Running)
    {
        return OperationResult::failure(
            ErrorCode::IneligibleError,
            std::format("account {} has no running session", id));
    }
    ++account->telemetry.current_tasks;
    emit(*account, EventKind::TaskStarted, description, Severity::Info,
         clock_.now());
    finish(lock);
    return OperationResult::success();
}

OperationResult PoolScheduler::record_task_completed(
    std::string const &id, std::string const &description)
{
    std::unique_lock lock(mutex_);
    auto *account = registry_.find(id);
    if (account == nullptr)
    {
        return OperationResult::failure(ErrorCode::NotFoundError,
                                        std::format("account {} not found", id));
    }
    if (account->status != AccountStatus::Running)
    {
        return OperationResult::failure(
            ErrorCode::IneligibleError,
            std::format("account {} has no running session", id));
    }
    ++account->success_count;
    account->consecutive_failures = 0;
    account->telemetry.current_tasks =
        std::max(0, account->telemetry.current_tasks - 1);
    ++log_.counters().tasks_completed;
    emit(*account, EventKind::TaskCompleted, description, Severity::Info,
         clock_.now());
    effects_.save = true;
    finish(lock);
    return OperationResult::success();
}

OperationResult PoolScheduler::record_task_failed(std::string const &id,
                                                  std::string const &error)
{
    std::unique_lock lock(mutex_);
    auto *account = registry_.find(id);
    if (account == nullptr)
    {
        return OperationResult::failure(ErrorCode::NotFoundError,
                                        std::format("account {} not found", id));
    }
    if (account->status != AccountStatus::Running)
    {
        return OperationResult::failure(
            ErrorCode::IneligibleError,
            std::format("account {} has no running session", id));
    }
    auto const now = clock_.now();
    ++account->failure_count;
    ++account->consecutive_failures;
    account->last_error = error;
    account->telemetry.current_tasks =
        std::max(0, account->telemetry.current_tasks - 1);
    ++log_.counters().tasks_failed;

    auto const budget =
        static_cast<std::uint32_t>(std::max(1, settings_.max_consecutive_failures));
    emit(*account, EventKind::TaskFailed, error,
         account->consecutive_failures > 1 ? Severity::Critical
                                           : Severity::Warning,
         now);
    if (account->consecutive_failures >= budget)
    {
        accrue_current(now);
        handle_failure(*account,
                       std::format("{} consecutive task failures",
                                   account->consecutive_failures),
                       false, AccountStatus::Error, now, true);
    }
    effects_.save = true;
    finish(lock);
    return OperationResult::success();
}

OperationResult PoolScheduler::update_telemetry(std::string const &id,
                                                ResourceTelemetry const &telemetry)
{
    std::unique_lock lock(mutex_);
    auto *account = registry_.find(id);
    if (account == nullptr)
    {
        return OperationResult::failure(ErrorCode::NotFoundError,
                                        std::format("account {} not found", id));
    }
    if (account->status != AccountStatus::Running)
    {
        return OperationResult::failure(
            ErrorCode::IneligibleError,
            std::format("telemetry for {} ignored: not running", id));
    }
    account->telemetry = telemetry;
    return OperationResult::success();
}

// ---------------------------------------------------------------------------
// queries

PoolStatus PoolScheduler::pool_status() const
{
    std::lock_guard lock(mutex_);
    PoolStatus status;
    for (auto const &account : registry_.accounts())
    {
        ++status.total_accounts;
        if (!account.enabled)
        {
            ++status.disabled_accounts;
        }
        else
        {
            status.total_remaining_quota += account.remaining_quota();
        }
        switch (account.status)
        {
        case AccountStatus::Active:
            ++status.active_accounts;
            break;
        case AccountStatus::Running:
            ++status.running_accounts;
            break;
        case AccountStatus::Cooldown:
            ++status.cooldown_accounts;
            break;
        case AccountStatus::QuotaExhausted:
            ++status.exhausted_accounts;
            break;
        case AccountStatus::Error:
        case AccountStatus::Disconnected:
            ++status.error_accounts;
            break;
        case AccountStatus::Paused:
            ++status.paused_accounts;
            break;
        case AccountStatus::Suspended:
            ++status.suspended_accounts;
            break;
        }
    }
    status.current_session = current_;
    std::string const exclude = current_ ? current_->account_id : std::string{};
    if (auto next = pick_next(exclude))
    {
        status.next_candidate_id = next->account_id;
    }
    if (prestart_)
    {
        status.prestart_candidate_id = prestart_->account_id;
    }
    status.is_pool_available =
        current_.has_value() || status.next_candidate_id.has_value();
    status.emergency_active = emergency_active_;
    status.updated_at = clock_.now();
    return status;
}

std::vector<Account> PoolScheduler::all_accounts() const
{
    std::lock_guard lock(mutex_);
    return registry_.accounts();
}

std::optional<Account> PoolScheduler::account(std::string const &id) const
{
    std::lock_guard lock(mutex_);
    return registry_.get(id);
}

PoolStats PoolScheduler::stats() const
{
    std::lock_guard lock(mutex_);
    PoolStats stats;
    double utilization = 0.0;
    for (auto const &account : registry_.accounts())
    {
        ++stats.total_accounts;
        stats.total_quota_used += std::min(account.used_today, account.daily_limit);
        if (account.enabled)
        {
            stats.total_quota_remaining += account.remaining_quota();
        }
        if (account.emergency)
        {
            ++stats.emergency_accounts;
        }
        if (account.status == AccountStatus::Running)
        {
            ++stats.running_accounts;
            utilization += account.telemetry.utilization_percent;
        }
        if (AccountStateMachine::is_failure_status(account.status))
        {
            ++stats.error_accounts;
        }
    }
    if (stats.running_accounts > 0)
    {
        stats.average_utilization =
            utilization / static_cast<double>(stats.running_accounts);
    }
    stats.counters = log_.counters();

    std::string exclude;
    if (current_)
    {
        stats.active_account_id = current_->account_id;
        exclude = current_->account_id;
        if (auto const *account = registry_.find(current_->account_id))
        {
            auto const now = clock_.now();
            stats.next_switch_time =
                now + monitor_.time_to_switch(*account, settings_, now);
        }
    }
    if (auto next = pick_next(exclude))
    {
        stats.next_candidate_id = next->account_id;
    }
    return stats;
}

std::vector<PoolEvent> PoolScheduler::recent_events(std::size_t count) const
{
    std::lock_guard lock(mutex_);
    return log_.recent(count);
}

PoolSettings PoolScheduler::settings() const
{
    std::lock_guard lock(mutex_);
    return settings_;
}

std::optional<std::string> PoolScheduler::current_account_id() const
{
    std::lock_guard lock(mutex_);
    if (!current_)
    {
        return std::nullopt;
    }
    return current_->account_id;
}

std::size_t PoolScheduler::pending_operations() const
{
    std::lock_guard lock(mutex_);
    return pending_.size();
}

} // namespace rotor::engine
