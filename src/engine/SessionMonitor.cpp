#include "engine/SessionMonitor.hpp"

#include <algorithm>

namespace rotor::engine
{

SessionMonitor::TrackedSession &SessionMonitor::track(Account const &account)
{
    auto const started = account.session_start.value_or(TimePoint{});
    if (!tracked_ || tracked_->account_id != account.id ||
        tracked_->started_at != started)
    {
        tracked_ = TrackedSession{account.id, started};
    }
    return *tracked_;
}

MonitorReport SessionMonitor::evaluate(Account const &account,
                                       PoolSettings const &settings,
                                       TimePoint now)
{
    MonitorReport report;
    if (account.status != AccountStatus::Running || !account.session_start)
    {
        return report;
    }
    auto &session = track(account);

    report.session_elapsed =
        now > *account.session_start ? now - *account.session_start : Duration{0};
    report.time_to_switch = time_to_switch(account, settings, now);

    bool const exhausted = quota_.is_exhausted(account);
    bool const session_limit = report.session_elapsed >= account.max_session;
    bool const low =
        quota_.is_low(account, settings.low_quota_threshold_percent);

    if (low && !session.warning_raised)
    {
        session.warning_raised = true;
        report.quota_warning = true;
    }

    // precedence: exhausted > session limit > low quota. Lower conditions
    // that already hold are consumed with the one reported.
    if (exhausted && !session.exhausted_raised)
    {
        report.condition = SwitchReason::QuotaExhausted;
    }
    else if (session_limit && !session.session_limit_raised)
    {
        report.condition = SwitchReason::SessionLimit;
    }
    else if (low && settings.auto_rotate_on_quota_low &&
             !session.quota_low_raised)
    {
        report.condition = SwitchReason::QuotaLow;
    }

    if (report.condition)
    {
        session.exhausted_raised = session.exhausted_raised || exhausted;
        session.session_limit_raised =
            session.session_limit_raised || session_limit;
        session.quota_low_raised =
            session.quota_low_raised || (low && settings.auto_rotate_on_quota_low);
    }
    return report;
}

Duration SessionMonitor::time_to_switch(Account const &account,
                                        PoolSettings const &settings,
                                        TimePoint now) const
{
    if (!account.session_start)
    {
        return Duration{0};
    }
    auto const elapsed =
        now > *account.session_start ? now - *account.session_start : Duration{0};
    auto const session_left =
        elapsed >= account.max_session ? Duration{0} : account.max_session - elapsed;

    auto quota_left = account.remaining_quota();
    if (settings.auto_rotate_on_quota_low)
    {
        // low-quota rotation fires once usage passes threshold% of the limit
        auto const soft_limit = Duration(account.daily_limit.count() *
                                         settings.low_quota_threshold_percent /
                                         100);
        auto const soft_left = account.used_today >= soft_limit
                                   ? Duration{0}
                                   : soft_limit - account.used_today;
        quota_left = std::min(quota_left, soft_left);
    }
    return std::min(session_left, quota_left);
}

} // namespace rotor::engine
