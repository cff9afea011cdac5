#include "engine/QuotaTracker.hpp"

#include "engine/AccountStateMachine.hpp"
#include "engine/PoolUtils.hpp"

#include <algorithm>

namespace rotor::engine
{

AccrualResult QuotaTracker::accrue(Account &account, Duration elapsed) const
{
    AccrualResult result;
    if (elapsed <= Duration{0})
    {
        return result;
    }
    auto const before = account.used_today;
    auto const room = before >= account.daily_limit
                          ? Duration{0}
                          : account.daily_limit - before;
    result.recorded = std::min(room, elapsed);
    result.overflow = elapsed - result.recorded;
    account.used_today = before + result.recorded;
    result.reached_limit =
        before < account.daily_limit && account.used_today >= account.daily_limit;
    return result;
}

bool QuotaTracker::reset_if_due(Account &account, TimePoint now) const
{
    if (utc_day(now) <= account.last_reset_day)
    {
        return false;
    }
    clear_usage(account, now);
    return true;
}

void QuotaTracker::reset(Account &account, TimePoint now) const
{
    clear_usage(account, now);
}

double QuotaTracker::percent_used(Account const &account) const noexcept
{
    if (account.daily_limit <= Duration{0})
    {
        return 100.0;
    }
    auto const used = std::min(account.used_today, account.daily_limit);
    return static_cast<double>(used.count()) * 100.0 /
           static_cast<double>(account.daily_limit.count());
}

double QuotaTracker::percent_remaining(Account const &account) const noexcept
{
    return 100.0 - percent_used(account);
}

bool QuotaTracker::is_exhausted(Account const &account) const noexcept
{
    return account.remaining_quota() <= Duration{0};
}

bool QuotaTracker::is_low(Account const &account,
                          int threshold_percent) const noexcept
{
    return percent_remaining(account) < 100.0 - threshold_percent;
}

void QuotaTracker::clear_usage(Account &account, TimePoint now) const
{
    account.used_today = Duration{0};
    account.last_reset_day = std::max(account.last_reset_day, utc_day(now));

    bool const quota_cooldown =
        account.status == AccountStatus::Cooldown &&
        account.cooldown_reason == CooldownReason::QuotaExhausted;
    if (quota_cooldown || account.status == AccountStatus::QuotaExhausted)
    {
        StatusChange change;
        change.to = AccountStatus::Active;
        change.now = now;
        AccountStateMachine::apply(account, change);
    }
}

} // namespace rotor::engine
