#pragma once

#include "engine/Core.hpp"
#include "engine/QuotaTracker.hpp"

#include <optional>
#include <string>

namespace rotor::engine
{

struct MonitorReport
{
    // Highest-precedence switch condition not yet raised for this session.
    std::optional<SwitchReason> condition;
    // Set once per session when usage crosses the low-quota threshold.
    bool quota_warning = false;
    Duration session_elapsed{0};
    Duration time_to_switch{0};
};

class SessionMonitor
{
  public:
    explicit SessionMonitor(QuotaTracker const &quota) : quota_(quota) {}

    MonitorReport evaluate(Account const &account, PoolSettings const &settings,
                           TimePoint now);

    // Time left before the running account must hand over: the smaller of
    // the remaining session length and the remaining (usable) quota.
    Duration time_to_switch(Account const &account, PoolSettings const &settings,
                            TimePoint now) const;

    void reset() noexcept { tracked_.reset(); }

  private:
    struct TrackedSession
    {
        std::string account_id;
        TimePoint started_at{};
        bool exhausted_raised = false;
        bool session_limit_raised = false;
        bool quota_low_raised = false;
        bool warning_raised = false;
    };

    TrackedSession &track(Account const &account);

    QuotaTracker const &quota_;
    std::optional<TrackedSession> tracked_;
};

} // namespace rotor::engine
