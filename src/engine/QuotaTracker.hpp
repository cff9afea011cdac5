#pragma once

#include "engine/Core.hpp"

namespace rotor::engine
{

struct AccrualResult
{
    Duration recorded{0};
    // Running time past the daily limit; recorded as an exhaustion event only.
    Duration overflow{0};
    bool reached_limit = false;
};

class QuotaTracker
{
  public:
    AccrualResult accrue(Account &account, Duration elapsed) const;

    // Zeroes usage when `now` falls on a later UTC day than the last reset.
    // Returns true when a reset happened; repeated calls on the same day are
    // no-ops.
    bool reset_if_due(Account &account, TimePoint now) const;

    // Manual operator reset, independent of the calendar day.
    void reset(Account &account, TimePoint now) const;

    double percent_used(Account const &account) const noexcept;
    double percent_remaining(Account const &account) const noexcept;
    bool is_exhausted(Account const &account) const noexcept;
    bool is_low(Account const &account, int threshold_percent) const noexcept;

  private:
    void clear_usage(Account &account, TimePoint now) const;
};

} // namespace rotor::engine
