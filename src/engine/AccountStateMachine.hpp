#pragma once

#include "engine/Core.hpp"

#include <optional>
#include <string>

namespace rotor::engine
{

struct StatusChange
{
    AccountStatus to = AccountStatus::Active;
    TimePoint now{};
    std::optional<TimePoint> cooldown_until;
    CooldownReason cooldown_reason = CooldownReason::None;
    std::optional<TimePoint> retry_after;
    std::optional<std::string> error;
};

// The one table of legal account status moves. Every status write in the
// pool goes through apply() so the cooldown, session and telemetry fields
// stay consistent with the status.
class AccountStateMachine
{
  public:
    static bool can_transition(AccountStatus from, AccountStatus to) noexcept;

    // Returns false (and leaves the account untouched) for an illegal move or
    // a Cooldown entry without an expiry.
    static bool apply(Account &account, StatusChange const &change);

    static bool is_failure_status(AccountStatus status) noexcept;

    // Drops cooldown and retry fields that do not belong to the account's
    // status. Used on records read back from a store.
    static void normalize(Account &account);
};

} // namespace rotor::engine
