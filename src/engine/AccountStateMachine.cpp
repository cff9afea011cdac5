#include "engine/AccountStateMachine.hpp"

#include <array>
#include <cstddef>

namespace rotor::engine
{

namespace
{

constexpr std::size_t kStatusCount = 8;

using Row = std::array<bool, kStatusCount>;

constexpr std::size_t index_of(AccountStatus status) noexcept
{
    return static_cast<std::size_t>(status);
}

// rows: from, columns: to
// order: Active, Running, Cooldown, QuotaExhausted, Error, Disconnected,
//        Paused, Suspended
constexpr std::array<Row, kStatusCount> kTransitions{{
    /* Active         */ {false, true, false, true, true, false, false, true},
    /* Running        */ {true, false, true, true, true, true, true, true},
    /* Cooldown       */ {true, true, false, true, false, false, false, false},
    /* QuotaExhausted */ {true, true, false, false, false, false, false, false},
    /* Error          */ {true, true, false, false, false, false, false, true},
    /* Disconnected   */ {true, true, false, false, true, false, false, true},
    /* Paused         */ {true, true, false, false, false, false, false, false},
    /* Suspended      */ {true, true, false, false, false, false, false, false},
}};

} // namespace

bool AccountStateMachine::can_transition(AccountStatus from,
                                         AccountStatus to) noexcept
{
    auto const row = index_of(from);
    auto const column = index_of(to);
    if (row >= kStatusCount || column >= kStatusCount)
    {
        return false;
    }
    return kTransitions[row][column];
}

bool AccountStateMachine::is_failure_status(AccountStatus status) noexcept
{
    return status == AccountStatus::Error ||
           status == AccountStatus::Disconnected ||
           status == AccountStatus::Suspended;
}

bool AccountStateMachine::apply(Account &account, StatusChange const &change)
{
    if (!can_transition(account.status, change.to))
    {
        return false;
    }
    if (change.to == AccountStatus::Cooldown && !change.cooldown_until)
    {
        return false;
    }

    auto const from = account.status;

    if (from == AccountStatus::Running)
    {
        account.session_start.reset();
        account.telemetry = ResourceTelemetry{};
        account.last_used_at = change.now;
    }
    if (from == AccountStatus::Cooldown)
    {
        account.cooldown_until.reset();
        account.cooldown_reason = CooldownReason::None;
    }
    if (from == AccountStatus::Error || from == AccountStatus::Disconnected)
    {
        account.retry_after.reset();
    }

    switch (change.to)
    {
    case AccountStatus::Running:
        account.session_start = change.now;
        account.last_used_at = change.now;
        ++account.total_sessions;
        account.retry_after.reset();
        break;
    case AccountStatus::Cooldown:
        account.cooldown_until = change.cooldown_until;
        account.cooldown_reason = change.cooldown_reason;
        break;
    case AccountStatus::Error:
    case AccountStatus::Disconnected:
        account.retry_after = change.retry_after;
        if (change.error)
        {
            account.last_error = change.error;
        }
        break;
    case AccountStatus::Suspended:
        account.retry_after.reset();
        if (change.error)
        {
            account.last_error = change.error;
        }
        break;
    case AccountStatus::Active:
        account.retry_after.reset();
        break;
    default:
        break;
    }

    account.status = change.to;
    return true;
}

void AccountStateMachine::normalize(Account &account)
{
    if (account.status != AccountStatus::Cooldown)
    {
        account.cooldown_until.reset();
        account.cooldown_reason = CooldownReason::None;
    }
    if (!is_failure_status(account.status) ||
        account.status == AccountStatus::Suspended)
    {
        account.retry_after.reset();
    }
}

} // namespace rotor::engine
