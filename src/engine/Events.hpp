#pragma once

#include "engine/Core.hpp"

#include <optional>
#include <string>

namespace rotor::engine
{

// Every record appended to the event log is also published as this.
struct PoolEventPublished
{
    PoolEvent event;
};

struct AccountRotatedEvent
{
    std::optional<std::string> previous_account_id;
    std::string account_id;
    bool emergency = false;
    bool from_prestart = false;
    TimePoint at{};
};

struct NodeStatusChangedEvent
{
    std::string account_id;
    AccountStatus old_status = AccountStatus::Active;
    AccountStatus new_status = AccountStatus::Active;
    TimePoint at{};
};

struct SwitchRequiredEvent
{
    std::string current_account_id;
    std::optional<std::string> next_account_id;
    SwitchReason reason = SwitchReason::QuotaExhausted;
    TimePoint at{};
};

struct EmergencyActivatedEvent
{
    std::string account_id;
    std::optional<std::string> replaced_account_id;
    TimePoint at{};
};

struct SettingsChangedEvent
{
};

} // namespace rotor::engine
