#pragma once

#include "engine/Core.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace rotor::engine
{

inline constexpr std::int64_t kMillisPerDay = 24LL * 60 * 60 * 1000;

inline std::int64_t to_epoch_ms(TimePoint value) noexcept
{
    return value.time_since_epoch().count();
}

inline TimePoint from_epoch_ms(std::int64_t value) noexcept
{
    return TimePoint(Duration(value));
}

// Calendar day (UTC) counted from the unix epoch.
inline std::int64_t utc_day(TimePoint value) noexcept
{
    auto ms = to_epoch_ms(value);
    auto day = ms / kMillisPerDay;
    if (ms < 0 && ms % kMillisPerDay != 0)
    {
        --day;
    }
    return day;
}

inline double to_minutes(Duration value) noexcept
{
    return static_cast<double>(value.count()) / 60000.0;
}

namespace detail
{

template <typename Enum, std::size_t N>
std::string_view enum_name(std::array<std::pair<Enum, std::string_view>, N> const &table,
                           Enum value)
{
    for (auto const &[key, name] : table)
    {
        if (key == value)
        {
            return name;
        }
    }
    return "unknown";
}

template <typename Enum, std::size_t N>
std::optional<Enum> enum_parse(std::array<std::pair<Enum, std::string_view>, N> const &table,
                               std::string_view value)
{
    for (auto const &[key, name] : table)
    {
        if (name == value)
        {
            return key;
        }
    }
    return std::nullopt;
}

inline constexpr std::array<std::pair<ProviderType, std::string_view>, 11>
    kProviderNames{{
        {ProviderType::GoogleColab, "google-colab"},
        {ProviderType::Kaggle, "kaggle"},
        {ProviderType::LightningAI, "lightning-ai"},
        {ProviderType::HuggingFace, "hugging-face"},
        {ProviderType::Paperspace, "paperspace"},
        {ProviderType::SaturnCloud, "saturn-cloud"},
        {ProviderType::RunPod, "runpod"},
        {ProviderType::Vast, "vast"},
        {ProviderType::Lambda, "lambda"},
        {ProviderType::Local, "local"},
        {ProviderType::Custom, "custom"},
    }};

inline constexpr std::array<std::pair<AccountTier, std::string_view>, 3>
    kTierNames{{
        {AccountTier::Free, "free"},
        {AccountTier::Pro, "pro"},
        {AccountTier::ProPlus, "pro-plus"},
    }};

inline constexpr std::array<std::pair<AccountStatus, std::string_view>, 8>
    kStatusNames{{
        {AccountStatus::Active, "active"},
        {AccountStatus::Running, "running"},
        {AccountStatus::Cooldown, "cooldown"},
        {AccountStatus::QuotaExhausted, "quota-exhausted"},
        {AccountStatus::Error, "error"},
        {AccountStatus::Disconnected, "disconnected"},
        {AccountStatus::Paused, "paused"},
        {AccountStatus::Suspended, "suspended"},
    }};

inline constexpr std::array<std::pair<CooldownReason, std::string_view>, 4>
    kCooldownReasonNames{{
        {CooldownReason::None, "none"},
        {CooldownReason::SessionLimit, "session-limit"},
        {CooldownReason::QuotaExhausted, "quota-exhausted"},
        {CooldownReason::Rotation, "rotation"},
    }};

inline constexpr std::array<std::pair<RotationStrategy, std::string_view>, 3>
    kStrategyNames{{
        {RotationStrategy::Priority, "priority"},
        {RotationStrategy::RoundRobin, "round-robin"},
        {RotationStrategy::LeastUsed, "least-used"},
    }};

inline constexpr std::array<std::pair<EventKind, std::string_view>, 19>
    kEventKindNames{{
        {EventKind::StatusChanged, "status-changed"},
        {EventKind::Connected, "connected"},
        {EventKind::Disconnected, "disconnected"},
        {EventKind::TaskStarted, "task-started"},
        {EventKind::TaskCompleted, "task-completed"},
        {EventKind::TaskFailed, "task-failed"},
        {EventKind::QuotaWarning, "quota-warning"},
        {EventKind::QuotaExceeded, "quota-exceeded"},
        {EventKind::QuotaReset, "quota-reset"},
        {EventKind::SessionStarted, "session-started"},
        {EventKind::SessionEnded, "session-ended"},
        {EventKind::Rebooting, "rebooting"},
        {EventKind::Error, "error"},
        {EventKind::EmergencyActivated, "emergency-activated"},
        {EventKind::PrestartTriggered, "prestart-triggered"},
        {EventKind::AccountAdded, "account-added"},
        {EventKind::AccountRemoved, "account-removed"},
        {EventKind::AccountRecovered, "account-recovered"},
        {EventKind::PoolExhausted, "pool-exhausted"},
    }};

inline constexpr std::array<std::pair<Severity, std::string_view>, 3>
    kSeverityNames{{
        {Severity::Info, "info"},
        {Severity::Warning, "warning"},
        {Severity::Critical, "critical"},
    }};

inline constexpr std::array<std::pair<SwitchReason, std::string_view>, 4>
    kSwitchReasonNames{{
        {SwitchReason::QuotaExhausted, "quota-exhausted"},
        {SwitchReason::SessionLimit, "session-limit"},
        {SwitchReason::QuotaLow, "quota-low"},
        {SwitchReason::ProvisioningFailure, "provisioning-failure"},
    }};

inline constexpr std::array<std::pair<ErrorCode, std::string_view>, 6>
    kErrorCodeNames{{
        {ErrorCode::Ok, "ok"},
        {ErrorCode::ValidationError, "validation-error"},
        {ErrorCode::NotFoundError, "not-found"},
        {ErrorCode::IneligibleError, "ineligible"},
        {ErrorCode::ProvisioningError, "provisioning-error"},
        {ErrorCode::PoolExhausted, "pool-exhausted"},
    }};

} // namespace detail

inline std::string_view to_string(ProviderType value)
{
    return detail::enum_name(detail::kProviderNames, value);
}

inline std::string_view to_string(AccountTier value)
{
    return detail::enum_name(detail::kTierNames, value);
}

inline std::string_view to_string(AccountStatus value)
{
    return detail::enum_name(detail::kStatusNames, value);
}

inline std::string_view to_string(CooldownReason value)
{
    return detail::enum_name(detail::kCooldownReasonNames, value);
}

inline std::string_view to_string(RotationStrategy value)
{
    return detail::enum_name(detail::kStrategyNames, value);
}

inline std::string_view to_string(EventKind value)
{
    return detail::enum_name(detail::kEventKindNames, value);
}

inline std::string_view to_string(Severity value)
{
    return detail::enum_name(detail::kSeverityNames, value);
}

inline std::string_view to_string(SwitchReason value)
{
    return detail::enum_name(detail::kSwitchReasonNames, value);
}

inline std::string_view to_string(ErrorCode value)
{
    return detail::enum_name(detail::kErrorCodeNames, value);
}

inline std::optional<ProviderType> parse_provider(std::string_view value)
{
    return detail::enum_parse(detail::kProviderNames, value);
}

inline std::optional<AccountTier> parse_tier(std::string_view value)
{
    return detail::enum_parse(detail::kTierNames, value);
}

inline std::optional<AccountStatus> parse_status(std::string_view value)
{
    return detail::enum_parse(detail::kStatusNames, value);
}

inline std::optional<CooldownReason> parse_cooldown_reason(std::string_view value)
{
    return detail::enum_parse(detail::kCooldownReasonNames, value);
}

inline std::optional<RotationStrategy> parse_strategy(std::string_view value)
{
    return detail::enum_parse(detail::kStrategyNames, value);
}

inline std::optional<EventKind> parse_event_kind(std::string_view value)
{
    return detail::enum_parse(detail::kEventKindNames, value);
}

inline std::optional<Severity> parse_severity(std::string_view value)
{
    return detail::enum_parse(detail::kSeverityNames, value);
}

inline Account make_account(AccountSpec const &spec, TimePoint now)
{
    Account account;
    account.id = spec.id;
    account.display_name = spec.display_name.empty() ? spec.id : spec.display_name;
    account.provider = spec.provider;
    account.tier = spec.tier;
    account.priority = spec.priority;
    account.enabled = spec.enabled;
    account.emergency = spec.emergency;
    account.daily_limit = spec.daily_limit;
    account.max_session = spec.max_session;
    account.status = AccountStatus::Active;
    account.last_reset_day = utc_day(now);
    account.created_at = now;
    return account;
}

inline AccountSpec spec_of(Account const &account)
{
    AccountSpec spec;
    spec.id = account.id;
    spec.display_name = account.display_name;
    spec.provider = account.provider;
    spec.tier = account.tier;
    spec.priority = account.priority;
    spec.enabled = account.enabled;
    spec.emergency = account.emergency;
    spec.daily_limit = account.daily_limit;
    spec.max_session = account.max_session;
    return spec;
}

} // namespace rotor::engine
