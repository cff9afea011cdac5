#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rotor::engine
{

using Duration = std::chrono::milliseconds;
using TimePoint = std::chrono::time_point<std::chrono::system_clock, Duration>;

enum class ProviderType
{
    GoogleColab = 0,
    Kaggle,
    LightningAI,
    HuggingFace,
    Paperspace,
    SaturnCloud,
    RunPod,
    Vast,
    Lambda,
    Local,
    Custom,
};

enum class AccountTier
{
    Free = 0,
    Pro,
    ProPlus,
};

enum class AccountStatus
{
    Active = 0,
    Running,
    Cooldown,
    QuotaExhausted,
    Error,
    Disconnected,
    Paused,
    Suspended,
};

enum class CooldownReason
{
    None = 0,
    SessionLimit,
    QuotaExhausted,
    Rotation,
};

enum class RotationStrategy
{
    Priority = 0,
    RoundRobin,
    LeastUsed,
};

enum class EventKind
{
    StatusChanged = 0,
    Connected,
    Disconnected,
    TaskStarted,
    TaskCompleted,
    TaskFailed,
    QuotaWarning,
    QuotaExceeded,
    QuotaReset,
    SessionStarted,
    SessionEnded,
    Rebooting,
    Error,
    EmergencyActivated,
    PrestartTriggered,
    AccountAdded,
    AccountRemoved,
    AccountRecovered,
    PoolExhausted,
};

enum class Severity
{
    Info = 0,
    Warning,
    Critical,
};

enum class SwitchReason
{
    QuotaExhausted = 0,
    SessionLimit,
    QuotaLow,
    ProvisioningFailure,
};

enum class ErrorCode
{
    Ok = 0,
    ValidationError,
    NotFoundError,
    IneligibleError,
    ProvisioningError,
    PoolExhausted,
};

struct OperationResult
{
    ErrorCode code = ErrorCode::Ok;
    std::string message;

    bool ok() const noexcept { return code == ErrorCode::Ok; }
    explicit operator bool() const noexcept { return ok(); }

    static OperationResult success() { return {}; }
    static OperationResult failure(ErrorCode code, std::string message)
    {
        return {code, std::move(message)};
    }
};

struct ResourceTelemetry
{
    double memory_used_gb = 0.0;
    double memory_total_gb = 0.0;
    double utilization_percent = 0.0;
    double temperature_c = 0.0;
    int current_tasks = 0;

    bool operator==(ResourceTelemetry const &) const = default;
};

// Caller-owned static description of an account. Dynamic state (status,
// quota usage, counters) is never taken from a spec.
struct AccountSpec
{
    std::string id;
    std::string display_name;
    ProviderType provider = ProviderType::GoogleColab;
    AccountTier tier = AccountTier::Free;
    int priority = 100;
    bool enabled = true;
    bool emergency = false;
    Duration daily_limit = std::chrono::minutes(720);
    Duration max_session = std::chrono::hours(12);
};

struct Account
{
    std::string id;
    std::string display_name;
    ProviderType provider = ProviderType::GoogleColab;
    AccountTier tier = AccountTier::Free;
    int priority = 100;
    bool enabled = true;
    bool emergency = false;

    AccountStatus status = AccountStatus::Active;
    Duration daily_limit = std::chrono::minutes(720);
    Duration used_today{0};
    std::int64_t last_reset_day = 0;
    std::optional<TimePoint> cooldown_until;
    CooldownReason cooldown_reason = CooldownReason::None;
    std::optional<TimePoint> retry_after;
    std::optional<TimePoint> last_used_at;
    std::optional<std::string> last_error;
    std::optional<TimePoint> session_start;
    Duration max_session = std::chrono::hours(12);

    std::uint64_t total_sessions = 0;
    std::uint64_t success_count = 0;
    std::uint64_t failure_count = 0;
    std::uint32_t consecutive_failures = 0;
    TimePoint created_at{};

    ResourceTelemetry telemetry;

    Duration remaining_quota() const noexcept
    {
        return used_today >= daily_limit ? Duration{0}
                                         : daily_limit - used_today;
    }

    double success_rate() const noexcept
    {
        auto const total = success_count + failure_count;
        if (total == 0)
        {
            return 100.0;
        }
        return static_cast<double>(success_count) * 100.0 /
               static_cast<double>(total);
    }

    bool operator==(Account const &) const = default;
};

struct Session
{
    std::string account_id;
    TimePoint started_at{};

    Duration duration(TimePoint now) const noexcept
    {
        return now > started_at ? now - started_at : Duration{0};
    }
};

struct PoolSettings
{
    RotationStrategy strategy = RotationStrategy::Priority;
    Duration cooldown = std::chrono::minutes(60);
    int low_quota_threshold_percent = 90;
    bool auto_failover = true;
    bool auto_rotate_on_quota_low = true;
    int max_consecutive_failures = 3;
    Duration error_retry_delay = std::chrono::minutes(2);
    bool auto_prestart = true;
    Duration prestart_lead_time = std::chrono::minutes(5);
    Duration health_check_interval = std::chrono::seconds(60);

    bool operator==(PoolSettings const &) const = default;
};

struct PoolEvent
{
    std::uint64_t sequence = 0;
    std::string account_id;
    std::string account_name;
    EventKind kind = EventKind::StatusChanged;
    std::string message;
    TimePoint timestamp{};
    Severity severity = Severity::Info;
    std::optional<AccountStatus> old_status;
    std::optional<AccountStatus> new_status;
};

struct PoolStatus
{
    std::size_t total_accounts = 0;
    std::size_t active_accounts = 0;
    std::size_t running_accounts = 0;
    std::size_t cooldown_accounts = 0;
    std::size_t exhausted_accounts = 0;
    std::size_t error_accounts = 0;
    std::size_t suspended_accounts = 0;
    std::size_t paused_accounts = 0;
    std::size_t disabled_accounts = 0;
    Duration total_remaining_quota{0};
    std::optional<Session> current_session;
    std::optional<std::string> next_candidate_id;
    std::optional<std::string> prestart_candidate_id;
    bool is_pool_available = false;
    bool emergency_active = false;
    TimePoint updated_at{};
};

struct PoolCounters
{
    std::uint64_t rotations = 0;
    std::uint64_t emergency_activations = 0;
    std::uint64_t switch_required = 0;
    std::uint64_t sessions_started = 0;
    std::uint64_t sessions_ended = 0;
    std::uint64_t prestarts = 0;
    std::uint64_t provisioning_failures = 0;
    std::uint64_t quota_resets = 0;
    std::uint64_t tasks_completed = 0;
    std::uint64_t tasks_failed = 0;
};

struct PoolStats
{
    std::size_t total_accounts = 0;
    std::size_t running_accounts = 0;
    std::size_t error_accounts = 0;
    std::size_t emergency_accounts = 0;
    Duration total_quota_used{0};
    Duration total_quota_remaining{0};
    double average_utilization = 0.0;
    PoolCounters counters;
    std::optional<std::string> active_account_id;
    std::optional<std::string> next_candidate_id;
    std::optional<TimePoint> next_switch_time;
};

// Everything the Store persists for one pool.
struct PoolState
{
    std::vector<Account> accounts;
    PoolSettings settings;
    std::string rotation_cursor;

    bool operator==(PoolState const &) const = default;
};

struct AccountResult
{
    OperationResult status;
    std::optional<Account> account;
};

struct CoreSettings
{
    std::filesystem::path state_path;
    Duration tick_interval = std::chrono::seconds(1);
    Duration flush_interval = std::chrono::seconds(30);
    Duration health_check_timeout = std::chrono::seconds(5);
    Duration provisioning_timeout = std::chrono::seconds(120);
    int worker_threads = 2;
    std::size_t event_history_limit = 500;

    bool operator==(CoreSettings const &) const = default;
};

class EventBus;
class PoolScheduler;
class Provisioner;

// Runtime host: owns the sqlite store, the provisioning workers and the
// periodic task loop that ticks the pool.
class Core
{
  public:
    Core(CoreSettings settings, std::shared_ptr<Provisioner> provisioner);
    ~Core();
    static std::unique_ptr<Core> create(CoreSettings settings,
                                        std::shared_ptr<Provisioner> provisioner);

    void run();
    void stop() noexcept;
    bool is_running() const noexcept;

    PoolScheduler &pool() noexcept;
    PoolScheduler const &pool() const noexcept;
    EventBus &events() noexcept;
    CoreSettings settings() const;
    // Tick and flush intervals apply at once; timeouts and the worker count
    // from the next start of the process.
    bool update_settings(CoreSettings const &settings);

  private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rotor::engine
