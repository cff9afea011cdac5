#include "engine/PersistenceManager.hpp"
#include "engine/AsyncTaskService.hpp"
#include "engine/PoolUtils.hpp"

#include "utils/Json.hpp"
#include "utils/Log.hpp"
#include "utils/StateStore.hpp"

#include <utility>

namespace rotor::engine
{

namespace
{

constexpr char const *kPoolSettingsKey = "poolSettings";
constexpr char const *kRotationCursorKey = "rotationCursor";

void add_enum(yyjson_mut_doc *doc, yyjson_mut_val *obj, char const *key,
              std::string_view value)
{
    yyjson_mut_obj_add_strn(doc, obj, key, value.data(), value.size());
}

std::optional<std::int64_t> to_optional_ms(std::optional<TimePoint> const &value)
{
    if (!value)
    {
        return std::nullopt;
    }
    return to_epoch_ms(*value);
}

std::optional<TimePoint> from_optional_ms(std::optional<std::int64_t> const &value)
{
    if (!value)
    {
        return std::nullopt;
    }
    return from_epoch_ms(*value);
}

std::string encode_telemetry(ResourceTelemetry const &telemetry)
{
    json::MutableDocument doc;
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    yyjson_mut_obj_add_real(native, root, "memoryUsedGb",
                            telemetry.memory_used_gb);
    yyjson_mut_obj_add_real(native, root, "memoryTotalGb",
                            telemetry.memory_total_gb);
    yyjson_mut_obj_add_real(native, root, "utilizationPercent",
                            telemetry.utilization_percent);
    yyjson_mut_obj_add_real(native, root, "temperatureC",
                            telemetry.temperature_c);
    yyjson_mut_obj_add_int(native, root, "currentTasks",
                           telemetry.current_tasks);
    return doc.write();
}

ResourceTelemetry decode_telemetry(std::string const &payload)
{
    ResourceTelemetry telemetry;
    if (payload.empty())
    {
        return telemetry;
    }
    auto doc = json::Document::parse(payload);
    if (!doc.is_valid() || !yyjson_is_obj(doc.root()))
    {
        return telemetry;
    }
    auto *root = doc.root();
    telemetry.memory_used_gb =
        json::get_number(root, "memoryUsedGb").value_or(0.0);
    telemetry.memory_total_gb =
        json::get_number(root, "memoryTotalGb").value_or(0.0);
    telemetry.utilization_percent =
        json::get_number(root, "utilizationPercent").value_or(0.0);
    telemetry.temperature_c =
        json::get_number(root, "temperatureC").value_or(0.0);
    telemetry.current_tasks =
        static_cast<int>(json::get_int(root, "currentTasks").value_or(0));
    return telemetry;
}

std::string encode_pool_settings(PoolSettings const &settings)
{
    json::MutableDocument doc;
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    add_enum(native, root, "strategy", to_string(settings.strategy));
    yyjson_mut_obj_add_int(native, root, "cooldownMs",
                           settings.cooldown.count());
    yyjson_mut_obj_add_int(native, root, "lowQuotaThresholdPercent",
                           settings.low_quota_threshold_percent);
    yyjson_mut_obj_add_bool(native, root, "autoFailover",
                            settings.auto_failover);
    yyjson_mut_obj_add_bool(native, root, "autoRotateOnQuotaLow",
                            settings.auto_rotate_on_quota_low);
    yyjson_mut_obj_add_int(native, root, "maxConsecutiveFailures",
                           settings.max_consecutive_failures);
    yyjson_mut_obj_add_int(native, root, "errorRetryDelayMs",
                           settings.error_retry_delay.count());
    yyjson_mut_obj_add_bool(native, root, "autoPrestart",
                            settings.auto_prestart);
    yyjson_mut_obj_add_int(native, root, "prestartLeadTimeMs",
                           settings.prestart_lead_time.count());
    yyjson_mut_obj_add_int(native, root, "healthCheckIntervalMs",
                           settings.health_check_interval.count());
    return doc.write();
}

// Unknown or missing members keep their defaults so older files still load.
PoolSettings decode_pool_settings(std::string const &payload)
{
    PoolSettings settings;
    auto doc = json::Document::parse(payload);
    if (!doc.is_valid() || !yyjson_is_obj(doc.root()))
    {
        ROTOR_LOG_WARN("stored pool settings are not valid JSON; using "
                       "defaults");
        return settings;
    }
    auto *root = doc.root();
    if (auto value = json::get_string(root, "strategy"))
    {
        settings.strategy = parse_strategy(*value).value_or(settings.strategy);
    }
    if (auto value = json::get_int(root, "cooldownMs"))
    {
        settings.cooldown = Duration(*value);
    }
    if (auto value = json::get_int(root, "lowQuotaThresholdPercent"))
    {
        settings.low_quota_threshold_percent = static_cast<int>(*value);
    }
    if (auto value = json::get_bool(root, "autoFailover"))
    {
        settings.auto_failover = *value;
    }
    if (auto value = json::get_bool(root, "autoRotateOnQuotaLow"))
    {
        settings.auto_rotate_on_quota_low = *value;
    }
    if (auto value = json::get_int(root, "maxConsecutiveFailures"))
    {
        settings.max_consecutive_failures = static_cast<int>(*value);
    }
    if (auto value = json::get_int(root, "errorRetryDelayMs"))
    {
        settings.error_retry_delay = Duration(*value);
    }
    if (auto value = json::get_bool(root, "autoPrestart"))
    {
        settings.auto_prestart = *value;
    }
    if (auto value = json::get_int(root, "prestartLeadTimeMs"))
    {
        settings.prestart_lead_time = Duration(*value);
    }
    if (auto value = json::get_int(root, "healthCheckIntervalMs"))
    {
        settings.health_check_interval = Duration(*value);
    }
    return settings;
}

storage::AccountRow to_row(Account const &account, std::int64_t position)
{
    storage::AccountRow row;
    row.id = account.id;
    row.position = position;
    row.display_name = account.display_name;
    row.provider = std::string(to_string(account.provider));
    row.tier = std::string(to_string(account.tier));
    row.priority = account.priority;
    row.enabled = account.enabled;
    row.emergency = account.emergency;
    row.status = std::string(to_string(account.status));
    row.daily_limit_ms = account.daily_limit.count();
    row.used_today_ms = account.used_today.count();
    row.last_reset_day = account.last_reset_day;
    row.cooldown_until_ms = to_optional_ms(account.cooldown_until);
    row.cooldown_reason = std::string(to_string(account.cooldown_reason));
    row.retry_after_ms = to_optional_ms(account.retry_after);
    row.last_used_at_ms = to_optional_ms(account.last_used_at);
    row.last_error = account.last_error;
    row.session_start_ms = to_optional_ms(account.session_start);
    row.max_session_ms = account.max_session.count();
    row.total_sessions = static_cast<std::int64_t>(account.total_sessions);
    row.success_count = static_cast<std::int64_t>(account.success_count);
    row.failure_count = static_cast<std::int64_t>(account.failure_count);
    row.consecutive_failures =
        static_cast<std::int64_t>(account.consecutive_failures);
    row.created_at_ms = to_epoch_ms(account.created_at);
    row.telemetry = encode_telemetry(account.telemetry);
    return row;
}

std::optional<Account> from_row(storage::AccountRow const &row)
{
    auto status = parse_status(row.status);
    if (!status)
    {
        ROTOR_LOG_WARN("account {} has unknown status '{}'; skipping", row.id,
                       row.status);
        return std::nullopt;
    }
    Account account;
    account.id = row.id;
    account.display_name = row.display_name.empty() ? row.id : row.display_name;
    account.provider = parse_provider(row.provider).value_or(ProviderType::Custom);
    account.tier = parse_tier(row.tier).value_or(AccountTier::Free);
    account.priority = row.priority;
    account.enabled = row.enabled;
    account.emergency = row.emergency;
    account.status = *status;
    account.daily_limit = Duration(row.daily_limit_ms);
    account.used_today = Duration(row.used_today_ms);
    account.last_reset_day = row.last_reset_day;
    account.cooldown_until = from_optional_ms(row.cooldown_until_ms);
    account.cooldown_reason =
        parse_cooldown_reason(row.cooldown_reason).value_or(CooldownReason::None);
    account.retry_after = from_optional_ms(row.retry_after_ms);
    account.last_used_at = from_optional_ms(row.last_used_at_ms);
    account.last_error = row.last_error;
    account.session_start = from_optional_ms(row.session_start_ms);
    account.max_session = Duration(row.max_session_ms);
    account.total_sessions = static_cast<std::uint64_t>(row.total_sessions);
    account.success_count = static_cast<std::uint64_t>(row.success_count);
    account.failure_count = static_cast<std::uint64_t>(row.failure_count);
    account.consecutive_failures =
        static_cast<std::uint32_t>(row.consecutive_failures);
    account.created_at = from_epoch_ms(row.created_at_ms);
    account.telemetry = decode_telemetry(row.telemetry);
    return account;
}

} // namespace

PersistenceManager::PersistenceManager(std::filesystem::path path,
                                       AsyncTaskService *task_service)
    : database_(std::make_shared<storage::Database>(std::move(path))),
      task_service_(task_service)
{
}

PersistenceManager::~PersistenceManager() = default;

bool PersistenceManager::is_valid() const noexcept
{
    return database_ != nullptr && database_->is_valid();
}

std::optional<PoolState> PersistenceManager::load_pool()
{
    if (!is_valid())
    {
        return std::nullopt;
    }
    auto rows = database_->load_accounts();
    auto stored_settings = database_->get_setting(kPoolSettingsKey);
    if (rows.empty() && !stored_settings)
    {
        return std::nullopt;
    }

    PoolState state;
    state.accounts.reserve(rows.size());
    for (auto const &row : rows)
    {
        if (auto account = from_row(row))
        {
            state.accounts.push_back(std::move(*account));
        }
    }
    if (stored_settings)
    {
        state.settings = decode_pool_settings(*stored_settings);
    }
    state.rotation_cursor =
        database_->get_setting(kRotationCursorKey).value_or(std::string{});

    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        last_saved_ = state;
    }
    ROTOR_LOG_INFO("loaded {} account(s) from {}", state.accounts.size(),
                   database_->path().string());
    return state;
}

bool PersistenceManager::save_pool(PoolState const &state)
{
    if (!is_valid())
    {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        if (last_saved_ && *last_saved_ == state)
        {
            return true;
        }
        last_saved_ = state;
    }
    auto db = database_;
    if (task_service_ && task_service_->is_running())
    {
        task_service_->submit([this, db, state]
                              { write_pool(db, state); });
        return true;
    }
    return write_pool(db, state);
}

bool PersistenceManager::write_pool(std::shared_ptr<storage::Database> const &db,
                                    PoolState const &state)
{
    std::vector<storage::AccountRow> rows;
    rows.reserve(state.accounts.size());
    std::int64_t position = 0;
    for (auto const &account : state.accounts)
    {
        rows.push_back(to_row(account, position++));
    }
    bool ok = db->replace_accounts(rows) &&
              db->set_setting(kPoolSettingsKey,
                              encode_pool_settings(state.settings)) &&
              db->set_setting(kRotationCursorKey, state.rotation_cursor);
    if (!ok)
    {
        ROTOR_LOG_ERROR("failed to persist pool state to {}",
                        db->path().string());
        std::lock_guard<std::mutex> lock(cache_mutex_);
        last_saved_.reset();
    }
    return ok;
}

std::optional<std::string>
PersistenceManager::get_setting(std::string const &key) const
{
    if (!is_valid())
    {
        return std::nullopt;
    }
    return database_->get_setting(key);
}

bool PersistenceManager::persist_settings(CoreSettings const &settings)
{
    if (!is_valid())
    {
        return false;
    }
    auto db = database_;
    auto write = [db, settings]
    {
        bool ok = db->set_setting("tickIntervalMs",
                                  std::to_string(settings.tick_interval.count()));
        ok = db->set_setting("flushIntervalMs",
                             std::to_string(settings.flush_interval.count())) &&
             ok;
        ok = db->set_setting(
                 "healthCheckTimeoutMs",
                 std::to_string(settings.health_check_timeout.count())) &&
             ok;
        ok = db->set_setting(
                 "provisioningTimeoutMs",
                 std::to_string(settings.provisioning_timeout.count())) &&
             ok;
        ok = db->set_setting("workerThreads",
                             std::to_string(settings.worker_threads)) &&
             ok;
        ok = db->set_setting("eventHistoryLimit",
                             std::to_string(settings.event_history_limit)) &&
             ok;
        if (!ok)
        {
            ROTOR_LOG_WARN("failed to persist runtime settings");
        }
        return ok;
    };
    if (task_service_ && task_service_->is_running())
    {
        task_service_->submit([write] { write(); });
        return true;
    }
    return write();
}

} // namespace rotor::engine
