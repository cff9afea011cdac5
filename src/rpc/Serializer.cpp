#include "rpc/Serializer.hpp"

#include "engine/PoolUtils.hpp"
#include "utils/Json.hpp"
#include "utils/Version.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <yyjson.h>

namespace rotor::rpc
{

namespace
{

using engine::Duration;
using engine::TimePoint;

void add_name(yyjson_mut_doc *doc, yyjson_mut_val *obj, char const *key,
              std::string_view value)
{
    // enum names live in static tables
    yyjson_mut_obj_add_strn(doc, obj, key, value.data(), value.size());
}

void add_text(yyjson_mut_doc *doc, yyjson_mut_val *obj, char const *key,
              std::string const &value)
{
    yyjson_mut_obj_add_strncpy(doc, obj, key, value.data(), value.size());
}

void add_optional_text(yyjson_mut_doc *doc, yyjson_mut_val *obj,
                       char const *key,
                       std::optional<std::string> const &value)
{
    if (value)
    {
        add_text(doc, obj, key, *value);
    }
    else
    {
        yyjson_mut_obj_add_null(doc, obj, key);
    }
}

void add_time(yyjson_mut_doc *doc, yyjson_mut_val *obj, char const *key,
              std::optional<TimePoint> const &value)
{
    if (value)
    {
        yyjson_mut_obj_add_int(doc, obj, key, engine::to_epoch_ms(*value));
    }
    else
    {
        yyjson_mut_obj_add_null(doc, obj, key);
    }
}

void add_duration(yyjson_mut_doc *doc, yyjson_mut_val *obj, char const *key,
                  Duration value)
{
    yyjson_mut_obj_add_int(doc, obj, key, value.count());
}

yyjson_mut_val *account_to_json(yyjson_mut_doc *doc,
                                engine::Account const &account)
{
    auto *entry = yyjson_mut_obj(doc);
    add_text(doc, entry, "id", account.id);
    add_text(doc, entry, "displayName", account.display_name);
    add_name(doc, entry, "provider", engine::to_string(account.provider));
    add_name(doc, entry, "tier", engine::to_string(account.tier));
    yyjson_mut_obj_add_int(doc, entry, "priority", account.priority);
    yyjson_mut_obj_add_bool(doc, entry, "enabled", account.enabled);
    yyjson_mut_obj_add_bool(doc, entry, "emergency", account.emergency);
    add_name(doc, entry, "status", engine::to_string(account.status));

    auto *quota = yyjson_mut_obj(doc);
    add_duration(doc, quota, "dailyLimitMs", account.daily_limit);
    add_duration(doc, quota, "usedTodayMs", account.used_today);
    add_duration(doc, quota, "remainingMs", account.remaining_quota());
    yyjson_mut_obj_add_int(doc, quota, "lastResetDay", account.last_reset_day);
    yyjson_mut_obj_add_val(doc, entry, "quota", quota);

    add_time(doc, entry, "cooldownUntil", account.cooldown_until);
    add_name(doc, entry, "cooldownReason",
             engine::to_string(account.cooldown_reason));
    add_time(doc, entry, "retryAfter", account.retry_after);
    add_time(doc, entry, "lastUsedAt", account.last_used_at);
    add_optional_text(doc, entry, "lastError", account.last_error);
    add_time(doc, entry, "sessionStart", account.session_start);
    add_duration(doc, entry, "maxSessionMs", account.max_session);

    yyjson_mut_obj_add_uint(doc, entry, "totalSessions",
                            account.total_sessions);
    yyjson_mut_obj_add_uint(doc, entry, "successCount", account.success_count);
    yyjson_mut_obj_add_uint(doc, entry, "failureCount", account.failure_count);
    yyjson_mut_obj_add_uint(doc, entry, "consecutiveFailures",
                            account.consecutive_failures);
    yyjson_mut_obj_add_real(doc, entry, "successRate", account.success_rate());
    add_time(doc, entry, "createdAt", account.created_at);

    auto const &telemetry = account.telemetry;
    auto *resources = yyjson_mut_obj(doc);
    yyjson_mut_obj_add_real(doc, resources, "memoryUsedGb",
                            telemetry.memory_used_gb);
    yyjson_mut_obj_add_real(doc, resources, "memoryTotalGb",
                            telemetry.memory_total_gb);
    yyjson_mut_obj_add_real(doc, resources, "utilizationPercent",
                            telemetry.utilization_percent);
    yyjson_mut_obj_add_real(doc, resources, "temperatureC",
                            telemetry.temperature_c);
    yyjson_mut_obj_add_int(doc, resources, "currentTasks",
                           telemetry.current_tasks);
    yyjson_mut_obj_add_val(doc, entry, "telemetry", resources);
    return entry;
}

yyjson_mut_val *event_to_json(yyjson_mut_doc *doc,
                              engine::PoolEvent const &event)
{
    auto *entry = yyjson_mut_obj(doc);
    yyjson_mut_obj_add_uint(doc, entry, "sequence", event.sequence);
    if (event.account_id.empty())
    {
        yyjson_mut_obj_add_null(doc, entry, "accountId");
    }
    else
    {
        add_text(doc, entry, "accountId", event.account_id);
        add_text(doc, entry, "accountName", event.account_name);
    }
    add_name(doc, entry, "kind", engine::to_string(event.kind));
    add_text(doc, entry, "message", event.message);
    add_time(doc, entry, "timestamp", event.timestamp);
    add_name(doc, entry, "severity", engine::to_string(event.severity));
    if (event.old_status)
    {
        add_name(doc, entry, "oldStatus", engine::to_string(*event.old_status));
    }
    if (event.new_status)
    {
        add_name(doc, entry, "newStatus", engine::to_string(*event.new_status));
    }
    return entry;
}

yyjson_mut_val *settings_to_json(yyjson_mut_doc *doc,
                                 engine::PoolSettings const &settings)
{
    auto *entry = yyjson_mut_obj(doc);
    add_name(doc, entry, "strategy", engine::to_string(settings.strategy));
    add_duration(doc, entry, "cooldownMs", settings.cooldown);
    yyjson_mut_obj_add_int(doc, entry, "lowQuotaThresholdPercent",
                           settings.low_quota_threshold_percent);
    yyjson_mut_obj_add_bool(doc, entry, "autoFailover",
                            settings.auto_failover);
    yyjson_mut_obj_add_bool(doc, entry, "autoRotateOnQuotaLow",
                            settings.auto_rotate_on_quota_low);
    yyjson_mut_obj_add_int(doc, entry, "maxConsecutiveFailures",
                           settings.max_consecutive_failures);
    add_duration(doc, entry, "errorRetryDelayMs", settings.error_retry_delay);
    yyjson_mut_obj_add_bool(doc, entry, "autoPrestart",
                            settings.auto_prestart);
    add_duration(doc, entry, "prestartLeadTimeMs",
                 settings.prestart_lead_time);
    add_duration(doc, entry, "healthCheckIntervalMs",
                 settings.health_check_interval);
    return entry;
}

std::string write_root(json::MutableDocument &doc, yyjson_mut_val *root,
                       char const *fallback)
{
    doc.set_root(root);
    return doc.write(fallback);
}

// Reads an optional member of the expected JSON type. Returns false when the
// member exists with another type.
template <typename T, typename Reader>
bool read_member(yyjson_val *obj, char const *key, Reader reader, T &out)
{
    auto *value = yyjson_obj_get(obj, key);
    if (value == nullptr)
    {
        return true;
    }
    auto parsed = reader(obj, key);
    if (!parsed)
    {
        return false;
    }
    out = static_cast<T>(*parsed);
    return true;
}

bool read_duration(yyjson_val *obj, char const *ms_key, char const *minutes_key,
                   Duration &out)
{
    std::int64_t raw = 0;
    if (yyjson_obj_get(obj, ms_key) != nullptr)
    {
        if (!read_member(obj, ms_key, json::get_int, raw))
        {
            return false;
        }
        out = Duration(raw);
        return true;
    }
    if (minutes_key != nullptr && yyjson_obj_get(obj, minutes_key) != nullptr)
    {
        if (!read_member(obj, minutes_key, json::get_int, raw))
        {
            return false;
        }
        out = std::chrono::duration_cast<Duration>(std::chrono::minutes(raw));
    }
    return true;
}

template <typename Enum, typename Parser>
bool read_enum(yyjson_val *obj, char const *key, Parser parser, Enum &out)
{
    auto *value = yyjson_obj_get(obj, key);
    if (value == nullptr)
    {
        return true;
    }
    auto text = json::get_string(obj, key);
    if (!text)
    {
        return false;
    }
    auto parsed = parser(*text);
    if (!parsed)
    {
        return false;
    }
    out = *parsed;
    return true;
}

std::optional<engine::AccountSpec> spec_from_json(yyjson_val *obj)
{
    if (!yyjson_is_obj(obj))
    {
        return std::nullopt;
    }
    engine::AccountSpec spec;
    auto id = json::get_string(obj, "id");
    if (!id)
    {
        return std::nullopt;
    }
    spec.id = *id;
    bool ok = read_member(obj, "displayName", json::get_string,
                          spec.display_name) &&
              read_enum(obj, "provider", engine::parse_provider,
                        spec.provider) &&
              read_enum(obj, "tier", engine::parse_tier, spec.tier) &&
              read_member(obj, "priority", json::get_int, spec.priority) &&
              read_member(obj, "enabled", json::get_bool, spec.enabled) &&
              read_member(obj, "emergency", json::get_bool, spec.emergency) &&
              read_duration(obj, "dailyLimitMs", "dailyLimitMinutes",
                            spec.daily_limit) &&
              read_duration(obj, "maxSessionMs", "maxSessionMinutes",
                            spec.max_session);
    if (!ok)
    {
        return std::nullopt;
    }
    return spec;
}

} // namespace

std::string serialize_account(engine::Account const &account)
{
    json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    return write_root(doc, account_to_json(doc.doc(), account), "{}");
}

std::string serialize_accounts(std::vector<engine::Account> const &accounts)
{
    json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "[]";
    }
    auto *native = doc.doc();
    auto *list = yyjson_mut_arr(native);
    for (auto const &account : accounts)
    {
        yyjson_mut_arr_append(list, account_to_json(native, account));
    }
    return write_root(doc, list, "[]");
}

std::string serialize_event(engine::PoolEvent const &event)
{
    json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    return write_root(doc, event_to_json(doc.doc(), event), "{}");
}

std::string serialize_events(std::vector<engine::PoolEvent> const &events)
{
    json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "[]";
    }
    auto *native = doc.doc();
    auto *list = yyjson_mut_arr(native);
    for (auto const &event : events)
    {
        yyjson_mut_arr_append(list, event_to_json(native, event));
    }
    return write_root(doc, list, "[]");
}

std::string serialize_pool_status(engine::PoolStatus const &status)
{
    json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    yyjson_mut_obj_add_str(native, root, "version",
                           rotor::version::kSemanticVersion);

    auto *counts = yyjson_mut_obj(native);
    yyjson_mut_obj_add_uint(native, counts, "total", status.total_accounts);
    yyjson_mut_obj_add_uint(native, counts, "active", status.active_accounts);
    yyjson_mut_obj_add_uint(native, counts, "running", status.running_accounts);
    yyjson_mut_obj_add_uint(native, counts, "cooldown",
                            status.cooldown_accounts);
    yyjson_mut_obj_add_uint(native, counts, "quotaExhausted",
                            status.exhausted_accounts);
    yyjson_mut_obj_add_uint(native, counts, "error", status.error_accounts);
    yyjson_mut_obj_add_uint(native, counts, "suspended",
                            status.suspended_accounts);
    yyjson_mut_obj_add_uint(native, counts, "paused", status.paused_accounts);
    yyjson_mut_obj_add_uint(native, counts, "disabled",
                            status.disabled_accounts);
    yyjson_mut_obj_add_val(native, root, "accounts", counts);

    add_duration(native, root, "totalRemainingQuotaMs",
                 status.total_remaining_quota);
    if (status.current_session)
    {
        auto *session = yyjson_mut_obj(native);
        add_text(native, session, "accountId",
                 status.current_session->account_id);
        add_time(native, session, "startedAt",
                 status.current_session->started_at);
        add_duration(native, session, "durationMs",
                     status.current_session->duration(status.updated_at));
        yyjson_mut_obj_add_val(native, root, "currentSession", session);
    }
    else
    {
        yyjson_mut_obj_add_null(native, root, "currentSession");
    }
    add_optional_text(native, root, "nextCandidateId", status.next_candidate_id);
    add_optional_text(native, root, "prestartCandidateId",
                      status.prestart_candidate_id);
    yyjson_mut_obj_add_bool(native, root, "poolAvailable",
                            status.is_pool_available);
    yyjson_mut_obj_add_bool(native, root, "emergencyActive",
                            status.emergency_active);
    add_time(native, root, "updatedAt", status.updated_at);
    return write_root(doc, root, "{}");
}

std::string serialize_stats(engine::PoolStats const &stats)
{
    json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    yyjson_mut_obj_add_uint(native, root, "totalAccounts", stats.total_accounts);
    yyjson_mut_obj_add_uint(native, root, "runningAccounts",
                            stats.running_accounts);
    yyjson_mut_obj_add_uint(native, root, "errorAccounts", stats.error_accounts);
    yyjson_mut_obj_add_uint(native, root, "emergencyAccounts",
                            stats.emergency_accounts);
    add_duration(native, root, "totalQuotaUsedMs", stats.total_quota_used);
    add_duration(native, root, "totalQuotaRemainingMs",
                 stats.total_quota_remaining);
    yyjson_mut_obj_add_real(native, root, "averageUtilization",
                            stats.average_utilization);
    add_optional_text(native, root, "activeAccountId", stats.active_account_id);
    add_optional_text(native, root, "nextCandidateId", stats.next_candidate_id);
    add_time(native, root, "nextSwitchTime", stats.next_switch_time);

    auto const &c = stats.counters;
    auto *counters = yyjson_mut_obj(native);
    yyjson_mut_obj_add_uint(native, counters, "rotations", c.rotations);
    yyjson_mut_obj_add_uint(native, counters, "emergencyActivations",
                            c.emergency_activations);
    yyjson_mut_obj_add_uint(native, counters, "switchRequired",
                            c.switch_required);
    yyjson_mut_obj_add_uint(native, counters, "sessionsStarted",
                            c.sessions_started);
    yyjson_mut_obj_add_uint(native, counters, "sessionsEnded",
                            c.sessions_ended);
    yyjson_mut_obj_add_uint(native, counters, "prestarts", c.prestarts);
    yyjson_mut_obj_add_uint(native, counters, "provisioningFailures",
                            c.provisioning_failures);
    yyjson_mut_obj_add_uint(native, counters, "quotaResets", c.quota_resets);
    yyjson_mut_obj_add_uint(native, counters, "tasksCompleted",
                            c.tasks_completed);
    yyjson_mut_obj_add_uint(native, counters, "tasksFailed", c.tasks_failed);
    yyjson_mut_obj_add_val(native, root, "counters", counters);
    return write_root(doc, root, "{}");
}

std::string serialize_settings(engine::PoolSettings const &settings)
{
    json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    return write_root(doc, settings_to_json(doc.doc(), settings), "{}");
}

std::string serialize_result(engine::OperationResult const &result)
{
    if (!result.ok())
    {
        return serialize_error(result.message, engine::to_string(result.code));
    }
    json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return R"({"result":"success"})";
    }
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    yyjson_mut_obj_add_str(native, root, "result", "success");
    return write_root(doc, root, R"({"result":"success"})");
}

std::string serialize_success(std::string_view arguments_json)
{
    json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return R"({"result":"success"})";
    }
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    yyjson_mut_obj_add_str(native, root, "result", "success");
    if (!arguments_json.empty())
    {
        auto arguments = json::Document::parse(arguments_json);
        if (!arguments.is_valid())
        {
            return serialize_error("internal error");
        }
        yyjson_mut_obj_add_val(native, root, "arguments",
                               yyjson_val_mut_copy(native, arguments.root()));
    }
    return write_root(doc, root, R"({"result":"success"})");
}

std::string serialize_error(std::string_view message,
                            std::optional<std::string_view> details)
{
    json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return R"({"result":"error"})";
    }

    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    yyjson_mut_obj_add_str(native, root, "result", "error");

    auto *arguments = yyjson_mut_obj(native);
    yyjson_mut_obj_add_val(native, root, "arguments", arguments);
    yyjson_mut_obj_add_strncpy(native, arguments, "message", message.data(),
                               message.size());
    if (details && !details->empty())
    {
        yyjson_mut_obj_add_strncpy(native, arguments, "code", details->data(),
                                   details->size());
    }
    return write_root(doc, root, R"({"result":"error"})");
}

std::optional<engine::PoolSettings> parse_settings(std::string_view payload,
                                                   engine::PoolSettings base)
{
    auto doc = json::Document::parse(payload);
    if (!doc.is_valid())
    {
        return std::nullopt;
    }
    return parse_settings(doc.root(), std::move(base));
}

std::optional<engine::PoolSettings> parse_settings(yyjson_val *root,
                                                   engine::PoolSettings base)
{
    if (!yyjson_is_obj(root))
    {
        return std::nullopt;
    }
    auto settings = base;
    bool ok =
        read_enum(root, "strategy", engine::parse_strategy,
                  settings.strategy) &&
        read_duration(root, "cooldownMs", "cooldownMinutes",
                      settings.cooldown) &&
        read_member(root, "lowQuotaThresholdPercent", json::get_int,
                    settings.low_quota_threshold_percent) &&
        read_member(root, "autoFailover", json::get_bool,
                    settings.auto_failover) &&
        read_member(root, "autoRotateOnQuotaLow", json::get_bool,
                    settings.auto_rotate_on_quota_low) &&
        read_member(root, "maxConsecutiveFailures", json::get_int,
                    settings.max_consecutive_failures) &&
        read_duration(root, "errorRetryDelayMs", nullptr,
                      settings.error_retry_delay) &&
        read_member(root, "autoPrestart", json::get_bool,
                    settings.auto_prestart) &&
        read_duration(root, "prestartLeadTimeMs", "prestartLeadTimeMinutes",
                      settings.prestart_lead_time) &&
        read_duration(root, "healthCheckIntervalMs", nullptr,
                      settings.health_check_interval);
    if (!ok)
    {
        return std::nullopt;
    }
    return settings;
}

std::optional<std::vector<engine::AccountSpec>>
parse_account_specs(std::string_view payload)
{
    auto doc = json::Document::parse(payload);
    if (!doc.is_valid())
    {
        return std::nullopt;
    }
    return parse_account_specs(doc.root());
}

std::optional<std::vector<engine::AccountSpec>>
parse_account_specs(yyjson_val *root)
{
    std::vector<engine::AccountSpec> specs;
    if (yyjson_is_arr(root))
    {
        std::size_t idx = 0;
        std::size_t max = 0;
        yyjson_val *item = nullptr;
        yyjson_arr_foreach(root, idx, max, item)
        {
            auto spec = spec_from_json(item);
            if (!spec)
            {
                return std::nullopt;
            }
            specs.push_back(std::move(*spec));
        }
        return specs;
    }
    auto spec = spec_from_json(root);
    if (!spec)
    {
        return std::nullopt;
    }
    specs.push_back(std::move(*spec));
    return specs;
}

} // namespace rotor::rpc
