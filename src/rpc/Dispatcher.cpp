#include "rpc/Dispatcher.hpp"

#include "engine/PoolScheduler.hpp"
#include "engine/PoolUtils.hpp"
#include "rpc/Serializer.hpp"
#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <cstddef>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <yyjson.h>

namespace rotor::rpc
{

namespace
{

constexpr std::size_t kDefaultEventCount = 50;

std::string validation_error(std::string_view message)
{
    return serialize_error(
        message, engine::to_string(engine::ErrorCode::ValidationError));
}

std::optional<std::string> parse_id(yyjson_val *arguments)
{
    auto id = json::get_string(arguments, "id");
    if (!id || id->empty())
    {
        return std::nullopt;
    }
    return id;
}

std::string reply_account(engine::AccountResult const &result)
{
    if (!result.status.ok() || !result.account)
    {
        return serialize_result(result.status);
    }
    return serialize_success(serialize_account(*result.account));
}

// Overwrites only the members present in arguments. False on a member of the
// wrong type.
bool parse_telemetry(yyjson_val *arguments, engine::ResourceTelemetry &out)
{
    struct Number
    {
        char const *key;
        double *target;
    };
    Number const numbers[] = {
        {"memoryUsedGb", &out.memory_used_gb},
        {"memoryTotalGb", &out.memory_total_gb},
        {"utilizationPercent", &out.utilization_percent},
        {"temperatureC", &out.temperature_c},
    };
    for (auto const &number : numbers)
    {
        if (yyjson_obj_get(arguments, number.key) == nullptr)
        {
            continue;
        }
        auto value = json::get_number(arguments, number.key);
        if (!value)
        {
            return false;
        }
        *number.target = *value;
    }
    if (yyjson_obj_get(arguments, "currentTasks") != nullptr)
    {
        auto tasks = json::get_int(arguments, "currentTasks");
        if (!tasks || *tasks < 0)
        {
            return false;
        }
        out.current_tasks = static_cast<int>(*tasks);
    }
    return true;
}

std::string handle_account_get(engine::PoolScheduler &pool,
                               yyjson_val *arguments)
{
    auto id = parse_id(arguments);
    if (!id)
    {
        return validation_error("id required");
    }
    auto account = pool.account(*id);
    if (!account)
    {
        return serialize_error(
            "unknown account: " + *id,
            engine::to_string(engine::ErrorCode::NotFoundError));
    }
    return serialize_success(serialize_account(*account));
}

std::string handle_account_add(engine::PoolScheduler &pool,
                               yyjson_val *arguments, bool update)
{
    if (!yyjson_is_obj(arguments))
    {
        return validation_error("account object required");
    }
    auto specs = parse_account_specs(arguments);
    if (!specs || specs->size() != 1)
    {
        return validation_error("invalid account definition");
    }
    auto const &spec = specs->front();
    return reply_account(update ? pool.update_account(spec)
                                : pool.add_account(spec));
}

std::string handle_settings_set(engine::PoolScheduler &pool,
                                yyjson_val *arguments)
{
    auto settings = parse_settings(arguments, pool.settings());
    if (!settings)
    {
        return validation_error("invalid settings");
    }
    auto result = pool.update_settings(*settings);
    if (!result.ok())
    {
        return serialize_result(result);
    }
    return serialize_success(serialize_settings(pool.settings()));
}

std::string handle_session_activate(engine::PoolScheduler &pool,
                                    yyjson_val *arguments)
{
    auto id = parse_id(arguments);
    if (!id)
    {
        return serialize_result(pool.activate_next());
    }
    bool force = json::get_bool(arguments, "force").value_or(false);
    return serialize_result(pool.set_active(*id, force));
}

std::string handle_quota_reset(engine::PoolScheduler &pool,
                               yyjson_val *arguments)
{
    if (auto id = parse_id(arguments))
    {
        return serialize_result(pool.reset_daily_quota(*id));
    }
    return serialize_result(pool.reset_all_daily_quotas());
}

std::string handle_task(engine::PoolScheduler &pool, yyjson_val *arguments,
                        engine::EventKind kind)
{
    auto id = parse_id(arguments);
    if (!id)
    {
        return validation_error("id required");
    }
    if (kind == engine::EventKind::TaskFailed)
    {
        auto error = json::get_string(arguments, "error");
        return serialize_result(
            pool.record_task_failed(*id, error.value_or("task failed")));
    }
    auto description = json::get_string(arguments, "description").value_or("");
    if (kind == engine::EventKind::TaskStarted)
    {
        return serialize_result(pool.record_task_started(*id, description));
    }
    return serialize_result(pool.record_task_completed(*id, description));
}

std::string handle_telemetry_update(engine::PoolScheduler &pool,
                                    yyjson_val *arguments)
{
    auto id = parse_id(arguments);
    if (!id)
    {
        return validation_error("id required");
    }
    auto account = pool.account(*id);
    if (!account)
    {
        return serialize_error(
            "unknown account: " + *id,
            engine::to_string(engine::ErrorCode::NotFoundError));
    }
    auto telemetry = account->telemetry;
    if (!parse_telemetry(arguments, telemetry))
    {
        return validation_error("invalid telemetry");
    }
    return serialize_result(pool.update_telemetry(*id, telemetry));
}

std::string handle_events_get(engine::PoolScheduler &pool,
                              yyjson_val *arguments)
{
    auto count = kDefaultEventCount;
    if (yyjson_obj_get(arguments, "count") != nullptr)
    {
        auto requested = json::get_int(arguments, "count");
        if (!requested || *requested < 0)
        {
            return validation_error("count must be a non-negative integer");
        }
        count = static_cast<std::size_t>(*requested);
    }
    return serialize_success(serialize_events(pool.recent_events(count)));
}

template <typename Handler> DispatchHandler wrap_sync_handler(Handler handler)
{
    return DispatchHandler(
        [handler = std::move(handler)](yyjson_val *arguments,
                                       ResponseCallback cb) mutable
        {
            std::string response;
            try
            {
                response = handler(arguments);
            }
            catch (std::exception const &ex)
            {
                ROTOR_LOG_WARN("RPC handler threw: {}", ex.what());
                response = serialize_error("internal error");
            }
            cb(std::move(response));
        });
}

} // namespace

Dispatcher::Dispatcher(engine::PoolScheduler *pool,
                       ShutdownHook request_shutdown)
    : pool_(pool), request_shutdown_(std::move(request_shutdown))
{
    register_handlers();
}

void Dispatcher::register_handlers()
{
    auto add = [this](std::string method, auto handler)
    {
        handlers_.emplace(
            std::move(method),
            wrap_sync_handler(
                [this, handler = std::move(handler)](yyjson_val *arguments)
                {
                    if (pool_ == nullptr)
                    {
                        return serialize_error("pool unavailable");
                    }
                    return handler(*pool_, arguments);
                }));
    };
    auto add_id = [&add](std::string method, auto operation)
    {
        add(std::move(method),
            [operation](engine::PoolScheduler &pool, yyjson_val *arguments)
            {
                auto id = parse_id(arguments);
                if (!id)
                {
                    return validation_error("id required");
                }
                return serialize_result(operation(pool, *id));
            });
    };
    using engine::PoolScheduler;

    add("pool-status", [](PoolScheduler &pool, yyjson_val *)
        { return serialize_success(serialize_pool_status(pool.pool_status())); });
    add("pool-stats", [](PoolScheduler &pool, yyjson_val *)
        { return serialize_success(serialize_stats(pool.stats())); });
    add("account-list", [](PoolScheduler &pool, yyjson_val *)
        { return serialize_success(serialize_accounts(pool.all_accounts())); });
    add("account-get", handle_account_get);
    add("account-add", [](PoolScheduler &pool, yyjson_val *arguments)
        { return handle_account_add(pool, arguments, false); });
    add("account-update", [](PoolScheduler &pool, yyjson_val *arguments)
        { return handle_account_add(pool, arguments, true); });
    add_id("account-remove", [](PoolScheduler &pool, std::string const &id)
           { return pool.remove_account(id); });
    add_id("account-resume", [](PoolScheduler &pool, std::string const &id)
           { return pool.resume_account(id); });
    add_id("account-recover", [](PoolScheduler &pool, std::string const &id)
           { return pool.recover_account(id); });
    add("settings-get", [](PoolScheduler &pool, yyjson_val *)
        { return serialize_success(serialize_settings(pool.settings())); });
    add("settings-set", handle_settings_set);
    add("session-activate", handle_session_activate);
    add("session-end", [](PoolScheduler &pool, yyjson_val *)
        { return serialize_result(pool.end_session()); });
    add("session-pause", [](PoolScheduler &pool, yyjson_val *)
        { return serialize_result(pool.pause_session()); });
    add("session-prestart", [](PoolScheduler &pool, yyjson_val *)
        { return serialize_result(pool.prestart_next()); });
    add("quota-reset", handle_quota_reset);
    add("task-started", [](PoolScheduler &pool, yyjson_val *arguments)
        { return handle_task(pool, arguments, engine::EventKind::TaskStarted); });
    add("task-completed",
        [](PoolScheduler &pool, yyjson_val *arguments)
        { return handle_task(pool, arguments, engine::EventKind::TaskCompleted); });
    add("task-failed", [](PoolScheduler &pool, yyjson_val *arguments)
        { return handle_task(pool, arguments, engine::EventKind::TaskFailed); });
    add("telemetry-update", handle_telemetry_update);
    add("events-get", handle_events_get);

    handlers_.emplace(
        "app-shutdown", wrap_sync_handler(
                            [this](yyjson_val *)
                            {
                                if (!request_shutdown_)
                                {
                                    return serialize_error("shutdown unavailable");
                                }
                                ROTOR_LOG_INFO("shutdown requested over RPC");
                                request_shutdown_();
                                return serialize_success();
                            }));
}

void Dispatcher::dispatch(std::string_view payload, ResponseCallback cb)
{
    if (payload.empty())
    {
        cb(serialize_error("empty RPC payload"));
        return;
    }

    auto doc = rotor::json::Document::parse(payload);
    if (!doc.is_valid())
    {
        cb(serialize_error("invalid JSON"));
        return;
    }

    yyjson_val *root = doc.root();
    if (root == nullptr || !yyjson_is_obj(root))
    {
        cb(serialize_error("expected JSON object"));
        return;
    }

    auto method = json::get_string(root, "method");
    if (!method)
    {
        cb(serialize_error("missing method"));
        return;
    }
    ROTOR_LOG_DEBUG("Dispatching RPC method={}", *method);

    yyjson_val *arguments = yyjson_obj_get(root, "arguments");
    if (arguments != nullptr && !yyjson_is_obj(arguments))
    {
        cb(validation_error("arguments must be an object"));
        return;
    }
    auto handler_it = handlers_.find(*method);
    if (handler_it == handlers_.end())
    {
        cb(serialize_error("unsupported method"));
        return;
    }
    handler_it->second(arguments, std::move(cb));
}

} // namespace rotor::rpc
