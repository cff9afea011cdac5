#include "engine/ConfigurationService.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/PersistenceManager.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <mutex>
#include <string_view>
#include <utility>

namespace rotor::engine
{

namespace
{

std::optional<std::int64_t> parse_positive(std::string_view text)
{
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos)
    {
        return std::nullopt;
    }
    auto end = text.find_last_not_of(" \t\r\n");
    text = text.substr(begin, end - begin + 1);
    std::int64_t value = 0;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value <= 0)
    {
        return std::nullopt;
    }
    return value;
}

// One numeric knob, addressed by its settings-table key and env variable.
struct Knob
{
    char const *key;
    char const *env;
    void (*apply)(CoreSettings &, std::int64_t);
};

constexpr Knob kKnobs[] = {
    {"tickIntervalMs", "ROTOR_TICK_INTERVAL_MS",
     [](CoreSettings &s, std::int64_t v) { s.tick_interval = Duration(v); }},
    {"flushIntervalMs", "ROTOR_FLUSH_INTERVAL_MS",
     [](CoreSettings &s, std::int64_t v) { s.flush_interval = Duration(v); }},
    {"healthCheckTimeoutMs", "ROTOR_HEALTH_CHECK_TIMEOUT_MS",
     [](CoreSettings &s, std::int64_t v)
     { s.health_check_timeout = Duration(v); }},
    {"provisioningTimeoutMs", "ROTOR_PROVISIONING_TIMEOUT_MS",
     [](CoreSettings &s, std::int64_t v)
     { s.provisioning_timeout = Duration(v); }},
    {"workerThreads", "ROTOR_WORKER_THREADS",
     [](CoreSettings &s, std::int64_t v)
     {
         s.worker_threads = static_cast<int>(
             std::min<std::int64_t>(v, std::numeric_limits<int>::max()));
     }},
    {"eventHistoryLimit", "ROTOR_EVENT_HISTORY_LIMIT",
     [](CoreSettings &s, std::int64_t v)
     { s.event_history_limit = static_cast<std::size_t>(v); }},
};

} // namespace

ConfigurationService::ConfigurationService(PersistenceManager *persistence,
                                           EventBus *bus, CoreSettings defaults,
                                           EnvReader env)
    : persistence_(persistence), bus_(bus), settings_(std::move(defaults))
{
    apply_stored();
    apply_environment(env ? env : EnvReader(&ConfigurationService::read_environment));
}

std::optional<std::string> ConfigurationService::read_environment(char const *key)
{
    auto value = std::getenv(key);
    if (value == nullptr)
    {
        return std::nullopt;
    }
    return std::string(value);
}

void ConfigurationService::apply_stored()
{
    if (persistence_ == nullptr || !persistence_->is_valid())
    {
        return;
    }
    for (auto const &knob : kKnobs)
    {
        auto stored = persistence_->get_setting(knob.key);
        if (!stored)
        {
            continue;
        }
        if (auto value = parse_positive(*stored))
        {
            knob.apply(settings_, *value);
        }
        else
        {
            ROTOR_LOG_WARN("ignoring stored setting {}='{}'", knob.key, *stored);
        }
    }
}

void ConfigurationService::apply_environment(EnvReader const &env)
{
    for (auto const &knob : kKnobs)
    {
        auto raw = env(knob.env);
        if (!raw)
        {
            continue;
        }
        if (auto value = parse_positive(*raw))
        {
            knob.apply(settings_, *value);
            ROTOR_LOG_DEBUG("{} overrides {} with {}", knob.env, knob.key,
                            *value);
        }
        else
        {
            ROTOR_LOG_WARN("ignoring {}='{}': expected a positive integer",
                           knob.env, *raw);
        }
    }
}

CoreSettings ConfigurationService::get() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return settings_;
}

bool ConfigurationService::validate(CoreSettings const &settings,
                                    std::string *error)
{
    auto fail = [error](char const *message)
    {
        if (error != nullptr)
        {
            *error = message;
        }
        return false;
    };
    if (settings.tick_interval <= Duration::zero())
    {
        return fail("tick interval must be positive");
    }
    if (settings.flush_interval <= Duration::zero())
    {
        return fail("flush interval must be positive");
    }
    if (settings.health_check_timeout <= Duration::zero() ||
        settings.provisioning_timeout <= Duration::zero())
    {
        return fail("provisioner timeouts must be positive");
    }
    if (settings.worker_threads < 1)
    {
        return fail("at least one provisioning worker is required");
    }
    if (settings.event_history_limit == 0)
    {
        return fail("event history limit must be positive");
    }
    return true;
}

bool ConfigurationService::update(CoreSettings const &settings)
{
    std::string error;
    if (!validate(settings, &error))
    {
        ROTOR_LOG_WARN("rejected runtime settings: {}", error);
        return false;
    }
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (settings_ == settings)
        {
            return true;
        }
        settings_ = settings;
    }
    mark_dirty();
    notify_listeners();
    return true;
}

void ConfigurationService::mark_dirty()
{
    dirty_.store(true, std::memory_order_release);
}

void ConfigurationService::persist_if_dirty()
{
    if (!dirty_.load(std::memory_order_acquire))
    {
        return;
    }
    persist_now();
}

void ConfigurationService::persist_now()
{
    if (!persistence_)
    {
        return;
    }
    CoreSettings copy = get();
    if (persistence_->persist_settings(copy))
    {
        dirty_.store(false, std::memory_order_release);
    }
    else
    {
        ROTOR_LOG_WARN("failed to persist runtime settings");
    }
}

void ConfigurationService::notify_listeners()
{
    if (bus_ != nullptr)
    {
        bus_->publish(SettingsChangedEvent{});
    }
}

} // namespace rotor::engine
