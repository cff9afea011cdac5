#pragma once

#include "engine/Core.hpp"

#include <atomic>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>

namespace rotor::engine
{

class PersistenceManager;
class EventBus;

// Runtime settings of the host. Resolved once at construction from the
// defaults, then the settings table, then ROTOR_* environment variables.
class ConfigurationService
{
  public:
    using EnvReader = std::function<std::optional<std::string>(char const *)>;

    ConfigurationService(PersistenceManager *persistence, EventBus *bus,
                         CoreSettings defaults, EnvReader env = {});

    CoreSettings get() const;

    // Replaces the settings and publishes SettingsChangedEvent if they
    // changed. Invalid values are rejected and false is returned.
    bool update(CoreSettings const &settings);

    void persist_if_dirty();
    void persist_now();

    static bool validate(CoreSettings const &settings, std::string *error = nullptr);
    static std::optional<std::string> read_environment(char const *key);

  private:
    void apply_stored();
    void apply_environment(EnvReader const &env);
    void mark_dirty();
    void notify_listeners();

    PersistenceManager *persistence_;
    EventBus *bus_;

    mutable std::shared_mutex mutex_;
    CoreSettings settings_;

    std::atomic_bool dirty_{false};
};

} // namespace rotor::engine
