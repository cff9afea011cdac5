#pragma once

#include "engine/Core.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct yyjson_val;

namespace rotor::rpc
{

// JSON views of pool state. Times are unix milliseconds, durations are
// milliseconds with an "Ms" suffix, enums use their kebab-case names.
std::string serialize_account(engine::Account const &account);
std::string serialize_accounts(std::vector<engine::Account> const &accounts);
std::string serialize_event(engine::PoolEvent const &event);
std::string serialize_events(std::vector<engine::PoolEvent> const &events);
std::string serialize_pool_status(engine::PoolStatus const &status);
std::string serialize_stats(engine::PoolStats const &stats);
std::string serialize_settings(engine::PoolSettings const &settings);
std::string serialize_result(engine::OperationResult const &result);
// Wraps an already serialized JSON value as the arguments of a success reply.
std::string serialize_success(std::string_view arguments_json = {});
std::string
serialize_error(std::string_view message,
                std::optional<std::string_view> details = std::nullopt);

// Members missing from the payload keep the value from base. nullopt when
// the payload is not a JSON object or a member has the wrong type.
std::optional<engine::PoolSettings>
parse_settings(std::string_view payload, engine::PoolSettings base = {});
std::optional<engine::PoolSettings>
parse_settings(yyjson_val *object, engine::PoolSettings base = {});

// Accepts either one account object or an array of them.
std::optional<std::vector<engine::AccountSpec>>
parse_account_specs(std::string_view payload);
std::optional<std::vector<engine::AccountSpec>>
parse_account_specs(yyjson_val *value);

} // namespace rotor::rpc
