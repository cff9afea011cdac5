#pragma once

#include "engine/Core.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

struct yyjson_val;

namespace rotor::engine
{
class PoolScheduler;
}

namespace rotor::rpc
{

using ResponseCallback = std::function<void(std::string)>;
using DispatchHandler = std::function<void(yyjson_val *, ResponseCallback)>;
using ShutdownHook = std::function<void()>;

// Routes {"method": ..., "arguments": {...}} requests to the pool. Every
// request gets exactly one response through the callback.
class Dispatcher
{
  public:
    explicit Dispatcher(engine::PoolScheduler *pool,
                        ShutdownHook request_shutdown = {});
    void dispatch(std::string_view payload, ResponseCallback cb);

  private:
    void register_handlers();

    engine::PoolScheduler *pool_;
    ShutdownHook request_shutdown_;
    std::unordered_map<std::string, DispatchHandler> handlers_;
};

} // namespace rotor::rpc
