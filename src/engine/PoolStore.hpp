#pragma once

#include "engine/Core.hpp"

#include <optional>

namespace rotor::engine
{

class PoolStore
{
  public:
    virtual ~PoolStore() = default;

    // nullopt when the store has nothing usable; the pool then starts empty
    // with default settings.
    virtual std::optional<PoolState> load_pool() = 0;
    virtual bool save_pool(PoolState const &state) = 0;
};

} // namespace rotor::engine
