#pragma once

#include "engine/Core.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rotor::engine
{

struct Selection
{
    std::string account_id;
    bool emergency = false;
};

// Picks the next account to run. Stateless: the round-robin position comes
// in as the id of the last committed selection.
class Selector
{
  public:
    static bool is_eligible(Account const &account) noexcept;

    std::optional<Selection> select(std::vector<Account> const &accounts,
                                    PoolSettings const &settings,
                                    std::string_view cursor,
                                    std::string_view exclude = {}) const;

    // Eligible regular accounts in strategy order, best first. Emergency
    // accounts are held back for select()'s fallback.
    std::vector<std::string> ranked(std::vector<Account> const &accounts,
                                    PoolSettings const &settings,
                                    std::string_view cursor,
                                    std::string_view exclude = {}) const;

    std::optional<std::string> emergency_candidate(
        std::vector<Account> const &accounts, std::string_view exclude = {}) const;
};

} // namespace rotor::engine
