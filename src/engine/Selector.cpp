#include "engine/Selector.hpp"

#include <algorithm>

namespace rotor::engine
{

namespace
{

// never-used accounts sort before any used one
bool used_earlier(Account const &lhs, Account const &rhs) noexcept
{
    if (lhs.last_used_at.has_value() != rhs.last_used_at.has_value())
    {
        return !lhs.last_used_at.has_value();
    }
    if (lhs.last_used_at && *lhs.last_used_at != *rhs.last_used_at)
    {
        return *lhs.last_used_at < *rhs.last_used_at;
    }
    return false;
}

bool by_priority(Account const *lhs, Account const *rhs) noexcept
{
    if (lhs->priority != rhs->priority)
    {
        return lhs->priority < rhs->priority;
    }
    if (used_earlier(*lhs, *rhs))
    {
        return true;
    }
    if (used_earlier(*rhs, *lhs))
    {
        return false;
    }
    return lhs->id < rhs->id;
}

bool by_usage(Account const *lhs, Account const *rhs) noexcept
{
    if (lhs->used_today != rhs->used_today)
    {
        return lhs->used_today < rhs->used_today;
    }
    return by_priority(lhs, rhs);
}

} // namespace

bool Selector::is_eligible(Account const &account) noexcept
{
    return account.enabled && account.status == AccountStatus::Active &&
           account.remaining_quota() > Duration{0};
}

std::vector<std::string> Selector::ranked(std::vector<Account> const &accounts,
                                          PoolSettings const &settings,
                                          std::string_view cursor,
                                          std::string_view exclude) const
{
    std::vector<Account const *> eligible;
    eligible.reserve(accounts.size());

    if (settings.strategy == RotationStrategy::RoundRobin)
    {
        // registry order, rotated to start right after the cursor
        std::size_t start = 0;
        for (std::size_t i = 0; i < accounts.size(); ++i)
        {
            if (!cursor.empty() && accounts[i].id == cursor)
            {
                start = i + 1;
                break;
            }
        }
        for (std::size_t n = 0; n < accounts.size(); ++n)
        {
            auto const &account = accounts[(start + n) % accounts.size()];
            if (is_eligible(account) && !account.emergency &&
                account.id != exclude)
            {
                eligible.push_back(&account);
            }
        }
    }
    else
    {
        for (auto const &account : accounts)
        {
            if (is_eligible(account) && !account.emergency &&
                account.id != exclude)
            {
                eligible.push_back(&account);
            }
        }
        if (settings.strategy == RotationStrategy::LeastUsed)
        {
            std::sort(eligible.begin(), eligible.end(), by_usage);
        }
        else
        {
            std::sort(eligible.begin(), eligible.end(), by_priority);
        }
    }

    std::vector<std::string> ids;
    ids.reserve(eligible.size());
    for (auto const *account : eligible)
    {
        ids.push_back(account->id);
    }
    return ids;
}

std::optional<std::string> Selector::emergency_candidate(
    std::vector<Account> const &accounts, std::string_view exclude) const
{
    Account const *best = nullptr;
    for (auto const &account : accounts)
    {
        if (!account.emergency || !account.enabled || account.id == exclude)
        {
            continue;
        }
        // the fallback ignores transient failures and quota, not a cooldown
        // it just entered, an operator pause or a suspension that only a
        // recover with a health check lifts
        if (account.status == AccountStatus::Cooldown ||
            account.status == AccountStatus::Paused ||
            account.status == AccountStatus::Suspended)
        {
            continue;
        }
        if (best == nullptr || by_priority(&account, best))
        {
            best = &account;
        }
    }
    if (best == nullptr)
    {
        return std::nullopt;
    }
    return best->id;
}

std::optional<Selection> Selector::select(std::vector<Account> const &accounts,
                                          PoolSettings const &settings,
                                          std::string_view cursor,
                                          std::string_view exclude) const
{
    auto ids = ranked(accounts, settings, cursor, exclude);
    if (!ids.empty())
    {
        return Selection{std::move(ids.front()), false};
    }
    if (!settings.auto_failover)
    {
        return std::nullopt;
    }
    if (auto emergency = emergency_candidate(accounts, exclude))
    {
        return Selection{std::move(*emergency), true};
    }
    return std::nullopt;
}

} // namespace rotor::engine
