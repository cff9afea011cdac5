#include "engine/AccountRegistry.hpp"

#include "engine/PoolUtils.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>

namespace rotor::engine
{

OperationResult AccountRegistry::validate(AccountSpec const &spec)
{
    if (spec.id.empty())
    {
        return OperationResult::failure(ErrorCode::ValidationError,
                                        "account id must not be empty");
    }
    if (spec.daily_limit <= Duration{0})
    {
        return OperationResult::failure(
            ErrorCode::ValidationError,
            std::format("account {} needs a positive daily limit", spec.id));
    }
    if (spec.max_session <= Duration{0})
    {
        return OperationResult::failure(
            ErrorCode::ValidationError,
            std::format("account {} needs a positive max session length",
                        spec.id));
    }
    return OperationResult::success();
}

OperationResult AccountRegistry::add(Account account)
{
    if (auto result = validate(spec_of(account)); !result)
    {
        return result;
    }
    if (contains(account.id))
    {
        return OperationResult::failure(
            ErrorCode::ValidationError,
            std::format("account {} already exists", account.id));
    }
    accounts_.push_back(std::move(account));
    return OperationResult::success();
}

bool AccountRegistry::remove(std::string_view id)
{
    auto it = std::find_if(accounts_.begin(), accounts_.end(),
                           [id](Account const &account)
                           { return account.id == id; });
    if (it == accounts_.end())
    {
        return false;
    }
    accounts_.erase(it);
    return true;
}

OperationResult AccountRegistry::update(AccountSpec const &spec)
{
    if (auto result = validate(spec); !result)
    {
        return result;
    }
    auto *account = find(spec.id);
    if (account == nullptr)
    {
        return OperationResult::failure(
            ErrorCode::NotFoundError,
            std::format("account {} not found", spec.id));
    }
    account->display_name = spec.display_name.empty() ? spec.id
                                                      : spec.display_name;
    account->provider = spec.provider;
    account->tier = spec.tier;
    account->priority = spec.priority;
    account->enabled = spec.enabled;
    account->emergency = spec.emergency;
    account->daily_limit = spec.daily_limit;
    account->max_session = spec.max_session;
    return OperationResult::success();
}

void AccountRegistry::replace_all(std::vector<Account> accounts)
{
    // duplicate ids from a damaged store keep their first occurrence
    std::unordered_set<std::string> seen;
    accounts_.clear();
    accounts_.reserve(accounts.size());
    for (auto &account : accounts)
    {
        if (account.id.empty() || !seen.insert(account.id).second)
        {
            continue;
        }
        accounts_.push_back(std::move(account));
    }
}

bool AccountRegistry::contains(std::string_view id) const noexcept
{
    return find(id) != nullptr;
}

Account *AccountRegistry::find(std::string_view id) noexcept
{
    for (auto &account : accounts_)
    {
        if (account.id == id)
        {
            return &account;
        }
    }
    return nullptr;
}

Account const *AccountRegistry::find(std::string_view id) const noexcept
{
    for (auto const &account : accounts_)
    {
        if (account.id == id)
        {
            return &account;
        }
    }
    return nullptr;
}

std::optional<Account> AccountRegistry::get(std::string_view id) const
{
    if (auto const *account = find(id))
    {
        return *account;
    }
    return std::nullopt;
}

TransitionRecord AccountRegistry::transition(std::string_view id,
                                             StatusChange const &change)
{
    TransitionRecord record;
    record.to = change.to;
    auto *account = find(id);
    if (account == nullptr)
    {
        return record;
    }
    record.from = account->status;
    record.applied = AccountStateMachine::apply(*account, change);
    return record;
}

} // namespace rotor::engine
