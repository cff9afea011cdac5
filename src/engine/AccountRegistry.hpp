#pragma once

#include "engine/AccountStateMachine.hpp"
#include "engine/Core.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rotor::engine
{

struct TransitionRecord
{
    bool applied = false;
    AccountStatus from = AccountStatus::Active;
    AccountStatus to = AccountStatus::Active;
};

// Owns the accounts of one pool. Insertion order is stable and is the order
// round-robin rotation walks.
class AccountRegistry
{
  public:
    static OperationResult validate(AccountSpec const &spec);

    OperationResult add(Account account);
    bool remove(std::string_view id);
    OperationResult update(AccountSpec const &spec);
    void replace_all(std::vector<Account> accounts);

    bool contains(std::string_view id) const noexcept;
    Account *find(std::string_view id) noexcept;
    Account const *find(std::string_view id) const noexcept;
    std::optional<Account> get(std::string_view id) const;

    TransitionRecord transition(std::string_view id, StatusChange const &change);

    std::vector<Account> const &accounts() const noexcept { return accounts_; }
    std::vector<Account> &accounts() noexcept { return accounts_; }
    std::size_t size() const noexcept { return accounts_.size(); }

  private:
    std::vector<Account> accounts_;
};

} // namespace rotor::engine
