#include "engine/Selector.hpp"

#include "TestUtils.hpp"

#include <vector>

#include <doctest/doctest.h>

using namespace rotor::engine;
using namespace std::chrono_literals;
using rotor::tests::make_test_account;
using rotor::tests::test_epoch;

namespace
{

PoolSettings with_strategy(RotationStrategy strategy)
{
    PoolSettings settings;
    settings.strategy = strategy;
    return settings;
}

} // namespace

TEST_CASE("priority strategy prefers the lower number")
{
    Selector selector;
    std::vector<Account> accounts{make_test_account("twenty", 20),
                                  make_test_account("ten", 10)};
    auto pick = selector.select(accounts, PoolSettings{}, {});
    REQUIRE(pick);
    CHECK(pick->account_id == "ten");
    CHECK_FALSE(pick->emergency);
}

TEST_CASE("priority ties go to the least recently used account")
{
    Selector selector;
    std::vector<Account> accounts{make_test_account("recent", 10),
                                  make_test_account("older", 10),
                                  make_test_account("fresh", 10)};
    accounts[0].last_used_at = test_epoch() - 10min;
    accounts[1].last_used_at = test_epoch() - 2h;

    auto order = selector.ranked(accounts, PoolSettings{}, {});
    REQUIRE(order.size() == 3);
    CHECK(order[0] == "fresh");
    CHECK(order[1] == "older");
    CHECK(order[2] == "recent");
}

TEST_CASE("ineligible accounts are never selected")
{
    Selector selector;
    std::vector<Account> accounts;
    for (auto status : {AccountStatus::Cooldown, AccountStatus::Suspended,
                        AccountStatus::Error, AccountStatus::QuotaExhausted,
                        AccountStatus::Running, AccountStatus::Paused,
                        AccountStatus::Disconnected})
    {
        auto account = make_test_account("s" + std::to_string(static_cast<int>(status)), 1);
        account.status = status;
        accounts.push_back(account);
    }
    auto disabled = make_test_account("disabled", 1);
    disabled.enabled = false;
    accounts.push_back(disabled);
    auto empty = make_test_account("empty", 1);
    empty.used_today = empty.daily_limit;
    accounts.push_back(empty);

    CHECK(selector.ranked(accounts, PoolSettings{}, {}).empty());
    CHECK_FALSE(selector.select(accounts, PoolSettings{}, {}).has_value());

    accounts.push_back(make_test_account("ok", 50));
    auto pick = selector.select(accounts, PoolSettings{}, {});
    REQUIRE(pick);
    CHECK(pick->account_id == "ok");
}

TEST_CASE("round-robin resumes after the cursor")
{
    Selector selector;
    auto settings = with_strategy(RotationStrategy::RoundRobin);
    std::vector<Account> accounts{make_test_account("a", 1), make_test_account("b", 9),
                                  make_test_account("c", 5)};

    CHECK(selector.select(accounts, settings, {})->account_id == "a");
    CHECK(selector.select(accounts, settings, "a")->account_id == "b");
    CHECK(selector.select(accounts, settings, "b")->account_id == "c");
    CHECK(selector.select(accounts, settings, "c")->account_id == "a");

    accounts[0].status = AccountStatus::Cooldown;
    accounts[0].cooldown_until = test_epoch() + 1h;
    CHECK(selector.select(accounts, settings, "c")->account_id == "b");

    // a cursor that no longer exists starts from the top
    CHECK(selector.select(accounts, settings, "gone")->account_id == "b");
}

TEST_CASE("round-robin skips the excluded current account")
{
    Selector selector;
    auto settings = with_strategy(RotationStrategy::RoundRobin);
    std::vector<Account> accounts{make_test_account("a"), make_test_account("b")};
    auto pick = selector.select(accounts, settings, "a", "b");
    REQUIRE(pick);
    CHECK(pick->account_id == "a");
    CHECK_FALSE(selector.select({accounts[1]}, settings, "a", "b").has_value());
}

TEST_CASE("least-used prefers the account with the most quota left")
{
    Selector selector;
    auto settings = with_strategy(RotationStrategy::LeastUsed);
    std::vector<Account> accounts{make_test_account("busy", 1),
                                  make_test_account("idle", 50),
                                  make_test_account("light", 10)};
    accounts[0].used_today = 300min;
    accounts[2].used_today = 20min;

    auto order = selector.ranked(accounts, settings, {});
    REQUIRE(order.size() == 3);
    CHECK(order[0] == "idle");
    CHECK(order[1] == "light");
    CHECK(order[2] == "busy");
}

TEST_CASE("emergency account only when nothing regular is eligible")
{
    Selector selector;
    PoolSettings settings;
    auto emergency = make_test_account("reserve", 1);
    emergency.emergency = true;
    auto regular = make_test_account("regular", 50);

    std::vector<Account> accounts{emergency, regular};
    auto normal = selector.select(accounts, settings, {});
    REQUIRE(normal);
    CHECK(normal->account_id == "regular");
    CHECK_FALSE(normal->emergency);
    CHECK(selector.ranked(accounts, settings, {}) ==
          std::vector<std::string>{"regular"});

    accounts[1].status = AccountStatus::Suspended;
    auto fallback = selector.select(accounts, settings, {});
    REQUIRE(fallback);
    CHECK(fallback->account_id == "reserve");
    CHECK(fallback->emergency);

    settings.auto_failover = false;
    CHECK_FALSE(selector.select(accounts, settings, {}).has_value());
}

TEST_CASE("emergency fallback ignores quota but not cooldown, pause or suspension")
{
    Selector selector;
    auto reserve = make_test_account("reserve");
    reserve.emergency = true;
    reserve.status = AccountStatus::QuotaExhausted;
    reserve.used_today = reserve.daily_limit;
    std::vector<Account> accounts{reserve};

    CHECK(selector.emergency_candidate(accounts) == std::optional<std::string>("reserve"));

    accounts[0].status = AccountStatus::Cooldown;
    accounts[0].cooldown_until = test_epoch() + 1h;
    CHECK_FALSE(selector.emergency_candidate(accounts).has_value());

    accounts[0].status = AccountStatus::Paused;
    CHECK_FALSE(selector.emergency_candidate(accounts).has_value());

    accounts[0].status = AccountStatus::Suspended;
    accounts[0].last_error = "account banned";
    CHECK_FALSE(selector.emergency_candidate(accounts).has_value());

    accounts[0].status = AccountStatus::Error;
    CHECK(selector.emergency_candidate(accounts) == std::optional<std::string>("reserve"));

    accounts[0].status = AccountStatus::Active;
    accounts[0].enabled = false;
    CHECK_FALSE(selector.emergency_candidate(accounts).has_value());
}
