#include "engine/AccountRegistry.hpp"
#include "engine/AccountStateMachine.hpp"

#include "TestUtils.hpp"

#include <doctest/doctest.h>

using namespace rotor::engine;
using namespace std::chrono_literals;
using rotor::tests::make_spec;
using rotor::tests::make_test_account;
using rotor::tests::test_epoch;

TEST_CASE("state machine follows the status table")
{
    using S = AccountStatus;
    CHECK(AccountStateMachine::can_transition(S::Active, S::Running));
    CHECK(AccountStateMachine::can_transition(S::Running, S::Cooldown));
    CHECK(AccountStateMachine::can_transition(S::Running, S::Paused));
    CHECK(AccountStateMachine::can_transition(S::Cooldown, S::Active));
    CHECK(AccountStateMachine::can_transition(S::Error, S::Suspended));
    CHECK(AccountStateMachine::can_transition(S::Suspended, S::Active));

    CHECK_FALSE(AccountStateMachine::can_transition(S::Active, S::Cooldown));
    CHECK_FALSE(AccountStateMachine::can_transition(S::Active, S::Paused));
    CHECK_FALSE(AccountStateMachine::can_transition(S::Suspended, S::Error));
    CHECK_FALSE(AccountStateMachine::can_transition(S::Paused, S::Cooldown));
    CHECK_FALSE(AccountStateMachine::can_transition(S::Running, S::Running));

    CHECK(AccountStateMachine::is_failure_status(S::Disconnected));
    CHECK_FALSE(AccountStateMachine::is_failure_status(S::QuotaExhausted));
}

TEST_CASE("applying a session start and a cooldown keeps fields consistent")
{
    auto account = make_test_account("a");
    auto const start = test_epoch();

    REQUIRE(AccountStateMachine::apply(account, {AccountStatus::Running, start}));
    CHECK(account.session_start == start);
    CHECK(account.last_used_at == start);
    CHECK(account.total_sessions == 1);

    StatusChange no_expiry;
    no_expiry.to = AccountStatus::Cooldown;
    no_expiry.now = start + 2h;
    CHECK_FALSE(AccountStateMachine::apply(account, no_expiry));
    CHECK(account.status == AccountStatus::Running);

    StatusChange cooldown = no_expiry;
    cooldown.cooldown_until = start + 3h;
    cooldown.cooldown_reason = CooldownReason::SessionLimit;
    REQUIRE(AccountStateMachine::apply(account, cooldown));
    CHECK(account.status == AccountStatus::Cooldown);
    CHECK_FALSE(account.session_start.has_value());
    CHECK(account.last_used_at == start + 2h);
    CHECK(account.cooldown_until == start + 3h);

    REQUIRE(AccountStateMachine::apply(account, {AccountStatus::Active, start + 3h}));
    CHECK_FALSE(account.cooldown_until.has_value());
    CHECK(account.cooldown_reason == CooldownReason::None);
}

TEST_CASE("failure transitions record the error and retry time")
{
    auto account = make_test_account("a");
    StatusChange change;
    change.to = AccountStatus::Error;
    change.now = test_epoch();
    change.retry_after = test_epoch() + 2min;
    change.error = "quota API unreachable";
    REQUIRE(AccountStateMachine::apply(account, change));
    CHECK(account.last_error == "quota API unreachable");
    CHECK(account.retry_after == test_epoch() + 2min);

    REQUIRE(AccountStateMachine::apply(account, {AccountStatus::Suspended, test_epoch()}));
    CHECK_FALSE(account.retry_after.has_value());
    CHECK(account.last_error == "quota API unreachable");
}

TEST_CASE("normalize drops fields that do not match the status")
{
    auto account = make_test_account("a");
    account.cooldown_until = test_epoch() + 1h;
    account.cooldown_reason = CooldownReason::Rotation;
    account.retry_after = test_epoch() + 5min;
    AccountStateMachine::normalize(account);
    CHECK_FALSE(account.cooldown_until.has_value());
    CHECK(account.cooldown_reason == CooldownReason::None);
    CHECK_FALSE(account.retry_after.has_value());

    auto failed = make_test_account("b");
    failed.status = AccountStatus::Error;
    failed.retry_after = test_epoch() + 5min;
    AccountStateMachine::normalize(failed);
    CHECK(failed.retry_after == test_epoch() + 5min);
}

TEST_CASE("registry validates and keeps insertion order")
{
    AccountRegistry registry;
    REQUIRE(registry.add(make_test_account("a")));
    REQUIRE(registry.add(make_test_account("b")));
    REQUIRE(registry.add(make_test_account("c")));

    auto duplicate = registry.add(make_test_account("b"));
    CHECK(duplicate.code == ErrorCode::ValidationError);
    CHECK(registry.size() == 3);

    CHECK(AccountRegistry::validate(make_spec("")).code == ErrorCode::ValidationError);
    CHECK(AccountRegistry::validate(make_spec("x", 1, Duration{0})).code ==
          ErrorCode::ValidationError);
    CHECK(AccountRegistry::validate(make_spec("x", 1, 10min, Duration{0})).code ==
          ErrorCode::ValidationError);

    CHECK(registry.remove("b"));
    CHECK_FALSE(registry.remove("b"));
    REQUIRE(registry.accounts().size() == 2);
    CHECK(registry.accounts()[0].id == "a");
    CHECK(registry.accounts()[1].id == "c");
}

TEST_CASE("registry update replaces the static description only")
{
    AccountRegistry registry;
    auto account = make_test_account("a");
    account.used_today = 30min;
    account.status = AccountStatus::Cooldown;
    account.cooldown_until = test_epoch() + 1h;
    REQUIRE(registry.add(account));

    auto spec = make_spec("a", 5, 240min, 90min);
    spec.display_name = "Colab main";
    spec.enabled = false;
    REQUIRE(registry.update(spec));

    auto stored = registry.get("a");
    REQUIRE(stored);
    CHECK(stored->priority == 5);
    CHECK(stored->display_name == "Colab main");
    CHECK_FALSE(stored->enabled);
    CHECK(stored->daily_limit == 240min);
    CHECK(stored->max_session == 90min);
    CHECK(stored->used_today == 30min);
    CHECK(stored->status == AccountStatus::Cooldown);

    CHECK(registry.update(make_spec("missing")).code == ErrorCode::NotFoundError);
}

TEST_CASE("registry transitions go through the state machine")
{
    AccountRegistry registry;
    REQUIRE(registry.add(make_test_account("a")));

    auto rejected = registry.transition("a", {AccountStatus::Paused, test_epoch()});
    CHECK_FALSE(rejected.applied);
    CHECK(rejected.from == AccountStatus::Active);

    auto started = registry.transition("a", {AccountStatus::Running, test_epoch()});
    CHECK(started.applied);
    CHECK(registry.find("a")->status == AccountStatus::Running);

    CHECK_FALSE(registry.transition("nobody", {AccountStatus::Active, test_epoch()})
                    .applied);
}

TEST_CASE("replace_all drops duplicate and empty ids")
{
    AccountRegistry registry;
    std::vector<Account> accounts{make_test_account("a"), make_test_account("b"),
                                  make_test_account("a"), make_test_account("")};
    accounts[2].priority = 1;
    registry.replace_all(accounts);
    REQUIRE(registry.size() == 2);
    CHECK(registry.find("a")->priority == 100);
}
