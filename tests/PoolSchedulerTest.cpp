#include "engine/PoolScheduler.hpp"

#include "TestUtils.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include <doctest/doctest.h>

using namespace rotor::engine;
using namespace std::chrono_literals;
using rotor::tests::kTestDay;
using rotor::tests::make_spec;
using rotor::tests::make_test_account;
using rotor::tests::ManualSubmitter;
using rotor::tests::PoolHarness;

namespace
{

// Every regular account unusable, one emergency account in reserve.
std::vector<Account> stranded_pool()
{
    auto suspended = make_test_account("suspended", 1);
    suspended.status = AccountStatus::Suspended;
    suspended.last_error = "account banned";
    auto drained = make_test_account("drained", 2);
    drained.status = AccountStatus::QuotaExhausted;
    drained.used_today = drained.daily_limit;
    auto reserve = make_test_account("reserve", 50);
    reserve.emergency = true;
    return {suspended, drained, reserve};
}

std::size_t index_of(std::vector<PoolEvent> const &events, EventKind kind,
                     std::string const &account)
{
    auto it = std::find_if(events.begin(), events.end(),
                           [&](PoolEvent const &event)
                           { return event.kind == kind && event.account_id == account; });
    return static_cast<std::size_t>(it - events.begin());
}

} // namespace

TEST_CASE("session limit switches exactly once at the 120 minute mark")
{
    PoolHarness h;
    h.settings([](PoolSettings &s) { s.cooldown = 60min; });
    REQUIRE(h.pool.add_account(make_spec("A", 10, 720min, 120min)).status);
    auto const start = h.clock.now();
    REQUIRE(h.pool.set_active("A"));

    h.run_for(119min);
    CHECK(h.recorder.switches.empty());
    CHECK(h.get("A").status == AccountStatus::Running);

    h.step(1min);
    REQUIRE(h.recorder.switches.size() == 1);
    CHECK(h.recorder.switches[0].reason == SwitchReason::SessionLimit);
    CHECK(h.recorder.switches[0].current_account_id == "A");
    CHECK_FALSE(h.recorder.switches[0].next_account_id.has_value());

    auto a = h.get("A");
    CHECK(a.status == AccountStatus::Cooldown);
    CHECK(a.cooldown_until == start + 180min);
    CHECK(a.cooldown_reason == CooldownReason::SessionLimit);
    CHECK(a.used_today == 120min);
    CHECK_FALSE(h.pool.current_account_id().has_value());

    h.run_for(59min);
    CHECK(h.recorder.switches.size() == 1);
    CHECK_FALSE(h.pool.pool_status().is_pool_available);
    CHECK(h.recorder.count(EventKind::PoolExhausted) == 1);

    // cooldown over: the pool picks the account up again
    h.step(1min);
    CHECK(h.get("A").status == AccountStatus::Running);
    CHECK(h.pool.current_account_id() == std::optional<std::string>("A"));
    CHECK(h.recorder.switches.size() == 1);
}

TEST_CASE("low quota rotates before the quota is gone")
{
    PoolHarness h;
    h.settings(
        [](PoolSettings &s)
        {
            s.low_quota_threshold_percent = 90;
            s.auto_rotate_on_quota_low = true;
            s.auto_prestart = false;
        });
    REQUIRE(h.pool.add_account(make_spec("A", 10, 100min)).status);
    REQUIRE(h.pool.add_account(make_spec("B", 20)).status);
    REQUIRE(h.pool.set_active("A"));

    h.run_for(90min);
    CHECK(h.recorder.switches.empty());
    CHECK(h.recorder.count(EventKind::QuotaWarning) == 0);

    h.step(1min);
    REQUIRE(h.recorder.switches.size() == 1);
    CHECK(h.recorder.switches[0].reason == SwitchReason::QuotaLow);
    CHECK(h.recorder.switches[0].next_account_id == std::optional<std::string>("B"));
    CHECK(h.recorder.count(EventKind::QuotaWarning, "A") == 1);

    auto a = h.get("A");
    CHECK(a.used_today == 91min);
    CHECK(a.remaining_quota() == 9min);
    CHECK(a.status == AccountStatus::Cooldown);
    CHECK(a.cooldown_reason == CooldownReason::Rotation);
    CHECK(h.pool.current_account_id() == std::optional<std::string>("B"));

    REQUIRE_FALSE(h.recorder.rotations.empty());
    auto const &rotation = h.recorder.rotations.back();
    CHECK(rotation.account_id == "B");
    CHECK(rotation.previous_account_id == std::optional<std::string>("A"));
    CHECK_FALSE(rotation.emergency);
}

TEST_CASE("low quota keeps the session when only the emergency account is left")
{
    PoolHarness h;
    h.settings([](PoolSettings &s) { s.auto_prestart = false; });
    REQUIRE(h.pool.add_account(make_spec("A", 10, 100min)).status);
    auto reserve = make_spec("reserve", 1);
    reserve.emergency = true;
    REQUIRE(h.pool.add_account(reserve).status);
    REQUIRE(h.pool.set_active("A"));

    h.run_for(95min);
    REQUIRE(h.recorder.switches.size() == 1);
    CHECK(h.recorder.switches[0].reason == SwitchReason::QuotaLow);
    CHECK(h.pool.current_account_id() == std::optional<std::string>("A"));

    // the hard limit still hands over, to the emergency account
    h.run_for(5min);
    CHECK(h.recorder.switches.size() == 2);
    CHECK(h.recorder.switches[1].reason == SwitchReason::QuotaExhausted);
    CHECK(h.pool.current_account_id() == std::optional<std::string>("reserve"));
    CHECK(h.get("A").cooldown_reason == CooldownReason::QuotaExhausted);
    REQUIRE(h.recorder.emergencies.size() == 1);
    CHECK(h.recorder.emergencies[0].replaced_account_id ==
          std::optional<std::string>("A"));
}

TEST_CASE("emergency account takes over a stranded pool")
{
    PoolHarness h;
    REQUIRE(h.restore(stranded_pool()));

    auto before = h.pool.pool_status();
    CHECK(before.is_pool_available);
    CHECK(before.next_candidate_id == std::optional<std::string>("reserve"));
    CHECK(before.suspended_accounts == 1);
    CHECK(before.exhausted_accounts == 1);

    REQUIRE(h.pool.activate_next());
    REQUIRE(h.recorder.emergencies.size() == 1);
    CHECK(h.recorder.emergencies[0].account_id == "reserve");
    CHECK(h.recorder.count(EventKind::EmergencyActivated, "reserve") == 1);

    auto after = h.pool.pool_status();
    CHECK(after.is_pool_available);
    CHECK(after.emergency_active);
    REQUIRE(after.current_session);
    CHECK(after.current_session->account_id == "reserve");
    CHECK(h.pool.stats().counters.emergency_activations == 1);
}

TEST_CASE("without failover a stranded pool is unavailable")
{
    PoolHarness h;
    PoolSettings settings;
    settings.auto_failover = false;
    REQUIRE(h.restore(stranded_pool(), settings));

    auto status = h.pool.pool_status();
    CHECK_FALSE(status.is_pool_available);
    CHECK_FALSE(status.next_candidate_id.has_value());

    auto result = h.pool.activate_next();
    CHECK(result.code == ErrorCode::PoolExhausted);
    CHECK(h.recorder.emergencies.empty());
    CHECK_FALSE(h.pool.current_account_id().has_value());
}

TEST_CASE("emergency session hands back once a regular account is eligible")
{
    PoolHarness h;
    REQUIRE(h.restore(stranded_pool()));
    REQUIRE(h.pool.activate_next());
    h.run_for(10min);
    CHECK(h.pool.current_account_id() == std::optional<std::string>("reserve"));

    REQUIRE(h.pool.reset_daily_quota("drained"));
    CHECK(h.get("drained").status == AccountStatus::Active);

    h.step(1s);
    CHECK(h.pool.current_account_id() == std::optional<std::string>("drained"));
    CHECK(h.get("reserve").status == AccountStatus::Active);
    CHECK(h.get("reserve").used_today == 10min + 1s);
    CHECK_FALSE(h.pool.pool_status().emergency_active);
    CHECK(h.recorder.rotations.back().previous_account_id ==
          std::optional<std::string>("reserve"));
    CHECK_FALSE(h.recorder.rotations.back().emergency);
}

TEST_CASE("removing the running account ends its session first")
{
    PoolHarness h;
    REQUIRE(h.pool.add_account(make_spec("A", 10)).status);
    REQUIRE(h.pool.add_account(make_spec("B", 20)).status);
    REQUIRE(h.pool.set_active("A"));
    h.run_for(5min);

    REQUIRE(h.pool.remove_account("A"));
    CHECK_FALSE(h.pool.current_account_id().has_value());
    CHECK_FALSE(h.pool.account("A").has_value());
    CHECK_FALSE(h.pool.pool_status().current_session.has_value());
    CHECK(h.provisioner->stops("A") == 1);

    auto const &events = h.recorder.events;
    auto ended = index_of(events, EventKind::SessionEnded, "A");
    auto removed = index_of(events, EventKind::AccountRemoved, "A");
    REQUIRE(ended < events.size());
    REQUIRE(removed < events.size());
    CHECK(ended < removed);

    CHECK(h.pool.pool_status().next_candidate_id == std::optional<std::string>("B"));
    CHECK(h.pool.remove_account("A").code == ErrorCode::NotFoundError);
}

TEST_CASE("end_session returns the account to Active, not Cooldown")
{
    PoolHarness h;
    REQUIRE(h.pool.add_account(make_spec("A")).status);
    REQUIRE(h.pool.set_active("A"));
    h.run_for(10min);

    REQUIRE(h.pool.end_session());
    auto a = h.get("A");
    CHECK(a.status == AccountStatus::Active);
    CHECK_FALSE(a.cooldown_until.has_value());
    CHECK(a.used_today == 10min);
    CHECK_FALSE(h.pool.current_account_id().has_value());
    CHECK(h.pool.end_session().code == ErrorCode::NotFoundError);

    // a deliberate stop is not resumed by the tick loop
    h.run_for(5min);
    CHECK_FALSE(h.pool.current_account_id().has_value());
}

TEST_CASE("set_active refuses ineligible accounts unless forced")
{
    PoolHarness h;
    auto cooling = make_test_account("cooling", 10);
    cooling.status = AccountStatus::Cooldown;
    cooling.cooldown_until = h.clock.now() + 1h;
    cooling.cooldown_reason = CooldownReason::Rotation;
    REQUIRE(h.restore({cooling, make_test_account("spare", 20)}));

    CHECK(h.pool.set_active("cooling").code == ErrorCode::IneligibleError);
    CHECK(h.pool.set_active("ghost").code == ErrorCode::NotFoundError);
    CHECK_FALSE(h.pool.current_account_id().has_value());

    REQUIRE(h.pool.set_active("cooling", true));
    CHECK(h.get("cooling").status == AccountStatus::Running);
    CHECK_FALSE(h.get("cooling").cooldown_until.has_value());
}

TEST_CASE("invalid input is rejected without touching the pool")
{
    PoolHarness h;
    REQUIRE(h.pool.add_account(make_spec("A")).status);
    auto const saves = h.store.saves;

    CHECK(h.pool.add_account(make_spec("A")).status.code == ErrorCode::ValidationError);
    CHECK(h.pool.add_account(make_spec("")).status.code == ErrorCode::ValidationError);
    CHECK(h.pool.add_account(make_spec("B", 1, Duration{0})).status.code ==
          ErrorCode::ValidationError);
    CHECK(h.pool.update_account(make_spec("ghost")).status.code ==
          ErrorCode::NotFoundError);
    CHECK(h.pool.reset_daily_quota("ghost").code == ErrorCode::NotFoundError);
    CHECK(h.pool.recover_account("ghost").code == ErrorCode::NotFoundError);

    auto settings = h.pool.settings();
    auto bad = settings;
    bad.low_quota_threshold_percent = 150;
    CHECK(h.pool.update_settings(bad).code == ErrorCode::ValidationError);
    bad = settings;
    bad.max_consecutive_failures = 0;
    CHECK(h.pool.update_settings(bad).code == ErrorCode::ValidationError);
    bad = settings;
    bad.cooldown = -1min;
    CHECK(h.pool.update_settings(bad).code == ErrorCode::ValidationError);
    bad = settings;
    bad.cooldown = Duration{0};
    CHECK(h.pool.update_settings(bad).code == ErrorCode::ValidationError);

    CHECK(h.pool.settings() == settings);
    CHECK(h.pool.all_accounts().size() == 1);
    CHECK(h.store.saves == saves);
}

TEST_CASE("an in-flight prestart wins over a better candidate that frees up later")
{
    PoolHarness h;
    auto a = make_test_account("A", 10);
    a.max_session = 60min;
    auto b = make_test_account("B", 20);
    auto c = make_test_account("C", 5);
    c.status = AccountStatus::Cooldown;
    c.cooldown_until = h.clock.now() + 58min;
    c.cooldown_reason = CooldownReason::Rotation;
    PoolSettings settings;
    settings.prestart_lead_time = 5min;
    REQUIRE(h.restore({a, b, c}, settings));
    REQUIRE(h.pool.set_active("A"));

    h.run_for(54min);
    CHECK_FALSE(h.pool.pool_status().prestart_candidate_id.has_value());

    h.step(1min);
    CHECK(h.pool.pool_status().prestart_candidate_id ==
          std::optional<std::string>("B"));
    CHECK(h.recorder.count(EventKind::PrestartTriggered, "B") == 1);

    h.run_for(4min);
    CHECK(h.get("C").status == AccountStatus::Active);
    CHECK(h.pool.pool_status().next_candidate_id == std::optional<std::string>("B"));

    h.step(1min);
    CHECK(h.pool.current_account_id() == std::optional<std::string>("B"));
    REQUIRE_FALSE(h.recorder.rotations.empty());
    CHECK(h.recorder.rotations.back().from_prestart);
    CHECK(h.get("C").status == AccountStatus::Active);
    CHECK(h.provisioner->starts("B") == 1);
    CHECK(h.get("A").status == AccountStatus::Cooldown);
}

TEST_CASE("prestart_next is idempotent for the same candidate")
{
    PoolHarness h;
    REQUIRE(h.pool.add_account(make_spec("A", 10)).status);
    CHECK(h.pool.prestart_next().code == ErrorCode::Ok);
    CHECK(h.pool.pool_status().prestart_candidate_id ==
          std::optional<std::string>("A"));

    REQUIRE(h.pool.set_active("A"));
    CHECK(h.pool.prestart_next().code == ErrorCode::PoolExhausted);

    REQUIRE(h.pool.add_account(make_spec("B", 20)).status);
    REQUIRE(h.pool.add_account(make_spec("C", 30)).status);
    REQUIRE(h.pool.prestart_next());
    REQUIRE(h.pool.prestart_next());
    CHECK(h.pool.pool_status().prestart_candidate_id ==
          std::optional<std::string>("B"));
    CHECK(h.provisioner->starts("B") == 1);
}

TEST_CASE("a session start that times out fails over and is stopped when it lands")
{
    ManualSubmitter manual;
    PoolSchedulerOptions options;
    options.provisioning_timeout = 120s;
    PoolHarness h(manual.submitter(), options);
    REQUIRE(h.pool.add_account(make_spec("A", 10)).status);
    REQUIRE(h.pool.add_account(make_spec("B", 20)).status);
    REQUIRE(h.pool.set_active("A"));
    CHECK(h.pool.pending_operations() == 1);

    h.step(121s);
    auto a = h.get("A");
    CHECK(a.status == AccountStatus::Error);
    CHECK(a.last_error == std::optional<std::string>("session start timed out"));
    CHECK(a.retry_after.has_value());
    CHECK(h.pool.current_account_id() == std::optional<std::string>("B"));

    // the late start, the stop of A and B's start
    CHECK(manual.run_all() == 3);
    h.step(1s);
    CHECK(h.recorder.count(EventKind::Connected, "B") == 1);
    manual.run_all();
    CHECK(h.provisioner->stops("A") == 2);
}

TEST_CASE("ending a session whose start is still running stops the late session")
{
    ManualSubmitter manual;
    PoolHarness h(manual.submitter());
    REQUIRE(h.pool.add_account(make_spec("A", 10)).status);
    REQUIRE(h.pool.set_active("A"));
    CHECK(h.pool.pending_operations() == 1);

    REQUIRE(h.pool.end_session());
    CHECK(h.pool.pending_operations() == 0);
    CHECK(h.get("A").status == AccountStatus::Active);

    // the stop overtakes the start
    CHECK(manual.run_all_reversed() == 2);
    CHECK(h.provisioner->stops("A") == 1);
    h.step(1s);
    CHECK(manual.run_all() == 1);
    CHECK(h.provisioner->starts("A") == 1);
    CHECK(h.provisioner->stops("A") == 2);
    CHECK(h.pool.pending_operations() == 0);
}

TEST_CASE("pausing a session whose start is still running stops the late session")
{
    ManualSubmitter manual;
    PoolHarness h(manual.submitter());
    REQUIRE(h.pool.add_account(make_spec("A", 10)).status);
    REQUIRE(h.pool.set_active("A"));

    REQUIRE(h.pool.pause_session());
    CHECK(h.pool.pending_operations() == 0);
    CHECK(h.get("A").status == AccountStatus::Paused);

    manual.run_all_reversed();
    h.step(1s);
    manual.run_all();
    CHECK(h.provisioner->stops("A") == 2);
    CHECK(h.get("A").status == AccountStatus::Paused);
}

TEST_CASE("removing an account with a start in flight still stops the late session")
{
    ManualSubmitter manual;
    PoolHarness h(manual.submitter());
    REQUIRE(h.pool.add_account(make_spec("A", 10)).status);
    REQUIRE(h.pool.set_active("A"));

    REQUIRE(h.pool.remove_account("A"));
    CHECK(h.pool.pending_operations() == 0);
    CHECK_FALSE(h.pool.current_account_id().has_value());

    manual.run_all_reversed();
    CHECK(h.provisioner->stops("A") == 1);
    h.step(1s);
    CHECK(manual.run_all() == 1);
    CHECK(h.provisioner->stops("A") == 2);
}

TEST_CASE("removing an account that is being prestarted stops the late session")
{
    ManualSubmitter manual;
    PoolHarness h(manual.submitter());
    REQUIRE(h.pool.add_account(make_spec("A", 10)).status);
    REQUIRE(h.pool.prestart_next());
    CHECK(h.pool.pending_operations() == 1);

    REQUIRE(h.pool.remove_account("A"));
    CHECK(h.pool.pending_operations() == 0);
    CHECK_FALSE(h.pool.pool_status().prestart_candidate_id.has_value());

    CHECK(manual.run_all() == 1);
    CHECK(h.provisioner->stops("A") == 0);
    h.step(1s);
    CHECK(manual.run_all() == 1);
    CHECK(h.provisioner->starts("A") == 1);
    CHECK(h.provisioner->stops("A") == 1);
}

TEST_CASE("repeated failures escalate and then suspend the account")
{
    PoolHarness h;
    REQUIRE(h.pool.add_account(make_spec("A", 10)).status);
    h.provisioner->fail_start("A", "runtime allocation failed");
    h.provisioner->fail_health("A", "runtime unreachable");
    REQUIRE(h.pool.set_active("A"));

    h.run_for(10min, 30s);
    auto a = h.get("A");
    CHECK(a.status == AccountStatus::Suspended);
    CHECK(a.consecutive_failures == 3);
    CHECK(a.failure_count == 3);
    CHECK(a.last_error == std::optional<std::string>("runtime unreachable"));
    CHECK(h.provisioner->starts("A") == 1);
    CHECK(h.provisioner->health_checks("A") == 2);

    auto errors = h.recorder.of_kind(EventKind::Error);
    REQUIRE(errors.size() == 3);
    CHECK(errors[0].severity == Severity::Warning);
    CHECK(errors[1].severity == Severity::Critical);
    CHECK(errors[2].severity == Severity::Critical);

    // the scheduler keeps going and picks up a new eligible account
    REQUIRE(h.pool.add_account(make_spec("B", 20)).status);
    h.step(1s);
    CHECK(h.pool.current_account_id() == std::optional<std::string>("B"));
    CHECK(h.get("A").status == AccountStatus::Suspended);
}

TEST_CASE("recovery re-checks health before returning an account")
{
    PoolHarness h;
    REQUIRE(h.pool.add_account(make_spec("A", 10)).status);
    h.provisioner->fail_start("A", "credentials revoked", true);
    REQUIRE(h.pool.set_active("A"));
    h.step(1s);
    REQUIRE(h.get("A").status == AccountStatus::Suspended);
    CHECK(h.recorder.of_kind(EventKind::Error).back().severity == Severity::Critical);

    h.provisioner->fail_health("A", "still banned");
    REQUIRE(h.pool.recover_account("A"));
    h.step(1s);
    auto refused = h.get("A");
    CHECK(refused.status == AccountStatus::Suspended);
    CHECK(refused.last_error == std::optional<std::string>("still banned"));
    CHECK(h.recorder.of_kind(EventKind::Error).back().message ==
          "recovery refused: still banned");

    h.provisioner->heal("A");
    REQUIRE(h.pool.recover_account("A"));
    h.step(1s);
    CHECK(h.recorder.count(EventKind::AccountRecovered, "A") == 1);
    CHECK(h.get("A").status == AccountStatus::Running);
    CHECK(h.pool.recover_account("A").code == ErrorCode::IneligibleError);
}

TEST_CASE("failed health check disconnects and fails over")
{
    PoolHarness h;
    REQUIRE(h.pool.add_account(make_spec("A", 10)).status);
    REQUIRE(h.pool.add_account(make_spec("B", 20)).status);
    h.provisioner->fail_health("A", "kernel died");
    REQUIRE(h.pool.set_active("A"));

    h.step(60s);
    CHECK(h.provisioner->health_checks("A") == 1);
    h.step(1s);

    auto a = h.get("A");
    CHECK(a.status == AccountStatus::Disconnected);
    CHECK(a.last_error == std::optional<std::string>("kernel died"));
    CHECK(h.pool.current_account_id() == std::optional<std::string>("B"));
    CHECK(h.pool.stats().counters.rotations == 1);
}

TEST_CASE("consecutive task failures take the account out of rotation")
{
    PoolHarness h;
    REQUIRE(h.pool.add_account(make_spec("A", 10)).status);
    REQUIRE(h.pool.add_account(make_spec("B", 20)).status);
    REQUIRE(h.pool.set_active("A"));

    REQUIRE(h.pool.record_task_started("A", "epoch 1"));
    REQUIRE(h.pool.record_task_completed("A", "epoch 1"));
    REQUIRE(h.pool.record_task_failed("A", "CUDA out of memory"));
    REQUIRE(h.pool.record_task_failed("A", "CUDA out of memory"));
    auto failures = h.recorder.of_kind(EventKind::TaskFailed);
    REQUIRE(failures.size() == 2);
    CHECK(failures[0].severity == Severity::Warning);
    CHECK(failures[1].severity == Severity::Critical);

    // the third one exhausts the failure budget
    REQUIRE(h.pool.record_task_failed("A", "CUDA out of memory"));
    auto a = h.get("A");
    CHECK(a.status == AccountStatus::Suspended);
    CHECK(a.failure_count == 3);
    CHECK(a.success_count == 1);
    CHECK(h.pool.current_account_id() == std::optional<std::string>("B"));
    CHECK(h.pool.record_task_completed("A", "late").code == ErrorCode::IneligibleError);
    CHECK(h.pool.stats().counters.tasks_failed == 3);
}

TEST_CASE("a new UTC day lifts quota exhaustion once")
{
    PoolHarness h;
    auto drained = make_test_account("drained");
    drained.status = AccountStatus::QuotaExhausted;
    drained.used_today = drained.daily_limit;
    drained.last_reset_day = kTestDay - 1;
    REQUIRE(h.restore({drained}));

    h.step(1s);
    auto account = h.get("drained");
    CHECK(account.status == AccountStatus::Active);
    CHECK(account.used_today == Duration{0});
    CHECK(account.last_reset_day == kTestDay);
    CHECK(h.recorder.count(EventKind::QuotaReset, "drained") == 1);

    h.run_for(2h);
    CHECK(h.recorder.count(EventKind::QuotaReset, "drained") == 1);
    CHECK(h.pool.stats().counters.quota_resets == 1);
}

TEST_CASE("pause and resume")
{
    PoolHarness h;
    REQUIRE(h.pool.add_account(make_spec("A")).status);
    CHECK(h.pool.pause_session().code == ErrorCode::NotFoundError);
    REQUIRE(h.pool.set_active("A"));
    h.run_for(3min);

    REQUIRE(h.pool.pause_session());
    CHECK(h.get("A").status == AccountStatus::Paused);
    CHECK(h.get("A").used_today == 3min);
    CHECK(h.pool.set_active("A").code == ErrorCode::IneligibleError);

    REQUIRE(h.pool.resume_account("A"));
    CHECK(h.get("A").status == AccountStatus::Active);
    CHECK(h.pool.resume_account("A").code == ErrorCode::IneligibleError);
}

TEST_CASE("loading closes sessions left running by a previous process")
{
    PoolHarness h;
    auto stale = make_test_account("stale");
    stale.status = AccountStatus::Running;
    stale.session_start = h.clock.now() - 30min;
    stale.used_today = 30min;
    REQUIRE(h.restore({stale}));

    auto account = h.get("stale");
    CHECK(account.status == AccountStatus::Active);
    CHECK_FALSE(account.session_start.has_value());
    CHECK(account.used_today == 30min);
    CHECK_FALSE(h.pool.current_account_id().has_value());
}

TEST_CASE("loading lifts a cooldown that has no expiry")
{
    PoolHarness h;
    auto broken = make_test_account("broken");
    broken.status = AccountStatus::Cooldown;
    broken.cooldown_reason = CooldownReason::SessionLimit;
    auto stray = make_test_account("stray");
    stray.cooldown_until = h.clock.now() + 1h;
    stray.cooldown_reason = CooldownReason::Rotation;
    REQUIRE(h.restore({broken, stray}));

    auto lifted = h.get("broken");
    CHECK(lifted.status == AccountStatus::Active);
    CHECK(lifted.cooldown_reason == CooldownReason::None);
    auto cleaned = h.get("stray");
    CHECK(cleaned.status == AccountStatus::Active);
    CHECK_FALSE(cleaned.cooldown_until.has_value());
    REQUIRE(h.pool.set_active("broken"));
}

TEST_CASE("every committed change reaches the store")
{
    PoolHarness h;
    REQUIRE(h.pool.add_account(make_spec("A", 10)).status);
    REQUIRE(h.store.state);
    CHECK(h.store.state->accounts.size() == 1);

    REQUIRE(h.pool.set_active("A"));
    CHECK(h.store.state->accounts[0].status == AccountStatus::Running);
    CHECK(h.store.state->rotation_cursor == "A");

    h.run_for(10min);
    REQUIRE(h.pool.flush());
    CHECK(h.store.state->accounts[0].used_today == 10min);

    PoolHarness restarted;
    restarted.store.state = h.store.state;
    REQUIRE(restarted.pool.load());
    CHECK(restarted.get("A").used_today == 10min);
    CHECK(restarted.pool.settings() == h.pool.settings());
}

TEST_CASE("recent events are bounded and newest last")
{
    PoolSchedulerOptions options;
    options.event_history_limit = 4;
    PoolHarness h({}, options);
    for (auto id : {"a", "b", "c", "d", "e", "f"})
    {
        REQUIRE(h.pool.add_account(make_spec(id)).status);
    }
    auto events = h.pool.recent_events(10);
    REQUIRE(events.size() == 4);
    CHECK(events.front().account_id == "c");
    CHECK(events.back().account_id == "f");
    CHECK(events.back().sequence == 6);
}
