#include "engine/AsyncTaskService.hpp"
#include "engine/PersistenceManager.hpp"
#include "utils/StateStore.hpp"

#include "TestUtils.hpp"

#include <filesystem>
#include <system_error>

#include <doctest/doctest.h>

using namespace rotor::engine;
using namespace std::chrono_literals;
using rotor::tests::make_temp_root;
using rotor::tests::make_test_account;
using rotor::tests::test_epoch;

namespace
{

PoolState sample_state()
{
    auto colab = make_test_account("colab-main", 10);
    colab.display_name = "Colab main";
    colab.tier = AccountTier::ProPlus;
    colab.used_today = 95min;
    colab.status = AccountStatus::Cooldown;
    colab.cooldown_until = test_epoch() + 45min;
    colab.cooldown_reason = CooldownReason::SessionLimit;
    colab.last_used_at = test_epoch() - 15min;
    colab.total_sessions = 4;
    colab.success_count = 12;
    colab.failure_count = 1;

    auto kaggle = make_test_account("kaggle", 20);
    kaggle.provider = ProviderType::Kaggle;
    kaggle.status = AccountStatus::Error;
    kaggle.retry_after = test_epoch() + 2min;
    kaggle.last_error = "notebook quota API returned 503";
    kaggle.consecutive_failures = 2;
    kaggle.failure_count = 2;
    kaggle.telemetry.memory_used_gb = 11.5;
    kaggle.telemetry.memory_total_gb = 16.0;
    kaggle.telemetry.utilization_percent = 87.25;
    kaggle.telemetry.temperature_c = 71.0;
    kaggle.telemetry.current_tasks = 2;

    auto reserve = make_test_account("reserve", 99);
    reserve.emergency = true;
    reserve.enabled = false;

    PoolState state;
    state.accounts = {colab, kaggle, reserve};
    state.settings.strategy = RotationStrategy::RoundRobin;
    state.settings.cooldown = 30min;
    state.settings.low_quota_threshold_percent = 80;
    state.settings.auto_prestart = false;
    state.settings.max_consecutive_failures = 5;
    state.rotation_cursor = "kaggle";
    return state;
}

} // namespace

TEST_CASE("saved pool state loads back unchanged")
{
    auto root = make_temp_root("persistence-roundtrip");
    auto const state = sample_state();
    {
        PersistenceManager persistence(root / "pool.db");
        REQUIRE(persistence.is_valid());
        CHECK_FALSE(persistence.load_pool().has_value());
        REQUIRE(persistence.save_pool(state));
    }
    {
        PersistenceManager persistence(root / "pool.db");
        auto loaded = persistence.load_pool();
        REQUIRE(loaded);
        REQUIRE(loaded->accounts.size() == state.accounts.size());
        for (std::size_t i = 0; i < state.accounts.size(); ++i)
        {
            CHECK(loaded->accounts[i] == state.accounts[i]);
        }
        CHECK(loaded->settings == state.settings);
        CHECK(loaded->rotation_cursor == "kaggle");
        CHECK(*loaded == state);
    }
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
}

TEST_CASE("removed accounts disappear from the table on the next save")
{
    auto root = make_temp_root("persistence-remove");
    PersistenceManager persistence(root / "pool.db");
    REQUIRE(persistence.is_valid());

    auto state = sample_state();
    REQUIRE(persistence.save_pool(state));
    state.accounts.erase(state.accounts.begin() + 1);
    REQUIRE(persistence.save_pool(state));

    rotor::storage::Database reader(root / "pool.db");
    auto rows = reader.load_accounts();
    REQUIRE(rows.size() == 2);
    CHECK(rows[0].id == "colab-main");
    CHECK(rows[1].id == "reserve");
    CHECK(rows[1].position == 1);
}

TEST_CASE("database schema is migrated to the current version")
{
    auto root = make_temp_root("persistence-schema");
    rotor::storage::Database db(root / "state.db");
    REQUIRE(db.is_valid());
    CHECK(db.schema_version() == std::optional<int>(2));

    CHECK(db.set_setting("answer", "42"));
    CHECK(db.get_setting("answer") == std::optional<std::string>("42"));
    CHECK(db.remove_setting("answer"));
    CHECK_FALSE(db.get_setting("answer").has_value());

    rotor::storage::AccountRow row;
    row.id = "solo";
    row.status = "active";
    row.provider = "local";
    row.tier = "free";
    row.cooldown_reason = "none";
    row.daily_limit_ms = 60000;
    row.max_session_ms = 60000;
    row.retry_after_ms = 1234;
    REQUIRE(db.upsert_account(row));
    row.priority = 3;
    REQUIRE(db.upsert_account(row));
    auto rows = db.load_accounts();
    REQUIRE(rows.size() == 1);
    CHECK(rows[0].priority == 3);
    CHECK(rows[0].retry_after_ms == std::optional<std::int64_t>(1234));
    CHECK_FALSE(rows[0].cooldown_until_ms.has_value());
    CHECK(db.delete_account("solo"));
    CHECK(db.load_accounts().empty());
}

TEST_CASE("rows with an unknown status are skipped on load")
{
    auto root = make_temp_root("persistence-bad-row");
    {
        PersistenceManager persistence(root / "pool.db");
        REQUIRE(persistence.save_pool(sample_state()));
    }
    {
        rotor::storage::Database db(root / "pool.db");
        auto rows = db.load_accounts();
        REQUIRE(rows.size() == 3);
        rows[1].status = "hibernating";
        REQUIRE(db.upsert_account(rows[1]));
    }
    PersistenceManager persistence(root / "pool.db");
    auto loaded = persistence.load_pool();
    REQUIRE(loaded);
    REQUIRE(loaded->accounts.size() == 2);
    CHECK(loaded->accounts[1].id == "reserve");
}

TEST_CASE("writes through the storage worker land in order")
{
    auto root = make_temp_root("persistence-async");
    auto state = sample_state();
    {
        AsyncTaskService storage(1, "storage");
        storage.start();
        PersistenceManager persistence(root / "pool.db", &storage);
        REQUIRE(persistence.save_pool(state));
        state.accounts[0].used_today = 120min;
        REQUIRE(persistence.save_pool(state));
        state.rotation_cursor = "colab-main";
        REQUIRE(persistence.save_pool(state));
        storage.stop();
    }
    PersistenceManager persistence(root / "pool.db");
    auto loaded = persistence.load_pool();
    REQUIRE(loaded);
    CHECK(loaded->accounts[0].used_today == 120min);
    CHECK(loaded->rotation_cursor == "colab-main");
}

TEST_CASE("a scheduler restarted on the same database resumes its pool")
{
    auto root = make_temp_root("persistence-scheduler");
    {
        PersistenceManager persistence(root / "pool.db");
        ManualClock clock(test_epoch());
        EventBus bus;
        PoolScheduler pool(clock, nullptr, &persistence, bus, {});
        REQUIRE(pool.add_account(rotor::tests::make_spec("a", 10)).status);
        REQUIRE(pool.add_account(rotor::tests::make_spec("b", 20)).status);
        REQUIRE(pool.set_active("a"));
        clock.advance(25min);
        pool.tick();
        REQUIRE(pool.flush());
    }
    PersistenceManager persistence(root / "pool.db");
    ManualClock clock(test_epoch() + 30min);
    EventBus bus;
    PoolScheduler pool(clock, nullptr, &persistence, bus, {});
    REQUIRE(pool.load());
    auto a = pool.account("a");
    REQUIRE(a);
    CHECK(a->status == AccountStatus::Active);
    CHECK(a->used_today == 25min);
    CHECK(a->total_sessions == 1);
    CHECK(pool.all_accounts().size() == 2);
    CHECK_FALSE(pool.current_account_id().has_value());
}
