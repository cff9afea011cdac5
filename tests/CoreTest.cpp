#include "engine/Core.hpp"
#include "engine/PoolScheduler.hpp"
#include "engine/Provisioner.hpp"

#include "TestUtils.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <thread>

#include <doctest/doctest.h>

using namespace rotor::engine;
using namespace std::chrono_literals;
using rotor::tests::make_spec;
using rotor::tests::make_temp_root;

namespace
{

struct EngineRunner
{
    explicit EngineRunner(Core &core) : core_(core), thread_([&core] { core.run(); })
    {
        auto const deadline = std::chrono::steady_clock::now() + 5s;
        while (!core_.is_running() && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(5ms);
        }
    }

    ~EngineRunner()
    {
        core_.stop();
        if (thread_.joinable())
        {
            thread_.join();
        }
    }

    Core &core_;
    std::thread thread_;
};

CoreSettings settings_in(std::filesystem::path const &root)
{
    CoreSettings settings;
    settings.state_path = root / "state.db";
    settings.tick_interval = 10ms;
    return settings;
}

} // namespace

TEST_CASE("Core keeps the pool across a restart")
{
    auto root = make_temp_root("core-restart");
    {
        auto core = Core::create(settings_in(root),
                                 std::make_shared<PassiveProvisioner>());
        auto &pool = core->pool();
        REQUIRE(pool.add_account(make_spec("a", 10)).status);
        REQUIRE(pool.add_account(make_spec("b", 20)).status);
        REQUIRE(pool.activate_next());
        {
            EngineRunner runner(*core);
            REQUIRE(core->is_running());
            std::this_thread::sleep_for(100ms);
            CHECK(pool.current_account_id() == std::optional<std::string>("a"));
        }
        CHECK_FALSE(core->is_running());
    }
    {
        auto core = Core::create(settings_in(root),
                                 std::make_shared<PassiveProvisioner>());
        auto a = core->pool().account("a");
        REQUIRE(a);
        // the open session was closed on load
        CHECK(a->status == AccountStatus::Active);
        CHECK(a->total_sessions == 1);
        CHECK(core->pool().all_accounts().size() == 2);
        CHECK_FALSE(core->pool().current_account_id().has_value());
    }
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
}

TEST_CASE("Core applies runtime setting changes")
{
    auto root = make_temp_root("core-settings");
    auto core = Core::create(settings_in(root),
                             std::make_shared<PassiveProvisioner>());
    EngineRunner runner(*core);

    auto settings = core->settings();
    settings.flush_interval = 5s;
    settings.state_path = root / "elsewhere.db";
    CHECK(core->update_settings(settings));
    CHECK(core->settings().flush_interval == 5s);
    // the database location is fixed once running
    CHECK(core->settings().state_path == root / "state.db");

    settings.tick_interval = 0ms;
    CHECK_FALSE(core->update_settings(settings));
    CHECK(core->settings().tick_interval == 10ms);
}
