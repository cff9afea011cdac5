#include "app/DaemonMain.hpp"
#include "engine/Core.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/PoolScheduler.hpp"
#include "engine/Provisioner.hpp"
#include "rpc/Serializer.hpp"
#include "rpc/Server.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"
#include "utils/Version.hpp"

#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace
{

constexpr char const kUsage[] =
    "usage: rotord [options]\n"
    "  --state <path>          pool database (default <data dir>/rotor.db)\n"
    "  --accounts <file>       add or update accounts from a JSON file\n"
    "  --settings <file>       replace pool settings from a JSON file\n"
    "  --activate              start a session on the best account\n"
    "  --status-interval <s>   seconds between status lines (default 60)\n"
    "  --run-seconds <s>       stop after this many seconds\n"
    "  --print-status          print the pool status and exit\n"
    "  --rpc-bind <url>        RPC listener (default http://127.0.0.1:8765)\n"
    "  --rpc-token <token>     require this token on RPC requests\n"
    "  --no-rpc                do not start the RPC listener\n"
    "  --version               print the version and exit\n";

struct Options
{
    std::optional<std::filesystem::path> state_path;
    std::optional<std::filesystem::path> accounts_file;
    std::optional<std::filesystem::path> settings_file;
    std::optional<std::string> rpc_bind;
    std::optional<std::string> rpc_token;
    bool rpc_enabled = true;
    bool activate = false;
    bool print_status_only = false;
    bool show_version = false;
    bool show_help = false;
    int status_interval_seconds = 60;
    int run_seconds = 0;
};

std::optional<int> parse_seconds(std::string_view text)
{
    int value = 0;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value < 0)
    {
        return std::nullopt;
    }
    return value;
}

std::optional<Options> parse_options(int argc, char *argv[])
{
    Options options;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        auto next = [&]() -> std::optional<std::string_view>
        {
            if (i + 1 >= argc)
            {
                std::fprintf(stderr, "rotord: %s needs a value\n", argv[i]);
                return std::nullopt;
            }
            return std::string_view(argv[++i]);
        };
        if (arg == "--state" || arg == "--accounts" || arg == "--settings")
        {
            auto value = next();
            if (!value)
            {
                return std::nullopt;
            }
            std::filesystem::path path(*value);
            if (arg == "--state")
            {
                options.state_path = path;
            }
            else if (arg == "--accounts")
            {
                options.accounts_file = path;
            }
            else
            {
                options.settings_file = path;
            }
        }
        else if (arg == "--status-interval" || arg == "--run-seconds")
        {
            auto value = next();
            if (!value)
            {
                return std::nullopt;
            }
            auto seconds = parse_seconds(*value);
            if (!seconds)
            {
                std::fprintf(stderr, "rotord: invalid value for %.*s\n",
                             static_cast<int>(arg.size()), arg.data());
                return std::nullopt;
            }
            if (arg == "--status-interval")
            {
                options.status_interval_seconds = *seconds;
            }
            else
            {
                options.run_seconds = *seconds;
            }
        }
        else if (arg == "--rpc-bind" || arg == "--rpc-token")
        {
            auto value = next();
            if (!value || value->empty())
            {
                return std::nullopt;
            }
            if (arg == "--rpc-bind")
            {
                options.rpc_bind = std::string(*value);
            }
            else
            {
                options.rpc_token = std::string(*value);
            }
        }
        else if (arg == "--no-rpc")
        {
            options.rpc_enabled = false;
        }
        else if (arg == "--activate")
        {
            options.activate = true;
        }
        else if (arg == "--print-status")
        {
            options.print_status_only = true;
        }
        else if (arg == "--version")
        {
            options.show_version = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            options.show_help = true;
        }
        else
        {
            std::fprintf(stderr, "rotord: unknown option %s\n", argv[i]);
            return std::nullopt;
        }
    }
    return options;
}

std::optional<std::string> env_value(char const *name)
{
    if (auto const *value = std::getenv(name); value && *value)
    {
        return std::string(value);
    }
    return std::nullopt;
}

std::optional<std::string> read_file(std::filesystem::path const &path)
{
    std::ifstream input(path, std::ios::binary);
    if (!input)
    {
        return std::nullopt;
    }
    return std::string(std::istreambuf_iterator<char>(input),
                       std::istreambuf_iterator<char>());
}

bool import_accounts(rotor::engine::PoolScheduler &pool,
                     std::filesystem::path const &path)
{
    auto payload = read_file(path);
    if (!payload)
    {
        ROTOR_LOG_ERROR("cannot read accounts file {}", path.string());
        return false;
    }
    auto specs = rotor::rpc::parse_account_specs(*payload);
    if (!specs)
    {
        ROTOR_LOG_ERROR("accounts file {} is not a valid account list",
                        path.string());
        return false;
    }
    bool all_ok = true;
    for (auto const &spec : *specs)
    {
        auto result = pool.account(spec.id) ? pool.update_account(spec)
                                            : pool.add_account(spec);
        if (!result.status.ok())
        {
            ROTOR_LOG_WARN("account {} not imported: {}", spec.id,
                           result.status.message);
            all_ok = false;
        }
    }
    ROTOR_LOG_INFO("imported {} account definition(s) from {}", specs->size(),
                   path.string());
    return all_ok;
}

bool apply_settings_file(rotor::engine::PoolScheduler &pool,
                         std::filesystem::path const &path)
{
    auto payload = read_file(path);
    if (!payload)
    {
        ROTOR_LOG_ERROR("cannot read settings file {}", path.string());
        return false;
    }
    auto settings = rotor::rpc::parse_settings(*payload, pool.settings());
    if (!settings)
    {
        ROTOR_LOG_ERROR("settings file {} is not valid", path.string());
        return false;
    }
    auto result = pool.update_settings(*settings);
    if (!result.ok())
    {
        ROTOR_LOG_ERROR("settings rejected: {}", result.message);
        return false;
    }
    return true;
}

} // namespace

namespace rotor::app
{

int daemon_main(int argc, char *argv[])
{
    try
    {
        std::signal(SIGINT, [](int) { rotor::runtime::request_shutdown(); });
        std::signal(SIGTERM, [](int) { rotor::runtime::request_shutdown(); });

        auto options = parse_options(argc, argv);
        if (!options)
        {
            std::fputs(kUsage, stderr);
            return 2;
        }
        if (options->show_help)
        {
            std::fputs(kUsage, stdout);
            return 0;
        }
        if (options->show_version)
        {
            rotor::log::print_status(
                "{}", std::string_view(rotor::version::kDisplayVersion));
            return 0;
        }

        rotor::engine::CoreSettings settings;
        if (options->state_path)
        {
            settings.state_path = *options->state_path;
        }
        else if (auto const *env = std::getenv("ROTOR_STATE_PATH"); env && *env)
        {
            settings.state_path = env;
        }
        else
        {
            settings.state_path = rotor::utils::data_root() / "rotor.db";
        }

        ROTOR_LOG_INFO("{} starting; state at {}",
                       std::string_view(rotor::version::kDisplayVersion),
                       settings.state_path.string());

        auto engine = rotor::engine::Core::create(
            settings, std::make_shared<rotor::engine::PassiveProvisioner>());
        auto &pool = engine->pool();

        if (options->settings_file &&
            !apply_settings_file(pool, *options->settings_file))
        {
            return 1;
        }
        if (options->accounts_file &&
            !import_accounts(pool, *options->accounts_file))
        {
            ROTOR_LOG_WARN("some accounts could not be imported");
        }

        if (options->print_status_only)
        {
            rotor::log::print_status("{}", rotor::rpc::serialize_pool_status(
                                               pool.pool_status()));
            rotor::log::print_status(
                "{}", rotor::rpc::serialize_accounts(pool.all_accounts()));
            return 0;
        }

        auto subscription =
            engine->events().subscribe<rotor::engine::PoolEventPublished>(
                [](rotor::engine::PoolEventPublished const &published)
                {
                    rotor::log::print_status(
                        "{}", rotor::rpc::serialize_event(published.event));
                });

        if (options->activate)
        {
            auto result = pool.activate_next();
            if (!result.ok())
            {
                ROTOR_LOG_WARN("activation failed: {}", result.message);
            }
        }

        std::unique_ptr<rotor::rpc::Server> rpc_server;
        if (options->rpc_enabled)
        {
            rotor::rpc::ServerOptions server_options;
            server_options.token =
                options->rpc_token ? options->rpc_token
                                   : env_value("ROTOR_RPC_TOKEN");
            auto bind = options->rpc_bind.value_or(
                env_value("ROTOR_RPC_BIND").value_or("http://127.0.0.1:8765"));
            rpc_server = std::make_unique<rotor::rpc::Server>(
                &pool, &engine->events(), std::move(bind),
                std::move(server_options),
                [] { rotor::runtime::request_shutdown(); });
            if (!rpc_server->start())
            {
                ROTOR_LOG_ERROR("RPC listener unavailable; exiting");
                return 1;
            }
        }

        std::thread engine_thread([core = engine.get()] { core->run(); });
        rotor::log::print_status("rotord running; CTRL+C to stop.");

        auto const started = std::chrono::steady_clock::now();
        auto last_status = started;
        auto const status_every =
            std::chrono::seconds(options->status_interval_seconds);
        while (!rotor::runtime::should_shutdown())
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            auto now = std::chrono::steady_clock::now();
            if (options->run_seconds > 0 &&
                now - started >= std::chrono::seconds(options->run_seconds))
            {
                ROTOR_LOG_INFO("run-seconds={} reached; requesting shutdown",
                               options->run_seconds);
                rotor::runtime::request_shutdown();
                break;
            }
            if (options->status_interval_seconds > 0 &&
                now - last_status >= status_every)
            {
                last_status = now;
                rotor::log::print_status("{}", rotor::rpc::serialize_pool_status(
                                                   pool.pool_status()));
            }
        }

        ROTOR_LOG_INFO("Shutdown requested; stopping engine...");
        // no RPC call may reach the pool once the engine is gone
        rpc_server.reset();
        engine->stop();
        if (engine_thread.joinable())
        {
            engine_thread.join();
        }
        engine->events().unsubscribe(subscription);
        engine.reset();

        rotor::log::print_status("Shutdown complete.");
        return 0;
    }
    catch (std::exception const &ex)
    {
        std::fprintf(stderr, "rotord failed: %s\n", ex.what());
    }
    return 1;
}

} // namespace rotor::app

int main(int argc, char *argv[])
{
    return rotor::app::daemon_main(argc, argv);
}
