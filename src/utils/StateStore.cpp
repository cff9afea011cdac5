#include "utils/StateStore.hpp"

#include "utils/Log.hpp"

#include <filesystem>
#include <system_error>

namespace rotor::storage
{

namespace
{

constexpr int kDatabaseBusyTimeoutMs = 5000;

using Lock = std::lock_guard<std::recursive_mutex>;

std::optional<std::string> column_text(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL)
    {
        return std::nullopt;
    }
    auto const *text =
        reinterpret_cast<char const *>(sqlite3_column_text(stmt, index));
    if (text == nullptr)
    {
        return std::nullopt;
    }
    return std::string(text);
}

std::optional<std::int64_t> column_int64(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL)
    {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt, index));
}

void bind_optional(sqlite3_stmt *stmt, int index,
                   std::optional<std::int64_t> const &value)
{
    if (value)
    {
        sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(*value));
    }
    else
    {
        sqlite3_bind_null(stmt, index);
    }
}

void bind_optional(sqlite3_stmt *stmt, int index,
                   std::optional<std::string> const &value)
{
    if (value)
    {
        sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
    }
    else
    {
        sqlite3_bind_null(stmt, index);
    }
}

void bind_text(sqlite3_stmt *stmt, int index, std::string const &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

} // namespace

Database::Database(std::filesystem::path path) : path_(std::move(path))
{
    if (path_.empty())
    {
        return;
    }
    auto parent = path_.parent_path();
    if (!parent.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            ROTOR_LOG_WARN("could not create {}: {}", parent.string(),
                           ec.message());
        }
    }
    int rc = sqlite3_open_v2(path_.string().c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                 SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK)
    {
        ROTOR_LOG_ERROR("failed to open sqlite database {}: {}", path_.string(),
                        sqlite3_errstr(rc));
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    char *err_msg = nullptr;
    rc = sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr,
                      &err_msg);
    if (rc != SQLITE_OK)
    {
        if (err_msg != nullptr)
        {
            ROTOR_LOG_WARN("failed to enable WAL journal mode: {}", err_msg);
        }
    }
    if (err_msg != nullptr)
    {
        sqlite3_free(err_msg);
    }
    sqlite3_busy_timeout(db_, kDatabaseBusyTimeoutMs);
    if (!ensure_schema())
    {
        ROTOR_LOG_ERROR("database schema for {} is unusable", path_.string());
        for (auto &entry : stmt_cache_)
        {
            sqlite3_finalize(entry.second);
        }
        stmt_cache_.clear();
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Database::~Database()
{
    for (auto &entry : stmt_cache_)
    {
        if (entry.second != nullptr)
        {
            sqlite3_finalize(entry.second);
        }
    }
    stmt_cache_.clear();
    if (db_)
    {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool Database::ensure_schema()
{
    if (!db_)
    {
        return false;
    }
    constexpr char const *kSchemaVersionSql =
        "CREATE TABLE IF NOT EXISTS schema_version ("
        "id INTEGER PRIMARY KEY CHECK(id = 1),"
        "version INTEGER NOT NULL);";
    if (!execute(kSchemaVersionSql))
    {
        return false;
    }
    return run_migrations();
}

bool Database::execute(std::string const &sql) const
{
    if (!db_)
    {
        return false;
    }
    char *err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK)
    {
        if (err_msg != nullptr)
        {
            ROTOR_LOG_WARN("sqlite error: {}", err_msg);
            sqlite3_free(err_msg);
        }
        return false;
    }
    return true;
}

bool Database::run_migrations()
{
    if (!ensure_schema_version_row())
    {
        return false;
    }
    auto current = schema_version().value_or(0);
    struct Migration
    {
        int version;
        bool (Database::*apply)() const;
    };
    static constexpr Migration kMigrations[] = {
        {1, &Database::apply_migration_v1},
        {2, &Database::apply_migration_v2},
    };
    for (auto const &migration : kMigrations)
    {
        if (current >= migration.version)
        {
            continue;
        }
        if (!begin_transaction())
        {
            return false;
        }
        if (!(this->*migration.apply)() || !set_schema_version(migration.version))
        {
            ROTOR_LOG_ERROR("schema migration v{} failed", migration.version);
            rollback_transaction();
            return false;
        }
        if (!commit_transaction())
        {
            return false;
        }
        current = migration.version;
    }
    return true;
}

bool Database::ensure_schema_version_row() const
{
    constexpr char const *sql =
        "INSERT OR IGNORE INTO schema_version (id, version) VALUES (1, 0);";
    return execute(sql);
}

std::optional<int> Database::schema_version() const
{
    Lock lock(mutex_);
    if (!db_)
    {
        return std::nullopt;
    }
    constexpr char const *sql =
        "SELECT version FROM schema_version WHERE id = 1 LIMIT 1;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    std::optional<int> result;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        result = static_cast<int>(sqlite3_column_int(stmt, 0));
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return result;
}

bool Database::set_schema_version(int version) const
{
    if (!db_)
    {
        return false;
    }
    constexpr char const *sql =
        "INSERT OR REPLACE INTO schema_version (id, version) VALUES (1, ?);";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_int(stmt, 1, version);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE;
}

bool Database::apply_migration_v1() const
{
    constexpr char const *kSettingsSql = "CREATE TABLE IF NOT EXISTS settings ("
                                         "key TEXT PRIMARY KEY,"
                                         "value TEXT NOT NULL);";
    constexpr char const *kAccountsSql =
        "CREATE TABLE IF NOT EXISTS accounts ("
        "id TEXT PRIMARY KEY,"
        "position INTEGER NOT NULL,"
        "display_name TEXT NOT NULL,"
        "provider TEXT NOT NULL,"
        "tier TEXT NOT NULL,"
        "priority INTEGER NOT NULL,"
        "enabled INTEGER NOT NULL,"
        "emergency INTEGER NOT NULL,"
        "status TEXT NOT NULL,"
        "daily_limit_ms INTEGER NOT NULL,"
        "used_today_ms INTEGER NOT NULL,"
        "last_reset_day INTEGER NOT NULL,"
        "cooldown_until_ms INTEGER,"
        "cooldown_reason TEXT,"
        "last_used_at_ms INTEGER,"
        "last_error TEXT,"
        "session_start_ms INTEGER,"
        "max_session_ms INTEGER NOT NULL,"
        "total_sessions INTEGER NOT NULL,"
        "success_count INTEGER NOT NULL,"
        "failure_count INTEGER NOT NULL,"
        "created_at_ms INTEGER NOT NULL);";
    return execute(kSettingsSql) && execute(kAccountsSql);
}

bool Database::apply_migration_v2() const
{
    // failure budget and telemetry arrived after the first release
    return execute("ALTER TABLE accounts ADD COLUMN retry_after_ms INTEGER;") &&
           execute("ALTER TABLE accounts ADD COLUMN consecutive_failures "
                   "INTEGER NOT NULL DEFAULT 0;") &&
           execute("ALTER TABLE accounts ADD COLUMN telemetry TEXT;");
}

sqlite3_stmt *Database::prepare_cached(std::string const &sql) const
{
    if (!db_)
    {
        return nullptr;
    }
    auto it = stmt_cache_.find(sql);
    if (it != stmt_cache_.end())
    {
        if (it->second != nullptr)
        {
            sqlite3_reset(it->second);
            sqlite3_clear_bindings(it->second);
        }
        return it->second;
    }
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        ROTOR_LOG_WARN("sqlite prepare failed: {}", sqlite3_errmsg(db_));
        return nullptr;
    }
    stmt_cache_.emplace(sql, stmt);
    return stmt;
}

bool Database::begin_transaction() const
{
    Lock lock(mutex_);
    return execute("BEGIN TRANSACTION;");
}

bool Database::commit_transaction() const
{
    Lock lock(mutex_);
    return execute("COMMIT;");
}

bool Database::rollback_transaction() const
{
    Lock lock(mutex_);
    return execute("ROLLBACK;");
}

std::optional<std::string> Database::get_setting(std::string const &key) const
{
    Lock lock(mutex_);
    if (!db_)
    {
        return std::nullopt;
    }
    constexpr char const *sql =
        "SELECT value FROM settings WHERE key = ? LIMIT 1;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    bind_text(stmt, 1, key);
    std::optional<std::string> value;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        value = column_text(stmt, 0);
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return value;
}

bool Database::set_setting(std::string const &key, std::string const &value)
{
    Lock lock(mutex_);
    if (!db_)
    {
        return false;
    }
    constexpr char const *sql =
        "INSERT OR REPLACE INTO settings (key, value) VALUES (?, ?);";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    bind_text(stmt, 1, key);
    bind_text(stmt, 2, value);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE;
}

bool Database::remove_setting(std::string const &key)
{
    Lock lock(mutex_);
    if (!db_)
    {
        return false;
    }
    constexpr char const *sql = "DELETE FROM settings WHERE key = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    bind_text(stmt, 1, key);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE;
}

std::vector<AccountRow> Database::load_accounts() const
{
    Lock lock(mutex_);
    std::vector<AccountRow> result;
    if (!db_)
    {
        return result;
    }
    constexpr char const *sql =
        "SELECT id, position, display_name, provider, tier, priority, enabled, "
        "emergency, status, daily_limit_ms, used_today_ms, last_reset_day, "
        "cooldown_until_ms, cooldown_reason, retry_after_ms, last_used_at_ms, "
        "last_error, session_start_ms, max_session_ms, total_sessions, "
        "success_count, failure_count, consecutive_failures, created_at_ms, "
        "telemetry FROM accounts ORDER BY position ASC;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return result;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW)
    {
        AccountRow row;
        row.id = column_text(stmt, 0).value_or(std::string{});
        row.position = sqlite3_column_int64(stmt, 1);
        row.display_name = column_text(stmt, 2).value_or(row.id);
        row.provider = column_text(stmt, 3).value_or(std::string{});
        row.tier = column_text(stmt, 4).value_or(std::string{});
        row.priority = sqlite3_column_int(stmt, 5);
        row.enabled = sqlite3_column_int(stmt, 6) != 0;
        row.emergency = sqlite3_column_int(stmt, 7) != 0;
        row.status = column_text(stmt, 8).value_or(std::string{});
        row.daily_limit_ms = sqlite3_column_int64(stmt, 9);
        row.used_today_ms = sqlite3_column_int64(stmt, 10);
        row.last_reset_day = sqlite3_column_int64(stmt, 11);
        row.cooldown_until_ms = column_int64(stmt, 12);
        row.cooldown_reason = column_text(stmt, 13).value_or(std::string{});
        row.retry_after_ms = column_int64(stmt, 14);
        row.last_used_at_ms = column_int64(stmt, 15);
        row.last_error = column_text(stmt, 16);
        row.session_start_ms = column_int64(stmt, 17);
        row.max_session_ms = sqlite3_column_int64(stmt, 18);
        row.total_sessions = sqlite3_column_int64(stmt, 19);
        row.success_count = sqlite3_column_int64(stmt, 20);
        row.failure_count = sqlite3_column_int64(stmt, 21);
        row.consecutive_failures = sqlite3_column_int64(stmt, 22);
        row.created_at_ms = sqlite3_column_int64(stmt, 23);
        row.telemetry = column_text(stmt, 24).value_or(std::string{});
        if (!row.id.empty())
        {
            result.push_back(std::move(row));
        }
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return result;
}

bool Database::write_account(AccountRow const &row) const
{
    constexpr char const *sql =
        "INSERT OR REPLACE INTO accounts (id, position, display_name, "
        "provider, tier, priority, enabled, emergency, status, daily_limit_ms, "
        "used_today_ms, last_reset_day, cooldown_until_ms, cooldown_reason, "
        "retry_after_ms, last_used_at_ms, last_error, session_start_ms, "
        "max_session_ms, total_sessions, success_count, failure_count, "
        "consecutive_failures, created_at_ms, telemetry) VALUES (?, ?, ?, ?, "
        "?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    bind_text(stmt, 1, row.id);
    sqlite3_bind_int64(stmt, 2, row.position);
    bind_text(stmt, 3, row.display_name);
    bind_text(stmt, 4, row.provider);
    bind_text(stmt, 5, row.tier);
    sqlite3_bind_int(stmt, 6, row.priority);
    sqlite3_bind_int(stmt, 7, row.enabled ? 1 : 0);
    sqlite3_bind_int(stmt, 8, row.emergency ? 1 : 0);
    bind_text(stmt, 9, row.status);
    sqlite3_bind_int64(stmt, 10, row.daily_limit_ms);
    sqlite3_bind_int64(stmt, 11, row.used_today_ms);
    sqlite3_bind_int64(stmt, 12, row.last_reset_day);
    bind_optional(stmt, 13, row.cooldown_until_ms);
    bind_text(stmt, 14, row.cooldown_reason);
    bind_optional(stmt, 15, row.retry_after_ms);
    bind_optional(stmt, 16, row.last_used_at_ms);
    bind_optional(stmt, 17, row.last_error);
    bind_optional(stmt, 18, row.session_start_ms);
    sqlite3_bind_int64(stmt, 19, row.max_session_ms);
    sqlite3_bind_int64(stmt, 20, row.total_sessions);
    sqlite3_bind_int64(stmt, 21, row.success_count);
    sqlite3_bind_int64(stmt, 22, row.failure_count);
    sqlite3_bind_int64(stmt, 23, row.consecutive_failures);
    sqlite3_bind_int64(stmt, 24, row.created_at_ms);
    bind_text(stmt, 25, row.telemetry);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    if (rc != SQLITE_DONE)
    {
        ROTOR_LOG_WARN("failed to write account {}: {}", row.id,
                       sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool Database::upsert_account(AccountRow const &row)
{
    Lock lock(mutex_);
    if (!db_ || row.id.empty())
    {
        return false;
    }
    return write_account(row);
}

bool Database::delete_account(std::string const &id)
{
    Lock lock(mutex_);
    if (!db_)
    {
        return false;
    }
    constexpr char const *sql = "DELETE FROM accounts WHERE id = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    bind_text(stmt, 1, id);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE;
}

bool Database::replace_accounts(std::vector<AccountRow> const &rows)
{
    Lock lock(mutex_);
    if (!db_)
    {
        return false;
    }
    if (!begin_transaction())
    {
        return false;
    }
    bool success = execute("DELETE FROM accounts;");
    for (auto const &row : rows)
    {
        if (!success)
        {
            break;
        }
        success = write_account(row);
    }
    if (!success)
    {
        rollback_transaction();
        return false;
    }
    return commit_transaction();
}

} // namespace rotor::storage
