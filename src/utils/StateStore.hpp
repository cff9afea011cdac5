#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <sqlite3.h>

namespace rotor::storage
{

// One row of the accounts table. Times are unix milliseconds, enums are
// stored by name so the file stays readable with the sqlite shell.
struct AccountRow
{
    std::string id;
    std::int64_t position = 0;
    std::string display_name;
    std::string provider;
    std::string tier;
    int priority = 100;
    bool enabled = true;
    bool emergency = false;
    std::string status;
    std::int64_t daily_limit_ms = 0;
    std::int64_t used_today_ms = 0;
    std::int64_t last_reset_day = 0;
    std::optional<std::int64_t> cooldown_until_ms;
    std::string cooldown_reason;
    std::optional<std::int64_t> retry_after_ms;
    std::optional<std::int64_t> last_used_at_ms;
    std::optional<std::string> last_error;
    std::optional<std::int64_t> session_start_ms;
    std::int64_t max_session_ms = 0;
    std::int64_t total_sessions = 0;
    std::int64_t success_count = 0;
    std::int64_t failure_count = 0;
    std::int64_t consecutive_failures = 0;
    std::int64_t created_at_ms = 0;
    std::string telemetry;
};

class Database
{
  public:
    explicit Database(std::filesystem::path path);
    ~Database();

    Database(Database const &) = delete;
    Database &operator=(Database const &) = delete;

    bool is_valid() const noexcept { return db_ != nullptr; }
    std::filesystem::path const &path() const noexcept { return path_; }

    std::optional<std::string> get_setting(std::string const &key) const;
    bool set_setting(std::string const &key, std::string const &value);
    bool remove_setting(std::string const &key);
    bool begin_transaction() const;
    bool commit_transaction() const;
    bool rollback_transaction() const;

    std::vector<AccountRow> load_accounts() const;
    bool upsert_account(AccountRow const &row);
    bool delete_account(std::string const &id);
    // Replaces the whole table inside one transaction.
    bool replace_accounts(std::vector<AccountRow> const &rows);
    std::optional<int> schema_version() const;

  private:
    bool ensure_schema();
    bool execute(std::string const &sql) const;
    bool run_migrations();
    bool ensure_schema_version_row() const;
    bool set_schema_version(int version) const;
    bool apply_migration_v1() const;
    bool apply_migration_v2() const;
    bool write_account(AccountRow const &row) const;
    sqlite3_stmt *prepare_cached(std::string const &sql) const;

    std::filesystem::path path_;
    sqlite3 *db_ = nullptr;
    // cached statements are shared; one caller at a time
    mutable std::recursive_mutex mutex_;
    mutable std::unordered_map<std::string, sqlite3_stmt *> stmt_cache_;
};

} // namespace rotor::storage
