#pragma once

#include "engine/Core.hpp"
#include "engine/PoolStore.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace rotor::storage
{
class Database;
}

namespace rotor::engine
{
class AsyncTaskService;

// sqlite-backed PoolStore. Accounts live in their own table, the pool
// settings and rotation cursor in the key/value settings table.
class PersistenceManager : public PoolStore
{
  public:
    // Optional task service may be provided to offload blocking DB writes.
    explicit PersistenceManager(std::filesystem::path path,
                                AsyncTaskService *task_service = nullptr);
    ~PersistenceManager() override;

    PersistenceManager(PersistenceManager const &) = delete;
    PersistenceManager &operator=(PersistenceManager const &) = delete;

    bool is_valid() const noexcept;

    std::optional<PoolState> load_pool() override;
    bool save_pool(PoolState const &state) override;

    // Runtime settings share the settings table with the pool.
    std::optional<std::string> get_setting(std::string const &key) const;
    bool persist_settings(CoreSettings const &settings);

  private:
    bool write_pool(std::shared_ptr<storage::Database> const &db,
                    PoolState const &state);

    std::shared_ptr<storage::Database> database_;
    // Not owning; writes run on it in submission order when set.
    AsyncTaskService *task_service_ = nullptr;

    std::mutex cache_mutex_;
    std::optional<PoolState> last_saved_;
};

} // namespace rotor::engine
