#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <sqlite3.h>

namespace rt::storage
{

// SQLite-backed state for the daemon: flat key/value settings plus opaque
// documents stored whole under a namespace key. All members are safe to call
// from any thread.
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

    std::optional<std::string> load_document(std::string const &ns) const;
    bool store_document(std::string const &ns, std::string const &payload);

    // Last sqlite error message, empty when the last call succeeded.
    std::string last_error() const;

  private:
    bool ensure_schema();
    bool run_migrations();
    bool apply_migration_v1() const;
    bool apply_migration_v2() const;
    std::optional<int> schema_version() const;
    bool set_schema_version(int version) const;
    bool execute(std::string const &sql) const;
    sqlite3_stmt *prepare_cached(std::string const &sql) const;
    bool step_done(sqlite3_stmt *stmt) const;

    std::filesystem::path path_;
    sqlite3 *db_ = nullptr;
    mutable std::recursive_mutex mutex_;
    mutable std::unordered_map<std::string, sqlite3_stmt *> stmt_cache_;
    mutable std::string last_error_;
};

} // namespace rt::storage
