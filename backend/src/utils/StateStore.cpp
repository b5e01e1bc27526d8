#include "utils/StateStore.hpp"

#include "utils/Log.hpp"

#include <chrono>
#include <filesystem>
#include <system_error>

namespace rt::storage
{

namespace
{

constexpr int kDatabaseBusyTimeoutMs = 5000;

std::int64_t unix_millis_now()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
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
            RT_LOG_WARN("cannot create {}: {}", parent.string(), ec.message());
        }
    }
    int rc = sqlite3_open_v2(path_.string().c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                 SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK)
    {
        RT_LOG_ERROR("failed to open sqlite database {}: {}", path_.string(),
                     sqlite3_errstr(rc));
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    char *err_msg = nullptr;
    rc = sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr,
                      &err_msg);
    if (rc != SQLITE_OK && err_msg != nullptr)
    {
        RT_LOG_WARN("failed to enable WAL journal mode: {}", err_msg);
    }
    sqlite3_free(err_msg);
    sqlite3_busy_timeout(db_, kDatabaseBusyTimeoutMs);
    if (!ensure_schema())
    {
        RT_LOG_ERROR("database schema setup failed for {}", path_.string());
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

std::string Database::last_error() const
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return last_error_;
}

bool Database::ensure_schema()
{
    constexpr char const *kSchemaVersionSql =
        "CREATE TABLE IF NOT EXISTS schema_version ("
        "id INTEGER PRIMARY KEY CHECK(id = 1),"
        "version INTEGER NOT NULL);";
    if (!execute(kSchemaVersionSql) ||
        !execute("INSERT OR IGNORE INTO schema_version (id, version) "
                 "VALUES (1, 0);"))
    {
        return false;
    }
    return run_migrations();
}

bool Database::run_migrations()
{
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
        if (!execute("BEGIN TRANSACTION;"))
        {
            return false;
        }
        if (!(this->*migration.apply)() ||
            !set_schema_version(migration.version))
        {
            RT_LOG_ERROR("schema migration v{} failed", migration.version);
            execute("ROLLBACK;");
            return false;
        }
        if (!execute("COMMIT;"))
        {
            return false;
        }
        current = migration.version;
    }
    return true;
}

std::optional<int> Database::schema_version() const
{
    auto *stmt =
        prepare_cached("SELECT version FROM schema_version WHERE id = 1;");
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    std::optional<int> result;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        result = sqlite3_column_int(stmt, 0);
    }
    sqlite3_reset(stmt);
    return result;
}

bool Database::set_schema_version(int version) const
{
    auto *stmt = prepare_cached(
        "UPDATE schema_version SET version = ? WHERE id = 1;");
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_int(stmt, 1, version);
    return step_done(stmt);
}

bool Database::apply_migration_v1() const
{
    return execute("CREATE TABLE IF NOT EXISTS settings ("
                   "key TEXT PRIMARY KEY,"
                   "value TEXT NOT NULL);");
}

bool Database::apply_migration_v2() const
{
    return execute("CREATE TABLE IF NOT EXISTS documents ("
                   "namespace TEXT PRIMARY KEY,"
                   "payload TEXT NOT NULL,"
                   "updated_at INTEGER NOT NULL);");
}

bool Database::execute(std::string const &sql) const
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!db_)
    {
        last_error_ = "database is not open";
        return false;
    }
    char *err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK)
    {
        last_error_ = err_msg != nullptr ? err_msg : sqlite3_errstr(rc);
        RT_LOG_WARN("sqlite error: {}", last_error_);
        sqlite3_free(err_msg);
        return false;
    }
    last_error_.clear();
    return true;
}

sqlite3_stmt *Database::prepare_cached(std::string const &sql) const
{
    if (!db_)
    {
        last_error_ = "database is not open";
        return nullptr;
    }
    auto it = stmt_cache_.find(sql);
    if (it != stmt_cache_.end())
    {
        sqlite3_reset(it->second);
        sqlite3_clear_bindings(it->second);
        return it->second;
    }
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        last_error_ = sqlite3_errmsg(db_);
        RT_LOG_WARN("sqlite prepare failed: {}", last_error_);
        return nullptr;
    }
    stmt_cache_.emplace(sql, stmt);
    return stmt;
}

bool Database::step_done(sqlite3_stmt *stmt) const
{
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE)
    {
        last_error_ = sqlite3_errmsg(db_);
    }
    else
    {
        last_error_.clear();
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE;
}

std::optional<std::string> Database::get_setting(std::string const &key) const
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto *stmt =
        prepare_cached("SELECT value FROM settings WHERE key = ? LIMIT 1;");
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    std::optional<std::string> value;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        auto text =
            reinterpret_cast<char const *>(sqlite3_column_text(stmt, 0));
        if (text != nullptr)
        {
            value = std::string(text);
        }
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return value;
}

bool Database::set_setting(std::string const &key, std::string const &value)
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto *stmt = prepare_cached(
        "INSERT OR REPLACE INTO settings (key, value) VALUES (?, ?);");
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
    return step_done(stmt);
}

std::optional<std::string> Database::load_document(std::string const &ns) const
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto *stmt = prepare_cached(
        "SELECT payload FROM documents WHERE namespace = ? LIMIT 1;");
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, ns.c_str(), -1, SQLITE_TRANSIENT);
    std::optional<std::string> payload;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        auto const *data = sqlite3_column_blob(stmt, 0);
        auto const size = sqlite3_column_bytes(stmt, 0);
        if (data != nullptr && size > 0)
        {
            payload = std::string(static_cast<char const *>(data),
                                  static_cast<std::size_t>(size));
        }
        else
        {
            payload = std::string{};
        }
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return payload;
}

bool Database::store_document(std::string const &ns, std::string const &payload)
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto *stmt = prepare_cached(
        "INSERT OR REPLACE INTO documents (namespace, payload, updated_at) "
        "VALUES (?, ?, ?);");
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_text(stmt, 1, ns.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, payload.data(),
                      static_cast<int>(payload.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, unix_millis_now());
    return step_done(stmt);
}

} // namespace rt::storage
