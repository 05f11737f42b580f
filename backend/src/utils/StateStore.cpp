#include "utils/StateStore.hpp"

#include "utils/Log.hpp"

#include <chrono>
#include <filesystem>
#include <system_error>

namespace tmax::storage
{

namespace
{

constexpr int kDatabaseBusyTimeoutMs = 5000;

std::vector<std::uint8_t> copy_column_blob(sqlite3_stmt *stmt, int index)
{
    auto size = sqlite3_column_bytes(stmt, index);
    if (size <= 0)
    {
        return {};
    }
    auto data = sqlite3_column_blob(stmt, index);
    if (data == nullptr)
    {
        return {};
    }
    return std::vector<std::uint8_t>(
        reinterpret_cast<std::uint8_t const *>(data),
        reinterpret_cast<std::uint8_t const *>(data) +
            static_cast<std::size_t>(size));
}

std::string column_text(sqlite3_stmt *stmt, int index)
{
    auto *text = reinterpret_cast<char const *>(sqlite3_column_text(stmt, index));
    return text != nullptr ? std::string(text) : std::string();
}

void finish(sqlite3_stmt *stmt)
{
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
}

} // namespace

Database::Database(std::filesystem::path path) : path_(std::move(path))
{
    if (path_.empty())
    {
        return;
    }
    std::error_code ec;
    auto parent = path_.parent_path();
    if (!parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            TM_LOG_WARN("failed to create state directory {}: {}",
                        parent.string(), ec.message());
        }
    }
    int rc = sqlite3_open_v2(path_.string().c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                 SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK)
    {
        TM_LOG_ERROR("failed to open sqlite database {}: {}", path_.string(),
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
        TM_LOG_WARN("failed to enable WAL journal mode: {}", err_msg);
    }
    sqlite3_free(err_msg);
    sqlite3_busy_timeout(db_, kDatabaseBusyTimeoutMs);
    if (!ensure_schema())
    {
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
            TM_LOG_WARN("sqlite error: {}", err_msg);
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
    };
    for (auto const &migration : kMigrations)
    {
        if (current >= migration.version)
        {
            continue;
        }
        if (!(this->*migration.apply)())
        {
            TM_LOG_ERROR("schema migration v{} failed", migration.version);
            return false;
        }
        if (!set_schema_version(migration.version))
        {
            return false;
        }
        current = migration.version;
    }
    return true;
}

bool Database::ensure_schema_version_row() const
{
    return execute(
        "INSERT OR IGNORE INTO schema_version (id, version) VALUES (1, 0);");
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
    finish(stmt);
    return result;
}

bool Database::set_schema_version(int version) const
{
    auto *stmt = prepare_cached(
        "INSERT OR REPLACE INTO schema_version (id, version) VALUES (1, ?);");
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_int(stmt, 1, version);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE;
}

bool Database::apply_migration_v1() const
{
    constexpr char const *kSettingsSql = "CREATE TABLE IF NOT EXISTS settings ("
                                         "key TEXT PRIMARY KEY,"
                                         "value TEXT NOT NULL);";
    constexpr char const *kResumeSql =
        "CREATE TABLE IF NOT EXISTS resume_data ("
        "info_hash TEXT PRIMARY KEY,"
        "data BLOB NOT NULL,"
        "updated_at INTEGER NOT NULL);";
    constexpr char const *kTorrentListSql =
        "CREATE TABLE IF NOT EXISTS torrent_list ("
        "position INTEGER NOT NULL,"
        "info_hash TEXT PRIMARY KEY,"
        "save_path TEXT NOT NULL,"
        "name TEXT,"
        "trackers TEXT);";
    return execute(kSettingsSql) && execute(kResumeSql) &&
           execute(kTorrentListSql);
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
        finish(it->second);
        return it->second;
    }
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        TM_LOG_WARN("sqlite prepare failed: {}", sqlite3_errmsg(db_));
        return nullptr;
    }
    stmt_cache_.emplace(sql, stmt);
    return stmt;
}

bool Database::begin_transaction() const
{
    return execute("BEGIN TRANSACTION;");
}

bool Database::commit_transaction() const
{
    return execute("COMMIT;");
}

bool Database::rollback_transaction() const
{
    return execute("ROLLBACK;");
}

std::optional<std::string> Database::get_setting(std::string const &key) const
{
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
        value = column_text(stmt, 0);
    }
    finish(stmt);
    return value;
}

bool Database::set_setting(std::string const &key, std::string const &value)
{
    auto *stmt = prepare_cached(
        "INSERT OR REPLACE INTO settings (key, value) VALUES (?, ?);");
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE;
}

bool Database::update_resume_data(std::string const &hash,
                                  std::vector<std::uint8_t> const &data)
{
    if (data.empty())
    {
        return false;
    }
    auto *stmt = prepare_cached("INSERT OR REPLACE INTO resume_data "
                                "(info_hash, data, updated_at) "
                                "VALUES (?, ?, ?);");
    if (stmt == nullptr)
    {
        return false;
    }
    auto const now = std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::now());
    sqlite3_bind_text(stmt, 1, hash.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 2, data.data(), static_cast<int>(data.size()),
                      SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(now));
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE;
}

std::optional<std::vector<std::uint8_t>>
Database::resume_data(std::string const &hash) const
{
    auto *stmt = prepare_cached(
        "SELECT data FROM resume_data WHERE info_hash = ? LIMIT 1;");
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, hash.c_str(), -1, SQLITE_TRANSIENT);
    std::optional<std::vector<std::uint8_t>> result;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        result = copy_column_blob(stmt, 0);
    }
    finish(stmt);
    return result;
}

bool Database::delete_resume_data(std::string const &hash)
{
    auto *stmt = prepare_cached("DELETE FROM resume_data WHERE info_hash = ?;");
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_text(stmt, 1, hash.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    finish(stmt);
    return rc == SQLITE_DONE;
}

bool Database::replace_torrent_list(std::vector<TorrentListRow> const &rows)
{
    if (!begin_transaction())
    {
        return false;
    }
    if (!execute("DELETE FROM torrent_list;"))
    {
        rollback_transaction();
        return false;
    }
    auto *stmt = prepare_cached("INSERT OR REPLACE INTO torrent_list "
                                "(position, info_hash, save_path, name, "
                                "trackers) VALUES (?, ?, ?, ?, ?);");
    if (stmt == nullptr)
    {
        rollback_transaction();
        return false;
    }
    int position = 0;
    for (auto const &row : rows)
    {
        sqlite3_bind_int(stmt, 1, position++);
        sqlite3_bind_text(stmt, 2, row.hash.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, row.save_path.c_str(), -1,
                          SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, row.name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 5, row.trackers_json.c_str(), -1,
                          SQLITE_TRANSIENT);
        int rc = sqlite3_step(stmt);
        finish(stmt);
        if (rc != SQLITE_DONE)
        {
            TM_LOG_WARN("failed to store torrent list entry {}: {}", row.hash,
                        sqlite3_errmsg(db_));
            rollback_transaction();
            return false;
        }
    }
    return commit_transaction();
}

std::optional<std::vector<TorrentListRow>> Database::load_torrent_list() const
{
    auto *stmt = prepare_cached("SELECT info_hash, save_path, name, trackers "
                                "FROM torrent_list ORDER BY position;");
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    std::vector<TorrentListRow> result;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
    {
        TorrentListRow row;
        row.hash = column_text(stmt, 0);
        row.save_path = column_text(stmt, 1);
        row.name = column_text(stmt, 2);
        row.trackers_json = column_text(stmt, 3);
        if (!row.hash.empty())
        {
            result.push_back(std::move(row));
        }
    }
    finish(stmt);
    if (rc != SQLITE_DONE)
    {
        TM_LOG_WARN("failed to read torrent list: {}", sqlite3_errmsg(db_));
        return std::nullopt;
    }
    return result;
}

} // namespace tmax::storage
