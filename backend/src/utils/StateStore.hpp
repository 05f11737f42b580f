#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <sqlite3.h>

namespace tmax::storage {

// One row of the persisted torrent list. Trackers are kept as a JSON array.
struct TorrentListRow {
  std::string hash;
  std::string save_path;
  std::string name;
  std::string trackers_json;
};

class Database {
public:
  explicit Database(std::filesystem::path path);
  ~Database();

  Database(Database const &) = delete;
  Database &operator=(Database const &) = delete;

  bool is_valid() const noexcept { return db_ != nullptr; }
  std::filesystem::path const &path() const noexcept { return path_; }

  std::optional<std::string> get_setting(std::string const &key) const;
  bool set_setting(std::string const &key, std::string const &value);
  bool begin_transaction() const;
  bool commit_transaction() const;
  bool rollback_transaction() const;

  bool update_resume_data(std::string const &hash,
                          std::vector<std::uint8_t> const &data);
  std::optional<std::vector<std::uint8_t>>
  resume_data(std::string const &hash) const;
  bool delete_resume_data(std::string const &hash);

  // Replaces the whole list atomically; row order is preserved.
  bool replace_torrent_list(std::vector<TorrentListRow> const &rows);
  std::optional<std::vector<TorrentListRow>> load_torrent_list() const;

private:
  bool ensure_schema();
  bool run_migrations();
  bool ensure_schema_version_row() const;
  std::optional<int> schema_version() const;
  bool set_schema_version(int version) const;
  bool apply_migration_v1() const;
  bool execute(std::string const &sql) const;
  sqlite3_stmt *prepare_cached(std::string const &sql) const;

  std::filesystem::path path_;
  sqlite3 *db_ = nullptr;
  mutable std::unordered_map<std::string, sqlite3_stmt *> stmt_cache_;
};

} // namespace tmax::storage
