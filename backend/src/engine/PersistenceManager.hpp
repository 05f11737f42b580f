#pragma once

#include "engine/PersistenceStore.hpp"
#include "engine/Types.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tmax::storage
{
class Database;
}

namespace tmax::engine
{

// SQLite-backed PersistenceStore; also owns the settings table used by
// ConfigurationService.
class PersistenceManager : public PersistenceStore
{
  public:
    explicit PersistenceManager(std::filesystem::path path);
    ~PersistenceManager() override;

    PersistenceManager(PersistenceManager const &) = delete;
    PersistenceManager &operator=(PersistenceManager const &) = delete;

    bool is_valid() const noexcept;

    bool write_resume_data(std::string const &fingerprint,
                           std::vector<std::uint8_t> const &data) override;
    std::optional<std::vector<std::uint8_t>>
    read_resume_data(std::string const &fingerprint) override;
    bool remove_resume_data(std::string const &fingerprint) override;

    bool
    write_torrent_list(std::vector<TorrentListEntry> const &entries) override;
    std::optional<std::vector<TorrentListEntry>> read_torrent_list() override;

    // Overlays persisted values onto defaults.
    EngineSettings load_settings(EngineSettings defaults) const;
    bool persist_settings(EngineSettings const &settings);

  private:
    std::unique_ptr<storage::Database> database_;
};

} // namespace tmax::engine
