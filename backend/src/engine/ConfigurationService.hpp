#pragma once

#include "engine/Types.hpp"

#include <atomic>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>

namespace tmax::engine
{

class PersistenceManager;

class ConfigurationService
{
  public:
    ConfigurationService(PersistenceManager *persistence,
                         EngineSettings defaults);

    EngineSettings get() const;

    // Replaces the current values with whatever the store holds.
    void load();

    void set_download_path(std::filesystem::path const &path);
    void set_listen_port(int port);
    void set_rate_limits(std::optional<int> download,
                         std::optional<int> upload);
    // An empty name returns to automatic detection.
    void set_manual_profile(std::string const &name);
    void set_auto_profile(bool enabled);

    // Session overrides for the configured speed limits.
    SettingsMap rate_limit_settings() const;

    bool is_dirty() const noexcept;
    void persist_if_dirty();
    void persist_now();

  private:
    void mark_dirty();

    PersistenceManager *persistence_;

    mutable std::shared_mutex mutex_;
    EngineSettings settings_;

    std::atomic_bool dirty_{false};
};

} // namespace tmax::engine
