#include "engine/ConfigurationService.hpp"

#include "engine/PersistenceManager.hpp"
#include "utils/Log.hpp"

#include <mutex>
#include <utility>

namespace tmax::engine
{

ConfigurationService::ConfigurationService(PersistenceManager *persistence,
                                           EngineSettings defaults)
    : persistence_(persistence), settings_(std::move(defaults))
{
}

EngineSettings ConfigurationService::get() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return settings_;
}

void ConfigurationService::load()
{
    if (!persistence_ || !persistence_->is_valid())
        return;

    auto loaded = persistence_->load_settings(get());
    std::unique_lock<std::shared_mutex> lock(mutex_);
    settings_ = std::move(loaded);
}

void ConfigurationService::set_download_path(std::filesystem::path const &path)
{
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (settings_.download_path == path)
            return;
        settings_.download_path = path;
    }
    mark_dirty();
}

void ConfigurationService::set_listen_port(int port)
{
    if (port <= 0 || port > 65535)
    {
        TM_LOG_WARN("ignoring invalid listen port {}", port);
        return;
    }
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (settings_.listen_port == port)
            return;
        settings_.listen_port = port;
    }
    mark_dirty();
}

void ConfigurationService::set_rate_limits(std::optional<int> download,
                                           std::optional<int> upload)
{
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (download)
            settings_.max_download_rate = *download < 0 ? 0 : *download;
        if (upload)
            settings_.max_upload_rate = *upload < 0 ? 0 : *upload;
    }
    mark_dirty();
}

void ConfigurationService::set_manual_profile(std::string const &name)
{
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (settings_.manual_profile == name)
            return;
        settings_.manual_profile = name;
    }
    mark_dirty();
}

void ConfigurationService::set_auto_profile(bool enabled)
{
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (settings_.auto_profile == enabled)
            return;
        settings_.auto_profile = enabled;
    }
    mark_dirty();
}

SettingsMap ConfigurationService::rate_limit_settings() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    SettingsMap limits;
    if (settings_.max_download_rate > 0)
        limits["download_rate_limit"] = settings_.max_download_rate;
    if (settings_.max_upload_rate > 0)
        limits["upload_rate_limit"] = settings_.max_upload_rate;
    return limits;
}

bool ConfigurationService::is_dirty() const noexcept
{
    return dirty_.load(std::memory_order_acquire);
}

void ConfigurationService::mark_dirty()
{
    dirty_.store(true, std::memory_order_release);
}

void ConfigurationService::persist_if_dirty()
{
    if (!dirty_.load(std::memory_order_acquire))
        return;
    persist_now();
}

void ConfigurationService::persist_now()
{
    if (!persistence_)
        return;

    EngineSettings copy = get();
    if (persistence_->persist_settings(copy))
    {
        dirty_.store(false, std::memory_order_release);
    }
    else
    {
        TM_LOG_WARN("failed to persist settings");
    }
}

} // namespace tmax::engine
