#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace tmax::engine
{

// Session settings are addressed by their backend name
// ("connections_limit", "enable_dht", ...).
using SettingValue = std::variant<int, bool, std::string>;
using SettingsMap = std::map<std::string, SettingValue>;

struct SessionStats
{
    std::int64_t download_rate = 0; // bytes/s
    std::int64_t upload_rate = 0;   // bytes/s
    int peer_count = 0;
    int dht_node_count = 0;
};

struct TorrentListEntry
{
    std::string fingerprint;
    std::filesystem::path save_path;
    std::string name;
    std::vector<std::string> trackers;
};

enum class TorrentState
{
    Queued,
    Checking,
    DownloadingMetadata,
    Downloading,
    Seeding,
    Paused,
    Error,
};

// Per-torrent status as reported to callers.
struct TorrentSnapshot
{
    std::string fingerprint;
    std::string name;
    TorrentState state = TorrentState::Queued;
    double progress = 0.0; // 0..1
    std::int64_t download_rate = 0; // bytes/s
    std::int64_t upload_rate = 0;   // bytes/s
    std::int64_t total_size = 0;    // wanted bytes
    std::int64_t total_downloaded = 0;
    std::int64_t total_uploaded = 0;
    int num_peers = 0;
    int num_seeds = 0;
    std::int64_t eta_seconds = -1; // -1 when unknown
    std::filesystem::path save_path;
    std::string error;
};

enum class AddTorrentStatus
{
    Ok,
    NotRunning,
    InvalidSource,
    NotFound,
    BackendRejected,
};

struct EngineSettings
{
    std::filesystem::path state_dir;
    std::filesystem::path download_path;
    int listen_port = 6881;
    int max_download_rate = 0; // bytes/s, 0 = unlimited
    int max_upload_rate = 0;   // bytes/s, 0 = unlimited
    bool auto_profile = true;
    std::string manual_profile;
    std::chrono::milliseconds checkpoint_timeout{8000};
    std::chrono::milliseconds alert_interval{1000};
    std::chrono::milliseconds network_probe_interval{10000};
    std::chrono::milliseconds stats_interval{2000};
};

} // namespace tmax::engine
