#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tmax::engine
{
class ConfigurationService;
}

namespace tmax::app
{

struct DaemonOptions
{
    std::filesystem::path state_dir;
    std::filesystem::path download_dir;
    std::optional<int> listen_port;
    // "wifi", "lan", "vpn" or "auto".
    std::optional<std::string> profile;
    // Bytes per second, 0 = unlimited.
    std::optional<int> max_download_rate;
    std::optional<int> max_upload_rate;
    int run_seconds = 0;
    std::vector<std::string> sources;
    bool show_help = false;
};

// Accepts both "--flag value" and "--flag=value". Returns nullopt and
// fills error on malformed input.
std::optional<DaemonOptions> parse_arguments(std::vector<std::string> const &args,
                                             std::string &error);

// Command-line values win over persisted ones; the caller persists them.
void apply_overrides(DaemonOptions const &options,
                     tmax::engine::ConfigurationService &config);

// Runs the headless TorrentMax daemon until SIGINT/SIGTERM or --run-seconds.
int daemon_main(int argc, char *argv[]);

} // namespace tmax::app
