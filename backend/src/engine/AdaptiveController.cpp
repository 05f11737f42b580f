#include "engine/AdaptiveController.hpp"

#include "engine/TransferEngine.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <map>

namespace tmax::engine
{

namespace
{

constexpr int kMiB = 1024 * 1024;
constexpr int kKiB = 1024;
constexpr int kDefaultConnectionsLimit = 100;
constexpr int kMinConnectionsLimit = 30;

SettingsMap make_profile(int connections, int out_request_queue,
                         int send_watermark, int send_low_watermark,
                         int socket_buffer, int request_queue_time,
                         int whole_pieces_threshold, int cache_size,
                         int active_transfers)
{
    return SettingsMap{
        {"connections_limit", connections},
        {"max_out_request_queue", out_request_queue},
        {"send_buffer_watermark", send_watermark},
        {"send_buffer_low_watermark", send_low_watermark},
        {"recv_socket_buffer_size", socket_buffer},
        {"send_socket_buffer_size", socket_buffer},
        {"request_queue_time", request_queue_time},
        {"whole_pieces_threshold", whole_pieces_threshold},
        {"cache_size", cache_size},
        {"active_downloads", active_transfers},
        {"active_seeds", active_transfers},
    };
}

std::map<std::string, SettingsMap> const &profiles()
{
    static std::map<std::string, SettingsMap> const kProfiles = {
        // Shared medium: fewer connections, small buffers.
        {kProfileWifi, make_profile(100, 500, 3 * kMiB, 512 * kKiB, kMiB, 3,
                                    20, 1024, 3)},
        {kProfileLan, make_profile(300, 1500, 16 * kMiB, 4 * kMiB, 4 * kMiB,
                                   3, 5, 4096, 5)},
        // Tunnels add latency, so requests are queued for longer.
        {kProfileVpn, make_profile(150, 1000, 8 * kMiB, 2 * kMiB, 2 * kMiB, 4,
                                   10, 2048, 3)},
    };
    return kProfiles;
}

} // namespace

SettingsMap const *find_profile(std::string const &name)
{
    auto const &table = profiles();
    auto it = table.find(name);
    return it == table.end() ? nullptr : &it->second;
}

AdaptiveController::AdaptiveController(TransferEngine &engine,
                                       NetworkClassifier &network)
    : engine_(engine), network_(network)
{
}

std::string AdaptiveController::detect_and_apply()
{
    if (manual_profile_)
    {
        return *manual_profile_;
    }

    std::string profile = kProfileLan;
    try
    {
        if (network_.is_vpn_active())
        {
            profile = kProfileVpn;
        }
        else if (network_.connection_type() == ConnectionType::Wifi)
        {
            profile = kProfileWifi;
        }
    }
    catch (std::exception const &ex)
    {
        TM_LOG_WARN("network detection failed: {}", ex.what());
    }

    if (profile != current_profile_)
    {
        TM_LOG_INFO("network profile changed: {} -> {}", current_profile_,
                    profile);
        apply_profile(profile);
    }
    return current_profile_;
}

void AdaptiveController::set_manual_profile(std::optional<std::string> name)
{
    if (name && name->empty())
    {
        name.reset();
    }
    manual_profile_ = std::move(name);
    if (manual_profile_)
    {
        TM_LOG_INFO("manual profile set to {}", *manual_profile_);
        apply_profile(*manual_profile_);
    }
    else
    {
        TM_LOG_INFO("manual profile cleared; using automatic detection");
    }
}

bool AdaptiveController::apply_profile(std::string const &name)
{
    auto const *settings = find_profile(name);
    if (settings == nullptr)
    {
        TM_LOG_WARN("unknown profile: {}", name);
        return false;
    }
    engine_.apply_settings(*settings);
    current_profile_ = name;
    TM_LOG_INFO("applied profile: {}", name);
    return true;
}

std::vector<Bottleneck>
AdaptiveController::analyze_bottlenecks(SessionStats const &stats,
                                        double disk_percent, double cpu_percent)
{
    std::vector<Bottleneck> result;

    if (disk_percent > 90.0)
    {
        result.push_back({"disk", std::min(1.0, disk_percent / 100.0),
                          std::format("Disk loaded at {:.0f}%", disk_percent),
                          "Reducing connections to lower disk pressure"});
    }
    else if (disk_percent > 70.0)
    {
        result.push_back({"disk", 0.5,
                          std::format("Disk at {:.0f}%", disk_percent),
                          "Disk usage is elevated, monitoring"});
    }

    if (cpu_percent > 85.0)
    {
        result.push_back({"cpu", std::min(1.0, cpu_percent / 100.0),
                          std::format("CPU at {:.0f}%", cpu_percent),
                          "High CPU, may limit throughput"});
    }

    if (stats.download_rate > 0 && stats.peer_count < 5)
    {
        result.push_back(
            {"peers", 0.7,
             std::format("Only {} peers connected", stats.peer_count),
             "Few peers available, speed limited by swarm"});
    }

    if (stats.peer_count > 10 && stats.download_rate < 10 * 1024)
    {
        result.push_back(
            {"network", 0.6,
             std::format("Low speed ({:.0f} KB/s) with {} peers",
                         static_cast<double>(stats.download_rate) / 1024.0,
                         stats.peer_count),
             "Network may be throttled or peers are slow"});
    }

    return result;
}

void AdaptiveController::apply_dynamic_adjustments(
    std::vector<Bottleneck> const &bottlenecks)
{
    for (auto const &bottleneck : bottlenecks)
    {
        if (bottleneck.category != "disk" || bottleneck.severity <= 0.8)
        {
            continue;
        }
        // Always derived from the table, so repeated ticks do not compound.
        int baseline = kDefaultConnectionsLimit;
        if (auto const *profile = find_profile(current_profile_))
        {
            if (auto it = profile->find("connections_limit");
                it != profile->end())
            {
                if (auto const *value = std::get_if<int>(&it->second))
                {
                    baseline = *value;
                }
            }
        }
        int limit = std::max(kMinConnectionsLimit, baseline / 2);
        engine_.apply_settings({{"connections_limit", limit}});
        TM_LOG_INFO("disk pressure: connections_limit lowered to {}", limit);
    }
}

} // namespace tmax::engine
