#include "utils/SystemProbe.hpp"

#include "utils/Log.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>

#if defined(__linux__) || defined(__APPLE__)
#include <ifaddrs.h>
#include <net/if.h>
#include <sys/statvfs.h>
#endif

namespace tmax::sys
{

namespace
{

std::string to_lower(std::string_view value)
{
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    return result;
}

bool starts_with(std::string_view value, std::string_view prefix)
{
    return value.substr(0, prefix.size()) == prefix;
}

bool is_loopback_name(std::string_view lower)
{
    return lower == "lo" || lower.find("loopback") != std::string_view::npos;
}

} // namespace

std::vector<std::string_view> const &vpn_interface_keywords()
{
    static std::vector<std::string_view> const kKeywords = {
        "tap",     "tun",       "vpn",     "nordlynx", "wireguard",
        "wg",      "proton",    "mullvad", "openvpn",  "amnezia",
        "awg",     "cloudflare", "warp",   "zerotier", "tailscale",
    };
    return kKeywords;
}

bool is_vpn_interface_name(std::string_view name)
{
    auto lower = to_lower(name);
    for (auto keyword : vpn_interface_keywords())
    {
        if (lower.find(keyword) != std::string::npos)
        {
            return true;
        }
    }
    return false;
}

tmax::engine::ConnectionType classify_interface_name(std::string_view name)
{
    using tmax::engine::ConnectionType;
    auto lower = to_lower(name);
    if (is_loopback_name(lower))
    {
        return ConnectionType::Unknown;
    }
    if (lower.find("wi-fi") != std::string::npos ||
        lower.find("wifi") != std::string::npos ||
        lower.find("wlan") != std::string::npos ||
        lower.find("wireless") != std::string::npos || starts_with(lower, "wl"))
    {
        return ConnectionType::Wifi;
    }
    if (lower.find("ethernet") != std::string::npos ||
        lower.find("eth") != std::string::npos || starts_with(lower, "en"))
    {
        return ConnectionType::Lan;
    }
    return ConnectionType::Unknown;
}

std::optional<CpuTimes> parse_proc_stat(std::string_view contents)
{
    auto end = contents.find('\n');
    auto line = contents.substr(0, end);
    if (!starts_with(line, "cpu ") && !starts_with(line, "cpu\t"))
    {
        return std::nullopt;
    }
    std::istringstream input{std::string(line.substr(3))};
    // user nice system idle iowait irq softirq steal
    std::uint64_t values[8] = {};
    int count = 0;
    while (count < 8 && input >> values[count])
    {
        ++count;
    }
    if (count < 4)
    {
        return std::nullopt;
    }
    CpuTimes times;
    for (int i = 0; i < count; ++i)
    {
        times.total += values[i];
    }
    std::uint64_t idle = values[3] + (count > 4 ? values[4] : 0);
    times.busy = times.total - idle;
    return times;
}

std::vector<std::string> SystemProbe::active_interfaces() const
{
    std::vector<std::string> names;
#if defined(__linux__) || defined(__APPLE__)
    ifaddrs *list = nullptr;
    if (getifaddrs(&list) != 0)
    {
        TM_LOG_WARN("getifaddrs failed: {}", std::strerror(errno));
        return names;
    }
    for (auto *entry = list; entry != nullptr; entry = entry->ifa_next)
    {
        if (entry->ifa_name == nullptr || (entry->ifa_flags & IFF_UP) == 0 ||
            (entry->ifa_flags & IFF_LOOPBACK) != 0)
        {
            continue;
        }
        std::string name(entry->ifa_name);
        if (std::find(names.begin(), names.end(), name) == names.end())
        {
            names.push_back(std::move(name));
        }
    }
    freeifaddrs(list);
#endif
    return names;
}

tmax::engine::ConnectionType SystemProbe::connection_type()
{
    using tmax::engine::ConnectionType;
    auto names = active_interfaces();
    if (names.empty())
    {
        return ConnectionType::Unknown;
    }
    for (auto const &name : names)
    {
        auto type = classify_interface_name(name);
        if (type != ConnectionType::Unknown)
        {
            return type;
        }
    }
    // Something is up but unnamed; treat it as wired.
    return ConnectionType::Lan;
}

bool SystemProbe::is_vpn_active()
{
    auto names = active_interfaces();
    return std::any_of(names.begin(), names.end(), [](std::string const &name)
                       { return is_vpn_interface_name(name); });
}

std::optional<double>
SystemProbe::disk_usage_percent(std::filesystem::path const &path)
{
#if defined(__linux__) || defined(__APPLE__)
    std::error_code ec;
    auto probe = path;
    while (!probe.empty() && !std::filesystem::exists(probe, ec))
    {
        auto parent = probe.parent_path();
        if (parent == probe)
            break;
        probe = parent;
    }
    if (probe.empty())
    {
        probe = std::filesystem::current_path(ec);
    }
    struct statvfs info{};
    if (statvfs(probe.c_str(), &info) != 0)
    {
        TM_LOG_DEBUG("statvfs({}) failed: {}", probe.string(),
                     std::strerror(errno));
        return std::nullopt;
    }
    auto const total = static_cast<double>(info.f_blocks) * info.f_frsize;
    auto const available = static_cast<double>(info.f_bavail) * info.f_frsize;
    if (total <= 0.0)
    {
        return std::nullopt;
    }
    return (total - available) / total * 100.0;
#else
    (void)path;
    return std::nullopt;
#endif
}

std::optional<double> SystemProbe::cpu_percent()
{
    std::ifstream input("/proc/stat");
    if (!input)
    {
        return std::nullopt;
    }
    std::string line;
    std::getline(input, line);
    auto current = parse_proc_stat(line);
    if (!current)
    {
        return std::nullopt;
    }
    auto previous = std::exchange(last_cpu_, current);
    if (!previous || current->total <= previous->total)
    {
        return std::nullopt;
    }
    auto const total = static_cast<double>(current->total - previous->total);
    auto const busy = static_cast<double>(current->busy - previous->busy);
    return busy / total * 100.0;
}

} // namespace tmax::sys
