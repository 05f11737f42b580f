#pragma once

#include "engine/Probes.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tmax::sys
{

// Interface-name keywords that indicate an active tunnel.
std::vector<std::string_view> const &vpn_interface_keywords();

bool is_vpn_interface_name(std::string_view name);
tmax::engine::ConnectionType classify_interface_name(std::string_view name);

struct CpuTimes
{
    std::uint64_t busy = 0;
    std::uint64_t total = 0;
};

// Parses the aggregate "cpu" line of /proc/stat.
std::optional<CpuTimes> parse_proc_stat(std::string_view contents);

// Linux realisation of the probes, backed by getifaddrs, statvfs and
// /proc/stat.
class SystemProbe : public tmax::engine::NetworkClassifier,
                    public tmax::engine::ResourceProbe
{
  public:
    tmax::engine::ConnectionType connection_type() override;
    bool is_vpn_active() override;

    std::optional<double>
    disk_usage_percent(std::filesystem::path const &path) override;
    std::optional<double> cpu_percent() override;

  private:
    std::vector<std::string> active_interfaces() const;

    std::optional<CpuTimes> last_cpu_;
};

} // namespace tmax::sys
