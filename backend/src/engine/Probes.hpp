#pragma once

#include <filesystem>
#include <optional>

namespace tmax::engine
{

enum class ConnectionType
{
    Unknown,
    Wifi,
    Lan,
};

class NetworkClassifier
{
  public:
    virtual ~NetworkClassifier() = default;

    virtual ConnectionType connection_type() = 0;
    virtual bool is_vpn_active() = 0;
};

class ResourceProbe
{
  public:
    virtual ~ResourceProbe() = default;

    // Percent of the volume holding path that is in use.
    virtual std::optional<double>
    disk_usage_percent(std::filesystem::path const &path) = 0;
    // Percent of CPU time spent busy since the previous call.
    virtual std::optional<double> cpu_percent() = 0;
};

} // namespace tmax::engine
