#pragma once

#include "engine/Types.hpp"

#include <optional>
#include <string>

#include <libtorrent/settings_pack.hpp>

namespace tmax::engine
{

class SettingsManager
{
  public:
    // Session defaults: all alerts, DHT/LSD/UPnP/NAT-PMP on, dual-stack
    // listen interfaces on listen_port.
    static libtorrent::settings_pack build_settings_pack(int listen_port);

    // Converts name/value overrides into a pack. Unknown names and values
    // of the wrong type are skipped with a warning.
    static libtorrent::settings_pack to_settings_pack(SettingsMap const &map);

    static std::optional<SettingValue>
    read_setting(libtorrent::settings_pack const &pack,
                 std::string const &name);

    static std::string listen_interfaces(int listen_port);
};

} // namespace tmax::engine
