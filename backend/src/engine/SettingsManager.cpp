#include "engine/SettingsManager.hpp"

#include "utils/Log.hpp"
#include "utils/Version.hpp"

#include <format>
#include <string>
#include <type_traits>
#include <variant>

#include <libtorrent/alert.hpp>
#include <libtorrent/settings_pack.hpp>

namespace tmax::engine
{

namespace
{

constexpr int kFilePoolSize = 500;

char const *type_label(int type)
{
    switch (type)
    {
    case libtorrent::settings_pack::string_type_base:
        return "string";
    case libtorrent::settings_pack::int_type_base:
        return "int";
    case libtorrent::settings_pack::bool_type_base:
        return "bool";
    default:
        return "unknown";
    }
}

} // namespace

std::string SettingsManager::listen_interfaces(int listen_port)
{
    return std::format("0.0.0.0:{0},[::]:{0}", listen_port);
}

libtorrent::settings_pack SettingsManager::build_settings_pack(int listen_port)
{
    libtorrent::settings_pack pack;
    pack.set_str(libtorrent::settings_pack::user_agent,
                 tmax::version::kUserAgentVersion);
    pack.set_int(libtorrent::settings_pack::alert_mask,
                 libtorrent::alert_category::all);
    pack.set_bool(libtorrent::settings_pack::enable_dht, true);
    pack.set_bool(libtorrent::settings_pack::enable_lsd, true);
    pack.set_bool(libtorrent::settings_pack::enable_upnp, true);
    pack.set_bool(libtorrent::settings_pack::enable_natpmp, true);
    pack.set_str(libtorrent::settings_pack::listen_interfaces,
                 listen_interfaces(listen_port));
    pack.set_int(libtorrent::settings_pack::file_pool_size, kFilePoolSize);
    pack.set_int(libtorrent::settings_pack::alert_queue_size, 8192);
    return pack;
}

libtorrent::settings_pack SettingsManager::to_settings_pack(SettingsMap const &map)
{
    libtorrent::settings_pack pack;
    for (auto const &[name, value] : map)
    {
        int const id = libtorrent::setting_by_name(name);
        if (id < 0)
        {
            TM_LOG_WARN("skipping unknown session setting {}", name);
            continue;
        }
        int const type = id & libtorrent::settings_pack::type_mask;
        bool applied = std::visit(
            [&](auto const &v) -> bool
            {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, int>)
                {
                    if (type != libtorrent::settings_pack::int_type_base)
                        return false;
                    pack.set_int(id, v);
                }
                else if constexpr (std::is_same_v<T, bool>)
                {
                    if (type != libtorrent::settings_pack::bool_type_base)
                        return false;
                    pack.set_bool(id, v);
                }
                else
                {
                    if (type != libtorrent::settings_pack::string_type_base)
                        return false;
                    pack.set_str(id, v);
                }
                return true;
            },
            value);
        if (!applied)
        {
            TM_LOG_WARN("skipping session setting {}: expected {} value", name,
                        type_label(type));
        }
    }
    return pack;
}

std::optional<SettingValue>
SettingsManager::read_setting(libtorrent::settings_pack const &pack,
                              std::string const &name)
{
    int const id = libtorrent::setting_by_name(name);
    if (id < 0)
    {
        return std::nullopt;
    }
    switch (id & libtorrent::settings_pack::type_mask)
    {
    case libtorrent::settings_pack::int_type_base:
        return SettingValue(pack.get_int(id));
    case libtorrent::settings_pack::bool_type_base:
        return SettingValue(pack.get_bool(id));
    case libtorrent::settings_pack::string_type_base:
        return SettingValue(pack.get_str(id));
    default:
        return std::nullopt;
    }
}

} // namespace tmax::engine
