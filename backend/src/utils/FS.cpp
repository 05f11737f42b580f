#include "utils/FS.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <system_error>
#include <vector>

#if defined(__APPLE__)
#include <mach-o/dyld.h>
#else
#include <unistd.h>
#endif

namespace tmax::utils
{

namespace
{
std::optional<std::filesystem::path> env_path(char const *key)
{
    auto value = std::getenv(key);
    if (value == nullptr || *value == '\0')
    {
        return std::nullopt;
    }
    return std::filesystem::path(value);
}

std::filesystem::path fallback_root()
{
    if (auto exe = executable_path(); exe && !exe->filename().empty())
    {
        return exe->parent_path();
    }
    return std::filesystem::current_path();
}
} // namespace

std::optional<std::filesystem::path>
ensure_directory(std::filesystem::path const &candidate)
{
    std::error_code ec;
    std::filesystem::create_directories(candidate, ec);
    if (!ec || std::filesystem::exists(candidate, ec))
    {
        return candidate;
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> executable_path()
{
#if defined(__APPLE__)
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    if (size == 0)
    {
        return std::nullopt;
    }
    std::vector<char> buffer(size);
    if (_NSGetExecutablePath(buffer.data(), &size) != 0)
    {
        return std::nullopt;
    }
    return std::filesystem::path(buffer.data());
#else
    std::vector<char> buffer(4096);
    while (true)
    {
        ssize_t length =
            readlink("/proc/self/exe", buffer.data(), buffer.size());
        if (length == -1)
        {
            return std::nullopt;
        }
        if (static_cast<std::size_t>(length) < buffer.size())
        {
            return std::filesystem::path(buffer.data(), buffer.data() + length);
        }
        buffer.resize(buffer.size() * 2);
    }
#endif
}

std::filesystem::path data_root()
{
    // TORRENTMAX_HOME wins, then the XDG data directory, then ~/.local/share.
    std::optional<std::filesystem::path> root = env_path("TORRENTMAX_HOME");
    if (!root)
    {
        if (auto xdg = env_path("XDG_DATA_HOME"))
        {
            root = *xdg / "TorrentMax";
        }
        else if (auto home = env_path("HOME"))
        {
            root = *home / ".local" / "share" / "TorrentMax";
        }
    }
    if (root)
    {
        if (auto ensured = ensure_directory(*root))
        {
            return *ensured;
        }
    }
    auto fallback = fallback_root() / "data";
    if (auto ensured = ensure_directory(fallback))
    {
        return *ensured;
    }
    return fallback;
}

std::filesystem::path default_download_dir()
{
    if (auto home = env_path("HOME"))
    {
        return *home / "Downloads";
    }
    return data_root() / "downloads";
}

} // namespace tmax::utils
