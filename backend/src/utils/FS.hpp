#pragma once

#include <filesystem>
#include <optional>

namespace tmax::utils
{

std::filesystem::path data_root();
std::filesystem::path default_download_dir();
std::optional<std::filesystem::path> executable_path();
std::optional<std::filesystem::path>
ensure_directory(std::filesystem::path const &candidate);

} // namespace tmax::utils
