#pragma once

#include <filesystem>
#include <optional>

namespace rt::utils
{

// Per-user state directory, created on first use. Honors RT_DATA_DIR, then
// XDG_DATA_HOME, then ~/.local/share; falls back to <exe dir>/data.
std::filesystem::path data_root();
std::optional<std::filesystem::path> executable_path();
std::optional<std::filesystem::path> ensure_directory(
    std::filesystem::path const &candidate);

} // namespace rt::utils
