#include "utils/FS.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace rt::utils
{

namespace
{
std::optional<std::filesystem::path> env_path(char const *name)
{
    auto const *value = std::getenv(name);
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
        return exe->parent_path() / "data";
    }
    return std::filesystem::current_path() / "data";
}
} // namespace

std::optional<std::filesystem::path> ensure_directory(
    std::filesystem::path const &candidate)
{
    std::error_code ec;
    std::filesystem::create_directories(candidate, ec);
    if (!ec || std::filesystem::is_directory(candidate, ec))
    {
        return candidate;
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> executable_path()
{
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
}

std::filesystem::path data_root()
{
    std::vector<std::filesystem::path> candidates;
    if (auto explicit_root = env_path("RT_DATA_DIR"))
    {
        candidates.push_back(*explicit_root);
    }
    if (auto xdg = env_path("XDG_DATA_HOME"))
    {
        candidates.push_back(*xdg / "reeltorrent");
    }
    if (auto home = env_path("HOME"))
    {
        candidates.push_back(*home / ".local" / "share" / "reeltorrent");
    }
    candidates.push_back(fallback_root());
    for (auto const &candidate : candidates)
    {
        if (auto ensured = ensure_directory(candidate))
        {
            return *ensured;
        }
    }
    return std::filesystem::current_path();
}

} // namespace rt::utils
