#include "utils/Log.hpp"
#include "utils/FS.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>

namespace rt::log
{

namespace
{
std::mutex g_mutex;
std::ofstream g_stream;
std::optional<std::filesystem::path> g_path;
bool g_failed = false;
} // namespace

void set_log_file(std::filesystem::path path)
{
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_stream.is_open())
    {
        g_stream.close();
    }
    g_path = std::move(path);
    g_failed = false;
}

void append_log_line_to_file(std::string const &line)
{
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_failed)
    {
        return;
    }
    if (!g_path)
    {
        g_path = rt::utils::data_root() / "reeltorrent.log";
    }
    if (!g_stream.is_open())
    {
        g_stream.open(*g_path, std::ios::app | std::ios::out);
        if (!g_stream.is_open())
        {
            // Report once, then keep logging to stderr only.
            g_failed = true;
            throw std::ios_base::failure("cannot open " + g_path->string());
        }
    }
    g_stream << line << '\n';
    g_stream.flush();
}

} // namespace rt::log
