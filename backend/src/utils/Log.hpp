#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <exception>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace rt::log
{

// Defined in Log.cpp. Throws std::ios_base::failure when the file cannot be
// written.
void append_log_line_to_file(std::string const &line);

// Redirects the log file. Until called, lines go to reeltorrent.log under the
// data root.
void set_log_file(std::filesystem::path path);

// RT_ENABLE_LOGGING=1 forces logging on even in minimal builds.
#if !defined(RT_BUILD_MINIMAL) ||                                             \
    (defined(RT_ENABLE_LOGGING) && (RT_ENABLE_LOGGING))
template <typename... Args>
inline void write_line(char level, std::string_view fmt, Args &&...args)
{
    auto const now = std::chrono::system_clock::now();
    auto const millis = static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch())
            .count() %
        1000);
    auto const time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    char time_buffer[16]{};
    std::strftime(time_buffer, sizeof(time_buffer), "%H:%M:%S", &tm);

    auto const message = std::vformat(fmt, std::make_format_args(args...));
    char millis_buf[8] = {};
    std::snprintf(millis_buf, sizeof(millis_buf), "%03lld", millis);
    std::string line;
    line.reserve(32 + message.size());
    line.push_back('[');
    line.push_back(level);
    line.push_back(' ');
    line.append(time_buffer);
    line.push_back('.');
    line.append(millis_buf);
    line.append("] ");
    line.append(message);
    if (stderr)
    {
        std::fprintf(stderr, "%s\n", line.c_str());
        std::fflush(stderr);
    }
    try
    {
        append_log_line_to_file(line);
    }
    catch (std::exception const &ex)
    {
        if (stderr)
        {
            std::fprintf(stderr, "log file unavailable: %s\n", ex.what());
        }
    }
}
#else
template <typename... Args>
inline void write_line(char, std::string_view, Args &&...) noexcept
{
}
#endif

template <typename... Args>
inline void print_status(std::string_view fmt, Args &&...args)
{
    auto const message = std::vformat(fmt, std::make_format_args(args...));
    std::fputs(message.c_str(), stdout);
    std::fputc('\n', stdout);
    std::fflush(stdout);
}

} // namespace rt::log

#define RT_LOG_INFO(fmt, ...) rt::log::write_line('I', fmt, ##__VA_ARGS__)
#define RT_LOG_DEBUG(fmt, ...) rt::log::write_line('D', fmt, ##__VA_ARGS__)
#define RT_LOG_WARN(fmt, ...) rt::log::write_line('W', fmt, ##__VA_ARGS__)
#define RT_LOG_ERROR(fmt, ...) rt::log::write_line('E', fmt, ##__VA_ARGS__)
