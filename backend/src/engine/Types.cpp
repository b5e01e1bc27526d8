#include "engine/Types.hpp"

#include <format>

namespace rt::engine
{

std::string_view to_string(TransferStatus status) noexcept
{
    switch (status)
    {
        case TransferStatus::Metadata:
            return "metadata";
        case TransferStatus::Downloading:
            return "downloading";
        case TransferStatus::Seeding:
            return "seeding";
        case TransferStatus::Done:
            return "done";
        case TransferStatus::Paused:
            return "paused";
        case TransferStatus::Stalled:
            return "stalled";
        case TransferStatus::NoPeers:
            return "no_peers";
        case TransferStatus::Error:
            return "error";
    }
    return "unknown";
}

std::string_view to_string(HistoryStatus status) noexcept
{
    switch (status)
    {
        case HistoryStatus::Active:
            return "active";
        case HistoryStatus::Paused:
            return "paused";
        case HistoryStatus::Completed:
            return "completed";
        case HistoryStatus::Failed:
            return "failed";
        case HistoryStatus::Removed:
            return "removed";
        case HistoryStatus::Error:
            return "error";
        case HistoryStatus::Stalled:
            return "stalled";
    }
    return "unknown";
}

std::string_view to_string(ResultCode code) noexcept
{
    switch (code)
    {
        case ResultCode::Ok:
            return "ok";
        case ResultCode::InvalidLocator:
            return "invalid locator";
        case ResultCode::EngineUnavailable:
            return "engine unavailable";
        case ResultCode::NotReady:
            return "not ready";
    }
    return "unknown";
}

std::optional<HistoryStatus> parse_history_status(std::string_view value)
{
    static constexpr HistoryStatus kAll[] = {
        HistoryStatus::Active,  HistoryStatus::Paused,
        HistoryStatus::Completed, HistoryStatus::Failed,
        HistoryStatus::Removed, HistoryStatus::Error,
        HistoryStatus::Stalled,
    };
    for (auto status : kAll)
    {
        if (to_string(status) == value)
        {
            return status;
        }
    }
    return std::nullopt;
}

std::string StreamLocator::url() const
{
    return std::format("http://{}:{}{}", host, port, path);
}

std::int64_t to_unix_millis(TimePoint value) noexcept
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               value.time_since_epoch())
        .count();
}

TimePoint from_unix_millis(std::int64_t millis) noexcept
{
    return TimePoint(std::chrono::duration_cast<Clock::duration>(
        std::chrono::milliseconds(millis)));
}

} // namespace rt::engine
