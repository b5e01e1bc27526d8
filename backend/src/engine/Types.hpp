#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rt::engine
{

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class TransferStatus
{
    Metadata,
    Downloading,
    Seeding,
    Done,
    Paused,
    Stalled,
    NoPeers,
    Error,
};

enum class HistoryStatus
{
    Active,
    Paused,
    Completed,
    Failed,
    Removed,
    Error,
    Stalled,
};

// Outcome of a manager operation that can be rejected.
enum class ResultCode
{
    Ok,
    InvalidLocator,
    EngineUnavailable,
    NotReady,
};

std::string_view to_string(TransferStatus status) noexcept;
std::string_view to_string(HistoryStatus status) noexcept;
std::string_view to_string(ResultCode code) noexcept;
std::optional<HistoryStatus> parse_history_status(std::string_view value);

// Raw per-transfer readings from the engine, valid at the time of the call.
struct EngineCounters
{
    bool ready = false;
    bool done = false;
    bool paused = false;
    std::uint64_t bytes_downloaded = 0;
    std::uint64_t bytes_uploaded = 0;
    std::optional<std::uint64_t> total_bytes;
    std::uint64_t download_rate = 0;
    std::uint64_t upload_rate = 0;
    int peer_count = 0;
    std::optional<std::int64_t> eta_seconds;
    double progress = 0.0;
    std::string name;
    std::optional<std::string> error;
};

struct EngineFile
{
    int index = 0;
    std::string path;
    std::uint64_t length = 0;
};

struct Transfer
{
    std::string id;
    std::optional<std::string> display_name;
    std::optional<std::string> external_id;
    std::string name;
    std::string content_locator;
    TimePoint added_at{};
    std::uint64_t bytes_downloaded = 0;
    std::uint64_t bytes_uploaded = 0;
    std::optional<std::uint64_t> total_bytes;
    std::uint64_t download_rate = 0;
    std::uint64_t upload_rate = 0;
    int peer_count = 0;
    double progress = 0.0;
    std::optional<std::int64_t> eta_seconds;
    TimePoint last_progress_at{};
    bool paused = false;
    TransferStatus status = TransferStatus::Metadata;
    std::optional<std::string> degraded_reason;
    std::optional<std::string> last_error;
};

struct HistoryRecord
{
    std::string id;
    std::string content_locator;
    std::string display_name;
    std::optional<std::string> external_id;
    TimePoint added_at{};
    std::optional<TimePoint> completed_at;
    std::optional<std::uint64_t> size_bytes;
    HistoryStatus status = HistoryStatus::Active;
    std::optional<std::string> last_error;
};

struct ClassifierPolicy
{
    std::chrono::milliseconds stall_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds no_peers_timeout{std::chrono::seconds(60)};
};

struct ManagerSettings
{
    std::chrono::milliseconds poll_interval{1000};
    ClassifierPolicy policy{};
    std::chrono::milliseconds engine_start_timeout{5000};
    std::chrono::milliseconds operation_timeout{10000};
};

struct EngineSettings
{
    std::string download_path;
    std::string listen_interface = "0.0.0.0:6881";
    bool dht_enabled = true;
    bool lsd_enabled = true;
};

struct AddResult
{
    ResultCode code = ResultCode::Ok;
    std::optional<Transfer> transfer;
    std::string message;

    bool ok() const noexcept { return code == ResultCode::Ok; }
};

struct StreamLocator
{
    std::string host;
    std::uint16_t port = 0;
    std::string path;

    std::string url() const;
};

// Keeps a published stream reachable. The server stops serving the path once
// the last reference is released.
class StreamEndpoint
{
  public:
    virtual ~StreamEndpoint() = default;
    virtual StreamLocator const &locator() const noexcept = 0;
};

struct StreamResult
{
    ResultCode code = ResultCode::Ok;
    std::optional<EngineFile> file;
    std::shared_ptr<StreamEndpoint> endpoint;

    bool ok() const noexcept { return code == ResultCode::Ok; }
};

std::int64_t to_unix_millis(TimePoint value) noexcept;
TimePoint from_unix_millis(std::int64_t millis) noexcept;

} // namespace rt::engine
