#pragma once

#include "engine/TransferEngine.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

#include <mongoose.h>

namespace rt::stream
{

enum class RangeKind
{
    Whole,
    Partial,
    Unsatisfiable,
};

struct RangeRequest
{
    RangeKind kind = RangeKind::Whole;
    // Inclusive bounds; meaningless for Unsatisfiable or an empty file.
    std::uint64_t first = 0;
    std::uint64_t last = 0;

    std::uint64_t length() const noexcept
    {
        return kind == RangeKind::Unsatisfiable ? 0 : last - first + 1;
    }
};

// Interprets a Range header for a file of the given size. Only the first
// range of a multi-range request is honored; syntactically invalid headers
// are ignored and yield the whole file.
RangeRequest parse_range_header(std::optional<std::string_view> header,
                                std::uint64_t size);
std::string_view content_type_for(std::string_view path);

// Local HTTP server exposing transfer files for progressive playback. Each
// published endpoint gets an unguessable path; bytes are pulled lazily from
// the transfer as the client's socket drains.
class StreamServer final : public engine::StreamPublisher
{
  public:
    explicit StreamServer(std::string bind_url = "http://127.0.0.1:0");
    ~StreamServer() override;

    StreamServer(StreamServer const &) = delete;
    StreamServer &operator=(StreamServer const &) = delete;

    bool start();
    void stop();
    bool is_running() const noexcept;
    std::uint16_t port() const noexcept;

    std::shared_ptr<engine::StreamEndpoint>
    publish(std::shared_ptr<engine::TransferHandle> handle,
            engine::EngineFile const &file) override;
    void revoke(std::string const &transfer_id) override;
    std::size_t endpoint_count() const;

  private:
    struct Route
    {
        std::string transfer_id;
        std::shared_ptr<engine::TransferHandle> handle;
        engine::EngineFile file;
    };

    struct Registry
    {
        mutable std::mutex mutex;
        std::unordered_map<std::string, Route> routes;
    };

    struct ActiveStream
    {
        std::string path;
        std::shared_ptr<engine::TransferHandle> handle;
        int file_index = 0;
        std::uint64_t next = 0;
        std::uint64_t end = 0;
        bool waiting = false;
        // Set when a pipelined request arrives mid-body.
        bool close_when_done = false;
    };

    class Endpoint;

    static void handle_event(struct mg_connection *conn, int ev,
                             void *ev_data);
    void handle_http_message(struct mg_connection *conn,
                             struct mg_http_message *hm);
    void pump_stream(struct mg_connection *conn);
    void run_loop();
    std::string next_token();

    std::string bind_url_;
    std::string host_;
    std::atomic<std::uint16_t> port_{0};
    struct mg_mgr mgr_{};
    struct mg_connection *listener_ = nullptr;
    std::atomic_bool running_{false};
    std::atomic_bool destroying_{false};
    std::thread worker_;
    std::shared_ptr<Registry> registry_;
    // Worker thread only.
    std::unordered_map<unsigned long, ActiveStream> streams_;
    std::vector<char> buffer_;
    std::mutex token_mutex_;
    std::mt19937_64 token_rng_;
};

} // namespace rt::stream
