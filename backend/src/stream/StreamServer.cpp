#include "stream/StreamServer.hpp"

#include "utils/Log.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <format>
#include <span>

namespace rt::stream
{

namespace
{

constexpr std::size_t kChunkSize = 64 * 1024;
constexpr std::size_t kSendHighWater = 512 * 1024;
constexpr std::uint64_t kReadahead = 8ull * 1024 * 1024;
constexpr int kPollIntervalMs = 50;
constexpr std::string_view kStreamPrefix = "/stream/";

std::string_view trim(std::string_view value)
{
    while (!value.empty() &&
           std::isspace(static_cast<unsigned char>(value.front())))
    {
        value.remove_prefix(1);
    }
    while (!value.empty() &&
           std::isspace(static_cast<unsigned char>(value.back())))
    {
        value.remove_suffix(1);
    }
    return value;
}

std::optional<std::uint64_t> parse_number(std::string_view text)
{
    if (text.empty())
    {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    auto const *end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end)
    {
        return std::nullopt;
    }
    return value;
}

std::string_view to_view(struct mg_str const &value)
{
    return std::string_view(value.buf, value.len);
}

std::optional<std::string_view> header_value(struct mg_http_message *hm,
                                             char const *name)
{
    auto *header = mg_http_get_header(hm, name);
    if (header == nullptr)
    {
        return std::nullopt;
    }
    return to_view(*header);
}

char const *status_text(int code)
{
    switch (code)
    {
        case 200:
            return "OK";
        case 206:
            return "Partial Content";
        case 416:
            return "Range Not Satisfiable";
        default:
            return "";
    }
}

std::string host_from_bind_url(std::string const &url)
{
    auto start = url.find("://");
    start = start == std::string::npos ? 0 : start + 3;
    auto end = url.rfind(':');
    if (end == std::string::npos || end < start)
    {
        end = url.size();
    }
    auto host = url.substr(start, end - start);
    if (host.empty() || host == "0.0.0.0")
    {
        return "127.0.0.1";
    }
    return host;
}

} // namespace

RangeRequest parse_range_header(std::optional<std::string_view> header,
                                std::uint64_t size)
{
    RangeRequest whole;
    whole.kind = RangeKind::Whole;
    whole.first = 0;
    whole.last = size > 0 ? size - 1 : 0;
    if (!header)
    {
        return whole;
    }
    auto value = trim(*header);
    constexpr std::string_view kUnit = "bytes=";
    if (value.substr(0, kUnit.size()) != kUnit)
    {
        return whole;
    }
    value.remove_prefix(kUnit.size());
    value = trim(value.substr(0, value.find(',')));
    auto const dash = value.find('-');
    if (dash == std::string_view::npos)
    {
        return whole;
    }
    auto const first_text = trim(value.substr(0, dash));
    auto const last_text = trim(value.substr(dash + 1));

    RangeRequest unsatisfiable;
    unsatisfiable.kind = RangeKind::Unsatisfiable;

    if (first_text.empty())
    {
        auto suffix = parse_number(last_text);
        if (!suffix)
        {
            return whole;
        }
        if (*suffix == 0 || size == 0)
        {
            return unsatisfiable;
        }
        RangeRequest tail;
        tail.kind = RangeKind::Partial;
        tail.first = size - std::min(*suffix, size);
        tail.last = size - 1;
        return tail;
    }
    auto first = parse_number(first_text);
    if (!first)
    {
        return whole;
    }
    std::uint64_t last = size > 0 ? size - 1 : 0;
    if (!last_text.empty())
    {
        auto parsed_last = parse_number(last_text);
        if (!parsed_last || *parsed_last < *first)
        {
            return whole;
        }
        last = std::min(last, *parsed_last);
    }
    if (*first >= size)
    {
        return unsatisfiable;
    }
    RangeRequest partial;
    partial.kind = RangeKind::Partial;
    partial.first = *first;
    partial.last = last;
    return partial;
}

std::string_view content_type_for(std::string_view path)
{
    struct Mapping
    {
        std::string_view extension;
        std::string_view type;
    };
    static constexpr Mapping kTypes[] = {
        {".mp4", "video/mp4"},         {".m4v", "video/mp4"},
        {".mkv", "video/x-matroska"},  {".webm", "video/webm"},
        {".avi", "video/x-msvideo"},   {".mov", "video/quicktime"},
        {".ts", "video/mp2t"},         {".mp3", "audio/mpeg"},
        {".flac", "audio/flac"},       {".srt", "application/x-subrip"},
        {".vtt", "text/vtt"},
    };
    auto const dot = path.rfind('.');
    if (dot != std::string_view::npos)
    {
        std::string extension(path.substr(dot));
        std::transform(extension.begin(), extension.end(), extension.begin(),
                       [](unsigned char ch)
                       { return static_cast<char>(std::tolower(ch)); });
        for (auto const &mapping : kTypes)
        {
            if (mapping.extension == extension)
            {
                return mapping.type;
            }
        }
    }
    return "application/octet-stream";
}

class StreamServer::Endpoint final : public engine::StreamEndpoint
{
  public:
    Endpoint(std::weak_ptr<Registry> registry, engine::StreamLocator locator)
        : registry_(std::move(registry)), locator_(std::move(locator))
    {
    }

    ~Endpoint() override
    {
        if (auto registry = registry_.lock())
        {
            std::lock_guard<std::mutex> lock(registry->mutex);
            registry->routes.erase(locator_.path);
        }
    }

    engine::StreamLocator const &locator() const noexcept override
    {
        return locator_;
    }

  private:
    std::weak_ptr<Registry> registry_;
    engine::StreamLocator locator_;
};

StreamServer::StreamServer(std::string bind_url)
    : bind_url_(std::move(bind_url)), host_(host_from_bind_url(bind_url_)),
      registry_(std::make_shared<Registry>()), buffer_(kChunkSize),
      token_rng_(std::random_device{}())
{
}

StreamServer::~StreamServer()
{
    stop();
}

bool StreamServer::start()
{
    if (running_.load(std::memory_order_acquire))
    {
        return true;
    }
    mg_mgr_init(&mgr_);
    mgr_.userdata = this;
    destroying_.store(false, std::memory_order_release);
    listener_ = mg_http_listen(&mgr_, bind_url_.c_str(),
                               &StreamServer::handle_event, this);
    if (listener_ == nullptr)
    {
        RT_LOG_ERROR("stream server failed to bind {}", bind_url_);
        mg_mgr_free(&mgr_);
        return false;
    }
    port_.store(static_cast<std::uint16_t>(mg_ntohs(listener_->loc.port)),
                std::memory_order_release);
    running_.store(true, std::memory_order_release);
    worker_ = std::thread(&StreamServer::run_loop, this);
    RT_LOG_INFO("stream server listening on {}:{}", host_, port());
    return true;
}

void StreamServer::stop()
{
    if (!running_.exchange(false))
    {
        return;
    }
    if (worker_.joinable())
    {
        worker_.join();
    }
    // Close events fired by mg_mgr_free must not touch streams_.
    destroying_.store(true, std::memory_order_release);
    mg_mgr_free(&mgr_);
    listener_ = nullptr;
    streams_.clear();
    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        registry_->routes.clear();
    }
    port_.store(0, std::memory_order_release);
    RT_LOG_INFO("stream server stopped");
}

bool StreamServer::is_running() const noexcept
{
    return running_.load(std::memory_order_acquire);
}

std::uint16_t StreamServer::port() const noexcept
{
    return port_.load(std::memory_order_acquire);
}

std::size_t StreamServer::endpoint_count() const
{
    std::lock_guard<std::mutex> lock(registry_->mutex);
    return registry_->routes.size();
}

std::string StreamServer::next_token()
{
    std::lock_guard<std::mutex> lock(token_mutex_);
    return std::format("{:016x}{:016x}", token_rng_(), token_rng_());
}

std::shared_ptr<engine::StreamEndpoint>
StreamServer::publish(std::shared_ptr<engine::TransferHandle> handle,
                      engine::EngineFile const &file)
{
    if (!handle || !is_running())
    {
        return nullptr;
    }
    engine::StreamLocator locator;
    locator.host = host_;
    locator.port = port();
    locator.path =
        std::format("{}{}/{}", kStreamPrefix, handle->id(), next_token());
    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        Route route;
        route.transfer_id = handle->id();
        route.handle = std::move(handle);
        route.file = file;
        registry_->routes.emplace(locator.path, std::move(route));
    }
    return std::make_shared<Endpoint>(registry_, std::move(locator));
}

void StreamServer::revoke(std::string const &transfer_id)
{
    std::lock_guard<std::mutex> lock(registry_->mutex);
    std::erase_if(registry_->routes, [&](auto const &item)
                  { return item.second.transfer_id == transfer_id; });
}

void StreamServer::run_loop()
{
    while (running_.load(std::memory_order_acquire))
    {
        mg_mgr_poll(&mgr_, kPollIntervalMs);
    }
}

void StreamServer::handle_event(struct mg_connection *conn, int ev,
                                void *ev_data)
{
    if (conn == nullptr)
    {
        return;
    }
    auto *self = static_cast<StreamServer *>(conn->fn_data);
    if (self == nullptr || self->destroying_.load(std::memory_order_acquire))
    {
        return;
    }
    switch (ev)
    {
        case MG_EV_HTTP_MSG:
            self->handle_http_message(
                conn, static_cast<struct mg_http_message *>(ev_data));
            break;
        case MG_EV_POLL:
        case MG_EV_WRITE:
            self->pump_stream(conn);
            break;
        case MG_EV_CLOSE:
            self->streams_.erase(conn->id);
            break;
        case MG_EV_ERROR:
            RT_LOG_DEBUG("stream connection {} error: {}", conn->id,
                         ev_data != nullptr
                             ? static_cast<char const *>(ev_data)
                             : "");
            break;
        default:
            break;
    }
}

void StreamServer::handle_http_message(struct mg_connection *conn,
                                       struct mg_http_message *hm)
{
    auto const method = to_view(hm->method);
    auto const uri = to_view(hm->uri);
    if (auto active = streams_.find(conn->id); active != streams_.end())
    {
        // One response at a time per connection. The pipelined request is
        // dropped and the connection closes after the current body.
        RT_LOG_DEBUG("connection {} pipelined {} during a body; closing after it",
                     conn->id, std::string(uri));
        active->second.close_when_done = true;
        return;
    }
    bool const head_only = method == "HEAD";
    if (method != "GET" && !head_only)
    {
        mg_http_reply(conn, 405,
                      "Allow: GET, HEAD\r\nContent-Type: text/plain\r\n",
                      "method not allowed");
        return;
    }
    std::optional<Route> route;
    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        auto it = registry_->routes.find(std::string(uri));
        if (it != registry_->routes.end())
        {
            route = it->second;
        }
    }
    if (!route)
    {
        mg_http_reply(conn, 404, "Content-Type: text/plain\r\n", "not found");
        return;
    }

    auto const size = route->file.length;
    auto const content_type = content_type_for(route->file.path);
    auto const range = parse_range_header(header_value(hm, "Range"), size);
    if (range.kind == RangeKind::Unsatisfiable)
    {
        mg_printf(conn,
                  "HTTP/1.1 416 %s\r\n"
                  "Accept-Ranges: bytes\r\n"
                  "Content-Range: bytes */%llu\r\n"
                  "Content-Length: 0\r\n"
                  "\r\n",
                  status_text(416), static_cast<unsigned long long>(size));
        conn->is_resp = 0;
        return;
    }
    int const code = range.kind == RangeKind::Partial ? 206 : 200;
    auto const length = size == 0 ? 0 : range.length();
    std::string content_range;
    if (code == 206)
    {
        content_range = std::format("Content-Range: bytes {}-{}/{}\r\n",
                                    range.first, range.last, size);
    }
    mg_printf(conn,
              "HTTP/1.1 %d %s\r\n"
              "Content-Type: %.*s\r\n"
              "Content-Length: %llu\r\n"
              "Accept-Ranges: bytes\r\n"
              "%s"
              "Cache-Control: no-store\r\n"
              "\r\n",
              code, status_text(code), static_cast<int>(content_type.size()),
              content_type.data(), static_cast<unsigned long long>(length),
              content_range.c_str());
    if (head_only || length == 0)
    {
        conn->is_resp = 0;
        return;
    }

    ActiveStream stream;
    stream.path = std::string(uri);
    stream.handle = route->handle;
    stream.file_index = route->file.index;
    stream.next = range.first;
    stream.end = range.first + length;
    RT_LOG_DEBUG("stream {} bytes {}-{} on connection {}", stream.path,
                 range.first, range.last, conn->id);
    try
    {
        stream.handle->prioritize(stream.file_index, stream.next, kReadahead);
    }
    catch (std::exception const &ex)
    {
        RT_LOG_WARN("stream {} unavailable: {}", stream.path, ex.what());
        conn->is_closing = 1;
        return;
    }
    streams_[conn->id] = std::move(stream);
    pump_stream(conn);
}

void StreamServer::pump_stream(struct mg_connection *conn)
{
    auto it = streams_.find(conn->id);
    if (it == streams_.end() || conn->is_closing)
    {
        return;
    }
    auto &stream = it->second;
    bool route_alive = false;
    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        route_alive = registry_->routes.contains(stream.path);
    }
    if (!route_alive)
    {
        RT_LOG_DEBUG("stream {} revoked; closing connection {}", stream.path,
                     conn->id);
        conn->is_closing = 1;
        streams_.erase(it);
        return;
    }

    while (conn->send.len < kSendHighWater && stream.next < stream.end)
    {
        auto const want = static_cast<std::size_t>(
            std::min<std::uint64_t>(buffer_.size(), stream.end - stream.next));
        std::size_t got = 0;
        try
        {
            got = stream.handle->read(stream.file_index, stream.next,
                                      std::span<char>(buffer_.data(), want));
        }
        catch (std::exception const &ex)
        {
            RT_LOG_WARN("stream {} read failed: {}", stream.path, ex.what());
            conn->is_closing = 1;
            streams_.erase(it);
            return;
        }
        if (got == 0)
        {
            if (!stream.waiting)
            {
                stream.waiting = true;
                try
                {
                    stream.handle->prioritize(stream.file_index, stream.next,
                                              kReadahead);
                }
                catch (std::exception const &ex)
                {
                    RT_LOG_WARN("stream {} prioritize failed: {}", stream.path,
                                ex.what());
                }
            }
            return;
        }
        stream.waiting = false;
        mg_send(conn, buffer_.data(), got);
        stream.next += got;
    }
    if (stream.next >= stream.end)
    {
        // Lets mongoose dispatch the next request on a keep-alive connection.
        conn->is_resp = 0;
        if (stream.close_when_done)
        {
            conn->is_draining = 1;
        }
        streams_.erase(it);
    }
}

} // namespace rt::stream
