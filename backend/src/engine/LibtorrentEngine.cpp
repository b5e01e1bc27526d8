#include "engine/LibtorrentEngine.hpp"

#include "engine/TorrentUtils.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/Version.hpp"

#include <libtorrent/alert_types.hpp>
#include <libtorrent/error_code.hpp>
#include <libtorrent/file_storage.hpp>
#include <libtorrent/magnet_uri.hpp>
#include <libtorrent/session_params.hpp>
#include <libtorrent/torrent_flags.hpp>
#include <libtorrent/torrent_info.hpp>
#include <libtorrent/torrent_status.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace rt::engine
{

namespace
{

constexpr int kPrioritizedPieces = 16;
constexpr int kFirstDeadlineMs = 0;
constexpr int kDeadlineStepMs = 250;

std::int64_t estimate_eta(libtorrent::torrent_status const &status)
{
    if (status.download_payload_rate <= 0)
    {
        return -1;
    }
    auto remaining = status.total_wanted - status.total_wanted_done;
    if (remaining <= 0)
    {
        return 0;
    }
    auto const rate = static_cast<std::int64_t>(status.download_payload_rate);
    return (remaining + rate - 1) / rate;
}

std::uint64_t non_negative(std::int64_t value)
{
    return value > 0 ? static_cast<std::uint64_t>(value) : 0;
}

bool looks_like_metainfo_path(std::string const &locator)
{
    std::error_code ec;
    std::filesystem::path path(locator);
    return path.extension() == ".torrent" &&
           std::filesystem::is_regular_file(path, ec);
}

} // namespace

LibtorrentHandle::LibtorrentHandle(std::string id,
                                   libtorrent::torrent_handle handle)
    : id_(std::move(id)), handle_(std::move(handle))
{
}

EngineCounters LibtorrentHandle::counters() const
{
    auto const status = handle_.status();
    EngineCounters counters;
    counters.ready = status.has_metadata;
    counters.done = status.has_metadata &&
                    (status.is_finished || status.is_seeding);
    counters.paused =
        static_cast<bool>(status.flags & libtorrent::torrent_flags::paused);
    counters.bytes_downloaded = non_negative(status.total_wanted_done);
    counters.bytes_uploaded = non_negative(status.all_time_upload);
    if (status.has_metadata)
    {
        counters.total_bytes = non_negative(status.total_wanted);
    }
    counters.download_rate = non_negative(status.download_payload_rate);
    counters.upload_rate = non_negative(status.upload_payload_rate);
    counters.peer_count = status.num_peers;
    if (auto eta = estimate_eta(status); eta >= 0)
    {
        counters.eta_seconds = eta;
    }
    counters.progress = status.progress;
    counters.name = status.name;
    if (status.errc)
    {
        counters.error = status.errc.message();
    }
    return counters;
}

void LibtorrentHandle::pause()
{
    // Without this the session queue would resume it on its own.
    handle_.unset_flags(libtorrent::torrent_flags::auto_managed);
    handle_.pause();
}

void LibtorrentHandle::resume()
{
    handle_.resume();
}

std::vector<EngineFile> LibtorrentHandle::files() const
{
    std::vector<EngineFile> result;
    auto ti = handle_.torrent_file();
    if (!ti)
    {
        return result;
    }
    auto const &storage = ti->files();
    for (auto const index : storage.file_range())
    {
        if (storage.pad_file_at(index))
        {
            continue;
        }
        EngineFile file;
        file.index = static_cast<int>(index);
        file.path = storage.file_path(index);
        file.length = non_negative(storage.file_size(index));
        result.push_back(std::move(file));
    }
    return result;
}

std::size_t LibtorrentHandle::read(int file_index, std::uint64_t offset,
                                   std::span<char> out)
{
    auto ti = handle_.torrent_file();
    if (!ti || out.empty())
    {
        return 0;
    }
    auto const &storage = ti->files();
    if (file_index < 0 || file_index >= storage.num_files())
    {
        throw std::out_of_range("file index out of range");
    }
    libtorrent::file_index_t const index{file_index};
    auto const size = non_negative(storage.file_size(index));
    if (offset >= size)
    {
        return 0;
    }
    auto want = std::min<std::uint64_t>(out.size(), size - offset);
    auto const request = ti->map_file(index, static_cast<std::int64_t>(offset),
                                      static_cast<int>(want));
    if (!handle_.have_piece(request.piece))
    {
        return 0;
    }
    // Only serve what lies inside the verified piece.
    auto const left_in_piece =
        static_cast<std::uint64_t>(ti->piece_size(request.piece) - request.start);
    want = std::min(want, left_in_piece);

    auto const save_path =
        handle_.status(libtorrent::torrent_handle::query_save_path).save_path;
    auto const path =
        std::filesystem::path(save_path) / storage.file_path(index);
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return 0;
    }
    in.seekg(static_cast<std::streamoff>(offset));
    in.read(out.data(), static_cast<std::streamsize>(want));
    return static_cast<std::size_t>(std::max<std::streamsize>(in.gcount(), 0));
}

void LibtorrentHandle::prioritize(int file_index, std::uint64_t offset,
                                  std::uint64_t length)
{
    auto ti = handle_.torrent_file();
    if (!ti || length == 0)
    {
        return;
    }
    auto const &storage = ti->files();
    if (file_index < 0 || file_index >= storage.num_files())
    {
        return;
    }
    libtorrent::file_index_t const index{file_index};
    auto const size = non_negative(storage.file_size(index));
    if (offset >= size)
    {
        return;
    }
    auto const last = std::min(size, offset + length) - 1;
    auto const first_piece =
        ti->map_file(index, static_cast<std::int64_t>(offset), 1).piece;
    auto const last_piece =
        ti->map_file(index, static_cast<std::int64_t>(last), 1).piece;
    int step = 0;
    for (auto piece = first_piece; piece <= last_piece && step < kPrioritizedPieces;
         ++piece, ++step)
    {
        if (!handle_.have_piece(piece))
        {
            handle_.set_piece_deadline(piece,
                                       kFirstDeadlineMs + step * kDeadlineStepMs);
        }
    }
}

LibtorrentEngine::LibtorrentEngine(EngineSettings settings)
    : settings_(std::move(settings))
{
    if (settings_.download_path.empty())
    {
        settings_.download_path =
            (rt::utils::data_root() / "downloads").string();
    }
}

LibtorrentEngine::~LibtorrentEngine()
{
    shutdown();
}

libtorrent::settings_pack
LibtorrentEngine::build_settings_pack(EngineSettings const &settings)
{
    libtorrent::settings_pack pack;
    pack.set_str(libtorrent::settings_pack::user_agent,
                 rt::version::kUserAgentVersion);
    pack.set_str(libtorrent::settings_pack::listen_interfaces,
                 settings.listen_interface);
    pack.set_bool(libtorrent::settings_pack::enable_dht, settings.dht_enabled);
    pack.set_bool(libtorrent::settings_pack::enable_lsd, settings.lsd_enabled);
    pack.set_int(libtorrent::settings_pack::alert_mask,
                 libtorrent::alert_category::error |
                     libtorrent::alert_category::status |
                     libtorrent::alert_category::storage);
    pack.set_int(libtorrent::settings_pack::alert_queue_size, 4096);
    return pack;
}

std::optional<libtorrent::add_torrent_params>
LibtorrentEngine::parse_locator(std::string const &locator)
{
    libtorrent::add_torrent_params params;
    libtorrent::error_code ec;
    if (locator.rfind("magnet:", 0) == 0)
    {
        libtorrent::parse_magnet_uri(locator, params, ec);
        if (ec)
        {
            return std::nullopt;
        }
    }
    else if (auto hash = sha1_from_hex(locator); hash)
    {
        params.info_hashes.v1 = *hash;
    }
    else if (looks_like_metainfo_path(locator))
    {
        auto ti = std::make_shared<libtorrent::torrent_info>(locator, ec);
        if (ec)
        {
            return std::nullopt;
        }
        params.ti = std::move(ti);
    }
    else
    {
        return std::nullopt;
    }
    if (!info_hash_from_params(params))
    {
        return std::nullopt;
    }
    return params;
}

void LibtorrentEngine::start()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_)
    {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(settings_.download_path, ec);
    if (ec)
    {
        throw std::system_error(ec, "cannot create download directory " +
                                        settings_.download_path);
    }
    libtorrent::session_params params(build_settings_pack(settings_));
    session_ = std::make_unique<libtorrent::session>(std::move(params));
    RT_LOG_INFO("libtorrent session listening on {}, saving to {}",
                settings_.listen_interface, settings_.download_path);
}

void LibtorrentEngine::shutdown()
{
    std::unique_ptr<libtorrent::session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handles_.clear();
        alert_buffer_.clear();
        session = std::move(session_);
    }
    if (session)
    {
        RT_LOG_INFO("stopping libtorrent session");
        session.reset();
    }
}

std::optional<std::string>
LibtorrentEngine::content_id(std::string const &locator) const
{
    auto params = parse_locator(locator);
    if (!params)
    {
        return std::nullopt;
    }
    return info_hash_from_params(*params);
}

std::shared_ptr<TransferHandle>
LibtorrentEngine::start_transfer(std::string const &locator)
{
    auto params = parse_locator(locator);
    if (!params)
    {
        throw InvalidLocatorError("unrecognized locator: " + locator);
    }
    auto id = *info_hash_from_params(*params);
    params->save_path = settings_.download_path;
    params->flags &= ~(libtorrent::torrent_flags::paused |
                       libtorrent::torrent_flags::auto_managed);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_)
    {
        throw std::runtime_error("libtorrent session is not running");
    }
    auto const hashes = params->info_hashes;
    libtorrent::error_code ec;
    auto handle = session_->add_torrent(std::move(*params), ec);
    if (ec == libtorrent::errors::duplicate_torrent)
    {
        // A removal of the same content may still be in flight.
        handle = session_->find_torrent(hashes.get_best());
        ec.clear();
    }
    if (ec || !handle.is_valid())
    {
        throw std::runtime_error("failed to add " + id + ": " +
                                 (ec ? ec.message() : "invalid handle"));
    }
    auto wrapped = std::make_shared<LibtorrentHandle>(id, std::move(handle));
    handles_[id] = wrapped;
    return wrapped;
}

std::shared_ptr<TransferHandle>
LibtorrentEngine::lookup(std::string const &id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(id);
    if (it == handles_.end())
    {
        return nullptr;
    }
    return it->second;
}

void LibtorrentEngine::remove(TransferHandle &handle)
{
    auto *native = dynamic_cast<LibtorrentHandle *>(&handle);
    if (native == nullptr)
    {
        throw std::invalid_argument("handle does not belong to this engine");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    handles_.erase(native->id());
    if (session_ && native->native().is_valid())
    {
        session_->remove_torrent(native->native());
    }
}

void LibtorrentEngine::set_fault_callback(FaultCallback callback)
{
    std::lock_guard<std::mutex> lock(mutex_);
    on_fault_ = std::move(callback);
}

void LibtorrentEngine::collect_fault(libtorrent::torrent_handle const &handle,
                                     std::string message,
                                     std::vector<Fault> &faults) const
{
    if (!handle.is_valid())
    {
        return;
    }
    auto id = info_hash_to_hex(handle.info_hashes());
    if (handles_.find(id) == handles_.end())
    {
        return;
    }
    faults.push_back({std::move(id), std::move(message)});
}

void LibtorrentEngine::pump()
{
    std::vector<Fault> faults;
    FaultCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_)
        {
            return;
        }
        alert_buffer_.clear();
        session_->pop_alerts(&alert_buffer_);
        for (auto const *alert : alert_buffer_)
        {
            if (auto *file_error =
                    libtorrent::alert_cast<libtorrent::file_error_alert>(alert))
            {
                collect_fault(file_error->handle, file_error->message(), faults);
            }
            else if (auto *torrent_error =
                         libtorrent::alert_cast<libtorrent::torrent_error_alert>(
                             alert))
            {
                collect_fault(torrent_error->handle, torrent_error->message(),
                              faults);
            }
            else if (auto *metadata_failed = libtorrent::alert_cast<
                         libtorrent::metadata_failed_alert>(alert))
            {
                collect_fault(metadata_failed->handle,
                              metadata_failed->message(), faults);
            }
            else if (auto *added =
                         libtorrent::alert_cast<libtorrent::add_torrent_alert>(
                             alert))
            {
                if (added->error)
                {
                    RT_LOG_WARN("add failed: {}", added->message());
                }
            }
            else if (auto *listen_failed = libtorrent::alert_cast<
                         libtorrent::listen_failed_alert>(alert))
            {
                RT_LOG_WARN("{}", listen_failed->message());
            }
            else if (auto *listening = libtorrent::alert_cast<
                         libtorrent::listen_succeeded_alert>(alert))
            {
                RT_LOG_DEBUG("{}", listening->message());
            }
        }
        alert_buffer_.clear();
        callback = on_fault_;
    }
    if (!callback)
    {
        return;
    }
    for (auto const &fault : faults)
    {
        callback(fault.id, fault.message);
    }
}

} // namespace rt::engine
