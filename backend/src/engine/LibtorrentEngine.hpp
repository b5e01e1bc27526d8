#pragma once

#include "engine/TransferEngine.hpp"

#include <libtorrent/add_torrent_params.hpp>
#include <libtorrent/alert.hpp>
#include <libtorrent/session.hpp>
#include <libtorrent/settings_pack.hpp>
#include <libtorrent/torrent_handle.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rt::engine
{

class LibtorrentHandle final : public TransferHandle
{
  public:
    LibtorrentHandle(std::string id, libtorrent::torrent_handle handle);

    std::string const &id() const noexcept override { return id_; }
    EngineCounters counters() const override;
    void pause() override;
    void resume() override;
    std::vector<EngineFile> files() const override;
    std::size_t read(int file_index, std::uint64_t offset,
                     std::span<char> out) override;
    void prioritize(int file_index, std::uint64_t offset,
                    std::uint64_t length) override;

    libtorrent::torrent_handle const &native() const noexcept
    {
        return handle_;
    }

  private:
    std::string id_;
    libtorrent::torrent_handle handle_;
};

// Transfer engine backed by a libtorrent session. Accepts magnet URIs, bare
// 40-digit hex info-hashes and paths to .torrent files.
class LibtorrentEngine final : public TransferEngine
{
  public:
    explicit LibtorrentEngine(EngineSettings settings);
    ~LibtorrentEngine() override;

    LibtorrentEngine(LibtorrentEngine const &) = delete;
    LibtorrentEngine &operator=(LibtorrentEngine const &) = delete;

    void start() override;
    void shutdown() override;

    std::optional<std::string>
    content_id(std::string const &locator) const override;
    std::shared_ptr<TransferHandle>
    start_transfer(std::string const &locator) override;
    std::shared_ptr<TransferHandle>
    lookup(std::string const &id) const override;
    void remove(TransferHandle &handle) override;

    void set_fault_callback(FaultCallback callback) override;
    void pump() override;

    static libtorrent::settings_pack
    build_settings_pack(EngineSettings const &settings);
    static std::optional<libtorrent::add_torrent_params>
    parse_locator(std::string const &locator);

  private:
    struct Fault
    {
        std::string id;
        std::string message;
    };

    void collect_fault(libtorrent::torrent_handle const &handle,
                       std::string message, std::vector<Fault> &faults) const;

    EngineSettings settings_;
    mutable std::mutex mutex_;
    std::unique_ptr<libtorrent::session> session_;
    std::unordered_map<std::string, std::shared_ptr<LibtorrentHandle>>
        handles_;
    FaultCallback on_fault_;
    std::vector<libtorrent::alert *> alert_buffer_;
};

} // namespace rt::engine
