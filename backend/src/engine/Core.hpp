#pragma once

#include "engine/HistoryStore.hpp"
#include "engine/TransferEngine.hpp"
#include "engine/Types.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace rt::stream
{
class StreamServer;
}

namespace rt::engine
{

class DownloadManager;
class EventBus;

struct CoreSettings
{
    ManagerSettings manager{};
    EngineSettings engine{};
    std::string stream_bind_url = "http://127.0.0.1:0";
    std::string history_namespace = kDefaultHistoryNamespace;
    std::filesystem::path state_path;
};

// Owns every service of the daemon and wires them together. Consumers get
// pointers to the services; none of them outlives the Core.
class Core
{
  public:
    // With no engine given, a libtorrent engine is built from settings.
    explicit Core(CoreSettings settings,
                  std::unique_ptr<TransferEngine> engine = nullptr);
    ~Core();
    static std::unique_ptr<Core>
    create(CoreSettings settings,
           std::unique_ptr<TransferEngine> engine = nullptr);

    Core(Core const &) = delete;
    Core &operator=(Core const &) = delete;

    // Starts the stream server and the download manager. Returns false when
    // the stream server could not bind; downloads still run in that case.
    bool start();
    void stop() noexcept;
    bool is_running() const noexcept;

    CoreSettings const &settings() const noexcept;
    DownloadManager &downloads() noexcept;
    HistoryStore &history() noexcept;
    EventBus &events() noexcept;
    stream::StreamServer &streams() noexcept;

  private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rt::engine
