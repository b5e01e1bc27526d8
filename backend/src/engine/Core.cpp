#include "engine/Core.hpp"

#include "engine/DownloadManager.hpp"
#include "engine/EventBus.hpp"
#include "engine/LibtorrentEngine.hpp"
#include "stream/StreamServer.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/StateStore.hpp"

#include <atomic>
#include <exception>

namespace rt::engine
{

struct Core::Impl
{
    CoreSettings settings;
    EventBus bus;
    std::unique_ptr<storage::Database> database;
    std::unique_ptr<HistoryStore> history;
    std::unique_ptr<TransferEngine> engine;
    std::unique_ptr<stream::StreamServer> streams;
    std::unique_ptr<DownloadManager> downloads;
    std::atomic_bool running{false};

    Impl(CoreSettings s, std::unique_ptr<TransferEngine> injected)
        : settings(std::move(s)), engine(std::move(injected))
    {
        if (settings.state_path.empty())
        {
            settings.state_path = rt::utils::data_root() / "reeltorrent.db";
        }
        database = std::make_unique<storage::Database>(settings.state_path);
        if (!database->is_valid())
        {
            RT_LOG_WARN("state database {} unavailable; history will not "
                        "persist this session",
                        settings.state_path.string());
        }
        history = std::make_unique<HistoryStore>(database.get(), &bus,
                                                 settings.history_namespace);
        if (!engine)
        {
            engine = std::make_unique<LibtorrentEngine>(settings.engine);
        }
        streams = std::make_unique<stream::StreamServer>(settings.stream_bind_url);
        downloads = std::make_unique<DownloadManager>(
            engine.get(), history.get(), &bus, streams.get(), settings.manager);
    }
};

Core::Core(CoreSettings settings, std::unique_ptr<TransferEngine> engine)
    : impl_(std::make_unique<Impl>(std::move(settings), std::move(engine)))
{
}

Core::~Core()
{
    stop();
}

std::unique_ptr<Core> Core::create(CoreSettings settings,
                                   std::unique_ptr<TransferEngine> engine)
{
    return std::make_unique<Core>(std::move(settings), std::move(engine));
}

bool Core::start()
{
    if (impl_->running.exchange(true))
    {
        return true;
    }
    bool const streaming = impl_->streams->start();
    impl_->downloads->start();
    return streaming;
}

void Core::stop() noexcept
{
    if (!impl_ || !impl_->running.exchange(false))
    {
        return;
    }
    // Manager first: removing its transfers revokes their stream routes.
    try
    {
        impl_->downloads->stop();
    }
    catch (std::exception const &ex)
    {
        RT_LOG_ERROR("download manager stop failed: {}", ex.what());
    }
    try
    {
        impl_->streams->stop();
    }
    catch (std::exception const &ex)
    {
        RT_LOG_ERROR("stream server stop failed: {}", ex.what());
    }
}

bool Core::is_running() const noexcept
{
    return impl_ && impl_->running.load();
}

CoreSettings const &Core::settings() const noexcept
{
    return impl_->settings;
}

DownloadManager &Core::downloads() noexcept
{
    return *impl_->downloads;
}

HistoryStore &Core::history() noexcept
{
    return *impl_->history;
}

EventBus &Core::events() noexcept
{
    return impl_->bus;
}

stream::StreamServer &Core::streams() noexcept
{
    return *impl_->streams;
}

} // namespace rt::engine
