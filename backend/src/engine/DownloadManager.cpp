#include "engine/DownloadManager.hpp"

#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/HistoryStore.hpp"
#include "engine/StatusClassifier.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace rt::engine
{

namespace
{

bool is_degraded(TransferStatus status)
{
    return status == TransferStatus::Stalled ||
           status == TransferStatus::NoPeers;
}

bool is_finished(TransferStatus status)
{
    return status == TransferStatus::Done || status == TransferStatus::Seeding;
}

} // namespace

DownloadManager::DownloadManager(TransferEngine *engine, HistoryStore *history,
                                 EventBus *bus, StreamPublisher *publisher,
                                 ManagerSettings settings, NowFn now)
    : engine_(engine), history_(history), bus_(bus), publisher_(publisher),
      settings_(std::move(settings)), now_(std::move(now))
{
    if (!now_)
    {
        now_ = [] { return Clock::now(); };
    }
}

DownloadManager::~DownloadManager()
{
    stop();
}

void DownloadManager::start()
{
    if (actor_.joinable() || engine_ == nullptr)
    {
        return;
    }
    engine_->set_fault_callback(
        [this](std::string const &id, std::string const &message)
        {
            enqueue_task([this, id, message] { handle_fault(id, message); });
        });
    auto *engine = engine_;
    engine_started_ = std::async(std::launch::async,
                                 [engine]
                                 {
                                     try
                                     {
                                         engine->start();
                                     }
                                     catch (std::exception const &ex)
                                     {
                                         RT_LOG_ERROR(
                                             "transfer engine failed to start: {}",
                                             ex.what());
                                         throw;
                                     }
                                 })
                          .share();
    scheduler_.schedule(settings_.poll_interval, [this] { poll_tick(); });
    exit_requested_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);
    actor_ = std::thread([this] { actor_loop(); });
    RT_LOG_INFO("download manager started (poll every {} ms)",
                settings_.poll_interval.count());
}

void DownloadManager::stop()
{
    if (!actor_.joinable())
    {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(task_mutex_);
        exit_requested_.store(true, std::memory_order_release);
    }
    task_cv_.notify_all();
    actor_.join();
    running_.store(false, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lock(task_mutex_);
        tasks_.clear();
    }
    scheduler_ = SchedulerService{};
    if (publisher_ != nullptr)
    {
        for (auto const &entry : transfers_)
        {
            publisher_->revoke(entry.transfer.id);
        }
    }
    transfers_.clear();
    if (engine_started_.valid())
    {
        engine_started_.wait();
    }
    engine_->set_fault_callback({});
    engine_->shutdown();
    RT_LOG_INFO("download manager stopped");
}

bool DownloadManager::is_running() const noexcept
{
    return running_.load(std::memory_order_acquire);
}

bool DownloadManager::engine_ready() const
{
    return wait_for_engine(std::chrono::milliseconds(0));
}

bool DownloadManager::wait_for_engine(std::chrono::milliseconds timeout) const
{
    if (!engine_started_.valid())
    {
        return false;
    }
    if (engine_started_.wait_for(timeout) != std::future_status::ready)
    {
        return false;
    }
    try
    {
        engine_started_.get();
        return true;
    }
    catch (std::exception const &)
    {
        // Already logged by the starter.
        return false;
    }
}

bool DownloadManager::on_actor_thread() const noexcept
{
    return actor_id_.load(std::memory_order_acquire) ==
           std::this_thread::get_id();
}

bool DownloadManager::enqueue_task(std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> lock(task_mutex_);
        if (!running_.load(std::memory_order_acquire) ||
            exit_requested_.load(std::memory_order_acquire))
        {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    task_cv_.notify_one();
    return true;
}

void DownloadManager::actor_loop()
{
    actor_id_.store(std::this_thread::get_id(), std::memory_order_release);
    while (true)
    {
        std::deque<std::function<void()>> pending;
        {
            std::unique_lock<std::mutex> lock(task_mutex_);
            auto const wait = scheduler_.time_until_next_task(
                SchedulerService::Clock::now());
            task_cv_.wait_for(lock, wait,
                              [this]
                              {
                                  return exit_requested_.load(
                                             std::memory_order_acquire) ||
                                         !tasks_.empty();
                              });
            if (exit_requested_.load(std::memory_order_acquire))
            {
                break;
            }
            pending.swap(tasks_);
        }
        run_pending(pending);
        scheduler_.tick(SchedulerService::Clock::now());
    }
    actor_id_.store(std::thread::id{}, std::memory_order_release);
}

void DownloadManager::run_pending(std::deque<std::function<void()>> &pending)
{
    for (auto &task : pending)
    {
        try
        {
            task();
        }
        catch (std::exception const &ex)
        {
            RT_LOG_ERROR("download manager task failed: {}", ex.what());
        }
    }
}

DownloadManager::Entry *DownloadManager::find(std::string const &id)
{
    auto it = std::find_if(transfers_.begin(), transfers_.end(),
                           [&](Entry const &entry)
                           { return entry.transfer.id == id; });
    return it == transfers_.end() ? nullptr : &*it;
}

AddResult DownloadManager::add(std::string const &locator,
                               std::optional<std::string> display_name,
                               std::optional<std::string> external_id)
{
    AddResult rejected;
    if (!engine_->content_id(locator))
    {
        rejected.code = ResultCode::InvalidLocator;
        rejected.message = "locator cannot be parsed";
        return rejected;
    }
    if (!wait_for_engine(settings_.engine_start_timeout))
    {
        rejected.code = ResultCode::EngineUnavailable;
        rejected.message = "transfer engine is not available";
        return rejected;
    }
    auto result = run_task(
        [this, locator, display_name = std::move(display_name),
         external_id = std::move(external_id)]() mutable
        {
            return add_on_actor(locator, std::move(display_name),
                                std::move(external_id));
        });
    if (!result)
    {
        rejected.code = ResultCode::EngineUnavailable;
        rejected.message = "download manager did not respond";
        return rejected;
    }
    return std::move(*result);
}

AddResult DownloadManager::redownload(std::string const &history_id)
{
    auto record = history_ != nullptr ? history_->find(history_id)
                                      : std::nullopt;
    if (!record || record->content_locator.empty())
    {
        AddResult rejected;
        rejected.code = ResultCode::InvalidLocator;
        rejected.message = "no history entry for " + history_id;
        return rejected;
    }
    std::optional<std::string> display_name;
    if (!record->display_name.empty())
    {
        display_name = record->display_name;
    }
    return add(record->content_locator, std::move(display_name),
               record->external_id);
}

AddResult DownloadManager::add_on_actor(std::string const &locator,
                                        std::optional<std::string> display_name,
                                        std::optional<std::string> external_id)
{
    AddResult result;
    auto id = engine_->content_id(locator);
    if (!id)
    {
        result.code = ResultCode::InvalidLocator;
        return result;
    }
    if (auto *existing = find(*id))
    {
        result.transfer = existing->transfer;
        return result;
    }

    std::shared_ptr<TransferHandle> handle;
    try
    {
        handle = engine_->start_transfer(locator);
    }
    catch (InvalidLocatorError const &ex)
    {
        result.code = ResultCode::InvalidLocator;
        result.message = ex.what();
        return result;
    }
    catch (std::exception const &ex)
    {
        RT_LOG_ERROR("engine refused {}: {}", *id, ex.what());
        result.code = ResultCode::EngineUnavailable;
        result.message = ex.what();
        return result;
    }

    auto const now = now_();
    Entry entry;
    entry.handle = handle;
    auto &transfer = entry.transfer;
    transfer.id = handle->id();
    transfer.display_name = std::move(display_name);
    transfer.external_id = std::move(external_id);
    transfer.content_locator = locator;
    transfer.added_at = now;
    transfer.last_progress_at = now;
    transfer.status = TransferStatus::Metadata;
    try
    {
        transfer.name = handle->counters().name;
    }
    catch (std::exception const &ex)
    {
        RT_LOG_DEBUG("no initial counters for {}: {}", transfer.id, ex.what());
    }
    transfers_.push_back(entry);
    RT_LOG_INFO("added {} ({})", transfer.id,
                transfer.display_name.value_or(transfer.name));

    Outbox outbox;
    record_history(outbox, transfer, HistoryStatus::Active);
    outbox.push_back([this, snapshot = transfer]
                     { bus_->publish(TransferAddedEvent{snapshot}); });
    result.transfer = transfer;
    flush(outbox);
    return result;
}

bool DownloadManager::pause(std::string const &id)
{
    return run_task([this, id] { return set_paused_on_actor(id, true); })
        .value_or(false);
}

bool DownloadManager::resume(std::string const &id)
{
    return run_task([this, id] { return set_paused_on_actor(id, false); })
        .value_or(false);
}

bool DownloadManager::set_paused_on_actor(std::string const &id, bool paused)
{
    auto *entry = find(id);
    if (entry == nullptr || entry->transfer.paused == paused)
    {
        return false;
    }
    try
    {
        if (paused)
        {
            entry->handle->pause();
        }
        else
        {
            entry->handle->resume();
        }
    }
    catch (std::exception const &ex)
    {
        RT_LOG_WARN("{} of {} failed: {}", paused ? "pause" : "resume", id,
                    ex.what());
        return false;
    }
    entry->transfer.paused = paused;
    if (!paused)
    {
        // Idle time while paused does not count towards a stall.
        entry->transfer.last_progress_at = now_();
    }
    Outbox outbox;
    record_history(outbox, entry->transfer,
                   paused ? HistoryStatus::Paused : HistoryStatus::Active);
    flush(outbox);
    return true;
}

bool DownloadManager::remove(std::string const &id)
{
    return run_task([this, id] { return remove_on_actor(id); }).value_or(false);
}

bool DownloadManager::remove_on_actor(std::string const &id)
{
    auto it = std::find_if(transfers_.begin(), transfers_.end(),
                           [&](Entry const &entry)
                           { return entry.transfer.id == id; });
    if (it == transfers_.end())
    {
        return false;
    }
    auto entry = std::move(*it);
    transfers_.erase(it);
    try
    {
        engine_->remove(*entry.handle);
    }
    catch (std::exception const &ex)
    {
        RT_LOG_WARN("engine removal of {} failed: {}", id, ex.what());
    }
    if (publisher_ != nullptr)
    {
        publisher_->revoke(id);
    }
    RT_LOG_INFO("removed {}", id);

    // Written directly: the record_history guard skips ids no longer active.
    if (history_ != nullptr)
    {
        HistoryRecord record;
        record.id = id;
        record.content_locator = entry.transfer.content_locator;
        record.display_name = entry.transfer.display_name.value_or(
            entry.transfer.name);
        record.external_id = entry.transfer.external_id;
        record.added_at = entry.transfer.added_at;
        record.size_bytes = entry.transfer.total_bytes;
        record.status = HistoryStatus::Removed;
        history_->upsert(record);
    }
    bus_->publish(TransferRemovedEvent{id});
    return true;
}

StreamResult DownloadManager::stream_largest_file(std::string const &id)
{
    auto result = run_task([this, id] { return stream_on_actor(id); });
    if (!result)
    {
        StreamResult not_ready;
        not_ready.code = ResultCode::NotReady;
        return not_ready;
    }
    return std::move(*result);
}

StreamResult DownloadManager::stream_on_actor(std::string const &id)
{
    StreamResult result;
    result.code = ResultCode::NotReady;
    auto *entry = find(id);
    if (entry == nullptr || publisher_ == nullptr)
    {
        return result;
    }
    std::vector<EngineFile> files;
    try
    {
        files = entry->handle->files();
    }
    catch (std::exception const &ex)
    {
        RT_LOG_WARN("file list of {} unavailable: {}", id, ex.what());
        return result;
    }
    if (files.empty())
    {
        return result;
    }
    auto largest = files.begin();
    for (auto it = files.begin(); it != files.end(); ++it)
    {
        if (it->length > largest->length)
        {
            largest = it;
        }
    }
    auto endpoint = publisher_->publish(entry->handle, *largest);
    if (!endpoint)
    {
        return result;
    }
    RT_LOG_INFO("streaming {} of {} at {}", largest->path, id,
                endpoint->locator().url());
    result.code = ResultCode::Ok;
    result.file = *largest;
    result.endpoint = std::move(endpoint);
    return result;
}

std::vector<Transfer> DownloadManager::list()
{
    auto snapshot = run_task(
        [this]
        {
            std::vector<Transfer> transfers;
            transfers.reserve(transfers_.size());
            for (auto const &entry : transfers_)
            {
                transfers.push_back(entry.transfer);
            }
            return transfers;
        });
    return snapshot.value_or(std::vector<Transfer>{});
}

std::optional<Transfer> DownloadManager::get(std::string const &id)
{
    auto snapshot = run_task(
        [this, id]() -> std::optional<Transfer>
        {
            if (auto *entry = find(id))
            {
                return entry->transfer;
            }
            return std::nullopt;
        });
    return snapshot.value_or(std::nullopt);
}

bool DownloadManager::poll_now_for_testing()
{
    return run_task(
               [this]
               {
                   poll_tick();
                   return true;
               })
        .value_or(false);
}

void DownloadManager::poll_tick()
{
    if (!engine_ready())
    {
        return;
    }
    try
    {
        engine_->pump();
    }
    catch (std::exception const &ex)
    {
        RT_LOG_WARN("engine notification pump failed: {}", ex.what());
    }
    auto const now = now_();
    Outbox outbox;
    for (auto &entry : transfers_)
    {
        try
        {
            refresh(entry, now, outbox);
        }
        catch (std::exception const &ex)
        {
            RT_LOG_WARN("poll of {} failed: {}", entry.transfer.id, ex.what());
            continue;
        }
        outbox.push_back([this, snapshot = entry.transfer]
                         { bus_->publish(TransferProgressEvent{snapshot}); });
    }
    flush(outbox);
}

void DownloadManager::refresh(Entry &entry, TimePoint now, Outbox &outbox)
{
    auto counters = entry.handle->counters();
    auto &transfer = entry.transfer;
    if (counters.bytes_downloaded > transfer.bytes_downloaded)
    {
        transfer.last_progress_at = now;
    }
    transfer.bytes_downloaded = counters.bytes_downloaded;
    transfer.bytes_uploaded = counters.bytes_uploaded;
    transfer.total_bytes = counters.total_bytes;
    transfer.download_rate = counters.download_rate;
    transfer.upload_rate = counters.upload_rate;
    transfer.peer_count = counters.peer_count;
    transfer.progress = counters.progress;
    transfer.eta_seconds = counters.eta_seconds;
    if (!counters.name.empty())
    {
        transfer.name = counters.name;
    }

    if (counters.error && !entry.faulted)
    {
        mark_faulted(entry, *counters.error, outbox);
    }
    if (entry.faulted)
    {
        transfer.status = TransferStatus::Error;
        return;
    }

    counters.paused = counters.paused || transfer.paused;
    auto const previous = transfer.status;
    // The stall clock starts once metadata is known.
    if (previous == TransferStatus::Metadata && counters.ready)
    {
        transfer.last_progress_at = now;
    }
    auto const classification = classify(
        counters, TimingState{transfer.added_at, transfer.last_progress_at},
        now, settings_.policy);
    if (classification.progress_observed)
    {
        transfer.last_progress_at = now;
    }
    transfer.status = classification.status;
    transfer.degraded_reason = classification.degraded_reason;

    if (is_finished(transfer.status))
    {
        if (!entry.completion_recorded)
        {
            entry.completion_recorded = true;
            RT_LOG_INFO("{} finished", transfer.id);
            record_history(outbox, transfer, HistoryStatus::Completed, now);
            outbox.push_back([this, snapshot = transfer]
                             { bus_->publish(TransferDoneEvent{snapshot}); });
        }
    }
    else if (is_degraded(transfer.status) && !is_degraded(previous))
    {
        RT_LOG_INFO("{} is {}: {}", transfer.id, to_string(transfer.status),
                    transfer.degraded_reason.value_or(""));
        record_history(outbox, transfer, HistoryStatus::Stalled);
    }
    else if (transfer.status == TransferStatus::Downloading &&
             is_degraded(previous))
    {
        record_history(outbox, transfer, HistoryStatus::Active);
    }
}

void DownloadManager::mark_faulted(Entry &entry, std::string const &message,
                                   Outbox &outbox)
{
    auto &transfer = entry.transfer;
    entry.faulted = true;
    transfer.status = TransferStatus::Error;
    transfer.last_error = message;
    transfer.degraded_reason = message;
    RT_LOG_ERROR("{} faulted: {}", transfer.id, message);
    record_history(outbox, transfer, HistoryStatus::Error);
    outbox.push_back(
        [this, snapshot = transfer, message]
        { bus_->publish(TransferErrorEvent{snapshot, message}); });
}

void DownloadManager::handle_fault(std::string const &id,
                                   std::string const &message)
{
    auto *entry = find(id);
    if (entry == nullptr || entry->faulted)
    {
        return;
    }
    Outbox outbox;
    mark_faulted(*entry, message, outbox);
    flush(outbox);
}

void DownloadManager::record_history(Outbox &outbox, Transfer const &transfer,
                                     HistoryStatus status,
                                     std::optional<TimePoint> completed_at)
{
    if (history_ == nullptr)
    {
        return;
    }
    HistoryRecord record;
    record.id = transfer.id;
    record.content_locator = transfer.content_locator;
    record.display_name = transfer.display_name.value_or(transfer.name);
    record.external_id = transfer.external_id;
    record.added_at = transfer.added_at;
    record.completed_at = completed_at;
    record.size_bytes = transfer.total_bytes;
    record.status = status;
    if (status == HistoryStatus::Error)
    {
        record.last_error = transfer.last_error;
    }
    // An event handler earlier in the outbox may have removed the transfer;
    // its "removed" record must not be overwritten.
    outbox.push_back(
        [this, record = std::move(record)]
        {
            if (find(record.id) != nullptr)
            {
                history_->upsert(record);
            }
        });
}

void DownloadManager::flush(Outbox &outbox)
{
    for (auto &effect : outbox)
    {
        try
        {
            effect();
        }
        catch (std::exception const &ex)
        {
            RT_LOG_ERROR("event delivery failed: {}", ex.what());
        }
    }
    outbox.clear();
}

} // namespace rt::engine
