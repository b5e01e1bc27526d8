#pragma once

#include "engine/SchedulerService.hpp"
#include "engine/TransferEngine.hpp"
#include "engine/Types.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace rt::engine
{

class EventBus;
class HistoryStore;

// Owns the set of active transfers. All table access happens on one actor
// thread: public calls are queued to it and waited on with a bounded timeout,
// the poll tick is scheduled on it, and engine notifications are turned into
// queued tasks. Calls made from inside an event handler run inline.
class DownloadManager
{
  public:
    using NowFn = std::function<TimePoint()>;

    DownloadManager(TransferEngine *engine, HistoryStore *history,
                    EventBus *bus, StreamPublisher *publisher,
                    ManagerSettings settings, NowFn now = {});
    DownloadManager(DownloadManager const &) = delete;
    DownloadManager &operator=(DownloadManager const &) = delete;
    ~DownloadManager();

    // Starts the engine in the background and the actor thread.
    void start();
    // Cancels the tick, drains the actor and shuts the engine down.
    void stop();
    bool is_running() const noexcept;
    bool engine_ready() const;

    AddResult add(std::string const &locator,
                  std::optional<std::string> display_name = std::nullopt,
                  std::optional<std::string> external_id = std::nullopt);
    // Adds the locator stored in a history record again.
    AddResult redownload(std::string const &history_id);
    // Each returns false when nothing changed.
    bool pause(std::string const &id);
    bool resume(std::string const &id);
    bool remove(std::string const &id);
    StreamResult stream_largest_file(std::string const &id);

    std::vector<Transfer> list();
    std::optional<Transfer> get(std::string const &id);

    ManagerSettings const &settings() const noexcept { return settings_; }

    // Runs one poll tick on the actor and waits for it.
    bool poll_now_for_testing();

  private:
    struct Entry
    {
        Transfer transfer;
        std::shared_ptr<TransferHandle> handle;
        bool completion_recorded = false;
        bool faulted = false;
    };

    // Side effects deferred until table mutation is finished.
    using Outbox = std::vector<std::function<void()>>;

    enum class TaskState
    {
        Queued,
        Running,
        Cancelled
    };

    bool enqueue_task(std::function<void()> task);

    template <typename Fn>
    auto run_task(Fn &&fn) -> std::optional<std::invoke_result_t<Fn>>
    {
        using result_t = std::invoke_result_t<Fn>;
        if (on_actor_thread())
        {
            return fn();
        }
        auto task = std::make_shared<std::packaged_task<result_t()>>(
            std::forward<Fn>(fn));
        auto future = task->get_future();
        auto state = std::make_shared<std::atomic<TaskState>>(TaskState::Queued);
        if (!enqueue_task(
                [task, state]() mutable
                {
                    auto expected = TaskState::Queued;
                    if (state->compare_exchange_strong(expected,
                                                       TaskState::Running))
                    {
                        (*task)();
                    }
                }))
        {
            return std::nullopt;
        }
        if (future.wait_for(settings_.operation_timeout) !=
            std::future_status::ready)
        {
            // A task the actor has not picked up yet never runs. One that
            // already started is waited on so the caller sees its outcome.
            auto expected = TaskState::Queued;
            if (state->compare_exchange_strong(expected, TaskState::Cancelled))
            {
                return std::nullopt;
            }
            future.wait();
        }
        try
        {
            return future.get();
        }
        catch (std::future_error const &)
        {
            // Dropped unexecuted during stop().
            return std::nullopt;
        }
    }

    bool on_actor_thread() const noexcept;
    bool wait_for_engine(std::chrono::milliseconds timeout) const;
    void actor_loop();
    void run_pending(std::deque<std::function<void()>> &pending);

    Entry *find(std::string const &id);
    AddResult add_on_actor(std::string const &locator,
                           std::optional<std::string> display_name,
                           std::optional<std::string> external_id);
    bool set_paused_on_actor(std::string const &id, bool paused);
    bool remove_on_actor(std::string const &id);
    StreamResult stream_on_actor(std::string const &id);
    void poll_tick();
    void refresh(Entry &entry, TimePoint now, Outbox &outbox);
    void mark_faulted(Entry &entry, std::string const &message,
                      Outbox &outbox);
    void handle_fault(std::string const &id, std::string const &message);
    void record_history(Outbox &outbox, Transfer const &transfer,
                        HistoryStatus status,
                        std::optional<TimePoint> completed_at = std::nullopt);
    static void flush(Outbox &outbox);

    TransferEngine *engine_ = nullptr;
    HistoryStore *history_ = nullptr;
    EventBus *bus_ = nullptr;
    StreamPublisher *publisher_ = nullptr;
    ManagerSettings settings_;
    NowFn now_;

    std::vector<Entry> transfers_;
    SchedulerService scheduler_;
    std::shared_future<void> engine_started_;

    std::atomic<bool> running_{false};
    std::atomic<bool> exit_requested_{false};
    std::atomic<std::thread::id> actor_id_{};
    std::thread actor_;
    std::mutex task_mutex_;
    std::condition_variable task_cv_;
    std::deque<std::function<void()>> tasks_;
};

} // namespace rt::engine
