#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <queue>
#include <unordered_set>
#include <vector>

namespace rt::engine
{

// Fixed-interval callbacks driven by an owning loop. Not thread-safe: the
// loop thread is the only caller. A callback that overruns its interval is
// rescheduled from the time it finished, so runs never stack up.
class SchedulerService
{
  public:
    using Clock = std::chrono::steady_clock;
    using TaskId = std::size_t;
    using Callback = std::function<void()>;

    TaskId schedule(std::chrono::milliseconds interval, Callback callback);
    void cancel(TaskId id);
    bool empty() const noexcept { return tasks_.empty(); }

    // Runs every task that is due. Returns how many ran.
    std::size_t tick(Clock::time_point now);

    // How long the loop may sleep before the next task is due.
    std::chrono::milliseconds time_until_next_task(Clock::time_point now) const;

  private:
    struct Task
    {
        TaskId id;
        std::chrono::milliseconds interval;
        Clock::time_point next_run;
        Callback callback;

        bool operator>(Task const &other) const
        {
            return next_run > other.next_run;
        }
    };

    std::priority_queue<Task, std::vector<Task>, std::greater<Task>> tasks_;
    std::unordered_set<TaskId> cancelled_;
    TaskId next_id_ = 1;
};

} // namespace rt::engine
