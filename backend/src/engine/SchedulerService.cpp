#include "engine/SchedulerService.hpp"

namespace rt::engine
{

auto SchedulerService::schedule(std::chrono::milliseconds interval,
                                Callback callback) -> TaskId
{
    TaskId id = next_id_++;
    tasks_.push({id, interval, Clock::now() + interval, std::move(callback)});
    return id;
}

void SchedulerService::cancel(TaskId id)
{
    cancelled_.insert(id);
}

std::size_t SchedulerService::tick(Clock::time_point now)
{
    std::size_t executed = 0;
    std::vector<Task> ran;
    while (!tasks_.empty() && tasks_.top().next_run <= now)
    {
        Task task = tasks_.top();
        tasks_.pop();
        if (cancelled_.erase(task.id) > 0)
        {
            continue;
        }
        if (task.callback)
        {
            task.callback();
            ++executed;
        }
        ran.push_back(std::move(task));
    }
    auto const finished = Clock::now();
    for (auto &task : ran)
    {
        if (cancelled_.erase(task.id) > 0)
        {
            continue;
        }
        task.next_run = finished + task.interval;
        tasks_.push(std::move(task));
    }
    return executed;
}

std::chrono::milliseconds
SchedulerService::time_until_next_task(Clock::time_point now) const
{
    if (tasks_.empty())
    {
        return std::chrono::hours(24);
    }
    auto next = tasks_.top().next_run;
    if (now >= next)
    {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(next - now) +
           std::chrono::milliseconds(1);
}

} // namespace rt::engine
