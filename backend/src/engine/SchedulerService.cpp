#include "engine/SchedulerService.hpp"

#include "utils/Log.hpp"

#include <exception>

namespace tmax::engine
{

auto SchedulerService::schedule(std::string name,
                                std::chrono::milliseconds interval,
                                Callback callback) -> TaskId
{
    if (interval <= std::chrono::milliseconds::zero())
    {
        interval = std::chrono::milliseconds(1);
    }
    TaskId id = next_id_++;
    tasks_.push({id, std::move(name), interval, Clock::now() + interval,
                 std::move(callback)});
    return id;
}

void SchedulerService::cancel(TaskId id)
{
    cancelled_.insert(id);
    drop_cancelled_top();
}

void SchedulerService::drop_cancelled_top()
{
    while (!tasks_.empty() && cancelled_.contains(tasks_.top().id))
    {
        cancelled_.erase(tasks_.top().id);
        tasks_.pop();
    }
}

std::size_t SchedulerService::tick(Clock::time_point now)
{
    std::size_t executed = 0;
    std::vector<Task> ran;

    drop_cancelled_top();
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
            try
            {
                task.callback();
            }
            catch (std::exception const &ex)
            {
                TM_LOG_ERROR("scheduled task '{}' failed: {}", task.name,
                             ex.what());
            }
            ++executed;
        }

        task.next_run = now + task.interval;
        ran.push_back(std::move(task));
        drop_cancelled_top();
    }
    // Requeue after the loop so a task never runs twice in one tick.
    for (auto &task : ran)
    {
        if (cancelled_.erase(task.id) == 0)
        {
            tasks_.push(std::move(task));
        }
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
        return std::chrono::milliseconds(0);
    return std::chrono::duration_cast<std::chrono::milliseconds>(next - now);
}

std::size_t SchedulerService::size() const noexcept
{
    return tasks_.size() >= cancelled_.size()
               ? tasks_.size() - cancelled_.size()
               : 0;
}

} // namespace tmax::engine
