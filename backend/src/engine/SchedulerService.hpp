#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <queue>
#include <string>
#include <unordered_set>
#include <vector>

namespace tmax::engine
{

// Fixed-interval tasks run on the caller's thread from tick().
class SchedulerService
{
  public:
    using Clock = std::chrono::steady_clock;
    using TaskId = std::size_t;
    using Callback = std::function<void()>;

    TaskId schedule(std::string name, std::chrono::milliseconds interval,
                    Callback callback);
    void cancel(TaskId id);

    // Runs every due task once. Returns how many ran.
    std::size_t tick(Clock::time_point now);

    // How long the owner may sleep before the next task is due.
    std::chrono::milliseconds time_until_next_task(Clock::time_point now) const;

    std::size_t size() const noexcept;

  private:
    struct Task
    {
        TaskId id;
        std::string name;
        std::chrono::milliseconds interval;
        Clock::time_point next_run;
        Callback callback;

        bool operator>(Task const &other) const
        {
            return next_run > other.next_run;
        }
    };

    void drop_cancelled_top();

    std::priority_queue<Task, std::vector<Task>, std::greater<Task>> tasks_;
    std::unordered_set<TaskId> cancelled_;
    TaskId next_id_ = 1;
};

} // namespace tmax::engine
