#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace termpane
{

// Single-threaded one-shot timers. The owner pumps run_due() from its event
// loop; nothing here blocks or spawns threads.
class TaskScheduler
{
   public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = Clock::duration;
    using TaskId    = uint64_t;
    using Task      = std::function<void()>;

    static constexpr TaskId INVALID_TASK = 0;

    TaskScheduler() = default;

    TaskScheduler(const TaskScheduler&)            = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    // Schedule fn to run once at now() + delay.
    TaskId schedule_after(Duration delay, Task fn);
    TaskId schedule_at(TimePoint when, Task fn);

    // Returns false if the task already ran or was never scheduled.
    bool cancel(TaskId id);

    // Run every task due at or before `now`, in due-time order (ties in
    // scheduling order). Tasks scheduled from inside a task run on a later
    // call. Returns the number of tasks run.
    // Not reentrant.
    size_t run_due(TimePoint now);
    size_t run_due() { return run_due(Clock::now()); }

    size_t                   pending_count() const { return tasks_.size(); }
    std::optional<TimePoint> next_due() const;

    void clear() { tasks_.clear(); }

   private:
    struct Entry
    {
        TaskId    id;
        TimePoint due;
        Task      fn;
    };

    std::vector<Entry> tasks_;
    std::vector<Entry> running_;
    TaskId             next_id_ = 1;
};

}   // namespace termpane
