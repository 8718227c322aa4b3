#include "task_scheduler.hpp"

#include <algorithm>
#include <iterator>
#include <termpane/logger.hpp>

namespace termpane
{

TaskScheduler::TaskId TaskScheduler::schedule_after(Duration delay, Task fn)
{
    return schedule_at(Clock::now() + delay, std::move(fn));
}

TaskScheduler::TaskId TaskScheduler::schedule_at(TimePoint when, Task fn)
{
    TaskId id = next_id_++;
    tasks_.push_back(Entry{id, when, std::move(fn)});
    TERMPANE_LOG_TRACE("scheduler", "scheduled task {} ({} pending)", id, tasks_.size());
    return id;
}

bool TaskScheduler::cancel(TaskId id)
{
    auto match = [id](const Entry& e) { return e.id == id; };

    auto it = std::find_if(tasks_.begin(), tasks_.end(), match);
    if (it == tasks_.end())
    {
        // A task of the batch currently running may cancel a later one.
        auto running = std::find_if(running_.begin(), running_.end(), match);
        if (running == running_.end() || !running->fn)
            return false;
        running->fn = nullptr;
        TERMPANE_LOG_TRACE("scheduler", "cancelled task {}", id);
        return true;
    }

    tasks_.erase(it);
    TERMPANE_LOG_TRACE("scheduler", "cancelled task {}", id);
    return true;
}

size_t TaskScheduler::run_due(TimePoint now)
{
    // Pull the due set out first so tasks may schedule or cancel freely.
    auto split = std::stable_partition(tasks_.begin(),
                                       tasks_.end(),
                                       [now](const Entry& e) { return e.due > now; });
    running_.assign(std::make_move_iterator(split), std::make_move_iterator(tasks_.end()));
    tasks_.erase(split, tasks_.end());

    std::stable_sort(running_.begin(),
                     running_.end(),
                     [](const Entry& a, const Entry& b) { return a.due < b.due; });

    size_t ran = 0;
    for (size_t i = 0; i < running_.size(); ++i)
    {
        Task fn = std::move(running_[i].fn);
        running_[i].fn = nullptr;
        if (fn)
        {
            fn();
            ++ran;
        }
    }
    running_.clear();
    return ran;
}

std::optional<TaskScheduler::TimePoint> TaskScheduler::next_due() const
{
    if (tasks_.empty())
        return std::nullopt;

    auto it = std::min_element(tasks_.begin(),
                               tasks_.end(),
                               [](const Entry& a, const Entry& b) { return a.due < b.due; });
    return it->due;
}

}   // namespace termpane
