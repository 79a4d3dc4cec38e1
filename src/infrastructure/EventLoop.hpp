/**
 * @file EventLoop.hpp
 * @brief Single-threaded timer queue used as the production Scheduler.
 */

#pragma once

#include "domain/Scheduler.hpp"

#include <map>
#include <unordered_map>
#include <utility>

namespace scribeline::infrastructure {

/**
 * @class EventLoop
 * @brief Runs scheduled tasks in due-time order on the calling thread.
 *
 * Tasks with the same due time run in the order they were scheduled. Tasks may schedule
 * and cancel other tasks, and may call stop().
 */
class EventLoop : public domain::Scheduler {
public:
    TaskId schedule(std::chrono::milliseconds delay, Task task) override;
    bool cancel(TaskId id) override;
    Clock::time_point now() const override;

    /** @brief Runs until no task is pending or stop() is called. */
    void run();

    void stop() { m_stopped = true; }
    bool empty() const { return m_queue.empty(); }
    std::size_t pending() const { return m_queue.size(); }

private:
    using Key = std::pair<Clock::time_point, TaskId>;

    std::map<Key, Task> m_queue;
    std::unordered_map<TaskId, Key> m_index;
    TaskId m_nextId = 1;
    bool m_stopped = false;
};

} // namespace scribeline::infrastructure
