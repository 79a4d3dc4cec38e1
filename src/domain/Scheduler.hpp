/**
 * @file Scheduler.hpp
 * @brief Injectable, cancellable scheduled-task primitive.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace scribeline::domain {

/**
 * @class Scheduler
 * @brief Runs tasks after a delay on a single logical thread.
 *
 * Tasks never run concurrently with each other. Production code uses the event loop;
 * tests use a manual clock so tick counts and backoff delays can be asserted exactly.
 */
class Scheduler {
public:
    using TaskId = std::uint64_t;
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    virtual ~Scheduler() = default;

    /** @brief Queues a task to run once the delay has elapsed. Returns a handle for cancel(). */
    virtual TaskId schedule(std::chrono::milliseconds delay, Task task) = 0;

    /** @brief Drops a pending task. Returns false if it already ran or was never scheduled. */
    virtual bool cancel(TaskId id) = 0;

    virtual Clock::time_point now() const = 0;
};

} // namespace scribeline::domain
