/**
 * @file task.h
 * @brief Cooperative tasks.
 *
 * @par GitHub
 * https://github.com/Zhuagenborn
 */

#pragma once

#include "kernel/task/waker.h"

namespace task {

//! Results of polling a task.
enum class PollResult {
    //! The task is waiting for an event. It will be polled again after its waker is woken.
    Pending,
    //! The task has finished.
    Complete
};

/**
 * @brief The cooperative task.
 *
 * @details
 * A task keeps its progress in its own state and runs a step each time it is polled.
 * It must never block. If it cannot make progress, it registers the waker somewhere an event source can reach,
 * then returns @p PollResult::Pending.
 *
 * @code
 *   Executor                Task                   Interrupt Handler
 *      │                      │                           │
 *      │─── Poll(waker) ─────►│                           │
 *      │                      │─── Register(waker) ──────►│
 *      │◄──── Pending ────────│                           │
 *      │                      │                           │
 *      │◄────────────────── waker.Wake() ─────────────────│
 *      │─── Poll(waker) ─────►│                           │
 *      │◄──── Complete ───────│                           │
 * @endcode
 */
class Task {
public:
    virtual ~Task() noexcept = default;

    /**
     * @brief Run the task until it finishes or waits.
     *
     * @param waker The waker that schedules the task again.
     */
    virtual PollResult Poll(const Waker& waker) noexcept = 0;

protected:
    Task() noexcept = default;
};

}  // namespace task
