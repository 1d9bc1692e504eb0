/**
 * @file waker.h
 * @brief Task wakers and the wake queue.
 *
 * @par GitHub
 * https://github.com/Zhuagenborn
 */

#pragma once

#include "kernel/util/ring_queue.h"

namespace task {

//! The unique ID of a task.
using TaskId = stl::uint64_t;

//! The ID returned when a task cannot be spawned.
inline constexpr TaskId invalid_task_id {0};

/**
 * @brief The queue of IDs of ready tasks.
 *
 * @details
 * It is pushed by wakers in normal or interrupt context and popped only by the executor.
 */
using WakeQueue = RingQueue<TaskId>;

//! The wake queue with a built-in buffer.
template <stl::size_t capacity>
using FixedWakeQueue = RingQueueArray<TaskId, capacity>;

/**
 * @brief The waker of a task.
 *
 * @details
 * Waking a task pushes its ID into the wake queue, so it can be used in interrupt handlers.
 */
class Waker {
public:
    Waker() noexcept = default;

    Waker(WakeQueue& queue, const TaskId id) noexcept : queue_ {&queue}, id_ {id} {}

    /**
     * @brief Schedule the task again.
     *
     * @return Whether the task has been scheduled. It fails if the wake queue is full.
     */
    bool Wake() const noexcept;

    TaskId GetTaskId() const noexcept {
        return id_;
    }

    bool IsValid() const noexcept {
        return queue_ && id_ != invalid_task_id;
    }

private:
    WakeQueue* queue_ {nullptr};
    TaskId id_ {invalid_task_id};
};

/**
 * @brief The slot holding at most one waker.
 *
 * @details
 * A task registers its waker before waiting for an event.
 * The event source wakes and clears the slot when the event occurs.
 * A newly registered waker replaces the old one.
 */
class WakerSlot {
public:
    WakerSlot() noexcept = default;

    WakerSlot(const WakerSlot&) = delete;

    //! Register a waker.
    WakerSlot& Register(const Waker&) noexcept;

    /**
     * @brief Wake and clear the registered waker.
     *
     * @return Whether a waker was registered and its task has been scheduled.
     */
    bool Wake() noexcept;

    bool IsEmpty() const noexcept;

private:
    Waker waker_ {};
    bool registered_ {false};
};

}  // namespace task
