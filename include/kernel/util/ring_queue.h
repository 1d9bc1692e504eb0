/**
 * @file ring_queue.h
 * @brief The interrupt-safe ring queue.
 *
 * @par GitHub
 * https://github.com/Zhuagenborn
 */

#pragma once

#include "kernel/debug/assert.h"
#include "kernel/interrupt/intr.h"
#include "kernel/stl/array.h"
#include "kernel/stl/atomic.h"
#include "kernel/stl/optional.h"
#include "kernel/stl/utility.h"

/**
 * @brief The bounded queue based on a circular buffer.
 *
 * @details
 * For a queue of capacity @p n, the circular buffer has `n + 1` slots.
 * When the queue is empty, `head == tail`.
 * When the queue is full, `head + 1 == tail`.
 *
 * There can be producers in both normal and interrupt context, but only one consumer in normal context.
 * Pushing disables interrupts, so a push in normal context cannot interleave with a push in an interrupt handler.
 * Popping never blocks and only changes the tail.
 *
 * @warning
 * This queue only works on a single-core processor.
 * It does not own its buffer. Developers should use @p RingQueueArray.
 */
template <typename T>
class RingQueue {
public:
    RingQueue(const RingQueue&) = delete;

    //! Get the maximum number of elements.
    stl::size_t GetCapacity() const noexcept {
        return slot_count_ - 1;
    }

    stl::size_t GetSize() const noexcept {
        const auto head {head_.load(stl::memory_order::acquire)};
        const auto tail {tail_.load(stl::memory_order::acquire)};
        return (head + slot_count_ - tail) % slot_count_;
    }

    bool IsFull() const noexcept {
        return GetNextPos(head_.load(stl::memory_order::acquire))
               == tail_.load(stl::memory_order::acquire);
    }

    bool IsEmpty() const noexcept {
        return head_.load(stl::memory_order::acquire) == tail_.load(stl::memory_order::acquire);
    }

    /**
     * @brief Push an object into the queue.
     *
     * @return Whether the object has been pushed. If the queue is full, the object is dropped.
     */
    bool TryPush(T val) noexcept {
        const intr::IntrGuard guard;
        const auto head {head_.load(stl::memory_order::relaxed)};
        const auto next {GetNextPos(head)};
        if (next == tail_.load(stl::memory_order::acquire)) {
            return false;
        }

        slots_[head] = stl::move(val);
        // Publish the slot after it has been written.
        head_.store(next, stl::memory_order::release);
        return true;
    }

    //! Pop an object from the queue if it is not empty.
    stl::optional<T> TryPop() noexcept {
        const auto tail {tail_.load(stl::memory_order::relaxed)};
        if (tail == head_.load(stl::memory_order::acquire)) {
            return stl::nullopt;
        }

        const stl::optional<T> val {slots_[tail]};
        tail_.store(GetNextPos(tail), stl::memory_order::release);
        return val;
    }

protected:
    RingQueue() noexcept = default;

    ~RingQueue() noexcept = default;

    /**
     * @brief Attach the queue to a buffer.
     *
     * @param slots A buffer of at least two slots. One slot is always unused.
     * @param slot_count The number of slots.
     */
    void Init(T* const slots, const stl::size_t slot_count) noexcept {
        dbg::Assert(slots && slot_count > 1);
        slots_ = slots;
        slot_count_ = slot_count;
    }

private:
    stl::size_t GetNextPos(const stl::size_t pos) const noexcept {
        return (pos + 1) % slot_count_;
    }

    T* slots_ {nullptr};
    stl::size_t slot_count_ {1};
    stl::atomic<stl::size_t> head_ {0};
    stl::atomic<stl::size_t> tail_ {0};
};

//! The ring queue that uses a built-in array to store objects.
template <typename T, stl::size_t n>
class RingQueueArray : public RingQueue<T> {
    static_assert(n > 0);

public:
    RingQueueArray() noexcept {
        this->Init(buf_.data(), buf_.size());
    }

private:
    stl::array<T, n + 1> buf_;
};
