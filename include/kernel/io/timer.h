/**
 * @file timer.h
 * @brief *Intel 8253* Programmable Interval Timer.
 *
 * @par GitHub
 * https://github.com/Zhuagenborn
 */

#pragma once

#include "kernel/interrupt/intr.h"
#include "kernel/krnl.h"
#include "kernel/task/task.h"

namespace io {

/**
 * @brief Initialize the timer.
 *
 * @param freq_per_second The number of timer interrupts per second.
 */
void InitTimer(stl::size_t freq_per_second = timer_freq_per_second) noexcept;

bool IsTimerInited() noexcept;

//! Get the number of ticks after the timer is initialized.
stl::size_t GetTicks() noexcept;

/**
 * @brief Register a waker that will be woken at the next tick.
 *
 * @details
 * Only one waker can be registered. A new one replaces the old one.
 */
void RegisterTickWaker(const task::Waker&) noexcept;

/**
 * @brief The timer interrupt handler.
 *
 * @details
 * It increases ticks, wakes the tick waiter and acknowledges the interrupt.
 */
void TimerIntrHandler(const intr::IntrStack&) noexcept;

/**
 * @brief The task printing a heartbeat message periodically.
 *
 * @details
 * It never completes. It is woken at every tick and prints a message once per period.
 */
class HeartbeatTask : public task::Task {
public:
    //! @param period The number of ticks between two messages.
    explicit HeartbeatTask(stl::size_t period = heartbeat_period_ticks) noexcept;

    task::PollResult Poll(const task::Waker&) noexcept override;

    //! Get the number of printed messages.
    stl::size_t GetBeatCount() const noexcept;

private:
    stl::size_t period_;
    stl::size_t last_tick_ {0};
    stl::size_t beat_count_ {0};
    bool started_ {false};
};

}  // namespace io
