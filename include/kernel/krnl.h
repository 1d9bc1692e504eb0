/**
 * @file krnl.h
 * @brief Basic kernel configurations.
 *
 * @par GitHub
 * https://github.com/Zhuagenborn
 */

#pragma once

#include "kernel/util/metric.h"

namespace boot {
struct BootInfo;
}

//! The virtual base address of the kernel heap.
inline constexpr stl::uintptr_t krnl_heap_base {0x0000'4444'4444'0000};

//! The size of the kernel heap in bytes.
inline constexpr stl::size_t krnl_heap_size {KB(100)};

//! The size of the stack reserved for the double fault handler.
inline constexpr stl::size_t double_fault_stack_size {KB(20)};

//! The number of timer interrupts per second.
inline constexpr stl::size_t timer_freq_per_second {100};

//! The capacity of the executor's wake queue.
inline constexpr stl::size_t wake_queue_capacity {100};

//! The capacity of the keyboard scancode queue.
inline constexpr stl::size_t scancode_queue_capacity {100};

//! The number of ticks between two heartbeat messages.
inline constexpr stl::size_t heartbeat_period_ticks {timer_freq_per_second};

enum class Privilege {
    //! The kernel.
    Zero = 0,
    //! Users.
    Three = 3
};

/**
 * @brief Initialize the kernel.
 *
 * @details
 * Components are initialized in a strict order:
 * 1. The global descriptor table and the task state segment.
 * 2. The interrupt descriptor table and the interrupt controllers.
 * 3. The physical frame allocator.
 * 4. The page mapper.
 * 5. The kernel heap.
 * 6. The timer and the keyboard.
 *
 * Interrupts are enabled at the end.
 */
void InitKernel(const boot::BootInfo&) noexcept;
