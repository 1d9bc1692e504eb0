/**
 * @file tss.h
 * @brief The task state segment.
 *
 * @par GitHub
 * https://github.com/Zhuagenborn
 */

#pragma once

#include "kernel/stl/cstdint.h"

namespace tss {

//! The number of entries in the interrupt stack table.
inline constexpr stl::size_t intr_stack_count {7};

/**
 * @brief The interrupt stack table index used by the double fault gate.
 *
 * @details
 * Indexes in gate descriptors start from @p 1. @p 0 means the current stack is used.
 */
inline constexpr stl::size_t double_fault_stack_idx {1};

#pragma pack(push, 1)

/**
 * @brief The 64-bit task state segment.
 *
 * @details
 * In IA-32e mode, hardware task switching is not supported.
 * The task state segment only holds stack pointers:
 * - The stacks used when the privilege level changes.
 * - The interrupt stack table. An interrupt gate can refer to one of its entries,
 *   then the CPU always switches to that stack before calling the handler.
 *   A double fault caused by a kernel stack overflow can still be handled on a known-good stack.
 */
struct TaskStateSeg {
    //! Set an entry of the interrupt stack table, starting from @p 1.
    TaskStateSeg& SetIntrStack(stl::size_t idx, stl::uintptr_t top) noexcept;

    //! Get an entry of the interrupt stack table, starting from @p 1.
    stl::uintptr_t GetIntrStack(stl::size_t idx) const noexcept;

    stl::uint32_t reserved_0;
    stl::uint64_t rsp[3];
    stl::uint64_t reserved_1;
    stl::uint64_t ist[intr_stack_count];
    stl::uint64_t reserved_2;
    stl::uint16_t reserved_3;
    stl::uint16_t io_base;
};

#pragma pack(pop)

static_assert(sizeof(TaskStateSeg) == 104);

/**
 * @brief Get the task state segment.
 *
 * @details
 * There is only one processor, so the kernel needs only one task state segment.
 */
TaskStateSeg& GetTaskStateSeg() noexcept;

//! Get the top address of the stack reserved for the double fault handler.
stl::uintptr_t GetDoubleFaultStackTop() noexcept;

//! Get the bottom address of the stack reserved for the double fault handler.
stl::uintptr_t GetDoubleFaultStackBottom() noexcept;

}  // namespace tss
