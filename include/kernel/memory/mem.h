/**
 * @file mem.h
 * @brief Memory management.
 *
 * @par GitHub
 * https://github.com/Zhuagenborn
 */

#pragma once

#include "kernel/boot/boot_info.h"
#include "kernel/memory/frame.h"
#include "kernel/memory/heap.h"
#include "kernel/memory/page.h"

namespace mem {

/**
 * @brief Initialize memory management.
 *
 * @details
 * 1. The physical frame allocator over the boot memory map.
 * 2. The page mapper over the active level-4 page table in @p CR3.
 * 3. The kernel heap.
 *
 * The system halts if the memory map is malformed or the heap cannot be mapped.
 */
void InitMem(const boot::BootInfo&) noexcept;

//! Whether memory management has been initialized.
bool IsMemInited() noexcept;

//! Get the kernel physical frame allocator.
FrameAllocator& GetFrameAllocator() noexcept;

//! Get the kernel page mapper.
PageMapper& GetPageMapper() noexcept;

}  // namespace mem
