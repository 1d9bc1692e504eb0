/**
 * The global descriptor table.
 */

#pragma once

#include "kernel/descriptor/desc.h"
#include "kernel/descriptor/gdt/idx.h"

namespace gdt {

/**
 * @brief The global descriptor table.
 *
 * @details
 * The boot loader leaves a temporary table in place.
 * The kernel builds its own one in a built-in array and switches to it.
 */
using GlobalDescTab = desc::DescTabArray<desc::SegDesc, count>;

//! Get the global descriptor table register.
desc::DescTabReg GetGlobalDescTabReg() noexcept;

//! Get the global descriptor table.
GlobalDescTab& GetGlobalDescTab() noexcept;

/**
 * @brief Build and load the global descriptor table and the task state segment.
 *
 * @details
 * 1. Create kernel descriptors for 64-bit code and data.
 * 2. Create a descriptor for the task state segment,
 *    whose interrupt stack table refers to the double fault stack.
 * 3. Load the table and reload segment registers.
 * 4. Load the task register.
 */
void InitGlobalDescTab() noexcept;

//! Whether the global descriptor table has been installed.
bool IsGlobalDescTabInstalled() noexcept;

}  // namespace gdt
