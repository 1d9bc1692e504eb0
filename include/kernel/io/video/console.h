/**
 * @file console.h
 * @brief The console writing to the VGA text screen and the COM1 serial port.
 *
 * @par GitHub
 * https://github.com/Zhuagenborn
 */

#pragma once

#include "kernel/stl/cstdint.h"

namespace io {

//! The screen width in VGA text mode.
inline constexpr stl::size_t text_screen_width {80};
//! The screen height in VGA text mode.
inline constexpr stl::size_t text_screen_height {25};

/**
 * @brief Initialize the console.
 *
 * @details
 * Before initialization, characters are only written to the serial port.
 *
 * @param phy_mem_offset The virtual address where the boot loader maps all physical memory.
 */
void InitConsole(stl::uintptr_t phy_mem_offset) noexcept;

}  // namespace io
