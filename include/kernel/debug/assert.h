/**
 * @file assert.h
 * @brief Diagnostics tools.
 *
 * @par GitHub
 * https://github.com/Zhuagenborn
 */

#pragma once

#include "kernel/stl/source_location.h"
#include "kernel/stl/string_view.h"

namespace dbg {

#ifdef NDEBUG
inline constexpr bool enabled {false};
#else
inline constexpr bool enabled {true};
#endif

/**
 * @brief
 * Check for a condition.
 * If it is @p false, the method displays a message, shows the source code information and halts the system.
 *
 * @param cond A condition to evaluate.
 * @param msg An optional message to display.
 * @param src The source code information. The developer should not change this parameter.
 */
void Assert(bool cond, stl::string_view msg = nullptr,
            const stl::source_location& src = stl::source_location::current()) noexcept;

/**
 * @brief Display a message, show the source code information and halt the system.
 *
 * @details
 * Unlike @p Assert, it cannot be disabled by @p NDEBUG.
 * It is used for unrecoverable conditions, such as a malformed boot memory map.
 */
[[noreturn]] void Panic(stl::string_view msg,
                        const stl::source_location& src = stl::source_location::current()) noexcept;

/**
 * @brief Halt the system forever.
 *
 * @details
 * Interrupts are disabled and pending output is flushed before the processor stops.
 */
[[noreturn]] void HaltSystem() noexcept;

}  // namespace dbg
