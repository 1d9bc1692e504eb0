/**
 * @file idx.h
 * @brief Global descriptor indexes.
 *
 * @par GitHub
 * https://github.com/Zhuagenborn
 */

#pragma once

#include "kernel/stl/cstdint.h"

namespace gdt {

//! The number of global descriptor slots.
inline constexpr stl::size_t count {5};

namespace idx {

//! The kernel descriptor for code.
inline constexpr stl::size_t krnl_code {1};
//! The kernel descriptor for data.
inline constexpr stl::size_t krnl_data {2};
/**
 * @brief The kernel descriptor for the task state segment.
 *
 * @details
 * It is a 16-byte system descriptor and also occupies the next slot.
 */
inline constexpr stl::size_t tss {3};

}  // namespace idx

}  // namespace gdt
