/**
 * String formatting.
 */

#pragma once

#include "kernel/stl/cstdint.h"

//! The maximum length of a 64-bit unsigned integer in binary.
inline constexpr stl::size_t max_uint_str_len {64};

/**
 * @brief Convert an unsigned integer to a string and write it to a buffer.
 *
 * @param buf A buffer that can hold at least @p max_uint_str_len + 1 characters.
 * @param num An unsigned integer.
 * @param base The numeral base, from 2 to 16.
 * @return The length of the string, without the terminating null character.
 */
stl::size_t ConvertUIntToString(char* buf, stl::uint64_t num, stl::size_t base = 10) noexcept;
