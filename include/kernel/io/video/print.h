/**
 * @file print.h
 * @brief Text printing.
 *
 * @details
 * All diagnostics of the kernel are written through @p PrintChar.
 * The kernel image writes characters to the VGA text buffer and the serial port.
 *
 * @par GitHub
 * https://github.com/Zhuagenborn
 */

#pragma once

#include "kernel/stl/cstdint.h"
#include "kernel/stl/string_view.h"

namespace io {

//! Print a string with a new line.
void PrintlnStr(stl::string_view) noexcept;

//! Print a string.
void PrintStr(stl::string_view) noexcept;

//! Print an unsigned hexadecimal integer.
void PrintHex(stl::uint64_t) noexcept;

//! Print a hexadecimal integer.
void PrintHex(stl::int64_t) noexcept;

extern "C" {

//! Print a character.
void PrintChar(char) noexcept;

//! Wait until all printed characters have left the output devices.
void FlushOutput() noexcept;
}

namespace _printf_impl {

void Print(stl::uint64_t) noexcept;

void Print(stl::uint32_t) noexcept;

void Print(stl::int64_t) noexcept;

void Print(stl::int32_t) noexcept;

void Print(char) noexcept;

void Print(stl::string_view) noexcept;

void Print(const char*) noexcept;

void Printf(stl::string_view) noexcept;

template <typename Arg, typename... Args>
void Printf(const stl::string_view format, const Arg arg, const Args... args) noexcept {
    for (stl::size_t i {0}; i != format.size(); ++i) {
        if (format[i] == '{' && i + 1 != format.size() && format[i + 1] == '}') {
            Print(arg);
            return Printf(format.substr(i + 2), args...);
        } else {
            Print(format[i]);
        }
    }
}

}  // namespace _printf_impl

/**
 * @brief Print variadic values.
 *
 * @param format
 * A format string with a number of @p {}.
 * They will be replaced by the string representations of the arguments.
 * The following types are supported:
 * - `const char*`
 * - `char`
 * - `stl::string_view`
 * - Integers, printed in hexadecimal without a prefix.
 * @param args Variadic arguments to be printed.
 */
template <typename... Args>
void Printf(const stl::string_view format, const Args... args) noexcept {
    _printf_impl::Printf(format, args...);
}

}  // namespace io
