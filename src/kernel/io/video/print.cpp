#include "kernel/io/video/print.h"
#include "kernel/util/format.h"

namespace io {

void PrintlnStr(const stl::string_view str) noexcept {
    PrintStr(str);
    PrintChar('\n');
}

void PrintStr(const stl::string_view str) noexcept {
    for (const auto ch : str) {
        PrintChar(ch);
    }
}

void PrintHex(const stl::uint64_t num) noexcept {
    char buf[max_uint_str_len + 1] {};
    PrintStr({buf, ConvertUIntToString(buf, num, 16)});
}

void PrintHex(const stl::int64_t num) noexcept {
    if (num >= 0) {
        PrintHex(static_cast<stl::uint64_t>(num));
    } else {
        PrintChar('-');
        PrintHex(static_cast<stl::uint64_t>(-num));
    }
}

namespace _printf_impl {

void Print(const stl::uint64_t num) noexcept {
    PrintHex(num);
}

void Print(const stl::uint32_t num) noexcept {
    PrintHex(static_cast<stl::uint64_t>(num));
}

void Print(const stl::int64_t num) noexcept {
    PrintHex(num);
}

void Print(const stl::int32_t num) noexcept {
    PrintHex(static_cast<stl::int64_t>(num));
}

void Print(const char ch) noexcept {
    PrintChar(ch);
}

void Print(const stl::string_view str) noexcept {
    PrintStr(str);
}

void Print(const char* const str) noexcept {
    PrintStr(str);
}

void Printf(const stl::string_view format) noexcept {
    PrintStr(format);
}

}  // namespace _printf_impl

}  // namespace io
