#include "kernel/util/format.h"
#include "kernel/debug/assert.h"

stl::size_t ConvertUIntToString(char* const buf, const stl::uint64_t num,
                                const stl::size_t base) noexcept {
    dbg::Assert(buf);
    dbg::Assert(base >= 2 && base <= 16);
    const auto digit {num % base};
    const auto remain {num / base};
    stl::size_t len {0};
    if (remain > 0) {
        len = ConvertUIntToString(buf, remain, base);
    }

    buf[len] = static_cast<char>(digit < 10 ? digit + '0' : digit - 10 + 'A');
    buf[len + 1] = '\0';
    return len + 1;
}
