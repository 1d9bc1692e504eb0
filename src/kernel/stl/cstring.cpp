#include "kernel/stl/cstring.h"
#include "kernel/debug/assert.h"

namespace stl {

void memset(void* const addr, const byte val, const size_t size) noexcept {
    dbg::Assert(addr || size == 0);
    auto dest {static_cast<volatile byte*>(addr)};
    for (size_t i {0}; i != size; ++i) {
        dest[i] = val;
    }
}

void memcpy(void* const dest, const void* const src, const size_t size) noexcept {
    dbg::Assert((dest && src) || size == 0);
    for (size_t i {0}; i != size; ++i) {
        *(static_cast<byte*>(dest) + i) = *(static_cast<const byte*>(src) + i);
    }
}

void memmove(void* const dest, const void* const src, const size_t size) noexcept {
    dbg::Assert((dest && src) || size == 0);
    const auto to {static_cast<byte*>(dest)};
    const auto from {static_cast<const byte*>(src)};
    if (to < from) {
        for (size_t i {0}; i != size; ++i) {
            to[i] = from[i];
        }
    } else {
        for (auto i {size}; i != 0; --i) {
            to[i - 1] = from[i - 1];
        }
    }
}

int memcmp(const void* const lhs, const void* const rhs, const size_t size) noexcept {
    dbg::Assert((lhs && rhs) || size == 0);
    for (size_t i {0}; i != size; ++i) {
        const auto v1 {*(static_cast<const byte*>(lhs) + i)};
        const auto v2 {*(static_cast<const byte*>(rhs) + i)};
        if (v1 != v2) {
            return v1 > v2 ? 1 : -1;
        }
    }

    return 0;
}

}  // namespace stl
