#pragma once

#include "kernel/stl/cstdint.h"

namespace stl {

constexpr size_t strlen(const char* const str) noexcept {
    size_t len {0};
    if (str) {
        while (str[len] != '\0') {
            ++len;
        }
    }
    return len;
}

void memset(void* addr, byte val, size_t size) noexcept;

void memcpy(void* dest, const void* src, size_t size) noexcept;

//! Copy memory. The source and the destination can overlap.
void memmove(void* dest, const void* src, size_t size) noexcept;

int memcmp(const void* lhs, const void* rhs, size_t size) noexcept;

}  // namespace stl
