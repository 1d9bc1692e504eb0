/**
 * The runtime support required by the compiler in a freestanding kernel image.
 */

#include "kernel/debug/assert.h"
#include "kernel/memory/heap.h"
#include "kernel/stl/cstring.h"

#include <new>

extern "C" {

void* memset(void* const dest, const int val, const stl::size_t size) noexcept {
    stl::memset(dest, static_cast<stl::byte>(val), size);
    return dest;
}

void* memcpy(void* const dest, const void* const src, const stl::size_t size) noexcept {
    stl::memcpy(dest, src, size);
    return dest;
}

void* memmove(void* const dest, const void* const src, const stl::size_t size) noexcept {
    stl::memmove(dest, src, size);
    return dest;
}

int memcmp(const void* const lhs, const void* const rhs, const stl::size_t size) noexcept {
    return stl::memcmp(lhs, rhs, size);
}

//! Called when a pure virtual method is called.
void __cxa_pure_virtual() noexcept {
    dbg::Panic("A pure virtual method is called");
}

void* __dso_handle {nullptr};

//! The kernel never exits, so destructors of static objects are never registered.
int __cxa_atexit(void (*)(void*), void*, void*) noexcept {
    return 0;
}
}

namespace {

void* AllocateFromKrnlHeap(const stl::size_t size) noexcept {
    auto* const addr {mem::GetKrnlHeap().Allocate(size)};
    if (!addr) {
        dbg::Panic("The kernel heap is exhausted");
    }

    return addr;
}

}  // namespace

void* operator new(const stl::size_t size) {
    return AllocateFromKrnlHeap(size);
}

void* operator new[](const stl::size_t size) {
    return AllocateFromKrnlHeap(size);
}

void operator delete(void* const addr, const stl::size_t size) noexcept {
    if (addr) {
        mem::GetKrnlHeap().Free(addr, size);
    }
}

void operator delete[](void* const addr, const stl::size_t size) noexcept {
    if (addr) {
        mem::GetKrnlHeap().Free(addr, size);
    }
}

// The heap needs the original size to free memory.
void operator delete(void* const addr) noexcept {
    if (addr) {
        dbg::Panic("Memory cannot be freed without its size");
    }
}

void operator delete[](void* const addr) noexcept {
    if (addr) {
        dbg::Panic("Memory cannot be freed without its size");
    }
}
