/**
 * @file io.h
 * @brief Port I/O and register control.
 *
 * @par GitHub
 * https://github.com/Zhuagenborn
 */

#pragma once

#include "kernel/stl/cstdint.h"
#include "kernel/util/bit.h"

namespace io {

//! The @p RFLAGS register.
class RFlags {
public:
    static RFlags Get() noexcept;

    constexpr RFlags(const stl::uint64_t val = 0) noexcept : val_ {val} {
        SetMbs();
    }

    constexpr operator stl::uint64_t() const noexcept {
        return val_;
    }

    //! Whether interrupts are enabled.
    constexpr bool If() const noexcept {
        return bit::IsBitSet(val_, if_pos);
    }

    constexpr RFlags& SetIf() noexcept {
        bit::SetBit(val_, if_pos);
        return *this;
    }

    constexpr RFlags& ResetIf() noexcept {
        bit::ResetBit(val_, if_pos);
        return *this;
    }

private:
    static constexpr stl::size_t if_pos {9};

    //! The bit @p 1 is always set.
    constexpr RFlags& SetMbs() noexcept {
        bit::SetBit(val_, 1);
        return *this;
    }

    stl::uint64_t val_;
};

static_assert(sizeof(RFlags) == sizeof(stl::uint64_t));

extern "C" {

//! Get the value of @p CR2, the address that caused the last page fault.
stl::uint64_t GetCr2() noexcept;

//! Get the value of @p CR3, the physical address of the active level-4 page table.
stl::uint64_t GetCr3() noexcept;

//! Invalidate the Translation Lookaside Buffer (TLB) entry of a virtual address.
void InvalidateTlbEntry(stl::uintptr_t vr_addr) noexcept;

//! Write a byte to a port.
void WriteByteToPort(stl::uint16_t port, stl::byte data) noexcept;

//! Read a byte from a port.
stl::byte ReadByteFromPort(stl::uint16_t port) noexcept;

//! Stop the processor until the next interrupt.
void Halt() noexcept;

/**
 * @brief Enable interrupts and stop the processor until the next interrupt.
 *
 * @details
 * @p sti delays interrupts until the next instruction completes,
 * so an interrupt cannot slip in between enabling interrupts and @p hlt.
 */
void EnableIntrAndHalt() noexcept;

//! Raise a breakpoint exception by @p int3.
void Breakpoint() noexcept;
}

}  // namespace io
