/**
 * @file boot_info.h
 * @brief Information passed by the boot loader.
 *
 * @par GitHub
 * https://github.com/Zhuagenborn
 */

#pragma once

#include "kernel/stl/cstdint.h"
#include "kernel/stl/span.h"

namespace boot {

//! Types of physical memory regions.
enum class MemRegionType : stl::uint32_t {
    //! Free memory that can be allocated by the kernel.
    Usable,
    //! Memory reserved by hardware or firmware.
    Reserved,
    //! The kernel image.
    Kernel,
    //! The stack used by the kernel at startup.
    KernelStack,
    //! Page tables created by the boot loader.
    PageTable,
    //! The boot loader.
    Bootloader,
    //! The boot information.
    BootInfo,
    //! The first physical frame, which is never allocated.
    FrameZero,
    //! Memory that can be reused after ACPI tables have been read.
    AcpiReclaimable,
    //! Memory reserved for ACPI non-volatile storage.
    AcpiNvs,
    //! Defective memory.
    BadMemory
};

//! A physical memory region `[start, end)`.
struct MemRegion {
    constexpr stl::size_t GetSize() const noexcept {
        return end - start;
    }

    constexpr bool IsUsable() const noexcept {
        return type == MemRegionType::Usable;
    }

    constexpr bool IsValid() const noexcept {
        return start < end;
    }

    //! Whether the region overlaps `[begin, begin + size)`.
    constexpr bool Overlaps(const stl::uintptr_t begin, const stl::size_t size) const noexcept {
        return begin < end && start < begin + size;
    }

    stl::uintptr_t start;
    stl::uintptr_t end;
    MemRegionType type;
};

//! The physical memory map.
struct MemMap {
    stl::span<const MemRegion> GetRegions() const noexcept {
        return {regions, count};
    }

    /**
     * @brief Whether the map is well-formed.
     *
     * @details
     * It must contain at least one region and every region must be non-empty.
     */
    bool IsValid() const noexcept;

    const MemRegion* regions;
    stl::size_t count;
};

//! The boot information.
struct BootInfo {
    MemMap mem_map;

    /**
     * @brief The virtual offset where the boot loader has mapped all physical memory.
     *
     * @details
     * A physical address @p p can be accessed at the virtual address `p + phy_mem_offset`.
     */
    stl::uintptr_t phy_mem_offset;
};

}  // namespace boot
