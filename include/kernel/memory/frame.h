/**
 * @file frame.h
 * @brief The physical frame allocator.
 *
 * @par GitHub
 * https://github.com/Zhuagenborn
 */

#pragma once

#include "kernel/boot/boot_info.h"
#include "kernel/memory/page.h"

namespace mem {

/**
 * @brief The physical frame allocator.
 *
 * @details
 * It hands out page-aligned frames from usable regions of the boot memory map in a forward order.
 * A usable frame overlapping any non-usable region is skipped.
 * Frames cannot be freed, so a frame is never returned twice.
 *
 * @code
 *              Region Cursor
 *                   │
 *   ┌──────────┬────▼─────────────┬──────────┬──────────────┐
 *   │  Usable  │      Usable      │ Reserved │    Usable    │
 *   └──────────┴──────────▲───────┴──────────┴──────────────┘
 *     Exhausted           │
 *                    Next Frame
 * @endcode
 */
class FrameAllocator {
public:
    FrameAllocator() noexcept = default;

    //! Create an allocator over a memory map.
    explicit FrameAllocator(const boot::MemMap&) noexcept;

    FrameAllocator(const FrameAllocator&) = delete;

    /**
     * @brief Reset the allocator to a memory map.
     *
     * @warning
     * The map must stay alive while the allocator is used.
     * The system halts if the map is malformed.
     */
    FrameAllocator& Init(const boot::MemMap&) noexcept;

    //! Allocate a frame, or get nothing if usable memory is exhausted.
    stl::optional<Frame> AllocFrame() noexcept;

    //! Get the number of frames that have been allocated.
    stl::size_t GetAllocatedCount() const noexcept;

    bool IsInited() const noexcept;

private:
    //! Whether a frame overlaps a non-usable region.
    bool IsReserved(stl::uintptr_t frame) const noexcept;

    boot::MemMap map_ {};
    stl::size_t region_idx_ {0};
    stl::uintptr_t next_frame_ {0};
    stl::size_t allocated_count_ {0};
};

}  // namespace mem
