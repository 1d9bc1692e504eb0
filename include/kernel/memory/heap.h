/**
 * @file heap.h
 * @brief The kernel heap allocator.
 *
 * @par GitHub
 * https://github.com/Zhuagenborn
 */

#pragma once

#include "kernel/memory/page.h"

namespace mem {

class FrameAllocator;

//! The sizes of fixed-size blocks.
inline constexpr stl::size_t heap_size_classes[] {8, 16, 32, 64, 128, 256, 512, 1024, 2048};
//! The number of size classes.
inline constexpr stl::size_t heap_size_class_count {sizeof(heap_size_classes)
                                                    / sizeof(stl::size_t)};

//! The default alignment of heap memory.
inline constexpr stl::size_t heap_default_align {16};

/**
 * @brief The heap allocator.
 *
 * @details
 * It manages a fixed range of mapped virtual memory with three strategies:
 * - Small requests are served by size classes from @p 8 to @p 2048 bytes.
 *   A request uses the smallest class not less than its size and alignment.
 *   Freed blocks are kept in the singly-linked free list of their class.
 * - Large requests search an address-ordered list of free regions with the first-fit policy.
 *   The remainders of a region are split into new free regions.
 * - Untouched memory is served by a bump pointer.
 *   Freeing a large block that ends at the bump pointer moves the pointer backwards.
 *
 * @code
 *  Base                         Bump                    End
 *   ┌──────┬──────┬──────┬──────┬───────────────────────┐
 *   │ Used │ Free │ Used │ Free │       Untouched       │
 *   └──────┴──────┴──────┴──────┴───────────────────────┘
 * @endcode
 *
 * @warning
 * It is not re-entrant and cannot be used in interrupt handlers.
 */
class HeapAllocator {
public:
    HeapAllocator() noexcept = default;

    HeapAllocator(const HeapAllocator&) = delete;

    /**
     * @brief Initialize the allocator over a range of mapped memory.
     *
     * @param base The start address, aligned to the page size.
     * @param size The size in bytes.
     */
    HeapAllocator& Init(stl::uintptr_t base, stl::size_t size) noexcept;

    /**
     * @brief Allocate memory.
     *
     * @param size The size in bytes.
     * @param align The alignment, which must be a power of two.
     * @return The allocated memory, or @p nullptr if the heap is exhausted.
     */
    void* Allocate(stl::size_t size, stl::size_t align = heap_default_align) noexcept;

    /**
     * @brief Free memory.
     *
     * @param addr Memory returned by @p Allocate.
     * @param size The size used to allocate it.
     * @param align The alignment used to allocate it.
     */
    void Free(void* addr, stl::size_t size, stl::size_t align = heap_default_align) noexcept;

    //! Get the number of bytes that are allocated and not freed yet.
    stl::size_t GetUsedSize() const noexcept;

    stl::uintptr_t GetBase() const noexcept;

    stl::size_t GetSize() const noexcept;

    //! Whether an address is in the heap range.
    bool Contains(const void* addr) const noexcept;

    bool IsInited() const noexcept;

private:
    //! A freed block of a size class.
    struct FreeBlock {
        FreeBlock* next;
    };

    //! A freed large block.
    struct FreeRegion {
        stl::uintptr_t GetEnd() const noexcept {
            return reinterpret_cast<stl::uintptr_t>(this) + size;
        }

        stl::size_t size;
        FreeRegion* next;
    };

    static constexpr stl::size_t npos_class {heap_size_class_count};

    //! Get the index of the size class used by a request, or @p npos_class if it is large.
    static stl::size_t FindSizeClass(stl::size_t size, stl::size_t align) noexcept;

    //! Get the size of a large block, which is rounded up to the size of a region header.
    static stl::size_t CalcLargeSize(stl::size_t size) noexcept;

    void* AllocFromBump(stl::size_t size, stl::size_t align) noexcept;

    void* AllocLarge(stl::size_t size, stl::size_t align) noexcept;

    void FreeLarge(stl::uintptr_t addr, stl::size_t size) noexcept;

    //! Insert a free region into the address-ordered list and merge it with its neighbors.
    void InsertFreeRegion(stl::uintptr_t addr, stl::size_t size) noexcept;

    stl::array<FreeBlock*, heap_size_class_count> free_blocks_ {};
    FreeRegion* free_regions_ {nullptr};
    stl::uintptr_t base_ {0};
    stl::uintptr_t end_ {0};
    stl::uintptr_t bump_ {0};
    stl::size_t used_size_ {0};
};

/**
 * @brief Map the kernel heap range and initialize the kernel heap.
 *
 * @details
 * Every page in the range is mapped as present and writable before the allocator is initialized.
 *
 * @return The first mapping error, or @p MapError::None on success.
 */
MapError InitHeap(PageMapper&, FrameAllocator&) noexcept;

/**
 * @brief Map a range of virtual memory to newly allocated frames.
 *
 * @param base The start address, aligned to the page size.
 * @param size The size in bytes.
 */
MapError MapHeapRange(stl::uintptr_t base, stl::size_t size, PageMapper&,
                      FrameAllocator&) noexcept;

//! Get the kernel heap.
HeapAllocator& GetKrnlHeap() noexcept;

}  // namespace mem
