#include "kernel/memory/heap.h"
#include "kernel/debug/assert.h"
#include "kernel/interrupt/intr.h"
#include "kernel/io/video/print.h"
#include "kernel/krnl.h"
#include "kernel/memory/frame.h"
#include "kernel/stl/algorithm.h"

namespace mem {

HeapAllocator& HeapAllocator::Init(const stl::uintptr_t base, const stl::size_t size) noexcept {
    if (IsInited()) {
        dbg::Panic("The heap has already been initialized");
    }

    dbg::Assert(base != 0 && IsAligned(base, static_cast<stl::uintptr_t>(page_size)));
    dbg::Assert(size > 0);
    base_ = base;
    end_ = base + size;
    bump_ = base;
    used_size_ = 0;
    free_regions_ = nullptr;
    free_blocks_.fill(nullptr);
    return *this;
}

bool HeapAllocator::IsInited() const noexcept {
    return end_ != 0;
}

stl::uintptr_t HeapAllocator::GetBase() const noexcept {
    return base_;
}

stl::size_t HeapAllocator::GetSize() const noexcept {
    return end_ - base_;
}

stl::size_t HeapAllocator::GetUsedSize() const noexcept {
    return used_size_;
}

bool HeapAllocator::Contains(const void* const addr) const noexcept {
    const auto val {reinterpret_cast<stl::uintptr_t>(addr)};
    return base_ <= val && val < end_;
}

stl::size_t HeapAllocator::FindSizeClass(const stl::size_t size, const stl::size_t align) noexcept {
    const auto min_size {stl::max(size, align)};
    for (stl::size_t i {0}; i != heap_size_class_count; ++i) {
        if (heap_size_classes[i] >= min_size) {
            return i;
        }
    }

    return npos_class;
}

stl::size_t HeapAllocator::CalcLargeSize(const stl::size_t size) noexcept {
    return ForwardAlign(size, sizeof(FreeRegion));
}

void* HeapAllocator::Allocate(stl::size_t size, const stl::size_t align) noexcept {
    dbg::Assert(IsInited(), "The heap has not been initialized");
    dbg::Assert(!intr::IsInIntrContext(), "The heap cannot be used in interrupt handlers");
    dbg::Assert(IsPowerOfTwo(align), "The alignment must be a power of two");
    if (size == 0) {
        size = 1;
    }

    // Rounding a larger request would wrap around.
    if (size > GetSize() || align > GetSize()) {
        return nullptr;
    }

    if (const auto cls {FindSizeClass(size, align)}; cls != npos_class) {
        const auto block_size {heap_size_classes[cls]};
        void* addr {nullptr};
        if (auto* const block {free_blocks_[cls]}; block) {
            free_blocks_[cls] = block->next;
            addr = block;
        } else {
            // A block is aligned to its own size, which is not less than the requested alignment.
            addr = AllocFromBump(block_size, block_size);
        }

        if (addr) {
            used_size_ += block_size;
        }

        return addr;
    }

    const auto large_size {CalcLargeSize(size)};
    const auto large_align {stl::max(align, sizeof(FreeRegion))};
    auto* addr {AllocLarge(large_size, large_align)};
    if (!addr) {
        addr = AllocFromBump(large_size, large_align);
    }

    if (addr) {
        used_size_ += large_size;
    }

    return addr;
}

void HeapAllocator::Free(void* const addr, stl::size_t size, const stl::size_t align) noexcept {
    if (!addr) {
        return;
    }

    dbg::Assert(IsInited(), "The heap has not been initialized");
    dbg::Assert(!intr::IsInIntrContext(), "The heap cannot be used in interrupt handlers");
    dbg::Assert(Contains(addr), "The memory does not belong to the heap");
    if (size == 0) {
        size = 1;
    }

    if (const auto cls {FindSizeClass(size, align)}; cls != npos_class) {
        auto* const block {static_cast<FreeBlock*>(addr)};
        block->next = free_blocks_[cls];
        free_blocks_[cls] = block;
        used_size_ -= heap_size_classes[cls];
        return;
    }

    const auto large_size {CalcLargeSize(size)};
    used_size_ -= large_size;
    FreeLarge(reinterpret_cast<stl::uintptr_t>(addr), large_size);
}

void* HeapAllocator::AllocFromBump(const stl::size_t size, const stl::size_t align) noexcept {
    const auto addr {ForwardAlign(bump_, static_cast<stl::uintptr_t>(align))};
    if (addr > end_ || end_ - addr < size) {
        return nullptr;
    }

    bump_ = addr + size;
    return reinterpret_cast<void*>(addr);
}

void* HeapAllocator::AllocLarge(const stl::size_t size, const stl::size_t align) noexcept {
    FreeRegion* prev {nullptr};
    for (auto* region {free_regions_}; region; prev = region, region = region->next) {
        const auto start {reinterpret_cast<stl::uintptr_t>(region)};
        const auto end {region->GetEnd()};
        const auto addr {ForwardAlign(start, static_cast<stl::uintptr_t>(align))};
        if (addr >= end || end - addr < size) {
            continue;
        }

        if (prev) {
            prev->next = region->next;
        } else {
            free_regions_ = region->next;
        }

        // Regions and sizes are multiples of the header size, so both remainders can hold a header.
        if (addr != start) {
            InsertFreeRegion(start, addr - start);
        }

        if (addr + size != end) {
            InsertFreeRegion(addr + size, end - addr - size);
        }

        return reinterpret_cast<void*>(addr);
    }

    return nullptr;
}

void HeapAllocator::FreeLarge(const stl::uintptr_t addr, const stl::size_t size) noexcept {
    InsertFreeRegion(addr, size);
}

void HeapAllocator::InsertFreeRegion(const stl::uintptr_t addr, const stl::size_t size) noexcept {
    dbg::Assert(size >= sizeof(FreeRegion));
    if (addr + size == bump_) {
        // Give the block back to the untouched memory.
        bump_ = addr;
        FreeRegion* prev {nullptr};
        auto* last {free_regions_};
        while (last && last->next) {
            prev = last;
            last = last->next;
        }

        if (last && last->GetEnd() == bump_) {
            bump_ = reinterpret_cast<stl::uintptr_t>(last);
            if (prev) {
                prev->next = nullptr;
            } else {
                free_regions_ = nullptr;
            }
        }

        return;
    }

    FreeRegion* prev {nullptr};
    auto* next {free_regions_};
    while (next && reinterpret_cast<stl::uintptr_t>(next) < addr) {
        prev = next;
        next = next->next;
    }

    auto* const region {reinterpret_cast<FreeRegion*>(addr)};
    region->size = size;
    region->next = next;
    if (next && region->GetEnd() == reinterpret_cast<stl::uintptr_t>(next)) {
        region->size += next->size;
        region->next = next->next;
    }

    if (prev && prev->GetEnd() == addr) {
        prev->size += region->size;
        prev->next = region->next;
    } else if (prev) {
        prev->next = region;
    } else {
        free_regions_ = region;
    }
}

MapError MapHeapRange(const stl::uintptr_t base, const stl::size_t size, PageMapper& mapper,
                      FrameAllocator& allocator) noexcept {
    dbg::Assert(IsAligned(base, static_cast<stl::uintptr_t>(page_size)));
    for (stl::size_t i {0}; i != CalcPageCount(size); ++i) {
        const auto frame {allocator.AllocFrame()};
        if (!frame) {
            return MapError::OutOfFrames;
        }

        const Page page {base + i * page_size};
        if (const auto err {mapper.Map(page, *frame, PageFlags {PageFlag::Present}.Set(PageFlag::Writable),
                                       allocator)};
            err != MapError::None) {
            return err;
        }
    }

    return MapError::None;
}

MapError InitHeap(PageMapper& mapper, FrameAllocator& allocator) noexcept {
    auto& heap {GetKrnlHeap()};
    if (heap.IsInited()) {
        dbg::Panic("The kernel heap has already been initialized");
    }

    if (const auto err {MapHeapRange(krnl_heap_base, krnl_heap_size, mapper, allocator)};
        err != MapError::None) {
        return err;
    }

    heap.Init(krnl_heap_base, krnl_heap_size);
    io::Printf("The kernel heap has been initialized at 0x{} with 0x{} bytes.\n", krnl_heap_base,
               krnl_heap_size);
    return MapError::None;
}

HeapAllocator& GetKrnlHeap() noexcept {
    static HeapAllocator heap;
    return heap;
}

}  // namespace mem
