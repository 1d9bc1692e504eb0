#include "kernel/memory/frame.h"
#include "kernel/debug/assert.h"
#include "kernel/stl/algorithm.h"

namespace mem {

FrameAllocator::FrameAllocator(const boot::MemMap& map) noexcept {
    Init(map);
}

FrameAllocator& FrameAllocator::Init(const boot::MemMap& map) noexcept {
    if (!map.IsValid()) {
        dbg::Panic("The boot memory map is missing or malformed");
    }

    map_ = map;
    region_idx_ = 0;
    next_frame_ = 0;
    allocated_count_ = 0;
    return *this;
}

bool FrameAllocator::IsInited() const noexcept {
    return map_.regions != nullptr;
}

stl::size_t FrameAllocator::GetAllocatedCount() const noexcept {
    return allocated_count_;
}

stl::optional<Frame> FrameAllocator::AllocFrame() noexcept {
    dbg::Assert(IsInited(), "The frame allocator has not been initialized");
    const auto regions {map_.GetRegions()};
    for (; region_idx_ != regions.size(); ++region_idx_) {
        const auto& region {regions[region_idx_]};
        if (!region.IsUsable()) {
            continue;
        }

        auto frame {stl::max(next_frame_, ForwardAlign(region.start, page_size))};
        while (frame < region.end && region.end - frame >= page_size) {
            if (!IsReserved(frame)) {
                next_frame_ = frame + page_size;
                ++allocated_count_;
                return Frame {frame};
            }

            frame += page_size;
        }

        // The region is exhausted. Regions are not sorted, so the cursor restarts from the next region's base.
        next_frame_ = 0;
    }

    return stl::nullopt;
}

bool FrameAllocator::IsReserved(const stl::uintptr_t frame) const noexcept {
    for (const auto& region : map_.GetRegions()) {
        if (!region.IsUsable() && region.Overlaps(frame, page_size)) {
            return true;
        }
    }

    return false;
}

}  // namespace mem
