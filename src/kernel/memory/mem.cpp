#include "kernel/memory/mem.h"
#include "kernel/debug/assert.h"
#include "kernel/io/io.h"
#include "kernel/io/video/print.h"

namespace mem {

namespace {

bool& IsMemInitedImpl() noexcept {
    static bool inited {false};
    return inited;
}

//! Get the frame of the active level-4 page table.
Frame GetActivePageTabRoot() noexcept {
    return Frame {io::GetCr3()};
}

void InitFrameAllocator(const boot::MemMap& map) noexcept {
    GetFrameAllocator().Init(map);
    io::Printf("The physical frame allocator has been initialized with 0x{} regions.\n",
               map.count);
}

void InitPageMapper(const stl::uintptr_t phy_mem_offset) noexcept {
    GetPageMapper() = {PhyMemView {phy_mem_offset}, GetActivePageTabRoot()};
    io::Printf("The page mapper has been initialized with the root table at 0x{}.\n",
               GetPageMapper().GetRootFrame().GetAddr());
}

}  // namespace

FrameAllocator& GetFrameAllocator() noexcept {
    static FrameAllocator allocator;
    return allocator;
}

PageMapper& GetPageMapper() noexcept {
    static PageMapper mapper;
    return mapper;
}

void InitMem(const boot::BootInfo& boot_info) noexcept {
    if (IsMemInited()) {
        dbg::Panic("Memory management has already been initialized");
    }

    InitFrameAllocator(boot_info.mem_map);
    InitPageMapper(boot_info.phy_mem_offset);
    if (const auto err {InitHeap(GetPageMapper(), GetFrameAllocator())}; err != MapError::None) {
        io::Printf("Failed to map the kernel heap: {}.\n", GetMapErrorName(err));
        dbg::Panic("The kernel heap cannot be mapped");
    }

    IsMemInitedImpl() = true;
}

bool IsMemInited() noexcept {
    return IsMemInitedImpl();
}

}  // namespace mem
