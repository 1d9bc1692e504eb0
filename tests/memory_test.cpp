#include "kernel/boot/boot_info.h"
#include "kernel/interrupt/intr.h"
#include "kernel/krnl.h"
#include "kernel/memory/frame.h"
#include "kernel/memory/heap.h"
#include "kernel/memory/page.h"
#include "mock/cpu.h"
#include "mock/host_mem.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <random>
#include <set>
#include <vector>

using boot::MemRegion;
using boot::MemRegionType;
using mock::HostMem;
using mock::PhyMem;

namespace {

boot::MemMap MakeMemMap(const std::vector<MemRegion>& regions) {
    return {regions.data(), regions.size()};
}

bool OverlapsRange(const std::uintptr_t addr, const std::uintptr_t begin, const std::uintptr_t end) {
    return begin < addr + mem::page_size && addr < end;
}

}  // namespace

TEST(FrameAllocatorTest, AvoidsReservedRegions) {
    const std::vector<MemRegion> regions {{0x1000, 0x10000, MemRegionType::Usable},
                                          {0x10000, 0x100000, MemRegionType::Reserved},
                                          {0x100000, 0x200000, MemRegionType::Usable}};
    const auto map {MakeMemMap(regions)};
    mem::FrameAllocator allocator {map};

    std::set<std::uintptr_t> frames;
    while (const auto frame {allocator.AllocFrame()}) {
        const auto addr {frame->GetAddr()};
        EXPECT_EQ(addr % mem::page_size, 0U);
        EXPECT_FALSE(OverlapsRange(addr, 0x10000, 0x100000)) << std::hex << addr;
        EXPECT_TRUE(frames.insert(addr).second) << "Frame 0x" << std::hex << addr << " is duplicated";
    }

    EXPECT_EQ(frames.size(), 15U + 256U);
    EXPECT_EQ(allocator.GetAllocatedCount(), frames.size());
    EXPECT_EQ(*frames.begin(), 0x1000U);
    EXPECT_EQ(*frames.rbegin(), 0x1FF000U);
    EXPECT_FALSE(allocator.AllocFrame());
    EXPECT_EQ(allocator.GetAllocatedCount(), frames.size());
}

TEST(FrameAllocatorTest, SkipsUsableFramesOverlappingOtherRegions) {
    const std::vector<MemRegion> regions {{0x0, 0x6000, MemRegionType::Usable},
                                          {0x0, 0x1000, MemRegionType::FrameZero},
                                          {0x2000, 0x2800, MemRegionType::Kernel},
                                          {0x4FFF, 0x5001, MemRegionType::BootInfo}};
    const auto map {MakeMemMap(regions)};
    mem::FrameAllocator allocator {map};

    std::vector<std::uintptr_t> frames;
    while (const auto frame {allocator.AllocFrame()}) {
        frames.push_back(frame->GetAddr());
    }

    EXPECT_EQ(frames, (std::vector<std::uintptr_t> {0x1000, 0x3000}));
}

TEST(FrameAllocatorTest, AlignsUnalignedRegions) {
    const std::vector<MemRegion> regions {{0x1800, 0x4800, MemRegionType::Usable},
                                          {0x8000, 0x8FFF, MemRegionType::Usable}};
    const auto map {MakeMemMap(regions)};
    mem::FrameAllocator allocator {map};

    std::vector<std::uintptr_t> frames;
    while (const auto frame {allocator.AllocFrame()}) {
        frames.push_back(frame->GetAddr());
    }

    // A frame must lie completely inside a usable region.
    EXPECT_EQ(frames, (std::vector<std::uintptr_t> {0x2000, 0x3000}));
}

TEST(FrameAllocatorTest, MalformedMapHalts) {
    const std::vector<MemRegion> empty;
    EXPECT_EXIT(mem::FrameAllocator {MakeMemMap(empty)},
                testing::ExitedWithCode(mock::halt_exit_code), "missing or malformed");

    const std::vector<MemRegion> inverted {{0x2000, 0x1000, MemRegionType::Usable}};
    EXPECT_EXIT(mem::FrameAllocator {MakeMemMap(inverted)},
                testing::ExitedWithCode(mock::halt_exit_code), "missing or malformed");

    const boot::MemMap missing {nullptr, 1};
    EXPECT_EXIT(mem::FrameAllocator {missing}, testing::ExitedWithCode(mock::halt_exit_code),
                "missing or malformed");
}

class PageMapperTest : public testing::Test {
protected:
    static constexpr std::uintptr_t phy_mem_size {0x100000};

    PageMapperTest() :
        regions_ {{0x1000, phy_mem_size, MemRegionType::Usable}},
        map_ {MakeMemMap(regions_)},
        allocator_ {map_} {}

    void SetUp() override {
        mock::Reset();
        // Page tables must not rely on zeroed memory.
        phy_mem_.Fill(0xFF);
        const auto root {allocator_.AllocFrame()};
        ASSERT_TRUE(root);
        phy_mem_.GetView().GetPageTab(*root).Clear();
        mapper_ = {phy_mem_.GetView(), *root};
    }

    mem::Frame AllocFrame() {
        const auto frame {allocator_.AllocFrame()};
        EXPECT_TRUE(frame);
        return frame.value();
    }

    mem::PageTable& GetRootTab() noexcept {
        return phy_mem_.GetView().GetPageTab(mapper_.GetRootFrame());
    }

    PhyMem phy_mem_ {phy_mem_size};
    std::vector<MemRegion> regions_;
    boot::MemMap map_;
    mem::FrameAllocator allocator_;
    mem::PageMapper mapper_;
};

TEST_F(PageMapperTest, TranslatesAfterMapping) {
    const mem::VrAddr addr {0x4444'4444'0000};
    const mem::Page page {addr};
    const auto frame {AllocFrame()};
    ASSERT_EQ(mapper_.Map(page, frame, mem::PageFlags {mem::PageFlag::Present}.Set(mem::PageFlag::Writable),
                          allocator_),
              mem::MapError::None);

    EXPECT_EQ(mapper_.Translate(mem::VrAddr {addr + 0x123}).value_or(0), frame.GetAddr() + 0x123);
    EXPECT_EQ(mapper_.Translate(page).value_or(mem::Frame {}), frame);
    EXPECT_EQ(mock::GetCpu().invalidated_addrs, (std::vector<std::uintptr_t> {addr}));

    // Neighboring pages are still unmapped.
    EXPECT_FALSE(mapper_.Translate(mem::VrAddr {addr + mem::page_size}));
    EXPECT_FALSE(mapper_.Translate(mem::VrAddr {addr - 1}));
}

TEST_F(PageMapperTest, ClearsNewPageTables) {
    const mem::Page page {mem::VrAddr {0x1234'5678'9000}};
    ASSERT_EQ(mapper_.Map(page, AllocFrame(), mem::PageFlag::Present, allocator_),
              mem::MapError::None);

    auto* tab {&GetRootTab()};
    for (auto level {mem::page_tab_level_count}; level != 1; --level) {
        const auto idx {page.GetAddr().GetPageTabIdx(level)};
        const auto& entry {(*tab)[idx]};
        ASSERT_TRUE(entry.IsPresent());
        EXPECT_TRUE(entry.GetFlags().IsSet(mem::PageFlag::Writable));
        EXPECT_FALSE(entry.GetFlags().IsSet(mem::PageFlag::User));
        tab = &phy_mem_.GetView().GetPageTab(entry.GetFrame());
        for (std::size_t i {0}; i != mem::page_tab_entry_count; ++i) {
            if (i != page.GetAddr().GetPageTabIdx(level - 1)) {
                EXPECT_TRUE((*tab)[i].IsUnused()) << "Level " << level - 1 << ", entry " << i;
            }
        }
    }
}

TEST_F(PageMapperTest, ReplacesNonPresentParentEntries) {
    const mem::Page page {mem::VrAddr {0x1234'5678'9000}};
    const auto stale {AllocFrame()};
    auto& root_entry {GetRootTab()[page.GetAddr().GetPageTabIdx(4)]};
    // A stale address without the present bit.
    root_entry = {stale.GetAddr(), mem::PageFlag::Writable};
    ASSERT_FALSE(root_entry.IsUnused());

    const auto frame {AllocFrame()};
    const auto allocated {allocator_.GetAllocatedCount()};
    ASSERT_EQ(mapper_.Map(page, frame, mem::PageFlag::Writable, allocator_), mem::MapError::None);
    EXPECT_EQ(allocator_.GetAllocatedCount(), allocated + 3);
    EXPECT_TRUE(root_entry.IsPresent());
    EXPECT_NE(root_entry.GetFrame().GetAddr(), stale.GetAddr());
    EXPECT_EQ(mapper_.Translate(page).value_or(mem::Frame {}).GetAddr(), frame.GetAddr());

    // The frame the stale entry named is untouched.
    const auto& stale_tab {phy_mem_.GetView().GetPageTab(stale)};
    EXPECT_EQ(static_cast<std::uint64_t>(stale_tab[page.GetAddr().GetPageTabIdx(3)]), ~std::uint64_t {0});
}

TEST_F(PageMapperTest, UserPagesHaveUserParents) {
    const mem::Page page {mem::VrAddr {0x40'0000}};
    ASSERT_EQ(mapper_.Map(page, AllocFrame(),
                          mem::PageFlags {mem::PageFlag::User}.Set(mem::PageFlag::Writable),
                          allocator_),
              mem::MapError::None);

    const auto& l4_entry {GetRootTab()[page.GetAddr().GetPageTabIdx(4)]};
    EXPECT_TRUE(l4_entry.GetFlags().IsSet(mem::PageFlag::User));
}

TEST_F(PageMapperTest, ForcesLeafPresent) {
    const mem::Page page {mem::VrAddr {0x7000'0000}};
    const auto frame {AllocFrame()};
    ASSERT_EQ(mapper_.Map(page, frame, mem::PageFlag::Writable, allocator_), mem::MapError::None);
    EXPECT_EQ(mapper_.Translate(page).value_or(mem::Frame {}), frame);
}

TEST_F(PageMapperTest, RejectsMappedPages) {
    const mem::Page page {mem::VrAddr {0x5000'0000}};
    const auto first {AllocFrame()};
    const auto second {AllocFrame()};
    ASSERT_EQ(mapper_.Map(page, first, mem::PageFlag::Present, allocator_), mem::MapError::None);
    EXPECT_EQ(mapper_.Map(page, second, mem::PageFlag::Present, allocator_),
              mem::MapError::AlreadyMapped);
    EXPECT_EQ(mapper_.Translate(page).value_or(mem::Frame {}), first);
}

TEST_F(PageMapperTest, UnmapsPages) {
    const mem::Page page {mem::VrAddr {0xFFFF'8000'1234'5000}};
    const auto frame {AllocFrame()};
    ASSERT_EQ(mapper_.Map(page, frame, mem::PageFlag::Present, allocator_), mem::MapError::None);

    EXPECT_EQ(mapper_.Unmap(page).value_or(mem::Frame {}), frame);
    EXPECT_FALSE(mapper_.Translate(page));
    EXPECT_FALSE(mapper_.Translate(page.GetAddr()));
    const std::vector<std::uintptr_t> invalidated {page.GetAddr(), page.GetAddr()};
    EXPECT_EQ(mock::GetCpu().invalidated_addrs, invalidated);

    EXPECT_FALSE(mapper_.Unmap(page));
    EXPECT_EQ(mock::GetCpu().invalidated_addrs.size(), 2U);

    // The page can be mapped again.
    EXPECT_EQ(mapper_.Map(page, frame, mem::PageFlag::Present, allocator_), mem::MapError::None);
}

TEST_F(PageMapperTest, UnmapsUnmappedPagesToNothing) {
    EXPECT_FALSE(mapper_.Unmap(mem::Page {mem::VrAddr {0x1000}}));
    EXPECT_TRUE(mock::GetCpu().invalidated_addrs.empty());
}

TEST_F(PageMapperTest, TranslatesHugePages) {
    const auto view {phy_mem_.GetView()};
    const auto l3_frame {AllocFrame()};
    const auto l2_frame {AllocFrame()};
    view.GetPageTab(l3_frame).Clear();
    view.GetPageTab(l2_frame).Clear();

    const mem::PageFlags table_flags {mem::PageFlags {mem::PageFlag::Present}.Set(mem::PageFlag::Writable)};
    const mem::PageFlags huge_flags {mem::PageFlags {table_flags}.Set(mem::PageFlag::HugePage)};
    GetRootTab()[1] = {l3_frame.GetAddr(), table_flags};
    // A 1 GB page at the level-3 entry 2.
    view.GetPageTab(l3_frame)[2] = {0x4000'0000, huge_flags};
    // A 2 MB page at the level-2 entry 3 under the level-3 entry 5.
    view.GetPageTab(l3_frame)[5] = {l2_frame.GetAddr(), table_flags};
    view.GetPageTab(l2_frame)[3] = {0x60'0000, huge_flags};

    const mem::VrAddr in_1gb {1, 2, 5, 7, 0x10};
    EXPECT_EQ(mapper_.Translate(in_1gb).value_or(0), 0x4000'0000U + (5U << 21) + (7U << 12) + 0x10U);
    EXPECT_FALSE(mapper_.Translate(mem::Page {in_1gb}));

    const mem::VrAddr in_2mb {1, 5, 3, 9, 0x20};
    EXPECT_EQ(mapper_.Translate(in_2mb).value_or(0), 0x60'0000U + (9U << 12) + 0x20U);

    EXPECT_EQ(mapper_.Map(mem::Page {in_1gb}, AllocFrame(), mem::PageFlag::Present, allocator_),
              mem::MapError::ParentEntryHugePage);
    EXPECT_EQ(mapper_.Map(mem::Page {in_2mb}, AllocFrame(), mem::PageFlag::Present, allocator_),
              mem::MapError::ParentEntryHugePage);
    EXPECT_EQ(mapper_.Translate(in_1gb).value_or(0), 0x4000'0000U + (5U << 21) + (7U << 12) + 0x10U);
}

TEST(PageMapperLimitTest, ReportsOutOfFrames) {
    PhyMem phy_mem {0x4000};
    phy_mem.Fill(0);
    const std::vector<MemRegion> regions {{0x1000, 0x3000, MemRegionType::Usable}};
    const auto map {MakeMemMap(regions)};
    mem::FrameAllocator allocator {map};
    const auto root {allocator.AllocFrame()};
    ASSERT_TRUE(root);

    mem::PageMapper mapper {phy_mem.GetView(), *root};
    // Only one frame is left for the level-3 table, so the level-2 table cannot be allocated.
    EXPECT_EQ(mapper.Map(mem::Page {mem::VrAddr {0x8000'0000}}, mem::Frame {0x3000},
                         mem::PageFlag::Present, allocator),
              mem::MapError::OutOfFrames);
    EXPECT_FALSE(mapper.Translate(mem::VrAddr {0x8000'0000}));
}

TEST(VrAddrTest, SplitsIndexes) {
    const mem::VrAddr addr {0xFFFF'8000'1234'5678};
    EXPECT_TRUE(addr.IsCanonical());
    EXPECT_EQ(addr.GetOffset(), 0x678U);
    EXPECT_EQ(addr.GetPageAddr(), 0xFFFF'8000'1234'5000U);
    EXPECT_EQ(mem::VrAddr(addr.GetPageTabIdx(4), addr.GetPageTabIdx(3), addr.GetPageTabIdx(2),
                          addr.GetPageTabIdx(1), addr.GetOffset()),
              addr);
    EXPECT_EQ(addr.GetPageTabIdx(4), 0x100U);

    EXPECT_FALSE(mem::VrAddr {0x0000'8000'0000'0000}.IsCanonical());
    EXPECT_TRUE(mem::VrAddr {0x0000'7FFF'FFFF'FFFF}.IsCanonical());
}

class HeapTest : public testing::Test {
protected:
    static constexpr std::size_t heap_size {krnl_heap_size};

    void SetUp() override {
        heap_.Init(mem_.GetAddr(), heap_size);
    }

    std::uintptr_t GetBase() const noexcept {
        return mem_.GetAddr();
    }

    HostMem mem_ {heap_size};
    mem::HeapAllocator heap_;
};

TEST_F(HeapTest, ReusesSizeClassBlocks) {
    auto* const first {heap_.Allocate(24)};
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(heap_.GetUsedSize(), 32U);
    heap_.Free(first, 24);
    EXPECT_EQ(heap_.GetUsedSize(), 0U);

    // Both requests use the 32-byte class.
    auto* const second {heap_.Allocate(20)};
    EXPECT_EQ(second, first);
    heap_.Free(second, 20);
}

TEST_F(HeapTest, AlignsSizeClassBlocks) {
    for (const auto [size, align] : std::vector<std::pair<std::size_t, std::size_t>> {
             {1, 8}, {3, 64}, {100, 256}, {700, 16}, {2048, 2048}}) {
        auto* const addr {heap_.Allocate(size, align)};
        ASSERT_NE(addr, nullptr);
        EXPECT_EQ(reinterpret_cast<std::uintptr_t>(addr) % align, 0U) << size << ", " << align;
        EXPECT_TRUE(heap_.Contains(addr));
    }
}

TEST_F(HeapTest, SplitsLargeBlocksByFirstFit) {
    auto* const a {static_cast<std::byte*>(heap_.Allocate(4096))};
    auto* const b {static_cast<std::byte*>(heap_.Allocate(8192))};
    auto* const c {static_cast<std::byte*>(heap_.Allocate(4096))};
    ASSERT_EQ(reinterpret_cast<std::uintptr_t>(a), GetBase());
    ASSERT_EQ(b, a + 4096);
    ASSERT_EQ(c, b + 8192);

    heap_.Free(b, 8192);
    EXPECT_EQ(heap_.Allocate(4096), b);
    EXPECT_EQ(heap_.Allocate(4096), b + 4096);
    EXPECT_EQ(heap_.Allocate(4096), c + 4096);
}

TEST_F(HeapTest, MergesFreeRegions) {
    auto* const a {static_cast<std::byte*>(heap_.Allocate(4096))};
    auto* const b {static_cast<std::byte*>(heap_.Allocate(4096))};
    auto* const c {static_cast<std::byte*>(heap_.Allocate(4096))};
    auto* const d {static_cast<std::byte*>(heap_.Allocate(4096))};
    ASSERT_NE(d, nullptr);

    heap_.Free(a, 4096);
    heap_.Free(c, 4096);
    heap_.Free(b, 4096);
    // The three regions are merged, so a request larger than each one fits at the start.
    EXPECT_EQ(heap_.Allocate(12288), a);
    heap_.Free(d, 4096);
}

TEST_F(HeapTest, RetractsBumpPointer) {
    auto* const first {heap_.Allocate(3000)};
    ASSERT_EQ(reinterpret_cast<std::uintptr_t>(first), GetBase());
    heap_.Free(first, 3000);
    EXPECT_EQ(heap_.GetUsedSize(), 0U);

    // The whole heap is untouched again.
    auto* const whole {heap_.Allocate(heap_size)};
    EXPECT_EQ(whole, first);
    heap_.Free(whole, heap_size);
}

TEST_F(HeapTest, ReturnsNullWhenExhausted) {
    EXPECT_EQ(heap_.Allocate(heap_size + 1), nullptr);

    std::vector<void*> blocks;
    while (auto* const block {heap_.Allocate(2048)}) {
        blocks.push_back(block);
    }

    EXPECT_EQ(blocks.size(), heap_size / 2048);
    EXPECT_EQ(heap_.Allocate(8), nullptr);
    EXPECT_EQ(heap_.GetUsedSize(), heap_size);
    for (auto* const block : blocks) {
        heap_.Free(block, 2048);
    }

    EXPECT_EQ(heap_.GetUsedSize(), 0U);
    EXPECT_NE(heap_.Allocate(2000), nullptr);
}

TEST_F(HeapTest, RejectsRequestsLargerThanHeap) {
    constexpr auto max_size {std::numeric_limits<std::size_t>::max()};
    EXPECT_EQ(heap_.Allocate(max_size), nullptr);
    EXPECT_EQ(heap_.Allocate(max_size - 7), nullptr);
    EXPECT_EQ(heap_.Allocate(max_size - sizeof(std::uint64_t) * 2 + 1), nullptr);
    EXPECT_EQ(heap_.Allocate(8, std::size_t {1} << 63), nullptr);
    EXPECT_EQ(heap_.GetUsedSize(), 0U);

    auto* const block {heap_.Allocate(heap_size)};
    EXPECT_EQ(reinterpret_cast<std::uintptr_t>(block), heap_.GetBase());
    heap_.Free(block, heap_size);
    EXPECT_EQ(heap_.GetUsedSize(), 0U);
}

TEST_F(HeapTest, ReinitializationHalts) {
    EXPECT_EXIT(heap_.Init(heap_.GetBase(), heap_size), testing::ExitedWithCode(mock::halt_exit_code),
                "already been initialized");
}

TEST_F(HeapTest, KeepsRandomAllocationsApart) {
    struct Block {
        std::byte* addr;
        std::size_t size;
        std::size_t align;
        std::uint8_t pattern;
    };

    std::mt19937 rand {0x5EED};
    std::uniform_int_distribution<std::size_t> small_size {1, 2048};
    std::uniform_int_distribution<std::size_t> large_size {2049, 12000};
    std::uniform_int_distribution<std::size_t> align_shift {3, 8};
    std::uniform_int_distribution<int> percent {0, 99};

    std::vector<Block> live;
    for (std::size_t step {0}; step != 4000; ++step) {
        if (live.empty() || percent(rand) < 60) {
            const auto size {percent(rand) < 85 ? small_size(rand) : large_size(rand)};
            const auto align {static_cast<std::size_t>(1) << align_shift(rand)};
            auto* const addr {static_cast<std::byte*>(heap_.Allocate(size, align))};
            if (!addr) {
                continue;
            }

            const auto begin {reinterpret_cast<std::uintptr_t>(addr)};
            ASSERT_EQ(begin % align, 0U);
            ASSERT_GE(begin, GetBase());
            ASSERT_LE(begin + size, GetBase() + heap_size);
            for (const auto& block : live) {
                const auto other {reinterpret_cast<std::uintptr_t>(block.addr)};
                ASSERT_TRUE(begin + size <= other || other + block.size <= begin)
                    << "Step " << step << ": blocks overlap";
            }

            const auto pattern {static_cast<std::uint8_t>(step)};
            std::memset(addr, pattern, size);
            live.push_back({addr, size, align, pattern});
        } else {
            const auto idx {std::uniform_int_distribution<std::size_t> {0, live.size() - 1}(rand)};
            const auto block {live[idx]};
            // The content is intact if no other allocation has overlapped it.
            ASSERT_TRUE(std::all_of(block.addr, block.addr + block.size, [&block](const std::byte b) {
                return static_cast<std::uint8_t>(b) == block.pattern;
            })) << "Step " << step << ": a block is corrupted";
            heap_.Free(block.addr, block.size, block.align);
            live.erase(live.begin() + static_cast<std::ptrdiff_t>(idx));
        }
    }

    for (const auto& block : live) {
        heap_.Free(block.addr, block.size, block.align);
    }

    EXPECT_EQ(heap_.GetUsedSize(), 0U);
}

namespace {

mem::HeapAllocator* intr_heap {nullptr};

void AllocateInIntr(const intr::IntrStack&) noexcept {
    [[maybe_unused]] auto* const addr {intr_heap->Allocate(8)};
}

}  // namespace

TEST_F(HeapTest, AllocationInIntrHalts) {
    if (!dbg::enabled) {
        GTEST_SKIP() << "Assertions are disabled";
    }

    constexpr std::size_t vector {0x60};
    intr_heap = &heap_;
    intr::GetIntrHandlerTab().Register(vector, &AllocateInIntr);
    intr::IntrStack stack {};
    stack.intr_num = vector;
    EXPECT_EXIT(intr::DispatchIntr(stack), testing::ExitedWithCode(mock::halt_exit_code),
                "cannot be used in interrupt handlers");
}

TEST_F(HeapTest, FreeingForeignMemoryHalts) {
    if (!dbg::enabled) {
        GTEST_SKIP() << "Assertions are disabled";
    }

    std::uint64_t foreign {0};
    EXPECT_EXIT(heap_.Free(&foreign, sizeof(foreign)), testing::ExitedWithCode(mock::halt_exit_code),
                "does not belong to the heap");
}

TEST(HeapRangeTest, MapsEveryPage) {
    mock::Reset();
    constexpr std::size_t phy_mem_size {0x40000};
    PhyMem phy_mem {phy_mem_size};
    const std::vector<MemRegion> regions {{0x1000, phy_mem_size, MemRegionType::Usable}};
    const auto map {MakeMemMap(regions)};
    mem::FrameAllocator allocator {map};
    const auto root {allocator.AllocFrame()};
    ASSERT_TRUE(root);
    mem::PageMapper mapper {phy_mem.GetView(), *root};

    constexpr std::uintptr_t base {krnl_heap_base};
    constexpr std::size_t size {mem::page_size * 10};
    ASSERT_EQ(mem::MapHeapRange(base, size, mapper, allocator), mem::MapError::None);
    std::set<std::uintptr_t> frames;
    for (std::size_t i {0}; i != size / mem::page_size; ++i) {
        const auto frame {mapper.Translate(mem::Page {mem::VrAddr {base + i * mem::page_size}})};
        ASSERT_TRUE(frame);
        EXPECT_TRUE(frames.insert(frame->GetAddr()).second);
    }

    EXPECT_FALSE(mapper.Translate(mem::VrAddr {base + size}));
    EXPECT_EQ(mapper.Map(mem::Page {mem::VrAddr {base}}, mem::Frame {0x1000}, mem::PageFlag::Present,
                         allocator),
              mem::MapError::AlreadyMapped);
}
