/**
 * @file page.h
 * @brief Memory paging.
 *
 * @par GitHub
 * https://github.com/Zhuagenborn
 */

#pragma once

#include "kernel/io/io.h"
#include "kernel/stl/array.h"
#include "kernel/stl/optional.h"
#include "kernel/util/bit.h"
#include "kernel/util/metric.h"

namespace mem {

//! The size of a page in bytes.
inline constexpr stl::size_t page_size {KB(4)};
//! The number of entries in a page table of any level.
inline constexpr stl::size_t page_tab_entry_count {512};
//! The number of page table levels.
inline constexpr stl::size_t page_tab_level_count {4};
//! The size of a huge page mapped by a level-2 entry.
inline constexpr stl::size_t huge_page_size_2mb {MB(2)};
//! The size of a huge page mapped by a level-3 entry.
inline constexpr stl::size_t huge_page_size_1gb {GB(1)};

//! Align an address to its page base.
constexpr stl::uintptr_t AlignToPageBase(const stl::uintptr_t addr) noexcept {
    return BackwardAlign(addr, static_cast<stl::uintptr_t>(page_size));
}

//! Calculate the number of pages needed for the memory size in bytes.
constexpr stl::size_t CalcPageCount(const stl::size_t size) noexcept {
    return ForwardAlign(size, page_size) / page_size;
}

//! Page entry flags.
enum class PageFlag : stl::uint64_t {
    //! The page presents.
    Present = 1 << 0,
    //! The page is writable.
    Writable = 1 << 1,
    //! The page is accessible in user mode.
    User = 1 << 2,
    //! Writes go directly to memory.
    WriteThrough = 1 << 3,
    //! The page is not cached.
    NoCache = 1 << 4,
    //! The page has been accessed.
    Accessed = 1 << 5,
    //! The page is dirty (modified).
    Dirty = 1 << 6,
    //! The entry maps a 2 MB or 1 GB page instead of pointing to a page table.
    HugePage = 1 << 7,
    //! The translation is not flushed when @p CR3 is changed.
    Global = 1 << 8,
    //! Instructions cannot be fetched from the page.
    NoExecute = static_cast<stl::uint64_t>(1) << 63
};

using PageFlags = bit::Flags<PageFlag, stl::uint64_t>;

/**
 * @brief A 4 KB physical page frame.
 *
 * @details
 * Its address is always aligned to the page size.
 */
class Frame {
public:
    //! Create a frame containing a physical address.
    constexpr explicit Frame(const stl::uintptr_t phy_addr = 0) noexcept :
        addr_ {AlignToPageBase(phy_addr)} {}

    constexpr stl::uintptr_t GetAddr() const noexcept {
        return addr_;
    }

    constexpr bool operator==(const Frame& other) const noexcept {
        return addr_ == other.addr_;
    }

    constexpr bool operator!=(const Frame& other) const noexcept {
        return !(*this == other);
    }

private:
    stl::uintptr_t addr_;
};

/**
 * @brief The page table entry of any level.
 *
 * @details
 * @code
 * -------------------------------------------------------------------------------------------
 *   63    62-52    51-12    11-9   8   7    6   5    4     3     2    1   0
 * ┌────┬───────┬──────────┬─────┬───┬────┬───┬───┬─────┬─────┬─────┬───┬───┐
 * │ NX │  AVL  │ Base     │ AVL │ G │ PS │ D │ A │ PCD │ PWT │ U/S │ W │ P │
 * └────┴───────┴──────────┴─────┴───┴────┴───┴───┴─────┴─────┴─────┴───┴───┘
 *                                      ▲
 *                                      └─ 1: The entry maps a huge page (levels 2 and 3 only).
 * @endcode
 */
class PageEntry {
public:
    constexpr PageEntry(const stl::uint64_t entry = 0) noexcept : entry_ {entry} {}

    /**
     * @brief Create a page entry.
     *
     * @param phy_addr The physical address of a frame or a next-level page table.
     * @param flags Page flags.
     */
    constexpr PageEntry(const stl::uintptr_t phy_addr, const PageFlags flags) noexcept :
        PageEntry {} {
        SetAddress(phy_addr).SetFlags(flags);
    }

    //! Whether the entry is completely empty.
    constexpr bool IsUnused() const noexcept {
        return entry_ == 0;
    }

    constexpr bool IsPresent() const noexcept {
        return GetFlags().IsSet(PageFlag::Present);
    }

    constexpr bool IsHugePage() const noexcept {
        return GetFlags().IsSet(PageFlag::HugePage);
    }

    constexpr PageFlags GetFlags() const noexcept {
        return entry_ & ~addr_mask;
    }

    constexpr PageEntry& SetFlags(const PageFlags flags) noexcept {
        entry_ = (entry_ & addr_mask) | (flags & ~addr_mask);
        return *this;
    }

    constexpr stl::uintptr_t GetAddress() const noexcept {
        return entry_ & addr_mask;
    }

    constexpr PageEntry& SetAddress(const stl::uintptr_t phy_addr) noexcept {
        entry_ = (entry_ & ~addr_mask) | (phy_addr & addr_mask);
        return *this;
    }

    constexpr Frame GetFrame() const noexcept {
        return Frame {GetAddress()};
    }

    constexpr PageEntry& Clear() noexcept {
        entry_ = 0;
        return *this;
    }

    constexpr operator stl::uint64_t() const noexcept {
        return entry_;
    }

private:
    static constexpr stl::size_t addr_pos {12};
    static constexpr stl::size_t addr_len {40};
    static constexpr stl::uint64_t addr_mask {((static_cast<stl::uint64_t>(1) << addr_len) - 1)
                                              << addr_pos};

    stl::uint64_t entry_;
};

static_assert(sizeof(PageEntry) == sizeof(stl::uint64_t));

//! A page table of any level.
class alignas(page_size) PageTable {
public:
    const PageEntry& operator[](const stl::size_t idx) const noexcept {
        dbg::Assert(idx < page_tab_entry_count);
        return entries_[idx];
    }

    PageEntry& operator[](const stl::size_t idx) noexcept {
        return const_cast<PageEntry&>(const_cast<const PageTable&>(*this)[idx]);
    }

    PageTable& Clear() noexcept {
        entries_.fill(PageEntry {});
        return *this;
    }

private:
    stl::array<PageEntry, page_tab_entry_count> entries_;
};

static_assert(sizeof(PageTable) == page_size);

/**
 * @brief The virtual address.
 *
 * @details
 * @code
 * ----------------------------------------------------------------------
 *    63-48    47-39   38-30   29-21   20-12   11-0
 * │ Sign    │ PML4 │ PDPT │  PD  │  PT  │ Offset |
 *     ▲         ▲      ▲      ▲      ▲       ▲
 *     │         │      │      │      │       └─ The offset in the page.
 *     │         │      │      │      └─ The index in the level-1 page table.
 *     │         │      │      └─ The index in the level-2 page table.
 *     │         │      └─ The index in the level-3 page table.
 *     │         └─ The index in the level-4 page table.
 *     └─ Copies of the bit 47.
 * ----------------------------------------------------------------------
 * @endcode
 */
class VrAddr {
public:
    constexpr VrAddr(const stl::uintptr_t addr = 0) noexcept : addr_ {addr} {}

    VrAddr(const void* const addr) noexcept : VrAddr {reinterpret_cast<stl::uintptr_t>(addr)} {}

    /**
     * @brief Create a canonical virtual address.
     *
     * @param l4_idx The index in the level-4 page table.
     * @param l3_idx The index in the level-3 page table.
     * @param l2_idx The index in the level-2 page table.
     * @param l1_idx The index in the level-1 page table.
     * @param offset The offset in the page.
     */
    constexpr VrAddr(const stl::size_t l4_idx, const stl::size_t l3_idx, const stl::size_t l2_idx,
                     const stl::size_t l1_idx, const stl::uintptr_t offset) noexcept :
        VrAddr {Format(l4_idx, l3_idx, l2_idx, l1_idx, offset)} {}

    /**
     * @brief Get the index in a page table.
     *
     * @param level A page table level from @p 1 to @p 4.
     */
    constexpr stl::size_t GetPageTabIdx(const stl::size_t level) const noexcept {
        return bit::GetBits(addr_, GetIdxPos(level), idx_len);
    }

    constexpr VrAddr& SetPageTabIdx(const stl::size_t level, const stl::size_t idx) noexcept {
        bit::SetBits(addr_, idx, GetIdxPos(level), idx_len);
        return *this;
    }

    constexpr stl::uintptr_t GetOffset() const noexcept {
        return bit::GetBits(addr_, offset_pos, offset_len);
    }

    constexpr VrAddr& SetOffset(const stl::uintptr_t offset) noexcept {
        bit::SetBits(addr_, offset, offset_pos, offset_len);
        return *this;
    }

    constexpr stl::uintptr_t GetPageAddr() const noexcept {
        return addr_ - GetOffset();
    }

    //! Whether the bits @p 48-@p 63 are copies of the bit @p 47.
    constexpr bool IsCanonical() const noexcept {
        const auto high {bit::GetBits(addr_, sign_pos, sign_len)};
        return bit::IsBitSet(addr_, sign_pos - 1) ? high == (1 << sign_len) - 1 : high == 0;
    }

    constexpr operator stl::uintptr_t() const noexcept {
        return addr_;
    }

private:
    static constexpr stl::size_t offset_pos {0};
    static constexpr stl::size_t offset_len {12};
    static constexpr stl::size_t idx_len {9};
    static constexpr stl::size_t sign_pos {offset_len + idx_len * page_tab_level_count};
    static constexpr stl::size_t sign_len {16};

    static constexpr stl::size_t GetIdxPos(const stl::size_t level) noexcept {
        return offset_pos + offset_len + idx_len * (level - 1);
    }

    static constexpr stl::uintptr_t Format(const stl::size_t l4_idx, const stl::size_t l3_idx,
                                           const stl::size_t l2_idx, const stl::size_t l1_idx,
                                           const stl::uintptr_t offset) noexcept {
        VrAddr addr {};
        addr.SetPageTabIdx(4, l4_idx)
            .SetPageTabIdx(3, l3_idx)
            .SetPageTabIdx(2, l2_idx)
            .SetPageTabIdx(1, l1_idx)
            .SetOffset(offset);
        if (bit::IsBitSet(addr.addr_, sign_pos - 1)) {
            bit::SetBits(addr.addr_, (1 << sign_len) - 1, sign_pos, sign_len);
        }

        return addr;
    }

    stl::uintptr_t addr_;
};

static_assert(sizeof(VrAddr) == sizeof(stl::uintptr_t));

//! A 4 KB virtual page.
class Page {
public:
    //! Create a page containing a virtual address.
    constexpr explicit Page(const VrAddr addr = {}) noexcept : addr_ {addr.GetPageAddr()} {}

    constexpr VrAddr GetAddr() const noexcept {
        return addr_;
    }

    constexpr bool operator==(const Page& other) const noexcept {
        return addr_ == other.addr_;
    }

private:
    VrAddr addr_;
};

/**
 * @brief The view of physical memory from the kernel.
 *
 * @details
 * The boot loader maps all physical memory at a virtual offset,
 * so a physical address @p p can be accessed at `p + offset`.
 * Page tables are accessed by their physical frames through this view.
 */
class PhyMemView {
public:
    constexpr explicit PhyMemView(const stl::uintptr_t offset = 0) noexcept : offset_ {offset} {}

    constexpr stl::uintptr_t GetOffset() const noexcept {
        return offset_;
    }

    //! Convert a physical address to a virtual address.
    constexpr VrAddr ToVrAddr(const stl::uintptr_t phy_addr) const noexcept {
        return phy_addr + offset_;
    }

    //! Get the page table located in a physical frame.
    PageTable& GetPageTab(const Frame frame) const noexcept {
        return *reinterpret_cast<PageTable*>(static_cast<stl::uintptr_t>(ToVrAddr(frame.GetAddr())));
    }

private:
    stl::uintptr_t offset_;
};

//! Results of mapping a page.
enum class MapError {
    //! The page has been mapped.
    None,
    //! The page has already been mapped. The original entry is not changed.
    AlreadyMapped,
    //! There are not enough free frames for new page tables.
    OutOfFrames,
    //! A parent entry maps a huge page, so the page cannot be mapped as a 4 KB page.
    ParentEntryHugePage
};

//! Get the name of a mapping result.
stl::string_view GetMapErrorName(MapError) noexcept;

class FrameAllocator;

/**
 * @brief The virtual memory mapper.
 *
 * @details
 * It walks and edits four-level page tables through a view of physical memory.
 * Only 4 KB pages can be mapped or unmapped, but huge pages created by the boot loader can be translated.
 */
class PageMapper {
public:
    //! The routine that invalidates a Translation Lookaside Buffer (TLB) entry.
    using TlbInvalidator = void (*)(stl::uintptr_t) noexcept;

    PageMapper() noexcept = default;

    /**
     * @brief Create a mapper.
     *
     * @param view The view of physical memory.
     * @param root The frame of the level-4 page table.
     * @param invalidate_tlb The routine that invalidates a translation after it is changed.
     */
    PageMapper(PhyMemView view, Frame root,
               TlbInvalidator invalidate_tlb = &io::InvalidateTlbEntry) noexcept;

    //! Translate a virtual address to a physical address.
    stl::optional<stl::uintptr_t> Translate(VrAddr) const noexcept;

    //! Get the frame mapped by a page.
    stl::optional<Frame> Translate(Page) const noexcept;

    /**
     * @brief Map a page to a frame.
     *
     * @details
     * Missing intermediate page tables are allocated from @p allocator and cleared before they are linked.
     * An intermediate entry without the present bit counts as missing, whatever address it holds.
     * A non-empty leaf entry is never overwritten.
     * They are present and writable, and user-accessible if @p flags contains @p PageFlag::User.
     * The leaf entry is always present.
     *
     * @param page A virtual page.
     * @param frame A physical frame.
     * @param flags Flags of the leaf entry.
     * @param allocator The allocator for new page tables.
     */
    MapError Map(Page page, Frame frame, PageFlags flags, FrameAllocator& allocator) noexcept;

    /**
     * @brief Unmap a page.
     *
     * @return The frame that was mapped, or nothing if the page is not mapped.
     */
    stl::optional<Frame> Unmap(Page) noexcept;

    Frame GetRootFrame() const noexcept {
        return root_;
    }

private:
    /**
     * @brief Find the level-1 page table of a page.
     *
     * @return The table, or @p nullptr if an intermediate entry is not present or maps a huge page.
     */
    PageTable* FindPageTab(Page) const noexcept;

    PhyMemView view_ {};
    Frame root_ {};
    TlbInvalidator invalidate_tlb_ {nullptr};
};

}  // namespace mem
