#include "kernel/memory/page.h"
#include "kernel/debug/assert.h"
#include "kernel/memory/frame.h"

namespace mem {

namespace {

//! Get the size of the memory mapped by an entry at a page table level.
constexpr stl::size_t GetMappedSize(const stl::size_t level) noexcept {
    switch (level) {
        case 3: {
            return huge_page_size_1gb;
        }
        case 2: {
            return huge_page_size_2mb;
        }
        default: {
            return page_size;
        }
    }
}

}  // namespace

stl::string_view GetMapErrorName(const MapError err) noexcept {
    switch (err) {
        case MapError::None: {
            return "None";
        }
        case MapError::AlreadyMapped: {
            return "Already Mapped";
        }
        case MapError::OutOfFrames: {
            return "Out of Frames";
        }
        case MapError::ParentEntryHugePage: {
            return "Parent Entry Huge Page";
        }
        default: {
            return "Unknown";
        }
    }
}

PageMapper::PageMapper(const PhyMemView view, const Frame root,
                       const TlbInvalidator invalidate_tlb) noexcept :
    view_ {view}, root_ {root}, invalidate_tlb_ {invalidate_tlb} {
    dbg::Assert(invalidate_tlb_, "The TLB invalidation routine is null");
}

stl::optional<stl::uintptr_t> PageMapper::Translate(const VrAddr addr) const noexcept {
    const auto* tab {&view_.GetPageTab(root_)};
    for (auto level {page_tab_level_count}; level != 0; --level) {
        const auto& entry {(*tab)[addr.GetPageTabIdx(level)]};
        if (!entry.IsPresent()) {
            return stl::nullopt;
        }

        if (level == 1 || ((level == 2 || level == 3) && entry.IsHugePage())) {
            const auto size {GetMappedSize(level)};
            return entry.GetAddress() + (addr & (size - 1));
        }

        tab = &view_.GetPageTab(entry.GetFrame());
    }

    return stl::nullopt;
}

stl::optional<Frame> PageMapper::Translate(const Page page) const noexcept {
    const auto* const tab {FindPageTab(page)};
    if (!tab) {
        return stl::nullopt;
    }

    const auto& entry {(*tab)[page.GetAddr().GetPageTabIdx(1)]};
    if (!entry.IsPresent()) {
        return stl::nullopt;
    }

    return entry.GetFrame();
}

MapError PageMapper::Map(const Page page, const Frame frame, const PageFlags flags,
                         FrameAllocator& allocator) noexcept {
    const auto addr {page.GetAddr()};
    PageFlags parent_flags {PageFlag::Present};
    parent_flags.Set(PageFlag::Writable);
    if (flags.IsSet(PageFlag::User)) {
        parent_flags.Set(PageFlag::User);
    }

    auto* tab {&view_.GetPageTab(root_)};
    for (auto level {page_tab_level_count}; level != 1; --level) {
        auto& entry {(*tab)[addr.GetPageTabIdx(level)]};
        if (!entry.IsPresent()) {
            const auto new_tab {allocator.AllocFrame()};
            if (!new_tab) {
                return MapError::OutOfFrames;
            }

            // A new page table must be empty before it is linked.
            view_.GetPageTab(*new_tab).Clear();
            entry = {new_tab->GetAddr(), parent_flags};
        } else if (entry.IsHugePage()) {
            return MapError::ParentEntryHugePage;
        } else if ((entry.GetFlags() & parent_flags) != parent_flags) {
            entry.SetFlags(entry.GetFlags() | parent_flags);
        }

        tab = &view_.GetPageTab(entry.GetFrame());
    }

    auto& entry {(*tab)[addr.GetPageTabIdx(1)]};
    if (!entry.IsUnused()) {
        return MapError::AlreadyMapped;
    }

    entry = {frame.GetAddr(), PageFlags {flags}.Set(PageFlag::Present)};
    invalidate_tlb_(addr);
    return MapError::None;
}

stl::optional<Frame> PageMapper::Unmap(const Page page) noexcept {
    auto* const tab {FindPageTab(page)};
    if (!tab) {
        return stl::nullopt;
    }

    auto& entry {(*tab)[page.GetAddr().GetPageTabIdx(1)]};
    if (!entry.IsPresent()) {
        return stl::nullopt;
    }

    const auto frame {entry.GetFrame()};
    entry.Clear();
    invalidate_tlb_(page.GetAddr());
    return frame;
}

PageTable* PageMapper::FindPageTab(const Page page) const noexcept {
    const auto addr {page.GetAddr()};
    auto* tab {&view_.GetPageTab(root_)};
    for (auto level {page_tab_level_count}; level != 1; --level) {
        const auto& entry {(*tab)[addr.GetPageTabIdx(level)]};
        if (!entry.IsPresent() || entry.IsHugePage()) {
            return nullptr;
        }

        tab = &view_.GetPageTab(entry.GetFrame());
    }

    return tab;
}

}  // namespace mem
