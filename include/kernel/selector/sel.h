/**
 * @file sel.h
 * @brief Segment selectors.
 *
 * @par GitHub
 * https://github.com/Zhuagenborn
 */

#pragma once

#include "kernel/descriptor/gdt/idx.h"
#include "kernel/krnl.h"
#include "kernel/util/bit.h"

namespace sel {

/**
 * @brief The segment selector of a global descriptor.
 *
 * @details
 * The kernel has no local descriptor table, so the table indicator is always zero.
 *
 * ```
 *    15-3    2   1-0
 * ┌───────┬────┬─────┐
 * │ Index │ 0  │ RPL │
 * └───────┴────┴─────┘
 * ```
 */
class Selector {
public:
    /**
     * @brief Create a selector.
     *
     * @param rpl The requested privilege level.
     * @param idx The index in the global descriptor table.
     */
    constexpr Selector(const Privilege rpl, const stl::size_t idx) noexcept {
        bit::SetBits(sel_, static_cast<stl::uint32_t>(rpl), rpl_pos, rpl_len);
        bit::SetBits(sel_, idx, idx_pos, idx_len);
    }

    constexpr Selector(const stl::uint16_t sel = 0) noexcept : sel_ {sel} {}

    constexpr operator stl::uint16_t() const noexcept {
        return sel_;
    }

    constexpr Privilege GetRpl() const noexcept {
        return static_cast<Privilege>(bit::GetBits(sel_, rpl_pos, rpl_len));
    }

    constexpr stl::size_t GetIdx() const noexcept {
        return bit::GetBits(sel_, idx_pos, idx_len);
    }

private:
    static constexpr stl::size_t rpl_pos {0};
    static constexpr stl::size_t rpl_len {2};
    static constexpr stl::size_t idx_pos {3};
    static constexpr stl::size_t idx_len {13};

    stl::uint16_t sel_ {0};
};

static_assert(sizeof(Selector) == sizeof(stl::uint16_t));

//! The kernel code segment, loaded into @p CS.
inline constexpr Selector krnl_code {Privilege::Zero, gdt::idx::krnl_code};
//! The kernel data segment, loaded into @p DS, @p ES, @p FS, @p GS and @p SS.
inline constexpr Selector krnl_data {Privilege::Zero, gdt::idx::krnl_data};
//! The task state segment, loaded into the task register.
inline constexpr Selector tss {Privilege::Zero, gdt::idx::tss};

static_assert(krnl_code.GetIdx() == gdt::idx::krnl_code);

}  // namespace sel
