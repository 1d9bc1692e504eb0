/**
 * @file fault.h
 * @brief CPU exception handlers.
 *
 * @par GitHub
 * https://github.com/Zhuagenborn
 */

#pragma once

#include "kernel/interrupt/intr.h"

namespace intr {

/**
 * @brief The error code of a page fault.
 *
 * @details
 * ```
 *   4   3    2     1     0
 * ┌────┬──────┬─────┬─────┬───┐
 * │ ID │ RSVD │ U/S │ W/R │ P │
 * └────┴──────┴─────┴─────┴───┘
 * ```
 */
class PageFaultErrCode {
public:
    constexpr PageFaultErrCode(const stl::uint64_t code = 0) noexcept : code_ {code} {}

    constexpr operator stl::uint64_t() const noexcept {
        return code_;
    }

    //! Whether the fault was caused by a page-level protection violation rather than a non-present page.
    constexpr bool IsProtectionViolation() const noexcept {
        return bit::IsBitSet(code_, p_pos);
    }

    constexpr bool IsWrite() const noexcept {
        return bit::IsBitSet(code_, wr_pos);
    }

    constexpr bool IsUser() const noexcept {
        return bit::IsBitSet(code_, us_pos);
    }

    //! Whether a reserved bit was set in a page entry.
    constexpr bool IsReservedBitSet() const noexcept {
        return bit::IsBitSet(code_, rsvd_pos);
    }

    constexpr bool IsInstrFetch() const noexcept {
        return bit::IsBitSet(code_, id_pos);
    }

private:
    static constexpr stl::size_t p_pos {0};
    static constexpr stl::size_t wr_pos {p_pos + 1};
    static constexpr stl::size_t us_pos {wr_pos + 1};
    static constexpr stl::size_t rsvd_pos {us_pos + 1};
    static constexpr stl::size_t id_pos {rsvd_pos + 1};

    stl::uint64_t code_;
};

/**
 * @brief The breakpoint handler.
 *
 * @details
 * It prints the interrupted frame and resumes execution.
 */
void BreakpointHandler(const IntrStack&) noexcept;

/**
 * @brief The double fault handler.
 *
 * @details
 * It runs on the stack reserved in the interrupt stack table, prints the frame and halts the system.
 */
void DoubleFaultHandler(const IntrStack&) noexcept;

/**
 * @brief The page fault handler.
 *
 * @details
 * It prints the accessed address, the error code and the frame, then halts the system.
 * Demand paging is not supported, so every page fault is fatal.
 */
void PageFaultHandler(const IntrStack&) noexcept;

//! Register the handlers of breakpoints, double faults and page faults.
void RegisterFaultHandlers() noexcept;

}  // namespace intr
