/**
 * Descriptors.
 */

#pragma once

#include "kernel/debug/assert.h"
#include "kernel/krnl.h"
#include "kernel/selector/sel.h"
#include "kernel/stl/array.h"
#include "kernel/util/bit.h"

namespace desc {

//! Types of system descriptors in IA-32e mode.
enum class SysType {
    //! The local descriptor table.
    Ldt = 0b0010,
    //! The available 64-bit task state segment.
    Tss64 = 0b1001,
    //! The busy 64-bit task state segment.
    BusyTss64 = 0b1011,
    //! The 64-bit call gate.
    Call64 = 0b1100,
    //! The 64-bit interrupt gate.
    Intr64 = 0b1110,
    //! The 64-bit trap gate.
    Trap64 = 0b1111
};

//! Types of non-system descriptors.
enum class NonSysType {
    //! Executable code.
    ExecCode = 0b1000,
    //! Readable, executable code.
    ReadExecCode = 0b1010,
    //! Readable data.
    ReadData = 0b0000,
    //! Readable, writable data.
    ReadWriteData = 0b0010
};

/**
 * The descriptor attribute.
 * It is located in the bits `40`-`47` of a descriptor.
 *
 * ```
 *   7    6-5   4   3-0
 * ┌───┬─────┬───┬──────┐
 * │ P │ DPL │ S │ TYPE │
 * └───┴─────┴───┴──────┘
 * ```
 */
class Attribute {
public:
    constexpr Attribute(const stl::uint8_t attr = 0) noexcept : attr_ {attr} {}

    /**
     * @brief Create an attribute for a system descriptor.
     *
     * @param type The system descriptor type.
     * @param dpl The descriptor privilege level.
     * @param present Whether the descriptor is valid.
     */
    constexpr Attribute(const SysType type, const Privilege dpl, const bool present = true) noexcept
        :
        Attribute {Format(true, static_cast<stl::uint8_t>(type), dpl, present)} {}

    /**
     * @brief Create an attribute for a non-system descriptor.
     *
     * @param type The non-system descriptor type.
     * @param dpl The descriptor privilege level.
     * @param present Whether the descriptor is valid.
     */
    constexpr Attribute(const NonSysType type, const Privilege dpl,
                        const bool present = true) noexcept :
        Attribute {Format(false, static_cast<stl::uint8_t>(type), dpl, present)} {}

    constexpr operator stl::uint8_t() const noexcept {
        return attr_;
    }

    constexpr stl::uint8_t GetType() const noexcept {
        return bit::GetBits(attr_, type_pos, type_len);
    }

    constexpr Privilege GetDpl() const noexcept {
        return static_cast<Privilege>(bit::GetBits(attr_, dpl_pos, dpl_len));
    }

    constexpr Attribute& SetDpl(const Privilege dpl) noexcept {
        bit::SetBits(attr_, static_cast<stl::uint32_t>(dpl), dpl_pos, dpl_len);
        return *this;
    }

    constexpr bool IsSystem() const noexcept {
        return !bit::IsBitSet(attr_, s_pos);
    }

    constexpr bool IsPresent() const noexcept {
        return bit::IsBitSet(attr_, p_pos);
    }

private:
    static constexpr stl::size_t type_pos {0};
    static constexpr stl::size_t type_len {4};
    static constexpr stl::size_t s_pos {type_pos + type_len};
    static constexpr stl::size_t dpl_pos {s_pos + 1};
    static constexpr stl::size_t dpl_len {2};
    static constexpr stl::size_t p_pos {dpl_pos + dpl_len};

    static constexpr stl::uint8_t Format(const bool sys, const stl::uint8_t type,
                                         const Privilege dpl, const bool present) noexcept {
        stl::uint8_t attr {0};
        bit::SetBits(attr, type, type_pos, type_len);
        if (!sys) {
            bit::SetBit(attr, s_pos);
        }

        bit::SetBits(attr, static_cast<stl::uint32_t>(dpl), dpl_pos, dpl_len);
        if (present) {
            bit::SetBit(attr, p_pos);
        }

        return attr;
    }

    stl::uint8_t attr_;
};

static_assert(sizeof(Attribute) == sizeof(stl::uint8_t));

/**
 * @brief The descriptor.
 *
 * @warning
 * Normally, this class should not be used directly.
 * Developers should use its subclasses to create different types of descriptors.
 */
class Descriptor {
public:
    constexpr Descriptor(const stl::uint64_t desc = 0) noexcept : desc_ {desc} {}

    constexpr operator stl::uint64_t() const noexcept {
        return desc_;
    }

    constexpr bool IsInvalid() const noexcept {
        return desc_ == 0;
    }

    constexpr Attribute GetAttribute() const noexcept {
        return bit::GetByte(desc_, attr_pos);
    }

    constexpr Descriptor& SetAttribute(const Attribute attr) noexcept {
        bit::SetByte(desc_, attr, attr_pos);
        return *this;
    }

    constexpr Privilege GetDpl() const noexcept {
        return GetAttribute().GetDpl();
    }

    constexpr bool IsSystem() const noexcept {
        return GetAttribute().IsSystem();
    }

    constexpr bool IsPresent() const noexcept {
        return GetAttribute().IsPresent();
    }

protected:
    static constexpr stl::size_t attr_pos {40};

    stl::uint64_t desc_;
};

static_assert(sizeof(Descriptor) == sizeof(stl::uint64_t));

/**
 * @brief
 * The segment descriptor.
 *
 * @details
 * In 64-bit mode, the processor ignores the base and limit of code and data segments,
 * but the long mode bit @p L must be set for a 64-bit code segment.
 * ```
 * --------------------------------------------- High 32 bits ---------------------------------------------
 *      31-24    23   22   21   20       19-16     15  14-13  12  11-8       7-0
 * ┌────────────┬───┬─────┬───┬─────┬─────────────┬───┬─────┬───┬──────┬────────────┐
 * │ Base 31-24 │ G │ D/B │ L │ AVL │ Limit 19-16 │ P │ DPL │ S │ TYPE │ Base 23-16 │
 * └────────────┴───┴─────┴───┴─────┴─────────────┴───┴─────┴───┴──────┴────────────┘
 *                ▲    ▲    ▲
 *                │    │    └─ 1: The code segment is 64-bit. @p D must be cleared.
 *                │    └─ 0: 16-bit. 1: 32-bit.
 *                └─ 0: The limit is in units of bytes.
 *                   1: The limit is in units of 4 KB.
 * --------------------------------------------- Low 32 bits ---------------------------------------------
 *     31-16        15-0
 * ┌───────────┬────────────┐
 * │ Base 15-0 │ Limit 15-0 │
 * └───────────┴────────────┘
 * ```
 */
class SegDesc : public Descriptor {
public:
    using Descriptor::Descriptor;

    /**
     * @brief Create a segment descriptor.
     *
     * @param base The low 32 bits of the segment address.
     * @param limit The segment limit.
     * @param attr The descriptor attribute.
     * @param large
     * If it is @p true, the limit is in units of 4 KB.
     * Otherwise, the limit is in units of bytes.
     */
    constexpr SegDesc(const stl::uint32_t base, const stl::uint32_t limit, const Attribute attr,
                      const bool large = false) noexcept :
        Descriptor {Format(base, limit, attr, large)} {}

    constexpr stl::uint32_t GetBase() const noexcept {
        const auto low {bit::GetBits(desc_, base_low_pos, base_low_len)};
        const auto high {bit::GetBits(desc_, base_high_pos, base_high_len)};
        return static_cast<stl::uint32_t>(low | (high << base_low_len));
    }

    constexpr stl::uint32_t GetLimit() const noexcept {
        const auto low {bit::GetBits(desc_, limit_low_pos, limit_low_len)};
        const auto high {bit::GetBits(desc_, limit_high_pos, limit_high_len)};
        return static_cast<stl::uint32_t>(low | (high << limit_low_len));
    }

    constexpr bool IsLongMode() const noexcept {
        return bit::IsBitSet(desc_, l_pos);
    }

    //! Mark the segment as a 64-bit code segment.
    constexpr SegDesc& SetLongMode(const bool long_mode = true) noexcept {
        if (long_mode) {
            bit::SetBit(desc_, l_pos);
            bit::ResetBit(desc_, db_pos);
        } else {
            bit::ResetBit(desc_, l_pos);
        }

        return *this;
    }

    constexpr bool IsLarge() const noexcept {
        return bit::IsBitSet(desc_, g_pos);
    }

private:
    static constexpr stl::size_t limit_low_pos {0};
    static constexpr stl::size_t limit_low_len {16};
    static constexpr stl::size_t base_low_pos {limit_low_pos + limit_low_len};
    static constexpr stl::size_t base_low_len {24};
    static_assert(attr_pos == base_low_pos + base_low_len);
    static constexpr stl::size_t limit_high_pos {attr_pos + sizeof(Attribute) * bit::byte_len};
    static constexpr stl::size_t limit_high_len {4};
    static constexpr stl::size_t avl_pos {limit_high_pos + limit_high_len};
    static constexpr stl::size_t l_pos {avl_pos + 1};
    static constexpr stl::size_t db_pos {l_pos + 1};
    static constexpr stl::size_t g_pos {db_pos + 1};
    static constexpr stl::size_t base_high_pos {g_pos + 1};
    static constexpr stl::size_t base_high_len {8};

    static constexpr stl::uint64_t Format(const stl::uint32_t base, const stl::uint32_t limit,
                                          const Attribute attr, const bool large) noexcept {
        stl::uint64_t desc {0};
        bit::SetBits(desc, bit::GetBits(limit, 0, limit_low_len), limit_low_pos, limit_low_len);
        bit::SetBits(desc, bit::GetBits(limit, limit_low_len, limit_high_len), limit_high_pos,
                     limit_high_len);
        bit::SetBits(desc, bit::GetBits(base, 0, base_low_len), base_low_pos, base_low_len);
        bit::SetBits(desc, bit::GetBits(base, base_low_len, base_high_len), base_high_pos,
                     base_high_len);
        bit::SetByte(desc, attr, attr_pos);
        if (large) {
            bit::SetBit(desc, g_pos);
        }

        return desc;
    }
};

static_assert(sizeof(SegDesc) == sizeof(stl::uint64_t));

/**
 * @brief The 16-byte system segment descriptor, used for the task state segment.
 *
 * @details
 * It occupies two slots in the global descriptor table.
 * The low slot has the layout of a segment descriptor.
 * The high slot holds the bits `32`-`63` of the segment address.
 */
class SysSegDesc {
public:
    constexpr SysSegDesc(const stl::uintptr_t base, const stl::uint32_t limit,
                         const Attribute attr) noexcept :
        low_ {static_cast<stl::uint32_t>(bit::GetLowDword(base)), limit, attr},
        high_ {bit::GetHighDword(base)} {}

    constexpr SegDesc GetLow() const noexcept {
        return low_;
    }

    constexpr SegDesc GetHigh() const noexcept {
        return high_;
    }

    constexpr stl::uintptr_t GetBase() const noexcept {
        return bit::CombineDwords(static_cast<stl::uint32_t>(high_), low_.GetBase());
    }

private:
    SegDesc low_;
    SegDesc high_;
};

/**
 * @brief The 16-byte gate descriptor in IA-32e mode.
 *
 * @details
 * ```
 * ------------------------------------------ Bytes 8-15 ------------------------------------------
 * ┌──────────┬─────────────┐
 * │ Reserved │ Offset 63-32│
 * └──────────┴─────────────┘
 * ------------------------------------------ Bytes 0-7 -------------------------------------------
 *      63-48        47-40     39-35   34-32     31-16        15-0
 * ┌──────────────┬───────────┬──────┬─────┬────────────┬───────────┐
 * │ Offset 31-16 │ Attribute │  0   │ IST │  Selector  │Offset 15-0│
 * └──────────────┴───────────┴──────┴─────┴────────────┴───────────┘
 *                                      ▲
 *                                      └─ 0: Use the current stack.
 *                                         1-7: Switch to the stack in the interrupt stack table.
 * ```
 */
class GateDesc {
public:
    constexpr GateDesc() noexcept = default;

    /**
     * @brief Create a gate descriptor.
     *
     * @param sel The selector for the code segment where the routine is located.
     * @param func The entry point of a routine.
     * @param attr The descriptor attribute.
     * @param stack_idx The index of the interrupt stack table entry, starting from @p 1. @p 0 means no stack switch.
     */
    constexpr GateDesc(const sel::Selector sel, const stl::uintptr_t func, const Attribute attr,
                       const stl::size_t stack_idx = 0) noexcept {
        SetSelector(sel).SetFuncOffset(func).SetAttribute(attr).SetStackIdx(stack_idx);
    }

    constexpr stl::uintptr_t GetFuncOffset() const noexcept {
        const auto low {bit::CombineWords(bit::GetWord(low_, offset_high_pos),
                                          bit::GetWord(low_, offset_low_pos))};
        return bit::CombineDwords(bit::GetLowDword(high_), low);
    }

    constexpr GateDesc& SetFuncOffset(const stl::uintptr_t func) noexcept {
        const auto low {bit::GetLowDword(func)};
        bit::SetWord(low_, bit::GetLowWord(low), offset_low_pos);
        bit::SetWord(low_, bit::GetHighWord(low), offset_high_pos);
        bit::SetDword(high_, bit::GetHighDword(func), 0);
        return *this;
    }

    constexpr sel::Selector GetSelector() const noexcept {
        return bit::GetWord(low_, sel_pos);
    }

    constexpr GateDesc& SetSelector(const sel::Selector sel) noexcept {
        bit::SetWord(low_, sel, sel_pos);
        return *this;
    }

    constexpr Attribute GetAttribute() const noexcept {
        return bit::GetByte(low_, attr_pos);
    }

    constexpr GateDesc& SetAttribute(const Attribute attr) noexcept {
        bit::SetByte(low_, attr, attr_pos);
        return *this;
    }

    constexpr stl::size_t GetStackIdx() const noexcept {
        return bit::GetBits(low_, ist_pos, ist_len);
    }

    constexpr GateDesc& SetStackIdx(const stl::size_t idx) noexcept {
        bit::SetBits(low_, idx, ist_pos, ist_len);
        return *this;
    }

    constexpr bool IsPresent() const noexcept {
        return GetAttribute().IsPresent();
    }

private:
    static constexpr stl::size_t offset_low_pos {0};
    static constexpr stl::size_t sel_pos {offset_low_pos + sizeof(stl::uint16_t) * bit::byte_len};
    static constexpr stl::size_t ist_pos {sel_pos + sizeof(sel::Selector) * bit::byte_len};
    static constexpr stl::size_t ist_len {3};
    static constexpr stl::size_t attr_pos {40};
    static constexpr stl::size_t offset_high_pos {attr_pos + sizeof(Attribute) * bit::byte_len};

    stl::uint64_t low_ {0};
    stl::uint64_t high_ {0};
};

static_assert(sizeof(GateDesc) == 2 * sizeof(stl::uint64_t));

#pragma pack(push, 1)

/**
 * The descriptor table register.
 * They store the location of a descriptor table.
 */
class DescTabReg {
public:
    constexpr DescTabReg() noexcept = default;

    constexpr DescTabReg(const stl::uintptr_t base, const stl::uint16_t limit) noexcept :
        limit_ {limit}, base_ {base} {}

    constexpr stl::uint16_t GetLimit() const noexcept {
        return limit_;
    }

    constexpr stl::uintptr_t GetBase() const noexcept {
        return base_;
    }

private:
    stl::uint16_t limit_ {0};
    stl::uintptr_t base_ {0};
};

static_assert(sizeof(DescTabReg) == sizeof(stl::uint16_t) + sizeof(stl::uint64_t));

#pragma pack(pop)

/**
 * @brief The descriptor table.
 *
 * @tparam T The descriptor type.
 *
 * @warning
 * This class cannot be used directly.
 * Developers should use its different subclasses depending on the memory layout.
 */
template <typename T>
class DescTab {
    static_assert(sizeof(T) % sizeof(stl::uint64_t) == 0);

public:
    virtual stl::size_t GetCount() const noexcept = 0;

    virtual const T* GetData() const noexcept = 0;

    const T& operator[](const stl::size_t idx) const noexcept {
        dbg::Assert(idx < GetCount());
        return GetDesc(idx);
    }

    T& operator[](const stl::size_t idx) noexcept {
        return const_cast<T&>(const_cast<const DescTab&>(*this)[idx]);
    }

    //! Build the corresponding descriptor table register.
    DescTabReg BuildReg() const noexcept {
        return {reinterpret_cast<stl::uintptr_t>(GetData()),
                static_cast<stl::uint16_t>(GetCount() * sizeof(T) - 1)};
    }

protected:
    DescTab() noexcept = default;

    ~DescTab() noexcept = default;

    virtual const T& GetDesc(stl::size_t) const noexcept = 0;
};

/**
 * The descriptor table that uses a built-in array to store descriptors.
 */
template <typename T, stl::size_t count>
class DescTabArray : public DescTab<T> {
public:
    stl::size_t GetCount() const noexcept override {
        return count;
    }

    const T* GetData() const noexcept override {
        return descs_.data();
    }

protected:
    const T& GetDesc(const stl::size_t idx) const noexcept override {
        return descs_[idx];
    }

    stl::array<T, count> descs_;
};

}  // namespace desc
