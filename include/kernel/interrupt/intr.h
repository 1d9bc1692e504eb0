/**
 * @file intr.h
 * @brief The interrupt.
 *
 * @par GitHub
 * https://github.com/Zhuagenborn
 */

#pragma once

#include "kernel/debug/assert.h"
#include "kernel/descriptor/desc.h"
#include "kernel/stl/string_view.h"
#include "kernel/stl/utility.h"

namespace intr {

//! The number of interrupts.
inline constexpr stl::size_t count {0x100};
//! The interrupt number of the first user-defined interrupt.
inline constexpr stl::size_t start_usr_intr_num {0x20};

//! Interrupt numbers.
enum class Intr {
    //! The breakpoint trap raised by @p int3.
    Breakpoint = 0x03,
    //! The double fault.
    DoubleFault = 0x08,
    //! The memory page fault.
    PageFault = 0x0E,

    /* Interrupts of Intel 8259A Programmable Interrupt Controller */
    //! The timer.
    Timer = start_usr_intr_num,
    //! The keyboard.
    Keyboard,
    //! The spurious interrupt of the master chip.
    SpuriousMaster = start_usr_intr_num + 7,
    //! The spurious interrupt of the slave chip.
    SpuriousSlave = start_usr_intr_num + 15
    /********************************************************************/
};

//! The initialization state of interrupts.
enum class State {
    //! The interrupt descriptor table has not been loaded.
    Uninitialized,
    //! The interrupt descriptor table has been loaded but interrupts are disabled.
    Installed,
    //! Interrupts are enabled.
    Active
};

//! The interrupt descriptor table.
template <stl::size_t count>
class IntrDescTab : public desc::DescTabArray<desc::GateDesc, count> {
public:
    using desc::DescTabArray<desc::GateDesc, count>::operator[];

    const desc::GateDesc& operator[](const Intr intr) const noexcept {
        return this->descs_[static_cast<stl::size_t>(intr)];
    }

    desc::GateDesc& operator[](const Intr intr) noexcept {
        return const_cast<desc::GateDesc&>(const_cast<const IntrDescTab&>(*this)[intr]);
    }
};

/**
 * @brief The interrupt stack.
 *
 * @details
 * When an interrupt occurs, these values are pushed onto the stack.
 * Some values are automatically pushed by the CPU.
 * Some values are manually pushed by the kernel in the macro @p intr_entry in @p src/kernel/interrupt/intr.asm.
 *
 * @see @p src/kernel/interrupt/intr.asm
 */
struct IntrStack {
    /* These values are manually pushed by the kernel */
    stl::uint64_t r15;
    stl::uint64_t r14;
    stl::uint64_t r13;
    stl::uint64_t r12;
    stl::uint64_t r11;
    stl::uint64_t r10;
    stl::uint64_t r9;
    stl::uint64_t r8;
    stl::uint64_t rbp;
    stl::uint64_t rdi;
    stl::uint64_t rsi;
    stl::uint64_t rdx;
    stl::uint64_t rcx;
    stl::uint64_t rbx;
    stl::uint64_t rax;
    stl::uint64_t intr_num;

    /* These values are automatically pushed by the CPU */
    /**
     * @details
     * Some interrupts do not have an error code.
     * To simplify the code, we push a zero when those interrupts occur.
     */
    stl::uint64_t err_code;
    stl::uint64_t old_rip;
    stl::uint64_t old_cs;
    stl::uint64_t rflags;
    stl::uint64_t old_rsp;
    stl::uint64_t old_ss;
};

static_assert(sizeof(IntrStack) % 16 == 0);

//! The interrupt handler.
using Handler = void (*)(const IntrStack&) noexcept;

/**
 * @brief The interrupt handler table.
 *
 * @details
 * It can be regarded as a manager for an array of function pointers.
 */
template <stl::size_t count>
class IntrHandlerTab {
    static_assert(count > 0);

public:
    /**
     * @brief Create an interrupt handler table.
     *
     * @param default_name The default interrupt handler name.
     * @param default_handler The default interrupt handler.
     */
    IntrHandlerTab(const stl::string_view default_name, const Handler default_handler) noexcept {
        for (stl::size_t i {0}; i != count; ++i) {
            Register(i, default_name, default_handler);
        }
    }

    IntrHandlerTab(const IntrHandlerTab&) = delete;

    /**
     * @brief Register a name.
     *
     * @warning The name is not copied. It must outlive the table.
     */
    IntrHandlerTab& Register(const stl::size_t idx, const stl::string_view name) noexcept {
        dbg::Assert(idx < count);
        names_[idx] = name;
        return *this;
    }

    IntrHandlerTab& Register(const stl::size_t idx, const Handler handler) noexcept {
        dbg::Assert(idx < count);
        dbg::Assert(handler, "The interrupt handler is null");
        handlers_[idx] = handler;
        return *this;
    }

    IntrHandlerTab& Register(const stl::size_t idx, const stl::string_view name,
                             const Handler handler) noexcept {
        Register(idx, name);
        return Register(idx, handler);
    }

    IntrHandlerTab& Register(const Intr intr, const stl::string_view name) noexcept {
        return Register(static_cast<stl::size_t>(intr), name);
    }

    IntrHandlerTab& Register(const Intr intr, const Handler handler) noexcept {
        return Register(static_cast<stl::size_t>(intr), handler);
    }

    IntrHandlerTab& Register(const Intr intr, const stl::string_view name,
                             const Handler handler) noexcept {
        return Register(static_cast<stl::size_t>(intr), name, handler);
    }

    stl::string_view GetName(const stl::size_t idx) const noexcept {
        dbg::Assert(idx < count);
        return names_[idx];
    }

    Handler GetHandler(const stl::size_t idx) const noexcept {
        dbg::Assert(idx < count);
        return handlers_[idx];
    }

    Handler GetHandler(const Intr intr) const noexcept {
        return GetHandler(static_cast<stl::size_t>(intr));
    }

    constexpr stl::size_t GetCount() const noexcept {
        return count;
    }

private:
    stl::array<stl::string_view, count> names_;
    stl::array<Handler, count> handlers_;
};

extern "C" {
//! Enable interrupts.
void EnableIntr() noexcept;

//! Disable interrupts.
void DisableIntr() noexcept;

//! Whether interrupts are enabled
bool IsIntrEnabled() noexcept;

/**
 * @brief Call the handler registered for an interrupt.
 *
 * @details
 * It is called by the entry points in @p src/kernel/interrupt/intr.asm after registers are saved.
 * The handler runs in interrupt context.
 */
void DispatchIntr(const IntrStack&) noexcept;
}

/**
 * @brief Initialize interrupts.
 *
 * @details
 * The global descriptor table must have been installed.
 * Interrupts are still disabled after initialization. @p Activate enables them.
 */
void InitIntr() noexcept;

//! Enable interrupts after the interrupt descriptor table has been installed.
void Activate() noexcept;

//! Get the initialization state of interrupts.
State GetState() noexcept;

//! Whether the code is running in an interrupt handler.
bool IsInIntrContext() noexcept;

/**
 * @brief The interrupt guard.
 *
 * @details
 * It provides a convenient RAII-style mechanism for disabling interrupts for the duration of a scoped block.
 */
class IntrGuard {
public:
    //! Disable interrupts.
    IntrGuard() noexcept;

    IntrGuard(const IntrGuard&) = delete;

    //! Restore the original interrupt state.
    ~IntrGuard() noexcept;

private:
    bool enabled_;
};

/**
 * @brief The default interrupt handler.
 *
 * @details
 * It prints interrupt information and halts the system.
 * Spurious interrupts from the interrupt controllers are ignored.
 */
void DefaultIntrHandler(const IntrStack&) noexcept;

//! Print the registers saved by the CPU when an interrupt occurs.
void PrintIntrStack(const IntrStack&) noexcept;

//! Get the interrupt descriptor table register.
desc::DescTabReg GetIntrDescTabReg() noexcept;

//! Get the interrupt descriptor table.
IntrDescTab<count>& GetIntrDescTab() noexcept;

//! Get the interrupt handler table.
IntrHandlerTab<count>& GetIntrHandlerTab() noexcept;

}  // namespace intr
