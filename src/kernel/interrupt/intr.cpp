#include "kernel/interrupt/intr.h"
#include "kernel/descriptor/gdt/tab.h"
#include "kernel/descriptor/tss.h"
#include "kernel/interrupt/fault.h"
#include "kernel/interrupt/pic.h"
#include "kernel/io/io.h"
#include "kernel/io/video/print.h"
#include "kernel/selector/sel.h"

namespace intr {

namespace {

extern "C" {

/**
 * @brief The entry points of interrupts, defined in @p src/kernel/interrupt/intr.asm.
 *
 * @details
 * They will be registered in the interrupt descriptor table.
 * When an interrupt @p i occurs:
 * 1. The CPU jumps to the entry point @p intr_entries[i].
 * 2. After saving registers, @p intr_entries[i] calls @p DispatchIntr.
 * 3. @p DispatchIntr calls the handler registered for @p i.
 */
extern stl::uintptr_t intr_entries[count];

//! Set the interrupt descriptor table register.
void SetIntrDescTabReg(stl::uint16_t limit, stl::uintptr_t base) noexcept;

//! Get the interrupt descriptor table register.
void GetIntrDescTabReg(desc::DescTabReg&) noexcept;
}

State& GetStateImpl() noexcept {
    static State state {State::Uninitialized};
    return state;
}

bool& IsInIntrContextImpl() noexcept {
    static bool in_intr {false};
    return in_intr;
}

void SetIntrDescTabReg(const desc::DescTabReg& reg) noexcept {
    SetIntrDescTabReg(reg.GetLimit(), reg.GetBase());
}

//! Initialize the interrupt descriptor table.
void InitIntrDescTab() noexcept {
    auto& idt {GetIntrDescTab()};
    for (stl::size_t i {0}; i != idt.GetCount(); ++i) {
        idt[i] = {sel::krnl_code, intr_entries[i], {desc::SysType::Intr64, Privilege::Zero}};
    }

    // A double fault may be caused by a kernel stack overflow, so it always switches to a known-good stack.
    idt[Intr::DoubleFault].SetStackIdx(tss::double_fault_stack_idx);
}

void RegisterIntrNames() noexcept {
    GetIntrHandlerTab()
        .Register(0x00, "#DE Divide Error")
        .Register(0x01, "#DB Debug Exception")
        .Register(0x02, "NMI Intr")
        .Register(Intr::Breakpoint, "#BP Breakpoint Exception")
        .Register(0x04, "#OF Overflow Exception")
        .Register(0x05, "#BR Bound Range Exceeded Exception")
        .Register(0x06, "#UD Invalid Opcode Exception")
        .Register(0x07, "#NM Device Not Available Exception")
        .Register(Intr::DoubleFault, "#DF Double Fault Exception")
        .Register(0x09, "Coprocessor Segment Overrun")
        .Register(0x0A, "#TS Invalid TSS Exception")
        .Register(0x0B, "#NP Segment Not Present")
        .Register(0x0C, "#SS Stack Fault Exception")
        .Register(0x0D, "#GP General Protection Exception")
        .Register(Intr::PageFault, "#PF Page-Fault Exception")
        .Register(0x10, "#MF x87 FPU Floating-Point Error")
        .Register(0x11, "#AC Alignment Check Exception")
        .Register(0x12, "#MC Machine-Check Exception")
        .Register(0x13, "#XF SIMD Floating-Point Exception")
        .Register(0x14, "#VE Virtualization Exception")
        .Register(0x15, "#CP Control Protection Exception")
        .Register(Intr::Timer, "Timer")
        .Register(Intr::Keyboard, "Keyboard")
        .Register(Intr::SpuriousMaster, "Spurious Master IRQ")
        .Register(Intr::SpuriousSlave, "Spurious Slave IRQ");
}

}  // namespace

desc::DescTabReg GetIntrDescTabReg() noexcept {
    desc::DescTabReg reg;
    GetIntrDescTabReg(reg);
    return reg;
}

IntrDescTab<count>& GetIntrDescTab() noexcept {
    static IntrDescTab<count> idt;
    return idt;
}

IntrHandlerTab<count>& GetIntrHandlerTab() noexcept {
    static IntrHandlerTab<count> handlers {"Unknown", DefaultIntrHandler};
    return handlers;
}

void InitIntr() noexcept {
    dbg::Assert(gdt::IsGlobalDescTabInstalled(),
                "The global descriptor table must be installed before interrupts");
    if (GetState() != State::Uninitialized) {
        dbg::Panic("The interrupt descriptor table has already been installed");
    }

    InitIntrDescTab();
    RegisterIntrNames();
    RegisterFaultHandlers();

    pic::Intr intrs[] {pic::Intr::Timer, pic::Intr::Keyboard};
    pic::InitPgmIntrCtrl(intrs);

    SetIntrDescTabReg(GetIntrDescTab().BuildReg());
    GetStateImpl() = State::Installed;
    io::PrintlnStr("The interrupt descriptor table has been initialized.");
}

void Activate() noexcept {
    dbg::Assert(GetState() == State::Installed,
                "Interrupts can only be activated after the interrupt descriptor table is installed");
    GetStateImpl() = State::Active;
    EnableIntr();
    io::PrintlnStr("Interrupts have been enabled.");
}

State GetState() noexcept {
    return GetStateImpl();
}

bool IsInIntrContext() noexcept {
    return IsInIntrContextImpl();
}

extern "C" {

bool IsIntrEnabled() noexcept {
    return io::RFlags::Get().If();
}

void DispatchIntr(const IntrStack& stack) noexcept {
    // An exception raised by a handler is dispatched in a nested context.
    auto& in_intr {IsInIntrContextImpl()};
    const auto prev_in_intr {in_intr};
    in_intr = true;
    GetIntrHandlerTab().GetHandler(stack.intr_num)(stack);
    in_intr = prev_in_intr;
}
}

IntrGuard::IntrGuard() noexcept : enabled_ {intr::IsIntrEnabled()} {
    if (enabled_) {
        intr::DisableIntr();
    }
}

IntrGuard::~IntrGuard() noexcept {
    if (enabled_) {
        intr::EnableIntr();
    }
}

void PrintIntrStack(const IntrStack& stack) noexcept {
    io::Printf("\tRIP: 0x{}\n", stack.old_rip);
    io::Printf("\tCS: 0x{}\n", stack.old_cs);
    io::Printf("\tRFLAGS: 0x{}\n", stack.rflags);
    io::Printf("\tRSP: 0x{}\n", stack.old_rsp);
    io::Printf("\tSS: 0x{}\n", stack.old_ss);
}

void DefaultIntrHandler(const IntrStack& stack) noexcept {
    const auto intr_num {stack.intr_num};
    if (intr_num == static_cast<stl::size_t>(Intr::SpuriousMaster)
        || intr_num == static_cast<stl::size_t>(Intr::SpuriousSlave)) {
        // Ignore spurious interrupts.
        return;
    }

    io::PrintlnStr("\n!!!!! Exception !!!!!");
    io::Printf("\t0x{} {}\n", intr_num, GetIntrHandlerTab().GetName(intr_num));
    io::Printf("\tError Code: 0x{}\n", stack.err_code);
    PrintIntrStack(stack);
    dbg::HaltSystem();
}

}  // namespace intr
