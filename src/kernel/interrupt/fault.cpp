#include "kernel/interrupt/fault.h"
#include "kernel/io/io.h"
#include "kernel/io/video/print.h"

namespace intr {

void BreakpointHandler(const IntrStack& stack) noexcept {
    io::PrintlnStr("#BP Breakpoint Exception");
    PrintIntrStack(stack);
}

void DoubleFaultHandler(const IntrStack& stack) noexcept {
    io::PrintlnStr("\n!!!!! Exception !!!!!");
    io::PrintlnStr("\t#DF Double Fault Exception");
    io::Printf("\tError Code: 0x{}\n", stack.err_code);
    PrintIntrStack(stack);
    dbg::HaltSystem();
}

void PageFaultHandler(const IntrStack& stack) noexcept {
    const PageFaultErrCode err_code {stack.err_code};
    io::PrintlnStr("\n!!!!! Exception !!!!!");
    io::PrintlnStr("\t#PF Page-Fault Exception");
    io::Printf("\tAccessed Address: 0x{}\n", io::GetCr2());
    io::Printf("\tError Code: 0x{} ({}, {}{})\n", static_cast<stl::uint64_t>(err_code),
               err_code.IsProtectionViolation() ? "protection violation" : "page not present",
               err_code.IsWrite() ? "write" : "read",
               err_code.IsInstrFetch() ? ", instruction fetch" : "");
    PrintIntrStack(stack);
    dbg::HaltSystem();
}

void RegisterFaultHandlers() noexcept {
    GetIntrHandlerTab()
        .Register(Intr::Breakpoint, &BreakpointHandler)
        .Register(Intr::DoubleFault, &DoubleFaultHandler)
        .Register(Intr::PageFault, &PageFaultHandler);
}

}  // namespace intr
