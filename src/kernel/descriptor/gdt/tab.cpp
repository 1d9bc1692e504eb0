#include "kernel/descriptor/gdt/tab.h"
#include "kernel/descriptor/tss.h"
#include "kernel/io/video/print.h"
#include "kernel/selector/sel.h"

namespace gdt {

namespace {

extern "C" {

//! Set the global descriptor table register.
void SetGlobalDescTabReg(stl::uint16_t limit, stl::uintptr_t base) noexcept;

//! Get the global descriptor table register.
void GetGlobalDescTabReg(desc::DescTabReg&) noexcept;

/**
 * @brief Reload segment registers.
 *
 * @details
 * @p CS can only be changed by a far jump or return.
 *
 * @param code A selector to a code segment.
 * @param data A selector to a data segment, loaded into @p DS, @p ES, @p SS, @p FS and @p GS.
 */
void ReloadSegRegs(stl::uint16_t code, stl::uint16_t data) noexcept;

/**
 * @brief Set the task register.
 *
 * @param sel A selector to a task state segment.
 */
void SetTaskReg(stl::uint16_t sel) noexcept;
}

bool& IsGlobalDescTabInstalledImpl() noexcept {
    static bool installed {false};
    return installed;
}

void SetGlobalDescTabReg(const desc::DescTabReg& reg) noexcept {
    SetGlobalDescTabReg(reg.GetLimit(), reg.GetBase());
}

}  // namespace

desc::DescTabReg GetGlobalDescTabReg() noexcept {
    desc::DescTabReg reg;
    GetGlobalDescTabReg(reg);
    return reg;
}

GlobalDescTab& GetGlobalDescTab() noexcept {
    static GlobalDescTab gdt;
    return gdt;
}

void InitGlobalDescTab() noexcept {
    if (IsGlobalDescTabInstalled()) {
        dbg::Panic("The global descriptor table has already been installed");
    }

    auto& gdt {GetGlobalDescTab()};
    gdt[idx::krnl_code] =
        desc::SegDesc {0, 0xFFFFF, {desc::NonSysType::ReadExecCode, Privilege::Zero}, true}
            .SetLongMode();
    gdt[idx::krnl_data] =
        desc::SegDesc {0, 0xFFFFF, {desc::NonSysType::ReadWriteData, Privilege::Zero}, true};

    // Create a kernel descriptor for the task state segment.
    auto& task_seg {tss::GetTaskStateSeg()};
    task_seg.SetIntrStack(tss::double_fault_stack_idx, tss::GetDoubleFaultStackTop());
    const desc::SysSegDesc tss_desc {reinterpret_cast<stl::uintptr_t>(&task_seg),
                                     sizeof(task_seg) - 1,
                                     {desc::SysType::Tss64, Privilege::Zero}};
    gdt[idx::tss] = tss_desc.GetLow();
    gdt[idx::tss + 1] = tss_desc.GetHigh();

    SetGlobalDescTabReg(gdt.BuildReg());
    ReloadSegRegs(sel::krnl_code, sel::krnl_data);
    SetTaskReg(sel::tss);

    IsGlobalDescTabInstalledImpl() = true;
    io::PrintlnStr("The global descriptor table has been initialized.");
}

bool IsGlobalDescTabInstalled() noexcept {
    return IsGlobalDescTabInstalledImpl();
}

}  // namespace gdt
