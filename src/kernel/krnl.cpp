#include "kernel/krnl.h"
#include "kernel/boot/boot_info.h"
#include "kernel/descriptor/gdt/tab.h"
#include "kernel/interrupt/intr.h"
#include "kernel/io/keyboard.h"
#include "kernel/io/timer.h"
#include "kernel/memory/mem.h"

void InitKernel(const boot::BootInfo& boot_info) noexcept {
    gdt::InitGlobalDescTab();
    intr::InitIntr();
    mem::InitMem(boot_info);
    io::InitTimer();
    io::InitKeyboard();
    intr::Activate();
}
