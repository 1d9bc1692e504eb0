#include "kernel/boot/boot_info.h"
#include "kernel/debug/assert.h"
#include "kernel/io/io.h"
#include "kernel/io/keyboard.h"
#include "kernel/io/timer.h"
#include "kernel/io/video/console.h"
#include "kernel/io/video/print.h"
#include "kernel/krnl.h"
#include "kernel/memory/heap.h"
#include "kernel/stl/array.h"
#include "kernel/task/example.h"
#include "kernel/task/executor.h"

namespace {

//! Allocate a few objects through the global allocation operators.
void TestHeap() noexcept {
    auto* const num {new stl::uint64_t {0x29}};
    io::Printf("A number 0x{} is stored in the heap at 0x{}.\n", *num,
               reinterpret_cast<stl::uintptr_t>(num));

    auto* const nums {new stl::array<stl::uint64_t, 500> {}};
    stl::uint64_t sum {0};
    for (stl::size_t i {0}; i != nums->size(); ++i) {
        (*nums)[i] = i;
        sum += (*nums)[i];
    }

    io::Printf("The sum of 0x{} numbers in the heap is 0x{}.\n", nums->size(), sum);
    delete nums;
    delete num;
    io::Printf("The heap has 0x{} bytes in use.\n", mem::GetKrnlHeap().GetUsedSize());
}

}  // namespace

/**
 * @brief The entry of the kernel in C++.
 *
 * @param boot_info The boot information provided by the boot loader.
 */
extern "C" [[noreturn]] void KernelMain(const boot::BootInfo* const boot_info) noexcept {
    dbg::Assert(boot_info, "The boot information is missing");
    io::InitConsole(boot_info->phy_mem_offset);
    InitKernel(*boot_info);

    io::Breakpoint();
    io::PrintlnStr("The kernel continues after a breakpoint.");
    TestHeap();

    static task::FixedWakeQueue<wake_queue_capacity> wake_queue;
    task::Executor executor {mem::GetKrnlHeap(), wake_queue};
    dbg::Assert(executor.Spawn<task::ExampleTask>() != task::invalid_task_id);
    dbg::Assert(executor.Spawn<io::KeyboardTask>() != task::invalid_task_id);
    dbg::Assert(executor.Spawn<io::HeartbeatTask>() != task::invalid_task_id);
    executor.Run();
}
