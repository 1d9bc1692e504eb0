#include "kernel/descriptor/tss.h"
#include "kernel/debug/assert.h"
#include "kernel/krnl.h"
#include "kernel/stl/array.h"

namespace tss {

namespace {

using DoubleFaultStack = stl::array<stl::byte, double_fault_stack_size>;

/**
 * @brief The stack reserved for the double fault handler.
 *
 * @details
 * It is not allocated from the heap, so it is usable even if memory management is broken.
 */
DoubleFaultStack& GetDoubleFaultStack() noexcept {
    alignas(16) static DoubleFaultStack stack;
    return stack;
}

}  // namespace

TaskStateSeg& TaskStateSeg::SetIntrStack(const stl::size_t idx, const stl::uintptr_t top) noexcept {
    dbg::Assert(0 < idx && idx <= intr_stack_count);
    ist[idx - 1] = top;
    return *this;
}

stl::uintptr_t TaskStateSeg::GetIntrStack(const stl::size_t idx) const noexcept {
    dbg::Assert(0 < idx && idx <= intr_stack_count);
    return ist[idx - 1];
}

TaskStateSeg& GetTaskStateSeg() noexcept {
    static TaskStateSeg tss {.io_base = sizeof(TaskStateSeg)};
    return tss;
}

stl::uintptr_t GetDoubleFaultStackBottom() noexcept {
    return reinterpret_cast<stl::uintptr_t>(GetDoubleFaultStack().data());
}

stl::uintptr_t GetDoubleFaultStackTop() noexcept {
    // Stacks grow downwards.
    return GetDoubleFaultStackBottom() + GetDoubleFaultStack().size();
}

}  // namespace tss
