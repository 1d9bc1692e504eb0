#include "kernel/task/waker.h"
#include "kernel/io/video/print.h"

namespace task {

bool Waker::Wake() const noexcept {
    dbg::Assert(IsValid(), "The waker is invalid");
    if (!queue_->TryPush(id_)) {
        io::Printf("WARNING: The wake queue is full. The task 0x{} is dropped.\n", id_);
        return false;
    }

    return true;
}

WakerSlot& WakerSlot::Register(const Waker& waker) noexcept {
    dbg::Assert(waker.IsValid(), "The waker is invalid");
    const intr::IntrGuard guard;
    waker_ = waker;
    registered_ = true;
    return *this;
}

bool WakerSlot::Wake() noexcept {
    Waker waker;
    {
        const intr::IntrGuard guard;
        if (!registered_) {
            return false;
        }

        waker = waker_;
        registered_ = false;
    }

    return waker.Wake();
}

bool WakerSlot::IsEmpty() const noexcept {
    const intr::IntrGuard guard;
    return !registered_;
}

}  // namespace task
