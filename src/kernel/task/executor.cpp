#include "kernel/task/executor.h"
#include "kernel/interrupt/intr.h"
#include "kernel/io/io.h"
#include "kernel/io/video/print.h"

namespace task {

Executor::Executor(mem::HeapAllocator& heap, WakeQueue& queue) noexcept :
    heap_ {heap}, queue_ {queue} {}

Executor::~Executor() noexcept {
    while (const auto tag {tasks_.GetFront()}) {
        Destroy(tag->GetElem<TaskSlot>());
    }
}

TaskId Executor::Attach(const Storage& storage) noexcept {
    auto* const mem {heap_.Allocate(sizeof(TaskSlot), alignof(TaskSlot))};
    if (!mem) {
        io::PrintlnStr("WARNING: The heap is full. A task cannot be spawned.");
        Release(storage);
        return invalid_task_id;
    }

    const auto id {next_id_};
    if (!queue_.TryPush(id)) {
        io::PrintlnStr("WARNING: The wake queue is full. A task cannot be spawned.");
        heap_.Free(mem, sizeof(TaskSlot), alignof(TaskSlot));
        Release(storage);
        return invalid_task_id;
    }

    ++next_id_;
    auto* const slot {::new (mem) TaskSlot {}};
    slot->id = id;
    slot->storage = storage;
    tasks_.PushBack(slot->tag);
    return id;
}

void Executor::RunReadyTasks() noexcept {
    while (const auto id {queue_.TryPop()}) {
        auto* const slot {FindTask(*id)};
        if (!slot) {
            // The task has finished.
            continue;
        }

        const Waker waker {queue_, *id};
        if (slot->storage.task->Poll(waker) == PollResult::Complete) {
            Destroy(*slot);
        }
    }
}

void Executor::Run() noexcept {
    while (true) {
        RunReadyTasks();
        SleepIfIdle();
    }
}

void Executor::SleepIfIdle() noexcept {
    intr::DisableIntr();
    if (queue_.IsEmpty()) {
        io::EnableIntrAndHalt();
    } else {
        intr::EnableIntr();
    }
}

stl::size_t Executor::GetTaskCount() const noexcept {
    return tasks_.GetSize();
}

bool Executor::HasTask(const TaskId id) const noexcept {
    return FindTask(id) != nullptr;
}

Executor::TaskSlot* Executor::FindTask(TaskId id) const noexcept {
    const auto tag {tasks_.Find(
        [](const TagList::Tag& tag, void* const arg) noexcept {
            return tag.GetElem<TaskSlot>().id == *static_cast<const TaskId*>(arg);
        },
        &id)};
    return tag ? &tag->GetElem<TaskSlot>() : nullptr;
}

void Executor::Release(const Storage& storage) noexcept {
    storage.task->~Task();
    heap_.Free(storage.addr, storage.size, storage.align);
}

void Executor::Destroy(TaskSlot& slot) noexcept {
    slot.tag.Detach();
    Release(slot.storage);
    slot.~TaskSlot();
    heap_.Free(&slot, sizeof(TaskSlot), alignof(TaskSlot));
}

}  // namespace task
