/**
 * @file executor.h
 * @brief The cooperative task executor.
 *
 * @par GitHub
 * https://github.com/Zhuagenborn
 */

#pragma once

#include "kernel/io/video/print.h"
#include "kernel/memory/heap.h"
#include "kernel/stl/type_traits.h"
#include "kernel/stl/utility.h"
#include "kernel/task/task.h"
#include "kernel/util/tag_list.h"

#include <new>

namespace task {

/**
 * @brief The single-threaded cooperative task executor.
 *
 * @details
 * Tasks are stored in the heap and owned by the executor.
 * The executor only polls the tasks whose IDs are in the wake queue.
 * When no task is ready, the processor sleeps until the next interrupt.
 */
class Executor {
public:
    /**
     * @brief Create an executor.
     *
     * @param heap The heap storing tasks.
     * @param queue The queue of IDs of ready tasks.
     */
    Executor(mem::HeapAllocator& heap, WakeQueue& queue) noexcept;

    Executor(const Executor&) = delete;

    //! Destroy all remaining tasks.
    ~Executor() noexcept;

    /**
     * @brief Create a task and schedule it.
     *
     * @tparam T The task type.
     * @param args Arguments to construct the task.
     * @return The task ID, or @p invalid_task_id if the heap or the wake queue is full.
     */
    template <typename T, typename... Args>
    TaskId Spawn(Args&&... args) noexcept {
        static_assert(stl::is_base_of_v<Task, T>);
        auto* const storage {heap_.Allocate(sizeof(T), alignof(T))};
        if (!storage) {
            io::PrintlnStr("WARNING: The heap is full. A task cannot be spawned.");
            return invalid_task_id;
        }

        auto* const task {::new (storage) T(stl::forward<Args>(args)...)};
        return Attach({task, storage, sizeof(T), alignof(T)});
    }

    /**
     * @brief Poll tasks until the wake queue is empty.
     *
     * @details
     * IDs of finished tasks are skipped. A task is destroyed after it completes.
     */
    void RunReadyTasks() noexcept;

    //! Run tasks forever. The processor sleeps when no task is ready.
    [[noreturn]] void Run() noexcept;

    //! Get the number of unfinished tasks.
    stl::size_t GetTaskCount() const noexcept;

    //! Whether a task has been spawned and has not finished.
    bool HasTask(TaskId) const noexcept;

private:
    //! The memory of a task.
    struct Storage {
        Task* task;
        void* addr;
        stl::size_t size;
        stl::size_t align;
    };

    //! The bookkeeping record of a spawned task.
    struct TaskSlot {
        //! It must be the first member so that the slot can be found by its tag.
        TagList::Tag tag;
        TaskId id;
        Storage storage;
    };

    //! Record a constructed task and push it into the wake queue.
    TaskId Attach(const Storage&) noexcept;

    TaskSlot* FindTask(TaskId) const noexcept;

    void Release(const Storage&) noexcept;

    void Destroy(TaskSlot&) noexcept;

    /**
     * @brief Sleep until the next interrupt if no task is ready.
     *
     * @details
     * Interrupts are disabled while the queue is checked,
     * then enabled and the processor halts in one atomic step.
     * Otherwise an interrupt could wake a task between the check and @p hlt, and the wake-up would be lost.
     */
    void SleepIfIdle() noexcept;

    mem::HeapAllocator& heap_;
    WakeQueue& queue_;
    TagList tasks_;
    TaskId next_id_ {invalid_task_id + 1};
};

}  // namespace task
