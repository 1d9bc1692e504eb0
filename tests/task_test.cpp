#include "kernel/interrupt/intr.h"
#include "kernel/io/keyboard.h"
#include "kernel/io/timer.h"
#include "kernel/krnl.h"
#include "kernel/memory/heap.h"
#include "kernel/task/example.h"
#include "kernel/task/executor.h"
#include "kernel/task/waker.h"
#include "kernel/util/ring_queue.h"
#include "mock/cpu.h"
#include "mock/host_mem.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

namespace {

//! The port of the master interrupt controller's command register.
constexpr std::uint16_t master_pic_cmd_port {0x20};
//! The keyboard data port.
constexpr std::uint16_t keyboard_data_port {0x60};
//! The end-of-interrupt command.
constexpr std::uint8_t end_of_intr {0x20};

//! A long-lived wake queue for wakers registered to global event sources.
task::WakeQueue& GetEventQueue() noexcept {
    static task::FixedWakeQueue<wake_queue_capacity> queue;
    return queue;
}

template <typename T>
void Drain(RingQueue<T>& queue) noexcept {
    while (queue.TryPop()) {
    }
}

std::vector<task::TaskId> PopAll(task::WakeQueue& queue) {
    std::vector<task::TaskId> ids;
    while (const auto id {queue.TryPop()}) {
        ids.push_back(*id);
    }

    return ids;
}

//! What happened to a task.
struct Probe {
    std::size_t polls {0};
    bool destroyed {false};
};

//! A task that wakes itself a number of times before it completes.
class CountingTask : public task::Task {
public:
    CountingTask(Probe& probe, const std::size_t pending_polls) noexcept :
        probe_ {probe}, pending_polls_ {pending_polls} {}

    ~CountingTask() noexcept override {
        probe_.destroyed = true;
    }

    task::PollResult Poll(const task::Waker& waker) noexcept override {
        if (++probe_.polls <= pending_polls_) {
            waker.Wake();
            return task::PollResult::Pending;
        }

        return task::PollResult::Complete;
    }

private:
    Probe& probe_;
    std::size_t pending_polls_;
};

//! A task that waits without registering its waker anywhere.
class WaitingTask : public task::Task {
public:
    explicit WaitingTask(Probe& probe) noexcept : probe_ {probe} {}

    ~WaitingTask() noexcept override {
        probe_.destroyed = true;
    }

    task::PollResult Poll(const task::Waker&) noexcept override {
        ++probe_.polls;
        return task::PollResult::Pending;
    }

private:
    Probe& probe_;
};

//! A task that waits on an external event a number of times before it completes.
class EventTask : public task::Task {
public:
    EventTask(Probe& probe, task::WakerSlot& event, const std::size_t pending_polls) noexcept :
        probe_ {probe}, event_ {event}, pending_polls_ {pending_polls} {}

    ~EventTask() noexcept override {
        probe_.destroyed = true;
    }

    task::PollResult Poll(const task::Waker& waker) noexcept override {
        if (++probe_.polls <= pending_polls_) {
            event_.Register(waker);
            return task::PollResult::Pending;
        }

        return task::PollResult::Complete;
    }

private:
    Probe& probe_;
    task::WakerSlot& event_;
    std::size_t pending_polls_;
};

//! A task that records its ID each time it is polled and never completes.
class RecordingTask : public task::Task {
public:
    explicit RecordingTask(std::vector<task::TaskId>& polled) noexcept : polled_ {polled} {}

    task::PollResult Poll(const task::Waker& waker) noexcept override {
        polled_.push_back(waker.GetTaskId());
        return task::PollResult::Pending;
    }

private:
    std::vector<task::TaskId>& polled_;
};

//! An unused interrupt vector for simulated device interrupts.
constexpr std::size_t device_intr {0x60};

//! The event a simulated device interrupt signals.
task::WakerSlot& GetDeviceEvent() noexcept {
    static task::WakerSlot event;
    return event;
}

void SignalDeviceEvent(const intr::IntrStack&) noexcept {
    GetDeviceEvent().Wake();
}

//! The wakers a simulated interrupt fires, and whether each wake-up succeeded.
struct IntrWakes {
    std::vector<task::Waker> wakers;
    std::vector<bool> results;
};

IntrWakes& GetIntrWakes() noexcept {
    static IntrWakes wakes;
    return wakes;
}

void WakeTasksInIntr(const intr::IntrStack&) noexcept {
    auto& wakes {GetIntrWakes()};
    for (const auto& waker : wakes.wakers) {
        wakes.results.push_back(waker.Wake());
    }
}

void RaiseIntr(const std::size_t vector) noexcept {
    intr::IntrStack stack {};
    stack.intr_num = vector;
    intr::DispatchIntr(stack);
}

}  // namespace

TEST(RingQueueTest, RejectsPushesWhenFull) {
    RingQueueArray<task::TaskId, 16> queue;
    EXPECT_EQ(queue.GetCapacity(), 16U);
    EXPECT_TRUE(queue.IsEmpty());
    for (task::TaskId id {1}; id <= 16; ++id) {
        EXPECT_TRUE(queue.TryPush(id));
    }

    EXPECT_TRUE(queue.IsFull());
    EXPECT_EQ(queue.GetSize(), 16U);
    EXPECT_FALSE(queue.TryPush(17));

    for (task::TaskId id {1}; id <= 16; ++id) {
        EXPECT_EQ(queue.TryPop().value_or(0), id);
    }

    EXPECT_TRUE(queue.IsEmpty());
    EXPECT_FALSE(queue.TryPop());
}

TEST(RingQueueTest, WrapsAround) {
    RingQueueArray<task::TaskId, 3> queue;
    for (task::TaskId id {1}; id != 40; ++id) {
        ASSERT_TRUE(queue.TryPush(id));
        ASSERT_TRUE(queue.TryPush(id + 1000));
        EXPECT_EQ(queue.TryPop().value_or(0), id);
        EXPECT_EQ(queue.TryPop().value_or(0), id + 1000);
    }

    EXPECT_TRUE(queue.IsEmpty());
}

TEST(RingQueueTest, RestoresIntrState) {
    RingQueueArray<task::TaskId, 2> queue;
    mock::GetCpu().intr_enabled = true;
    EXPECT_TRUE(queue.TryPush(1));
    EXPECT_TRUE(mock::GetCpu().intr_enabled);

    mock::GetCpu().intr_enabled = false;
    EXPECT_TRUE(queue.TryPush(2));
    EXPECT_FALSE(mock::GetCpu().intr_enabled);
    EXPECT_FALSE(queue.TryPush(3));
    EXPECT_FALSE(mock::GetCpu().intr_enabled);
}

TEST(WakerTest, FailsOnFullQueue) {
    task::FixedWakeQueue<1> queue;
    const task::Waker first {queue, 1};
    const task::Waker second {queue, 2};
    EXPECT_TRUE(first.IsValid());
    EXPECT_FALSE(task::Waker {}.IsValid());
    EXPECT_TRUE(first.Wake());
    EXPECT_FALSE(second.Wake());
    EXPECT_EQ(PopAll(queue), (std::vector<task::TaskId> {1}));
}

TEST(WakerSlotTest, WakesOnce) {
    task::FixedWakeQueue<4> queue;
    task::WakerSlot slot;
    EXPECT_TRUE(slot.IsEmpty());
    EXPECT_FALSE(slot.Wake());

    slot.Register({queue, 1});
    // A new waker replaces the old one.
    slot.Register({queue, 2});
    EXPECT_FALSE(slot.IsEmpty());
    EXPECT_TRUE(slot.Wake());
    EXPECT_TRUE(slot.IsEmpty());
    EXPECT_FALSE(slot.Wake());
    EXPECT_EQ(PopAll(queue), (std::vector<task::TaskId> {2}));
}

class ExecutorTest : public testing::Test {
protected:
    void SetUp() override {
        mock::Reset();
        heap_.Init(mem_.GetAddr(), krnl_heap_size);
    }

    mock::HostMem mem_ {krnl_heap_size};
    mem::HeapAllocator heap_;
    task::FixedWakeQueue<wake_queue_capacity> queue_;
};

TEST_F(ExecutorTest, RunsSelfWakingTaskToCompletion) {
    Probe probe;
    task::Executor executor {heap_, queue_};
    const auto id {executor.Spawn<CountingTask>(probe, 2)};
    ASSERT_NE(id, task::invalid_task_id);
    EXPECT_TRUE(executor.HasTask(id));
    EXPECT_GT(heap_.GetUsedSize(), 0U);

    executor.RunReadyTasks();
    EXPECT_EQ(probe.polls, 3U);
    EXPECT_TRUE(probe.destroyed);
    EXPECT_FALSE(executor.HasTask(id));
    EXPECT_EQ(executor.GetTaskCount(), 0U);
    EXPECT_EQ(heap_.GetUsedSize(), 0U);
    EXPECT_TRUE(queue_.IsEmpty());
}

TEST_F(ExecutorTest, PollsOncePerExternalWake) {
    Probe probe;
    auto& event {GetDeviceEvent()};
    intr::GetIntrHandlerTab().Register(device_intr, &SignalDeviceEvent);
    task::Executor executor {heap_, queue_};
    const auto id {executor.Spawn<EventTask>(probe, event, 2)};
    ASSERT_NE(id, task::invalid_task_id);

    executor.RunReadyTasks();
    EXPECT_EQ(probe.polls, 1U);
    EXPECT_FALSE(event.IsEmpty());
    EXPECT_TRUE(queue_.IsEmpty());

    RaiseIntr(device_intr);
    EXPECT_TRUE(event.IsEmpty());
    EXPECT_EQ(queue_.GetSize(), 1U);
    executor.RunReadyTasks();
    EXPECT_EQ(probe.polls, 2U);
    EXPECT_TRUE(executor.HasTask(id));

    RaiseIntr(device_intr);
    executor.RunReadyTasks();
    EXPECT_EQ(probe.polls, 3U);
    EXPECT_TRUE(probe.destroyed);
    EXPECT_FALSE(executor.HasTask(id));
    EXPECT_EQ(heap_.GetUsedSize(), 0U);
    EXPECT_TRUE(event.IsEmpty());
}

TEST_F(ExecutorTest, PollsTasksInWakeOrder) {
    std::vector<task::TaskId> polled;
    task::Executor executor {heap_, queue_};
    const auto first {executor.Spawn<RecordingTask>(polled)};
    const auto second {executor.Spawn<RecordingTask>(polled)};
    const auto third {executor.Spawn<RecordingTask>(polled)};
    executor.RunReadyTasks();
    EXPECT_EQ(polled, (std::vector<task::TaskId> {first, second, third}));

    polled.clear();
    EXPECT_TRUE(task::Waker(queue_, third).Wake());
    EXPECT_TRUE(task::Waker(queue_, first).Wake());
    EXPECT_TRUE(task::Waker(queue_, second).Wake());
    executor.RunReadyTasks();
    EXPECT_EQ(polled, (std::vector<task::TaskId> {third, first, second}));
}

TEST_F(ExecutorTest, DrainsWakesFromIntrInOrder) {
    constexpr std::size_t capacity {16};
    task::FixedWakeQueue<capacity> queue;
    std::vector<task::TaskId> polled;
    task::Executor executor {heap_, queue};
    std::vector<task::TaskId> ids;
    for (std::size_t i {0}; i != capacity; ++i) {
        const auto id {executor.Spawn<RecordingTask>(polled)};
        ASSERT_NE(id, task::invalid_task_id);
        ids.push_back(id);
    }

    executor.RunReadyTasks();
    ASSERT_EQ(polled, ids);
    polled.clear();

    // Wake the tasks from an interrupt in reverse order, plus one more than the queue can hold.
    auto& wakes {GetIntrWakes()};
    wakes = {};
    for (auto it {ids.rbegin()}; it != ids.rend(); ++it) {
        wakes.wakers.emplace_back(queue, *it);
    }

    wakes.wakers.emplace_back(queue, ids.front());
    intr::GetIntrHandlerTab().Register(device_intr, &WakeTasksInIntr);
    RaiseIntr(device_intr);

    std::vector<bool> expected_results(capacity, true);
    expected_results.push_back(false);
    EXPECT_EQ(wakes.results, expected_results);
    EXPECT_TRUE(queue.IsFull());

    executor.RunReadyTasks();
    EXPECT_EQ(polled, std::vector<task::TaskId>(ids.rbegin(), ids.rend()));
    EXPECT_TRUE(queue.IsEmpty());
    wakes = {};
}

TEST_F(ExecutorTest, KeepsWaitingTasks) {
    Probe probe;
    task::Executor executor {heap_, queue_};
    const auto id {executor.Spawn<WaitingTask>(probe)};
    ASSERT_NE(id, task::invalid_task_id);

    executor.RunReadyTasks();
    EXPECT_EQ(probe.polls, 1U);
    executor.RunReadyTasks();
    EXPECT_EQ(probe.polls, 1U);
    EXPECT_TRUE(executor.HasTask(id));

    // Only a wake-up makes the task polled again.
    EXPECT_TRUE(task::Waker(queue_, id).Wake());
    executor.RunReadyTasks();
    EXPECT_EQ(probe.polls, 2U);
    EXPECT_FALSE(probe.destroyed);
}

TEST_F(ExecutorTest, AssignsUniqueIds) {
    Probe first_probe, second_probe;
    task::Executor executor {heap_, queue_};
    const auto first {executor.Spawn<WaitingTask>(first_probe)};
    const auto second {executor.Spawn<WaitingTask>(second_probe)};
    EXPECT_NE(first, task::invalid_task_id);
    EXPECT_NE(second, task::invalid_task_id);
    EXPECT_NE(first, second);
    EXPECT_EQ(executor.GetTaskCount(), 2U);
    EXPECT_EQ(PopAll(queue_), (std::vector<task::TaskId> {first, second}));
}

TEST_F(ExecutorTest, SkipsUnknownAndFinishedTasks) {
    Probe probe;
    task::Executor executor {heap_, queue_};
    const auto id {executor.Spawn<CountingTask>(probe, 0)};
    ASSERT_NE(id, task::invalid_task_id);
    executor.RunReadyTasks();
    ASSERT_TRUE(probe.destroyed);
    ASSERT_EQ(probe.polls, 1U);

    // A stale wake-up of a finished task and an ID that has never been spawned.
    ASSERT_TRUE(queue_.TryPush(id));
    ASSERT_TRUE(queue_.TryPush(0x999));
    executor.RunReadyTasks();
    EXPECT_EQ(probe.polls, 1U);
    EXPECT_TRUE(queue_.IsEmpty());
}

TEST_F(ExecutorTest, FailsToSpawnOnFullWakeQueue) {
    task::FixedWakeQueue<1> queue;
    Probe first, second;
    task::Executor executor {heap_, queue};
    ASSERT_NE(executor.Spawn<WaitingTask>(first), task::invalid_task_id);
    const auto used {heap_.GetUsedSize()};

    EXPECT_EQ(executor.Spawn<WaitingTask>(second), task::invalid_task_id);
    EXPECT_TRUE(second.destroyed);
    EXPECT_EQ(second.polls, 0U);
    EXPECT_EQ(heap_.GetUsedSize(), used);
    EXPECT_EQ(executor.GetTaskCount(), 1U);
    EXPECT_NE(mock::GetCpu().output.find("wake queue is full"), std::string::npos);
}

TEST_F(ExecutorTest, FailsToSpawnOnFullHeap) {
    mock::HostMem small_mem {mem::page_size};
    mem::HeapAllocator small_heap;
    small_heap.Init(small_mem.GetAddr(), mem::page_size);
    while (small_heap.Allocate(8)) {
    }

    Probe probe;
    task::Executor executor {small_heap, queue_};
    EXPECT_EQ(executor.Spawn<WaitingTask>(probe), task::invalid_task_id);
    EXPECT_FALSE(probe.destroyed);
    EXPECT_EQ(executor.GetTaskCount(), 0U);
    EXPECT_TRUE(queue_.IsEmpty());
    EXPECT_NE(mock::GetCpu().output.find("heap is full"), std::string::npos);
}

TEST_F(ExecutorTest, DestroysRemainingTasks) {
    Probe first, second;
    {
        task::Executor executor {heap_, queue_};
        ASSERT_NE(executor.Spawn<WaitingTask>(first), task::invalid_task_id);
        ASSERT_NE(executor.Spawn<WaitingTask>(second), task::invalid_task_id);
        executor.RunReadyTasks();
    }

    EXPECT_TRUE(first.destroyed);
    EXPECT_TRUE(second.destroyed);
    EXPECT_EQ(heap_.GetUsedSize(), 0U);
}

TEST_F(ExecutorTest, RunsExampleTask) {
    task::Executor executor {heap_, queue_};
    const auto id {executor.Spawn<task::ExampleTask>()};
    ASSERT_NE(id, task::invalid_task_id);
    executor.RunReadyTasks();
    EXPECT_FALSE(executor.HasTask(id));
    EXPECT_EQ(mock::GetCpu().output, "async number: 42\n");
    EXPECT_EQ(heap_.GetUsedSize(), 0U);
}

TEST(ExampleTaskTest, CompletesWithNumber) {
    task::FixedWakeQueue<1> queue;
    task::ExampleTask example;
    EXPECT_FALSE(example.GetNumber());
    EXPECT_EQ(example.Poll({queue, 1}), task::PollResult::Complete);
    EXPECT_EQ(example.GetNumber().value_or(0), task::ExampleTask::number);
}

TEST(KeyDecoderTest, DecodesLetters) {
    io::KeyDecoder decoder;
    EXPECT_EQ(decoder.Decode(0x1E).value_or('\0'), 'a');
    // Releasing a key produces no character.
    EXPECT_FALSE(decoder.Decode(0x9E));
    EXPECT_EQ(decoder.Decode(0x10).value_or('\0'), 'q');
}

TEST(KeyDecoderTest, AppliesShift) {
    io::KeyDecoder decoder;
    EXPECT_FALSE(decoder.Decode(0x2A));
    EXPECT_TRUE(decoder.IsShiftPressed());
    EXPECT_EQ(decoder.Decode(0x1E).value_or('\0'), 'A');
    EXPECT_EQ(decoder.Decode(0x02).value_or('\0'), '!');
    EXPECT_EQ(decoder.Decode(0x0D).value_or('\0'), '+');
    EXPECT_FALSE(decoder.Decode(0xAA));
    EXPECT_FALSE(decoder.IsShiftPressed());
    EXPECT_EQ(decoder.Decode(0x1E).value_or('\0'), 'a');

    // Either shift key works.
    EXPECT_FALSE(decoder.Decode(0x36));
    EXPECT_EQ(decoder.Decode(0x27).value_or('\0'), ':');
    EXPECT_FALSE(decoder.Decode(0xB6));
    EXPECT_EQ(decoder.Decode(0x27).value_or('\0'), ';');
}

TEST(KeyDecoderTest, AppliesCapsLockToLettersOnly) {
    io::KeyDecoder decoder;
    EXPECT_FALSE(decoder.Decode(0x3A));
    EXPECT_FALSE(decoder.Decode(0xBA));
    EXPECT_TRUE(decoder.IsCapsLockOn());
    EXPECT_EQ(decoder.Decode(0x1E).value_or('\0'), 'A');
    EXPECT_EQ(decoder.Decode(0x02).value_or('\0'), '1');

    // Shift reverts caps lock for letters.
    EXPECT_FALSE(decoder.Decode(0x2A));
    EXPECT_EQ(decoder.Decode(0x1E).value_or('\0'), 'a');
    EXPECT_EQ(decoder.Decode(0x02).value_or('\0'), '!');
    EXPECT_FALSE(decoder.Decode(0xAA));

    EXPECT_FALSE(decoder.Decode(0x3A));
    EXPECT_FALSE(decoder.IsCapsLockOn());
    EXPECT_EQ(decoder.Decode(0x1E).value_or('\0'), 'a');
}

TEST(KeyDecoderTest, IgnoresExtendedKeys) {
    io::KeyDecoder decoder;
    EXPECT_FALSE(decoder.Decode(0xE0));
    // The keypad enter.
    EXPECT_FALSE(decoder.Decode(0x1C));
    EXPECT_EQ(decoder.Decode(0x1C).value_or('\0'), '\n');
    EXPECT_EQ(decoder.Decode(0x39).value_or('\0'), ' ');

    // An extended code never changes the shift state.
    EXPECT_FALSE(decoder.Decode(0xE0));
    EXPECT_FALSE(decoder.Decode(0x2A));
    EXPECT_FALSE(decoder.IsShiftPressed());
}

TEST(KeyDecoderTest, ReportsKeyEvents) {
    io::KeyDecoder decoder;
    const auto press {decoder.AddScancode(0x1E)};
    ASSERT_TRUE(press);
    EXPECT_EQ(press->key, 0x1E);
    EXPECT_TRUE(press->pressed);
    EXPECT_FALSE(press->extended);

    EXPECT_FALSE(decoder.AddScancode(0xE0));
    const auto release {decoder.AddScancode(0x9C)};
    ASSERT_TRUE(release);
    EXPECT_EQ(release->key, 0x1C);
    EXPECT_FALSE(release->pressed);
    EXPECT_TRUE(release->extended);
}

TEST(KeyDecoderTest, IgnoresUnprintableKeys) {
    io::KeyDecoder decoder;
    // Control, a function key and an out-of-table key.
    EXPECT_FALSE(decoder.Decode(0x1D));
    EXPECT_FALSE(decoder.Decode(0x3B));
    EXPECT_FALSE(decoder.Decode(0x58));
}

class EventSourceTest : public testing::Test {
protected:
    void SetUp() override {
        mock::Reset();
        Drain(io::GetScancodeQueue());
        Drain(GetEventQueue());
    }
};

TEST_F(EventSourceTest, KeyboardIntrQueuesScancode) {
    mock::GetCpu().port_inputs[keyboard_data_port] = {0x1E, 0x9E};
    io::KeyboardIntrHandler({});
    io::KeyboardIntrHandler({});

    auto& queue {io::GetScancodeQueue()};
    EXPECT_EQ(queue.GetSize(), 2U);
    EXPECT_EQ(queue.TryPop().value_or(0), 0x1E);
    EXPECT_EQ(queue.TryPop().value_or(0), 0x9E);
    EXPECT_EQ(mock::GetPortWrites(master_pic_cmd_port),
              (std::vector<std::uint8_t> {end_of_intr, end_of_intr}));
}

TEST_F(EventSourceTest, DropsScancodesWhenFull) {
    for (std::size_t i {0}; i != scancode_queue_capacity; ++i) {
        ASSERT_TRUE(io::AddScancode(0x1E));
    }

    EXPECT_FALSE(io::AddScancode(0x30));
    EXPECT_EQ(io::GetScancodeQueue().GetSize(), scancode_queue_capacity);
    EXPECT_NE(mock::GetCpu().output.find("scancode queue is full"), std::string::npos);
}

TEST_F(EventSourceTest, KeyboardTaskEchoesInput) {
    constexpr task::TaskId id {7};
    io::KeyboardTask keyboard;
    for (const std::uint8_t scancode : {0x23, 0xA3, 0x17, 0x97}) {
        io::AddScancode(scancode);
    }

    EXPECT_EQ(keyboard.Poll({GetEventQueue(), id}), task::PollResult::Pending);
    EXPECT_EQ(mock::GetCpu().output, "hi");
    EXPECT_TRUE(io::GetScancodeQueue().IsEmpty());

    // A new scancode wakes the task.
    EXPECT_TRUE(GetEventQueue().IsEmpty());
    io::AddScancode(0x39);
    EXPECT_EQ(PopAll(GetEventQueue()), (std::vector<task::TaskId> {id}));
    keyboard.Poll({GetEventQueue(), id});
    EXPECT_EQ(mock::GetCpu().output, "hi ");

    // Consume the registered waker.
    io::AddScancode(0xB9);
    Drain(GetEventQueue());
}

TEST_F(EventSourceTest, TimerIntrTicks) {
    const auto ticks {io::GetTicks()};
    io::TimerIntrHandler({});
    io::TimerIntrHandler({});
    EXPECT_EQ(io::GetTicks(), ticks + 2);
    EXPECT_EQ(mock::GetPortWrites(master_pic_cmd_port),
              (std::vector<std::uint8_t> {end_of_intr, end_of_intr}));
}

TEST_F(EventSourceTest, HeartbeatTaskPrintsPeriodically) {
    constexpr task::TaskId id {9};
    io::HeartbeatTask heartbeat {3};
    EXPECT_EQ(heartbeat.Poll({GetEventQueue(), id}), task::PollResult::Pending);
    EXPECT_EQ(heartbeat.GetBeatCount(), 0U);

    for (std::size_t i {0}; i != 3; ++i) {
        io::TimerIntrHandler({});
    }

    // The tick waker is cleared after the first tick.
    EXPECT_EQ(PopAll(GetEventQueue()), (std::vector<task::TaskId> {id}));
    heartbeat.Poll({GetEventQueue(), id});
    EXPECT_EQ(heartbeat.GetBeatCount(), 1U);
    EXPECT_NE(mock::GetCpu().output.find("Heartbeat"), std::string::npos);

    heartbeat.Poll({GetEventQueue(), id});
    EXPECT_EQ(heartbeat.GetBeatCount(), 1U);

    io::TimerIntrHandler({});
    Drain(GetEventQueue());
}
