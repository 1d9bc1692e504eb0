#include "kernel/io/timer.h"
#include "kernel/debug/assert.h"
#include "kernel/interrupt/pic.h"
#include "kernel/io/io.h"
#include "kernel/io/video/print.h"
#include "kernel/stl/atomic.h"
#include "kernel/util/bit.h"

namespace io {

namespace {

/**
 * @brief A wrapper of a global @p bool variable representing whether the timer has been initialized.
 *
 * @details
 * Global variables cannot be initialized properly.
 * We use @p static variables in methods instead since they can be initialized by methods.
 */
bool& IsTimerInitedImpl() noexcept {
    static bool inited {false};
    return inited;
}

//! *Intel 8253* registers.
namespace port {
//! The data register for the counter @p 0.
inline constexpr stl::uint16_t counter_0 {0x40};
//! The mode and command register.
static constexpr stl::uint16_t pit_ctrl {0x43};
}  // namespace port

//! The number of ticks after the timer is initialized.
stl::atomic<stl::size_t>& GetTicksImpl() noexcept {
    static stl::atomic<stl::size_t> ticks {0};
    return ticks;
}

task::WakerSlot& GetTickWakerSlot() noexcept {
    static task::WakerSlot slot;
    return slot;
}

enum class ReadWriteMode {
    LatchRead = 0,
    ReadWriteLowByte = 1,
    ReadWriteHighByte = 2,
    ReadWriteLowHighBytes = 3
};

enum class CountMode {
    IntrOnTerminalCount = 0,
    HardRetriggerOneShot = 1,
    RateGenerator = 2,
    SquareWaveGenerator = 3,
    SoftTriggerStrobe = 4,
    HardTriggerStrobe = 5,
};

enum class DigitalMode { Binary, BinaryCodedDecimal };

//! The control word.
class CtrlWord {
public:
    constexpr CtrlWord(const stl::uint8_t val = 0) noexcept : val_ {val} {}

    constexpr operator stl::uint8_t() const noexcept {
        return val_;
    }

    constexpr CtrlWord& SetDigitalMode(const DigitalMode mode) noexcept {
        if (mode == DigitalMode::BinaryCodedDecimal) {
            bit::SetBit(val_, bcd_pos);
        } else {
            bit::ResetBit(val_, bcd_pos);
        }

        return *this;
    }

    constexpr CtrlWord& SetCountMode(const CountMode mode) noexcept {
        bit::SetBits(val_, static_cast<stl::uint32_t>(mode), m_pos, m_len);
        return *this;
    }

    constexpr CtrlWord& SetReadWriteMode(const ReadWriteMode mode) noexcept {
        bit::SetBits(val_, static_cast<stl::uint32_t>(mode), rw_pos, rw_len);
        return *this;
    }

    CtrlWord& SetSelectCounter(const stl::size_t id) noexcept {
        dbg::Assert(id < 3);
        bit::SetBits(val_, id, sc_pos, sc_len);
        return *this;
    }

    void WriteToPort() noexcept {
        io::WriteByteToPort(port::pit_ctrl, val_);
    }

private:
    static constexpr stl::size_t bcd_pos {0};
    static constexpr stl::size_t m_pos {bcd_pos + 1};
    static constexpr stl::size_t m_len {3};
    static constexpr stl::size_t rw_pos {m_pos + m_len};
    static constexpr stl::size_t rw_len {2};
    static constexpr stl::size_t sc_pos {rw_pos + rw_len};
    static constexpr stl::size_t sc_len {2};

    stl::uint8_t val_;
};

//! Calculate the initial counter value by a timer interrupt frequency.
constexpr stl::uint16_t CalcInitCounterVal(const stl::size_t freq_per_second) noexcept {
    constexpr stl::size_t input_freq {1193180};
    return static_cast<stl::uint16_t>(input_freq / freq_per_second);
}

void InitCounter(const stl::size_t freq_per_second) noexcept {
    CtrlWord {}
        .SetSelectCounter(0)
        .SetCountMode(CountMode::RateGenerator)
        .SetReadWriteMode(ReadWriteMode::ReadWriteLowHighBytes)
        .SetDigitalMode(DigitalMode::Binary)
        .WriteToPort();

    const auto init_val {CalcInitCounterVal(freq_per_second)};
    io::WriteByteToPort(port::counter_0, bit::GetLowByte(init_val));
    io::WriteByteToPort(port::counter_0, bit::GetHighByte(init_val));
}

}  // namespace

void TimerIntrHandler(const intr::IntrStack&) noexcept {
    GetTicksImpl().fetch_add(1, stl::memory_order::release);
    GetTickWakerSlot().Wake();
    intr::pic::SendEndOfIntr(intr::pic::Intr::Timer);
}

stl::size_t GetTicks() noexcept {
    return GetTicksImpl().load(stl::memory_order::acquire);
}

void RegisterTickWaker(const task::Waker& waker) noexcept {
    GetTickWakerSlot().Register(waker);
}

void InitTimer(const stl::size_t freq_per_second) noexcept {
    if (IsTimerInited()) {
        dbg::Panic("The timer has already been initialized");
    }

    dbg::Assert(intr::GetState() != intr::State::Uninitialized,
                "The interrupt descriptor table must be installed before the timer");
    dbg::Assert(freq_per_second > 0);
    GetTicksImpl().store(0);
    InitCounter(freq_per_second);
    intr::GetIntrHandlerTab().Register(intr::Intr::Timer, &TimerIntrHandler);
    IsTimerInitedImpl() = true;
    io::PrintStr("Intel 8253 Programmable Interval Timer has been initialized.\n");
}

bool IsTimerInited() noexcept {
    return IsTimerInitedImpl();
}

HeartbeatTask::HeartbeatTask(const stl::size_t period) noexcept : period_ {period} {
    dbg::Assert(period_ > 0);
}

task::PollResult HeartbeatTask::Poll(const task::Waker& waker) noexcept {
    const auto now {GetTicks()};
    if (!started_) {
        last_tick_ = now;
        started_ = true;
    } else if (now - last_tick_ >= period_) {
        last_tick_ = now;
        ++beat_count_;
        io::Printf("Heartbeat: 0x{} ticks.\n", now);
    }

    RegisterTickWaker(waker);
    return task::PollResult::Pending;
}

stl::size_t HeartbeatTask::GetBeatCount() const noexcept {
    return beat_count_;
}

}  // namespace io
