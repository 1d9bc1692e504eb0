#include "kernel/io/keyboard.h"
#include "kernel/interrupt/pic.h"
#include "kernel/io/io.h"
#include "kernel/io/video/print.h"

namespace io {

namespace {

//! *Intel 8042* registers.
namespace port {
//! The data register.
inline constexpr stl::uint16_t keyboard_data {0x60};
}  // namespace port

//! Scancodes of set 1.
namespace code {
inline constexpr stl::uint8_t ext_prefix {0xE0};
inline constexpr stl::uint8_t release_bit {0x80};
inline constexpr stl::uint8_t left_shift {0x2A};
inline constexpr stl::uint8_t right_shift {0x36};
inline constexpr stl::uint8_t caps_lock {0x3A};
}  // namespace code

//! The number of keys in the character tables.
inline constexpr stl::size_t key_count {0x3A};

//! Characters of keys without shift, indexed by scancodes.
constexpr char normal_keys[] {
    "\0\x1B"
    "1234567890-="
    "\b\t"
    "qwertyuiop[]"
    "\n\0"
    "asdfghjkl;'`"
    "\0"
    "\\zxcvbnm,./"
    "\0*\0 "};

//! Characters of keys with shift, indexed by scancodes.
constexpr char shifted_keys[] {
    "\0\x1B"
    "!@#$%^&*()_+"
    "\b\t"
    "QWERTYUIOP{}"
    "\n\0"
    "ASDFGHJKL:\"~"
    "\0"
    "|ZXCVBNM<>?"
    "\0*\0 "};

static_assert(sizeof(normal_keys) == key_count + 1);
static_assert(sizeof(shifted_keys) == key_count + 1);

constexpr bool IsLetter(const char ch) noexcept {
    return 'a' <= ch && ch <= 'z';
}

bool& IsKeyboardInitedImpl() noexcept {
    static bool inited {false};
    return inited;
}

task::WakerSlot& GetKeyboardWakerSlot() noexcept {
    static task::WakerSlot slot;
    return slot;
}

}  // namespace

ScancodeQueue& GetScancodeQueue() noexcept {
    static ScancodeQueue queue;
    return queue;
}

void RegisterKeyboardWaker(const task::Waker& waker) noexcept {
    GetKeyboardWakerSlot().Register(waker);
}

bool AddScancode(const stl::uint8_t scancode) noexcept {
    const auto added {GetScancodeQueue().TryPush(scancode)};
    if (!added) {
        io::PrintlnStr("WARNING: The scancode queue is full. Keyboard input is dropped.");
    }

    GetKeyboardWakerSlot().Wake();
    return added;
}

void KeyboardIntrHandler(const intr::IntrStack&) noexcept {
    // The controller does not raise the next interrupt until the data register is read.
    const auto scancode {io::ReadByteFromPort(port::keyboard_data)};
    AddScancode(scancode);
    intr::pic::SendEndOfIntr(intr::pic::Intr::Keyboard);
}

void InitKeyboard() noexcept {
    if (IsKeyboardInited()) {
        dbg::Panic("The keyboard has already been initialized");
    }

    dbg::Assert(intr::GetState() != intr::State::Uninitialized,
                "The interrupt descriptor table must be installed before the keyboard");
    intr::GetIntrHandlerTab().Register(intr::Intr::Keyboard, &KeyboardIntrHandler);
    IsKeyboardInitedImpl() = true;
    io::PrintlnStr("The keyboard has been initialized.");
}

bool IsKeyboardInited() noexcept {
    return IsKeyboardInitedImpl();
}

stl::optional<KeyEvent> KeyDecoder::AddScancode(const stl::uint8_t scancode) noexcept {
    if (scancode == code::ext_prefix) {
        extended_ = true;
        return stl::nullopt;
    }

    const KeyEvent event {static_cast<stl::uint8_t>(scancode & ~code::release_bit),
                          (scancode & code::release_bit) == 0, extended_};
    extended_ = false;
    if (event.extended) {
        return event;
    }

    switch (event.key) {
        case code::left_shift: {
            left_shift_ = event.pressed;
            break;
        }
        case code::right_shift: {
            right_shift_ = event.pressed;
            break;
        }
        case code::caps_lock: {
            if (event.pressed) {
                caps_lock_ = !caps_lock_;
            }

            break;
        }
        default: {
            break;
        }
    }

    return event;
}

stl::optional<char> KeyDecoder::ToChar(const KeyEvent& event) const noexcept {
    if (!event.pressed || event.extended || event.key >= key_count) {
        return stl::nullopt;
    }

    const auto normal {normal_keys[event.key]};
    if (normal == '\0') {
        return stl::nullopt;
    }

    // Caps lock only affects letters, and shift reverts it.
    const auto upper {IsLetter(normal) ? IsShiftPressed() != caps_lock_ : IsShiftPressed()};
    return upper ? shifted_keys[event.key] : normal;
}

stl::optional<char> KeyDecoder::Decode(const stl::uint8_t scancode) noexcept {
    const auto event {AddScancode(scancode)};
    return event ? ToChar(*event) : stl::nullopt;
}

bool KeyDecoder::IsShiftPressed() const noexcept {
    return left_shift_ || right_shift_;
}

bool KeyDecoder::IsCapsLockOn() const noexcept {
    return caps_lock_;
}

task::PollResult KeyboardTask::Poll(const task::Waker& waker) noexcept {
    // Register the waker first, so a scancode arriving after the queue is drained still wakes the task.
    RegisterKeyboardWaker(waker);
    while (const auto scancode {GetScancodeQueue().TryPop()}) {
        if (const auto ch {decoder_.Decode(*scancode)}) {
            io::PrintChar(*ch);
        }
    }

    return task::PollResult::Pending;
}

}  // namespace io
