/**
 * @file keyboard.h
 * @brief The *Intel 8042* keyboard controller.
 *
 * @par GitHub
 * https://github.com/Zhuagenborn
 */

#pragma once

#include "kernel/interrupt/intr.h"
#include "kernel/krnl.h"
#include "kernel/task/task.h"
#include "kernel/util/ring_queue.h"

namespace io {

//! The queue of raw scancodes, pushed by the keyboard interrupt handler.
using ScancodeQueue = RingQueueArray<stl::uint8_t, scancode_queue_capacity>;

//! Initialize the keyboard.
void InitKeyboard() noexcept;

bool IsKeyboardInited() noexcept;

//! Get the scancode queue.
ScancodeQueue& GetScancodeQueue() noexcept;

/**
 * @brief Register a waker that will be woken when a scancode arrives.
 *
 * @details
 * Only one waker can be registered. A new one replaces the old one.
 */
void RegisterKeyboardWaker(const task::Waker&) noexcept;

/**
 * @brief Add a scancode to the queue and wake the keyboard waiter.
 *
 * @return Whether the scancode has been added. It is dropped if the queue is full.
 */
bool AddScancode(stl::uint8_t) noexcept;

/**
 * @brief The keyboard interrupt handler.
 *
 * @details
 * It reads a scancode from the keyboard controller, adds it to the queue and acknowledges the interrupt.
 * Scancodes are decoded later by the keyboard task.
 */
void KeyboardIntrHandler(const intr::IntrStack&) noexcept;

//! A key event decoded from scancodes.
struct KeyEvent {
    //! The scancode without the release bit.
    stl::uint8_t key;
    //! Whether the key is pressed or released.
    bool pressed;
    //! Whether the scancode has an @p 0xE0 prefix.
    bool extended;
};

/**
 * @brief The decoder of scancode set 1 with the US keyboard layout.
 *
 * @details
 * It tracks the state of shift keys and caps lock.
 */
class KeyDecoder {
public:
    //! Add a scancode. A key event is returned if the scancode completes one.
    stl::optional<KeyEvent> AddScancode(stl::uint8_t) noexcept;

    //! Convert a key event to a character if it is a printable key being pressed.
    stl::optional<char> ToChar(const KeyEvent&) const noexcept;

    //! Add a scancode and convert the completed key event to a character.
    stl::optional<char> Decode(stl::uint8_t) noexcept;

    bool IsShiftPressed() const noexcept;

    bool IsCapsLockOn() const noexcept;

private:
    bool left_shift_ {false};
    bool right_shift_ {false};
    bool caps_lock_ {false};
    bool extended_ {false};
};

/**
 * @brief The task echoing keyboard input to the console.
 *
 * @details
 * It never completes. It is woken by the keyboard interrupt handler.
 */
class KeyboardTask : public task::Task {
public:
    task::PollResult Poll(const task::Waker&) noexcept override;

private:
    KeyDecoder decoder_;
};

}  // namespace io
