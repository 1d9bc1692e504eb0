/**
 * @file pic.h
 * @brief *Intel 8259A* Programmable Interrupt Controller.
 *
 * @par GitHub
 * https://github.com/Zhuagenborn
 */

#pragma once

#include "kernel/stl/span.h"

namespace intr::pic {

//! Interrupt requests.
enum class Intr {
    //! The timer.
    Timer = 0,
    //! The keyboard.
    Keyboard = 1,

    /**
     * @brief The slave *Intel 8259A* chip.
     *
     * @details
     * The IBM extended the computer architecture by adding a second *Intel 8259A* chip,
     * This was possible due to the *Intel 8259A*'s ability to cascade interrupts.
     * When we cascade chips, *Intel 8259A* needs to use one of the interrupt requests to signal the other chip.
     */
    SlavePic = 2,

    //! The spurious interrupt request of the master chip.
    SpuriousMaster = 7,
    //! The spurious interrupt request of the slave chip.
    SpuriousSlave = 15
};

/**
 * @brief Initialize the interrupt controller.
 *
 * @param intrs Interrupts to be enabled.
 */
void InitPgmIntrCtrl(stl::span<Intr> intrs) noexcept;

/**
 * @brief Send an end-of-interrupt signal.
 *
 * @details
 * The chips do not deliver the next interrupt until the current one is acknowledged.
 * An interrupt from the slave chip must be acknowledged on both chips.
 */
void SendEndOfIntr(Intr) noexcept;

}  // namespace intr::pic