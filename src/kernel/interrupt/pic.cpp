#include "kernel/interrupt/pic.h"
#include "kernel/debug/assert.h"
#include "kernel/interrupt/intr.h"
#include "kernel/io/io.h"
#include "kernel/io/video/print.h"
#include "kernel/util/bit.h"

namespace intr::pic {

namespace {

//! The number of interrupt lines on an *Intel 8259A* chip.
inline constexpr stl::size_t irq_count {8};
//! The master line the slave chip is attached to.
inline constexpr stl::size_t cascade_irq {static_cast<stl::size_t>(Intr::SlavePic)};

/**
 * @brief Initialization Command Word 1.
 *
 * @details
 * Edge triggered, cascaded, and followed by Initialization Command Word 4.
 */
inline constexpr stl::uint8_t init_cmd_word_1 {0b0001'0001};

/**
 * @brief Initialization Command Word 4.
 *
 * @details
 * The 8086 mode without the auto end of interrupts,
 * so each handler has to call @p SendEndOfIntr.
 */
inline constexpr stl::uint8_t init_cmd_word_4 {0b0000'0001};

//! Operation Command Word 2 for a non-specific end of interrupt.
inline constexpr stl::uint8_t end_of_intr {0b0010'0000};

//! An *Intel 8259A* chip.
struct Chip {
    stl::uint16_t cmd_port;
    stl::uint16_t data_port;
    //! The interrupt number of the interrupt request @p 0.
    stl::size_t start_intr_num;
    //! Initialization Command Word 3. The cascade lines on the master chip, or the cascade identity on the slave chip.
    stl::uint8_t cascade;
};

constexpr Chip master {0x20, 0x21, static_cast<stl::size_t>(intr::Intr::Timer), 1 << cascade_irq};
constexpr Chip slave {0xA0, 0xA1, master.start_intr_num + irq_count, cascade_irq};

// The low three bits of Initialization Command Word 2 are the line number.
static_assert(master.start_intr_num % irq_count == 0 && slave.start_intr_num % irq_count == 0);

void InitChip(const Chip& chip) noexcept {
    io::WriteByteToPort(chip.cmd_port, init_cmd_word_1);
    io::WriteByteToPort(chip.data_port, static_cast<stl::uint8_t>(chip.start_intr_num));
    io::WriteByteToPort(chip.data_port, chip.cascade);
    io::WriteByteToPort(chip.data_port, init_cmd_word_4);
}

//! Whether an interrupt is from the master *Intel 8259A* chip.
bool IsMasterIntr(const Intr intr) noexcept {
    return static_cast<stl::size_t>(intr) < irq_count;
}

}  // namespace

void SendEndOfIntr(const Intr intr) noexcept {
    if (!IsMasterIntr(intr)) {
        io::WriteByteToPort(slave.cmd_port, end_of_intr);
    }

    io::WriteByteToPort(master.cmd_port, end_of_intr);
}

void InitPgmIntrCtrl(const stl::span<Intr> intrs) noexcept {
    InitChip(master);
    InitChip(slave);

    // Operation Command Word 1. A set bit masks its line.
    stl::uint8_t master_mask {0xFF};
    stl::uint8_t slave_mask {0xFF};
    for (const auto intr : intrs) {
        const auto irq {static_cast<stl::size_t>(intr)};
        dbg::Assert(irq < 2 * irq_count);
        if (IsMasterIntr(intr)) {
            bit::ResetBit(master_mask, irq);
        } else {
            bit::ResetBit(master_mask, cascade_irq);
            bit::ResetBit(slave_mask, irq - irq_count);
        }
    }

    io::WriteByteToPort(master.data_port, master_mask);
    io::WriteByteToPort(slave.data_port, slave_mask);

    io::PrintlnStr("Intel 8259A Programmable Interrupt Controller has been initialized.");
}

}  // namespace intr::pic
