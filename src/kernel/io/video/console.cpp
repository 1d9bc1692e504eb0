#include "kernel/io/video/console.h"
#include "kernel/interrupt/intr.h"
#include "kernel/io/io.h"
#include "kernel/io/video/print.h"
#include "kernel/util/bit.h"

namespace io {

namespace {

namespace port {
//! The base port of COM1.
inline constexpr stl::uint16_t com1 {0x3F8};
//! The CRT controller's address register.
inline constexpr stl::uint16_t crt_addr {0x3D4};
//! The CRT controller's data register.
inline constexpr stl::uint16_t crt_data {0x3D5};
}  // namespace port

/**
 * @brief The *16550* UART.
 */
class SerialPort {
public:
    explicit constexpr SerialPort(const stl::uint16_t base) noexcept : base_ {base} {}

    void Init() const noexcept {
        // Disable interrupts of the port.
        WriteByteToPort(GetIntrEnablePort(), 0);
        // Set the baud rate to 38400 with the divisor latch.
        WriteByteToPort(GetLineCtrlPort(), line_ctrl_dlab);
        WriteByteToPort(GetDataPort(), bit::GetLowByte(baud_divisor));
        WriteByteToPort(GetIntrEnablePort(), bit::GetHighByte(baud_divisor));
        // 8 bits, no parity, one stop bit.
        WriteByteToPort(GetLineCtrlPort(), line_ctrl_8n1);
        // Enable and clear FIFOs with a 14-byte threshold.
        WriteByteToPort(GetFifoCtrlPort(), 0xC7);
        // Data terminal ready and request to send.
        WriteByteToPort(GetModemCtrlPort(), 0x03);
    }

    void Write(const char ch) const noexcept {
        while (!bit::IsBitSet(ReadByteFromPort(GetLineStatusPort()), line_status_thr_empty_pos)) {
        }

        WriteByteToPort(GetDataPort(), static_cast<stl::byte>(ch));
    }

    //! Wait until the transmitter is empty.
    void Flush() const noexcept {
        while (!bit::IsBitSet(ReadByteFromPort(GetLineStatusPort()), line_status_idle_pos)) {
        }
    }

private:
    static constexpr stl::uint16_t baud_divisor {3};
    static constexpr stl::byte line_ctrl_dlab {0x80};
    static constexpr stl::byte line_ctrl_8n1 {0x03};
    static constexpr stl::size_t line_status_thr_empty_pos {5};
    static constexpr stl::size_t line_status_idle_pos {6};

    constexpr stl::uint16_t GetDataPort() const noexcept {
        return base_;
    }

    constexpr stl::uint16_t GetIntrEnablePort() const noexcept {
        return base_ + 1;
    }

    constexpr stl::uint16_t GetFifoCtrlPort() const noexcept {
        return base_ + 2;
    }

    constexpr stl::uint16_t GetLineCtrlPort() const noexcept {
        return base_ + 3;
    }

    constexpr stl::uint16_t GetModemCtrlPort() const noexcept {
        return base_ + 4;
    }

    constexpr stl::uint16_t GetLineStatusPort() const noexcept {
        return base_ + 5;
    }

    stl::uint16_t base_;
};

//! The VGA text screen.
class TextScreen {
public:
    //! The physical address of the text buffer.
    static constexpr stl::uintptr_t phy_buf_addr {0xB8000};

    void Init(const stl::uintptr_t phy_mem_offset) noexcept {
        buf_ = reinterpret_cast<volatile stl::uint16_t*>(phy_mem_offset + phy_buf_addr);
        for (stl::size_t i {0}; i != text_screen_width * text_screen_height; ++i) {
            buf_[i] = MakeCell(' ');
        }

        pos_ = 0;
        UpdateCursor();
    }

    bool IsInited() const noexcept {
        return buf_ != nullptr;
    }

    void Write(const char ch) noexcept {
        switch (ch) {
            case '\n': {
                pos_ += text_screen_width - pos_ % text_screen_width;
                break;
            }
            case '\r': {
                pos_ -= pos_ % text_screen_width;
                break;
            }
            case '\b': {
                if (pos_ > 0) {
                    buf_[--pos_] = MakeCell(' ');
                }

                break;
            }
            case '\t': {
                pos_ = (pos_ / tab_width + 1) * tab_width;
                break;
            }
            default: {
                buf_[pos_++] = MakeCell(ch);
                break;
            }
        }

        if (pos_ >= text_screen_width * text_screen_height) {
            Scroll();
        }

        UpdateCursor();
    }

private:
    static constexpr stl::size_t tab_width {4};
    //! Light gray on black.
    static constexpr stl::uint8_t default_attr {0x07};

    static constexpr stl::uint16_t MakeCell(const char ch) noexcept {
        return bit::CombineBytes(default_attr, static_cast<stl::uint8_t>(ch));
    }

    //! Move all lines up by one line and clear the last line.
    void Scroll() noexcept {
        constexpr auto last_line {text_screen_width * (text_screen_height - 1)};
        for (stl::size_t i {0}; i != last_line; ++i) {
            buf_[i] = buf_[i + text_screen_width];
        }

        for (auto i {last_line}; i != text_screen_width * text_screen_height; ++i) {
            buf_[i] = MakeCell(' ');
        }

        pos_ = last_line;
    }

    void UpdateCursor() const noexcept {
        const auto pos {static_cast<stl::uint16_t>(pos_)};
        WriteByteToPort(port::crt_addr, 0x0E);
        WriteByteToPort(port::crt_data, bit::GetHighByte(pos));
        WriteByteToPort(port::crt_addr, 0x0F);
        WriteByteToPort(port::crt_data, bit::GetLowByte(pos));
    }

    volatile stl::uint16_t* buf_ {nullptr};
    stl::size_t pos_ {0};
};

constexpr SerialPort com1 {port::com1};

bool& IsSerialPortInited() noexcept {
    static bool inited {false};
    return inited;
}

TextScreen& GetTextScreen() noexcept {
    static TextScreen screen;
    return screen;
}

void WriteToSerialPort(const char ch) noexcept {
    if (!IsSerialPortInited()) {
        com1.Init();
        IsSerialPortInited() = true;
    }

    if (ch == '\n') {
        com1.Write('\r');
    }

    com1.Write(ch);
}

}  // namespace

void InitConsole(const stl::uintptr_t phy_mem_offset) noexcept {
    const intr::IntrGuard guard;
    GetTextScreen().Init(phy_mem_offset);
}

extern "C" {

void PrintChar(const char ch) noexcept {
    // Interrupt handlers also print, so a character must be written completely.
    const intr::IntrGuard guard;
    WriteToSerialPort(ch);
    if (auto& screen {GetTextScreen()}; screen.IsInited()) {
        screen.Write(ch);
    }
}

void FlushOutput() noexcept {
    if (IsSerialPortInited()) {
        com1.Flush();
    }
}
}

}  // namespace io
