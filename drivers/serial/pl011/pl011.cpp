#include "drivers/serial/pl011/pl011.hpp"
#include "hal/mmio.hpp"

namespace
{
    uintptr_t g_base = TEAOS_UART_BASE;

    constexpr uintptr_t DR   = 0x00;
    constexpr uintptr_t FR   = 0x18;
    constexpr uintptr_t CR   = 0x30;

    constexpr u32 FR_TXFF  = (1u << 5);
    constexpr u32 FR_BUSY  = (1u << 3);

    constexpr u32 CR_UARTEN = (1u << 0);
    constexpr u32 CR_TXE    = (1u << 8);
}

namespace pl011
{
    void init(uintptr_t base)
    {
        g_base = base;

        u32 cr = mmio::read32(g_base + CR);
        if ((cr & (CR_UARTEN | CR_TXE)) != (CR_UARTEN | CR_TXE))
        {
            mmio::write32(g_base + CR, cr | CR_UARTEN | CR_TXE);
        }
    }

    void putc(char c)
    {
        if (c == '\n')
        {
            putc('\r');
        }

        while (mmio::read32(g_base + FR) & FR_TXFF) {}
        mmio::write32(g_base + DR, (u32)(u8)c);
    }

    void puts(const char* s)
    {
        while (*s) putc(*s++);

        while (mmio::read32(g_base + FR) & FR_BUSY) {}
    }
}
