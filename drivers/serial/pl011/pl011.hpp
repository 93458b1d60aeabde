#pragma once
#include "teaos/config.hpp"
#include "teaos/types.hpp"

namespace pl011
{
    // Firmware (or QEMU) has already configured baud rate and line control.
    void init(uintptr_t base = TEAOS_UART_BASE);

    void putc(char c);
    void puts(const char* s);
}
