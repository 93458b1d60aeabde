#pragma once

// Prints the message, masks interrupts and stops the machine.
[[noreturn]] void panic(const char* msg);

// Stops the machine. A nested call (the power-off request itself trapped)
// parks the core instead.
[[noreturn]] void halt();
