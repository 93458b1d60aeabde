#include "kernel/core/panic.hpp"
#include "kernel/core/print.hpp"
#include "kernel/arch/aarch64/psci.hpp"
#include "kernel/arch/aarch64/sysreg.hpp"

namespace
{
    // Set on the first halt(). A firmware call that traps escalates back into
    // halt(); the second entry must not issue the call again.
    volatile bool g_halting = false;
}

[[noreturn]] void halt()
{
    arch::sysreg::mask_all();

    if (g_halting)
    {
        kprint::puts("halt: already halting, parking core\n");

        while (true)
        {
            arch::sysreg::wfe();
        }
    }

    g_halting = true;
    psci::system_off();
}

[[noreturn]] void panic(const char* msg)
{
    arch::sysreg::mask_all();

    kprint::puts("\n\n=== PANIC ===\n");
    kprint::puts(msg);
    kprint::puts("\n");

    halt();
}
