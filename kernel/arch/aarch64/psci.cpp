#include "kernel/arch/aarch64/psci.hpp"
#include "kernel/arch/aarch64/sysreg.hpp"
#include "teaos/config.hpp"

namespace
{
    u64 call(u64 fn, u64 a1 = 0, u64 a2 = 0, u64 a3 = 0)
    {
        register u64 x0 asm("x0") = fn;
        register u64 x1 asm("x1") = a1;
        register u64 x2 asm("x2") = a2;
        register u64 x3 asm("x3") = a3;

#if TEAOS_PSCI_CONDUIT_HVC
        asm volatile("hvc #0"
#else
        asm volatile("smc #0"
#endif
                     : "+r"(x0), "+r"(x1), "+r"(x2), "+r"(x3)
                     :
                     : "x4", "x5", "x6", "x7", "x8", "x9", "x10", "x11",
                       "x12", "x13", "x14", "x15", "x16", "x17", "memory");

        return x0;
    }

    [[noreturn]] void park()
    {
        while (true)
        {
            arch::sysreg::wfe();
        }
    }
}

namespace psci
{
    u32 version()
    {
        return (u32)call(FN_VERSION);
    }

    void system_off()
    {
        call(FN_SYSTEM_OFF);

        // firmware refused or no PSCI: stop this core
        park();
    }
}
