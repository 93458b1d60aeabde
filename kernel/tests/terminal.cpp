#include "kernel/tests/tests.hpp"
#include "kernel/core/panic.hpp"
#include "kernel/core/print.hpp"

// Scenarios whose only correct outcome is that the machine stops. Each one is
// built into its own image and watched from the outside: the expected
// diagnostics must appear, the survival marker must not.

namespace
{
    void unhandled_slot()
    {
        kprint::puts("terminal: synchronous trap on SP_EL0\n");

        // brk taken with SPSel = 0 enters slot 0, which has no handler
        asm volatile(
            "msr spsel, #0\n"
            "brk #0\n"
            "msr spsel, #1\n"
            ::: "memory");
    }

    void el1_escalation()
    {
        kprint::puts("terminal: undefined instruction at EL1\n");

        // EC 0x00: not a breakpoint, so the EL1 handler gives up on it
        asm volatile("udf #0" ::: "memory");
    }

    void halt_reentry()
    {
        kprint::puts("terminal: halting with a trapping power-off call\n");

        // Without firmware behind the conduit the power-off request is an
        // undefined instruction, which escalates back into halt().
        halt();
    }
}

namespace tests
{
    void run_terminal(Terminal scenario)
    {
        switch (scenario)
        {
            case Terminal::UnhandledSlot:
                unhandled_slot();
                break;

            case Terminal::El1Escalation:
                el1_escalation();
                break;

            case Terminal::HaltReentry:
                halt_reentry();
                break;

            case Terminal::None:
                break;
        }

        kprint::puts("terminal: survived\n");
        panic("terminal scenario returned");
    }
}
