#include "drivers/serial/pl011/pl011.hpp"
#include "kernel/core/print.hpp"
#include "kernel/core/panic.hpp"

#include "kernel/arch/aarch64/psci.hpp"
#include "kernel/arch/aarch64/sysreg.hpp"
#include "kernel/mm/layout.hpp"
#include "kernel/platform/fdt/fdt.hpp"
#include "kernel/tests/tests.hpp"
#include "src/arch/aarch64/exceptions/exception.hpp"

#include "teaos/config.hpp"

namespace
{
    void check_dtb(u64 arg0)
    {
#if TEAOS_LAYOUT_QEMU_VIRT
        // QEMU does not pass the DTB to bare ELF images; it sits at the start of RAM.
        u64 dtb = arg0 != 0 ? arg0 : layout::qemu_virt::DTB_START;

        layout::Region reserved{ "dtb", layout::qemu_virt::DTB_START, layout::qemu_virt::DTB_SIZE };
        if (!reserved.contains(dtb))
        {
            kprint::log_hex("kernel", "dtb outside the reserved region: ", dtb);
            return;
        }

        const void* blob = (const void*)(uintptr_t)dtb;
        if (!fdt::is_valid(blob))
        {
            kprint::log_hex("kernel", "no valid dtb, magic ", fdt::magic(blob));
            return;
        }

        if (fdt::total_size(blob) > reserved.start + reserved.size - dtb)
        {
            kprint::log("kernel", "dtb larger than its reservation");
            return;
        }

        fdt::debug_print_header(blob);
#else
        kprint::log_hex("kernel", "boot argument ", arg0);
#endif
    }
}

extern "C" void kernel_main(u64 arg0)
{
    pl011::init();

    kprint::puts("\n");
    kprint::log("kernel", "teaos starting");
    kprint::log_hex("kernel", "CurrentEL ", arch::sysreg::current_el());

    layout::init();
    check_dtb(arg0);

    exception::init();
    kprint::log_hex("kernel", "vector table at ", exception::vector_base());

#if TEAOS_KERNEL_TERMINAL_TEST
    tests::run_terminal(tests::Terminal(TEAOS_KERNEL_TERMINAL_TEST));
#elif TEAOS_KERNEL_SELFTEST
    tests::run_all();
#else
    asm volatile("brk #0" ::: "memory");
    kprint::log("kernel", "returned from breakpoint trap");
#endif

    u32 v = psci::version();
    if ((s32)v == psci::NOT_SUPPORTED)
    {
        kprint::log("kernel", "psci not available, parking core");
    }
    else
    {
        kprint::puts("psci version ");
        kprint::dec_u64(v >> 16);
        kprint::putc('.');
        kprint::dec_u64(v & 0xFFFF);
        kprint::puts("\n");
    }

    kprint::log("kernel", "nothing left to do, powering off");
    halt();
}
