#include "src/arch/aarch64/exceptions/exception.hpp"

#include "kernel/arch/aarch64/esr.hpp"
#include "kernel/arch/aarch64/sysreg.hpp"
#include "kernel/arch/aarch64/vector_slots.hpp"
#include "kernel/core/print.hpp"
#include "kernel/core/panic.hpp"

namespace
{
    exception::El1Observer g_el1_observer = nullptr;

    void dump_slot(u64 vector)
    {
        kprint::puts("vector: ");
        kprint::dec_u64(vector);

        if (vector < VECTOR_SLOT_COUNT)
        {
            const arch::VectorSlot& slot = arch::VECTOR_SLOTS[vector];
            kprint::puts(" (");
            kprint::puts(arch::class_name(slot.trap_class()));
            kprint::puts(", ");
            kprint::puts(arch::source_name(slot.source()));
            kprint::puts(")");
        }
        kprint::puts("\n");
    }

    void dump_frame(const arch::TrapFrame& f)
    {
        kprint::puts("SPSR: "); kprint::hex_u64(f.spsr);
        kprint::puts("\nELR:  "); kprint::hex_u64(f.elr);
        kprint::puts("\n");

        for (u64 i = 0; i < arch::GPR_COUNT; i++)
        {
            kprint::putc('x');
            kprint::dec_u64(i);
            kprint::puts(i < 10 ? ":  " : ": ");
            kprint::hex_u64(f.x[i]);
            kprint::puts((i % 2) ? "\n" : "   ");
        }
        kprint::puts("\n");
    }
}

extern "C" void handle_unhandled(arch::TrapFrame* frame)
{
    arch::sysreg::mask_all();

    kprint::puts("\n=== UNHANDLED EXCEPTION ===\n");
    dump_slot(frame->vector);
    kprint::puts("CurrentEL: "); kprint::dec_u64(arch::sysreg::current_el());
    kprint::puts("\n");

    if (arch::reports_syndrome(frame->vector))
    {
        u64 esr = arch::sysreg::read_esr();
        u64 ec  = arch::esr::ec(esr);

        kprint::puts("ESR: ");     kprint::hex_u64(esr);
        kprint::puts(" EC=");      kprint::hex_u64(ec);
        kprint::puts(" (");        kprint::puts(arch::esr::class_name(ec));
        kprint::puts(") ISS=");    kprint::hex_u64(arch::esr::iss(esr));
        kprint::puts("\nFAR: ");   kprint::hex_u64(arch::sysreg::read_far());
        kprint::puts("\n");
    }

    dump_frame(*frame);

    panic("unhandled exception");
}

extern "C" void handle_exception_el1(arch::TrapFrame* frame)
{
    u64 esr = arch::sysreg::read_esr();

    if (g_el1_observer != nullptr && g_el1_observer(*frame, esr))
    {
        return;
    }

    u64 ec = arch::esr::ec(esr);

    switch (ec)
    {
        case arch::esr::EC_BRK64:
            kprint::log("exception", "skipping breakpoint");
            frame->elr += 4;
            return;

        default:
            kprint::log_hex("exception", "unhandled exception from EL1, EC=", ec);
            handle_unhandled(frame);
    }
}

namespace exception
{
    void init()
    {
        kprint::log("exception", "initializing exception handling");

        arch::sysreg::write_vbar(vector_base());
        arch::sysreg::isb();
    }

    u64 vector_base()
    {
        return (u64)(uintptr_t)exception_vectors;
    }

    El1Observer set_el1_observer(El1Observer fn)
    {
        El1Observer prev = g_el1_observer;
        g_el1_observer = fn;
        return prev;
    }
}
