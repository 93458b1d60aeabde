#include "kernel/tests/tests.hpp"
#include "kernel/core/assert.hpp"
#include "kernel/core/print.hpp"
#include "kernel/arch/aarch64/esr.hpp"
#include "kernel/arch/aarch64/sysreg.hpp"
#include "kernel/arch/aarch64/trapframe.hpp"
#include "kernel/arch/aarch64/vector_slots.hpp"
#include "kernel/mm/layout.hpp"
#include "src/arch/aarch64/exceptions/exception.hpp"

extern "C"
{
    void trap_probe_svc(u64* out);
    void trap_probe_skip(u64* out);
    extern u8 trap_probe_svc_resume[];
    extern u8 trap_probe_skip_resume[];

    extern u8 exception_vector_0[];
    extern u8 exception_vector_1[];
    extern u8 exception_vector_2[];
    extern u8 exception_vector_3[];
    extern u8 exception_vector_4[];
    extern u8 exception_vector_5[];
    extern u8 exception_vector_6[];
    extern u8 exception_vector_7[];
    extern u8 exception_vector_8[];
    extern u8 exception_vector_9[];
    extern u8 exception_vector_10[];
    extern u8 exception_vector_11[];
    extern u8 exception_vector_12[];
    extern u8 exception_vector_13[];
    extern u8 exception_vector_14[];
    extern u8 exception_vector_15[];
}

namespace
{
    // Must match trap_probe.S
    static constexpr u64 PROBE_NZCV    = 0xA0000000ull;
    static constexpr u64 PROBE_SVC     = 0;
    static constexpr u64 PROBE_SKIP    = 1;
    static constexpr u64 PROBE_OUT_LEN = 33;
    static constexpr u64 OUT_NZCV      = 31;
    static constexpr u64 OUT_SP        = 32;

    static constexpr u64 MUTATED_REG   = 5;
    static constexpr u64 MUTATED_VALUE = 0x00000000C0FFEE00ull;

    static constexpr u64 SPSR_NZCV_MASK = 0xF0000000ull;
    static constexpr u64 SPSR_M_MASK    = 0xFull;
    static constexpr u64 SPSR_M_EL1H    = 0x5ull;

    constexpr u64 pattern(u64 n)
    {
        return 0x7ea0000000000000ull | (n << 32) | (0x1000 + n);
    }

    struct Observed
    {
        u64 svc_count;
        u64 brk_count;
        u64 esr;
        u64 frame_addr;
        u64 interrupted_sp;
        arch::TrapFrame frame;
    };

    Observed g_seen;

    bool probe_observer(arch::TrapFrame& f, u64 esr)
    {
        u64 ec = arch::esr::ec(esr);

        if (ec == arch::esr::EC_BRK64)
        {
            g_seen.brk_count++;
            return false;
        }

        if (ec != arch::esr::EC_SVC64)
        {
            return false;
        }

        g_seen.svc_count++;
        g_seen.esr = esr;
        g_seen.frame_addr = (u64)(uintptr_t)&f;
        g_seen.interrupted_sp = f.interrupted_sp();
        g_seen.frame = f;

        if (arch::esr::imm16(esr) == PROBE_SKIP)
        {
            f.x[MUTATED_REG] = MUTATED_VALUE;
            f.elr += 4;
        }

        return true;
    }

    void reset_seen()
    {
        g_seen.svc_count = 0;
        g_seen.brk_count = 0;
        g_seen.esr = 0;
        g_seen.frame_addr = 0;
        g_seen.interrupted_sp = 0;
    }

    void check_captured_frame(u64 imm, const u8* resume, const u64* out)
    {
        const arch::TrapFrame& f = g_seen.frame;

        ASSERT_EQ(g_seen.svc_count, 1);
        ASSERT_EQ(arch::esr::imm16(g_seen.esr), imm);
        ASSERT_EQ(f.vector, 4);
        ASSERT_EQ(g_seen.frame_addr % arch::FRAME_ALIGN, 0);
        ASSERT_EQ(g_seen.interrupted_sp, out[OUT_SP]);
        ASSERT_EQ(f.elr, (u64)(uintptr_t)resume);
        ASSERT_EQ(f.spsr & SPSR_NZCV_MASK, PROBE_NZCV);
        ASSERT_EQ(f.spsr & SPSR_M_MASK, SPSR_M_EL1H);

        for (u64 i = 0; i < arch::GPR_COUNT; i++)
        {
            ASSERT_EQ(f.x[i], pattern(i));
        }
    }
}

namespace tests
{
    void vector_table_test()
    {
        kprint::puts("vector_table_test: placement and VBAR\n");

        const u8* slots[VECTOR_SLOT_COUNT] = {
            exception_vector_0,  exception_vector_1,  exception_vector_2,  exception_vector_3,
            exception_vector_4,  exception_vector_5,  exception_vector_6,  exception_vector_7,
            exception_vector_8,  exception_vector_9,  exception_vector_10, exception_vector_11,
            exception_vector_12, exception_vector_13, exception_vector_14, exception_vector_15,
        };

        u64 base = exception::vector_base();

        ASSERT_EQ(base % VECTOR_TABLE_ALIGN, 0);
        ASSERT_EQ(arch::sysreg::read_vbar(), base);
        ASSERT_EQ((u64)(uintptr_t)exception_vectors_end - base, VECTOR_SLOT_COUNT * VECTOR_ENTRY_SIZE);

        for (u64 i = 0; i < VECTOR_SLOT_COUNT; i++)
        {
            ASSERT_EQ((u64)(uintptr_t)slots[i], base + arch::VECTOR_SLOTS[i].offset());
        }

        kprint::puts("vector_table_test done\n");
    }

    void trap_roundtrip_test()
    {
        kprint::puts("trap_roundtrip_test: svc from EL1, frame left untouched\n");

        u64 out[PROBE_OUT_LEN];
        reset_seen();

        exception::El1Observer prev = exception::set_el1_observer(probe_observer);
        trap_probe_svc(out);
        exception::set_el1_observer(prev);

        check_captured_frame(PROBE_SVC, trap_probe_svc_resume, out);

        for (u64 i = 0; i < arch::GPR_COUNT; i++)
        {
            ASSERT_EQ(out[i], pattern(i));
        }
        ASSERT_EQ(out[OUT_NZCV], PROBE_NZCV);

        kprint::puts("trap_roundtrip_test done\n");
    }

    void trap_mutation_test()
    {
        kprint::puts("trap_mutation_test: handler writes x5 and skips one instruction\n");

        u64 out[PROBE_OUT_LEN];
        reset_seen();

        exception::El1Observer prev = exception::set_el1_observer(probe_observer);
        trap_probe_skip(out);
        exception::set_el1_observer(prev);

        check_captured_frame(PROBE_SKIP, trap_probe_skip_resume, out);

        for (u64 i = 0; i < arch::GPR_COUNT; i++)
        {
            if (i == MUTATED_REG)
            {
                ASSERT_EQ(out[i], MUTATED_VALUE);
            }
            else
            {
                // x7 would read 0xbad had the skipped instruction run
                ASSERT_EQ(out[i], pattern(i));
            }
        }
        ASSERT_EQ(out[OUT_NZCV], PROBE_NZCV);

        kprint::puts("trap_mutation_test done\n");
    }

    void brk_skip_test()
    {
        kprint::puts("brk_skip_test: brk from EL1 is skipped\n");

        reset_seen();

        exception::El1Observer prev = exception::set_el1_observer(probe_observer);
        asm volatile("brk #0x42" ::: "memory");
        exception::set_el1_observer(prev);

        ASSERT_EQ(g_seen.brk_count, 1);
        ASSERT_EQ(g_seen.svc_count, 0);

        kprint::puts("brk_skip_test done\n");
    }

    void layout_test()
    {
        kprint::puts("layout_test: linked layout is ordered and disjoint\n");

        layout::Region regions[8];
        usize n = layout::current(regions, 8);

        ASSERT(n > 0);
        ASSERT(layout::validate(regions, n) == layout::Check::Ok);

        for (usize i = 0; i < n; i++)
        {
            for (usize j = i + 1; j < n; j++)
            {
                ASSERT(!regions[i].overlaps(regions[j]));
            }
        }

        kprint::puts("layout_test done\n");
    }

    void run_all()
    {
        vector_table_test();
        trap_roundtrip_test();
        trap_mutation_test();
        brk_skip_test();
        layout_test();

        kprint::puts("selftest: all passed\n");
    }
}
