#include "kernel/mm/layout.hpp"
#include "kernel/core/print.hpp"
#include "kernel/core/panic.hpp"
#include "teaos/config.hpp"

extern "C"
{
    extern u8 __KERNEL_START[];
    extern u8 __KERNEL_END[];

#if TEAOS_LAYOUT_QEMU_VIRT
    extern u8 __DTB_START[];
    extern u8 __DTB_END[];
    extern u8 __TEXT_END[];
    extern u8 __RODATA_START[];
    extern u8 __DATA_START[];
    extern u8 __BSS_START[];
    extern u8 __BSS_END[];
    extern u8 __SCRATCH_STACK_BOTTOM[];
    extern u8 __SCRATCH_STACK_TOP[];
#elif TEAOS_LAYOUT_HIGHHALF
    extern u8 __STACK_START[];
    extern u8 __STACK_END[];
    extern u8 __HEAP_START[];
    extern u8 __HEAP_END[];
    extern u8 __USERIMG_START[];
    extern u8 __USERIMG_END[];
    extern u8 __LINEAR_REGION_START[];
#endif
}

namespace
{
    static constexpr usize MAX_REGIONS = 8;

    static inline u64 addr(const u8* sym)
    {
        return (u64)(uintptr_t)sym;
    }

    static layout::Region span(const char* name, const u8* start, const u8* end)
    {
        return layout::Region{ name, addr(start), addr(end) - addr(start) };
    }

    // Image sections may legitimately be empty; fixed regions may not.
    static void push(layout::Region* regions, usize& n, const layout::Region& r, bool may_be_empty)
    {
        if (may_be_empty && r.size == 0)
        {
            return;
        }
        regions[n++] = r;
    }

    void print_region(const layout::Region& r)
    {
        kprint::puts("  ");
        kprint::hex_u64(r.start);
        kprint::puts(" - ");
        kprint::hex_u64(r.last());
        kprint::puts("  ");
        kprint::puts(r.name);
        kprint::puts("\n");
    }
}

namespace layout
{
    usize current(Region* out, usize max)
    {
        Region regions[MAX_REGIONS];
        usize n = 0;

#if TEAOS_LAYOUT_QEMU_VIRT
        push(regions, n, span("dtb",    __DTB_START, __DTB_END), false);
        push(regions, n, span("text",   __KERNEL_START, __TEXT_END), false);
        push(regions, n, span("rodata", __RODATA_START, __DATA_START), true);
        push(regions, n, span("data",   __DATA_START, __BSS_START), true);
        push(regions, n, span("bss",    __BSS_START, __BSS_END), true);
        push(regions, n, span("stack",  __SCRATCH_STACK_BOTTOM, __SCRATCH_STACK_TOP), false);
#elif TEAOS_LAYOUT_HIGHHALF
        regions[n++] = span("kernel",  __KERNEL_START, __KERNEL_END);
        regions[n++] = span("stack",   __STACK_START, __STACK_END);
        regions[n++] = span("heap",    __HEAP_START, __HEAP_END);
        regions[n++] = span("userimg", __USERIMG_START, __USERIMG_END);
        regions[n++] = Region{ "linear", addr(__LINEAR_REGION_START), 0ull - addr(__LINEAR_REGION_START) };
#endif

        usize count = n < max ? n : max;
        for (usize i = 0; i < count; i++)
        {
            out[i] = regions[i];
        }
        return count;
    }

    void init()
    {
        Region regions[MAX_REGIONS];
        usize n = current(regions, MAX_REGIONS);

        if (n == 0)
        {
            panic("layout: kernel built without a memory layout variant");
        }

        kprint::log("layout", "memory layout:");
        for (usize i = 0; i < n; i++)
        {
            print_region(regions[i]);
        }

        Check c = validate(regions, n);
        if (c != Check::Ok)
        {
            kprint::puts("layout: ");
            kprint::puts(check_name(c));
            kprint::puts("\n");
            panic("layout: inconsistent memory layout");
        }

#if TEAOS_LAYOUT_HIGHHALF
        if (addr(__STACK_START) != highhalf::KSTACK_START ||
            addr(__HEAP_START) != highhalf::KHEAP_START ||
            addr(__LINEAR_REGION_START) != highhalf::LINEAR_START)
        {
            panic("layout: linker script disagrees with layout::highhalf");
        }
#elif TEAOS_LAYOUT_QEMU_VIRT
        if (addr(__DTB_START) != qemu_virt::DTB_START ||
            addr(__KERNEL_START) != qemu_virt::KERNEL_LOAD)
        {
            panic("layout: linker script disagrees with layout::qemu_virt");
        }
#endif
    }
}
