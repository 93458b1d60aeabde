#pragma once
#include "teaos/types.hpp"

// Address space layouts the kernel can be linked for. The numbers here must
// agree with link/highhalf.ld and link/qemu-virt.ld; the linker scripts assert
// the same ordering at link time and layout::init() re-checks the bound
// symbols at boot.
//
// High-half:
//   0xffff000000000000 - 0xffff0000ffffffff    kernel code + data
//   0xffff000100000000 - 0xffff000100003fff    stack (16 KiB)
//   0xffff000200000000 - 0xffff0002ffffffff    heap (4 GiB)
//   0xffff000300000000 - 0xffff0003ffffffff    user image (4 GiB)
//   0xffff100000000000 - 0xffffffffffffffff    linear map (240 TiB)
//
// QEMU virt (RAM at 0x40000000, MMU off):
//   0x40000000 - 0x401fffff                    DTB reservation (2 MiB)
//   0x40200000 - __KERNEL_END                  text, rodata, data, bss
//   __SCRATCH_STACK_BOTTOM - __SCRATCH_STACK_TOP  boot stack (64 KiB)

namespace layout
{
    struct Region
    {
        const char* name;
        u64 start;
        u64 size;

        // inclusive, so a region may end at the top of the address space
        constexpr u64 last() const { return start + (size - 1); }

        constexpr bool contains(u64 addr) const
        {
            return size != 0 && addr >= start && addr <= last();
        }

        constexpr bool overlaps(const Region& o) const
        {
            return size != 0 && o.size != 0 && start <= o.last() && o.start <= last();
        }
    };

    enum class Check : u32
    {
        Ok,
        Empty,       // size == 0
        Wraps,       // runs past the top of the address space
        OutOfOrder,  // start not above the previous region
        Overlap      // shares addresses with the previous region
    };

    // Regions must be listed in ascending address order.
    constexpr Check validate(const Region* regions, usize count)
    {
        for (usize i = 0; i < count; i++)
        {
            const Region& r = regions[i];

            if (r.size == 0)
            {
                return Check::Empty;
            }

            if (r.last() < r.start)
            {
                return Check::Wraps;
            }

            if (i == 0)
            {
                continue;
            }

            const Region& prev = regions[i - 1];

            if (r.start <= prev.start)
            {
                return Check::OutOfOrder;
            }

            if (r.start <= prev.last())
            {
                return Check::Overlap;
            }
        }

        return Check::Ok;
    }

    constexpr const char* check_name(Check c)
    {
        switch (c)
        {
            case Check::Ok:         return "ok";
            case Check::Empty:      return "empty region";
            case Check::Wraps:      return "region wraps the address space";
            case Check::OutOfOrder: return "regions out of order";
            case Check::Overlap:    return "regions overlap";
        }
        return "?";
    }

    namespace highhalf
    {
        static constexpr u64 KERNEL_START  = 0xffff000000000000ull;
        static constexpr u64 KSTACK_START  = 0xffff000100000000ull;
        static constexpr u64 KSTACK_SIZE   = 16ull << 10;
        static constexpr u64 KHEAP_START   = 0xffff000200000000ull;
        static constexpr u64 KHEAP_SIZE    = 4ull << 30;
        static constexpr u64 USERIMG_START = 0xffff000300000000ull;
        static constexpr u64 USERIMG_SIZE  = 4ull << 30;
        static constexpr u64 LINEAR_START  = 0xffff100000000000ull;
        static constexpr u64 LINEAR_SIZE   = 0ull - LINEAR_START;

        // The kernel image may grow up to the stack region.
        static constexpr u64 KERNEL_WINDOW = KSTACK_START - KERNEL_START;

        static constexpr Region REGIONS[] = {
            { "kernel",  KERNEL_START,  KERNEL_WINDOW },
            { "stack",   KSTACK_START,  KSTACK_SIZE },
            { "heap",    KHEAP_START,   KHEAP_SIZE },
            { "userimg", USERIMG_START, USERIMG_SIZE },
            { "linear",  LINEAR_START,  LINEAR_SIZE },
        };

        static constexpr usize REGION_COUNT = sizeof(REGIONS) / sizeof(REGIONS[0]);

        static_assert(validate(REGIONS, REGION_COUNT) == Check::Ok, "high-half layout is inconsistent");
        static_assert(KERNEL_START < KSTACK_START && KSTACK_START < KHEAP_START && KHEAP_START < LINEAR_START,
                      "kernel < stack < heap < linear map");
    }

    namespace qemu_virt
    {
        static constexpr u64 RAM_BASE           = 0x40000000ull;
        static constexpr u64 DTB_START          = RAM_BASE;
        static constexpr u64 DTB_SIZE           = 2ull << 20;
        static constexpr u64 KERNEL_LOAD        = DTB_START + DTB_SIZE;
        static constexpr u64 SCRATCH_STACK_SIZE = 64ull << 10;

        static_assert(KERNEL_LOAD % (2ull << 20) == 0, "kernel load address is 2 MiB aligned");
    }

    // Region set of the layout this kernel was linked with, from linker
    // symbols. Returns the number of regions written (at most max).
    usize current(Region* out, usize max);

    // Validates and logs the current layout; panics if it is inconsistent.
    void init();
}
