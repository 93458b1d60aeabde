#include "kernel/platform/fdt/fdt.hpp"
#include "kernel/core/print.hpp"

namespace
{
    static u32 be32(const void* p)
    {
        const u8* b = (const u8*)p;
        return ((u32)b[0] << 24) | ((u32)b[1] << 16) | ((u32)b[2] << 8) | (u32)b[3];
    }

    static constexpr u32 FDT_MIN_VERSION = 16;

    struct FdtHeader
    {
        u32 magic;
        u32 totalsize;
        u32 off_dt_struct;
        u32 off_dt_strings;
        u32 off_mem_rsvmap;
        u32 version;
        u32 last_comp_version;
        u32 boot_cpuid_phys;
        u32 size_dt_strings;
        u32 size_dt_struct;
    };

    static bool block_fits(u32 off, u32 size, u32 total)
    {
        return off <= total && size <= total - off;
    }
}

namespace fdt
{
    bool is_valid(const void* dtb)
    {
        if (dtb == nullptr)
        {
            return false;
        }

        const FdtHeader* h = (const FdtHeader*)dtb;
        if (be32(&h->magic) != FDT_MAGIC)
        {
            return false;
        }

        u32 total = be32(&h->totalsize);
        if (total < sizeof(FdtHeader))
        {
            return false;
        }

        if (be32(&h->last_comp_version) > FDT_MIN_VERSION || be32(&h->version) < FDT_MIN_VERSION)
        {
            return false;
        }

        return block_fits(be32(&h->off_dt_struct), be32(&h->size_dt_struct), total) &&
               block_fits(be32(&h->off_dt_strings), be32(&h->size_dt_strings), total) &&
               be32(&h->off_mem_rsvmap) < total;
    }

    u32 magic(const void* dtb)
    {
        const FdtHeader* h = (const FdtHeader*)dtb;
        return be32(&h->magic);
    }

    u32 total_size(const void* dtb)
    {
        const FdtHeader* h = (const FdtHeader*)dtb;
        return be32(&h->totalsize);
    }

    void debug_print_header(const void* dtb)
    {
        const FdtHeader* h = (const FdtHeader*)dtb;

        kprint::puts("fdt hdr: magic=");
        kprint::hex_u64(be32(&h->magic));
        kprint::puts(" totalsize=");
        kprint::hex_u64(be32(&h->totalsize));
        kprint::puts(" version=");
        kprint::dec_u64(be32(&h->version));
        kprint::puts("\n");
    }
}
