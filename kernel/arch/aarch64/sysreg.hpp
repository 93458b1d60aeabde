#pragma once
#include "teaos/types.hpp"

namespace arch
{
    namespace sysreg
    {
        inline u64 current_el()
        {
            u64 v;
            asm volatile("mrs %0, CurrentEL" : "=r"(v));
            return (v >> 2) & 3;
        }

        inline u64 read_esr()
        {
            u64 v;
            asm volatile("mrs %0, ESR_EL1" : "=r"(v));
            return v;
        }

        inline u64 read_far()
        {
            u64 v;
            asm volatile("mrs %0, FAR_EL1" : "=r"(v));
            return v;
        }

        inline u64 read_vbar()
        {
            u64 v;
            asm volatile("mrs %0, VBAR_EL1" : "=r"(v));
            return v;
        }

        inline void write_vbar(u64 v)
        {
            asm volatile("msr VBAR_EL1, %0" :: "r"(v) : "memory");
        }

        inline u64 read_cntfrq()
        {
            u64 v;
            asm volatile("mrs %0, CNTFRQ_EL0" : "=r"(v));
            return v;
        }

        inline u64 read_cntpct()
        {
            u64 v;
            asm volatile("isb; mrs %0, CNTPCT_EL0" : "=r"(v) :: "memory");
            return v;
        }

        inline void isb()
        {
            asm volatile("isb" ::: "memory");
        }

        inline void mask_all()
        {
            asm volatile("msr daifset, #0xf" ::: "memory");
        }

        inline void wfe()
        {
            asm volatile("wfe");
        }
    }
}
