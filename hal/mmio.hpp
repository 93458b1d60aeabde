#pragma once
#include "teaos/types.hpp"

namespace mmio
{
    static inline void write32(uintptr_t addr, u32 value)
    {
        *(volatile u32*)addr = value;
    }

    static inline u32 read32(uintptr_t addr)
    {
        return *(volatile u32*)addr;
    }
}
