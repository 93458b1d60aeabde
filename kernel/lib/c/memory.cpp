#include "teaos/types.hpp"

// GCC may emit calls to these even with -ffreestanding.

extern "C" void* memset(void* dst, int c, usize n)
{
    volatile u8* p = (volatile u8*)dst;

    while (n--)
    {
        *p++ = (u8)c;
    }

    return dst;
}

extern "C" void* memcpy(void* dst, const void* src, usize n)
{
    volatile u8* d = (volatile u8*)dst;
    const u8* s = (const u8*)src;

    while (n--)
    {
        *d++ = *s++;
    }

    return dst;
}
