#pragma once

// Vector slot routing, expanded by vectors.S (one trampoline per slot) and by
// C++ (the route table below).
//
//   slot  class   source
//    0    Sync    EL1 with SP_EL0
//    1    IRQ     EL1 with SP_EL0
//    2    FIQ     EL1 with SP_EL0
//    3    SError  EL1 with SP_EL0
//    4    Sync    EL1 with SP_ELx      -> handle_exception_el1
//    5    IRQ     EL1 with SP_ELx
//    6    FIQ     EL1 with SP_ELx
//    7    SError  EL1 with SP_ELx
//    8    Sync    EL0 AArch64
//    9    IRQ     EL0 AArch64
//   10    FIQ     EL0 AArch64
//   11    SError  EL0 AArch64
//   12    Sync    EL0 AArch32
//   13    IRQ     EL0 AArch32
//   14    FIQ     EL0 AArch32
//   15    SError  EL0 AArch32
//
// Every slot not routed to a handler goes to handle_unhandled, which halts.

#define VECTOR_TABLE_ALIGN 2048
#define VECTOR_ENTRY_SIZE  128
#define VECTOR_SLOT_COUNT  16

#define TEAOS_VECTOR_SLOTS(X) \
    X(0,  unhandled)          \
    X(1,  unhandled)          \
    X(2,  unhandled)          \
    X(3,  unhandled)          \
    X(4,  exception_el1)      \
    X(5,  unhandled)          \
    X(6,  unhandled)          \
    X(7,  unhandled)          \
    X(8,  unhandled)          \
    X(9,  unhandled)          \
    X(10, unhandled)          \
    X(11, unhandled)          \
    X(12, unhandled)          \
    X(13, unhandled)          \
    X(14, unhandled)          \
    X(15, unhandled)

#ifndef __ASSEMBLER__

#include "teaos/types.hpp"

namespace arch
{
    enum class TrapClass : u32
    {
        Synchronous = 0,
        Irq         = 1,
        Fiq         = 2,
        SError      = 3
    };

    enum class TrapSource : u32
    {
        El1Sp0      = 0,
        El1SpX      = 1,
        El0Aarch64  = 2,
        El0Aarch32  = 3
    };

    // Terminal state for every slot without a handler: halt the machine.
    enum class Route : u32
    {
        Unhandled,
        ExceptionEl1
    };

    struct VectorSlot
    {
        u32 index;
        Route route;
        const char* handler;

        constexpr TrapClass trap_class() const { return TrapClass(index % 4); }
        constexpr TrapSource source() const { return TrapSource(index / 4); }
        constexpr u64 offset() const { return (u64)index * VECTOR_ENTRY_SIZE; }
        constexpr bool routed() const { return route != Route::Unhandled; }
    };

#define TEAOS_ROUTE_unhandled     Route::Unhandled
#define TEAOS_ROUTE_exception_el1 Route::ExceptionEl1
#define TEAOS_SLOT_ENTRY(n, h)    VectorSlot{ n, TEAOS_ROUTE_##h, "handle_" #h },

    static constexpr VectorSlot VECTOR_SLOTS[VECTOR_SLOT_COUNT] = {
        TEAOS_VECTOR_SLOTS(TEAOS_SLOT_ENTRY)
    };

#undef TEAOS_SLOT_ENTRY

    constexpr const VectorSlot& vector_slot(TrapClass cls, TrapSource src)
    {
        return VECTOR_SLOTS[(u32)src * 4 + (u32)cls];
    }

    constexpr const char* class_name(TrapClass cls)
    {
        switch (cls)
        {
            case TrapClass::Synchronous: return "Synchronous";
            case TrapClass::Irq:         return "IRQ";
            case TrapClass::Fiq:         return "FIQ";
            case TrapClass::SError:      return "SError";
        }
        return "?";
    }

    constexpr const char* source_name(TrapSource src)
    {
        switch (src)
        {
            case TrapSource::El1Sp0:     return "EL1 with SP_EL0";
            case TrapSource::El1SpX:     return "EL1 with SP_ELx";
            case TrapSource::El0Aarch64: return "EL0 AArch64";
            case TrapSource::El0Aarch32: return "EL0 AArch32";
        }
        return "?";
    }

    // ESR_EL1 and FAR_EL1 are only written for synchronous exceptions. On an
    // IRQ, FIQ or SError slot they still hold the last synchronous trap.
    constexpr bool reports_syndrome(u64 vector)
    {
        return vector < VECTOR_SLOT_COUNT &&
               VECTOR_SLOTS[vector].trap_class() == TrapClass::Synchronous;
    }

    constexpr bool slots_in_order()
    {
        for (u32 i = 0; i < VECTOR_SLOT_COUNT; i++)
        {
            if (VECTOR_SLOTS[i].index != i)
            {
                return false;
            }
        }
        return true;
    }

    static_assert(VECTOR_TABLE_ALIGN == VECTOR_SLOT_COUNT * VECTOR_ENTRY_SIZE, "vector table is 16 x 128 bytes");
    static_assert(slots_in_order(), "vector slots must be listed in architectural order");
    static_assert(VECTOR_SLOTS[4].route == Route::ExceptionEl1, "EL1h synchronous traps go to the EL1 handler");
}

#endif
