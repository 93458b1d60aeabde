#pragma once

// Trap frame layout shared by vectors.S and C++.
//
// The frame is built on SP_EL1, which the core selects on every exception
// taken to EL1. The dispatch routine receives the frame base, which is the
// stack pointer after the frame has been reserved:
//
//   base + 0    spsr       \ topmost pair, stored last, loaded first
//   base + 8    elr        /
//   base + 16   x0, x1
//   ...
//   base + 240  x28, x29
//   base + 256  x30, vector
//   base + 272  (interrupted stack pointer for EL1h traps)

#define TF_SPSR         0
#define TF_ELR          8
#define TF_X0           16
#define TF_X(n)         (TF_X0 + 8 * (n))
#define TF_X30          TF_X(30)
#define TF_VECTOR       (TF_X30 + 8)
#define TRAP_FRAME_SIZE 272

#ifndef __ASSEMBLER__

#include "teaos/types.hpp"

namespace arch
{
    struct TrapFrame
    {
        u64 spsr;       // SPSR_EL1 at entry
        u64 elr;        // ELR_EL1 at entry (resume address)
        u64 x[31];      // x0..x30
        u64 vector;     // slot index 0..15 that took the trap

        u64& lr() { return x[30]; }

        // Only meaningful for traps taken on the same stack (EL1h).
        u64 interrupted_sp() const
        {
            return (u64)(uintptr_t)this + TRAP_FRAME_SIZE;
        }
    };

    static_assert(sizeof(TrapFrame) == TRAP_FRAME_SIZE, "TrapFrame size does not match vectors.S");
    static_assert(TRAP_FRAME_SIZE % 16 == 0, "trap frame must keep SP 16-byte aligned");
    static_assert(__builtin_offsetof(TrapFrame, spsr) == TF_SPSR, "spsr offset");
    static_assert(__builtin_offsetof(TrapFrame, elr) == TF_ELR, "elr offset");
    static_assert(__builtin_offsetof(TrapFrame, x) == TF_X0, "x0 offset");
    static_assert(__builtin_offsetof(TrapFrame, x) + 30 * sizeof(u64) == TF_X30, "x30 offset");
    static_assert(__builtin_offsetof(TrapFrame, vector) == TF_VECTOR, "vector offset");

    static constexpr u64 FRAME_ALIGN = 16;
    static constexpr u64 GPR_COUNT   = 31;
}

#endif
