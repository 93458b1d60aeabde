#pragma once
#include "teaos/types.hpp"
#include "kernel/arch/aarch64/trapframe.hpp"

extern "C" u8 exception_vectors[];
extern "C" u8 exception_vectors_end[];

// Dispatch routines called by vectors.S with the frame base in x0.
extern "C" [[noreturn]] void handle_unhandled(arch::TrapFrame* frame);
extern "C" void handle_exception_el1(arch::TrapFrame* frame);

namespace exception
{
    // Programs VBAR_EL1 with exception_vectors.
    void init();

    u64 vector_base();

    // Sees every EL1 synchronous trap before the built-in policy. Returning
    // true marks the trap handled; the frame is restored as left.
    using El1Observer = bool (*)(arch::TrapFrame& frame, u64 esr);

    El1Observer set_el1_observer(El1Observer fn);
}
