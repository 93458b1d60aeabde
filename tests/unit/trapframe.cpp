#include <catch2/catch.hpp>

#include "kernel/arch/aarch64/trapframe.hpp"

#include <cstddef>

using arch::TrapFrame;

TEST_CASE("Trap frame keeps the stack 16-byte aligned", "[TrapFrame]")
{
    REQUIRE(sizeof(TrapFrame) == 272);
    REQUIRE(sizeof(TrapFrame) % 16 == 0);
    REQUIRE(alignof(TrapFrame) == 8);
}

TEST_CASE("SPSR and ELR form the topmost pair", "[TrapFrame]")
{
    // Stored last by the trampoline, so they sit at the frame base
    REQUIRE(offsetof(TrapFrame, spsr) == 0);
    REQUIRE(offsetof(TrapFrame, elr) == 8);
    REQUIRE(offsetof(TrapFrame, spsr) == TF_SPSR);
    REQUIRE(offsetof(TrapFrame, elr) == TF_ELR);
}

TEST_CASE("General purpose registers are stored as 16-byte pairs", "[TrapFrame]")
{
    REQUIRE(offsetof(TrapFrame, x) == TF_X0);

    for (int n = 0; n < 31; n += 2)
    {
        // every even register starts a pair on a 16-byte boundary
        REQUIRE(TF_X(n) % 16 == 0);
        REQUIRE(offsetof(TrapFrame, x) + n * sizeof(uint64_t) == (size_t)TF_X(n));
    }
    REQUIRE(TF_X30 == 256);
    // x30 shares its pair with the slot index
    REQUIRE(offsetof(TrapFrame, vector) == TF_X30 + 8);
    REQUIRE(offsetof(TrapFrame, vector) + 8 == TRAP_FRAME_SIZE);
}

TEST_CASE("Frame fields map to the right registers", "[TrapFrame]")
{
    alignas(16) unsigned char raw[TRAP_FRAME_SIZE] = {};
    auto* frame = reinterpret_cast<TrapFrame*>(raw);

    for (int n = 0; n < 31; n++)
    {
        frame->x[n] = 0x1000 + n;
    }
    frame->spsr = 0x3c5;
    frame->elr = 0xffff000000001234;
    frame->vector = 4;

    uint64_t word;
    __builtin_memcpy(&word, raw + TF_X(17), sizeof(word));
    REQUIRE(word == 0x1000 + 17);
    __builtin_memcpy(&word, raw + TF_ELR, sizeof(word));
    REQUIRE(word == 0xffff000000001234);
    __builtin_memcpy(&word, raw + TF_VECTOR, sizeof(word));
    REQUIRE(word == 4);

    REQUIRE(frame->lr() == 0x1000 + 30);
    frame->lr() = 0xdead;
    REQUIRE(frame->x[30] == 0xdead);
}

TEST_CASE("Interrupted stack pointer lies just above the frame", "[TrapFrame]")
{
    alignas(16) unsigned char raw[TRAP_FRAME_SIZE + 16] = {};
    auto* frame = reinterpret_cast<TrapFrame*>(raw);

    REQUIRE(frame->interrupted_sp() == (uint64_t)(uintptr_t)raw + TRAP_FRAME_SIZE);
    REQUIRE(frame->interrupted_sp() % 16 == 0);
}
