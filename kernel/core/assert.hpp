#pragma once
#include "kernel/core/print.hpp"
#include "kernel/core/panic.hpp"

#define ASSERT(expr) do { \
    if (!(expr)) { \
        kprint::puts("\n\n=== ASSERT FAILED ===\n"); \
        kprint::puts("expr: " #expr "\n"); \
        kprint::puts("file: " __FILE__ "\n"); \
        kprint::puts("line: "); \
        kprint::dec_u64((u64)__LINE__); \
        kprint::puts("\n"); \
        panic("assert"); \
    } \
} while (0)

#define ASSERT_EQ(actual, expected) do { \
    u64 a_ = (u64)(actual); \
    u64 e_ = (u64)(expected); \
    if (a_ != e_) { \
        kprint::puts("\n\n=== ASSERT FAILED ===\n"); \
        kprint::puts("expr: " #actual " == " #expected "\n"); \
        kprint::puts("actual:   "); kprint::hex_u64(a_); \
        kprint::puts("\nexpected: "); kprint::hex_u64(e_); \
        kprint::puts("\nfile: " __FILE__ "\nline: "); \
        kprint::dec_u64((u64)__LINE__); \
        kprint::puts("\n"); \
        panic("assert"); \
    } \
} while (0)
