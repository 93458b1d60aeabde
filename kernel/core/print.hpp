#pragma once
#include "teaos/types.hpp"

namespace kprint
{
    void putc(char c);
    void puts(const char* s);

    void hex_u64(u64 x);
    void dec_u64(u64 x);

    // "<uptime ms> [module] msg\n"
    void log(const char* module, const char* msg);
    void log_hex(const char* module, const char* msg, u64 value);

    u64 uptime_ms();
}
