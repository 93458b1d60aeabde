#pragma once
#include "teaos/types.hpp"

namespace psci
{
    static constexpr s32 NOT_SUPPORTED = -1;

    static constexpr u32 FN_BASE_SMC32   = 0x84000000;
    static constexpr u32 FN_VERSION      = FN_BASE_SMC32 + 0;
    static constexpr u32 FN_SYSTEM_OFF   = FN_BASE_SMC32 + 8;

    // major in [31:16], minor in [15:0], or NOT_SUPPORTED
    u32 version();

    [[noreturn]] void system_off();
}
