#pragma once
#include "teaos/types.hpp"

// ESR_EL1 decoding:
//   [31:26] EC   exception class
//   [25]    IL   32-bit instruction length
//   [24:0]  ISS  instruction specific syndrome

namespace arch
{
    namespace esr
    {
        enum Class : u64
        {
            EC_UNKNOWN        = 0x00,
            EC_WFX            = 0x01,
            EC_FP_ACCESS      = 0x07,
            EC_ILLEGAL_STATE  = 0x0E,
            EC_SVC32          = 0x11,
            EC_SVC64          = 0x15,
            EC_HVC64          = 0x16,
            EC_SMC64          = 0x17,
            EC_SYSREG         = 0x18,
            EC_IABT_LOWER     = 0x20,
            EC_IABT_SAME      = 0x21,
            EC_PC_ALIGN       = 0x22,
            EC_DABT_LOWER     = 0x24,
            EC_DABT_SAME      = 0x25,
            EC_SP_ALIGN       = 0x26,
            EC_FP_EXC64       = 0x2C,
            EC_SERROR         = 0x2F,
            EC_BREAKPT_LOWER  = 0x30,
            EC_BREAKPT_SAME   = 0x31,
            EC_STEP_LOWER     = 0x32,
            EC_STEP_SAME      = 0x33,
            EC_WATCHPT_LOWER  = 0x34,
            EC_WATCHPT_SAME   = 0x35,
            EC_BRK64          = 0x3C
        };

        constexpr u64 ec(u64 esr)
        {
            return (esr >> 26) & 0x3Fu;
        }

        constexpr bool il(u64 esr)
        {
            return ((esr >> 25) & 1u) != 0;
        }

        constexpr u64 iss(u64 esr)
        {
            return esr & 0x1FFFFFFu;
        }

        // SVC/HVC/SMC/BRK immediate
        constexpr u64 imm16(u64 esr)
        {
            return esr & 0xFFFFu;
        }

        constexpr bool is_abort(u64 ec_value)
        {
            return (ec_value == EC_IABT_LOWER) || (ec_value == EC_IABT_SAME) ||
                   (ec_value == EC_DABT_LOWER) || (ec_value == EC_DABT_SAME);
        }

        constexpr const char* class_name(u64 ec_value)
        {
            switch (ec_value)
            {
                case EC_UNKNOWN:       return "Unknown reason";
                case EC_WFX:           return "WFI/WFE";
                case EC_FP_ACCESS:     return "FP/SIMD access";
                case EC_ILLEGAL_STATE: return "Illegal execution state";
                case EC_SVC32:         return "SVC (AArch32)";
                case EC_SVC64:         return "SVC (AArch64)";
                case EC_HVC64:         return "HVC (AArch64)";
                case EC_SMC64:         return "SMC (AArch64)";
                case EC_SYSREG:        return "MSR/MRS/system instruction";
                case EC_IABT_LOWER:    return "Instruction Abort (lower EL)";
                case EC_IABT_SAME:     return "Instruction Abort (same EL)";
                case EC_PC_ALIGN:      return "PC alignment fault";
                case EC_DABT_LOWER:    return "Data Abort (lower EL)";
                case EC_DABT_SAME:     return "Data Abort (same EL)";
                case EC_SP_ALIGN:      return "SP alignment fault";
                case EC_FP_EXC64:      return "FP exception (AArch64)";
                case EC_SERROR:        return "SError";
                case EC_BREAKPT_LOWER: return "Breakpoint (lower EL)";
                case EC_BREAKPT_SAME:  return "Breakpoint (same EL)";
                case EC_STEP_LOWER:    return "Software step (lower EL)";
                case EC_STEP_SAME:     return "Software step (same EL)";
                case EC_WATCHPT_LOWER: return "Watchpoint (lower EL)";
                case EC_WATCHPT_SAME:  return "Watchpoint (same EL)";
                case EC_BRK64:         return "BRK (AArch64)";
            }
            return "Other";
        }
    }
}
