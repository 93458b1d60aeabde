#pragma once
#include "teaos/types.hpp"

namespace fdt
{
    static constexpr u32 FDT_MAGIC = 0xD00DFEED;

    // Header checks only: magic, version and that the blocks fit totalsize.
    bool is_valid(const void* dtb);

    u32 magic(const void* dtb);
    u32 total_size(const void* dtb);

    void debug_print_header(const void* dtb);
}
