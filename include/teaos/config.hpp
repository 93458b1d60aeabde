#pragma once

/**
 * @file config.hpp
 * @brief Build-time configuration for the teaos kernel.
 *
 * Every value can be overridden from the build system
 * (`target_compile_definitions`). Toggles are `0` or `1`.
 */

// -----------------------------------------------------------------------------
// Platform
// -----------------------------------------------------------------------------

/// PL011 UART used for the kernel console (QEMU virt default).
#ifndef TEAOS_UART_BASE
#define TEAOS_UART_BASE 0x09000000ull
#endif

/// PSCI conduit: 1 issues `hvc #0`, 0 issues `smc #0`.
#ifndef TEAOS_PSCI_CONDUIT_HVC
#define TEAOS_PSCI_CONDUIT_HVC 1
#endif

// -----------------------------------------------------------------------------
// Memory layout variant (exactly one is set per executable)
// -----------------------------------------------------------------------------

#ifndef TEAOS_LAYOUT_QEMU_VIRT
#define TEAOS_LAYOUT_QEMU_VIRT 0
#endif

#ifndef TEAOS_LAYOUT_HIGHHALF
#define TEAOS_LAYOUT_HIGHHALF 0
#endif

#if TEAOS_LAYOUT_QEMU_VIRT && TEAOS_LAYOUT_HIGHHALF
#error "select only one memory layout variant"
#endif

// -----------------------------------------------------------------------------
// Debug / test toggles
// -----------------------------------------------------------------------------

/// Run the in-kernel trap self tests at boot, then power off.
#ifndef TEAOS_KERNEL_SELFTEST
#define TEAOS_KERNEL_SELFTEST 0
#endif

/// Boot straight into one trap scenario that must end the run instead of
/// returning (see kernel/tests/terminal.cpp). 0 disables it.
///   1  synchronous trap on SP_EL0 (slot 0, routed to handle_unhandled)
///   2  undefined instruction at EL1 (slot 4, escalated by the EL1 handler)
///   3  halt() with a power-off call that traps (build with the smc conduit)
#ifndef TEAOS_KERNEL_TERMINAL_TEST
#define TEAOS_KERNEL_TERMINAL_TEST 0
#endif
