// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 AutoZ Project
/**
 * @file config.h
 * @brief AutoZ build configuration, defaults and debug output
 *
 * Naming:
 * - Constants use k prefix: kDefaultZHop, kEndstopOvertravelMm
 * - Global variables use g_ prefix
 */

#ifndef AUTOZ_CONFIG_H
#define AUTOZ_CONFIG_H

#include <cstdint>

// ============================================================================
// Version Information
// ============================================================================

constexpr uint8_t     kVersionMajor  = 0;
constexpr uint8_t     kVersionMinor  = 1;
constexpr uint8_t     kVersionPatch  = 0;
constexpr const char* kVersionString = "0.1.0";

namespace autoz {

// ============================================================================
// [auto_offset_z] Defaults
// ============================================================================

namespace defaults {

constexpr float kTravelSpeed      = 50.0F;   // mm/s XY travel
constexpr float kZHop             = 10.0F;   // mm, absolute Z for all XY travel
constexpr float kZHopSpeed        = 15.0F;   // mm/s
constexpr float kOffsetAdjust     = 0.0F;    // mm, signed manual correction

// Microswitch actuation travel past first contact. Approximate: measured on
// common Omron-style switches, not universal across switch types.
constexpr float kEndstopOvertravelMm = 0.5F;

} // namespace defaults

// ============================================================================
// Config Section / Option Names
// ============================================================================

namespace cfg {

constexpr const char* kSection          = "auto_offset_z";
constexpr const char* kCenterXY         = "center_xy_position";
constexpr const char* kEndstopXY        = "endstop_xy_position";
constexpr const char* kSpeed            = "speed";
constexpr const char* kZHop             = "z_hop";
constexpr const char* kZHopSpeed        = "z_hop_speed";
constexpr const char* kOffsetAdjust     = "offsetadjust";
constexpr const char* kOvertravel       = "endstop_overtravel";

constexpr const char* kStepperX         = "stepper_x";
constexpr const char* kStepperY         = "stepper_y";
constexpr const char* kStepperZ         = "stepper_z";
constexpr const char* kPositionMin      = "position_min";
constexpr const char* kPositionMax      = "position_max";
constexpr const char* kEndstopPin       = "endstop_pin";
constexpr const char* kVirtualEndstop   = "virtual_endstop";

constexpr const char* kBltouch          = "bltouch";
constexpr const char* kProbe            = "probe";
constexpr const char* kXOffset          = "x_offset";
constexpr const char* kYOffset          = "y_offset";

constexpr const char* kQuadGantryLevel  = "quad_gantry_level";
constexpr const char* kZTilt            = "z_tilt";

} // namespace cfg

} // namespace autoz

// ============================================================================
// Debug Macros
// ============================================================================

// Single #ifdef CONFIG_DEBUG bridge sets constexpr bool; all downstream code
// uses if constexpr (compiles away when disabled).
#ifdef CONFIG_DEBUG
inline constexpr bool kDebugEnabled = true;
#else
inline constexpr bool kDebugEnabled = false;
#endif

#include <chrono>
#include <cstdio>

inline unsigned long dbg_time_us() {
    using namespace std::chrono;
    return static_cast<unsigned long>(
        duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count());
}

template<typename... Args>
inline void dbg_print(const char* fmt, Args... args) {
    if constexpr (kDebugEnabled) {
        printf("[%lu] ", dbg_time_us());
        printf(fmt, args...);
        printf("\n");
    }
}

template<typename... Args>
inline void dbg_error(const char* fmt, Args... args) {
    if constexpr (kDebugEnabled) {
        printf("[%lu] ERROR: ", dbg_time_us());
        printf(fmt, args...);
        printf("\n");
    }
}

inline void dbg_state(const char* from, const char* to) {
    if constexpr (kDebugEnabled) {
        printf("[%lu] State: %s -> %s\n", dbg_time_us(), from, to);
    }
}

#define DBG_PRINT(fmt, ...) dbg_print(fmt, ##__VA_ARGS__)
#define DBG_STATE(from, to) dbg_state(from, to)
#define DBG_ERROR(fmt, ...) dbg_error(fmt, ##__VA_ARGS__)

#endif // AUTOZ_CONFIG_H
