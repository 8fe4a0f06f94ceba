// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 AutoZ Project
/**
 * @file Machine.h
 * @brief Motion-controller collaborator interfaces
 *
 * The calibration core never talks to the printer directly. The host
 * runtime provides concrete implementations of these interfaces:
 * - MotionRuntime: toolhead moves and homing state
 * - ProbeDriver:   single-point probe primitive (deploy/measure/stow)
 * - LevelingState: read-only view of QUAD_GANTRY_LEVEL / Z_TILT status
 * - GcodeOffset:   the active G-code Z offset
 * - Responder:     operator-facing console output
 *
 * All calls block until the underlying command completes or fails.
 */

#ifndef AUTOZ_HAL_MACHINE_H
#define AUTOZ_HAL_MACHINE_H

#include <cstdint>

#include "math/vec2.h"

namespace autoz {
namespace hal {

/**
 * @brief Motion command failure, propagated unchanged by the core
 */
enum class MotionError : uint8_t {
    NONE = 0,
    NOT_HOMED,      // Runtime refused the move: axes lost homing
    OUT_OF_BOUNDS,  // Runtime rejected the target against its own limits
    ABORTED,        // Emergency stop / shutdown during the move
    FAULT           // Any other runtime failure
};

/**
 * @brief Probe primitive outcome
 */
enum class ProbeStatus : uint8_t {
    OK = 0,
    TIMEOUT         // Probe reached max travel without triggering
};

/**
 * @brief Toolhead motion runtime
 */
class MotionRuntime {
public:
    virtual ~MotionRuntime() = default;

    /**
     * @brief Absolute move in machine coordinates
     *
     * Any axis passed as NaN keeps its current position.
     *
     * @param x, y, z Target position (mm) or NaN
     * @param speed Feed rate in mm/s
     * @return MotionError::NONE once the move has completed
     */
    virtual MotionError move_to(float x, float y, float z, float speed) = 0;

    /**
     * @brief Check that X, Y and Z are all homed
     */
    virtual bool axes_homed() const = 0;
};

/**
 * @brief Single-point probe primitive
 */
class ProbeDriver {
public:
    virtual ~ProbeDriver() = default;

    /**
     * @brief Probe downward at the current toolhead XY
     *
     * Deploy, descend, stow are handled by the driver.
     *
     * @param toolheadXY Current toolhead XY (for driver diagnostics)
     * @param zOut Output: Z at which the probe triggered
     * @return ProbeStatus::OK on trigger
     */
    virtual ProbeStatus probe_at(const Vec2& toolheadXY, float* zOut) = 0;
};

/**
 * @brief Read capability for the gantry leveling subsystem
 *
 * Set true by the leveling subsystem on success, reset on homing or
 * restart. The core only reads it.
 */
class LevelingState {
public:
    virtual ~LevelingState() = default;
    virtual bool is_leveling_applied() const = 0;
};

/**
 * @brief Active G-code Z offset (SET_GCODE_OFFSET Z=...)
 */
class GcodeOffset {
public:
    virtual ~GcodeOffset() = default;
    virtual float z_offset() const = 0;
    virtual void set_z_offset(float z) = 0;
};

/**
 * @brief Operator console output for a running command
 */
class Responder {
public:
    virtual ~Responder() = default;
    virtual void respond_info(const char* msg) = 0;
    virtual void respond_error(const char* msg) = 0;
};

} // namespace hal
} // namespace autoz

#endif // AUTOZ_HAL_MACHINE_H
