// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 AutoZ Project
/**
 * @file calibration_types.h
 * @brief Data model for the two-point Z offset calibration
 *
 * CalibrationConfig is built once at startup by the config loader and
 * handed to the core by const reference. ProbeSample and
 * CalibrationResult live only inside a single calibration run.
 */

#ifndef AUTOZ_CALIBRATION_TYPES_H
#define AUTOZ_CALIBRATION_TYPES_H

#include <cstdint>

#include "autoz/config.h"
#include "hal/Machine.h"
#include "math/vec2.h"

namespace autoz {

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Gantry leveling subsystem present in the printer config
 */
enum class LevelingType : uint8_t {
    NONE = 0,
    QUAD_GANTRY_LEVEL,
    Z_TILT
};

/**
 * @brief Machine travel limits in toolhead coordinates (mm)
 */
struct TravelEnvelope {
    float xMin{0.0f};
    float xMax{0.0f};
    float yMin{0.0f};
    float yMax{0.0f};
    float zMax{0.0f};

    bool contains_xy(const Vec2& p) const {
        return p.x >= xMin && p.x <= xMax && p.y >= yMin && p.y <= yMax;
    }
};

/**
 * @brief [auto_offset_z] settings plus the machine facts they depend on
 *
 * Positions are where the probe tip must land; the toolhead is moved to
 * position - probeOffset.
 */
struct CalibrationConfig {
    Vec2 centerPosition;                 ///< Bed reference point
    Vec2 endstopPosition;                ///< Z endstop pin
    Vec2 probeOffset;                    ///< Probe tip relative to nozzle
    float travelSpeed = defaults::kTravelSpeed;
    float hopHeight = defaults::kZHop;
    float hopSpeed = defaults::kZHopSpeed;
    float manualOffsetAdjustment = defaults::kOffsetAdjust;
    float overtravelConstant = defaults::kEndstopOvertravelMm;
    TravelEnvelope envelope;
    LevelingType leveling = LevelingType::NONE;

    Vec2 toolhead_target(const Vec2& probePoint) const { return probePoint - probeOffset; }
};

// ============================================================================
// Samples and Result
// ============================================================================

enum class ProbePoint : uint8_t {
    NONE = 0,
    ENDSTOP,
    BED
};

struct ProbeSample {
    ProbePoint point = ProbePoint::NONE;
    Vec2 position;                       ///< Probe tip XY
    float z{0.0f};                       ///< Trigger Z
};

/**
 * @brief Outcome of one successful calibration run
 *
 * finalOffset = (bed.z - endstop.z) + overtravel + manualAdjust
 * Negative moves the nozzle closer to the bed (babystepping convention).
 */
struct CalibrationResult {
    ProbeSample endstop;
    ProbeSample bed;
    float difference{0.0f};              ///< endstop.z - bed.z, as reported
    float overtravel{0.0f};
    float manualAdjust{0.0f};
    float finalOffset{0.0f};
};

// ============================================================================
// Errors
// ============================================================================

enum class CalError : uint8_t {
    NONE = 0,
    BUSY,                   // A run already owns the toolhead
    INVALID_CONFIG,         // Non-positive speed or hop height at call time
    AXES_NOT_HOMED,         // X, Y or Z not homed
    LEVELING_NOT_APPLIED,   // QGL / Z_TILT not run this session
    PROBE_NO_TRIGGER,       // Probe timed out at `point`
    PROBE_OUT_OF_RANGE,     // Target for `point` outside the envelope
    MOTION_FAILED,          // Runtime move failed, see `motion`
    INVALID_SAMPLE          // NaN or physically impossible measurement
};

/**
 * @brief Error plus the context needed to act on it
 */
struct CalStatus {
    CalError error = CalError::NONE;
    ProbePoint point = ProbePoint::NONE;
    hal::MotionError motion = hal::MotionError::NONE;
    bool recoveryFailed = false;         ///< Toolhead may be below hop height

    bool ok() const { return error == CalError::NONE; }

    static CalStatus success() { return CalStatus{}; }
    static CalStatus fail(CalError e, ProbePoint p = ProbePoint::NONE) {
        CalStatus s;
        s.error = e;
        s.point = p;
        return s;
    }
    static CalStatus motion_failed(hal::MotionError m) {
        CalStatus s;
        s.error = CalError::MOTION_FAILED;
        s.motion = m;
        return s;
    }
};

const char* cal_error_name(CalError error);
const char* probe_point_name(ProbePoint point);
const char* motion_error_name(hal::MotionError error);
const char* leveling_type_name(LevelingType type);

} // namespace autoz

#endif // AUTOZ_CALIBRATION_TYPES_H
