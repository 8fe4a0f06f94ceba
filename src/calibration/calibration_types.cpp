// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 AutoZ Project
#include "calibration/calibration_types.h"

namespace autoz {

const char* cal_error_name(CalError error) {
    switch (error) {
        case CalError::NONE:                 return "NONE";
        case CalError::BUSY:                 return "BUSY";
        case CalError::INVALID_CONFIG:       return "INVALID_CONFIG";
        case CalError::AXES_NOT_HOMED:       return "AXES_NOT_HOMED";
        case CalError::LEVELING_NOT_APPLIED: return "LEVELING_NOT_APPLIED";
        case CalError::PROBE_NO_TRIGGER:     return "PROBE_NO_TRIGGER";
        case CalError::PROBE_OUT_OF_RANGE:   return "PROBE_OUT_OF_RANGE";
        case CalError::MOTION_FAILED:        return "MOTION_FAILED";
        case CalError::INVALID_SAMPLE:       return "INVALID_SAMPLE";
    }
    return "UNKNOWN";
}

const char* probe_point_name(ProbePoint point) {
    switch (point) {
        case ProbePoint::NONE:    return "none";
        case ProbePoint::ENDSTOP: return "endstop";
        case ProbePoint::BED:     return "bed";
    }
    return "unknown";
}

const char* motion_error_name(hal::MotionError error) {
    switch (error) {
        case hal::MotionError::NONE:          return "none";
        case hal::MotionError::NOT_HOMED:     return "not homed";
        case hal::MotionError::OUT_OF_BOUNDS: return "out of bounds";
        case hal::MotionError::ABORTED:       return "aborted";
        case hal::MotionError::FAULT:         return "fault";
    }
    return "unknown";
}

const char* leveling_type_name(LevelingType type) {
    switch (type) {
        case LevelingType::NONE:              return "none";
        case LevelingType::QUAD_GANTRY_LEVEL: return "quad gantry level";
        case LevelingType::Z_TILT:            return "z tilt";
    }
    return "unknown";
}

} // namespace autoz
