// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 AutoZ Project
#include "calibration/offset_calculator.h"

#include <cmath>

#include "autoz/config.h"

namespace autoz {

float offset_from_samples(float z1, float z2, float overtravel, float manualAdjust) {
    return (z2 - z1) + overtravel + manualAdjust;
}

bool sample_is_valid(float z, float zMax) {
    if (!std::isfinite(z) || !std::isfinite(zMax)) {
        return false;
    }
    return z >= -zMax && z <= zMax;
}

CalStatus compute_offset(const ProbeSample& endstop, const ProbeSample& bed,
                         const CalibrationConfig& config, CalibrationResult* result) {
    if (result == nullptr) {
        return CalStatus::fail(CalError::INVALID_SAMPLE);
    }
    if (!sample_is_valid(endstop.z, config.envelope.zMax)) {
        DBG_ERROR("[AutoZ] Endstop sample out of range: %f", static_cast<double>(endstop.z));
        return CalStatus::fail(CalError::INVALID_SAMPLE, ProbePoint::ENDSTOP);
    }
    if (!sample_is_valid(bed.z, config.envelope.zMax)) {
        DBG_ERROR("[AutoZ] Bed sample out of range: %f", static_cast<double>(bed.z));
        return CalStatus::fail(CalError::INVALID_SAMPLE, ProbePoint::BED);
    }
    if (!std::isfinite(config.overtravelConstant) ||
        !std::isfinite(config.manualOffsetAdjustment)) {
        return CalStatus::fail(CalError::INVALID_SAMPLE);
    }

    result->endstop = endstop;
    result->bed = bed;
    result->difference = endstop.z - bed.z;
    result->overtravel = config.overtravelConstant;
    result->manualAdjust = config.manualOffsetAdjustment;
    result->finalOffset = offset_from_samples(endstop.z, bed.z,
                                              config.overtravelConstant,
                                              config.manualOffsetAdjustment);

    DBG_PRINT("[AutoZ] z1=%.6f z2=%.6f offset=%.6f",
              static_cast<double>(endstop.z), static_cast<double>(bed.z),
              static_cast<double>(result->finalOffset));
    return CalStatus::success();
}

} // namespace autoz
