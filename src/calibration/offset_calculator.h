// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 AutoZ Project
#ifndef AUTOZ_CALIBRATION_OFFSET_CALCULATOR_H
#define AUTOZ_CALIBRATION_OFFSET_CALCULATOR_H

// Offset Calculator: endstop/bed samples -> G-code Z offset.
// Pure C++, no side effects.
//
// Physical model: a switch endstop only registers after the nozzle has
// pushed the plunger by its actuation travel (overtravel). The endstop
// sample z1 is therefore taken past the true datum, while the bed sample
// z2 is direct surface contact. The corrected offset is
//
//   finalOffset = (z2 - z1) + overtravel + manualAdjust
//
// manualAdjust absorbs switch-to-switch variance beyond the nominal
// overtravel. Sign: negative = nozzle closer to the bed, the same as
// babystepping down.

#include "calibration/calibration_types.h"

namespace autoz {

// The bare formula. Exact, no validation.
float offset_from_samples(float z1, float z2, float overtravel, float manualAdjust);

// True if z is finite and inside [-zMax, zMax].
bool sample_is_valid(float z, float zMax);

// Validate both samples and the two config terms, then fill result.
// INVALID_SAMPLE (with the offending point) leaves result untouched.
CalStatus compute_offset(const ProbeSample& endstop, const ProbeSample& bed,
                         const CalibrationConfig& config, CalibrationResult* result);

} // namespace autoz

#endif // AUTOZ_CALIBRATION_OFFSET_CALCULATOR_H
