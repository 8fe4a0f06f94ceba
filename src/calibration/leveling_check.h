// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 AutoZ Project
#ifndef AUTOZ_CALIBRATION_LEVELING_CHECK_H
#define AUTOZ_CALIBRATION_LEVELING_CHECK_H

// Precondition checks run before any calibration motion.
// Both measured points share a reference plane only once the gantry has
// been leveled in the current session.

#include "calibration/calibration_types.h"
#include "hal/Machine.h"

namespace autoz {

// LEVELING_NOT_APPLIED if the leveling subsystem reports no successful
// QGL / Z_TILT since the last homing or restart. No side effects.
CalStatus verify_leveling_applied(const hal::LevelingState& leveling);

// AXES_NOT_HOMED first, then verify_leveling_applied().
CalStatus verify_preconditions(const hal::MotionRuntime& motion,
                               const hal::LevelingState& leveling);

} // namespace autoz

#endif // AUTOZ_CALIBRATION_LEVELING_CHECK_H
