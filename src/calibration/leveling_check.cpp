// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 AutoZ Project
#include "calibration/leveling_check.h"

#include "autoz/config.h"

namespace autoz {

CalStatus verify_leveling_applied(const hal::LevelingState& leveling) {
    if (!leveling.is_leveling_applied()) {
        DBG_ERROR("[AutoZ] Gantry leveling not applied");
        return CalStatus::fail(CalError::LEVELING_NOT_APPLIED);
    }
    return CalStatus::success();
}

CalStatus verify_preconditions(const hal::MotionRuntime& motion,
                               const hal::LevelingState& leveling) {
    if (!motion.axes_homed()) {
        DBG_ERROR("[AutoZ] Axes not homed");
        return CalStatus::fail(CalError::AXES_NOT_HOMED);
    }
    return verify_leveling_applied(leveling);
}

} // namespace autoz
