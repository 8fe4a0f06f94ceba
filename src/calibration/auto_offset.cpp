// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 AutoZ Project
#include "calibration/auto_offset.h"

#include <cstdio>

#include "autoz/config.h"
#include "calibration/leveling_check.h"
#include "calibration/offset_calculator.h"

namespace autoz {

// ============================================================================
// Progress Output
// ============================================================================

static void announce_point(ProbePoint point, void* ctx) {
    hal::Responder* responder = static_cast<hal::Responder*>(ctx);
    if (responder == nullptr) {
        return;
    }
    if (point == ProbePoint::ENDSTOP) {
        responder->respond_info("AutoOffsetZ: Probing endstop ...");
    } else if (point == ProbePoint::BED) {
        responder->respond_info("AutoOffsetZ: Probing bed ...");
    }
}

// ============================================================================
// Construction
// ============================================================================

AutoOffsetZ::AutoOffsetZ(const CalibrationConfig& config,
                         hal::MotionRuntime& motion,
                         hal::ProbeDriver& probe,
                         const hal::LevelingState& leveling,
                         hal::GcodeOffset& gcodeOffset)
    : m_config(config),
      m_motion(motion),
      m_leveling(leveling),
      m_gcodeOffset(gcodeOffset),
      m_prober(motion, probe) {}

// ============================================================================
// Calibration Run
// ============================================================================

CalStatus AutoOffsetZ::fail(const CalStatus& status, bool restoreOffset, float savedOffset) {
    if (restoreOffset) {
        m_gcodeOffset.set_z_offset(savedOffset);
    }
    DBG_ERROR("[AutoZ] Calibration aborted: %s (%s)", cal_error_name(status.error),
              probe_point_name(status.point));
    return status;
}

CalStatus AutoOffsetZ::run_calibration(CalibrationResult* result, hal::Responder* responder) {
    if (m_running || m_prober.is_active()) {
        DBG_ERROR("[AutoZ] Calibration already in progress");
        return CalStatus::fail(CalError::BUSY);
    }
    m_running = true;
    const CalStatus status = run_locked(result, responder);
    m_running = false;
    return status;
}

CalStatus AutoOffsetZ::run_locked(CalibrationResult* result, hal::Responder* responder) {
    m_hasResult = false;

    const CalStatus pre = verify_preconditions(m_motion, m_leveling);
    if (!pre.ok()) {
        return fail(pre, false, 0.0F);
    }

    // Probe in raw machine Z: any active offset would shift both samples
    const float savedOffset = m_gcodeOffset.z_offset();
    m_gcodeOffset.set_z_offset(0.0F);

    m_prober.set_point_hook(responder != nullptr ? announce_point : nullptr, responder);

    ProbeSample endstop;
    ProbeSample bed;
    const CalStatus probed = m_prober.probe_two_points(m_config, &endstop, &bed);
    m_prober.set_point_hook(nullptr, nullptr);
    if (!probed.ok()) {
        return fail(probed, true, savedOffset);
    }

    CalibrationResult computed;
    const CalStatus calc = compute_offset(endstop, bed, m_config, &computed);
    if (!calc.ok()) {
        return fail(calc, true, savedOffset);
    }

    m_gcodeOffset.set_z_offset(computed.finalOffset);
    m_lastResult = computed;
    m_hasResult = true;
    if (result != nullptr) {
        *result = computed;
    }

    DBG_PRINT("[AutoZ] Applied Z offset %.6f", static_cast<double>(computed.finalOffset));
    return CalStatus::success();
}

CalStatus AutoOffsetZ::cmd_auto_offset_z(hal::Responder& responder) {
    char buf[kReportBufSize];
    CalibrationResult result;

    const CalStatus status = run_calibration(&result, &responder);
    if (!status.ok()) {
        format_error(status, m_config.leveling, buf, sizeof(buf));
        responder.respond_error(buf);
        return status;
    }

    format_report(result, buf, sizeof(buf));
    responder.respond_info(buf);
    return status;
}

// ============================================================================
// Formatting
// ============================================================================

int AutoOffsetZ::format_report(const CalibrationResult& result, char* buf, size_t len) {
    return snprintf(buf, len,
                    "AutoOffsetZ:\n"
                    "Bed: %.6f\n"
                    "Endstop: %.6f\n"
                    "Diff: %.6f\n"
                    "Manual Adjust: %.6f\n"
                    "Total Calculated Offset: %.6f",
                    static_cast<double>(result.bed.z),
                    static_cast<double>(result.endstop.z),
                    static_cast<double>(result.difference),
                    static_cast<double>(result.manualAdjust),
                    static_cast<double>(result.finalOffset));
}

static int format_cause(const CalStatus& status, LevelingType leveling,
                        char* buf, size_t len) {
    switch (status.error) {
        case CalError::NONE:
            return snprintf(buf, len, "AutoOffsetZ: OK");
        case CalError::BUSY:
            return snprintf(buf, len, "AutoOffsetZ: Calibration already in progress");
        case CalError::INVALID_CONFIG:
            return snprintf(buf, len, "AutoOffsetZ: Invalid speed or z_hop configuration");
        case CalError::AXES_NOT_HOMED:
            return snprintf(buf, len, "You must home X, Y and Z axes first");
        case CalError::LEVELING_NOT_APPLIED:
            if (leveling == LevelingType::QUAD_GANTRY_LEVEL) {
                return snprintf(buf, len, "AutoOffsetZ: You have to do a quad gantry level first");
            }
            if (leveling == LevelingType::Z_TILT) {
                return snprintf(buf, len, "AutoOffsetZ: You have to do a z tilt first");
            }
            return snprintf(buf, len, "AutoOffsetZ: Gantry leveling has not been applied");
        case CalError::PROBE_NO_TRIGGER:
            return snprintf(buf, len, "AutoOffsetZ: Probe did not trigger at %s position",
                            probe_point_name(status.point));
        case CalError::PROBE_OUT_OF_RANGE:
            return snprintf(buf, len, "AutoOffsetZ: %s position is outside the travel range",
                            probe_point_name(status.point));
        case CalError::MOTION_FAILED:
            return snprintf(buf, len, "AutoOffsetZ: Move failed (%s)",
                            motion_error_name(status.motion));
        case CalError::INVALID_SAMPLE:
            return snprintf(buf, len, "AutoOffsetZ: Invalid %s probe sample",
                            probe_point_name(status.point));
    }
    return snprintf(buf, len, "AutoOffsetZ: Unknown error");
}

int AutoOffsetZ::format_error(const CalStatus& status, LevelingType leveling,
                              char* buf, size_t len) {
    const int n = format_cause(status, leveling, buf, len);
    if (!status.recoveryFailed || n < 0) {
        return n;
    }
    const size_t used = static_cast<size_t>(n) < len ? static_cast<size_t>(n) : len;
    const int tail = snprintf(buf + used, len - used,
                              " - toolhead could not be raised, check Z before moving");
    return tail < 0 ? tail : n + tail;
}

} // namespace autoz
