// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 AutoZ Project
#include "calibration/dual_point_prober.h"

#include <cmath>

#include "autoz/config.h"

namespace autoz {

// ============================================================================
// State
// ============================================================================

const char* DualPointProber::state_name(State state) {
    switch (state) {
        case State::IDLE:             return "IDLE";
        case State::MOVED_TO_ENDSTOP: return "MOVED_TO_ENDSTOP";
        case State::PROBED_ENDSTOP:   return "PROBED_ENDSTOP";
        case State::MOVED_TO_BED:     return "MOVED_TO_BED";
        case State::PROBED_BED:       return "PROBED_BED";
        case State::DONE:             return "DONE";
        case State::ABORTED:          return "ABORTED";
    }
    return "UNKNOWN";
}

bool DualPointProber::is_active() const {
    return m_running;
}

void DualPointProber::transition(State next) {
    DBG_STATE(state_name(m_state), state_name(next));
    m_state = next;
}

// ============================================================================
// Checks
// ============================================================================

CalStatus DualPointProber::check_targets(const CalibrationConfig& config) const {
    if (!(config.travelSpeed > 0.0F) || !(config.hopSpeed > 0.0F) ||
        !(config.hopHeight > 0.0F) || config.hopHeight > config.envelope.zMax) {
        return CalStatus::fail(CalError::INVALID_CONFIG);
    }

    const Vec2 endstopTarget = config.toolhead_target(config.endstopPosition);
    if (!endstopTarget.is_finite() || !config.envelope.contains_xy(endstopTarget)) {
        DBG_ERROR("[AutoZ] Endstop target %.3f,%.3f outside envelope",
                  static_cast<double>(endstopTarget.x), static_cast<double>(endstopTarget.y));
        return CalStatus::fail(CalError::PROBE_OUT_OF_RANGE, ProbePoint::ENDSTOP);
    }

    const Vec2 bedTarget = config.toolhead_target(config.centerPosition);
    if (!bedTarget.is_finite() || !config.envelope.contains_xy(bedTarget)) {
        DBG_ERROR("[AutoZ] Bed target %.3f,%.3f outside envelope",
                  static_cast<double>(bedTarget.x), static_cast<double>(bedTarget.y));
        return CalStatus::fail(CalError::PROBE_OUT_OF_RANGE, ProbePoint::BED);
    }

    return CalStatus::success();
}

// ============================================================================
// Motion Steps
// ============================================================================

hal::MotionError DualPointProber::hop(const CalibrationConfig& config) {
    return m_motion.move_to(NAN, NAN, config.hopHeight, config.hopSpeed);
}

CalStatus DualPointProber::measure(const CalibrationConfig& config, ProbePoint point,
                                   const Vec2& probeXY, State moved, State probed,
                                   ProbeSample* out) {
    if (m_pointHook != nullptr) {
        m_pointHook(point, m_pointHookCtx);
    }

    const Vec2 target = config.toolhead_target(probeXY);
    const hal::MotionError err = m_motion.move_to(target.x, target.y, NAN, config.travelSpeed);
    if (err != hal::MotionError::NONE) {
        return abort(config, CalStatus::motion_failed(err), true);
    }
    transition(moved);

    float z = 0.0F;
    if (m_probe.probe_at(target, &z) != hal::ProbeStatus::OK) {
        DBG_ERROR("[AutoZ] No trigger at %s", probe_point_name(point));
        return abort(config, CalStatus::fail(CalError::PROBE_NO_TRIGGER, point), true);
    }
    transition(probed);

    out->point = point;
    out->position = probeXY;
    out->z = z;
    DBG_PRINT("[AutoZ] %s z=%.6f", probe_point_name(point), static_cast<double>(z));

    const hal::MotionError hopErr = hop(config);
    if (hopErr != hal::MotionError::NONE) {
        return abort(config, CalStatus::motion_failed(hopErr), false);
    }
    return CalStatus::success();
}

CalStatus DualPointProber::abort(const CalibrationConfig& config, CalStatus status,
                                 bool recoverHop) {
    transition(State::ABORTED);
    if (recoverHop && m_motionIssued) {
        const hal::MotionError err = hop(config);
        if (err != hal::MotionError::NONE) {
            DBG_ERROR("[AutoZ] Recovery hop failed: %s", motion_error_name(err));
            status.recoveryFailed = true;
        }
    }
    m_running = false;
    return status;
}

// ============================================================================
// Sequence
// ============================================================================

CalStatus DualPointProber::probe_two_points(const CalibrationConfig& config,
                                            ProbeSample* endstop, ProbeSample* bed) {
    if (m_running) {
        return CalStatus::fail(CalError::BUSY);
    }
    if (endstop == nullptr || bed == nullptr) {
        return CalStatus::fail(CalError::INVALID_CONFIG);
    }

    m_running = true;
    m_motionIssued = false;
    transition(State::IDLE);

    const CalStatus targets = check_targets(config);
    if (!targets.ok()) {
        return abort(config, targets, false);
    }

    const hal::MotionError err = hop(config);
    if (err != hal::MotionError::NONE) {
        return abort(config, CalStatus::motion_failed(err), false);
    }
    m_motionIssued = true;

    ProbeSample endstopSample;
    CalStatus status = measure(config, ProbePoint::ENDSTOP, config.endstopPosition,
                               State::MOVED_TO_ENDSTOP, State::PROBED_ENDSTOP,
                               &endstopSample);
    if (!status.ok()) {
        return status;
    }

    ProbeSample bedSample;
    status = measure(config, ProbePoint::BED, config.centerPosition,
                     State::MOVED_TO_BED, State::PROBED_BED, &bedSample);
    if (!status.ok()) {
        return status;
    }

    transition(State::DONE);
    m_running = false;
    *endstop = endstopSample;
    *bed = bedSample;
    return CalStatus::success();
}

} // namespace autoz
