// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 AutoZ Project
/**
 * @file dual_point_prober.h
 * @brief Endstop + bed probing sequence
 *
 * Runs the fixed move/probe sequence as a single-direction state machine:
 *
 *   IDLE -> MOVED_TO_ENDSTOP -> PROBED_ENDSTOP -> MOVED_TO_BED
 *        -> PROBED_BED -> DONE
 *
 * Any failure goes to ABORTED. All XY travel happens at hop height, and
 * the toolhead is left at hop height on every exit path where motion
 * already occurred. No retries.
 */

#ifndef AUTOZ_CALIBRATION_DUAL_POINT_PROBER_H
#define AUTOZ_CALIBRATION_DUAL_POINT_PROBER_H

#include "calibration/calibration_types.h"
#include "hal/Machine.h"

namespace autoz {

/**
 * @brief Called right before the toolhead travels to a probe point
 *
 * Used by the command layer for progress output.
 */
typedef void (*probe_point_hook_fn)(ProbePoint point, void* ctx);

class DualPointProber {
public:
    enum class State : uint8_t {
        IDLE = 0,
        MOVED_TO_ENDSTOP,
        PROBED_ENDSTOP,
        MOVED_TO_BED,
        PROBED_BED,
        DONE,
        ABORTED
    };

    DualPointProber(hal::MotionRuntime& motion, hal::ProbeDriver& probe)
        : m_motion(motion), m_probe(probe) {}

    // Owns the toolhead for the duration of a run
    DualPointProber(const DualPointProber&) = delete;
    DualPointProber& operator=(const DualPointProber&) = delete;

    /**
     * @brief Probe the endstop, then the bed reference point
     *
     * Both targets are checked against the envelope before any motion.
     * Samples are written only when the whole sequence reaches DONE.
     *
     * @return PROBE_OUT_OF_RANGE / PROBE_NO_TRIGGER with the point,
     *         MOTION_FAILED with the runtime error, BUSY if called while
     *         a sequence is in progress, INVALID_CONFIG for non-positive
     *         speeds or hop height
     */
    CalStatus probe_two_points(const CalibrationConfig& config,
                               ProbeSample* endstop, ProbeSample* bed);

    State state() const { return m_state; }
    bool is_active() const;

    void set_point_hook(probe_point_hook_fn fn, void* ctx) {
        m_pointHook = fn;
        m_pointHookCtx = ctx;
    }

    static const char* state_name(State state);

private:
    void transition(State next);
    CalStatus check_targets(const CalibrationConfig& config) const;
    hal::MotionError hop(const CalibrationConfig& config);
    CalStatus measure(const CalibrationConfig& config, ProbePoint point,
                      const Vec2& probeXY, State moved, State probed,
                      ProbeSample* out);
    CalStatus abort(const CalibrationConfig& config, CalStatus status, bool recoverHop);

    hal::MotionRuntime& m_motion;
    hal::ProbeDriver& m_probe;
    State m_state = State::IDLE;
    bool m_running = false;
    bool m_motionIssued = false;

    probe_point_hook_fn m_pointHook = nullptr;
    void* m_pointHookCtx = nullptr;
};

} // namespace autoz

#endif // AUTOZ_CALIBRATION_DUAL_POINT_PROBER_H
