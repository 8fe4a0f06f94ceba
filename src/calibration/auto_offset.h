// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 AutoZ Project
/**
 * @file auto_offset.h
 * @brief AUTO_OFFSET_Z: two-point Z offset calibration entry point
 *
 * Checker -> Prober -> Calculator, strictly sequential:
 * 1. Axes homed and gantry leveled (no motion before this passes)
 * 2. Active G-code Z offset saved, then zeroed
 * 3. Endstop and bed probed at hop-height travel
 * 4. finalOffset computed and applied as the new G-code Z offset
 *
 * Any failure after step 2 restores the saved offset, so no partial
 * offset is ever applied. Not re-entrant: a call during a run returns
 * BUSY.
 */

#ifndef AUTOZ_CALIBRATION_AUTO_OFFSET_H
#define AUTOZ_CALIBRATION_AUTO_OFFSET_H

#include <cstddef>

#include "calibration/calibration_types.h"
#include "calibration/dual_point_prober.h"
#include "hal/Machine.h"

namespace autoz {

constexpr size_t kReportBufSize = 256;

class AutoOffsetZ {
public:
    static constexpr const char* kCommandName = "AUTO_OFFSET_Z";
    static constexpr const char* kCommandHelp =
        "Test endstop and bed surface to calculate g-code offset for Z";

    /**
     * @param config Loaded once at startup, must outlive this object
     */
    AutoOffsetZ(const CalibrationConfig& config,
                hal::MotionRuntime& motion,
                hal::ProbeDriver& probe,
                const hal::LevelingState& leveling,
                hal::GcodeOffset& gcodeOffset);

    AutoOffsetZ(const AutoOffsetZ&) = delete;
    AutoOffsetZ& operator=(const AutoOffsetZ&) = delete;

    /**
     * @brief Run the full calibration and apply the result
     *
     * @param result Output: written only on success
     * @param responder Optional progress output ("Probing endstop ...")
     * @return CalStatus with the specific cause on failure; BUSY without
     *         side effects if a collaborator calls back in during a run
     */
    CalStatus run_calibration(CalibrationResult* result, hal::Responder* responder = nullptr);

    /**
     * @brief G-code command handler
     *
     * Progress and the diagnostic report go to respond_info(), the
     * failure cause to respond_error().
     */
    CalStatus cmd_auto_offset_z(hal::Responder& responder);

    /**
     * @brief Result of the last successful run
     *
     * Cleared when a new run starts; stays empty if that run fails.
     */
    bool has_result() const { return m_hasResult; }
    const CalibrationResult& last_result() const { return m_lastResult; }

    const CalibrationConfig& config() const { return m_config; }
    DualPointProber::State prober_state() const { return m_prober.state(); }

    /**
     * @brief Diagnostic block: bed, endstop, diff, manual adjust, total
     * @return snprintf-style length
     */
    static int format_report(const CalibrationResult& result, char* buf, size_t len);

    /**
     * @brief Operator message for a failed run
     */
    static int format_error(const CalStatus& status, LevelingType leveling,
                            char* buf, size_t len);

private:
    CalStatus run_locked(CalibrationResult* result, hal::Responder* responder);
    CalStatus fail(const CalStatus& status, bool restoreOffset, float savedOffset);

    const CalibrationConfig& m_config;
    hal::MotionRuntime& m_motion;
    const hal::LevelingState& m_leveling;
    hal::GcodeOffset& m_gcodeOffset;
    DualPointProber m_prober;

    CalibrationResult m_lastResult;
    bool m_hasResult = false;
    bool m_running = false;     // Set for the whole run, not just the probing
};

} // namespace autoz

#endif // AUTOZ_CALIBRATION_AUTO_OFFSET_H
