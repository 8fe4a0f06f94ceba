// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 AutoZ Project
/**
 * @file calibration_config.h
 * @brief Build and validate CalibrationConfig from printer.cfg
 *
 * Reads [auto_offset_z] plus the sections it depends on:
 * - [stepper_x], [stepper_y], [stepper_z]: travel envelope, Z endstop pin
 * - [bltouch] or [probe]: probe XY offset from the nozzle
 * - [quad_gantry_level] or [z_tilt]: leveling type
 *
 * Rejects setups the two-point method cannot work with: no probe, probe
 * mounted at the nozzle, probe used as the Z endstop, no gantry leveling.
 */

#ifndef AUTOZ_CALIBRATION_CALIBRATION_CONFIG_H
#define AUTOZ_CALIBRATION_CALIBRATION_CONFIG_H

#include "calibration/calibration_types.h"
#include "config/printer_config.h"

namespace autoz {

/**
 * @brief Load [auto_offset_z] and dependent sections
 * @param printer Parsed printer config
 * @param out Output: fully validated calibration config
 * @param status Output: first error found, with message
 * @return true on success; out is untouched on failure
 */
bool load_calibration_config(const PrinterConfig& printer, CalibrationConfig* out,
                             ConfigStatus* status);

/**
 * @brief Re-check a config against its own invariants
 *
 * Speeds and hop height positive, hop below Z max, both toolhead targets
 * inside the envelope. Also used at load time.
 */
bool validate_calibration_config(const CalibrationConfig& config, ConfigStatus* status);

} // namespace autoz

#endif // AUTOZ_CALIBRATION_CALIBRATION_CONFIG_H
