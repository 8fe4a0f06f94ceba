// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 AutoZ Project
#include "calibration/calibration_config.h"

#include <string>

#include "autoz/config.h"

namespace autoz {

// Klipper default for stepper position_min
constexpr float kDefaultPositionMin = 0.0F;

// ============================================================================
// Section Loaders
// ============================================================================

static bool load_envelope(const PrinterConfig& printer, TravelEnvelope* env,
                          ConfigStatus* status) {
    if (!printer.get_float_or(cfg::kStepperX, cfg::kPositionMin, kDefaultPositionMin,
                              &env->xMin, status) ||
        !printer.get_float(cfg::kStepperX, cfg::kPositionMax, &env->xMax, status) ||
        !printer.get_float_or(cfg::kStepperY, cfg::kPositionMin, kDefaultPositionMin,
                              &env->yMin, status) ||
        !printer.get_float(cfg::kStepperY, cfg::kPositionMax, &env->yMax, status) ||
        !printer.get_float(cfg::kStepperZ, cfg::kPositionMax, &env->zMax, status)) {
        return false;
    }
    return true;
}

static bool load_probe(const PrinterConfig& printer, Vec2* offset, ConfigStatus* status) {
    const char* section = nullptr;
    if (printer.has_section(cfg::kBltouch)) {
        section = cfg::kBltouch;
    } else if (printer.has_section(cfg::kProbe)) {
        section = cfg::kProbe;
    } else {
        return config_fail(status, ConfigError::NO_PROBE,
                           "AutoOffsetZ: No bltouch or probe configured in your system - check your setup.");
    }

    if (!printer.get_float_or(section, cfg::kXOffset, 0.0F, &offset->x, status) ||
        !printer.get_float_or(section, cfg::kYOffset, 0.0F, &offset->y, status)) {
        return false;
    }
    if (offset->is_zero()) {
        return config_fail(status, ConfigError::PROBE_OFFSET_ZERO,
                           "AutoOffsetZ: Check the x and y offset from [%s] - both are zero "
                           "and the probe can't be at the same position as the nozzle.",
                           section);
    }

    std::string endstopPin;
    if (!printer.get_string(cfg::kStepperZ, cfg::kEndstopPin, &endstopPin, status)) {
        return false;
    }
    if (endstopPin.find(cfg::kVirtualEndstop) != std::string::npos) {
        return config_fail(status, ConfigError::PROBE_IS_Z_ENDSTOP,
                           "AutoOffsetZ: [%s] can't be used as z endstop - use a physical endstop instead.",
                           section);
    }
    return true;
}

static bool load_leveling(const PrinterConfig& printer, LevelingType* type,
                          ConfigStatus* status) {
    if (printer.has_section(cfg::kQuadGantryLevel)) {
        *type = LevelingType::QUAD_GANTRY_LEVEL;
    } else if (printer.has_section(cfg::kZTilt)) {
        *type = LevelingType::Z_TILT;
    } else {
        return config_fail(status, ConfigError::NO_LEVELING,
                           "AutoOffsetZ: This can only be used if your config contains a section "
                           "[quad_gantry_level] or [z_tilt].");
    }
    return true;
}

// ============================================================================
// Public API
// ============================================================================

bool validate_calibration_config(const CalibrationConfig& config, ConfigStatus* status) {
    if (!(config.travelSpeed > 0.0F)) {
        return config_fail(status, ConfigError::NOT_ABOVE_MINIMUM,
                           "Option '%s' in section '%s' must be above 0", cfg::kSpeed, cfg::kSection);
    }
    if (!(config.hopHeight > 0.0F)) {
        return config_fail(status, ConfigError::NOT_ABOVE_MINIMUM,
                           "Option '%s' in section '%s' must be above 0", cfg::kZHop, cfg::kSection);
    }
    if (!(config.hopSpeed > 0.0F)) {
        return config_fail(status, ConfigError::NOT_ABOVE_MINIMUM,
                           "Option '%s' in section '%s' must be above 0", cfg::kZHopSpeed, cfg::kSection);
    }
    if (config.hopHeight > config.envelope.zMax) {
        return config_fail(status, ConfigError::POSITION_OUT_OF_RANGE,
                           "AutoOffsetZ: z_hop %.3f exceeds stepper_z position_max %.3f",
                           static_cast<double>(config.hopHeight),
                           static_cast<double>(config.envelope.zMax));
    }

    const Vec2 endstop = config.toolhead_target(config.endstopPosition);
    if (!config.envelope.contains_xy(endstop)) {
        return config_fail(status, ConfigError::POSITION_OUT_OF_RANGE,
                           "AutoOffsetZ: endstop_xy_position needs toolhead at %.3f, %.3f - outside travel range",
                           static_cast<double>(endstop.x), static_cast<double>(endstop.y));
    }
    const Vec2 center = config.toolhead_target(config.centerPosition);
    if (!config.envelope.contains_xy(center)) {
        return config_fail(status, ConfigError::POSITION_OUT_OF_RANGE,
                           "AutoOffsetZ: center_xy_position needs toolhead at %.3f, %.3f - outside travel range",
                           static_cast<double>(center.x), static_cast<double>(center.y));
    }
    return true;
}

bool load_calibration_config(const PrinterConfig& printer, CalibrationConfig* out,
                             ConfigStatus* status) {
    if (out == nullptr) {
        return false;
    }
    if (!printer.has_section(cfg::kSection)) {
        return config_fail(status, ConfigError::MISSING_SECTION,
                           "Section '%s' not found", cfg::kSection);
    }

    CalibrationConfig config;
    float xy[2] = {};

    if (!printer.get_float_list(cfg::kSection, cfg::kCenterXY, 2, xy, status)) {
        return false;
    }
    config.centerPosition = Vec2(xy[0], xy[1]);

    if (!printer.get_float_list(cfg::kSection, cfg::kEndstopXY, 2, xy, status)) {
        return false;
    }
    config.endstopPosition = Vec2(xy[0], xy[1]);

    if (!printer.get_float_above(cfg::kSection, cfg::kZHop, defaults::kZHop, 0.0F,
                                 &config.hopHeight, status) ||
        !printer.get_float_above(cfg::kSection, cfg::kZHopSpeed, defaults::kZHopSpeed, 0.0F,
                                 &config.hopSpeed, status) ||
        !printer.get_float_above(cfg::kSection, cfg::kSpeed, defaults::kTravelSpeed, 0.0F,
                                 &config.travelSpeed, status) ||
        !printer.get_float_or(cfg::kSection, cfg::kOffsetAdjust, defaults::kOffsetAdjust,
                              &config.manualOffsetAdjustment, status) ||
        !printer.get_float_or(cfg::kSection, cfg::kOvertravel, defaults::kEndstopOvertravelMm,
                              &config.overtravelConstant, status)) {
        return false;
    }

    if (!load_envelope(printer, &config.envelope, status) ||
        !load_probe(printer, &config.probeOffset, status) ||
        !load_leveling(printer, &config.leveling, status) ||
        !validate_calibration_config(config, status)) {
        return false;
    }

    DBG_PRINT("[AutoZ] Config: endstop %.2f,%.2f center %.2f,%.2f probe offset %.2f,%.2f leveling %s",
              static_cast<double>(config.endstopPosition.x), static_cast<double>(config.endstopPosition.y),
              static_cast<double>(config.centerPosition.x), static_cast<double>(config.centerPosition.y),
              static_cast<double>(config.probeOffset.x), static_cast<double>(config.probeOffset.y),
              leveling_type_name(config.leveling));

    *out = config;
    return true;
}

} // namespace autoz
