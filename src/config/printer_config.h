// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 AutoZ Project
/**
 * @file printer_config.h
 * @brief printer.cfg reader
 *
 * Parses the section/option text format used by the motion-controller
 * host:
 *
 * @code
 * [auto_offset_z]
 * center_xy_position: 150, 150   # comment
 * z_hop = 10
 * @endcode
 *
 * - Option separator is ':' or '='
 * - '#' and ';' start a comment (whole line, or inline after whitespace)
 * - Indented lines continue the previous option's value
 * - Section and option names are case-insensitive
 * - A repeated section merges; a repeated option overrides
 */

#ifndef AUTOZ_CONFIG_PRINTER_CONFIG_H
#define AUTOZ_CONFIG_PRINTER_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace autoz {

enum class ConfigError : uint8_t {
    NONE = 0,
    FILE_ERROR,             // Cannot open config file
    PARSE_ERROR,            // Malformed line
    MISSING_SECTION,
    MISSING_OPTION,
    INVALID_VALUE,          // Not a number / wrong list length
    NOT_ABOVE_MINIMUM,      // Value must be above a bound
    NO_PROBE,               // Neither [bltouch] nor [probe]
    PROBE_OFFSET_ZERO,      // Probe x/y offset both zero
    PROBE_IS_Z_ENDSTOP,     // stepper_z endstop is the probe's virtual endstop
    NO_LEVELING,            // Neither [quad_gantry_level] nor [z_tilt]
    POSITION_OUT_OF_RANGE   // Probe target outside the travel envelope
};

const char* config_error_name(ConfigError error);

constexpr size_t kConfigMessageLen = 192;

/**
 * @brief Error code plus operator-facing message
 */
struct ConfigStatus {
    ConfigError error = ConfigError::NONE;
    char message[kConfigMessageLen] = {};

    bool ok() const { return error == ConfigError::NONE; }
};

class PrinterConfig {
public:
    PrinterConfig() = default;

    /**
     * @brief Parse config text, merging into any already-loaded sections
     * @return PARSE_ERROR with line number in status->message on failure
     */
    bool parse(const std::string& text, ConfigStatus* status);

    /**
     * @brief Read and parse a file
     */
    bool load_file(const char* path, ConfigStatus* status);

    bool has_section(const char* section) const;
    bool has_option(const char* section, const char* option) const;

    /**
     * @brief Raw option value, or nullptr when absent
     */
    const std::string* get(const char* section, const char* option) const;

    // Typed getters. Each fills status (with "Option 'x' in section 'y' ..."
    // wording) and returns false on failure. *_or variants return the
    // default when the option is absent.
    bool get_float(const char* section, const char* option,
                   float* out, ConfigStatus* status) const;
    bool get_float_or(const char* section, const char* option, float defaultValue,
                      float* out, ConfigStatus* status) const;
    bool get_float_above(const char* section, const char* option, float defaultValue,
                         float above, float* out, ConfigStatus* status) const;
    bool get_float_list(const char* section, const char* option, size_t count,
                        float* out, ConfigStatus* status) const;
    bool get_string(const char* section, const char* option,
                    std::string* out, ConfigStatus* status) const;

    size_t section_count() const { return m_sections.size(); }

private:
    using Section = std::map<std::string, std::string>;

    const Section* find_section(const char* section) const;

    std::map<std::string, Section> m_sections;
};

// Fill status with a formatted message. Returns false for call-site brevity.
bool config_fail(ConfigStatus* status, ConfigError error, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

} // namespace autoz

#endif // AUTOZ_CONFIG_PRINTER_CONFIG_H
