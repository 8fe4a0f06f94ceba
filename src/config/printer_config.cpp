// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 AutoZ Project
#include "config/printer_config.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdarg>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

#include "autoz/config.h"

namespace autoz {

// ============================================================================
// Helpers
// ============================================================================

static std::string trim(const std::string& s) {
    size_t begin = 0;
    while (begin < s.size() && isspace(static_cast<unsigned char>(s[begin])) != 0) {
        ++begin;
    }
    size_t end = s.size();
    while (end > begin && isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return s.substr(begin, end - begin);
}

static std::string to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

// '#' or ';' at column 0, or preceded by whitespace, starts a comment
static std::string strip_comment(const std::string& line) {
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] != '#' && line[i] != ';') {
            continue;
        }
        if (i == 0 || isspace(static_cast<unsigned char>(line[i - 1])) != 0) {
            return line.substr(0, i);
        }
    }
    return line;
}

// Always '.' as decimal point, whatever LC_NUMERIC says
static bool parse_number(const std::string& text, float* out) {
    std::string s = trim(text);
    if (!s.empty() && s.front() == '+') {
        s.erase(0, 1);
        if (!s.empty() && s.front() == '-') {
            return false;
        }
    }
    if (s.empty()) {
        return false;
    }
    float v = 0.0F;
    const char* last = s.data() + s.size();
    const std::from_chars_result r = std::from_chars(s.data(), last, v);
    if (r.ec != std::errc() || r.ptr != last || !std::isfinite(v)) {
        return false;
    }
    *out = v;
    return true;
}

bool config_fail(ConfigStatus* status, ConfigError error, const char* fmt, ...) {
    if (status != nullptr) {
        status->error = error;
        va_list args;
        va_start(args, fmt);
        vsnprintf(status->message, sizeof(status->message), fmt, args);
        va_end(args);
        DBG_ERROR("[Config] %s", status->message);
    }
    return false;
}

const char* config_error_name(ConfigError error) {
    switch (error) {
        case ConfigError::NONE:                  return "NONE";
        case ConfigError::FILE_ERROR:            return "FILE_ERROR";
        case ConfigError::PARSE_ERROR:           return "PARSE_ERROR";
        case ConfigError::MISSING_SECTION:       return "MISSING_SECTION";
        case ConfigError::MISSING_OPTION:        return "MISSING_OPTION";
        case ConfigError::INVALID_VALUE:         return "INVALID_VALUE";
        case ConfigError::NOT_ABOVE_MINIMUM:     return "NOT_ABOVE_MINIMUM";
        case ConfigError::NO_PROBE:              return "NO_PROBE";
        case ConfigError::PROBE_OFFSET_ZERO:     return "PROBE_OFFSET_ZERO";
        case ConfigError::PROBE_IS_Z_ENDSTOP:    return "PROBE_IS_Z_ENDSTOP";
        case ConfigError::NO_LEVELING:           return "NO_LEVELING";
        case ConfigError::POSITION_OUT_OF_RANGE: return "POSITION_OUT_OF_RANGE";
    }
    return "UNKNOWN";
}

// ============================================================================
// Parsing
// ============================================================================

bool PrinterConfig::parse(const std::string& text, ConfigStatus* status) {
    std::string section;
    std::string lastOption;
    uint32_t lineNo = 0;

    size_t pos = 0;
    while (pos <= text.size()) {
        size_t eol = text.find('\n', pos);
        if (eol == std::string::npos) {
            eol = text.size();
        }
        std::string line = text.substr(pos, eol - pos);
        pos = eol + 1;
        ++lineNo;

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        const std::string content = trim(strip_comment(line));
        if (content.empty()) {
            continue;
        }

        // Indented line continues the previous option
        const bool indented = isspace(static_cast<unsigned char>(line[0])) != 0;
        if (indented && !lastOption.empty()) {
            std::string& value = m_sections[section][lastOption];
            value += value.empty() ? content : "\n" + content;
            continue;
        }

        if (content.front() == '[') {
            if (content.back() != ']') {
                return config_fail(status, ConfigError::PARSE_ERROR,
                                   "Line %u: unterminated section header", lineNo);
            }
            section = to_lower(trim(content.substr(1, content.size() - 2)));
            if (section.empty()) {
                return config_fail(status, ConfigError::PARSE_ERROR,
                                   "Line %u: empty section name", lineNo);
            }
            m_sections[section];
            lastOption.clear();
            continue;
        }

        if (section.empty()) {
            return config_fail(status, ConfigError::PARSE_ERROR,
                               "Line %u: option outside of a section", lineNo);
        }

        const size_t sep = content.find_first_of(":=");
        if (sep == std::string::npos) {
            return config_fail(status, ConfigError::PARSE_ERROR,
                               "Line %u: expected 'option: value'", lineNo);
        }
        const std::string key = to_lower(trim(content.substr(0, sep)));
        if (key.empty()) {
            return config_fail(status, ConfigError::PARSE_ERROR,
                               "Line %u: missing option name", lineNo);
        }
        m_sections[section][key] = trim(content.substr(sep + 1));
        lastOption = key;
    }

    DBG_PRINT("[Config] Parsed %u lines, %u sections", lineNo,
              static_cast<unsigned>(m_sections.size()));
    return true;
}

bool PrinterConfig::load_file(const char* path, ConfigStatus* status) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return config_fail(status, ConfigError::FILE_ERROR,
                           "Unable to open config file %s", path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), status);
}

// ============================================================================
// Lookup
// ============================================================================

const PrinterConfig::Section* PrinterConfig::find_section(const char* section) const {
    const auto it = m_sections.find(to_lower(section));
    return it == m_sections.end() ? nullptr : &it->second;
}

bool PrinterConfig::has_section(const char* section) const {
    return find_section(section) != nullptr;
}

bool PrinterConfig::has_option(const char* section, const char* option) const {
    return get(section, option) != nullptr;
}

const std::string* PrinterConfig::get(const char* section, const char* option) const {
    const Section* s = find_section(section);
    if (s == nullptr) {
        return nullptr;
    }
    const auto it = s->find(to_lower(option));
    return it == s->end() ? nullptr : &it->second;
}

bool PrinterConfig::get_string(const char* section, const char* option,
                               std::string* out, ConfigStatus* status) const {
    if (!has_section(section)) {
        return config_fail(status, ConfigError::MISSING_SECTION,
                           "Section '%s' not found", section);
    }
    const std::string* value = get(section, option);
    if (value == nullptr) {
        return config_fail(status, ConfigError::MISSING_OPTION,
                           "Option '%s' in section '%s' must be specified", option, section);
    }
    *out = *value;
    return true;
}

bool PrinterConfig::get_float(const char* section, const char* option,
                              float* out, ConfigStatus* status) const {
    std::string raw;
    if (!get_string(section, option, &raw, status)) {
        return false;
    }
    if (!parse_number(raw, out)) {
        return config_fail(status, ConfigError::INVALID_VALUE,
                           "Unable to parse option '%s' in section '%s'", option, section);
    }
    return true;
}

bool PrinterConfig::get_float_or(const char* section, const char* option, float defaultValue,
                                 float* out, ConfigStatus* status) const {
    if (get(section, option) == nullptr) {
        *out = defaultValue;
        return true;
    }
    return get_float(section, option, out, status);
}

bool PrinterConfig::get_float_above(const char* section, const char* option, float defaultValue,
                                    float above, float* out, ConfigStatus* status) const {
    float value = 0.0F;
    if (!get_float_or(section, option, defaultValue, &value, status)) {
        return false;
    }
    if (!(value > above)) {
        return config_fail(status, ConfigError::NOT_ABOVE_MINIMUM,
                           "Option '%s' in section '%s' must be above %f",
                           option, section, static_cast<double>(above));
    }
    *out = value;
    return true;
}

bool PrinterConfig::get_float_list(const char* section, const char* option, size_t count,
                                   float* out, ConfigStatus* status) const {
    std::string raw;
    if (!get_string(section, option, &raw, status)) {
        return false;
    }

    std::vector<float> values;
    size_t start = 0;
    while (start <= raw.size()) {
        size_t comma = raw.find(',', start);
        if (comma == std::string::npos) {
            comma = raw.size();
        }
        float v = 0.0F;
        if (values.size() >= count || !parse_number(raw.substr(start, comma - start), &v)) {
            break;
        }
        values.push_back(v);
        start = comma + 1;
    }

    if (start <= raw.size() || values.size() != count) {
        return config_fail(status, ConfigError::INVALID_VALUE,
                           "Option '%s' in section '%s' must have %u numeric values",
                           option, section, static_cast<unsigned>(count));
    }
    std::copy(values.begin(), values.end(), out);
    return true;
}

} // namespace autoz
