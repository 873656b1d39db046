#ifndef ETRACE_CONFIG_HPP
#define ETRACE_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Tracer configuration and INI loading
 */

#include <cerrno>
#include <cstdio>
#include <string>

#include "../namespaces/ini_parser.hpp"
#include "../namespaces/log.hpp"
#include "../platform.hpp"
#include "enums.hpp"
#include "errors.hpp"

namespace etrace {

/**
 * @brief Construction-time settings of a Tracer.
 *
 * Only output_path changes what gets recorded (it selects the mode); the
 * other fields tune file handling and diagnostics.
 */
struct Config {
    std::string output_path;          ///< Streaming output file (empty = buffered mode)
    bool lock_appends = true;         ///< Hold an exclusive advisory lock during each append
    bool create_directories = false;  ///< Create missing parent directories of output/flush paths
    bool warn_unbalanced = true;      ///< Warn when a tracer is destroyed with open spans
    bool warn_unflushed = false;      ///< Warn when a buffered tracer is destroyed with records left
    FILE* log_out = stderr;           ///< Destination of warnings

    /**
     * @brief Mode selected by this configuration.
     */
    TracingMode mode() const {
        return output_path.empty() ? TracingMode::Buffered : TracingMode::Streaming;
    }

    /**
     * @brief Load configuration from INI file.
     *
     * Keys absent from the file keep their current values. Malformed lines
     * and unknown keys are reported as warnings and skipped.
     *
     * @param path Path to INI file (relative or absolute)
     * @return true on success, false if the file could not be opened
     *
     * Example INI format:
     * @code
     * [output]
     * path = "traces/run.json"
     * lock = true
     * create_dirs = yes
     *
     * [diagnostics]
     * warn_unbalanced = true
     * warn_unflushed = false
     * @endcode
     */
    inline bool load_from_file(const char* path);

    /**
     * @brief Parse INI text from an open stream.
     * @param f Stream positioned at the start of the INI text
     * @param path Name used in warnings
     */
    inline void load_from_stream(FILE* f, const char* path);
};

inline bool Config::load_from_file(const char* path) {
    FILE* f = safe_fopen(path, "r");
    if (!f) {
        log::warn(log_out, "Could not open config file: %s", path);
        return false;
    }
    load_from_stream(f, path);
    std::fclose(f);
    return true;
}

inline void Config::load_from_stream(FILE* f, const char* path) {
    std::string current_section;
    std::string raw;
    int line_num = 0;

    auto set_bool = [&](bool& field, const std::string& key, const std::string& value) {
        if (!ini_parser::parse_bool(value, field)) {
            log::warn(log_out, "Invalid boolean '%s' for '%s' in %s:%d",
                      value.c_str(), key.c_str(), path, line_num);
        }
    };

    while (ini_parser::read_line(f, raw)) {
        ++line_num;
        std::string line = ini_parser::trim(raw);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Parse section header [section_name]
        if (line[0] == '[' && line[line.length()-1] == ']') {
            current_section = ini_parser::lower(ini_parser::trim(line.substr(1, line.length() - 2)));
            continue;
        }

        // Parse key = value
        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            log::warn(log_out, "Invalid line in %s:%d (no '=')", path, line_num);
            continue;
        }

        std::string key = ini_parser::lower(ini_parser::trim(line.substr(0, eq_pos)));
        std::string value = ini_parser::strip_comment(line.substr(eq_pos + 1));

        if (current_section == "output") {
            if (key == "path") output_path = ini_parser::unquote(value);
            else if (key == "lock") set_bool(lock_appends, key, value);
            else if (key == "create_dirs") set_bool(create_directories, key, value);
            else log::warn(log_out, "Unknown key '%s' in [output] at %s:%d", key.c_str(), path, line_num);
        }
        else if (current_section == "diagnostics") {
            if (key == "warn_unbalanced") set_bool(warn_unbalanced, key, value);
            else if (key == "warn_unflushed") set_bool(warn_unflushed, key, value);
            else log::warn(log_out, "Unknown key '%s' in [diagnostics] at %s:%d", key.c_str(), path, line_num);
        }
        else {
            log::warn(log_out, "Key '%s' outside a known section at %s:%d", key.c_str(), path, line_num);
        }
    }
}

/**
 * @brief Build a Config from defaults plus an INI file.
 *
 * @param path Path to INI file
 * @return Loaded configuration
 * @throws ResourceError if the file cannot be opened
 *
 * Example:
 * @code
 * etrace::Tracer tracer(etrace::load_config("etrace.ini"));
 * @endcode
 */
inline Config load_config(const std::string& path) {
    FILE* f = safe_fopen(path.c_str(), "r");
    if (!f) {
        throw ResourceError("cannot open config file", path, errno);
    }
    Config cfg;
    cfg.load_from_stream(f, path.c_str());
    std::fclose(f);
    return cfg;
}

} // namespace etrace

#endif // ETRACE_CONFIG_HPP
