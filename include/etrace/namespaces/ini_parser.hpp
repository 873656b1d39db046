#ifndef ETRACE_INI_PARSER_HPP
#define ETRACE_INI_PARSER_HPP

/**
 * @file ini_parser.hpp
 * @brief INI file parsing utilities
 *
 * Features:
 * - String trimming and cleaning
 * - Boolean parsing with error reporting
 * - Quote handling for string values
 * - Inline comment stripping
 */

#include <cctype>
#include <cstdio>
#include <cstring>
#include <string>

namespace etrace {

/**
 * @brief INI file parsing utilities.
 *
 * Provides helper functions for parsing configuration values from INI files.
 */
namespace ini_parser {

/**
 * @brief Read one line of any length, without its trailing newline.
 * @return false at end of file when nothing was read
 */
inline bool read_line(FILE* f, std::string& line) {
    line.clear();
    char buf[256];
    while (std::fgets(buf, sizeof(buf), f)) {
        size_t len = std::strlen(buf);
        if (len > 0 && buf[len - 1] == '\n') {
            line.append(buf, len - 1);
            return true;
        }
        line.append(buf, len);
    }
    return !line.empty();
}

/**
 * @brief Trim whitespace from both ends of a string.
 */
inline std::string trim(const std::string& str) {
    size_t start = 0;
    size_t end = str.length();

    while (start < end && std::isspace((unsigned char)str[start])) ++start;
    while (end > start && std::isspace((unsigned char)str[end - 1])) --end;

    return str.substr(start, end - start);
}

/**
 * @brief Lowercase copy of a string.
 */
inline std::string lower(std::string s) {
    for (char& c : s) {
        c = (char)std::tolower((unsigned char)c);
    }
    return s;
}

/**
 * @brief Parse boolean value from string.
 *
 * Accepts: true/false, 1/0, on/off, yes/no (case-insensitive)
 *
 * @param value Raw value text
 * @param out Receives the parsed value; untouched on failure
 * @return true if the value was recognized
 */
inline bool parse_bool(const std::string& value, bool& out) {
    std::string v = lower(trim(value));

    if (v == "true" || v == "1" || v == "on" || v == "yes") {
        out = true;
        return true;
    }
    if (v == "false" || v == "0" || v == "off" || v == "no") {
        out = false;
        return true;
    }
    return false;
}

/**
 * @brief Remove quotes from string if present.
 */
inline std::string unquote(const std::string& str) {
    std::string s = trim(str);
    if (s.length() >= 2 && s[0] == '"' && s[s.length()-1] == '"') {
        return s.substr(1, s.length() - 2);
    }
    return s;
}

/**
 * @brief Remove an inline "#" or ";" comment from an unquoted value.
 *
 * Comment characters inside a quoted value are kept.
 */
inline std::string strip_comment(const std::string& value) {
    bool quoted = false;
    for (size_t i = 0; i < value.length(); ++i) {
        char c = value[i];
        if (c == '"') {
            quoted = !quoted;
        }
        else if (!quoted && (c == '#' || c == ';')) {
            return trim(value.substr(0, i));
        }
    }
    return trim(value);
}

} // namespace ini_parser

} // namespace etrace

#endif // ETRACE_INI_PARSER_HPP
