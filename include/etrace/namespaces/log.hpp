#ifndef ETRACE_LOG_HPP
#define ETRACE_LOG_HPP

/**
 * @file log.hpp
 * @brief Diagnostic warnings
 *
 * Warnings are single lines prefixed "etrace: Warning: ". They are used only
 * where an error cannot be thrown (destructors, instrumentation hooks) or is
 * not fatal (configuration parsing).
 */

#include <cstdarg>
#include <cstdio>

namespace etrace {

namespace log {

/**
 * @brief Write a printf-style warning line to a stream.
 *
 * @param out Destination (nullptr = stderr)
 * @param fmt Printf-style format string, without trailing newline
 */
inline void warn(FILE* out, const char* fmt, ...) {
    if (!out) out = stderr;
    std::fputs("etrace: Warning: ", out);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(out, fmt, ap);
    va_end(ap);
    std::fputc('\n', out);
    std::fflush(out);
}

} // namespace log

} // namespace etrace

#endif // ETRACE_LOG_HPP
