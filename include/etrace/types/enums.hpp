#ifndef ETRACE_ENUMS_HPP
#define ETRACE_ENUMS_HPP

/**
 * @file enums.hpp
 * @brief Enum definitions
 */

#include <cstdint>

namespace etrace {

/**
 * @brief Where a tracer commits its events. Fixed for the tracer's lifetime.
 */
enum class TracingMode : uint8_t {
    Buffered = 0,   ///< Events kept in memory until flush()
    Streaming = 1   ///< Events appended to the output file as they happen
};

/**
 * @brief Trace Event Format phase codes ("ph" field).
 */
enum class Phase : char {
    Begin           = 'B',
    End             = 'E',
    Complete        = 'X',
    Instant         = 'I',
    Counter         = 'C',
    AsyncBegin      = 'b',
    AsyncInstant    = 'n',
    AsyncEnd        = 'e',
    FlowBegin       = 's',
    FlowStep        = 't',
    FlowEnd         = 'f',
    ObjectCreated   = 'N',
    ObjectSnapshot  = 'O',
    ObjectDestroyed = 'D',
    Metadata        = 'M',
    Mark            = 'R',
    ClockSync       = 'c',
    ContextEnter    = '(',
    ContextLeave    = ')'
};

} // namespace etrace

#endif // ETRACE_ENUMS_HPP
