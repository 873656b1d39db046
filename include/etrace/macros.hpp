#ifndef ETRACE_MACROS_HPP
#define ETRACE_MACROS_HPP

/**
 * @file macros.hpp
 * @brief ETRACE_* macro definitions
 */

#include "types/scoped_span.hpp"

#define ETRACE_CONCAT_INNER(a, b) a##b
#define ETRACE_CONCAT(a, b) ETRACE_CONCAT_INNER(a, b)

/**
 * @def ETRACE_SCOPE(tracer, name)
 * @brief Record the rest of the enclosing block as a span.
 *
 * Example:
 * @code
 * void step(etrace::Tracer& tracer) {
 *     ETRACE_SCOPE(tracer, "step");
 *     // ...
 * }
 * @endcode
 */
#define ETRACE_SCOPE(tracer, name) \
    ::etrace::ScopedSpan ETRACE_CONCAT(_etrace_scope_obj, __LINE__)((tracer), (name))

/**
 * @def ETRACE_FUNCTION(tracer)
 * @brief Record the enclosing function as a span named after it.
 */
#define ETRACE_FUNCTION(tracer) ETRACE_SCOPE(tracer, __func__)

#endif // ETRACE_MACROS_HPP
