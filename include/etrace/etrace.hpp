#ifndef ETRACE_HPP
#define ETRACE_HPP

/**
 * @file etrace.hpp
 * @brief Event tracer writing the Trace Event Format (chrome://tracing, Perfetto)
 *
 * Single include for the whole library.
 *
 * Usage:
 * @code
 * #include <etrace/etrace.hpp>
 *
 * etrace::Tracer tracer("trace.json");      // streaming
 * tracer.begin("main");
 * tracer.instant("ready", "p");
 * tracer.end();
 * @endcode
 *
 * Files produced this way end in ",\n". Run them through
 * etrace::finalize_trace_file() for tools that require a closed array.
 */

#include "platform.hpp"

#include "types/enums.hpp"
#include "types/errors.hpp"
#include "types/event.hpp"
#include "types/config.hpp"
#include "types/depth_tracker.hpp"
#include "types/event_buffer.hpp"
#include "types/trace_file.hpp"
#include "types/tracer.hpp"
#include "types/scoped_span.hpp"

#include "namespaces/ini_parser.hpp"
#include "namespaces/json_codec.hpp"
#include "namespaces/log.hpp"

#include "functions.hpp"
#include "macros.hpp"
#include "profile.hpp"

#endif // ETRACE_HPP
