#ifndef ETRACE_PROFILE_HPP
#define ETRACE_PROFILE_HPP

/**
 * @file profile.hpp
 * @brief Automatic span per function call, via compiler instrumentation
 *
 * Code compiled with -finstrument-functions (GCC, Clang) calls a hook on
 * every function entry and exit. Linking libetrace provides those hooks; they
 * do nothing until set_profile() activates them.
 *
 * Names are looked up in the dynamic symbol table, so link the instrumented
 * executable with -rdynamic (CMake: ENABLE_EXPORTS) to see function names
 * instead of addresses.
 */

#include "types/tracer.hpp"

namespace etrace {

/**
 * @brief Start or stop recording every instrumented call into tracer.
 *
 * Activating emits begin("Profiling init") and then records, on the calling
 * thread only, begin(<function>, {"filename", "address"}) on each entry and
 * an unnamed end() on each exit. Deactivating stops recording and emits
 * end("Profiling exit").
 *
 * If an entry cannot be recorded, a warning goes to the tracer's log_out and
 * nothing more is recorded until that function returns, so its exit adds no
 * end(). Exits of functions entered before activation are ignored too.
 *
 * At most one tracer is profiled at a time; activating a second one replaces
 * the first without closing its "Profiling init" span. The tracer must stay
 * alive until profiling is deactivated.
 *
 * @param tracer Target tracer
 * @param active true to start, false to stop
 * @throws SerializationError or ResourceError from the init/exit events
 */
void set_profile(Tracer& tracer, bool active);

/**
 * @brief Whether a profiling hook is currently installed.
 */
bool profiling_active();

} // namespace etrace

#endif // ETRACE_PROFILE_HPP
