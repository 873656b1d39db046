#ifndef ETRACE_SCOPED_SPAN_HPP
#define ETRACE_SCOPED_SPAN_HPP

/**
 * @file scoped_span.hpp
 * @brief RAII begin/end pair
 */

#include <string>
#include <utility>

#include "../namespaces/log.hpp"
#include "errors.hpp"
#include "event.hpp"
#include "tracer.hpp"

namespace etrace {

/**
 * @brief Emits begin() on construction and end() on destruction.
 *
 * The end record is written however the scope is left, including by an
 * exception. A failing end() cannot propagate out of a destructor, so it is
 * reported as a warning on the tracer's log stream instead.
 *
 * @code
 * void load(etrace::Tracer& tracer) {
 *     etrace::ScopedSpan span(tracer, "load", etrace::Json{{"stage", 1}});
 *     // ...
 * }
 * @endcode
 */
class ScopedSpan {
public:
    /**
     * @throws SerializationError or ResourceError from begin(); no end() is
     *         emitted in that case
     */
    ScopedSpan(Tracer& tracer, std::string name, Args args = std::nullopt, Text cat = std::nullopt)
        : tracer_(tracer) {
        tracer_.begin(std::move(name), std::move(args), std::move(cat));
    }

    ~ScopedSpan() {
        try {
            tracer_.end();
        }
        catch (const Error& e) {
            log::warn(tracer_.config().log_out, "Could not end span: %s", e.what());
        }
    }

    ScopedSpan(const ScopedSpan&) = delete;
    ScopedSpan& operator=(const ScopedSpan&) = delete;

private:
    Tracer& tracer_;
};

} // namespace etrace

#endif // ETRACE_SCOPED_SPAN_HPP
