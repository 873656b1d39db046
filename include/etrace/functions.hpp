#ifndef ETRACE_FUNCTIONS_HPP
#define ETRACE_FUNCTIONS_HPP

/**
 * @file functions.hpp
 * @brief Free helper functions built on Tracer
 */

#include <cerrno>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include "platform.hpp"
#include "types/errors.hpp"
#include "types/event.hpp"
#include "types/scoped_span.hpp"
#include "types/trace_file.hpp"
#include "types/tracer.hpp"

namespace etrace {

// ---- Span wrappers ----------------------------------------------------------

/**
 * @brief Wrap a callable so every call is recorded as a span.
 *
 * @param tracer Tracer that outlives the returned callable
 * @param name Span name used for every call
 * @param fn Callable to wrap
 * @return Callable with the same arguments and result as fn
 *
 * Example:
 * @code
 * auto parse = etrace::wrap(tracer, "parse", [](const std::string& s) { return s.size(); });
 * size_t n = parse("abc");   // emits B "parse" ... E
 * @endcode
 */
template <typename Fn>
auto wrap(Tracer& tracer, std::string name, Fn fn) {
    return [&tracer, name = std::move(name), fn = std::move(fn)](auto&&... args) mutable -> decltype(auto) {
        ScopedSpan span(tracer, name);
        return fn(std::forward<decltype(args)>(args)...);
    };
}

// ---- Metadata helpers ---------------------------------------------------------

/**
 * @brief Label the calling process in the viewer.
 */
inline void set_process_name(Tracer& tracer, const std::string& name) {
    tracer.metadata("process_name", Json{{"name", name}});
}

/**
 * @brief Attach comma-separated labels to the calling process.
 */
inline void set_process_labels(Tracer& tracer, const std::string& labels) {
    tracer.metadata("process_labels", Json{{"labels", labels}});
}

inline void set_process_sort_index(Tracer& tracer, int64_t index) {
    tracer.metadata("process_sort_index", Json{{"sort_index", index}});
}

/**
 * @brief Label the calling thread in the viewer.
 */
inline void set_thread_name(Tracer& tracer, const std::string& name) {
    tracer.metadata("thread_name", Json{{"name", name}});
}

inline void set_thread_sort_index(Tracer& tracer, int64_t index) {
    tracer.metadata("thread_sort_index", Json{{"sort_index", index}});
}

// ---- Finalization ---------------------------------------------------------------

/**
 * @brief Turn trace file text into a closed JSON array.
 *
 * Trace files are left open-ended ("[\n" then "<record>,\n" lines) so any
 * number of writers can append. This drops the trailing separator and adds
 * the closing bracket. Empty input gives "[]".
 *
 * @param text Contents of a trace file
 * @return Text that parses as a JSON array
 */
inline std::string finalize_trace(const std::string& text) {
    if (text.empty()) {
        return "[]";
    }
    std::string out = text;
    const std::string sep = TraceFile::kSeparator;
    if (out.size() >= sep.size() && out.compare(out.size() - sep.size(), sep.size(), sep) == 0) {
        out.erase(out.size() - sep.size());
    }
    out += "\n]";
    return out;
}

/**
 * @brief Read a trace file and return its finalized text.
 * @throws ResourceError if the file cannot be read
 */
inline std::string read_trace_file(const std::string& path) {
    FILE* f = safe_fopen(path.c_str(), "rb");
    if (!f) {
        throw ResourceError("cannot open trace file", path, errno);
    }
    std::string text;
    char buf[4096];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
        text.append(buf, n);
    }
    bool failed = std::ferror(f) != 0;
    std::fclose(f);
    if (failed) {
        throw ResourceError("cannot read trace file", path, EIO);
    }
    return finalize_trace(text);
}

/**
 * @brief Write the finalized form of a trace file to another file.
 *
 * in and out may be the same path.
 *
 * @throws ResourceError if either file cannot be read or written
 */
inline void finalize_trace_file(const std::string& in, const std::string& out) {
    std::string text = read_trace_file(in);
    FILE* f = safe_fopen(out.c_str(), "wb");
    if (!f) {
        throw ResourceError("cannot open output file", out, errno);
    }
    bool ok = std::fwrite(text.data(), 1, text.size(), f) == text.size();
    int err = errno;
    if (std::fclose(f) != 0 && ok) {
        ok = false;
        err = errno;
    }
    if (!ok) {
        throw ResourceError("cannot write output file", out, err);
    }
}

} // namespace etrace

#endif // ETRACE_FUNCTIONS_HPP
