#ifndef ETRACE_TRACER_HPP
#define ETRACE_TRACER_HPP

/**
 * @file tracer.hpp
 * @brief The event tracer: one method per Trace Event Format phase
 */

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "../namespaces/json_codec.hpp"
#include "../namespaces/log.hpp"
#include "../platform.hpp"
#include "config.hpp"
#include "depth_tracker.hpp"
#include "enums.hpp"
#include "errors.hpp"
#include "event.hpp"
#include "event_buffer.hpp"
#include "trace_file.hpp"

namespace etrace {

/**
 * @brief Records trace events into a buffer or straight into a file.
 *
 * The mode is chosen at construction and never changes:
 * - Buffered (no output path): events accumulate in memory; flush(path)
 *   appends them all to a file in one write.
 * - Streaming (output path given): each event is appended to the file and
 *   flushed before the call returns.
 *
 * Every event call stamps the record with wall-clock microseconds, the
 * process ID and the thread ID, encodes it to JSON, then commits it. A tracer
 * has no internal locking; share one between threads only under external
 * synchronization. Separate tracers may stream into the same file.
 *
 * @code
 * etrace::Tracer tracer;                     // buffered
 * tracer.begin("load", etrace::Json{{"file", path}});
 * tracer.end();
 * tracer.flush("trace.json");
 * @endcode
 */
class Tracer {
public:
    /**
     * @brief Buffered tracer with default settings.
     */
    Tracer() : Tracer(Config{}) {}

    /**
     * @brief Streaming tracer appending to path.
     * @throws ResourceError if the file cannot be opened or initialized
     */
    explicit Tracer(const std::string& path) : Tracer(streaming_config(path)) {}

    /**
     * @brief Tracer from a full configuration; mode follows cfg.output_path.
     * @throws ResourceError if a streaming file cannot be opened or initialized
     */
    explicit Tracer(Config cfg) : config_(std::move(cfg)) {
        if (config_.mode() == TracingMode::Streaming) {
            file_ = std::make_unique<TraceFile>(config_.output_path, config_);
            file_->open_array();
        }
    }

    /**
     * @brief Closes the streaming file. Buffered records are discarded.
     */
    ~Tracer() {
        if (config_.warn_unbalanced) {
            int64_t open_spans = depth();
            if (open_spans > 0) {
                log::warn(config_.log_out, "Tracer destroyed with %lld open span(s)", (long long)open_spans);
            }
        }
        if (config_.warn_unflushed && !file_ && !buffer_.empty()) {
            log::warn(config_.log_out, "Tracer destroyed with %zu unflushed event(s)", buffer_.size());
        }
    }

    Tracer(const Tracer&) = delete;
    Tracer& operator=(const Tracer&) = delete;

    TracingMode mode() const { return file_ ? TracingMode::Streaming : TracingMode::Buffered; }
    const Config& config() const { return config_; }

    /**
     * @brief Buffered events in emission order.
     * @throws UsageError on a streaming tracer
     */
    const std::vector<Event>& events() const {
        if (file_) {
            throw UsageError("events() called on a streaming tracer");
        }
        return buffer_.events();
    }

    /**
     * @brief Open spans of the calling process (0 if it never began one).
     */
    int64_t depth() const { return depths_.depth(process_id()); }

    const DepthTracker& depths() const { return depths_; }

    // ---- Spans ------------------------------------------------------------

    void begin(std::string name, Args args = std::nullopt, Text cat = std::nullopt) {
        BeginEvent e;
        e.header = stamp();
        e.name = std::move(name);
        e.cat = std::move(cat);
        e.args = std::move(args);
        const uint32_t pid = e.header.pid;
        commit(std::move(e));
        depths_.increment(pid);
    }

    void end(Text name = std::nullopt, Args args = std::nullopt, Text cat = std::nullopt) {
        EndEvent e;
        e.header = stamp();
        e.name = std::move(name);
        e.cat = std::move(cat);
        e.args = std::move(args);
        const uint32_t pid = e.header.pid;
        commit(std::move(e));
        depths_.decrement(pid);
    }

    /**
     * @brief Span recorded after the fact.
     * @param start Start time in microseconds since the epoch (used as ts)
     * @param duration Duration in microseconds
     */
    void complete(int64_t start, int64_t duration, Text name = std::nullopt,
                  Args args = std::nullopt, Text cat = std::nullopt) {
        CompleteEvent e;
        e.header = stamp();
        e.header.ts = start;
        e.dur = duration;
        e.name = std::move(name);
        e.cat = std::move(cat);
        e.args = std::move(args);
        commit(std::move(e));
    }

    // ---- Point events -----------------------------------------------------

    /**
     * @param scope "g" (global), "p" (process) or "t" (thread); not validated
     */
    void instant(Text name = std::nullopt, Text scope = std::nullopt,
                 Args args = std::nullopt, Text cat = std::nullopt) {
        InstantEvent e;
        e.header = stamp();
        e.name = std::move(name);
        e.cat = std::move(cat);
        e.scope = std::move(scope);
        e.args = std::move(args);
        commit(std::move(e));
    }

    /**
     * @param args One entry per counter series, e.g. {"hits": 3, "misses": 1}
     */
    void counter(Text name = std::nullopt, Args args = std::nullopt, Text cat = std::nullopt) {
        CounterEvent e;
        e.header = stamp();
        e.name = std::move(name);
        e.cat = std::move(cat);
        e.args = std::move(args);
        commit(std::move(e));
    }

    void mark(Text name = std::nullopt, Args args = std::nullopt, Text cat = std::nullopt) {
        MarkEvent e;
        e.header = stamp();
        e.name = std::move(name);
        e.cat = std::move(cat);
        e.args = std::move(args);
        commit(std::move(e));
    }

    // ---- Async and flow ---------------------------------------------------

    void async_start(Text name = std::nullopt, Text id = std::nullopt,
                     Args args = std::nullopt, Text cat = std::nullopt) {
        emit_id<AsyncBeginEvent>(std::move(name), std::move(id), std::move(args), std::move(cat));
    }

    void async_instant(Text name = std::nullopt, Text id = std::nullopt,
                       Args args = std::nullopt, Text cat = std::nullopt) {
        emit_id<AsyncInstantEvent>(std::move(name), std::move(id), std::move(args), std::move(cat));
    }

    void async_end(Text name = std::nullopt, Text id = std::nullopt,
                   Args args = std::nullopt, Text cat = std::nullopt) {
        emit_id<AsyncEndEvent>(std::move(name), std::move(id), std::move(args), std::move(cat));
    }

    void flow_start(Text name = std::nullopt, Text id = std::nullopt,
                    Args args = std::nullopt, Text cat = std::nullopt) {
        emit_id<FlowBeginEvent>(std::move(name), std::move(id), std::move(args), std::move(cat));
    }

    void flow_instant(Text name = std::nullopt, Text id = std::nullopt,
                      Args args = std::nullopt, Text cat = std::nullopt) {
        emit_id<FlowStepEvent>(std::move(name), std::move(id), std::move(args), std::move(cat));
    }

    void flow_end(Text name = std::nullopt, Text id = std::nullopt,
                  Args args = std::nullopt, Text cat = std::nullopt) {
        emit_id<FlowEndEvent>(std::move(name), std::move(id), std::move(args), std::move(cat));
    }

    // ---- Objects ----------------------------------------------------------

    void object_created(Text name = std::nullopt, Text id = std::nullopt, Args args = std::nullopt,
                        Text cat = std::nullopt, Text scope = std::nullopt) {
        emit_object<ObjectCreatedEvent>(std::move(name), std::move(id), std::move(args),
                                        std::move(cat), std::move(scope));
    }

    void object_snapshot(Text name = std::nullopt, Text id = std::nullopt, Args args = std::nullopt,
                         Text cat = std::nullopt, Text scope = std::nullopt) {
        emit_object<ObjectSnapshotEvent>(std::move(name), std::move(id), std::move(args),
                                         std::move(cat), std::move(scope));
    }

    void object_destroyed(Text name = std::nullopt, Text id = std::nullopt, Args args = std::nullopt,
                          Text cat = std::nullopt, Text scope = std::nullopt) {
        emit_object<ObjectDestroyedEvent>(std::move(name), std::move(id), std::move(args),
                                          std::move(cat), std::move(scope));
    }

    // ---- Metadata, clock sync, context --------------------------------------

    /**
     * @param name e.g. "process_name", "thread_name", "process_sort_index"
     * @param args e.g. {"name": "worker"} or {"sort_index": 2}
     */
    void metadata(Text name = std::nullopt, Args args = std::nullopt) {
        MetadataEvent e;
        e.header = stamp();
        e.name = std::move(name);
        e.args = std::move(args);
        commit(std::move(e));
    }

    void clock_sync(Text name = std::nullopt, Text sync_id = std::nullopt,
                    std::optional<int64_t> issue_ts = std::nullopt) {
        ClockSyncEvent e;
        e.header = stamp();
        e.name = std::move(name);
        e.sync_id = std::move(sync_id);
        e.issue_ts = issue_ts;
        commit(std::move(e));
    }

    void context_enter(Text name = std::nullopt, Text id = std::nullopt) {
        ContextEnterEvent e;
        e.header = stamp();
        e.name = std::move(name);
        e.id = std::move(id);
        commit(std::move(e));
    }

    void context_leave(Text name = std::nullopt, Text id = std::nullopt) {
        ContextLeaveEvent e;
        e.header = stamp();
        e.name = std::move(name);
        e.id = std::move(id);
        commit(std::move(e));
    }

    // ---- Housekeeping -------------------------------------------------------

    /**
     * @brief End every span still open in the calling process.
     *
     * Emits one unnamed end() per outstanding begin(). Which span each end
     * closes is not tracked. No-op if this process never began a span.
     */
    void clear() {
        const uint32_t pid = process_id();
        if (!depths_.tracks(pid)) {
            return;
        }
        while (depths_.depth(pid) > 0) {
            end();
        }
    }

    /**
     * @brief Append all buffered events to a trace file and empty the buffer.
     *
     * Writes "[\n" first if the file is empty, then one "<json>,\n" per event,
     * as one write under the file lock. Nothing is written when the buffer is
     * empty. If writing fails, the events that did not fully reach the file
     * stay buffered; those already written are dropped, so a later flush
     * never writes them twice.
     *
     * @throws UsageError on a streaming tracer
     * @throws ResourceError if the file cannot be opened, locked or written
     */
    void flush(const std::string& path) {
        if (file_) {
            throw UsageError("flush() called on a streaming tracer");
        }
        if (buffer_.empty()) {
            return;
        }
        EventBuffer drained = buffer_.drain();
        size_t committed = 0;
        try {
            TraceFile target(path, config_);
            target.append(drained.encoded(), &committed);
        }
        catch (const ResourceError&) {
            buffer_.restore(std::move(drained), committed);
            throw;
        }
    }

    /**
     * @brief Print buffered events, one JSON object per line.
     */
    friend std::ostream& operator<<(std::ostream& os, const Tracer& t) {
        if (!t.file_) {
            for (const auto& line : t.buffer_.encoded()) {
                os << line << '\n';
            }
        }
        return os;
    }

private:
    static Config streaming_config(const std::string& path) {
        Config cfg;
        cfg.output_path = path;
        return cfg;
    }

    static Header stamp() {
        Header h;
        h.ts = now_us();
        h.pid = process_id();
        h.tid = thread_id();
        return h;
    }

    /**
     * @brief Encode then hand the event to the active sink.
     *
     * Encoding happens first so a SerializationError leaves the sink as it was.
     */
    template <typename E>
    void commit(E&& e) {
        std::string encoded = json_codec::encode(e);
        if (file_) {
            file_->append(encoded);
        }
        else {
            buffer_.push(Event(std::forward<E>(e)), std::move(encoded));
        }
    }

    template <typename E>
    void emit_id(Text name, Text id, Args args, Text cat) {
        E e;
        e.header = stamp();
        e.name = std::move(name);
        e.id = std::move(id);
        e.cat = std::move(cat);
        e.args = std::move(args);
        commit(std::move(e));
    }

    template <typename E>
    void emit_object(Text name, Text id, Args args, Text cat, Text scope) {
        E e;
        e.header = stamp();
        e.name = std::move(name);
        e.id = std::move(id);
        e.cat = std::move(cat);
        e.args = std::move(args);
        e.scope = std::move(scope);
        commit(std::move(e));
    }

    Config config_;
    DepthTracker depths_;
    EventBuffer buffer_;
    std::unique_ptr<TraceFile> file_;
};

} // namespace etrace

#endif // ETRACE_TRACER_HPP
