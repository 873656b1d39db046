/**
 * @file example_basic.cpp
 * @brief Buffered tracing from two threads, flushed once at the end.
 *
 * Shows:
 * - Spans with ETRACE_FUNCTION() / ETRACE_SCOPE()
 * - Instants, counters and async spans
 * - Thread and process names
 * - flush() followed by finalize_trace_file()
 *
 * Open trace.json in chrome://tracing or https://ui.perfetto.dev.
 */

#include <etrace/etrace.hpp>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <thread>

namespace {

// One tracer shared by both threads; the tracer itself does no locking.
std::mutex g_trace_mtx;

void bar(etrace::Tracer& tracer, int i) {
    {
        std::lock_guard<std::mutex> lock(g_trace_mtx);
        tracer.begin("bar", etrace::Json{{"i", i}}, "compute");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(3));
    std::lock_guard<std::mutex> lock(g_trace_mtx);
    tracer.counter("progress", etrace::Json{{"items", i + 1}});
    tracer.end();
}

void foo(etrace::Tracer& tracer, const char* who) {
    {
        std::lock_guard<std::mutex> lock(g_trace_mtx);
        etrace::set_thread_name(tracer, who);
        tracer.instant("foo start", "t");
    }
    for (int i = 0; i < 3; ++i) {
        bar(tracer, i);
    }
}

} // namespace

int main() {
    etrace::Tracer tracer;
    etrace::set_process_name(tracer, "example_basic");

    {
        ETRACE_FUNCTION(tracer);
        tracer.async_start("request", "req-1", etrace::Json{{"url", "/index"}});

        std::thread t1([&tracer]() { foo(tracer, "worker"); });
        foo(tracer, "main");
        t1.join();

        std::lock_guard<std::mutex> lock(g_trace_mtx);
        tracer.async_end("request", "req-1");
    }

    try {
        tracer.flush("trace.json");
        etrace::finalize_trace_file("trace.json", "trace.json");
        std::printf("Trace written to trace.json\n");
    }
    catch (const etrace::Error& e) {
        std::fprintf(stderr, "Could not write trace: %s\n", e.what());
        return 1;
    }
    return 0;
}
