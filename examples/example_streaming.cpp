/**
 * @file example_streaming.cpp
 * @brief Several processes streaming into one trace file.
 *
 * Each child process opens its own streaming tracer on the same path. Every
 * record is written and flushed as soon as it is emitted, so a crash loses at
 * most the record being written.
 *
 * Usage: example_streaming [trace-file] [processes]
 */

#include <etrace/etrace.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>

#ifndef _WIN32
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace {

void run_worker(const std::string& path, int index) {
    etrace::Tracer tracer(path);
    etrace::set_process_name(tracer, "worker " + std::to_string(index));
    etrace::set_process_sort_index(tracer, index);

    for (int step = 0; step < 5; ++step) {
        int64_t start = etrace::now_us();
        std::this_thread::sleep_for(std::chrono::milliseconds(2 + index));
        tracer.complete(start, etrace::now_us() - start, "step", etrace::Json{{"step", step}}, "work");
        tracer.flow_start("handoff", std::to_string(index * 100 + step));
    }
    tracer.clock_sync("sync", "worker-" + std::to_string(index), etrace::now_us());
}

} // namespace

int main(int argc, char** argv) {
    std::string path = argc > 1 ? argv[1] : "stream_trace.json";
    int processes = argc > 2 ? std::atoi(argv[2]) : 3;

    std::remove(path.c_str());

    try {
#ifndef _WIN32
        for (int i = 0; i < processes; ++i) {
            pid_t pid = fork();
            if (pid < 0) {
                std::perror("fork");
                return 1;
            }
            if (pid == 0) {
                int rc = 0;
                try {
                    run_worker(path, i + 1);
                }
                catch (const etrace::Error& e) {
                    std::fprintf(stderr, "worker %d: %s\n", i + 1, e.what());
                    rc = 1;
                }
                std::_Exit(rc);
            }
        }
        while (wait(nullptr) > 0) {
        }
#else
        for (int i = 0; i < processes; ++i) {
            run_worker(path, i + 1);
        }
#endif
        etrace::Tracer tracer(path);
        etrace::set_process_name(tracer, "parent");
        tracer.instant("all workers done", "g");

        std::string finalized = path + ".final.json";
        etrace::finalize_trace_file(path, finalized);
        std::printf("Raw trace: %s\nFinalized: %s\n", path.c_str(), finalized.c_str());
    }
    catch (const etrace::Error& e) {
        std::fprintf(stderr, "Tracing failed: %s\n", e.what());
        return 1;
    }
    return 0;
}
