/**
 * @file example_config_file.cpp
 * @brief Configure a tracer from an INI file.
 *
 * Usage: example_config_file [config.ini]
 */

#include <etrace/etrace.hpp>
#include <cstdio>

namespace {

void worker_function(etrace::Tracer& tracer, int id) {
    ETRACE_SCOPE(tracer, "worker");
    for (int i = 0; i < 3; ++i) {
        tracer.instant("item", "t", etrace::Json{{"worker", id}, {"item", i}});
    }
}

} // namespace

int main(int argc, char** argv) {
    const char* ini = argc > 1 ? argv[1] : "../examples/etrace.ini";

    etrace::Config cfg;
    if (!cfg.load_from_file(ini)) {
        std::printf("Using defaults\n");
    }
    if (cfg.output_path.empty()) {
        cfg.output_path = "config_trace.json";   // this example always streams
    }

    std::printf("Output: %s\n", cfg.output_path.c_str());
    std::printf("Lock appends: %s\n", cfg.lock_appends ? "yes" : "no");
    std::printf("Create directories: %s\n", cfg.create_directories ? "yes" : "no");

    try {
        etrace::Tracer tracer(cfg);
        auto job = etrace::wrap(tracer, "job", worker_function);
        for (int id = 0; id < 2; ++id) {
            job(tracer, id);
        }
    }
    catch (const etrace::Error& e) {
        std::fprintf(stderr, "Tracing failed: %s\n", e.what());
        return 1;
    }
    return 0;
}
