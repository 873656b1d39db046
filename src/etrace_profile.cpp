/**
 * @file etrace_profile.cpp
 * @brief Function instrumentation hooks behind etrace::set_profile()
 *
 * This file must not itself be compiled with -finstrument-functions.
 */

#include <atomic>
#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <utility>

#if defined(__GNUC__) && !defined(_WIN32)
#include <cxxabi.h>
#include <dlfcn.h>
#define ETRACE_HAVE_DLADDR 1
#endif

#include "../include/etrace/namespaces/log.hpp"
#include "../include/etrace/profile.hpp"
#include "../include/etrace/types/event.hpp"

#if defined(__GNUC__)
#define ETRACE_NO_INSTRUMENT __attribute__((no_instrument_function))
#else
#define ETRACE_NO_INSTRUMENT
#endif

namespace etrace {

namespace {

std::atomic<Tracer*> g_profiled{nullptr};

// Set on the thread that called set_profile(tracer, true).
thread_local bool t_profiling_thread = false;

// Set while a hook is running on this thread. Anything the hook calls that
// happens to be instrumented re-enters and must be ignored.
thread_local bool t_in_hook = false;

// Instrumented frames entered on this thread since profiling started. Exits
// at depth 0 belong to frames entered before activation.
thread_local int t_call_depth = 0;

// Depth of the frame whose entry could not be recorded, or 0. Nothing is
// recorded until that frame exits.
thread_local int t_failed_depth = 0;

ETRACE_NO_INSTRUMENT std::string hex_address(const void* addr) {
    char buf[2 + 16 + 1];
    std::snprintf(buf, sizeof(buf), "0x%" PRIxPTR, (uintptr_t)addr);
    return buf;
}

/**
 * @brief Copy of @p text with invalid UTF-8 sequences replaced by U+FFFD.
 */
ETRACE_NO_INSTRUMENT std::string valid_utf8(const char* text) {
    std::string dumped = Json(text).dump(-1, ' ', false, Json::error_handler_t::replace);
    return Json::parse(dumped).get<std::string>();
}

/**
 * @brief Demangled symbol name and object file of a code address.
 */
ETRACE_NO_INSTRUMENT void describe(void* fn, std::string& name, std::string& filename) {
    name = hex_address(fn);
    filename.clear();
#ifdef ETRACE_HAVE_DLADDR
    Dl_info info;
    if (dladdr(fn, &info) == 0) {
        return;
    }
    if (info.dli_fname) {
        filename = valid_utf8(info.dli_fname);
    }
    if (info.dli_sname) {
        int status = 0;
        char* demangled = abi::__cxa_demangle(info.dli_sname, nullptr, nullptr, &status);
        if (status == 0 && demangled) {
            name = demangled;
        }
        else {
            name = valid_utf8(info.dli_sname);
        }
        std::free(demangled);
    }
#endif
}

ETRACE_NO_INSTRUMENT void on_function_enter(void* fn) {
    Tracer* tracer = g_profiled.load(std::memory_order_acquire);
    if (!tracer) {
        return;
    }
    ++t_call_depth;
    if (t_failed_depth != 0) {
        return;
    }
    std::string name, filename;
    try {
        describe(fn, name, filename);
        tracer->begin(std::move(name), Json{{"filename", filename}, {"address", hex_address(fn)}});
    }
    catch (const std::exception& e) {
        t_failed_depth = t_call_depth;
        log::warn(tracer->config().log_out, "Profiling hook could not record entry: %s", e.what());
    }
}

ETRACE_NO_INSTRUMENT void on_function_exit(void*) {
    Tracer* tracer = g_profiled.load(std::memory_order_acquire);
    if (!tracer || t_call_depth == 0) {
        return;
    }
    int depth = t_call_depth--;
    if (t_failed_depth != 0) {
        if (t_failed_depth == depth) {
            t_failed_depth = 0;
        }
        return;
    }
    try {
        tracer->end();
    }
    catch (const std::exception& e) {
        log::warn(tracer->config().log_out, "Profiling hook could not record exit: %s", e.what());
    }
}

/**
 * @brief Marks the current thread as inside a hook for its lifetime.
 */
struct HookGuard {
    ETRACE_NO_INSTRUMENT HookGuard() { t_in_hook = true; }
    ETRACE_NO_INSTRUMENT ~HookGuard() { t_in_hook = false; }
};

} // namespace

ETRACE_NO_INSTRUMENT void set_profile(Tracer& tracer, bool active) {
    HookGuard guard;
    if (active) {
        tracer.begin("Profiling init");
        t_call_depth = 0;
        t_failed_depth = 0;
        t_profiling_thread = true;
        g_profiled.store(&tracer, std::memory_order_release);
    }
    else {
        g_profiled.store(nullptr, std::memory_order_release);
        t_profiling_thread = false;
        tracer.end("Profiling exit");
    }
}

ETRACE_NO_INSTRUMENT bool profiling_active() {
    return g_profiled.load(std::memory_order_acquire) != nullptr;
}

} // namespace etrace

extern "C" {

ETRACE_NO_INSTRUMENT void __cyg_profile_func_enter(void* fn, void* call_site);
ETRACE_NO_INSTRUMENT void __cyg_profile_func_exit(void* fn, void* call_site);

void __cyg_profile_func_enter(void* fn, void*) {
    if (etrace::t_in_hook || !etrace::t_profiling_thread) {
        return;
    }
    etrace::HookGuard guard;
    etrace::on_function_enter(fn);
}

void __cyg_profile_func_exit(void* fn, void*) {
    if (etrace::t_in_hook || !etrace::t_profiling_thread) {
        return;
    }
    etrace::HookGuard guard;
    etrace::on_function_exit(fn);
}

} // extern "C"
