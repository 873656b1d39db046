#ifndef ETRACE_PLATFORM_HPP
#define ETRACE_PLATFORM_HPP

/**
 * @file platform.hpp
 * @brief Platform-specific includes, build-time defines and OS helpers
 *
 * Everything that touches the operating system directly lives here: wall-clock
 * time, process/thread identity, advisory file locks and directory creation.
 */

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <string>
#include <system_error>
#include <thread>
#include <filesystem>

#ifdef _WIN32
#include <windows.h>
#include <io.h>
#include <process.h>
// Undefine Windows macros that conflict with std::min/max
#undef min
#undef max
#else
#include <sys/file.h>
#include <sys/types.h>
#include <unistd.h>
#if defined(__linux__)
#include <sys/syscall.h>
#elif defined(__APPLE__)
#include <pthread.h>
#endif
#endif

// Version information
#define ETRACE_VERSION "0.1.0"
#define ETRACE_VERSION_MAJOR 0
#define ETRACE_VERSION_MINOR 1
#define ETRACE_VERSION_PATCH 0

namespace etrace {

// Cross-platform safe fopen wrapper to avoid deprecation warnings
inline FILE* safe_fopen(const char* filename, const char* mode) {
#ifdef _MSC_VER
    FILE* file = nullptr;
    if (fopen_s(&file, filename, mode) != 0) {
        return nullptr;
    }
    return file;
#else
    return std::fopen(filename, mode);
#endif
}

/**
 * @brief Wall-clock time in microseconds since the Unix epoch.
 *
 * Uses system_clock so timestamps from different processes writing the same
 * trace file line up.
 */
inline int64_t now_us() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return (int64_t)std::chrono::duration_cast<std::chrono::microseconds>(now).count();
}

/**
 * @brief Identifier of the calling process.
 */
inline uint32_t process_id() {
#ifdef _WIN32
    return (uint32_t)::GetCurrentProcessId();
#else
    return (uint32_t)::getpid();
#endif
}

/**
 * @brief Hash the current std::thread::id to a 32-bit value.
 *
 * Fallback for platforms without a native numeric thread id.
 */
inline uint32_t thread_id_hash() {
    auto id = std::this_thread::get_id();
    std::hash<std::thread::id> h;
    uint64_t v = (uint64_t)h(id);
    v ^= (v >> 33); v *= 0xff51afd7ed558ccdULL;
    v ^= (v >> 33); v *= 0xc4ceb9fe1a85ec53ULL;
    v ^= (v >> 33);
    return (uint32_t)(v & 0xffffffffu);
}

/**
 * @brief Identifier of the calling thread, as the OS reports it.
 */
inline uint64_t thread_id() {
#if defined(_WIN32)
    return (uint64_t)::GetCurrentThreadId();
#elif defined(__linux__)
    return (uint64_t)::syscall(SYS_gettid);
#elif defined(__APPLE__)
    uint64_t tid64 = 0;
    pthread_threadid_np(nullptr, &tid64);
    return tid64;
#else
    return (uint64_t)thread_id_hash();
#endif
}

/**
 * @brief Take an exclusive advisory lock on an open stream, blocking until granted.
 * @return Empty on success, otherwise the OS error (Win32 codes in system_category())
 */
inline std::error_code lock_file(FILE* f) {
#ifdef _WIN32
    HANDLE h = (HANDLE)_get_osfhandle(_fileno(f));
    OVERLAPPED ov = {};
    if (!::LockFileEx(h, LOCKFILE_EXCLUSIVE_LOCK, 0, MAXDWORD, MAXDWORD, &ov)) {
        return std::error_code((int)::GetLastError(), std::system_category());
    }
    return std::error_code();
#else
    int rc;
    do {
        rc = ::flock(::fileno(f), LOCK_EX);
    } while (rc != 0 && errno == EINTR);
    return rc == 0 ? std::error_code() : std::error_code(errno, std::generic_category());
#endif
}

/**
 * @brief Release a lock taken with lock_file().
 * @return Empty on success, otherwise the OS error
 */
inline std::error_code unlock_file(FILE* f) {
#ifdef _WIN32
    HANDLE h = (HANDLE)_get_osfhandle(_fileno(f));
    OVERLAPPED ov = {};
    if (!::UnlockFileEx(h, 0, MAXDWORD, MAXDWORD, &ov)) {
        return std::error_code((int)::GetLastError(), std::system_category());
    }
    return std::error_code();
#else
    if (::flock(::fileno(f), LOCK_UN) != 0) {
        return std::error_code(errno, std::generic_category());
    }
    return std::error_code();
#endif
}

/**
 * @brief Create the missing parent directories of a file path.
 * @return Empty error code on success or when there is nothing to create
 */
inline std::error_code create_parent_dirs(const std::string& path) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty() && !fs::exists(parent, ec)) {
        fs::create_directories(parent, ec);
    }
    return ec;
}

} // namespace etrace

#endif // ETRACE_PLATFORM_HPP
