#ifndef ETRACE_ERRORS_HPP
#define ETRACE_ERRORS_HPP

/**
 * @file errors.hpp
 * @brief Exception types thrown by tracing operations
 *
 * Every tracing call may throw one of these. Callers either propagate them or
 * catch etrace::Error to deliberately ignore tracing failures.
 */

#include <stdexcept>
#include <string>
#include <system_error>

namespace etrace {

/**
 * @brief Base class of all etrace exceptions.
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Operation not valid for the tracer's mode (e.g. flush() while streaming).
 */
class UsageError : public Error {
public:
    explicit UsageError(const std::string& msg) : Error(msg) {}
};

/**
 * @brief A field could not be converted to JSON.
 *
 * Thrown before anything reaches the sink, so the buffer or file is untouched.
 */
class SerializationError : public Error {
public:
    explicit SerializationError(const std::string& msg) : Error(msg) {}
};

/**
 * @brief The trace file could not be opened, locked, written or flushed.
 */
class ResourceError : public Error {
public:
    /**
     * @param what Failed action, e.g. "cannot open trace file"
     * @param path File the action was applied to
     * @param error_code errno value
     */
    ResourceError(const std::string& what, const std::string& path, int error_code)
        : ResourceError(what, path, std::error_code(error_code, std::generic_category())) {}

    /**
     * @param code OS error with its category (system_category() for Win32 codes)
     */
    ResourceError(const std::string& what, const std::string& path, std::error_code code)
        : Error(what + " '" + path + "': " + code.message()), path_(path), code_(code) {}

    const std::string& path() const { return path_; }
    int error_code() const { return code_.value(); }
    const std::error_code& code() const { return code_; }

private:
    std::string path_;
    std::error_code code_;
};

} // namespace etrace

#endif // ETRACE_ERRORS_HPP
