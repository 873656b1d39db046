#ifndef ETRACE_TRACE_FILE_HPP
#define ETRACE_TRACE_FILE_HPP

/**
 * @file trace_file.hpp
 * @brief Append-only JSON array trace file
 *
 * File format:
 *   "[\n" written once, by whoever finds the file empty
 *   "<json object>,\n" per record, appended by any number of writers
 *
 * The array is never closed here. Finalizing it (drop the last ",\n", add
 * "\n]") is left to finalize_trace().
 */

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "../namespaces/log.hpp"
#include "../platform.hpp"
#include "config.hpp"
#include "errors.hpp"

namespace etrace {

/**
 * @brief RAII exclusive advisory lock on an open trace file.
 *
 * Does nothing when constructed with enabled = false.
 */
class FileLock {
public:
    FileLock(FILE* f, bool enabled, const std::string& path, FILE* log_out)
        : f_(enabled ? f : nullptr), path_(path), log_out_(log_out) {
        if (f_) {
            std::error_code ec = lock_file(f_);
            if (ec) {
                throw ResourceError("cannot lock trace file", path_, ec);
            }
        }
    }

    ~FileLock() {
        if (f_) {
            std::error_code ec = unlock_file(f_);
            if (ec) {
                log::warn(log_out_, "Could not unlock trace file %s: %s", path_.c_str(), ec.message().c_str());
            }
        }
    }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    FILE* f_;
    const std::string& path_;
    FILE* log_out_;
};

/**
 * @brief An open trace file in append mode.
 *
 * Several TraceFile objects, in this or other processes, may append to the
 * same path. Each append checks for an empty file, writes and flushes while
 * holding the file lock (unless Config::lock_appends is off).
 */
class TraceFile {
public:
    static constexpr const char* kOpenToken = "[\n";
    static constexpr const char* kSeparator = ",\n";

    /**
     * @brief Open (creating if needed) a trace file for appending.
     * @throws ResourceError if the file or its directories cannot be created
     */
    TraceFile(std::string path, const Config& cfg)
        : path_(std::move(path)), lock_(cfg.lock_appends), log_out_(cfg.log_out) {
        if (cfg.create_directories) {
            std::error_code ec = create_parent_dirs(path_);
            if (ec) {
                throw ResourceError("cannot create directories for trace file", path_, ec);
            }
        }
        f_ = safe_fopen(path_.c_str(), "ab");
        if (!f_) {
            throw ResourceError("cannot open trace file", path_, errno);
        }
        // Unbuffered, so a failed fwrite reports how much reached the file.
        std::setvbuf(f_, nullptr, _IONBF, 0);
    }

    ~TraceFile() {
        if (f_ && std::fclose(f_) != 0) {
            log::warn(log_out_, "Could not close trace file %s: %s", path_.c_str(), std::strerror(errno));
        }
    }

    TraceFile(const TraceFile&) = delete;
    TraceFile& operator=(const TraceFile&) = delete;

    const std::string& path() const { return path_; }

    /**
     * @brief Write the opening token if the file is still empty.
     */
    void open_array() { append_records(nullptr, 0, nullptr); }

    /**
     * @brief Append one encoded record.
     */
    void append(const std::string& record) { append_records(&record, 1, nullptr); }

    /**
     * @brief Append several encoded records in a single write.
     *
     * @param records Encoded records, without separators
     * @param committed If non-null, receives the number of leading records
     *        (separator included) that reached the file, also when a
     *        ResourceError is thrown. A record cut short by a failed write is
     *        not counted.
     */
    void append(const std::vector<std::string>& records, size_t* committed = nullptr) {
        append_records(records.data(), records.size(), committed);
    }

private:
    void append_records(const std::string* records, size_t count, size_t* committed) {
        if (committed) {
            *committed = 0;
        }
        size_t total = 0;
        for (size_t i = 0; i < count; ++i) {
            total += records[i].size() + 2;
        }

        FileLock lock(f_, lock_, path_, log_out_);

        // Size must be checked under the lock, another writer may have
        // created the array since this file was opened.
        if (std::fseek(f_, 0, SEEK_END) != 0) {
            throw ResourceError("cannot seek trace file", path_, errno);
        }
        long size = std::ftell(f_);
        if (size < 0) {
            throw ResourceError("cannot query size of trace file", path_, errno);
        }

        std::string chunk;
        chunk.reserve(total + 2);
        if (size == 0) {
            chunk += kOpenToken;
        }
        for (size_t i = 0; i < count; ++i) {
            chunk += records[i];
            chunk += kSeparator;
        }
        if (chunk.empty()) {
            return;
        }

        size_t written = std::fwrite(chunk.data(), 1, chunk.size(), f_);
        if (committed) {
            *committed = complete_records(records, count, size == 0 ? 2 : 0, written);
        }
        if (written != chunk.size()) {
            throw ResourceError("cannot write trace file", path_, errno);
        }
        if (std::fflush(f_) != 0) {
            throw ResourceError("cannot flush trace file", path_, errno);
        }
    }

    static size_t complete_records(const std::string* records, size_t count, size_t offset, size_t written) {
        size_t n = 0;
        while (n < count) {
            offset += records[n].size() + 2;
            if (offset > written) {
                break;
            }
            ++n;
        }
        return n;
    }

    std::string path_;
    bool lock_;
    FILE* log_out_;
    FILE* f_ = nullptr;
};

} // namespace etrace

#endif // ETRACE_TRACE_FILE_HPP
