#ifndef ETRACE_DEPTH_TRACKER_HPP
#define ETRACE_DEPTH_TRACKER_HPP

/**
 * @file depth_tracker.hpp
 * @brief Count of open begin spans per process
 */

#include <cstdint>
#include <map>

namespace etrace {

/**
 * @brief Open-span counter keyed by process ID.
 *
 * All threads of one process share a count. An entry is created by the first
 * increment() or decrement() for a pid and is never removed. The count may go
 * negative when end() is called without a matching begin(); that is left to
 * the caller.
 */
class DepthTracker {
public:
    void increment(uint32_t pid) { ++depths_[pid]; }
    void decrement(uint32_t pid) { --depths_[pid]; }

    /// Whether pid has ever been seen.
    bool tracks(uint32_t pid) const { return depths_.count(pid) != 0; }

    /// Open spans for pid (0 if never seen).
    int64_t depth(uint32_t pid) const {
        auto it = depths_.find(pid);
        return it == depths_.end() ? 0 : it->second;
    }

private:
    std::map<uint32_t, int64_t> depths_;
};

} // namespace etrace

#endif // ETRACE_DEPTH_TRACKER_HPP
