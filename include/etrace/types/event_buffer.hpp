#ifndef ETRACE_EVENT_BUFFER_HPP
#define ETRACE_EVENT_BUFFER_HPP

/**
 * @file event_buffer.hpp
 * @brief In-memory sink of a buffered tracer
 */

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "event.hpp"

namespace etrace {

/**
 * @brief Ordered sequence of events with their JSON encodings.
 *
 * Each record is encoded when it is pushed, so a later flush only has to
 * concatenate text and can never fail on serialization.
 */
class EventBuffer {
public:
    void push(Event e, std::string encoded) {
        events_.push_back(std::move(e));
        encoded_.push_back(std::move(encoded));
    }

    const std::vector<Event>& events() const { return events_; }
    const std::vector<std::string>& encoded() const { return encoded_; }

    size_t size() const { return events_.size(); }
    bool empty() const { return events_.empty(); }

    /**
     * @brief Take all records, leaving this buffer empty.
     *
     * Swap-based: records are moved out as a whole, never copied or split.
     */
    EventBuffer drain() {
        EventBuffer out;
        out.events_.swap(events_);
        out.encoded_.swap(encoded_);
        return out;
    }

    /**
     * @brief Put previously drained records back in front of current ones.
     * @param drained Records returned by drain()
     * @param skip Number of leading drained records to discard instead
     */
    void restore(EventBuffer&& drained, size_t skip = 0) {
        skip = std::min(skip, drained.events_.size());
        drained.events_.erase(drained.events_.begin(), drained.events_.begin() + (std::ptrdiff_t)skip);
        drained.encoded_.erase(drained.encoded_.begin(), drained.encoded_.begin() + (std::ptrdiff_t)skip);
        drained.events_.insert(drained.events_.end(),
                               std::make_move_iterator(events_.begin()),
                               std::make_move_iterator(events_.end()));
        drained.encoded_.insert(drained.encoded_.end(),
                                std::make_move_iterator(encoded_.begin()),
                                std::make_move_iterator(encoded_.end()));
        events_.swap(drained.events_);
        encoded_.swap(drained.encoded_);
    }

private:
    std::vector<Event> events_;
    std::vector<std::string> encoded_;
};

} // namespace etrace

#endif // ETRACE_EVENT_BUFFER_HPP
