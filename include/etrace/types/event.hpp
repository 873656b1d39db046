#ifndef ETRACE_EVENT_HPP
#define ETRACE_EVENT_HPP

/**
 * @file event.hpp
 * @brief Event record types, one per phase code
 *
 * Each phase has its own struct carrying exactly the fields that phase may
 * have. Optional fields left as std::nullopt are omitted from the JSON output.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

#include <nlohmann/json.hpp>

#include "enums.hpp"

namespace etrace {

/// JSON value type used for args. Keeps insertion order of keys.
using Json = nlohmann::ordered_json;

/// Optional string field (name, cat, id, scope).
using Text = std::optional<std::string>;

/// Optional args object.
using Args = std::optional<Json>;

/**
 * @brief Fields common to every event.
 */
struct Header {
    int64_t  ts  = 0;   ///< Microseconds since the Unix epoch
    uint32_t pid = 0;   ///< Process ID at emission
    uint64_t tid = 0;   ///< Thread ID at emission
};

/** @brief Span begin ("B"). */
struct BeginEvent {
    static constexpr Phase phase = Phase::Begin;
    Header      header;
    std::string name;
    Text        cat;
    Args        args;
};

/** @brief Span end ("E"). */
struct EndEvent {
    static constexpr Phase phase = Phase::End;
    Header header;
    Text   name;
    Text   cat;
    Args   args;
};

/** @brief Complete span ("X"); header.ts is the caller-supplied start. */
struct CompleteEvent {
    static constexpr Phase phase = Phase::Complete;
    Header  header;
    int64_t dur = 0;   ///< Duration in microseconds
    Text    name;
    Text    cat;
    Args    args;
};

/** @brief Instant ("I"). */
struct InstantEvent {
    static constexpr Phase phase = Phase::Instant;
    Header header;
    Text   name;
    Text   cat;
    Text   scope;   ///< "g", "p" or "t"; not validated
    Args   args;
};

/** @brief Counter sample ("C"); each args entry is one series. */
struct CounterEvent {
    static constexpr Phase phase = Phase::Counter;
    Header header;
    Text   name;
    Text   cat;
    Args   args;
};

/**
 * @brief Events correlated by id: async ("b"/"n"/"e") and flow ("s"/"t"/"f").
 */
template <Phase P>
struct IdEvent {
    static constexpr Phase phase = P;
    Header header;
    Text   name;
    Text   id;
    Text   cat;
    Args   args;
};

using AsyncBeginEvent   = IdEvent<Phase::AsyncBegin>;
using AsyncInstantEvent = IdEvent<Phase::AsyncInstant>;
using AsyncEndEvent     = IdEvent<Phase::AsyncEnd>;
using FlowBeginEvent    = IdEvent<Phase::FlowBegin>;
using FlowStepEvent     = IdEvent<Phase::FlowStep>;
using FlowEndEvent      = IdEvent<Phase::FlowEnd>;

/**
 * @brief Object lifecycle events ("N"/"O"/"D").
 */
template <Phase P>
struct ObjectEvent {
    static constexpr Phase phase = P;
    Header header;
    Text   name;
    Text   id;
    Text   cat;
    Args   args;
    Text   scope;
};

using ObjectCreatedEvent   = ObjectEvent<Phase::ObjectCreated>;
using ObjectSnapshotEvent  = ObjectEvent<Phase::ObjectSnapshot>;
using ObjectDestroyedEvent = ObjectEvent<Phase::ObjectDestroyed>;

/** @brief Metadata ("M"), e.g. process_name with args {"name": ...}. */
struct MetadataEvent {
    static constexpr Phase phase = Phase::Metadata;
    Header header;
    Text   name;
    Args   args;
};

/** @brief Mark ("R"). */
struct MarkEvent {
    static constexpr Phase phase = Phase::Mark;
    Header header;
    Text   name;
    Text   cat;
    Args   args;
};

/** @brief Clock sync ("c"); serialized with args {"sync_id", "issue_ts"}. */
struct ClockSyncEvent {
    static constexpr Phase phase = Phase::ClockSync;
    Header                 header;
    Text                   name;
    Text                   sync_id;
    std::optional<int64_t> issue_ts;
};

/**
 * @brief Context enter/leave ("(" / ")").
 */
template <Phase P>
struct ContextEvent {
    static constexpr Phase phase = P;
    Header header;
    Text   name;
    Text   id;
};

using ContextEnterEvent = ContextEvent<Phase::ContextEnter>;
using ContextLeaveEvent = ContextEvent<Phase::ContextLeave>;

/**
 * @brief A single trace event.
 */
using Event = std::variant<
    BeginEvent,
    EndEvent,
    CompleteEvent,
    InstantEvent,
    CounterEvent,
    AsyncBeginEvent,
    AsyncInstantEvent,
    AsyncEndEvent,
    FlowBeginEvent,
    FlowStepEvent,
    FlowEndEvent,
    ObjectCreatedEvent,
    ObjectSnapshotEvent,
    ObjectDestroyedEvent,
    MetadataEvent,
    MarkEvent,
    ClockSyncEvent,
    ContextEnterEvent,
    ContextLeaveEvent>;

/**
 * @brief Phase code of an event.
 */
inline Phase phase_of(const Event& e) {
    return std::visit([](const auto& ev) { return std::decay_t<decltype(ev)>::phase; }, e);
}

/**
 * @brief Common fields of an event.
 */
inline const Header& header_of(const Event& e) {
    return std::visit([](const auto& ev) -> const Header& { return ev.header; }, e);
}

} // namespace etrace

#endif // ETRACE_EVENT_HPP
