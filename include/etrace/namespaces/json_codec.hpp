#ifndef ETRACE_JSON_CODEC_HPP
#define ETRACE_JSON_CODEC_HPP

/**
 * @file json_codec.hpp
 * @brief JSON encoding of event records
 *
 * Key order is fixed: ph, ts, pid, tid, then the phase's own fields. Absent
 * optional fields are skipped, so a record never contains null for a field
 * the caller did not provide.
 */

#include <cmath>
#include <string>

#include "../types/errors.hpp"
#include "../types/event.hpp"

namespace etrace {

namespace json_codec {

inline void put(Json& j, const char* key, const Text& v) {
    if (v) j[key] = *v;
}

inline void put(Json& j, const char* key, const Args& v) {
    if (v) j[key] = *v;
}

inline void put_header(Json& j, Phase ph, const Header& h) {
    j["ph"] = std::string(1, static_cast<char>(ph));
    j["ts"] = h.ts;
    j["pid"] = h.pid;
    j["tid"] = h.tid;
}

/**
 * @brief Reject values JSON cannot represent.
 *
 * nlohmann writes NaN/Inf as null and binary values as objects; both would
 * silently change what the caller recorded, so they are errors here.
 * Strings are checked for UTF-8 validity later, when dumping.
 */
inline void check_value(const Json& v) {
    switch (v.type()) {
        case Json::value_t::number_float:
            if (!std::isfinite(v.get<double>())) {
                throw SerializationError("non-finite number cannot be encoded as JSON");
            }
            break;
        case Json::value_t::binary:
            throw SerializationError("binary value cannot be encoded as JSON");
        case Json::value_t::object:
        case Json::value_t::array:
            for (const auto& item : v) {
                check_value(item);
            }
            break;
        default:
            break;
    }
}

} // namespace json_codec

inline void to_json(Json& j, const BeginEvent& e) {
    json_codec::put_header(j, e.phase, e.header);
    j["name"] = e.name;
    json_codec::put(j, "cat", e.cat);
    json_codec::put(j, "args", e.args);
}

inline void to_json(Json& j, const EndEvent& e) {
    json_codec::put_header(j, e.phase, e.header);
    json_codec::put(j, "name", e.name);
    json_codec::put(j, "cat", e.cat);
    json_codec::put(j, "args", e.args);
}

inline void to_json(Json& j, const CompleteEvent& e) {
    json_codec::put_header(j, e.phase, e.header);
    j["dur"] = e.dur;
    json_codec::put(j, "name", e.name);
    json_codec::put(j, "cat", e.cat);
    json_codec::put(j, "args", e.args);
}

inline void to_json(Json& j, const InstantEvent& e) {
    json_codec::put_header(j, e.phase, e.header);
    json_codec::put(j, "name", e.name);
    json_codec::put(j, "cat", e.cat);
    json_codec::put(j, "scope", e.scope);
    json_codec::put(j, "args", e.args);
}

inline void to_json(Json& j, const CounterEvent& e) {
    json_codec::put_header(j, e.phase, e.header);
    json_codec::put(j, "name", e.name);
    json_codec::put(j, "cat", e.cat);
    json_codec::put(j, "args", e.args);
}

template <Phase P>
inline void to_json(Json& j, const IdEvent<P>& e) {
    json_codec::put_header(j, P, e.header);
    json_codec::put(j, "name", e.name);
    json_codec::put(j, "id", e.id);
    json_codec::put(j, "cat", e.cat);
    json_codec::put(j, "args", e.args);
}

template <Phase P>
inline void to_json(Json& j, const ObjectEvent<P>& e) {
    json_codec::put_header(j, P, e.header);
    json_codec::put(j, "name", e.name);
    json_codec::put(j, "id", e.id);
    json_codec::put(j, "cat", e.cat);
    json_codec::put(j, "args", e.args);
    json_codec::put(j, "scope", e.scope);
}

inline void to_json(Json& j, const MetadataEvent& e) {
    json_codec::put_header(j, e.phase, e.header);
    json_codec::put(j, "name", e.name);
    json_codec::put(j, "args", e.args);
}

inline void to_json(Json& j, const MarkEvent& e) {
    json_codec::put_header(j, e.phase, e.header);
    json_codec::put(j, "name", e.name);
    json_codec::put(j, "cat", e.cat);
    json_codec::put(j, "args", e.args);
}

inline void to_json(Json& j, const ClockSyncEvent& e) {
    json_codec::put_header(j, e.phase, e.header);
    json_codec::put(j, "name", e.name);
    Json args = Json::object();
    json_codec::put(args, "sync_id", e.sync_id);
    if (e.issue_ts) args["issue_ts"] = *e.issue_ts;
    j["args"] = std::move(args);
}

template <Phase P>
inline void to_json(Json& j, const ContextEvent<P>& e) {
    json_codec::put_header(j, P, e.header);
    json_codec::put(j, "name", e.name);
    json_codec::put(j, "id", e.id);
}

namespace json_codec {

/**
 * @brief Build the JSON object of an event without validating it.
 */
inline Json to_object(const Event& e) {
    return std::visit([](const auto& ev) { return Json(ev); }, e);
}

/**
 * @brief Encode an event to a single-line JSON object.
 *
 * Runs entirely in memory, so a failure leaves every sink untouched.
 *
 * @throws SerializationError if args is not an object, or any value is
 *         non-finite, binary, or a string/key is not valid UTF-8
 */
inline std::string encode(const Event& e) {
    Json j = to_object(e);
    auto args = j.find("args");
    if (args != j.end() && !args->is_object()) {
        throw SerializationError("args must be a JSON object");
    }
    check_value(j);
    try {
        return j.dump(-1, ' ', false, Json::error_handler_t::strict);
    }
    catch (const nlohmann::json::exception& ex) {
        throw SerializationError(std::string("cannot encode event: ") + ex.what());
    }
}

} // namespace json_codec

} // namespace etrace

#endif // ETRACE_JSON_CODEC_HPP
