#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace reviewer {

using json = nlohmann::json;

// One dispatched tool call. reason_tag: ok, cache, not_found, outside_sandbox, invalid_arguments.
struct TraceEntry {
    std::string tool;
    json arguments = json::object();
    size_t result_size = 0;
    std::string reason_tag;

    json to_json() const {
        return json{{"tool", tool}, {"arguments", arguments}, {"result_size", result_size}, {"reason_tag", reason_tag}};
    }

    static TraceEntry from_json(const json& j) {
        TraceEntry e;
        e.tool = j.value("tool", "");
        e.arguments = j.value("arguments", json::object());
        e.result_size = j.value("result_size", size_t{0});
        e.reason_tag = j.value("reason_tag", "");
        return e;
    }

    bool operator==(const TraceEntry& o) const {
        return tool == o.tool && arguments == o.arguments && result_size == o.result_size && reason_tag == o.reason_tag;
    }
};

// Append-only for the duration of one review.
using NavigationTrace = std::vector<TraceEntry>;

inline json trace_to_json(const NavigationTrace& trace) {
    json arr = json::array();
    for (const auto& e : trace) arr.push_back(e.to_json());
    return arr;
}

inline NavigationTrace trace_from_json(const json& j) {
    NavigationTrace trace;
    if (!j.is_array()) return trace;
    for (const auto& e : j) trace.push_back(TraceEntry::from_json(e));
    return trace;
}

} // namespace reviewer
