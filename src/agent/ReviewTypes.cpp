#include "agent/ReviewTypes.hpp"
#include <algorithm>

namespace reviewer {

using json = nlohmann::json;

const char* to_string(ReviewState state) {
    switch (state) {
        case ReviewState::Init:             return "INIT";
        case ReviewState::Seeded:           return "SEEDED";
        case ReviewState::Exploring:        return "EXPLORING";
        case ReviewState::TerminatedNormal: return "TERMINATED_NORMAL";
        case ReviewState::TerminatedBound:  return "TERMINATED_BOUND";
        case ReviewState::TerminatedError:  return "TERMINATED_ERROR";
    }
    return "UNKNOWN";
}

ReviewRequest ReviewRequest::from_json(const json& j, const ReviewBounds& defaults) {
    if (!j.is_object()) {
        throw ReviewerError(ErrorCode::InvalidArguments, "Review request must be a JSON object");
    }
    if (!j.contains("project_root") || !j["project_root"].is_string() ||
        j["project_root"].get<std::string>().empty()) {
        throw ReviewerError(ErrorCode::InvalidArguments, "project_root is required");
    }

    ReviewRequest req;
    try {
        req.project_root = j["project_root"].get<std::string>();
        req.session_name = j.value("session_name", req.session_name);
        if (req.session_name.empty()) req.session_name = "default";
        req.changed_files = j.value("changed_files", std::vector<std::string>{});
        req.diffs = j.value("diffs", "");
        req.design_doc = j.value("design_doc", "");
        req.story = j.value("story", "");
        req.model = j.value("model", "");
        if (j.contains("bounds") && !j["bounds"].is_null()) {
            req.bounds = bounds_from_json(j["bounds"], defaults);
        }
    } catch (const json::exception& e) {
        throw ReviewerError(ErrorCode::InvalidArguments, std::string("Malformed review request: ") + e.what());
    } catch (const ReviewerError& e) {
        throw ReviewerError(ErrorCode::InvalidArguments, e.what());
    }
    return req;
}

json SessionInfo::to_json() const {
    return json{
        {"name", name},
        {"status", status},
        {"iteration", iteration},
        {"created_at", created_at},
        {"last_reviewed", last_reviewed},
        {"chat_messages_count", chat_messages_count},
        {"previous_issues_count", previous_issues_count}
    };
}

bool ReviewResult::reached(ReviewState state) const {
    return std::find(transitions.begin(), transitions.end(), state) != transitions.end();
}

json ReviewResult::to_json() const {
    json states = json::array();
    for (auto s : transitions) states.push_back(to_string(s));

    json j = {
        {"final_state", to_string(final_state)},
        {"transitions", states},
        {"answer", answer},
        {"error", nullptr},
        {"trace", trace_to_json(trace)},
        {"navigation_summary", navigation_summary},
        {"tokens_used", tokens_used},
        {"issues_found", issues_found},
        {"index_stats", index_stats.to_json()}
    };
    if (error) j["error"] = {{"code", to_string(error->code)}, {"message", error->message}};
    return j;
}

int64_t count_issues(const std::string& answer) {
    static const char* markers[] = {"ISSUE:", "ERROR:", "WARNING:", "FILE:", "Line:"};
    int64_t count = 0;
    for (const char* marker : markers) {
        const std::string m(marker);
        for (size_t pos = answer.find(m); pos != std::string::npos; pos = answer.find(m, pos + m.size())) {
            ++count;
        }
    }
    return count;
}

std::string format_time_ago(int64_t then_ms, int64_t now_ms) {
    int64_t seconds = std::max<int64_t>(0, (now_ms - then_ms) / 1000);
    auto plural = [](int64_t n, const char* unit) {
        return std::to_string(n) + " " + unit + (n == 1 ? "" : "s") + " ago";
    };
    if (seconds < 60) return "just now";
    if (seconds < 3600) return plural(seconds / 60, "minute");
    if (seconds < 86400) return plural(seconds / 3600, "hour");
    return plural(seconds / 86400, "day");
}

} // namespace reviewer
