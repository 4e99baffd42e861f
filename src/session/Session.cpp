#include "session/Session.hpp"
#include <chrono>

namespace reviewer {

using json = nlohmann::json;

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch()).count();
}

json Message::to_json() const {
    json j = {{"role", role}, {"content", content}};
    if (!tool.is_null()) j["tool"] = tool;
    return j;
}

Message Message::from_json(const json& j) {
    Message m;
    m.role = j.at("role").get<std::string>();
    m.content = j.value("content", "");
    if (j.contains("tool")) m.tool = j["tool"];
    return m;
}

json Session::to_json() const {
    json history = json::array();
    for (const auto& m : message_history) history.push_back(m.to_json());

    return json{
        {"id", id},
        {"name", name},
        {"project_root", project_root},
        {"created_at", created_at},
        {"last_updated", last_updated},
        {"message_history", history},
        {"navigation_state", trace_to_json(navigation_state)},
        {"iteration_count", iteration_count},
        {"cumulative_token_estimate", cumulative_token_estimate},
        {"last_issues_count", last_issues_count}
    };
}

Session Session::from_json(const json& j) {
    Session s;
    s.id = j.at("id").get<std::string>();
    s.name = j.at("name").get<std::string>();
    s.project_root = j.at("project_root").get<std::string>();
    s.created_at = j.at("created_at").get<int64_t>();
    s.last_updated = j.at("last_updated").get<int64_t>();
    for (const auto& m : j.value("message_history", json::array())) s.message_history.push_back(Message::from_json(m));
    s.navigation_state = trace_from_json(j.value("navigation_state", json::array()));
    s.iteration_count = j.value("iteration_count", int64_t{0});
    s.cumulative_token_estimate = j.value("cumulative_token_estimate", int64_t{0});
    s.last_issues_count = j.value("last_issues_count", int64_t{0});
    return s;
}

SessionSummary SessionSummary::of(const Session& s) {
    SessionSummary sum;
    sum.id = s.id;
    sum.name = s.name;
    sum.project_root = s.project_root;
    sum.created_at = s.created_at;
    sum.last_updated = s.last_updated;
    sum.iteration_count = s.iteration_count;
    sum.message_count = s.message_history.size();
    sum.cumulative_token_estimate = s.cumulative_token_estimate;
    return sum;
}

json SessionSummary::to_json() const {
    return json{
        {"id", id},
        {"name", name},
        {"project_root", project_root},
        {"created_at", created_at},
        {"last_updated", last_updated},
        {"iteration_count", iteration_count},
        {"message_count", message_count},
        {"cumulative_token_estimate", cumulative_token_estimate}
    };
}

} // namespace reviewer
