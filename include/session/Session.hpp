#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "tools/NavigationTrace.hpp"

namespace reviewer {

// One turn of the conversation with the reasoning engine.
//   role "user":  content holds the prompt text
//   role "model": content holds answer text; tool = {"calls": [{"name", "args"}]} when it asked for tools
//   role "tool":  tool = {"name", "response"} for one executed (or refused) call
struct Message {
    std::string role;
    std::string content;
    nlohmann::json tool; // null when absent

    nlohmann::json to_json() const;
    static Message from_json(const nlohmann::json& j);

    bool operator==(const Message& o) const { return role == o.role && content == o.content && tool == o.tool; }
};

struct Session {
    std::string id;
    std::string name;
    std::string project_root;   // canonical
    int64_t created_at = 0;     // ms since epoch
    int64_t last_updated = 0;   // ms since epoch
    std::vector<Message> message_history;
    NavigationTrace navigation_state;
    int64_t iteration_count = 0;
    int64_t cumulative_token_estimate = 0;
    int64_t last_issues_count = 0;

    nlohmann::json to_json() const;
    static Session from_json(const nlohmann::json& j);

    bool operator==(const Session& o) const {
        return id == o.id && name == o.name && project_root == o.project_root && created_at == o.created_at &&
               last_updated == o.last_updated && message_history == o.message_history &&
               navigation_state == o.navigation_state && iteration_count == o.iteration_count &&
               cumulative_token_estimate == o.cumulative_token_estimate && last_issues_count == o.last_issues_count;
    }
};

struct SessionSummary {
    std::string id;
    std::string name;
    std::string project_root;
    int64_t created_at = 0;
    int64_t last_updated = 0;
    int64_t iteration_count = 0;
    size_t message_count = 0;
    int64_t cumulative_token_estimate = 0;

    static SessionSummary of(const Session& s);
    nlohmann::json to_json() const;
};

int64_t now_ms();

} // namespace reviewer
