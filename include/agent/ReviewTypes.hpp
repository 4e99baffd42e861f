#pragma once
#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "errors.hpp"
#include "index/codebase_index.hpp"
#include "tools/NavigationTrace.hpp"

namespace reviewer {

enum class ReviewState { Init, Seeded, Exploring, TerminatedNormal, TerminatedBound, TerminatedError };

const char* to_string(ReviewState state);

struct ReviewRequest {
    std::string project_root;
    std::string session_name = "default";
    std::vector<std::string> changed_files;
    std::string diffs;
    std::string design_doc;
    std::string story;
    std::string model;                  // empty means the configured model
    std::optional<ReviewBounds> bounds; // empty means the configured bounds

    // Throws InvalidArguments on missing project_root or wrongly typed fields.
    static ReviewRequest from_json(const nlohmann::json& j, const ReviewBounds& defaults);
};

// Caller-side stop signal, checked whenever the review is about to wait on the engine.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }

    void set_deadline(std::chrono::steady_clock::time_point deadline) {
        deadline_ns_.store(deadline.time_since_epoch().count());
    }

    bool cancelled() const {
        if (cancelled_.load()) return true;
        auto deadline = deadline_ns_.load();
        return deadline != 0 && std::chrono::steady_clock::now().time_since_epoch().count() >= deadline;
    }

private:
    std::atomic<bool> cancelled_{false};
    std::atomic<std::chrono::steady_clock::rep> deadline_ns_{0};
};

struct SessionInfo {
    std::string name;
    std::string status = "new"; // new | continued
    int64_t iteration = 0;
    int64_t created_at = 0;
    int64_t last_reviewed = 0;
    size_t chat_messages_count = 0;
    int64_t previous_issues_count = 0;

    nlohmann::json to_json() const;
};

struct ReviewFailure {
    ErrorCode code;
    std::string message;
};

struct ReviewResult {
    ReviewState final_state = ReviewState::Init;
    std::vector<ReviewState> transitions;
    std::string answer;
    std::optional<ReviewFailure> error;
    NavigationTrace trace;
    nlohmann::json navigation_summary = nlohmann::json::object();
    SessionInfo session;
    int64_t tokens_used = 0;
    int64_t issues_found = 0;
    IndexStats index_stats;

    bool reached(ReviewState state) const;
    nlohmann::json to_json() const;
};

// Markers counted as findings in an answer: ISSUE:, ERROR:, WARNING:, FILE:, Line:
int64_t count_issues(const std::string& answer);

// "just now", "5 minutes ago", "1 hour ago", "3 days ago"
std::string format_time_ago(int64_t then_ms, int64_t now_ms);

} // namespace reviewer
