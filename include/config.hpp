#pragma once
#include <chrono>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace reviewer {

// Exploration limits for one review. Crossing any of them ends the review in TERMINATED_BOUND.
struct ReviewBounds {
    int max_tool_calls = 20;
    std::chrono::seconds max_wall_clock{300};
    int max_distinct_files = 40;
};

struct BucketConfig {
    double capacity = 0.0;
    double refill_per_second = 0.0;
};

struct ServiceConfig {
    std::string host = "127.0.0.1";
    int port = 8765;
};

struct ReviewerConfig {
    std::vector<std::string> ignore_patterns;
    ReviewBounds bounds;
    std::map<std::string, BucketConfig> rate_limits; // key: "tier:model-prefix"
    std::chrono::milliseconds rate_limit_wait{30000};
    size_t read_file_max_bytes = 100000;
    std::string session_dir;
    std::chrono::milliseconds session_wait{0};
    std::string model = "gemini-2.5-pro";
    std::string tier = "tier1";
    size_t history_digest_chars = 3000;
    ServiceConfig service;

    static ReviewerConfig from_json(const nlohmann::json& j);
};

ReviewBounds bounds_from_json(const nlohmann::json& j, const ReviewBounds& fallback);

std::string default_session_dir();

// Search order: explicit path, $REVIEWER_CONFIG, <project>/.reviewer/config.json,
// ~/.config/reviewer/config.json. No file means defaults.
ReviewerConfig load_config(const std::string& project_root, const std::string& explicit_path = "");

} // namespace reviewer
