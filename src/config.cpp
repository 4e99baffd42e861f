#include "config.hpp"
#include "errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>

namespace reviewer {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    return home ? fs::path(home) : fs::temp_directory_path();
}

} // namespace

std::string default_session_dir() {
    return (home_dir() / ".local" / "share" / "reviewer" / "sessions").string();
}

ReviewBounds bounds_from_json(const json& j, const ReviewBounds& fallback) {
    ReviewBounds b = fallback;
    if (!j.is_object()) return b;
    b.max_tool_calls = j.value("max_tool_calls", fallback.max_tool_calls);
    b.max_wall_clock = std::chrono::seconds(
        j.value("max_wall_clock_seconds", static_cast<long long>(fallback.max_wall_clock.count())));
    b.max_distinct_files = j.value("max_distinct_files", fallback.max_distinct_files);
    if (b.max_tool_calls < 0 || b.max_distinct_files < 0 || b.max_wall_clock.count() <= 0) {
        throw ReviewerError(ErrorCode::ConfigError, "Review bounds must be non-negative with a positive wall clock");
    }
    return b;
}

ReviewerConfig ReviewerConfig::from_json(const json& j) {
    ReviewerConfig cfg;
    cfg.session_dir = default_session_dir();
    if (!j.is_object()) return cfg;

    try {
        cfg.ignore_patterns = j.value("ignore_patterns", std::vector<std::string>{});
        if (j.contains("bounds")) cfg.bounds = bounds_from_json(j["bounds"], cfg.bounds);

        if (j.contains("rate_limits")) {
            for (const auto& [category, bucket] : j["rate_limits"].items()) {
                BucketConfig bc;
                bc.capacity = bucket.value("capacity", 0.0);
                bc.refill_per_second = bucket.value("refill_per_second", 0.0);
                if (bc.capacity < 1.0 || bc.refill_per_second <= 0.0) {
                    throw ReviewerError(ErrorCode::ConfigError,
                                        "Rate limit for '" + category + "' needs capacity >= 1 and a positive refill rate");
                }
                cfg.rate_limits[category] = bc;
            }
        }

        cfg.rate_limit_wait = std::chrono::milliseconds(
            static_cast<long long>(j.value("rate_limit_wait_seconds", 30.0) * 1000.0));
        cfg.read_file_max_bytes = j.value("read_file_max_bytes", cfg.read_file_max_bytes);
        cfg.session_dir = j.value("session_dir", cfg.session_dir);
        cfg.session_wait = std::chrono::milliseconds(j.value("session_wait_ms", 0LL));
        cfg.model = j.value("model", cfg.model);
        cfg.tier = j.value("tier", cfg.tier);
        cfg.history_digest_chars = j.value("history_digest_chars", cfg.history_digest_chars);

        if (j.contains("service")) {
            cfg.service.host = j["service"].value("host", cfg.service.host);
            cfg.service.port = j["service"].value("port", cfg.service.port);
        }
    } catch (const json::exception& e) {
        throw ReviewerError(ErrorCode::ConfigError, std::string("Invalid config value: ") + e.what());
    }
    return cfg;
}

ReviewerConfig load_config(const std::string& project_root, const std::string& explicit_path) {
    std::vector<fs::path> search_paths;
    if (!explicit_path.empty()) search_paths.emplace_back(explicit_path);
    if (const char* env = std::getenv("REVIEWER_CONFIG")) search_paths.emplace_back(env);
    if (!project_root.empty()) search_paths.push_back(fs::path(project_root) / ".reviewer" / "config.json");
    search_paths.push_back(home_dir() / ".config" / "reviewer" / "config.json");

    for (const auto& path : search_paths) {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            if (!explicit_path.empty() && path == fs::path(explicit_path)) {
                throw ReviewerError(ErrorCode::ConfigError, "Config file not found: " + path.string());
            }
            continue;
        }

        std::ifstream f(path);
        json j;
        try {
            j = json::parse(f);
        } catch (const json::parse_error& e) {
            spdlog::error("❌ Config corrupted at {}", path.string());
            throw ReviewerError(ErrorCode::ConfigError, "Malformed config " + path.string() + ": " + e.what());
        }
        auto cfg = ReviewerConfig::from_json(j);
        spdlog::info("⚙️  Config loaded from {}: {} ignore patterns, {} rate limit overrides.",
                     path.string(), cfg.ignore_patterns.size(), cfg.rate_limits.size());
        return cfg;
    }

    return ReviewerConfig::from_json(json::object());
}

} // namespace reviewer
