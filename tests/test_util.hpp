#pragma once
#include <cassert>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "engine/ReasoningEngine.hpp"
#include "errors.hpp"

namespace test_util {

namespace fs = std::filesystem;

// A fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "reviewer_test") {
        std::string pattern = (fs::temp_directory_path() / (prefix + "_XXXXXX")).string();
        std::vector<char> buf(pattern.begin(), pattern.end());
        buf.push_back('\0');
        char* made = ::mkdtemp(buf.data());
        assert(made != nullptr);
        path_ = fs::canonical(made);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

    // Writes a file relative to the directory, creating parents.
    fs::path write(const std::string& rel, const std::string& content) const {
        fs::path p = path_ / rel;
        fs::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        out << content;
        return p;
    }

private:
    fs::path path_;
};

// Expects `fn` to throw a ReviewerError carrying `code`.
template <typename Fn>
void expect_error(reviewer::ErrorCode code, Fn&& fn) {
    try {
        fn();
    } catch (const reviewer::ReviewerError& e) {
        assert(e.code() == code);
        return;
    }
    assert(false && "expected a ReviewerError");
}

inline reviewer::EngineReply answer(const std::string& text, int64_t tokens = 10) {
    reviewer::EngineReply r;
    r.text = text;
    r.tokens_used = tokens;
    return r;
}

inline reviewer::EngineReply call(const std::string& name, nlohmann::json args, int64_t tokens = 10) {
    reviewer::EngineReply r;
    r.tool_calls.push_back({name, std::move(args)});
    r.tokens_used = tokens;
    return r;
}

/**
 * Replays queued replies in order and records every request it receives.
 * An empty queue answers "done"; a queued error is thrown instead of replied.
 */
class ScriptedEngine : public reviewer::IReasoningEngine {
public:
    void push(reviewer::EngineReply reply) { script_.push_back(Step{std::move(reply), std::nullopt}); }
    void push_error(reviewer::ErrorCode code) { script_.push_back(Step{{}, code}); }

    // Called before each reply; lets a test act between turns.
    std::function<void(const reviewer::EngineRequest&)> on_request;

    reviewer::EngineReply complete(const reviewer::EngineRequest& request) override {
        requests.push_back(request);
        if (on_request) on_request(request);
        if (script_.empty()) return answer("done");
        Step step = std::move(script_.front());
        script_.pop_front();
        if (step.error) throw reviewer::ReviewerError(*step.error, "scripted failure");
        return step.reply;
    }

    std::vector<reviewer::EngineRequest> requests;

private:
    struct Step {
        reviewer::EngineReply reply;
        std::optional<reviewer::ErrorCode> error;
    };
    std::deque<Step> script_;
};

inline void quiet_logs() { spdlog::set_level(spdlog::level::warn); }

} // namespace test_util
