#pragma once
#include <deque>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace reviewer {

struct InteractionLog {
    long long timestamp;        // ms since epoch
    std::string session;
    std::string project_root;
    std::string model;
    std::string prompt_preview;  // last message sent
    std::string reply_preview;   // text or requested tools
    long long tokens_used;
    double duration_ms;
    std::string outcome;         // "ok" or an error code
};

// Last engine interactions, newest first, for /api/admin/logs.
class LogManager {
public:
    static constexpr size_t kCapacity = 50;

    static LogManager& instance() {
        static LogManager instance;
        return instance;
    }

    void add_log(const InteractionLog& log) {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.push_back(log);
        if (logs_.size() > kCapacity) {
            logs_.pop_front();
        }
    }

    nlohmann::json get_logs_json() const {
        std::lock_guard<std::mutex> lock(mtx_);
        nlohmann::json j_list = nlohmann::json::array();
        for (auto it = logs_.rbegin(); it != logs_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"session", it->session},
                {"project_root", it->project_root},
                {"model", it->model},
                {"prompt_preview", it->prompt_preview},
                {"reply_preview", it->reply_preview},
                {"tokens_used", it->tokens_used},
                {"duration_ms", it->duration_ms},
                {"outcome", it->outcome}
            });
        }
        return j_list;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return logs_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.clear();
    }

private:
    LogManager() = default;
    std::deque<InteractionLog> logs_;
    mutable std::mutex mtx_;
};

} // namespace reviewer
