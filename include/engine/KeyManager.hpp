#pragma once
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace reviewer {

// Pool of engine API keys with rotation on quota errors.
// Sources: GEMINI_API_KEY (comma separated), else the first keys.json found.
class KeyManager {
private:
    struct ApiKey {
        std::string key;
        bool is_active = true;
        int fail_count = 0;
    };

    std::vector<ApiKey> key_pool;
    mutable std::shared_mutex pool_mutex;
    size_t current_index = 0;

public:
    KeyManager() { refresh_key_pool(); }

    explicit KeyManager(std::vector<std::string> keys) {
        for (auto& k : keys) {
            if (!k.empty()) key_pool.push_back({std::move(k), true, 0});
        }
    }

    void refresh_key_pool() {
        std::unique_lock lock(pool_mutex);
        key_pool.clear();
        current_index = 0;

        if (const char* env = std::getenv("GEMINI_API_KEY")) {
            std::stringstream ss(env);
            std::string item;
            while (std::getline(ss, item, ',')) {
                if (!item.empty()) key_pool.push_back({item, true, 0});
            }
            if (!key_pool.empty()) {
                spdlog::info("🔑 Key pool from GEMINI_API_KEY: {} key(s)", key_pool.size());
                return;
            }
        }

        const std::vector<std::string> search_paths = {"keys.json", "../keys.json", "build/keys.json"};
        std::ifstream f;
        std::string found_path;
        for (const auto& path : search_paths) {
            f.open(path);
            if (f.is_open()) {
                found_path = path;
                break;
            }
        }

        if (found_path.empty()) {
            spdlog::warn("⚠️ No API keys: set GEMINI_API_KEY or provide keys.json");
            return;
        }

        try {
            auto j = nlohmann::json::parse(f);
            for (auto& k : j.at("keys")) {
                key_pool.push_back({k.get<std::string>(), true, 0});
            }
            spdlog::info("🔑 Key pool from {}: {} key(s)", found_path, key_pool.size());
        } catch (const nlohmann::json::exception& e) {
            spdlog::error("💥 Failed to parse {}: {}", found_path, e.what());
        }
    }

    size_t get_active_key_count() const {
        std::shared_lock lock(pool_mutex);
        size_t count = 0;
        for (const auto& k : key_pool) {
            if (k.is_active) count++;
        }
        return count;
    }

    std::string get_current_key() const {
        std::shared_lock lock(pool_mutex);
        if (key_pool.empty()) return "";
        return key_pool[current_index % key_pool.size()].key;
    }

    // Marks a quota failure on the current key and moves to the next active one.
    void report_rate_limit() {
        std::unique_lock lock(pool_mutex);
        if (key_pool.empty()) return;

        auto& current = key_pool[current_index % key_pool.size()];
        current.fail_count++;
        if (current.fail_count > 2 && key_pool.size() > 1) {
            current.is_active = false;
            spdlog::warn("⚠️ Key #{} decommissioned", current_index % key_pool.size());
        }
        for (size_t step = 1; step <= key_pool.size(); ++step) {
            size_t next = (current_index + step) % key_pool.size();
            if (key_pool[next].is_active) {
                current_index = next;
                return;
            }
        }
    }
};

} // namespace reviewer
