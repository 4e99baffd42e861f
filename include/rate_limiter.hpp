#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include "config.hpp"

namespace reviewer {

using TimeSource = std::function<std::chrono::steady_clock::time_point()>;

/**
 * Token bucket in front of one category of engine calls.
 * Refill is computed lazily from elapsed time on every access, never by a timer.
 * Blocked callers are served strictly in arrival order.
 */
class TokenBucket {
public:
    // An empty time source means the steady clock.
    TokenBucket(double capacity, double refill_per_second, TimeSource now = {});

    // Blocks until a token is available; throws RateLimitExceeded once max_wait would be exceeded.
    void acquire(std::chrono::milliseconds max_wait);

    // Never blocks; fails while other callers are queued.
    bool try_acquire();

    double available_tokens() const;
    double capacity() const { return capacity_; }
    double refill_per_second() const { return refill_rate_; }

private:
    void refill_locked();
    void advance_serving_locked();

    const double capacity_;
    const double refill_rate_;
    TimeSource now_;

    double tokens_;
    std::chrono::steady_clock::time_point last_refill_;

    // FIFO ticketing
    uint64_t next_ticket_ = 0;
    uint64_t serving_ = 0;
    std::set<uint64_t> abandoned_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

// One bucket per "tier:model-prefix" category; categories never share state.
class RateLimitManager {
public:
    static constexpr int kDefaultRpm = 100;
    static constexpr const char* kDefaultCategoryKey = "default_unknown_model";

    explicit RateLimitManager(std::map<std::string, BucketConfig> overrides = {},
                              TimeSource now = {});

    // Longest known model prefix and its requests-per-minute. Throws ConfigError for unknown tiers.
    static std::pair<int, std::string> rpm_and_prefix(const std::string& model, const std::string& tier);
    static std::string category_for(const std::string& model, const std::string& tier);

    TokenBucket& bucket_for(const std::string& model, const std::string& tier);

    void acquire(const std::string& model, const std::string& tier, std::chrono::milliseconds max_wait) {
        bucket_for(model, tier).acquire(max_wait);
    }

private:
    std::map<std::string, BucketConfig> overrides_;
    TimeSource now_;
    std::map<std::string, std::unique_ptr<TokenBucket>> buckets_;
    std::mutex mutex_;
};

} // namespace reviewer
