#include "rate_limiter.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <vector>
#include <spdlog/spdlog.h>

namespace reviewer {

using namespace std::chrono;

namespace {

// Absorbs floating point drift so that exactly 1/R seconds yields exactly one token.
constexpr double kEpsilon = 1e-9;

const std::vector<std::pair<std::string, int>>& tier1_limits() {
    // Longest prefix first
    static const std::vector<std::pair<std::string, int>> limits = [] {
        std::vector<std::pair<std::string, int>> v = {
            {"gemini-2.5-pro", 150},
            {"gemini-2.5-flash", 1000},
            {"gemini-2.0-flash", 2000},
            {"gemini-2.0-flash-lite", 4000},
        };
        std::stable_sort(v.begin(), v.end(), [](const auto& a, const auto& b) { return a.first.size() > b.first.size(); });
        return v;
    }();
    return limits;
}

} // namespace

// --- 1. TOKEN BUCKET ---

TokenBucket::TokenBucket(double capacity, double refill_per_second, TimeSource now)
    : capacity_(capacity), refill_rate_(refill_per_second), now_(std::move(now)) {
    if (!now_) now_ = [] { return steady_clock::now(); };
    if (capacity_ < 1.0 || refill_rate_ <= 0.0) {
        throw ReviewerError(ErrorCode::ConfigError, "Token bucket needs capacity >= 1 and a positive refill rate");
    }
    tokens_ = capacity_;
    last_refill_ = now_();
}

void TokenBucket::refill_locked() {
    auto now = now_();
    if (now <= last_refill_) return;
    double elapsed = duration<double>(now - last_refill_).count();
    tokens_ = std::min(capacity_, tokens_ + elapsed * refill_rate_);
    last_refill_ = now;
}

void TokenBucket::advance_serving_locked() {
    ++serving_;
    while (abandoned_.count(serving_)) {
        abandoned_.erase(serving_);
        ++serving_;
    }
}

void TokenBucket::acquire(milliseconds max_wait) {
    std::unique_lock<std::mutex> lock(mutex_);
    const uint64_t ticket = next_ticket_++;
    const auto deadline = steady_clock::now() + max_wait;

    auto give_up = [&]() {
        if (ticket == serving_) advance_serving_locked();
        else abandoned_.insert(ticket);
        cv_.notify_all();
        spdlog::warn("⏳ Rate limit: no token within {} ms", max_wait.count());
        throw ReviewerError(ErrorCode::RateLimitExceeded,
                            "Rate limit exceeded: no token available within " + std::to_string(max_wait.count()) + " ms");
    };

    while (true) {
        auto wake = deadline;
        if (ticket == serving_) {
            refill_locked();
            if (tokens_ + kEpsilon >= 1.0) {
                tokens_ = std::max(0.0, tokens_ - 1.0);
                advance_serving_locked();
                cv_.notify_all();
                return;
            }
            auto needed = duration_cast<steady_clock::duration>(duration<double>((1.0 - tokens_) / refill_rate_));
            if (steady_clock::now() + needed > deadline) give_up();
            wake = std::min(deadline, steady_clock::now() + needed);
        } else if (steady_clock::now() >= deadline) {
            give_up();
        }
        cv_.wait_until(lock, wake);
        if (ticket != serving_ && steady_clock::now() >= deadline) give_up();
    }
}

bool TokenBucket::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (serving_ != next_ticket_) return false; // someone is queued
    refill_locked();
    if (tokens_ + kEpsilon < 1.0) return false;
    tokens_ = std::max(0.0, tokens_ - 1.0);
    return true;
}

double TokenBucket::available_tokens() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = now_();
    if (now <= last_refill_) return tokens_;
    double elapsed = duration<double>(now - last_refill_).count();
    return std::min(capacity_, tokens_ + elapsed * refill_rate_);
}

// --- 2. MANAGER ---

RateLimitManager::RateLimitManager(std::map<std::string, BucketConfig> overrides, TimeSource now)
    : overrides_(std::move(overrides)), now_(std::move(now)) {}

std::pair<int, std::string> RateLimitManager::rpm_and_prefix(const std::string& model, const std::string& tier) {
    if (tier != "tier1") {
        throw ReviewerError(ErrorCode::ConfigError, "Unsupported tier: " + tier);
    }
    std::string lower = model;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& [prefix, rpm] : tier1_limits()) {
        if (lower.rfind(prefix, 0) == 0) return {rpm, prefix};
    }
    // Unknown models share one bucket
    return {kDefaultRpm, kDefaultCategoryKey};
}

std::string RateLimitManager::category_for(const std::string& model, const std::string& tier) {
    return tier + ":" + rpm_and_prefix(model, tier).second;
}

TokenBucket& RateLimitManager::bucket_for(const std::string& model, const std::string& tier) {
    auto [rpm, prefix] = rpm_and_prefix(model, tier);
    const std::string key = tier + ":" + prefix;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buckets_.find(key);
    if (it != buckets_.end()) return *it->second;

    double capacity = rpm;
    double refill = rpm / 60.0;
    auto o = overrides_.find(key);
    if (o != overrides_.end()) {
        capacity = o->second.capacity;
        refill = o->second.refill_per_second;
    }
    spdlog::info("🚦 Rate bucket {}: capacity {}, refill {:.3f}/s", key, capacity, refill);
    auto bucket = std::make_unique<TokenBucket>(capacity, refill, now_);
    TokenBucket& ref = *bucket;
    buckets_.emplace(key, std::move(bucket));
    return ref;
}

} // namespace reviewer
