#pragma once
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "agent/ContextBuilder.hpp"
#include "agent/ReviewTypes.hpp"
#include "config.hpp"
#include "engine/ReasoningEngine.hpp"
#include "index/codebase_index.hpp"
#include "rate_limiter.hpp"
#include "session/SessionStore.hpp"

namespace reviewer {

/**
 * Runs one review: INIT -> SEEDED -> EXPLORING -> TERMINATED_*.
 *
 * The store, limiter and engine are shared across concurrent reviews and must outlive
 * the orchestrator. A review is single threaded; reviews of the same session are
 * serialized by the store's lease. Every call returns a ReviewResult, and once the
 * session is loaded it is persisted before returning.
 */
class ReviewOrchestrator {
public:
    // Least recently used project indexes are dropped past this many
    static constexpr size_t kMaxCachedIndexes = 8;

    ReviewOrchestrator(SessionStore& store, RateLimitManager& limiter, IReasoningEngine& engine,
                       ReviewerConfig config);

    ReviewResult run(const ReviewRequest& request, const CancellationToken* cancel = nullptr);

    // Index snapshot for a project; reused across reviews and refreshed for the changed files.
    std::shared_ptr<const CodebaseIndex> index_for(const std::string& canonical_root,
                                                   const std::vector<std::string>& changed_files);

    size_t cached_indexes() const {
        std::lock_guard<std::mutex> lock(index_mutex_);
        return indexes_.size();
    }

    size_t active_reviews() const { return active_.load(); }
    const ReviewerConfig& config() const { return config_; }

private:
    struct Turn;
    struct CachedIndex {
        std::shared_ptr<const CodebaseIndex> index;
        uint64_t last_used = 0;
    };

    EngineReply call_engine(Turn& turn, const nlohmann::json& tools);

    SessionStore& store_;
    RateLimitManager& limiter_;
    IReasoningEngine& engine_;
    ReviewerConfig config_;
    ContextBuilder context_;

    mutable std::mutex index_mutex_;
    std::map<std::string, CachedIndex> indexes_;
    uint64_t index_clock_ = 0;
    std::atomic<size_t> active_{0};
};

} // namespace reviewer
