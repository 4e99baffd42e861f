#pragma once
#include <string>
#include <vector>
#include "agent/ReviewTypes.hpp"
#include "index/codebase_index.hpp"
#include "session/Session.hpp"

namespace reviewer {

// Composes the prompts the orchestrator sends: the seed turn and the forced summary request.
class ContextBuilder {
public:
    static constexpr size_t kTreeLines = 200;

    explicit ContextBuilder(size_t history_digest_chars = 3000) : digest_chars_(history_digest_chars) {}

    std::string seed_prompt(const ReviewRequest& request, const CodebaseIndex& index,
                            const Session& session, int64_t now) const;

    // Tail of the previous reviews' user and model text, at most history_digest_chars long.
    std::string history_digest(const std::vector<Message>& history) const;

    // Empty for a session that has never been reviewed.
    static std::string continuation_header(const Session& session, int64_t now);

    static std::string summarize_prompt(const std::string& reason);

private:
    size_t digest_chars_;
};

} // namespace reviewer
