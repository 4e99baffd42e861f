#include "agent/ReviewOrchestrator.hpp"
#include "index/indexer.hpp"
#include "tools/NavigationTools.hpp"
#include "tools/ToolDispatcher.hpp"
#include "LogManager.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <set>
#include <spdlog/spdlog.h>

namespace reviewer {

namespace fs = std::filesystem;
using json = nlohmann::json;

struct ReviewOrchestrator::Turn {
    std::string session_name;
    std::string project_root;
    std::string model;
    std::vector<Message> messages; // this review only
    int64_t tokens = 0;
    const CancellationToken* cancel = nullptr;
};

namespace {

void check_cancelled(const CancellationToken* cancel) {
    if (cancel && cancel->cancelled()) {
        throw ReviewerError(ErrorCode::Cancelled, "Review cancelled by the caller");
    }
}

std::string preview_of(const Message& m) {
    const std::string text = m.content.empty() ? m.tool.dump(-1, ' ', false, json::error_handler_t::replace) : m.content;
    return to_valid_utf8(utf8_safe_substr(text, 300));
}

std::string preview_of(const EngineReply& r) {
    if (r.tool_calls.empty()) return to_valid_utf8(utf8_safe_substr(r.text, 300));
    std::string names = "tools:";
    for (const auto& c : r.tool_calls) names += " " + c.name;
    return names;
}

Message model_message(const EngineReply& reply) {
    Message m{"model", reply.text, nullptr};
    if (reply.wants_tools()) {
        json calls = json::array();
        for (const auto& c : reply.tool_calls) calls.push_back({{"name", c.name}, {"args", c.args}});
        m.tool = {{"calls", calls}};
    }
    return m;
}

Message tool_message(const std::string& name, json response) {
    return Message{"tool", "", json{{"name", name}, {"response", std::move(response)}}};
}

json not_executed(const std::string& reason) {
    return json{{"error", {{"code", "NotExecuted"}, {"message", "Exploration limit reached: " + reason}}}};
}

// Decrements the active review count on every exit path.
struct ActiveGuard {
    std::atomic<size_t>& counter;
    explicit ActiveGuard(std::atomic<size_t>& c) : counter(c) { ++counter; }
    ~ActiveGuard() { --counter; }
};

} // namespace

// --- 1. SETUP ---

ReviewOrchestrator::ReviewOrchestrator(SessionStore& store, RateLimitManager& limiter, IReasoningEngine& engine,
                                       ReviewerConfig config)
    : store_(store), limiter_(limiter), engine_(engine), config_(std::move(config)),
      context_(config_.history_digest_chars) {}

std::shared_ptr<const CodebaseIndex> ReviewOrchestrator::index_for(const std::string& canonical_root,
                                                                   const std::vector<std::string>& changed_files) {
    std::shared_ptr<const CodebaseIndex> previous;
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        auto it = indexes_.find(canonical_root);
        if (it != indexes_.end()) previous = it->second.index;
    }

    // Built outside the lock so reviews of other projects are not held up
    std::shared_ptr<const CodebaseIndex> index;
    if (!previous || changed_files.empty()) {
        // No change list means we cannot tell what moved; rebuild
        index = std::make_shared<const CodebaseIndex>(Indexer::build(canonical_root, config_.ignore_patterns));
    } else {
        std::set<std::string> changed(changed_files.begin(), changed_files.end());
        index = std::make_shared<const CodebaseIndex>(Indexer::update(*previous, changed));
    }

    std::lock_guard<std::mutex> lock(index_mutex_);
    indexes_[canonical_root] = CachedIndex{index, ++index_clock_};
    while (indexes_.size() > kMaxCachedIndexes) {
        auto oldest = indexes_.begin();
        for (auto it = indexes_.begin(); it != indexes_.end(); ++it) {
            if (it->second.last_used < oldest->second.last_used) oldest = it;
        }
        spdlog::debug("🗑️  Dropping cached index for {}", oldest->first);
        indexes_.erase(oldest);
    }
    return index;
}

// --- 2. ENGINE BOUNDARY ---

EngineReply ReviewOrchestrator::call_engine(Turn& turn, const json& tools) {
    check_cancelled(turn.cancel);
    limiter_.acquire(turn.model, config_.tier, config_.rate_limit_wait);
    check_cancelled(turn.cancel);

    EngineRequest request{turn.messages, tools, turn.model};
    InteractionLog log{now_ms(), turn.session_name, turn.project_root, turn.model,
                       turn.messages.empty() ? "" : preview_of(turn.messages.back()), "", 0, 0.0, "ok"};

    auto start = std::chrono::steady_clock::now();
    EngineReply reply;
    try {
        reply = engine_.complete(request);
    } catch (const ReviewerError& e) {
        log.duration_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
        log.outcome = to_string(e.code());
        log.reply_preview = e.what();
        LogManager::instance().add_log(log);
        throw;
    }
    log.duration_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    log.reply_preview = preview_of(reply);
    log.tokens_used = reply.tokens_used;
    LogManager::instance().add_log(log);

    turn.tokens += reply.tokens_used;
    spdlog::info("🧠 Engine replied in {:.0f} ms: {}", log.duration_ms,
                 reply.wants_tools() ? std::to_string(reply.tool_calls.size()) + " tool call(s)" : "final answer");

    check_cancelled(turn.cancel);
    return reply;
}

// --- 3. THE REVIEW LOOP ---

ReviewResult ReviewOrchestrator::run(const ReviewRequest& request, const CancellationToken* cancel) {
    ActiveGuard active(active_);
    ReviewResult result;

    auto transition = [&](ReviewState next) {
        if (!result.transitions.empty()) {
            spdlog::info("🧭 {} -> {}", to_string(result.final_state), to_string(next));
        }
        result.transitions.push_back(next);
        result.final_state = next;
    };
    auto fail = [&](ErrorCode code, const std::string& message) {
        result.error = ReviewFailure{code, message};
        if (result.final_state != ReviewState::TerminatedError) transition(ReviewState::TerminatedError);
    };

    transition(ReviewState::Init);
    // Wall clock covers indexing and the seed call too
    const auto started = std::chrono::steady_clock::now();

    std::error_code ec;
    if (!fs::is_directory(request.project_root, ec)) {
        spdlog::error("❌ Project root is not a directory: {}", request.project_root);
        fail(ErrorCode::NotFound, "Project root is not a directory: " + request.project_root);
        return result;
    }
    const std::string root = SessionStore::canonical_root(request.project_root);
    const ReviewBounds bounds = request.bounds.value_or(config_.bounds);

    // Held until the session is persisted
    std::optional<SessionLease> lease;
    Session session;
    try {
        lease.emplace(store_.acquire(request.session_name, root, config_.session_wait));
        auto existing = store_.find(request.session_name, root);
        session = existing ? *existing : store_.create(request.session_name, root);
    } catch (const ReviewerError& e) {
        spdlog::error("❌ Review of '{}' not started: {}", request.session_name, e.what());
        fail(e.code(), e.what());
        return result;
    }

    result.session.name = session.name;
    result.session.status = session.iteration_count > 0 ? "continued" : "new";
    result.session.created_at = session.created_at;
    result.session.last_reviewed = session.iteration_count > 0 ? session.last_updated : 0;
    result.session.previous_issues_count = session.last_issues_count;

    spdlog::info("🚀 Review '{}' of {} (iteration {})", session.name, root, session.iteration_count + 1);

    Turn turn;
    turn.session_name = session.name;
    turn.project_root = root;
    turn.model = request.model.empty() ? config_.model : request.model;
    turn.cancel = cancel;

    std::shared_ptr<const CodebaseIndex> index;
    std::unique_ptr<NavigationTools> tools;
    std::unique_ptr<ToolDispatcher> dispatcher;

    try {
        index = index_for(root, request.changed_files);
        result.index_stats = index->stats();
        tools = std::make_unique<NavigationTools>(*index, config_.read_file_max_bytes);
        dispatcher = std::make_unique<ToolDispatcher>(*tools);

        // SEEDED
        turn.messages.push_back(Message{"user", context_.seed_prompt(request, *index, session, now_ms()), nullptr});
        transition(ReviewState::Seeded);
        const json manifest = tool_manifest_json();
        EngineReply reply = call_engine(turn, manifest);

        // EXPLORING
        int calls = 0;
        std::optional<std::string> bound;

        auto time_bound = [&]() -> std::optional<std::string> {
            if (std::chrono::steady_clock::now() - started >= bounds.max_wall_clock) {
                return "wall clock limit of " + std::to_string(bounds.max_wall_clock.count()) + "s";
            }
            return std::nullopt;
        };

        while (reply.wants_tools()) {
            if (result.final_state != ReviewState::Exploring) transition(ReviewState::Exploring);
            turn.messages.push_back(model_message(reply));

            for (const auto& requested : reply.tool_calls) {
                if (!bound) {
                    if (calls >= bounds.max_tool_calls) {
                        bound = "max tool calls (" + std::to_string(bounds.max_tool_calls) + ")";
                    } else {
                        bound = time_bound();
                    }
                }
                if (bound) {
                    turn.messages.push_back(tool_message(requested.name, not_executed(*bound)));
                    continue;
                }

                ToolCall call;
                try {
                    call = parse_tool_call(requested.name, requested.args);
                } catch (const ReviewerError& e) {
                    ++calls;
                    ToolOutcome rejected = dispatcher->reject(requested.name, requested.args, e.what());
                    turn.messages.push_back(tool_message(requested.name, rejected.payload));
                    continue;
                }

                if (dispatcher->reads_new_file(call) &&
                    dispatcher->files_read().size() >= static_cast<size_t>(bounds.max_distinct_files)) {
                    bound = "max distinct files (" + std::to_string(bounds.max_distinct_files) + ")";
                    turn.messages.push_back(tool_message(requested.name, not_executed(*bound)));
                    continue;
                }

                ++calls;
                ToolOutcome outcome = dispatcher->dispatch(call);
                turn.messages.push_back(tool_message(requested.name, outcome.payload));
            }

            if (!bound) bound = time_bound();
            if (bound) break;
            reply = call_engine(turn, manifest);
        }

        if (bound) {
            spdlog::warn("⛔ Bound reached: {}. Requesting a summary.", *bound);
            transition(ReviewState::TerminatedBound);
            turn.messages.push_back(Message{"user", ContextBuilder::summarize_prompt(*bound), nullptr});
            reply = call_engine(turn, json::array());
            if (reply.wants_tools()) {
                spdlog::warn("⚠️  Engine asked for tools after the bound; keeping its text only");
                reply.tool_calls.clear();
            }
            result.answer = reply.text.empty() ? "Exploration stopped at the " + *bound + " before a summary was produced."
                                               : reply.text;
        } else {
            result.answer = reply.text;
            transition(ReviewState::TerminatedNormal);
        }
        turn.messages.push_back(model_message(reply));
    } catch (const ReviewerError& e) {
        spdlog::error("❌ Review '{}' ended with {}: {}", session.name, to_string(e.code()), e.what());
        fail(e.code(), e.what());
    } catch (const std::exception& e) {
        spdlog::error("❌ Review '{}' failed: {}", session.name, e.what());
        fail(ErrorCode::IoError, e.what());
    }

    if (dispatcher) {
        result.trace = dispatcher->trace();
        result.navigation_summary = dispatcher->navigation_summary();
    }
    result.tokens_used = turn.tokens;
    result.issues_found = count_issues(result.answer);

    // Persist on every terminal path
    session.message_history.insert(session.message_history.end(), turn.messages.begin(), turn.messages.end());
    session.iteration_count += 1;
    session.navigation_state = result.trace;
    session.cumulative_token_estimate += turn.tokens;
    session.last_updated = now_ms();
    if (!result.answer.empty()) session.last_issues_count = result.issues_found;

    try {
        store_.save(session);
    } catch (const ReviewerError& e) {
        spdlog::error("❌ Could not persist session '{}': {}", session.name, e.what());
        if (!result.error) fail(e.code(), e.what());
    } catch (const std::exception& e) {
        spdlog::error("❌ Could not persist session '{}': {}", session.name, e.what());
        if (!result.error) fail(ErrorCode::IoError, e.what());
    }

    result.session.iteration = session.iteration_count;
    result.session.chat_messages_count = session.message_history.size();

    spdlog::info("🏁 Review '{}' finished: {} ({} tool calls, {} tokens)", session.name,
                 to_string(result.final_state), result.trace.size(), result.tokens_used);
    return result;
}

} // namespace reviewer
