#include "agent/ReviewOrchestrator.hpp"
#include "LogManager.hpp"
#include "test_util.hpp"
#include <memory>
#include <thread>

using namespace reviewer;
using test_util::TempDir;
using test_util::ScriptedEngine;
using test_util::answer;
using test_util::call;
using json = nlohmann::json;

namespace {

ReviewerConfig test_config(const TempDir& store_dir) {
    ReviewerConfig config;
    config.session_dir = store_dir.str();
    config.model = "gemini-2.5-pro";
    config.tier = "tier1";
    config.rate_limit_wait = std::chrono::milliseconds(0);
    config.rate_limits["tier1:gemini-2.5-pro"] = BucketConfig{1000, 1000};
    return config;
}

// One project, one store and one scripted engine per test.
struct Harness {
    TempDir store_dir{"reviewer_store"};
    TempDir project{"reviewer_project"};
    ReviewerConfig config = test_config(store_dir);
    SessionStore store{store_dir.path()};
    RateLimitManager limiter{config.rate_limits};
    ScriptedEngine engine;
    ReviewOrchestrator orchestrator{store, limiter, engine, config};

    Harness() {
        project.write("a.py",
                      "def foo():\n"
                      "    return 1\n");
        project.write("b.py",
                      "from a import foo\n"
                      "\n"
                      "def bar():\n"
                      "    return foo() + 1\n");
        project.write("c.py", "X = 1\n");
    }

    ReviewRequest request(const std::string& session = "feature") const {
        ReviewRequest r;
        r.project_root = project.str();
        r.session_name = session;
        r.changed_files = {"b.py"};
        r.diffs = "--- a/b.py\n+++ b/b.py\n+    return foo() + 1\n";
        r.story = "Bar should add one";
        return r;
    }
};

std::vector<ReviewState> states(std::initializer_list<ReviewState> list) { return list; }

} // namespace

void test_normal_review() {
    std::cout << "Testing a review that ends normally..." << std::endl;

    Harness h;
    h.engine.push(call("read_file", {{"filepath", "a.py"}}));
    h.engine.push(answer("ISSUE: foo returns a constant\nFILE: a.py\nLine: 2", 40));

    ReviewResult result = h.orchestrator.run(h.request());

    assert(!result.error);
    assert(result.final_state == ReviewState::TerminatedNormal);
    assert(result.transitions == states({ReviewState::Init, ReviewState::Seeded, ReviewState::Exploring,
                                         ReviewState::TerminatedNormal}));
    assert(result.answer.find("foo returns a constant") != std::string::npos);
    assert(result.issues_found == 3);
    assert(result.tokens_used == 50);
    assert(result.trace.size() == 1 && result.trace[0].tool == "read_file");
    assert(result.index_stats.total_files == 3);

    // The seed carries the change and the full tool manifest
    assert(h.engine.requests.size() == 2);
    const EngineRequest& seed = h.engine.requests[0];
    assert(seed.tools.size() == 6);
    assert(seed.model == "gemini-2.5-pro");
    assert(seed.messages.size() == 1 && seed.messages[0].role == "user");
    assert(seed.messages[0].content.find("### CHANGED FILES\n- b.py") != std::string::npos);
    assert(seed.messages[0].content.find("Bar should add one") != std::string::npos);
    assert(seed.messages[0].content.find("Continuing review session") == std::string::npos);

    // The tool answer goes back in the next turn
    const Message& tool_turn = h.engine.requests[1].messages.back();
    assert(tool_turn.role == "tool");
    assert(tool_turn.tool["name"] == "read_file");
    assert(tool_turn.tool["response"]["result"]["content"] == "def foo():\n    return 1\n");

    Session saved = h.store.load("feature", h.project.str());
    assert(saved.iteration_count == 1);
    assert(saved.message_history.size() == 4);
    assert(saved.navigation_state == result.trace);
    assert(saved.cumulative_token_estimate == 50);
    assert(saved.last_issues_count == 3);

    assert(result.session.status == "new");
    assert(result.session.iteration == 1);
    assert(result.session.chat_messages_count == 4);
    assert(h.orchestrator.active_reviews() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_tool_call_bound() {
    std::cout << "Testing the tool call bound..." << std::endl;

    Harness h;
    ReviewRequest req = h.request();
    req.bounds = ReviewBounds{3, std::chrono::seconds(300), 40};

    h.engine.push(call("read_file", {{"filepath", "a.py"}}));
    h.engine.push(call("search_symbol", {{"symbol_name", "foo"}}));
    h.engine.push(call("get_file_tree", json::object()));
    h.engine.push(call("search_text", {{"pattern", "foo"}}));
    h.engine.push(answer("ISSUE: partial\nFILE: b.py\nLine: 4"));

    ReviewResult result = h.orchestrator.run(req);

    assert(!result.error);
    assert(result.final_state == ReviewState::TerminatedBound);
    assert(result.reached(ReviewState::Exploring));
    assert(!result.reached(ReviewState::TerminatedNormal));
    assert(result.trace.size() == 3);
    assert(result.answer.find("partial") != std::string::npos);

    // Seed, three tool turns, then a summary request that offers no tools
    assert(h.engine.requests.size() == 5);
    const EngineRequest& summary = h.engine.requests[4];
    assert(summary.tools.empty());
    assert(summary.messages.back().role == "user");
    assert(summary.messages.back().content.find("Please summarize") != std::string::npos);

    // The fourth call was answered without running
    const Message& refused = summary.messages[summary.messages.size() - 2];
    assert(refused.role == "tool");
    assert(refused.tool["response"]["error"]["code"] == "NotExecuted");

    assert(h.store.load("feature", h.project.str()).iteration_count == 1);

    std::cout << "  PASS" << std::endl;
}

void test_distinct_file_bound() {
    std::cout << "Testing the distinct file bound..." << std::endl;

    Harness h;
    ReviewRequest req = h.request();
    req.bounds = ReviewBounds{20, std::chrono::seconds(300), 1};

    h.engine.push(call("read_file", {{"filepath", "a.py"}}));
    // Re-reading the same file is not a new file
    h.engine.push(call("read_file", {{"filepath", "./a.py"}}));
    h.engine.push(call("read_file", {{"filepath", "b.py"}}));
    h.engine.push(answer("summary"));

    ReviewResult result = h.orchestrator.run(req);

    assert(result.final_state == ReviewState::TerminatedBound);
    assert(result.trace.size() == 2);
    assert(result.navigation_summary["files_read"].size() == 1);
    assert(h.engine.requests.back().tools.empty());
    assert(result.answer == "summary");

    std::cout << "  PASS" << std::endl;
}

void test_wall_clock_bound() {
    std::cout << "Testing the wall clock bound..." << std::endl;

    Harness h;
    ReviewRequest req = h.request();
    req.bounds = ReviewBounds{20, std::chrono::seconds(0), 40};

    h.engine.push(call("read_file", {{"filepath", "a.py"}}));
    h.engine.push(answer(""));

    ReviewResult result = h.orchestrator.run(req);

    assert(result.final_state == ReviewState::TerminatedBound);
    assert(result.trace.empty());
    // An empty summary still leaves an answer behind
    assert(result.answer.find("wall clock") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_wall_clock_includes_seed_call() {
    std::cout << "Testing the wall clock covers the seed call..." << std::endl;

    Harness h;
    ReviewRequest req = h.request();
    req.bounds = ReviewBounds{20, std::chrono::seconds(1), 40};

    h.engine.on_request = [&](const EngineRequest&) {
        if (h.engine.requests.size() == 1) std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    };
    h.engine.push(call("read_file", {{"filepath", "a.py"}}));
    h.engine.push(answer("summary after a slow start"));

    ReviewResult result = h.orchestrator.run(req);

    assert(result.final_state == ReviewState::TerminatedBound);
    assert(result.trace.empty());
    assert(result.answer == "summary after a slow start");
    assert(h.engine.requests.size() == 2);
    assert(h.engine.requests[1].tools.empty());

    std::cout << "  PASS" << std::endl;
}

void test_non_utf8_file_is_persisted() {
    std::cout << "Testing a Latin-1 file read..." << std::endl;

    Harness h;
    h.project.write("notes.txt", "caf\xE9 au lait\n");
    h.engine.push(call("read_file", {{"filepath", "notes.txt"}}));
    h.engine.push(answer("ISSUE: notes are not UTF-8\nFILE: notes.txt\nLine: 1"));

    ReviewResult result = h.orchestrator.run(h.request());

    assert(!result.error);
    assert(result.final_state == ReviewState::TerminatedNormal);
    assert(result.trace.size() == 1 && result.trace[0].reason_tag == "ok");
    const Message& tool_turn = h.engine.requests[1].messages.back();
    assert(tool_turn.tool["response"]["result"]["content"] == "caf\xEF\xBF\xBD au lait\n");

    Session saved = h.store.load("feature", h.project.str());
    assert(saved.iteration_count == 1);
    assert(saved.message_history.size() == 4);
    assert(saved.message_history[2].tool.dump().find("caf\xEF\xBF\xBD") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_search_hit_cut_inside_character() {
    std::cout << "Testing a search hit trimmed inside a multibyte character..." << std::endl;

    Harness h;
    // The 300 byte trim lands between the two bytes of the e-acute
    h.project.write("wide.py", "# " + std::string(297, 'a') + "\xC3\xA9 tail\n");
    h.engine.push(call("search_text", {{"pattern", "tail"}}));
    h.engine.push(answer("No issues."));

    ReviewResult result = h.orchestrator.run(h.request());

    assert(!result.error);
    assert(result.final_state == ReviewState::TerminatedNormal);
    const json& hits = h.engine.requests[1].messages.back().tool["response"]["result"];
    assert(hits.size() == 1);
    assert(hits[0]["content"] == "# " + std::string(297, 'a') + "...");

    Session saved = h.store.load("feature", h.project.str());
    assert(saved.iteration_count == 1);
    assert(saved.last_issues_count == 0);

    std::cout << "  PASS" << std::endl;
}

void test_index_cache_is_bounded() {
    std::cout << "Testing the index cache bound..." << std::endl;

    Harness h;
    std::vector<std::unique_ptr<TempDir>> roots;
    for (size_t i = 0; i < ReviewOrchestrator::kMaxCachedIndexes + 3; ++i) {
        roots.push_back(std::make_unique<TempDir>("reviewer_project"));
        roots.back()->write("m.py", "def f():\n    return " + std::to_string(i) + "\n");
        auto index = h.orchestrator.index_for(SessionStore::canonical_root(roots.back()->str()), {});
        assert(index->stats().total_files == 1);
        assert(h.orchestrator.cached_indexes() <= ReviewOrchestrator::kMaxCachedIndexes);
    }
    assert(h.orchestrator.cached_indexes() == ReviewOrchestrator::kMaxCachedIndexes);

    // A cached project is refreshed for its changed files only
    const std::string last = SessionStore::canonical_root(roots.back()->str());
    roots.back()->write("n.py", "def g():\n    return 2\n");
    assert(h.orchestrator.index_for(last, {"n.py"})->stats().total_files == 2);
    assert(h.orchestrator.cached_indexes() == ReviewOrchestrator::kMaxCachedIndexes);

    std::cout << "  PASS" << std::endl;
}

void test_invalid_tool_calls_continue() {
    std::cout << "Testing invalid tool calls..." << std::endl;

    Harness h;
    h.engine.push(call("rm_rf", {{"path", "/"}}));
    h.engine.push(call("read_file", {{"path", "a.py"}}));
    h.engine.push(call("read_file", {{"filepath", "../../etc/passwd"}}));
    h.engine.push(answer("ok"));

    ReviewResult result = h.orchestrator.run(h.request());

    assert(!result.error);
    assert(result.final_state == ReviewState::TerminatedNormal);
    assert(result.trace.size() == 3);
    assert(result.trace[0].reason_tag == "invalid_arguments");
    assert(result.trace[1].reason_tag == "invalid_arguments");
    assert(result.trace[2].reason_tag == "outside_sandbox");

    assert(h.engine.requests[1].messages.back().tool["response"]["error"]["code"] == "InvalidArguments");
    assert(h.engine.requests[3].messages.back().tool["response"]["error"]["code"] == "OutsideSandbox");

    std::cout << "  PASS" << std::endl;
}

void test_engine_failure_is_persisted() {
    std::cout << "Testing engine failure..." << std::endl;

    Harness h;
    LogManager::instance().clear();
    h.engine.push(call("read_file", {{"filepath", "a.py"}}, 7));
    h.engine.push_error(ErrorCode::EngineUnreachable);

    ReviewResult result = h.orchestrator.run(h.request());

    assert(result.final_state == ReviewState::TerminatedError);
    assert(result.error && result.error->code == ErrorCode::EngineUnreachable);
    assert(result.answer.empty());
    assert(result.trace.size() == 1);

    Session saved = h.store.load("feature", h.project.str());
    assert(saved.iteration_count == 1);
    assert(saved.cumulative_token_estimate == 7);
    // seed, model call, tool response
    assert(saved.message_history.size() == 3);

    // Both engine calls are logged, the failure first in the list
    json logs = LogManager::instance().get_logs_json();
    assert(logs.size() == 2);
    assert(logs[0]["outcome"] == "EngineUnreachable");
    assert(logs[1]["outcome"] == "ok");
    assert(logs[1]["session"] == "feature");
    assert(logs[1]["tokens_used"] == 7);

    std::cout << "  PASS" << std::endl;
}

void test_cancellation() {
    std::cout << "Testing cancellation..." << std::endl;

    Harness h;
    CancellationToken token;
    h.engine.push(call("read_file", {{"filepath", "a.py"}}));
    h.engine.on_request = [&](const EngineRequest&) { token.cancel(); };

    ReviewResult result = h.orchestrator.run(h.request(), &token);

    assert(result.final_state == ReviewState::TerminatedError);
    assert(result.error && result.error->code == ErrorCode::Cancelled);
    assert(h.engine.requests.size() == 1);
    assert(h.store.load("feature", h.project.str()).iteration_count == 1);

    // A deadline in the past cancels before the first engine call
    Harness late;
    CancellationToken expired;
    expired.set_deadline(std::chrono::steady_clock::now() - std::chrono::seconds(1));
    ReviewResult stopped = late.orchestrator.run(late.request(), &expired);
    assert(stopped.error && stopped.error->code == ErrorCode::Cancelled);
    assert(late.engine.requests.empty());

    std::cout << "  PASS" << std::endl;
}

void test_session_continuation() {
    std::cout << "Testing session continuation..." << std::endl;

    Harness h;
    h.engine.push(answer("ISSUE: stale cache in bar\nFILE: b.py\nLine: 4"));
    ReviewResult first = h.orchestrator.run(h.request());
    assert(first.session.status == "new");
    assert(first.issues_found == 3);

    h.project.write("b.py",
                    "from a import foo\n"
                    "\n"
                    "def bar():\n"
                    "    return foo() + 2\n");
    h.engine.push(answer("Looks fixed."));
    ReviewResult second = h.orchestrator.run(h.request());

    assert(!second.error);
    assert(second.session.status == "continued");
    assert(second.session.iteration == 2);
    assert(second.session.previous_issues_count == 3);
    assert(second.session.created_at == first.session.created_at);
    assert(second.session.last_reviewed > 0);

    const std::string& seed = h.engine.requests[1].messages[0].content;
    assert(seed.find("Continuing review session (iteration 2)") != std::string::npos);
    assert(seed.find("In our last review, we found 3 issues.") != std::string::npos);
    assert(seed.find("stale cache in bar") != std::string::npos);

    Session saved = h.store.load("feature", h.project.str());
    assert(saved.iteration_count == 2);
    assert(saved.message_history.size() == 4);
    assert(saved.last_issues_count == 0);

    // A different session name on the same project starts fresh
    h.engine.push(answer("fresh"));
    ReviewResult other = h.orchestrator.run(h.request("other"));
    assert(other.session.status == "new");

    std::cout << "  PASS" << std::endl;
}

void test_busy_session_is_not_touched() {
    std::cout << "Testing a busy session..." << std::endl;

    Harness h;
    SessionLease held = h.store.acquire("feature", SessionStore::canonical_root(h.project.str()),
                                        std::chrono::milliseconds(0));

    ReviewResult result = h.orchestrator.run(h.request());

    assert(result.error && result.error->code == ErrorCode::SessionBusy);
    assert(result.transitions == states({ReviewState::Init, ReviewState::TerminatedError}));
    assert(h.engine.requests.empty());
    assert(!h.store.find("feature", h.project.str()).has_value());

    std::cout << "  PASS" << std::endl;
}

void test_rate_limit_exhausted() {
    std::cout << "Testing rate limit exhaustion..." << std::endl;

    TempDir store_dir, project;
    project.write("main.py", "print('hi')\n");
    ReviewerConfig config = test_config(store_dir);
    config.rate_limits["tier1:gemini-2.5-pro"] = BucketConfig{1, 0.001};
    SessionStore store(store_dir.path());
    RateLimitManager limiter(config.rate_limits);
    ScriptedEngine engine;
    ReviewOrchestrator orchestrator(store, limiter, engine, config);

    ReviewRequest req;
    req.project_root = project.str();

    ReviewResult first = orchestrator.run(req);
    assert(!first.error);

    ReviewResult second = orchestrator.run(req);
    assert(second.error && second.error->code == ErrorCode::RateLimitExceeded);
    assert(second.reached(ReviewState::Seeded));
    assert(!second.reached(ReviewState::Exploring));
    assert(engine.requests.size() == 1);
    assert(store.load("default", project.str()).iteration_count == 2);

    std::cout << "  PASS" << std::endl;
}

void test_missing_project_root() {
    std::cout << "Testing a missing project root..." << std::endl;

    Harness h;
    ReviewRequest req = h.request();
    req.project_root = h.project.str() + "/does/not/exist";

    ReviewResult result = h.orchestrator.run(req);
    assert(result.error && result.error->code == ErrorCode::NotFound);
    assert(!result.reached(ReviewState::Seeded));
    assert(h.store.list().empty());

    std::cout << "  PASS" << std::endl;
}

int main() {
    test_util::quiet_logs();
    test_normal_review();
    test_tool_call_bound();
    test_distinct_file_bound();
    test_wall_clock_bound();
    test_wall_clock_includes_seed_call();
    test_non_utf8_file_is_persisted();
    test_search_hit_cut_inside_character();
    test_index_cache_is_bounded();
    test_invalid_tool_calls_continue();
    test_engine_failure_is_persisted();
    test_cancellation();
    test_session_continuation();
    test_busy_session_is_not_touched();
    test_rate_limit_exhausted();
    test_missing_project_root();
    std::cout << "All orchestrator tests passed." << std::endl;
    return 0;
}
