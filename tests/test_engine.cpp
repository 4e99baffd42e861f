#include "agent/ContextBuilder.hpp"
#include "agent/ReviewTypes.hpp"
#include "config.hpp"
#include "engine/GeminiEngine.hpp"
#include "engine/KeyManager.hpp"
#include "index/indexer.hpp"
#include "utf8.hpp"
#include "test_util.hpp"

using namespace reviewer;
using test_util::TempDir;
using test_util::expect_error;
using json = nlohmann::json;

void test_payload_shape() {
    std::cout << "Testing generateContent payload..." << std::endl;

    EngineRequest req;
    req.model = "gemini-2.5-pro";
    req.tools = json::array({{{"name", "read_file"}}});
    req.messages.push_back(Message{"user", "seed", nullptr});
    req.messages.push_back(Message{"model", "", json{{"calls", {{{"name", "read_file"}, {"args", {{"filepath", "a.py"}}}},
                                                                {{"name", "get_file_tree"}, {"args", json::object()}}}}}});
    req.messages.push_back(Message{"tool", "", json{{"name", "read_file"}, {"response", {{"result", "x"}}}}});
    req.messages.push_back(Message{"tool", "", json{{"name", "get_file_tree"}, {"response", {{"result", "y"}}}}});
    req.messages.push_back(Message{"user", "summarize", nullptr});

    json payload = GeminiEngine::build_payload(req);
    const json& contents = payload["contents"];
    assert(contents.size() == 4);
    assert(contents[0]["role"] == "user" && contents[0]["parts"][0]["text"] == "seed");

    assert(contents[1]["role"] == "model");
    assert(contents[1]["parts"].size() == 2);
    assert(contents[1]["parts"][0]["functionCall"]["name"] == "read_file");
    assert(contents[1]["parts"][0]["functionCall"]["args"]["filepath"] == "a.py");

    // Both tool results share one function turn
    assert(contents[2]["role"] == "function");
    assert(contents[2]["parts"].size() == 2);
    assert(contents[2]["parts"][1]["functionResponse"]["name"] == "get_file_tree");
    assert(contents[2]["parts"][1]["functionResponse"]["response"]["result"] == "y");

    assert(payload["tools"][0]["functionDeclarations"][0]["name"] == "read_file");

    req.tools = json::array();
    assert(!GeminiEngine::build_payload(req).contains("tools"));

    std::cout << "  PASS" << std::endl;
}

void test_reply_parsing() {
    std::cout << "Testing reply parsing..." << std::endl;

    json calls = json::parse(R"({
        "candidates": [{"content": {"role": "model", "parts": [
            {"functionCall": {"name": "search_symbol", "args": {"symbol_name": "foo"}}},
            {"functionCall": {"name": "get_file_tree"}}
        ]}}],
        "usageMetadata": {"totalTokenCount": 321}
    })");
    EngineReply reply = GeminiEngine::parse_reply(calls, 100);
    assert(reply.wants_tools());
    assert(reply.tool_calls.size() == 2);
    assert(reply.tool_calls[0].args["symbol_name"] == "foo");
    assert(reply.tool_calls[1].args.is_object() && reply.tool_calls[1].args.empty());
    assert(reply.tokens_used == 321);

    json text = json::parse(R"({"candidates": [{"content": {"parts": [{"text": "ISSUE: "}, {"text": "x"}]}}]})");
    EngineReply final_reply = GeminiEngine::parse_reply(text, 392);
    assert(!final_reply.wants_tools());
    assert(final_reply.text == "ISSUE: x");
    // No usage metadata: estimated from the characters exchanged
    assert(final_reply.tokens_used == 100);

    expect_error(ErrorCode::EngineProtocolError, [] { GeminiEngine::parse_reply(json::object(), 0); });
    expect_error(ErrorCode::EngineProtocolError,
                 [] { GeminiEngine::parse_reply(json::parse(R"({"candidates": []})"), 0); });
    expect_error(ErrorCode::EngineProtocolError, [] {
        GeminiEngine::parse_reply(json::parse(R"({"candidates": [{"finishReason": "SAFETY"}]})"), 0);
    });
    expect_error(ErrorCode::EngineProtocolError, [] {
        GeminiEngine::parse_reply(json::parse(R"({"candidates": [{"content": {"parts": [{"functionCall": {}}]}}]})"), 0);
    });

    std::cout << "  PASS" << std::endl;
}

void test_key_rotation() {
    std::cout << "Testing key rotation..." << std::endl;

    auto keys = std::make_shared<KeyManager>(std::vector<std::string>{"k0", "k1", ""});
    assert(keys->get_active_key_count() == 2);
    assert(keys->get_current_key() == "k0");

    keys->report_rate_limit();
    assert(keys->get_current_key() == "k1");
    keys->report_rate_limit();
    assert(keys->get_current_key() == "k0");

    // Third strike on k0 takes it out of the pool
    keys->report_rate_limit(); // k0: 2
    keys->report_rate_limit(); // k1: 2
    keys->report_rate_limit(); // k0: 3
    assert(keys->get_active_key_count() == 1);
    assert(keys->get_current_key() == "k1");

    // Without keys the engine refuses before touching the network
    GeminiEngine engine(std::make_shared<KeyManager>(std::vector<std::string>{}));
    EngineRequest req;
    req.model = "gemini-2.5-pro";
    req.messages.push_back(Message{"user", "hi", nullptr});
    expect_error(ErrorCode::EngineUnreachable, [&] { engine.complete(req); });

    std::cout << "  PASS" << std::endl;
}

void test_utf8_truncation() {
    std::cout << "Testing UTF-8 safe truncation..." << std::endl;

    std::string s = "ab\xC3\xA9"; // "abé"
    assert(utf8_safe_substr(s, 10) == s);
    assert(utf8_safe_substr(s, 3) == "ab");
    assert(utf8_safe_substr(s, 4) == s);
    assert(utf8_safe_substr(s + "!", 4) == s);

    // Latin-1 bytes and cut sequences are replaced, valid text is untouched
    assert(is_valid_utf8(s));
    assert(!is_valid_utf8("caf\xE9"));
    assert(!is_valid_utf8("ab\xC3"));
    assert(!is_valid_utf8("\xED\xA0\x80")); // surrogate
    assert(to_valid_utf8(s) == s);
    assert(to_valid_utf8("caf\xE9!") == "caf\xEF\xBF\xBD!");
    assert(to_valid_utf8("ab\xC3") == "ab\xEF\xBF\xBD");

    json j = {{"name", "caf\xE9"}, {"list", {"ok", "x\xFFy"}}, {"n", 3}};
    make_valid_utf8(j);
    assert(j["name"] == "caf\xEF\xBF\xBD");
    assert(j["list"][1] == "x\xEF\xBF\xBDy");
    assert(j["n"] == 3);
    assert(!j.dump().empty());

    std::cout << "  PASS" << std::endl;
}

void test_review_request_parsing() {
    std::cout << "Testing review request parsing..." << std::endl;

    ReviewBounds defaults;
    ReviewRequest full = ReviewRequest::from_json(json::parse(R"({
        "project_root": "/tmp/project",
        "session_name": "pr-42",
        "changed_files": ["a.py", "b.py"],
        "diffs": "+x",
        "story": "As a user...",
        "design_doc": "Handlers stay stateless",
        "bounds": {"max_tool_calls": 5}
    })"), defaults);
    assert(full.session_name == "pr-42");
    assert(full.changed_files.size() == 2);
    assert(full.design_doc == "Handlers stay stateless");
    assert(full.bounds && full.bounds->max_tool_calls == 5);
    assert(full.bounds->max_distinct_files == defaults.max_distinct_files);

    ReviewRequest minimal = ReviewRequest::from_json(json{{"project_root", "/tmp/p"}, {"session_name", ""}}, defaults);
    assert(minimal.session_name == "default");
    assert(!minimal.bounds);
    assert(minimal.model.empty());
    assert(minimal.design_doc.empty());

    expect_error(ErrorCode::InvalidArguments, [&] { ReviewRequest::from_json(json::array(), defaults); });
    expect_error(ErrorCode::InvalidArguments, [&] { ReviewRequest::from_json(json::object(), defaults); });
    expect_error(ErrorCode::InvalidArguments,
                 [&] { ReviewRequest::from_json(json{{"project_root", "/p"}, {"changed_files", "a.py"}}, defaults); });
    expect_error(ErrorCode::InvalidArguments, [&] {
        ReviewRequest::from_json(json{{"project_root", "/p"}, {"bounds", {{"max_tool_calls", -1}}}}, defaults);
    });

    std::cout << "  PASS" << std::endl;
}

void test_issue_count_and_time_ago() {
    std::cout << "Testing issue counting and time formatting..." << std::endl;

    assert(count_issues("") == 0);
    assert(count_issues("All good.") == 0);
    assert(count_issues("ISSUE: a\nFILE: x.py\nLine: 3\nWARNING: b") == 4);

    const int64_t now = 10LL * 24 * 3600 * 1000;
    assert(format_time_ago(now - 5000, now) == "just now");
    assert(format_time_ago(now + 5000, now) == "just now");
    assert(format_time_ago(now - 60 * 1000, now) == "1 minute ago");
    assert(format_time_ago(now - 5 * 60 * 1000, now) == "5 minutes ago");
    assert(format_time_ago(now - 3600 * 1000, now) == "1 hour ago");
    assert(format_time_ago(now - 3LL * 86400 * 1000, now) == "3 days ago");

    std::cout << "  PASS" << std::endl;
}

void test_context_builder() {
    std::cout << "Testing seed prompt composition..." << std::endl;

    TempDir dir;
    dir.write("app/service.py", "def handle():\n    return 1\n");
    dir.write("tests/test_service.py", "from app.service import handle\n\ndef test_handle():\n    assert handle() == 1\n");
    CodebaseIndex index = Indexer::build(dir.path(), {});

    ReviewRequest req;
    req.project_root = dir.str();
    req.changed_files = {"app/service.py", "gone.py"};
    req.diffs = "+    return 1";

    Session fresh;
    fresh.name = "s";
    ContextBuilder builder(40);
    std::string seed = builder.seed_prompt(req, index, fresh, 0);
    assert(seed.find("### ROLE") == 0);
    assert(seed.find("### PROJECT TOPOLOGY") != std::string::npos);
    assert(seed.find("- gone.py (not in index") != std::string::npos);
    assert(seed.find("### DIFFS\n+    return 1") != std::string::npos);
    assert(seed.find("### STORY") == std::string::npos);
    assert(seed.find("### SESSION") == std::string::npos);
    assert(seed.find("### DESIGN") == std::string::npos);

    // Design notes sit between the project overview and the story
    req.design_doc = "Handlers stay stateless";
    req.story = "As an operator I want retries";
    std::string designed = builder.seed_prompt(req, index, fresh, 0);
    const size_t design_at = designed.find("### DESIGN\nHandlers stay stateless");
    assert(design_at != std::string::npos);
    assert(designed.find("### INDEX") < design_at);
    assert(design_at < designed.find("### CHANGED FILES"));
    assert(design_at < designed.find("### STORY\nAs an operator"));
    req.design_doc.clear();
    req.story.clear();

    Session previous = fresh;
    previous.iteration_count = 2;
    previous.last_issues_count = 0;
    previous.last_updated = 0;
    previous.message_history.push_back(Message{"user", "old seed", nullptr});
    previous.message_history.push_back(Message{"tool", "", json{{"name", "read_file"}}});
    previous.message_history.push_back(Message{"model", std::string(100, 'z'), nullptr});

    std::string header = ContextBuilder::continuation_header(previous, 2 * 3600 * 1000);
    assert(header.find("Continuing review session (iteration 3)") != std::string::npos);
    assert(header.find("Last reviewed: 2 hours ago") != std::string::npos);
    assert(header.find("In our last review") == std::string::npos);

    std::string digest = builder.history_digest(previous.message_history);
    assert(digest.size() == 43);
    assert(digest.compare(0, 3, "...") == 0);
    assert(digest.find("old seed") == std::string::npos);
    assert(ContextBuilder(0).history_digest(previous.message_history).empty());
    assert(ContextBuilder(1000).history_digest(previous.message_history).find("[user] old seed\n") == 0);

    std::string summary = ContextBuilder::summarize_prompt("max tool calls (3)");
    assert(summary.find("max tool calls (3)") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_config_loading() {
    std::cout << "Testing configuration..." << std::endl;

    TempDir dir;
    dir.write(".reviewer/config.json", R"({
        "ignore_patterns": ["generated/"],
        "bounds": {"max_tool_calls": 7, "max_wall_clock_seconds": 60},
        "rate_limits": {"tier1:gemini-2.5-pro": {"capacity": 2, "refill_per_second": 0.5}},
        "session_dir": "/tmp/reviewer-sessions-test",
        "model": "gemini-2.5-flash"
    })");
    ReviewerConfig cfg = load_config(dir.str());
    assert(cfg.bounds.max_tool_calls == 7);
    assert(cfg.bounds.max_wall_clock == std::chrono::seconds(60));
    assert(cfg.bounds.max_distinct_files == 40);
    assert(cfg.rate_limits.at("tier1:gemini-2.5-pro").capacity == 2);
    assert(cfg.ignore_patterns.size() == 1);
    assert(cfg.model == "gemini-2.5-flash");
    assert(cfg.session_dir == "/tmp/reviewer-sessions-test");

    dir.write("bad.json", R"({"rate_limits": {"tier1:x": {"capacity": 0, "refill_per_second": 1}}})");
    expect_error(ErrorCode::ConfigError, [&] { load_config(dir.str(), (dir.path() / "bad.json").string()); });

    dir.write("broken.json", "{ nope");
    expect_error(ErrorCode::ConfigError, [&] { load_config(dir.str(), (dir.path() / "broken.json").string()); });

    std::cout << "  PASS" << std::endl;
}

int main() {
    test_util::quiet_logs();
    test_payload_shape();
    test_reply_parsing();
    test_key_rotation();
    test_utf8_truncation();
    test_review_request_parsing();
    test_issue_count_and_time_ago();
    test_context_builder();
    test_config_loading();
    std::cout << "All engine and context tests passed." << std::endl;
    return 0;
}
