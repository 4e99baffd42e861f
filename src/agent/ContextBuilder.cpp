#include "agent/ContextBuilder.hpp"
#include "utf8.hpp"
#include <sstream>

namespace reviewer {

namespace {

const char* kRole =
    "### ROLE\n"
    "You are a senior code reviewer. You do not have the whole repository: use the navigation tools "
    "(read_file, search_symbol, find_usages, get_imports, get_file_tree, search_text) to look up "
    "only what you need to judge the change. When you have enough, answer without calling tools.\n"
    "Report each finding as:\n"
    "ISSUE: <short title>\nFILE: <path>\nLine: <number>\n<explanation and suggested fix>\n";

// Related tests for the changed files, from the index's test mapping.
std::vector<std::string> tests_touching(const CodebaseIndex& index, const std::string& source) {
    std::vector<std::string> tests;
    for (const auto& [test, sources] : index.test_mapping()) {
        for (const auto& s : sources) {
            if (s == source) {
                tests.push_back(test);
                break;
            }
        }
    }
    return tests;
}

} // namespace

std::string ContextBuilder::continuation_header(const Session& session, int64_t now) {
    if (session.iteration_count == 0) return "";

    std::ostringstream out;
    out << "### SESSION\n";
    out << "Continuing review session (iteration " << session.iteration_count + 1 << ")\n";
    out << "Last reviewed: " << format_time_ago(session.last_updated, now) << "\n";
    if (session.last_issues_count > 0) {
        out << "In our last review, we found " << session.last_issues_count << " issues.\n";
        out << "Let me check what has changed since then.\n";
    }
    return out.str();
}

std::string ContextBuilder::history_digest(const std::vector<Message>& history) const {
    if (digest_chars_ == 0) return "";

    std::string digest;
    for (const auto& m : history) {
        if (m.role == "tool" || m.content.empty()) continue;
        digest += "[" + m.role + "] " + m.content + "\n";
    }
    if (digest.size() <= digest_chars_) return digest;

    // Keep the tail; step forward past any UTF-8 continuation bytes
    size_t start = digest.size() - digest_chars_;
    while (start < digest.size() && (static_cast<unsigned char>(digest[start]) & 0xC0) == 0x80) ++start;
    return "..." + digest.substr(start);
}

std::string ContextBuilder::seed_prompt(const ReviewRequest& request, const CodebaseIndex& index,
                                        const Session& session, int64_t now) const {
    std::string payload = kRole;
    payload += "\n";

    std::string header = continuation_header(session, now);
    if (!header.empty()) {
        payload += header + "\n";
        std::string digest = history_digest(session.message_history);
        if (!digest.empty()) payload += "### PREVIOUS REVIEW\n" + digest + "\n";
    }

    payload += "### PROJECT TOPOLOGY\n" + index.render_tree(kTreeLines) + "\n";
    payload += "### INDEX\n" + index.summary() + "\n";
    if (!request.design_doc.empty()) payload += "### DESIGN\n" + request.design_doc + "\n\n";

    payload += "### CHANGED FILES\n";
    if (request.changed_files.empty()) {
        payload += "(none listed)\n";
    }
    for (const auto& file : request.changed_files) {
        payload += "- " + file;
        if (!index.contains_file(file)) payload += " (not in index: deleted or ignored)";
        auto tests = tests_touching(index, file);
        if (!tests.empty()) {
            payload += " [tests:";
            for (const auto& t : tests) payload += " " + t;
            payload += "]";
        }
        payload += "\n";
    }
    payload += "\n";

    if (!request.diffs.empty()) payload += "### DIFFS\n" + request.diffs + "\n\n";
    if (!request.story.empty()) payload += "### STORY\n" + request.story + "\n\n";

    payload += "### YOUR NEXT STEP\nReview the changes above. Call tools to gather context, then give your findings.";
    // The tree lists names straight from disk
    return to_valid_utf8(payload);
}

std::string ContextBuilder::summarize_prompt(const std::string& reason) {
    return "Exploration limit reached (" + reason + "). No more tools are available. "
           "Please summarize what you have found so far, using the ISSUE:/FILE:/Line: format for each finding.";
}

} // namespace reviewer
