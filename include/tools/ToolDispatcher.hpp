#pragma once
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "tools/NavigationTools.hpp"
#include "tools/NavigationTrace.hpp"
#include "tools/ResultCache.hpp"

namespace reviewer {

// The closed set of operations the reasoning engine can call.
namespace ops {
struct ReadFile     { std::string filepath; };
struct SearchSymbol { std::string symbol_name; };
struct FindUsages   { std::string symbol_name; };
struct GetImports   { std::string filepath; };
struct GetFileTree  {};
struct SearchText   { std::string pattern; std::optional<std::string> file_pattern; };
} // namespace ops

using ToolCall = std::variant<ops::ReadFile, ops::SearchSymbol, ops::FindUsages,
                              ops::GetImports, ops::GetFileTree, ops::SearchText>;

struct ToolMetadata {
    std::string name;
    std::string description;
    nlohmann::json parameters; // JSON schema
};

const std::vector<ToolMetadata>& tool_manifest();

// Function declarations as the engine expects them: [{name, description, parameters}]
nlohmann::json tool_manifest_json();

// Validates the name and argument shape. Throws InvalidArguments.
ToolCall parse_tool_call(const std::string& name, const nlohmann::json& args);

std::string tool_name(const ToolCall& call);
nlohmann::json tool_arguments(const ToolCall& call);

struct ToolOutcome {
    nlohmann::json payload; // {"result": ...} or {"error": {"code", "message"}}
    bool ok = true;
    std::string reason_tag;
    size_t result_size = 0;
};

/**
 * Runs tool calls for one review. Owns the review's result cache and navigation
 * trace; every call, including rejected ones, appends exactly one trace entry.
 */
class ToolDispatcher {
public:
    explicit ToolDispatcher(const NavigationTools& tools, size_t cache_capacity = 256);

    ToolOutcome dispatch(const ToolCall& call);

    // Records a call that failed validation and builds the error for the engine.
    ToolOutcome reject(const std::string& name, const nlohmann::json& args, const std::string& why);

    // True when the call is a read of an existing file not read before in this review.
    bool reads_new_file(const ToolCall& call) const;

    const NavigationTrace& trace() const { return trace_; }
    const std::set<std::string>& files_read() const { return files_read_; }
    size_t cache_hits() const { return cache_.hits(); }

    nlohmann::json navigation_summary() const;

private:
    void record(const std::string& tool, const nlohmann::json& args, const ToolOutcome& outcome);

    const NavigationTools& tools_;
    ResultCache<std::string, ToolOutcome> cache_;
    NavigationTrace trace_;
    std::set<std::string> files_read_;
    size_t bytes_read_ = 0;
};

} // namespace reviewer
