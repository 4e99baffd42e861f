#include "tools/ToolDispatcher.hpp"
#include "errors.hpp"
#include "utf8.hpp"
#include <spdlog/spdlog.h>

namespace reviewer {

using json = nlohmann::json;

namespace {

json string_param(const std::string& description) {
    return json{{"type", "string"}, {"description", description}};
}

json object_schema(json properties, std::vector<std::string> required) {
    json schema = {{"type", "object"}, {"properties", std::move(properties)}};
    if (!required.empty()) schema["required"] = required;
    return schema;
}

const ToolMetadata* find_tool(const std::string& name) {
    for (const auto& meta : tool_manifest()) {
        if (meta.name == name) return &meta;
    }
    return nullptr;
}

std::string required_string(const std::string& tool, const json& args, const std::string& key) {
    if (!args.contains(key) || !args[key].is_string() || args[key].get<std::string>().empty()) {
        throw ReviewerError(ErrorCode::InvalidArguments,
                            tool + " requires a non-empty string argument '" + key + "'");
    }
    return args[key].get<std::string>();
}

const char* reason_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound:         return "not_found";
        case ErrorCode::OutsideSandbox:   return "outside_sandbox";
        case ErrorCode::InvalidArguments: return "invalid_arguments";
        default:                          return "error";
    }
}

json error_payload(ErrorCode code, const std::string& message) {
    return json{{"error", {{"code", to_string(code)}, {"message", message}}}};
}

size_t size_of(const json& result) {
    if (result.is_array()) return result.size();
    if (result.is_string()) return result.get_ref<const std::string&>().size();
    if (result.is_object() && result.contains("content")) return result["content"].get_ref<const std::string&>().size();
    return 0;
}

// One overload per operation; std::visit picks it.
struct Executor {
    const NavigationTools& tools;

    json operator()(const ops::ReadFile& op) const { return tools.read_file(op.filepath).to_json(); }

    json operator()(const ops::SearchSymbol& op) const {
        json arr = json::array();
        for (const auto& s : tools.search_symbol(op.symbol_name)) arr.push_back(s.to_json());
        return arr;
    }

    json operator()(const ops::FindUsages& op) const {
        json arr = json::array();
        for (const auto& u : tools.find_usages(op.symbol_name)) arr.push_back(u.to_json());
        return arr;
    }

    json operator()(const ops::GetImports& op) const { return tools.get_imports(op.filepath); }

    json operator()(const ops::GetFileTree&) const { return tools.get_file_tree(); }

    json operator()(const ops::SearchText& op) const {
        json arr = json::array();
        for (const auto& m : tools.search_text(op.pattern, op.file_pattern.value_or(""))) arr.push_back(m.to_json());
        return arr;
    }
};

} // namespace

// --- 1. MANIFEST ---

const std::vector<ToolMetadata>& tool_manifest() {
    static const std::vector<ToolMetadata> manifest = {
        {"read_file", "Read and return the content of a file. Large files are truncated with a marker.",
         object_schema({{"filepath", string_param("Path to the file relative to repository root")}}, {"filepath"})},
        {"search_symbol", "Find where a class, function, or method is defined",
         object_schema({{"symbol_name", string_param("Name of the symbol to search for")}}, {"symbol_name"})},
        {"find_usages", "Find all places where a symbol is used in the codebase (at most 100)",
         object_schema({{"symbol_name", string_param("Name of the symbol to find usages for")}}, {"symbol_name"})},
        {"get_imports", "Get all imports from a specific file",
         object_schema({{"filepath", string_param("Path to the file relative to repository root")}}, {"filepath"})},
        {"get_file_tree", "Get the project file tree structure", object_schema(json::object(), {})},
        {"search_text", "Search for a regex pattern in files (at most 100 matches)",
         object_schema({{"pattern", string_param("Text or regex pattern to search for")},
                        {"file_pattern", string_param("Optional file pattern to limit search (e.g., '*.py' or 'src/')")}},
                       {"pattern"})},
    };
    return manifest;
}

json tool_manifest_json() {
    json arr = json::array();
    for (const auto& meta : tool_manifest()) {
        arr.push_back({{"name", meta.name}, {"description", meta.description}, {"parameters", meta.parameters}});
    }
    return arr;
}

// --- 2. PARSING ---

ToolCall parse_tool_call(const std::string& name, const json& raw_args) {
    const ToolMetadata* meta = find_tool(name);
    if (!meta) {
        throw ReviewerError(ErrorCode::InvalidArguments, "Unknown tool '" + name + "'");
    }

    json args = raw_args.is_null() ? json::object() : raw_args;
    if (!args.is_object()) {
        throw ReviewerError(ErrorCode::InvalidArguments, name + " arguments must be an object");
    }
    for (const auto& [key, value] : args.items()) {
        if (!meta->parameters["properties"].contains(key)) {
            throw ReviewerError(ErrorCode::InvalidArguments,
                                name + " does not take '" + key + "'; expected " + meta->parameters["properties"].dump());
        }
    }

    if (name == "read_file") return ops::ReadFile{required_string(name, args, "filepath")};
    if (name == "search_symbol") return ops::SearchSymbol{required_string(name, args, "symbol_name")};
    if (name == "find_usages") return ops::FindUsages{required_string(name, args, "symbol_name")};
    if (name == "get_imports") return ops::GetImports{required_string(name, args, "filepath")};
    if (name == "get_file_tree") return ops::GetFileTree{};

    ops::SearchText op;
    op.pattern = required_string(name, args, "pattern");
    if (args.contains("file_pattern") && !args["file_pattern"].is_null()) {
        if (!args["file_pattern"].is_string()) {
            throw ReviewerError(ErrorCode::InvalidArguments, "search_text 'file_pattern' must be a string");
        }
        std::string scope = args["file_pattern"].get<std::string>();
        if (!scope.empty()) op.file_pattern = scope;
    }
    return op;
}

std::string tool_name(const ToolCall& call) {
    static const char* names[] = {"read_file", "search_symbol", "find_usages", "get_imports", "get_file_tree", "search_text"};
    return names[call.index()];
}

json tool_arguments(const ToolCall& call) {
    struct Args {
        json operator()(const ops::ReadFile& op) const { return {{"filepath", op.filepath}}; }
        json operator()(const ops::SearchSymbol& op) const { return {{"symbol_name", op.symbol_name}}; }
        json operator()(const ops::FindUsages& op) const { return {{"symbol_name", op.symbol_name}}; }
        json operator()(const ops::GetImports& op) const { return {{"filepath", op.filepath}}; }
        json operator()(const ops::GetFileTree&) const { return json::object(); }
        json operator()(const ops::SearchText& op) const {
            json j = {{"pattern", op.pattern}};
            if (op.file_pattern) j["file_pattern"] = *op.file_pattern;
            return j;
        }
    };
    return std::visit(Args{}, call);
}

// --- 3. DISPATCH ---

ToolDispatcher::ToolDispatcher(const NavigationTools& tools, size_t cache_capacity)
    : tools_(tools), cache_(cache_capacity) {}

void ToolDispatcher::record(const std::string& tool, const json& args, const ToolOutcome& outcome) {
    trace_.push_back(TraceEntry{tool, args, outcome.result_size, outcome.reason_tag});
}

ToolOutcome ToolDispatcher::dispatch(const ToolCall& call) {
    const std::string name = tool_name(call);
    const json args = tool_arguments(call);
    const std::string key = name + ":" + args.dump();

    if (auto cached = cache_.get(key)) {
        ToolOutcome hit = *cached;
        hit.reason_tag = "cache";
        spdlog::info("♻️  {} {} (cached)", name, args.dump());
        record(name, args, hit);
        return hit;
    }

    ToolOutcome outcome;
    try {
        json result = std::visit(Executor{tools_}, call);
        // File names and contents come straight from disk
        make_valid_utf8(result);
        outcome.result_size = size_of(result);
        outcome.payload = json{{"result", std::move(result)}};
        outcome.ok = true;
        outcome.reason_tag = "ok";

        if (std::holds_alternative<ops::ReadFile>(call)) {
            const auto& file = outcome.payload["result"];
            files_read_.insert(file["filepath"].get<std::string>());
            bytes_read_ += outcome.result_size;
        }
        spdlog::info("🛠️  {} {} -> {}", name, args.dump(), outcome.result_size);
    } catch (const ReviewerError& e) {
        outcome.payload = error_payload(e.code(), to_valid_utf8(e.what()));
        outcome.ok = false;
        outcome.reason_tag = reason_for(e.code());
        outcome.result_size = 0;
        spdlog::warn("⚠️  {} {} failed: {}", name, args.dump(), e.what());
    }

    cache_.set(key, outcome);
    record(name, args, outcome);
    return outcome;
}

ToolOutcome ToolDispatcher::reject(const std::string& name, const json& args, const std::string& why) {
    ToolOutcome outcome;
    outcome.payload = error_payload(ErrorCode::InvalidArguments, why);
    outcome.ok = false;
    outcome.reason_tag = "invalid_arguments";
    spdlog::warn("⚠️  Rejected tool call {}: {}", name, why);
    record(name, args.is_null() ? json::object() : args, outcome);
    return outcome;
}

bool ToolDispatcher::reads_new_file(const ToolCall& call) const {
    const auto* read = std::get_if<ops::ReadFile>(&call);
    if (!read) return false;
    try {
        fs::path target = tools_.sandbox().resolve(read->filepath);
        std::error_code ec;
        if (!fs::is_regular_file(target, ec)) return false;
        return files_read_.count(tools_.sandbox().relative(target)) == 0;
    } catch (const ReviewerError&) {
        return false; // the call itself will report the violation
    }
}

json ToolDispatcher::navigation_summary() const {
    size_t symbol_searches = 0;
    for (const auto& e : trace_) {
        if (e.tool == "search_symbol" || e.tool == "find_usages") ++symbol_searches;
    }
    return json{
        {"files_read", std::vector<std::string>(files_read_.begin(), files_read_.end())},
        {"symbol_searches", symbol_searches},
        {"total_calls", trace_.size()},
        {"cache_hits", cache_.hits()},
        {"total_tokens_estimate", bytes_read_ / 4}
    };
}

} // namespace reviewer
