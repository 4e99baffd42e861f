#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "index/codebase_index.hpp"
#include "tools/Sandbox.hpp"

namespace reviewer {

struct FileContent {
    std::string filepath;
    std::string content;
    bool truncated = false;
    uintmax_t size = 0;

    nlohmann::json to_json() const {
        return {{"filepath", filepath}, {"content", content}, {"truncated", truncated}, {"size", size}};
    }
};

struct UsageHit {
    std::string file;
    int line = 0;
    std::string content;
    bool via_import = false; // the file imports a file that defines the symbol

    nlohmann::json to_json() const {
        return {{"file", file}, {"line", line}, {"content", content}, {"via_import", via_import}};
    }
};

struct TextMatch {
    std::string file;
    int line = 0;
    std::string content;
    bool clipped = false; // content is the part of an overlong line that matched

    nlohmann::json to_json() const {
        nlohmann::json j = {{"file", file}, {"line", line}, {"content", content}};
        if (clipped) j["clipped"] = true;
        return j;
    }
};

/**
 * The queries the reasoning engine may run. Nothing here mutates the index; file
 * content is read through the sandbox. "Nothing found" is an empty list, never an error.
 */
class NavigationTools {
public:
    static constexpr size_t kMaxResults = 100;
    static constexpr uintmax_t kMaxSearchBytes = 1024 * 1024;

    NavigationTools(const CodebaseIndex& index, size_t read_file_max_bytes = 100000);

    // Throws OutsideSandbox or NotFound.
    FileContent read_file(const std::string& filepath) const;

    std::vector<SymbolEntry> search_symbol(const std::string& symbol_name) const;
    std::vector<UsageHit> find_usages(const std::string& symbol_name) const;

    // Throws NotFound when the file is neither indexed nor present.
    std::vector<std::string> get_imports(const std::string& filepath) const;

    std::string get_file_tree() const;

    // ECMAScript regex; a bad pattern throws InvalidArguments. file_pattern is a glob
    // on the name or path ("*.py", "src/*.ts") or a directory prefix ("src/").
    std::vector<TextMatch> search_text(const std::string& pattern, const std::string& file_pattern = "") const;

    // Project-relative form of a requested path, used to count distinct files.
    std::string relative_path(const std::string& requested) const;

    const CodebaseIndex& index() const { return index_; }
    const Sandbox& sandbox() const { return sandbox_; }

private:
    bool load_text(const std::string& rel_path, std::string& out) const;

    const CodebaseIndex& index_;
    Sandbox sandbox_;
    size_t max_bytes_;
};

} // namespace reviewer
