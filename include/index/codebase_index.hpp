#pragma once

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace reviewer {

enum class SymbolKind { Type, Function, Method };

const char* to_string(SymbolKind kind);

struct SymbolEntry {
    std::string name;
    SymbolKind kind = SymbolKind::Function;
    std::string file;   // project-relative, '/'-separated
    int line = 0;       // 1-based
    std::string parent; // enclosing type for methods

    bool operator==(const SymbolEntry& o) const {
        return name == o.name && kind == o.kind && file == o.file && line == o.line && parent == o.parent;
    }

    nlohmann::json to_json() const;
};

// One indexed file. raw_imports are the dependency strings as written in the source;
// they are resolved against the file set whenever the derived tables are rebuilt.
struct FileRecord {
    std::string path;
    uintmax_t size = 0;
    bool is_source = false;
    bool parsed = true;
    std::vector<SymbolEntry> symbols;
    std::vector<std::string> raw_imports;

    bool operator==(const FileRecord& o) const {
        return path == o.path && size == o.size && is_source == o.is_source && parsed == o.parsed &&
               symbols == o.symbols && raw_imports == o.raw_imports;
    }
};

struct IndexStats {
    size_t total_files = 0;
    size_t source_files = 0;
    size_t unparsed_files = 0;
    size_t total_symbols = 0;
    size_t unique_symbols = 0;
    size_t test_files = 0;
    double build_ms = 0.0;

    nlohmann::json to_json() const;
};

class Indexer;

class CodebaseIndex {
public:
    CodebaseIndex() = default;
    explicit CodebaseIndex(std::filesystem::path root) : root_(std::move(root)) {}

    const std::filesystem::path& root() const { return root_; }
    const std::vector<std::string>& ignore_patterns() const { return ignore_patterns_; }

    const std::map<std::string, FileRecord>& files() const { return files_; }
    const std::set<std::string>& directories() const { return directories_; }
    bool contains_file(const std::string& rel_path) const { return files_.count(rel_path) > 0; }

    // Ordered FileTree: directories carry a trailing '/'.
    std::vector<std::string> file_tree() const;
    std::string render_tree(size_t max_lines = 0) const;

    const std::map<std::string, std::vector<SymbolEntry>>& symbols() const { return symbols_; }
    std::vector<SymbolEntry> find_symbol(const std::string& name) const;

    const std::map<std::string, std::vector<std::string>>& import_graph() const { return imports_; }
    const std::vector<std::string>* imports_of(const std::string& rel_path) const;
    std::vector<std::string> dependents_of(const std::string& rel_path) const;

    const std::map<std::string, std::vector<std::string>>& test_mapping() const { return test_mapping_; }
    static bool is_test_file(const std::string& rel_path);

    const IndexStats& stats() const { return stats_; }
    std::string summary() const;

    // Equality covers the primary data; symbol, import and test tables are derived from it.
    bool operator==(const CodebaseIndex& o) const {
        return root_ == o.root_ && ignore_patterns_ == o.ignore_patterns_ &&
               files_ == o.files_ && directories_ == o.directories_;
    }
    bool operator!=(const CodebaseIndex& o) const { return !(*this == o); }

private:
    friend class Indexer;

    void rebuild_derived();

    std::filesystem::path root_;
    std::vector<std::string> ignore_patterns_;
    std::map<std::string, FileRecord> files_;
    std::set<std::string> directories_;

    std::map<std::string, std::vector<SymbolEntry>> symbols_;
    std::map<std::string, std::vector<std::string>> imports_;
    std::map<std::string, std::vector<std::string>> test_mapping_;
    IndexStats stats_;
};

} // namespace reviewer
