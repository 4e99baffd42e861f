#pragma once
#include <filesystem>
#include <set>
#include <string>
#include <vector>
#include "index/codebase_index.hpp"
#include "index/ignore_rules.hpp"

namespace reviewer {

class SymbolExtractor;

class Indexer {
public:
    // Full scan of the project. Files that fail to parse are kept as unparsed entries.
    static CodebaseIndex build(const std::filesystem::path& project_root,
                               const std::vector<std::string>& ignore_patterns);

    // Re-reads only the listed project-relative paths; deleted ones are dropped.
    // An empty set returns the index unchanged.
    static CodebaseIndex update(const CodebaseIndex& index, const std::set<std::string>& changed_paths);

private:
    static FileRecord index_file(const std::filesystem::path& root, const std::string& rel_path,
                                 SymbolExtractor& extractor);
    static void parse_all(const std::filesystem::path& root, std::vector<FileRecord>& records);
    static void scan_tree(const std::filesystem::path& root, const std::filesystem::path& start, const IgnoreRules& rules,
                          std::vector<std::string>& files, std::set<std::string>& directories);
};

} // namespace reviewer
