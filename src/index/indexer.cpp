#include "index/indexer.hpp"
#include "index/symbol_extractor.hpp"
#include "tools/Sandbox.hpp"
#include "errors.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace reviewer {

namespace fs = std::filesystem;

namespace {

constexpr uintmax_t kMaxParseBytes = 2 * 1024 * 1024;

std::string normalize_changed(const fs::path& root, const std::string& raw) {
    fs::path p(raw);
    if (p.is_absolute()) p = p.lexically_relative(root);
    std::string rel = p.lexically_normal().generic_string();
    if (rel.rfind("./", 0) == 0) rel = rel.substr(2);
    while (!rel.empty() && rel.back() == '/') rel.pop_back();
    if (rel.empty() || rel == "." || rel == ".." || rel.rfind("../", 0) == 0) return "";
    return rel;
}

} // namespace

// --- 1. FILE LEVEL ---

FileRecord Indexer::index_file(const fs::path& root, const std::string& rel_path, SymbolExtractor& extractor) {
    FileRecord rec;
    rec.path = rel_path;
    rec.is_source = is_source_path(rel_path);

    std::error_code ec;
    rec.size = fs::file_size(root / rel_path, ec);
    if (ec) rec.size = 0;
    if (!rec.is_source) return rec;

    if (ec || rec.size > kMaxParseBytes) {
        spdlog::debug("⏭️  Not parsing {} ({} bytes)", rel_path, rec.size);
        rec.parsed = false;
        return rec;
    }

    std::ifstream f(root / rel_path, std::ios::binary);
    if (!f.is_open()) {
        rec.parsed = false;
        return rec;
    }
    std::stringstream buffer;
    buffer << f.rdbuf();

    ParsedFile parsed = extractor.extract(rel_path, buffer.str());
    rec.parsed = parsed.parsed;
    rec.symbols = std::move(parsed.symbols);
    rec.raw_imports = std::move(parsed.imports);
    return rec;
}

// Parallel parse into a pre-sized vector; slot i always holds file i.
void Indexer::parse_all(const fs::path& root, std::vector<FileRecord>& records) {
    const int n = static_cast<int>(records.size());

    #pragma omp parallel
    {
        SymbolExtractor extractor; // one tree-sitter parser per thread

        #pragma omp for schedule(dynamic, 8)
        for (int i = 0; i < n; ++i) {
            const std::string rel = records[i].path;
            try {
                records[i] = index_file(root, rel, extractor);
            } catch (const std::exception& e) {
                spdlog::warn("⚠️  Failed to index {}: {}", rel, e.what());
                records[i].is_source = is_source_path(rel);
                records[i].parsed = false;
            }
        }
    }
}

// --- 2. TREE SCAN ---

void Indexer::scan_tree(const fs::path& root, const fs::path& start, const IgnoreRules& rules,
                        std::vector<std::string>& files, std::set<std::string>& directories) {
    std::error_code ec;
    fs::recursive_directory_iterator it(start, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw ReviewerError(ErrorCode::IoError, "Cannot scan " + start.string() + ": " + ec.message());
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::warn("⚠️  Scan of {} stopped early: {}", start.string(), ec.message());
            break;
        }
        const auto& entry = *it;
        const std::string rel = entry.path().lexically_relative(root).generic_string();

        std::error_code st_ec;
        bool is_link = entry.is_symlink(st_ec);
        bool is_dir = entry.is_directory(st_ec);

        if (rules.is_ignored(rel, is_dir)) {
            if (is_dir && !is_link) it.disable_recursion_pending();
            continue;
        }

        if (is_link) {
            // Links are indexed only when they land on a regular file inside the root
            std::error_code link_ec;
            fs::path target = fs::canonical(entry.path(), link_ec);
            if (link_ec || is_dir || !Sandbox::is_inside(target, root)) {
                spdlog::debug("🔗 Skipping link {}", rel);
                continue;
            }
        }

        if (is_dir) {
            directories.insert(rel);
        } else if (entry.is_regular_file(st_ec)) {
            files.push_back(rel);
        }
    }
    std::sort(files.begin(), files.end());
}

// --- 3. PUBLIC API ---

CodebaseIndex Indexer::build(const fs::path& project_root, const std::vector<std::string>& ignore_patterns) {
    auto start = std::chrono::steady_clock::now();

    std::error_code ec;
    fs::path root = fs::canonical(project_root, ec);
    if (ec || !fs::is_directory(root, ec)) {
        throw ReviewerError(ErrorCode::NotFound, "Project root is not a directory: " + project_root.string());
    }

    spdlog::info("🚀 Indexing {}", root.string());
    CodebaseIndex index(root);
    index.ignore_patterns_ = ignore_patterns;

    IgnoreRules rules = IgnoreRules::for_project(root, ignore_patterns);
    std::vector<std::string> files;
    scan_tree(root, root, rules, files, index.directories_);

    std::vector<FileRecord> records(files.size());
    for (size_t i = 0; i < files.size(); ++i) records[i].path = files[i];
    parse_all(root, records);

    for (auto& rec : records) {
        std::string key = rec.path;
        index.files_.emplace(std::move(key), std::move(rec));
    }
    index.rebuild_derived();

    index.stats_.build_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

    const auto& s = index.stats();
    spdlog::info("📚 Indexed {} files ({} source, {} symbols) in {:.0f} ms",
                 s.total_files, s.source_files, s.total_symbols, s.build_ms);
    if (s.unparsed_files > 0) {
        spdlog::warn("⚠️  {} source files could not be parsed", s.unparsed_files);
    }
    return index;
}

CodebaseIndex Indexer::update(const CodebaseIndex& index, const std::set<std::string>& changed_paths) {
    if (changed_paths.empty()) return index;

    CodebaseIndex next = index;
    const fs::path& root = next.root_;
    IgnoreRules rules = IgnoreRules::for_project(root, next.ignore_patterns_);
    SymbolExtractor extractor;

    size_t reparsed = 0;
    size_t removed = 0;

    for (const auto& raw : changed_paths) {
        std::string rel = normalize_changed(root, raw);
        if (rel.empty()) {
            spdlog::warn("⚠️  Ignoring changed path outside the project: {}", raw);
            continue;
        }

        std::error_code ec;
        fs::path abs = root / rel;
        bool exists = fs::is_regular_file(abs, ec);
        bool linked_out = false;
        if (exists && fs::is_symlink(fs::symlink_status(abs, ec))) {
            fs::path target = fs::canonical(abs, ec);
            linked_out = ec || !Sandbox::is_inside(target, root);
        }

        if (exists && !linked_out && !rules.is_ignored(rel, false)) {
            next.files_[rel] = index_file(root, rel, extractor);
            ++reparsed;

            // Register any new parent directories
            fs::path parent = fs::path(rel).parent_path();
            while (!parent.empty()) {
                next.directories_.insert(parent.generic_string());
                parent = parent.parent_path();
            }
            continue;
        }

        // Deleted, ignored, or a directory: drop the path and anything beneath it
        if (next.files_.erase(rel)) ++removed;
        const std::string prefix = rel + "/";
        for (auto f = next.files_.lower_bound(prefix); f != next.files_.end() && f->first.rfind(prefix, 0) == 0;) {
            f = next.files_.erase(f);
            ++removed;
        }

        // A directory that still exists is rescanned as a whole
        bool is_dir = fs::is_directory(abs, ec) && !fs::is_symlink(fs::symlink_status(abs, ec));
        if (is_dir && !rules.is_ignored(rel, true)) {
            std::vector<std::string> found;
            next.directories_.insert(rel);
            scan_tree(root, abs, rules, found, next.directories_);
            for (const auto& f : found) {
                next.files_[f] = index_file(root, f, extractor);
                ++reparsed;
            }
        }
    }

    for (auto d = next.directories_.begin(); d != next.directories_.end();) {
        std::error_code ec;
        if (!fs::is_directory(root / *d, ec)) d = next.directories_.erase(d);
        else ++d;
    }

    next.rebuild_derived();
    spdlog::info("🔄 Index update: {} re-parsed, {} removed", reparsed, removed);
    return next;
}

} // namespace reviewer
