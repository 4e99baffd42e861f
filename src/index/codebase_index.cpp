#include "index/codebase_index.hpp"
#include "index/symbol_extractor.hpp"
#include <algorithm>
#include <cctype>
#include <functional>
#include <sstream>

namespace reviewer {

namespace fs = std::filesystem;
using json = nlohmann::json;

const char* to_string(SymbolKind kind) {
    switch (kind) {
        case SymbolKind::Type:     return "type";
        case SymbolKind::Function: return "function";
        case SymbolKind::Method:   return "method";
    }
    return "function";
}

json SymbolEntry::to_json() const {
    json j = {{"name", name}, {"kind", to_string(kind)}, {"file", file}, {"line", line}};
    if (!parent.empty()) j["parent"] = parent;
    return j;
}

json IndexStats::to_json() const {
    return json{
        {"total_files", total_files},
        {"source_files", source_files},
        {"unparsed_files", unparsed_files},
        {"total_symbols", total_symbols},
        {"unique_symbols", unique_symbols},
        {"test_files", test_files},
        {"build_ms", build_ms}
    };
}

// --- IMPORT RESOLUTION ---

namespace {

using FileMap = std::map<std::string, FileRecord>;

// Project-relative, '/'-separated; empty when the path leaves the root.
std::string normalize_rel(const fs::path& p) {
    if (p.is_absolute()) return "";
    std::string n = p.lexically_normal().generic_string();
    if (n.empty() || n == "." || n == ".." || n.rfind("../", 0) == 0) return "";
    if (n.rfind("./", 0) == 0) n = n.substr(2);
    return n;
}

std::string first_existing(const FileMap& files, const std::vector<fs::path>& candidates) {
    for (const auto& c : candidates) {
        std::string n = normalize_rel(c);
        if (!n.empty() && files.count(n)) return n;
    }
    return "";
}

std::string find_by_suffix(const FileMap& files, const std::string& suffix) {
    const std::string needle = "/" + suffix;
    for (const auto& [path, rec] : files) {
        if (path == suffix) return path;
        if (path.size() > needle.size() && path.compare(path.size() - needle.size(), needle.size(), needle) == 0) {
            return path;
        }
    }
    return "";
}

std::string resolve_python(const std::string& from, const std::string& raw, const FileMap& files) {
    size_t dots = 0;
    while (dots < raw.size() && raw[dots] == '.') ++dots;
    std::string rest = raw.substr(dots);
    std::replace(rest.begin(), rest.end(), '.', '/');

    const fs::path dir = fs::path(from).parent_path();
    std::vector<fs::path> bases;
    if (dots > 0) {
        fs::path base = dir;
        for (size_t i = 1; i < dots; ++i) base = base.parent_path();
        bases.push_back(base);
    } else {
        bases = {fs::path(), dir, fs::path("src")};
    }

    std::vector<fs::path> candidates;
    for (const auto& b : bases) {
        if (rest.empty()) {
            candidates.push_back(b / "__init__.py");
            continue;
        }
        candidates.push_back(b / (rest + ".py"));
        candidates.push_back(b / rest / "__init__.py");
    }
    return first_existing(files, candidates);
}

std::string resolve_script(const std::string& from, const std::string& raw, const FileMap& files) {
    if (raw.empty() || raw[0] != '.') return ""; // package or path alias
    const fs::path base = fs::path(from).parent_path() / raw;
    std::vector<fs::path> candidates = {base};
    for (const char* ext : {".ts", ".tsx", ".js", ".jsx", ".mjs"}) {
        candidates.emplace_back(base.string() + ext);
    }
    for (const char* index : {"index.ts", "index.tsx", "index.js"}) {
        candidates.push_back(base / index);
    }
    return first_existing(files, candidates);
}

std::string resolve_include(const std::string& from, const std::string& raw, const FileMap& files) {
    if (raw.empty() || raw[0] == '<') return "";
    const fs::path dir = fs::path(from).parent_path();
    std::string hit = first_existing(files, {dir / raw, fs::path(raw), fs::path("include") / raw, fs::path("src") / raw});
    if (!hit.empty()) return hit;
    std::string clean = normalize_rel(raw);
    return clean.empty() ? "" : find_by_suffix(files, clean);
}

std::string resolve_import(const std::string& from, const std::string& raw, const FileMap& files) {
    switch (language_for(from)) {
        case Language::Python:
            return resolve_python(from, raw, files);
        case Language::TypeScript:
        case Language::JsxTsx:
            return resolve_script(from, raw, files);
        case Language::Cpp:
            return resolve_include(from, raw, files);
        case Language::Php:
            return first_existing(files, {fs::path(from).parent_path() / raw, fs::path(raw)});
        case Language::Java: {
            if (raw.find('*') != std::string::npos) return "";
            std::string rel = raw;
            std::replace(rel.begin(), rel.end(), '.', '/');
            return find_by_suffix(files, rel + ".java");
        }
        case Language::CSharp: // namespaces, not files
        case Language::None:
            break;
    }
    return "";
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Names of the source files a test file is likely to exercise.
std::vector<std::string> tested_stems(const std::string& rel_path) {
    std::string name = fs::path(rel_path).filename().string();
    std::string stem = fs::path(rel_path).stem().string();

    for (const char* marker : {".test.", ".spec."}) {
        auto pos = name.find(marker);
        if (pos != std::string::npos) return {name.substr(0, pos)};
    }

    std::vector<std::string> out;
    if (stem.rfind("test_", 0) == 0) out.push_back(stem.substr(5));
    if (ends_with(stem, "_test")) out.push_back(stem.substr(0, stem.size() - 5));
    if (ends_with(stem, "Tests") && stem.size() > 5) out.push_back(stem.substr(0, stem.size() - 5));
    else if (ends_with(stem, "Test") && stem.size() > 4) out.push_back(stem.substr(0, stem.size() - 4));
    if (out.empty()) out.push_back(stem);
    return out;
}

} // namespace

bool CodebaseIndex::is_test_file(const std::string& rel_path) {
    fs::path p(rel_path);
    std::string name = p.filename().string();
    std::string stem = p.stem().string();
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower.rfind("test_", 0) == 0) return true;
    if (ends_with(stem, "_test")) return true;
    if (lower.find(".test.") != std::string::npos || lower.find(".spec.") != std::string::npos) return true;
    if ((ends_with(stem, "Tests") && stem.size() > 5) || (ends_with(stem, "Test") && stem.size() > 4)) return true;

    for (const auto& part : p.parent_path()) {
        std::string seg = part.string();
        if (seg == "test" || seg == "tests" || seg == "__tests__" || seg == "spec") return true;
    }
    return false;
}

// --- DERIVED TABLES ---

void CodebaseIndex::rebuild_derived() {
    symbols_.clear();
    imports_.clear();
    test_mapping_.clear();

    const double build_ms = stats_.build_ms;
    stats_ = IndexStats{};
    stats_.build_ms = build_ms;
    stats_.total_files = files_.size();

    std::map<std::string, std::vector<std::string>> sources_by_stem;

    for (const auto& [path, rec] : files_) {
        if (rec.is_source) {
            ++stats_.source_files;
            if (!is_test_file(path)) sources_by_stem[fs::path(path).stem().string()].push_back(path);
        }
        if (!rec.parsed) ++stats_.unparsed_files;

        for (const auto& sym : rec.symbols) {
            symbols_[sym.name].push_back(sym);
            ++stats_.total_symbols;
        }

        if (rec.raw_imports.empty()) continue;
        std::vector<std::string> deps;
        std::set<std::string> seen;
        for (const auto& raw : rec.raw_imports) {
            std::string resolved = resolve_import(path, raw, files_);
            std::string dep = resolved.empty() ? raw : resolved;
            if (dep == path) continue;
            if (seen.insert(dep).second) deps.push_back(dep);
        }
        imports_[path] = std::move(deps);
    }

    for (const auto& [path, rec] : files_) {
        if (!rec.is_source || !is_test_file(path)) continue;

        std::set<std::string> targets;
        for (const auto& stem : tested_stems(path)) {
            auto it = sources_by_stem.find(stem);
            if (it != sources_by_stem.end()) targets.insert(it->second.begin(), it->second.end());
        }
        auto deps = imports_.find(path);
        if (deps != imports_.end()) {
            for (const auto& dep : deps->second) {
                auto f = files_.find(dep);
                if (f != files_.end() && f->second.is_source && !is_test_file(dep)) targets.insert(dep);
            }
        }
        if (!targets.empty()) test_mapping_[path] = std::vector<std::string>(targets.begin(), targets.end());
    }

    stats_.unique_symbols = symbols_.size();
    stats_.test_files = test_mapping_.size();
}

// --- QUERIES ---

std::vector<std::string> CodebaseIndex::file_tree() const {
    std::vector<std::string> entries;
    entries.reserve(directories_.size() + files_.size());
    for (const auto& d : directories_) entries.push_back(d + "/");
    for (const auto& [path, rec] : files_) entries.push_back(path);
    std::sort(entries.begin(), entries.end());
    return entries;
}

std::string CodebaseIndex::render_tree(size_t max_lines) const {
    struct VisualNode {
        std::map<std::string, VisualNode> children;
        bool is_dir = false;
    };
    VisualNode root;

    auto insert = [&root](const std::string& rel, bool is_dir) {
        std::stringstream ss(rel);
        std::string part;
        VisualNode* current = &root;
        while (std::getline(ss, part, '/')) {
            if (part.empty()) continue;
            current->is_dir = true;
            current = &(current->children[part]);
        }
        if (is_dir) current->is_dir = true;
    };
    for (const auto& d : directories_) insert(d, true);
    for (const auto& [path, rec] : files_) insert(path, false);

    std::vector<std::string> lines;
    lines.push_back(root_.filename().string() + "/");

    std::function<void(const VisualNode&, const std::string&)> draw_node;
    draw_node = [&](const VisualNode& node, const std::string& prefix) {
        for (auto it = node.children.begin(); it != node.children.end(); ++it) {
            bool is_last = (std::next(it) == node.children.end());
            std::string name = it->first + (it->second.is_dir ? "/" : "");
            lines.push_back(prefix + (is_last ? "└── " : "├── ") + name);
            draw_node(it->second, prefix + (is_last ? "    " : "│   "));
        }
    };
    draw_node(root, "");

    std::string out;
    size_t shown = (max_lines > 0 && lines.size() > max_lines) ? max_lines : lines.size();
    for (size_t i = 0; i < shown; ++i) out += lines[i] + "\n";
    if (shown < lines.size()) {
        out += "... (" + std::to_string(lines.size() - shown) + " more entries, call get_file_tree)\n";
    }
    return out;
}

std::vector<SymbolEntry> CodebaseIndex::find_symbol(const std::string& name) const {
    auto it = symbols_.find(name);
    if (it == symbols_.end()) return {};
    return it->second;
}

const std::vector<std::string>* CodebaseIndex::imports_of(const std::string& rel_path) const {
    auto it = imports_.find(rel_path);
    return it == imports_.end() ? nullptr : &it->second;
}

std::vector<std::string> CodebaseIndex::dependents_of(const std::string& rel_path) const {
    std::vector<std::string> out;
    for (const auto& [file, deps] : imports_) {
        if (std::find(deps.begin(), deps.end(), rel_path) != deps.end()) out.push_back(file);
    }
    return out;
}

std::string CodebaseIndex::summary() const {
    std::ostringstream ss;
    ss << "Codebase Index Summary\n"
       << "Total files: " << stats_.total_files << "\n"
       << "Source files: " << stats_.source_files << "\n"
       << "Unparsed files: " << stats_.unparsed_files << "\n"
       << "Unique symbols: " << stats_.unique_symbols << "\n"
       << "Total symbol definitions: " << stats_.total_symbols << "\n"
       << "Test files: " << stats_.test_files << "\n"
       << "Build time: " << static_cast<long long>(stats_.build_ms) << " ms\n";
    return ss.str();
}

} // namespace reviewer
