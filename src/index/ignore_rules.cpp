#include "index/ignore_rules.hpp"
#include <fnmatch.h>
#include <fstream>
#include <spdlog/spdlog.h>

namespace reviewer {

namespace fs = std::filesystem;

const std::vector<std::string>& IgnoreRules::default_patterns() {
    static const std::vector<std::string> defaults = {
        "__pycache__", "*.pyc", "node_modules", ".git", ".venv", "venv", "env", "dist", "build",
        ".pytest_cache", ".mypy_cache", "*.egg-info", ".tox", "htmlcov", ".coverage", "*.log",
        ".DS_Store", "Thumbs.db",
        // .NET output and tooling
        "bin/", "obj/", "*.dll", "*.pdb", "*.exe", "TestResults/", "*.user", "*.suo", ".vs/",
        "packages/", "*.nupkg", "*.cache", "_ReSharper*", "*.dotCover",
        // our own state
        ".reviewer/"
    };
    return defaults;
}

IgnoreRules IgnoreRules::for_project(const fs::path& root, const std::vector<std::string>& extra) {
    IgnoreRules rules;
    for (const auto& p : default_patterns()) rules.add(p);
    rules.add_file(root / ".gitignore");
    for (const auto& p : extra) rules.add(p);
    return rules;
}

void IgnoreRules::add(const std::string& pattern) {
    std::string p = pattern;
    while (!p.empty() && (p.back() == ' ' || p.back() == '\t' || p.back() == '\r')) p.pop_back();
    p.erase(0, p.find_first_not_of(" \t"));
    if (p.empty() || p[0] == '#') return;

    Rule rule;
    if (p[0] == '!') {
        rule.negated = true;
        p.erase(0, 1);
    }
    if (!p.empty() && p.back() == '/') {
        rule.dir_only = true;
        p.pop_back();
    }
    if (!p.empty() && p[0] == '/') {
        rule.anchored = true;
        p.erase(0, 1);
    }
    if (p.find('/') != std::string::npos) rule.anchored = true;
    if (p.rfind("**/", 0) == 0) {
        rule.anchored = false;
        p.erase(0, 3);
    }
    if (p.empty()) return;

    rule.glob = p;
    rules_.push_back(std::move(rule));
}

void IgnoreRules::add_file(const fs::path& ignore_file) {
    std::error_code ec;
    if (!fs::is_regular_file(ignore_file, ec)) return;

    std::ifstream f(ignore_file);
    if (!f.is_open()) {
        spdlog::warn("⚠️  Could not read {}", ignore_file.string());
        return;
    }
    std::string line;
    size_t before = rules_.size();
    while (std::getline(f, line)) add(line);
    spdlog::debug("📜 Loaded {} ignore rules from {}", rules_.size() - before, ignore_file.string());
}

int IgnoreRules::match(const std::string& rel_path, bool is_dir) const {
    const std::string name = fs::path(rel_path).filename().string();
    int decision = 0;
    for (const auto& rule : rules_) {
        if (rule.dir_only && !is_dir) continue;
        bool hit = rule.anchored ? fnmatch(rule.glob.c_str(), rel_path.c_str(), FNM_PATHNAME) == 0
                                 : fnmatch(rule.glob.c_str(), name.c_str(), 0) == 0;
        if (hit) decision = rule.negated ? -1 : 1;
    }
    return decision;
}

bool IgnoreRules::is_ignored(const std::string& rel_path, bool is_dir) const {
    // A file under an ignored directory stays ignored, as in git
    std::string prefix;
    fs::path p(rel_path);
    std::vector<std::string> parts;
    for (const auto& part : p) {
        std::string seg = part.string();
        if (!seg.empty() && seg != ".") parts.push_back(seg);
    }
    for (size_t i = 0; i < parts.size(); ++i) {
        prefix += (i ? "/" : "") + parts[i];
        bool last = (i + 1 == parts.size());
        if (match(prefix, last ? is_dir : true) > 0) return true;
    }
    return false;
}

} // namespace reviewer
