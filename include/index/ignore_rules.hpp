#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace reviewer {

/**
 * Gitignore-style path filter. Rules are evaluated in order and the last match wins.
 *   "*.log"   matches the name at any depth
 *   "bin/"    matches directories only
 *   "/out"    or "docs/*.md" is anchored at the project root
 *   "!keep"   re-includes a previously ignored path
 * A path is ignored when it, or any directory above it, is ignored.
 */
class IgnoreRules {
public:
    IgnoreRules() = default;

    // Built-in defaults, then <root>/.gitignore, then the caller's patterns.
    static IgnoreRules for_project(const std::filesystem::path& root, const std::vector<std::string>& extra);
    static const std::vector<std::string>& default_patterns();

    void add(const std::string& pattern);
    void add_file(const std::filesystem::path& ignore_file);

    bool is_ignored(const std::string& rel_path, bool is_dir) const;

private:
    struct Rule {
        std::string glob;
        bool negated = false;
        bool dir_only = false;
        bool anchored = false;
    };

    // Decision for this exact path, ignoring its parents: 1 ignore, -1 include, 0 no rule.
    int match(const std::string& rel_path, bool is_dir) const;

    std::vector<Rule> rules_;
};

} // namespace reviewer
