#pragma once
#include <filesystem>
#include <string>

namespace reviewer {

namespace fs = std::filesystem;

/**
 * Security boundary for every file access made on behalf of the reasoning engine.
 * resolve() canonicalizes ".." and symlinks before comparing against the root and
 * fails closed: any resolution problem is reported as OutsideSandbox.
 */
class Sandbox {
public:
    explicit Sandbox(const fs::path& project_root);

    const fs::path& root() const { return root_; }

    // Absolute, canonical path inside the root. The target need not exist.
    fs::path resolve(const std::string& requested) const;

    // '/'-separated path relative to the root for an already resolved path.
    std::string relative(const fs::path& resolved) const;

    static bool is_inside(const fs::path& child, const fs::path& parent);

private:
    fs::path root_;
};

} // namespace reviewer
