#include "tools/Sandbox.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

namespace reviewer {

Sandbox::Sandbox(const fs::path& project_root) {
    std::error_code ec;
    root_ = fs::canonical(project_root, ec);
    if (ec || !fs::is_directory(root_, ec)) {
        throw ReviewerError(ErrorCode::NotFound, "Project root is not a directory: " + project_root.string());
    }
}

// Segment-wise comparison; "/a/bc" is not inside "/a/b".
bool Sandbox::is_inside(const fs::path& child, const fs::path& parent) {
    if (parent.empty()) return false;
    auto c = child.lexically_normal();
    auto p = parent.lexically_normal();

    auto it_c = c.begin();
    for (auto it_p = p.begin(); it_p != p.end(); ++it_p) {
        if (it_p->empty() || it_p->string() == ".") continue;
        if (it_c == c.end() || *it_c != *it_p) return false;
        ++it_c;
    }
    for (; it_c != c.end(); ++it_c) {
        if (it_c->string() == "..") return false;
    }
    return true;
}

fs::path Sandbox::resolve(const std::string& requested) const {
    if (requested.empty() || requested.find('\0') != std::string::npos) {
        spdlog::error("🚫 Sandbox: rejected empty or malformed path");
        throw ReviewerError(ErrorCode::OutsideSandbox, "Invalid path");
    }

    fs::path p(requested);
    fs::path candidate = p.is_absolute() ? p : root_ / p;

    // weakly_canonical follows every existing symlink; loops and unreadable parts fail here
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(candidate, ec);
    if (ec) {
        spdlog::error("🚫 Sandbox: cannot resolve '{}': {}", requested, ec.message());
        throw ReviewerError(ErrorCode::OutsideSandbox, "Path cannot be resolved safely: " + requested);
    }

    if (!is_inside(resolved, root_)) {
        spdlog::error("🚫 Sandbox: '{}' resolves outside {}", requested, root_.string());
        throw ReviewerError(ErrorCode::OutsideSandbox, "Path is outside the project root: " + requested);
    }

    // Any link still present after canonicalization is dangling and its target is unknown
    fs::path walk = root_;
    for (const auto& part : resolved.lexically_relative(root_)) {
        if (part.empty() || part == ".") continue;
        walk /= part;
        if (fs::is_symlink(fs::symlink_status(walk, ec))) {
            spdlog::error("🚫 Sandbox: '{}' goes through a dangling link", requested);
            throw ReviewerError(ErrorCode::OutsideSandbox, "Path cannot be resolved safely: " + requested);
        }
    }
    return resolved;
}

std::string Sandbox::relative(const fs::path& resolved) const {
    std::string rel = resolved.lexically_relative(root_).generic_string();
    return rel == "." ? "" : rel;
}

} // namespace reviewer
