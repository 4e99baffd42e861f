#include "tools/NavigationTools.hpp"
#include "index/symbol_extractor.hpp"
#include "errors.hpp"
#include "utf8.hpp"
#include <fnmatch.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <set>
#include <sstream>
#include <spdlog/spdlog.h>

namespace reviewer {

namespace {

constexpr size_t kMaxLineChars = 300;
// std::regex recurses per character matched; long lines are searched in overlapping windows
constexpr size_t kRegexWindow = 2048;
constexpr size_t kRegexOverlap = 256;

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

std::string trim_line(const std::string& line) {
    size_t b = line.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    size_t e = line.find_last_not_of(" \t\r");
    std::string out = line.substr(b, e - b + 1);
    if (out.size() > kMaxLineChars) out = utf8_safe_substr(out, kMaxLineChars) + "...";
    return to_valid_utf8(out);
}

bool contains_word(const std::string& line, const std::string& word) {
    size_t pos = line.find(word);
    while (pos != std::string::npos) {
        bool left_ok = pos == 0 || !is_ident_char(line[pos - 1]);
        size_t end = pos + word.size();
        bool right_ok = end >= line.size() || !is_ident_char(line[end]);
        if (left_ok && right_ok) return true;
        pos = line.find(word, pos + 1);
    }
    return false;
}

bool in_scope(const std::string& rel, std::string scope) {
    if (scope.empty()) return true;
    if (scope.rfind("./", 0) == 0) scope = scope.substr(2);
    if (!scope.empty() && scope.back() == '/') return rel.rfind(scope, 0) == 0;

    const std::string name = fs::path(rel).filename().string();
    if (scope.find_first_of("*?[") != std::string::npos) {
        if (scope.find('/') != std::string::npos) return fnmatch(scope.c_str(), rel.c_str(), 0) == 0;
        return fnmatch(scope.c_str(), name.c_str(), 0) == 0;
    }
    return rel == scope || name == scope || rel.rfind(scope + "/", 0) == 0;
}

// Position of the first window holding a match, or npos. Matches wider than the overlap
// that straddle a window edge are missed.
size_t search_windows(const std::string& line, const std::regex& re) {
    for (size_t start = 0; start < line.size(); start += kRegexWindow - kRegexOverlap) {
        const size_t end = std::min(line.size(), start + kRegexWindow);
        auto flags = std::regex_constants::match_default;
        if (start > 0) flags |= std::regex_constants::match_prev_avail;
        if (end < line.size()) flags |= std::regex_constants::match_not_eol;
        if (std::regex_search(line.begin() + start, line.begin() + end, re, flags)) return start;
        if (end == line.size()) break;
    }
    return std::string::npos;
}

} // namespace

NavigationTools::NavigationTools(const CodebaseIndex& index, size_t read_file_max_bytes)
    : index_(index), sandbox_(index.root()), max_bytes_(read_file_max_bytes) {}

std::string NavigationTools::relative_path(const std::string& requested) const {
    return sandbox_.relative(sandbox_.resolve(requested));
}

bool NavigationTools::load_text(const std::string& rel_path, std::string& out) const {
    std::error_code ec;
    fs::path abs = sandbox_.root() / rel_path;
    auto size = fs::file_size(abs, ec);
    if (ec || size > kMaxSearchBytes) return false;

    std::ifstream f(abs, std::ios::binary);
    if (!f.is_open()) return false;
    std::stringstream buffer;
    buffer << f.rdbuf();
    out = buffer.str();
    return out.find('\0') == std::string::npos;
}

// --- 1. READ ---

FileContent NavigationTools::read_file(const std::string& filepath) const {
    fs::path target = sandbox_.resolve(filepath);
    std::string rel = sandbox_.relative(target);
    spdlog::info("🔍 read_file {}", rel);

    std::error_code ec;
    if (!fs::is_regular_file(target, ec)) {
        throw ReviewerError(ErrorCode::NotFound, "File not found: " + filepath);
    }

    FileContent result;
    result.filepath = rel;
    result.size = fs::file_size(target, ec);

    std::ifstream f(target, std::ios::in | std::ios::binary);
    if (!f.is_open()) {
        throw ReviewerError(ErrorCode::IoError, "Cannot open " + filepath);
    }
    std::string content(static_cast<size_t>(std::min<uintmax_t>(result.size, max_bytes_)), '\0');
    f.read(&content[0], static_cast<std::streamsize>(content.size()));
    content.resize(static_cast<size_t>(f.gcount()));

    if (result.size > max_bytes_) {
        // Do not split a UTF-8 sequence
        size_t cut = content.size();
        while (cut > 0 && (static_cast<unsigned char>(content[cut - 1]) & 0xC0) == 0x80) --cut;
        if (cut > 0 && static_cast<unsigned char>(content[cut - 1]) >= 0xC0) --cut;
        else cut = content.size();
        content.resize(cut);
        content += "\n... [truncated: " + std::to_string(cut) + " of " + std::to_string(result.size) + " bytes shown]";
        result.truncated = true;
    }
    if (!is_valid_utf8(content)) {
        spdlog::warn("⚠️  {} is not valid UTF-8; invalid bytes shown as U+FFFD", rel);
        content = to_valid_utf8(content);
    }
    result.content = std::move(content);
    return result;
}

// --- 2. SYMBOLS ---

std::vector<SymbolEntry> NavigationTools::search_symbol(const std::string& symbol_name) const {
    return index_.find_symbol(symbol_name);
}

std::vector<UsageHit> NavigationTools::find_usages(const std::string& symbol_name) const {
    std::vector<UsageHit> hits;
    if (symbol_name.empty()) return hits;

    std::set<std::pair<std::string, int>> definitions;
    std::set<std::string> defining_files;
    for (const auto& def : index_.find_symbol(symbol_name)) {
        definitions.insert({def.file, def.line});
        defining_files.insert(def.file);
    }

    for (const auto& [rel, rec] : index_.files()) {
        std::string content;
        if (!load_text(rel, content) || content.find(symbol_name) == std::string::npos) continue;

        bool via_import = false;
        if (const auto* deps = index_.imports_of(rel)) {
            for (const auto& dep : *deps) {
                if (defining_files.count(dep)) {
                    via_import = true;
                    break;
                }
            }
        }

        std::istringstream stream(content);
        std::string line;
        int line_no = 0;
        while (std::getline(stream, line)) {
            ++line_no;
            if (!contains_word(line, symbol_name) || definitions.count({rel, line_no})) continue;
            hits.push_back(UsageHit{rel, line_no, trim_line(line), via_import});
            if (hits.size() >= kMaxResults) return hits;
        }
    }
    return hits;
}

// --- 3. STRUCTURE ---

std::vector<std::string> NavigationTools::get_imports(const std::string& filepath) const {
    fs::path target = sandbox_.resolve(filepath);
    std::string rel = sandbox_.relative(target);

    if (const auto* deps = index_.imports_of(rel)) return *deps;
    if (index_.contains_file(rel)) return {};

    std::error_code ec;
    if (!fs::is_regular_file(target, ec)) {
        throw ReviewerError(ErrorCode::NotFound, "File not found: " + filepath);
    }

    // Present on disk but not indexed (ignored or created after the snapshot)
    std::string content;
    if (!load_text(rel, content)) return {};
    SymbolExtractor extractor;
    return extractor.extract(rel, content).imports;
}

std::string NavigationTools::get_file_tree() const {
    return index_.render_tree();
}

std::vector<TextMatch> NavigationTools::search_text(const std::string& pattern, const std::string& file_pattern) const {
    if (pattern.empty()) {
        throw ReviewerError(ErrorCode::InvalidArguments, "search_text needs a non-empty pattern");
    }
    std::regex re;
    try {
        re = std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw ReviewerError(ErrorCode::InvalidArguments, "Invalid regex '" + pattern + "': " + e.what());
    }

    std::vector<TextMatch> matches;
    for (const auto& [rel, rec] : index_.files()) {
        if (!in_scope(rel, file_pattern)) continue;

        std::string content;
        if (!load_text(rel, content)) continue;

        std::istringstream stream(content);
        std::string line;
        int line_no = 0;
        while (std::getline(stream, line)) {
            ++line_no;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.size() <= kRegexWindow) {
                if (!std::regex_search(line, re)) continue;
                matches.push_back(TextMatch{rel, line_no, trim_line(line)});
            } else {
                const size_t window = search_windows(line, re);
                if (window == std::string::npos) continue;
                matches.push_back(TextMatch{rel, line_no, trim_line(line.substr(window, kRegexWindow)), true});
            }
            if (matches.size() >= kMaxResults) return matches;
        }
    }
    return matches;
}

} // namespace reviewer
