#include "index/symbol_extractor.hpp"
#include <regex>
#include <set>
#include <sstream>
#include <spdlog/spdlog.h>

namespace reviewer {

namespace {

// std::regex recurses per character; longer lines (minified bundles) only get brace counting
constexpr size_t kMaxScanLineBytes = 4096;

struct ScanRules {
    std::vector<std::regex> imports;
    std::regex type_re;
    std::regex member_re;        // group 1: return type or empty, group 2: name
    bool members_need_class;     // C# and Java only define functions inside types
    bool skip_magic = false;     // PHP __construct, __get, ...
};

const std::set<std::string>& keywords() {
    static const std::set<std::string> words = {
        "if", "else", "while", "for", "foreach", "switch", "catch", "using", "new", "return",
        "lock", "nameof", "typeof", "sizeof", "throw", "await", "do", "try", "function", "synchronized"
    };
    return words;
}

ScanRules rules_for(Language lang) {
    ScanRules r;
    switch (lang) {
        case Language::CSharp:
            r.imports = {std::regex(R"(^\s*using\s+(?:static\s+)?([\w.]+)\s*;)")};
            r.type_re = std::regex(R"(\b(?:class|record|struct|interface|enum)\s+(\w+))");
            r.member_re = std::regex(
                R"(^\s*(?:(?:public|private|protected|internal|static|virtual|override|async|abstract|sealed|extern|unsafe|new|partial)\s+)*([\w<>\[\],.?]+)\s+(\w+)\s*(?:<[^>]*>)?\s*\()");
            r.members_need_class = true;
            break;
        case Language::Java:
            r.imports = {std::regex(R"(^\s*import\s+(?:static\s+)?([\w.*]+)\s*;)")};
            r.type_re = std::regex(R"(\b(?:class|interface|enum|record)\s+(\w+))");
            r.member_re = std::regex(
                R"(^\s*(?:(?:public|private|protected|static|final|abstract|synchronized|native|default)\s+)*(?:<[^>]+>\s+)?([\w<>\[\],.?]+)\s+(\w+)\s*\()");
            r.members_need_class = true;
            break;
        case Language::Php:
            r.imports = {std::regex(R"(^\s*use\s+([^;]+);)"),
                         std::regex(R"((?:include|require)(?:_once)?\s*\(?\s*['"]([^'"]+)['"])")};
            r.type_re = std::regex(R"(\b(?:class|interface|trait|enum)\s+(\w+))");
            r.member_re = std::regex(R"(()\bfunction\s+&?\s*(\w+)\s*\()");
            r.members_need_class = false;
            r.skip_magic = true;
            break;
        default: // JSX / TSX
            r.imports = {std::regex(R"(\bfrom\s+['"]([^'"]+)['"])"),
                         std::regex(R"(^\s*import\s+['"]([^'"]+)['"])"),
                         std::regex(R"(\brequire\(\s*['"]([^'"]+)['"]\s*\))")};
            r.type_re = std::regex(R"(^\s*(?:export\s+)?(?:default\s+)?(?:abstract\s+)?(?:class|interface|enum)\s+(\w+))");
            r.member_re = std::regex(
                R"(^\s*(?:export\s+)?(?:default\s+)?(?:async\s+)?(function)\s*\*?\s*(\w+)\s*[<(])");
            r.members_need_class = false;
            break;
    }
    return r;
}

// Braces outside string literals and line comments.
void count_braces(const std::string& line, int& open, int& close) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote) {
            if (c == '\\') ++i;
            else if (c == quote) quote = 0;
            continue;
        }
        if (c == '"' || c == '\'' || c == '`') quote = c;
        else if (c == '/' && i + 1 < line.size() && line[i + 1] == '/') break;
        else if (c == '{') ++open;
        else if (c == '}') ++close;
    }
}

struct OpenType {
    std::string name;
    int depth;           // brace depth of the declaration line
    int line;
    bool opened = false;
};

} // namespace

ParsedFile scan_lines(const std::string& rel_path, const std::string& content, Language lang) {
    ParsedFile out;
    const ScanRules rules = rules_for(lang);

    static const std::regex arrow_re(
        R"(^\s*(?:export\s+)?(?:const|let|var)\s+(\w+)\s*(?::[^=]+)?=\s*(?:async\s+)?(?:\([^)]*\)|\w+)\s*(?::[^=]+)?=>)");
    static const std::regex class_member_re(
        R"(^\s*(?:(?:public|private|protected|static|async|readonly|override|get|set)\s+)*(\w+)\s*\([^)]*\)\s*(?::[^{]+)?\{)");

    std::set<std::string> seen_imports;
    std::vector<OpenType> types;
    std::istringstream stream(content);
    std::string line;
    int line_no = 0;
    int depth = 0;

    while (std::getline(stream, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        std::string clean_line = line;
        clean_line.erase(0, clean_line.find_first_not_of(" \t"));

        int open_braces = 0;
        int close_braces = 0;
        count_braces(clean_line, open_braces, close_braces);

        bool is_comment = clean_line.rfind("//", 0) == 0 || clean_line.rfind("/*", 0) == 0 ||
                          clean_line.rfind("*", 0) == 0 || (lang == Language::Php && clean_line.rfind("#", 0) == 0);

        if (clean_line.size() > kMaxScanLineBytes) {
            spdlog::debug("⏭️  {}:{} is {} bytes; symbols on it are skipped", rel_path, line_no, clean_line.size());
        } else if (!is_comment && !clean_line.empty()) {
            // 1. Imports
            for (const auto& re : rules.imports) {
                for (std::sregex_iterator it(clean_line.begin(), clean_line.end(), re), end; it != end; ++it) {
                    std::string raw = (*it)[1].str();
                    raw.erase(raw.find_last_not_of(" \t") + 1);
                    if (!raw.empty() && seen_imports.insert(raw).second) out.imports.push_back(raw);
                }
            }

            const OpenType* enclosing = nullptr;
            if (!types.empty() && types.back().opened && depth == types.back().depth + 1) enclosing = &types.back();

            // 2. Types
            std::smatch match;
            bool matched_type = false;
            if (std::regex_search(clean_line, match, rules.type_re)) {
                std::string name = match[1].str();
                if (!keywords().count(name)) {
                    out.symbols.push_back(SymbolEntry{name, SymbolKind::Type, rel_path, line_no, ""});
                    types.push_back(OpenType{name, depth, line_no});
                    matched_type = true;
                }
            }

            // 3. Functions and methods
            if (!matched_type) {
                bool ends_statement = !clean_line.empty() && clean_line.back() == ';';
                std::string name;
                if (std::regex_search(clean_line, match, rules.member_re)) {
                    std::string ret = match[1].str();
                    name = match[2].str();
                    if (keywords().count(name) || (ret != "function" && keywords().count(ret))) name.clear();
                    if (rules.members_need_class && (!enclosing || ends_statement)) name.clear();
                    if (rules.skip_magic && name.rfind("__", 0) == 0) name.clear();
                } else if (lang == Language::JsxTsx && std::regex_search(clean_line, match, arrow_re)) {
                    name = match[1].str();
                } else if (lang == Language::JsxTsx && enclosing && std::regex_search(clean_line, match, class_member_re)) {
                    name = match[1].str();
                    if (keywords().count(name)) name.clear();
                }

                if (!name.empty()) {
                    bool is_method = enclosing != nullptr;
                    out.symbols.push_back(SymbolEntry{name, is_method ? SymbolKind::Method : SymbolKind::Function,
                                                      rel_path, line_no, is_method ? enclosing->name : ""});
                }
            }
        }

        // 4. Brace depth and type scopes
        depth += open_braces - close_braces;
        if (depth < 0) depth = 0;
        while (!types.empty()) {
            OpenType& top = types.back();
            if (!top.opened && depth > top.depth) top.opened = true;
            // "class A {}" opens and closes on its declaration line
            if (!top.opened && top.line == line_no && open_braces > 0) {
                types.pop_back();
                continue;
            }
            if (top.opened && depth <= top.depth) {
                types.pop_back();
                continue;
            }
            break;
        }
    }

    return out;
}

} // namespace reviewer
