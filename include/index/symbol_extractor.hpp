#pragma once
#include <tree_sitter/api.h>
#include <string>
#include <vector>
#include "index/codebase_index.hpp"

// Grammars are linked from their own libraries
extern "C" {
    const TSLanguage* tree_sitter_cpp();
    const TSLanguage* tree_sitter_python();
    const TSLanguage* tree_sitter_typescript();
}

namespace reviewer {

enum class Language { None, Python, Cpp, TypeScript, JsxTsx, CSharp, Java, Php };

Language language_for(const std::string& path);
inline bool is_source_path(const std::string& path) { return language_for(path) != Language::None; }

struct ParsedFile {
    bool parsed = true;
    std::vector<SymbolEntry> symbols;
    std::vector<std::string> imports; // raw, in source order, de-duplicated
};

// Regex line scanner for the languages without a linked grammar (C#, Java, PHP, JSX/TSX).
ParsedFile scan_lines(const std::string& rel_path, const std::string& content, Language lang);

/**
 * Turns one source file into symbol definitions and raw imports.
 * Owns a tree-sitter parser, so an instance must not be shared between threads.
 */
class SymbolExtractor {
public:
    SymbolExtractor();
    ~SymbolExtractor();

    SymbolExtractor(const SymbolExtractor&) = delete;
    SymbolExtractor& operator=(const SymbolExtractor&) = delete;

    ParsedFile extract(const std::string& rel_path, const std::string& content);

private:
    ParsedFile extract_ast(const std::string& rel_path, const std::string& content, Language lang);
    const TSLanguage* get_lang(Language lang) const;

    TSParser* parser_;
};

// Binary or invalid UTF-8 content is never parsed.
bool looks_like_text(const std::string& content);

} // namespace reviewer
