#include "index/symbol_extractor.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <set>
#include <stack>

namespace reviewer {

Language language_for(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".py") return Language::Python;
    if (ext == ".cpp" || ext == ".cc" || ext == ".cxx" || ext == ".c" ||
        ext == ".hpp" || ext == ".hh" || ext == ".hxx" || ext == ".h") return Language::Cpp;
    if (ext == ".ts" || ext == ".js" || ext == ".mjs" || ext == ".cjs") return Language::TypeScript;
    if (ext == ".tsx" || ext == ".jsx") return Language::JsxTsx;
    if (ext == ".cs") return Language::CSharp;
    if (ext == ".java") return Language::Java;
    if (ext == ".php") return Language::Php;
    return Language::None;
}

bool looks_like_text(const std::string& content) {
    size_t i = 0;
    const size_t n = content.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(content[i]);
        if (c == 0) return false;
        size_t extra = 0;
        if (c < 0x80) extra = 0;
        else if ((c & 0xE0) == 0xC0 && c >= 0xC2) extra = 1;
        else if ((c & 0xF0) == 0xE0) extra = 2;
        else if ((c & 0xF8) == 0xF0 && c <= 0xF4) extra = 3;
        else return false;

        if (i + extra >= n && extra > 0) return false;
        for (size_t k = 1; k <= extra; ++k) {
            if ((static_cast<unsigned char>(content[i + k]) & 0xC0) != 0x80) return false;
        }
        i += extra + 1;
    }
    return true;
}

namespace {

std::string node_text(TSNode node, const std::string& content) {
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (start >= content.size() || end <= start) return "";
    return content.substr(start, std::min<size_t>(end, content.size()) - start);
}

TSNode field(TSNode node, const char* name) {
    return ts_node_child_by_field_name(node, name, static_cast<uint32_t>(strlen(name)));
}

std::string strip_quotes(std::string s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'' || s.front() == '`') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

int line_of(TSNode node) {
    return static_cast<int>(ts_node_start_point(node).row) + 1;
}

// Nearest enclosing type, and whether a function body sits between it and the node.
struct Frame {
    TSNode node;
    std::string klass;
    bool in_function = false;
};

class Collector {
public:
    Collector(const std::string& rel_path, ParsedFile& out) : path_(rel_path), out_(out) {}

    void symbol(const std::string& name, SymbolKind kind, TSNode at, const std::string& parent = "") {
        if (name.empty()) return;
        out_.symbols.push_back(SymbolEntry{name, kind, path_, line_of(at), parent});
    }

    void import(const std::string& raw) {
        if (raw.empty()) return;
        if (seen_.insert(raw).second) out_.imports.push_back(raw);
    }

private:
    const std::string& path_;
    ParsedFile& out_;
    std::set<std::string> seen_;
};

// --- PYTHON ---

void visit_python(const Frame& f, const std::string& content, Collector& c, Frame& child) {
    const std::string type = ts_node_type(f.node);

    if (type == "class_definition") {
        std::string name = node_text(field(f.node, "name"), content);
        c.symbol(name, SymbolKind::Type, f.node);
        child.klass = name;
        child.in_function = false;
    } else if (type == "function_definition") {
        std::string name = node_text(field(f.node, "name"), content);
        bool is_method = !f.klass.empty() && !f.in_function;
        c.symbol(name, is_method ? SymbolKind::Method : SymbolKind::Function, f.node, is_method ? f.klass : "");
        child.in_function = true;
    } else if (type == "import_statement") {
        uint32_t count = ts_node_named_child_count(f.node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode n = ts_node_named_child(f.node, i);
            std::string ntype = ts_node_type(n);
            if (ntype == "dotted_name") c.import(node_text(n, content));
            else if (ntype == "aliased_import") c.import(node_text(field(n, "name"), content));
        }
    } else if (type == "import_from_statement") {
        c.import(node_text(field(f.node, "module_name"), content));
    }
}

// --- C / C++ ---

void visit_cpp(const Frame& f, const std::string& content, Collector& c, Frame& child) {
    const std::string type = ts_node_type(f.node);

    if (type == "class_specifier" || type == "struct_specifier") {
        TSNode name = field(f.node, "name");
        if (ts_node_is_null(name) || ts_node_is_null(field(f.node, "body"))) return;
        std::string n = node_text(name, content);
        c.symbol(n, SymbolKind::Type, f.node);
        child.klass = n;
        child.in_function = false;
    } else if (type == "function_definition") {
        child.in_function = true;

        TSNode decl = field(f.node, "declarator");
        while (!ts_node_is_null(decl)) {
            std::string dtype = ts_node_type(decl);
            if (dtype == "function_declarator") break;
            if (dtype == "pointer_declarator" || dtype == "reference_declarator" ||
                dtype == "parenthesized_declarator") {
                uint32_t named = ts_node_named_child_count(decl);
                decl = named ? ts_node_named_child(decl, named - 1) : TSNode{};
                continue;
            }
            return;
        }
        if (ts_node_is_null(decl)) return;

        TSNode target = field(decl, "declarator");
        std::string parent;
        while (!ts_node_is_null(target) && std::string(ts_node_type(target)) == "qualified_identifier") {
            TSNode scope = field(target, "scope");
            if (!ts_node_is_null(scope)) parent = node_text(scope, content);
            target = field(target, "name");
        }
        if (ts_node_is_null(target)) return;

        std::string ttype = ts_node_type(target);
        std::string name = node_text(target, content);
        if (ttype == "destructor_name" || ttype == "operator_name" || ttype == "identifier" ||
            ttype == "field_identifier") {
            if (parent.empty() && !f.klass.empty() && !f.in_function) parent = f.klass;
            c.symbol(name, parent.empty() ? SymbolKind::Function : SymbolKind::Method, f.node, parent);
        }
    } else if (type == "preproc_include") {
        TSNode path = field(f.node, "path");
        if (ts_node_is_null(path)) return;
        std::string raw = node_text(path, content);
        c.import(raw.empty() || raw[0] == '<' ? raw : strip_quotes(raw));
    }
}

// --- TYPESCRIPT / JAVASCRIPT ---

void visit_script(const Frame& f, const std::string& content, Collector& c, Frame& child) {
    const std::string type = ts_node_type(f.node);

    if (type == "class_declaration" || type == "abstract_class_declaration" ||
        type == "interface_declaration" || type == "enum_declaration" || type == "class") {
        std::string name = node_text(field(f.node, "name"), content);
        c.symbol(name, SymbolKind::Type, f.node);
        if (!name.empty()) {
            child.klass = name;
            child.in_function = false;
        }
    } else if (type == "function_declaration" || type == "generator_function_declaration") {
        c.symbol(node_text(field(f.node, "name"), content), SymbolKind::Function, f.node);
        child.in_function = true;
    } else if (type == "method_definition") {
        bool is_method = !f.klass.empty() && !f.in_function;
        std::string name = node_text(field(f.node, "name"), content);
        c.symbol(name, is_method ? SymbolKind::Method : SymbolKind::Function, f.node, is_method ? f.klass : "");
        child.in_function = true;
    } else if (type == "variable_declarator") {
        TSNode value = field(f.node, "value");
        if (ts_node_is_null(value)) return;
        std::string vtype = ts_node_type(value);
        if (vtype == "arrow_function" || vtype == "function_expression" || vtype == "function") {
            TSNode name = field(f.node, "name");
            if (std::string(ts_node_type(name)) == "identifier") {
                c.symbol(node_text(name, content), SymbolKind::Function, f.node);
            }
        }
    } else if (type == "import_statement" || type == "export_statement") {
        TSNode source = field(f.node, "source");
        if (!ts_node_is_null(source)) c.import(strip_quotes(node_text(source, content)));
    } else if (type == "call_expression") {
        TSNode fn = field(f.node, "function");
        if (ts_node_is_null(fn) || node_text(fn, content) != "require") return;
        TSNode args = field(f.node, "arguments");
        if (ts_node_is_null(args) || ts_node_named_child_count(args) == 0) return;
        TSNode first = ts_node_named_child(args, 0);
        if (std::string(ts_node_type(first)) == "string") c.import(strip_quotes(node_text(first, content)));
    }
}

} // namespace

SymbolExtractor::SymbolExtractor() {
    parser_ = ts_parser_new();
}

SymbolExtractor::~SymbolExtractor() {
    if (parser_) ts_parser_delete(parser_);
}

const TSLanguage* SymbolExtractor::get_lang(Language lang) const {
    switch (lang) {
        case Language::Python:     return tree_sitter_python();
        case Language::Cpp:        return tree_sitter_cpp();
        case Language::TypeScript: return tree_sitter_typescript();
        default:                   return nullptr;
    }
}

ParsedFile SymbolExtractor::extract(const std::string& rel_path, const std::string& content) {
    Language lang = language_for(rel_path);
    if (lang == Language::None) return ParsedFile{};

    if (!looks_like_text(content)) {
        ParsedFile unparsed;
        unparsed.parsed = false;
        return unparsed;
    }

    if (get_lang(lang)) return extract_ast(rel_path, content, lang);
    return scan_lines(rel_path, content, lang);
}

ParsedFile SymbolExtractor::extract_ast(const std::string& rel_path, const std::string& content, Language lang) {
    ParsedFile out;

    if (!ts_parser_set_language(parser_, get_lang(lang))) {
        spdlog::warn("⚠️  Grammar version mismatch, skipping {}", rel_path);
        out.parsed = false;
        return out;
    }
    TSTree* tree = ts_parser_parse_string(parser_, nullptr, content.c_str(), static_cast<uint32_t>(content.length()));
    if (!tree) {
        out.parsed = false;
        return out;
    }
    TSNode root = ts_tree_root_node(tree);

    // Python sources that do not parse cleanly contribute nothing
    if (lang == Language::Python && ts_node_has_error(root)) {
        ts_tree_delete(tree);
        out.parsed = false;
        return out;
    }

    Collector collector(rel_path, out);

    // Non-recursive pre-order traversal; children pushed in reverse to keep source order
    std::stack<Frame> stack;
    stack.push(Frame{root, "", false});

    while (!stack.empty()) {
        Frame frame = stack.top();
        stack.pop();

        Frame child = frame;
        switch (lang) {
            case Language::Python:     visit_python(frame, content, collector, child); break;
            case Language::Cpp:        visit_cpp(frame, content, collector, child); break;
            case Language::TypeScript: visit_script(frame, content, collector, child); break;
            default: break;
        }

        uint32_t count = ts_node_child_count(frame.node);
        for (uint32_t i = count; i > 0; --i) {
            child.node = ts_node_child(frame.node, i - 1);
            stack.push(child);
        }
    }

    ts_tree_delete(tree);
    spdlog::debug("🛰️  AST scan: {} symbols, {} imports in {}", out.symbols.size(), out.imports.size(), rel_path);
    return out;
}

} // namespace reviewer
