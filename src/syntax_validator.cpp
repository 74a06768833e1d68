#include "syntax_validator.hpp"
#include <tree_sitter/api.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <vector>

// 🚀 EXTERNAL SYMBOL LINKING
extern "C" {
    const TSLanguage* tree_sitter_cpp();
    const TSLanguage* tree_sitter_python();
}

namespace autopatch::syntax {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

// Depth-first search for the first ERROR or MISSING node.
bool find_error_node(TSNode node, TSNode& out) {
    if (std::strcmp(ts_node_type(node), "ERROR") == 0 || ts_node_is_missing(node)) {
        out = node;
        return true;
    }
    if (!ts_node_has_error(node)) return false;
    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; i++) {
        if (find_error_node(ts_node_child(node, i), out)) return true;
    }
    return false;
}

}

SyntaxValidator::SyntaxValidator() {
    parser_ = ts_parser_new();
}

SyntaxValidator::~SyntaxValidator() {
    if (parser_) ts_parser_delete(parser_);
}

std::string SyntaxValidator::detect_language(const std::string& language_hint, const std::string& target_path) {
    std::string hint = lower(language_hint);
    if (hint == "python" || hint == "py") return "python";
    if (hint == "cpp" || hint == "c++" || hint == "cxx") return "cpp";
    if (hint == "c") return "c";
    if (hint == "javascript" || hint == "js" || hint == "typescript" || hint == "ts") return "javascript";
    if (hint == "java" || hint == "kotlin" || hint == "csharp" || hint == "scala") return "java";
    if (hint == "go" || hint == "golang") return "go";
    if (hint == "rust" || hint == "rs") return "rust";
    if (hint == "css") return "css";
    if (hint == "toml") return "toml";
    if (hint == "json") return "json";
    if (hint == "text" || hint == "txt" || hint == "markdown" || hint == "md" ||
        hint == "yaml" || hint == "yml" || hint == "shell" || hint == "sh") return "text";
    if (hint == "generic") return "generic";

    std::string ext = lower(std::filesystem::path(target_path).extension().string());
    if (ext == ".py") return "python";
    if (ext == ".cpp" || ext == ".cc" || ext == ".cxx" || ext == ".hpp" ||
        ext == ".h" || ext == ".hh") return "cpp";
    if (ext == ".c") return "c";
    if (ext == ".js" || ext == ".mjs" || ext == ".cjs" || ext == ".jsx" ||
        ext == ".ts" || ext == ".tsx") return "javascript";
    if (ext == ".java" || ext == ".cs" || ext == ".kt" || ext == ".scala") return "java";
    if (ext == ".go") return "go";
    if (ext == ".rs") return "rust";
    if (ext == ".css") return "css";
    if (ext == ".toml") return "toml";
    if (ext == ".json") return "json";
    // Formats where quotes, '#' and brackets carry no balance rule.
    if (ext == ".txt" || ext == ".md" || ext == ".rst" || ext == ".log" || ext == ".csv" ||
        ext == ".yaml" || ext == ".yml" || ext == ".sh" || ext == ".bash" || ext == ".ini" ||
        ext == ".cfg" || ext == ".xml" || ext == ".html" || ext == ".scss" || ext == ".less") return "text";
    return "generic";
}

LexRules SyntaxValidator::lex_rules(const std::string& language) {
    LexRules r;
    if (language == "python" || language == "toml") {
        r.hash_comments = true;
        r.single_quotes = true;
        r.triple_quotes = true;
    } else if (language == "c" || language == "cpp") {
        r.slash_comments = true;
        r.single_quotes = true;
    } else if (language == "javascript") {
        r.slash_comments = true;
        r.single_quotes = true;
        r.backticks = true;
        r.backtick_escapes = true;
    } else if (language == "java") {
        r.slash_comments = true;
        r.single_quotes = true;
        r.triple_quotes = true;
    } else if (language == "go") {
        r.slash_comments = true;
        r.single_quotes = true;
        r.backticks = true;
    } else if (language == "rust") {
        r.slash_comments = true;
        r.char_quotes = true;
    } else if (language == "css") {
        r.block_comments = true;
        r.single_quotes = true;
    }
    return r;
}

const TSLanguage* SyntaxValidator::get_lang(const std::string& language) const {
    if (language == "cpp") return tree_sitter_cpp();
    if (language == "python") return tree_sitter_python();
    return nullptr;
}

ValidationResult SyntaxValidator::validate(const std::string& content,
                                           const std::string& language_hint,
                                           const std::string& target_path) {
    std::string language = detect_language(language_hint, target_path);

    if (language == "text") {
        return {true, language, "Plain text, no grammar check", 0, 0};
    }

    // Wipe guard: empty code is almost always a generation failure.
    if (is_blank(content) && language != "generic") {
        spdlog::warn("⚠️ AST WARNING: Proposed {} content is empty.", language);
        return {false, language, "Proposed content is empty", 0, 0};
    }

    ValidationResult result;
    if (language == "json") {
        result = validate_json(content);
    } else if (get_lang(language)) {
        result = validate_tree_sitter(content, language);
    } else {
        result = check_structure(content, lex_rules(language));
    }
    result.language = language;

    if (!result.accepted) {
        spdlog::error("❌ AST REJECTION ({}): {} at {}:{}", language, result.message, result.line, result.column);
    }
    return result;
}

ValidationResult SyntaxValidator::validate_tree_sitter(const std::string& content, const std::string& language) {
    ts_parser_set_language(parser_, get_lang(language));

    TSTree* tree = ts_parser_parse_string(parser_, nullptr, content.c_str(), (uint32_t)content.length());
    if (!tree) return {false, language, "Parser produced no tree", 0, 0};

    TSNode root = ts_tree_root_node(tree);
    ValidationResult result{true, language, "Syntax OK", 0, 0};

    TSNode bad{};
    if (find_error_node(root, bad)) {
        TSPoint at = ts_node_start_point(bad);
        result.accepted = false;
        result.line = static_cast<int>(at.row) + 1;
        result.column = static_cast<int>(at.column) + 1;
        if (ts_node_is_missing(bad)) {
            result.message = std::string("Missing '") + ts_node_type(bad) + "'";
        } else {
            result.message = "Syntax error";
        }
    } else if (ts_node_has_error(root)) {
        result.accepted = false;
        result.message = "Syntax error";
    }

    ts_tree_delete(tree);
    return result;
}

ValidationResult SyntaxValidator::validate_json(const std::string& content) {
    try {
        auto parsed = nlohmann::json::parse(content);
        (void)parsed;
        return {true, "json", "JSON OK", 0, 0};
    } catch (const nlohmann::json::parse_error& e) {
        // e.byte is 1-based offset of the failing byte.
        size_t limit = std::min(static_cast<size_t>(e.byte), content.size());
        int line = 1;
        int column = 1;
        for (size_t i = 0; i + 1 < limit; ++i) {
            if (content[i] == '\n') { line++; column = 1; } else { column++; }
        }
        return {false, "json", e.what(), line, column};
    }
}

ValidationResult SyntaxValidator::check_structure(const std::string& content, const LexRules& rules) {
    struct Open { char ch; int line; int column; };
    std::vector<Open> stack;

    int line = 1;
    int column = 0;
    size_t i = 0;
    const size_t n = content.size();

    auto closing_for = [](char open) {
        return open == '(' ? ')' : open == '[' ? ']' : '}';
    };

    while (i < n) {
        char c = content[i];
        column++;

        if (c == '\n') {
            line++;
            column = 0;
            i++;
            continue;
        }

        if ((rules.hash_comments && c == '#') ||
            (rules.slash_comments && c == '/' && i + 1 < n && content[i + 1] == '/')) {
            while (i < n && content[i] != '\n') i++;
            continue;
        }
        if ((rules.slash_comments || rules.block_comments) && c == '/' && i + 1 < n && content[i + 1] == '*') {
            int start_line = line, start_col = column;
            i += 2;
            column++;
            bool closed = false;
            while (i < n) {
                if (content[i] == '*' && i + 1 < n && content[i + 1] == '/') {
                    i += 2;
                    column += 2;
                    closed = true;
                    break;
                }
                if (content[i] == '\n') { line++; column = 0; } else { column++; }
                i++;
            }
            if (!closed) return {false, "generic", "Unterminated block comment", start_line, start_col};
            continue;
        }

        // Rust style: a quote that is not a one-character literal is a lifetime or label.
        if (rules.char_quotes && c == '\'') {
            if (i + 2 < n && content[i + 1] != '\\' && content[i + 1] != '\n' && content[i + 2] == '\'') {
                i += 3;
                column += 2;
                continue;
            }
            if (i + 1 < n && content[i + 1] == '\\') {
                int start_line = line, start_col = column;
                size_t close = content.find_first_of("'\n", i + 3);
                if (close == std::string::npos || content[close] != '\'') {
                    return {false, "generic", "Unterminated character literal", start_line, start_col};
                }
                column += static_cast<int>(close - i);
                i = close + 1;
                continue;
            }
            i++;
            continue;
        }

        bool quote = c == '"' || (rules.single_quotes && c == '\'') || (rules.backticks && c == '`');
        if (quote) {
            int start_line = line, start_col = column;
            bool triple = rules.triple_quotes && c != '`' && i + 2 < n && content[i + 1] == c && content[i + 2] == c;
            bool multiline = triple || c == '`';
            bool escapes = c != '`' || rules.backtick_escapes;
            i += triple ? 3 : 1;
            column += triple ? 2 : 0;
            bool closed = false;
            while (i < n) {
                char d = content[i];
                if (escapes && d == '\\') {
                    if (i + 1 < n && content[i + 1] == '\n') { line++; column = 0; } else { column += 2; }
                    i += 2;
                    continue;
                }
                if (!multiline && d == '\n') break;
                if (d == c && (!triple || (i + 2 < n && content[i + 1] == c && content[i + 2] == c))) {
                    i += triple ? 3 : 1;
                    column += triple ? 3 : 1;
                    closed = true;
                    break;
                }
                if (d == '\n') { line++; column = 0; } else { column++; }
                i++;
            }
            if (!closed) return {false, "generic", "Unterminated string literal", start_line, start_col};
            continue;
        }

        if (c == '(' || c == '[' || c == '{') {
            stack.push_back({c, line, column});
        } else if (c == ')' || c == ']' || c == '}') {
            if (stack.empty()) {
                return {false, "generic", std::string("Unexpected '") + c + "'", line, column};
            }
            if (closing_for(stack.back().ch) != c) {
                return {false, "generic",
                        std::string("Mismatched '") + c + "', expected '" + closing_for(stack.back().ch) + "'",
                        line, column};
            }
            stack.pop_back();
        }
        i++;
    }

    if (!stack.empty()) {
        const Open& o = stack.back();
        return {false, "generic", std::string("Unclosed '") + o.ch + "'", o.line, o.column};
    }
    return {true, "generic", "Structure OK", 0, 0};
}

}
