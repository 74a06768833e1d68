#pragma once
#include <string>
#include "pipeline/ChangeTypes.hpp"

struct TSParser;
struct TSLanguage;

namespace autopatch::syntax {

// What the structural check treats as comments and strings. Double-quoted
// strings are always recognised; everything else is off by default.
struct LexRules {
    bool hash_comments = false;     // '#' to end of line
    bool slash_comments = false;    // '//' to end of line and '/* */'
    bool block_comments = false;    // '/* */' only
    bool single_quotes = false;     // '...' on one line
    bool char_quotes = false;       // only 'x' and '\n' style literals
    bool backticks = false;         // `...`, may span lines
    bool backtick_escapes = false;
    bool triple_quotes = false;     // """...""" and '''...''', may span lines
};

// Parse-only checks of candidate file content. Nothing in the content is
// ever executed.
class SyntaxValidator {
public:
    SyntaxValidator();
    ~SyntaxValidator();

    SyntaxValidator(const SyntaxValidator&) = delete;
    SyntaxValidator& operator=(const SyntaxValidator&) = delete;

    // `language_hint` wins over the extension of `target_path` when set.
    ValidationResult validate(const std::string& content,
                              const std::string& language_hint,
                              const std::string& target_path = "");

    // python | cpp | c | javascript | java | go | rust | css | toml | json | text | generic
    static std::string detect_language(const std::string& language_hint, const std::string& target_path);

    static LexRules lex_rules(const std::string& language);

    // Balanced ()[]{} outside strings and comments, terminated strings.
    static ValidationResult check_structure(const std::string& content, const LexRules& rules = {});

private:
    TSParser* parser_;

    const TSLanguage* get_lang(const std::string& language) const;
    ValidationResult validate_tree_sitter(const std::string& content, const std::string& language);
    static ValidationResult validate_json(const std::string& content);
};

}
