#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace calltree {

// Half-open byte range [begin, end) into a source text.
struct Span {
    size_t begin = 0;
    size_t end = 0;
};

inline bool is_ident_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

inline bool is_ident_char(char c) {
    return is_ident_start(c) || (c >= '0' && c <= '9');
}

// ---------------------------------------------------------------------------
// Balanced delimiters
// ---------------------------------------------------------------------------

// Given text[open] == left, return the index one past the matching `right`,
// counting nesting depth. Returns npos when text[open] is not `left`, when
// the span never closes, or when a character from `stop_chars` is met first.
size_t match_balanced(const std::string& text, size_t open,
                      char left, char right, const char* stop_chars = nullptr);

size_t match_nested_parens(const std::string& text, size_t open);
size_t match_nested_braces(const std::string& text, size_t open);
// Angle spans never cross ';', '{' or '}'.
size_t match_nested_angles(const std::string& text, size_t open);

// ---------------------------------------------------------------------------
// Names
// ---------------------------------------------------------------------------

struct QualifiedName {
    std::string name;     // template arguments stripped
    size_t begin = 0;
    size_t end = 0;       // one past the last consumed character
};

// Match `::? (ident (<...>)? ::)* ~? ident` starting exactly at pos.
std::optional<QualifiedName> match_qualified_name(const std::string& text, size_t pos);

// Trailing identifier segment ("ns::Foo::bar" -> "bar").
std::string simple_name_of(const std::string& name);

// ---------------------------------------------------------------------------
// Function definitions
// ---------------------------------------------------------------------------

struct DefinitionMatch {
    std::string qualified_name;
    size_t name_begin = 0;
    size_t name_end = 0;
    size_t params_begin = 0;   // the '(' of the parameter list
    size_t body_begin = 0;     // the '{' of the body
    size_t end = 0;            // one past the closing '}'
};

// Name, parameter list, trailing specifiers, optional constructor
// initializer list and body, with the name starting exactly at pos.
std::optional<DefinitionMatch> match_definition_at(const std::string& text, size_t pos);

// First definition anywhere in text at or after `from`.
std::optional<DefinitionMatch> find_definition(const std::string& text, size_t from = 0);

// Line-anchored scan over a whole file. Each span starts at the beginning of
// the line holding the definition's name and ends after its body; scanning
// resumes on the line following the body.
std::vector<Span> find_function_definitions(const std::string& text);

// ---------------------------------------------------------------------------
// Call expressions
// ---------------------------------------------------------------------------

// Every `name (` in text, descending into each balanced argument list, so
// "f(g(h(x)))" yields {"f", "g", "h"}. Names repeat once per occurrence.
std::vector<std::string> extract_calls(const std::string& text);

} // namespace calltree
