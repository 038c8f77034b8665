#include <calltree/analysis/patterns.hpp>
#include <cctype>
#include <cstring>

namespace calltree {

static constexpr size_t npos = std::string::npos;

static size_t skip_ws(const std::string& text, size_t i, size_t end) {
    while (i < end && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    return i;
}

static size_t skip_ws(const std::string& text, size_t i) {
    return skip_ws(text, i, text.size());
}

static size_t skip_ident(const std::string& text, size_t i) {
    while (i < text.size() && is_ident_char(text[i])) ++i;
    return i;
}

static bool has_double_colon(const std::string& text, size_t i) {
    return i + 1 < text.size() && text[i] == ':' && text[i + 1] == ':';
}

// A qualified name may begin here: an identifier start on a word boundary,
// or a leading "::" that does not continue an earlier scope chain.
static bool is_name_start(const std::string& text, size_t i, size_t lower = 0) {
    char prev = i > lower ? text[i - 1] : ' ';
    if (is_ident_start(text[i])) return !is_ident_char(prev);
    if (has_double_colon(text, i)) {
        return prev != ':' && !is_ident_char(prev) &&
               i + 2 < text.size() && is_ident_start(text[i + 2]);
    }
    return false;
}

// Keyword at i delimited by word boundaries.
static bool keyword_at(const std::string& text, size_t i, const char* kw) {
    size_t len = std::strlen(kw);
    if (text.compare(i, len, kw) != 0) return false;
    if (i > 0 && is_ident_char(text[i - 1])) return false;
    return i + len >= text.size() || !is_ident_char(text[i + len]);
}

// ---- Balanced delimiters ----

size_t match_balanced(const std::string& text, size_t open,
                      char left, char right, const char* stop_chars) {
    if (open >= text.size() || text[open] != left) return npos;

    int depth = 0;
    for (size_t i = open; i < text.size(); ++i) {
        char c = text[i];
        if (c == left) {
            ++depth;
        } else if (c == right) {
            if (--depth == 0) return i + 1;
        } else if (stop_chars && std::strchr(stop_chars, c)) {
            return npos;
        }
    }
    return npos;
}

size_t match_nested_parens(const std::string& text, size_t open) {
    return match_balanced(text, open, '(', ')');
}

size_t match_nested_braces(const std::string& text, size_t open) {
    return match_balanced(text, open, '{', '}');
}

size_t match_nested_angles(const std::string& text, size_t open) {
    return match_balanced(text, open, '<', '>', ";{}");
}

// ---- Names ----

std::optional<QualifiedName> match_qualified_name(const std::string& text, size_t pos) {
    QualifiedName qn;
    qn.begin = pos;

    size_t i = pos;
    std::string name;
    if (has_double_colon(text, i)) {
        name = "::";
        i += 2;
    }

    std::optional<QualifiedName> last_good;
    while (i < text.size()) {
        bool after_scope = name.size() >= 2 && name.compare(name.size() - 2, 2, "::") == 0;
        if (after_scope && text[i] == '~') {
            name.push_back('~');
            ++i;
        }
        if (i >= text.size() || !is_ident_start(text[i])) break;

        size_t id_end = skip_ident(text, i);
        name.append(text, i, id_end - i);
        qn.name = name;
        qn.end = id_end;
        last_good = qn;
        i = id_end;

        // Template arguments count only as part of a scope, "Foo<T>::bar".
        size_t j = i;
        if (j < text.size() && text[j] == '<') {
            size_t close = match_nested_angles(text, j);
            if (close == npos || !has_double_colon(text, close)) break;
            j = close;
        }
        if (!has_double_colon(text, j) || j + 2 >= text.size()) break;
        char next = text[j + 2];
        if (!is_ident_start(next) && next != '~') break;

        name += "::";
        i = j + 2;
    }

    return last_good;
}

std::string simple_name_of(const std::string& name) {
    size_t end = name.size();
    size_t begin = end;
    while (begin > 0 && is_ident_char(name[begin - 1])) --begin;
    if (begin == end) return name;
    return name.substr(begin, end - begin);
}

// ---- Function definitions ----

// const / volatile / noexcept(...) / override / final / & / && / throw(...)
// and a trailing return type "-> T".
static size_t skip_trailing_specifiers(const std::string& text, size_t i) {
    while (true) {
        size_t j = skip_ws(text, i);
        if (j >= text.size()) return i;

        if (keyword_at(text, j, "const")) { i = j + 5; continue; }
        if (keyword_at(text, j, "volatile")) { i = j + 8; continue; }
        if (keyword_at(text, j, "override")) { i = j + 8; continue; }
        if (keyword_at(text, j, "final")) { i = j + 5; continue; }
        if (keyword_at(text, j, "noexcept") || keyword_at(text, j, "throw")) {
            size_t k = skip_ws(text, j + (text[j] == 'n' ? 8 : 5));
            if (k < text.size() && text[k] == '(') {
                size_t close = match_nested_parens(text, k);
                if (close == npos) return i;
                k = close;
            }
            i = k;
            continue;
        }
        if (text[j] == '&') { i = j + 1; continue; }
        if (text.compare(j, 2, "->") == 0) {
            size_t k = skip_ws(text, j + 2);
            auto ret = match_qualified_name(text, k);
            if (!ret) return i;
            k = ret->end;
            if (k < text.size() && text[k] == '<') {
                size_t close = match_nested_angles(text, k);
                if (close == npos) return i;
                k = close;
            }
            while (true) {
                size_t m = skip_ws(text, k);
                if (m < text.size() && (text[m] == '*' || text[m] == '&')) {
                    k = m + 1;
                } else {
                    break;
                }
            }
            i = k;
            continue;
        }
        return i;
    }
}

// ": member(args), Base<T>{args}, ...". Returns i unchanged when no list
// starts here, npos when one starts but is malformed.
static size_t skip_initializer_list(const std::string& text, size_t i) {
    size_t j = skip_ws(text, i);
    if (j >= text.size() || text[j] != ':' || has_double_colon(text, j)) return i;
    ++j;

    while (true) {
        j = skip_ws(text, j);
        auto member = match_qualified_name(text, j);
        if (!member) return npos;
        j = member->end;
        if (j < text.size() && text[j] == '<') {
            j = match_nested_angles(text, j);
            if (j == npos) return npos;
        }
        j = skip_ws(text, j);
        if (j >= text.size()) return npos;
        if (text[j] == '(') {
            j = match_nested_parens(text, j);
        } else if (text[j] == '{') {
            j = match_nested_braces(text, j);
        } else {
            return npos;
        }
        if (j == npos) return npos;

        size_t k = skip_ws(text, j);
        if (text.compare(k, 3, "...") == 0) k = skip_ws(text, k + 3);
        if (k < text.size() && text[k] == ',') {
            j = k + 1;
            continue;
        }
        return j;
    }
}

std::optional<DefinitionMatch> match_definition_at(const std::string& text, size_t pos) {
    auto qn = match_qualified_name(text, pos);
    if (!qn) return std::nullopt;

    size_t i = skip_ws(text, qn->end);
    if (i >= text.size() || text[i] != '(') return std::nullopt;
    size_t params_begin = i;
    size_t params_end = match_nested_parens(text, i);
    if (params_end == npos) return std::nullopt;

    i = skip_trailing_specifiers(text, params_end);
    i = skip_initializer_list(text, i);
    if (i == npos) return std::nullopt;

    i = skip_ws(text, i);
    if (i >= text.size() || text[i] != '{') return std::nullopt;
    size_t body_end = match_nested_braces(text, i);
    if (body_end == npos) return std::nullopt;

    DefinitionMatch m;
    m.qualified_name = std::move(qn->name);
    m.name_begin = qn->begin;
    m.name_end = qn->end;
    m.params_begin = params_begin;
    m.body_begin = i;
    m.end = body_end;
    return m;
}

std::optional<DefinitionMatch> find_definition(const std::string& text, size_t from) {
    size_t i = from;
    while (i < text.size()) {
        if (!is_name_start(text, i)) {
            ++i;
            continue;
        }
        if (auto m = match_definition_at(text, i)) return m;
        i = text[i] == ':' ? i + 2 : skip_ident(text, i);
    }
    return std::nullopt;
}

std::vector<Span> find_function_definitions(const std::string& text) {
    std::vector<Span> spans;
    size_t line_start = 0;

    while (line_start < text.size()) {
        size_t line_end = text.find('\n', line_start);
        if (line_end == npos) line_end = text.size();

        std::optional<DefinitionMatch> found;
        size_t i = line_start;
        while (i < line_end) {
            if (!is_name_start(text, i)) {
                ++i;
                continue;
            }
            found = match_definition_at(text, i);
            if (found) break;
            i = text[i] == ':' ? i + 2 : skip_ident(text, i);
        }

        if (!found) {
            line_start = line_end + 1;
            continue;
        }

        spans.push_back(Span{line_start, found->end});
        size_t next = text.find('\n', found->end);
        if (next == npos) break;
        line_start = next + 1;
    }

    return spans;
}

// ---- Call expressions ----

static void collect_calls(const std::string& text, size_t begin, size_t end,
                          std::vector<std::string>& out) {
    size_t i = begin;
    while (i < end) {
        if (!is_name_start(text, i, begin)) {
            ++i;
            continue;
        }

        auto qn = match_qualified_name(text, i);
        if (!qn || qn->end > end) {
            i = text[i] == ':' ? i + 2 : skip_ident(text, i);
            continue;
        }

        size_t j = skip_ws(text, qn->end, end);
        if (j >= end || text[j] != '(') {
            i = qn->end;
            continue;
        }

        out.push_back(qn->name);
        size_t close = match_nested_parens(text, j);
        if (close != npos && close <= end) {
            collect_calls(text, j + 1, close - 1, out);
            i = close;
        } else {
            // Unbalanced: keep scanning flat from inside the argument list.
            i = j + 1;
        }
    }
}

std::vector<std::string> extract_calls(const std::string& text) {
    std::vector<std::string> out;
    collect_calls(text, 0, text.size(), out);
    return out;
}

} // namespace calltree
