#include <calltree/analysis/extractor.hpp>
#include <calltree/analysis/patterns.hpp>
#include <calltree/log.hpp>

#include <algorithm>
#include <cctype>
#include <map>

namespace calltree {

std::set<std::string> ExtractOptions::default_ignored_names() {
    return {
        "for", "if", "while", "switch", "catch",
        "log", "warn", "trace", "debug", "defined", "error", "fatal",
        "static_cast", "reinterpret_cast", "const_cast", "dynamic_cast",
        "return", "assert", "sizeof", "alignas",
        "constexpr",
        "set", "get",
    };
}

// ---- Merge ----

// "path:line:content" with a non-empty path and a decimal line number.
static bool split_grep_line(const std::string& raw, std::string& path, int& line,
                            std::string& content) {
    size_t c1 = raw.find(':');
    if (c1 == std::string::npos || c1 == 0) return false;
    size_t i = c1 + 1;
    size_t digits_begin = i;
    while (i < raw.size() && std::isdigit(static_cast<unsigned char>(raw[i]))) ++i;
    if (i == digits_begin || i >= raw.size() || raw[i] != ':') return false;
    if (i - digits_begin > 9) return false;

    path = raw.substr(0, c1);
    line = std::stoi(raw.substr(digits_begin, i - digits_begin));
    content = raw.substr(i + 1);
    return true;
}

Result<std::vector<MatchedSpan>> merge_grep_lines(const std::vector<std::string>& lines) {
    std::vector<MatchedSpan> spans;
    int last_line = 0;

    for (size_t i = 0; i < lines.size(); ++i) {
        std::string path, content;
        int line = 0;
        if (!split_grep_line(lines[i], path, line, content)) {
            std::string prev = i > 0 ? lines[i - 1] : std::string("<none>");
            return CalltreeError{CalltreeError::Parse,
                "cannot split search result into path, line and content: '" + lines[i] + "'",
                "previous result: '" + prev + "'"};
        }

        if (!spans.empty() && spans.back().path == path && last_line + 1 == line) {
            spans.back().text += '\n';
            spans.back().text += content;
        } else {
            spans.push_back(MatchedSpan{path, line, std::move(content)});
        }
        last_line = line;
    }

    return Result<std::vector<MatchedSpan>>::ok(std::move(spans));
}

// ---- Definitions and callees ----

std::vector<FunctionDefinition> capture_definitions(const MatchedSpan& span) {
    std::vector<FunctionDefinition> defs;
    size_t from = 0;
    int line = span.line;
    size_t counted = 0;

    while (auto m = find_definition(span.text, from)) {
        // Report the line the name sits on, not the first line of the run.
        line += static_cast<int>(std::count(span.text.begin() + counted,
                                            span.text.begin() + m->name_begin, '\n'));
        counted = m->name_begin;

        FunctionDefinition def;
        def.qualified_name = m->qualified_name;
        def.simple_name = simple_name_of(m->qualified_name);
        def.path = span.path;
        def.line = line;
        def.body_text = span.text.substr(m->name_end, m->end - m->name_end);
        defs.push_back(std::move(def));
        from = m->end;
    }
    return defs;
}

std::vector<std::string> callees_of(const FunctionDefinition& def) {
    return extract_calls(def.body_text);
}

std::set<std::string> compute_ignore_set(const std::vector<std::vector<std::string>>& callee_lists,
                                         const ExtractOptions& opts,
                                         size_t* num_trivial) {
    std::map<std::string, int> counts;
    for (const auto& callees : callee_lists) {
        for (const auto& name : callees) ++counts[name];
    }

    std::set<std::string> ignored = opts.ignored;
    size_t trivial = 0;
    for (const auto& [name, count] : counts) {
        if (count > opts.trivial_threshold ||
            static_cast<int>(name.size()) < opts.length_threshold) {
            ignored.insert(name);
            ++trivial;
        }
    }
    if (num_trivial) *num_trivial = trivial;
    return ignored;
}

CallGraph build_call_graph(const std::vector<MatchedSpan>& spans,
                           const ExtractOptions& opts,
                           ExtractStats* stats) {
    // One callee list per definition; spans without one still count.
    std::vector<FunctionDefinition> defs;
    std::vector<std::vector<std::string>> callees;

    for (const auto& span : spans) {
        auto found = capture_definitions(span);
        if (found.empty()) {
            callees.push_back(extract_calls(span.text));
            continue;
        }
        for (auto& def : found) {
            defs.push_back(std::move(def));
        }
    }
    size_t named = defs.size();
    size_t first_def_list = callees.size();
    for (const auto& def : defs) callees.push_back(callees_of(def));

    size_t trivial = 0;
    std::set<std::string> ignored = compute_ignore_set(callees, opts, &trivial);

    CallGraph graph;
    for (size_t i = 0; i < defs.size(); ++i) {
        const FunctionDefinition& def = defs[i];
        if (ignored.count(def.qualified_name)) continue;

        std::set<std::string> kept;
        for (const auto& name : callees[first_def_list + i]) {
            if (!ignored.count(name)) kept.insert(name);
        }
        std::set<std::string> aliases;
        for (const auto& name : kept) {
            std::string simple = simple_name_of(name);
            if (!kept.count(simple)) aliases.insert(simple);
        }

        CallerNode node;
        node.name = def.qualified_name;
        node.simple_name = def.simple_name;
        node.file_info = def.file_info();
        node.callee_names.assign(kept.begin(), kept.end());
        node.callee_simple_names.assign(aliases.begin(), aliases.end());
        graph.add_caller(std::move(node));
    }

    if (stats) {
        stats->spans_merged = spans.size();
        stats->definitions_named = named;
        stats->definitions_kept = graph.node_count();
        stats->trivial_names = trivial;
    }
    return graph;
}

Result<CallGraph> extract_call_graph(Searcher& searcher,
                                     const SearchScope& scope,
                                     const ExtractOptions& opts,
                                     ExtractStats* stats) {
    auto lines = searcher.grep(find_function_definitions, scope);
    if (lines.is_err()) return std::move(lines).error();
    calltree::log::info("extract lines: %zu", lines.value().size());

    auto spans = merge_grep_lines(lines.value());
    if (spans.is_err()) return std::move(spans).error();
    calltree::log::info("spans after merge: %zu", spans.value().size());

    ExtractStats local;
    CallGraph graph = build_call_graph(spans.value(), opts, &local);
    local.lines_matched = lines.value().size();
    calltree::log::info("kept %zu of %zu named definitions, %zu trivial names ignored",
                        local.definitions_kept, local.definitions_named, local.trivial_names);

    if (stats) *stats = local;
    return Result<CallGraph>::ok(std::move(graph));
}

} // namespace calltree
