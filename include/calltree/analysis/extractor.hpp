#pragma once

#include <calltree/result.hpp>
#include <calltree/search.hpp>
#include <calltree/analysis/call_graph.hpp>
#include <set>
#include <string>
#include <vector>

namespace calltree {

struct ExtractOptions {
    std::set<std::string> ignored = default_ignored_names();
    int trivial_threshold = 50;   // called more often than this: noise
    int length_threshold = 3;     // shorter than this: noise

    // Keywords, casts, assert- and log-like names.
    static std::set<std::string> default_ignored_names();
};

// Counters reported by an extraction, for logging.
struct ExtractStats {
    size_t lines_matched = 0;
    size_t spans_merged = 0;
    size_t definitions_named = 0;
    size_t definitions_kept = 0;
    size_t trivial_names = 0;
};

// A run of file-adjacent grep lines, joined with '\n'.
struct MatchedSpan {
    std::string path;
    int line = 0;        // first line of the run
    std::string text;
};

struct FunctionDefinition {
    std::string qualified_name;
    std::string simple_name;
    std::string path;
    int line = 0;
    std::string body_text;  // parameters and body, up to the closing '}'

    std::string file_info() const { return path + ":" + std::to_string(line); }
};

// Merge "path:line:content" lines into runs of consecutive lines of the
// same file. Parse error on a line that does not split that way.
Result<std::vector<MatchedSpan>> merge_grep_lines(const std::vector<std::string>& lines);

// Every definition a span holds, in order. Several definitions end up in
// one span when they sit on file-adjacent lines.
std::vector<FunctionDefinition> capture_definitions(const MatchedSpan& span);

// Names called from the definition's parameter list and body.
std::vector<std::string> callees_of(const FunctionDefinition& def);

// Blacklist plus every name called more than the trivial threshold or
// shorter than the length threshold, counted over all lists.
std::set<std::string> compute_ignore_set(const std::vector<std::vector<std::string>>& callee_lists,
                                         const ExtractOptions& opts,
                                         size_t* num_trivial = nullptr);

CallGraph build_call_graph(const std::vector<MatchedSpan>& spans,
                           const ExtractOptions& opts,
                           ExtractStats* stats = nullptr);

// Grep definitions through `searcher`, then merge, capture and filter.
Result<CallGraph> extract_call_graph(Searcher& searcher,
                                     const SearchScope& scope,
                                     const ExtractOptions& opts,
                                     ExtractStats* stats = nullptr);

} // namespace calltree
