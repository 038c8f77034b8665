#pragma once

#include <calltree/result.hpp>
#include <calltree/search.hpp>
#include <calltree/analysis/call_graph.hpp>
#include <calltree/analysis/extractor.hpp>
#include <string>

namespace calltree {

struct PipelineOptions {
    std::string root = ".";
    SearchScope scope;
    ExtractOptions extract;
    int workers = 10;
    std::string cache_dir;   // empty: root
};

// Restore leftovers of an interrupted run, then return the cached graph if
// its key still matches. Otherwise sanitize every file in scope, extract,
// restore the sources and persist the new graph.
Result<CallGraph> load_or_build_call_graph(Searcher& searcher, const PipelineOptions& opts);

} // namespace calltree
