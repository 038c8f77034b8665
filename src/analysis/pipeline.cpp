#include <calltree/analysis/pipeline.hpp>
#include <calltree/analysis/graph_cache.hpp>
#include <calltree/analysis/sanitizer.hpp>
#include <calltree/log.hpp>

namespace calltree {

Result<CallGraph> load_or_build_call_graph(Searcher& searcher, const PipelineOptions& opts) {
    auto recovered = recover_interrupted_run(opts.root);
    if (recovered.is_err()) return std::move(recovered).error();
    if (recovered.value() > 0) {
        calltree::log::info("restored %zu files from an interrupted run", recovered.value());
    }

    GraphCache cache(opts.cache_dir.empty() ? opts.root : opts.cache_dir,
                     CacheKey::make(opts.extract));
    auto cached = cache.load();
    if (cached.is_err()) return std::move(cached).error();
    if (cached.value()) return Result<CallGraph>::ok(std::move(*cached.value()));

    auto files = searcher.list_files(opts.scope);
    if (files.is_err()) return std::move(files).error();
    calltree::log::info("found %zu source files", files.value().size());

    CallGraph graph;
    {
        SanitizeSession session(std::move(files).value());
        CALLTREE_TRY(session.sanitize(opts.workers));

        auto extracted = extract_call_graph(searcher, opts.scope, opts.extract);
        if (extracted.is_err()) return std::move(extracted).error();
        graph = std::move(extracted).value();

        CALLTREE_TRY(session.restore());
    }

    CALLTREE_TRY(cache.store(graph));
    return Result<CallGraph>::ok(std::move(graph));
}

} // namespace calltree
