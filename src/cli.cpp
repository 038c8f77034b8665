#include <calltree/cli.hpp>
#include <calltree/config.hpp>
#include <calltree/log.hpp>
#include <calltree/search.hpp>
#include <calltree/analysis/pipeline.hpp>
#include <calltree/query/tree_render.hpp>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <ostream>

namespace calltree {

const char* const kUsage =
    "usage: calltree <name_or_pattern> [filter] [direction] [verbose] [depth]\n"
    "  filter     regex a leaf must match (default: everything)\n"
    "  direction  1 = who calls it (default), 0 = what it calls\n"
    "  verbose    0 = names only (default), anything else adds locations\n"
    "  depth      maximum tree depth (default 100000)\n";

Result<CliArgs> parse_cli_args(const std::vector<std::string>& args) {
    if (args.empty() || args[0].empty()) {
        return CalltreeError{CalltreeError::InvalidArg,
            "no function name or pattern given", kUsage};
    }

    CliArgs out;
    out.name = args[0];
    if (args.size() > 1) out.query.filter = args[1];
    if (args.size() > 2) {
        out.query.direction = args[2] == "0" ? Direction::Calling : Direction::Called;
    }
    if (args.size() > 3) out.verbose = args[3] != "0";
    if (args.size() > 4) {
        const char* text = args[4].c_str();
        char* end = nullptr;
        errno = 0;
        long depth = std::strtol(text, &end, 10);
        if (end == text || *end != '\0' || errno == ERANGE || depth < 1 || depth > INT_MAX) {
            return CalltreeError{CalltreeError::InvalidArg,
                "invalid depth: " + args[4], kUsage};
        }
        out.query.max_depth = static_cast<int>(depth);
    }
    return Result<CliArgs>::ok(std::move(out));
}

Status run_cli(const CliArgs& args, const std::string& root, std::ostream& out) {
    auto config = load_layered_config(root);
    CALLTREE_TRY(config);

    const Config& cfg = config.value();
    if (cfg.log_level) {
        log::Level level;
        if (log::parse_level(*cfg.log_level, level)) log::set_level(level);
    }

    FileSearcher searcher(root);
    CALLTREE_TRY(searcher.check_available());

    PipelineOptions opts;
    opts.root = root;
    opts.scope = cfg.search_scope();
    opts.extract = cfg.extract_options();
    if (cfg.workers) opts.workers = *cfg.workers;
    if (cfg.cache_dir) opts.cache_dir = *cfg.cache_dir;

    auto graph = load_or_build_call_graph(searcher, opts);
    CALLTREE_TRY(graph);

    auto tree = query_tree(graph.value(), args.name, args.query);
    CALLTREE_TRY(tree);

    for (const auto& line : render_tree(tree.value(), args.verbose)) {
        out << line << "\n";
    }
    return ok_status();
}

int cli_main(const std::vector<std::string>& args, const std::string& root,
             std::ostream& out, std::ostream& err) {
    auto parsed = parse_cli_args(args);
    if (parsed.is_err()) {
        err << parsed.error().format() << "\n";
        return 2;
    }

    auto st = run_cli(parsed.value(), root, out);
    if (st.is_err()) {
        err << st.error().format() << "\n";
        return 1;
    }
    return 0;
}

} // namespace calltree
