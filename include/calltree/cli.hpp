#pragma once

#include <calltree/result.hpp>
#include <calltree/query/tree_query.hpp>
#include <iosfwd>
#include <string>
#include <vector>

namespace calltree {

extern const char* const kUsage;

struct CliArgs {
    std::string name;
    QueryOptions query;
    bool verbose = false;
};

// Positional arguments, without the program name:
//     <name_or_pattern> [filter] [direction] [verbose] [depth]
// InvalidArg with the usage text as hint on a missing name or a bad depth.
Result<CliArgs> parse_cli_args(const std::vector<std::string>& args);

// Load the config under `root`, build or load the graph, then print the tree.
Status run_cli(const CliArgs& args, const std::string& root, std::ostream& out);

// Parse, run and report. Returns the process exit code: 2 on a usage
// error, 1 on any other error, 0 otherwise.
int cli_main(const std::vector<std::string>& args, const std::string& root,
             std::ostream& out, std::ostream& err);

} // namespace calltree
