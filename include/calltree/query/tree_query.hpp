#pragma once

#include <calltree/result.hpp>
#include <calltree/analysis/call_graph.hpp>
#include <string>
#include <vector>

namespace calltree {

enum class LeafKind {
    None,        // expanded, or the synthetic root
    Outmost,     // nothing further is known about this name
    Deep,        // depth limit reached
    Recursive,   // already on the current path
};

const char* leaf_kind_name(LeafKind kind);

struct TreeNode {
    std::string name;
    std::string file_info;   // "path:line", empty when unknown
    std::vector<TreeNode> children;
    LeafKind leaf = LeafKind::None;
};

enum class Direction {
    Called,    // who calls this name
    Calling,   // what this name calls
};

struct QueryOptions {
    std::string filter;          // regex searched in terminal names; empty matches all
    int max_depth = 100000;      // the anchor sits at level 1
    Direction direction = Direction::Called;
};

// Build the pruned tree for `name`. An exact key of the traversal index is
// the root itself; anything else is a regex selecting every matching key
// under a synthetic root named `name`. InvalidArg on a bad regex.
Result<TreeNode> query_tree(const CallGraph& graph, const std::string& name,
                            const QueryOptions& opts);

} // namespace calltree
