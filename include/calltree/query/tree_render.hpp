#pragma once

#include <calltree/query/tree_query.hpp>
#include <string>
#include <vector>

namespace calltree {

// name, plus "\t[path:line]" when verbose and the location is known.
std::string format_label(const TreeNode& node, bool verbose);

// One line per node, pre-order, children drawn with box-drawing prefixes.
std::vector<std::string> render_tree(const TreeNode& root, bool verbose);

} // namespace calltree
