#include <calltree/query/tree_query.hpp>
#include <calltree/analysis/patterns.hpp>
#include <calltree/log.hpp>

#include <optional>
#include <regex>
#include <set>

namespace calltree {

const char* leaf_kind_name(LeafKind kind) {
    switch (kind) {
        case LeafKind::None:      return "none";
        case LeafKind::Outmost:   return "outmost";
        case LeafKind::Deep:      return "deep";
        case LeafKind::Recursive: return "recursive";
    }
    return "unknown";
}

namespace {

class TreeBuilder {
public:
    TreeBuilder(const CallGraph& graph, const std::regex& filter,
                int max_depth, Direction direction)
        : graph_(graph), filter_(filter), max_depth_(max_depth), direction_(direction) {}

    const NameIndex& index() const {
        return direction_ == Direction::Called ? graph_.callers() : graph_.definitions();
    }

    // Location shown for a name that is not itself a caller node.
    std::string location_of(const std::string& name) const {
        auto defs = graph_.definitions_of(name);
        return defs.empty() ? std::string() : defs.front()->file_info;
    }

    // Subtree for `name`, or nullopt when pruned. `out` receives the node
    // even when it is pruned so the anchor can still be emitted.
    std::optional<TreeNode> visit(const std::string& name, const std::string& file_info,
                                  int level, TreeNode* out = nullptr) {
        TreeNode node;
        node.name = name;
        node.file_info = file_info;

        std::string simple = simple_name_of(name);
        if (!index().contains(simple)) {
            node.leaf = LeafKind::Outmost;
        } else if (level >= max_depth_) {
            node.leaf = LeafKind::Deep;
        } else if (path_.count(simple)) {
            node.leaf = LeafKind::Recursive;
        }

        if (node.leaf != LeafKind::None) {
            bool keep = std::regex_search(name, filter_);
            if (out) *out = node;
            if (!keep) return std::nullopt;
            return node;
        }

        path_.insert(simple);
        for (const auto& [child_name, child_info] : next_of(simple)) {
            if (auto child = visit(child_name, child_info, level + 1)) {
                node.children.push_back(std::move(*child));
            }
        }
        path_.erase(simple);

        if (out) *out = node;
        if (node.children.empty()) return std::nullopt;
        return node;
    }

private:
    std::vector<std::pair<std::string, std::string>> next_of(const std::string& simple) const {
        std::vector<std::pair<std::string, std::string>> next;
        if (direction_ == Direction::Called) {
            for (const CallerNode* caller : graph_.callers_of(simple)) {
                next.emplace_back(caller->name, caller->file_info);
            }
            return next;
        }

        // Overloads share their callees; list each callee once.
        std::set<std::string> callees;
        for (const CallerNode* def : graph_.definitions_of(simple)) {
            callees.insert(def->callee_names.begin(), def->callee_names.end());
        }
        for (const auto& callee : callees) {
            next.emplace_back(callee, location_of(callee));
        }
        return next;
    }

    const CallGraph& graph_;
    const std::regex& filter_;
    int max_depth_;
    Direction direction_;
    std::set<std::string> path_;
};

} // namespace

Result<TreeNode> query_tree(const CallGraph& graph, const std::string& name,
                            const QueryOptions& opts) {
    std::regex filter;
    try {
        filter = std::regex(opts.filter);
    } catch (const std::regex_error& e) {
        return CalltreeError{CalltreeError::InvalidArg,
            "invalid filter '" + opts.filter + "': " + e.what()};
    }

    TreeBuilder builder(graph, filter, opts.max_depth, opts.direction);

    if (builder.index().contains(name)) {
        TreeNode root;
        builder.visit(name, builder.location_of(name), 1, &root);
        return Result<TreeNode>::ok(std::move(root));
    }

    std::regex pattern;
    try {
        pattern = std::regex(name);
    } catch (const std::regex_error& e) {
        return CalltreeError{CalltreeError::InvalidArg,
            "invalid name pattern '" + name + "': " + e.what(),
            "the name is not a known function, so it is read as a regex"};
    }

    TreeNode root;
    root.name = name;
    size_t matched = 0;
    for (const auto& [key, ids] : builder.index().entries()) {
        if (!std::regex_search(key, pattern)) continue;
        ++matched;
        if (auto child = builder.visit(key, builder.location_of(key), 1)) {
            root.children.push_back(std::move(*child));
        }
    }
    calltree::log::debug("pattern '%s' matched %zu names", name.c_str(), matched);
    return Result<TreeNode>::ok(std::move(root));
}

} // namespace calltree
