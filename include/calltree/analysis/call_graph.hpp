#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

namespace calltree {

// One function definition and the non-noise names it calls.
struct CallerNode {
    std::string name;                              // qualified
    std::string simple_name;
    std::string file_info;                         // "path:line"
    std::vector<std::string> callee_names;         // sorted, unique
    std::vector<std::string> callee_simple_names;  // aliases not in callee_names

    bool operator==(const CallerNode& other) const {
        return name == other.name && simple_name == other.simple_name &&
               file_info == other.file_info && callee_names == other.callee_names &&
               callee_simple_names == other.callee_simple_names;
    }
};

// ---------------------------------------------------------------------------
// NameIndex: key -> node ids, where a key is either a qualified name or the
// simple-name alias of one. Ids keep insertion order and appear at most once
// per key. Iteration over keys is lexicographic.
// ---------------------------------------------------------------------------

class NameIndex {
public:
    using NodeId = size_t;

    // File `id` under `qualified` and, when it differs, under its simple
    // name. Returns false if `id` was already filed under `qualified`.
    bool add(const std::string& qualified, NodeId id);

    // Raw insertion used when reloading a persisted index.
    void add_key(const std::string& key, NodeId id);
    void add_alias(const std::string& simple, const std::string& qualified);

    bool contains(const std::string& key) const { return entries_.count(key) != 0; }
    const std::vector<NodeId>& find(const std::string& key) const;

    // Qualified keys that registered `simple` as their alias.
    const std::set<std::string>& qualified_names(const std::string& simple) const;

    const std::map<std::string, std::vector<NodeId>>& entries() const { return entries_; }
    const std::map<std::string, std::set<std::string>>& aliases() const { return aliases_; }
    size_t size() const { return entries_.size(); }

    bool operator==(const NameIndex& other) const {
        return entries_ == other.entries_ && aliases_ == other.aliases_;
    }

private:
    bool file_under(const std::string& key, NodeId id);

    std::map<std::string, std::vector<NodeId>> entries_;
    std::map<std::string, std::set<std::string>> aliases_;
};

// ---------------------------------------------------------------------------
// CallGraph: caller nodes plus the two indices
//   definitions_of: function name -> its definitions
//   callers_of:     callee name   -> definitions that call it
// Append-only; a name may be called without being defined.
// ---------------------------------------------------------------------------

class CallGraph {
public:
    using NodeId = NameIndex::NodeId;

    NodeId add_caller(CallerNode node);

    size_t node_count() const { return nodes_.size(); }
    const CallerNode& node(NodeId id) const { return nodes_[id]; }
    const std::vector<CallerNode>& nodes() const { return nodes_; }

    const NameIndex& definitions() const { return definitions_; }
    const NameIndex& callers() const { return callers_; }

    std::vector<const CallerNode*> definitions_of(const std::string& name) const;
    std::vector<const CallerNode*> callers_of(const std::string& name) const;

    // Reassemble a graph from persisted parts. Node ids in both indices must
    // refer into `nodes`; returns false otherwise.
    static bool from_parts(std::vector<CallerNode> nodes, NameIndex definitions,
                           NameIndex callers, CallGraph& out);

    bool operator==(const CallGraph& other) const {
        return nodes_ == other.nodes_ && definitions_ == other.definitions_ &&
               callers_ == other.callers_;
    }

private:
    std::vector<const CallerNode*> resolve(const NameIndex& index,
                                           const std::string& name) const;

    std::vector<CallerNode> nodes_;
    NameIndex definitions_;
    NameIndex callers_;
};

} // namespace calltree
