#include <calltree/analysis/call_graph.hpp>
#include <calltree/analysis/patterns.hpp>

#include <algorithm>

namespace calltree {

// ---- NameIndex ----

bool NameIndex::file_under(const std::string& key, NodeId id) {
    auto& ids = entries_[key];
    if (std::find(ids.begin(), ids.end(), id) != ids.end()) return false;
    ids.push_back(id);
    return true;
}

bool NameIndex::add(const std::string& qualified, NodeId id) {
    if (!file_under(qualified, id)) return false;

    std::string simple = simple_name_of(qualified);
    if (simple != qualified) {
        file_under(simple, id);
        aliases_[simple].insert(qualified);
    }
    return true;
}

void NameIndex::add_key(const std::string& key, NodeId id) {
    file_under(key, id);
}

void NameIndex::add_alias(const std::string& simple, const std::string& qualified) {
    if (simple != qualified) aliases_[simple].insert(qualified);
}

const std::vector<NameIndex::NodeId>& NameIndex::find(const std::string& key) const {
    static const std::vector<NodeId> empty;
    auto it = entries_.find(key);
    return it == entries_.end() ? empty : it->second;
}

const std::set<std::string>& NameIndex::qualified_names(const std::string& simple) const {
    static const std::set<std::string> empty;
    auto it = aliases_.find(simple);
    return it == aliases_.end() ? empty : it->second;
}

// ---- CallGraph ----

CallGraph::NodeId CallGraph::add_caller(CallerNode node) {
    NodeId id = nodes_.size();
    nodes_.push_back(std::move(node));
    const CallerNode& n = nodes_.back();

    definitions_.add(n.name, id);
    for (const auto& callee : n.callee_names) {
        callers_.add(callee, id);
    }
    return id;
}

std::vector<const CallerNode*> CallGraph::resolve(const NameIndex& index,
                                                  const std::string& name) const {
    std::vector<const CallerNode*> out;
    for (NodeId id : index.find(name)) out.push_back(&nodes_[id]);
    return out;
}

std::vector<const CallerNode*> CallGraph::definitions_of(const std::string& name) const {
    return resolve(definitions_, name);
}

std::vector<const CallerNode*> CallGraph::callers_of(const std::string& name) const {
    return resolve(callers_, name);
}

bool CallGraph::from_parts(std::vector<CallerNode> nodes, NameIndex definitions,
                           NameIndex callers, CallGraph& out) {
    for (const NameIndex* index : {&definitions, &callers}) {
        for (const auto& [key, ids] : index->entries()) {
            for (NodeId id : ids) {
                if (id >= nodes.size()) return false;
            }
        }
    }
    out.nodes_ = std::move(nodes);
    out.definitions_ = std::move(definitions);
    out.callers_ = std::move(callers);
    return true;
}

} // namespace calltree
