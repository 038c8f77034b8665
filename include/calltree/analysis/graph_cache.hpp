#pragma once

#include <calltree/result.hpp>
#include <calltree/analysis/call_graph.hpp>
#include <calltree/analysis/extractor.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace calltree {

// Everything a cached graph depends on. Two runs with equal keys would
// extract the same graph from an unchanged tree.
struct CacheKey {
    std::vector<std::string> ignored;  // sorted
    int trivial_threshold = 0;
    int length_threshold = 0;

    static CacheKey make(const ExtractOptions& opts);

    // Blacklist joined by ','; stored next to the graphs.
    std::string signature() const;
    // "<trivial>.<length>", appended to every cache file name.
    std::string suffix() const;
};

// Encode one half of a graph: the node table plus one of its two indices.
enum class GraphFileKind : uint8_t {
    Calling = 1,   // definitions index
    Called = 2,    // callers index
};

std::vector<uint8_t> serialize_graph_file(const CallGraph& graph, GraphFileKind kind);

// Decoded graph file. Corrupt error on bad magic, wrong kind, truncation or
// out-of-range node ids.
struct GraphFile {
    std::vector<CallerNode> nodes;
    NameIndex index;
};
Result<GraphFile> deserialize_graph_file(const uint8_t* data, size_t len,
                                         GraphFileKind expected);

// Signature file plus the two graph files in one directory.
class GraphCache {
public:
    GraphCache(std::string dir, CacheKey key);

    std::string signature_path() const;
    std::string calling_path() const;
    std::string called_path() const;

    // nullopt on a miss: no signature, a different one, or a graph file
    // missing. A hit whose graph files do not parse is a Corrupt error.
    Result<std::optional<CallGraph>> load();

    Status store(const CallGraph& graph);

    const CacheKey& key() const { return key_; }
    const std::string& dir() const { return dir_; }

private:
    Status touch(const std::string& path);

    std::string dir_;
    CacheKey key_;
};

} // namespace calltree
