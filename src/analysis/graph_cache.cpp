#include <calltree/analysis/graph_cache.hpp>
#include <calltree/log.hpp>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace calltree {

// ---------------------------------------------------------------------------
// Binary serialization helpers (varint + length-prefixed strings)
// ---------------------------------------------------------------------------

static const char MAGIC[] = "CTG\x01";
static constexpr size_t MAGIC_LEN = 4;

namespace ser {

static void write_varint(std::vector<uint8_t>& buf, uint64_t val) {
    while (val >= 0x80) {
        buf.push_back(static_cast<uint8_t>(val & 0x7F) | 0x80);
        val >>= 7;
    }
    buf.push_back(static_cast<uint8_t>(val));
}

static bool read_varint(const uint8_t*& p, const uint8_t* end, uint64_t& val) {
    val = 0;
    unsigned shift = 0;
    while (p < end) {
        uint8_t b = *p++;
        val |= static_cast<uint64_t>(b & 0x7F) << shift;
        if (!(b & 0x80)) return true;
        shift += 7;
        if (shift >= 64) return false;
    }
    return false;
}

static void write_string(std::vector<uint8_t>& buf, const std::string& s) {
    write_varint(buf, s.size());
    buf.insert(buf.end(), s.begin(), s.end());
}

static bool read_string(const uint8_t*& p, const uint8_t* end, std::string& s) {
    uint64_t len;
    if (!read_varint(p, end, len)) return false;
    if (len > static_cast<uint64_t>(end - p)) return false;
    s.assign(reinterpret_cast<const char*>(p), static_cast<size_t>(len));
    p += len;
    return true;
}

static void write_strings(std::vector<uint8_t>& buf, const std::vector<std::string>& v) {
    write_varint(buf, v.size());
    for (const auto& s : v) write_string(buf, s);
}

// Counts are checked against the bytes left so a corrupt length cannot
// trigger a huge allocation.
static bool read_count(const uint8_t*& p, const uint8_t* end, size_t& n) {
    uint64_t raw;
    if (!read_varint(p, end, raw)) return false;
    if (raw > static_cast<uint64_t>(end - p)) return false;
    n = static_cast<size_t>(raw);
    return true;
}

static bool read_strings(const uint8_t*& p, const uint8_t* end, std::vector<std::string>& v) {
    size_t n;
    if (!read_count(p, end, n)) return false;
    v.resize(n);
    for (auto& s : v) {
        if (!read_string(p, end, s)) return false;
    }
    return true;
}

} // namespace ser

// ---------------------------------------------------------------------------
// CacheKey
// ---------------------------------------------------------------------------

CacheKey CacheKey::make(const ExtractOptions& opts) {
    CacheKey key;
    key.ignored.assign(opts.ignored.begin(), opts.ignored.end());
    key.trivial_threshold = opts.trivial_threshold;
    key.length_threshold = opts.length_threshold;
    return key;
}

std::string CacheKey::signature() const {
    std::string sig;
    for (size_t i = 0; i < ignored.size(); ++i) {
        if (i > 0) sig += ',';
        sig += ignored[i];
    }
    return sig;
}

std::string CacheKey::suffix() const {
    return std::to_string(trivial_threshold) + "." + std::to_string(length_threshold);
}

// ---------------------------------------------------------------------------
// Graph files
// ---------------------------------------------------------------------------

std::vector<uint8_t> serialize_graph_file(const CallGraph& graph, GraphFileKind kind) {
    std::vector<uint8_t> buf;
    buf.reserve(1024);
    buf.insert(buf.end(), MAGIC, MAGIC + MAGIC_LEN);
    buf.push_back(static_cast<uint8_t>(kind));

    ser::write_varint(buf, graph.node_count());
    for (const auto& n : graph.nodes()) {
        ser::write_string(buf, n.name);
        ser::write_string(buf, n.simple_name);
        ser::write_string(buf, n.file_info);
        ser::write_strings(buf, n.callee_names);
        ser::write_strings(buf, n.callee_simple_names);
    }

    const NameIndex& index = kind == GraphFileKind::Calling ? graph.definitions()
                                                            : graph.callers();
    ser::write_varint(buf, index.entries().size());
    for (const auto& [key, ids] : index.entries()) {
        ser::write_string(buf, key);
        ser::write_varint(buf, ids.size());
        for (auto id : ids) ser::write_varint(buf, id);
    }

    ser::write_varint(buf, index.aliases().size());
    for (const auto& [simple, qualified] : index.aliases()) {
        ser::write_string(buf, simple);
        ser::write_strings(buf, std::vector<std::string>(qualified.begin(), qualified.end()));
    }

    return buf;
}

static CalltreeError corrupt(const std::string& what) {
    return CalltreeError{CalltreeError::Corrupt, "corrupted call graph cache: " + what,
        "delete the .calltree_* files to rebuild"};
}

Result<GraphFile> deserialize_graph_file(const uint8_t* data, size_t len,
                                         GraphFileKind expected) {
    if (len < MAGIC_LEN + 1 || std::memcmp(data, MAGIC, MAGIC_LEN) != 0) {
        return corrupt("invalid magic bytes");
    }
    if (data[MAGIC_LEN] != static_cast<uint8_t>(expected)) {
        return corrupt("unexpected graph kind");
    }

    const uint8_t* p = data + MAGIC_LEN + 1;
    const uint8_t* end = data + len;
    GraphFile out;

    size_t num_nodes;
    if (!ser::read_count(p, end, num_nodes)) return corrupt("truncated node count");
    out.nodes.resize(num_nodes);
    for (auto& n : out.nodes) {
        if (!ser::read_string(p, end, n.name) ||
            !ser::read_string(p, end, n.simple_name) ||
            !ser::read_string(p, end, n.file_info) ||
            !ser::read_strings(p, end, n.callee_names) ||
            !ser::read_strings(p, end, n.callee_simple_names))
            return corrupt("truncated node");
    }

    size_t num_keys;
    if (!ser::read_count(p, end, num_keys)) return corrupt("truncated key count");
    for (size_t k = 0; k < num_keys; ++k) {
        std::string key;
        size_t num_ids;
        if (!ser::read_string(p, end, key) || !ser::read_count(p, end, num_ids))
            return corrupt("truncated index entry");
        for (size_t i = 0; i < num_ids; ++i) {
            uint64_t id;
            if (!ser::read_varint(p, end, id)) return corrupt("truncated node id");
            if (id >= num_nodes) return corrupt("node id out of range");
            out.index.add_key(key, static_cast<size_t>(id));
        }
    }

    size_t num_aliases;
    if (!ser::read_count(p, end, num_aliases)) return corrupt("truncated alias count");
    for (size_t a = 0; a < num_aliases; ++a) {
        std::string simple;
        std::vector<std::string> qualified;
        if (!ser::read_string(p, end, simple) || !ser::read_strings(p, end, qualified))
            return corrupt("truncated alias");
        for (const auto& q : qualified) out.index.add_alias(simple, q);
    }

    if (p != end) return corrupt("trailing bytes");
    return Result<GraphFile>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// GraphCache
// ---------------------------------------------------------------------------

static Result<std::vector<uint8_t>> read_bytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return CalltreeError{CalltreeError::IO, "cannot open " + path};
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());
    if (in.bad()) {
        return CalltreeError{CalltreeError::IO, "cannot read " + path};
    }
    return Result<std::vector<uint8_t>>::ok(std::move(data));
}

static Status write_bytes(const std::string& path, const void* data, size_t len) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return CalltreeError{CalltreeError::IO, "cannot write " + path};
    }
    out.write(static_cast<const char*>(data), static_cast<std::streamsize>(len));
    out.close();
    if (!out) {
        return CalltreeError{CalltreeError::IO, "cannot write " + path};
    }
    return ok_status();
}

GraphCache::GraphCache(std::string dir, CacheKey key)
    : dir_(std::move(dir)), key_(std::move(key)) {}

std::string GraphCache::signature_path() const {
    return (fs::path(dir_) / (".calltree_ignored." + key_.suffix())).string();
}

std::string GraphCache::calling_path() const {
    return (fs::path(dir_) / (".calltree_calling." + key_.suffix())).string();
}

std::string GraphCache::called_path() const {
    return (fs::path(dir_) / (".calltree_called." + key_.suffix())).string();
}

Status GraphCache::touch(const std::string& path) {
    std::error_code ec;
    fs::last_write_time(path, fs::file_time_type::clock::now(), ec);
    if (ec) {
        return CalltreeError{CalltreeError::IO,
            "cannot update timestamp of " + path + ": " + ec.message()};
    }
    return ok_status();
}

Result<std::optional<CallGraph>> GraphCache::load() {
    using Loaded = Result<std::optional<CallGraph>>;
    std::error_code ec;

    if (!fs::exists(signature_path(), ec)) {
        calltree::log::info("no cached call graph for %s", key_.suffix().c_str());
        return Loaded::ok(std::nullopt);
    }
    auto sig = read_bytes(signature_path());
    if (sig.is_err()) return std::move(sig).error();
    std::string stored(sig.value().begin(), sig.value().end());
    if (stored != key_.signature()) {
        calltree::log::info("ignore list changed, rebuilding call graph");
        return Loaded::ok(std::nullopt);
    }
    if (!fs::exists(calling_path(), ec) || !fs::exists(called_path(), ec)) {
        calltree::log::info("cached call graph incomplete, rebuilding");
        return Loaded::ok(std::nullopt);
    }

    auto calling_bytes = read_bytes(calling_path());
    if (calling_bytes.is_err()) return std::move(calling_bytes).error();
    auto called_bytes = read_bytes(called_path());
    if (called_bytes.is_err()) return std::move(called_bytes).error();

    auto calling = deserialize_graph_file(calling_bytes.value().data(),
                                          calling_bytes.value().size(),
                                          GraphFileKind::Calling);
    if (calling.is_err()) return std::move(calling).error().at(calling_path());
    auto called = deserialize_graph_file(called_bytes.value().data(),
                                         called_bytes.value().size(),
                                         GraphFileKind::Called);
    if (called.is_err()) return std::move(called).error().at(called_path());
    if (calling.value().nodes != called.value().nodes) {
        return CalltreeError{CalltreeError::Corrupt,
            "cached call graph files disagree on their node table",
            "delete the .calltree_* files to rebuild"}.at(dir_);
    }

    CallGraph graph;
    if (!CallGraph::from_parts(std::move(calling.value().nodes),
                               std::move(calling.value().index),
                               std::move(called.value().index), graph)) {
        return corrupt("node id out of range");
    }

    CALLTREE_TRY(touch(signature_path()));
    CALLTREE_TRY(touch(calling_path()));
    CALLTREE_TRY(touch(called_path()));

    calltree::log::info("loaded cached call graph: %zu definitions", graph.node_count());
    return Loaded::ok(std::move(graph));
}

Status GraphCache::store(const CallGraph& graph) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        return CalltreeError{CalltreeError::IO,
            "cannot create cache directory " + dir_ + ": " + ec.message()};
    }

    // The signature is removed first and written last, so a store cut short
    // anywhere in between leaves a cache that misses.
    fs::remove(signature_path(), ec);
    if (ec) {
        return CalltreeError{CalltreeError::IO,
            "cannot remove " + signature_path() + ": " + ec.message()};
    }

    auto calling = serialize_graph_file(graph, GraphFileKind::Calling);
    auto called = serialize_graph_file(graph, GraphFileKind::Called);
    CALLTREE_TRY(write_bytes(calling_path(), calling.data(), calling.size()));
    CALLTREE_TRY(write_bytes(called_path(), called.data(), called.size()));

    std::string sig = key_.signature();
    CALLTREE_TRY(write_bytes(signature_path(), sig.data(), sig.size()));

    calltree::log::info("stored call graph in %s", dir_.c_str());
    return ok_status();
}

} // namespace calltree
