#include <catch2/catch.hpp>
#include <calltree/analysis/graph_cache.hpp>
#include <calltree/analysis/pipeline.hpp>
#include <calltree/query/tree_query.hpp>
#include <calltree/query/tree_render.hpp>
#include "temp_dir.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace calltree;
namespace fs = std::filesystem;

static CallGraph sample_graph() {
    CallGraph graph;
    CallerNode main_node;
    main_node.name = "main";
    main_node.simple_name = "main";
    main_node.file_info = "src/main.cc:3";
    main_node.callee_names = {"app::start", "parse"};
    main_node.callee_simple_names = {"start"};
    graph.add_caller(main_node);

    CallerNode start;
    start.name = "app::start";
    start.simple_name = "start";
    start.file_info = "src/app.cc:10";
    start.callee_names = {"parse"};
    graph.add_caller(start);
    return graph;
}

// Counts every call that reaches the wrapped searcher.
class CountingSearcher : public Searcher {
public:
    explicit CountingSearcher(Searcher& inner) : inner_(inner) {}

    Result<std::vector<std::string>> list_files(const SearchScope& scope) override {
        ++calls;
        return inner_.list_files(scope);
    }
    Result<std::vector<std::string>> grep(const SpanFinder& finder,
                                          const SearchScope& scope) override {
        ++calls;
        return inner_.grep(finder, scope);
    }

    int calls = 0;

private:
    Searcher& inner_;
};

// ===== Key =====

TEST_CASE("cache key signature is the sorted blacklist", "[graph_cache]") {
    ExtractOptions opts;
    opts.ignored = {"while", "for", "if"};
    opts.trivial_threshold = 7;
    opts.length_threshold = 2;
    CacheKey key = CacheKey::make(opts);
    REQUIRE(key.signature() == "for,if,while");
    REQUIRE(key.suffix() == "7.2");
}

TEST_CASE("cache file names carry the thresholds", "[graph_cache]") {
    ExtractOptions opts;
    GraphCache cache("/tmp/x", CacheKey::make(opts));
    REQUIRE(cache.signature_path() == "/tmp/x/.calltree_ignored.50.3");
    REQUIRE(cache.calling_path() == "/tmp/x/.calltree_calling.50.3");
    REQUIRE(cache.called_path() == "/tmp/x/.calltree_called.50.3");
}

// ===== Serialization =====

TEST_CASE("graph files decode back to the stored index", "[graph_cache]") {
    CallGraph graph = sample_graph();
    auto bytes = serialize_graph_file(graph, GraphFileKind::Called);
    auto file = deserialize_graph_file(bytes.data(), bytes.size(), GraphFileKind::Called);
    REQUIRE(file.is_ok());
    REQUIRE(file.value().nodes == graph.nodes());
    REQUIRE(file.value().index == graph.callers());
}

TEST_CASE("wrong magic, kind or truncation is corruption", "[graph_cache]") {
    CallGraph graph = sample_graph();
    auto bytes = serialize_graph_file(graph, GraphFileKind::Calling);

    auto wrong_kind = deserialize_graph_file(bytes.data(), bytes.size(), GraphFileKind::Called);
    REQUIRE(wrong_kind.is_err());
    REQUIRE(wrong_kind.error().code == CalltreeError::Corrupt);

    auto truncated = deserialize_graph_file(bytes.data(), bytes.size() - 3, GraphFileKind::Calling);
    REQUIRE(truncated.is_err());
    REQUIRE(truncated.error().code == CalltreeError::Corrupt);

    std::vector<uint8_t> junk = {'n', 'o', 'p', 'e', 1, 0};
    auto bad_magic = deserialize_graph_file(junk.data(), junk.size(), GraphFileKind::Calling);
    REQUIRE(bad_magic.is_err());
    REQUIRE(bad_magic.error().code == CalltreeError::Corrupt);
}

// ===== Store / load =====

TEST_CASE("stored graph loads back equal", "[graph_cache]") {
    TempDir td("cache");
    GraphCache cache(td.path.string(), CacheKey::make(ExtractOptions{}));
    CallGraph graph = sample_graph();

    auto miss = cache.load();
    REQUIRE(miss.is_ok());
    REQUIRE_FALSE(miss.value().has_value());

    REQUIRE(cache.store(graph).is_ok());
    auto hit = cache.load();
    REQUIRE(hit.is_ok());
    REQUIRE(hit.value().has_value());
    REQUIRE(*hit.value() == graph);
}

TEST_CASE("changed blacklist misses the cache", "[graph_cache]") {
    TempDir td("cache_sig");
    ExtractOptions opts;
    REQUIRE(GraphCache(td.path.string(), CacheKey::make(opts)).store(sample_graph()).is_ok());

    opts.ignored.insert("my_log");
    auto r = GraphCache(td.path.string(), CacheKey::make(opts)).load();
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().has_value());
}

TEST_CASE("unparsable cached graph is a fatal error", "[graph_cache]") {
    TempDir td("cache_corrupt");
    GraphCache cache(td.path.string(), CacheKey::make(ExtractOptions{}));
    REQUIRE(cache.store(sample_graph()).is_ok());

    std::ofstream(cache.called_path(), std::ios::binary | std::ios::trunc) << "garbage";
    auto r = cache.load();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CalltreeError::Corrupt);
    REQUIRE(r.error().file == cache.called_path());
}

TEST_CASE("failed store leaves a cache that misses", "[graph_cache]") {
    TempDir td("cache_torn");
    GraphCache cache(td.path.string(), CacheKey::make(ExtractOptions{}));
    REQUIRE(cache.store(sample_graph()).is_ok());

    // The called index can no longer be written.
    fs::remove(cache.called_path());
    fs::create_directories(fs::path(cache.called_path()) / "blocked");

    CallGraph rebuilt = sample_graph();
    CallerNode extra;
    extra.name = "extra";
    extra.simple_name = "extra";
    extra.file_info = "src/extra.cc:1";
    extra.callee_names = {"parse"};
    rebuilt.add_caller(extra);

    REQUIRE(cache.store(rebuilt).is_err());
    REQUIRE_FALSE(fs::exists(cache.signature_path()));

    auto r = cache.load();
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().has_value());
}

TEST_CASE("cache hit refreshes file timestamps", "[graph_cache]") {
    TempDir td("cache_touch");
    GraphCache cache(td.path.string(), CacheKey::make(ExtractOptions{}));
    REQUIRE(cache.store(sample_graph()).is_ok());

    auto old_time = fs::file_time_type::clock::now() - std::chrono::hours(24);
    fs::last_write_time(cache.calling_path(), old_time);
    REQUIRE(cache.load().is_ok());
    REQUIRE(fs::last_write_time(cache.calling_path()) > old_time);
}

// ===== Pipeline =====

TEST_CASE("second run reuses the cache without searching", "[graph_cache]") {
    TempDir td("pipeline");
    td.write_file("src/main.c",
        "int main() {\n"
        "    foo();\n"
        "}\n"
        "\n"
        "void foo() {\n"
        "    bar(\"(\");\n"
        "}\n");

    FileSearcher files(td.path.string());
    PipelineOptions opts;
    opts.root = td.path.string();
    opts.workers = 2;

    CountingSearcher first(files);
    auto built = load_or_build_call_graph(first, opts);
    REQUIRE(built.is_ok());
    REQUIRE(first.calls > 0);
    REQUIRE(built.value().callers_of("foo").front()->name == "main");
    REQUIRE(td.read_file("src/main.c").find("bar(\"(\")") != std::string::npos);
    REQUIRE_FALSE(td.exists("src/main.c.saved_by_calltree"));

    CountingSearcher second(files);
    auto cached = load_or_build_call_graph(second, opts);
    REQUIRE(cached.is_ok());
    REQUIRE(second.calls == 0);
    REQUIRE(cached.value() == built.value());
}

TEST_CASE("pipeline restores leftovers before building", "[graph_cache]") {
    TempDir td("pipeline_recover");
    td.write_file("a.c", "broken");
    td.write_file("a.c.saved_by_calltree", "void a() {\n    helper();\n}\n");

    FileSearcher files(td.path.string());
    PipelineOptions opts;
    opts.root = td.path.string();
    opts.cache_dir = td.file("cache");

    auto r = load_or_build_call_graph(files, opts);
    REQUIRE(r.is_ok());
    REQUIRE(td.read_file("a.c") == "void a() {\n    helper();\n}\n");
    REQUIRE(r.value().callers_of("helper").size() == 1);
    REQUIRE(td.exists("cache/.calltree_ignored.50.3"));
}

TEST_CASE("definitions sharing lines still chain callers", "[graph_cache]") {
    auto caller_chain = [](const std::string& source) {
        TempDir td("pipeline_adjacent");
        td.write_file("a.c", source);

        FileSearcher files(td.path.string());
        PipelineOptions opts;
        opts.root = td.path.string();
        auto graph = load_or_build_call_graph(files, opts);
        REQUIRE(graph.is_ok());
        REQUIRE(td.read_file("a.c") == source);

        QueryOptions query;
        query.filter = ".*";
        auto tree = query_tree(graph.value(), "bar", query);
        REQUIRE(tree.is_ok());
        return render_tree(tree.value(), false);
    };
    const std::vector<std::string> expected = {
        "bar",
        "└── foo",
        "    └── main",
    };

    SECTION("all on one line") {
        REQUIRE(caller_chain("main(){ foo(); } foo(){ bar(); } bar(){ baz(); }\n") == expected);
    }
    SECTION("one definition per line") {
        REQUIRE(caller_chain("main(){ foo(); }\nfoo(){ bar(); }\nbar(){ baz(); }\n") == expected);
    }
}
