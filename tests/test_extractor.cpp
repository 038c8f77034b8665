#include <catch2/catch.hpp>
#include <calltree/analysis/extractor.hpp>

#include <set>
#include <string>
#include <vector>

using namespace calltree;

// Serves fixed grep lines; used where no files are needed.
class StaticSearcher : public Searcher {
public:
    explicit StaticSearcher(std::vector<std::string> lines) : lines_(std::move(lines)) {}

    Result<std::vector<std::string>> list_files(const SearchScope&) override {
        return Result<std::vector<std::string>>::ok({});
    }
    Result<std::vector<std::string>> grep(const SpanFinder&, const SearchScope&) override {
        return Result<std::vector<std::string>>::ok(lines_);
    }

private:
    std::vector<std::string> lines_;
};

static MatchedSpan span_of(const std::string& text, int line = 1,
                           const std::string& path = "a.c") {
    return MatchedSpan{path, line, text};
}

// ===== Merge =====

TEST_CASE("adjacent lines of one file merge into one span", "[extractor]") {
    auto r = merge_grep_lines({
        "a.c:3:int f() {",
        "a.c:4:  g();",
        "a.c:5:}",
        "a.c:9:int h() { k(); }",
        "b.c:10:int m() { n(); }",
    });
    REQUIRE(r.is_ok());
    const auto& spans = r.value();
    REQUIRE(spans.size() == 3);
    REQUIRE(spans[0].path == "a.c");
    REQUIRE(spans[0].line == 3);
    REQUIRE(spans[0].text == "int f() {\n  g();\n}");
    REQUIRE(spans[1].line == 9);
    REQUIRE(spans[2].path == "b.c");
    REQUIRE(spans[2].line == 10);
}

TEST_CASE("consecutive line numbers in different files do not merge", "[extractor]") {
    auto r = merge_grep_lines({"a.c:1:x", "b.c:2:y"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 2);
}

TEST_CASE("content may contain colons", "[extractor]") {
    auto r = merge_grep_lines({"a.cpp:7:void A::f() { B::g(); }"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value()[0].text == "void A::f() { B::g(); }");
}

TEST_CASE("undecomposable grep line is a parse error", "[extractor]") {
    auto r = merge_grep_lines({"a.c:1:ok", "garbage without line number"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CalltreeError::Parse);

    REQUIRE(merge_grep_lines({"a.c:x:text"}).is_err());
    REQUIRE(merge_grep_lines({":3:text"}).is_err());
}

// ===== Definitions and callees =====

TEST_CASE("capture names the definition and its location", "[extractor]") {
    auto defs = capture_definitions(span_of("static int\nns::Foo::run(int x)\n{\n  step(x);\n}", 10));
    REQUIRE(defs.size() == 1);
    REQUIRE(defs[0].qualified_name == "ns::Foo::run");
    REQUIRE(defs[0].simple_name == "run");
    REQUIRE(defs[0].line == 11);
    REQUIRE(defs[0].file_info() == "a.c:11");
}

TEST_CASE("spans without a definition capture nothing", "[extractor]") {
    REQUIRE(capture_definitions(span_of("int x = f(1);")).empty());
}

TEST_CASE("callees are the calls after the definition's name", "[extractor]") {
    auto defs = capture_definitions(span_of("int f(int a = g()) { return h(k(a)); }"));
    REQUIRE(defs.size() == 1);
    auto callees = callees_of(defs[0]);
    REQUIRE(std::set<std::string>(callees.begin(), callees.end()) ==
            std::set<std::string>{"g", "h", "k"});
}

TEST_CASE("every definition in a span is captured with its own body", "[extractor]") {
    SECTION("one line") {
        auto defs = capture_definitions(span_of("main(){ foo(); } foo(){ bar(); } bar(){ baz(); }", 4));
        REQUIRE(defs.size() == 3);
        REQUIRE(defs[0].qualified_name == "main");
        REQUIRE(defs[1].qualified_name == "foo");
        REQUIRE(defs[2].qualified_name == "bar");
        REQUIRE(callees_of(defs[0]) == std::vector<std::string>{"foo"});
        REQUIRE(callees_of(defs[1]) == std::vector<std::string>{"bar"});
        REQUIRE(callees_of(defs[2]) == std::vector<std::string>{"baz"});
        REQUIRE(defs[2].line == 4);
    }

    SECTION("consecutive lines") {
        auto defs = capture_definitions(span_of(
            "int main() { foo(); }\nvoid foo() { bar(); }\nvoid bar() {\n  baz();\n}", 7));
        REQUIRE(defs.size() == 3);
        REQUIRE(defs[0].line == 7);
        REQUIRE(defs[1].line == 8);
        REQUIRE(defs[2].line == 9);
        REQUIRE(callees_of(defs[0]) == std::vector<std::string>{"foo"});
        REQUIRE(callees_of(defs[2]) == std::vector<std::string>{"baz"});
    }
}

// ===== Noise filtering =====

TEST_CASE("blacklist contains keywords, casts and log-like names", "[extractor]") {
    auto ignored = ExtractOptions::default_ignored_names();
    for (const char* name : {"if", "for", "while", "switch", "return", "sizeof",
                             "static_cast", "assert", "log", "get", "set"}) {
        REQUIRE(ignored.count(name) == 1);
    }
    REQUIRE(ExtractOptions{}.trivial_threshold == 50);
    REQUIRE(ExtractOptions{}.length_threshold == 3);
}

TEST_CASE("frequent and short names become trivial", "[extractor]") {
    ExtractOptions opts;
    opts.ignored = {"skip"};
    opts.trivial_threshold = 2;
    opts.length_threshold = 3;

    std::vector<std::vector<std::string>> lists = {
        {"often", "rare", "ab"},
        {"often"},
        {"often", "twice"},
        {"twice"},
    };
    size_t trivial = 0;
    auto ignored = compute_ignore_set(lists, opts, &trivial);
    REQUIRE(ignored == std::set<std::string>{"skip", "often", "ab"});
    REQUIRE(trivial == 2);
}

TEST_CASE("noise names are dropped from the graph", "[extractor]") {
    ExtractOptions opts;
    opts.ignored = {};
    opts.trivial_threshold = 2;
    opts.length_threshold = 3;

    std::vector<MatchedSpan> spans = {
        span_of("void one() { common(); ab(); keep(); }", 1),
        span_of("void two() { common(); }", 5),
        span_of("void three() { common(); }", 9),
        span_of("void ab() { keep(); }", 13),
    };
    ExtractStats stats;
    CallGraph graph = build_call_graph(spans, opts, &stats);

    REQUIRE(graph.node_count() == 3);   // "ab" is too short to be a definition
    REQUIRE_FALSE(graph.callers().contains("common"));
    REQUIRE_FALSE(graph.callers().contains("ab"));
    REQUIRE(graph.callers().contains("keep"));
    REQUIRE(graph.definitions_of("one").front()->callee_names ==
            std::vector<std::string>{"keep"});
    REQUIRE(stats.definitions_named == 4);
    REQUIRE(stats.definitions_kept == 3);
    REQUIRE(stats.trivial_names == 2);
}

TEST_CASE("blacklisted definitions are dropped", "[extractor]") {
    ExtractOptions opts;
    CallGraph graph = build_call_graph({span_of("if (ready) { start(); }")}, opts);
    REQUIRE(graph.node_count() == 0);
}

TEST_CASE("qualified callees keep a simple alias", "[extractor]") {
    ExtractOptions opts;
    CallGraph graph = build_call_graph({
        span_of("void run() { net::connect(); connect(); io::flush(); }"),
    }, opts);
    REQUIRE(graph.node_count() == 1);
    const CallerNode& node = graph.node(0);
    REQUIRE(node.callee_names == std::vector<std::string>{"connect", "io::flush", "net::connect"});
    REQUIRE(node.callee_simple_names == std::vector<std::string>{"flush"});
    REQUIRE(graph.callers_of("flush").size() == 1);
    REQUIRE(graph.callers_of("connect").size() == 1);
}

TEST_CASE("extract_call_graph runs grep, merge and capture", "[extractor]") {
    StaticSearcher searcher({
        "src/a.c:1:int main() {",
        "src/a.c:2:    foo();",
        "src/a.c:3:}",
        "src/a.c:5:void foo() { bar(); }",
    });
    ExtractStats stats;
    auto r = extract_call_graph(searcher, SearchScope{}, ExtractOptions{}, &stats);
    REQUIRE(r.is_ok());
    REQUIRE(stats.lines_matched == 4);
    REQUIRE(stats.spans_merged == 2);
    REQUIRE(r.value().definitions_of("foo").front()->file_info == "src/a.c:5");
    REQUIRE(r.value().callers_of("foo").front()->name == "main");
}

TEST_CASE("extract_call_graph propagates merge errors", "[extractor]") {
    StaticSearcher searcher({"not a grep line"});
    auto r = extract_call_graph(searcher, SearchScope{}, ExtractOptions{});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CalltreeError::Parse);
}

TEST_CASE("definitions on adjacent lines each become a caller", "[extractor]") {
    StaticSearcher searcher({
        "a.c:1:int main() { foo(); }",
        "a.c:2:void foo() { bar(); }",
        "a.c:3:void bar() { baz(); }",
    });
    ExtractStats stats;
    auto r = extract_call_graph(searcher, SearchScope{}, ExtractOptions{}, &stats);
    REQUIRE(r.is_ok());
    REQUIRE(stats.spans_merged == 1);
    REQUIRE(stats.definitions_named == 3);

    const CallGraph& graph = r.value();
    REQUIRE(graph.callers_of("bar").size() == 1);
    REQUIRE(graph.callers_of("bar").front()->name == "foo");
    REQUIRE(graph.callers_of("foo").front()->name == "main");
    REQUIRE(graph.definitions_of("bar").front()->file_info == "a.c:3");
    REQUIRE(graph.definitions_of("main").front()->callee_names == std::vector<std::string>{"foo"});
}
