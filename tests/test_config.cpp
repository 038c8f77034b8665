#include <catch2/catch.hpp>
#include <calltree/config.hpp>
#include "temp_dir.hpp"

#include <cstdlib>

using namespace calltree;

// ===== Parsing =====

TEST_CASE("parse config with extract section", "[config]") {
    auto r = Config::parse(R"(
[extract]
trivial-threshold = 20
length-threshold = 4
extra-ignore = ["my_log", "my_assert"]
)");
    REQUIRE(r.is_ok());
    const Config& cfg = r.value();
    REQUIRE(cfg.trivial_threshold == 20);
    REQUIRE(cfg.length_threshold == 4);
    REQUIRE_FALSE(cfg.ignore.has_value());
    REQUIRE(cfg.extra_ignore == std::vector<std::string>{"my_log", "my_assert"});
}

TEST_CASE("parse config with search, sanitize, cache and log sections", "[config]") {
    auto r = Config::parse(R"(
[search]
file-pattern = '\.(c|h)$'
ignore-globs = ["*vendor/*"]

[sanitize]
workers = 4

[cache]
dir = ".calltree"

[log]
level = "debug"
)");
    REQUIRE(r.is_ok());
    const Config& cfg = r.value();
    REQUIRE(cfg.file_pattern == std::string(R"(\.(c|h)$)"));
    REQUIRE(cfg.ignore_globs == std::vector<std::string>{"*vendor/*"});
    REQUIRE(cfg.workers == 4);
    REQUIRE(cfg.cache_dir == std::string(".calltree"));
    REQUIRE(cfg.log_level == std::string("debug"));
}

TEST_CASE("parse empty config", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().trivial_threshold.has_value());
    REQUIRE_FALSE(r.value().workers.has_value());
    REQUIRE(r.value().extra_ignore.empty());
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CalltreeError::Config);
}

TEST_CASE("wrong value types are config errors", "[config]") {
    auto a = Config::parse("[extract]\ntrivial-threshold = \"many\"\n");
    REQUIRE(a.is_err());
    REQUIRE(a.error().code == CalltreeError::Config);

    auto b = Config::parse("[extract]\nignore = [\"if\", 3]\n");
    REQUIRE(b.is_err());
    REQUIRE(b.error().code == CalltreeError::Config);

    auto c = Config::parse("[search]\nfile-pattern = 12\n");
    REQUIRE(c.is_err());
    REQUIRE(c.error().code == CalltreeError::Config);
}

TEST_CASE("out of range values are config errors", "[config]") {
    REQUIRE(Config::parse("[extract]\ntrivial-threshold = -1\n").is_err());
    REQUIRE(Config::parse("[extract]\nlength-threshold = -2\n").is_err());
    REQUIRE(Config::parse("[sanitize]\nworkers = 0\n").is_err());
    REQUIRE(Config::parse("[log]\nlevel = \"loud\"\n").is_err());
}

TEST_CASE("integers wider than int are rejected, not wrapped", "[config]") {
    auto r = Config::parse("[extract]\ntrivial-threshold = 4294967297\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CalltreeError::Config);
    REQUIRE(r.error().message.find("extract.trivial-threshold") != std::string::npos);

    REQUIRE(Config::parse("[sanitize]\nworkers = 2147483648\n").is_err());
    REQUIRE(Config::parse("[extract]\nlength-threshold = -9999999999\n").is_err());

    auto max = Config::parse("[extract]\ntrivial-threshold = 2147483647\n");
    REQUIRE(max.is_ok());
    REQUIRE(*max.value().trivial_threshold == 2147483647);
}

// ===== Merge =====

TEST_CASE("merge overrides only fields set by the later layer", "[config]") {
    auto base = Config::parse(R"(
[extract]
trivial-threshold = 30
length-threshold = 2
[sanitize]
workers = 8
)").value();

    auto overlay = Config::parse(R"(
[extract]
trivial-threshold = 10
)").value();

    base.merge(overlay);
    REQUIRE(base.trivial_threshold == 10);   // overridden
    REQUIRE(base.length_threshold == 2);     // preserved
    REQUIRE(base.workers == 8);              // preserved
}

TEST_CASE("extra ignore names accumulate across layers", "[config]") {
    auto global = Config::parse("[extract]\nextra-ignore = [\"g_log\"]\n").value();
    auto project = Config::parse("[extract]\nextra-ignore = [\"p_log\"]\n").value();
    Config cfg = Config::effective(global, project);
    REQUIRE(cfg.extra_ignore == std::vector<std::string>{"g_log", "p_log"});
}

TEST_CASE("effective config with no layers is the default", "[config]") {
    Config cfg = Config::effective(std::nullopt, std::nullopt);
    ExtractOptions opts = cfg.extract_options();
    REQUIRE(opts.ignored == ExtractOptions::default_ignored_names());
    REQUIRE(opts.trivial_threshold == 50);
    REQUIRE(opts.length_threshold == 3);
    REQUIRE(cfg.search_scope().file_pattern == SearchScope{}.file_pattern);
}

// ===== Options =====

TEST_CASE("ignore replaces the blacklist and extra-ignore extends it", "[config]") {
    auto cfg = Config::parse(R"(
[extract]
ignore = ["if", "for"]
extra-ignore = ["trace_me"]
)").value();
    ExtractOptions opts = cfg.extract_options();
    REQUIRE(opts.ignored == std::set<std::string>{"for", "if", "trace_me"});
}

TEST_CASE("extra-ignore alone keeps the default blacklist", "[config]") {
    auto cfg = Config::parse("[extract]\nextra-ignore = [\"trace_me\"]\n").value();
    ExtractOptions opts = cfg.extract_options();
    REQUIRE(opts.ignored.count("trace_me") == 1);
    REQUIRE(opts.ignored.count("static_cast") == 1);
}

TEST_CASE("search scope takes configured pattern and globs", "[config]") {
    auto cfg = Config::parse("[search]\nignore-globs = []\n").value();
    SearchScope scope = cfg.search_scope();
    REQUIRE(scope.ignore_globs.empty());
    REQUIRE(scope.file_pattern == SearchScope{}.file_pattern);
}

// ===== Files =====

TEST_CASE("load reports the failing file", "[config]") {
    TempDir td("config");
    std::string path = td.write_file(".calltree.toml", "[sanitize]\nworkers = \"x\"\n");
    auto r = Config::load(path);
    REQUIRE(r.is_err());
    REQUIRE(r.error().file == path);

    auto missing = Config::load(td.file("missing.toml"));
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == CalltreeError::IO);
}

TEST_CASE("layered config reads the project file", "[config]") {
    TempDir td("layers");
    TempDir home("home");
    const char* old_home = std::getenv("HOME");
    std::string saved = old_home ? old_home : "";
    setenv("HOME", home.path.c_str(), 1);

    home.write_file(".calltree/config.toml", "[sanitize]\nworkers = 3\n[extract]\nlength-threshold = 5\n");
    td.write_file(".calltree.toml", "[extract]\nlength-threshold = 2\n");

    auto r = load_layered_config(td.path.string());
    if (old_home) setenv("HOME", saved.c_str(), 1); else unsetenv("HOME");

    REQUIRE(r.is_ok());
    REQUIRE(r.value().workers == 3);
    REQUIRE(r.value().length_threshold == 2);
    REQUIRE(project_config_path(td.path.string()) == (td.path / ".calltree.toml").string());
}
