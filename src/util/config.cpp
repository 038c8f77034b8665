#include <calltree/config.hpp>
#include <calltree/log.hpp>
#include <toml++/toml.hpp>

#include <climits>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace calltree {

static CalltreeError type_error(const std::string& key, const char* expected) {
    return CalltreeError{CalltreeError::Config,
        "config key '" + key + "' must be " + expected};
}

// Each reader leaves `dst` alone when the key is absent and fails with a
// Config error when it holds the wrong type.
static Status read_int(const toml::table& tbl, const char* section, const char* key,
                       std::optional<int>& dst) {
    const toml::node* node = tbl.get(key);
    if (!node) return ok_status();
    auto v = node->value<int64_t>();
    if (!node->is_integer() || !v) {
        return type_error(std::string(section) + "." + key, "an integer");
    }
    if (*v < INT_MIN || *v > INT_MAX) {
        return CalltreeError{CalltreeError::Config,
            "config key '" + std::string(section) + "." + key + "' is out of range: " +
            std::to_string(*v)};
    }
    dst = static_cast<int>(*v);
    return ok_status();
}

static Status read_string(const toml::table& tbl, const char* section, const char* key,
                          std::optional<std::string>& dst) {
    const toml::node* node = tbl.get(key);
    if (!node) return ok_status();
    auto v = node->value<std::string>();
    if (!v) return type_error(std::string(section) + "." + key, "a string");
    dst = std::string(*v);
    return ok_status();
}

static Status read_strings(const toml::table& tbl, const char* section, const char* key,
                           std::optional<std::vector<std::string>>& dst) {
    const toml::node* node = tbl.get(key);
    if (!node) return ok_status();
    const toml::array* arr = node->as_array();
    if (!arr) return type_error(std::string(section) + "." + key, "an array of strings");

    std::vector<std::string> out;
    for (const auto& elem : *arr) {
        auto s = elem.value<std::string>();
        if (!s) return type_error(std::string(section) + "." + key, "an array of strings");
        out.push_back(std::string(*s));
    }
    dst = std::move(out);
    return ok_status();
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return CalltreeError{CalltreeError::Config,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [extract] section
    if (auto extract = doc["extract"].as_table()) {
        CALLTREE_TRY(read_int(*extract, "extract", "trivial-threshold", cfg.trivial_threshold));
        CALLTREE_TRY(read_int(*extract, "extract", "length-threshold", cfg.length_threshold));
        CALLTREE_TRY(read_strings(*extract, "extract", "ignore", cfg.ignore));
        std::optional<std::vector<std::string>> extra;
        CALLTREE_TRY(read_strings(*extract, "extract", "extra-ignore", extra));
        if (extra) cfg.extra_ignore = std::move(*extra);

        if (cfg.trivial_threshold && *cfg.trivial_threshold < 0) {
            return CalltreeError{CalltreeError::Config,
                "extract.trivial-threshold must not be negative"};
        }
        if (cfg.length_threshold && *cfg.length_threshold < 0) {
            return CalltreeError{CalltreeError::Config,
                "extract.length-threshold must not be negative"};
        }
    }

    // [search] section
    if (auto search = doc["search"].as_table()) {
        CALLTREE_TRY(read_string(*search, "search", "file-pattern", cfg.file_pattern));
        CALLTREE_TRY(read_strings(*search, "search", "ignore-globs", cfg.ignore_globs));
    }

    // [sanitize] section
    if (auto sanitize = doc["sanitize"].as_table()) {
        CALLTREE_TRY(read_int(*sanitize, "sanitize", "workers", cfg.workers));
        if (cfg.workers && *cfg.workers < 1) {
            return CalltreeError{CalltreeError::Config,
                "sanitize.workers must be at least 1"};
        }
    }

    // [cache] section
    if (auto cache = doc["cache"].as_table()) {
        CALLTREE_TRY(read_string(*cache, "cache", "dir", cfg.cache_dir));
    }

    // [log] section
    if (auto log_tbl = doc["log"].as_table()) {
        CALLTREE_TRY(read_string(*log_tbl, "log", "level", cfg.log_level));
        log::Level level;
        if (cfg.log_level && !log::parse_level(*cfg.log_level, level)) {
            return CalltreeError{CalltreeError::Config,
                "unknown log level '" + *cfg.log_level + "'",
                "expected one of: trace, debug, info, warn, error"};
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return CalltreeError{CalltreeError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) return std::move(cfg).error().at(path);
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.trivial_threshold) trivial_threshold = other.trivial_threshold;
    if (other.length_threshold) length_threshold = other.length_threshold;
    if (other.ignore) {
        // A replaced blacklist drops the additions made on top of the old one.
        ignore = other.ignore;
        extra_ignore.clear();
    }
    extra_ignore.insert(extra_ignore.end(), other.extra_ignore.begin(), other.extra_ignore.end());

    if (other.file_pattern) file_pattern = other.file_pattern;
    if (other.ignore_globs) ignore_globs = other.ignore_globs;

    if (other.workers) workers = other.workers;
    if (other.cache_dir) cache_dir = other.cache_dir;
    if (other.log_level) log_level = other.log_level;
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

ExtractOptions Config::extract_options() const {
    ExtractOptions opts;
    if (ignore) opts.ignored = std::set<std::string>(ignore->begin(), ignore->end());
    opts.ignored.insert(extra_ignore.begin(), extra_ignore.end());
    if (trivial_threshold) opts.trivial_threshold = *trivial_threshold;
    if (length_threshold) opts.length_threshold = *length_threshold;
    return opts;
}

SearchScope Config::search_scope() const {
    SearchScope scope;
    if (file_pattern) scope.file_pattern = *file_pattern;
    if (ignore_globs) scope.ignore_globs = *ignore_globs;
    return scope;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.calltree/config.toml";
}

std::string project_config_path(const std::string& root) {
    return (fs::path(root) / ".calltree.toml").string();
}

Result<Config> load_layered_config(const std::string& root) {
    std::optional<Config> global;
    std::optional<Config> project;
    std::error_code ec;

    std::string gpath = global_config_path();
    if (!gpath.empty() && fs::exists(gpath, ec)) {
        auto cfg = Config::load(gpath);
        if (cfg.is_err()) return std::move(cfg).error();
        global = std::move(cfg).value();
    }

    std::string ppath = project_config_path(root);
    if (fs::exists(ppath, ec)) {
        auto cfg = Config::load(ppath);
        if (cfg.is_err()) return std::move(cfg).error();
        project = std::move(cfg).value();
    }

    return Result<Config>::ok(Config::effective(global, project));
}

} // namespace calltree
