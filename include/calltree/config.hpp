#pragma once

#include <calltree/result.hpp>
#include <calltree/search.hpp>
#include <calltree/analysis/extractor.hpp>
#include <optional>
#include <string>
#include <vector>

namespace calltree {

// Layered configuration: global then project. Later layers override only
// the fields they set explicitly.
struct Config {
    std::optional<int> trivial_threshold;
    std::optional<int> length_threshold;
    std::optional<std::vector<std::string>> ignore;   // replaces the blacklist
    std::vector<std::string> extra_ignore;            // appended to it

    std::optional<std::string> file_pattern;
    std::optional<std::vector<std::string>> ignore_globs;

    std::optional<int> workers;
    std::optional<std::string> cache_dir;
    std::optional<std::string> log_level;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Layers in order: global -> project
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project);

    // Defaults with this config's overrides applied.
    ExtractOptions extract_options() const;
    SearchScope search_scope() const;
};

// ~/.calltree/config.toml
std::string global_config_path();

// <root>/.calltree.toml
std::string project_config_path(const std::string& root);

// Load whichever layers exist. Missing files are not errors.
Result<Config> load_layered_config(const std::string& root);

} // namespace calltree
