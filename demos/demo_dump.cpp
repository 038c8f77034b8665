// calltree-dump: sanitize one C/C++ file in memory and print every function
// definition found in it, with the line it starts on and the names it calls.
// The file on disk is not modified.
//
//     ./calltree-dump src/foo.cpp            # definitions and callees
//     ./calltree-dump src/foo.cpp --source   # also print the sanitized text

#include <calltree/result.hpp>
#include <calltree/search.hpp>
#include <calltree/analysis/extractor.hpp>
#include <calltree/analysis/sanitizer.hpp>

#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using namespace calltree;

// The same "path:line:content" lines a Searcher would report for this file.
static std::vector<std::string> grep_lines(const std::string& path, const std::string& text) {
    std::vector<std::string> all;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) all.push_back(line);

    std::vector<std::string> out;
    for (int n : lines_covered(text, find_function_definitions(text))) {
        if (n - 1 < static_cast<int>(all.size())) {
            out.push_back(path + ":" + std::to_string(n) + ":" + all[n - 1]);
        }
    }
    return out;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: calltree-dump <file.c|file.cpp|file.h> [--source]\n";
        return 1;
    }

    std::string path = argv[1];
    bool show_source = (argc > 2 && std::string(argv[2]) == "--source");

    std::ifstream f(path, std::ios::binary);
    if (!f) {
        std::cerr << "error: cannot open " << path << "\n";
        return 1;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    std::string sanitized = sanitize_source(ss.str());

    std::cout << "--- " << path << " ---\n";
    if (show_source) {
        std::cout << "\n-- Sanitized --\n" << sanitized << "\n";
    }

    auto spans = merge_grep_lines(grep_lines(path, sanitized));
    if (spans.is_err()) {
        std::cerr << spans.error().format() << "\n";
        return 1;
    }
    std::cout << "Definition spans: " << spans.value().size() << "\n\n";

    const std::set<std::string> blacklist = ExtractOptions::default_ignored_names();
    for (const auto& span : spans.value()) {
        auto defs = capture_definitions(span);
        if (defs.empty()) {
            std::cout << "  (unnamed span at line " << span.line << ")\n";
            continue;
        }

        for (const auto& def : defs) {
            std::cout << def.qualified_name << "  (" << def.file_info() << ")";
            if (blacklist.count(def.qualified_name)) std::cout << "  [ignored]";
            std::cout << "\n";

            std::set<std::string> callees;
            for (const auto& name : callees_of(def)) {
                if (!blacklist.count(name)) callees.insert(name);
            }
            for (const auto& name : callees) {
                std::cout << "    -> " << name << "\n";
            }
        }
    }

    return 0;
}
