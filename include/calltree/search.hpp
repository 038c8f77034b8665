#pragma once

#include <calltree/result.hpp>
#include <calltree/analysis/patterns.hpp>
#include <functional>
#include <string>
#include <vector>

namespace calltree {

// Which files a search covers.
struct SearchScope {
    std::string file_pattern = R"(\.(c|cc|cpp|C|h|hh|hpp|H)$)";  // regex on the file name
    std::vector<std::string> ignore_globs = {
        "*test*", "*benchmark*", "*CMakeFiles*",
        "*contrib/*", "*thirdparty/*", "*3rdparty/*",
    };
};

// Reports the byte spans of interest in one file's content.
using SpanFinder = std::function<std::vector<Span>(const std::string&)>;

// File listing and line-oriented grep over a source tree.
class Searcher {
public:
    virtual ~Searcher() = default;

    // Paths of the files in scope, in a stable order.
    virtual Result<std::vector<std::string>> list_files(const SearchScope& scope) = 0;

    // "path:line:content" for every line touched by a span the finder
    // reports, each line once, in file then line order.
    virtual Result<std::vector<std::string>> grep(const SpanFinder& finder,
                                                  const SearchScope& scope) = 0;
};

// In-process searcher rooted at a directory. Hidden entries are skipped.
class FileSearcher : public Searcher {
public:
    explicit FileSearcher(std::string root);

    // Search error when the root is not a readable directory.
    Status check_available() const;

    Result<std::vector<std::string>> list_files(const SearchScope& scope) override;
    Result<std::vector<std::string>> grep(const SpanFinder& finder,
                                          const SearchScope& scope) override;

    const std::string& root() const { return root_; }

private:
    std::string root_;
};

// Lines of `content` covered by `spans`, 1-based and ascending.
std::vector<int> lines_covered(const std::string& content, const std::vector<Span>& spans);

} // namespace calltree
