#include <calltree/search.hpp>
#include <calltree/glob.hpp>
#include <calltree/log.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

#include <unistd.h>

namespace fs = std::filesystem;

namespace calltree {

FileSearcher::FileSearcher(std::string root)
    : root_(std::move(root)) {}

Status FileSearcher::check_available() const {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return CalltreeError{CalltreeError::Search,
            "search root is not a directory: " + root_};
    }
    if (access(root_.c_str(), R_OK | X_OK) != 0) {
        return CalltreeError{CalltreeError::Search,
            "search root is not readable: " + root_};
    }
    return ok_status();
}

Result<std::vector<std::string>> FileSearcher::list_files(const SearchScope& scope) {
    CALLTREE_TRY(check_available());

    std::regex name_re;
    try {
        name_re = std::regex(scope.file_pattern);
    } catch (const std::regex_error& e) {
        return CalltreeError{CalltreeError::InvalidArg,
            "invalid file pattern '" + scope.file_pattern + "': " + e.what()};
    }

    std::vector<std::string> files;
    std::error_code ec;
    fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return CalltreeError{CalltreeError::Search,
            "cannot list " + root_ + ": " + ec.message()};
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return CalltreeError{CalltreeError::Search,
                "error listing " + root_ + ": " + ec.message()};
        }
        const fs::path& p = it->path();
        std::string name = p.filename().string();
        std::string rel = fs::relative(p, root_, ec).generic_string();
        if (ec) continue;

        bool hidden = !name.empty() && name[0] == '.';
        if (it->is_directory(ec)) {
            if (hidden || glob_ignored(scope.ignore_globs, rel)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (hidden || !it->is_regular_file(ec)) continue;
        if (!std::regex_search(name, name_re)) continue;
        if (glob_ignored(scope.ignore_globs, rel)) continue;

        files.push_back((fs::path(root_) / rel).lexically_normal().generic_string());
    }

    std::sort(files.begin(), files.end());
    calltree::log::debug("listed %zu files under %s", files.size(), root_.c_str());
    return Result<std::vector<std::string>>::ok(std::move(files));
}

std::vector<int> lines_covered(const std::string& content, const std::vector<Span>& spans) {
    std::vector<size_t> line_starts{0};
    for (size_t i = 0; i < content.size(); ++i) {
        if (content[i] == '\n') line_starts.push_back(i + 1);
    }
    auto line_of = [&](size_t offset) {
        auto it = std::upper_bound(line_starts.begin(), line_starts.end(), offset);
        return static_cast<int>(it - line_starts.begin());
    };

    std::vector<int> lines;
    for (const auto& span : spans) {
        if (span.end <= span.begin) continue;
        int first = line_of(span.begin);
        int last = line_of(span.end - 1);
        for (int ln = first; ln <= last; ++ln) lines.push_back(ln);
    }
    std::sort(lines.begin(), lines.end());
    lines.erase(std::unique(lines.begin(), lines.end()), lines.end());
    return lines;
}

Result<std::vector<std::string>> FileSearcher::grep(const SpanFinder& finder,
                                                    const SearchScope& scope) {
    auto files = list_files(scope);
    if (files.is_err()) return std::move(files).error();

    std::vector<std::string> hits;
    for (const auto& path : files.value()) {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            return CalltreeError{CalltreeError::IO,
                "cannot open file for reading: " + path};
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        std::string content = ss.str();

        auto lines = lines_covered(content, finder(content));
        if (lines.empty()) continue;

        // Walk the content once, emitting the covered lines in order.
        size_t li = 0;
        int ln = 1;
        size_t start = 0;
        while (li < lines.size() && start <= content.size()) {
            size_t nl = content.find('\n', start);
            size_t end = nl == std::string::npos ? content.size() : nl;
            if (ln == lines[li]) {
                hits.push_back(path + ":" + std::to_string(ln) + ":" +
                               content.substr(start, end - start));
                ++li;
            }
            if (nl == std::string::npos) break;
            start = nl + 1;
            ++ln;
        }
    }
    return Result<std::vector<std::string>>::ok(std::move(hits));
}

} // namespace calltree
