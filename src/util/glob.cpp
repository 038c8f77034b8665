#include <calltree/glob.hpp>

namespace calltree {

static std::string normalize_path(const std::string& p) {
    std::string out;
    out.reserve(p.size());
    for (char c : p) {
        if (c == '\\') c = '/';
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    if (out.size() > 1 && out.back() == '/') out.pop_back();
    if (out.size() > 2 && out[0] == '.' && out[1] == '/') out.erase(0, 2);
    return out;
}

static std::vector<std::string> split_segments(const std::string& s) {
    std::vector<std::string> segs;
    size_t start = 0;
    while (true) {
        size_t slash = s.find('/', start);
        if (slash == std::string::npos) {
            segs.push_back(s.substr(start));
            break;
        }
        segs.push_back(s.substr(start, slash - start));
        start = slash + 1;
    }
    return segs;
}

// Match one character against a [...] class starting at pat[pi] == '['.
// Advances pi past the closing ']'.
static bool match_class(const std::string& pat, size_t& pi, char c) {
    ++pi;
    bool negate = pi < pat.size() && pat[pi] == '!';
    if (negate) ++pi;

    bool hit = false;
    while (pi < pat.size() && pat[pi] != ']') {
        char lo = pat[pi];
        if (pi + 2 < pat.size() && pat[pi + 1] == '-' && pat[pi + 2] != ']') {
            if (c >= lo && c <= pat[pi + 2]) hit = true;
            pi += 3;
        } else {
            if (c == lo) hit = true;
            ++pi;
        }
    }
    if (pi < pat.size()) ++pi;
    return hit != negate;
}

// Single path segment, no '/' on either side. Greedy star with one
// backtrack point, the usual wildcard scheme.
static bool match_segment(const std::string& pat, const std::string& str) {
    size_t pi = 0, si = 0;
    size_t star_pi = std::string::npos, star_si = 0;

    while (si < str.size()) {
        if (pi < pat.size() && pat[pi] == '*') {
            star_pi = ++pi;
            star_si = si;
            continue;
        }
        if (pi < pat.size()) {
            size_t next = pi;
            bool ok;
            if (pat[pi] == '?') {
                ok = true;
                next = pi + 1;
            } else if (pat[pi] == '[') {
                ok = match_class(pat, next, str[si]);
            } else {
                ok = pat[pi] == str[si];
                next = pi + 1;
            }
            if (ok) {
                pi = next;
                ++si;
                continue;
            }
        }
        if (star_pi == std::string::npos) return false;
        pi = star_pi;
        si = ++star_si;
    }

    while (pi < pat.size() && pat[pi] == '*') ++pi;
    return pi == pat.size();
}

static bool match_segments(const std::vector<std::string>& pat, size_t pi,
                           const std::vector<std::string>& path, size_t si) {
    for (; pi < pat.size(); ++pi, ++si) {
        if (pat[pi] == "**") {
            while (pi < pat.size() && pat[pi] == "**") ++pi;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= path.size(); ++k) {
                if (match_segments(pat, pi, path, k)) return true;
            }
            return false;
        }
        if (si >= path.size() || !match_segment(pat[pi], path[si])) return false;
    }
    return si == path.size();
}

bool glob_match(const std::string& pattern, const std::string& path) {
    return match_segments(split_segments(normalize_path(pattern)), 0,
                          split_segments(normalize_path(path)), 0);
}

bool glob_ignored(const std::vector<std::string>& globs, const std::string& path) {
    std::string norm = normalize_path(path);
    for (const auto& g : globs) {
        std::string pat = normalize_path(g);
        if (pat.empty()) continue;
        if (glob_match("**/" + pat, norm)) return true;
        if (glob_match("**/" + pat + "/**", norm)) return true;
    }
    return false;
}

} // namespace calltree
