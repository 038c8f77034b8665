#pragma once

#include <string>
#include <vector>

namespace calltree {

// Match a glob pattern against a path (both normalized to forward slashes).
// Supports: * (any chars except /), ? (single char except /),
//           ** (zero or more path segments), [abc], [a-z], [!0-9]
bool glob_match(const std::string& pattern, const std::string& path);

// True when `path` should be skipped under ag-style ignore globs. A glob
// without '/' is tried against every path component; a glob with '/' is
// tried against every sub-path, so "*contrib/*" hides everything below any
// directory whose name ends in "contrib".
bool glob_ignored(const std::vector<std::string>& globs, const std::string& path);

} // namespace calltree
