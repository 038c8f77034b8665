#pragma once

#include <calltree/result.hpp>
#include <string>
#include <vector>

namespace calltree {

// Suffixes are fixed so a later run can find leftovers after a crash.
inline constexpr const char* kBackupSuffix = ".saved_by_calltree";
inline constexpr const char* kTempSuffix = ".tmp.created_by_calltree";

// ---------------------------------------------------------------------------
// Text passes. None of them changes the number of lines.
// ---------------------------------------------------------------------------

// "/* ... */" -> one '\n' per newline inside the comment.
std::string blank_block_comments(const std::string& src);
// "..." and R"d(...)d" -> "" followed by the newlines they contained.
std::string blank_string_literals(const std::string& src);
// 'c', '\n', '\'' -> 'x'. Digit separators (1'000) are not literals.
std::string blank_char_literals(const std::string& src);
// "// ..." removed up to the end of the line.
std::string strip_line_comments(const std::string& src);
// '{' '}' '<' '>' '(' ')' in single quotes -> 'x'.
std::string defuse_quoted_brackets(const std::string& src);
// "<<", "<=", "<<=" ... -> "++".
std::string rewrite_left_angle_operators(const std::string& src);
// "a < b" -> "a + b" when '<' has blanks on both sides.
std::string rewrite_isolated_less_than(const std::string& src);

// All passes above, in order.
std::string sanitize_source(const std::string& src);

// ---------------------------------------------------------------------------
// Files
// ---------------------------------------------------------------------------

std::string backup_path(const std::string& path);
std::string temp_path(const std::string& path);

// Back up `path` under backup_path(), then overwrite it with its sanitized
// text. Non-regular and binary files are skipped.
Status sanitize_file(const std::string& path);

// Move the backup over `path` and drop any temp file. No backup: no-op.
Status restore_file(const std::string& path);

// Round-robin partition into min(num_groups, files.size()) groups.
std::vector<std::vector<std::string>> group_files(
    const std::vector<std::string>& files, size_t num_groups);

// Fork one worker process per group and wait for all of them.
Status sanitize_files(const std::vector<std::string>& files, int workers);

// Put back every backup and delete every temp file below root that an
// interrupted run left behind. Returns the number of files restored.
Result<size_t> recover_interrupted_run(const std::string& root);

// Scoped sanitization of a file set. While active, termination signals
// restore every file before the process exits; leaving scope restores too.
// At most one session can be active per process.
class SanitizeSession {
public:
    explicit SanitizeSession(std::vector<std::string> files);
    ~SanitizeSession();

    SanitizeSession(const SanitizeSession&) = delete;
    SanitizeSession& operator=(const SanitizeSession&) = delete;

    Status sanitize(int workers);
    Status restore();

    bool active() const { return active_; }
    const std::vector<std::string>& files() const { return files_; }

private:
    std::vector<std::string> files_;
    std::vector<std::string> backups_;
    std::vector<std::string> temps_;
    bool active_ = false;
};

} // namespace calltree
