#include <calltree/analysis/sanitizer.hpp>
#include <calltree/analysis/patterns.hpp>
#include <calltree/log.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace calltree {

static constexpr size_t npos = std::string::npos;

// ---------------------------------------------------------------------------
// Literal scanning
// ---------------------------------------------------------------------------

static bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

// text[i] == '"' opens a raw string when preceded by R, u8R, uR, UR or LR.
static bool opens_raw_string(const std::string& s, size_t i) {
    if (i == 0 || s[i - 1] != 'R') return false;
    size_t k = i - 1;
    while (k > 0 && is_ident_char(s[k - 1])) --k;
    std::string prefix = s.substr(k, i - 1 - k);
    return prefix.empty() || prefix == "u8" || prefix == "u" ||
           prefix == "U" || prefix == "L";
}

// One past the string literal opened at s[i] == '"'. Unterminated literals
// run to the end of the line.
static size_t end_of_string(const std::string& s, size_t i) {
    if (opens_raw_string(s, i)) {
        size_t paren = s.find('(', i + 1);
        if (paren != npos && paren - i - 1 <= 16) {
            std::string close = ")" + s.substr(i + 1, paren - i - 1) + "\"";
            size_t end = s.find(close, paren + 1);
            if (end != npos) return end + close.size();
        }
    }
    for (size_t j = i + 1; j < s.size(); ++j) {
        if (s[j] == '\\') {
            ++j;
        } else if (s[j] == '"') {
            return j + 1;
        } else if (s[j] == '\n') {
            return j;
        }
    }
    return s.size();
}

// One past the character literal opened at s[i] == '\'', or npos when the
// quote is a digit separator or never closes on the same line.
static size_t end_of_char(const std::string& s, size_t i) {
    size_t k = i;
    while (k > 0 && is_ident_char(s[k - 1])) --k;
    if (k < i && std::isdigit(static_cast<unsigned char>(s[k]))) return npos;

    for (size_t j = i + 1; j < s.size() && j <= i + 12; ++j) {
        if (s[j] == '\n') return npos;
        if (s[j] == '\\') {
            ++j;
        } else if (s[j] == '\'') {
            return j == i + 1 ? npos : j + 1;
        }
    }
    return npos;
}

static size_t end_of_line(const std::string& s, size_t i) {
    size_t nl = s.find('\n', i);
    return nl == npos ? s.size() : nl;
}

static std::string newlines_in(const std::string& s, size_t begin, size_t end) {
    return std::string(static_cast<size_t>(
        std::count(s.begin() + begin, s.begin() + end, '\n')), '\n');
}

// Calls `on` for each line (without its '\n') and rejoins the results.
template<typename F>
static std::string per_line(const std::string& src, F&& on) {
    std::string out;
    out.reserve(src.size());
    size_t start = 0;
    while (true) {
        size_t nl = src.find('\n', start);
        if (nl == npos) {
            out += on(src.substr(start));
            break;
        }
        out += on(src.substr(start, nl - start));
        out.push_back('\n');
        start = nl + 1;
    }
    return out;
}

// ---------------------------------------------------------------------------
// Text passes
// ---------------------------------------------------------------------------

std::string blank_block_comments(const std::string& src) {
    std::string out;
    out.reserve(src.size());
    size_t i = 0;
    while (i < src.size()) {
        char c = src[i];
        size_t end = npos;
        if (c == '"') {
            end = end_of_string(src, i);
        } else if (c == '\'') {
            end = end_of_char(src, i);
        } else if (c == '/' && i + 1 < src.size() && src[i + 1] == '/') {
            end = end_of_line(src, i);
        } else if (c == '/' && i + 1 < src.size() && src[i + 1] == '*') {
            size_t close = src.find("*/", i + 2);
            if (close != npos) {
                out += newlines_in(src, i, close);
                i = close + 2;
                continue;
            }
        }
        if (end == npos) {
            out.push_back(c);
            ++i;
        } else {
            out.append(src, i, end - i);
            i = end;
        }
    }
    return out;
}

std::string blank_string_literals(const std::string& src) {
    std::string out;
    out.reserve(src.size());
    size_t i = 0;
    while (i < src.size()) {
        char c = src[i];
        if (c == '"') {
            size_t end = end_of_string(src, i);
            out += "\"\"";
            out += newlines_in(src, i, end);
            i = end;
            continue;
        }
        size_t end = npos;
        if (c == '\'') {
            end = end_of_char(src, i);
        } else if (c == '/' && i + 1 < src.size() && src[i + 1] == '/') {
            end = end_of_line(src, i);
        }
        if (end == npos) {
            out.push_back(c);
            ++i;
        } else {
            out.append(src, i, end - i);
            i = end;
        }
    }
    return out;
}

std::string blank_char_literals(const std::string& src) {
    std::string out;
    out.reserve(src.size());
    size_t i = 0;
    while (i < src.size()) {
        char c = src[i];
        if (c == '\'') {
            size_t end = end_of_char(src, i);
            if (end != npos) {
                out += "'x'";
                i = end;
                continue;
            }
        }
        size_t end = npos;
        if (c == '"') {
            end = end_of_string(src, i);
        } else if (c == '/' && i + 1 < src.size() && src[i + 1] == '/') {
            end = end_of_line(src, i);
        }
        if (end == npos) {
            out.push_back(c);
            ++i;
        } else {
            out.append(src, i, end - i);
            i = end;
        }
    }
    return out;
}

std::string strip_line_comments(const std::string& src) {
    return per_line(src, [](const std::string& line) {
        size_t pos = line.find("//");
        return pos == npos ? line : line.substr(0, pos);
    });
}

std::string defuse_quoted_brackets(const std::string& src) {
    std::string out = src;
    for (size_t i = 0; i + 2 < out.size(); ++i) {
        if (out[i] == '\'' && out[i + 2] == '\'' && std::strchr("{}<>()", out[i + 1]) &&
            out[i + 1] != '\0') {
            out[i + 1] = 'x';
            i += 2;
        }
    }
    return out;
}

std::string rewrite_left_angle_operators(const std::string& src) {
    return per_line(src, [](const std::string& line) {
        std::string out;
        out.reserve(line.size());
        size_t i = 0;
        while (i < line.size()) {
            if (line[i] == '<' && i + 1 < line.size() &&
                (line[i + 1] == '<' || line[i + 1] == '=')) {
                size_t j = i + 1;
                while (j < line.size() && (line[j] == '<' || line[j] == '=')) ++j;
                out += "++";
                i = j;
                continue;
            }
            out.push_back(line[i]);
            ++i;
        }
        return out;
    });
}

std::string rewrite_isolated_less_than(const std::string& src) {
    return per_line(src, [](const std::string& line) {
        std::string out;
        out.reserve(line.size());
        size_t i = 0;
        while (i < line.size()) {
            if (!is_blank(line[i])) {
                out.push_back(line[i]);
                ++i;
                continue;
            }
            size_t j = i;
            while (j < line.size() && is_blank(line[j])) ++j;
            if (j + 1 < line.size() && line[j] == '<' && is_blank(line[j + 1])) {
                size_t k = j + 1;
                while (k < line.size() && is_blank(line[k])) ++k;
                out += " + ";
                i = k;
            } else {
                out.append(line, i, j - i);
                i = j;
            }
        }
        return out;
    });
}

std::string sanitize_source(const std::string& src) {
    std::string text = blank_block_comments(src);
    text = blank_string_literals(text);
    text = blank_char_literals(text);
    text = strip_line_comments(text);
    text = defuse_quoted_brackets(text);
    text = rewrite_left_angle_operators(text);
    return rewrite_isolated_less_than(text);
}

// ---------------------------------------------------------------------------
// Files
// ---------------------------------------------------------------------------

std::string backup_path(const std::string& path) {
    return path + kBackupSuffix;
}

std::string temp_path(const std::string& path) {
    return path + kTempSuffix;
}

static Result<std::string> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return CalltreeError{CalltreeError::IO,
            "cannot open file for reading: " + path + ": " + std::strerror(errno)};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return CalltreeError{CalltreeError::IO, "failed to read file: " + path};
    }
    return Result<std::string>::ok(ss.str());
}

static Status write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return CalltreeError{CalltreeError::IO,
            "cannot open file for writing: " + path + ": " + std::strerror(errno)};
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        return CalltreeError{CalltreeError::IO, "failed to write file: " + path};
    }
    return ok_status();
}

Status sanitize_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return ok_status();

    auto content = read_file(path);
    if (content.is_err()) return std::move(content).error();
    const std::string& original = content.value();
    if (original.find('\0') != npos) {
        calltree::log::debug("skipping binary file: %s", path.c_str());
        return ok_status();
    }

    std::string saved = backup_path(path);
    fs::rename(path, saved, ec);
    if (ec) {
        return CalltreeError{CalltreeError::IO,
            "cannot back up " + path + ": " + ec.message()};
    }
    CALLTREE_TRY(write_file(path, original));
    if (original.empty()) return ok_status();

    std::string tmp = temp_path(path);
    CALLTREE_TRY(write_file(tmp, sanitize_source(original)));
    fs::rename(tmp, path, ec);
    if (ec) {
        return CalltreeError{CalltreeError::IO,
            "cannot replace " + path + " with sanitized text: " + ec.message()};
    }
    calltree::log::trace("sanitized %s", path.c_str());
    return ok_status();
}

Status restore_file(const std::string& path) {
    std::error_code ec;
    std::string saved = backup_path(path);
    if (fs::exists(saved, ec)) {
        fs::rename(saved, path, ec);
        if (ec) {
            return CalltreeError{CalltreeError::IO,
                "cannot restore " + path + " from " + saved + ": " + ec.message()};
        }
    }
    fs::remove(temp_path(path), ec);
    if (ec) {
        return CalltreeError{CalltreeError::IO,
            "cannot remove " + temp_path(path) + ": " + ec.message()};
    }
    return ok_status();
}

std::vector<std::vector<std::string>> group_files(
    const std::vector<std::string>& files, size_t num_groups)
{
    std::vector<std::vector<std::string>> groups;
    if (files.empty() || num_groups == 0) return groups;
    groups.resize(std::min(num_groups, files.size()));
    for (size_t i = 0; i < files.size(); ++i) {
        groups[i % groups.size()].push_back(files[i]);
    }
    return groups;
}

// ---------------------------------------------------------------------------
// Signal-time restoration
// ---------------------------------------------------------------------------

namespace {

constexpr int kTerminationSignals[] = {SIGINT, SIGTERM, SIGQUIT, SIGHUP, SIGABRT};
constexpr size_t kNumSignals = sizeof(kTerminationSignals) / sizeof(kTerminationSignals[0]);

// Read from the signal handler: prepared before the handler is installed and
// only touched through async-signal-safe calls there.
struct RestorePlan {
    const std::vector<std::string>* originals = nullptr;
    const std::vector<std::string>* backups = nullptr;
    const std::vector<std::string>* temps = nullptr;
};

RestorePlan g_plan;
std::vector<pid_t> g_workers;
volatile sig_atomic_t g_num_workers = 0;
struct sigaction g_previous[kNumSignals];

extern "C" void restore_on_signal(int) {
    for (int sig : kTerminationSignals) signal(sig, SIG_DFL);

    for (sig_atomic_t i = 0; i < g_num_workers; ++i) {
        pid_t pid = g_workers[static_cast<size_t>(i)];
        if (pid > 0) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
        }
    }

    if (g_plan.originals) {
        for (size_t i = 0; i < g_plan.originals->size(); ++i) {
            rename((*g_plan.backups)[i].c_str(), (*g_plan.originals)[i].c_str());
            unlink((*g_plan.temps)[i].c_str());
        }
    }

    static const char msg[] = "calltree: abnormal exit, source files restored\n";
    ssize_t n = write(STDERR_FILENO, msg, sizeof(msg) - 1);
    (void)n;
    _exit(0);
}

void install_handlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = restore_on_signal;
    sigfillset(&sa.sa_mask);
    for (size_t i = 0; i < kNumSignals; ++i) {
        sigaction(kTerminationSignals[i], &sa, &g_previous[i]);
    }
}

void uninstall_handlers() {
    for (size_t i = 0; i < kNumSignals; ++i) {
        sigaction(kTerminationSignals[i], &g_previous[i], nullptr);
    }
}

void reset_handlers_to_default() {
    for (int sig : kTerminationSignals) signal(sig, SIG_DFL);
}

sigset_t termination_mask() {
    sigset_t mask;
    sigemptyset(&mask);
    for (int sig : kTerminationSignals) sigaddset(&mask, sig);
    return mask;
}

int wait_for(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

} // namespace

Status sanitize_files(const std::vector<std::string>& files, int workers) {
    if (workers < 1) {
        return CalltreeError{CalltreeError::InvalidArg,
            "sanitizer worker count must be at least 1, got " + std::to_string(workers)};
    }
    auto groups = group_files(files, static_cast<size_t>(workers));
    if (groups.empty()) return ok_status();

    calltree::log::info("sanitizing %zu files with %zu workers",
                        files.size(), groups.size());

    g_workers.assign(groups.size(), 0);
    g_num_workers = static_cast<sig_atomic_t>(groups.size());

    // Block termination signals across fork so every spawned pid is recorded
    // before the handler can run.
    sigset_t mask = termination_mask();
    sigset_t old_mask;
    sigprocmask(SIG_BLOCK, &mask, &old_mask);

    size_t spawned = 0;
    std::string spawn_error;
    for (; spawned < groups.size(); ++spawned) {
        pid_t pid = fork();
        if (pid < 0) {
            spawn_error = std::strerror(errno);
            break;
        }
        if (pid == 0) {
            reset_handlers_to_default();
            sigprocmask(SIG_SETMASK, &old_mask, nullptr);
            int rc = 0;
            for (const auto& f : groups[spawned]) {
                auto st = sanitize_file(f);
                if (st.is_err()) {
                    calltree::log::error("%s", st.error().format().c_str());
                    rc = 1;
                    break;
                }
            }
            _exit(rc);
        }
        g_workers[spawned] = pid;
    }
    sigprocmask(SIG_SETMASK, &old_mask, nullptr);

    size_t failed = 0;
    for (size_t i = 0; i < spawned; ++i) {
        if (wait_for(g_workers[i]) != 0) ++failed;
        g_workers[i] = 0;
    }
    g_num_workers = 0;

    if (!spawn_error.empty()) {
        return CalltreeError{CalltreeError::Process,
            "fork() failed while spawning sanitizer workers: " + spawn_error};
    }
    if (failed > 0) {
        return CalltreeError{CalltreeError::Process,
            std::to_string(failed) + " sanitizer worker(s) failed",
            "see the errors logged above"};
    }
    return ok_status();
}

Result<size_t> recover_interrupted_run(const std::string& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return CalltreeError{CalltreeError::IO,
            "cannot scan for leftovers, not a directory: " + root};
    }

    const std::string backup_suffix = kBackupSuffix;
    const std::string temp_suffix = kTempSuffix;
    auto ends_with = [](const std::string& s, const std::string& suffix) {
        return s.size() > suffix.size() &&
               s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    };

    std::vector<std::string> backups;
    std::vector<std::string> temps;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return CalltreeError{CalltreeError::IO,
            "cannot scan " + root + ": " + ec.message()};
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return CalltreeError{CalltreeError::IO,
                "error scanning " + root + ": " + ec.message()};
        }
        std::string name = it->path().filename().string();
        if (it->is_directory(ec)) {
            if (!name.empty() && name[0] == '.') it.disable_recursion_pending();
            continue;
        }
        if (ends_with(name, backup_suffix)) {
            backups.push_back(it->path().string());
        } else if (ends_with(name, temp_suffix)) {
            temps.push_back(it->path().string());
        }
    }

    for (const auto& saved : backups) {
        std::string original = saved.substr(0, saved.size() - backup_suffix.size());
        fs::rename(saved, original, ec);
        if (ec) {
            return CalltreeError{CalltreeError::IO,
                "cannot restore " + original + ": " + ec.message()};
        }
        calltree::log::warn("restored %s left over from an interrupted run", original.c_str());
    }
    for (const auto& tmp : temps) {
        fs::remove(tmp, ec);
        if (ec) {
            return CalltreeError{CalltreeError::IO,
                "cannot remove " + tmp + ": " + ec.message()};
        }
    }
    return Result<size_t>::ok(backups.size());
}

// ---------------------------------------------------------------------------
// SanitizeSession
// ---------------------------------------------------------------------------

SanitizeSession::SanitizeSession(std::vector<std::string> files)
    : files_(std::move(files)) {
    backups_.reserve(files_.size());
    temps_.reserve(files_.size());
    for (const auto& f : files_) {
        backups_.push_back(backup_path(f));
        temps_.push_back(temp_path(f));
    }
}

SanitizeSession::~SanitizeSession() {
    if (!active_) return;
    auto st = restore();
    if (st.is_err()) {
        calltree::log::error("%s", st.error().format().c_str());
    }
}

Status SanitizeSession::sanitize(int workers) {
    if (active_ || g_plan.originals) {
        return CalltreeError{CalltreeError::InvalidArg,
            "a sanitize session is already active"};
    }

    g_plan.originals = &files_;
    g_plan.backups = &backups_;
    g_plan.temps = &temps_;
    install_handlers();
    active_ = true;

    return sanitize_files(files_, workers);
}

Status SanitizeSession::restore() {
    if (!active_) return ok_status();

    // Termination signals wait until every file is back. One that arrived
    // meanwhile is delivered to the handler on unblock and exits with 0.
    sigset_t mask = termination_mask();
    sigset_t old_mask;
    sigprocmask(SIG_BLOCK, &mask, &old_mask);

    std::optional<CalltreeError> first_error;
    for (const auto& f : files_) {
        auto st = restore_file(f);
        if (st.is_err() && !first_error) first_error = std::move(st).error();
    }

    g_plan = RestorePlan{};
    active_ = false;
    sigprocmask(SIG_SETMASK, &old_mask, nullptr);
    uninstall_handlers();

    if (first_error) return *first_error;

    calltree::log::debug("restored %zu files", files_.size());
    return ok_status();
}

} // namespace calltree
