#include <calltree/error.hpp>

namespace calltree {

namespace {

// Indexed by CalltreeError::Code.
constexpr const char* kCodeNames[] = {
    "io", "parse", "config", "not-found", "invalid-arg", "search", "process", "corrupt",
};

} // namespace

const char* CalltreeError::code_name(Code c) {
    auto i = static_cast<size_t>(c);
    if (i >= sizeof(kCodeNames) / sizeof(kCodeNames[0])) return "unknown";
    return kCodeNames[i];
}

CalltreeError& CalltreeError::at(std::string f, int l) {
    file = std::move(f);
    line = l;
    return *this;
}

std::string CalltreeError::location() const {
    if (file.empty()) return "";
    if (line <= 0) return file + ": ";
    return file + ":" + std::to_string(line) + ": ";
}

std::string CalltreeError::format() const {
    std::string out = location() + "error[" + code_name(code) + "]: " + message;
    if (!hint.empty()) out += "\n  hint: " + hint;
    return out;
}

} // namespace calltree
