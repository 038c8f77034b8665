#pragma once

#include <string>

namespace calltree {

struct CalltreeError {
    enum Code {
        IO,
        Parse,
        Config,
        NotFound,
        InvalidArg,
        Search,
        Process,
        Corrupt
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    CalltreeError() = default;
    CalltreeError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    CalltreeError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    CalltreeError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Attach the file (and line, when known) the error is about.
    CalltreeError& at(std::string f, int l = 0);

    // "path:line: " when a file is attached, empty otherwise.
    std::string location() const;

    // "<location>error[<code>]: message", then an indented hint line.
    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace calltree
