// calltree: print the call tree of a C/C++ function found in the current
// directory.
//
//     calltree <name_or_pattern> [filter] [direction] [verbose] [depth]
//
// The first run sanitizes and scans every source file and caches the call
// graph next to them; later runs with the same settings reuse the cache.

#include <calltree/cli.hpp>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return calltree::cli_main(args, ".", std::cout, std::cerr);
}
