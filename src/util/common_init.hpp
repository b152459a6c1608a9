#pragma once

#include "util/cli_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <thread>

// PARLEY_VERSION is defined in the generated core/version.hpp.
// Callers must include core/version.hpp before using check_version().

namespace parley {

// Print "<cmd_name> <version>" to stderr if --version is present.
// Returns true if --version was handled (caller should return 0).
inline bool check_version(const CliParser& cli, const char* cmd_name) {
    if (cli.has("--version")) {
        std::fprintf(stderr, "%s %s\n", cmd_name, PARLEY_VERSION);
        return true;
    }
    return false;
}

// True if -v / --verbose was given.
inline bool verbose_requested(const CliParser& cli) {
    return cli.has("-v") || cli.has("--verbose");
}

// Resolve a thread count (0 or negative -> hardware_concurrency).
inline int resolve_threads(int n) {
    if (n <= 0) {
        n = static_cast<int>(std::thread::hardware_concurrency());
        if (n <= 0) n = 1;
    }
    return n;
}

} // namespace parley
