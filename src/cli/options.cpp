#include "schemat/cli/options.hpp"

#include "schemat/log/log.hpp"

#include <iostream>

namespace schemat::cli {

auto parse_cli_options(int argc, char* argv[]) -> Result<CliOptions, std::string> {
    CliOptions options;
    bool only_patterns = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (only_patterns) {
            options.patterns.push_back(arg);
        } else if (arg == "--") {
            only_patterns = true;
        } else if (arg == "-c" || arg == "--check") {
            options.check = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "-V" || arg == "--version") {
            options.version = true;
        } else if (arg == "-i" || arg == "--ignore") {
            if (i + 1 >= argc) {
                return "option " + arg + " requires a pattern";
            }
            options.ignore.push_back(argv[++i]);
        } else if (arg.starts_with("--ignore=")) {
            options.ignore.push_back(arg.substr(9));
        } else if (log::is_log_option(arg)) {
            // Consumed by log::parse_log_options()
        } else if (arg.size() > 1 && arg[0] == '-') {
            return "unknown option: " + arg;
        } else {
            options.patterns.push_back(arg);
        }
    }

    return options;
}

void print_usage() {
    std::cout << "schemat " << VERSION << " - S-expression formatter\n\n";
    std::cout << "Usage: schemat [options] [patterns...]\n\n";
    std::cout << "With no patterns, formats standard input to standard output.\n";
    std::cout << "Directories are searched recursively for Scheme and Lisp sources.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --check            Check that files are formatted, change nothing\n";
    std::cout << "  -i, --ignore <glob>    Skip paths matching <glob> (repeatable)\n";
    std::cout << "  -v, --verbose          Report every file, not only failures\n";
    std::cout << "  -h, --help             Show this help\n";
    std::cout << "  -V, --version          Show version\n\n";
    std::cout << "Logging:\n";
    std::cout << "  --log-level=<level>    trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>    Per-module levels, e.g. format=debug,*=warn\n";
    std::cout << "  --log-file=<path>      Also write log records to <path>\n";
    std::cout << "  --log-format=<fmt>     text or json\n";
    std::cout << "  -q, --quiet            Only log errors\n";
    std::cout << "  -vv, -vvv              Debug or trace logging\n\n";
    std::cout << "Environment:\n";
    std::cout << "  SCHEMAT_LOG            Level or filter when no logging flag is given\n";
}

void print_version() {
    std::cout << "schemat " << VERSION << "\n";
}

} // namespace schemat::cli
