//! # Command-Line Options
//!
//! ```bash
//! schemat                       # Format stdin to stdout
//! schemat 'src/**/*.scm'        # Format matching files in place
//! schemat -c src/               # Check every S-expression file under src/
//! schemat -c -i 'vendor/*' .    # Check, skipping vendor/
//! ```
//!
//! Logging flags (`--log-level=`, `-q`, `-vv`...) are accepted anywhere and
//! handled by `log::parse_log_options()`.

#ifndef SCHEMAT_CLI_OPTIONS_HPP
#define SCHEMAT_CLI_OPTIONS_HPP

#include "schemat/common.hpp"

#include <string>
#include <vector>

namespace schemat::cli {

struct CliOptions {
    bool check = false;   // Report unformatted files instead of rewriting them
    bool verbose = false; // Also report files that passed
    bool help = false;
    bool version = false;
    std::vector<std::string> ignore;   // Glob patterns of paths to skip
    std::vector<std::string> patterns; // Glob patterns or directories to process
};

// Parses argv into options; the error is a message for the user
[[nodiscard]] auto parse_cli_options(int argc, char* argv[]) -> Result<CliOptions, std::string>;

void print_usage();
void print_version();

} // namespace schemat::cli

#endif // SCHEMAT_CLI_OPTIONS_HPP
