//! # Command-Line Driver
//!
//! ```text
//! schemat_main()
//!   ├─ logging flags   → log::Logger::init()
//!   ├─ --help, -h      → print_usage()
//!   ├─ --version, -V   → print_version()
//!   └─ otherwise       → run_format()
//! ```

#include "schemat/cli/driver.hpp"

#include "schemat/cli/cmd_format.hpp"
#include "schemat/cli/options.hpp"
#include "schemat/log/log.hpp"

#include <iostream>

using namespace schemat;

int schemat_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    auto parsed = cli::parse_cli_options(argc, argv);
    if (is_err(parsed)) {
        std::cerr << "error: " << unwrap_err(parsed) << "\n";
        std::cerr << "Run 'schemat --help' for usage.\n";
        return 2;
    }
    const auto& options = unwrap(parsed);

    if (options.help) {
        cli::print_usage();
        return 0;
    }

    if (options.version) {
        cli::print_version();
        return 0;
    }

    int status = cli::run_format(options);
    log::Logger::instance().flush();
    return status;
}
