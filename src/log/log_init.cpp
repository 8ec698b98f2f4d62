//! # Log Initialization from CLI
//!
//! Parses logging-related command-line arguments and the SCHEMAT_LOG
//! environment variable to produce a LogConfig.

#include "schemat/log/log.hpp"

#include <cstdlib>
#include <string>

namespace schemat::log {

namespace {

/// Number of 'v' letters in a `-v`, `-vv`, `-vvv` flag, or 0.
int verbosity_count(std::string_view arg) {
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-') {
        return 0;
    }
    for (size_t j = 1; j < arg.size(); ++j) {
        if (arg[j] != 'v') {
            return 0;
        }
    }
    return static_cast<int>(arg.size() - 1);
}

} // anonymous namespace

bool is_log_option(std::string_view arg) {
    return arg.starts_with("--log-level=") || arg.starts_with("--log-filter=") ||
           arg.starts_with("--log-file=") || arg.starts_with("--log-format=") || arg == "-q" ||
           arg == "--quiet" || verbosity_count(arg) > 1;
}

LogConfig parse_log_options(int argc, char* argv[]) {
    LogConfig config;

    bool has_cli_level = false;
    bool has_cli_filter = false;
    int v_count = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--") {
            break;
        }

        if (arg.starts_with("--log-level=")) {
            config.level = parse_level(arg.substr(12));
            has_cli_level = true;
        } else if (arg.starts_with("--log-filter=")) {
            config.filter_spec = arg.substr(13);
            has_cli_filter = true;
        } else if (arg.starts_with("--log-file=")) {
            config.log_file = arg.substr(11);
        } else if (arg.starts_with("--log-format=")) {
            std::string fmt = arg.substr(13);
            config.format = (fmt == "json" || fmt == "JSON") ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            config.level = LogLevel::Error;
            has_cli_level = true;
        } else if (arg == "--verbose") {
            if (v_count == 0)
                v_count = 1;
        } else if (int count = verbosity_count(arg); count > v_count) {
            v_count = count;
        }
    }

    // -v = Info, -vv = Debug, -vvv = Trace (only without an explicit level)
    if (!has_cli_level && v_count > 0) {
        if (v_count >= 3) {
            config.level = LogLevel::Trace;
        } else if (v_count == 2) {
            config.level = LogLevel::Debug;
        } else {
            config.level = LogLevel::Info;
        }
        has_cli_level = true;
    }

    if (!has_cli_level && !has_cli_filter) {
        const char* env_log = std::getenv("SCHEMAT_LOG");
        std::string env_str = env_log ? env_log : "";
        if (!env_str.empty()) {
            // "format=debug" or "format,cli" is a filter, anything else a level
            if (env_str.find('=') != std::string::npos ||
                env_str.find(',') != std::string::npos) {
                config.filter_spec = env_str;
            } else {
                config.level = parse_level(env_str);
            }
        }
    }

    return config;
}

} // namespace schemat::log
