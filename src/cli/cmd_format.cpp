//! # Format Command
//!
//! This file implements the command behind `schemat [--check] [patterns]`.
//!
//! ## Process
//!
//! 1. Discover files from the patterns (see `discovery.cpp`)
//! 2. Run one independent pipeline per file on a worker pool
//! 3. Report per-file results on stderr in input order
//! 4. Print a summary and return 1 if any file failed
//!
//! ## Report Lines
//!
//! | Line                       | When                                   |
//! |----------------------------|----------------------------------------|
//! | `FAIL\t<path>`             | Check mode, file is not formatted      |
//! | `OK\t<path>`               | Check mode, `--verbose`, file passes   |
//! | `FORMAT\t<path>`           | Format mode, `--verbose`               |
//! | `ERROR\t<path>\t<message>` | Read, parse or write failure           |

#include "schemat/cli/cmd_format.hpp"

#include "schemat/cli/discovery.hpp"
#include "schemat/lexer/source.hpp"
#include "schemat/log/log.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <iostream>
#include <iterator>
#include <thread>

namespace schemat::cli {

namespace {

constexpr const char* RESET = "\033[0m";
constexpr const char* RED = "\033[31m";
constexpr const char* GREEN = "\033[32m";
constexpr const char* YELLOW = "\033[33m";
constexpr const char* BLUE = "\033[34m";

auto colored(const char* label, const char* color, bool colors) -> std::string {
    if (!colors) {
        return label;
    }
    return std::string(color) + label + RESET;
}

auto write_file(const std::string& path, const std::string& content) -> bool {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    out << content;
    out.close();
    return !out.fail();
}

} // anonymous namespace

// ============================================================================
// Single File
// ============================================================================

auto process_file(const std::string& path, const format::Formatter& formatter, bool check)
    -> FileResult {
    auto source_result = lexer::Source::from_file(path);
    if (is_err(source_result)) {
        return FileResult{.path = path, .status = FileStatus::Error,
                          .message = unwrap_err(source_result)};
    }
    const auto& source = unwrap(source_result);

    auto formatted = formatter.format(source);
    if (is_err(formatted)) {
        return FileResult{.path = path, .status = FileStatus::Error,
                          .message = unwrap_err(formatted).render(source)};
    }

    const auto& text = unwrap(formatted);
    if (text == source.content()) {
        return FileResult{.path = path, .status = FileStatus::Unchanged, .message = {}};
    }

    if (check) {
        SCHEMAT_LOG_INFO("cli", path << " would be reformatted");
        return FileResult{.path = path, .status = FileStatus::NotFormatted, .message = {}};
    }

    if (!write_file(path, text)) {
        return FileResult{.path = path, .status = FileStatus::Error,
                          .message = "cannot write file"};
    }

    SCHEMAT_LOG_INFO("cli", "Formatted " << path);
    return FileResult{.path = path, .status = FileStatus::Formatted, .message = {}};
}

// ============================================================================
// Worker Pool
// ============================================================================

auto process_files(const std::vector<std::string>& paths, const format::Formatter& formatter,
                   bool check, unsigned int num_threads) -> std::vector<FileResult> {
    std::vector<FileResult> results(paths.size());
    if (paths.empty()) {
        return results;
    }

    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0)
            num_threads = 4;
    }
    num_threads = std::min<unsigned int>(num_threads, static_cast<unsigned int>(paths.size()));

    // Each slot of `results` is written by exactly one worker.
    std::atomic<size_t> current_index{0};

    auto worker = [&]() {
        while (true) {
            size_t index = current_index.fetch_add(1);
            if (index >= paths.size()) {
                break;
            }
            results[index] = process_file(paths[index], formatter, check);
        }
    };

    SCHEMAT_LOG_DEBUG("cli", "Processing " << paths.size() << " file(s) on " << num_threads
                                           << " thread(s)");

    std::vector<std::thread> workers;
    for (unsigned int i = 0; i < num_threads; ++i) {
        workers.emplace_back(worker);
    }

    for (auto& thread : workers) {
        thread.join();
    }

    return results;
}

// ============================================================================
// Reporting
// ============================================================================

auto report_line(const FileResult& result, bool check, bool verbose, bool colors)
    -> std::string {
    switch (result.status) {
    case FileStatus::NotFormatted:
        return colored("FAIL", YELLOW, colors) + "\t" + result.path;
    case FileStatus::Error:
        return colored("ERROR", RED, colors) + "\t" + result.path + "\t" + result.message;
    case FileStatus::Unchanged:
        if (verbose) {
            return check ? colored("OK", GREEN, colors) + "\t" + result.path
                         : colored("FORMAT", BLUE, colors) + "\t" + result.path;
        }
        return {};
    case FileStatus::Formatted:
        if (verbose) {
            return colored("FORMAT", BLUE, colors) + "\t" + result.path;
        }
        return {};
    }
    return {};
}

// ============================================================================
// Entry Points
// ============================================================================

auto summary_line(size_t failed, size_t total, bool check) -> std::string {
    auto line = std::to_string(failed) + " / " + std::to_string(total) + " file(s) failed";
    return check ? line : line + " to format";
}

int run_format_stdin(const format::Formatter& formatter) {
    std::string input{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
    auto source = lexer::Source::from_string(std::move(input));

    auto formatted = formatter.format(source);
    if (is_err(formatted)) {
        std::cerr << unwrap_err(formatted).render(source) << "\n";
        return 1;
    }

    std::cout << unwrap(formatted);
    std::cout.flush();
    if (!std::cout) {
        SCHEMAT_LOG_ERROR("cli", "Cannot write to standard output");
        return 1;
    }
    return 0;
}

int run_format(const CliOptions& options) {
    format::Formatter formatter;

    if (options.patterns.empty()) {
        if (options.check) {
            std::cerr << "cannot check stdin\n";
            return 1;
        }
        return run_format_stdin(formatter);
    }

    auto discovered = discover_files(options.patterns, options.ignore);
    if (is_err(discovered)) {
        std::cerr << unwrap_err(discovered) << "\n";
        return 1;
    }
    const auto& paths = unwrap(discovered);

    auto results = process_files(paths, formatter, options.check);

    bool colors = log::stderr_supports_color();
    size_t failed = 0;
    for (const auto& result : results) {
        bool is_failure =
            result.status == FileStatus::Error || result.status == FileStatus::NotFormatted;
        if (is_failure) {
            ++failed;
        }

        auto line = report_line(result, options.check, options.verbose, colors);
        if (!line.empty()) {
            std::cerr << line << "\n";
        }
    }

    if (failed > 0) {
        std::cerr << summary_line(failed, results.size(), options.check) << "\n";
        return 1;
    }
    return 0;
}

} // namespace schemat::cli
