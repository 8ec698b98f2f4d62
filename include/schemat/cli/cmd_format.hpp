//! # Format Command Interface
//!
//! - `run_format(options)`: Format or check the files named by the options
//! - `run_format_stdin(formatter)`: Format standard input to standard output
//!
//! Both return the process exit status.

#ifndef SCHEMAT_CLI_CMD_FORMAT_HPP
#define SCHEMAT_CLI_CMD_FORMAT_HPP

#include "schemat/cli/options.hpp"
#include "schemat/format/formatter.hpp"

#include <string>
#include <vector>

namespace schemat::cli {

// Outcome of processing one file
enum class FileStatus {
    Unchanged,    // Already canonical (format mode: nothing written)
    Formatted,    // Rewritten in place
    NotFormatted, // Check mode: formatting would change the file
    Error,        // Could not be read, parsed or written
};

struct FileResult {
    std::string path;
    FileStatus status = FileStatus::Unchanged;
    std::string message; // Error description for FileStatus::Error
};

// Formats or checks a single file
[[nodiscard]] auto process_file(const std::string& path, const format::Formatter& formatter,
                                bool check) -> FileResult;

// Processes files on a pool of worker threads.
// Results are returned in the order of `paths`; num_threads == 0 picks one
// thread per hardware thread.
[[nodiscard]] auto process_files(const std::vector<std::string>& paths,
                                 const format::Formatter& formatter, bool check,
                                 unsigned int num_threads = 0) -> std::vector<FileResult>;

// Report line for a result (without newline); empty when nothing is reported
[[nodiscard]] auto report_line(const FileResult& result, bool check, bool verbose, bool colors)
    -> std::string;

// Closing summary when `failed` of `total` files failed
[[nodiscard]] auto summary_line(size_t failed, size_t total, bool check) -> std::string;

int run_format(const CliOptions& options);
int run_format_stdin(const format::Formatter& formatter);

} // namespace schemat::cli

#endif // SCHEMAT_CLI_CMD_FORMAT_HPP
