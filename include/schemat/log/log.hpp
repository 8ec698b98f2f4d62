//! # Formatter Logging
//!
//! Diagnostics for the formatter and its command-line front end. Every record
//! carries a level and a module tag (`"format"` or `"cli"`); `LogFilter` picks
//! a level per tag. Records go to stderr and optionally a file, never to
//! standard output, which carries formatted text. Worker threads log through
//! the same mutex-guarded `Logger`. Levels below `SCHEMAT_MIN_LOG_LEVEL` are
//! compiled out.
//!
//! ## Usage
//!
//! ```cpp
//! SCHEMAT_LOG_DEBUG("format", "Parsed " << nodes << " top-level nodes");
//! SCHEMAT_LOG_INFO("cli", "Rewrote " << path);
//! ```

#ifndef SCHEMAT_LOG_LOG_HPP
#define SCHEMAT_LOG_LOG_HPP

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace schemat::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Severity, lowest first.
enum class LogLevel : int {
    Trace = 0, ///< Per-token and per-node tracing
    Debug = 1, ///< Pipeline stage summaries
    Info = 2,  ///< Per-file progress
    Warn = 3,  ///< Suspicious but tolerated input
    Error = 4, ///< A file could not be processed
    Fatal = 5, ///< The run cannot continue
    Off = 6    ///< Disables all logging
};

/// Upper-case level name as printed in text records.
inline const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

/// Level for a lower- or upper-case name; unknown names give Info.
inline LogLevel parse_level(std::string_view s) {
    if (s == "trace" || s == "TRACE")
        return LogLevel::Trace;
    if (s == "debug" || s == "DEBUG")
        return LogLevel::Debug;
    if (s == "info" || s == "INFO")
        return LogLevel::Info;
    if (s == "warn" || s == "WARN")
        return LogLevel::Warn;
    if (s == "error" || s == "ERROR")
        return LogLevel::Error;
    if (s == "fatal" || s == "FATAL")
        return LogLevel::Fatal;
    if (s == "off" || s == "OFF")
        return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Log Record
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view module;
    std::string message;
    const char* file;
    int line;
    int64_t timestamp_ms; ///< Since the Unix epoch
};

enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< One JSON object per line
};

/// Renders a record as one line (without the trailing newline).
/// `colors` wraps the level name in an ANSI color and only applies to text.
std::string format_record(const LogRecord& record, LogFormat format, bool colors = false);

/// True if stderr is a color-capable terminal and NO_COLOR is unset. Used by
/// the console sink and by the per-file report lines.
bool stderr_supports_color();

// ============================================================================
// Log Sinks
// ============================================================================

/// Destination for records. Called with the logger's mutex held.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes one line per record to stderr.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// Appends one line per record to a file (`--log-file`), flushing after
/// errors.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path);

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

// ============================================================================
// Log Filter
// ============================================================================

/// Per-module levels from a spec such as `"format=trace,*=warn"`.
class LogFilter {
public:
    LogFilter() = default;

    /// Replaces the module levels. `*=level` sets the default; a module named
    /// without `=level` logs everything.
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level accepted by any module or by the default.
    LogLevel min_level() const {
        LogLevel min = default_level_;
        for (const auto& [_, level] : module_levels_) {
            if (level < min)
                min = level;
        }
        return min;
    }

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< `LogFilter::parse` syntax
    std::string log_file;    ///< Empty for no file sink
    bool console = true;
    bool colors = true;
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Process-wide logger. It has no sinks until `init()`, so code that never
/// configures logging prints nothing.
class Logger {
public:
    /// Replaces the sinks, level and filter.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Checked by the macros before the message is built.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// CLI Parsing
// ============================================================================

/// Reads `--log-level=`, `--log-filter=`, `--log-file=`, `--log-format=`,
/// `-v`/`-vv`/`-vvv` and `-q` from argv. Without a level or filter there,
/// SCHEMAT_LOG is used: a spec containing '=' or ',' is a filter, anything
/// else a level.
LogConfig parse_log_options(int argc, char* argv[]);

/// True for arguments only `parse_log_options()` uses. `-v` is not one: it is
/// also the command's verbose flag.
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// 0 = Trace up to 6 = Off, as in LogLevel
#ifndef SCHEMAT_MIN_LOG_LEVEL
#define SCHEMAT_MIN_LOG_LEVEL 0
#endif

// Builds the message only when some sink will take it.
#define SCHEMAT_LOG_IMPL(level, module_str, msg)                                                   \
    do {                                                                                           \
        if (static_cast<int>(level) >= SCHEMAT_MIN_LOG_LEVEL) {                                    \
            auto& logger_ = ::schemat::log::Logger::instance();                                    \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Usage: `SCHEMAT_LOG_TRACE("format", "tokens: " << count);`
#define SCHEMAT_LOG_TRACE(module, msg) SCHEMAT_LOG_IMPL(::schemat::log::LogLevel::Trace, module, msg)

#define SCHEMAT_LOG_DEBUG(module, msg) SCHEMAT_LOG_IMPL(::schemat::log::LogLevel::Debug, module, msg)

#define SCHEMAT_LOG_INFO(module, msg) SCHEMAT_LOG_IMPL(::schemat::log::LogLevel::Info, module, msg)

#define SCHEMAT_LOG_WARN(module, msg) SCHEMAT_LOG_IMPL(::schemat::log::LogLevel::Warn, module, msg)

#define SCHEMAT_LOG_ERROR(module, msg) SCHEMAT_LOG_IMPL(::schemat::log::LogLevel::Error, module, msg)

} // namespace schemat::log

#endif // SCHEMAT_LOG_LOG_HPP
