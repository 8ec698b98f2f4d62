//! # Logger
//!
//! Record formatting, the two sinks, module filtering and the process-wide
//! `Logger`.

#include "schemat/log/log.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <unistd.h>

namespace schemat::log {

// ============================================================================
// Terminal Color Detection
// ============================================================================

bool stderr_supports_color() {
    if (!isatty(fileno(stderr)))
        return false;

    if (std::getenv("NO_COLOR") != nullptr)
        return false;

    const char* term = std::getenv("TERM");
    if (!term)
        return false;

    return std::string_view(term) != "dumb";
}

// ============================================================================
// Record Formatting
// ============================================================================

namespace {

/// Local wall-clock time as `HH:MM:SS.mmm`.
std::string clock_time() {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count();
    return oss.str();
}

int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

const char* level_color(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m"; // Dark gray
    case LogLevel::Debug:
        return "\033[36m"; // Cyan
    case LogLevel::Info:
        return "\033[32m"; // Green
    case LogLevel::Warn:
        return "\033[33m"; // Yellow
    case LogLevel::Error:
        return "\033[31m"; // Red
    case LogLevel::Fatal:
        return "\033[1;31m"; // Bold red
    case LogLevel::Off:
        return "";
    }
    return "";
}

void append_json_escaped(std::ostringstream& oss, std::string_view text) {
    for (char c : text) {
        switch (c) {
        case '"':
            oss << "\\\"";
            break;
        case '\\':
            oss << "\\\\";
            break;
        case '\n':
            oss << "\\n";
            break;
        case '\r':
            oss << "\\r";
            break;
        case '\t':
            oss << "\\t";
            break;
        default:
            oss << c;
        }
    }
}

} // anonymous namespace

std::string format_record(const LogRecord& record, LogFormat format, bool colors) {
    std::ostringstream oss;

    if (format == LogFormat::JSON) {
        oss << "{\"ts\":" << record.timestamp_ms << ","
            << "\"level\":\"" << level_name(record.level) << "\","
            << "\"module\":\"" << record.module << "\","
            << "\"msg\":\"";
        append_json_escaped(oss, record.message);
        oss << "\"}";
        return oss.str();
    }

    oss << clock_time() << " ";
    if (colors) {
        oss << level_color(record.level);
    }
    oss << std::left << std::setw(5) << level_name(record.level);
    if (colors) {
        oss << "\033[0m";
    }
    oss << " [" << record.module << "] " << record.message;
    return oss.str();
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors)
    : colors_enabled_(use_colors && stderr_supports_color()) {}

void ConsoleSink::write(const LogRecord& record) {
    // One insertion per record so concurrent writers never interleave a line.
    std::cerr << format_record(record, format_, colors_enabled_) + "\n";
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path) : file_(path, std::ios::out | std::ios::app) {}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open())
        return;

    file_ << format_record(record, format_) << "\n";

    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

    size_t pos = 0;
    while (pos < spec.size()) {
        size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }

        auto token = spec.substr(pos, comma - pos);
        size_t eq = token.find('=');

        if (eq != std::string_view::npos) {
            auto mod = token.substr(0, eq);
            auto lvl = token.substr(eq + 1);
            if (mod == "*") {
                default_level_ = parse_level(lvl);
            } else {
                module_levels_[std::string(mod)] = parse_level(lvl);
            }
        } else if (!token.empty()) {
            module_levels_[std::string(token)] = LogLevel::Trace;
        }

        pos = comma + 1;
    }
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    auto it = module_levels_.find(std::string(module));
    if (it != module_levels_.end()) {
        return level >= it->second;
    }
    return level >= default_level_;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() = default;

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.sinks_.clear();
    logger.level_ = config.level;

    if (!config.filter_spec.empty()) {
        logger.filter_.parse(config.filter_spec);
        // Without a "*=level" entry the command-line level is the default.
        if (config.level < logger.filter_.default_level()) {
            logger.filter_.set_default_level(config.level);
        }
        // Per-module overrides may be more verbose than the global level.
        logger.level_ = logger.filter_.min_level();
    } else {
        logger.filter_.set_default_level(config.level);
    }

    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        logger.sinks_.push_back(std::move(console));
    }

    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        file->set_format(config.format);
        if (file->is_open()) {
            logger.sinks_.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    if (level < level_)
        return false;

    std::lock_guard<std::mutex> lock(mutex_);
    return !sinks_.empty() && filter_.should_log(level, module);
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    LogRecord record{.level = level,
                     .module = module,
                     .message = message,
                     .file = file,
                     .line = line,
                     .timestamp_ms = epoch_ms()};

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace schemat::log
