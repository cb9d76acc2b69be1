//! # Logger Implementation
//!
//! Sinks, the module filter and the global `Logger`.

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

#include <unistd.h>

namespace vnc::log {

namespace {

auto stderr_is_color_terminal() -> bool {
    if (!isatty(fileno(stderr))) {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) != "dumb";
}

auto level_color(LogLevel level) -> const char* {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m";
    case LogLevel::Debug:
        return "\033[36m";
    case LogLevel::Info:
        return "\033[32m";
    case LogLevel::Warn:
        return "\033[33m";
    case LogLevel::Error:
        return "\033[31m";
    case LogLevel::Fatal:
        return "\033[1;31m";
    case LogLevel::Off:
        break;
    }
    return "";
}

auto wall_clock(int64_t timestamp_ms) -> std::string {
    auto seconds = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm tm_buf{};
    localtime_r(&seconds, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << (timestamp_ms % 1000);
    return oss.str();
}

void append_escaped(std::string& out, std::string_view text) {
    for (char c : text) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out += c;
        }
    }
}

} // namespace

// ============================================================================
// Levels
// ============================================================================

auto level_name(LogLevel level) -> const char* {
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

auto parse_level(std::string_view s, bool* ok) -> LogLevel {
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ok) {
        *ok = true;
    }
    if (lower == "trace")
        return LogLevel::Trace;
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warn" || lower == "warning")
        return LogLevel::Warn;
    if (lower == "error")
        return LogLevel::Error;
    if (lower == "fatal")
        return LogLevel::Fatal;
    if (lower == "off")
        return LogLevel::Off;

    if (ok) {
        *ok = false;
    }
    return LogLevel::Info;
}

auto epoch_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// Formatting
// ============================================================================

auto format_text(const LogRecord& record) -> std::string {
    std::ostringstream oss;
    oss << wall_clock(record.timestamp_ms) << " " << std::left << std::setw(5)
        << level_name(record.level) << " [" << record.module << "] " << record.message;
    return oss.str();
}

auto format_json(const LogRecord& record) -> std::string {
    std::string out = "{\"ts\":" + std::to_string(record.timestamp_ms) + ",\"level\":\"";
    out += level_name(record.level);
    out += "\",\"module\":\"";
    append_escaped(out, record.module);
    out += "\",\"msg\":\"";
    append_escaped(out, record.message);
    out += "\"}";
    return out;
}

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors, LogFormat format)
    : colors_enabled_(use_colors && stderr_is_color_terminal()), format_(format) {}

void ConsoleSink::write(const LogRecord& record) {
    if (format_ == LogFormat::JSON) {
        std::cerr << format_json(record) << "\n";
        return;
    }

    if (!colors_enabled_) {
        std::cerr << format_text(record) << "\n";
        return;
    }

    std::ostringstream oss;
    oss << wall_clock(record.timestamp_ms) << " " << level_color(record.level) << std::left
        << std::setw(5) << level_name(record.level) << "\033[0m"
        << " [" << record.module << "] " << record.message << "\n";
    std::cerr << oss.str();
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

FileSink::FileSink(const std::string& path, LogFormat format)
    : file_(path, std::ios::out | std::ios::app), format_(format) {}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open()) {
        return;
    }

    file_ << (format_ == LogFormat::JSON ? format_json(record) : format_text(record)) << "\n";

    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

void MultiSink::write(const LogRecord& record) {
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void MultiSink::flush() {
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

void MultiSink::add(std::unique_ptr<LogSink> sink) {
    sinks_.push_back(std::move(sink));
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

    size_t pos = 0;
    while (pos <= spec.size()) {
        size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }

        auto entry = spec.substr(pos, comma - pos);
        size_t eq = entry.find('=');

        if (eq != std::string_view::npos) {
            auto module = entry.substr(0, eq);
            auto level = parse_level(entry.substr(eq + 1));
            if (module == "*") {
                default_level_ = level;
            } else {
                module_levels_[std::string(module)] = level;
            }
        } else if (!entry.empty()) {
            module_levels_[std::string(entry)] = LogLevel::Trace;
        }

        pos = comma + 1;
    }
}

auto LogFilter::should_log(LogLevel level, std::string_view module) const -> bool {
    auto it = module_levels_.find(std::string(module));
    if (it != module_levels_.end()) {
        return level >= it->second;
    }
    return level >= default_level_;
}

auto LogFilter::min_level() const -> LogLevel {
    LogLevel min = default_level_;
    for (const auto& [_, level] : module_levels_) {
        min = std::min(min, level);
    }
    return min;
}

// ============================================================================
// Logger
// ============================================================================

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.sinks_.clear();
    logger.filter_ = LogFilter{};
    logger.filter_.set_default_level(config.level);
    logger.level_ = config.level;

    if (!config.filter_spec.empty()) {
        logger.filter_.parse(config.filter_spec);
        // A spec without "*=level" keeps the CLI level as the default
        if (config.level < logger.filter_.default_level()) {
            logger.filter_.set_default_level(config.level);
        }
        logger.level_ = logger.filter_.min_level();
    }

    if (config.console) {
        logger.sinks_.push_back(std::make_unique<ConsoleSink>(config.colors, config.format));
    }

    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file, config.format);
        if (file->is_open()) {
            logger.sinks_.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }
}

auto Logger::should_log(LogLevel level, std::string_view module) const -> bool {
    if (level < level_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.should_log(level, module);
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

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    filter_.set_default_level(level);
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    level_ = std::min(level_, filter_.min_level());
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace vnc::log
