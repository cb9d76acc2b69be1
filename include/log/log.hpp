//! # Logging
//!
//! Structured, module-tagged logging for the generator:
//! - 6 levels (Trace, Debug, Info, Warn, Error, Fatal) plus Off
//! - per-module filtering (`expand=debug,*=warn`)
//! - console, file, null and fan-out sinks
//! - compile-time elision through `VNC_MIN_LOG_LEVEL`
//!
//! ## Usage
//!
//! ```cpp
//! VNC_LOG_INFO("expand", "Expanding " << path);
//! VNC_LOG_DEBUG("derive", "enum " << name << " has " << count << " variants");
//! ```
//!
//! Nothing is written until a sink is installed, either by `Logger::init`
//! or `Logger::add_sink`.

#ifndef VNC_LOG_HPP
#define VNC_LOG_HPP

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace vnc::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

/// Upper-case name of a level ("TRACE", "DEBUG", ...).
auto level_name(LogLevel level) -> const char*;

/// Parses a level name, ignoring case. Unknown names return `Info` and
/// clear `*ok` when it is given.
auto parse_level(std::string_view s, bool* ok = nullptr) -> LogLevel;

// ============================================================================
// Records and Sinks
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;
    std::string_view module;
    std::string message;
    const char* file;
    int line;
    int64_t timestamp_ms;
};

enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< One object per line
};

/// Destination for log records.
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr, colored when stderr is a terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true, LogFormat format = LogFormat::Text);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool colors_enabled_;
    LogFormat format_;
};

/// Appends to a file. Flushes on Error and above.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, LogFormat format = LogFormat::Text);

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] auto is_open() const -> bool {
        return file_.is_open();
    }

private:
    std::ofstream file_;
    LogFormat format_;
};

/// Discards everything.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Forwards every record to each child sink.
class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void add(std::unique_ptr<LogSink> sink);

    [[nodiscard]] auto size() const -> size_t {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

/// Renders a record as one line of text (no trailing newline).
auto format_text(const LogRecord& record) -> std::string;

/// Renders a record as one JSON object (no trailing newline).
auto format_json(const LogRecord& record) -> std::string;

// ============================================================================
// Log Filter
// ============================================================================

/// Per-module level filter parsed from specs like `"lexer=trace,*=warn"`.
///
/// A module name without `=level` enables everything for that module.
class LogFilter {
public:
    void parse(std::string_view spec);

    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    [[nodiscard]] auto default_level() const -> LogLevel {
        return default_level_;
    }

    /// Lowest level any module accepts; used for the fast-path check.
    [[nodiscard]] auto min_level() const -> LogLevel;

private:
    LogLevel default_level_ = LogLevel::Warn;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec;
    std::string log_file;
    bool console = true;
    bool colors = true;
};

/// Thread-safe global logger.
class Logger {
public:
    /// Replaces sinks, level and filter with the given configuration.
    static void init(const LogConfig& config);

    static auto instance() -> Logger&;

    /// Fast check done by the macros before the message is built.
    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink; messages are dropped until one is added.
    void clear_sinks();

    void set_level(LogLevel level);

    [[nodiscard]] auto level() const -> LogLevel {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger() = default;

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

/// Milliseconds since the epoch.
auto epoch_ms() -> int64_t;

// ============================================================================
// CLI Parsing
// ============================================================================

/// Reads `--log-level=`, `--log-filter=`, `--log-file=`, `--log-format=`,
/// `-v`/`-vv`/`-vvv` and `-q` from argv. Falls back to the `VNC_LOG`
/// environment variable when neither a level nor a filter was given.
auto parse_log_options(int argc, char* argv[]) -> LogConfig;

/// True if `arg` is one of the logging flags handled by `parse_log_options`.
auto is_log_option(std::string_view arg) -> bool;

// ============================================================================
// Macros
// ============================================================================

// 0=Trace .. 6=Off. Calls below this level compile to nothing.
#ifndef VNC_MIN_LOG_LEVEL
#define VNC_MIN_LOG_LEVEL 0
#endif

#define VNC_LOG_IMPL(level, module_str, msg)                                                       \
    do {                                                                                           \
        if (static_cast<int>(level) >= VNC_MIN_LOG_LEVEL) {                                        \
            auto& vnc_logger_ = ::vnc::log::Logger::instance();                                    \
            if (vnc_logger_.should_log(level, module_str)) {                                       \
                std::ostringstream vnc_oss_;                                                       \
                vnc_oss_ << msg;                                                                   \
                vnc_logger_.log(level, module_str, vnc_oss_.str(), __FILE__, __LINE__);            \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define VNC_LOG_TRACE(module, msg) VNC_LOG_IMPL(::vnc::log::LogLevel::Trace, module, msg)
#define VNC_LOG_DEBUG(module, msg) VNC_LOG_IMPL(::vnc::log::LogLevel::Debug, module, msg)
#define VNC_LOG_INFO(module, msg) VNC_LOG_IMPL(::vnc::log::LogLevel::Info, module, msg)
#define VNC_LOG_WARN(module, msg) VNC_LOG_IMPL(::vnc::log::LogLevel::Warn, module, msg)
#define VNC_LOG_ERROR(module, msg) VNC_LOG_IMPL(::vnc::log::LogLevel::Error, module, msg)
#define VNC_LOG_FATAL(module, msg) VNC_LOG_IMPL(::vnc::log::LogLevel::Fatal, module, msg)

} // namespace vnc::log

#endif // VNC_LOG_HPP
