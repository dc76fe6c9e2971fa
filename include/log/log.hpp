//! # deadprop Logging
//!
//! A small structured logger shared by every deadprop component:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-component filtering
//! - Console, file and null sinks
//! - Thread-safe dispatch
//! - Compile-time level elision via DEADPROP_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! DEADPROP_LOG_DEBUG("lint", "Entering script " << source_name);
//! DEADPROP_LOG_WARN("config", "Unknown key '" << key << "'");
//! ```
//!
//! ## Module Tags
//!
//! | Tag      | Component                          |
//! |----------|------------------------------------|
//! | `pass`   | Pass manager and compiler context  |
//! | `lint`   | Lint checks                        |
//! | `config` | Option loading                     |
//! | `diag`   | Error managers                     |

#ifndef DEADPROP_LOG_HPP
#define DEADPROP_LOG_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace deadprop::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Debugging information
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Potential issues
    Error = 4, ///< Recoverable errors
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the string name for a log level (e.g., "TRACE", "DEBUG").
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

/// Parses a log level from a string (lower or upper case).
/// Returns LogLevel::Info if the string is not recognized.
LogLevel parse_level(std::string_view s);

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "lint", "pass")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text with optional ANSI colors
    JSON  ///< One JSON object per line
};

/// Writes `record` to `out` in the given format, terminated by a newline.
/// `color` is an ANSI prefix applied to the level name in text mode (may be empty).
void write_record(std::ostream& out, const LogRecord& record, LogFormat format,
                  const char* color = "");

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    /// Write a log record to the sink.
    virtual void write(const LogRecord& record) = 0;

    /// Flush any buffered output.
    virtual void flush() = 0;
};

/// Console sink that writes to stderr with optional ANSI colors.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

    bool colors_enabled() const {
        return colors_enabled_;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// File sink. Flushes after Error and Fatal records.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

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

/// Null sink that discards all messages.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses filter strings like "lint=trace,config=debug,*=warn".
class LogFilter {
public:
    LogFilter() = default;

    /// Parse a filter specification. A bare module name enables Trace for it.
    void parse(std::string_view spec);

    /// Check if a message at `level` from `module` passes the filter.
    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level any module (or the default) accepts.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum log level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Path to log file (empty = no file)
    bool console = true;                ///< Enable console (stderr) output
    bool colors = true;                 ///< Enable ANSI colors on console
};

/// Builds a LogConfig from the DEADPROP_LOG environment variable.
///
/// The variable holds either a level name ("debug") or a filter
/// specification ("lint=trace,*=warn"). Unset means Warn.
LogConfig log_config_from_env();

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
///
/// Auto-initializes with a Warn-level console sink on first use unless
/// `Logger::init()` ran before.
class Logger {
public:
    /// (Re)initialize the global logger, replacing all sinks.
    static void init(const LogConfig& config);

    /// Get the global logger instance.
    static Logger& instance();

    /// Fast-path check used by the macros before formatting a message.
    bool should_log(LogLevel level, std::string_view module) const;

    /// Log a message at the given level from the given module.
    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    /// Add a sink to the logger.
    void add_sink(std::unique_ptr<LogSink> sink);

    /// Remove all sinks.
    void clear_sinks();

    /// Set the global minimum log level.
    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    /// Set the module filter from a filter specification string.
    void set_filter(std::string_view spec);

    /// Flush all sinks.
    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Timestamp Helpers
// ============================================================================

/// Returns current time formatted as "HH:MM:SS.mmm".
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &now_c);
#else
    localtime_r(&now_c, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << now_ms.count();
    return oss.str();
}

/// Returns milliseconds since epoch (for LogRecord timestamps).
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// Logging Macros
// ============================================================================

// Compile-time minimum log level gate.
// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef DEADPROP_MIN_LOG_LEVEL
#define DEADPROP_MIN_LOG_LEVEL 0
#endif

/// Internal macro - do not use directly.
#define DEADPROP_LOG_IMPL(level, module_str, msg)                                                  \
    do {                                                                                           \
        if (static_cast<int>(level) >= DEADPROP_MIN_LOG_LEVEL) {                                   \
            auto& logger_ = ::deadprop::log::Logger::instance();                                   \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Log a trace-level message.
/// Usage: DEADPROP_LOG_TRACE("module", "message " << value);
#define DEADPROP_LOG_TRACE(module, msg) DEADPROP_LOG_IMPL(::deadprop::log::LogLevel::Trace, module, msg)

/// Log a debug-level message.
#define DEADPROP_LOG_DEBUG(module, msg) DEADPROP_LOG_IMPL(::deadprop::log::LogLevel::Debug, module, msg)

/// Log an info-level message.
#define DEADPROP_LOG_INFO(module, msg) DEADPROP_LOG_IMPL(::deadprop::log::LogLevel::Info, module, msg)

/// Log a warning-level message.
#define DEADPROP_LOG_WARN(module, msg) DEADPROP_LOG_IMPL(::deadprop::log::LogLevel::Warn, module, msg)

/// Log an error-level message.
#define DEADPROP_LOG_ERROR(module, msg) DEADPROP_LOG_IMPL(::deadprop::log::LogLevel::Error, module, msg)

/// Log a fatal-level message.
#define DEADPROP_LOG_FATAL(module, msg) DEADPROP_LOG_IMPL(::deadprop::log::LogLevel::Fatal, module, msg)

} // namespace deadprop::log

#endif // DEADPROP_LOG_HPP
