//! # sbcheck Logging
//!
//! Structured, module-tagged logging used by every component:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Per-module filtering (`borrow=trace,interp=debug,*=warn`)
//! - Console (stderr) and file sinks, text or JSON lines
//! - Thread-safe dispatch through a mutex-protected singleton
//! - Compile-time level elision via SBC_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! SBC_LOG_DEBUG("interp", "step " << pc << ": " << describe(op));
//! SBC_LOG_TRACE("borrow", "popped " << tag << " from `" << name << "`");
//! ```
//!
//! ## Modules
//!
//! | Module   | Component                          |
//! |----------|------------------------------------|
//! | `borrow` | Permission engine, memory store    |
//! | `interp` | Trace interpreter                  |
//! | `trace`  | Trace file loading and parsing     |
//! | `cli`    | Command-line driver                |

#ifndef SBC_LOG_HPP
#define SBC_LOG_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sbc::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Per-frame stack mutations
    Debug = 1, ///< Per-instruction execution
    Info = 2,  ///< Per-trace summaries
    Warn = 3,  ///< Suspicious but accepted input
    Error = 4, ///< Failed operations (I/O, malformed traces)
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the upper-case name of a log level (e.g., "TRACE").
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

/// Parses a log level name, either all lower-case or all upper-case.
/// Unrecognized names map to LogLevel::Info.
LogLevel parse_level(std::string_view s);

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "borrow")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Line format of a sink.
enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< `{"ts":..,"level":..,"module":..,"msg":..}`
};

/// Writes one record as a single line in the given format.
/// Shared by every stream-backed sink.
void write_record(std::ostream& out, const LogRecord& record, LogFormat format,
                  const char* level_color = nullptr);

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr, colored by level when the terminal allows it.
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

/// Appends to a file. Flushes eagerly on Error and Fatal.
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

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses filter strings like "borrow=trace,interp=debug,*=warn". A bare
/// module name without "=level" enables Trace for that module.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// The lowest level any module accepts. Used by the logger's fast path.
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

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
///
/// Starts with no sinks, so nothing is printed until `Logger::init()` or
/// `add_sink()` is called. Tests rely on that to stay quiet.
class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before the message is built.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink and restores the default level.
    void reset();

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view spec);

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

/// Returns current local time formatted as "HH:MM:SS.mmm".
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

/// Returns milliseconds since epoch.
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// CLI Parsing
// ============================================================================

/// Parse logging-related CLI options from argv.
/// Extracts: --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv, -q
/// Falls back to the SBC_LOG environment variable.
LogConfig parse_log_options(int argc, char* argv[]);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef SBC_MIN_LOG_LEVEL
#define SBC_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level-specific ones below.
#define SBC_LOG_IMPL(level, module_str, msg)                                                       \
    do {                                                                                           \
        if (static_cast<int>(level) >= SBC_MIN_LOG_LEVEL) {                                        \
            auto& logger_ = ::sbc::log::Logger::instance();                                        \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define SBC_LOG_TRACE(module, msg) SBC_LOG_IMPL(::sbc::log::LogLevel::Trace, module, msg)
#define SBC_LOG_DEBUG(module, msg) SBC_LOG_IMPL(::sbc::log::LogLevel::Debug, module, msg)
#define SBC_LOG_INFO(module, msg) SBC_LOG_IMPL(::sbc::log::LogLevel::Info, module, msg)
#define SBC_LOG_WARN(module, msg) SBC_LOG_IMPL(::sbc::log::LogLevel::Warn, module, msg)
#define SBC_LOG_ERROR(module, msg) SBC_LOG_IMPL(::sbc::log::LogLevel::Error, module, msg)
#define SBC_LOG_FATAL(module, msg) SBC_LOG_IMPL(::sbc::log::LogLevel::Fatal, module, msg)

} // namespace sbc::log

#endif // SBC_LOG_HPP
