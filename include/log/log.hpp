//! # tsbuild Logging
//!
//! Module-tagged logger shared by every tsbuild component:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Per-module filtering ("engine=debug,*=warn")
//! - Console, file and null sinks
//! - Text or JSON-lines output
//! - Compile-time level elision via TSBUILD_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! TSBUILD_LOG_INFO("engine", "Compiling " << step.input << " -> " << step.output);
//! TSBUILD_LOG_DEBUG("toolchain", "Probing PATH for " << name);
//! ```
//!
//! Module tags in use: `cli`, `manifest`, `toolchain`, `rules`, `engine`.

#ifndef TSBUILD_LOG_HPP
#define TSBUILD_LOG_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tsbuild::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6 ///< Disables all logging
};

/// Returns the upper-case name of a level ("TRACE", "DEBUG", ...).
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

/// Parses a level name, accepting lower or upper case.
/// Unrecognized names map to LogLevel::Info.
LogLevel parse_level(std::string_view s);

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;
    std::string_view module;
    std::string message;
    const char* file;
    int line;
    int64_t timestamp_ms; ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< "HH:MM:SS.mmm LEVEL [module] message"
    JSON  ///< One object per line
};

/// Renders a record as a single text line (with trailing newline).
std::string format_text(const LogRecord& record, bool colors);

/// Renders a record as a single JSON object line (with trailing newline).
std::string format_json(const LogRecord& record);

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract log output destination.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr, colored when stderr is a capable terminal.
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

/// Appends to a file. Flushes on Error and Fatal.
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

/// Discards everything.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based level filter.
///
/// Parses specs like "engine=trace,toolchain=debug,*=warn". A bare module
/// name without "=level" enables everything for that module.
class LogFilter {
public:
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }
    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level configured for any module, or the default.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec;
    std::string log_file; ///< Empty = no file sink
    bool console = true;
    bool colors = true;
};

/// Thread-safe global logger.
class Logger {
public:
    /// Replaces sinks and filtering with the given configuration.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before building the message.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);
    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();

    void set_level(LogLevel level);
    LogLevel level() const {
        return level_.load();
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    std::atomic<LogLevel> level_{LogLevel::Warn};
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Helpers
// ============================================================================

/// Current local time as "HH:MM:SS.mmm".
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

inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/// Parse logging options from argv: --log-level, --log-filter, --log-file,
/// --log-format, -v/-vv/-vvv, -q/--quiet. Falls back to TSBUILD_LOG.
LogConfig parse_log_options(int argc, char* argv[]);

/// Returns true if `arg` is one of the options consumed by parse_log_options().
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

#ifndef TSBUILD_MIN_LOG_LEVEL
#define TSBUILD_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level-specific ones below.
#define TSBUILD_LOG_IMPL(level, module_str, msg)                                                   \
    do {                                                                                           \
        if (static_cast<int>(level) >= TSBUILD_MIN_LOG_LEVEL) {                                    \
            auto& logger_ = ::tsbuild::log::Logger::instance();                                    \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define TSBUILD_LOG_TRACE(module, msg) TSBUILD_LOG_IMPL(::tsbuild::log::LogLevel::Trace, module, msg)
#define TSBUILD_LOG_DEBUG(module, msg) TSBUILD_LOG_IMPL(::tsbuild::log::LogLevel::Debug, module, msg)
#define TSBUILD_LOG_INFO(module, msg) TSBUILD_LOG_IMPL(::tsbuild::log::LogLevel::Info, module, msg)
#define TSBUILD_LOG_WARN(module, msg) TSBUILD_LOG_IMPL(::tsbuild::log::LogLevel::Warn, module, msg)
#define TSBUILD_LOG_ERROR(module, msg) TSBUILD_LOG_IMPL(::tsbuild::log::LogLevel::Error, module, msg)
#define TSBUILD_LOG_FATAL(module, msg) TSBUILD_LOG_IMPL(::tsbuild::log::LogLevel::Fatal, module, msg)

} // namespace tsbuild::log

#endif // TSBUILD_LOG_HPP
