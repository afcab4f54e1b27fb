//! # cleandoc Logging
//!
//! Module-tagged, leveled logging for the cleaning pipeline. cleandoc is a
//! library embedded in a documentation tool, so the logger is quiet by
//! default (warnings and up, on stderr) and the host decides where records
//! go by installing sinks.
//!
//! ## Module Tags
//!
//! | Tag         | Component                                |
//! |-------------|------------------------------------------|
//! | `attrs`     | Attribute aggregation, doc fragments     |
//! | `cfg`       | Configuration predicate parsing          |
//! | `links`     | Intra-doc link rendering                 |
//! | `clean`     | Entity model construction                |
//! | `primitive` | Primitive implementation table           |
//!
//! A filter entry names a tag or a tag prefix: `clean` also covers
//! `clean.types`.
//!
//! ## Usage
//!
//! ```cpp
//! log::Logger::init(log::log_config_from_env());
//! CLEANDOC_LOG_TRACE("attrs", "got doc_str=" << value);
//! ```
//!
//! Records below `CLEANDOC_MIN_LOG_LEVEL` are compiled out entirely.

#ifndef CLEANDOC_LOG_HPP
#define CLEANDOC_LOG_HPP

#include <atomic>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cleandoc::log {

// ============================================================================
// Levels and Records
// ============================================================================

enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6, ///< Threshold only; never carried by a record
};

/// Upper-case name of a level: "TRACE", "WARN", ...
const char* level_name(LogLevel level);

/// Parses a level name in any case; "warning" is accepted for Warn.
/// Unknown names give Info.
LogLevel parse_level(std::string_view s);

struct LogRecord {
    LogLevel level;
    std::string_view module;
    std::string message;
    const char* file;
    int line;
    int64_t timestamp_ms; ///< Wall clock, milliseconds since the epoch
};

enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON, ///< One object per line
};

/// One line of output for `record`, without the trailing newline.
std::string format_text(const LogRecord& record);
std::string format_json(const LogRecord& record);

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes formatted lines to a stream it does not own.
class StreamSink : public LogSink {
public:
    StreamSink(std::ostream& out, LogFormat format) : out_(out), format_(format) {}

    void write(const LogRecord& record) override;
    void flush() override;

protected:
    /// Text-format line for `record`; overridden to add terminal colors.
    virtual std::string render_text(const LogRecord& record) const;

    std::ostream& out_;
    LogFormat format_;
};

/// stderr, colored when it is a terminal that understands ANSI escapes.
class ConsoleSink : public StreamSink {
public:
    explicit ConsoleSink(LogFormat format = LogFormat::Text, bool colors = true);

    bool colored() const {
        return colored_;
    }

protected:
    std::string render_text(const LogRecord& record) const override;

private:
    bool colored_;
};

/// Appends to a file. Errors and fatal records are flushed at once so they
/// survive a crash of the host.
class FileSink : public StreamSink {
public:
    explicit FileSink(const std::string& path, LogFormat format = LogFormat::Text);

    void write(const LogRecord& record) override;

    bool is_open() const {
        return file_.is_open();
    }

private:
    // The base keeps a reference to this stream and only touches it after
    // construction finishes.
    std::ofstream file_;
};

/// Fans every record out to its children, in insertion order.
class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void add(std::unique_ptr<LogSink> sink);
    void clear();

    size_t size() const {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

// ============================================================================
// Filter
// ============================================================================

/// Per-module thresholds parsed from `"links=trace,cfg,*=warn"`.
///
/// An entry without `=level` enables its module at Trace; `*` sets the
/// default. The longest matching module prefix wins.
class LogFilter {
public:
    LogFilter() = default;

    /// Replaces the module entries. The default level is kept unless the
    /// spec has a `*` entry.
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const {
        return level >= threshold_for(module);
    }

    LogLevel threshold_for(std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest threshold of any entry, default included.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    /// Sorted by module name.
    std::vector<std::pair<std::string, LogLevel>> modules_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< Overrides `level` per module when set
    std::string log_file;    ///< Empty for no file output
    bool console = true;
    bool colors = true;
};

/// Reads `CLEANDOC_LOG` (a level name or a filter spec), `CLEANDOC_LOG_FILE`
/// and `CLEANDOC_LOG_FORMAT` (`text` or `json`).
LogConfig log_config_from_env();

/// Process-wide logger.
///
/// The cheapest check, against the lowest threshold in effect, is lock-free
/// so that disabled trace statements cost one atomic load.
class Logger {
public:
    static Logger& instance();

    /// Replaces the sinks and thresholds of the global logger.
    static void init(const LogConfig& config);

    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);
    void log(LogLevel level, std::string_view module, std::string message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();

    /// Sets the default threshold and drops module entries.
    void set_level(LogLevel level);
    void set_filter(std::string_view spec);

    /// Default threshold for modules without a filter entry.
    LogLevel level() const;

    void flush();

private:
    Logger();

    void refresh_floor();

    std::atomic<int> floor_{static_cast<int>(LogLevel::Warn)};
    LogFilter filter_;
    MultiSink sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Macros
// ============================================================================

#ifndef CLEANDOC_MIN_LOG_LEVEL
#define CLEANDOC_MIN_LOG_LEVEL 0
#endif

#define CLEANDOC_LOG_AT(level, module_str, msg)                                                    \
    do {                                                                                           \
        if constexpr (static_cast<int>(level) >= CLEANDOC_MIN_LOG_LEVEL) {                         \
            auto& cleandoc_logger_ = ::cleandoc::log::Logger::instance();                          \
            if (cleandoc_logger_.should_log(level, module_str)) {                                  \
                std::ostringstream cleandoc_msg_;                                                  \
                cleandoc_msg_ << msg;                                                              \
                cleandoc_logger_.log(level, module_str, cleandoc_msg_.str(), __FILE__, __LINE__);  \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define CLEANDOC_LOG_TRACE(module, msg) CLEANDOC_LOG_AT(::cleandoc::log::LogLevel::Trace, module, msg)
#define CLEANDOC_LOG_DEBUG(module, msg) CLEANDOC_LOG_AT(::cleandoc::log::LogLevel::Debug, module, msg)
#define CLEANDOC_LOG_INFO(module, msg) CLEANDOC_LOG_AT(::cleandoc::log::LogLevel::Info, module, msg)
#define CLEANDOC_LOG_WARN(module, msg) CLEANDOC_LOG_AT(::cleandoc::log::LogLevel::Warn, module, msg)
#define CLEANDOC_LOG_ERROR(module, msg) CLEANDOC_LOG_AT(::cleandoc::log::LogLevel::Error, module, msg)
#define CLEANDOC_LOG_FATAL(module, msg) CLEANDOC_LOG_AT(::cleandoc::log::LogLevel::Fatal, module, msg)

} // namespace cleandoc::log

#endif // CLEANDOC_LOG_HPP
