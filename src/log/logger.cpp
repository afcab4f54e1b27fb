//! # Logger Implementation
//!
//! Record formatting, the stream based sinks, module filters and the global
//! logger.

#include "log/log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <io.h>
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace cleandoc::log {

namespace {

struct LevelInfo {
    const char* name;
    const char* color; ///< ANSI escape used by the console sink
};

constexpr std::array<LevelInfo, 7> LEVELS = {{
    {"TRACE", "\033[90m"},
    {"DEBUG", "\033[36m"},
    {"INFO", "\033[32m"},
    {"WARN", "\033[33m"},
    {"ERROR", "\033[31m"},
    {"FATAL", "\033[1;31m"},
    {"OFF", ""},
}};

constexpr const char* ANSI_RESET = "\033[0m";

const LevelInfo& info_of(LogLevel level) {
    auto index = static_cast<size_t>(level);
    return LEVELS[index < LEVELS.size() ? index : LEVELS.size() - 1];
}

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

/// Local wall-clock time of `ms` as `HH:MM:SS.mmm`.
std::string clock_string(int64_t ms) {
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &secs);
#else
    localtime_r(&secs, &local);
#endif
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d", local.tm_hour, local.tm_min,
                  local.tm_sec, static_cast<int>(ms % 1000));
    return buf;
}

void append_json_string(std::string& out, std::string_view s) {
    out += '"';
    for (char c : s) {
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
            if (static_cast<unsigned char>(c) < 0x20) {
                char esc[8];
                std::snprintf(esc, sizeof(esc), "\\u%04x", static_cast<unsigned>(c));
                out += esc;
            } else {
                out += c;
            }
        }
    }
    out += '"';
}

bool stderr_understands_ansi() {
    if (std::getenv("NO_COLOR") != nullptr) {
        return false;
    }
#ifdef _WIN32
    if (!_isatty(_fileno(stderr))) {
        return false;
    }
    HANDLE handle = GetStdHandle(STD_ERROR_HANDLE);
    DWORD mode = 0;
    if (handle == INVALID_HANDLE_VALUE || !GetConsoleMode(handle, &mode)) {
        return false;
    }
    return SetConsoleMode(handle, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

/// True when `module` is `prefix` or lies below it (`clean` covers
/// `clean.types` and `clean::types`).
bool covers(std::string_view prefix, std::string_view module) {
    if (module.size() < prefix.size() || module.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    if (module.size() == prefix.size()) {
        return true;
    }
    char sep = module[prefix.size()];
    return sep == '.' || sep == ':';
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

} // namespace

// ============================================================================
// Levels and Formatting
// ============================================================================

const char* level_name(LogLevel level) {
    return info_of(level).name;
}

LogLevel parse_level(std::string_view s) {
    std::string name;
    name.reserve(s.size());
    for (char c : s) {
        name += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (name == "WARNING") {
        return LogLevel::Warn;
    }
    for (size_t i = 0; i < LEVELS.size(); ++i) {
        if (name == LEVELS[i].name) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::Info;
}

std::string format_text(const LogRecord& record) {
    std::ostringstream oss;
    oss << clock_string(record.timestamp_ms) << ' ' << std::left << std::setw(5)
        << level_name(record.level) << " [" << record.module << "] " << record.message;
    return oss.str();
}

std::string format_json(const LogRecord& record) {
    std::string out = "{\"ts\":" + std::to_string(record.timestamp_ms) + ",\"level\":";
    append_json_string(out, level_name(record.level));
    out += ",\"module\":";
    append_json_string(out, record.module);
    out += ",\"msg\":";
    append_json_string(out, record.message);
    out += '}';
    return out;
}

// ============================================================================
// Sinks
// ============================================================================

std::string StreamSink::render_text(const LogRecord& record) const {
    return format_text(record);
}

void StreamSink::write(const LogRecord& record) {
    if (format_ == LogFormat::JSON) {
        out_ << format_json(record) << '\n';
    } else {
        out_ << render_text(record) << '\n';
    }
}

void StreamSink::flush() {
    out_.flush();
}

ConsoleSink::ConsoleSink(LogFormat format, bool colors)
    : StreamSink(std::cerr, format), colored_(colors && stderr_understands_ansi()) {}

std::string ConsoleSink::render_text(const LogRecord& record) const {
    if (!colored_) {
        return format_text(record);
    }
    return std::string(info_of(record.level).color) + format_text(record) + ANSI_RESET;
}

FileSink::FileSink(const std::string& path, LogFormat format)
    : StreamSink(file_, format), file_(path, std::ios::out | std::ios::app) {}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open()) {
        return;
    }
    StreamSink::write(record);
    if (record.level >= LogLevel::Error) {
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
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

void MultiSink::clear() {
    sinks_.clear();
}

// ============================================================================
// Filter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    modules_.clear();

    while (!spec.empty()) {
        size_t comma = spec.find(',');
        std::string_view entry = trim(spec.substr(0, comma));
        spec = comma == std::string_view::npos ? std::string_view{} : spec.substr(comma + 1);
        if (entry.empty()) {
            continue;
        }

        std::string_view module = entry;
        LogLevel level = LogLevel::Trace;
        size_t eq = entry.find('=');
        if (eq != std::string_view::npos) {
            module = trim(entry.substr(0, eq));
            level = parse_level(trim(entry.substr(eq + 1)));
        }

        if (module == "*") {
            default_level_ = level;
            continue;
        }

        auto pos = std::lower_bound(
            modules_.begin(), modules_.end(), module,
            [](const auto& known, std::string_view name) { return known.first < name; });
        if (pos != modules_.end() && pos->first == module) {
            pos->second = level;
        } else {
            modules_.emplace(pos, std::string(module), level);
        }
    }
}

LogLevel LogFilter::threshold_for(std::string_view module) const {
    LogLevel threshold = default_level_;
    size_t best = 0;
    for (const auto& [prefix, level] : modules_) {
        if (prefix.size() >= best && covers(prefix, module)) {
            best = prefix.size();
            threshold = level;
        }
    }
    return threshold;
}

LogLevel LogFilter::min_level() const {
    LogLevel lowest = default_level_;
    for (const auto& entry : modules_) {
        lowest = std::min(lowest, entry.second);
    }
    return lowest;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    filter_.set_default_level(LogLevel::Warn);
    sinks_.add(std::make_unique<ConsoleSink>());
    refresh_floor();
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    Logger& logger = instance();
    bool file_failed = false;
    {
        std::lock_guard<std::mutex> lock(logger.mutex_);
        logger.sinks_.flush();
        logger.sinks_.clear();

        logger.filter_ = LogFilter{};
        logger.filter_.set_default_level(config.level);
        if (!config.filter_spec.empty()) {
            logger.filter_.parse(config.filter_spec);
        }

        if (config.console) {
            logger.sinks_.add(std::make_unique<ConsoleSink>(config.format, config.colors));
        }
        if (!config.log_file.empty()) {
            auto file = std::make_unique<FileSink>(config.log_file, config.format);
            file_failed = !file->is_open();
            logger.sinks_.add(std::move(file));
        }
        logger.refresh_floor();
    }

    if (file_failed) {
        CLEANDOC_LOG_WARN("log", "cannot open log file " << config.log_file);
    }
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    if (static_cast<int>(level) < floor_.load(std::memory_order_relaxed)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.write(record);
    if (record.level == LogLevel::Fatal) {
        sinks_.flush();
    }
}

void Logger::log(LogLevel level, std::string_view module, std::string message, const char* file,
                 int line) {
    log(LogRecord{level, module, std::move(message), file, line, now_ms()});
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.add(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_ = LogFilter{};
    filter_.set_default_level(level);
    refresh_floor();
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    refresh_floor();
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.default_level();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.flush();
}

void Logger::refresh_floor() {
    floor_.store(static_cast<int>(filter_.min_level()), std::memory_order_relaxed);
}

} // namespace cleandoc::log
