#pragma once

#include <atomic>
#include <chrono>
#include <concepts>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace h2wire {

// ============================================================================
// Levels and Formats
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

enum class LogFormat {
    Console,
    Json
};

std::string_view log_level_name(LogLevel level) noexcept;

// Case-insensitive; "warning" is accepted for Warn
std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

using LogField = std::pair<std::string, std::string>;

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level = LogLevel::Info;
    std::chrono::system_clock::time_point timestamp;
    std::string logger_name;
    std::string message;
    std::vector<LogField> fields;

    LogEntry& field(std::string key, std::string_view value) {
        fields.emplace_back(std::move(key), std::string(value));
        return *this;
    }

    template<std::integral T>
    LogEntry& field(std::string key, T value) {
        fields.emplace_back(std::move(key), std::to_string(value));
        return *this;
    }
};

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() {}
};

// Serialises whole lines onto an ostream
class StreamSink : public LogSink {
    std::ostream& out_;
    std::mutex mutex_;

protected:
    virtual std::string render(const LogEntry& entry) const = 0;

public:
    explicit StreamSink(std::ostream& out) : out_(out) {}

    void write(const LogEntry& entry) override;
    void flush() override;
};

// "2026-01-01T00:00:00.000Z [INFO] [name] message key=value"
class ConsoleSink : public StreamSink {
    bool colored_;

protected:
    std::string render(const LogEntry& entry) const override;

public:
    explicit ConsoleSink(std::ostream& out = std::cerr, bool colored = true)
        : StreamSink(out), colored_(colored) {}
};

// One JSON object per line, fields flattened into the object
class JsonSink : public StreamSink {
protected:
    std::string render(const LogEntry& entry) const override;

public:
    explicit JsonSink(std::ostream& out = std::cerr) : StreamSink(out) {}
};

// ============================================================================
// Logger
// ============================================================================

// Cheap to copy. Copies and children made with with() share one level and
// one set of sinks, so reconfiguring the root reaches every derived logger.
class Logger {
    struct Shared {
        std::atomic<LogLevel> level{LogLevel::Info};
        std::mutex mutex;
        std::vector<std::shared_ptr<LogSink>> sinks;
    };

    std::shared_ptr<Shared> shared_;
    std::string name_;
    std::vector<LogField> context_;

public:
    explicit Logger(std::string name = {});

    // Derived logger that stamps key=value on every entry
    Logger with(std::string key, std::string value) const;

    void set_level(LogLevel level) noexcept { shared_->level.store(level); }
    LogLevel level() const noexcept { return shared_->level.load(); }
    bool is_enabled(LogLevel level) const noexcept {
        return level != LogLevel::Off && level >= shared_->level.load();
    }

    void add_sink(std::shared_ptr<LogSink> sink);
    void clear_sinks();

    LogEntry entry(LogLevel level, std::string message) const;
    void log(const LogEntry& entry) const;
    void log(LogLevel level, std::string message) const;

    void trace(std::string message) const { log(LogLevel::Trace, std::move(message)); }
    void debug(std::string message) const { log(LogLevel::Debug, std::move(message)); }
    void info(std::string message) const { log(LogLevel::Info, std::move(message)); }
    void warn(std::string message) const { log(LogLevel::Warn, std::move(message)); }
    void error(std::string message) const { log(LogLevel::Error, std::move(message)); }
    void fatal(std::string message) const { log(LogLevel::Fatal, std::move(message)); }

    const std::string& name() const noexcept { return name_; }
    const std::vector<LogField>& context() const noexcept { return context_; }
};

// ============================================================================
// Process Logger
// ============================================================================

Logger& default_logger();

// Replaces the default logger's level and its sinks with one sink on stderr
void configure_default_logger(LogLevel level, LogFormat format);

inline void log_trace(std::string msg) { default_logger().trace(std::move(msg)); }
inline void log_debug(std::string msg) { default_logger().debug(std::move(msg)); }
inline void log_info(std::string msg) { default_logger().info(std::move(msg)); }
inline void log_warn(std::string msg) { default_logger().warn(std::move(msg)); }
inline void log_error(std::string msg) { default_logger().error(std::move(msg)); }
inline void log_fatal(std::string msg) { default_logger().fatal(std::move(msg)); }

} // namespace h2wire
