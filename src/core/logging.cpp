#include "h2wire/core/logging.hpp"

#include <array>
#include <cctype>
#include <cstdio>
#include <ctime>

namespace h2wire {

namespace {

constexpr std::array<std::string_view, 7> kLevelNames = {
    "TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL", "OFF"
};

constexpr std::array<const char*, 7> kLevelColors = {
    "\033[90m", "\033[36m", "\033[32m", "\033[33m", "\033[31m", "\033[35m", "\033[0m"
};

constexpr const char* kColorReset = "\033[0m";

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// UTC, millisecond precision
std::string iso_timestamp(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    auto seconds = system_clock::to_time_t(tp);
    auto millis = duration_cast<milliseconds>(tp.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<int>(millis));
    return buffer;
}

void append_json_string(std::string& out, std::string_view text) {
    out += '"';
    for (char c : text) {
        auto byte = static_cast<unsigned char>(c);
        if (c == '"' || c == '\\') {
            out += '\\';
            out += c;
        } else if (c == '\n') {
            out += "\\n";
        } else if (c == '\r') {
            out += "\\r";
        } else if (c == '\t') {
            out += "\\t";
        } else if (byte < 0x20) {
            char escaped[8];
            std::snprintf(escaped, sizeof(escaped), "\\u%04x", byte);
            out += escaped;
        } else {
            out += c;
        }
    }
    out += '"';
}

// Peer-controlled text must not break lines or carry terminal escapes
void append_console_text(std::string& out, std::string_view text) {
    for (char c : text) {
        auto byte = static_cast<unsigned char>(c);
        if (c == '\n') {
            out += "\\n";
        } else if (c == '\r') {
            out += "\\r";
        } else if (c == '\t') {
            out += "\\t";
        } else if (byte < 0x20 || byte == 0x7f) {
            char escaped[8];
            std::snprintf(escaped, sizeof(escaped), "\\x%02x", byte);
            out += escaped;
        } else {
            out += c;
        }
    }
}

size_t level_index(LogLevel level) {
    auto index = static_cast<size_t>(level);
    return index < kLevelNames.size() ? index : kLevelNames.size() - 1;
}

} // anonymous namespace

std::string_view log_level_name(LogLevel level) noexcept {
    return kLevelNames[level_index(level)];
}

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    for (size_t i = 0; i < kLevelNames.size(); ++i) {
        if (iequals(name, kLevelNames[i])) {
            return static_cast<LogLevel>(i);
        }
    }
    if (iequals(name, "warning")) return LogLevel::Warn;
    return std::nullopt;
}

// ============================================================================
// Sinks
// ============================================================================

void StreamSink::write(const LogEntry& entry) {
    auto line = render(entry);
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line;
}

void StreamSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    out_.flush();
}

std::string ConsoleSink::render(const LogEntry& entry) const {
    std::string line = iso_timestamp(entry.timestamp);
    line += ' ';
    if (colored_) line += kLevelColors[level_index(entry.level)];
    line += '[';
    line += log_level_name(entry.level);
    line += ']';
    if (colored_) line += kColorReset;

    if (!entry.logger_name.empty()) {
        line += " [";
        append_console_text(line, entry.logger_name);
        line += ']';
    }
    line += ' ';
    append_console_text(line, entry.message);

    for (const auto& [key, value] : entry.fields) {
        line += ' ';
        append_console_text(line, key);
        line += '=';
        append_console_text(line, value);
    }
    line += '\n';
    return line;
}

std::string JsonSink::render(const LogEntry& entry) const {
    std::string line = "{\"timestamp\":";
    append_json_string(line, iso_timestamp(entry.timestamp));
    line += ",\"level\":";
    append_json_string(line, log_level_name(entry.level));
    if (!entry.logger_name.empty()) {
        line += ",\"logger\":";
        append_json_string(line, entry.logger_name);
    }
    line += ",\"message\":";
    append_json_string(line, entry.message);

    for (const auto& [key, value] : entry.fields) {
        line += ',';
        append_json_string(line, key);
        line += ':';
        append_json_string(line, value);
    }
    line += "}\n";
    return line;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger(std::string name)
    : shared_(std::make_shared<Shared>())
    , name_(std::move(name))
{}

Logger Logger::with(std::string key, std::string value) const {
    Logger child = *this;
    child.context_.emplace_back(std::move(key), std::move(value));
    return child;
}

void Logger::add_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->sinks.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->sinks.clear();
}

LogEntry Logger::entry(LogLevel level, std::string message) const {
    LogEntry e;
    e.level = level;
    e.timestamp = std::chrono::system_clock::now();
    e.logger_name = name_;
    e.message = std::move(message);
    e.fields = context_;
    return e;
}

void Logger::log(const LogEntry& entry) const {
    if (!is_enabled(entry.level)) return;

    std::lock_guard<std::mutex> lock(shared_->mutex);
    for (const auto& sink : shared_->sinks) {
        sink->write(entry);
    }
}

void Logger::log(LogLevel level, std::string message) const {
    if (!is_enabled(level)) return;
    log(entry(level, std::move(message)));
}

// ============================================================================
// Process Logger
// ============================================================================

Logger& default_logger() {
    static Logger logger = [] {
        Logger root("h2wire");
        root.add_sink(std::make_shared<ConsoleSink>());
        return root;
    }();
    return logger;
}

void configure_default_logger(LogLevel level, LogFormat format) {
    auto& logger = default_logger();
    logger.set_level(level);
    logger.clear_sinks();
    if (format == LogFormat::Json) {
        logger.add_sink(std::make_shared<JsonSink>(std::cerr));
    } else {
        logger.add_sink(std::make_shared<ConsoleSink>(std::cerr));
    }
}

} // namespace h2wire
