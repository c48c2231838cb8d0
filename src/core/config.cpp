#include "h2wire/core/config.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>

namespace h2wire {

namespace {

Error invalid(std::string_view name, const std::string& value, std::string_view expected_what) {
    return Error::io(IoError::InvalidArgument,
        std::string(name) + "='" + value + "' is not " + std::string(expected_what));
}

template<typename T>
expected<T, Error> parse_number(std::string_view name, const std::string& value, T min, T max) {
    T result{};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc{} || ptr != value.data() + value.size() || result < min || result > max) {
        return unexpected(invalid(name, value,
            "a number in [" + std::to_string(min) + ", " + std::to_string(max) + "]"));
    }
    return result;
}

expected<bool, Error> parse_bool(std::string_view name, const std::string& value) {
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    return unexpected(invalid(name, value, "a boolean"));
}

} // anonymous namespace

expected<ServerConfig, Error> ServerConfig::from_env() {
    return load([](std::string_view name) -> std::optional<std::string> {
        if (const char* value = std::getenv(std::string(name).c_str())) {
            return std::string(value);
        }
        return std::nullopt;
    });
}

expected<ServerConfig, Error> ServerConfig::load(const Lookup& lookup) {
    ServerConfig config;

    if (auto host = lookup("H2WIRE_HOST")) {
        config.host = *host;
    }
    if (auto port = lookup("H2WIRE_PORT")) {
        auto parsed = parse_number<uint16_t>("H2WIRE_PORT", *port, 0, 65535);
        if (!parsed) return unexpected(parsed.error());
        config.port = *parsed;
    }
    if (auto backlog = lookup("H2WIRE_BACKLOG")) {
        auto parsed = parse_number<int>("H2WIRE_BACKLOG", *backlog, 1, std::numeric_limits<int>::max());
        if (!parsed) return unexpected(parsed.error());
        config.backlog = *parsed;
    }
    if (auto timeout = lookup("H2WIRE_READ_TIMEOUT_MS")) {
        auto parsed = parse_number<int64_t>("H2WIRE_READ_TIMEOUT_MS", *timeout, 0,
                                            std::numeric_limits<int32_t>::max());
        if (!parsed) return unexpected(parsed.error());
        config.read_timeout = std::chrono::milliseconds(*parsed);
    }

    if (auto level = lookup("H2WIRE_LOG_LEVEL")) {
        auto parsed = parse_log_level(*level);
        if (!parsed) {
            return unexpected(invalid("H2WIRE_LOG_LEVEL", *level,
                                      "trace, debug, info, warn, error, fatal or off"));
        }
        config.log_level = *parsed;
    }
    if (auto format = lookup("H2WIRE_LOG_FORMAT")) {
        if (*format == "json") {
            config.log_format = LogFormat::Json;
        } else if (*format == "console") {
            config.log_format = LogFormat::Console;
        } else {
            return unexpected(invalid("H2WIRE_LOG_FORMAT", *format, "'console' or 'json'"));
        }
    }

    if (auto size = lookup("H2WIRE_MAX_FRAME_SIZE")) {
        auto parsed = parse_number<uint32_t>("H2WIRE_MAX_FRAME_SIZE", *size,
            http2::Constants::MinMaxFrameSize, http2::Constants::MaxMaxFrameSize);
        if (!parsed) return unexpected(parsed.error());
        config.max_frame_size = *parsed;
    }
    if (auto strict = lookup("H2WIRE_STRICT_SETTINGS")) {
        auto parsed = parse_bool("H2WIRE_STRICT_SETTINGS", *strict);
        if (!parsed) return unexpected(parsed.error());
        config.strict_settings = *parsed;
    }
    if (auto goaway = lookup("H2WIRE_GOAWAY_ON_ERROR")) {
        auto parsed = parse_bool("H2WIRE_GOAWAY_ON_ERROR", *goaway);
        if (!parsed) return unexpected(parsed.error());
        config.goaway_on_error = *parsed;
    }
    if (auto encoding = lookup("H2WIRE_RESPONSE_ENCODING")) {
        if (*encoding == "plain") {
            config.response_encoding = http2::HeaderEncoding::Plain;
        } else if (*encoding == "hpack") {
            config.response_encoding = http2::HeaderEncoding::Hpack;
        } else {
            return unexpected(invalid("H2WIRE_RESPONSE_ENCODING", *encoding, "'plain' or 'hpack'"));
        }
    }
    if (auto body = lookup("H2WIRE_RESPONSE_BODY")) {
        config.response_body = *body;
    }

    return config;
}

http2::ConnectionOptions ServerConfig::connection_options() const {
    http2::ConnectionOptions options;
    options.max_frame_size = max_frame_size;
    options.strict_settings = strict_settings;
    options.goaway_on_error = goaway_on_error;
    options.read_timeout = read_timeout;
    options.response.encoding = response_encoding;
    if (response_body) {
        options.response.body = *response_body;
        options.response.content_length.reset();
    }
    return options;
}

} // namespace h2wire
