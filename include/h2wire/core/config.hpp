#pragma once

#include "h2wire/util/expected.hpp"
#include "h2wire/core/error.hpp"
#include "h2wire/core/logging.hpp"
#include "h2wire/http2/connection.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace h2wire {

struct ServerConfig {
    // Listener
    std::string host = "127.0.0.1";
    uint16_t port = 8080;
    int backlog = 128;

    // Logging
    LogLevel log_level = LogLevel::Info;
    LogFormat log_format = LogFormat::Console;

    // Per-connection engine
    std::chrono::milliseconds read_timeout{0};
    uint32_t max_frame_size = http2::Constants::DefaultMaxFrameSize;
    bool strict_settings = false;
    bool goaway_on_error = true;
    http2::HeaderEncoding response_encoding = http2::HeaderEncoding::Plain;
    std::optional<std::string> response_body;

    using Lookup = std::function<std::optional<std::string>(std::string_view name)>;

    // Read H2WIRE_* environment variables; malformed values are an error
    static expected<ServerConfig, Error> from_env();

    // Same as from_env() with a custom variable source
    static expected<ServerConfig, Error> load(const Lookup& lookup);

    http2::ConnectionOptions connection_options() const;
};

} // namespace h2wire
