#pragma once

#include "h2wire/http2/frame.hpp"
#include "h2wire/http2/hpack.hpp"
#include "h2wire/http2/settings.hpp"
#include "h2wire/http2/stream.hpp"
#include "h2wire/http2/response.hpp"
#include "h2wire/net/byte_stream.hpp"
#include "h2wire/core/logging.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace h2wire::http2 {

// ============================================================================
// Connection State
// ============================================================================

enum class ConnectionState {
    AwaitingPreface,
    AwaitingServerSettingsSent,
    AwaitingClientSettings,
    Established,
    Closed,
};

std::string_view connection_state_name(ConnectionState state) noexcept;

// Per-connection knobs; every worker receives its own copy
struct ConnectionOptions {
    // Largest inbound frame payload accepted
    uint32_t max_frame_size = Constants::DefaultMaxFrameSize;

    // Reject out-of-range values for recognized SETTINGS keys
    bool strict_settings = false;

    // Best-effort GOAWAY before closing on a protocol, decode or timeout error
    bool goaway_on_error = true;

    // Deadline for each blocking read or write; zero waits forever
    std::chrono::milliseconds read_timeout{0};

    ResponseOptions response;
};

// ============================================================================
// HTTP/2 Connection
// ============================================================================
//
// Owns one client byte stream and drives it through
//   AwaitingPreface -> AwaitingServerSettingsSent -> AwaitingClientSettings
//   -> Established -> Closed
// Frames are handled strictly in arrival order on the calling thread. Every
// failure funnels into Closed; run() never throws for protocol or I/O errors.

// Running summary of the peer's WINDOW_UPDATE frames. The credit is recorded
// but not enforced.
struct WindowUpdateStats {
    size_t count = 0;
    uint64_t total_increment = 0;
    uint32_t last_increment = 0;
};

class Connection {
    std::unique_ptr<net::ByteStream> stream_;
    ConnectionOptions options_;
    std::unique_ptr<HeaderDecoder> decoder_;
    ResponseEncoder responder_;
    Logger log_;

    Settings settings_;
    StreamRegistry streams_;
    ConnectionState state_ = ConnectionState::AwaitingPreface;

    std::optional<Error> close_reason_;
    std::optional<GoAwayInfo> peer_goaway_;
    WindowUpdateStats window_updates_;
    HeaderList last_request_headers_;
    size_t responses_sent_ = 0;

    bool write_failed_ = false;
    bool goaway_sent_ = false;

public:
    // A null decoder selects HpackDecoder
    explicit Connection(std::unique_ptr<net::ByteStream> stream,
                        ConnectionOptions options = {},
                        std::unique_ptr<HeaderDecoder> decoder = nullptr);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Serve the connection until it reaches Closed
    void run();

    ConnectionState state() const noexcept { return state_; }
    bool is_closed() const noexcept { return state_ == ConnectionState::Closed; }

    const Settings& settings() const noexcept { return settings_; }
    const StreamRegistry& streams() const noexcept { return streams_; }

    // Unset when the connection ended gracefully (peer GOAWAY)
    const std::optional<Error>& close_reason() const noexcept { return close_reason_; }

    const std::optional<GoAwayInfo>& peer_goaway() const noexcept { return peer_goaway_; }

    const WindowUpdateStats& window_updates() const noexcept { return window_updates_; }

    const HeaderList& last_request_headers() const noexcept { return last_request_headers_; }

    size_t responses_sent() const noexcept { return responses_sent_; }

    bool goaway_sent() const noexcept { return goaway_sent_; }

private:
    // Handshake
    expected<void, Error> send_server_settings();
    expected<void, Error> receive_client_settings();

    // Established loop
    expected<void, Error> serve();
    expected<void, Error> dispatch(const Frame& frame);

    expected<void, Error> handle_settings(const Frame& frame);
    expected<void, Error> handle_window_update(const Frame& frame);
    expected<void, Error> handle_headers(const Frame& frame);
    expected<void, Error> handle_goaway(const Frame& frame);

    expected<void, Error> apply_settings(const Frame& frame);

    // Header plus exactly `length` payload bytes
    expected<Frame, Error> read_frame();

    // Write and flush; a failure disables every later write
    expected<void, Error> write_frame(const std::vector<uint8_t>& bytes);

    void transition(ConnectionState next);
    void fail(const Error& error);
    void send_goaway(const Error& error);
    void close();
};

} // namespace h2wire::http2
