#include "h2wire/http2/connection.hpp"
#include "h2wire/http2/preface.hpp"

#include <array>
#include <string>

namespace h2wire::http2 {

std::string_view connection_state_name(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::AwaitingPreface: return "AwaitingPreface";
        case ConnectionState::AwaitingServerSettingsSent: return "AwaitingServerSettingsSent";
        case ConnectionState::AwaitingClientSettings: return "AwaitingClientSettings";
        case ConnectionState::Established: return "Established";
        case ConnectionState::Closed: return "Closed";
        default: return "Unknown";
    }
}

namespace {

bool is_known_frame_type(FrameType type) {
    return static_cast<uint8_t>(type) <= static_cast<uint8_t>(FrameType::Continuation);
}

// Strips the pad length, padding and priority fields around a header block
expected<std::span<const uint8_t>, Error> header_block_fragment(const Frame& frame) {
    std::span<const uint8_t> block(frame.payload);
    size_t padding = 0;

    if (frame.header.has_padded()) {
        if (block.empty()) {
            return unexpected(Error::protocol(ProtocolError::FrameSizeError,
                "padded HEADERS without pad length"));
        }
        padding = block[0];
        block = block.subspan(1);
    }
    if (frame.header.has_priority()) {
        if (block.size() < 5) {
            return unexpected(Error::protocol(ProtocolError::FrameSizeError,
                "HEADERS too short for priority fields"));
        }
        block = block.subspan(5);
    }
    if (padding > block.size()) {
        return unexpected(Error::protocol(ProtocolError::FrameSizeError,
            "HEADERS padding exceeds payload"));
    }
    return block.first(block.size() - padding);
}

} // anonymous namespace

Connection::Connection(std::unique_ptr<net::ByteStream> stream,
                       ConnectionOptions options,
                       std::unique_ptr<HeaderDecoder> decoder)
    : stream_(std::move(stream))
    , options_(std::move(options))
    , decoder_(std::move(decoder))
    , responder_(options_.response)
    , log_(default_logger().with("peer", stream_->remote_address()))
{
    if (!decoder_) {
        decoder_ = std::make_unique<HpackDecoder>();
    }
}

Connection::~Connection() {
    close();
}

// ============================================================================
// Driver
// ============================================================================

void Connection::run() {
    if (state_ != ConnectionState::AwaitingPreface) {
        return;
    }

    if (options_.read_timeout.count() > 0) {
        stream_->set_timeout(options_.read_timeout);
    }

    if (auto r = read_client_preface(*stream_); !r) {
        fail(r.error());
        return;
    }
    log_.debug("Valid HTTP/2 preface");
    transition(ConnectionState::AwaitingServerSettingsSent);

    if (auto r = send_server_settings(); !r) {
        fail(r.error());
        return;
    }
    transition(ConnectionState::AwaitingClientSettings);

    if (auto r = receive_client_settings(); !r) {
        fail(r.error());
        return;
    }
    transition(ConnectionState::Established);

    if (auto r = serve(); !r) {
        fail(r.error());
        return;
    }
    close();
}

expected<void, Error> Connection::send_server_settings() {
    // No parameters announced: the peer keeps protocol defaults
    return write_frame(serialize_settings_frame({}));
}

expected<void, Error> Connection::receive_client_settings() {
    auto frame = read_frame();
    if (!frame) {
        return unexpected(frame.error());
    }

    if (frame->header.type != FrameType::Settings || frame->header.has_ack()) {
        return unexpected(Error::protocol(ProtocolError::UnexpectedFrame,
            std::string("expected client SETTINGS, got ") +
            std::string(frame_type_name(frame->header.type)) +
            (frame->header.has_ack() ? " ACK" : "")));
    }

    if (auto r = apply_settings(*frame); !r) {
        return r;
    }
    return write_frame(serialize_settings_ack());
}

expected<void, Error> Connection::serve() {
    while (state_ == ConnectionState::Established) {
        auto frame = read_frame();
        if (!frame) {
            return unexpected(frame.error());
        }
        if (auto r = dispatch(*frame); !r) {
            return r;
        }
    }
    return {};
}

expected<void, Error> Connection::dispatch(const Frame& frame) {
    switch (frame.header.type) {
        case FrameType::Settings:
            return handle_settings(frame);
        case FrameType::WindowUpdate:
            return handle_window_update(frame);
        case FrameType::Headers:
            return handle_headers(frame);
        case FrameType::GoAway:
            return handle_goaway(frame);
        default:
            break;
    }

    if (!is_known_frame_type(frame.header.type)) {
        return unexpected(Error::protocol(ProtocolError::UnknownFrameType,
            "unknown frame type " + std::to_string(static_cast<unsigned>(frame.header.type))));
    }
    return unexpected(Error::protocol(ProtocolError::UnexpectedFrame,
        std::string(frame_type_name(frame.header.type)) + " frame not handled"));
}

// ============================================================================
// Frame Handlers
// ============================================================================

expected<void, Error> Connection::handle_settings(const Frame& frame) {
    if (frame.header.has_ack()) {
        if (!frame.payload.empty()) {
            return unexpected(Error::protocol(ProtocolError::FrameSizeError,
                "SETTINGS ACK with payload"));
        }
        log_.debug("Client acknowledged server SETTINGS");
        return {};
    }

    if (auto r = apply_settings(frame); !r) {
        return r;
    }
    return write_frame(serialize_settings_ack());
}

expected<void, Error> Connection::apply_settings(const Frame& frame) {
    if (frame.header.stream_id != 0) {
        return unexpected(Error::protocol(ProtocolError::UnexpectedFrame,
            "SETTINGS on stream " + std::to_string(frame.header.stream_id)));
    }

    auto entries = parse_settings_payload(frame.payload);
    if (!entries) {
        return unexpected(entries.error());
    }

    if (options_.strict_settings) {
        for (const auto& entry : *entries) {
            if (auto r = Settings::validate(entry.id, entry.value); !r) {
                return r;
            }
        }
    }

    settings_.apply_all(*entries);
    return {};
}

expected<void, Error> Connection::handle_window_update(const Frame& frame) {
    auto increment = parse_window_update(frame.payload);
    if (!increment) {
        return unexpected(increment.error());
    }

    ++window_updates_.count;
    window_updates_.total_increment += *increment;
    window_updates_.last_increment = *increment;
    log_.debug("WINDOW_UPDATE stream=" + std::to_string(frame.header.stream_id) +
              " increment=" + std::to_string(*increment));
    return {};
}

expected<void, Error> Connection::handle_headers(const Frame& frame) {
    uint32_t stream_id = frame.header.stream_id;

    if (auto r = streams_.open(stream_id); !r) {
        return r;
    }

    auto block = header_block_fragment(frame);
    if (!block) {
        return unexpected(block.error());
    }

    auto headers = decoder_->decode(*block);
    if (!headers) {
        return unexpected(headers.error());
    }
    last_request_headers_ = std::move(*headers);
    if (frame.header.has_end_stream()) {
        streams_.half_close(stream_id);
    }

    if (log_.is_enabled(LogLevel::Debug)) {
        auto entry = log_.entry(LogLevel::Debug, "Request headers");
        entry.field("stream", stream_id);
        for (const auto& field : last_request_headers_) {
            entry.field(field.name, field.value);
        }
        log_.log(entry);
    }

    if (auto r = responder_.send_response(*stream_, stream_id, settings_); !r) {
        if (r.error().is_transport()) {
            write_failed_ = true;
        }
        return r;
    }

    streams_.close(stream_id);
    ++responses_sent_;
    return {};
}

expected<void, Error> Connection::handle_goaway(const Frame& frame) {
    auto info = parse_goaway(frame.payload);
    if (!info) {
        return unexpected(info.error());
    }

    log_.info("Received GOAWAY last_stream_id=" + std::to_string(info->last_stream_id) +
             " error_code=" + std::to_string(info->error_code) +
             (info->debug_data.empty() ? "" : " debug=" + info->debug_data));

    peer_goaway_ = std::move(*info);
    transition(ConnectionState::Closed);
    return {};
}

// ============================================================================
// Frame I/O
// ============================================================================

expected<Frame, Error> Connection::read_frame() {
    std::array<uint8_t, Constants::FrameHeaderSize> header_bytes{};
    if (auto r = stream_->read_exact(header_bytes.data(), header_bytes.size()); !r) {
        return unexpected(r.error());
    }

    Frame frame;
    frame.header = FrameHeader::decode(header_bytes);

    if (log_.is_enabled(LogLevel::Debug)) {
        auto entry = log_.entry(LogLevel::Debug, "Frame received");
        entry.field("type", frame_type_name(frame.header.type))
             .field("flags", static_cast<unsigned>(frame.header.flags))
             .field("stream", frame.header.stream_id)
             .field("length", frame.header.length);
        log_.log(entry);
    }

    if (frame.header.length > options_.max_frame_size) {
        return unexpected(Error::protocol(ProtocolError::FrameSizeError,
            "frame length " + std::to_string(frame.header.length) + " exceeds " +
            std::to_string(options_.max_frame_size)));
    }

    if (frame.header.length > 0) {
        frame.payload.resize(frame.header.length);
        if (auto r = stream_->read_exact(frame.payload.data(), frame.payload.size()); !r) {
            return unexpected(r.error());
        }
    }
    return frame;
}

expected<void, Error> Connection::write_frame(const std::vector<uint8_t>& bytes) {
    auto r = stream_->write_all(bytes.data(), bytes.size());
    if (r) {
        r = stream_->flush();
    }
    if (!r) {
        write_failed_ = true;
    }
    return r;
}

// ============================================================================
// Teardown
// ============================================================================

void Connection::transition(ConnectionState next) {
    log_.trace(std::string("Connection state ") + std::string(connection_state_name(state_)) +
              " -> " + std::string(connection_state_name(next)));
    state_ = next;
}

void Connection::fail(const Error& error) {
    if (state_ == ConnectionState::Closed) {
        return;
    }

    auto entry = log_.entry(LogLevel::Warn, "Closing connection");
    entry.field("state", connection_state_name(state_))
         .field("reason", error.to_string());
    log_.log(entry);

    send_goaway(error);
    close_reason_ = error;
    close();
}

void Connection::send_goaway(const Error& error) {
    if (!options_.goaway_on_error || goaway_sent_ || write_failed_) {
        return;
    }
    // Nothing was negotiated before a valid preface
    if (state_ == ConnectionState::AwaitingPreface) {
        return;
    }
    if (error.is_transport() && !error.is_timeout()) {
        return;
    }

    goaway_sent_ = true;
    auto frame = serialize_goaway_frame(streams_.last_stream_id(), goaway_error_code(error),
                                        error.message());
    if (auto r = write_frame(frame); !r) {
        log_.debug("GOAWAY not delivered: " + r.error().to_string());
    }
}

void Connection::close() {
    if (stream_ && stream_->is_open()) {
        stream_->close();
    }
    if (state_ != ConnectionState::Closed) {
        transition(ConnectionState::Closed);
    }
}

} // namespace h2wire::http2
