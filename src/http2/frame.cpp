#include "h2wire/http2/frame.hpp"

namespace h2wire::http2 {

namespace {

void put_u32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

uint32_t get_u32(std::span<const uint8_t> data) {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

} // anonymous namespace

std::string_view frame_type_name(FrameType type) noexcept {
    switch (type) {
        case FrameType::Data: return "DATA";
        case FrameType::Headers: return "HEADERS";
        case FrameType::Priority: return "PRIORITY";
        case FrameType::RstStream: return "RST_STREAM";
        case FrameType::Settings: return "SETTINGS";
        case FrameType::PushPromise: return "PUSH_PROMISE";
        case FrameType::Ping: return "PING";
        case FrameType::GoAway: return "GOAWAY";
        case FrameType::WindowUpdate: return "WINDOW_UPDATE";
        case FrameType::Continuation: return "CONTINUATION";
        default: return "UNKNOWN";
    }
}

ErrorCode goaway_error_code(const Error& error) noexcept {
    if (error.is_codec()) {
        return ErrorCode::CompressionError;
    }
    if (error.is_protocol()) {
        switch (error.protocol_error()) {
            case ProtocolError::FrameSizeError:
            case ProtocolError::MalformedSettings:
                return ErrorCode::FrameSizeError;
            default:
                return ErrorCode::ProtocolError;
        }
    }
    if (error.is_timeout()) {
        // Idle peer: a graceful close, not a fault
        return ErrorCode::NoError;
    }
    return ErrorCode::InternalError;
}

// ============================================================================
// Frame Header
// ============================================================================

std::array<uint8_t, 9> FrameHeader::encode() const {
    std::array<uint8_t, 9> result{};

    // Length (24 bits, big-endian)
    result[0] = static_cast<uint8_t>((length >> 16) & 0xFF);
    result[1] = static_cast<uint8_t>((length >> 8) & 0xFF);
    result[2] = static_cast<uint8_t>(length & 0xFF);

    result[3] = static_cast<uint8_t>(type);
    result[4] = flags;

    // Stream ID (31 bits, big-endian, high bit reserved/must be 0)
    result[5] = static_cast<uint8_t>((stream_id >> 24) & 0x7F);
    result[6] = static_cast<uint8_t>((stream_id >> 16) & 0xFF);
    result[7] = static_cast<uint8_t>((stream_id >> 8) & 0xFF);
    result[8] = static_cast<uint8_t>(stream_id & 0xFF);

    return result;
}

FrameHeader FrameHeader::decode(std::span<const uint8_t, 9> data) {
    FrameHeader header;

    header.length = (static_cast<uint32_t>(data[0]) << 16) |
                    (static_cast<uint32_t>(data[1]) << 8) |
                    static_cast<uint32_t>(data[2]);
    header.type = static_cast<FrameType>(data[3]);
    header.flags = data[4];
    header.stream_id = get_u32(data.subspan<5, 4>()) & Constants::StreamIdMask;

    return header;
}

expected<FrameHeader, Error> FrameHeader::parse(std::span<const uint8_t> data) {
    if (data.size() < Constants::FrameHeaderSize) {
        return unexpected(Error::io(IoError::InvalidArgument, "Frame header too short"));
    }
    return decode(data.first<Constants::FrameHeaderSize>());
}

// ============================================================================
// Payload Parsing
// ============================================================================

expected<std::vector<SettingsEntry>, Error> parse_settings_payload(std::span<const uint8_t> payload) {
    if (payload.size() % Constants::SettingsEntrySize != 0) {
        return unexpected(Error::protocol(ProtocolError::MalformedSettings,
            "SETTINGS payload of " + std::to_string(payload.size()) + " bytes is not a multiple of 6"));
    }

    std::vector<SettingsEntry> entries;
    entries.reserve(payload.size() / Constants::SettingsEntrySize);

    for (size_t i = 0; i < payload.size(); i += Constants::SettingsEntrySize) {
        SettingsEntry entry;
        entry.id = static_cast<uint16_t>((static_cast<uint16_t>(payload[i]) << 8) | payload[i + 1]);
        entry.value = get_u32(payload.subspan(i + 2, 4));
        entries.push_back(entry);
    }

    return entries;
}

expected<uint32_t, Error> parse_window_update(std::span<const uint8_t> payload) {
    if (payload.size() != Constants::WindowUpdatePayloadSize) {
        return unexpected(Error::protocol(ProtocolError::FrameSizeError,
            "WINDOW_UPDATE payload must be 4 bytes, got " + std::to_string(payload.size())));
    }
    return get_u32(payload) & Constants::StreamIdMask;
}

expected<GoAwayInfo, Error> parse_goaway(std::span<const uint8_t> payload) {
    if (payload.size() < Constants::GoAwayMinPayloadSize) {
        return unexpected(Error::protocol(ProtocolError::FrameSizeError,
            "GOAWAY payload shorter than 8 bytes"));
    }

    GoAwayInfo info;
    info.last_stream_id = get_u32(payload) & Constants::StreamIdMask;
    info.error_code = get_u32(payload.subspan(4, 4));
    auto debug = payload.subspan(Constants::GoAwayMinPayloadSize);
    info.debug_data.assign(debug.begin(), debug.end());
    return info;
}

// ============================================================================
// Frame Serialization
// ============================================================================

std::vector<uint8_t> serialize_frame(const FrameHeader& header, std::span<const uint8_t> payload) {
    std::vector<uint8_t> result;
    result.reserve(Constants::FrameHeaderSize + payload.size());

    auto header_bytes = header.encode();
    result.insert(result.end(), header_bytes.begin(), header_bytes.end());
    result.insert(result.end(), payload.begin(), payload.end());

    return result;
}

std::vector<uint8_t> serialize_settings_frame(
    std::span<const SettingsEntry> settings,
    bool ack
) {
    // An ACK never carries entries
    std::vector<uint8_t> payload;
    if (!ack) {
        payload.reserve(settings.size() * Constants::SettingsEntrySize);
        for (const auto& setting : settings) {
            payload.push_back(static_cast<uint8_t>(setting.id >> 8));
            payload.push_back(static_cast<uint8_t>(setting.id & 0xFF));
            put_u32(payload, setting.value);
        }
    }

    FrameHeader header;
    header.length = static_cast<uint32_t>(payload.size());
    header.type = FrameType::Settings;
    header.flags = ack ? FrameFlags::Ack : 0;
    header.stream_id = 0;

    return serialize_frame(header, payload);
}

std::vector<uint8_t> serialize_settings_ack() {
    return serialize_settings_frame({}, true);
}

std::vector<uint8_t> serialize_goaway_frame(
    uint32_t last_stream_id,
    ErrorCode error_code,
    std::string_view debug_data
) {
    std::vector<uint8_t> payload;
    payload.reserve(Constants::GoAwayMinPayloadSize + debug_data.size());

    put_u32(payload, last_stream_id & Constants::StreamIdMask);
    put_u32(payload, static_cast<uint32_t>(error_code));
    payload.insert(payload.end(), debug_data.begin(), debug_data.end());

    FrameHeader header;
    header.length = static_cast<uint32_t>(payload.size());
    header.type = FrameType::GoAway;
    header.flags = 0;
    header.stream_id = 0;

    return serialize_frame(header, payload);
}

std::vector<uint8_t> serialize_window_update_frame(
    uint32_t stream_id,
    uint32_t window_size_increment
) {
    std::vector<uint8_t> payload;
    payload.reserve(Constants::WindowUpdatePayloadSize);
    put_u32(payload, window_size_increment & Constants::StreamIdMask);

    FrameHeader header;
    header.length = static_cast<uint32_t>(payload.size());
    header.type = FrameType::WindowUpdate;
    header.flags = 0;
    header.stream_id = stream_id;

    return serialize_frame(header, payload);
}

std::vector<uint8_t> serialize_data_frame(
    uint32_t stream_id,
    std::span<const uint8_t> data,
    bool end_stream
) {
    FrameHeader header;
    header.length = static_cast<uint32_t>(data.size());
    header.type = FrameType::Data;
    header.flags = end_stream ? FrameFlags::EndStream : 0;
    header.stream_id = stream_id;

    return serialize_frame(header, data);
}

std::vector<uint8_t> serialize_headers_frame(
    uint32_t stream_id,
    std::span<const uint8_t> header_block,
    bool end_stream,
    bool end_headers
) {
    FrameHeader header;
    header.length = static_cast<uint32_t>(header_block.size());
    header.type = FrameType::Headers;
    header.flags = 0;
    if (end_stream) header.flags |= FrameFlags::EndStream;
    if (end_headers) header.flags |= FrameFlags::EndHeaders;
    header.stream_id = stream_id;

    return serialize_frame(header, header_block);
}

} // namespace h2wire::http2
