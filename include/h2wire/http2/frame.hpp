#pragma once

#include "h2wire/util/expected.hpp"
#include "h2wire/core/error.hpp"

#include <cstdint>
#include <vector>
#include <span>
#include <string>
#include <string_view>
#include <array>

namespace h2wire::http2 {

// ============================================================================
// HTTP/2 Frame Types (RFC 7540 Section 6)
// ============================================================================

enum class FrameType : uint8_t {
    Data          = 0x0,
    Headers       = 0x1,
    Priority      = 0x2,
    RstStream     = 0x3,
    Settings      = 0x4,
    PushPromise   = 0x5,
    Ping          = 0x6,
    GoAway        = 0x7,
    WindowUpdate  = 0x8,
    Continuation  = 0x9,
};

std::string_view frame_type_name(FrameType type) noexcept;

// ============================================================================
// HTTP/2 Frame Flags
// ============================================================================

namespace FrameFlags {
    // DATA / HEADERS
    constexpr uint8_t EndStream  = 0x01;
    constexpr uint8_t Padded     = 0x08;

    // HEADERS
    constexpr uint8_t EndHeaders = 0x04;
    constexpr uint8_t Priority   = 0x20;

    // SETTINGS / PING
    constexpr uint8_t Ack        = 0x01;
}

// ============================================================================
// HTTP/2 Error Codes (RFC 7540 Section 7)
// ============================================================================

enum class ErrorCode : uint32_t {
    NoError            = 0x0,
    ProtocolError      = 0x1,
    InternalError      = 0x2,
    FlowControlError   = 0x3,
    SettingsTimeout    = 0x4,
    StreamClosed       = 0x5,
    FrameSizeError     = 0x6,
    RefusedStream      = 0x7,
    Cancel             = 0x8,
    CompressionError   = 0x9,
    ConnectError       = 0xa,
    EnhanceYourCalm    = 0xb,
    InadequateSecurity = 0xc,
    Http11Required     = 0xd,
};

// Wire error code a GOAWAY should carry for a fatal engine error
ErrorCode goaway_error_code(const Error& error) noexcept;

// ============================================================================
// HTTP/2 Settings Parameters (RFC 7540 Section 6.5.2)
// ============================================================================

enum class SettingsId : uint16_t {
    HeaderTableSize      = 0x1,
    EnablePush           = 0x2,
    MaxConcurrentStreams = 0x3,
    InitialWindowSize    = 0x4,
    MaxFrameSize         = 0x5,
    MaxHeaderListSize    = 0x6,
};

// Identifier kept raw: unknown keys travel through untouched
struct SettingsEntry {
    uint16_t id;
    uint32_t value;
};

// ============================================================================
// Frame Constants
// ============================================================================

namespace Constants {
    constexpr size_t FrameHeaderSize = 9;
    constexpr size_t SettingsEntrySize = 6;
    constexpr size_t WindowUpdatePayloadSize = 4;
    constexpr size_t GoAwayMinPayloadSize = 8;

    constexpr uint32_t StreamIdMask = 0x7FFFFFFF;
    constexpr uint32_t MaxFrameLength = 0xFFFFFF;     // 24-bit length field

    constexpr uint32_t DefaultHeaderTableSize = 4096;
    constexpr uint32_t DefaultMaxConcurrentStreams = 100;
    constexpr uint32_t DefaultInitialWindowSize = 65535;
    constexpr uint32_t DefaultMaxFrameSize = 16384;

    constexpr uint32_t MinMaxFrameSize = 16384;
    constexpr uint32_t MaxMaxFrameSize = 16777215;
    constexpr uint32_t MaxWindowSize = 2147483647;

    constexpr std::string_view ClientPreface = "PRI * HTTP/2.0\r\n\r\nSM\r\n\r\n";
}

// ============================================================================
// HTTP/2 Frame Header (9 bytes)
// ============================================================================

struct FrameHeader {
    uint32_t length = 0;              // 24 bits - payload length
    FrameType type = FrameType::Data; // 8 bits
    uint8_t flags = 0;                // 8 bits
    uint32_t stream_id = 0;           // 31 bits (high bit reserved)

    // Wire format, big-endian; the reserved stream id bit is written as 0
    std::array<uint8_t, 9> encode() const;

    // Any 9 bytes decode; the reserved stream id bit is masked off
    static FrameHeader decode(std::span<const uint8_t, 9> data);

    // Decode the first 9 bytes of a longer buffer
    static expected<FrameHeader, Error> parse(std::span<const uint8_t> data);

    bool has_end_stream() const { return flags & FrameFlags::EndStream; }
    bool has_end_headers() const { return flags & FrameFlags::EndHeaders; }
    bool has_padded() const { return flags & FrameFlags::Padded; }
    bool has_priority() const { return flags & FrameFlags::Priority; }
    bool has_ack() const { return flags & FrameFlags::Ack; }
};

// A header plus exactly `header.length` payload bytes
struct Frame {
    FrameHeader header;
    std::vector<uint8_t> payload;
};

// ============================================================================
// Payload Parsing
// ============================================================================

struct GoAwayInfo {
    uint32_t last_stream_id = 0;
    uint32_t error_code = 0;
    std::string debug_data;
};

// Sequence of 6-byte (id, value) entries; length must be a multiple of 6
expected<std::vector<SettingsEntry>, Error> parse_settings_payload(std::span<const uint8_t> payload);

// 31-bit window size increment; payload must be exactly 4 bytes
expected<uint32_t, Error> parse_window_update(std::span<const uint8_t> payload);

// Last stream id, error code and optional debug data; at least 8 bytes
expected<GoAwayInfo, Error> parse_goaway(std::span<const uint8_t> payload);

// ============================================================================
// Frame Serialization
// ============================================================================

std::vector<uint8_t> serialize_frame(const FrameHeader& header, std::span<const uint8_t> payload);

std::vector<uint8_t> serialize_settings_frame(
    std::span<const SettingsEntry> settings,
    bool ack = false
);

std::vector<uint8_t> serialize_settings_ack();

std::vector<uint8_t> serialize_goaway_frame(
    uint32_t last_stream_id,
    ErrorCode error_code,
    std::string_view debug_data = {}
);

std::vector<uint8_t> serialize_window_update_frame(
    uint32_t stream_id,
    uint32_t window_size_increment
);

std::vector<uint8_t> serialize_data_frame(
    uint32_t stream_id,
    std::span<const uint8_t> data,
    bool end_stream = false
);

// Header block is written as given; compression is the caller's concern
std::vector<uint8_t> serialize_headers_frame(
    uint32_t stream_id,
    std::span<const uint8_t> header_block,
    bool end_stream = false,
    bool end_headers = true
);

} // namespace h2wire::http2
