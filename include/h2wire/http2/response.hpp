#pragma once

#include "h2wire/util/expected.hpp"
#include "h2wire/core/error.hpp"
#include "h2wire/net/byte_stream.hpp"
#include "h2wire/http2/hpack.hpp"
#include "h2wire/http2/settings.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace h2wire::http2 {

enum class HeaderEncoding {
    Plain,  // "name: value\r\n" lines closed by an empty line
    Hpack,
};

struct ResponseOptions {
    std::string status = "200";
    std::string body = "Hello, world!";
    // Advertised value; unset means the body size
    std::optional<size_t> content_length = 12;
    HeaderEncoding encoding = HeaderEncoding::Plain;
};

// ============================================================================
// Response Encoder
// ============================================================================
//
// Answers one request stream with a HEADERS frame (END_HEADERS) followed by
// the body as DATA frames, the last one carrying END_STREAM. DATA frames are
// cut at the peer's MAX_FRAME_SIZE. Everything is flushed before returning;
// any write failure is returned as is.

class ResponseEncoder {
    ResponseOptions options_;
    HpackEncoder hpack_;
    uint32_t table_size_ = Constants::DefaultHeaderTableSize;

public:
    explicit ResponseEncoder(ResponseOptions options = {});

    expected<void, Error> send_response(net::ByteStream& stream, uint32_t stream_id,
                                        const Settings& settings);

    HeaderList header_fields() const;

    // Header block as it goes on the wire for the configured encoding
    expected<std::vector<uint8_t>, Error> encode_header_block(const Settings& settings);

    const ResponseOptions& options() const noexcept { return options_; }
};

// Plain-text rendering used when no header compression is negotiated
std::vector<uint8_t> render_plain_header_block(const HeaderList& fields);

} // namespace h2wire::http2
