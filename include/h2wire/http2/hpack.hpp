#pragma once

#include "h2wire/util/expected.hpp"
#include "h2wire/core/error.hpp"

#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <memory>

// Forward declare nghttp2 types
typedef struct nghttp2_hd_deflater nghttp2_hd_deflater;
typedef struct nghttp2_hd_inflater nghttp2_hd_inflater;

namespace h2wire::http2 {

// ============================================================================
// Header Field
// ============================================================================

struct HeaderField {
    std::string name;
    std::string value;

    // Pseudo-headers start with ':'
    bool is_pseudo() const { return !name.empty() && name[0] == ':'; }

    bool operator==(const HeaderField&) const = default;
};

using HeaderList = std::vector<HeaderField>;

// ============================================================================
// Header Decoder
// ============================================================================
//
// Turns the block carried by exactly one HEADERS frame into an ordered list
// of fields. A failure leaves no usable partial list and is fatal for the
// connection. Implementations may keep state across calls (HPACK's dynamic
// table), so one instance serves exactly one connection.

class HeaderDecoder {
public:
    virtual ~HeaderDecoder() = default;

    virtual expected<HeaderList, Error> decode(std::span<const uint8_t> block) = 0;
};

// ============================================================================
// HPACK Decoder (nghttp2 inflater)
// ============================================================================

class HpackDecoder : public HeaderDecoder {
    struct InflaterDeleter {
        void operator()(nghttp2_hd_inflater* inflater) const noexcept;
    };
    std::unique_ptr<nghttp2_hd_inflater, InflaterDeleter> inflater_;

public:
    HpackDecoder();
    ~HpackDecoder() override;

    HpackDecoder(HpackDecoder&&) noexcept = default;
    HpackDecoder& operator=(HpackDecoder&&) noexcept = default;

    // A moved-from decoder reports CodecError::NotInitialized
    expected<HeaderList, Error> decode(std::span<const uint8_t> block) override;
};

// ============================================================================
// HPACK Encoder (nghttp2 deflater)
// ============================================================================

class HpackEncoder {
    struct DeflaterDeleter {
        void operator()(nghttp2_hd_deflater* deflater) const noexcept;
    };
    std::unique_ptr<nghttp2_hd_deflater, DeflaterDeleter> deflater_;

public:
    HpackEncoder();
    ~HpackEncoder();

    HpackEncoder(HpackEncoder&&) noexcept = default;
    HpackEncoder& operator=(HpackEncoder&&) noexcept = default;

    expected<std::vector<uint8_t>, Error> encode(std::span<const HeaderField> headers);

    // Follows the peer's HEADER_TABLE_SIZE
    void set_max_table_size(size_t size);
};

// ============================================================================
// Header Utilities
// ============================================================================

// Pseudo-headers match exactly, regular headers case-insensitively
const HeaderField* find_header(std::span<const HeaderField> headers, std::string_view name);

} // namespace h2wire::http2
