#include "h2wire/http2/hpack.hpp"
#include "h2wire/http2/frame.hpp"

// nghttp2.h requires standard integer types and ssize_t to be defined
#include <cstdint>
#include <sys/types.h>
#include <nghttp2/nghttp2.h>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace h2wire::http2 {

namespace {

std::string lib_error(const char* what, ssize_t rv) {
    return std::string(what) + ": " + nghttp2_strerror(static_cast<int>(rv));
}

// nghttp2 takes non-const pointers but does not write through them
uint8_t* as_bytes(const std::string& text) {
    return reinterpret_cast<uint8_t*>(const_cast<char*>(text.data()));
}

std::string as_string(const uint8_t* data, size_t length) {
    return std::string(reinterpret_cast<const char*>(data), length);
}

} // anonymous namespace

// ============================================================================
// HPACK Decoder
// ============================================================================

void HpackDecoder::InflaterDeleter::operator()(nghttp2_hd_inflater* inflater) const noexcept {
    nghttp2_hd_inflate_del(inflater);
}

HpackDecoder::HpackDecoder() {
    nghttp2_hd_inflater* raw = nullptr;
    if (nghttp2_hd_inflate_new(&raw) == 0) {
        inflater_.reset(raw);
    }
}

HpackDecoder::~HpackDecoder() = default;

expected<HeaderList, Error> HpackDecoder::decode(std::span<const uint8_t> block) {
    if (!inflater_) {
        return unexpected(Error::codec(CodecError::NotInitialized, "HPACK inflater missing"));
    }

    HeaderList fields;
    auto remaining = block;

    for (;;) {
        nghttp2_nv nv{};
        int flags = 0;
        // The whole block arrives in one HEADERS frame, so in_final is always set
        ssize_t consumed = nghttp2_hd_inflate_hd2(inflater_.get(), &nv, &flags,
                                                  remaining.data(), remaining.size(), 1);
        if (consumed < 0) {
            return unexpected(Error::codec(CodecError::DecodeFailed,
                lib_error("HPACK decode error", consumed)));
        }
        remaining = remaining.subspan(static_cast<size_t>(consumed));

        bool emitted = (flags & NGHTTP2_HD_INFLATE_EMIT) != 0;
        if (emitted) {
            fields.push_back({as_string(nv.name, nv.namelen), as_string(nv.value, nv.valuelen)});
        }
        if (flags & NGHTTP2_HD_INFLATE_FINAL) {
            nghttp2_hd_inflate_end_headers(inflater_.get());
            return fields;
        }
        if (consumed == 0 && !emitted) {
            return unexpected(Error::codec(CodecError::DecodeFailed,
                "HPACK decode error: truncated header block"));
        }
    }
}

// ============================================================================
// HPACK Encoder
// ============================================================================

void HpackEncoder::DeflaterDeleter::operator()(nghttp2_hd_deflater* deflater) const noexcept {
    nghttp2_hd_deflate_del(deflater);
}

HpackEncoder::HpackEncoder() {
    nghttp2_hd_deflater* raw = nullptr;
    if (nghttp2_hd_deflate_new(&raw, Constants::DefaultHeaderTableSize) == 0) {
        deflater_.reset(raw);
    }
}

HpackEncoder::~HpackEncoder() = default;

expected<std::vector<uint8_t>, Error> HpackEncoder::encode(std::span<const HeaderField> headers) {
    if (!deflater_) {
        return unexpected(Error::codec(CodecError::NotInitialized, "HPACK deflater missing"));
    }

    std::vector<nghttp2_nv> nvs;
    nvs.reserve(headers.size());
    std::transform(headers.begin(), headers.end(), std::back_inserter(nvs),
        [](const HeaderField& field) {
            return nghttp2_nv{as_bytes(field.name), as_bytes(field.value),
                              field.name.size(), field.value.size(), NGHTTP2_NV_FLAG_NONE};
        });

    std::vector<uint8_t> out(nghttp2_hd_deflate_bound(deflater_.get(), nvs.data(), nvs.size()));
    ssize_t written = nghttp2_hd_deflate_hd(deflater_.get(), out.data(), out.size(),
                                            nvs.data(), nvs.size());
    if (written < 0) {
        return unexpected(Error::codec(CodecError::EncodeFailed,
            lib_error("HPACK encode error", written)));
    }

    out.resize(static_cast<size_t>(written));
    return out;
}

void HpackEncoder::set_max_table_size(size_t size) {
    if (deflater_) {
        nghttp2_hd_deflate_change_table_size(deflater_.get(), size);
    }
}

// ============================================================================
// Header Utilities
// ============================================================================

const HeaderField* find_header(std::span<const HeaderField> headers, std::string_view name) {
    if (name.empty()) return nullptr;

    auto same_name = [name](const HeaderField& field) {
        if (name.front() == ':') {
            return field.name == name;
        }
        return std::equal(field.name.begin(), field.name.end(), name.begin(), name.end(),
            [](char a, char b) {
                return std::tolower(static_cast<unsigned char>(a)) ==
                       std::tolower(static_cast<unsigned char>(b));
            });
    };

    auto it = std::find_if(headers.begin(), headers.end(), same_name);
    return it == headers.end() ? nullptr : &*it;
}

} // namespace h2wire::http2
