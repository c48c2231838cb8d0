#pragma once

#include "h2wire/util/expected.hpp"
#include "h2wire/core/error.hpp"
#include "h2wire/net/byte_stream.hpp"

#include <cstdint>
#include <span>

namespace h2wire::http2 {

// True only for the exact 24-byte client connection preface
bool is_client_preface(std::span<const uint8_t> bytes) noexcept;

// Reads exactly 24 bytes and checks them against the client preface.
// Fails with the transport error on a short read, InvalidPreface on mismatch.
expected<void, Error> read_client_preface(net::ByteStream& stream);

// Any short read, I/O error or mismatch yields false
bool validate_preface(net::ByteStream& stream);

} // namespace h2wire::http2
