#pragma once

#include <cstddef>
#include <cstdint>
#include <chrono>
#include <string>

#include "h2wire/util/expected.hpp"
#include "h2wire/core/error.hpp"

namespace h2wire::net {

using IoResult = expected<void, Error>;

// ============================================================================
// ByteStream - duplex, ordered, reliable byte channel
// ============================================================================
//
// Every call blocks the calling worker until it completes or fails. A short
// read (peer closed before `len` bytes arrived) reports IoError::EndOfStream.

class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Read exactly `len` bytes into buffer
    virtual IoResult read_exact(void* buffer, size_t len) = 0;

    // Queue `len` bytes for the peer; they reach the wire on flush()
    virtual IoResult write_all(const void* buffer, size_t len) = 0;

    // Push every queued byte to the peer
    virtual IoResult flush() = 0;

    virtual void close() = 0;

    virtual bool is_open() const noexcept = 0;

    // Deadline for a whole read_exact() and for each send; zero disables it
    virtual void set_timeout(std::chrono::milliseconds timeout) = 0;

    virtual std::string remote_address() const = 0;
};

} // namespace h2wire::net
