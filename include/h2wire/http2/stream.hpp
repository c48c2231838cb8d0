#pragma once

#include "h2wire/util/expected.hpp"
#include "h2wire/core/error.hpp"

#include <cstdint>
#include <map>
#include <string_view>

namespace h2wire::http2 {

// ============================================================================
// HTTP/2 Stream States (RFC 7540 Section 5.1)
// ============================================================================
//
// Only the client-initiated subset is modeled: no push, so no reserved states,
// and the server always finishes its side in one go.

enum class StreamState {
    Idle,
    Open,
    HalfClosedRemote,
    Closed,
};

std::string_view stream_state_name(StreamState state) noexcept;

// ============================================================================
// Stream Registry
// ============================================================================
//
// Per-connection map from stream id to state, kept apart from the frame
// dispatcher. Only live streams are stored: closed entries are erased and,
// like ids the client skipped over, reported as Closed from last_stream_id.

class StreamRegistry {
    std::map<uint32_t, StreamState> streams_;
    uint32_t last_stream_id_ = 0;

public:
    // A client HEADERS frame opens `stream_id`. The id must be odd, non-zero
    // and greater than every id opened before.
    expected<void, Error> open(uint32_t stream_id);

    // Remote side finished sending
    void half_close(uint32_t stream_id);

    // Response fully written; the entry is dropped
    void close(uint32_t stream_id);

    StreamState state(uint32_t stream_id) const;

    // Highest client stream id accepted so far (0 if none)
    uint32_t last_stream_id() const noexcept { return last_stream_id_; }

    // Streams not yet closed
    size_t active_count() const noexcept { return streams_.size(); }
};

} // namespace h2wire::http2
