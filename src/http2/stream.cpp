#include "h2wire/http2/stream.hpp"

#include <string>

namespace h2wire::http2 {

std::string_view stream_state_name(StreamState state) noexcept {
    switch (state) {
        case StreamState::Idle: return "idle";
        case StreamState::Open: return "open";
        case StreamState::HalfClosedRemote: return "half-closed (remote)";
        case StreamState::Closed: return "closed";
        default: return "unknown";
    }
}

expected<void, Error> StreamRegistry::open(uint32_t stream_id) {
    if (stream_id == 0) {
        return unexpected(Error::protocol(ProtocolError::InvalidStream,
            "HEADERS on stream 0"));
    }
    if (stream_id % 2 == 0) {
        return unexpected(Error::protocol(ProtocolError::InvalidStream,
            "HEADERS on server-initiated stream " + std::to_string(stream_id)));
    }
    if (stream_id <= last_stream_id_) {
        return unexpected(Error::protocol(ProtocolError::InvalidStream,
            "stream " + std::to_string(stream_id) + " not above last stream " +
            std::to_string(last_stream_id_)));
    }

    streams_[stream_id] = StreamState::Open;
    last_stream_id_ = stream_id;
    return {};
}

void StreamRegistry::half_close(uint32_t stream_id) {
    auto it = streams_.find(stream_id);
    if (it != streams_.end() && it->second == StreamState::Open) {
        it->second = StreamState::HalfClosedRemote;
    }
}

void StreamRegistry::close(uint32_t stream_id) {
    streams_.erase(stream_id);
}

StreamState StreamRegistry::state(uint32_t stream_id) const {
    auto it = streams_.find(stream_id);
    if (it != streams_.end()) {
        return it->second;
    }
    return stream_id != 0 && stream_id <= last_stream_id_ ? StreamState::Closed : StreamState::Idle;
}

} // namespace h2wire::http2
