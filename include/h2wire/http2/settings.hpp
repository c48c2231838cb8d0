#pragma once

#include "h2wire/util/expected.hpp"
#include "h2wire/core/error.hpp"
#include "h2wire/http2/frame.hpp"

#include <cstdint>
#include <span>

namespace h2wire::http2 {

// ============================================================================
// Connection Settings (RFC 7540 Section 6.5)
// ============================================================================
//
// Parameters announced by the peer. Created with protocol defaults, then
// updated in place by every SETTINGS frame the connection accepts.

struct Settings {
    uint32_t max_concurrent_streams = Constants::DefaultMaxConcurrentStreams;
    uint32_t initial_window_size = Constants::DefaultInitialWindowSize;
    bool enable_push = true;
    uint32_t header_table_size = Constants::DefaultHeaderTableSize;
    uint32_t max_frame_size = Constants::DefaultMaxFrameSize;

    // Returns false for an unrecognized key, which leaves every field untouched
    bool apply(uint16_t key, uint32_t value);

    // Apply each entry in order
    void apply_all(std::span<const SettingsEntry> entries);

    // Range checks for recognized keys; unknown keys always pass
    static expected<void, Error> validate(uint16_t key, uint32_t value);
};

} // namespace h2wire::http2
