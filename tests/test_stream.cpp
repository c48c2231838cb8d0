#include <catch2/catch_test_macros.hpp>

#include "h2wire/http2/stream.hpp"

using namespace h2wire;
using namespace h2wire::http2;

TEST_CASE("Stream registry opening rules", "[http2][stream]") {
    StreamRegistry streams;

    SECTION("First client stream") {
        REQUIRE(streams.open(1).has_value());
        REQUIRE(streams.state(1) == StreamState::Open);
        REQUIRE(streams.last_stream_id() == 1);
        REQUIRE(streams.active_count() == 1);
    }

    SECTION("Half-close only applies to open streams") {
        REQUIRE(streams.open(1).has_value());
        streams.half_close(1);
        REQUIRE(streams.state(1) == StreamState::HalfClosedRemote);
        streams.half_close(1);
        REQUIRE(streams.state(1) == StreamState::HalfClosedRemote);
        REQUIRE(streams.active_count() == 1);
    }

    SECTION("Stream 0 is rejected") {
        auto r = streams.open(0);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().protocol_error() == ProtocolError::InvalidStream);
    }

    SECTION("Even ids are rejected") {
        REQUIRE_FALSE(streams.open(2).has_value());
        REQUIRE(streams.last_stream_id() == 0);
    }

    SECTION("Ids must increase") {
        REQUIRE(streams.open(5).has_value());
        REQUIRE_FALSE(streams.open(5).has_value());
        REQUIRE_FALSE(streams.open(3).has_value());
        REQUIRE(streams.open(7).has_value());
        REQUIRE(streams.last_stream_id() == 7);
    }
}

TEST_CASE("Stream registry lifecycle", "[http2][stream]") {
    StreamRegistry streams;

    REQUIRE(streams.state(1) == StreamState::Idle);

    REQUIRE(streams.open(1).has_value());
    streams.half_close(1);
    REQUIRE(streams.state(1) == StreamState::HalfClosedRemote);

    streams.close(1);
    REQUIRE(streams.state(1) == StreamState::Closed);
    REQUIRE(streams.active_count() == 0);

    SECTION("Skipped ids count as closed") {
        REQUIRE(streams.open(7).has_value());
        REQUIRE(streams.state(3) == StreamState::Closed);
        REQUIRE(streams.state(5) == StreamState::Closed);
        REQUIRE(streams.state(9) == StreamState::Idle);
    }

    SECTION("Unknown ids are left alone") {
        streams.close(11);
        streams.half_close(13);
        REQUIRE(streams.active_count() == 0);
        REQUIRE(streams.state(11) == StreamState::Idle);
        REQUIRE(streams.state(13) == StreamState::Idle);
    }
}

TEST_CASE("Closed streams are not retained", "[http2][stream]") {
    StreamRegistry streams;
    for (uint32_t id = 1; id < 20000; id += 2) {
        REQUIRE(streams.open(id).has_value());
        streams.half_close(id);
        streams.close(id);
    }
    REQUIRE(streams.active_count() == 0);
    REQUIRE(streams.state(9999) == StreamState::Closed);
    REQUIRE(streams.last_stream_id() == 19999);
}

TEST_CASE("Stream state names", "[http2][stream]") {
    REQUIRE(stream_state_name(StreamState::Idle) == "idle");
    REQUIRE(stream_state_name(StreamState::HalfClosedRemote) == "half-closed (remote)");
}
