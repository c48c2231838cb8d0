#include <catch2/catch_test_macros.hpp>

#include "h2wire/http2/response.hpp"
#include "support/memory_stream.hpp"

#include <string>

using namespace h2wire;
using namespace h2wire::http2;
using h2wire::testing::MemoryStream;
using h2wire::testing::MemoryStreamState;
using h2wire::testing::split_frames;

namespace {

std::string as_string(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // anonymous namespace

TEST_CASE("Plain header block rendering", "[http2][response]") {
    HeaderList fields = {{":status", "200"}, {"content-length", "12"}};
    REQUIRE(as_string(render_plain_header_block(fields)) == ":status: 200\r\ncontent-length: 12\r\n\r\n");
    REQUIRE(as_string(render_plain_header_block({})) == "\r\n");
}

TEST_CASE("Default response", "[http2][response]") {
    auto state = std::make_shared<MemoryStreamState>();
    MemoryStream stream(state);
    ResponseEncoder encoder;
    Settings settings;

    auto result = encoder.send_response(stream, 1, settings);
    REQUIRE(result.has_value());
    REQUIRE(state->pending.empty());
    REQUIRE(state->flushes == 1);

    auto frames = split_frames(state->output);
    REQUIRE(frames.size() == 2);

    const auto& headers = frames[0];
    REQUIRE(headers.header.type == FrameType::Headers);
    REQUIRE(headers.header.stream_id == 1);
    REQUIRE(headers.header.has_end_headers());
    REQUIRE_FALSE(headers.header.has_end_stream());
    REQUIRE(as_string(headers.payload) == ":status: 200\r\ncontent-length: 12\r\n\r\n");

    const auto& data = frames[1];
    REQUIRE(data.header.type == FrameType::Data);
    REQUIRE(data.header.stream_id == 1);
    REQUIRE(data.header.has_end_stream());
    REQUIRE(data.header.length == 13);
    REQUIRE(as_string(data.payload) == "Hello, world!");
}

TEST_CASE("Custom body advertises its own length", "[http2][response]") {
    auto state = std::make_shared<MemoryStreamState>();
    MemoryStream stream(state);

    ResponseOptions options;
    options.body = "pong";
    options.content_length.reset();
    ResponseEncoder encoder(options);

    REQUIRE(encoder.send_response(stream, 3, Settings{}).has_value());

    auto frames = split_frames(state->output);
    REQUIRE(frames.size() == 2);
    REQUIRE(as_string(frames[0].payload) == ":status: 200\r\ncontent-length: 4\r\n\r\n");
    REQUIRE(as_string(frames[1].payload) == "pong");
}

TEST_CASE("Body is split at the peer's MAX_FRAME_SIZE", "[http2][response]") {
    auto state = std::make_shared<MemoryStreamState>();
    MemoryStream stream(state);

    ResponseOptions options;
    options.body = std::string(40000, 'x');
    options.content_length.reset();
    ResponseEncoder encoder(options);

    Settings settings;
    REQUIRE(encoder.send_response(stream, 5, settings).has_value());

    auto frames = split_frames(state->output);
    REQUIRE(frames.size() == 4);
    REQUIRE(frames[1].header.length == 16384);
    REQUIRE(frames[2].header.length == 16384);
    REQUIRE(frames[3].header.length == 40000 - 2 * 16384);
    REQUIRE_FALSE(frames[1].header.has_end_stream());
    REQUIRE_FALSE(frames[2].header.has_end_stream());
    REQUIRE(frames[3].header.has_end_stream());

    SECTION("Larger peer frames mean fewer DATA frames") {
        state->output.clear();
        settings.max_frame_size = 65536;
        REQUIRE(encoder.send_response(stream, 7, settings).has_value());
        auto more = split_frames(state->output);
        REQUIRE(more.size() == 2);
        REQUIRE(more[1].header.length == 40000);
    }

    SECTION("Sizes below the protocol minimum are not honored") {
        state->output.clear();
        settings.max_frame_size = 0;
        REQUIRE(encoder.send_response(stream, 7, settings).has_value());
        REQUIRE(split_frames(state->output).size() == 4);
    }
}

TEST_CASE("Empty body still ends the stream", "[http2][response]") {
    auto state = std::make_shared<MemoryStreamState>();
    MemoryStream stream(state);

    ResponseOptions options;
    options.status = "204";
    options.body.clear();
    options.content_length.reset();
    ResponseEncoder encoder(options);

    REQUIRE(encoder.send_response(stream, 1, Settings{}).has_value());

    auto frames = split_frames(state->output);
    REQUIRE(frames.size() == 2);
    REQUIRE(frames[1].header.length == 0);
    REQUIRE(frames[1].header.has_end_stream());
}

TEST_CASE("HPACK response encoding", "[http2][response][hpack]") {
    auto state = std::make_shared<MemoryStreamState>();
    MemoryStream stream(state);

    ResponseOptions options;
    options.encoding = HeaderEncoding::Hpack;
    ResponseEncoder encoder(options);

    REQUIRE(encoder.send_response(stream, 1, Settings{}).has_value());

    auto frames = split_frames(state->output);
    REQUIRE(frames.size() == 2);

    HpackDecoder decoder;
    auto decoded = decoder.decode(frames[0].payload);
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->size() == 2);
    REQUIRE((*decoded)[0] == HeaderField{":status", "200"});
    REQUIRE((*decoded)[1] == HeaderField{"content-length", "12"});
}

TEST_CASE("Write failure is reported", "[http2][response]") {
    auto state = std::make_shared<MemoryStreamState>();
    state->fail_writes = true;
    MemoryStream stream(state);
    ResponseEncoder encoder;

    auto result = encoder.send_response(stream, 1, Settings{});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().io_error() == IoError::ConnectionReset);
    REQUIRE(state->output.empty());
}
