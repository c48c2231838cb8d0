#include "h2wire/http2/response.hpp"
#include "h2wire/http2/frame.hpp"
#include "h2wire/core/logging.hpp"

#include <algorithm>

namespace h2wire::http2 {

std::vector<uint8_t> render_plain_header_block(const HeaderList& fields) {
    std::string text;
    for (const auto& field : fields) {
        text += field.name;
        text += ": ";
        text += field.value;
        text += "\r\n";
    }
    text += "\r\n";
    return std::vector<uint8_t>(text.begin(), text.end());
}

ResponseEncoder::ResponseEncoder(ResponseOptions options)
    : options_(std::move(options))
{
}

HeaderList ResponseEncoder::header_fields() const {
    size_t length = options_.content_length.value_or(options_.body.size());
    return {
        {":status", options_.status},
        {"content-length", std::to_string(length)},
    };
}

expected<std::vector<uint8_t>, Error> ResponseEncoder::encode_header_block(const Settings& settings) {
    auto fields = header_fields();

    if (options_.encoding == HeaderEncoding::Plain) {
        return render_plain_header_block(fields);
    }

    if (settings.header_table_size != table_size_) {
        hpack_.set_max_table_size(settings.header_table_size);
        table_size_ = settings.header_table_size;
    }
    return hpack_.encode(fields);
}

expected<void, Error> ResponseEncoder::send_response(net::ByteStream& stream, uint32_t stream_id,
                                                     const Settings& settings) {
    auto block = encode_header_block(settings);
    if (!block) {
        return unexpected(block.error());
    }

    auto headers = serialize_headers_frame(stream_id, *block, false, true);
    if (auto r = stream.write_all(headers.data(), headers.size()); !r) {
        return r;
    }

    // A peer-announced size below the protocol minimum is not honored
    size_t chunk = std::clamp(settings.max_frame_size, Constants::MinMaxFrameSize,
                              Constants::MaxMaxFrameSize);

    std::span<const uint8_t> body(reinterpret_cast<const uint8_t*>(options_.body.data()),
                                  options_.body.size());
    do {
        size_t n = std::min(chunk, body.size());
        bool last = n == body.size();
        auto data = serialize_data_frame(stream_id, body.first(n), last);
        if (auto r = stream.write_all(data.data(), data.size()); !r) {
            return r;
        }
        body = body.subspan(n);
    } while (!body.empty());

    if (auto r = stream.flush(); !r) {
        return r;
    }

    log_debug("Sent response on stream " + std::to_string(stream_id) +
              " (" + std::to_string(options_.body.size()) + " body bytes)");
    return {};
}

} // namespace h2wire::http2
