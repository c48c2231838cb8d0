#include "h2wire/http2/preface.hpp"
#include "h2wire/http2/frame.hpp"

#include <array>
#include <cstring>

namespace h2wire::http2 {

bool is_client_preface(std::span<const uint8_t> bytes) noexcept {
    return bytes.size() == Constants::ClientPreface.size() &&
           std::memcmp(bytes.data(), Constants::ClientPreface.data(), bytes.size()) == 0;
}

expected<void, Error> read_client_preface(net::ByteStream& stream) {
    std::array<uint8_t, Constants::ClientPreface.size()> buffer{};

    auto result = stream.read_exact(buffer.data(), buffer.size());
    if (!result) {
        return unexpected(result.error());
    }

    if (!is_client_preface(buffer)) {
        return unexpected(Error::protocol(ProtocolError::InvalidPreface,
            "client preface mismatch"));
    }
    return {};
}

bool validate_preface(net::ByteStream& stream) {
    return read_client_preface(stream).has_value();
}

} // namespace h2wire::http2
