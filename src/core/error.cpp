#include "h2wire/core/error.hpp"

#include <cerrno>
#include <sstream>
#include <type_traits>

namespace h2wire {

// ============================================================================
// Error Categories
// ============================================================================

namespace {

class IoErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "h2wire.io";
    }

    std::string message(int ev) const override {
        switch (static_cast<IoError>(ev)) {
            case IoError::Success: return "Success";
            case IoError::ConnectionReset: return "Connection reset";
            case IoError::EndOfStream: return "End of stream";
            case IoError::Timeout: return "Operation timed out";
            case IoError::Closed: return "Stream closed";
            case IoError::AddressInUse: return "Address already in use";
            case IoError::InvalidArgument: return "Invalid argument";
            case IoError::Unknown: return "Unknown error";
            default: return "Unknown I/O error";
        }
    }
};

class ProtocolErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "h2wire.protocol";
    }

    std::string message(int ev) const override {
        switch (static_cast<ProtocolError>(ev)) {
            case ProtocolError::InvalidPreface: return "Invalid connection preface";
            case ProtocolError::UnexpectedFrame: return "Unexpected frame";
            case ProtocolError::MalformedSettings: return "Malformed SETTINGS payload";
            case ProtocolError::FrameSizeError: return "Frame size error";
            case ProtocolError::InvalidSettingValue: return "Invalid setting value";
            case ProtocolError::UnknownFrameType: return "Unknown frame type";
            case ProtocolError::InvalidStream: return "Invalid stream identifier";
            default: return "Unknown protocol error";
        }
    }
};

class CodecErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "h2wire.codec";
    }

    std::string message(int ev) const override {
        switch (static_cast<CodecError>(ev)) {
            case CodecError::DecodeFailed: return "Header block decode failed";
            case CodecError::EncodeFailed: return "Header block encode failed";
            case CodecError::NotInitialized: return "Header codec not initialized";
            default: return "Unknown codec error";
        }
    }
};

const IoErrorCategory io_category_instance{};
const ProtocolErrorCategory protocol_category_instance{};
const CodecErrorCategory codec_category_instance{};

} // anonymous namespace

const std::error_category& io_error_category() noexcept {
    return io_category_instance;
}

const std::error_category& protocol_error_category() noexcept {
    return protocol_category_instance;
}

const std::error_category& codec_error_category() noexcept {
    return codec_category_instance;
}

std::error_code make_error_code(IoError e) noexcept {
    return {static_cast<int>(e), io_error_category()};
}

std::error_code make_error_code(ProtocolError e) noexcept {
    return {static_cast<int>(e), protocol_error_category()};
}

std::error_code make_error_code(CodecError e) noexcept {
    return {static_cast<int>(e), codec_error_category()};
}

// ============================================================================
// Error Implementation
// ============================================================================

Error Error::from_errno(int err, std::string msg) {
    switch (err) {
        case ECONNRESET:
        case EPIPE:
            return Error(IoError::ConnectionReset, std::move(msg));
        case EAGAIN:
#if EWOULDBLOCK != EAGAIN
        case EWOULDBLOCK:
#endif
        case ETIMEDOUT:
            return Error(IoError::Timeout, std::move(msg));
        case EADDRINUSE:
            return Error(IoError::AddressInUse, std::move(msg));
        default:
            return Error(std::error_code(err, std::system_category()), std::move(msg));
    }
}

std::error_code Error::code() const noexcept {
    return std::visit([](const auto& e) -> std::error_code {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, std::error_code>) {
            return e;
        } else {
            return make_error_code(e);
        }
    }, inner_);
}

std::string Error::to_string() const {
    std::ostringstream oss;

    if (is_io()) {
        oss << "IoError::" << io_error_category().message(static_cast<int>(std::get<IoError>(inner_)));
    } else if (is_protocol()) {
        oss << "ProtocolError::"
            << protocol_error_category().message(static_cast<int>(std::get<ProtocolError>(inner_)));
    } else if (is_codec()) {
        oss << "CodecError::" << codec_error_category().message(static_cast<int>(std::get<CodecError>(inner_)));
    } else if (is_system()) {
        auto ec = std::get<std::error_code>(inner_);
        oss << "SystemError::" << ec.category().name() << ":" << ec.value() << " " << ec.message();
    }

    if (!message_.empty()) {
        oss << " - " << message_;
    }

    return oss.str();
}

} // namespace h2wire
