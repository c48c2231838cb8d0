#pragma once

#include <variant>
#include <string>
#include <string_view>
#include <system_error>

namespace h2wire {

// ============================================================================
// Transport Errors (byte stream layer)
// ============================================================================

enum class IoError {
    Success = 0,
    ConnectionReset,
    EndOfStream,      // peer closed before the requested byte count arrived
    Timeout,
    Closed,           // operation on a stream we already closed
    AddressInUse,
    InvalidArgument,
    Unknown
};

// ============================================================================
// Protocol Violations (framing layer)
// ============================================================================

enum class ProtocolError {
    InvalidPreface = 1,
    UnexpectedFrame,
    MalformedSettings,
    FrameSizeError,
    InvalidSettingValue,
    UnknownFrameType,
    InvalidStream
};

// ============================================================================
// Header Codec Errors
// ============================================================================

enum class CodecError {
    DecodeFailed = 1,
    EncodeFailed,
    NotInitialized
};

} // namespace h2wire

template<>
struct std::is_error_code_enum<h2wire::IoError> : std::true_type {};

template<>
struct std::is_error_code_enum<h2wire::ProtocolError> : std::true_type {};

template<>
struct std::is_error_code_enum<h2wire::CodecError> : std::true_type {};

namespace h2wire {

const std::error_category& io_error_category() noexcept;
std::error_code make_error_code(IoError e) noexcept;

const std::error_category& protocol_error_category() noexcept;
std::error_code make_error_code(ProtocolError e) noexcept;

const std::error_category& codec_error_category() noexcept;
std::error_code make_error_code(CodecError e) noexcept;

// ============================================================================
// Unified Error Type
// ============================================================================

class Error {
public:
    using Variant = std::variant<IoError, ProtocolError, CodecError, std::error_code>;

private:
    Variant inner_;
    std::string message_;

public:
    Error() : inner_(IoError::Success) {}

    Error(IoError e, std::string message = "")
        : inner_(e), message_(std::move(message)) {}

    Error(ProtocolError e, std::string message = "")
        : inner_(e), message_(std::move(message)) {}

    Error(CodecError e, std::string message = "")
        : inner_(e), message_(std::move(message)) {}

    Error(std::error_code ec, std::string message = "")
        : inner_(ec), message_(std::move(message)) {}

    static Error io(IoError e, std::string msg = "") {
        return Error(e, std::move(msg));
    }

    static Error protocol(ProtocolError e, std::string msg = "") {
        return Error(e, std::move(msg));
    }

    static Error codec(CodecError e, std::string msg = "") {
        return Error(e, std::move(msg));
    }

    static Error system(std::error_code ec, std::string msg = "") {
        return Error(ec, std::move(msg));
    }

    static Error from_errno(int err, std::string msg = "");

    static Error timeout() {
        return Error(IoError::Timeout, "Operation timed out");
    }

    bool is_io() const noexcept { return std::holds_alternative<IoError>(inner_); }
    bool is_protocol() const noexcept { return std::holds_alternative<ProtocolError>(inner_); }
    bool is_codec() const noexcept { return std::holds_alternative<CodecError>(inner_); }
    bool is_system() const noexcept { return std::holds_alternative<std::error_code>(inner_); }

    // Transport failures: I/O enums and raw errno codes
    bool is_transport() const noexcept { return is_io() || is_system(); }

    bool is_timeout() const noexcept {
        return is_io() && std::get<IoError>(inner_) == IoError::Timeout;
    }

    IoError io_error() const noexcept {
        return is_io() ? std::get<IoError>(inner_) : IoError::Unknown;
    }

    ProtocolError protocol_error() const noexcept {
        return is_protocol() ? std::get<ProtocolError>(inner_) : ProtocolError::UnexpectedFrame;
    }

    CodecError codec_error() const noexcept {
        return is_codec() ? std::get<CodecError>(inner_) : CodecError::DecodeFailed;
    }

    std::error_code system_error() const noexcept {
        return is_system() ? std::get<std::error_code>(inner_) : std::error_code{};
    }

    std::error_code code() const noexcept;

    std::string_view message() const noexcept { return message_; }

    std::string to_string() const;

    bool operator==(const Error& other) const noexcept {
        return inner_ == other.inner_;
    }

    bool operator!=(const Error& other) const noexcept {
        return !(*this == other);
    }

    // True if this holds an error
    explicit operator bool() const noexcept {
        if (is_io()) return std::get<IoError>(inner_) != IoError::Success;
        if (is_system()) return static_cast<bool>(std::get<std::error_code>(inner_));
        return true;
    }
};

} // namespace h2wire
