#include <catch2/catch_test_macros.hpp>
#include <h2wire/core/error.hpp>

#include <cerrno>

using namespace h2wire;

TEST_CASE("Error construction", "[error]") {
    SECTION("IoError") {
        Error e(IoError::Timeout, "Read deadline expired");
        REQUIRE(e.is_io());
        REQUIRE(!e.is_protocol());
        REQUIRE(!e.is_system());
        REQUIRE(e.is_transport());
        REQUIRE(e.io_error() == IoError::Timeout);
        REQUIRE(e.message() == "Read deadline expired");
    }

    SECTION("ProtocolError") {
        Error e(ProtocolError::InvalidPreface, "bad magic");
        REQUIRE(!e.is_io());
        REQUIRE(e.is_protocol());
        REQUIRE(!e.is_transport());
        REQUIRE(e.protocol_error() == ProtocolError::InvalidPreface);
    }

    SECTION("CodecError") {
        Error e = Error::codec(CodecError::DecodeFailed);
        REQUIRE(e.is_codec());
        REQUIRE(!e.is_transport());
        REQUIRE(e.codec_error() == CodecError::DecodeFailed);
    }

    SECTION("system error") {
        auto ec = std::make_error_code(std::errc::no_such_file_or_directory);
        Error e(ec);
        REQUIRE(!e.is_io());
        REQUIRE(e.is_system());
        REQUIRE(e.is_transport());
        REQUIRE(e.system_error() == ec);
    }

    SECTION("default is not an error") {
        Error e;
        REQUIRE_FALSE(static_cast<bool>(e));
        REQUIRE(static_cast<bool>(Error(ProtocolError::UnexpectedFrame)));
    }
}

TEST_CASE("Error factory methods", "[error]") {
    SECTION("timeout") {
        Error e = Error::timeout();
        REQUIRE(e.is_timeout());
        REQUIRE(e.io_error() == IoError::Timeout);
    }

    SECTION("protocol") {
        Error e = Error::protocol(ProtocolError::FrameSizeError, "too big");
        REQUIRE(e.is_protocol());
        REQUIRE(!e.is_timeout());
    }
}

TEST_CASE("Error from errno", "[error]") {
    REQUIRE(Error::from_errno(ECONNRESET).io_error() == IoError::ConnectionReset);
    REQUIRE(Error::from_errno(EPIPE).io_error() == IoError::ConnectionReset);
    REQUIRE(Error::from_errno(EAGAIN).is_timeout());
    REQUIRE(Error::from_errno(ETIMEDOUT).is_timeout());
    REQUIRE(Error::from_errno(EADDRINUSE).io_error() == IoError::AddressInUse);

    Error other = Error::from_errno(EACCES, "bind");
    REQUIRE(other.is_system());
    REQUIRE(other.system_error().value() == EACCES);
    REQUIRE(other.message() == "bind");
}

TEST_CASE("Error codes and categories", "[error]") {
    REQUIRE(Error(IoError::EndOfStream).code().category().name() == std::string("h2wire.io"));
    REQUIRE(Error(ProtocolError::UnexpectedFrame).code().category().name() == std::string("h2wire.protocol"));
    REQUIRE(Error(CodecError::DecodeFailed).code().category().name() == std::string("h2wire.codec"));

    std::error_code ec = ProtocolError::InvalidStream;
    REQUIRE(ec == make_error_code(ProtocolError::InvalidStream));
    REQUIRE(ec.message() == "Invalid stream identifier");
}

TEST_CASE("Error to_string", "[error]") {
    SECTION("IoError") {
        Error e(IoError::ConnectionReset, "Connection was reset");
        std::string s = e.to_string();
        REQUIRE(s.find("Connection reset") != std::string::npos);
        REQUIRE(s.find("Connection was reset") != std::string::npos);
    }

    SECTION("ProtocolError") {
        Error e(ProtocolError::InvalidPreface);
        REQUIRE(e.to_string() == "ProtocolError::Invalid connection preface");
    }

    SECTION("CodecError with message") {
        Error e(CodecError::DecodeFailed, "index 126");
        REQUIRE(e.to_string() == "CodecError::Header block decode failed - index 126");
    }
}

TEST_CASE("Error equality", "[error]") {
    REQUIRE(Error(IoError::Timeout, "a") == Error(IoError::Timeout, "b"));
    REQUIRE(Error(IoError::Timeout) != Error(IoError::Closed));
    REQUIRE(Error(ProtocolError::InvalidStream) != Error(IoError::Timeout));
}
