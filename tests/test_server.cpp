#include <catch2/catch_test_macros.hpp>

#include "h2wire/server/server.hpp"
#include "h2wire/http2/frame.hpp"
#include "h2wire/http2/hpack.hpp"
#include "support/memory_stream.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <chrono>
#include <thread>

using namespace h2wire;
using namespace h2wire::http2;

namespace {

// Minimal blocking client for loopback tests
class TestClient {
    int fd_ = -1;

public:
    explicit TestClient(uint16_t port) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
            ::close(fd_);
            fd_ = -1;
        }
        timeval tv{};
        tv.tv_sec = 5;
        if (fd_ >= 0) {
            ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        }
    }

    ~TestClient() {
        if (fd_ >= 0) ::close(fd_);
    }

    bool connected() const { return fd_ >= 0; }

    bool send(const std::vector<uint8_t>& bytes) {
        size_t sent = 0;
        while (sent < bytes.size()) {
            ssize_t n = ::send(fd_, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) return false;
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    // Everything the server writes until it closes the socket
    std::vector<uint8_t> read_until_close() {
        std::vector<uint8_t> result;
        uint8_t buffer[4096];
        while (true) {
            ssize_t n = ::recv(fd_, buffer, sizeof(buffer), 0);
            if (n <= 0) break;
            result.insert(result.end(), buffer, buffer + n);
        }
        return result;
    }

    void shutdown_write() { ::shutdown(fd_, SHUT_WR); }
};

ServerConfig loopback_config() {
    ServerConfig config;
    config.host = "127.0.0.1";
    config.port = 0;
    config.read_timeout = std::chrono::milliseconds(2000);
    return config;
}

} // anonymous namespace

TEST_CASE("Listener binds an ephemeral port", "[server][net]") {
    net::TcpListener listener;
    REQUIRE(listener.listen("127.0.0.1", 0).has_value());
    REQUIRE(listener.is_listening());
    REQUIRE(listener.local_port() != 0);

    listener.close();
    REQUIRE_FALSE(listener.is_listening());

    auto accepted = listener.accept();
    REQUIRE_FALSE(accepted.has_value());
    REQUIRE(accepted.error().io_error() == IoError::Closed);
}

TEST_CASE("Listener rejects a malformed host", "[server][net]") {
    net::TcpListener listener;
    auto result = listener.listen("not-an-address", 0);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().io_error() == IoError::InvalidArgument);
}

TEST_CASE("Read deadline covers the whole read", "[server][net]") {
    net::TcpListener listener;
    REQUIRE(listener.listen("127.0.0.1", 0).has_value());

    TestClient client(listener.local_port());
    REQUIRE(client.connected());
    auto accepted = listener.accept();
    REQUIRE(accepted.has_value());
    auto& stream = *accepted;
    stream->set_timeout(std::chrono::milliseconds(300));

    SECTION("Bytes trickled within the per-byte gap still expire") {
        // Each gap is shorter than the timeout, the whole header is not
        std::thread sender([&client] {
            for (int i = 0; i < 9; ++i) {
                if (!client.send({static_cast<uint8_t>(i)})) return;
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });

        auto started = std::chrono::steady_clock::now();
        std::array<uint8_t, 9> header{};
        auto result = stream->read_exact(header.data(), header.size());
        auto elapsed = std::chrono::steady_clock::now() - started;
        sender.join();

        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().is_timeout());
        REQUIRE(elapsed < std::chrono::milliseconds(800));
    }

    SECTION("A read completed in time succeeds") {
        REQUIRE(client.send({1, 2, 3, 4}));
        std::array<uint8_t, 4> bytes{};
        REQUIRE(stream->read_exact(bytes.data(), bytes.size()).has_value());
        REQUIRE(bytes[3] == 4);
    }
}

TEST_CASE("Server answers a request over TCP", "[server]") {
    Server server(loopback_config());
    REQUIRE(server.listen().has_value());
    REQUIRE(server.port() != 0);

    // Assertions stay on the test thread
    bool run_ok = false;
    std::thread acceptor([&server, &run_ok] { run_ok = server.run().has_value(); });

    {
        TestClient client(server.port());
        REQUIRE(client.connected());

        HpackEncoder encoder;
        HeaderList request = {
            {":method", "GET"}, {":scheme", "http"}, {":path", "/"}, {":authority", "localhost"},
        };
        auto block = encoder.encode(request);
        REQUIRE(block.has_value());

        auto bytes = testing::preface_bytes();
        auto settings = serialize_settings_frame({});
        auto headers = serialize_headers_frame(1, *block, true, true);
        bytes.insert(bytes.end(), settings.begin(), settings.end());
        bytes.insert(bytes.end(), headers.begin(), headers.end());
        REQUIRE(client.send(bytes));
        client.shutdown_write();

        auto frames = testing::split_frames(client.read_until_close());
        REQUIRE(frames.size() == 4);
        REQUIRE(frames[0].header.type == FrameType::Settings);
        REQUIRE(frames[1].header.has_ack());
        REQUIRE(frames[2].header.type == FrameType::Headers);
        REQUIRE(frames[2].header.stream_id == 1);
        REQUIRE(frames[3].header.type == FrameType::Data);
        REQUIRE(frames[3].header.has_end_stream());
        REQUIRE(std::string(frames[3].payload.begin(), frames[3].payload.end()) == "Hello, world!");
    }

    REQUIRE(server.shutdown(std::chrono::seconds(5)));
    acceptor.join();

    REQUIRE(run_ok);
    REQUIRE(server.accepted_connections() == 1);
    REQUIRE(server.active_connections() == 0);
    REQUIRE_FALSE(server.is_running());
}

TEST_CASE("Server closes a client with a bad preface", "[server]") {
    Server server(loopback_config());
    REQUIRE(server.listen().has_value());

    bool run_ok = false;
    std::thread acceptor([&server, &run_ok] { run_ok = server.run().has_value(); });

    {
        TestClient client(server.port());
        REQUIRE(client.connected());
        std::string text = "GET / HTTP/1.1\r\nHost: localhost\r\n\r\n";
        REQUIRE(client.send(std::vector<uint8_t>(text.begin(), text.end())));
        REQUIRE(client.read_until_close().empty());
    }

    REQUIRE(server.shutdown(std::chrono::seconds(5)));
    acceptor.join();
    REQUIRE(run_ok);
}

TEST_CASE("Stopped server refuses to run again", "[server]") {
    Server server(loopback_config());
    server.stop();
    auto result = server.run();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().io_error() == IoError::Closed);
}
