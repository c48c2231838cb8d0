#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <chrono>

#include "h2wire/net/byte_stream.hpp"

namespace h2wire::net {

// ============================================================================
// SocketStream - blocking TCP ByteStream
// ============================================================================

class SocketStream : public ByteStream {
    int fd_;
    std::string remote_addr_;
    std::vector<uint8_t> write_buffer_;
    std::chrono::milliseconds timeout_{0};

public:
    // Takes ownership of a connected socket descriptor
    SocketStream(int fd, std::string remote_addr);
    ~SocketStream() override;

    SocketStream(const SocketStream&) = delete;
    SocketStream& operator=(const SocketStream&) = delete;

    IoResult read_exact(void* buffer, size_t len) override;
    IoResult write_all(const void* buffer, size_t len) override;
    IoResult flush() override;
    void close() override;
    bool is_open() const noexcept override { return fd_ >= 0; }
    void set_timeout(std::chrono::milliseconds timeout) override;
    std::string remote_address() const override { return remote_addr_; }

    int fd() const noexcept { return fd_; }
};

// ============================================================================
// TcpListener - accepts incoming connections
// ============================================================================

using AcceptResult = expected<std::unique_ptr<ByteStream>, Error>;

class TcpListener {
    std::atomic<int> listen_fd_{-1};
    uint16_t port_ = 0;

public:
    TcpListener() = default;
    ~TcpListener();

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    // Bind and listen on an IPv4 address; port 0 picks an ephemeral port
    expected<void, Error> listen(const std::string& host, uint16_t port, int backlog = 128);

    // Block until a client connects; fails with IoError::Closed after close()
    AcceptResult accept();

    // Stop listening; wakes a thread blocked in accept()
    void close();

    bool is_listening() const noexcept { return listen_fd_ >= 0; }

    uint16_t local_port() const noexcept { return port_; }
};

} // namespace h2wire::net
