#include "h2wire/net/socket.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>

namespace h2wire::net {

namespace {

// Writes are buffered until flush() up to this many bytes
constexpr size_t kMaxBufferedWrite = 64 * 1024;

timeval to_timeval(std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return tv;
}

// Waits until fd is readable or the deadline passes
IoResult wait_readable(int fd, std::chrono::steady_clock::time_point deadline) {
    using namespace std::chrono;
    for (;;) {
        auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
        if (remaining.count() <= 0) {
            return unexpected(Error::io(IoError::Timeout, "read deadline expired"));
        }

        pollfd pfd{fd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(std::min<milliseconds::rep>(remaining.count(), INT32_MAX)));
        if (rc > 0) {
            return {};
        }
        if (rc < 0 && errno != EINTR) {
            return unexpected(Error::from_errno(errno, "poll"));
        }
    }
}

void set_tcp_options(int fd) {
    int opt = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
}

} // anonymous namespace

// ============================================================================
// SocketStream
// ============================================================================

SocketStream::SocketStream(int fd, std::string remote_addr)
    : fd_(fd)
    , remote_addr_(std::move(remote_addr))
{
}

SocketStream::~SocketStream() {
    close();
}

IoResult SocketStream::read_exact(void* buffer, size_t len) {
    if (fd_ < 0) {
        return unexpected(Error::io(IoError::Closed, "read on closed stream"));
    }

    // One deadline covers the whole read, however the bytes are split
    bool bounded = timeout_.count() > 0;
    auto deadline = std::chrono::steady_clock::now() + timeout_;

    auto* out = static_cast<uint8_t*>(buffer);
    size_t total = 0;
    while (total < len) {
        if (bounded) {
            if (auto r = wait_readable(fd_, deadline); !r) {
                return r;
            }
        }
        ssize_t n = ::recv(fd_, out + total, len - total, 0);
        if (n > 0) {
            total += static_cast<size_t>(n);
            continue;
        }
        if (n == 0) {
            return unexpected(Error::io(IoError::EndOfStream,
                "peer closed after " + std::to_string(total) + " of " + std::to_string(len) + " bytes"));
        }
        if (errno == EINTR) {
            continue;
        }
        return unexpected(Error::from_errno(errno, "recv"));
    }
    return {};
}

IoResult SocketStream::write_all(const void* buffer, size_t len) {
    if (fd_ < 0) {
        return unexpected(Error::io(IoError::Closed, "write on closed stream"));
    }

    const auto* bytes = static_cast<const uint8_t*>(buffer);
    write_buffer_.insert(write_buffer_.end(), bytes, bytes + len);

    if (write_buffer_.size() >= kMaxBufferedWrite) {
        return flush();
    }
    return {};
}

IoResult SocketStream::flush() {
    if (fd_ < 0) {
        return unexpected(Error::io(IoError::Closed, "flush on closed stream"));
    }

    size_t sent = 0;
    while (sent < write_buffer_.size()) {
        ssize_t n = ::send(fd_, write_buffer_.data() + sent, write_buffer_.size() - sent, MSG_NOSIGNAL);
        if (n >= 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (errno == EINTR) {
            continue;
        }
        int err = errno;
        write_buffer_.clear();
        return unexpected(Error::from_errno(err, "send"));
    }
    write_buffer_.clear();
    return {};
}

void SocketStream::close() {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
        fd_ = -1;
    }
    write_buffer_.clear();
}

void SocketStream::set_timeout(std::chrono::milliseconds timeout) {
    timeout_ = timeout;
    if (fd_ < 0) return;

    // Reads are bounded in read_exact(); only sends use the socket option
    auto tv = to_timeval(timeout.count() > 0 ? timeout : std::chrono::milliseconds{0});
    setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

// ============================================================================
// TcpListener
// ============================================================================

TcpListener::~TcpListener() {
    close();
}

expected<void, Error> TcpListener::listen(const std::string& host, uint16_t port, int backlog) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        return unexpected(Error::io(IoError::InvalidArgument, "invalid IPv4 address: " + host));
    }

    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return unexpected(Error::system(std::error_code(errno, std::system_category()), "socket"));
    }

    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(fd);
        return unexpected(Error::from_errno(err, "bind " + host + ":" + std::to_string(port)));
    }

    if (::listen(fd, backlog) < 0) {
        int err = errno;
        ::close(fd);
        return unexpected(Error::from_errno(err, "listen"));
    }

    // Get actual port
    sockaddr_in bound_addr{};
    socklen_t addr_len = sizeof(bound_addr);
    getsockname(fd, reinterpret_cast<sockaddr*>(&bound_addr), &addr_len);
    port_ = ntohs(bound_addr.sin_port);

    listen_fd_.store(fd);
    return {};
}

AcceptResult TcpListener::accept() {
    while (true) {
        int fd = listen_fd_.load();
        if (fd < 0) {
            return unexpected(Error::io(IoError::Closed, "listener closed"));
        }

        sockaddr_in addr{};
        socklen_t addr_len = sizeof(addr);
        int client = ::accept4(fd, reinterpret_cast<sockaddr*>(&addr), &addr_len, SOCK_CLOEXEC);
        if (client < 0) {
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            if (listen_fd_.load() < 0) {
                return unexpected(Error::io(IoError::Closed, "listener closed"));
            }
            return unexpected(Error::from_errno(errno, "accept"));
        }

        set_tcp_options(client);

        char ip[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
        std::string remote = std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));

        return std::unique_ptr<ByteStream>(std::make_unique<SocketStream>(client, std::move(remote)));
    }
}

void TcpListener::close() {
    int fd = listen_fd_.exchange(-1);
    if (fd >= 0) {
        // shutdown() wakes a thread parked in accept()
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
    }
}

} // namespace h2wire::net
