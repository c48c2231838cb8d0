#pragma once

#include "h2wire/core/config.hpp"
#include "h2wire/net/socket.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>

namespace h2wire {

// ============================================================================
// Server
// ============================================================================
//
// Accepts TCP clients and gives each one a detached worker thread that owns
// its http2::Connection outright. Workers share nothing except their own copy
// of the connection options.

class Server {
public:
    explicit Server(ServerConfig config);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Bind the listener; run() calls this when it has not happened yet
    expected<void, Error> listen();

    // Accept loop (blocking) until stop()
    expected<void, Error> run();

    // Stop accepting; safe from a signal handler thread or another worker
    void stop();

    // stop(), then wait up to `drain_timeout` for workers to finish.
    // Returns false if some were still running.
    bool shutdown(std::chrono::milliseconds drain_timeout);

    size_t active_connections() const;
    uint64_t accepted_connections() const noexcept { return accepted_.load(); }

    uint16_t port() const noexcept { return listener_.local_port(); }
    bool is_running() const noexcept { return running_.load(); }

    const ServerConfig& config() const noexcept { return config_; }

private:
    // Outlives the server if a worker is still draining
    struct WorkerTracker {
        std::mutex mutex;
        std::condition_variable idle;
        size_t active = 0;
    };

    void spawn_worker(std::unique_ptr<net::ByteStream> stream);

    ServerConfig config_;
    http2::ConnectionOptions connection_options_;
    net::TcpListener listener_;
    std::shared_ptr<WorkerTracker> workers_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<uint64_t> accepted_{0};
};

} // namespace h2wire
