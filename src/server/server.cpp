#include "h2wire/server/server.hpp"
#include "h2wire/http2/connection.hpp"
#include "h2wire/core/logging.hpp"

#include <exception>
#include <thread>

namespace h2wire {

Server::Server(ServerConfig config)
    : config_(std::move(config))
    , connection_options_(config_.connection_options())
    , workers_(std::make_shared<WorkerTracker>())
{
}

Server::~Server() {
    shutdown(std::chrono::seconds(5));
}

expected<void, Error> Server::listen() {
    if (listener_.is_listening()) {
        return {};
    }

    auto result = listener_.listen(config_.host, config_.port, config_.backlog);
    if (!result) {
        return result;
    }

    log_info("Listening on " + config_.host + ":" + std::to_string(listener_.local_port()));
    return {};
}

expected<void, Error> Server::run() {
    if (stopped_.load()) {
        return unexpected(Error::io(IoError::Closed, "server already stopped"));
    }
    if (auto r = listen(); !r) {
        return r;
    }

    running_.store(true);
    while (running_.load()) {
        auto stream = listener_.accept();
        if (!stream) {
            if (!running_.load() || stream.error().io_error() == IoError::Closed) {
                break;
            }
            log_error("Accept failed: " + stream.error().to_string());
            // Back off so a persistent failure such as EMFILE does not spin
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }

        accepted_.fetch_add(1);
        spawn_worker(std::move(*stream));
    }
    running_.store(false);

    log_info("Accept loop stopped");
    return {};
}

void Server::spawn_worker(std::unique_ptr<net::ByteStream> stream) {
    {
        std::lock_guard<std::mutex> lock(workers_->mutex);
        ++workers_->active;
    }

    log_debug("Accepted connection from " + stream->remote_address());

    std::thread([tracker = workers_, options = connection_options_,
                 stream = std::move(stream)]() mutable {
        try {
            http2::Connection connection(std::move(stream), std::move(options));
            connection.run();
        } catch (const std::exception& e) {
            log_error(std::string("Connection worker failed: ") + e.what());
        }

        std::lock_guard<std::mutex> lock(tracker->mutex);
        --tracker->active;
        tracker->idle.notify_all();
    }).detach();
}

void Server::stop() {
    stopped_.store(true);
    running_.store(false);
    listener_.close();
}

bool Server::shutdown(std::chrono::milliseconds drain_timeout) {
    stop();

    std::unique_lock<std::mutex> lock(workers_->mutex);
    bool drained = workers_->idle.wait_for(lock, drain_timeout, [this] {
        return workers_->active == 0;
    });
    if (!drained) {
        log_warn(std::to_string(workers_->active) + " connection(s) still open after drain timeout");
    }
    return drained;
}

size_t Server::active_connections() const {
    std::lock_guard<std::mutex> lock(workers_->mutex);
    return workers_->active;
}

} // namespace h2wire
