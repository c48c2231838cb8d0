// HTTP/2 Frame Engine Server
// Answers every request stream with a fixed response over cleartext HTTP/2
// (prior knowledge, no upgrade).
//
// Test with:
//   curl --http2-prior-knowledge http://127.0.0.1:8080/
//
// Configuration comes from H2WIRE_* environment variables, e.g.
//   H2WIRE_PORT=9000 H2WIRE_LOG_LEVEL=debug H2WIRE_RESPONSE_ENCODING=hpack

#include <h2wire/h2wire.hpp>

#include <csignal>
#include <iostream>

namespace {
    h2wire::Server* g_server = nullptr;

    void signal_handler(int signal) {
        if (signal == SIGINT || signal == SIGTERM) {
            if (g_server) {
                g_server->stop();
            }
        }
    }
}

int main() {
    try {
        auto config = h2wire::ServerConfig::from_env();
        if (!config) {
            std::cerr << "Invalid configuration: " << config.error().to_string() << "\n";
            return 2;
        }

        h2wire::configure_default_logger(config->log_level, config->log_format);

        h2wire::Server server(*config);
        g_server = &server;

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        auto result = server.run();
        g_server = nullptr;

        if (!result) {
            h2wire::log_fatal("Server failed: " + result.error().to_string());
            return 1;
        }

        h2wire::log_info("Shutting down...");
        return server.shutdown(std::chrono::seconds(5)) ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
