/**
 * @file server.h
 * @brief voxserve HTTP server - embedded transcription API
 *
 * Listens on a raw TCP socket and serves each accepted connection on its
 * own worker through the Connection state machine. The connection pool
 * grows with demand; inference concurrency is bounded by the coordinator.
 *
 * Endpoints:
 *   GET     /health            - Service, system, API and transcription status
 *   POST    /api/transcribe    - multipart/form-data audio upload
 *   OPTIONS *                  - CORS preflight
 *
 * Usage:
 *   TranscriptionCoordinator coordinator(coordinator_config);
 *   coordinator.register_provider(ModelProvider::Local, provider);
 *   coordinator.scan_models("~/models");
 *
 *   ServerConfig config;
 *   config.port = 5000;
 *   TranscriptionServer server(config, coordinator);
 *   server.start();      // throws BindError
 *   server.wait();
 */

#pragma once

#include "connection.h"
#include "coordinator.h"
#include "router.h"
#include "socket_compat.h"
#include "thread_pool.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#ifndef VOXSERVE_VERSION
#define VOXSERVE_VERSION "1.0.0"
#endif

namespace voxserve {

/**
 * @brief Server configuration
 */
struct ServerConfig {
    std::string host = "127.0.0.1";        ///< Address used when network access is allowed
    int port = 5000;                        ///< 0 binds an ephemeral port
    bool allow_network_access = false;      ///< false binds loopback only
    size_t worker_threads = 32;             ///< Connection workers started up front; more start on demand
    int listen_backlog = 512;
    ConnectionOptions connection;
};

/**
 * @brief Request counters shared by all connections
 */
struct ServerStats {
    uint64_t requests_served = 0;
    double average_processing_ms = 0.0;
    uint64_t active_connections = 0;
};

class TranscriptionServer {
public:
    TranscriptionServer(const ServerConfig& config, TranscriptionCoordinator& coordinator);
    ~TranscriptionServer();

    TranscriptionServer(const TranscriptionServer&) = delete;
    TranscriptionServer& operator=(const TranscriptionServer&) = delete;

    /**
     * @brief Bind, listen and start the accept thread
     * @throws BindError when the port is taken or access is denied
     */
    void start();

    /**
     * @brief Stop accepting, interrupt open connections and waiting transcriptions, then join
     *
     * Safe to call more than once.
     */
    void stop();

    /** Block until stop() has completed */
    void wait();

    bool is_running() const { return running_.load(); }

    /** Bound port (the ephemeral one when configured with 0) */
    int port() const { return bound_port_; }
    std::string bind_address() const;

    ServerStats stats() const;
    const ServerConfig& config() const { return config_; }

private:
    void setup_routes();
    void accept_loop();
    void serve(std::shared_ptr<Connection> connection);
    void record_request(const ConnectionSummary& summary);

    // === Endpoint Handlers ===
    HttpResponse handle_health(const HttpRequest& req, RequestContext& ctx);
    HttpResponse handle_transcribe(const HttpRequest& req, RequestContext& ctx);

    ServerConfig config_;
    TranscriptionCoordinator& coordinator_;
    Router router_;

    socket_t listen_sock_ = INVALID_SOCKET;
    int bound_port_ = 0;
    std::atomic<bool> running_{false};
    std::thread accept_thread_;
    std::unique_ptr<ThreadPool> connection_pool_;

    mutable std::mutex connections_mutex_;
    std::map<uint64_t, std::shared_ptr<Connection>> connections_;
    std::atomic<uint64_t> next_connection_id_{0};

    std::mutex stop_mutex_;
    std::condition_variable stopped_cv_;
    bool stopped_ = true;

    // Metrics
    std::chrono::steady_clock::time_point start_time_;
    std::atomic<uint64_t> requests_served_{0};
    std::atomic<uint64_t> total_latency_us_{0};
};

} // namespace voxserve
