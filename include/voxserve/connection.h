/**
 * @file connection.h
 * @brief Per-connection state machine: read, frame, dispatch once, respond, close
 *
 * A Connection owns one accepted socket and is driven by run() on a pool
 * thread. The lifecycle is an explicit tagged state:
 *
 *   ReadingHeaders -> ReadingBody -> Dispatched -> Responding -> Closed
 *
 * Protocol rejections jump from a reading state straight to Responding.
 * The Dispatched transition is a single compare-and-swap, so the handler
 * runs at most once no matter what else happens on the socket.
 */

#pragma once

#include "http_message.h"
#include "request_parser.h"
#include "socket_compat.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace voxserve {

enum class ConnectionState {
    ReadingHeaders,
    ReadingBody,
    Dispatched,
    Responding,
    Closed
};

const char* connection_state_name(ConnectionState state);

/**
 * @struct ConnectionOptions
 */
struct ConnectionOptions {
    size_t read_chunk_bytes = 64 * 1024;
    size_t large_read_chunk_bytes = 8 * 1024 * 1024;
    uint64_t large_upload_threshold = 16ULL * 1024 * 1024;     ///< Content-Length above this selects the large variant
    std::chrono::milliseconds idle_timeout{30 * 1000};
    std::chrono::milliseconds large_idle_timeout{60 * 60 * 1000};
    bool send_processing_interim = false;  ///< Large variant: write "102 Processing" at each heartbeat
    ParserLimits limits;
};

/**
 * @brief What the handler can see of its connection
 */
class RequestContext {
public:
    using HeartbeatSink = std::function<void(std::chrono::milliseconds elapsed)>;

    RequestContext(uint64_t connection_id, bool large_upload,
                   std::shared_ptr<const HttpRequest> request, HeartbeatSink sink)
        : connection_id_(connection_id)
        , large_upload_(large_upload)
        , request_(std::move(request))
        , sink_(std::move(sink)) {}

    uint64_t connection_id() const { return connection_id_; }
    bool large_upload() const { return large_upload_; }

    /**
     * @brief Shared ownership of the request being handled
     *
     * Work that may outlive the handler (a timed-out transcription) holds
     * this to keep the body bytes valid.
     */
    std::shared_ptr<const HttpRequest> request_owner() const { return request_; }

    /**
     * @brief Report that long processing is still alive
     *
     * For large uploads this extends the connection deadline and logs
     * progress; ordinary connections ignore it.
     */
    void heartbeat(std::chrono::milliseconds elapsed) const {
        if (sink_) sink_(elapsed);
    }

private:
    uint64_t connection_id_;
    bool large_upload_;
    std::shared_ptr<const HttpRequest> request_;
    HeartbeatSink sink_;
};

using RequestHandler = std::function<HttpResponse(const HttpRequest&, RequestContext&)>;

/**
 * @brief Outcome of one connection, fed into the server statistics
 */
struct ConnectionSummary {
    uint64_t id = 0;
    std::string method;
    std::string path;
    int status = 0;               ///< 0 when no response was written
    bool dispatched = false;
    bool large_upload = false;
    bool timed_out = false;
    uint64_t bytes_received = 0;
    std::chrono::microseconds latency{0};
};

class Connection {
public:
    Connection(socket_t sock, uint64_t id, std::string peer,
               const ConnectionOptions& options, RequestHandler handler);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * @brief Serve the connection to completion (blocking)
     */
    ConnectionSummary run();

    /**
     * @brief Interrupt blocking socket calls from another thread
     *
     * Used by the server on stop(); run() then finishes and closes.
     */
    void abort();

    ConnectionState state() const { return state_.load(); }
    uint64_t id() const { return id_; }
    const std::string& peer() const { return peer_; }

private:
    bool advance(ConnectionState from, ConnectionState to);
    bool begin_dispatch();

    /** @return false when the connection ended without a complete request */
    bool read_request(RequestFramer& framer, ConnectionSummary& summary);
    void enter_large_mode(uint64_t content_length);
    void on_heartbeat(std::chrono::milliseconds elapsed);

    HttpResponse invoke_handler(const std::shared_ptr<const HttpRequest>& request);
    void respond(const HttpResponse& response, ConnectionSummary& summary);
    bool write_all(const std::string& data);
    void close();

    socket_t sock_;
    uint64_t id_;
    std::string peer_;
    ConnectionOptions options_;
    RequestHandler handler_;

    std::atomic<ConnectionState> state_{ConnectionState::ReadingHeaders};
    std::chrono::steady_clock::time_point created_;
    std::chrono::steady_clock::time_point deadline_;
    size_t chunk_size_;
    std::chrono::milliseconds idle_timeout_;
    bool large_upload_ = false;

    std::mutex socket_mutex_;
    bool socket_closed_ = false;
};

} // namespace voxserve
