/**
 * @file connection.cpp
 * @brief Connection state machine implementation
 */

#include "voxserve/connection.h"

#include <algorithm>
#include <iostream>
#include <vector>

namespace voxserve {

namespace {

constexpr const char* CONTINUE_RESPONSE = "HTTP/1.1 100 Continue\r\n\r\n";
constexpr const char* PROCESSING_RESPONSE = "HTTP/1.1 102 Processing\r\n\r\n";

bool is_retryable(int err) {
#ifdef _WIN32
    return err == WSAEINTR || err == WSAEWOULDBLOCK;
#else
    return err == EINTR || err == EAGAIN || err == EWOULDBLOCK;
#endif
}

} // anonymous namespace

const char* connection_state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::ReadingHeaders: return "reading-headers";
        case ConnectionState::ReadingBody:    return "reading-body";
        case ConnectionState::Dispatched:     return "dispatched";
        case ConnectionState::Responding:     return "responding";
        case ConnectionState::Closed:         return "closed";
    }
    return "unknown";
}

Connection::Connection(socket_t sock, uint64_t id, std::string peer,
                       const ConnectionOptions& options, RequestHandler handler)
    : sock_(sock)
    , id_(id)
    , peer_(std::move(peer))
    , options_(options)
    , handler_(std::move(handler))
    , created_(std::chrono::steady_clock::now())
    , chunk_size_(options.read_chunk_bytes)
    , idle_timeout_(options.idle_timeout)
{
}

Connection::~Connection() {
    close();
}

// ============================================================================
// State transitions
// ============================================================================

bool Connection::advance(ConnectionState from, ConnectionState to) {
    return state_.compare_exchange_strong(from, to);
}

bool Connection::begin_dispatch() {
    ConnectionState expected = ConnectionState::ReadingBody;
    if (state_.compare_exchange_strong(expected, ConnectionState::Dispatched)) {
        return true;
    }
    expected = ConnectionState::ReadingHeaders;
    return state_.compare_exchange_strong(expected, ConnectionState::Dispatched);
}

// ============================================================================
// Run
// ============================================================================

ConnectionSummary Connection::run() {
    ConnectionSummary summary;
    summary.id = id_;

    // The inactivity timer starts when a worker picks the connection up
    deadline_ = std::chrono::steady_clock::now() + idle_timeout_;

    RequestFramer framer(options_.limits);
    bool complete = read_request(framer, summary);
    summary.bytes_received = framer.body_bytes_received();
    summary.large_upload = large_upload_;
    if (framer.headers_parsed() || framer.phase() == FramePhase::Rejected) {
        summary.method = framer.request().method;
        summary.path = framer.request().path;
    }

    if (!complete) {
        if (framer.phase() == FramePhase::Rejected) {
            std::cerr << "[Conn " << id_ << "] Rejected: " << framer.reject_status() << " "
                      << framer.reject_message() << std::endl;
            ConnectionState from = state_.load();
            if (from == ConnectionState::ReadingHeaders || from == ConnectionState::ReadingBody) {
                advance(from, ConnectionState::Responding);
                respond(make_error_response(framer.reject_code(), framer.reject_message(),
                                            framer.reject_status()), summary);
            }
        } else if (summary.timed_out) {
            ConnectionState from = state_.load();
            if (from == ConnectionState::ReadingHeaders || from == ConnectionState::ReadingBody) {
                advance(from, ConnectionState::Responding);
                respond(make_error_response(ErrorCode::Timeout, "Request timed out waiting for data", 408),
                        summary);
            }
        }
        state_.store(ConnectionState::Closed);
        close();
        summary.latency = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - created_);
        return summary;
    }

    auto request = std::make_shared<const HttpRequest>(framer.take_request());
    summary.method = request->method;
    summary.path = request->path;

    if (begin_dispatch()) {
        summary.dispatched = true;
        HttpResponse response = invoke_handler(request);
        if (advance(ConnectionState::Dispatched, ConnectionState::Responding)) {
            respond(response, summary);
        }
    }

    state_.store(ConnectionState::Closed);
    close();
    summary.latency = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - created_);
    return summary;
}

bool Connection::read_request(RequestFramer& framer, ConnectionSummary& summary) {
    std::vector<char> buffer;

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline_) {
            std::cerr << "[Conn " << id_ << "] Idle timeout in state "
                      << connection_state_name(state_.load()) << std::endl;
            summary.timed_out = true;
            return false;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - now);
        int wait_ms = static_cast<int>(std::min<long long>(remaining.count() + 1, 1000));

        struct pollfd pfd;
        pfd.fd = sock_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, wait_ms);
        if (ready < 0) {
            int err = SOCKET_ERROR_CODE;
            if (is_retryable(err)) continue;
            std::cerr << "[Conn " << id_ << "] poll failed: " << err << std::endl;
            return false;
        }
        if (ready == 0) {
            continue;
        }

        if (buffer.size() != chunk_size_) {
            buffer.resize(chunk_size_);
        }
        auto n = recv(sock_, buffer.data(), static_cast<int>(buffer.size()), 0);
        if (n == 0) {
            if (framer.phase() != FramePhase::Headers || framer.body_bytes_received() > 0) {
                std::cerr << "[Conn " << id_ << "] Peer closed before the request was complete" << std::endl;
            }
            return false;
        }
        if (n < 0) {
            int err = SOCKET_ERROR_CODE;
            if (is_retryable(err)) continue;
            std::cerr << "[Conn " << id_ << "] recv failed: " << err << std::endl;
            return false;
        }

        const bool had_headers = framer.headers_parsed();
        FramePhase phase = framer.feed(buffer.data(), static_cast<size_t>(n));
        deadline_ = std::chrono::steady_clock::now() + idle_timeout_;

        if (phase == FramePhase::Rejected) {
            return false;
        }

        if (!had_headers && framer.headers_parsed()) {
            advance(ConnectionState::ReadingHeaders, ConnectionState::ReadingBody);
            if (framer.content_length() > options_.large_upload_threshold) {
                enter_large_mode(framer.content_length());
            }
            if (phase == FramePhase::Body && framer.expects_continue()) {
                if (!write_all(CONTINUE_RESPONSE)) {
                    return false;
                }
            }
        }

        if (phase == FramePhase::Complete) {
            return true;
        }
    }
}

void Connection::enter_large_mode(uint64_t content_length) {
    large_upload_ = true;
    chunk_size_ = options_.large_read_chunk_bytes;
    idle_timeout_ = options_.large_idle_timeout;
    deadline_ = std::chrono::steady_clock::now() + idle_timeout_;
    std::cout << "[Conn " << id_ << "] Large upload: " << content_length / (1024 * 1024) << " MB, "
              << "idle ceiling " << idle_timeout_.count() / 1000 << "s" << std::endl;
}

void Connection::on_heartbeat(std::chrono::milliseconds elapsed) {
    if (!large_upload_) {
        return;
    }
    deadline_ = std::chrono::steady_clock::now() + idle_timeout_;
    std::cout << "[Conn " << id_ << "] Still processing after " << elapsed.count() / 1000 << "s" << std::endl;
    if (options_.send_processing_interim && !write_all(PROCESSING_RESPONSE)) {
        std::cerr << "[Conn " << id_ << "] Heartbeat write failed" << std::endl;
    }
}

HttpResponse Connection::invoke_handler(const std::shared_ptr<const HttpRequest>& request) {
    RequestContext context(id_, large_upload_, request, [this](std::chrono::milliseconds elapsed) {
        on_heartbeat(elapsed);
    });
    try {
        return handler_(*request, context);
    } catch (const ApiError& e) {
        return make_error_response(e.code(), e.what(), e.http_status());
    } catch (const std::exception& e) {
        std::cerr << "[Conn " << id_ << "] Handler failed: " << e.what() << std::endl;
        return make_error_response(ErrorCode::Internal, std::string("Internal server error: ") + e.what(), 500);
    }
}

// ============================================================================
// Writing
// ============================================================================

void Connection::respond(const HttpResponse& response, ConnectionSummary& summary) {
    summary.status = response.status;
    if (!write_all(serialize_response(response))) {
        std::cerr << "[Conn " << id_ << "] Failed to write " << response.status << " response" << std::endl;
    }
    advance(ConnectionState::Responding, ConnectionState::Closed);
}

bool Connection::write_all(const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        auto n = send(sock_, data.data() + sent, static_cast<int>(data.size() - sent), VOXSERVE_MSG_NOSIGNAL);
        if (n < 0) {
            int err = SOCKET_ERROR_CODE;
            if (is_retryable(err)) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

void Connection::abort() {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    if (!socket_closed_) {
        shutdown(sock_, VOXSERVE_SHUT_RDWR);
    }
}

void Connection::close() {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    if (socket_closed_) {
        return;
    }
    socket_closed_ = true;
    shutdown(sock_, VOXSERVE_SHUT_RDWR);
    closesocket(sock_);
}

} // namespace voxserve
