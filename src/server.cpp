/**
 * @file server.cpp
 * @brief voxserve HTTP server implementation
 */

#include "voxserve/server.h"
#include "voxserve/diarization.h"
#include "voxserve/multipart.h"

#include "nlohmann/json.hpp"

#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>

#ifndef _WIN32
#include <sys/utsname.h>
#endif

using json = nlohmann::ordered_json;

namespace voxserve {

namespace {

std::string socket_error_string(int err) {
#ifdef _WIN32
    return "error " + std::to_string(err);
#else
    return std::strerror(err);
#endif
}

bool is_loopback_host(const std::string& host) {
    return host.empty() || host == "127.0.0.1" || host == "localhost" || host == "::1";
}

/**
 * @brief Resident set size of this process in MB
 */
double resident_memory_mb() {
#ifdef __linux__
    std::ifstream statm("/proc/self/statm");
    long pages_total = 0;
    long pages_resident = 0;
    if (statm >> pages_total >> pages_resident) {
        long page_size = sysconf(_SC_PAGESIZE);
        return static_cast<double>(pages_resident) * page_size / (1024.0 * 1024.0);
    }
#endif
    return 0.0;
}

void system_identity(std::string& platform, std::string& os_version) {
#ifdef _WIN32
    platform = "Windows";
    os_version = "unknown";
#else
    struct utsname info;
    if (uname(&info) == 0) {
        platform = info.sysname;
        os_version = std::string(info.release) + " " + info.machine;
    } else {
        platform = "unknown";
        os_version = "unknown";
    }
#endif
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

TranscriptionServer::TranscriptionServer(const ServerConfig& config, TranscriptionCoordinator& coordinator)
    : config_(config)
    , coordinator_(coordinator)
    , start_time_(std::chrono::steady_clock::now())
{
    setup_routes();
}

TranscriptionServer::~TranscriptionServer() {
    stop();
}

void TranscriptionServer::setup_routes() {
    router_.get("/health", [this](const HttpRequest& req, RequestContext& ctx) {
        return handle_health(req, ctx);
    });
    router_.post("/api/transcribe", [this](const HttpRequest& req, RequestContext& ctx) {
        return handle_transcribe(req, ctx);
    });
}

std::string TranscriptionServer::bind_address() const {
    if (!config_.allow_network_access) {
        return "127.0.0.1";
    }
    return is_loopback_host(config_.host) ? "0.0.0.0" : config_.host;
}

// ============================================================================
// Lifecycle
// ============================================================================

void TranscriptionServer::start() {
    if (running_.load()) {
        return;
    }

#ifdef _WIN32
    WSADATA wsa_data;
    if (WSAStartup(MAKEWORD(2, 2), &wsa_data) != 0) {
        throw BindError("WSAStartup failed", WSAGetLastError());
    }
#endif

    const std::string address = bind_address();
    if (!config_.allow_network_access && !is_loopback_host(config_.host)) {
        std::cerr << "[Server] Network access is disabled; ignoring host " << config_.host
                  << " and binding loopback" << std::endl;
    }

    socket_t sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock == INVALID_SOCKET) {
        int err = SOCKET_ERROR_CODE;
        throw BindError("Failed to create socket: " + socket_error_string(err), err);
    }

    int opt = 1;
    setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&opt), sizeof(opt));

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(config_.port));
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        closesocket(sock);
        throw BindError("Invalid bind address: " + address, 0);
    }

    if (bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == SOCKET_ERROR) {
        int err = SOCKET_ERROR_CODE;
        closesocket(sock);
        throw BindError("Failed to bind " + address + ":" + std::to_string(config_.port) + ": " +
                        socket_error_string(err), err);
    }

    if (listen(sock, config_.listen_backlog) == SOCKET_ERROR) {
        int err = SOCKET_ERROR_CODE;
        closesocket(sock);
        throw BindError("Failed to listen on " + address + ":" + std::to_string(config_.port) + ": " +
                        socket_error_string(err), err);
    }

    sockaddr_in bound;
    socklen_t bound_len = sizeof(bound);
    if (getsockname(sock, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = config_.port;
    }

    listen_sock_ = sock;
    start_time_ = std::chrono::steady_clock::now();
    connection_pool_ = std::make_unique<ThreadPool>(config_.worker_threads, "Connections", ThreadPool::UNBOUNDED);
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stopped_ = false;
    }
    running_.store(true);
    accept_thread_ = std::thread(&TranscriptionServer::accept_loop, this);

    std::cout << "[Server] Listening on http://" << address << ":" << bound_port_ << std::endl;
}

void TranscriptionServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    std::cout << "[Server] Stopping..." << std::endl;

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (listen_sock_ != INVALID_SOCKET) {
        closesocket(listen_sock_);
        listen_sock_ = INVALID_SOCKET;
    }

    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto& entry : connections_) {
            entry.second->abort();
        }
    }
    // Connections blocked in a transcription return as soon as it is aborted
    coordinator_.abort_pending();
    if (connection_pool_) {
        connection_pool_->shutdown();
    }

#ifdef _WIN32
    WSACleanup();
#endif

    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stopped_ = true;
    }
    stopped_cv_.notify_all();
    std::cout << "[Server] Stopped after " << requests_served_.load() << " request(s)" << std::endl;
}

void TranscriptionServer::wait() {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    stopped_cv_.wait(lock, [this]() { return stopped_; });
}

// ============================================================================
// Accept loop
// ============================================================================

void TranscriptionServer::accept_loop() {
    while (running_.load()) {
        struct pollfd pfd;
        pfd.fd = listen_sock_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, 200);
        if (ready <= 0) {
            continue;
        }

        sockaddr_in peer_addr;
        socklen_t peer_len = sizeof(peer_addr);
        socket_t client = accept(listen_sock_, reinterpret_cast<sockaddr*>(&peer_addr), &peer_len);
        if (client == INVALID_SOCKET) {
            int err = SOCKET_ERROR_CODE;
            if (running_.load()) {
                std::cerr << "[Server] accept failed: " << socket_error_string(err) << std::endl;
            }
            continue;
        }

        int nodelay = 1;
        setsockopt(client, IPPROTO_TCP, TCP_NODELAY, reinterpret_cast<const char*>(&nodelay), sizeof(nodelay));

        char peer_ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &peer_addr.sin_addr, peer_ip, sizeof(peer_ip));
        std::string peer = std::string(peer_ip) + ":" + std::to_string(ntohs(peer_addr.sin_port));

        const uint64_t id = ++next_connection_id_;
        auto connection = std::make_shared<Connection>(
            client, id, peer, config_.connection,
            [this](const HttpRequest& req, RequestContext& ctx) { return router_.dispatch(req, ctx); });

        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connections_[id] = connection;
        }

        if (!connection_pool_->post([this, connection]() { serve(connection); })) {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connections_.erase(id);
        }
    }
}

void TranscriptionServer::serve(std::shared_ptr<Connection> connection) {
    ConnectionSummary summary = connection->run();
    record_request(summary);

    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(connection->id());
}

void TranscriptionServer::record_request(const ConnectionSummary& summary) {
    if (summary.status == 0) {
        return;
    }
    requests_served_.fetch_add(1);
    total_latency_us_.fetch_add(static_cast<uint64_t>(summary.latency.count()));

    std::cout << "[Server] " << (summary.method.empty() ? "-" : summary.method) << " "
              << (summary.path.empty() ? "-" : summary.path) << " -> " << summary.status
              << " (" << summary.latency.count() / 1000 << " ms"
              << (summary.large_upload ? ", large upload" : "") << ")" << std::endl;
}

ServerStats TranscriptionServer::stats() const {
    ServerStats s;
    s.requests_served = requests_served_.load();
    uint64_t latency_us = total_latency_us_.load();
    s.average_processing_ms = s.requests_served > 0
        ? static_cast<double>(latency_us) / 1000.0 / static_cast<double>(s.requests_served)
        : 0.0;
    std::lock_guard<std::mutex> lock(connections_mutex_);
    s.active_connections = connections_.size();
    return s;
}

// ============================================================================
// Health
// ============================================================================

HttpResponse TranscriptionServer::handle_health(const HttpRequest&, RequestContext&) {
    CoordinatorStatus status = coordinator_.status();
    ServerStats server_stats = stats();

    std::string platform;
    std::string os_version;
    system_identity(platform, os_version);

    auto now = std::chrono::system_clock::now();
    double timestamp = std::chrono::duration<double>(now.time_since_epoch()).count();
    double uptime = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_).count();

    json capabilities = json::array({
        "speech-to-text",
        "multi-model-support",
        "speaker-diarization",
        "word-replacement",
        "local-transcription"
    });
    if (status.enhancement_enabled) {
        capabilities.push_back("ai-enhancement");
    }

    json response = {
        {"status", "healthy"},
        {"service", "voxserve"},
        {"version", VOXSERVE_VERSION},
        {"timestamp", timestamp},
        {"system", {
            {"platform", platform},
            {"osVersion", os_version},
            {"processorCount", static_cast<int>(std::thread::hardware_concurrency())},
            {"memoryUsageMB", resident_memory_mb()},
            {"uptimeSeconds", uptime}
        }},
        {"api", {
            {"endpoint", "http://" + (config_.allow_network_access ? bind_address() : std::string("localhost")) +
                         ":" + std::to_string(bound_port_)},
            {"port", bound_port_},
            {"isRunning", running_.load()},
            {"requestsServed", server_stats.requests_served},
            {"averageProcessingTimeMs", server_stats.average_processing_ms}
        }},
        {"transcription", {
            {"currentModel", status.current_model.empty() ? json(nullptr) : json(status.current_model)},
            {"modelLoaded", status.model_loaded},
            {"availableModels", status.available_models},
            {"enhancementEnabled", status.enhancement_enabled},
            {"wordReplacementEnabled", status.word_replacement_enabled}
        }},
        {"capabilities", capabilities}
    };

    return HttpResponse::json(200, response.dump());
}

// ============================================================================
// Transcription
// ============================================================================

HttpResponse TranscriptionServer::handle_transcribe(const HttpRequest& req, RequestContext& ctx) {
    const std::string boundary = extract_boundary(req.header("Content-Type"));
    if (boundary.empty()) {
        return make_error_response(ErrorCode::MissingBoundary,
                                   "Content-Type must be multipart/form-data with a boundary");
    }

    MultipartForm form = extract_multipart(req.body, boundary);
    if (form.status == MultipartStatus::Malformed) {
        return make_error_response(ErrorCode::MalformedMultipart, "Malformed multipart body: " + form.error);
    }
    if (form.status == MultipartStatus::NoFileField) {
        return make_error_response(ErrorCode::MissingFile, "No audio file provided in the 'file' field");
    }
    if (form.file_data.empty()) {
        return make_error_response(ErrorCode::BadRequest, "Uploaded audio file is empty");
    }

    std::optional<DiarizationParams> diarization = parse_diarization_params(form.fields);

    AudioUpload upload;
    upload.storage = ctx.request_owner();
    upload.bytes = form.file_data;
    upload.declared_content_type = form.file_content_type;
    upload.filename = form.file_name;
    if (!upload.storage) {
        auto copy = std::make_shared<const std::string>(form.file_data);
        upload.bytes = *copy;
        upload.storage = copy;
    }

    std::cout << "[Server] Transcribe request on connection " << ctx.connection_id() << ": "
              << (upload.filename.empty() ? "<unnamed>" : upload.filename) << ", "
              << upload.bytes.size() << " bytes"
              << (diarization ? ", diarization " + std::string(diarization_method_name(diarization->method)) : "")
              << std::endl;

    TranscriptionOutcome outcome = coordinator_.transcribe(upload, diarization,
        [&ctx](std::chrono::milliseconds elapsed) { ctx.heartbeat(elapsed); });

    return HttpResponse::json(outcome.status, std::move(outcome.body));
}

} // namespace voxserve
