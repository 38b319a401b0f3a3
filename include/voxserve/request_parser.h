/**
 * @file request_parser.h
 * @brief Incremental HTTP/1.1 request framing over a byte stream
 *
 * Bytes are fed in arbitrary fragments (down to one byte at a time). The
 * framer locates the header terminator even when it is split across reads,
 * enforces the header and body limits, and reports completion only once
 * exactly Content-Length body bytes have been accumulated.
 */

#pragma once

#include "errors.h"
#include "http_message.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace voxserve {

struct ParserLimits {
    size_t max_header_bytes = 64 * 1024;
    uint64_t max_body_bytes = 500ULL * 1024 * 1024;
};

enum class FramePhase {
    Headers,    ///< Waiting for CRLFCRLF
    Body,       ///< Headers parsed, accumulating Content-Length bytes
    Complete,   ///< Request fully framed
    Rejected    ///< Protocol violation or limit exceeded; see reject_*()
};

class RequestFramer {
public:
    explicit RequestFramer(ParserLimits limits = ParserLimits{});

    /**
     * @brief Consume the next fragment
     *
     * Bytes beyond the declared body length are ignored. Once Complete or
     * Rejected, further input is discarded.
     *
     * @return Phase after consuming the fragment
     */
    FramePhase feed(const char* data, size_t len);

    FramePhase phase() const { return phase_; }
    bool headers_parsed() const { return phase_ == FramePhase::Body || phase_ == FramePhase::Complete; }

    uint64_t content_length() const { return content_length_; }
    bool has_content_length() const { return has_content_length_; }
    uint64_t body_bytes_received() const { return request_.body.size(); }
    bool expects_continue() const { return expects_continue_; }

    /** Multipart boundary from Content-Type, empty when absent */
    const std::string& boundary() const { return boundary_; }

    /** Parsed request line and headers (valid once headers_parsed()) */
    const HttpRequest& request() const { return request_; }

    int reject_status() const { return reject_status_; }
    ErrorCode reject_code() const { return reject_code_; }
    const std::string& reject_message() const { return reject_message_; }

    /**
     * @brief Move the framed request out (only meaningful when Complete)
     */
    HttpRequest take_request();

private:
    FramePhase consume_header_bytes(const char* data, size_t len);
    FramePhase consume_body_bytes(const char* data, size_t len);
    bool parse_head(const std::string& head);
    FramePhase reject(int status, ErrorCode code, const std::string& message);

    ParserLimits limits_;
    FramePhase phase_ = FramePhase::Headers;

    std::string header_buf_;
    size_t scan_pos_ = 0;

    HttpRequest request_;
    uint64_t content_length_ = 0;
    bool has_content_length_ = false;
    bool expects_continue_ = false;
    std::string boundary_;

    int reject_status_ = 0;
    ErrorCode reject_code_ = ErrorCode::BadRequest;
    std::string reject_message_;
};

} // namespace voxserve
