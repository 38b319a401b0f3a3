/**
 * @file request_parser.cpp
 * @brief Incremental HTTP/1.1 request framing
 */

#include "voxserve/request_parser.h"
#include "voxserve/multipart.h"

#include <algorithm>
#include <cctype>
#include <limits>
#include <utility>

namespace voxserve {

namespace {

constexpr uint64_t MAX_BODY_RESERVE = 64ULL * 1024 * 1024;

bool is_token_char(unsigned char c) {
    if (std::isalnum(c)) return true;
    switch (c) {
        case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
        case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

bool is_token(const std::string& s) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (!is_token_char(c)) return false;
    }
    return true;
}

bool iequals(const std::string& a, const char* b) {
    CaseInsensitiveLess less;
    return !less(a, b) && !less(b, a);
}

std::string trim_ows(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

bool parse_decimal(const std::string& s, uint64_t& out) {
    if (s.empty()) return false;
    uint64_t value = 0;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) return false;
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

} // anonymous namespace

RequestFramer::RequestFramer(ParserLimits limits)
    : limits_(limits) {}

FramePhase RequestFramer::feed(const char* data, size_t len) {
    switch (phase_) {
        case FramePhase::Headers:
            return consume_header_bytes(data, len);
        case FramePhase::Body:
            return consume_body_bytes(data, len);
        case FramePhase::Complete:
        case FramePhase::Rejected:
            break;
    }
    return phase_;
}

HttpRequest RequestFramer::take_request() {
    return std::move(request_);
}

FramePhase RequestFramer::reject(int status, ErrorCode code, const std::string& message) {
    phase_ = FramePhase::Rejected;
    reject_status_ = status;
    reject_code_ = code;
    reject_message_ = message;
    header_buf_.clear();
    header_buf_.shrink_to_fit();
    return phase_;
}

FramePhase RequestFramer::consume_header_bytes(const char* data, size_t len) {
    header_buf_.append(data, len);

    // Resume 3 bytes back so a terminator split across fragments is found
    size_t from = scan_pos_ >= 3 ? scan_pos_ - 3 : 0;
    size_t end = header_buf_.find("\r\n\r\n", from);
    if (end == std::string::npos) {
        scan_pos_ = header_buf_.size();
        if (header_buf_.size() > limits_.max_header_bytes) {
            return reject(400, ErrorCode::BadRequest, "Request header section too large");
        }
        return phase_;
    }

    if (end + 4 > limits_.max_header_bytes) {
        return reject(400, ErrorCode::BadRequest, "Request header section too large");
    }

    std::string head = header_buf_.substr(0, end);
    std::string rest = header_buf_.substr(end + 4);
    header_buf_.clear();
    header_buf_.shrink_to_fit();

    if (!parse_head(head)) {
        return phase_;  // rejected inside parse_head
    }

    if (!has_content_length_ || content_length_ == 0) {
        phase_ = FramePhase::Complete;
        return phase_;
    }

    request_.body.reserve(static_cast<size_t>(std::min(content_length_, MAX_BODY_RESERVE)));
    phase_ = FramePhase::Body;
    if (!rest.empty()) {
        return consume_body_bytes(rest.data(), rest.size());
    }
    return phase_;
}

FramePhase RequestFramer::consume_body_bytes(const char* data, size_t len) {
    uint64_t remaining = content_length_ - request_.body.size();
    size_t take = static_cast<size_t>(std::min<uint64_t>(remaining, len));
    request_.body.append(data, take);
    if (request_.body.size() == content_length_) {
        phase_ = FramePhase::Complete;
    }
    return phase_;
}

bool RequestFramer::parse_head(const std::string& head) {
    size_t line_end = head.find("\r\n");
    std::string request_line = head.substr(0, line_end);

    // METHOD SP TARGET SP VERSION
    size_t sp1 = request_line.find(' ');
    size_t sp2 = sp1 == std::string::npos ? std::string::npos : request_line.find(' ', sp1 + 1);
    if (sp1 == std::string::npos || sp2 == std::string::npos ||
        request_line.find(' ', sp2 + 1) != std::string::npos) {
        reject(400, ErrorCode::BadRequest, "Malformed request line");
        return false;
    }

    request_.method = request_line.substr(0, sp1);
    request_.target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
    request_.version = request_line.substr(sp2 + 1);

    if (!is_token(request_.method)) {
        reject(400, ErrorCode::BadRequest, "Malformed request method");
        return false;
    }
    if (request_.target.empty() || (request_.target[0] != '/' && request_.target != "*")) {
        reject(400, ErrorCode::BadRequest, "Malformed request target");
        return false;
    }
    if (request_.version != "HTTP/1.1" && request_.version != "HTTP/1.0") {
        reject(400, ErrorCode::BadRequest, "Unsupported HTTP version");
        return false;
    }

    size_t q = request_.target.find('?');
    request_.path = q == std::string::npos ? request_.target : request_.target.substr(0, q);

    size_t pos = line_end == std::string::npos ? head.size() : line_end + 2;
    while (pos < head.size()) {
        size_t eol = head.find("\r\n", pos);
        std::string line = head.substr(pos, eol == std::string::npos ? std::string::npos : eol - pos);
        pos = eol == std::string::npos ? head.size() : eol + 2;

        if (line.empty()) continue;
        if (line[0] == ' ' || line[0] == '\t') {
            reject(400, ErrorCode::BadRequest, "Obsolete header line folding");
            return false;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            reject(400, ErrorCode::BadRequest, "Malformed header line");
            return false;
        }
        std::string name = line.substr(0, colon);
        if (!is_token(name)) {
            reject(400, ErrorCode::BadRequest, "Malformed header name");
            return false;
        }
        std::string value = trim_ows(line.substr(colon + 1));

        auto existing = request_.headers.find(name);
        if (existing != request_.headers.end()) {
            if (iequals(name, "Content-Length")) {
                if (existing->second != value) {
                    reject(400, ErrorCode::BadRequest, "Conflicting Content-Length headers");
                    return false;
                }
                continue;
            }
            existing->second += ", " + value;
        } else {
            request_.headers.emplace(name, value);
        }
    }

    if (request_.has_header("Transfer-Encoding")) {
        reject(400, ErrorCode::BadRequest, "Transfer-Encoding request bodies are not supported");
        return false;
    }

    if (request_.has_header("Content-Length")) {
        if (!parse_decimal(request_.header("Content-Length"), content_length_)) {
            reject(400, ErrorCode::BadRequest, "Invalid Content-Length");
            return false;
        }
        has_content_length_ = true;
        if (content_length_ > limits_.max_body_bytes) {
            reject(413, ErrorCode::PayloadTooLarge,
                   "Request body of " + std::to_string(content_length_) +
                   " bytes exceeds the limit of " + std::to_string(limits_.max_body_bytes) + " bytes");
            return false;
        }
    }

    std::string expect = request_.header("Expect");
    std::transform(expect.begin(), expect.end(), expect.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    expects_continue_ = (expect == "100-continue") && request_.version == "HTTP/1.1";

    boundary_ = extract_boundary(request_.header("Content-Type"));
    return true;
}

} // namespace voxserve
