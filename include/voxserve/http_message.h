/**
 * @file http_message.h
 * @brief HTTP/1.1 request and response value types
 */

#pragma once

#include "errors.h"

#include <map>
#include <string>

namespace voxserve {

/**
 * @brief ASCII case-insensitive ordering for header names
 */
struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

/**
 * @brief A fully framed request, produced once per connection
 */
struct HttpRequest {
    std::string method;
    std::string target;   ///< Request target as sent, including any query string
    std::string path;     ///< Target without the query string
    std::string version;  ///< "HTTP/1.1"
    HeaderMap headers;
    std::string body;     ///< Raw body bytes (binary safe)

    /**
     * @brief Header value or empty string
     */
    std::string header(const std::string& name) const;
    bool has_header(const std::string& name) const { return headers.count(name) > 0; }
};

struct HttpResponse {
    int status = 200;
    std::string content_type = "application/json; charset=utf-8";
    HeaderMap headers;
    std::string body;

    static HttpResponse json(int status, std::string body);
};

/**
 * @brief Reason phrase for a status code ("OK", "Payload Too Large", ...)
 */
const char* http_reason_phrase(int status);

/**
 * @brief Serialize status line, headers and body
 *
 * Content-Length is always computed from body.size(); the CORS header and
 * "Connection: close" are always present.
 */
std::string serialize_response(const HttpResponse& response);

/**
 * @brief JSON error body {"success": false, "error": {"code", "message"}}
 */
HttpResponse make_error_response(ErrorCode code, const std::string& message, int status = 0);

/**
 * @brief Empty 200 answer to a CORS preflight
 */
HttpResponse make_preflight_response();

} // namespace voxserve
