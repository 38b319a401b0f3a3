/**
 * @file http_message.cpp
 * @brief HTTP response serialization and error bodies
 */

#include "voxserve/http_message.h"

#include "nlohmann/json.hpp"

#include <cctype>
#include <sstream>
#include <utility>

using json = nlohmann::ordered_json;

namespace voxserve {

static constexpr const char* MIMETYPE_JSON = "application/json; charset=utf-8";

static bool iequals(const std::string& a, const char* b) {
    CaseInsensitiveLess less;
    return !less(a, b) && !less(b, a);
}

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    size_t n = a.size() < b.size() ? a.size() : b.size();
    for (size_t i = 0; i < n; ++i) {
        int ca = std::tolower(static_cast<unsigned char>(a[i]));
        int cb = std::tolower(static_cast<unsigned char>(b[i]));
        if (ca != cb) return ca < cb;
    }
    return a.size() < b.size();
}

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(name);
    return it == headers.end() ? std::string() : it->second;
}

HttpResponse HttpResponse::json(int status, std::string body) {
    HttpResponse res;
    res.status = status;
    res.content_type = MIMETYPE_JSON;
    res.body = std::move(body);
    return res;
}

const char* http_reason_phrase(int status) {
    switch (status) {
        case 100: return "Continue";
        case 102: return "Processing";
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 415: return "Unsupported Media Type";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return "Unknown";
    }
}

std::string serialize_response(const HttpResponse& response) {
    std::ostringstream out;
    out << "HTTP/1.1 " << response.status << " " << http_reason_phrase(response.status) << "\r\n";
    if (!response.content_type.empty()) {
        out << "Content-Type: " << response.content_type << "\r\n";
    }
    out << "Content-Length: " << response.body.size() << "\r\n";
    out << "Access-Control-Allow-Origin: *\r\n";
    for (const auto& [name, value] : response.headers) {
        // Framing headers are owned by the serializer
        if (iequals(name, "Content-Length") || iequals(name, "Content-Type") ||
            iequals(name, "Connection") || iequals(name, "Access-Control-Allow-Origin")) {
            continue;
        }
        out << name << ": " << value << "\r\n";
    }
    out << "Connection: close\r\n";
    out << "\r\n";
    out << response.body;
    return out.str();
}

HttpResponse make_error_response(ErrorCode code, const std::string& message, int status) {
    json body = {
        {"success", false},
        {"error", {
            {"code", error_code_name(code)},
            {"message", message}
        }}
    };
    return HttpResponse::json(status > 0 ? status : default_http_status(code), body.dump());
}

HttpResponse make_preflight_response() {
    HttpResponse res;
    res.status = 200;
    res.content_type = "text/plain";
    res.headers["Access-Control-Allow-Methods"] = "GET, POST, OPTIONS";
    res.headers["Access-Control-Allow-Headers"] = "Content-Type, Authorization, X-Requested-With";
    res.headers["Access-Control-Max-Age"] = "86400";
    return res;
}

} // namespace voxserve
