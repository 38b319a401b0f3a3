/**
 * @file multipart.cpp
 * @brief multipart/form-data extraction over raw bytes
 */

#include "voxserve/multipart.h"

#include <algorithm>
#include <cctype>

namespace voxserve {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) --e;
    return std::string(s.substr(b, e - b));
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        std::string out;
        out.reserve(s.size() - 2);
        for (size_t i = 1; i + 1 < s.size(); ++i) {
            if (s[i] == '\\' && i + 2 < s.size()) {
                ++i;
            }
            out += s[i];
        }
        return out;
    }
    return s;
}

// Split "type; a=1; b=\"x;y\"" on semicolons outside quotes
std::vector<std::string> split_params(std::string_view value) {
    std::vector<std::string> out;
    std::string current;
    bool quoted = false;
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '"') {
            quoted = !quoted;
        } else if (c == '\\' && quoted && i + 1 < value.size()) {
            current += c;
            c = value[++i];
        } else if (c == ';' && !quoted) {
            out.push_back(trim(current));
            current.clear();
            continue;
        }
        current += c;
    }
    out.push_back(trim(current));
    return out;
}

// Parameters of a header value keyed by lowercase name
std::map<std::string, std::string> parse_params(std::string_view value) {
    std::map<std::string, std::string> params;
    auto items = split_params(value);
    for (size_t i = 1; i < items.size(); ++i) {
        const std::string& item = items[i];
        size_t eq = item.find('=');
        if (eq == std::string::npos) continue;
        std::string key = to_lower(trim(std::string_view(item).substr(0, eq)));
        std::string val = unquote(trim(std::string_view(item).substr(eq + 1)));
        params.emplace(key, val);
    }
    return params;
}

bool parse_part_headers(std::string_view headers, MultipartPart& part) {
    bool has_disposition = false;
    size_t pos = 0;
    while (pos < headers.size()) {
        size_t eol = headers.find("\r\n", pos);
        std::string_view line = headers.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
        pos = (eol == std::string_view::npos) ? headers.size() : eol + 2;
        if (line.empty()) continue;

        size_t colon = line.find(':');
        if (colon == std::string_view::npos) {
            return false;
        }
        std::string name = to_lower(trim(line.substr(0, colon)));
        std::string_view value = line.substr(colon + 1);

        if (name == "content-disposition") {
            auto params = parse_params(value);
            auto n = params.find("name");
            if (n != params.end()) part.name = n->second;
            auto f = params.find("filename");
            if (f != params.end()) {
                part.filename = f->second;
                part.has_filename = true;
            }
            has_disposition = true;
        } else if (name == "content-type") {
            part.content_type = trim(value);
        }
    }
    return has_disposition || headers.empty();
}

MultipartForm malformed(const std::string& reason) {
    MultipartForm form;
    form.status = MultipartStatus::Malformed;
    form.error = reason;
    return form;
}

} // anonymous namespace

std::string extract_boundary(const std::string& content_type) {
    auto items = split_params(content_type);
    if (items.empty() || to_lower(items[0]).rfind("multipart/", 0) != 0) {
        return "";
    }
    auto params = parse_params(content_type);
    auto it = params.find("boundary");
    if (it == params.end()) {
        return "";
    }
    // RFC 2046 caps boundaries at 70 characters
    if (it->second.size() > 70) {
        return "";
    }
    return it->second;
}

MultipartForm extract_multipart(std::string_view body, const std::string& boundary) {
    if (boundary.empty()) {
        return malformed("Empty multipart boundary");
    }

    const std::string delimiter = "--" + boundary;
    const std::string part_delimiter = "\r\n" + delimiter;

    size_t pos = body.find(delimiter);
    if (pos == std::string_view::npos) {
        return malformed("Multipart boundary not found in body");
    }
    // Preamble before the first delimiter must end with CRLF
    if (pos > 0 && (pos < 2 || body.substr(pos - 2, 2) != "\r\n")) {
        return malformed("Multipart boundary not at line start");
    }
    pos += delimiter.size();

    MultipartForm form;
    bool closed = false;

    while (pos <= body.size()) {
        if (body.substr(pos, 2) == "--") {
            closed = true;
            break;
        }
        // Transport padding after the delimiter
        while (pos < body.size() && (body[pos] == ' ' || body[pos] == '\t')) ++pos;
        if (body.substr(pos, 2) != "\r\n") {
            return malformed("Expected CRLF after multipart boundary");
        }
        pos += 2;

        MultipartPart part;
        size_t payload_start;
        if (body.substr(pos, 2) == "\r\n") {
            payload_start = pos + 2;
        } else {
            size_t header_end = body.find("\r\n\r\n", pos);
            if (header_end == std::string_view::npos) {
                return malformed("Multipart part headers are not terminated");
            }
            if (!parse_part_headers(body.substr(pos, header_end - pos), part)) {
                return malformed("Invalid multipart part headers");
            }
            payload_start = header_end + 4;
        }

        size_t next = body.find(part_delimiter, payload_start);
        if (next == std::string_view::npos) {
            return malformed("Multipart part is not terminated by a boundary");
        }

        part.offset = payload_start;
        part.length = next - payload_start;
        form.parts.push_back(part);
        pos = next + part_delimiter.size();
    }

    if (!closed) {
        return malformed("Missing closing multipart boundary");
    }

    bool found_file = false;
    for (const auto& part : form.parts) {
        std::string_view payload = body.substr(part.offset, part.length);
        if (part.name == "file") {
            if (!found_file) {
                form.file_data = payload;
                form.file_name = part.filename;
                form.file_content_type = part.content_type;
                found_file = true;
            }
        } else if (!part.name.empty() && !part.has_filename) {
            form.fields.emplace(part.name, std::string(payload));
        }
    }

    if (!found_file) {
        form.status = MultipartStatus::NoFileField;
        form.error = "No file field in multipart body";
        return form;
    }

    form.status = MultipartStatus::Ok;
    return form;
}

} // namespace voxserve
