/**
 * @file multipart.h
 * @brief Binary-safe multipart/form-data extraction
 *
 * The body is never transcoded to text. Parts are located by searching for
 * the raw boundary delimiter, so payloads may contain any byte values
 * (including CR, LF and NUL).
 */

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace voxserve {

/**
 * @brief Extract the boundary parameter from a Content-Type header value
 *
 * Accepts `multipart/form-data; boundary=XYZ`, quoted boundaries and
 * trailing parameters (`boundary="a b"; charset=utf-8`).
 *
 * @return Boundary token, or empty string when absent or not multipart
 */
std::string extract_boundary(const std::string& content_type);

/**
 * @brief One part of a multipart body; payload is a byte range of the body
 */
struct MultipartPart {
    std::string name;            ///< `name` from Content-Disposition
    std::string filename;        ///< `filename` from Content-Disposition
    std::string content_type;    ///< Part Content-Type, may be empty
    bool has_filename = false;
    size_t offset = 0;           ///< Payload start within the body
    size_t length = 0;           ///< Payload length (trailing CRLF trimmed)
};

enum class MultipartStatus {
    Ok,
    NoFileField,   ///< Well-formed, but no part named "file"
    Malformed      ///< Structure broken: missing delimiter, header terminator, ...
};

/**
 * @brief Result of extraction; string views refer into the caller's body
 */
struct MultipartForm {
    MultipartStatus status = MultipartStatus::Malformed;
    std::string error;                        ///< Human readable reason when status != Ok

    std::string_view file_data;               ///< Payload of the "file" part
    std::string file_name;
    std::string file_content_type;

    std::map<std::string, std::string> fields;   ///< Scalar parts by name
    std::vector<MultipartPart> parts;

    bool ok() const { return status == MultipartStatus::Ok; }
    bool has_field(const std::string& name) const { return fields.count(name) > 0; }
};

/**
 * @brief Split a multipart body into its file payload and scalar fields
 *
 * The first part named "file" provides the payload; every other part named
 * part becomes a scalar field (first occurrence wins).
 */
MultipartForm extract_multipart(std::string_view body, const std::string& boundary);

} // namespace voxserve
