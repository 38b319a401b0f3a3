/**
 * @file errors.h
 * @brief Error taxonomy shared by the HTTP layer and the transcription pipeline
 *
 * Every failure that reaches a client is described by an ErrorCode. The code
 * decides the default HTTP status and the machine-readable string placed in
 * the JSON error body: {"success": false, "error": {"code", "message"}}.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace voxserve {

/**
 * @brief Client-visible error codes
 */
enum class ErrorCode {
    BadRequest,                       ///< Malformed request line or headers
    MissingBoundary,                  ///< multipart/form-data without boundary
    MissingFile,                      ///< No `file` part in the form
    MalformedMultipart,               ///< Broken multipart structure
    InvalidParameter,                 ///< Bad scalar form field
    UnsupportedAudio,                 ///< Audio could not be decoded
    NotFound,                         ///< Unknown route
    PayloadTooLarge,                  ///< Body exceeds the configured cap
    NoModel,                          ///< No transcription model selected
    ModelLoadFailed,                  ///< Local model failed to load
    TranscriptionFailed,              ///< Engine failure
    DiarizationMethodNotImplemented,  ///< Requested method has no implementation
    DiarizationUnavailable,           ///< No usable diarization method for this audio
    Timeout,                          ///< Idle or processing ceiling reached
    Internal                          ///< Anything else
};

/**
 * @brief Wire name of an error code, e.g. "MISSING_FILE"
 */
const char* error_code_name(ErrorCode code);

/**
 * @brief HTTP status used when an error carries no explicit status
 */
int default_http_status(ErrorCode code);

/**
 * @brief Error raised inside a request handler and rendered as a JSON error body
 */
class ApiError : public std::runtime_error {
public:
    ApiError(ErrorCode code, const std::string& message, int http_status = 0)
        : std::runtime_error(message)
        , code_(code)
        , http_status_(http_status > 0 ? http_status : default_http_status(code)) {}

    ErrorCode code() const { return code_; }
    int http_status() const { return http_status_; }

private:
    ErrorCode code_;
    int http_status_;
};

/**
 * @brief Listener could not be opened (port in use, permission denied, ...)
 */
class BindError : public std::runtime_error {
public:
    BindError(const std::string& message, int sys_errno)
        : std::runtime_error(message), sys_errno_(sys_errno) {}

    int sys_errno() const { return sys_errno_; }

private:
    int sys_errno_;
};

class ModelLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class TranscriptionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class AudioDecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Diarization failure; code is DiarizationMethodNotImplemented or
 *        DiarizationUnavailable
 */
class DiarizationError : public std::runtime_error {
public:
    DiarizationError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace voxserve
