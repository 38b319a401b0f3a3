/**
 * @file errors.cpp
 * @brief Error code names and default HTTP statuses
 */

#include "voxserve/errors.h"

namespace voxserve {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::BadRequest:                      return "BAD_REQUEST";
        case ErrorCode::MissingBoundary:                 return "MISSING_BOUNDARY";
        case ErrorCode::MissingFile:                     return "MISSING_FILE";
        case ErrorCode::MalformedMultipart:              return "MALFORMED_MULTIPART";
        case ErrorCode::InvalidParameter:                return "INVALID_PARAMETER";
        case ErrorCode::UnsupportedAudio:                return "UNSUPPORTED_AUDIO";
        case ErrorCode::NotFound:                        return "NOT_FOUND";
        case ErrorCode::PayloadTooLarge:                 return "PAYLOAD_TOO_LARGE";
        case ErrorCode::NoModel:                         return "NO_MODEL";
        case ErrorCode::ModelLoadFailed:                 return "MODEL_LOAD_FAILED";
        case ErrorCode::TranscriptionFailed:             return "TRANSCRIPTION_FAILED";
        case ErrorCode::DiarizationMethodNotImplemented: return "DIARIZATION_METHOD_NOT_IMPLEMENTED";
        case ErrorCode::DiarizationUnavailable:          return "DIARIZATION_UNAVAILABLE";
        case ErrorCode::Timeout:                         return "TIMEOUT";
        case ErrorCode::Internal:                        return "INTERNAL_ERROR";
    }
    return "INTERNAL_ERROR";
}

int default_http_status(ErrorCode code) {
    switch (code) {
        case ErrorCode::BadRequest:
        case ErrorCode::MissingBoundary:
        case ErrorCode::MissingFile:
        case ErrorCode::MalformedMultipart:
        case ErrorCode::InvalidParameter:
        case ErrorCode::UnsupportedAudio:
        case ErrorCode::DiarizationMethodNotImplemented:
            return 400;
        case ErrorCode::NotFound:
            return 404;
        case ErrorCode::PayloadTooLarge:
            return 413;
        case ErrorCode::Timeout:
            return 504;
        case ErrorCode::NoModel:
        case ErrorCode::ModelLoadFailed:
        case ErrorCode::TranscriptionFailed:
        case ErrorCode::DiarizationUnavailable:
        case ErrorCode::Internal:
            return 500;
    }
    return 500;
}

} // namespace voxserve
