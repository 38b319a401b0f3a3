/**
 * @file audio_format.h
 * @brief Audio container detection by magic bytes
 *
 * Classification never trusts the client-declared content type. The declared
 * type is only consulted as a hint when the magic bytes are inconclusive.
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace voxserve {

enum class AudioFormat {
    Mp3,
    Wav,
    M4a,
    Aac,
    Flac,
    Ogg,
    Webm,
    Unknown
};

/**
 * @brief Classify raw bytes by fixed-offset signatures
 *
 * Recognized: RIFF....WAVE, fLaC, OggS, ID3 / MPEG frame sync, ADTS sync,
 * ....ftyp (MP4/M4A), EBML (WebM). Pure function of the first 12 bytes.
 */
AudioFormat detect_audio_format(const unsigned char* data, size_t size);

inline AudioFormat detect_audio_format(std::string_view bytes) {
    return detect_audio_format(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size());
}

/**
 * @brief Map a declared content type ("audio/mpeg", "audio/x-wav", ...) to a format
 * @return AudioFormat::Unknown when nothing matches
 */
AudioFormat audio_format_from_content_type(const std::string& content_type);

const char* audio_format_name(AudioFormat format);       ///< "mp3", "wav", ...
const char* audio_format_extension(AudioFormat format);  ///< ".mp3", ".wav", ..., ".bin"
const char* audio_format_content_type(AudioFormat format);

} // namespace voxserve
