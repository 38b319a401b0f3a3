/**
 * @file audio_format.cpp
 * @brief Magic-byte audio format detection
 */

#include "voxserve/audio_format.h"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace voxserve {

namespace {

bool starts_with(const unsigned char* data, size_t size, const char* magic, size_t offset = 0) {
    size_t len = std::strlen(magic);
    if (size < offset + len) return false;
    return std::memcmp(data + offset, magic, len) == 0;
}

} // anonymous namespace

AudioFormat detect_audio_format(const unsigned char* data, size_t size) {
    if (!data || size < 4) {
        return AudioFormat::Unknown;
    }

    // RIFF....WAVE
    if (starts_with(data, size, "RIFF") && starts_with(data, size, "WAVE", 8)) {
        return AudioFormat::Wav;
    }

    if (starts_with(data, size, "fLaC")) {
        return AudioFormat::Flac;
    }

    if (starts_with(data, size, "OggS")) {
        return AudioFormat::Ogg;
    }

    // EBML header (Matroska / WebM)
    if (data[0] == 0x1A && data[1] == 0x45 && data[2] == 0xDF && data[3] == 0xA3) {
        return AudioFormat::Webm;
    }

    // ISO BMFF: box size (4 bytes) then "ftyp"
    if (starts_with(data, size, "ftyp", 4)) {
        return AudioFormat::M4a;
    }

    if (starts_with(data, size, "ID3")) {
        return AudioFormat::Mp3;
    }

    if (data[0] == 0xFF) {
        // ADTS: 12-bit sync, layer bits 00
        if ((data[1] & 0xF6) == 0xF0) {
            return AudioFormat::Aac;
        }
        // MPEG audio frame: 11-bit sync, layer bits != 00
        if ((data[1] & 0xE0) == 0xE0 && (data[1] & 0x06) != 0) {
            return AudioFormat::Mp3;
        }
    }

    return AudioFormat::Unknown;
}

AudioFormat audio_format_from_content_type(const std::string& content_type) {
    std::string ct = content_type;
    std::transform(ct.begin(), ct.end(), ct.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ct.find("mpeg") != std::string::npos || ct.find("mp3") != std::string::npos) return AudioFormat::Mp3;
    if (ct.find("wav") != std::string::npos || ct.find("wave") != std::string::npos) return AudioFormat::Wav;
    if (ct.find("mp4") != std::string::npos || ct.find("m4a") != std::string::npos) return AudioFormat::M4a;
    if (ct.find("aac") != std::string::npos) return AudioFormat::Aac;
    if (ct.find("flac") != std::string::npos) return AudioFormat::Flac;
    if (ct.find("ogg") != std::string::npos) return AudioFormat::Ogg;
    if (ct.find("webm") != std::string::npos) return AudioFormat::Webm;
    return AudioFormat::Unknown;
}

const char* audio_format_name(AudioFormat format) {
    switch (format) {
        case AudioFormat::Mp3:     return "mp3";
        case AudioFormat::Wav:     return "wav";
        case AudioFormat::M4a:     return "m4a";
        case AudioFormat::Aac:     return "aac";
        case AudioFormat::Flac:    return "flac";
        case AudioFormat::Ogg:     return "ogg";
        case AudioFormat::Webm:    return "webm";
        case AudioFormat::Unknown: return "unknown";
    }
    return "unknown";
}

const char* audio_format_extension(AudioFormat format) {
    switch (format) {
        case AudioFormat::Mp3:     return ".mp3";
        case AudioFormat::Wav:     return ".wav";
        case AudioFormat::M4a:     return ".m4a";
        case AudioFormat::Aac:     return ".aac";
        case AudioFormat::Flac:    return ".flac";
        case AudioFormat::Ogg:     return ".ogg";
        case AudioFormat::Webm:    return ".webm";
        case AudioFormat::Unknown: return ".bin";
    }
    return ".bin";
}

const char* audio_format_content_type(AudioFormat format) {
    switch (format) {
        case AudioFormat::Mp3:     return "audio/mpeg";
        case AudioFormat::Wav:     return "audio/wav";
        case AudioFormat::M4a:     return "audio/mp4";
        case AudioFormat::Aac:     return "audio/aac";
        case AudioFormat::Flac:    return "audio/flac";
        case AudioFormat::Ogg:     return "audio/ogg";
        case AudioFormat::Webm:    return "audio/webm";
        case AudioFormat::Unknown: return "application/octet-stream";
    }
    return "application/octet-stream";
}

} // namespace voxserve
