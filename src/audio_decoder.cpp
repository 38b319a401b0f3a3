/**
 * @file audio_decoder.cpp
 * @brief WAV decoding (dr_wav), resampling and ffmpeg conversion
 */

#include "voxserve/audio_decoder.h"
#include "voxserve/command.h"
#include "voxserve/errors.h"
#include "voxserve/temp_file.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

#define DR_WAV_IMPLEMENTATION
#include <dr_wav.h>

namespace voxserve {

namespace {

/**
 * @brief Owns an initialized drwav handle
 */
class WavReader {
public:
    explicit WavReader(std::string_view bytes) {
        if (bytes.empty() || !drwav_init_memory(&wav_, bytes.data(), bytes.size(), nullptr)) {
            throw AudioDecodeError("Invalid WAV file format");
        }
        open_ = true;
    }

    ~WavReader() {
        if (open_) {
            drwav_uninit(&wav_);
        }
    }

    WavReader(const WavReader&) = delete;
    WavReader& operator=(const WavReader&) = delete;

    drwav& get() { return wav_; }

private:
    drwav wav_;
    bool open_ = false;
};

void check_encoding(const drwav& wav) {
    const uint16_t tag = wav.translatedFormatTag;
    const uint16_t bits = wav.bitsPerSample;
    switch (tag) {
        case DR_WAVE_FORMAT_PCM:
            if (bits != 8 && bits != 16 && bits != 24 && bits != 32) {
                throw AudioDecodeError("Unsupported PCM bit depth " + std::to_string(bits));
            }
            break;
        case DR_WAVE_FORMAT_IEEE_FLOAT:
            if (bits != 32 && bits != 64) {
                throw AudioDecodeError("Unsupported float WAV bit depth " + std::to_string(bits));
            }
            break;
        case DR_WAVE_FORMAT_ALAW:
        case DR_WAVE_FORMAT_MULAW:
        case DR_WAVE_FORMAT_ADPCM:
        case DR_WAVE_FORMAT_DVI_ADPCM:
            break;
        default:
            throw AudioDecodeError("Unsupported WAV encoding (format tag " + std::to_string(tag) + ")");
    }
    if (wav.channels == 0 || wav.sampleRate == 0) {
        throw AudioDecodeError("Invalid WAV channel count or sample rate");
    }
}

} // anonymous namespace

// ============================================================================
// WAV
// ============================================================================

AudioBuffer decode_wav(std::string_view bytes, int target_rate) {
    WavReader reader(bytes);
    drwav& wav = reader.get();
    check_encoding(wav);

    const unsigned num_channels = wav.channels;
    const uint64_t total_frames = wav.totalPCMFrameCount;

    std::vector<float> interleaved(static_cast<size_t>(total_frames) * num_channels);
    const uint64_t frames_read = interleaved.empty()
        ? 0
        : drwav_read_pcm_frames_f32(&wav, total_frames, interleaved.data());
    const size_t num_frames = static_cast<size_t>(frames_read);

    std::vector<std::vector<float>> channels(num_channels, std::vector<float>(num_frames));
    for (size_t i = 0; i < num_frames; ++i) {
        for (unsigned c = 0; c < num_channels; ++c) {
            channels[c][i] = interleaved[i * num_channels + c];
        }
    }

    AudioBuffer out;
    out.sample_rate = target_rate;
    out.source_channels = static_cast<int>(num_channels);
    out.source_sample_rate = static_cast<int>(wav.sampleRate);

    for (auto& ch : channels) {
        out.channels.push_back(resample_linear(ch, out.source_sample_rate, target_rate));
    }

    const size_t n = out.channels.empty() ? 0 : out.channels[0].size();
    out.mono.assign(n, 0.0f);
    for (const auto& ch : out.channels) {
        for (size_t i = 0; i < n && i < ch.size(); ++i) {
            out.mono[i] += ch[i];
        }
    }
    if (out.channels.size() > 1) {
        const float scale = 1.0f / static_cast<float>(out.channels.size());
        for (auto& s : out.mono) s *= scale;
    }
    return out;
}

std::vector<float> resample_linear(const std::vector<float>& input, int from_rate, int to_rate) {
    if (from_rate == to_rate || input.empty() || from_rate <= 0 || to_rate <= 0) {
        return input;
    }

    const double ratio = static_cast<double>(from_rate) / to_rate;
    const size_t out_len = static_cast<size_t>(std::floor(input.size() / ratio));
    std::vector<float> out(out_len);
    for (size_t i = 0; i < out_len; ++i) {
        double src = i * ratio;
        size_t i0 = static_cast<size_t>(src);
        size_t i1 = std::min(i0 + 1, input.size() - 1);
        double frac = src - static_cast<double>(i0);
        out[i] = static_cast<float>(input[i0] * (1.0 - frac) + input[i1] * frac);
    }
    return out;
}

void write_wav_pcm16(const std::string& path, const std::vector<std::vector<float>>& channels, int sample_rate) {
    const unsigned num_channels = static_cast<unsigned>(channels.size());
    const size_t num_frames = channels.empty() ? 0 : channels[0].size();

    std::vector<int16_t> pcm;
    pcm.reserve(num_frames * num_channels);
    for (size_t i = 0; i < num_frames; ++i) {
        for (const auto& ch : channels) {
            float s = std::max(-1.0f, std::min(1.0f, i < ch.size() ? ch[i] : 0.0f));
            pcm.push_back(static_cast<int16_t>(std::lround(s * 32767.0f)));
        }
    }

    drwav_data_format format;
    format.container = drwav_container_riff;
    format.format = DR_WAVE_FORMAT_PCM;
    format.channels = num_channels;
    format.sampleRate = static_cast<drwav_uint32>(sample_rate);
    format.bitsPerSample = 16;

    drwav wav;
    if (!drwav_init_file_write(&wav, path.c_str(), &format, nullptr)) {
        throw std::runtime_error("Could not open " + path + " for writing");
    }
    drwav_uint64 written = drwav_write_pcm_frames(&wav, num_frames, pcm.data());
    drwav_uninit(&wav);
    if (written != num_frames) {
        throw std::runtime_error("Could not write " + path);
    }
}

// ============================================================================
// Normalizer
// ============================================================================

AudioNormalizer::AudioNormalizer(std::string ffmpeg_path)
    : ffmpeg_path_(std::move(ffmpeg_path)) {}

AudioBuffer AudioNormalizer::normalize(const std::string& input_path,
                                       std::string_view bytes,
                                       AudioFormat format,
                                       const std::string& work_dir) const {
    if (format == AudioFormat::Wav) {
        try {
            return decode_wav(bytes);
        } catch (const AudioDecodeError& e) {
            if (!can_convert()) {
                throw;
            }
            std::cout << "[Audio] Native WAV decode failed (" << e.what()
                      << "), converting with ffmpeg" << std::endl;
        }
    }

    if (!can_convert()) {
        throw AudioDecodeError(std::string("Cannot decode ") + audio_format_name(format) +
                               " audio: no ffmpeg converter configured");
    }
    return convert_with_ffmpeg(input_path, work_dir);
}

AudioBuffer AudioNormalizer::convert_with_ffmpeg(const std::string& input_path, const std::string& work_dir) const {
    ScopedTempFile converted(work_dir, ".wav");

    // Channel layout is kept so stereo input can still be diarized by channel
    std::ostringstream cmd;
    cmd << shell_quote(ffmpeg_path_) << " -nostdin -hide_banner -loglevel error"
        << " -i " << shell_quote(input_path)
        << " -y -ar " << ENGINE_SAMPLE_RATE << " -c:a pcm_s16le "
        << shell_quote(converted.path());
#ifndef _WIN32
    cmd << " 2>/dev/null";
#endif

    int status = std::system(cmd.str().c_str());
    if (status != 0) {
        throw AudioDecodeError("FFmpeg audio conversion failed (exit status " + std::to_string(status) + ")");
    }

    std::ifstream in(converted.path(), std::ios::binary);
    if (!in.is_open()) {
        throw AudioDecodeError("FFmpeg produced no output file");
    }
    std::string wav((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return decode_wav(wav);
}

bool ffmpeg_available(const std::string& ffmpeg_path) {
    if (ffmpeg_path.empty()) {
        return false;
    }
#ifdef _WIN32
    std::string cmd = shell_quote(ffmpeg_path) + " -version >NUL 2>&1";
#else
    std::string cmd = shell_quote(ffmpeg_path) + " -version >/dev/null 2>&1";
#endif
    return std::system(cmd.c_str()) == 0;
}

} // namespace voxserve
