/**
 * @file audio_decoder.h
 * @brief Audio normalization to the engine's 16 kHz float format
 *
 * WAV is decoded with dr_wav. Other containers are converted to WAV by an
 * external ffmpeg binary when one is configured.
 */

#pragma once

#include "audio_format.h"

#include <string>
#include <string_view>
#include <vector>

namespace voxserve {

constexpr int ENGINE_SAMPLE_RATE = 16000;

/**
 * @struct AudioBuffer
 * @brief Decoded audio at ENGINE_SAMPLE_RATE
 */
struct AudioBuffer {
    int sample_rate = ENGINE_SAMPLE_RATE;
    std::vector<float> mono;                    ///< Downmixed signal fed to the engine
    std::vector<std::vector<float>> channels;   ///< Per-channel signal, same length as mono
    int source_channels = 0;
    int source_sample_rate = 0;

    double duration_seconds() const {
        return sample_rate > 0 ? static_cast<double>(mono.size()) / sample_rate : 0.0;
    }
    bool is_stereo() const { return channels.size() >= 2; }
};

/**
 * @brief Decode a RIFF/WAVE byte buffer
 *
 * Supports PCM 8/16/24/32-bit, IEEE float 32/64, A-law, mu-law and
 * ADPCM (also via WAVE_FORMAT_EXTENSIBLE). Output is resampled to
 * target_rate.
 *
 * @throws AudioDecodeError on malformed or unsupported input
 */
AudioBuffer decode_wav(std::string_view bytes, int target_rate = ENGINE_SAMPLE_RATE);

/**
 * @brief Linear-interpolation resampler
 */
std::vector<float> resample_linear(const std::vector<float>& input, int from_rate, int to_rate);

/**
 * @brief Write 16-bit PCM WAV (interleaving channels when more than one)
 * @throws std::runtime_error on I/O failure
 */
void write_wav_pcm16(const std::string& path, const std::vector<std::vector<float>>& channels, int sample_rate);

class AudioNormalizer {
public:
    /**
     * @param ffmpeg_path Converter binary; empty disables conversion of
     *        non-WAV input
     */
    explicit AudioNormalizer(std::string ffmpeg_path = "");

    /**
     * @brief Decode an uploaded file to an AudioBuffer
     * @param input_path Temp file holding the upload (used by ffmpeg)
     * @param bytes The same upload in memory
     * @param work_dir Directory for intermediate files
     * @throws AudioDecodeError when the audio cannot be decoded
     */
    AudioBuffer normalize(const std::string& input_path,
                          std::string_view bytes,
                          AudioFormat format,
                          const std::string& work_dir) const;

    bool can_convert() const { return !ffmpeg_path_.empty(); }
    const std::string& ffmpeg_path() const { return ffmpeg_path_; }

private:
    AudioBuffer convert_with_ffmpeg(const std::string& input_path, const std::string& work_dir) const;

    std::string ffmpeg_path_;
};

/**
 * @brief Run "<ffmpeg> -version" quietly
 */
bool ffmpeg_available(const std::string& ffmpeg_path);

} // namespace voxserve
