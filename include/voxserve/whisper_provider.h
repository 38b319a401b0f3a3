/**
 * @file whisper_provider.h
 * @brief In-process whisper.cpp transcription provider
 *
 * Only compiled when whisper.cpp is found at build time
 * (VOXSERVE_HAS_WHISPER).
 */

#pragma once

#ifdef VOXSERVE_HAS_WHISPER

#include "interfaces/i_transcription_provider.h"

#include <map>
#include <mutex>
#include <string>

struct whisper_context;

namespace voxserve {

/**
 * @brief One shared whisper_context per model file, one whisper_state per call
 *
 * Concurrent requests against the same model each get their own state, so
 * they can decode in parallel.
 */
class WhisperTranscriptionProvider : public ITranscriptionProvider {
public:
    explicit WhisperTranscriptionProvider(bool use_gpu = true);
    ~WhisperTranscriptionProvider() override;

    WhisperTranscriptionProvider(const WhisperTranscriptionProvider&) = delete;
    WhisperTranscriptionProvider& operator=(const WhisperTranscriptionProvider&) = delete;

    std::string name() const override { return "whisper.cpp"; }
    void load(const ModelDescriptor& model) override;
    TranscriptionOutput transcribe(const AudioResource& resource,
                                   const ModelDescriptor& model,
                                   const TranscriptionOptions& options) override;
    bool supports_speaker_turns() const override { return true; }
    bool needs_wav_file() const override { return false; }

private:
    whisper_context* context_for(const std::string& path);

    bool use_gpu_;
    std::mutex mutex_;
    std::map<std::string, whisper_context*> contexts_;
};

} // namespace voxserve

#endif // VOXSERVE_HAS_WHISPER
