/**
 * @file i_transcription_provider.h
 * @brief Interface for speech-to-text engines
 *
 * A provider turns normalized audio into text plus optional timestamped
 * segments. Providers are registered per ModelProvider kind; the coordinator
 * calls them from the inference pool, never from the state owner.
 *
 * Design Principles:
 * - Providers hold no per-request state between calls
 * - load() may block for a long time and may be called concurrently for
 *   different models
 * - Failures are reported by throwing ModelLoadError / TranscriptionError
 */

#pragma once

#include "../audio_decoder.h"
#include "../model_store.h"

#include <atomic>
#include <string>
#include <vector>

namespace voxserve {

/**
 * @brief One timestamped piece of engine output
 */
struct TranscriptSegment {
    double start = 0.0;               ///< Seconds
    double end = 0.0;                 ///< Seconds
    std::string text;
    bool speaker_turn_next = false;   ///< Engine saw a speaker change after this segment

    double duration() const { return end - start; }
};

/**
 * @brief Per-request engine options
 */
struct TranscriptionOptions {
    std::string language = "auto";
    bool speaker_turns = false;       ///< Ask for speaker-turn flags (tinydiarize)
    int threads = 0;                  ///< 0 = hardware concurrency
    const std::atomic<bool>* cancel = nullptr;   ///< Set when the request timed out
};

struct TranscriptionOutput {
    std::string text;
    std::vector<TranscriptSegment> segments;   ///< Empty when the engine gives none
    std::string language;                      ///< Detected language when known
};

/**
 * @brief Audio handed to a provider: the decoded buffer and a 16 kHz WAV copy
 */
struct AudioResource {
    const AudioBuffer* audio = nullptr;
    std::string wav_path;     ///< 16-bit mono WAV for command-line engines
    std::string source_path;  ///< Original upload
};

class ITranscriptionProvider {
public:
    virtual ~ITranscriptionProvider() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Make the model ready for transcribe()
     * @throws ModelLoadError
     */
    virtual void load(const ModelDescriptor& model) = 0;

    /**
     * @brief Transcribe one resource with a loaded model
     * @throws TranscriptionError
     */
    virtual TranscriptionOutput transcribe(const AudioResource& resource,
                                           const ModelDescriptor& model,
                                           const TranscriptionOptions& options) = 0;

    /** True when segments can carry speaker_turn_next flags */
    virtual bool supports_speaker_turns() const { return false; }

    /** True when AudioResource::wav_path must be written before transcribe() */
    virtual bool needs_wav_file() const { return true; }
};

} // namespace voxserve
