/**
 * @file coordinator.h
 * @brief Bridges concurrent connections to the single-owner application state
 *
 * Connection threads call transcribe() concurrently. The coordinator:
 *   1. reads a snapshot of the application state through the StateOwner
 *   2. triggers (or joins) a model load on the load pool
 *   3. runs decoding, inference, post-processing and diarization on the
 *      inference pool
 *   4. waits for the result in short slices up to the processing ceiling,
 *      firing heartbeats, answering 504 and releasing temp files when the
 *      ceiling is reached
 *
 * The StateOwner thread only ever runs short closures; nothing blocking is
 * executed there and no lock is held across a wait.
 */

#pragma once

#include "audio_decoder.h"
#include "diarization.h"
#include "errors.h"
#include "interfaces/interfaces.h"
#include "model_store.h"
#include "state_owner.h"
#include "thread_pool.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace voxserve {

/**
 * @struct CoordinatorConfig
 */
struct CoordinatorConfig {
    std::chrono::milliseconds processing_timeout{20 * 60 * 1000};
    std::chrono::milliseconds heartbeat_interval{30 * 1000};
    std::string temp_dir;             ///< Empty for <system temp>/voxserve
    std::string language = "auto";
    std::string ffmpeg_path;          ///< Empty disables non-WAV conversion
    size_t inference_threads = 2;
    int engine_threads = 0;           ///< Threads per inference, 0 = auto
};

/**
 * @brief Uploaded audio plus the storage keeping it alive
 *
 * Inference may outlive the connection that received the upload (after a
 * timeout), so the bytes are shared rather than borrowed.
 */
struct AudioUpload {
    std::shared_ptr<const void> storage;   ///< Owner of the memory bytes points into
    std::string_view bytes;
    std::string declared_content_type;
    std::string filename;
};

/**
 * @brief Outcome of one transcription, always a complete JSON body
 */
struct TranscriptionOutcome {
    bool success = false;
    int status = 200;
    std::string body;
    std::optional<ErrorCode> error;
};

/**
 * @brief Read-only view of the application state for /health
 */
struct CoordinatorStatus {
    std::string current_model;          ///< Display name, empty when none
    bool model_loaded = false;
    std::vector<std::string> available_models;
    bool enhancement_enabled = false;
    bool word_replacement_enabled = false;
    std::string language;
};

/** Called on the waiting connection thread at every heartbeat */
using HeartbeatCallback = std::function<void(std::chrono::milliseconds elapsed)>;

class TranscriptionCoordinator {
public:
    explicit TranscriptionCoordinator(CoordinatorConfig config = CoordinatorConfig{});
    ~TranscriptionCoordinator();

    TranscriptionCoordinator(const TranscriptionCoordinator&) = delete;
    TranscriptionCoordinator& operator=(const TranscriptionCoordinator&) = delete;

    // ========================================================================
    // Setup (any thread)
    // ========================================================================

    void register_provider(ModelProvider kind, std::shared_ptr<ITranscriptionProvider> provider);

    void add_model(const ModelDescriptor& model);
    size_t scan_models(const std::string& directory);
    bool select_model(const std::string& id);

    void set_word_replacer(std::shared_ptr<IWordReplacer> replacer, bool enabled);
    void set_enhancer(std::shared_ptr<ITextEnhancer> enhancer, bool enabled);
    void set_language(const std::string& language);

    CoordinatorStatus status();

    // ========================================================================
    // Requests (connection threads)
    // ========================================================================

    /**
     * @brief Transcribe one upload
     *
     * Never throws for request-level failures: NO_MODEL, MODEL_LOAD_FAILED,
     * UNSUPPORTED_AUDIO, TRANSCRIPTION_FAILED and TIMEOUT all come back as
     * an error outcome with a JSON body.
     */
    TranscriptionOutcome transcribe(const AudioUpload& upload,
                                    const std::optional<DiarizationParams>& diarization,
                                    const HeartbeatCallback& on_heartbeat = nullptr);

    const CoordinatorConfig& config() const { return config_; }

    /**
     * @brief Make every transcribe() call in flight return promptly
     *
     * Waiting callers answer 503 and their jobs are cancelled. Calls made
     * afterwards run normally.
     */
    void abort_pending();

    void shutdown();

private:
    /**
     * @brief Mutable state; touched only from the StateOwner thread
     */
    struct ApplicationState {
        ModelStore models;
        std::shared_ptr<IWordReplacer> word_replacer;
        bool word_replacement_enabled = false;
        std::shared_ptr<ITextEnhancer> enhancer;
        bool enhancement_enabled = false;
        std::string language = "auto";
        std::map<std::string, std::shared_future<void>> pending_loads;
    };

    struct Snapshot {
        std::optional<ModelDescriptor> model;
        bool loaded = false;
        std::shared_ptr<IWordReplacer> word_replacer;
        std::shared_ptr<ITextEnhancer> enhancer;
        std::string language;
    };

    struct Job;

    std::shared_ptr<ITranscriptionProvider> provider_for(ModelProvider kind);
    std::shared_future<void> ensure_loaded(const ModelDescriptor& model,
                                           std::shared_ptr<ITranscriptionProvider> provider);
    TranscriptionOutcome run_job(Job& job);

    static TranscriptionOutcome error_outcome(ErrorCode code, const std::string& message, int status = 0);

    CoordinatorConfig config_;
    AudioNormalizer normalizer_;
    SpeakerDiarizer diarizer_;

    StateOwner owner_;
    ApplicationState state_;   // owner_ thread only

    std::mutex providers_mutex_;
    std::map<ModelProvider, std::shared_ptr<ITranscriptionProvider>> providers_;

    ThreadPool load_pool_;
    ThreadPool inference_pool_;
    std::atomic<uint64_t> job_counter_{0};
    std::atomic<uint64_t> abort_generation_{0};
};

} // namespace voxserve
