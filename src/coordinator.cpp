/**
 * @file coordinator.cpp
 * @brief Transcription coordinator implementation
 */

#include "voxserve/coordinator.h"
#include "voxserve/audio_format.h"
#include "voxserve/temp_file.h"

#include "nlohmann/json.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::ordered_json;

namespace voxserve {

namespace {

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

json segment_to_json(const AlignedSegment& seg) {
    json j = {
        {"start", seg.start},
        {"end", seg.end},
        {"text", seg.text},
        {"speaker", seg.speaker}
    };
    if (seg.confidence) j["confidence"] = *seg.confidence;
    if (seg.speaker_confidence) j["speakerConfidence"] = *seg.speaker_confidence;
    return j;
}

enum class WaitResult { Ready, TimedOut, Aborted };

constexpr std::chrono::milliseconds WAIT_SLICE{100};

/**
 * @brief Wait for a future until the deadline, heartbeating on the way
 *
 * Wakes every WAIT_SLICE to notice an abort; heartbeat() runs once per
 * heartbeat interval.
 */
template<typename Future, typename Aborted, typename Heartbeat>
WaitResult wait_ready(Future& future,
                      std::chrono::steady_clock::time_point deadline,
                      std::chrono::milliseconds heartbeat_interval,
                      Aborted&& aborted,
                      Heartbeat&& heartbeat) {
    auto next_heartbeat = std::chrono::steady_clock::now() + heartbeat_interval;
    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (future.wait_until(std::min(deadline, now + WAIT_SLICE)) == std::future_status::ready) {
            return WaitResult::Ready;
        }
        if (aborted()) {
            return WaitResult::Aborted;
        }
        now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return WaitResult::TimedOut;
        }
        if (now >= next_heartbeat) {
            heartbeat();
            next_heartbeat = now + heartbeat_interval;
        }
    }
}

} // anonymous namespace

// ============================================================================
// Job
// ============================================================================

/**
 * @brief One request's work item, shared by the waiter and the pool task
 */
struct TranscriptionCoordinator::Job {
    uint64_t id = 0;
    AudioUpload upload;
    std::optional<DiarizationParams> diarization;
    ModelDescriptor model;
    std::shared_ptr<ITranscriptionProvider> provider;
    Snapshot snapshot;
    AudioFormat format = AudioFormat::Unknown;
    std::chrono::steady_clock::time_point started;
    std::atomic<bool> cancel{false};

    std::mutex files_mutex;
    bool files_released = false;
    std::vector<ScopedTempFile> files;

    /**
     * @brief Create a temp file and fill it through writer(path)
     * @throws std::runtime_error once the job's files were released
     */
    template<typename Writer>
    std::string create_file(const std::string& dir, const std::string& ext, Writer&& writer) {
        std::lock_guard<std::mutex> lock(files_mutex);
        if (files_released) {
            throw std::runtime_error("Job was abandoned");
        }
        files.emplace_back(dir, ext);
        const std::string path = files.back().path();
        writer(path);
        return path;
    }

    void release_files() {
        std::lock_guard<std::mutex> lock(files_mutex);
        files_released = true;
        files.clear();
    }

    void check_cancelled() const {
        if (cancel.load()) {
            throw ApiError(ErrorCode::Timeout, "Transcription cancelled after processing timeout");
        }
    }
};

// ============================================================================
// Construction
// ============================================================================

TranscriptionCoordinator::TranscriptionCoordinator(CoordinatorConfig config)
    : config_(std::move(config))
    , normalizer_(config_.ffmpeg_path)
    , load_pool_(1, "ModelLoader")
    , inference_pool_(config_.inference_threads, "Inference")
{
    state_.language = config_.language.empty() ? "auto" : config_.language;
    std::cout << "[Coordinator] Initialized: " << config_.inference_threads << " inference thread(s), "
              << "processing timeout " << config_.processing_timeout.count() / 1000 << "s" << std::endl;
}

TranscriptionCoordinator::~TranscriptionCoordinator() {
    shutdown();
}

void TranscriptionCoordinator::abort_pending() {
    abort_generation_.fetch_add(1);
    std::cout << "[Coordinator] Aborting transcriptions in flight" << std::endl;
}

void TranscriptionCoordinator::shutdown() {
    inference_pool_.shutdown();
    load_pool_.shutdown();
    owner_.shutdown();
}

// ============================================================================
// Setup
// ============================================================================

void TranscriptionCoordinator::register_provider(ModelProvider kind, std::shared_ptr<ITranscriptionProvider> provider) {
    std::lock_guard<std::mutex> lock(providers_mutex_);
    std::cout << "[Coordinator] Provider for " << model_provider_name(kind) << " models: "
              << (provider ? provider->name() : "none") << std::endl;
    providers_[kind] = std::move(provider);
}

std::shared_ptr<ITranscriptionProvider> TranscriptionCoordinator::provider_for(ModelProvider kind) {
    std::lock_guard<std::mutex> lock(providers_mutex_);
    auto it = providers_.find(kind);
    return it == providers_.end() ? nullptr : it->second;
}

void TranscriptionCoordinator::add_model(const ModelDescriptor& model) {
    owner_.run([this, model]() { state_.models.add_model(model); });
}

size_t TranscriptionCoordinator::scan_models(const std::string& directory) {
    return owner_.run([this, directory]() { return state_.models.scan_directory(directory); });
}

bool TranscriptionCoordinator::select_model(const std::string& id) {
    bool ok = owner_.run([this, id]() { return state_.models.select_model(id); });
    if (ok) {
        std::cout << "[Coordinator] Selected model: " << id << std::endl;
    } else {
        std::cerr << "[Coordinator] Unknown model: " << id << std::endl;
    }
    return ok;
}

void TranscriptionCoordinator::set_word_replacer(std::shared_ptr<IWordReplacer> replacer, bool enabled) {
    owner_.run([this, replacer, enabled]() {
        state_.word_replacer = replacer;
        state_.word_replacement_enabled = enabled && replacer != nullptr;
    });
}

void TranscriptionCoordinator::set_enhancer(std::shared_ptr<ITextEnhancer> enhancer, bool enabled) {
    owner_.run([this, enhancer, enabled]() {
        state_.enhancer = enhancer;
        state_.enhancement_enabled = enabled && enhancer != nullptr;
    });
}

void TranscriptionCoordinator::set_language(const std::string& language) {
    owner_.run([this, language]() { state_.language = language.empty() ? "auto" : language; });
}

CoordinatorStatus TranscriptionCoordinator::status() {
    return owner_.run([this]() {
        CoordinatorStatus s;
        auto model = state_.models.current_model();
        if (model) s.current_model = model->display_name;
        s.model_loaded = model.has_value() && state_.models.is_loaded();
        s.available_models = state_.models.available_model_names();
        s.enhancement_enabled = state_.enhancement_enabled;
        s.word_replacement_enabled = state_.word_replacement_enabled;
        s.language = state_.language;
        return s;
    });
}

// ============================================================================
// Model loading
// ============================================================================

std::shared_future<void> TranscriptionCoordinator::ensure_loaded(const ModelDescriptor& model,
                                                                 std::shared_ptr<ITranscriptionProvider> provider) {
    return owner_.run([this, model, provider]() -> std::shared_future<void> {
        auto current = state_.models.current_model();
        if (current && current->id == model.id && state_.models.is_loaded()) {
            std::promise<void> ready;
            ready.set_value();
            return ready.get_future().share();
        }

        auto pending = state_.pending_loads.find(model.id);
        if (pending != state_.pending_loads.end()) {
            return pending->second;
        }

        auto promise = std::make_shared<std::promise<void>>();
        std::shared_future<void> loaded = promise->get_future().share();
        state_.pending_loads[model.id] = loaded;

        std::cout << "[Coordinator] Loading model " << model.id << " with " << provider->name() << std::endl;

        // Completion is reported back through the owner so the loaded flag
        // and the pending table change together
        bool queued = load_pool_.post([this, model, provider, promise]() {
            std::exception_ptr failure;
            try {
                provider->load(model);
            } catch (const std::exception& e) {
                std::cerr << "[Coordinator] Model load failed: " << e.what() << std::endl;
                failure = std::current_exception();
            } catch (...) {
                std::cerr << "[Coordinator] Model load failed with a non-standard exception" << std::endl;
                failure = std::make_exception_ptr(
                    ModelLoadError(provider->name() + " failed with a non-standard exception"));
            }

            bool posted = owner_.post([this, model, promise, failure]() {
                state_.pending_loads.erase(model.id);
                if (failure) {
                    promise->set_exception(failure);
                } else {
                    state_.models.mark_loaded(model.id);
                    promise->set_value();
                }
            });
            if (!posted) {
                if (failure) {
                    promise->set_exception(failure);
                } else {
                    promise->set_value();
                }
            }
        });

        if (!queued) {
            state_.pending_loads.erase(model.id);
            promise->set_exception(std::make_exception_ptr(ModelLoadError("Server is shutting down")));
        }
        return loaded;
    });
}

// ============================================================================
// Transcription
// ============================================================================

TranscriptionOutcome TranscriptionCoordinator::error_outcome(ErrorCode code, const std::string& message, int status) {
    TranscriptionOutcome out;
    out.success = false;
    out.status = status > 0 ? status : default_http_status(code);
    out.error = code;
    json body = {
        {"success", false},
        {"error", {
            {"code", error_code_name(code)},
            {"message", message}
        }}
    };
    out.body = body.dump();
    return out;
}

TranscriptionOutcome TranscriptionCoordinator::transcribe(const AudioUpload& upload,
                                                          const std::optional<DiarizationParams>& diarization,
                                                          const HeartbeatCallback& on_heartbeat) {
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + config_.processing_timeout;
    const uint64_t job_id = ++job_counter_;

    // 1. Snapshot of the owned state
    Snapshot snapshot = owner_.run([this]() {
        Snapshot s;
        s.model = state_.models.current_model();
        s.loaded = state_.models.is_loaded();
        if (state_.word_replacement_enabled) s.word_replacer = state_.word_replacer;
        if (state_.enhancement_enabled) s.enhancer = state_.enhancer;
        s.language = state_.language;
        return s;
    });

    if (!snapshot.model) {
        return error_outcome(ErrorCode::NoModel, "No transcription model selected");
    }

    auto provider = provider_for(snapshot.model->provider);
    if (!provider) {
        return error_outcome(ErrorCode::TranscriptionFailed,
                             std::string("No provider registered for ") +
                             model_provider_name(snapshot.model->provider) + " models");
    }

    const uint64_t generation = abort_generation_.load();
    auto aborted = [this, generation]() { return abort_generation_.load() != generation; };
    auto elapsed = [started]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    };

    // 2. Load (or join an in-flight load of) the model
    if (!snapshot.loaded) {
        std::shared_future<void> loaded = ensure_loaded(*snapshot.model, provider);
        WaitResult waited = wait_ready(loaded, deadline, config_.heartbeat_interval, aborted, [&]() {
            if (on_heartbeat) on_heartbeat(elapsed());
        });
        if (waited == WaitResult::Aborted) {
            return error_outcome(ErrorCode::Internal, "Server is shutting down", 503);
        }
        if (waited == WaitResult::TimedOut) {
            return error_outcome(ErrorCode::Timeout, "Timed out waiting for the model to load");
        }
        try {
            loaded.get();
        } catch (const std::exception& e) {
            return error_outcome(ErrorCode::ModelLoadFailed,
                                 "Failed to load model " + snapshot.model->display_name + ": " + e.what());
        }
    }

    // 3. Hand the work to the inference pool
    auto job = std::make_shared<Job>();
    job->id = job_id;
    job->upload = upload;
    job->diarization = diarization;
    job->model = *snapshot.model;
    job->provider = provider;
    job->snapshot = snapshot;
    job->started = started;
    job->format = detect_audio_format(upload.bytes);
    if (job->format == AudioFormat::Unknown) {
        job->format = audio_format_from_content_type(upload.declared_content_type);
    }

    std::cout << "[Coordinator] Job " << job_id << ": " << upload.bytes.size() << " bytes, format "
              << audio_format_name(job->format) << ", model " << job->model.id
              << (diarization ? ", diarization requested" : "") << std::endl;

    auto result = inference_pool_.submit([this, job]() {
        try {
            return run_job(*job);
        } catch (const ApiError& e) {
            return error_outcome(e.code(), e.what(), e.http_status());
        } catch (const std::exception& e) {
            return error_outcome(ErrorCode::TranscriptionFailed, std::string("Transcription failed: ") + e.what());
        } catch (...) {
            return error_outcome(ErrorCode::TranscriptionFailed,
                                 "Transcription failed with a non-standard exception");
        }
    });

    // 4. Wait until the processing ceiling
    WaitResult waited = wait_ready(result, deadline, config_.heartbeat_interval, aborted, [&]() {
        std::cout << "[Coordinator] Job " << job_id << " still processing after "
                  << static_cast<int>(seconds_since(started)) << "s" << std::endl;
        if (on_heartbeat) on_heartbeat(elapsed());
    });

    if (waited == WaitResult::Ready) {
        job->release_files();
        try {
            return result.get();
        } catch (const std::exception& e) {
            return error_outcome(ErrorCode::Internal, e.what());
        }
    }

    job->cancel.store(true);
    job->release_files();
    if (waited == WaitResult::Aborted) {
        std::cerr << "[Coordinator] Job " << job_id << " aborted by shutdown" << std::endl;
        return error_outcome(ErrorCode::Internal, "Server is shutting down", 503);
    }
    std::cerr << "[Coordinator] Job " << job_id << " exceeded the processing timeout of "
              << config_.processing_timeout.count() / 1000 << "s" << std::endl;
    return error_outcome(ErrorCode::Timeout, "Transcription exceeded the processing timeout");
}

TranscriptionOutcome TranscriptionCoordinator::run_job(Job& job) {
    const std::string& temp_dir = config_.temp_dir;

    // Persist the upload under a name derived from the sniffed format
    std::string upload_path = job.create_file(temp_dir, audio_format_extension(job.format),
        [&](const std::string& path) {
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            out.write(job.upload.bytes.data(), static_cast<std::streamsize>(job.upload.bytes.size()));
            if (!out) {
                throw std::runtime_error("Could not write uploaded audio to " + path);
            }
        });

    AudioBuffer audio;
    try {
        audio = normalizer_.normalize(upload_path, job.upload.bytes, job.format,
                                      temp_dir.empty() ? ScopedTempFile::default_directory() : temp_dir);
    } catch (const AudioDecodeError& e) {
        throw ApiError(ErrorCode::UnsupportedAudio, e.what());
    }
    job.check_cancelled();

    const double duration = audio.duration_seconds();

    // Decide the diarization method up front; it decides the engine options
    std::optional<DiarizationMethod> diarization_method;
    std::string diarization_error;
    if (job.diarization) {
        try {
            diarization_method = SpeakerDiarizer::choose_method(*job.diarization, audio,
                                                                job.provider->supports_speaker_turns());
        } catch (const DiarizationError& e) {
            if (e.code() == ErrorCode::DiarizationMethodNotImplemented) {
                throw ApiError(e.code(), e.what());
            }
            diarization_error = e.what();
            std::cerr << "[Coordinator] Job " << job.id << ": diarization unavailable: " << e.what() << std::endl;
        }
    }

    AudioResource resource;
    resource.audio = &audio;
    resource.source_path = upload_path;
    if (job.provider->needs_wav_file()) {
        resource.wav_path = job.create_file(temp_dir, ".wav", [&](const std::string& path) {
            write_wav_pcm16(path, {audio.mono}, audio.sample_rate);
        });
    }

    TranscriptionOptions options;
    options.language = job.snapshot.language;
    options.speaker_turns = diarization_method && *diarization_method == DiarizationMethod::Tinydiarize;
    options.threads = config_.engine_threads;
    options.cancel = &job.cancel;

    // Engine
    auto transcription_start = std::chrono::steady_clock::now();
    TranscriptionOutput output;
    try {
        output = job.provider->transcribe(resource, job.model, options);
    } catch (const std::exception& e) {
        job.check_cancelled();
        throw ApiError(ErrorCode::TranscriptionFailed, std::string("Transcription failed: ") + e.what());
    }
    const double transcription_time = seconds_since(transcription_start);
    job.check_cancelled();

    std::string text = trim(output.text);

    // Word replacement
    int replacements = 0;
    const bool replacement_enabled = job.snapshot.word_replacer != nullptr;
    if (replacement_enabled) {
        text = job.snapshot.word_replacer->apply(text, replacements);
        for (auto& seg : output.segments) {
            int ignored = 0;
            seg.text = job.snapshot.word_replacer->apply(seg.text, ignored);
        }
    }

    // Enhancement (non-fatal)
    std::optional<std::string> enhanced_text;
    double enhancement_time = 0.0;
    if (job.snapshot.enhancer && !text.empty()) {
        auto enhancement_start = std::chrono::steady_clock::now();
        try {
            enhanced_text = job.snapshot.enhancer->enhance(text);
            enhancement_time = seconds_since(enhancement_start);
        } catch (const std::exception& e) {
            std::cerr << "[Coordinator] Job " << job.id << ": enhancement failed: " << e.what() << std::endl;
        }
    }
    job.check_cancelled();

    // Diarization (degrades to the plain transcript on failure)
    std::optional<AlignedTranscription> aligned;
    double diarization_time = 0.0;
    if (diarization_method) {
        auto diarization_start = std::chrono::steady_clock::now();
        try {
            DiarizationParams params = *job.diarization;
            params.method = *diarization_method;
            DiarizationResult speakers = diarizer_.diarize(audio, output.segments, params,
                                                           job.provider->supports_speaker_turns());
            aligned = align_transcription(text, output.segments, speakers);
            diarization_time = seconds_since(diarization_start);
        } catch (const DiarizationError& e) {
            diarization_error = e.what();
            std::cerr << "[Coordinator] Job " << job.id << ": diarization failed: " << e.what() << std::endl;
        }
    }

    // Response
    json body;
    body["success"] = true;
    body["text"] = text;
    if (enhanced_text) {
        body["enhancedText"] = *enhanced_text;
    }
    if (aligned) {
        json segments = json::array();
        for (const auto& seg : aligned->segments) {
            segments.push_back(segment_to_json(seg));
        }
        body["segments"] = segments;
        body["speakers"] = aligned->speakers;
        body["numSpeakers"] = aligned->speakers.size();
        body["textWithSpeakers"] = aligned->text_with_speakers;
    }

    json metadata;
    metadata["model"] = job.model.display_name;
    metadata["language"] = job.snapshot.language;
    metadata["duration"] = duration;
    metadata["processingTime"] = seconds_since(job.started);
    metadata["transcriptionTime"] = transcription_time;
    if (aligned && diarization_time > 0.0) {
        metadata["diarizationTime"] = diarization_time;
    }
    if (enhanced_text && enhancement_time > 0.0) {
        metadata["enhancementTime"] = enhancement_time;
    }
    metadata["enhanced"] = enhanced_text.has_value();
    if (job.diarization) {
        metadata["diarizationEnabled"] = aligned.has_value();
        if (aligned) {
            metadata["diarizationMethod"] = diarization_method_name(aligned->method);
        } else {
            metadata["diarizationError"] = diarization_error;
        }
    }
    metadata["replacementsApplied"] = replacement_enabled;
    body["metadata"] = metadata;

    std::cout << "[Coordinator] Job " << job.id << " done: " << text.size() << " chars, "
              << duration << "s audio in " << seconds_since(job.started) << "s" << std::endl;

    TranscriptionOutcome out;
    out.success = true;
    out.status = 200;
    out.body = body.dump();
    return out;
}

} // namespace voxserve
