/**
 * @file whisper_provider.cpp
 * @brief whisper.cpp transcription provider
 */

#include "voxserve/whisper_provider.h"

#ifdef VOXSERVE_HAS_WHISPER

#include "voxserve/errors.h"

#include "whisper.h"

#include <algorithm>
#include <iostream>
#include <thread>

namespace voxserve {

namespace {

std::string trim(const char* text) {
    if (!text) return "";
    std::string s(text);
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Non-speech annotations whisper emits for silence
bool is_non_speech(const std::string& s) {
    return s == "[BLANK_AUDIO]" || s == "[ Silence ]" || s == "[silence]" || s == "(silence)";
}

// RAII holder for a per-call decoding state
class StateGuard {
public:
    explicit StateGuard(whisper_state* state) : state_(state) {}
    ~StateGuard() {
        if (state_) whisper_free_state(state_);
    }
    StateGuard(const StateGuard&) = delete;
    StateGuard& operator=(const StateGuard&) = delete;

    whisper_state* get() const { return state_; }

private:
    whisper_state* state_;
};

} // anonymous namespace

WhisperTranscriptionProvider::WhisperTranscriptionProvider(bool use_gpu)
    : use_gpu_(use_gpu) {}

WhisperTranscriptionProvider::~WhisperTranscriptionProvider() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [path, ctx] : contexts_) {
        if (ctx) whisper_free(ctx);
    }
    contexts_.clear();
}

whisper_context* WhisperTranscriptionProvider::context_for(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contexts_.find(path);
    return it == contexts_.end() ? nullptr : it->second;
}

void WhisperTranscriptionProvider::load(const ModelDescriptor& model) {
    if (context_for(model.path)) {
        return;
    }

    std::cout << "[Whisper] Loading model: " << model.path << std::endl;
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = use_gpu_;
    whisper_context* ctx = whisper_init_from_file_with_params(model.path.c_str(), cparams);
    if (!ctx) {
        throw ModelLoadError("whisper.cpp failed to load model: " + model.path);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = contexts_.emplace(model.path, ctx);
    if (!inserted) {
        // Lost a race with another load of the same file
        whisper_free(ctx);
    }
    std::cout << "[Whisper] Model ready: " << model.id << std::endl;
}

TranscriptionOutput WhisperTranscriptionProvider::transcribe(const AudioResource& resource,
                                                             const ModelDescriptor& model,
                                                             const TranscriptionOptions& options) {
    whisper_context* ctx = context_for(model.path);
    if (!ctx) {
        throw TranscriptionError("Model not loaded: " + model.id);
    }
    if (!resource.audio || resource.audio->mono.empty()) {
        throw TranscriptionError("No audio samples to transcribe");
    }

    StateGuard state(whisper_init_state(ctx));
    if (!state.get()) {
        throw TranscriptionError("whisper_init_state failed");
    }

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_realtime   = false;
    wparams.print_progress   = false;
    wparams.print_timestamps = false;
    wparams.print_special    = false;
    wparams.translate        = false;
    wparams.language         = options.language.empty() ? "auto" : options.language.c_str();
    wparams.detect_language  = false;
    wparams.n_threads        = options.threads > 0
                             ? options.threads
                             : static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    wparams.tdrz_enable      = options.speaker_turns;

    if (options.cancel) {
        wparams.abort_callback = [](void* user_data) -> bool {
            return static_cast<const std::atomic<bool>*>(user_data)->load();
        };
        wparams.abort_callback_user_data = const_cast<std::atomic<bool>*>(options.cancel);
    }

    const auto& pcm = resource.audio->mono;
    int ret = whisper_full_with_state(ctx, state.get(), wparams, pcm.data(), static_cast<int>(pcm.size()));
    if (ret != 0) {
        throw TranscriptionError("whisper_full failed with code " + std::to_string(ret));
    }

    TranscriptionOutput out;
    const int n = whisper_full_n_segments_from_state(state.get());
    for (int i = 0; i < n; ++i) {
        std::string text = trim(whisper_full_get_segment_text_from_state(state.get(), i));
        if (text.empty() || is_non_speech(text)) {
            continue;
        }
        TranscriptSegment seg;
        // Timestamps are in units of 10 ms
        seg.start = whisper_full_get_segment_t0_from_state(state.get(), i) * 0.01;
        seg.end = whisper_full_get_segment_t1_from_state(state.get(), i) * 0.01;
        seg.text = text;
        seg.speaker_turn_next = whisper_full_get_segment_speaker_turn_next_from_state(state.get(), i);
        out.segments.push_back(seg);

        if (!out.text.empty()) out.text += " ";
        out.text += text;
    }

    int lang_id = whisper_full_lang_id_from_state(state.get());
    if (lang_id >= 0) {
        out.language = whisper_lang_str(lang_id);
    }
    return out;
}

} // namespace voxserve

#endif // VOXSERVE_HAS_WHISPER
