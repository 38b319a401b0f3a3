/**
 * @file diarization.cpp
 * @brief Diarization methods and transcript/speaker alignment
 */

#include "voxserve/diarization.h"
#include "voxserve/errors.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <iostream>
#include <set>
#include <sstream>

namespace voxserve {

namespace {

// Mean absolute amplitude below which a window counts as silence
constexpr double SILENCE_ENERGY = 1e-3;

// A channel dominates when its energy exceeds the other by this factor
constexpr double DOMINANCE_RATIO = 1.1;

constexpr int MAX_SPEAKERS_LIMIT = 32;

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::optional<bool> parse_bool(const std::string& raw) {
    std::string v = to_lower(trim(raw));
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off" || v.empty()) return false;
    return std::nullopt;
}

std::optional<int> parse_speaker_count(const std::string& field, const std::string& raw) {
    std::string v = trim(raw);
    if (v.empty()) {
        return std::nullopt;
    }
    int value = 0;
    for (char c : v) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw ApiError(ErrorCode::InvalidParameter, field + " must be a positive integer, got '" + raw + "'");
        }
        value = value * 10 + (c - '0');
        if (value > MAX_SPEAKERS_LIMIT) {
            throw ApiError(ErrorCode::InvalidParameter,
                           field + " must be at most " + std::to_string(MAX_SPEAKERS_LIMIT));
        }
    }
    if (value < 1) {
        throw ApiError(ErrorCode::InvalidParameter, field + " must be at least 1");
    }
    return value;
}

std::string speaker_label(int index) {
    std::ostringstream ss;
    ss << "SPEAKER_" << (index < 10 ? "0" : "") << index;
    return ss.str();
}

std::vector<std::string> distinct_sorted(const std::vector<std::string>& labels) {
    std::set<std::string> unique(labels.begin(), labels.end());
    return std::vector<std::string>(unique.begin(), unique.end());
}

void finish_result(DiarizationResult& result) {
    std::vector<std::string> labels;
    labels.reserve(result.segments.size());
    for (const auto& seg : result.segments) {
        labels.push_back(seg.speaker);
    }
    result.speakers = distinct_sorted(labels);
    result.num_speakers = static_cast<int>(result.speakers.size());
}

std::optional<double> min_present(const std::optional<double>& a, const std::optional<double>& b) {
    if (a && b) return std::min(*a, *b);
    if (a) return a;
    return b;
}

} // anonymous namespace

// ============================================================================
// Names and parameters
// ============================================================================

const char* diarization_method_name(DiarizationMethod method) {
    switch (method) {
        case DiarizationMethod::Auto:        return "auto";
        case DiarizationMethod::Stereo:      return "stereo";
        case DiarizationMethod::Tinydiarize: return "tinydiarize";
        case DiarizationMethod::Pyannote:    return "pyannote";
    }
    return "auto";
}

std::optional<DiarizationMethod> diarization_method_from_string(const std::string& name) {
    std::string v = to_lower(trim(name));
    if (v.empty() || v == "auto") return DiarizationMethod::Auto;
    if (v == "stereo") return DiarizationMethod::Stereo;
    if (v == "tinydiarize") return DiarizationMethod::Tinydiarize;
    if (v == "pyannote") return DiarizationMethod::Pyannote;
    return std::nullopt;
}

const char* diarization_mode_name(DiarizationMode mode) {
    switch (mode) {
        case DiarizationMode::Fast:     return "fast";
        case DiarizationMode::Balanced: return "balanced";
        case DiarizationMode::Accurate: return "accurate";
    }
    return "balanced";
}

std::optional<DiarizationMode> diarization_mode_from_string(const std::string& name) {
    std::string v = to_lower(trim(name));
    if (v == "fast") return DiarizationMode::Fast;
    if (v == "balanced" || v.empty()) return DiarizationMode::Balanced;
    if (v == "accurate") return DiarizationMode::Accurate;
    return std::nullopt;
}

double stereo_window_seconds(DiarizationMode mode) {
    switch (mode) {
        case DiarizationMode::Fast:     return 1.0;
        case DiarizationMode::Balanced: return 0.5;
        case DiarizationMode::Accurate: return 0.25;
    }
    return 0.5;
}

std::optional<DiarizationParams> parse_diarization_params(const std::map<std::string, std::string>& fields) {
    auto field = [&](const char* name) -> const std::string* {
        auto it = fields.find(name);
        return it == fields.end() ? nullptr : &it->second;
    };

    const std::string* enable = field("enable_diarization");
    if (!enable) {
        return std::nullopt;
    }
    auto enabled = parse_bool(*enable);
    if (!enabled) {
        throw ApiError(ErrorCode::InvalidParameter, "enable_diarization must be true or false, got '" + *enable + "'");
    }
    if (!*enabled) {
        return std::nullopt;
    }

    DiarizationParams params;

    if (const std::string* mode = field("diarization_mode")) {
        auto parsed = diarization_mode_from_string(*mode);
        if (!parsed) {
            throw ApiError(ErrorCode::InvalidParameter,
                           "diarization_mode must be fast, balanced or accurate, got '" + *mode + "'");
        }
        params.mode = *parsed;
    }

    if (const std::string* v = field("min_speakers")) {
        params.min_speakers = parse_speaker_count("min_speakers", *v);
    }
    if (const std::string* v = field("max_speakers")) {
        params.max_speakers = parse_speaker_count("max_speakers", *v);
    }
    if (params.min_speakers && params.max_speakers && *params.min_speakers > *params.max_speakers) {
        throw ApiError(ErrorCode::InvalidParameter, "min_speakers must not exceed max_speakers");
    }

    if (const std::string* v = field("use_tinydiarize")) {
        auto parsed = parse_bool(*v);
        if (!parsed) {
            throw ApiError(ErrorCode::InvalidParameter, "use_tinydiarize must be true or false, got '" + *v + "'");
        }
        params.use_tinydiarize = *parsed;
    }

    if (const std::string* v = field("diarization_method")) {
        auto parsed = diarization_method_from_string(*v);
        if (!parsed) {
            throw ApiError(ErrorCode::InvalidParameter,
                           "diarization_method must be auto, stereo, tinydiarize or pyannote, got '" + *v + "'");
        }
        params.method = *parsed;
    }
    if (params.method == DiarizationMethod::Auto && params.use_tinydiarize) {
        params.method = DiarizationMethod::Tinydiarize;
    }

    if (params.method == DiarizationMethod::Pyannote) {
        throw ApiError(ErrorCode::DiarizationMethodNotImplemented,
                       "Diarization method 'pyannote' is not yet implemented");
    }
    return params;
}

// ============================================================================
// Alignment
// ============================================================================

std::pair<std::string, double> find_best_speaker(double start, double end,
                                                 const std::vector<DiarizationSegment>& segments) {
    std::string best_speaker = UNKNOWN_SPEAKER;
    double best_overlap = 0.0;
    double best_confidence = 0.0;

    for (const auto& seg : segments) {
        double overlap_start = std::max(start, seg.start);
        double overlap_end = std::min(end, seg.end);
        if (overlap_start < overlap_end) {
            double overlap = overlap_end - overlap_start;
            if (overlap > best_overlap) {
                best_overlap = overlap;
                best_speaker = seg.speaker;
                double total = end - start;
                best_confidence = total > 0.0 ? overlap / total : 0.0;
            }
        }
    }
    return {best_speaker, best_confidence};
}

std::vector<AlignedSegment> merge_consecutive_segments(const std::vector<AlignedSegment>& segments) {
    std::vector<AlignedSegment> merged;
    if (segments.empty()) {
        return merged;
    }

    AlignedSegment current = segments[0];
    for (size_t i = 1; i < segments.size(); ++i) {
        const AlignedSegment& seg = segments[i];
        if (seg.speaker == current.speaker && seg.start - current.end < MERGE_GAP_SECONDS) {
            current.end = std::max(current.end, seg.end);
            if (current.text.empty()) {
                current.text = seg.text;
            } else if (!seg.text.empty()) {
                current.text += " " + seg.text;
            }
            current.confidence = min_present(current.confidence, seg.confidence);
            current.speaker_confidence = min_present(current.speaker_confidence, seg.speaker_confidence);
        } else {
            merged.push_back(std::move(current));
            current = seg;
        }
    }
    merged.push_back(std::move(current));
    return merged;
}

AlignedTranscription align_transcription(const std::string& text,
                                         const std::vector<TranscriptSegment>& transcript,
                                         const DiarizationResult& diarization) {
    std::vector<TranscriptSegment> ordered = transcript;
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const TranscriptSegment& a, const TranscriptSegment& b) { return a.start < b.start; });

    std::vector<AlignedSegment> aligned;
    aligned.reserve(ordered.size());
    for (const auto& seg : ordered) {
        auto [speaker, confidence] = find_best_speaker(seg.start, seg.end, diarization.segments);
        AlignedSegment a;
        a.start = seg.start;
        a.end = seg.end;
        a.text = seg.text;
        a.speaker = speaker;
        a.speaker_confidence = confidence;
        aligned.push_back(std::move(a));
    }

    AlignedTranscription result;
    result.segments = merge_consecutive_segments(aligned);

    std::vector<std::string> labels;
    for (const auto& seg : result.segments) {
        labels.push_back(seg.speaker);
    }
    result.speakers = distinct_sorted(labels);
    result.text = text;
    result.text_with_speakers = format_text_with_speakers(result.segments);
    result.inline_text = format_inline_with_speakers(result.segments);
    result.method = diarization.method;
    return result;
}

std::string format_text_with_speakers(const std::vector<AlignedSegment>& segments) {
    std::string result;
    std::string current_speaker;
    bool first = true;

    for (const auto& seg : segments) {
        if (first || seg.speaker != current_speaker) {
            if (!first) {
                result += "\n\n";
            }
            result += "[" + seg.speaker + "]:\n";
            current_speaker = seg.speaker;
            first = false;
        } else if (!seg.text.empty()) {
            result += " ";
        }
        result += seg.text;
    }
    return trim(result);
}

std::string format_inline_with_speakers(const std::vector<AlignedSegment>& segments) {
    std::string result;
    std::string current_speaker;
    bool first = true;

    for (const auto& seg : segments) {
        if (!first) {
            result += " ";
        }
        if (first || seg.speaker != current_speaker) {
            result += "[" + seg.speaker + "]: ";
            current_speaker = seg.speaker;
            first = false;
        }
        result += seg.text;
    }
    return trim(result);
}

// ============================================================================
// Methods
// ============================================================================

DiarizationMethod SpeakerDiarizer::choose_method(const DiarizationParams& params,
                                                 const AudioBuffer& audio,
                                                 bool provider_supports_turns) {
    switch (params.method) {
        case DiarizationMethod::Pyannote:
            throw DiarizationError(ErrorCode::DiarizationMethodNotImplemented,
                                   "Diarization method 'pyannote' is not yet implemented");
        case DiarizationMethod::Stereo:
            if (!audio.is_stereo()) {
                throw DiarizationError(ErrorCode::DiarizationUnavailable,
                                       "Stereo diarization requires audio with at least two channels");
            }
            return DiarizationMethod::Stereo;
        case DiarizationMethod::Tinydiarize:
            if (!provider_supports_turns) {
                throw DiarizationError(ErrorCode::DiarizationUnavailable,
                                       "The transcription engine does not report speaker turns");
            }
            return DiarizationMethod::Tinydiarize;
        case DiarizationMethod::Auto:
            break;
    }

    if (audio.is_stereo()) {
        return DiarizationMethod::Stereo;
    }
    if (provider_supports_turns) {
        return DiarizationMethod::Tinydiarize;
    }
    throw DiarizationError(ErrorCode::DiarizationUnavailable,
                           "No suitable diarization method available for this audio");
}

DiarizationResult SpeakerDiarizer::diarize(const AudioBuffer& audio,
                                           const std::vector<TranscriptSegment>& transcript,
                                           const DiarizationParams& params,
                                           bool provider_supports_turns) const {
    auto t0 = std::chrono::steady_clock::now();

    DiarizationMethod method = choose_method(params, audio, provider_supports_turns);
    DiarizationResult result = (method == DiarizationMethod::Stereo)
        ? diarize_stereo(audio, params)
        : diarize_speaker_turns(transcript, audio.duration_seconds(), params);

    auto t1 = std::chrono::steady_clock::now();
    result.processing_time = std::chrono::duration<double>(t1 - t0).count();

    std::cout << "[Diarization] " << diarization_method_name(result.method) << ": "
              << result.segments.size() << " segments, " << result.num_speakers << " speakers" << std::endl;
    return result;
}

DiarizationResult SpeakerDiarizer::diarize_stereo(const AudioBuffer& audio, const DiarizationParams& params) {
    DiarizationResult result;
    result.method = DiarizationMethod::Stereo;
    result.total_duration = audio.duration_seconds();

    if (!audio.is_stereo() || audio.sample_rate <= 0) {
        return result;
    }

    const auto& left = audio.channels[0];
    const auto& right = audio.channels[1];
    const size_t n = std::min(left.size(), right.size());
    const size_t window = std::max<size_t>(1, static_cast<size_t>(stereo_window_seconds(params.mode) * audio.sample_rate));
    const bool single_speaker = params.max_speakers && *params.max_speakers == 1;

    bool open = false;
    int open_speaker = -1;
    DiarizationSegment current;
    double dominant_energy = 0.0;
    double total_energy = 0.0;

    auto close_segment = [&]() {
        if (open) {
            current.confidence = total_energy > 0.0 ? dominant_energy / total_energy : 0.0;
            result.segments.push_back(current);
        }
        open = false;
        open_speaker = -1;
        dominant_energy = 0.0;
        total_energy = 0.0;
    };

    for (size_t begin = 0; begin < n; begin += window) {
        const size_t end = std::min(n, begin + window);
        double e0 = 0.0;
        double e1 = 0.0;
        for (size_t i = begin; i < end; ++i) {
            e0 += std::fabs(left[i]);
            e1 += std::fabs(right[i]);
        }
        const double count = static_cast<double>(end - begin);
        e0 /= count;
        e1 /= count;

        int speaker = -1;
        if (e0 + e1 >= SILENCE_ENERGY) {
            if (e0 > DOMINANCE_RATIO * e1) {
                speaker = 0;
            } else if (e1 > DOMINANCE_RATIO * e0) {
                speaker = 1;
            }
        }
        if (speaker < 0) {
            close_segment();
            continue;
        }
        if (single_speaker) {
            speaker = 0;
        }

        const double start_s = static_cast<double>(begin) / audio.sample_rate;
        const double end_s = static_cast<double>(end) / audio.sample_rate;
        if (open && speaker == open_speaker) {
            current.end = end_s;
        } else {
            close_segment();
            current = DiarizationSegment{start_s, end_s, speaker_label(speaker), std::nullopt};
            open = true;
            open_speaker = speaker;
        }
        dominant_energy += std::max(e0, e1);
        total_energy += e0 + e1;
    }
    close_segment();

    finish_result(result);
    return result;
}

DiarizationResult SpeakerDiarizer::diarize_speaker_turns(const std::vector<TranscriptSegment>& transcript,
                                                         double total_duration,
                                                         const DiarizationParams& params) {
    DiarizationResult result;
    result.method = DiarizationMethod::Tinydiarize;
    result.total_duration = total_duration;

    int label_count = std::max(2, params.min_speakers.value_or(2));
    if (params.max_speakers) {
        label_count = std::max(1, std::min(label_count, *params.max_speakers));
    }

    int speaker = 0;
    for (const auto& seg : transcript) {
        DiarizationSegment d;
        d.start = seg.start;
        d.end = seg.end;
        d.speaker = speaker_label(speaker);
        result.segments.push_back(d);
        if (seg.speaker_turn_next) {
            speaker = (speaker + 1) % label_count;
        }
    }

    finish_result(result);
    return result;
}

} // namespace voxserve
