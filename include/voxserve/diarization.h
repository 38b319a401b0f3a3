/**
 * @file diarization.h
 * @brief Speaker diarization and transcript alignment
 *
 * Two independently produced time series are merged here: transcript
 * segments from the engine and speaker segments from a diarization method.
 * Each transcript segment takes the speaker of the diarization segment it
 * overlaps most; neighbouring segments of one speaker are then merged.
 */

#pragma once

#include "audio_decoder.h"
#include "interfaces/i_transcription_provider.h"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace voxserve {

constexpr const char* UNKNOWN_SPEAKER = "SPEAKER_UNKNOWN";

/** Segments of one speaker closer than this are merged */
constexpr double MERGE_GAP_SECONDS = 1.0;

/**
 * @enum DiarizationMethod
 */
enum class DiarizationMethod {
    Auto,          ///< Pick from the audio and engine capabilities
    Stereo,        ///< Channel energy: one speaker per channel
    Tinydiarize,   ///< Engine speaker-turn flags
    Pyannote       ///< External neural pipeline (not implemented)
};

const char* diarization_method_name(DiarizationMethod method);
std::optional<DiarizationMethod> diarization_method_from_string(const std::string& name);

enum class DiarizationMode {
    Fast,
    Balanced,
    Accurate
};

const char* diarization_mode_name(DiarizationMode mode);
std::optional<DiarizationMode> diarization_mode_from_string(const std::string& name);

/** Analysis window of the stereo method: 1.0 / 0.5 / 0.25 s */
double stereo_window_seconds(DiarizationMode mode);

/**
 * @struct DiarizationParams
 * @brief Options from the enable_diarization, diarization_mode,
 *        min_speakers, max_speakers, use_tinydiarize and diarization_method
 *        form fields
 */
struct DiarizationParams {
    DiarizationMode mode = DiarizationMode::Balanced;
    std::optional<int> min_speakers;
    std::optional<int> max_speakers;
    bool use_tinydiarize = false;
    DiarizationMethod method = DiarizationMethod::Auto;
};

/**
 * @brief Read diarization options from multipart scalar fields
 *
 * @return nullopt when enable_diarization is absent or false
 * @throws ApiError INVALID_PARAMETER for unparseable values,
 *         DIARIZATION_METHOD_NOT_IMPLEMENTED when an unimplemented method
 *         is requested explicitly
 */
std::optional<DiarizationParams> parse_diarization_params(const std::map<std::string, std::string>& fields);

struct DiarizationSegment {
    double start = 0.0;
    double end = 0.0;
    std::string speaker;
    std::optional<double> confidence;

    double duration() const { return end - start; }
};

struct DiarizationResult {
    std::vector<DiarizationSegment> segments;
    std::vector<std::string> speakers;   ///< Sorted, distinct
    int num_speakers = 0;
    double total_duration = 0.0;
    DiarizationMethod method = DiarizationMethod::Auto;
    std::optional<double> processing_time;
};

struct AlignedSegment {
    double start = 0.0;
    double end = 0.0;
    std::string text;
    std::string speaker;
    std::optional<double> confidence;          ///< Transcript confidence when the engine gives one
    std::optional<double> speaker_confidence;  ///< Overlap / segment duration

    double duration() const { return end - start; }
};

struct AlignedTranscription {
    std::vector<AlignedSegment> segments;
    std::vector<std::string> speakers;   ///< Sorted, distinct
    std::string text;
    std::string text_with_speakers;      ///< Block layout: "[SPEAKER_00]:\nhello ..."
    std::string inline_text;             ///< "[SPEAKER_00]: hello [SPEAKER_01]: hi"
    DiarizationMethod method = DiarizationMethod::Auto;
};

/**
 * @brief Speaker of the diarization segment with the largest overlap
 *
 * Confidence is overlap / (end - start). Without any overlap the speaker is
 * SPEAKER_UNKNOWN with confidence 0. Ties keep the earlier segment.
 */
std::pair<std::string, double> find_best_speaker(double start, double end,
                                                 const std::vector<DiarizationSegment>& segments);

/**
 * @brief Merge consecutive segments of one speaker with a gap < 1.0 s
 *
 * Text is joined with a space; confidences take the minimum of the values
 * present.
 */
std::vector<AlignedSegment> merge_consecutive_segments(const std::vector<AlignedSegment>& segments);

/**
 * @brief Align transcript segments with speaker segments
 *
 * Pure function; output segments keep the transcript's start-time order.
 */
AlignedTranscription align_transcription(const std::string& text,
                                         const std::vector<TranscriptSegment>& transcript,
                                         const DiarizationResult& diarization);

std::string format_text_with_speakers(const std::vector<AlignedSegment>& segments);
std::string format_inline_with_speakers(const std::vector<AlignedSegment>& segments);

/**
 * @brief Produces speaker segments with the method that fits the request
 */
class SpeakerDiarizer {
public:
    /**
     * @brief Decide which method will run, before transcription starts
     * @throws DiarizationError when no method can serve the request
     */
    static DiarizationMethod choose_method(const DiarizationParams& params,
                                           const AudioBuffer& audio,
                                           bool provider_supports_turns);

    /**
     * @param transcript Engine segments (speaker-turn flags are read here)
     * @throws DiarizationError
     */
    DiarizationResult diarize(const AudioBuffer& audio,
                              const std::vector<TranscriptSegment>& transcript,
                              const DiarizationParams& params,
                              bool provider_supports_turns) const;

    /**
     * @brief One speaker per channel by windowed mean absolute energy
     */
    static DiarizationResult diarize_stereo(const AudioBuffer& audio, const DiarizationParams& params);

    /**
     * @brief New speaker after every segment flagged speaker_turn_next
     */
    static DiarizationResult diarize_speaker_turns(const std::vector<TranscriptSegment>& transcript,
                                                   double total_duration,
                                                   const DiarizationParams& params);
};

} // namespace voxserve
