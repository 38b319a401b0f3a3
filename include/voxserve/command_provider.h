/**
 * @file command_provider.h
 * @brief Transcription through an external command-line engine
 */

#pragma once

#include "interfaces/i_transcription_provider.h"

#include <string>
#include <vector>

namespace voxserve {

/**
 * @brief Runs a configured CLI on the normalized WAV
 *
 * The command template may reference {model}, {file} and {language}; each
 * is substituted shell-quoted. Output in whisper-cli form
 * ("[00:00:01.000 --> 00:00:03.500]  text") becomes timestamped segments,
 * with a trailing " [SPEAKER_TURN]" marker setting speaker_turn_next.
 * Any other output is taken as plain text.
 *
 * Example: whisper-cli -m {model} -f {file} -l {language} -tdrz
 */
class CommandTranscriptionProvider : public ITranscriptionProvider {
public:
    explicit CommandTranscriptionProvider(std::string command_template, bool speaker_turns = false);

    std::string name() const override { return "command"; }
    void load(const ModelDescriptor& model) override;
    TranscriptionOutput transcribe(const AudioResource& resource,
                                   const ModelDescriptor& model,
                                   const TranscriptionOptions& options) override;
    bool supports_speaker_turns() const override { return speaker_turns_; }

    /**
     * @brief Parse engine stdout into text and segments
     */
    static TranscriptionOutput parse_output(const std::string& output);

private:
    std::string command_template_;
    bool speaker_turns_;
};

} // namespace voxserve
