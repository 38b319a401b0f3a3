/**
 * @file command_provider.cpp
 * @brief External command transcription provider
 */

#include "voxserve/command_provider.h"
#include "voxserve/command.h"
#include "voxserve/errors.h"

#include <filesystem>
#include <iostream>
#include <map>
#include <regex>

namespace fs = std::filesystem;

namespace voxserve {

namespace {

const char* SPEAKER_TURN_MARKER = "[SPEAKER_TURN]";

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

double to_seconds(const std::string& h, const std::string& m, const std::string& s, const std::string& ms) {
    return std::stoi(h) * 3600.0 + std::stoi(m) * 60.0 + std::stoi(s) + std::stoi(ms) / 1000.0;
}

} // anonymous namespace

CommandTranscriptionProvider::CommandTranscriptionProvider(std::string command_template, bool speaker_turns)
    : command_template_(std::move(command_template))
    , speaker_turns_(speaker_turns) {}

void CommandTranscriptionProvider::load(const ModelDescriptor& model) {
    if (command_template_.empty()) {
        throw ModelLoadError("No transcription command configured");
    }
    if (command_template_.find("{model}") != std::string::npos) {
        std::error_code ec;
        if (model.path.empty() || !fs::exists(model.path, ec)) {
            throw ModelLoadError("Model file not found: " + model.path);
        }
    }
    std::cout << "[CommandProvider] Ready: " << model.id << std::endl;
}

TranscriptionOutput CommandTranscriptionProvider::transcribe(const AudioResource& resource,
                                                             const ModelDescriptor& model,
                                                             const TranscriptionOptions& options) {
    std::map<std::string, std::string> values = {
        {"model", model.path},
        {"file", resource.wav_path},
        {"language", options.language.empty() ? "auto" : options.language}
    };
    std::string cmd = expand_command(command_template_, values);
#ifndef _WIN32
    cmd += " 2>/dev/null";
#endif

    std::string output;
    int status = run_command(cmd, output);
    if (status != 0) {
        throw TranscriptionError("Transcription command failed with status " + std::to_string(status));
    }
    if (options.cancel && options.cancel->load()) {
        throw TranscriptionError("Transcription cancelled");
    }
    return parse_output(output);
}

TranscriptionOutput CommandTranscriptionProvider::parse_output(const std::string& output) {
    static const std::regex line_re(
        R"(^\s*\[(\d+):(\d{2}):(\d{2})[.,](\d{3})\s*-->\s*(\d+):(\d{2}):(\d{2})[.,](\d{3})\]\s*(.*)$)");

    TranscriptionOutput result;
    std::string plain;
    size_t pos = 0;
    while (pos <= output.size()) {
        size_t eol = output.find('\n', pos);
        std::string line = output.substr(pos, eol == std::string::npos ? std::string::npos : eol - pos);
        pos = (eol == std::string::npos) ? output.size() + 1 : eol + 1;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        std::smatch m;
        if (std::regex_match(line, m, line_re)) {
            TranscriptSegment seg;
            seg.start = to_seconds(m[1], m[2], m[3], m[4]);
            seg.end = to_seconds(m[5], m[6], m[7], m[8]);
            std::string text = trim(m[9]);
            size_t marker = text.rfind(SPEAKER_TURN_MARKER);
            if (marker != std::string::npos && marker + std::string(SPEAKER_TURN_MARKER).size() == text.size()) {
                seg.speaker_turn_next = true;
                text = trim(text.substr(0, marker));
            }
            seg.text = text;
            result.segments.push_back(seg);
        } else {
            std::string t = trim(line);
            if (!t.empty()) {
                if (!plain.empty()) plain += " ";
                plain += t;
            }
        }
    }

    if (result.segments.empty()) {
        result.text = plain;
        return result;
    }

    for (const auto& seg : result.segments) {
        if (seg.text.empty()) continue;
        if (!result.text.empty()) result.text += " ";
        result.text += seg.text;
    }
    return result;
}

} // namespace voxserve
