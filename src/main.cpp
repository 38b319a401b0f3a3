/**
 * @file main.cpp
 * @brief voxserve CLI - local transcription API server
 */

#include "voxserve/audio_decoder.h"
#include "voxserve/command_provider.h"
#include "voxserve/coordinator.h"
#include "voxserve/errors.h"
#include "voxserve/server.h"
#include "voxserve/word_replacement.h"
#ifdef VOXSERVE_HAS_WHISPER
#include "voxserve/whisper_provider.h"
#endif
#include "nlohmann/json.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using json = nlohmann::json;

using namespace voxserve;

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_signal(int) {
    g_stop_requested.store(true);
}

} // anonymous namespace

static std::string get_default_config_path() {
    const char* env_config = std::getenv("VOXSERVE_CONFIG_PATH");
    if (env_config && std::strlen(env_config) > 0) {
        return std::string(env_config);
    }
#ifdef _WIN32
    const char* appdata = std::getenv("APPDATA");
    if (appdata) {
        return std::string(appdata) + "\\voxserve\\config.json";
    }
    return "C:\\voxserve\\config.json";
#else
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) {
        return std::string(xdg) + "/voxserve/config.json";
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/voxserve/config.json";
    }
    return "/tmp/voxserve/config.json";
#endif
}

static std::string get_default_models_path() {
#ifdef _WIN32
    const char* userprofile = std::getenv("USERPROFILE");
    if (userprofile) {
        return std::string(userprofile) + "\\voxserve\\models";
    }
    return "C:\\voxserve\\models";
#else
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.local/share/voxserve/models";
    }
    return "/tmp/voxserve/models";
#endif
}

static bool load_config_file(const std::string& path, json& out, std::string& error) {
    if (path.empty()) return false;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return false;
    }
    std::ifstream in(path);
    if (!in) {
        error = "Failed to open config file: " + path;
        return false;
    }
    try {
        in >> out;
        return true;
    } catch (const std::exception& e) {
        error = std::string("Failed to parse config file: ") + e.what();
        return false;
    }
}

static bool try_get_string(const json& root, const char* section, const char* key, std::string& out) {
    if (root.contains(section) && root[section].is_object()) {
        const auto& section_obj = root[section];
        if (section_obj.contains(key) && section_obj[key].is_string()) {
            out = section_obj[key].get<std::string>();
            return true;
        }
    }
    return false;
}

static bool try_get_int(const json& root, const char* section, const char* key, int& out) {
    if (root.contains(section) && root[section].is_object()) {
        const auto& section_obj = root[section];
        if (section_obj.contains(key) && section_obj[key].is_number_integer()) {
            out = section_obj[key].get<int>();
            return true;
        }
    }
    return false;
}

static bool try_get_bool(const json& root, const char* section, const char* key, bool& out) {
    if (root.contains(section) && root[section].is_object()) {
        const auto& section_obj = root[section];
        if (section_obj.contains(key) && section_obj[key].is_boolean()) {
            out = section_obj[key].get<bool>();
            return true;
        }
    }
    return false;
}

void print_banner() {
    std::cout << "\n";
    std::cout << "  voxserve v" << VOXSERVE_VERSION << "\n";
    std::cout << "  Local transcription API server\n";
    std::cout << std::endl;
}

void print_usage() {
    std::cout << "Usage: voxserve [OPTIONS]\n\n";
    std::cout << "Server:\n";
    std::cout << "  --host HOST                 Bind address when network access is allowed (default: 127.0.0.1)\n";
    std::cout << "  --port PORT                 Server port (default: 5000)\n";
    std::cout << "  --allow-network             Listen on all interfaces instead of loopback\n";
    std::cout << "  --threads N                 Concurrent connections served (default: 32)\n";
    std::cout << "  --max-body-mb N             Maximum request body in MB (default: 500)\n";
    std::cout << "  --idle-timeout-s N          Inactivity timeout in seconds (default: 30)\n";
    std::cout << "  --processing-timeout-min N  Transcription ceiling in minutes (default: 20)\n";
    std::cout << "\nTranscription:\n";
    std::cout << "  --models-dir PATH           Directory scanned for *.bin / *.gguf models\n";
    std::cout << "  --model ID                  Model to select at start-up\n";
    std::cout << "  --engine-command CMD        External transcription command; {model}, {file} and\n";
    std::cout << "                              {language} are substituted\n";
    std::cout << "  --ffmpeg PATH               ffmpeg used for non-WAV uploads (default: ffmpeg)\n";
    std::cout << "  --language CODE             Transcription language (default: auto)\n";
    std::cout << "\nGeneral:\n";
    std::cout << "  --config PATH               Config file (default: $VOXSERVE_CONFIG_PATH, then\n";
    std::cout << "                              $XDG_CONFIG_HOME/voxserve/config.json)\n";
    std::cout << "  --help                      Show this help\n";
    std::cout << "\nExamples:\n";
    std::cout << "  voxserve --models-dir ~/models --model ggml-base.en\n";
    std::cout << "  voxserve --engine-command \"whisper-cli -m {model} -f {file} -l {language}\"\n";
    std::cout << std::endl;
}

static bool parse_int_arg(const std::string& flag, const char* value, int min_value, int max_value, int& out) {
    try {
        size_t pos = 0;
        int v = std::stoi(value, &pos);
        if (pos != std::strlen(value) || v < min_value || v > max_value) {
            throw std::out_of_range(flag);
        }
        out = v;
        return true;
    } catch (const std::exception&) {
        std::cerr << "Error: " << flag << " expects an integer in [" << min_value << ", " << max_value
                  << "], got '" << value << "'" << std::endl;
        return false;
    }
}

int main(int argc, char** argv) {
    print_banner();

    // Defaults
    ServerConfig server_config;
    CoordinatorConfig coordinator_config;
    std::string models_dir = get_default_models_path();
    std::string default_model;
    std::string engine_command;
    std::string ffmpeg_path = "ffmpeg";
    bool word_replacement_enabled = false;
    std::vector<std::pair<std::string, std::string>> word_replacements;
    int max_body_mb = 500;
    int header_limit_kb = 64;
    int read_chunk_kb = 64;
    int idle_seconds = 30;
    int large_upload_idle_seconds = 3600;
    int processing_minutes = 20;
    int heartbeat_seconds = 30;
    int large_upload_threshold_mb = 16;
    int worker_threads = static_cast<int>(server_config.worker_threads);
    int inference_threads = static_cast<int>(coordinator_config.inference_threads);

    // --config has to be known before the file is read
    std::string config_path = get_default_config_path();
    for (int i = 1; i + 1 < argc; i++) {
        if (std::string(argv[i]) == "--config") {
            config_path = argv[i + 1];
        }
    }

    // Load persisted configuration (CLI args override these)
    json persisted_config;
    std::string config_error;
    if (load_config_file(config_path, persisted_config, config_error)) {
        std::cout << "[Config] Loaded " << config_path << std::endl;
        try_get_string(persisted_config, "server", "host", server_config.host);
        int port = 0;
        if (try_get_int(persisted_config, "server", "port", port) && port >= 0 && port <= 65535) {
            server_config.port = port;
        }
        try_get_bool(persisted_config, "server", "allow_network_access", server_config.allow_network_access);
        int threads = 0;
        if (try_get_int(persisted_config, "server", "worker_threads", threads) && threads >= 1 && threads <= 1024) {
            worker_threads = threads;
        }
        if (try_get_int(persisted_config, "server", "inference_threads", threads) && threads >= 1 && threads <= 64) {
            inference_threads = threads;
        }

        try_get_int(persisted_config, "limits", "max_body_mb", max_body_mb);
        try_get_int(persisted_config, "limits", "header_limit_kb", header_limit_kb);
        try_get_int(persisted_config, "limits", "read_chunk_kb", read_chunk_kb);

        try_get_int(persisted_config, "timeouts", "idle_seconds", idle_seconds);
        try_get_int(persisted_config, "timeouts", "large_upload_idle_seconds", large_upload_idle_seconds);
        try_get_int(persisted_config, "timeouts", "processing_minutes", processing_minutes);
        try_get_int(persisted_config, "timeouts", "heartbeat_seconds", heartbeat_seconds);
        try_get_int(persisted_config, "timeouts", "large_upload_threshold_mb", large_upload_threshold_mb);

        try_get_string(persisted_config, "models", "directory", models_dir);
        try_get_string(persisted_config, "models", "default", default_model);
        try_get_string(persisted_config, "engine", "command", engine_command);
        try_get_string(persisted_config, "audio", "ffmpeg", ffmpeg_path);

        try_get_string(persisted_config, "transcription", "language", coordinator_config.language);
        try_get_bool(persisted_config, "transcription", "word_replacement_enabled", word_replacement_enabled);
        if (persisted_config.contains("transcription") &&
            persisted_config["transcription"].contains("word_replacements") &&
            persisted_config["transcription"]["word_replacements"].is_object()) {
            for (const auto& item : persisted_config["transcription"]["word_replacements"].items()) {
                if (item.value().is_string()) {
                    word_replacements.emplace_back(item.key(), item.value().get<std::string>());
                }
            }
        }
    } else if (!config_error.empty()) {
        std::cerr << "[Config] " << config_error << std::endl;
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage();
            return 0;
        }
        else if (arg == "--config" && i + 1 < argc) {
            ++i;
        }
        else if (arg == "--host" && i + 1 < argc) {
            server_config.host = argv[++i];
        }
        else if (arg == "--port" && i + 1 < argc) {
            if (!parse_int_arg(arg, argv[++i], 0, 65535, server_config.port)) return 1;
        }
        else if (arg == "--allow-network") {
            server_config.allow_network_access = true;
        }
        else if (arg == "--threads" && i + 1 < argc) {
            if (!parse_int_arg(arg, argv[++i], 1, 1024, worker_threads)) return 1;
        }
        else if (arg == "--max-body-mb" && i + 1 < argc) {
            if (!parse_int_arg(arg, argv[++i], 1, 16384, max_body_mb)) return 1;
        }
        else if (arg == "--idle-timeout-s" && i + 1 < argc) {
            if (!parse_int_arg(arg, argv[++i], 1, 86400, idle_seconds)) return 1;
        }
        else if (arg == "--processing-timeout-min" && i + 1 < argc) {
            if (!parse_int_arg(arg, argv[++i], 1, 24 * 60, processing_minutes)) return 1;
        }
        else if (arg == "--models-dir" && i + 1 < argc) {
            models_dir = argv[++i];
        }
        else if (arg == "--model" && i + 1 < argc) {
            default_model = argv[++i];
        }
        else if (arg == "--engine-command" && i + 1 < argc) {
            engine_command = argv[++i];
        }
        else if (arg == "--ffmpeg" && i + 1 < argc) {
            ffmpeg_path = argv[++i];
        }
        else if (arg == "--language" && i + 1 < argc) {
            coordinator_config.language = argv[++i];
        }
        else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n\n";
            print_usage();
            return 1;
        }
    }

    // Limits and timeouts
    ConnectionOptions& conn = server_config.connection;
    conn.limits.max_body_bytes = static_cast<uint64_t>(std::max(1, max_body_mb)) * 1024 * 1024;
    conn.limits.max_header_bytes = static_cast<size_t>(std::max(1, header_limit_kb)) * 1024;
    conn.read_chunk_bytes = static_cast<size_t>(std::max(1, read_chunk_kb)) * 1024;
    conn.idle_timeout = std::chrono::seconds(std::max(1, idle_seconds));
    conn.large_idle_timeout = std::chrono::seconds(std::max(idle_seconds, large_upload_idle_seconds));
    conn.large_upload_threshold = static_cast<uint64_t>(std::max(1, large_upload_threshold_mb)) * 1024 * 1024;
    server_config.worker_threads = static_cast<size_t>(worker_threads);

    coordinator_config.processing_timeout = std::chrono::minutes(std::max(1, processing_minutes));
    coordinator_config.heartbeat_interval = std::chrono::seconds(std::max(1, heartbeat_seconds));
    coordinator_config.inference_threads = static_cast<size_t>(inference_threads);

    if (ffmpeg_available(ffmpeg_path)) {
        coordinator_config.ffmpeg_path = ffmpeg_path;
        std::cout << "[Audio] Using ffmpeg: " << ffmpeg_path << std::endl;
    } else {
        std::cerr << "[Audio] WARNING: ffmpeg not found at '" << ffmpeg_path
                  << "'; only WAV uploads can be transcribed" << std::endl;
    }

    int exit_code = 0;
    try {
        TranscriptionCoordinator coordinator(coordinator_config);

        // Providers
#ifdef VOXSERVE_HAS_WHISPER
        coordinator.register_provider(ModelProvider::Local, std::make_shared<WhisperTranscriptionProvider>());
#else
        if (!engine_command.empty()) {
            coordinator.register_provider(ModelProvider::Local,
                                          std::make_shared<CommandTranscriptionProvider>(engine_command));
        } else {
            std::cerr << "[Main] WARNING: built without whisper.cpp and no --engine-command given; "
                      << "local models cannot be transcribed" << std::endl;
        }
#endif
        if (!engine_command.empty()) {
            coordinator.register_provider(ModelProvider::Command,
                                          std::make_shared<CommandTranscriptionProvider>(engine_command));
            if (engine_command.find("{model}") == std::string::npos) {
                ModelDescriptor command_model;
                command_model.id = "command";
                command_model.display_name = "External Command";
                command_model.provider = ModelProvider::Command;
                coordinator.add_model(command_model);
            }
        }

        // Models
        coordinator.scan_models(models_dir);
        CoordinatorStatus initial = coordinator.status();
        if (!default_model.empty()) {
            if (!coordinator.select_model(default_model)) {
                std::cerr << "[Main] Model '" << default_model << "' not found in " << models_dir << std::endl;
            }
        } else if (!initial.available_models.empty()) {
            std::cout << "[Main] No model selected; use --model to pick one of "
                      << initial.available_models.size() << " available" << std::endl;
        }

        // Word replacement
        if (!word_replacements.empty()) {
            auto replacer = std::make_shared<DictionaryWordReplacer>(word_replacements);
            coordinator.set_word_replacer(replacer, word_replacement_enabled);
            std::cout << "[Main] Word replacement: " << replacer->rule_count() << " rule(s), "
                      << (word_replacement_enabled ? "enabled" : "disabled") << std::endl;
        }

        TranscriptionServer server(server_config, coordinator);
        server.start();

        std::cout << "\n  Listening:   http://" << server.bind_address() << ":" << server.port() << "\n";
        std::cout << "  Max body:    " << max_body_mb << " MB\n";
        std::cout << "  Timeouts:    idle " << idle_seconds << "s, processing " << processing_minutes << " min\n";
        std::cout << "  Endpoints:\n";
        std::cout << "    GET  /health\n";
        std::cout << "    POST /api/transcribe\n";
        std::cout << "\n  Press Ctrl+C to stop\n" << std::endl;

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);
#ifndef _WIN32
        std::signal(SIGPIPE, SIG_IGN);
#endif

        while (!g_stop_requested.load() && server.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        std::cout << "\n[Main] Shutting down..." << std::endl;
        server.stop();
        coordinator.shutdown();
    } catch (const BindError& e) {
        std::cerr << "[Main] Failed to start server: " << e.what() << std::endl;
        exit_code = 1;
    } catch (const std::exception& e) {
        std::cerr << "[Main] Fatal error: " << e.what() << std::endl;
        exit_code = 1;
    }

    return exit_code;
}
