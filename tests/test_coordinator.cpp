/**
 * @file test_coordinator.cpp
 * @brief Model loading, pipeline stages, diarization degrade and the processing ceiling
 */

#include "voxserve/coordinator.h"
#include "voxserve/temp_file.h"
#include "voxserve/word_replacement.h"
#include "fake_providers.h"
#include "test_support.h"

#include "nlohmann/json.hpp"

#include <filesystem>
#include <future>
#include <memory>

using namespace voxserve;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

std::string test_temp_dir(const std::string& name) {
    fs::path dir = fs::path(ScopedTempFile::default_directory()) / ("coordinator-" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir.string();
}

CoordinatorConfig test_config(const std::string& name) {
    CoordinatorConfig config;
    config.processing_timeout = std::chrono::seconds(30);
    config.heartbeat_interval = std::chrono::milliseconds(50);
    config.temp_dir = test_temp_dir(name);
    config.inference_threads = 4;
    return config;
}

AudioUpload upload_of(const std::string& bytes, const std::string& content_type = "audio/wav") {
    auto storage = std::make_shared<const std::string>(bytes);
    AudioUpload upload;
    upload.storage = storage;
    upload.bytes = *storage;
    upload.declared_content_type = content_type;
    upload.filename = "clip";
    return upload;
}

json body_of(const TranscriptionOutcome& outcome) {
    return json::parse(outcome.body);
}

std::string error_code_of(const TranscriptionOutcome& outcome) {
    return body_of(outcome)["error"]["code"].get<std::string>();
}

std::string stereo_call_wav(double seconds) {
    const int rate = ENGINE_SAMPLE_RATE;
    std::vector<float> tone = voxtest::sine(seconds, rate, 300.0, 0.5f);
    std::vector<float> left(tone.size(), 0.0f);
    std::vector<float> right(tone.size(), 0.0f);
    for (size_t i = 0; i < tone.size(); ++i) {
        (i < tone.size() / 2 ? left : right)[i] = tone[i];
    }
    return voxtest::make_wav({left, right}, rate);
}

TranscriptSegment segment(double start, double end, const std::string& text, bool turn = false) {
    TranscriptSegment seg;
    seg.start = start;
    seg.end = end;
    seg.text = text;
    seg.speaker_turn_next = turn;
    return seg;
}

} // anonymous namespace

int main() {
    voxtest::TestRunner runner("Coordinator");

    runner.add("no model selected", []() {
        TranscriptionCoordinator coordinator(test_config("nomodel"));
        TranscriptionOutcome outcome = coordinator.transcribe(upload_of(voxtest::make_mono_wav(1.0)), std::nullopt);
        VX_CHECK(!outcome.success);
        VX_CHECK_EQ(outcome.status, 500);
        VX_CHECK_EQ(error_code_of(outcome), "NO_MODEL");
        VX_CHECK_EQ(body_of(outcome)["success"].get<bool>(), false);
    });

    runner.add("transcription with metadata", []() {
        auto provider = std::make_shared<voxtest::FakeProvider>();
        TranscriptionCoordinator coordinator(test_config("basic"));
        coordinator.register_provider(ModelProvider::Local, provider);
        coordinator.add_model(voxtest::fake_model());
        VX_CHECK(coordinator.select_model("ggml-fake"));
        coordinator.set_language("en");

        CoordinatorStatus before = coordinator.status();
        VX_CHECK_EQ(before.current_model, "fake");
        VX_CHECK(!before.model_loaded);

        TranscriptionOutcome outcome = coordinator.transcribe(upload_of(voxtest::make_mono_wav(3.0)), std::nullopt);
        VX_CHECK(outcome.success);
        VX_CHECK_EQ(outcome.status, 200);

        json body = body_of(outcome);
        VX_CHECK_EQ(body["text"].get<std::string>(), "hello world");
        VX_CHECK(!body.contains("enhancedText"));
        VX_CHECK(!body.contains("segments"));
        const json& meta = body["metadata"];
        VX_CHECK_EQ(meta["model"].get<std::string>(), "fake");
        VX_CHECK_EQ(meta["language"].get<std::string>(), "en");
        VX_CHECK_NEAR(meta["duration"].get<double>(), 3.0, 0.01);
        VX_CHECK(meta["processingTime"].get<double>() >= meta["transcriptionTime"].get<double>());
        VX_CHECK_EQ(meta["enhanced"].get<bool>(), false);
        VX_CHECK_EQ(meta["replacementsApplied"].get<bool>(), false);
        VX_CHECK(!meta.contains("diarizationEnabled"));
        VX_CHECK_EQ(provider->last_language(), "en");

        CoordinatorStatus after = coordinator.status();
        VX_CHECK(after.model_loaded);
        VX_CHECK_EQ(after.available_models.size(), 1u);

        // Loaded models are not loaded again
        coordinator.transcribe(upload_of(voxtest::make_mono_wav(0.5)), std::nullopt);
        VX_CHECK_EQ(provider->load_calls.load(), 1);

        // Temp files are gone once requests finish
        VX_CHECK(fs::is_empty(coordinator.config().temp_dir));
    });

    runner.add("missing provider and failed load", []() {
        auto provider = std::make_shared<voxtest::FakeProvider>();
        provider->fail_load = true;
        TranscriptionCoordinator coordinator(test_config("loadfail"));

        ModelDescriptor command_model = voxtest::fake_model("cmd", "External Command");
        command_model.provider = ModelProvider::Command;
        coordinator.add_model(command_model);
        coordinator.select_model("cmd");
        TranscriptionOutcome unprovided = coordinator.transcribe(upload_of(voxtest::make_mono_wav(1.0)), std::nullopt);
        VX_CHECK_EQ(error_code_of(unprovided), "TRANSCRIPTION_FAILED");

        coordinator.register_provider(ModelProvider::Local, provider);
        coordinator.add_model(voxtest::fake_model());
        coordinator.select_model("ggml-fake");
        TranscriptionOutcome failed = coordinator.transcribe(upload_of(voxtest::make_mono_wav(1.0)), std::nullopt);
        VX_CHECK_EQ(failed.status, 500);
        VX_CHECK_EQ(error_code_of(failed), "MODEL_LOAD_FAILED");
        std::string message = body_of(failed)["error"]["message"].get<std::string>();
        VX_CHECK(message.find("fake") != std::string::npos);
        VX_CHECK(!coordinator.status().model_loaded);

        // A later request tries again
        provider->fail_load = false;
        TranscriptionOutcome retried = coordinator.transcribe(upload_of(voxtest::make_mono_wav(1.0)), std::nullopt);
        VX_CHECK(retried.success);
        VX_CHECK_EQ(provider->load_calls.load(), 2);
    });

    runner.add("concurrent requests share one load and keep their own results", []() {
        auto provider = std::make_shared<voxtest::FakeProvider>();
        provider->load_delay = std::chrono::milliseconds(300);
        provider->transcribe_delay = std::chrono::milliseconds(100);
        provider->respond = [](const AudioResource& resource, const TranscriptionOptions&) {
            TranscriptionOutput out;
            out.text = "samples " + std::to_string(resource.audio->mono.size());
            return out;
        };

        TranscriptionCoordinator coordinator(test_config("concurrent"));
        coordinator.register_provider(ModelProvider::Local, provider);
        coordinator.add_model(voxtest::fake_model());
        coordinator.select_model("ggml-fake");

        std::vector<std::future<TranscriptionOutcome>> results;
        for (int i = 1; i <= 4; ++i) {
            std::string wav = voxtest::make_mono_wav(0.25 * i);
            results.push_back(std::async(std::launch::async, [&coordinator, wav]() {
                return coordinator.transcribe(upload_of(wav), std::nullopt);
            }));
        }
        for (int i = 1; i <= 4; ++i) {
            TranscriptionOutcome outcome = results[i - 1].get();
            VX_CHECK(outcome.success);
            VX_CHECK_EQ(body_of(outcome)["text"].get<std::string>(), "samples " + std::to_string(4000 * i));
        }
        VX_CHECK_EQ(provider->load_calls.load(), 1);
        VX_CHECK(provider->max_active.load() >= 2);
    });

    runner.add("undecodable audio", []() {
        auto provider = std::make_shared<voxtest::FakeProvider>();
        TranscriptionCoordinator coordinator(test_config("baddata"));
        coordinator.register_provider(ModelProvider::Local, provider);
        coordinator.add_model(voxtest::fake_model());
        coordinator.select_model("ggml-fake");

        TranscriptionOutcome outcome = coordinator.transcribe(upload_of("ID3\x04 not really mp3", "audio/mpeg"),
                                                              std::nullopt);
        VX_CHECK_EQ(outcome.status, 400);
        VX_CHECK_EQ(error_code_of(outcome), "UNSUPPORTED_AUDIO");
        VX_CHECK_EQ(provider->transcribe_calls.load(), 0);

        provider->fail_transcribe = true;
        TranscriptionOutcome crashed = coordinator.transcribe(upload_of(voxtest::make_mono_wav(0.5)), std::nullopt);
        VX_CHECK_EQ(crashed.status, 500);
        VX_CHECK_EQ(error_code_of(crashed), "TRANSCRIPTION_FAILED");
    });

    runner.add("word replacement and enhancement", []() {
        auto provider = std::make_shared<voxtest::FakeProvider>();
        auto enhancer = std::make_shared<voxtest::FakeEnhancer>();
        auto replacer = std::make_shared<DictionaryWordReplacer>(
            std::vector<std::pair<std::string, std::string>>{{"world", "World"}});

        TranscriptionCoordinator coordinator(test_config("postprocess"));
        coordinator.register_provider(ModelProvider::Local, provider);
        coordinator.add_model(voxtest::fake_model());
        coordinator.select_model("ggml-fake");
        coordinator.set_word_replacer(replacer, true);
        coordinator.set_enhancer(enhancer, true);

        CoordinatorStatus status = coordinator.status();
        VX_CHECK(status.word_replacement_enabled);
        VX_CHECK(status.enhancement_enabled);

        json body = body_of(coordinator.transcribe(upload_of(voxtest::make_mono_wav(0.5)), std::nullopt));
        VX_CHECK_EQ(body["text"].get<std::string>(), "hello World");
        VX_CHECK_EQ(body["enhancedText"].get<std::string>(), "hello World.");
        VX_CHECK_EQ(body["metadata"]["replacementsApplied"].get<bool>(), true);
        VX_CHECK_EQ(body["metadata"]["enhanced"].get<bool>(), true);

        // Enhancement failures keep the plain transcript
        enhancer->fail = true;
        TranscriptionOutcome degraded = coordinator.transcribe(upload_of(voxtest::make_mono_wav(0.5)), std::nullopt);
        VX_CHECK(degraded.success);
        json plain = body_of(degraded);
        VX_CHECK(!plain.contains("enhancedText"));
        VX_CHECK_EQ(plain["metadata"]["enhanced"].get<bool>(), false);

        coordinator.set_word_replacer(replacer, false);
        coordinator.set_enhancer(nullptr, true);
        VX_CHECK(!coordinator.status().enhancement_enabled);
        json untouched = body_of(coordinator.transcribe(upload_of(voxtest::make_mono_wav(0.5)), std::nullopt));
        VX_CHECK_EQ(untouched["text"].get<std::string>(), "hello world");
    });

    runner.add("diarization degrades on mono audio", []() {
        auto provider = std::make_shared<voxtest::FakeProvider>();
        TranscriptionCoordinator coordinator(test_config("degrade"));
        coordinator.register_provider(ModelProvider::Local, provider);
        coordinator.add_model(voxtest::fake_model());
        coordinator.select_model("ggml-fake");

        TranscriptionOutcome outcome = coordinator.transcribe(upload_of(voxtest::make_mono_wav(1.0)),
                                                              DiarizationParams{});
        VX_CHECK(outcome.success);
        json body = body_of(outcome);
        VX_CHECK_EQ(body["text"].get<std::string>(), "hello world");
        VX_CHECK(!body.contains("speakers"));
        VX_CHECK_EQ(body["metadata"]["diarizationEnabled"].get<bool>(), false);
        VX_CHECK(!body["metadata"]["diarizationError"].get<std::string>().empty());

        DiarizationParams pyannote;
        pyannote.method = DiarizationMethod::Pyannote;
        TranscriptionOutcome rejected = coordinator.transcribe(upload_of(voxtest::make_mono_wav(1.0)), pyannote);
        VX_CHECK_EQ(rejected.status, 400);
        VX_CHECK_EQ(error_code_of(rejected), "DIARIZATION_METHOD_NOT_IMPLEMENTED");
    });

    runner.add("stereo diarization", []() {
        auto provider = std::make_shared<voxtest::FakeProvider>();
        provider->respond = [](const AudioResource&, const TranscriptionOptions&) {
            TranscriptionOutput out;
            out.text = "left talker right talker";
            out.segments = {segment(0.0, 1.9, "left talker"), segment(2.1, 4.0, "right talker")};
            return out;
        };
        TranscriptionCoordinator coordinator(test_config("stereo"));
        coordinator.register_provider(ModelProvider::Local, provider);
        coordinator.add_model(voxtest::fake_model());
        coordinator.select_model("ggml-fake");

        json body = body_of(coordinator.transcribe(upload_of(stereo_call_wav(4.0)), DiarizationParams{}));
        VX_CHECK_EQ(body["numSpeakers"].get<int>(), 2);
        VX_CHECK_EQ(body["speakers"][0].get<std::string>(), "SPEAKER_00");
        VX_CHECK_EQ(body["segments"].size(), 2u);
        VX_CHECK_EQ(body["segments"][1]["speaker"].get<std::string>(), "SPEAKER_01");
        VX_CHECK_NEAR(body["segments"][0]["speakerConfidence"].get<double>(), 1.0, 1e-9);
        VX_CHECK_EQ(body["textWithSpeakers"].get<std::string>(),
                    "[SPEAKER_00]:\nleft talker\n\n[SPEAKER_01]:\nright talker");
        VX_CHECK_EQ(body["metadata"]["diarizationEnabled"].get<bool>(), true);
        VX_CHECK_EQ(body["metadata"]["diarizationMethod"].get<std::string>(), "stereo");
        VX_CHECK(body["metadata"].contains("diarizationTime"));
        VX_CHECK_EQ(provider->speaker_turn_requests.load(), 0);
    });

    runner.add("speaker-turn diarization", []() {
        auto provider = std::make_shared<voxtest::FakeProvider>();
        provider->turns = true;
        provider->wav_file = false;
        provider->respond = [](const AudioResource& resource, const TranscriptionOptions&) {
            TranscriptionOutput out;
            out.text = "hi hello";
            out.segments = {segment(0.0, 0.5, "hi", true), segment(0.5, 1.0, "hello")};
            if (!resource.wav_path.empty()) {
                throw TranscriptionError("no wav file expected");
            }
            return out;
        };
        TranscriptionCoordinator coordinator(test_config("turns"));
        coordinator.register_provider(ModelProvider::Local, provider);
        coordinator.add_model(voxtest::fake_model());
        coordinator.select_model("ggml-fake");

        DiarizationParams params;
        params.use_tinydiarize = true;
        params.method = DiarizationMethod::Tinydiarize;
        json body = body_of(coordinator.transcribe(upload_of(voxtest::make_mono_wav(1.0)), params));
        VX_CHECK_EQ(body["metadata"]["diarizationMethod"].get<std::string>(), "tinydiarize");
        VX_CHECK_EQ(body["numSpeakers"].get<int>(), 2);
        VX_CHECK_EQ(provider->speaker_turn_requests.load(), 1);
    });

    runner.add("processing ceiling answers 504 and releases files", []() {
        auto provider = std::make_shared<voxtest::FakeProvider>();
        provider->transcribe_delay = std::chrono::milliseconds(1200);

        CoordinatorConfig config = test_config("timeout");
        config.processing_timeout = std::chrono::milliseconds(400);
        TranscriptionCoordinator coordinator(config);
        coordinator.register_provider(ModelProvider::Local, provider);
        coordinator.add_model(voxtest::fake_model());
        coordinator.select_model("ggml-fake");

        std::atomic<int> heartbeats{0};
        auto started = std::chrono::steady_clock::now();
        TranscriptionOutcome outcome = coordinator.transcribe(
            upload_of(voxtest::make_mono_wav(1.0)), std::nullopt,
            [&heartbeats](std::chrono::milliseconds) { heartbeats++; });
        auto waited = std::chrono::steady_clock::now() - started;

        VX_CHECK_EQ(outcome.status, 504);
        VX_CHECK_EQ(error_code_of(outcome), "TIMEOUT");
        VX_CHECK(waited < std::chrono::milliseconds(1100));
        VX_CHECK(heartbeats.load() >= 1);
        VX_CHECK(fs::is_empty(config.temp_dir));

        // The server keeps working for the next request
        std::this_thread::sleep_for(std::chrono::milliseconds(900));
        provider->transcribe_delay = std::chrono::milliseconds(0);
        VX_CHECK(coordinator.transcribe(upload_of(voxtest::make_mono_wav(0.5)), std::nullopt).success);
    });

    runner.add("model switches race loads and transcriptions", []() {
        auto provider = std::make_shared<voxtest::FakeProvider>();
        provider->load_delay = std::chrono::milliseconds(20);
        provider->transcribe_delay = std::chrono::milliseconds(5);

        TranscriptionCoordinator coordinator(test_config("switching"));
        coordinator.register_provider(ModelProvider::Local, provider);
        coordinator.add_model(voxtest::fake_model());
        coordinator.add_model(voxtest::fake_model("ggml-alt", "alt"));
        coordinator.select_model("ggml-fake");
        auto enhancer = std::make_shared<voxtest::FakeEnhancer>();

        const std::string wav = voxtest::make_mono_wav(0.2);
        std::atomic<int> succeeded{0};
        std::atomic<int> failed{0};
        std::vector<std::future<void>> tasks;

        for (int i = 0; i < 6; ++i) {
            tasks.push_back(std::async(std::launch::async, [&coordinator, &wav, &succeeded, &failed]() {
                for (int j = 0; j < 8; ++j) {
                    TranscriptionOutcome outcome = coordinator.transcribe(upload_of(wav), std::nullopt);
                    (outcome.success ? succeeded : failed)++;
                }
            }));
        }
        for (int i = 0; i < 2; ++i) {
            tasks.push_back(std::async(std::launch::async, [&coordinator, enhancer, i]() {
                for (int j = 0; j < 25; ++j) {
                    coordinator.select_model((i + j) % 2 == 0 ? "ggml-alt" : "ggml-fake");
                    coordinator.set_enhancer(enhancer, j % 2 == 0);
                    coordinator.add_model(voxtest::fake_model(
                        "ggml-extra-" + std::to_string(i) + "-" + std::to_string(j), "extra"));
                    coordinator.status();
                    std::this_thread::sleep_for(std::chrono::milliseconds(3));
                }
            }));
        }

        const auto bound = std::chrono::steady_clock::now() + std::chrono::seconds(20);
        for (auto& task : tasks) {
            VX_CHECK(task.wait_until(bound) == std::future_status::ready);
        }
        VX_CHECK_EQ(succeeded.load(), 48);
        VX_CHECK_EQ(failed.load(), 0);
        VX_CHECK_EQ(coordinator.status().available_models.size(), 52u);

        // The loaded flag follows the selected model once things settle
        VX_CHECK(coordinator.select_model("ggml-alt"));
        VX_CHECK(coordinator.transcribe(upload_of(wav), std::nullopt).success);
        CoordinatorStatus alt = coordinator.status();
        VX_CHECK_EQ(alt.current_model, "alt");
        VX_CHECK(alt.model_loaded);
        VX_CHECK(provider->loads_of("ggml-alt") >= 1);

        VX_CHECK(coordinator.select_model("ggml-fake"));
        VX_CHECK(!coordinator.status().model_loaded);
        VX_CHECK(coordinator.transcribe(upload_of(wav), std::nullopt).success);
        CoordinatorStatus fake = coordinator.status();
        VX_CHECK_EQ(fake.current_model, "fake");
        VX_CHECK(fake.model_loaded);
        VX_CHECK(provider->loads_of("ggml-fake") >= 1);
    });

    runner.add("abort releases waiting callers", []() {
        std::atomic<bool> slow{true};
        auto provider = std::make_shared<voxtest::FakeProvider>();
        provider->respond = [&slow](const AudioResource&, const TranscriptionOptions&) {
            if (slow.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1500));
            }
            TranscriptionOutput out;
            out.text = "done";
            return out;
        };

        CoordinatorConfig config = test_config("abort");
        TranscriptionCoordinator coordinator(config);
        coordinator.register_provider(ModelProvider::Local, provider);
        coordinator.add_model(voxtest::fake_model());
        coordinator.select_model("ggml-fake");

        auto pending = std::async(std::launch::async, [&coordinator]() {
            return coordinator.transcribe(upload_of(voxtest::make_mono_wav(0.5)), std::nullopt);
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        auto aborted_at = std::chrono::steady_clock::now();
        coordinator.abort_pending();

        VX_CHECK(pending.wait_for(std::chrono::milliseconds(700)) == std::future_status::ready);
        TranscriptionOutcome outcome = pending.get();
        VX_CHECK(std::chrono::steady_clock::now() - aborted_at < std::chrono::milliseconds(700));
        VX_CHECK_EQ(outcome.status, 503);
        VX_CHECK(!outcome.success);

        // Later calls are unaffected
        slow.store(false);
        TranscriptionOutcome next = coordinator.transcribe(upload_of(voxtest::make_mono_wav(0.5)), std::nullopt);
        VX_CHECK(next.success);
        VX_CHECK_EQ(body_of(next)["text"].get<std::string>(), "done");
    });

    runner.add("non-standard exceptions from the engine", []() {
        auto provider = std::make_shared<voxtest::FakeProvider>();
        provider->fail_load_non_standard = true;
        TranscriptionCoordinator coordinator(test_config("nonstandard"));
        coordinator.register_provider(ModelProvider::Local, provider);
        coordinator.add_model(voxtest::fake_model());
        coordinator.select_model("ggml-fake");

        TranscriptionOutcome load = coordinator.transcribe(upload_of(voxtest::make_mono_wav(0.5)), std::nullopt);
        VX_CHECK_EQ(load.status, 500);
        VX_CHECK_EQ(error_code_of(load), "MODEL_LOAD_FAILED");
        VX_CHECK(!coordinator.status().model_loaded);

        provider->fail_load_non_standard = false;
        provider->fail_transcribe_non_standard = true;
        TranscriptionOutcome run = coordinator.transcribe(upload_of(voxtest::make_mono_wav(0.5)), std::nullopt);
        VX_CHECK_EQ(run.status, 500);
        VX_CHECK_EQ(error_code_of(run), "TRANSCRIPTION_FAILED");

        provider->fail_transcribe_non_standard = false;
        VX_CHECK(coordinator.transcribe(upload_of(voxtest::make_mono_wav(0.5)), std::nullopt).success);
    });

    return runner.run();
}
