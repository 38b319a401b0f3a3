/**
 * @file test_server.cpp
 * @brief End-to-end HTTP behaviour over loopback sockets
 */

#include "voxserve/coordinator.h"
#include "voxserve/errors.h"
#include "voxserve/server.h"
#include "fake_providers.h"
#include "test_support.h"

#include "nlohmann/json.hpp"

#include <future>
#include <memory>

using namespace voxserve;
using json = nlohmann::json;

namespace {

const std::string BOUNDARY = "----voxserveTestBoundary";

/**
 * @brief Coordinator with a fake engine plus a started server on an ephemeral port
 */
struct Harness {
    explicit Harness(ServerConfig config = ServerConfig{}) {
        provider = std::make_shared<voxtest::FakeProvider>();
        CoordinatorConfig coordinator_config;
        coordinator_config.heartbeat_interval = std::chrono::milliseconds(100);
        coordinator_config.inference_threads = 4;
        coordinator = std::make_unique<TranscriptionCoordinator>(coordinator_config);
        coordinator->register_provider(ModelProvider::Local, provider);
        coordinator->add_model(voxtest::fake_model());
        coordinator->select_model("ggml-fake");

        config.port = 0;
        server = std::make_unique<TranscriptionServer>(config, *coordinator);
        server->start();
    }

    ~Harness() {
        server->stop();
        coordinator->shutdown();
    }

    voxtest::RawResponse exchange(const std::string& request) {
        voxtest::RawClient client(server->port());
        VX_CHECK(client.send_all(request));
        return client.read_response();
    }

    std::shared_ptr<voxtest::FakeProvider> provider;
    std::unique_ptr<TranscriptionCoordinator> coordinator;
    std::unique_ptr<TranscriptionServer> server;
};

std::string transcribe_request(const std::string& body, const std::string& boundary = BOUNDARY,
                               const std::string& extra_headers = "") {
    return "POST /api/transcribe HTTP/1.1\r\n"
           "Host: localhost\r\n"
           "Content-Type: multipart/form-data; boundary=" + boundary + "\r\n"
           "Content-Length: " + std::to_string(body.size()) + "\r\n" +
           extra_headers + "\r\n" + body;
}

std::string audio_form(const std::string& audio, std::vector<voxtest::FormPart> extra = {}) {
    extra.push_back({"file", "clip.wav", "audio/wav", audio});
    return voxtest::build_multipart(BOUNDARY, extra);
}

std::string error_code_of(const voxtest::RawResponse& response) {
    return json::parse(response.body)["error"]["code"].get<std::string>();
}

} // anonymous namespace

int main() {
    voxtest::TestRunner runner("Server");

    runner.add("health", []() {
        Harness h;
        VX_CHECK(h.server->is_running());
        VX_CHECK(h.server->port() > 0);

        voxtest::RawResponse res = h.exchange("GET /health HTTP/1.1\r\nHost: localhost\r\n\r\n");
        VX_CHECK_EQ(res.status, 200);
        VX_CHECK(voxtest::header_value(res.head, "Content-Type").rfind("application/json", 0) == 0);
        VX_CHECK_EQ(voxtest::header_value(res.head, "Content-Length"), std::to_string(res.body.size()));
        VX_CHECK_EQ(voxtest::header_value(res.head, "Access-Control-Allow-Origin"), "*");

        json body = json::parse(res.body);
        VX_CHECK_EQ(body["status"].get<std::string>(), "healthy");
        VX_CHECK_EQ(body["service"].get<std::string>(), "voxserve");
        VX_CHECK_EQ(body["api"]["isRunning"].get<bool>(), true);
        VX_CHECK_EQ(body["api"]["requestsServed"].get<int>(), 0);
        VX_CHECK_EQ(body["api"]["port"].get<int>(), h.server->port());
        VX_CHECK_EQ(body["transcription"]["currentModel"].get<std::string>(), "fake");
        VX_CHECK_EQ(body["transcription"]["modelLoaded"].get<bool>(), false);
        VX_CHECK(body["capabilities"].is_array());
        VX_CHECK(body["system"]["processorCount"].get<int>() >= 0);
    });

    runner.add("transcribe", []() {
        Harness h;
        voxtest::RawResponse res = h.exchange(transcribe_request(audio_form(voxtest::make_mono_wav(1.0))));
        VX_CHECK_EQ(res.status, 200);
        json body = json::parse(res.body);
        VX_CHECK_EQ(body["success"].get<bool>(), true);
        VX_CHECK_EQ(body["text"].get<std::string>(), "hello world");
        VX_CHECK_NEAR(body["metadata"]["duration"].get<double>(), 1.0, 0.01);

        // Counted once the connection is finished
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        VX_CHECK_EQ(h.server->stats().requests_served, 1u);
        json health = json::parse(h.exchange("GET /health HTTP/1.1\r\n\r\n").body);
        VX_CHECK_EQ(health["api"]["requestsServed"].get<int>(), 1);
        VX_CHECK_EQ(health["transcription"]["modelLoaded"].get<bool>(), true);
    });

    runner.add("form errors", []() {
        Harness h;

        std::string no_file = voxtest::build_multipart(BOUNDARY, {{"enable_diarization", "", "", "false"}});
        voxtest::RawResponse missing = h.exchange(transcribe_request(no_file));
        VX_CHECK_EQ(missing.status, 400);
        VX_CHECK_EQ(error_code_of(missing), "MISSING_FILE");

        std::string body = audio_form("RIFF");
        std::string no_boundary = "POST /api/transcribe HTTP/1.1\r\nContent-Type: multipart/form-data\r\n"
                                  "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
        VX_CHECK_EQ(error_code_of(h.exchange(no_boundary)), "MISSING_BOUNDARY");

        voxtest::RawResponse malformed = h.exchange(transcribe_request("--" + BOUNDARY + "\r\ngarbage"));
        VX_CHECK_EQ(malformed.status, 400);
        VX_CHECK_EQ(error_code_of(malformed), "MALFORMED_MULTIPART");

        voxtest::RawResponse empty = h.exchange(transcribe_request(audio_form("")));
        VX_CHECK_EQ(empty.status, 400);

        voxtest::RawResponse bad_param = h.exchange(transcribe_request(
            audio_form(voxtest::make_mono_wav(0.5), {{"enable_diarization", "", "", "true"},
                                                     {"max_speakers", "", "", "many"}})));
        VX_CHECK_EQ(bad_param.status, 400);
        VX_CHECK_EQ(error_code_of(bad_param), "INVALID_PARAMETER");

        voxtest::RawResponse pyannote = h.exchange(transcribe_request(
            audio_form(voxtest::make_mono_wav(0.5), {{"enable_diarization", "", "", "true"},
                                                     {"diarization_method", "", "", "pyannote"}})));
        VX_CHECK_EQ(pyannote.status, 400);
        VX_CHECK_EQ(error_code_of(pyannote), "DIARIZATION_METHOD_NOT_IMPLEMENTED");
        VX_CHECK_EQ(h.provider->transcribe_calls.load(), 0);
    });

    runner.add("oversized body rejected before it is sent", []() {
        ServerConfig config;
        config.connection.limits.max_body_bytes = 1024 * 1024;
        Harness h(config);

        voxtest::RawClient client(h.server->port());
        VX_CHECK(client.send_all("POST /api/transcribe HTTP/1.1\r\n"
                                 "Content-Type: multipart/form-data; boundary=x\r\n"
                                 "Content-Length: 600000000\r\n\r\n"));
        voxtest::RawResponse res = client.read_response();
        VX_CHECK_EQ(res.status, 413);
        VX_CHECK_EQ(error_code_of(res), "PAYLOAD_TOO_LARGE");
        VX_CHECK_EQ(h.provider->transcribe_calls.load(), 0);
    });

    runner.add("routing and preflight", []() {
        Harness h;
        voxtest::RawResponse missing = h.exchange("GET /nope HTTP/1.1\r\n\r\n");
        VX_CHECK_EQ(missing.status, 404);
        VX_CHECK_EQ(error_code_of(missing), "NOT_FOUND");

        voxtest::RawResponse wrong_method = h.exchange("GET /api/transcribe HTTP/1.1\r\n\r\n");
        VX_CHECK_EQ(wrong_method.status, 404);

        voxtest::RawResponse preflight = h.exchange(
            "OPTIONS /api/transcribe HTTP/1.1\r\nOrigin: http://localhost:3000\r\n"
            "Access-Control-Request-Method: POST\r\n\r\n");
        VX_CHECK_EQ(preflight.status, 200);
        VX_CHECK_EQ(voxtest::header_value(preflight.head, "Access-Control-Allow-Origin"), "*");
        VX_CHECK(voxtest::header_value(preflight.head, "Access-Control-Allow-Methods").find("POST") !=
                 std::string::npos);
        VX_CHECK(preflight.body.empty());
    });

    runner.add("protocol errors", []() {
        Harness h;
        voxtest::RawResponse chunked = h.exchange(
            "POST /api/transcribe HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n");
        VX_CHECK_EQ(chunked.status, 400);

        voxtest::RawResponse garbage = h.exchange("this is not http\r\n\r\n");
        VX_CHECK_EQ(garbage.status, 400);
        VX_CHECK_EQ(error_code_of(garbage), "BAD_REQUEST");
    });

    runner.add("fragmented upload", []() {
        Harness h;
        std::string request = transcribe_request(audio_form(voxtest::make_mono_wav(0.05)));

        voxtest::RawClient tiny(h.server->port());
        VX_CHECK(tiny.send_fragmented(request, 1));
        voxtest::RawResponse one_byte = tiny.read_response();
        VX_CHECK_EQ(one_byte.status, 200);

        voxtest::RawClient slow(h.server->port());
        VX_CHECK(slow.send_fragmented(request, 97, std::chrono::milliseconds(1)));
        VX_CHECK_EQ(slow.read_response().status, 200);
    });

    runner.add("expect 100-continue", []() {
        Harness h;
        std::string body = audio_form(voxtest::make_mono_wav(0.25));
        std::string request = transcribe_request(body, BOUNDARY, "Expect: 100-continue\r\n");
        std::string head = request.substr(0, request.size() - body.size());

        voxtest::RawClient client(h.server->port());
        VX_CHECK(client.send_all(head));
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        VX_CHECK(client.send_all(body));
        voxtest::RawResponse res = client.read_response();
        VX_CHECK(res.raw.rfind("HTTP/1.1 100 Continue\r\n\r\n", 0) == 0);
        VX_CHECK_EQ(res.status, 200);
    });

    runner.add("idle connection times out", []() {
        ServerConfig config;
        config.connection.idle_timeout = std::chrono::milliseconds(300);
        Harness h(config);

        voxtest::RawClient client(h.server->port());
        VX_CHECK(client.send_all("POST /api/transcribe HTTP/1.1\r\nContent-Length: 100\r\n\r\npartial"));
        voxtest::RawResponse res = client.read_response();
        VX_CHECK_EQ(res.status, 408);
        VX_CHECK_EQ(error_code_of(res), "TIMEOUT");
    });

    runner.add("connection behind a slow client is served", []() {
        ServerConfig config;
        config.worker_threads = 1;
        config.connection.idle_timeout = std::chrono::milliseconds(1000);
        Harness h(config);
        int port = h.server->port();

        // Holds the only pre-started worker by trickling its request
        auto slow = std::async(std::launch::async, [port]() {
            voxtest::RawClient client(port);
            client.send_fragmented("GET /health HTTP/1.1\r\nHost: x\r\n\r\n", 1, std::chrono::milliseconds(80));
            return client.read_response();
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        auto started = std::chrono::steady_clock::now();
        voxtest::RawResponse quick = h.exchange("GET /health HTTP/1.1\r\n\r\n");
        VX_CHECK_EQ(quick.status, 200);
        VX_CHECK(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(800));

        VX_CHECK_EQ(slow.get().status, 200);
    });

    runner.add("stop does not wait for a running transcription", []() {
        Harness h;
        h.provider->transcribe_delay = std::chrono::milliseconds(3000);
        std::string request = transcribe_request(audio_form(voxtest::make_mono_wav(0.5)));
        int port = h.server->port();
        auto pending = std::async(std::launch::async, [request, port]() {
            voxtest::RawClient client(port);
            client.send_all(request);
            return client.read_response();
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        auto stopping = std::chrono::steady_clock::now();
        h.server->stop();
        VX_CHECK(std::chrono::steady_clock::now() - stopping < std::chrono::milliseconds(1500));
        VX_CHECK(pending.get().status != 200);
    });

    runner.add("concurrent requests", []() {
        Harness h;
        h.provider->transcribe_delay = std::chrono::milliseconds(200);
        h.provider->respond = [](const AudioResource& resource, const TranscriptionOptions&) {
            TranscriptionOutput out;
            out.text = std::to_string(resource.audio->mono.size());
            return out;
        };

        std::vector<std::future<voxtest::RawResponse>> responses;
        for (int i = 1; i <= 6; ++i) {
            std::string request = transcribe_request(audio_form(voxtest::make_mono_wav(0.1 * i)));
            int port = h.server->port();
            responses.push_back(std::async(std::launch::async, [request, port]() {
                voxtest::RawClient client(port);
                client.send_fragmented(request, 4096);
                return client.read_response();
            }));
        }

        // Health stays responsive while transcriptions run
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        auto health_start = std::chrono::steady_clock::now();
        VX_CHECK_EQ(h.exchange("GET /health HTTP/1.1\r\n\r\n").status, 200);
        VX_CHECK(std::chrono::steady_clock::now() - health_start < std::chrono::milliseconds(1000));

        for (int i = 1; i <= 6; ++i) {
            voxtest::RawResponse res = responses[i - 1].get();
            VX_CHECK_EQ(res.status, 200);
            VX_CHECK_EQ(json::parse(res.body)["text"].get<std::string>(), std::to_string(1600 * i));
        }
    });

    runner.add("port conflict", []() {
        Harness h;
        ServerConfig config;
        config.port = h.server->port();
        TranscriptionServer second(config, *h.coordinator);
        VX_CHECK_THROWS(second.start(), BindError);
        VX_CHECK(!second.is_running());
        VX_CHECK(h.server->is_running());
    });

    runner.add("stop is idempotent and closes the listener", []() {
        Harness h;
        int port = h.server->port();
        h.server->stop();
        h.server->stop();
        VX_CHECK(!h.server->is_running());
        h.server->wait();
        VX_CHECK_THROWS(voxtest::RawClient(port), std::runtime_error);
    });

    return runner.run();
}
