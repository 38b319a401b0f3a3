/**
 * @file test_support.h
 * @brief Minimal check macros, section runner and request/audio builders for voxserve tests
 */

#pragma once

#include "voxserve/socket_compat.h"

#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace voxtest {

// ============================================================================
// Checks
// ============================================================================

class CheckFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

inline std::string location(const char* file, int line) {
    return std::string(file) + ":" + std::to_string(line);
}

#define VX_CHECK(cond)                                                                 \
    do {                                                                               \
        if (!(cond)) {                                                                 \
            throw voxtest::CheckFailure(voxtest::location(__FILE__, __LINE__) +        \
                                        ": CHECK(" #cond ") failed");                  \
        }                                                                              \
    } while (0)

#define VX_CHECK_EQ(actual, expected)                                                  \
    do {                                                                               \
        const auto& vx_a = (actual);                                                   \
        const auto& vx_e = (expected);                                                 \
        if (!(vx_a == vx_e)) {                                                         \
            std::ostringstream vx_msg;                                                 \
            vx_msg << voxtest::location(__FILE__, __LINE__) << ": " #actual " == "     \
                   << vx_a << ", expected " << vx_e;                                   \
            throw voxtest::CheckFailure(vx_msg.str());                                 \
        }                                                                              \
    } while (0)

#define VX_CHECK_NEAR(actual, expected, tolerance)                                     \
    do {                                                                               \
        double vx_a = static_cast<double>(actual);                                     \
        double vx_e = static_cast<double>(expected);                                   \
        if (std::fabs(vx_a - vx_e) > (tolerance)) {                                    \
            std::ostringstream vx_msg;                                                 \
            vx_msg << voxtest::location(__FILE__, __LINE__) << ": " #actual " == "     \
                   << vx_a << ", expected " << vx_e << " +/- " << (tolerance);         \
            throw voxtest::CheckFailure(vx_msg.str());                                 \
        }                                                                              \
    } while (0)

#define VX_CHECK_THROWS(expr, ExceptionType)                                           \
    do {                                                                               \
        bool vx_thrown = false;                                                        \
        try {                                                                          \
            (void)(expr);                                                              \
        } catch (const ExceptionType&) {                                               \
            vx_thrown = true;                                                          \
        }                                                                              \
        if (!vx_thrown) {                                                              \
            throw voxtest::CheckFailure(voxtest::location(__FILE__, __LINE__) +        \
                                        ": expected " #ExceptionType " from " #expr);  \
        }                                                                              \
    } while (0)

// ============================================================================
// Sections
// ============================================================================

/**
 * @brief Runs named sections in order and stops at the first failure
 */
class TestRunner {
public:
    explicit TestRunner(std::string suite) : suite_(std::move(suite)) {}

    void add(const std::string& name, std::function<void()> fn) {
        sections_.emplace_back(name, std::move(fn));
    }

    int run() {
        std::cout << "[" << suite_ << "] Running " << sections_.size() << " section(s)" << std::endl;
        for (const auto& section : sections_) {
            auto start = std::chrono::steady_clock::now();
            try {
                section.second();
            } catch (const std::exception& e) {
                std::cerr << "[" << suite_ << "] FAIL " << section.first << ": " << e.what() << std::endl;
                return 1;
            }
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();
            std::cout << "[" << suite_ << "] ok   " << section.first << " (" << ms << " ms)" << std::endl;
        }
        std::cout << "[" << suite_ << "] All sections passed" << std::endl;
        return 0;
    }

private:
    std::string suite_;
    std::vector<std::pair<std::string, std::function<void()>>> sections_;
};

// ============================================================================
// Builders
// ============================================================================

struct FormPart {
    std::string name;
    std::string filename;       ///< Empty for scalar fields
    std::string content_type;
    std::string data;
};

inline std::string build_multipart(const std::string& boundary, const std::vector<FormPart>& parts) {
    std::string body;
    for (const auto& part : parts) {
        body += "--" + boundary + "\r\n";
        body += "Content-Disposition: form-data; name=\"" + part.name + "\"";
        if (!part.filename.empty()) {
            body += "; filename=\"" + part.filename + "\"";
        }
        body += "\r\n";
        if (!part.content_type.empty()) {
            body += "Content-Type: " + part.content_type + "\r\n";
        }
        body += "\r\n";
        body += part.data;
        body += "\r\n";
    }
    body += "--" + boundary + "--\r\n";
    return body;
}

/**
 * @brief 16-bit PCM WAV bytes from per-channel float samples
 */
inline std::string make_wav(const std::vector<std::vector<float>>& channels, int sample_rate) {
    const uint16_t num_channels = static_cast<uint16_t>(channels.size());
    const size_t frames = channels.empty() ? 0 : channels[0].size();
    const uint32_t data_size = static_cast<uint32_t>(frames * num_channels * 2);

    std::string out;
    auto u16 = [&](uint16_t v) {
        out += static_cast<char>(v & 0xFF);
        out += static_cast<char>(v >> 8);
    };
    auto u32 = [&](uint32_t v) {
        for (int i = 0; i < 4; ++i) out += static_cast<char>((v >> (8 * i)) & 0xFF);
    };

    out += "RIFF";
    u32(36 + data_size);
    out += "WAVEfmt ";
    u32(16);
    u16(1);
    u16(num_channels);
    u32(static_cast<uint32_t>(sample_rate));
    u32(static_cast<uint32_t>(sample_rate) * num_channels * 2);
    u16(static_cast<uint16_t>(num_channels * 2));
    u16(16);
    out += "data";
    u32(data_size);
    for (size_t i = 0; i < frames; ++i) {
        for (const auto& ch : channels) {
            float s = ch[i] > 1.0f ? 1.0f : (ch[i] < -1.0f ? -1.0f : ch[i]);
            u16(static_cast<uint16_t>(static_cast<int16_t>(std::lround(s * 32767.0f))));
        }
    }
    return out;
}

inline std::vector<float> sine(double seconds, int sample_rate, double freq, float amplitude) {
    const size_t n = static_cast<size_t>(seconds * sample_rate);
    std::vector<float> out(n);
    for (size_t i = 0; i < n; ++i) {
        out[i] = amplitude * static_cast<float>(std::sin(2.0 * 3.14159265358979 * freq * i / sample_rate));
    }
    return out;
}

inline std::string make_mono_wav(double seconds, int sample_rate = 16000) {
    return make_wav({sine(seconds, sample_rate, 440.0, 0.5f)}, sample_rate);
}

// ============================================================================
// Raw socket client
// ============================================================================

struct RawResponse {
    int status = 0;
    std::string head;
    std::string body;
    std::string raw;
};

/**
 * @brief Blocking loopback client that writes fragments and reads until close
 */
class RawClient {
public:
    explicit RawClient(int port) {
        sock_ = socket(AF_INET, SOCK_STREAM, 0);
        if (sock_ == INVALID_SOCKET) {
            throw std::runtime_error("socket() failed");
        }
        sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(port));
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        if (connect(sock_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
            closesocket(sock_);
            throw std::runtime_error("connect() failed");
        }
    }

    ~RawClient() {
        if (sock_ != INVALID_SOCKET) {
            closesocket(sock_);
        }
    }

    RawClient(const RawClient&) = delete;
    RawClient& operator=(const RawClient&) = delete;

    bool send_all(const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            auto n = send(sock_, data.data() + sent, static_cast<int>(data.size() - sent), VOXSERVE_MSG_NOSIGNAL);
            if (n <= 0) return false;
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    /** Write data in pieces of fragment_size bytes with an optional pause */
    bool send_fragmented(const std::string& data, size_t fragment_size,
                         std::chrono::milliseconds pause = std::chrono::milliseconds(0)) {
        for (size_t pos = 0; pos < data.size(); pos += fragment_size) {
            if (!send_all(data.substr(pos, fragment_size))) return false;
            if (pause.count() > 0) std::this_thread::sleep_for(pause);
        }
        return true;
    }

    RawResponse read_response() {
        RawResponse r;
        char buf[16384];
        while (true) {
            auto n = recv(sock_, buf, static_cast<int>(sizeof(buf)), 0);
            if (n <= 0) break;
            r.raw.append(buf, static_cast<size_t>(n));
        }
        parse(r);
        return r;
    }

    /** Final response in raw, skipping interim 1xx responses */
    static void parse(RawResponse& r) {
        size_t start = 0;
        while (true) {
            size_t head_end = r.raw.find("\r\n\r\n", start);
            if (head_end == std::string::npos) return;
            std::string head = r.raw.substr(start, head_end - start);
            int status = 0;
            if (head.size() >= 12 && head.compare(0, 5, "HTTP/") == 0) {
                status = std::atoi(head.substr(9, 3).c_str());
            }
            if (status >= 100 && status < 200) {
                start = head_end + 4;
                continue;
            }
            r.status = status;
            r.head = head;
            r.body = r.raw.substr(head_end + 4);
            return;
        }
    }

private:
    socket_t sock_ = INVALID_SOCKET;
};

inline std::string header_value(const std::string& head, const std::string& name) {
    std::string lower_head = head;
    std::string lower_name = name;
    for (auto& c : lower_head) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    for (auto& c : lower_name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    size_t pos = lower_head.find("\r\n" + lower_name + ":");
    if (pos == std::string::npos) return "";
    pos += 3 + name.size();
    size_t end = head.find("\r\n", pos);
    std::string value = head.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
    size_t b = value.find_first_not_of(' ');
    return b == std::string::npos ? "" : value.substr(b);
}

} // namespace voxtest
