/**
 * @file temp_file.cpp
 * @brief Scoped temporary files
 */

#include "voxserve/temp_file.h"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>

#ifdef _WIN32
#include <process.h>
#define VOXSERVE_GETPID _getpid
#else
#include <unistd.h>
#define VOXSERVE_GETPID getpid
#endif

namespace fs = std::filesystem;

namespace voxserve {

namespace {

std::atomic<uint64_t> g_temp_counter{0};

std::string unique_name(const std::string& extension) {
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dist(0, 0xFFFFFF);

    std::ostringstream ss;
    ss << "voxserve-" << VOXSERVE_GETPID() << "-" << g_temp_counter.fetch_add(1) << "-"
       << std::hex << dist(rng) << extension;
    return ss.str();
}

} // anonymous namespace

std::string ScopedTempFile::default_directory() {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) {
        base = "/tmp";
    }
    return (base / "voxserve").string();
}

ScopedTempFile::ScopedTempFile(const std::string& directory, const std::string& extension) {
    fs::path dir = directory.empty() ? fs::path(default_directory()) : fs::path(directory);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Cannot create temp directory " + dir.string() + ": " + ec.message());
    }
    path_ = (dir / unique_name(extension)).string();
}

ScopedTempFile::~ScopedTempFile() {
    remove();
}

ScopedTempFile::ScopedTempFile(ScopedTempFile&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScopedTempFile& ScopedTempFile::operator=(ScopedTempFile&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void ScopedTempFile::write(std::string_view bytes) {
    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Could not open temporary file for writing: " + path_);
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) {
        throw std::runtime_error("Could not write temporary file: " + path_);
    }
}

void ScopedTempFile::remove() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        std::cerr << "[TempFile] Failed to remove " << path_ << ": " << ec.message() << std::endl;
    }
    path_.clear();
}

} // namespace voxserve
