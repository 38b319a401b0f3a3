/**
 * @file temp_file.h
 * @brief Scoped temporary files for uploaded and converted audio
 */

#pragma once

#include <string>
#include <string_view>

namespace voxserve {

/**
 * @brief Temporary file removed when the owner goes out of scope
 *
 * Move-only. Names are unique per process and per call
 * (voxserve-<pid>-<counter>-<random><ext>), so concurrent requests never
 * share a path.
 */
class ScopedTempFile {
public:
    ScopedTempFile() = default;

    /**
     * @brief Reserve a unique path in directory (created if needed)
     * @param directory Empty for <system temp>/voxserve
     * @param extension Including the dot, e.g. ".wav"
     */
    ScopedTempFile(const std::string& directory, const std::string& extension);

    ~ScopedTempFile();

    ScopedTempFile(ScopedTempFile&& other) noexcept;
    ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;
    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    /**
     * @brief Write bytes to the file, replacing any content
     * @throws std::runtime_error on I/O failure
     */
    void write(std::string_view bytes);

    /** Delete the file now; safe to call repeatedly */
    void remove();

    const std::string& path() const { return path_; }
    bool empty() const { return path_.empty(); }

    static std::string default_directory();

private:
    std::string path_;
};

} // namespace voxserve
