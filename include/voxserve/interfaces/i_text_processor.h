/**
 * @file i_text_processor.h
 * @brief Post-processing collaborators applied to transcript text
 */

#pragma once

#include <string>

namespace voxserve {

/**
 * @brief Applies user dictionary replacements
 */
class IWordReplacer {
public:
    virtual ~IWordReplacer() = default;

    /**
     * @param replacements_applied Incremented once per replaced occurrence
     */
    virtual std::string apply(const std::string& text, int& replacements_applied) const = 0;
};

/**
 * @brief Optional text enhancement (punctuation, formatting, ...)
 *
 * Failures are reported by throwing; the caller treats them as non-fatal.
 */
class ITextEnhancer {
public:
    virtual ~ITextEnhancer() = default;

    virtual std::string name() const = 0;
    virtual std::string enhance(const std::string& text) = 0;
};

} // namespace voxserve
