/**
 * @file word_replacement.h
 * @brief Dictionary-based whole-word replacement
 */

#pragma once

#include "interfaces/i_text_processor.h"

#include <string>
#include <utility>
#include <vector>

namespace voxserve {

/**
 * @brief Replaces whole words, ASCII case-insensitively
 *
 * A match must not be preceded or followed by a letter, digit or
 * apostrophe. Rules apply in insertion order; the replacement text is used
 * verbatim.
 */
class DictionaryWordReplacer : public IWordReplacer {
public:
    DictionaryWordReplacer() = default;
    explicit DictionaryWordReplacer(std::vector<std::pair<std::string, std::string>> rules);

    void add_rule(const std::string& from, const std::string& to);
    size_t rule_count() const { return rules_.size(); }

    std::string apply(const std::string& text, int& replacements_applied) const override;

private:
    std::vector<std::pair<std::string, std::string>> rules_;
};

} // namespace voxserve
