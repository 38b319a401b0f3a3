/**
 * @file word_replacement.cpp
 * @brief Dictionary-based whole-word replacement
 */

#include "voxserve/word_replacement.h"

#include <cctype>

namespace voxserve {

namespace {

bool is_word_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '\'' || u >= 0x80;
}

bool matches_at(const std::string& text, size_t pos, const std::string& word) {
    if (pos + word.size() > text.size()) return false;
    for (size_t i = 0; i < word.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[pos + i])) !=
            std::tolower(static_cast<unsigned char>(word[i]))) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

DictionaryWordReplacer::DictionaryWordReplacer(std::vector<std::pair<std::string, std::string>> rules) {
    for (auto& [from, to] : rules) {
        add_rule(from, to);
    }
}

void DictionaryWordReplacer::add_rule(const std::string& from, const std::string& to) {
    if (from.empty()) {
        return;
    }
    rules_.emplace_back(from, to);
}

std::string DictionaryWordReplacer::apply(const std::string& text, int& replacements_applied) const {
    std::string current = text;
    for (const auto& [from, to] : rules_) {
        std::string out;
        out.reserve(current.size());
        size_t i = 0;
        while (i < current.size()) {
            bool boundary_before = (i == 0) || !is_word_char(current[i - 1]);
            if (boundary_before && matches_at(current, i, from)) {
                size_t after = i + from.size();
                bool boundary_after = (after == current.size()) || !is_word_char(current[after]);
                if (boundary_after) {
                    out += to;
                    i = after;
                    ++replacements_applied;
                    continue;
                }
            }
            out += current[i];
            ++i;
        }
        current = std::move(out);
    }
    return current;
}

} // namespace voxserve
