#pragma once

#include <string>
#include <unordered_map>

namespace mwetag {

// wordform -> lemma, both lowercased
using LemmaDictionary = std::unordered_map<std::string, std::string>;

class Lemmatizer {
public:
    // Lowercase the word, then look it up in the override dictionary and
    // fall back to the language's suffix rules. Never fails; an empty word
    // is returned unchanged.
    static std::string normalize(const std::string& word, const std::string& language,
                                 const LemmaDictionary* overrides = nullptr);

    // Suffix rules for an already lowercased Portuguese word
    static std::string portuguese_rules(const std::string& word_lower);
};

} // namespace mwetag
