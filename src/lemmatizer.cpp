#include "mwetag/lemmatizer.h"
#include "mwetag/language.h"
#include "mwetag/unicode_utils.h"

#include <array>

namespace mwetag {

namespace {
using mwetag::unicode::char_count;
using mwetag::unicode::char_from_end;
using mwetag::unicode::drop_chars;
using mwetag::unicode::ends_with;

bool is_vowel(const std::string& ch) {
    static const std::array<const char*, 10> vowels = {
        "a", "e", "i", "o", "u", "á", "é", "í", "ó", "ú"
    };
    for (const char* v : vowels) {
        if (ch == v) {
            return true;
        }
    }
    return false;
}

} // namespace

std::string Lemmatizer::normalize(const std::string& word, const std::string& language,
                                  const LemmaDictionary* overrides) {
    if (word.empty()) {
        return word;
    }

    std::string word_lower = unicode::to_lower(word);

    if (overrides) {
        auto it = overrides->find(word_lower);
        if (it != overrides->end()) {
            return it->second;
        }
    }

    if (is_portuguese(language)) {
        return portuguese_rules(word_lower);
    }

    return word_lower;
}

std::string Lemmatizer::portuguese_rules(const std::string& word) {
    // Order matters: -es is a suffix of -res, -s of everything below
    if (ends_with(word, "ões") || ends_with(word, "ães") || ends_with(word, "ãos")) {
        return drop_chars(word, 3) + "ão";  // limões, pães, mãos
    }
    if (ends_with(word, "eis")) {
        if (char_count(word) > 4 && is_vowel(char_from_end(word, 4))) {
            return drop_chars(word, 3) + "l";
        }
        return drop_chars(word, 3) + "il";
    }
    if (ends_with(word, "óis")) {
        return drop_chars(word, 3) + "ol";  // sóis
    }
    if (ends_with(word, "res") || ends_with(word, "ses") || ends_with(word, "zes")) {
        return drop_chars(word, 2);  // flores, meses, luzes
    }
    if (ends_with(word, "ns")) {
        return drop_chars(word, 2) + "m";  // jardins
    }
    if (ends_with(word, "s") && char_count(word) > 2) {
        return drop_chars(word, 1);  // cafés
    }

    // Gerunds
    if (ends_with(word, "ando")) {
        return drop_chars(word, 4) + "ar";
    }
    if (ends_with(word, "endo") || ends_with(word, "indo")) {
        return drop_chars(word, 4) + "er";
    }

    return word;
}

} // namespace mwetag
