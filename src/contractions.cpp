#include "mwetag/contractions.h"
#include "mwetag/language.h"
#include "mwetag/unicode_utils.h"

#include <unordered_map>

namespace mwetag {

namespace {

// Preposition + article fusions
const std::unordered_map<std::string, std::vector<std::string>>& portuguese_contractions() {
    static const std::unordered_map<std::string, std::vector<std::string>> table = {
        {"da", {"de", "a"}},
        {"do", {"de", "o"}},
        {"das", {"de", "as"}},
        {"dos", {"de", "os"}},
        {"na", {"em", "a"}},
        {"no", {"em", "o"}},
        {"nas", {"em", "as"}},
        {"nos", {"em", "os"}},
        {"ao", {"a", "o"}},
        {"aos", {"a", "os"}},
        {"à", {"a", "a"}},
        {"às", {"a", "as"}},
        {"pela", {"por", "a"}},
        {"pelo", {"por", "o"}},
        {"pelas", {"por", "as"}},
        {"pelos", {"por", "os"}},
        {"dum", {"de", "um"}},
        {"duma", {"de", "uma"}},
        {"duns", {"de", "uns"}},
        {"dumas", {"de", "umas"}},
        {"num", {"em", "um"}},
        {"numa", {"em", "uma"}},
        {"nuns", {"em", "uns"}},
        {"numas", {"em", "umas"}},
    };
    return table;
}

const std::vector<std::string>* lookup(const std::string& form, const std::string& language) {
    if (form.empty() || !is_portuguese(language)) {
        return nullptr;
    }
    const auto& table = portuguese_contractions();
    auto it = table.find(unicode::to_lower(form));
    if (it == table.end()) {
        return nullptr;
    }
    return &it->second;
}

} // namespace

std::vector<std::string> ContractionExpander::expand(const std::string& form, const std::string& language) {
    const std::vector<std::string>* parts = lookup(form, language);
    if (!parts) {
        return {form};
    }
    return *parts;
}

std::vector<std::string> ContractionExpander::expand_all(const std::vector<std::string>& words,
                                                         const std::string& language) {
    std::vector<std::string> result;
    result.reserve(words.size());
    for (const auto& word : words) {
        std::vector<std::string> parts = expand(word, language);
        result.insert(result.end(), parts.begin(), parts.end());
    }
    return result;
}

bool ContractionExpander::is_contraction(const std::string& form, const std::string& language) {
    return lookup(form, language) != nullptr;
}

} // namespace mwetag
