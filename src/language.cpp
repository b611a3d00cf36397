#include "mwetag/language.h"
#include "mwetag/unicode_utils.h"

namespace mwetag {

std::string canonical_language(const std::string& language) {
    std::string lower = unicode::to_lower(language);
    if (lower == "pt") {
        return "portuguese";
    }
    return lower;
}

bool is_portuguese(const std::string& language) {
    return canonical_language(language) == "portuguese";
}

} // namespace mwetag
