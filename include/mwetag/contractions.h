#pragma once

#include <string>
#include <vector>

namespace mwetag {

class ContractionExpander {
public:
    // Split a contraction into the words it stands for ("da" -> {"de", "a"}).
    // Lookup is case-insensitive; anything else comes back as {form}.
    static std::vector<std::string> expand(const std::string& form, const std::string& language);

    // Expand every word of a sequence
    static std::vector<std::string> expand_all(const std::vector<std::string>& words,
                                               const std::string& language);

    static bool is_contraction(const std::string& form, const std::string& language);
};

} // namespace mwetag
